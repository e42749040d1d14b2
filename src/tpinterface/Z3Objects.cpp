// Z3Objects.cpp ---
//
// Filename: Z3Objects.cpp
// Author: Abhishek Udupa
// Created: Fri Apr 03 01:37:00 2015 (-0500)
//
//
// Copyright (c) 2013, Abhishek Udupa, University of Pennsylvania
// All rights reserved.
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
// 1. Redistributions of source code must retain the above copyright
//    notice, this list of conditions and the following disclaimer.
// 2. Redistributions in binary form must reproduce the above copyright
//    notice, this list of conditions and the following disclaimer in the
//    documentation and/or other materials provided with the distribution.
// 3. All advertising materials mentioning features or use of this software
//    must display the following acknowledgement:
//    This product includes software developed by The University of Pennsylvania
// 4. Neither the name of the University of Pennsylvania nor the
//    names of its contributors may be used to endorse or promote products
//    derived from this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDER ''AS IS'' AND ANY
// EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED
// WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER BE LIABLE FOR ANY
// DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES
// (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES;
// LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND
// ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
// (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
// SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
//
//

// Code:

#include "../lib/SymxLib.hpp"

#include "Z3Objects.hpp"

namespace SYMX {
    namespace TP {

        namespace Detail {

            // Errors are picked up through the error code after each
            // call, see Z3CtxWrapper::CheckError
            static void IgnoreZ3Error(Z3_context Ctx, Z3_error_code Code)
            {
                return;
            }

        } /* end namespace Detail */

        Z3CtxWrapper::Z3CtxWrapper()
        {
            auto const& Options = SymxLib::GetOptions();
            auto Cfg = Z3_mk_config();
            Z3_set_param_value(Cfg, "model", "true");
            if (Options.Z3TimeoutMs != 0) {
                Z3_set_param_value(Cfg, "timeout", to_string(Options.Z3TimeoutMs).c_str());
            }
            Ctx = Z3_mk_context_rc(Cfg);
            Z3_del_config(Cfg);
            Z3_set_error_handler(Ctx, Detail::IgnoreZ3Error);
        }

        Z3CtxWrapper::~Z3CtxWrapper()
        {
            Z3_del_context(Ctx);
        }

        Z3CtxWrapper::operator Z3_context () const
        {
            return Ctx;
        }

        void Z3CtxWrapper::CheckError(const string& Operation) const
        {
            auto Code = Z3_get_error_code(Ctx);
            if (Code == Z3_OK) {
                return;
            }
            string Message = Z3_get_error_msg(Ctx, Code);
            // Clear the error state for later calls
            Z3_set_error(Ctx, Z3_OK);
            throw EngineError((string)"Z3 failed during " + Operation + ": " + Message);
        }

        void Z3Sort::AddFuncDecl(const string& Key, Z3_func_decl Decl) const
        {
            FuncDecls[Key] = Z3FuncDecl(Ctx, Decl);
        }

        Z3_func_decl Z3Sort::GetFuncDecl(const string& Key) const
        {
            auto it = FuncDecls.find(Key);
            if (it == FuncDecls.end()) {
                throw InternalError((string)"No function declaration \"" + Key +
                                    "\" was recorded for sort " + ToString() +
                                    "\nAt: " + __FILE__ + ":" + to_string(__LINE__));
            }
            return it->second;
        }

        bool Z3Sort::operator == (const Z3Sort& Other) const
        {
            if (Handle == nullptr || Other.Handle == nullptr) {
                return (Handle == Other.Handle);
            }
            return (Ctx == Other.Ctx && Z3_is_eq_sort(*Ctx, Handle, Other.Handle));
        }

        Z3Solver::Z3Solver(const Z3Ctx& Ctx)
            : Z3Handle(Ctx, Z3_mk_solver(*Ctx))
        {
            auto const& Options = SymxLib::GetOptions();
            auto Params = Z3_mk_params(*Ctx);
            Z3_params_inc_ref(*Ctx, Params);
            Z3_params_set_uint(*Ctx, Params, Z3_mk_string_symbol(*Ctx, "random_seed"),
                               Options.Z3RandomSeed);
            if (Options.Z3TimeoutMs != 0) {
                Z3_params_set_uint(*Ctx, Params, Z3_mk_string_symbol(*Ctx, "timeout"),
                                   Options.Z3TimeoutMs);
            }
            Z3_solver_set_params(*Ctx, Handle, Params);
            Z3_params_dec_ref(*Ctx, Params);
            Ctx->CheckError("solver configuration");
        }

    } /* end namespace TP */
} /* end namespace SYMX */

//
// Z3Objects.cpp ends here
