// TheoremProver.cpp ---
//
// Filename: TheoremProver.cpp
// Author: Abhishek Udupa
// Created: Tue Jan 06 13:34:00 2015 (-0500)
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

#include "../expr/Expressions.hpp"
#include "../utils/LogManager.hpp"

#include "TheoremProver.hpp"

namespace SYMX {
    namespace TP {

        // Z3TheoremProver implementation
        Z3TheoremProver::Z3TheoremProver()
            : SolverSession(), Ctx(new Z3CtxWrapper()),
              LCtx(new Z3LoweredContext(Ctx)), Solver(Ctx),
              TheModel()
        {
            // Nothing here
        }

        Z3TheoremProver::~Z3TheoremProver()
        {
            // Release everything that refers to the context first
            TheModel = Z3Model();
            Solver = Z3Solver();
            LCtx = Z3LCRef::NullPtr;
        }

        BackendT Z3TheoremProver::GetBackend() const
        {
            return BackendT::SMT;
        }

        void Z3TheoremProver::AssertLowered(const ExpT& Assertion)
        {
            LCtx->ClearAssumptions();
            auto LoweredAssertion = Z3Lowerer::Do(Assertion, LCtx);

            SYMX_LOG_FULL(TheoremProverLowered,
                          Out_ << "Asserting Lowered Expr:" << endl
                               << LoweredAssertion.ToString() << endl;
                          );

            Z3_solver_assert(*Ctx, Solver, LoweredAssertion);
            Ctx->CheckError("assertion");

            for (auto const& Assumption : LCtx->GetAssumptions()) {
                SYMX_LOG_FULL(TheoremProverAssertions,
                              Out_ << "Asserting Assumption:" << endl
                                   << Assumption.ToString() << endl;
                              );

                Z3_solver_assert(*Ctx, Solver, Assumption);
                Ctx->CheckError("assertion");
            }
            LCtx->ClearAssumptions();
            TheModel = Z3Model();
        }

        TPResult Z3TheoremProver::CheckSatLowered()
        {
            SYMX_LOG_MIN_SHORT(
                               Out_ << "Checking SAT with "
                                    << GetNumLoweredAssertions()
                                    << " assertions... ";
                               );

            auto Res = Z3_solver_check(*Ctx, Solver);
            Ctx->CheckError("satisfiability check");

            SYMX_LOG_MIN_SHORT(
                               Out_ << "Done!" << endl;
                               );

            TheModel = Z3Model();
            ReasonUnknown = "";

            if (Res == Z3_L_FALSE) {
                return TPResult::UNSATISFIABLE;
            } else if (Res == Z3_L_TRUE) {
                return TPResult::SATISFIABLE;
            } else {
                ReasonUnknown = Z3_solver_get_reason_unknown(*Ctx, Solver);
                return TPResult::UNKNOWN;
            }
        }

        const Z3Model& Z3TheoremProver::GetModel()
        {
            if (TheModel.IsNull()) {
                TheModel = Z3Model(Ctx, Z3_solver_get_model(*Ctx, Solver));
                SYMX_LOG_FULL(TheoremProverModels,
                              Out_ << "Model:" << endl << TheModel.ToString() << endl;
                              );
            }
            return TheModel;
        }

        ValueRef Z3TheoremProver::GetLoweredModelValue(const ExpT& Var)
        {
            auto const& Model = GetModel();

            LCtx->ClearAssumptions();
            auto LoweredVar = Z3Lowerer::Do(Var, LCtx);
            LCtx->ClearAssumptions();

            auto Decl = Z3_get_app_decl(*Ctx, Z3_to_app(*Ctx, LoweredVar));
            if (!Z3_model_has_interp(*Ctx, Model, Decl)) {
                // Unconstrained by the assertions
                return Var->GetType()->GetDefaultValue();
            }

            Z3_ast OutAST = nullptr;
            auto EvalRes = Z3_model_eval(*Ctx, Model, LoweredVar, true, &OutAST);
            if (!EvalRes || OutAST == nullptr) {
                Ctx->CheckError("model evaluation");
                throw EngineError((string)"Could not evaluate " + Var->ToString() +
                                  " in the model");
            }
            Z3Expr Evaluated(Ctx, OutAST);
            return Z3Raiser::Do(Evaluated, Var->GetType(), LCtx, Model);
        }

        void Z3TheoremProver::PushLowered()
        {
            Z3_solver_push(*Ctx, Solver);
            Ctx->CheckError("push");
        }

        void Z3TheoremProver::PopLowered(u32 NumScopes)
        {
            Z3_solver_pop(*Ctx, Solver, NumScopes);
            Ctx->CheckError("pop");
            TheModel = Z3Model();
        }

        void Z3TheoremProver::Interrupt()
        {
            Z3_interrupt(*Ctx);
        }

        string Z3TheoremProver::GetReasonUnknown() const
        {
            return ReasonUnknown;
        }

        u64 Z3TheoremProver::GetNumLoweredAssertions() const
        {
            auto ASTVec = Z3_solver_get_assertions(*Ctx, Solver);
            Z3_ast_vector_inc_ref(*Ctx, ASTVec);
            u64 Retval = Z3_ast_vector_size(*Ctx, ASTVec);
            Z3_ast_vector_dec_ref(*Ctx, ASTVec);
            return Retval;
        }

    } /* end namespace TP */
} /* end namespace SYMX */

//
// TheoremProver.cpp ends here
