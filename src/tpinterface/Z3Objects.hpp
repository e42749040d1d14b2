// Z3Objects.hpp ---
//
// Filename: Z3Objects.hpp
// Author: Abhishek Udupa
// Created: Fri May 01 10:13:00 2015 (-0500)
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

// Owning handles for the Z3 objects the SMT backend keeps around.
// Contexts are created in reference counted mode, so every term,
// sort, declaration, solver and model is pinned by a handle.

#if !defined SYMX_Z3_OBJECTS_HPP_
#define SYMX_Z3_OBJECTS_HPP_

#include <z3.h>
#include <unordered_map>
#include <utility>

#include "../common/SymxFwdDecls.hpp"
#include "../containers/RefCountable.hpp"
#include "../containers/SmartPtr.hpp"

namespace SYMX {
    namespace TP {

        // Errors are reported through error codes, which CheckError
        // turns into exceptions.
        class Z3CtxWrapper : public RefCountable
        {
        private:
            Z3_context Ctx;

        public:
            // Configured from the library options
            Z3CtxWrapper();
            virtual ~Z3CtxWrapper();

            operator Z3_context () const;

            // Throws EngineError if the last call on this context failed
            void CheckError(const string& Operation) const;
        };

        namespace Detail {

            struct Z3AstOps
            {
                static inline void IncRef(Z3_context Ctx, Z3_ast AST)
                {
                    Z3_inc_ref(Ctx, AST);
                }

                static inline void DecRef(Z3_context Ctx, Z3_ast AST)
                {
                    Z3_dec_ref(Ctx, AST);
                }

                static inline string ToString(Z3_context Ctx, Z3_ast AST)
                {
                    return Z3_ast_to_string(Ctx, AST);
                }

                static inline const char* Operation()
                {
                    return "term construction";
                }
            };

            struct Z3SortOps
            {
                static inline void IncRef(Z3_context Ctx, Z3_sort Sort)
                {
                    Z3_inc_ref(Ctx, Z3_sort_to_ast(Ctx, Sort));
                }

                static inline void DecRef(Z3_context Ctx, Z3_sort Sort)
                {
                    Z3_dec_ref(Ctx, Z3_sort_to_ast(Ctx, Sort));
                }

                static inline string ToString(Z3_context Ctx, Z3_sort Sort)
                {
                    return Z3_sort_to_string(Ctx, Sort);
                }

                static inline const char* Operation()
                {
                    return "sort construction";
                }
            };

            struct Z3FuncDeclOps
            {
                static inline void IncRef(Z3_context Ctx, Z3_func_decl Decl)
                {
                    Z3_inc_ref(Ctx, Z3_func_decl_to_ast(Ctx, Decl));
                }

                static inline void DecRef(Z3_context Ctx, Z3_func_decl Decl)
                {
                    Z3_dec_ref(Ctx, Z3_func_decl_to_ast(Ctx, Decl));
                }

                static inline string ToString(Z3_context Ctx, Z3_func_decl Decl)
                {
                    return Z3_func_decl_to_string(Ctx, Decl);
                }

                static inline const char* Operation()
                {
                    return "datatype declaration";
                }
            };

            struct Z3SolverOps
            {
                static inline void IncRef(Z3_context Ctx, Z3_solver Solver)
                {
                    Z3_solver_inc_ref(Ctx, Solver);
                }

                static inline void DecRef(Z3_context Ctx, Z3_solver Solver)
                {
                    Z3_solver_dec_ref(Ctx, Solver);
                }

                static inline string ToString(Z3_context Ctx, Z3_solver Solver)
                {
                    return Z3_solver_to_string(Ctx, Solver);
                }

                static inline const char* Operation()
                {
                    return "solver construction";
                }
            };

            struct Z3ModelOps
            {
                static inline void IncRef(Z3_context Ctx, Z3_model Model)
                {
                    Z3_model_inc_ref(Ctx, Model);
                }

                static inline void DecRef(Z3_context Ctx, Z3_model Model)
                {
                    Z3_model_dec_ref(Ctx, Model);
                }

                static inline string ToString(Z3_context Ctx, Z3_model Model)
                {
                    return Z3_model_to_string(Ctx, Model);
                }

                static inline const char* Operation()
                {
                    return "model retrieval";
                }
            };

        } /* end namespace Detail */

        // Holds one Z3 reference to Handle for as long as it lives.
        // A default constructed handle is null and owns nothing.
        template <typename HANDLETYPE, typename OPSTYPE>
        class Z3Handle
        {
        protected:
            Z3Ctx Ctx;
            HANDLETYPE Handle;

        public:
            inline Z3Handle()
                : Ctx(), Handle(nullptr)
            {
                // Nothing here
            }

            // A null handle from Z3 means the call producing it failed
            inline Z3Handle(const Z3Ctx& Ctx, HANDLETYPE Handle)
                : Ctx(Ctx), Handle(Handle)
            {
                if (Handle == nullptr) {
                    Ctx->CheckError(OPSTYPE::Operation());
                    return;
                }
                OPSTYPE::IncRef(*Ctx, Handle);
            }

            inline Z3Handle(const Z3Handle& Other)
                : Ctx(Other.Ctx), Handle(Other.Handle)
            {
                if (Handle != nullptr) {
                    OPSTYPE::IncRef(*Ctx, Handle);
                }
            }

            inline Z3Handle(Z3Handle&& Other)
                : Ctx(), Handle(nullptr)
            {
                swap(Ctx, Other.Ctx);
                swap(Handle, Other.Handle);
            }

            inline ~Z3Handle()
            {
                if (Handle != nullptr) {
                    OPSTYPE::DecRef(*Ctx, Handle);
                }
            }

            inline Z3Handle& operator = (Z3Handle Other)
            {
                swap(Ctx, Other.Ctx);
                swap(Handle, Other.Handle);
                return *this;
            }

            inline operator HANDLETYPE () const
            {
                return Handle;
            }

            inline bool IsNull() const
            {
                return (Handle == nullptr);
            }

            inline string ToString() const
            {
                if (Handle == nullptr) {
                    return "null";
                }
                return OPSTYPE::ToString(*Ctx, Handle);
            }
        };

        class Z3Expr : public Z3Handle<Z3_ast, Detail::Z3AstOps>
        {
        public:
            Z3Expr() = default;

            inline Z3Expr(const Z3Ctx& Ctx, Z3_ast AST)
                : Z3Handle(Ctx, AST)
            {
                // Nothing here
            }
        };

        typedef Z3Handle<Z3_func_decl, Detail::Z3FuncDeclOps> Z3FuncDecl;

        // Sorts of datatypes and tuples also keep their constructors,
        // testers and accessors, under caller chosen keys
        class Z3Sort : public Z3Handle<Z3_sort, Detail::Z3SortOps>
        {
        private:
            mutable unordered_map<string, Z3FuncDecl> FuncDecls;

        public:
            Z3Sort() = default;

            inline Z3Sort(const Z3Ctx& Ctx, Z3_sort Sort)
                : Z3Handle(Ctx, Sort)
            {
                // Nothing here
            }

            void AddFuncDecl(const string& Key, Z3_func_decl Decl) const;
            Z3_func_decl GetFuncDecl(const string& Key) const;

            bool operator == (const Z3Sort& Other) const;
        };

        class Z3Solver : public Z3Handle<Z3_solver, Detail::Z3SolverOps>
        {
        public:
            Z3Solver() = default;

            // A fresh solver with the seed and timeout from the
            // library options
            explicit Z3Solver(const Z3Ctx& Ctx);
        };

        class Z3Model : public Z3Handle<Z3_model, Detail::Z3ModelOps>
        {
        public:
            Z3Model() = default;

            inline Z3Model(const Z3Ctx& Ctx, Z3_model Model)
                : Z3Handle(Ctx, Model)
            {
                // Nothing here
            }
        };

    } /* end namespace TP */
} /* end namespace SYMX */

#endif /* SYMX_Z3_OBJECTS_HPP_ */

//
// Z3Objects.hpp ends here
