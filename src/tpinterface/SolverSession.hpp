// SolverSession.hpp ---
//
// Filename: SolverSession.hpp
// Author: Abhishek Udupa
// Created: Fri Feb 13 01:45:00 2015 (-0500)
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

// The interface shared by the decision procedures. A session owns
// its assertion stack and, once CheckSat() has returned
// SATISFIABLE, a model that can be queried variable by variable.
// Default-valued maps are lowered here, before the assertions
// reach the backend, and raised again when models are read.

#if !defined SYMX_SOLVER_SESSION_HPP_
#define SYMX_SOLVER_SESSION_HPP_

#include <vector>

#include "../common/SymxFwdDecls.hpp"
#include "../maps/DMapLowering.hpp"

namespace SYMX {
    namespace TP {

        using Exprs::ExpT;
        using Exprs::ValueRef;
        using Exprs::TypeRef;

        enum class TPResult {
            SATISFIABLE, UNSATISFIABLE, UNKNOWN
        };

        extern string TPResultToString(TPResult Result);

        // The backend gave up on a query (timeout, incomplete theory)
        class IncompleteTheoryException : public EngineError
        {
        private:
            ExpT Expression;

        public:
            IncompleteTheoryException(const ExpT& Expression, const string& Reason);
            virtual ~IncompleteTheoryException() throw ();

            const ExpT& GetExpression() const;
        };

        class SolverSession
        {
        private:
            Maps::DMapLowering MapLowering;
            vector<ExpT> Assertions;
            vector<u32> ScopeMarks;

        protected:
            TPResult LastSolveResult;

            // Called with assertions that are free of default-valued maps
            virtual void AssertLowered(const ExpT& Assertion) = 0;
            // Var is a variable whose type has no default-valued map
            virtual ValueRef GetLoweredModelValue(const ExpT& Var) = 0;
            virtual TPResult CheckSatLowered() = 0;
            virtual void PushLowered() = 0;
            virtual void PopLowered(u32 NumScopes) = 0;

        public:
            SolverSession();
            SolverSession(const SolverSession& Other) = delete;
            SolverSession(SolverSession&& Other) = delete;
            virtual ~SolverSession();

            virtual BackendT GetBackend() const = 0;

            // Throws ModelingError on a non boolean assertion,
            // CapabilityError if the backend cannot encode it
            void Assert(const ExpT& Assertion);
            void Assert(const vector<ExpT>& Assertions);

            TPResult CheckSat();
            TPResult GetLastSolveResult() const;
            // Why the last check returned UNKNOWN
            virtual string GetReasonUnknown() const;

            // The value of Var in the current model, or the default
            // value of its type when the model leaves Var
            // unconstrained. Throws ModelingError when the last
            // CheckSat() was not satisfiable.
            ValueRef GetModelValue(const ExpT& Var);

            void Push();
            void Pop(u32 NumScopes = 1);
            u32 GetNumScopes() const;

            // Assertions made so far, before lowering
            const vector<ExpT>& GetAssertions() const;
            u64 GetNumAssertions() const;

            // Conjunction of the assertions, for diagnostics
            ExpT GetAssertionConjunction() const;
        };

    } /* end namespace TP */
} /* end namespace SYMX */

#endif /* SYMX_SOLVER_SESSION_HPP_ */

//
// SolverSession.hpp ends here
