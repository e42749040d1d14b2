// SolverSession.cpp ---
//
// Filename: SolverSession.cpp
// Author: Abhishek Udupa
// Created: Thu Mar 12 10:01:00 2015 (-0500)
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

#include "../expr/ExprMgr.hpp"
#include "../expr/SymxOps.hpp"
#include "../utils/LogManager.hpp"

#include "SolverSession.hpp"

namespace SYMX {
    namespace TP {

        using namespace Exprs;

        string TPResultToString(TPResult Result)
        {
            switch (Result) {
            case TPResult::SATISFIABLE:
                return "sat";
            case TPResult::UNSATISFIABLE:
                return "unsat";
            default:
                return "unknown";
            }
        }

        IncompleteTheoryException::IncompleteTheoryException(const ExpT& Expression,
                                                             const string& Reason)
            : EngineError((string)"Could not determine satisfiability of expression:\n" +
                          (Expression.IsNull_() ? string("<none>") : Expression->ToString()) +
                          "\nReason reported by the backend: " + Reason),
              Expression(Expression)
        {
            // Nothing here
        }

        IncompleteTheoryException::~IncompleteTheoryException() throw ()
        {
            // Nothing here
        }

        const ExpT& IncompleteTheoryException::GetExpression() const
        {
            return Expression;
        }

        SolverSession::SolverSession()
            : LastSolveResult(TPResult::UNKNOWN)
        {
            // Nothing here
        }

        SolverSession::~SolverSession()
        {
            // Nothing here
        }

        void SolverSession::Assert(const ExpT& Assertion)
        {
            auto& Mgr = ExprMgr::Instance();
            if (Assertion.IsNull_()) {
                throw ModelingError("Cannot assert a null expression");
            }
            if (Assertion->GetType() != Mgr.GetBoolType()) {
                throw ExprTypeError((string)"Assertions must be boolean, but " +
                                    Assertion->ToString() + " has type " +
                                    Assertion->GetType()->ToString());
            }

            auto Lowered = MapLowering.Do(Assertion);

            SYMX_LOG_FULL(TheoremProverAssertions,
                          Out_ << "Asserting Expr:" << endl
                               << Assertion->ToString() << endl;
                          );
            SYMX_LOG_FULL(MapLoweringDetailed,
                          Out_ << "After lowering default-valued maps:" << endl
                               << Lowered->ToString() << endl;
                          );

            AssertLowered(Lowered);
            Assertions.push_back(Assertion);
            LastSolveResult = TPResult::UNKNOWN;
        }

        void SolverSession::Assert(const vector<ExpT>& Assertions)
        {
            for (auto const& Assertion : Assertions) {
                Assert(Assertion);
            }
        }

        TPResult SolverSession::CheckSat()
        {
            LastSolveResult = CheckSatLowered();
            return LastSolveResult;
        }

        TPResult SolverSession::GetLastSolveResult() const
        {
            return LastSolveResult;
        }

        string SolverSession::GetReasonUnknown() const
        {
            return "unknown";
        }

        ValueRef SolverSession::GetModelValue(const ExpT& Var)
        {
            if (Var.IsNull_() || !Var->Is<VarExpression>()) {
                throw ModelingError((string)"Model values can only be read for variables, " +
                                    "got: " + (Var.IsNull_() ? string("null") : Var->ToString()));
            }
            if (LastSolveResult != TPResult::SATISFIABLE) {
                throw ModelingError((string)"No model to read " + Var->ToString() +
                                    " from, the last check was " +
                                    TPResultToString(LastSolveResult));
            }

            auto const& VarType = Var->GetType();
            ValueRef Retval;
            if (VarType->Is<DMapType>()) {
                Retval = MapLowering.RaiseMapVar(Var, [this] (const ExpT& PerKeyVar) -> ValueRef
                                                 {
                                                     return GetLoweredModelValue(PerKeyVar);
                                                 });
            } else if (VarType->ContainsDMap()) {
                throw CapabilityError((string)"Default-valued maps nested inside " +
                                      VarType->ToString() + " are not supported by solvers");
            } else {
                Retval = GetLoweredModelValue(Var);
            }

            SYMX_LOG_SHORT(TheoremProverModels,
                           Out_ << "Model value: " << Var->ToString() << " = "
                                << Retval->ToString() << endl;
                           );
            return Retval;
        }

        void SolverSession::Push()
        {
            PushLowered();
            ScopeMarks.push_back(Assertions.size());
        }

        void SolverSession::Pop(u32 NumScopes)
        {
            if (NumScopes > ScopeMarks.size()) {
                throw ModelingError((string)"Cannot pop " + to_string(NumScopes) +
                                    " scopes, only " + to_string(ScopeMarks.size()) +
                                    " have been pushed");
            }
            if (NumScopes == 0) {
                return;
            }
            PopLowered(NumScopes);
            auto Mark = ScopeMarks[ScopeMarks.size() - NumScopes];
            ScopeMarks.resize(ScopeMarks.size() - NumScopes);
            Assertions.resize(Mark);
            LastSolveResult = TPResult::UNKNOWN;
        }

        u32 SolverSession::GetNumScopes() const
        {
            return ScopeMarks.size();
        }

        const vector<ExpT>& SolverSession::GetAssertions() const
        {
            return Assertions;
        }

        u64 SolverSession::GetNumAssertions() const
        {
            return Assertions.size();
        }

        ExpT SolverSession::GetAssertionConjunction() const
        {
            auto& Mgr = ExprMgr::Instance();
            if (Assertions.size() == 0) {
                return Mgr.MakeTrue();
            }
            if (Assertions.size() == 1) {
                return Assertions[0];
            }
            return Mgr.MakeExpr(SymxOps::OpAND, Assertions);
        }

    } /* end namespace TP */
} /* end namespace SYMX */

//
// SolverSession.cpp ends here
