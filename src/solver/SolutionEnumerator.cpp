// SolutionEnumerator.cpp ---
//
// Filename: SolutionEnumerator.cpp
// Author: Abhishek Udupa
// Created: Fri Jan 09 17:54:00 2015 (-0500)
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
#include "../utils/LogManager.hpp"

#include "Solver.hpp"
#include "SolutionEnumerator.hpp"

namespace SYMX {
    namespace Query {

        using namespace Exprs;
        using TP::TPResult;

        // SolutionEnumerator::Iterator implementation
        SolutionEnumerator::Iterator::Iterator()
            : Enumerator(nullptr), Session(nullptr), Current(), Position(0)
        {
            // Nothing here
        }

        SolutionEnumerator::Iterator::Iterator(const SolutionEnumerator* Enumerator)
            : Enumerator(Enumerator), Session(Solver::MakeSession(Enumerator->GetBackend())),
              Current(), Position(0)
        {
            Session->Assert(Enumerator->GetPredicate());
            Solve();
        }

        SolutionEnumerator::Iterator::Iterator(Iterator&& Other)
            : Enumerator(Other.Enumerator), Session(move(Other.Session)),
              Current(std::move(Other.Current)), Position(Other.Position)
        {
            Other.Current = boost::none;
        }

        SolutionEnumerator::Iterator::~Iterator()
        {
            // Nothing here
        }

        SolutionEnumerator::Iterator&
        SolutionEnumerator::Iterator::operator = (Iterator&& Other)
        {
            Enumerator = Other.Enumerator;
            Session = move(Other.Session);
            Current = std::move(Other.Current);
            Position = Other.Position;
            Other.Current = boost::none;
            return *this;
        }

        void SolutionEnumerator::Iterator::Solve()
        {
            try {
                auto Result = Session->CheckSat();
                if (Result == TPResult::UNKNOWN) {
                    throw TP::IncompleteTheoryException(Session->GetAssertionConjunction(),
                                                        Session->GetReasonUnknown());
                }
                if (Result == TPResult::UNSATISFIABLE) {
                    SYMX_LOG_SHORT(SolverFindAll,
                                   Out_ << "No more solutions after " << Position
                                        << " solution(s)" << endl;
                                   );
                    Current = boost::none;
                    Session.reset();
                    return;
                }

                Current = Solver::ExtractSolution(*Session, Enumerator->GetVars());
                ++Position;

                SYMX_LOG_SHORT(SolverFindAll,
                               Out_ << "Solution " << Position << ": "
                                    << Current->ToString() << endl;
                               );
            } catch (...) {
                Current = boost::none;
                Session.reset();
                throw;
            }
        }

        ExpT SolutionEnumerator::Iterator::MakeBlockingClause(const Solution& TheSolution) const
        {
            auto& Mgr = ExprMgr::Instance();
            auto const& Vars = TheSolution.GetVars();
            if (Vars.size() == 0) {
                // The only model of a closed predicate
                return Mgr.MakeFalse();
            }

            vector<ExpT> Equalities;
            for (auto const& Var : Vars) {
                Equalities.push_back(Mgr.MakeExpr(SymxOps::OpEQ, Var,
                                                  Mgr.MakeVal(TheSolution.Get(Var))));
            }
            auto Conjunction = (Equalities.size() == 1 ? Equalities[0] :
                                Mgr.MakeExpr(SymxOps::OpAND, Equalities));
            return Mgr.MakeExpr(SymxOps::OpNOT, Conjunction);
        }

        const Solution& SolutionEnumerator::Iterator::operator * () const
        {
            if (!Current) {
                throw ModelingError("Cannot dereference an exhausted solution iterator");
            }
            return *Current;
        }

        const Solution* SolutionEnumerator::Iterator::operator -> () const
        {
            return &(operator * ());
        }

        SolutionEnumerator::Iterator& SolutionEnumerator::Iterator::operator ++ ()
        {
            if (!Current) {
                return *this;
            }

            auto Blocking = MakeBlockingClause(*Current);
            SYMX_LOG_FULL(SolverFindAll,
                          Out_ << "Excluding solution " << Position << " with:" << endl
                               << Blocking->ToString() << endl;
                          );
            try {
                Session->Assert(Blocking);
            } catch (...) {
                Current = boost::none;
                Session.reset();
                throw;
            }
            Solve();
            return *this;
        }

        bool SolutionEnumerator::Iterator::operator == (const Iterator& Other) const
        {
            return (IsExhausted() && Other.IsExhausted());
        }

        bool SolutionEnumerator::Iterator::operator != (const Iterator& Other) const
        {
            return !(*this == Other);
        }

        bool SolutionEnumerator::Iterator::IsExhausted() const
        {
            return !Current;
        }

        bool SolutionEnumerator::Iterator::HasSession() const
        {
            return (Session != nullptr);
        }

        u64 SolutionEnumerator::Iterator::GetPosition() const
        {
            return Position;
        }

        // SolutionEnumerator implementation
        SolutionEnumerator::SolutionEnumerator(const ExpT& Predicate, BackendT Backend)
            : Predicate(Predicate), Backend(Backend)
        {
            if (Predicate.IsNull_()) {
                throw ModelingError("Cannot enumerate the solutions of a null predicate");
            }
            if (Predicate->GetType() != ExprMgr::Instance().GetBoolType()) {
                throw ExprTypeError((string)"Predicates must be boolean, but " +
                                    Predicate->ToString() + " has type " +
                                    Predicate->GetType()->ToString());
            }
            Vars = VarGatherer::Do(Predicate);
        }

        SolutionEnumerator::~SolutionEnumerator()
        {
            // Nothing here
        }

        SolutionEnumerator::Iterator SolutionEnumerator::begin() const
        {
            return Iterator(this);
        }

        SolutionEnumerator::Iterator SolutionEnumerator::end() const
        {
            return Iterator();
        }

        vector<Solution> SolutionEnumerator::Take(u64 N) const
        {
            vector<Solution> Retval;
            if (N == 0) {
                return Retval;
            }
            for (auto it = begin(); it != end(); ++it) {
                Retval.push_back(*it);
                if (Retval.size() >= N) {
                    break;
                }
            }
            return Retval;
        }

        const ExpT& SolutionEnumerator::GetPredicate() const
        {
            return Predicate;
        }

        BackendT SolutionEnumerator::GetBackend() const
        {
            return Backend;
        }

        const vector<ExpT>& SolutionEnumerator::GetVars() const
        {
            return Vars;
        }

    } /* end namespace Query */
} /* end namespace SYMX */

//
// SolutionEnumerator.cpp ends here
