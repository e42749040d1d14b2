// Solver.cpp ---
//
// Filename: Solver.cpp
// Author: Abhishek Udupa
// Created: Fri Jan 23 23:56:00 2015 (-0500)
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
#include "../tpinterface/TheoremProver.hpp"
#include "../dd/DDSolver.hpp"
#include "../utils/LogManager.hpp"

#include "Solver.hpp"

namespace SYMX {
    namespace Query {

        using namespace Exprs;
        using TP::TPResult;

        unique_ptr<TP::SolverSession> Solver::MakeSession(BackendT Backend)
        {
            switch (Backend) {
            case BackendT::SMT:
                return unique_ptr<TP::SolverSession>(new TP::Z3TheoremProver());
            case BackendT::BDD:
                return unique_ptr<TP::SolverSession>(new DD::DDSolver());
            }
            throw InternalError((string)"Unknown backend " + to_string((u32)Backend) +
                                "\nAt: " + __FILE__ + ":" + to_string(__LINE__));
        }

        Solution Solver::ExtractSolution(TP::SolverSession& Session, const vector<ExpT>& Vars)
        {
            BindingMapT Model;
            for (auto const& Var : Vars) {
                Model[Var] = Session.GetModelValue(Var);
            }
            return Solution(Vars, Model);
        }

        Solution Solver::Solve(const ExpT& Exp, BackendT Backend)
        {
            auto Session = MakeSession(Backend);
            Session->Assert(Exp);
            auto Result = Session->CheckSat();

            if (Result == TPResult::UNKNOWN) {
                throw TP::IncompleteTheoryException(Exp, Session->GetReasonUnknown());
            }
            if (Result == TPResult::UNSATISFIABLE) {
                return Solution();
            }
            return ExtractSolution(*Session, VarGatherer::Do(Exp));
        }

        boost::optional<Solution> Solver::FindFirst(const ExpT& Predicate, BackendT Backend)
        {
            auto Retval = Solve(Predicate, Backend);
            if (!Retval.IsSatisfiable()) {
                return boost::none;
            }
            return Retval;
        }

        bool Solver::IsValid(const ExpT& Predicate, BackendT Backend)
        {
            if (Predicate.IsNull_()) {
                throw ModelingError("Cannot check the validity of a null predicate");
            }
            auto Negation = ExprMgr::Instance().MakeExpr(SymxOps::OpNOT, Predicate);
            return !Solve(Negation, Backend).IsSatisfiable();
        }

        SolutionEnumerator Solver::FindAll(const ExpT& Predicate, BackendT Backend)
        {
            return SolutionEnumerator(Predicate, Backend);
        }

    } /* end namespace Query */
} /* end namespace SYMX */

//
// Solver.cpp ends here
