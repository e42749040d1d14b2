// Solver.hpp ---
//
// Filename: Solver.hpp
// Author: Abhishek Udupa
// Created: Sun May 31 18:37:00 2015 (-0500)
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

// Entry points for solving. Every call works on its own solver
// session, so concurrent calls share nothing but the expression
// caches.

#if !defined SYMX_SOLVER_HPP_
#define SYMX_SOLVER_HPP_

#include <memory>

#include <boost/optional.hpp>

#include "../common/SymxFwdDecls.hpp"
#include "../tpinterface/SolverSession.hpp"

#include "Solution.hpp"
#include "SolutionEnumerator.hpp"

namespace SYMX {
    namespace Query {

        class Solver
        {
        private:
            Solver() = delete;

        public:
            // A fresh, empty session for the backend
            static unique_ptr<TP::SolverSession> MakeSession(BackendT Backend);

            // Reads the model of a satisfiable session over Vars
            static Solution ExtractSolution(TP::SolverSession& Session,
                                            const vector<ExpT>& Vars);

            // Satisfiable or unsatisfiable solution for Exp. Throws
            // IncompleteTheoryException when the backend cannot decide.
            static Solution Solve(const ExpT& Exp, BackendT Backend = BackendT::SMT);
            static boost::optional<Solution> FindFirst(const ExpT& Predicate,
                                                       BackendT Backend = BackendT::SMT);
            // True iff the negation of Predicate is unsatisfiable
            static bool IsValid(const ExpT& Predicate, BackendT Backend = BackendT::SMT);
            // Lazily enumerates distinct models of Predicate
            static SolutionEnumerator FindAll(const ExpT& Predicate,
                                              BackendT Backend = BackendT::SMT);
        };

    } /* end namespace Query */
} /* end namespace SYMX */

#endif /* SYMX_SOLVER_HPP_ */

//
// Solver.hpp ends here
