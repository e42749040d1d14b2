// SolutionEnumerator.hpp ---
//
// Filename: SolutionEnumerator.hpp
// Author: Abhishek Udupa
// Created: Wed Jan 28 13:18:00 2015 (-0500)
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

// A lazy, restartable range over the distinct models of a
// predicate. Each traversal owns one solver session: the predicate
// is asserted once, and after every model a clause excluding that
// model is added before solving again. The session goes away when
// the models run out, when the iterator is destroyed or when
// solving throws.

#if !defined SYMX_SOLUTION_ENUMERATOR_HPP_
#define SYMX_SOLUTION_ENUMERATOR_HPP_

#include <memory>
#include <iterator>
#include <vector>

#include <boost/optional.hpp>

#include "../common/SymxFwdDecls.hpp"
#include "../tpinterface/SolverSession.hpp"

#include "Solution.hpp"

namespace SYMX {
    namespace Query {

        class SolutionEnumerator
        {
        private:
            ExpT Predicate;
            BackendT Backend;
            vector<ExpT> Vars;

        public:
            class Iterator
            {
            private:
                const SolutionEnumerator* Enumerator;
                unique_ptr<TP::SolverSession> Session;
                boost::optional<Solution> Current;
                u64 Position;

                // Solves with the current assertions and updates
                // Current, releasing the session when done
                void Solve();
                ExpT MakeBlockingClause(const Solution& TheSolution) const;

            public:
                typedef input_iterator_tag iterator_category;
                typedef Solution value_type;
                typedef ptrdiff_t difference_type;
                typedef const Solution* pointer;
                typedef const Solution& reference;

                // The end iterator
                Iterator();
                Iterator(const SolutionEnumerator* Enumerator);
                Iterator(const Iterator& Other) = delete;
                Iterator(Iterator&& Other);
                ~Iterator();

                Iterator& operator = (const Iterator& Other) = delete;
                Iterator& operator = (Iterator&& Other);

                const Solution& operator * () const;
                const Solution* operator -> () const;
                Iterator& operator ++ ();

                // Iterators compare equal only when both are exhausted
                bool operator == (const Iterator& Other) const;
                bool operator != (const Iterator& Other) const;

                bool IsExhausted() const;
                // True while the iterator holds a live session
                bool HasSession() const;
                // Number of models produced so far, counting the current one
                u64 GetPosition() const;
            };

            SolutionEnumerator(const ExpT& Predicate, BackendT Backend);
            ~SolutionEnumerator();

            // Opens a fresh session for each traversal
            Iterator begin() const;
            Iterator end() const;

            // At most N models
            vector<Solution> Take(u64 N) const;

            const ExpT& GetPredicate() const;
            BackendT GetBackend() const;
            const vector<ExpT>& GetVars() const;
        };

    } /* end namespace Query */
} /* end namespace SYMX */

#endif /* SYMX_SOLUTION_ENUMERATOR_HPP_ */

//
// SolutionEnumerator.hpp ends here
