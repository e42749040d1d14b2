// DDSolver.hpp ---
//
// Filename: DDSolver.hpp
// Author: Abhishek Udupa
// Created: Wed Mar 04 11:30:00 2015 (-0500)
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

// The decision diagram backend: a solver session over a private
// DDManager. The conjunction of the assertions is kept as a single
// diagram; a scope is the diagram at the time of the push.

#if !defined SYMX_DD_SOLVER_HPP_
#define SYMX_DD_SOLVER_HPP_

#include <vector>

#include "../common/SymxFwdDecls.hpp"
#include "../tpinterface/SolverSession.hpp"

#include "DDManager.hpp"
#include "DDBitBlaster.hpp"

namespace SYMX {
    namespace DD {

        class DDSolver : public TP::SolverSession
        {
        private:
            DDManager Mgr;
            DDBitBlaster Blaster;
            DDNodeRef Root;
            vector<DDNodeRef> RootStack;
            // One satisfying path of Root, -1 for untested variables
            vector<i08> Assignment;

        protected:
            virtual void AssertLowered(const ExpT& Assertion) override;
            virtual ValueRef GetLoweredModelValue(const ExpT& Var) override;
            virtual TP::TPResult CheckSatLowered() override;
            virtual void PushLowered() override;
            virtual void PopLowered(u32 NumScopes) override;

        public:
            DDSolver();
            DDSolver(u64 MaxNodes);
            virtual ~DDSolver();

            virtual BackendT GetBackend() const override;

            const DDManager& GetManager() const;
            DDNodeRef GetRoot() const;
        };

    } /* end namespace DD */
} /* end namespace SYMX */

#endif /* SYMX_DD_SOLVER_HPP_ */

//
// DDSolver.hpp ends here
