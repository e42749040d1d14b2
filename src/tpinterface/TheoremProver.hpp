// TheoremProver.hpp ---
//
// Filename: TheoremProver.hpp
// Author: Abhishek Udupa
// Created: Sat May 16 02:42:00 2015 (-0500)
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

// The SMT backend: a solver session over a Z3 context

#if !defined SYMX_THEOREM_PROVER_HPP_
#define SYMX_THEOREM_PROVER_HPP_

#include <vector>

#include <z3.h>

#include "../common/SymxFwdDecls.hpp"

#include "Z3Objects.hpp"
#include "Z3Lowering.hpp"
#include "SolverSession.hpp"

namespace SYMX {
    namespace TP {

        class Z3TheoremProver : public SolverSession
        {
        private:
            Z3Ctx Ctx;
            Z3LCRef LCtx;
            Z3Solver Solver;
            Z3Model TheModel;
            string ReasonUnknown;

            const Z3Model& GetModel();

        protected:
            virtual void AssertLowered(const ExpT& Assertion) override;
            virtual ValueRef GetLoweredModelValue(const ExpT& Var) override;
            virtual TPResult CheckSatLowered() override;
            virtual void PushLowered() override;
            virtual void PopLowered(u32 NumScopes) override;

        public:
            Z3TheoremProver();
            virtual ~Z3TheoremProver();

            virtual BackendT GetBackend() const override;

            // Asks a running check to give up, it returns UNKNOWN
            void Interrupt();

            virtual string GetReasonUnknown() const override;

            // Number of Z3 assertions, including the type assumptions
            u64 GetNumLoweredAssertions() const;
        };

    } /* end namespace TP */
} /* end namespace SYMX */

#endif /* SYMX_THEOREM_PROVER_HPP_ */

//
// TheoremProver.hpp ends here
