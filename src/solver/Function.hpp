// Function.hpp ---
//
// Filename: Function.hpp
// Author: Abhishek Udupa
// Created: Sat Jul 11 21:05:00 2015 (-0500)
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

// A function over symbolic parameters: a list of distinct
// variables and a body over them. It can be evaluated on concrete
// arguments, interpreted or compiled, and inverted by asking the
// solver for arguments that satisfy an invariant of the arguments
// and the body.

#if !defined SYMX_FUNCTION_HPP_
#define SYMX_FUNCTION_HPP_

#include <vector>
#include <functional>

#include <boost/optional.hpp>

#include "../common/SymxFwdDecls.hpp"
#include "../compile/Compiler.hpp"

#include "Solution.hpp"
#include "SolutionEnumerator.hpp"

namespace SYMX {
    namespace Query {

        class Function : public Stringifiable
        {
        public:
            // Builds a boolean condition from the parameters and the body
            typedef function<ExpT(const vector<ExpT>&, const ExpT&)> InvariantT;

        private:
            vector<ExpT> Params;
            ExpT Body;
            Compile::CompiledFunctionRef Compiled;

            ExpT MakeCondition(const InvariantT& Invariant) const;

        public:
            // Throws ModelingError if Params are not distinct variables
            // or if Body has a free variable outside Params
            Function(const vector<ExpT>& Params, const ExpT& Body);
            virtual ~Function();

            const vector<ExpT>& GetParams() const;
            const ExpT& GetBody() const;

            // Later evaluations go through the compiled form
            void Compile();
            bool IsCompiled() const;

            ValueRef Evaluate(const vector<ValueRef>& Args) const;

            // Argument values, in parameter order, for which the
            // invariant holds
            boost::optional<vector<ValueRef>> Find(const InvariantT& Invariant,
                                                   BackendT Backend = BackendT::SMT) const;
            SolutionEnumerator FindAll(const InvariantT& Invariant,
                                       BackendT Backend = BackendT::SMT) const;

            virtual string ToString(u32 Verbosity = 0) const override;
        };

    } /* end namespace Query */
} /* end namespace SYMX */

#endif /* SYMX_FUNCTION_HPP_ */

//
// Function.hpp ends here
