// RegexMatcher.hpp ---
//
// Filename: RegexMatcher.hpp
// Author: Abhishek Udupa
// Created: Tue Jun 16 11:02:00 2015 (-0500)
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

#if !defined SYMX_REGEX_MATCHER_HPP_
#define SYMX_REGEX_MATCHER_HPP_

#include <vector>

#include "../common/SymxFwdDecls.hpp"
#include "RegexAST.hpp"

namespace SYMX {
    namespace Regex {

        // Runs the derivative automaton of a regex. The states are
        // the (interned) derivatives, and the transitions are
        // memoized in the RegexMgr, so repeated matches against the
        // same pattern only walk already built states.
        class RegexMatcher
        {
        public:
            static bool Accepts(const RegexRef& Regex, const vector<u32>& CodePoints);
            static bool Accepts(const string& Pattern, const vector<u32>& CodePoints);
        };

    } /* end namespace Regex */
} /* end namespace SYMX */

#endif /* SYMX_REGEX_MATCHER_HPP_ */

//
// RegexMatcher.hpp ends here
