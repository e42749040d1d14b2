// Z3RegexLowerer.hpp ---
//
// Filename: Z3RegexLowerer.hpp
// Author: Abhishek Udupa
// Created: Fri Mar 27 14:33:00 2015 (-0500)
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

// Translation of normalized regexes into Z3 regular expressions
// over strings

#if !defined SYMX_Z3_REGEX_LOWERER_HPP_
#define SYMX_Z3_REGEX_LOWERER_HPP_

#include "../common/SymxFwdDecls.hpp"
#include "../regex/RegexAST.hpp"

#include "Z3Lowering.hpp"

namespace SYMX {
    namespace TP {

        class Z3RegexLowerer
        {
        private:
            Z3LCRef LCtx;
            Z3Ctx Ctx;
            Z3Sort ReSort;

            Z3Expr MakeCharString(u32 CodePoint) const;
            Z3Expr LowerCharClass(const Regex::RegexCharClass* CharClass) const;
            Z3Expr Lower(const Regex::RegexRef& Regex);

        public:
            Z3RegexLowerer(const Z3LCRef& LCtx);
            ~Z3RegexLowerer();

            // Results are cached in the lowered context
            static Z3Expr Do(const Regex::RegexRef& Regex, const Z3LCRef& LCtx);
        };

    } /* end namespace TP */
} /* end namespace SYMX */

#endif /* SYMX_Z3_REGEX_LOWERER_HPP_ */

//
// Z3RegexLowerer.hpp ends here
