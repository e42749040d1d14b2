// RegexMgr.hpp ---
//
// Filename: RegexMgr.hpp
// Author: Abhishek Udupa
// Created: Fri May 22 14:05:00 2015 (-0500)
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

#if !defined SYMX_REGEX_MGR_HPP_
#define SYMX_REGEX_MGR_HPP_

#include <unordered_map>
#include <mutex>

#include "../common/SymxFwdDecls.hpp"
#include "../containers/InternTable.hpp"
#include "RegexAST.hpp"

namespace SYMX {
    namespace Regex {

        class RegexMgr
        {
        private:
            typedef InternTable<RegexBase, RegexPtrHasher, FastRegexPtrEquals> NodeCacheT;

            class DerivKeyHasher
            {
            public:
                inline u64 operator () (const pair<const RegexBase*, u32>& Key) const
                {
                    return (std::hash<const RegexBase*>()(Key.first) ^
                            ((u64)Key.second << 1));
                }
            };

            NodeCacheT NodeCache;

            unordered_map<string, RegexRef> PatternCache;
            mutex PatternCacheMutex;

            unordered_map<pair<const RegexBase*, u32>, RegexRef, DerivKeyHasher> DerivCache;
            mutex DerivCacheMutex;

            RegexRef EmptyRegex;
            RegexRef EpsilonRegex;
            RegexRef AnyCharRegex;

            RegexMgr();

            inline RegexRef Intern(const RegexBase* Regex)
            {
                return NodeCache.Intern(Regex);
            }

            RegexRef ComputeDerivative(const RegexRef& Regex, u32 CodePoint);

        public:
            RegexMgr(const RegexMgr& Other) = delete;
            RegexMgr(RegexMgr&& Other) = delete;
            ~RegexMgr();

            static RegexMgr& Instance();

            const RegexRef& MakeEmpty() const;
            const RegexRef& MakeEpsilon() const;
            // The class of all code points
            const RegexRef& MakeAnyChar() const;
            RegexRef MakeChar(u32 CodePoint);
            RegexRef MakeRange(u32 Low, u32 High);
            // Ranges need not be sorted or disjoint. A negated class
            // matches any single code point outside the ranges.
            RegexRef MakeCharClass(const CharRangeListT& Ranges, bool Negated = false);
            RegexRef MakeConcat(const RegexRef& Left, const RegexRef& Right);
            RegexRef MakeUnion(const RegexRef& Left, const RegexRef& Right);
            RegexRef MakeStar(const RegexRef& Inner);
            RegexRef MakePlus(const RegexRef& Inner);
            RegexRef MakeOption(const RegexRef& Inner);

            // Parses and caches a pattern. Throws ExprTypeError on
            // unparsable patterns.
            RegexRef Parse(const string& Pattern);

            // The Brzozowski derivative of a regex with respect to
            // a code point, memoized
            RegexRef Derivative(const RegexRef& Regex, u32 CodePoint);
        };

    } /* end namespace Regex */
} /* end namespace SYMX */

#endif /* SYMX_REGEX_MGR_HPP_ */

//
// RegexMgr.hpp ends here
