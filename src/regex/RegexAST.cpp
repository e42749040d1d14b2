// RegexAST.cpp ---
//
// Filename: RegexAST.cpp
// Author: Abhishek Udupa
// Created: Mon Mar 23 18:38:00 2015 (-0500)
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

#include <algorithm>
#include <boost/functional/hash.hpp>

#include "../utils/UnicodeUtils.hpp"

#include "RegexAST.hpp"

namespace SYMX {
    namespace Regex {

        namespace Detail {

            static inline string CodePointToString(u32 CodePoint)
            {
                switch (CodePoint) {
                case '\\': case '^': case '$': case '*': case '+': case '?': case '.':
                case '(': case ')': case '[': case ']': case '{': case '}': case '|':
                case '-':
                    return (string)"\\" + (char)CodePoint;
                default:
                    return UnicodeUtils::EscapeCodePoint(CodePoint);
                }
            }

        } /* end namespace Detail */

        // RegexBase
        RegexBase::RegexBase(RegexKindT Kind, bool Nullable)
            : Kind(Kind), Nullable(Nullable), HashValid(false), HashCode(0)
        {
            // Nothing here
        }

        RegexBase::~RegexBase()
        {
            // Nothing here
        }

        RegexKindT RegexBase::GetKind() const
        {
            return Kind;
        }

        bool RegexBase::IsNullable() const
        {
            return Nullable;
        }

        u64 RegexBase::Hash() const
        {
            if (!HashValid.load(memory_order_acquire)) {
                u64 Retval = 0;
                boost::hash_combine(Retval, (u32)Kind);
                boost::hash_combine(Retval, ComputeHashValue());
                HashCode.store(Retval, memory_order_relaxed);
                HashValid.store(true, memory_order_release);
            }
            return HashCode.load(memory_order_relaxed);
        }

        i32 RegexBase::Compare(const RegexBase& Other) const
        {
            if (&Other == this) {
                return 0;
            }
            if (Kind != Other.Kind) {
                return ((u32)Kind < (u32)Other.Kind ? -1 : 1);
            }
            return CompareSameKind(Other);
        }

        bool RegexBase::LT(const RegexBase& Other) const
        {
            return (Compare(Other) < 0);
        }

        bool RegexBase::FastEQ(const RegexBase& Other) const
        {
            return (Kind == Other.Kind);
        }

        // RegexEmpty
        RegexEmpty::RegexEmpty()
            : RegexBase(RegexKindT::Empty, false)
        {
            // Nothing here
        }

        RegexEmpty::~RegexEmpty()
        {
            // Nothing here
        }

        u64 RegexEmpty::ComputeHashValue() const
        {
            return 0;
        }

        i32 RegexEmpty::CompareSameKind(const RegexBase& Other) const
        {
            return 0;
        }

        string RegexEmpty::ToString(u32 Verbosity) const
        {
            return "[]";
        }

        // RegexEpsilon
        RegexEpsilon::RegexEpsilon()
            : RegexBase(RegexKindT::Epsilon, true)
        {
            // Nothing here
        }

        RegexEpsilon::~RegexEpsilon()
        {
            // Nothing here
        }

        u64 RegexEpsilon::ComputeHashValue() const
        {
            return 0;
        }

        i32 RegexEpsilon::CompareSameKind(const RegexBase& Other) const
        {
            return 0;
        }

        string RegexEpsilon::ToString(u32 Verbosity) const
        {
            return "()";
        }

        // RegexCharClass
        RegexCharClass::RegexCharClass(const CharRangeListT& Ranges)
            : RegexBase(RegexKindT::CharClass, false), Ranges(Ranges)
        {
            // Nothing here
        }

        RegexCharClass::~RegexCharClass()
        {
            // Nothing here
        }

        const CharRangeListT& RegexCharClass::GetRanges() const
        {
            return Ranges;
        }

        bool RegexCharClass::Contains(u32 CodePoint) const
        {
            auto it = upper_bound(Ranges.begin(), Ranges.end(),
                                  make_pair(CodePoint, UINT32_MAX));
            if (it == Ranges.begin()) {
                return false;
            }
            --it;
            return (CodePoint >= it->first && CodePoint <= it->second);
        }

        u64 RegexCharClass::ComputeHashValue() const
        {
            u64 Retval = 0;
            for (auto const& Range : Ranges) {
                boost::hash_combine(Retval, Range.first);
                boost::hash_combine(Retval, Range.second);
            }
            return Retval;
        }

        i32 RegexCharClass::CompareSameKind(const RegexBase& Other) const
        {
            auto const& OtherRanges = Other.SAs<RegexCharClass>()->Ranges;
            if (Ranges == OtherRanges) {
                return 0;
            }
            return (Ranges < OtherRanges ? -1 : 1);
        }

        bool RegexCharClass::FastEQ(const RegexBase& Other) const
        {
            auto OtherAsClass = Other.As<RegexCharClass>();
            return (OtherAsClass != nullptr && OtherAsClass->Ranges == Ranges);
        }

        string RegexCharClass::ToString(u32 Verbosity) const
        {
            if (Ranges.size() == 1 && Ranges[0].first == Ranges[0].second) {
                return Detail::CodePointToString(Ranges[0].first);
            }
            string Retval = "[";
            for (auto const& Range : Ranges) {
                Retval += Detail::CodePointToString(Range.first);
                if (Range.second != Range.first) {
                    Retval += "-" + Detail::CodePointToString(Range.second);
                }
            }
            return Retval + "]";
        }

        // RegexBinaryBase
        RegexBinaryBase::RegexBinaryBase(RegexKindT Kind, bool Nullable,
                                         const RegexRef& Left, const RegexRef& Right)
            : RegexBase(Kind, Nullable), Left(Left), Right(Right)
        {
            // Nothing here
        }

        RegexBinaryBase::~RegexBinaryBase()
        {
            // Nothing here
        }

        const RegexRef& RegexBinaryBase::GetLeft() const
        {
            return Left;
        }

        const RegexRef& RegexBinaryBase::GetRight() const
        {
            return Right;
        }

        u64 RegexBinaryBase::ComputeHashValue() const
        {
            u64 Retval = 0;
            boost::hash_combine(Retval, Left->Hash());
            boost::hash_combine(Retval, Right->Hash());
            return Retval;
        }

        i32 RegexBinaryBase::CompareSameKind(const RegexBase& Other) const
        {
            auto OtherAsBinary = Other.SAs<RegexBinaryBase>();
            auto Res = Left->Compare(*(OtherAsBinary->Left));
            if (Res != 0) {
                return Res;
            }
            return Right->Compare(*(OtherAsBinary->Right));
        }

        bool RegexBinaryBase::FastEQ(const RegexBase& Other) const
        {
            if (Other.GetKind() != GetKind()) {
                return false;
            }
            auto OtherAsBinary = Other.SAs<RegexBinaryBase>();
            return (Left == OtherAsBinary->Left && Right == OtherAsBinary->Right);
        }

        // RegexConcat
        RegexConcat::RegexConcat(const RegexRef& Left, const RegexRef& Right)
            : RegexBinaryBase(RegexKindT::Concat, Left->IsNullable() && Right->IsNullable(),
                              Left, Right)
        {
            // Nothing here
        }

        RegexConcat::~RegexConcat()
        {
            // Nothing here
        }

        string RegexConcat::ToString(u32 Verbosity) const
        {
            return GetLeft()->ToString(Verbosity) + GetRight()->ToString(Verbosity);
        }

        // RegexUnion
        RegexUnion::RegexUnion(const RegexRef& Left, const RegexRef& Right)
            : RegexBinaryBase(RegexKindT::Union, Left->IsNullable() || Right->IsNullable(),
                              Left, Right)
        {
            // Nothing here
        }

        RegexUnion::~RegexUnion()
        {
            // Nothing here
        }

        string RegexUnion::ToString(u32 Verbosity) const
        {
            return (string)"(" + GetLeft()->ToString(Verbosity) + "|" +
                GetRight()->ToString(Verbosity) + ")";
        }

        // RegexStar
        RegexStar::RegexStar(const RegexRef& Inner)
            : RegexBase(RegexKindT::Star, true), Inner(Inner)
        {
            // Nothing here
        }

        RegexStar::~RegexStar()
        {
            // Nothing here
        }

        const RegexRef& RegexStar::GetInner() const
        {
            return Inner;
        }

        u64 RegexStar::ComputeHashValue() const
        {
            return Inner->Hash();
        }

        i32 RegexStar::CompareSameKind(const RegexBase& Other) const
        {
            return Inner->Compare(*(Other.SAs<RegexStar>()->Inner));
        }

        bool RegexStar::FastEQ(const RegexBase& Other) const
        {
            auto OtherAsStar = Other.As<RegexStar>();
            return (OtherAsStar != nullptr && OtherAsStar->Inner == Inner);
        }

        string RegexStar::ToString(u32 Verbosity) const
        {
            return (string)"(" + Inner->ToString(Verbosity) + ")*";
        }

    } /* end namespace Regex */
} /* end namespace SYMX */

//
// RegexAST.cpp ends here
