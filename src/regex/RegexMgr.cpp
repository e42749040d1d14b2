// RegexMgr.cpp ---
//
// Filename: RegexMgr.cpp
// Author: Abhishek Udupa
// Created: Fri Jan 23 15:13:00 2015 (-0500)
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

#include "../expr/ExprTypes.hpp"
#include "RegexParser.hpp"
#include "RegexMgr.hpp"

namespace SYMX {
    namespace Regex {

        namespace Detail {

            // Sorts and merges overlapping or adjacent ranges
            static inline CharRangeListT NormalizeRanges(const CharRangeListT& Ranges)
            {
                CharRangeListT Sorted = Ranges;
                sort(Sorted.begin(), Sorted.end());
                CharRangeListT Retval;
                for (auto const& Range : Sorted) {
                    if (Retval.size() > 0 && (u64)Range.first <= (u64)Retval.back().second + 1) {
                        Retval.back().second = max(Retval.back().second, Range.second);
                    } else {
                        Retval.push_back(Range);
                    }
                }
                return Retval;
            }

            static inline CharRangeListT ComplementRanges(const CharRangeListT& Ranges)
            {
                CharRangeListT Retval;
                u32 Next = 0;
                for (auto const& Range : Ranges) {
                    if (Range.first > Next) {
                        Retval.push_back(make_pair(Next, Range.first - 1));
                    }
                    Next = Range.second + 1;
                }
                if (Next <= Exprs::CharType::MaxCodePoint) {
                    Retval.push_back(make_pair(Next, (u32)Exprs::CharType::MaxCodePoint));
                }
                return Retval;
            }

            // Unions are kept as right associated lists
            static inline void FlattenUnion(const RegexRef& Regex, vector<RegexRef>& Operands)
            {
                if (Regex->GetKind() == RegexKindT::Union) {
                    auto AsUnion = Regex->SAs<RegexUnion>();
                    FlattenUnion(AsUnion->GetLeft(), Operands);
                    FlattenUnion(AsUnion->GetRight(), Operands);
                } else {
                    Operands.push_back(Regex);
                }
            }

        } /* end namespace Detail */

        RegexMgr::RegexMgr()
        {
            EmptyRegex = Intern(new RegexEmpty());
            EpsilonRegex = Intern(new RegexEpsilon());
            CharRangeListT AllChars = { make_pair((u32)0, (u32)Exprs::CharType::MaxCodePoint) };
            AnyCharRegex = Intern(new RegexCharClass(AllChars));
        }

        RegexMgr::~RegexMgr()
        {
            // Nothing here
        }

        RegexMgr& RegexMgr::Instance()
        {
            static RegexMgr TheManager;
            return TheManager;
        }

        const RegexRef& RegexMgr::MakeEmpty() const
        {
            return EmptyRegex;
        }

        const RegexRef& RegexMgr::MakeEpsilon() const
        {
            return EpsilonRegex;
        }

        const RegexRef& RegexMgr::MakeAnyChar() const
        {
            return AnyCharRegex;
        }

        RegexRef RegexMgr::MakeChar(u32 CodePoint)
        {
            return MakeRange(CodePoint, CodePoint);
        }

        RegexRef RegexMgr::MakeRange(u32 Low, u32 High)
        {
            CharRangeListT Ranges = { make_pair(Low, High) };
            return MakeCharClass(Ranges);
        }

        RegexRef RegexMgr::MakeCharClass(const CharRangeListT& Ranges, bool Negated)
        {
            CharRangeListT Clamped;
            for (auto const& Range : Ranges) {
                if (Range.first > Range.second) {
                    throw Exprs::ExprTypeError((string)"Invalid character range [" +
                                               to_string(Range.first) + ", " +
                                               to_string(Range.second) + "]");
                }
                if (Range.first > Exprs::CharType::MaxCodePoint) {
                    continue;
                }
                Clamped.push_back(make_pair(Range.first,
                                            min(Range.second,
                                                (u32)Exprs::CharType::MaxCodePoint)));
            }
            auto Normalized = Detail::NormalizeRanges(Clamped);
            if (Negated) {
                Normalized = Detail::ComplementRanges(Normalized);
            }
            if (Normalized.size() == 0) {
                return EmptyRegex;
            }
            return Intern(new RegexCharClass(Normalized));
        }

        RegexRef RegexMgr::MakeConcat(const RegexRef& Left, const RegexRef& Right)
        {
            if (Left == EmptyRegex || Right == EmptyRegex) {
                return EmptyRegex;
            }
            if (Left == EpsilonRegex) {
                return Right;
            }
            if (Right == EpsilonRegex) {
                return Left;
            }
            if (Left->GetKind() == RegexKindT::Concat) {
                auto LeftAsConcat = Left->SAs<RegexConcat>();
                return MakeConcat(LeftAsConcat->GetLeft(),
                                  MakeConcat(LeftAsConcat->GetRight(), Right));
            }
            return Intern(new RegexConcat(Left, Right));
        }

        RegexRef RegexMgr::MakeUnion(const RegexRef& Left, const RegexRef& Right)
        {
            if (Left == Right) {
                return Left;
            }

            vector<RegexRef> Operands;
            Detail::FlattenUnion(Left, Operands);
            Detail::FlattenUnion(Right, Operands);

            // Character classes are merged into one
            CharRangeListT ClassRanges;
            bool HasClass = false;
            vector<RegexRef> Others;
            for (auto const& Operand : Operands) {
                if (Operand == EmptyRegex) {
                    continue;
                }
                if (Operand->GetKind() == RegexKindT::CharClass) {
                    auto const& Ranges = Operand->SAs<RegexCharClass>()->GetRanges();
                    ClassRanges.insert(ClassRanges.end(), Ranges.begin(), Ranges.end());
                    HasClass = true;
                } else {
                    Others.push_back(Operand);
                }
            }
            if (HasClass) {
                Others.push_back(MakeCharClass(ClassRanges));
            }

            sort(Others.begin(), Others.end(), RegexPtrCompare());
            Others.erase(unique(Others.begin(), Others.end()), Others.end());

            if (Others.size() == 0) {
                return EmptyRegex;
            }
            RegexRef Retval = Others.back();
            for (i64 i = (i64)Others.size() - 2; i >= 0; --i) {
                Retval = Intern(new RegexUnion(Others[i], Retval));
            }
            return Retval;
        }

        RegexRef RegexMgr::MakeStar(const RegexRef& Inner)
        {
            if (Inner == EmptyRegex || Inner == EpsilonRegex) {
                return EpsilonRegex;
            }
            if (Inner->GetKind() == RegexKindT::Star) {
                return Inner;
            }
            return Intern(new RegexStar(Inner));
        }

        RegexRef RegexMgr::MakePlus(const RegexRef& Inner)
        {
            return MakeConcat(Inner, MakeStar(Inner));
        }

        RegexRef RegexMgr::MakeOption(const RegexRef& Inner)
        {
            return MakeUnion(EpsilonRegex, Inner);
        }

        RegexRef RegexMgr::Parse(const string& Pattern)
        {
            {
                lock_guard<mutex> Guard(PatternCacheMutex);
                auto it = PatternCache.find(Pattern);
                if (it != PatternCache.end()) {
                    return it->second;
                }
            }

            RegexParser Parser(this, Pattern);
            auto Retval = Parser.Parse();

            lock_guard<mutex> Guard(PatternCacheMutex);
            PatternCache[Pattern] = Retval;
            return Retval;
        }

        RegexRef RegexMgr::ComputeDerivative(const RegexRef& Regex, u32 CodePoint)
        {
            switch (Regex->GetKind()) {
            case RegexKindT::Empty:
            case RegexKindT::Epsilon:
                return EmptyRegex;

            case RegexKindT::CharClass:
                return (Regex->SAs<RegexCharClass>()->Contains(CodePoint) ?
                        EpsilonRegex : EmptyRegex);

            case RegexKindT::Concat: {
                auto AsConcat = Regex->SAs<RegexConcat>();
                auto const& Left = AsConcat->GetLeft();
                auto const& Right = AsConcat->GetRight();
                auto Retval = MakeConcat(Derivative(Left, CodePoint), Right);
                if (Left->IsNullable()) {
                    Retval = MakeUnion(Retval, Derivative(Right, CodePoint));
                }
                return Retval;
            }

            case RegexKindT::Union: {
                auto AsUnion = Regex->SAs<RegexUnion>();
                return MakeUnion(Derivative(AsUnion->GetLeft(), CodePoint),
                                 Derivative(AsUnion->GetRight(), CodePoint));
            }

            case RegexKindT::Star: {
                auto AsStar = Regex->SAs<RegexStar>();
                return MakeConcat(Derivative(AsStar->GetInner(), CodePoint), Regex);
            }

            default:
                throw InternalError((string)"Unhandled regex kind\nAt: " + __FILE__ + ":" +
                                    to_string(__LINE__));
            }
        }

        RegexRef RegexMgr::Derivative(const RegexRef& Regex, u32 CodePoint)
        {
            auto Key = make_pair(Regex.GetPtr_(), CodePoint);
            {
                lock_guard<mutex> Guard(DerivCacheMutex);
                auto it = DerivCache.find(Key);
                if (it != DerivCache.end()) {
                    return it->second;
                }
            }

            auto Retval = ComputeDerivative(Regex, CodePoint);

            lock_guard<mutex> Guard(DerivCacheMutex);
            DerivCache[Key] = Retval;
            return Retval;
        }

    } /* end namespace Regex */
} /* end namespace SYMX */

//
// RegexMgr.cpp ends here
