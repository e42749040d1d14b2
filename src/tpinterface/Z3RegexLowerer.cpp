// Z3RegexLowerer.cpp ---
//
// Filename: Z3RegexLowerer.cpp
// Author: Abhishek Udupa
// Created: Mon May 25 07:19:00 2015 (-0500)
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

#include "Z3RegexLowerer.hpp"

namespace SYMX {
    namespace TP {

        using namespace Regex;

        Z3RegexLowerer::Z3RegexLowerer(const Z3LCRef& LCtx)
            : LCtx(LCtx), Ctx(LCtx->GetZ3Ctx())
        {
            Z3Sort StringSort(Ctx, Z3_mk_string_sort(*Ctx));
            ReSort = Z3Sort(Ctx, Z3_mk_re_sort(*Ctx, StringSort));
        }

        Z3RegexLowerer::~Z3RegexLowerer()
        {
            // Nothing here
        }

        Z3Expr Z3RegexLowerer::MakeCharString(u32 CodePoint) const
        {
            vector<u32> CodePoints = { CodePoint };
            return Z3Expr(Ctx, Z3_mk_string(*Ctx, MakeZ3StringLiteral(CodePoints).c_str()));
        }

        Z3Expr Z3RegexLowerer::LowerCharClass(const RegexCharClass* CharClass) const
        {
            auto const& Ranges = CharClass->GetRanges();
            if (Ranges.size() == 0) {
                return Z3Expr(Ctx, Z3_mk_re_empty(*Ctx, ReSort));
            }

            vector<Z3Expr> Alternatives;
            for (auto const& Range : Ranges) {
                auto Low = MakeCharString(Range.first);
                if (Range.first == Range.second) {
                    Alternatives.push_back(Z3Expr(Ctx, Z3_mk_seq_to_re(*Ctx, Low)));
                } else {
                    auto High = MakeCharString(Range.second);
                    Alternatives.push_back(Z3Expr(Ctx, Z3_mk_re_range(*Ctx, Low, High)));
                }
            }
            if (Alternatives.size() == 1) {
                return Alternatives[0];
            }

            vector<Z3_ast> Args;
            for (auto const& Alternative : Alternatives) {
                Args.push_back(Alternative);
            }
            return Z3Expr(Ctx, Z3_mk_re_union(*Ctx, Args.size(), Args.data()));
        }

        Z3Expr Z3RegexLowerer::Lower(const RegexRef& Regex)
        {
            auto const& Cached = LCtx->GetLoweredRegex(Regex);
            if (!Cached.IsNull()) {
                return Cached;
            }

            Z3Expr Retval;
            switch (Regex->GetKind()) {
            case RegexKindT::Empty:
                Retval = Z3Expr(Ctx, Z3_mk_re_empty(*Ctx, ReSort));
                break;

            case RegexKindT::Epsilon: {
                Z3Expr EmptyString(Ctx, Z3_mk_string(*Ctx, ""));
                Retval = Z3Expr(Ctx, Z3_mk_seq_to_re(*Ctx, EmptyString));
                break;
            }

            case RegexKindT::CharClass:
                Retval = LowerCharClass(Regex->SAs<RegexCharClass>());
                break;

            case RegexKindT::Concat:
            case RegexKindT::Union: {
                auto AsBinary = Regex->SAs<RegexBinaryBase>();
                auto Left = Lower(AsBinary->GetLeft());
                auto Right = Lower(AsBinary->GetRight());
                Z3_ast Args[2] = { Left, Right };
                if (Regex->GetKind() == RegexKindT::Concat) {
                    Retval = Z3Expr(Ctx, Z3_mk_re_concat(*Ctx, 2, Args));
                } else {
                    Retval = Z3Expr(Ctx, Z3_mk_re_union(*Ctx, 2, Args));
                }
                break;
            }

            case RegexKindT::Star: {
                auto Inner = Lower(Regex->SAs<RegexStar>()->GetInner());
                Retval = Z3Expr(Ctx, Z3_mk_re_star(*Ctx, Inner));
                break;
            }
            }

            LCtx->AddLoweredRegex(Regex, Retval);
            return Retval;
        }

        Z3Expr Z3RegexLowerer::Do(const RegexRef& Regex, const Z3LCRef& LCtx)
        {
            Z3RegexLowerer TheLowerer(LCtx);
            return TheLowerer.Lower(Regex);
        }

    } /* end namespace TP */
} /* end namespace SYMX */

//
// Z3RegexLowerer.cpp ends here
