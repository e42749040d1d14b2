// RegexParser.cpp ---
//
// Filename: RegexParser.cpp
// Author: Abhishek Udupa
// Created: Sun Feb 01 13:23:00 2015 (-0500)
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

#include "../utils/UnicodeUtils.hpp"
#include "RegexMgr.hpp"
#include "RegexParser.hpp"

namespace SYMX {
    namespace Regex {

        const u32 RegexParser::EndOfInput;

        namespace Detail {

            static inline bool IsHexDigit(u32 CodePoint)
            {
                return ((CodePoint >= '0' && CodePoint <= '9') ||
                        (CodePoint >= 'a' && CodePoint <= 'f') ||
                        (CodePoint >= 'A' && CodePoint <= 'F'));
            }

            static inline u32 HexDigitValue(u32 CodePoint)
            {
                if (CodePoint >= '0' && CodePoint <= '9') {
                    return CodePoint - '0';
                }
                if (CodePoint >= 'a' && CodePoint <= 'f') {
                    return CodePoint - 'a' + 10;
                }
                return CodePoint - 'A' + 10;
            }

            static inline void AddClassEscape(u32 Letter, CharRangeListT& Ranges)
            {
                switch (Letter) {
                case 'd':
                    Ranges.push_back(make_pair((u32)'0', (u32)'9'));
                    break;
                case 'w':
                    Ranges.push_back(make_pair((u32)'a', (u32)'z'));
                    Ranges.push_back(make_pair((u32)'A', (u32)'Z'));
                    Ranges.push_back(make_pair((u32)'0', (u32)'9'));
                    Ranges.push_back(make_pair((u32)'_', (u32)'_'));
                    break;
                case 's':
                    Ranges.push_back(make_pair((u32)'\t', (u32)'\r'));
                    Ranges.push_back(make_pair((u32)' ', (u32)' '));
                    break;
                default:
                    break;
                }
            }

        } /* end namespace Detail */

        RegexParser::RegexParser(RegexMgr* Mgr, const string& Pattern)
            : Mgr(Mgr), Pattern(Pattern), Input(UnicodeUtils::DecodeUTF8(Pattern)),
              Position(0)
        {
            // Nothing here
        }

        RegexParser::~RegexParser()
        {
            // Nothing here
        }

        Exprs::ExprTypeError RegexParser::ParseError(const string& Reason) const
        {
            return Exprs::ExprTypeError((string)"Invalid regular expression \"" + Pattern +
                                        "\": " + Reason + " at position " +
                                        to_string(Position));
        }

        u32 RegexParser::Peek() const
        {
            if (Position >= Input.size()) {
                return EndOfInput;
            }
            return Input[Position];
        }

        u32 RegexParser::Next()
        {
            auto Retval = Peek();
            if (Retval != EndOfInput) {
                ++Position;
            }
            return Retval;
        }

        bool RegexParser::Accept(u32 CodePoint)
        {
            if (Peek() == CodePoint) {
                ++Position;
                return true;
            }
            return false;
        }

        void RegexParser::Expect(u32 CodePoint)
        {
            if (!Accept(CodePoint)) {
                if (Peek() == EndOfInput) {
                    throw ParseError((string)"expected '" + (char)CodePoint +
                                     "' but reached the end of the pattern");
                }
                throw ParseError((string)"expected '" + (char)CodePoint + "' but found '" +
                                 UnicodeUtils::EscapeCodePoint(Peek()) + "'");
            }
        }

        bool RegexParser::IsSpecial(u32 CodePoint) const
        {
            switch (CodePoint) {
            case '\\': case '^': case '$': case '*': case '+': case '?': case '.':
            case '(': case ')': case '[': case ']': case '{': case '}': case '|':
                return true;
            default:
                return false;
            }
        }

        bool RegexParser::AtTermStart() const
        {
            auto CodePoint = Peek();
            if (CodePoint == EndOfInput) {
                return false;
            }
            return (!IsSpecial(CodePoint) || CodePoint == '.' || CodePoint == '(' ||
                    CodePoint == '[' || CodePoint == '\\');
        }

        RegexRef RegexParser::Parse()
        {
            auto Retval = ParseRegex();
            if (Peek() != EndOfInput) {
                throw ParseError((string)"unexpected '" + UnicodeUtils::EscapeCodePoint(Peek()) +
                                 "'");
            }
            return Retval;
        }

        RegexRef RegexParser::ParseRegex()
        {
            auto Retval = ParseTerm();
            while (Accept('|')) {
                Retval = Mgr->MakeUnion(Retval, ParseTerm());
            }
            return Retval;
        }

        RegexRef RegexParser::ParseTerm()
        {
            // Empty alternatives and the empty pattern match ""
            if (!AtTermStart()) {
                return Mgr->MakeEpsilon();
            }
            auto Retval = ParseFactor();
            while (AtTermStart()) {
                Retval = Mgr->MakeConcat(Retval, ParseFactor());
            }
            return Retval;
        }

        RegexRef RegexParser::ParseFactor()
        {
            auto Retval = ParseAtom();
            while (true) {
                if (Accept('*')) {
                    Retval = Mgr->MakeStar(Retval);
                } else if (Accept('+')) {
                    Retval = Mgr->MakePlus(Retval);
                } else if (Accept('?')) {
                    Retval = Mgr->MakeOption(Retval);
                } else {
                    break;
                }
            }
            return Retval;
        }

        RegexRef RegexParser::ParseAtom()
        {
            auto CodePoint = Peek();
            if (CodePoint == EndOfInput) {
                throw ParseError("unexpected end of the pattern");
            }

            if (!IsSpecial(CodePoint)) {
                Next();
                return Mgr->MakeChar(CodePoint);
            }

            CharRangeListT Unused;
            switch (Next()) {
            case '\\':
                return ParseEscape(false, Unused);

            case '.':
                return Mgr->MakeAnyChar();

            case '(': {
                auto Retval = ParseRegex();
                Expect(')');
                return Retval;
            }

            case '[': {
                bool Negated = Accept('^');
                CharRangeListT Ranges;
                ParseClassItem(Ranges);
                while (Peek() != ']') {
                    if (Peek() == EndOfInput) {
                        throw ParseError("unterminated character class");
                    }
                    ParseClassItem(Ranges);
                }
                Expect(']');
                return Mgr->MakeCharClass(Ranges, Negated);
            }

            default:
                --Position;
                throw ParseError((string)"unexpected '" + UnicodeUtils::EscapeCodePoint(CodePoint) +
                                 "'");
            }
        }

        u32 RegexParser::ParseHexDigits(u32 MinDigits, u32 MaxDigits)
        {
            u32 Retval = 0;
            u32 NumDigits = 0;
            while (NumDigits < MaxDigits && Detail::IsHexDigit(Peek())) {
                Retval = Retval * 16 + Detail::HexDigitValue(Next());
                ++NumDigits;
            }
            if (NumDigits < MinDigits) {
                throw ParseError("malformed hexadecimal escape");
            }
            return Retval;
        }

        // Parses what follows a backslash. Class escapes (\d, \w, \s
        // and their negations) add their ranges to ClassRanges when
        // InClass is set.
        RegexRef RegexParser::ParseEscape(bool InClass, CharRangeListT& ClassRanges)
        {
            auto Letter = Next();
            u32 CodePoint;

            switch (Letter) {
            case EndOfInput:
                throw ParseError("dangling '\\' at the end of the pattern");

            case 'n': CodePoint = '\n'; break;
            case 't': CodePoint = '\t'; break;
            case 'r': CodePoint = '\r'; break;
            case 'f': CodePoint = '\f'; break;
            case 'v': CodePoint = '\v'; break;
            case '0': CodePoint = 0; break;

            case 'x':
                CodePoint = ParseHexDigits(2, 2);
                break;

            case 'u':
                if (Accept('{')) {
                    CodePoint = ParseHexDigits(1, 6);
                    Expect('}');
                } else {
                    CodePoint = ParseHexDigits(4, 4);
                }
                break;

            case 'd': case 'w': case 's': {
                CharRangeListT Ranges;
                Detail::AddClassEscape(Letter, Ranges);
                if (InClass) {
                    ClassRanges.insert(ClassRanges.end(), Ranges.begin(), Ranges.end());
                    return RegexRef::NullPtr;
                }
                return Mgr->MakeCharClass(Ranges);
            }

            case 'D': case 'W': case 'S': {
                if (InClass) {
                    throw ParseError("negated class escapes are not allowed inside classes");
                }
                CharRangeListT Ranges;
                Detail::AddClassEscape(Letter - 'A' + 'a', Ranges);
                return Mgr->MakeCharClass(Ranges, true);
            }

            default:
                CodePoint = Letter;
                break;
            }

            if (CodePoint > Exprs::CharType::MaxCodePoint) {
                throw ParseError("escaped code point out of range");
            }
            if (InClass) {
                ClassRanges.push_back(make_pair(CodePoint, CodePoint));
                return RegexRef::NullPtr;
            }
            return Mgr->MakeChar(CodePoint);
        }

        void RegexParser::ParseClassItem(CharRangeListT& Ranges)
        {
            u32 Low;
            auto CodePoint = Next();
            if (CodePoint == EndOfInput) {
                throw ParseError("unterminated character class");
            }
            if (CodePoint == ']') {
                --Position;
                throw ParseError("empty character class");
            }
            if (CodePoint == '\\') {
                CharRangeListT Escaped;
                ParseEscape(true, Escaped);
                // A class escape such as \d cannot start a range
                if (Escaped.size() != 1 || Escaped[0].first != Escaped[0].second) {
                    Ranges.insert(Ranges.end(), Escaped.begin(), Escaped.end());
                    return;
                }
                Low = Escaped[0].first;
            } else {
                Low = CodePoint;
            }

            // A '-' right before the closing ']' is a literal
            if (Peek() != '-' || (Position + 1 < Input.size() && Input[Position + 1] == ']') ||
                Position + 1 >= Input.size()) {
                Ranges.push_back(make_pair(Low, Low));
                return;
            }
            Next();

            u32 High;
            CodePoint = Next();
            if (CodePoint == '\\') {
                CharRangeListT Escaped;
                ParseEscape(true, Escaped);
                if (Escaped.size() != 1 || Escaped[0].first != Escaped[0].second) {
                    throw ParseError("invalid character range");
                }
                High = Escaped[0].first;
            } else {
                High = CodePoint;
            }
            if (High < Low) {
                throw ParseError("invalid character range");
            }
            Ranges.push_back(make_pair(Low, High));
        }

    } /* end namespace Regex */
} /* end namespace SYMX */

//
// RegexParser.cpp ends here
