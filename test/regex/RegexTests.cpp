// RegexTests.cpp ---
//
// Filename: RegexTests.cpp
// Author: Abhishek Udupa
// Created: Thu Jan 29 19:25:00 2015 (-0500)
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

#include <gtest/gtest.h>

#include "../../src/expr/ExprMgr.hpp"
#include "../../src/regex/RegexMgr.hpp"
#include "../../src/regex/RegexMatcher.hpp"

using namespace SYMX;
using namespace Regex;

static vector<u32> CodePoints(const string& UTF8String)
{
    auto Value = Exprs::ExprMgr::Instance().MakeStringValue(UTF8String);
    return Value->SAs<Exprs::SeqValue>()->GetCodePoints();
}

static bool Matches(const string& Pattern, const string& Input)
{
    return RegexMatcher::Accepts(Pattern, CodePoints(Input));
}

TEST(RegexTests, ParsedPatternsAreCached)
{
    auto& Mgr = RegexMgr::Instance();
    auto R1 = Mgr.Parse("(ab|c)*d");
    auto R2 = Mgr.Parse("(ab|c)*d");
    EXPECT_EQ(R1.GetPtr_(), R2.GetPtr_());
}

TEST(RegexTests, LiteralsAndConcatenation)
{
    EXPECT_TRUE(Matches("abc", "abc"));
    EXPECT_FALSE(Matches("abc", "ab"));
    EXPECT_FALSE(Matches("abc", "abcd"));
    EXPECT_TRUE(Matches("", ""));
    EXPECT_FALSE(Matches("", "a"));
}

TEST(RegexTests, PostfixOperators)
{
    EXPECT_TRUE(Matches("a*", ""));
    EXPECT_TRUE(Matches("a*", "aaaa"));
    EXPECT_FALSE(Matches("a+", ""));
    EXPECT_TRUE(Matches("a+b+", "aabbb"));
    EXPECT_FALSE(Matches("a+b+", "ba"));
    EXPECT_FALSE(Matches("a+b+", "aaa"));
    EXPECT_TRUE(Matches("colou?r", "color"));
    EXPECT_TRUE(Matches("colou?r", "colour"));
    EXPECT_FALSE(Matches("colou?r", "colouur"));
}

TEST(RegexTests, AlternationAndGrouping)
{
    EXPECT_TRUE(Matches("cat|dog", "dog"));
    EXPECT_FALSE(Matches("cat|dog", "cog"));
    EXPECT_TRUE(Matches("(ab)*", "ababab"));
    EXPECT_FALSE(Matches("(ab)*", "aba"));
    EXPECT_TRUE(Matches("x(a|b)*y", "xabbay"));
    EXPECT_TRUE(Matches("a(b|)c", "ac"));
    EXPECT_TRUE(Matches("a(b|)c", "abc"));
}

TEST(RegexTests, CharacterClasses)
{
    EXPECT_TRUE(Matches("[a-z]+", "hello"));
    EXPECT_FALSE(Matches("[a-z]+", "Hello"));
    EXPECT_TRUE(Matches("[0-9a-f]*", "deadbeef42"));
    EXPECT_TRUE(Matches("[^0-9]", "x"));
    EXPECT_FALSE(Matches("[^0-9]", "7"));
    EXPECT_FALSE(Matches("[^0-9]", "xy"));
}

TEST(RegexTests, DotAndEscapes)
{
    EXPECT_TRUE(Matches("a.c", "abc"));
    EXPECT_TRUE(Matches("a.c", "a\xC3\xA9" "c"));
    EXPECT_FALSE(Matches("a.c", "ac"));
    EXPECT_TRUE(Matches("a\\.c", "a.c"));
    EXPECT_FALSE(Matches("a\\.c", "abc"));
    EXPECT_TRUE(Matches("\\(\\)", "()"));
}

TEST(RegexTests, MalformedPatternsAreRejected)
{
    auto& Mgr = RegexMgr::Instance();
    EXPECT_THROW(Mgr.Parse("(a"), Exprs::ExprTypeError);
    EXPECT_THROW(Mgr.Parse("a)"), Exprs::ExprTypeError);
    EXPECT_THROW(Mgr.Parse("*a"), Exprs::ExprTypeError);
    EXPECT_THROW(Mgr.Parse("[a-"), Exprs::ExprTypeError);
}

TEST(RegexTests, BuiltRegexesMatchParsedOnes)
{
    auto& Mgr = RegexMgr::Instance();
    auto Built = Mgr.MakeConcat(Mgr.MakePlus(Mgr.MakeChar('a')),
                                Mgr.MakePlus(Mgr.MakeChar('b')));
    EXPECT_TRUE(RegexMatcher::Accepts(Built, CodePoints("ab")));
    EXPECT_FALSE(RegexMatcher::Accepts(Built, CodePoints("a")));
    EXPECT_TRUE(RegexMatcher::Accepts(Mgr.MakeEpsilon(), CodePoints("")));
    EXPECT_FALSE(RegexMatcher::Accepts(Mgr.MakeEmpty(), CodePoints("")));
}

//
// RegexTests.cpp ends here
