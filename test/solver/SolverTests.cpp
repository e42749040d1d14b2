// SolverTests.cpp ---
//
// Filename: SolverTests.cpp
// Author: Abhishek Udupa
// Created: Sat Feb 14 00:05:00 2015 (-0500)
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

#include <set>

#include <gtest/gtest.h>

#include "../../src/expr/ExprMgr.hpp"
#include "../../src/interp/ExpressionEvaluator.hpp"
#include "../../src/regex/RegexMatcher.hpp"
#include "../../src/solver/Solver.hpp"
#include "../../src/solver/Function.hpp"

using namespace SYMX;
using namespace Exprs;
using Query::Solver;
using Query::Solution;
using Query::SolutionEnumerator;
using Query::Function;
using Interp::ExpressionEvaluator;

class SolverTests : public ::testing::Test
{
protected:
    ExprMgr& Mgr = ExprMgr::Instance();
    TypeRef Int32Type = Mgr.GetInt32Type();
    TypeRef Int8Type = Mgr.MakeIntType(8, true);
    TypeRef StringType = Mgr.GetStringType();

    ExpT Eq(const ExpT& A, const ExpT& B)
    {
        return Mgr.MakeExpr(SymxOps::OpEQ, A, B);
    }

    ExpT And(const ExpT& A, const ExpT& B)
    {
        return Mgr.MakeExpr(SymxOps::OpAND, A, B);
    }

    static i64 GetInt(const ValueRef& Value)
    {
        return Value->SAs<IntValue>()->GetSigned();
    }

    static string GetString(const ValueRef& Value)
    {
        return Value->SAs<SeqValue>()->GetString();
    }
};

class SolverBackendTests : public SolverTests,
                           public ::testing::WithParamInterface<BackendT>
{
    // Nothing here
};

TEST_F(SolverTests, SolvesLinearEquation)
{
    auto X = Mgr.MakeVar("LinX", Int32Type);
    auto Result = Solver::Solve(Eq(Mgr.MakeExpr(SymxOps::OpADD, X, Mgr.MakeInt32(1)),
                                   Mgr.MakeInt32(5)));
    ASSERT_TRUE(Result.IsSatisfiable());
    EXPECT_EQ(GetInt(Result.Get(X)), 4);
}

TEST_F(SolverTests, UnsatisfiableSolutionsCannotBeRead)
{
    auto X = Mgr.MakeVar("UnsatX", Int32Type);
    auto Result = Solver::Solve(And(Eq(X, Mgr.MakeInt32(1)), Eq(X, Mgr.MakeInt32(2))));
    EXPECT_FALSE(Result.IsSatisfiable());
    EXPECT_THROW(Result.Get(X), ModelingError);
    EXPECT_FALSE(Solver::FindFirst(And(Eq(X, Mgr.MakeInt32(1)),
                                       Eq(X, Mgr.MakeInt32(2)))).is_initialized());
}

TEST_F(SolverTests, UnconstrainedVariablesReadAsDefaults)
{
    auto X = Mgr.MakeVar("DefX", Int32Type);
    auto S = Mgr.MakeVar("DefS", StringType);
    auto Result = Solver::Solve(Eq(X, Mgr.MakeInt32(3)));
    ASSERT_TRUE(Result.IsSatisfiable());
    EXPECT_EQ(GetString(Result.Get(S)), "");
    EXPECT_THROW(Result.Get(Mgr.MakeInt32(3)), ModelingError);
}

TEST_F(SolverTests, NonBooleanPredicatesAreRejected)
{
    auto X = Mgr.MakeVar("NonBoolX", Int32Type);
    EXPECT_THROW(Solver::Solve(X), ExprTypeError);
    EXPECT_THROW(Solver::FindAll(X), ExprTypeError);
}

TEST_F(SolverTests, ModelsSatisfyThePredicate)
{
    auto S = Mgr.MakeVar("ConsS", StringType);
    auto Pred = And(Mgr.MakeExpr(SymxOps::OpSEQSTARTSWITH, S, Mgr.MakeString("bro")),
                    Eq(Mgr.MakeExpr(SymxOps::OpSEQLENGTH, S), Mgr.MakeBigInt(BigIntT(5))));
    auto Result = Solver::Solve(Pred);
    ASSERT_TRUE(Result.IsSatisfiable());
    EXPECT_TRUE(ExpressionEvaluator::DoBool(Pred, Result.GetModel()));
    EXPECT_EQ(GetString(Result.Get(S)).substr(0, 3), "bro");
}

TEST_F(SolverTests, RegexSolutionsAreAccepted)
{
    auto S = Mgr.MakeVar("RegexS", StringType);
    auto Solutions = Solver::FindAll(Mgr.MakeRegexMatch(S, "a+b+")).Take(5);
    ASSERT_EQ(Solutions.size(), 5u);

    set<string> Seen;
    for (auto const& TheSolution : Solutions) {
        auto Value = TheSolution.Get(S)->SAs<SeqValue>();
        EXPECT_TRUE(Regex::RegexMatcher::Accepts("a+b+", Value->GetCodePoints()))
            << Value->GetString();
        Seen.insert(Value->GetString());
    }
    EXPECT_EQ(Seen.size(), 5u);
}

TEST_F(SolverTests, EnumerationWithoutVariablesYieldsOneSolution)
{
    auto All = Solver::FindAll(Mgr.MakeTrue()).Take(10);
    ASSERT_EQ(All.size(), 1u);
    EXPECT_TRUE(All[0].IsSatisfiable());
    EXPECT_TRUE(Solver::FindAll(Mgr.MakeFalse()).Take(10).empty());
}

TEST_F(SolverTests, EnumerationIsRestartable)
{
    auto X = Mgr.MakeVar("RestartX", Int8Type);
    auto Enumerator = Solver::FindAll(And(Mgr.MakeExpr(SymxOps::OpGT, X, Mgr.MakeInt(Int8Type, 0)),
                                          Mgr.MakeExpr(SymxOps::OpLT, X, Mgr.MakeInt(Int8Type, 10))));
    EXPECT_EQ(Enumerator.Take(3).size(), 3u);
    EXPECT_EQ(Enumerator.Take(100).size(), 9u);
    EXPECT_EQ(Enumerator.Take(0).size(), 0u);
    EXPECT_EQ(Enumerator.GetVars().size(), 1u);
}

TEST_F(SolverTests, EnumeratorReleasesSessionWhenExhausted)
{
    auto X = Mgr.MakeVar("ReleaseX", Int8Type);
    auto Enumerator = Solver::FindAll(Mgr.MakeExpr(SymxOps::OpOR,
                                                   Eq(X, Mgr.MakeInt(Int8Type, 1)),
                                                   Eq(X, Mgr.MakeInt(Int8Type, 2))));
    auto It = Enumerator.begin();
    EXPECT_TRUE(It.HasSession());
    u32 Count = 0;
    while (It != Enumerator.end()) {
        ++Count;
        ++It;
    }
    EXPECT_EQ(Count, 2u);
    EXPECT_TRUE(It.IsExhausted());
    EXPECT_FALSE(It.HasSession());
    EXPECT_THROW(*It, ModelingError);
}

TEST_P(SolverBackendTests, EnumeratesEachModelOnce)
{
    auto X = Mgr.MakeVar("EnumX", Int8Type);
    auto Pred = And(Mgr.MakeExpr(SymxOps::OpLT, X, Mgr.MakeInt(Int8Type, 3)),
                    Mgr.MakeExpr(SymxOps::OpGT, X, Mgr.MakeInt(Int8Type, -2)));
    set<i64> Seen;
    for (auto const& TheSolution : Solver::FindAll(Pred, GetParam())) {
        EXPECT_TRUE(Seen.insert(GetInt(TheSolution.Get(X))).second);
    }
    EXPECT_EQ(Seen, (set<i64> { -1, 0, 1, 2 }));
}

TEST_P(SolverBackendTests, Validity)
{
    auto X = Mgr.MakeVar("ValidX", Int8Type);
    auto Five = Mgr.MakeInt(Int8Type, 5);
    EXPECT_TRUE(Solver::IsValid(Mgr.MakeExpr(SymxOps::OpOR,
                                             Mgr.MakeExpr(SymxOps::OpLT, X, Five),
                                             Mgr.MakeExpr(SymxOps::OpGE, X, Five)),
                                GetParam()));
    EXPECT_FALSE(Solver::IsValid(Mgr.MakeExpr(SymxOps::OpLT, X, Five), GetParam()));
    // Wrapping makes x + 1 > x fail at the maximum
    EXPECT_FALSE(Solver::IsValid(Mgr.MakeExpr(SymxOps::OpGT,
                                              Mgr.MakeExpr(SymxOps::OpADD, X,
                                                           Mgr.MakeInt(Int8Type, 1)),
                                              X),
                                 GetParam()));
}

TEST_P(SolverBackendTests, RecordsAndOptions)
{
    auto PairType = Mgr.MakeRecordType("SolverPair", { { "lo", Int8Type }, { "hi", Int8Type } });
    auto P = Mgr.MakeVar("SolverP", PairType);
    auto O = Mgr.MakeVar("SolverO", Mgr.MakeOptionType(Int8Type));
    auto Lo = Mgr.MakeProject(P, "lo");
    auto Hi = Mgr.MakeProject(P, "hi");
    auto Pred = And(And(Eq(Mgr.MakeExpr(SymxOps::OpADD, Lo, Hi), Mgr.MakeInt(Int8Type, 10)),
                        Mgr.MakeExpr(SymxOps::OpLT, Hi, Lo)),
                    And(Mgr.MakeExpr(SymxOps::OpOPTISSOME, O),
                        Eq(Mgr.MakeExpr(SymxOps::OpOPTVALUE, O), Hi)));

    auto Result = Solver::Solve(Pred, GetParam());
    ASSERT_TRUE(Result.IsSatisfiable());
    EXPECT_TRUE(ExpressionEvaluator::DoBool(Pred, Result.GetModel()));
}

INSTANTIATE_TEST_SUITE_P(Backends, SolverBackendTests,
                         ::testing::Values(BackendT::SMT, BackendT::BDD));

class SolverMapTests : public SolverTests
{
protected:
    TypeRef UInt8Type = Mgr.MakeIntType(8, false);
    TypeRef IntMapType = Mgr.MakeMapType(Int32Type, Int32Type);

    ExpT Get(const ExpT& Map, const ExpT& Key)
    {
        return Mgr.MakeExpr(SymxOps::OpMAPGET, Map, Key);
    }

    ExpT IsSome(const ExpT& Opt)
    {
        return Mgr.MakeExpr(SymxOps::OpOPTISSOME, Opt);
    }

    static const ValueMapT& GetEntries(const ValueRef& Value)
    {
        return Value->SAs<MapValue>()->GetEntries();
    }
};

TEST_F(SolverMapTests, EqualToEmptyMap)
{
    auto M = Mgr.MakeVar("EmptyM", IntMapType);
    auto Pred = Eq(M, Mgr.MakeEmptyMap(IntMapType));
    auto Result = Solver::Solve(Pred);
    ASSERT_TRUE(Result.IsSatisfiable());
    EXPECT_TRUE(GetEntries(Result.Get(M)).empty());
    EXPECT_TRUE(ExpressionEvaluator::DoBool(Pred, Result.GetModel()));
}

TEST_F(SolverMapTests, SetOnEmptyMap)
{
    auto M = Mgr.MakeVar("SetM", IntMapType);
    auto Stored = Mgr.MakeExpr(SymxOps::OpMAPSET, Mgr.MakeEmptyMap(IntMapType),
                               Mgr.MakeInt32(1), Mgr.MakeInt32(2));
    auto Pred = Eq(Stored, M);
    auto Result = Solver::Solve(Pred);
    ASSERT_TRUE(Result.IsSatisfiable());
    auto const& Entries = GetEntries(Result.Get(M));
    ASSERT_EQ(Entries.size(), 1u);
    EXPECT_EQ(GetInt(Entries.begin()->first), 1);
    EXPECT_EQ(GetInt(Entries.begin()->second), 2);
    EXPECT_TRUE(ExpressionEvaluator::DoBool(Pred, Result.GetModel()));
}

TEST_F(SolverMapTests, LookupInConstantMap)
{
    ValueMapT Entries = { { Mgr.MakeIntValue(Int32Type, 3), Mgr.MakeIntValue(Int32Type, 1) } };
    auto Const = Mgr.MakeVal(Mgr.MakeMapValue(IntMapType, Entries));
    auto X = Mgr.MakeVar("ConstLookupX", Int32Type);
    auto Pred = IsSome(Get(Const, X));
    auto Result = Solver::Solve(Pred);
    ASSERT_TRUE(Result.IsSatisfiable());
    EXPECT_EQ(GetInt(Result.Get(X)), 3);

    EXPECT_FALSE(Solver::Solve(And(Pred, Eq(Mgr.MakeExpr(SymxOps::OpOPTVALUE, Get(Const, X)),
                                            Mgr.MakeInt32(2)))).IsSatisfiable());
}

TEST_F(SolverMapTests, EveryKeyPresent)
{
    auto SmallMapType = Mgr.MakeMapType(UInt8Type, Int32Type);
    auto M = Mgr.MakeVar("FullM", SmallMapType);
    vector<ExpT> Conjuncts;
    for (i64 k = 0; k < 256; ++k) {
        Conjuncts.push_back(IsSome(Get(M, Mgr.MakeInt(UInt8Type, k))));
    }
    auto Pred = Mgr.MakeExpr(SymxOps::OpAND, Conjuncts);
    auto Result = Solver::Solve(Pred);
    ASSERT_TRUE(Result.IsSatisfiable());
    EXPECT_EQ(GetEntries(Result.Get(M)).size(), 256u);
    EXPECT_TRUE(ExpressionEvaluator::DoBool(Pred, Result.GetModel()));
}

TEST_F(SolverMapTests, TwoSymbolicKeysPresent)
{
    auto M = Mgr.MakeVar("TwoKeysM", IntMapType);
    auto A = Mgr.MakeVar("TwoKeysA", Int32Type);
    auto B = Mgr.MakeVar("TwoKeysB", Int32Type);
    auto Pred = Mgr.MakeExpr(SymxOps::OpAND, IsSome(Get(M, A)), IsSome(Get(M, B)),
                             Mgr.MakeExpr(SymxOps::OpNOT, Eq(A, B)));
    auto Result = Solver::Solve(Pred);
    ASSERT_TRUE(Result.IsSatisfiable());
    EXPECT_GE(GetEntries(Result.Get(M)).size(), 2u);
    EXPECT_TRUE(ExpressionEvaluator::DoBool(Pred, Result.GetModel()));
}

TEST_F(SolverMapTests, EnumeratesMaps)
{
    auto M = Mgr.MakeVar("EnumM", IntMapType);
    auto K = Mgr.MakeVar("EnumK", Int32Type);
    auto Stored = Mgr.MakeExpr(SymxOps::OpMAPSET, Mgr.MakeEmptyMap(IntMapType), K,
                               Mgr.MakeInt32(7));
    auto Pred = Mgr.MakeExpr(SymxOps::OpAND, Eq(M, Stored),
                             Mgr.MakeExpr(SymxOps::OpGT, K, Mgr.MakeInt32(0)),
                             Mgr.MakeExpr(SymxOps::OpLT, K, Mgr.MakeInt32(4)));

    set<i64> Keys;
    for (auto const& TheSolution : Solver::FindAll(Pred)) {
        EXPECT_TRUE(ExpressionEvaluator::DoBool(Pred, TheSolution.GetModel()));
        auto const& Entries = GetEntries(TheSolution.Get(M));
        ASSERT_EQ(Entries.size(), 1u);
        EXPECT_EQ(GetInt(Entries.begin()->first), GetInt(TheSolution.Get(K)));
        EXPECT_TRUE(Keys.insert(GetInt(TheSolution.Get(K))).second);
    }
    EXPECT_EQ(Keys, (set<i64> { 1, 2, 3 }));
}

TEST_F(SolverTests, BDDRejectsStrings)
{
    auto S = Mgr.MakeVar("BDDS", StringType);
    EXPECT_THROW(Solver::Solve(Mgr.MakeExpr(SymxOps::OpSEQSTARTSWITH, S, Mgr.MakeString("a")),
                               BackendT::BDD),
                 CapabilityError);
}

TEST_F(SolverTests, FunctionEvaluatesInterpretedAndCompiled)
{
    auto X = Mgr.MakeVar("FunX", Int32Type);
    auto Y = Mgr.MakeVar("FunY", Int32Type);
    Function Add({ X, Y }, Mgr.MakeExpr(SymxOps::OpADD, X, Y));
    vector<ValueRef> Args = { Mgr.MakeIntValue(Int32Type, 3), Mgr.MakeIntValue(Int32Type, 4) };

    EXPECT_FALSE(Add.IsCompiled());
    EXPECT_EQ(GetInt(Add.Evaluate(Args)), 7);
    Add.Compile();
    EXPECT_TRUE(Add.IsCompiled());
    EXPECT_EQ(GetInt(Add.Evaluate(Args)), 7);
    EXPECT_THROW(Add.Evaluate({ Args[0] }), ModelingError);
}

TEST_F(SolverTests, FunctionFindsInputs)
{
    auto X = Mgr.MakeVar("FindX", Int32Type);
    auto Y = Mgr.MakeVar("FindY", Int32Type);
    Function Add({ X, Y }, Mgr.MakeExpr(SymxOps::OpADD, X, Y));

    auto Inputs = Add.Find([&] (const vector<ExpT>& Params, const ExpT& Result) -> ExpT
                           {
                               return And(Eq(Result, Mgr.MakeInt32(10)),
                                          Eq(Params[0], Mgr.MakeInt32(3)));
                           });
    ASSERT_TRUE(Inputs.is_initialized());
    ASSERT_EQ(Inputs->size(), 2u);
    EXPECT_EQ(GetInt((*Inputs)[0]), 3);
    EXPECT_EQ(GetInt((*Inputs)[1]), 7);
    EXPECT_EQ(GetInt(Add.Evaluate(*Inputs)), 10);

    auto None = Add.Find([&] (const vector<ExpT>& Params, const ExpT& Result) -> ExpT
                         {
                             return And(Eq(Params[0], Mgr.MakeInt32(1)),
                                        Eq(Params[0], Mgr.MakeInt32(2)));
                         });
    EXPECT_FALSE(None.is_initialized());
}

TEST_F(SolverTests, FunctionEnumeratesInputs)
{
    auto X = Mgr.MakeVar("FunEnumX", Int8Type);
    Function Double({ X }, Mgr.MakeExpr(SymxOps::OpADD, X, X));
    auto All = Double.FindAll([&] (const vector<ExpT>& Params, const ExpT& Result) -> ExpT
                              {
                                  return Eq(Result, Mgr.MakeInt(Int8Type, 4));
                              }, BackendT::BDD).Take(10);
    // x + x == 4 has two solutions modulo 2^8
    set<i64> Seen;
    for (auto const& TheSolution : All) {
        Seen.insert(GetInt(TheSolution.Get(X)));
    }
    EXPECT_EQ(Seen, (set<i64> { 2, -126 }));
}

TEST_F(SolverTests, FunctionBodyMayOnlyUseParameters)
{
    auto X = Mgr.MakeVar("BodyX", Int32Type);
    auto Y = Mgr.MakeVar("BodyY", Int32Type);
    EXPECT_THROW(Function({ X }, Mgr.MakeExpr(SymxOps::OpADD, X, Y)), ModelingError);
    EXPECT_THROW(Function({ X, X }, X), ModelingError);
}

//
// SolverTests.cpp ends here
