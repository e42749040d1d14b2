// CompilerTests.cpp ---
//
// Filename: CompilerTests.cpp
// Author: Abhishek Udupa
// Created: Wed Jan 07 09:32:00 2015 (-0500)
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
#include "../../src/interp/ExpressionEvaluator.hpp"
#include "../../src/compile/Compiler.hpp"

using namespace SYMX;
using namespace Exprs;
using Compile::Compiler;
using Compile::CompiledFunctionRef;
using Interp::ExpressionEvaluator;
using Interp::BindingMapT;

class CompilerTests : public ::testing::Test
{
protected:
    ExprMgr& Mgr = ExprMgr::Instance();
    TypeRef Int8Type = Mgr.MakeIntType(8, true);
    TypeRef StringType = Mgr.GetStringType();

    void ExpectAgrees(const ExpT& Body, const vector<ExpT>& Params,
                      const vector<vector<ValueRef>>& Inputs)
    {
        auto Compiled = Compiler::Compile(Body, Params);
        for (auto const& Args : Inputs) {
            BindingMapT Bindings;
            for (u32 i = 0; i < Params.size(); ++i) {
                Bindings[Params[i]] = Args[i];
            }
            auto Expected = ExpressionEvaluator::Do(Body, Bindings);
            auto Actual = Compiled->Evaluate(Args);
            EXPECT_TRUE(Expected->Equals(*Actual))
                << "Body: " << Body->ToString() << "\nInterpreted: "
                << Expected->ToString() << "\nCompiled: " << Actual->ToString();
        }
    }
};

TEST_F(CompilerTests, ArithmeticAgreesWithInterpreter)
{
    auto X = Mgr.MakeVar("X", Int8Type);
    auto Y = Mgr.MakeVar("Y", Int8Type);
    auto Sum = Mgr.MakeExpr(SymxOps::OpADD, X, Y);
    auto Prod = Mgr.MakeExpr(SymxOps::OpMUL, Sum, Mgr.MakeExpr(SymxOps::OpSUB, X, Y));
    auto Body = Mgr.MakeExpr(SymxOps::OpITE, Mgr.MakeExpr(SymxOps::OpLT, X, Y),
                             Prod, Mgr.MakeExpr(SymxOps::OpBVXOR, Sum, Prod));

    vector<vector<ValueRef>> Inputs;
    for (i64 x = -128; x < 128; x += 7) {
        for (i64 y = -128; y < 128; y += 11) {
            Inputs.push_back({ Mgr.MakeIntValue(Int8Type, x), Mgr.MakeIntValue(Int8Type, y) });
        }
    }
    ExpectAgrees(Body, { X, Y }, Inputs);
}

TEST_F(CompilerTests, StringsAgreeWithInterpreter)
{
    auto S = Mgr.MakeVar("S", StringType);
    auto T = Mgr.MakeVar("T", StringType);
    auto BigType = Mgr.GetBigIntType();
    auto Idx = Mgr.MakeExpr(SymxOps::OpSEQINDEXOF, S, T, Mgr.MakeBigInt(BigIntT(0)));
    auto Len = Mgr.MakeExpr(SymxOps::OpSEQLENGTH, T);
    auto Slice = Mgr.MakeExpr(SymxOps::OpSEQSLICE, S, Idx, Len);
    auto Body = Mgr.MakeRecord(Mgr.MakeRecordType("Prefixes", { { "starts", Mgr.GetBoolType() },
                                                             { "slice", StringType },
                                                             { "index", BigType },
                                                             { "matches", Mgr.GetBoolType() },
                                                             { "replaced", StringType } }),
                               { Mgr.MakeExpr(SymxOps::OpSEQSTARTSWITH, S, T), Slice, Idx,
                                 Mgr.MakeRegexMatch(S, "(ab)*c?"),
                                 Mgr.MakeExpr(SymxOps::OpSEQREPLACEFIRST, S, T,
                                              Mgr.MakeString("#")) });

    vector<string> Strings = { "", "a", "ab", "abab", "ababc", "brown cow", "bro", "c", "ba" };
    vector<vector<ValueRef>> Inputs;
    for (auto const& s : Strings) {
        for (auto const& t : Strings) {
            Inputs.push_back({ Mgr.MakeStringValue(s), Mgr.MakeStringValue(t) });
        }
    }
    ExpectAgrees(Body, { S, T }, Inputs);
}

TEST_F(CompilerTests, MapsAndOptionsAgreeWithInterpreter)
{
    auto Int32Type = Mgr.GetInt32Type();
    auto DMapType = Mgr.MakeDMapType(Int32Type, Int32Type);
    auto MapType = Mgr.MakeMapType(Int32Type, Int32Type);
    auto K = Mgr.MakeVar("K", Int32Type);
    auto V = Mgr.MakeVar("V", Int32Type);

    auto D = Mgr.MakeExpr(SymxOps::OpDMAPSET, Mgr.MakeEmptyDMap(DMapType), K, V);
    D = Mgr.MakeExpr(SymxOps::OpDMAPSET, D, Mgr.MakeInt32(1), Mgr.MakeInt32(10));
    auto M = Mgr.MakeExpr(SymxOps::OpMAPSET, Mgr.MakeEmptyMap(MapType), K, V);
    auto Got = Mgr.MakeExpr(SymxOps::OpMAPGET, M, Mgr.MakeInt32(1));

    auto Body = Mgr.MakeTuple({ Mgr.MakeExpr(SymxOps::OpDMAPCOUNT, D),
                                Mgr.MakeExpr(SymxOps::OpDMAPGET, D, Mgr.MakeInt32(2)),
                                Got,
                                Mgr.MakeExpr(SymxOps::OpOPTVALUE, Got) });

    vector<vector<ValueRef>> Inputs;
    for (i32 k = -1; k <= 3; ++k) {
        for (i32 v = 0; v <= 2; ++v) {
            Inputs.push_back({ Mgr.MakeIntValue(Int32Type, k), Mgr.MakeIntValue(Int32Type, v) });
        }
    }
    ExpectAgrees(Body, { K, V }, Inputs);
}

TEST_F(CompilerTests, SharedNodesUseMemoSlots)
{
    auto X = Mgr.MakeVar("X", Int8Type);
    ExpT Body = X;
    for (u32 i = 0; i < 40; ++i) {
        Body = Mgr.MakeExpr(SymxOps::OpADD, Body, Body);
    }
    auto Compiled = Compiler::Compile(Body, { X });
    EXPECT_GT(Compiled->GetNumMemoSlots(), 0u);
    auto Result = Compiled->Evaluate({ Mgr.MakeIntValue(Int8Type, 1) });
    EXPECT_EQ(Result->SAs<IntValue>()->GetSigned(), 0);
}

TEST_F(CompilerTests, FreeVariableIsRejected)
{
    auto X = Mgr.MakeVar("X", Int8Type);
    auto Y = Mgr.MakeVar("Y", Int8Type);
    EXPECT_THROW(Compiler::Compile(Mgr.MakeExpr(SymxOps::OpADD, X, Y), { X }), ModelingError);
}

TEST_F(CompilerTests, ParamsMustBeDistinctVariables)
{
    auto X = Mgr.MakeVar("X", Int8Type);
    EXPECT_THROW(Compiler::Compile(X, { X, X }), ModelingError);
    EXPECT_THROW(Compiler::Compile(X, { Mgr.MakeInt(Int8Type, 1) }), ModelingError);
}

TEST_F(CompilerTests, ArgumentsAreChecked)
{
    auto X = Mgr.MakeVar("X", Int8Type);
    auto Compiled = Compiler::Compile(Mgr.MakeExpr(SymxOps::OpADD, X, X), { X });

    EXPECT_THROW(Compiled->Evaluate({}), ModelingError);
    EXPECT_THROW(Compiled->Evaluate({ Mgr.MakeBoolValue(true) }), ModelingError);
    EXPECT_EQ(Compiled->Evaluate({ Mgr.MakeIntValue(Int8Type, 3) })->SAs<IntValue>()->GetSigned(),
              6);
}

TEST_F(CompilerTests, ConstantBodyNeedsNoArguments)
{
    auto Compiled = Compiler::Compile(Mgr.MakeString("fixed"), {});
    EXPECT_EQ(Compiled->Evaluate({})->SAs<SeqValue>()->GetString(), "fixed");
}

//
// CompilerTests.cpp ends here
