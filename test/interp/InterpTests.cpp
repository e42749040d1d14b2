// InterpTests.cpp ---
//
// Filename: InterpTests.cpp
// Author: Abhishek Udupa
// Created: Sat Apr 04 23:25:00 2015 (-0500)
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

using namespace SYMX;
using namespace Exprs;
using Interp::ExpressionEvaluator;
using Interp::BindingMapT;

class InterpTests : public ::testing::Test
{
protected:
    ExprMgr& Mgr = ExprMgr::Instance();
    TypeRef Int32Type = Mgr.GetInt32Type();
    TypeRef Int8Type = Mgr.MakeIntType(8, true);
    TypeRef UInt8Type = Mgr.MakeIntType(8, false);
    TypeRef UInt16Type = Mgr.MakeIntType(16, false);

    ValueRef Eval(const ExpT& Exp, const BindingMapT& Bindings = BindingMapT())
    {
        return ExpressionEvaluator::Do(Exp, Bindings);
    }

    ExpT Op(i64 OpCode, const ExpT& A)
    {
        return Mgr.MakeExpr(OpCode, A);
    }

    ExpT Op(i64 OpCode, const ExpT& A, const ExpT& B)
    {
        return Mgr.MakeExpr(OpCode, A, B);
    }

    ExpT Op(i64 OpCode, const ExpT& A, const ExpT& B, const ExpT& C)
    {
        return Mgr.MakeExpr(OpCode, A, B, C);
    }

    ExpT Str(const char* Text)
    {
        return Mgr.MakeString(Text);
    }

    ExpT Big(i64 Value)
    {
        return Mgr.MakeBigInt(BigIntT(Value));
    }

    string EvalString(const ExpT& Exp)
    {
        return Eval(Exp)->SAs<SeqValue>()->GetString();
    }

    bool EvalBool(const ExpT& Exp, const BindingMapT& Bindings = BindingMapT())
    {
        return ExpressionEvaluator::DoBool(Exp, Bindings);
    }

    i64 EvalSigned(const ExpT& Exp, const BindingMapT& Bindings = BindingMapT())
    {
        return Eval(Exp, Bindings)->SAs<IntValue>()->GetSigned();
    }

    BigIntT EvalBig(const ExpT& Exp)
    {
        return Eval(Exp)->SAs<BigIntValue>()->GetValue();
    }
};

TEST_F(InterpTests, FixedWidthArithmeticWraps)
{
    auto X = Mgr.MakeVar("X", UInt8Type);
    auto Y = Mgr.MakeVar("Y", UInt8Type);
    BindingMapT Bindings = { { X, Mgr.MakeUIntValue(UInt8Type, 250) },
                             { Y, Mgr.MakeUIntValue(UInt8Type, 10) } };

    EXPECT_EQ(EvalSigned(Op(SymxOps::OpADD, X, Y), Bindings), 4);
    EXPECT_EQ(EvalSigned(Op(SymxOps::OpSUB, Y, X), Bindings), 16);
    EXPECT_EQ(EvalSigned(Op(SymxOps::OpMUL, X, Y), Bindings), (250 * 10) % 256);

    auto S = Mgr.MakeVar("S", Int8Type);
    BindingMapT SBindings = { { S, Mgr.MakeIntValue(Int8Type, 127) } };
    EXPECT_EQ(EvalSigned(Op(SymxOps::OpADD, S, Mgr.MakeInt(Int8Type, 1)), SBindings), -128);
}

TEST_F(InterpTests, ComparisonsRespectSignedness)
{
    EXPECT_TRUE(EvalBool(Op(SymxOps::OpLT, Mgr.MakeInt(Int8Type, -1), Mgr.MakeInt(Int8Type, 1))));
    EXPECT_FALSE(EvalBool(Op(SymxOps::OpLT, Mgr.MakeInt(UInt8Type, 255),
                             Mgr.MakeInt(UInt8Type, 1))));
    EXPECT_TRUE(EvalBool(Op(SymxOps::OpGE, Mgr.MakeInt(Int8Type, 5), Mgr.MakeInt(Int8Type, 5))));
    EXPECT_TRUE(EvalBool(Op(SymxOps::OpGT, Big(-3), Big(-10))));
    EXPECT_TRUE(EvalBool(Op(SymxOps::OpLE, Mgr.MakeChar('a'), Mgr.MakeChar('b'))));
}

TEST_F(InterpTests, CastsTruncateAndExtend)
{
    auto MinusOne = Mgr.MakeInt(Int8Type, -1);
    EXPECT_EQ(Eval(Mgr.MakeCast(MinusOne, UInt16Type))->SAs<IntValue>()->GetUnsigned(), 65535u);
    EXPECT_EQ(EvalSigned(Mgr.MakeCast(Mgr.MakeInt(UInt8Type, 255), Int32Type)), 255);
    EXPECT_EQ(EvalSigned(Mgr.MakeCast(Mgr.MakeInt32(300), UInt8Type)), 44);
    EXPECT_EQ(EvalBig(Mgr.MakeCast(MinusOne, Mgr.GetBigIntType())), BigIntT(-1));
    EXPECT_EQ(EvalSigned(Mgr.MakeCast(Big(-129), Int8Type)), 127);
}

TEST_F(InterpTests, BitOperations)
{
    auto A = Mgr.MakeVar("A", UInt8Type);
    BindingMapT Bindings = { { A, Mgr.MakeUIntValue(UInt8Type, 0x5A) } };
    EXPECT_EQ(EvalSigned(Op(SymxOps::OpBVNOT, A), Bindings), 0xA5);
    EXPECT_EQ(EvalSigned(Op(SymxOps::OpBVXOR, A, Mgr.MakeInt(UInt8Type, 0xFF)), Bindings), 0xA5);
    EXPECT_EQ(EvalSigned(Op(SymxOps::OpBVOR, A, Mgr.MakeInt(UInt8Type, 0x01)), Bindings), 0x5B);
}

TEST_F(InterpTests, StartsWithAndFriends)
{
    EXPECT_TRUE(EvalBool(Op(SymxOps::OpSEQSTARTSWITH, Str("brown cow"), Str("bro"))));
    EXPECT_FALSE(EvalBool(Op(SymxOps::OpSEQSTARTSWITH, Str("quick fox"), Str("uick"))));
    EXPECT_TRUE(EvalBool(Op(SymxOps::OpSEQENDSWITH, Str("quick fox"), Str("fox"))));
    EXPECT_TRUE(EvalBool(Op(SymxOps::OpSEQCONTAINS, Str("quick fox"), Str("ck f"))));
    EXPECT_TRUE(EvalBool(Op(SymxOps::OpSEQCONTAINS, Str("abc"), Str(""))));
}

TEST_F(InterpTests, SliceSaturatesAtTheBounds)
{
    EXPECT_EQ(EvalString(Op(SymxOps::OpSEQSLICE, Str("hello"), Big(10), Big(3))), "");
    EXPECT_EQ(EvalString(Op(SymxOps::OpSEQSLICE, Str("hello"), Big(1), Big(3))), "ell");
    EXPECT_EQ(EvalString(Op(SymxOps::OpSEQSLICE, Str("hello"), Big(3), Big(10))), "lo");
    EXPECT_EQ(EvalString(Op(SymxOps::OpSEQSLICE, Str("hello"), Big(-1), Big(2))), "");
    EXPECT_EQ(EvalString(Op(SymxOps::OpSEQSLICE, Str("hello"), Big(0), Big(0))), "");
}

TEST_F(InterpTests, AtAndLength)
{
    EXPECT_EQ(EvalString(Op(SymxOps::OpSEQAT, Str("hello"), Big(1))), "e");
    EXPECT_EQ(EvalString(Op(SymxOps::OpSEQAT, Str("hello"), Big(5))), "");
    EXPECT_EQ(EvalString(Op(SymxOps::OpSEQAT, Str("hello"), Big(-1))), "");
    EXPECT_EQ(EvalBig(Op(SymxOps::OpSEQLENGTH, Str("h\xC3\xA9llo"))), BigIntT(5));
}

TEST_F(InterpTests, IndexOfUsesMinusOneForNotFound)
{
    EXPECT_EQ(EvalBig(Op(SymxOps::OpSEQINDEXOF, Str("abcabc"), Str("c"), Big(0))), BigIntT(2));
    EXPECT_EQ(EvalBig(Op(SymxOps::OpSEQINDEXOF, Str("abcabc"), Str("c"), Big(3))), BigIntT(5));
    EXPECT_EQ(EvalBig(Op(SymxOps::OpSEQINDEXOF, Str("abcabc"), Str("d"), Big(0))), BigIntT(-1));
    EXPECT_EQ(EvalBig(Op(SymxOps::OpSEQINDEXOF, Str("abc"), Str(""), Big(2))), BigIntT(2));
    EXPECT_EQ(EvalBig(Op(SymxOps::OpSEQINDEXOF, Str("abc"), Str("a"), Big(-1))), BigIntT(-1));
    EXPECT_EQ(EvalBig(Op(SymxOps::OpSEQINDEXOF, Str("abc"), Str(""), Big(4))), BigIntT(-1));
}

TEST_F(InterpTests, ReplaceFirst)
{
    EXPECT_EQ(EvalString(Op(SymxOps::OpSEQREPLACEFIRST, Str("aXbXc"), Str("X"), Str("--"))),
              "a--bXc");
    EXPECT_EQ(EvalString(Op(SymxOps::OpSEQREPLACEFIRST, Str("abc"), Str(""), Str(">"))), ">abc");
    EXPECT_EQ(EvalString(Op(SymxOps::OpSEQREPLACEFIRST, Str("abc"), Str("z"), Str(">"))), "abc");
}

TEST_F(InterpTests, RegexMatch)
{
    EXPECT_TRUE(EvalBool(Mgr.MakeRegexMatch(Str("aaabb"), "a+b+")));
    EXPECT_FALSE(EvalBool(Mgr.MakeRegexMatch(Str("aaa"), "a+b+")));
}

TEST_F(InterpTests, OptionsAndRecords)
{
    auto None = Mgr.MakeNone(Int32Type);
    auto Some = Op(SymxOps::OpOPTSOME, Mgr.MakeInt32(7));
    EXPECT_FALSE(EvalBool(Op(SymxOps::OpOPTISSOME, None)));
    EXPECT_EQ(EvalSigned(Op(SymxOps::OpOPTVALUE, None)), 0);
    EXPECT_EQ(EvalSigned(Op(SymxOps::OpOPTVALUE, Some)), 7);

    auto PointType = Mgr.MakeRecordType("Point", { { "x", Int32Type }, { "y", Int32Type } });
    auto P = Mgr.MakeVar("P", PointType);
    BindingMapT Bindings =
        { { P, Mgr.MakeRecordValue(PointType, { Mgr.MakeIntValue(Int32Type, 1),
                                                Mgr.MakeIntValue(Int32Type, 2) }) } };
    auto Moved = Mgr.MakeWithField(P, "x", Mgr.MakeInt32(5));
    EXPECT_EQ(EvalSigned(Mgr.MakeProject(Moved, "x"), Bindings), 5);
    EXPECT_EQ(EvalSigned(Mgr.MakeProject(Moved, "y"), Bindings), 2);
}

TEST_F(InterpTests, GeneralMaps)
{
    auto MapType = Mgr.MakeMapType(Int32Type, Mgr.GetStringType());
    auto M = Op(SymxOps::OpMAPSET, Mgr.MakeEmptyMap(MapType), Mgr.MakeInt32(1), Str("one"));

    auto Present = Eval(Op(SymxOps::OpMAPGET, M, Mgr.MakeInt32(1)));
    ASSERT_TRUE(Present->SAs<OptionValue>()->IsSome());
    EXPECT_EQ(Present->SAs<OptionValue>()->GetInner()->SAs<SeqValue>()->GetString(), "one");

    auto Absent = Eval(Op(SymxOps::OpMAPGET, M, Mgr.MakeInt32(2)));
    EXPECT_FALSE(Absent->SAs<OptionValue>()->IsSome());

    auto Deleted = Op(SymxOps::OpMAPDELETE, M, Mgr.MakeInt32(1));
    EXPECT_TRUE(EvalBool(Op(SymxOps::OpEQ, Deleted, Mgr.MakeEmptyMap(MapType))));
}

TEST_F(InterpTests, DMapSetBackToDefault)
{
    auto DMapType = Mgr.MakeDMapType(Int32Type, Int32Type);
    auto M = Op(SymxOps::OpDMAPSET, Mgr.MakeEmptyDMap(DMapType), Mgr.MakeInt32(1),
                Mgr.MakeInt32(10));
    M = Op(SymxOps::OpDMAPSET, M, Mgr.MakeInt32(1), Mgr.MakeInt32(0));

    EXPECT_EQ(EvalSigned(Op(SymxOps::OpDMAPCOUNT, M)), 0);
    EXPECT_EQ(EvalSigned(Op(SymxOps::OpDMAPGET, M, Mgr.MakeInt32(1))), 0);
    EXPECT_EQ(EvalSigned(Op(SymxOps::OpDMAPGET, M, Mgr.MakeInt32(2))), 0);
    EXPECT_TRUE(EvalBool(Op(SymxOps::OpEQ, M, Mgr.MakeEmptyDMap(DMapType))));
}

TEST_F(InterpTests, DMapLastWriteWinsAndEqualityIsExtensional)
{
    auto DMapType = Mgr.MakeDMapType(Int32Type, Int32Type);
    auto M = Mgr.MakeVar("M", DMapType);
    BindingMapT Bindings = { { M, DMapType->GetDefaultValue() } };

    auto Set = [&] (const ExpT& Map, i32 Key, i32 Value) -> ExpT
        {
            return Op(SymxOps::OpDMAPSET, Map, Mgr.MakeInt32(Key), Mgr.MakeInt32(Value));
        };

    auto M1 = Set(Set(Set(M, 1, 10), 2, 20), 1, 30);
    EXPECT_EQ(EvalSigned(Op(SymxOps::OpDMAPGET, M1, Mgr.MakeInt32(1)), Bindings), 30);
    EXPECT_EQ(EvalSigned(Op(SymxOps::OpDMAPCOUNT, M1), Bindings), 2);

    auto M2 = Set(Set(M, 2, 20), 1, 30);
    EXPECT_TRUE(EvalBool(Op(SymxOps::OpEQ, M1, M2), Bindings));

    // Count after Set(k, default) is the count before the first Set(k, _)
    auto Before = Set(M, 2, 20);
    auto After = Set(Set(Before, 5, 50), 5, 0);
    EXPECT_EQ(EvalSigned(Op(SymxOps::OpDMAPCOUNT, After), Bindings),
              EvalSigned(Op(SymxOps::OpDMAPCOUNT, Before), Bindings));
}

TEST_F(InterpTests, BindingsAreChecked)
{
    auto X = Mgr.MakeVar("X", Int32Type);
    auto Exp = Op(SymxOps::OpADD, X, Mgr.MakeInt32(1));

    EXPECT_THROW(Eval(Exp), ModelingError);

    BindingMapT Mistyped = { { X, Mgr.MakeBoolValue(true) } };
    EXPECT_THROW(Eval(Exp, Mistyped), ModelingError);

    BindingMapT Good = { { X, Mgr.MakeIntValue(Int32Type, 41) } };
    EXPECT_EQ(EvalSigned(Exp, Good), 42);
}

TEST_F(InterpTests, SharedSubtreesAreEvaluatedOnce)
{
    // A DAG that would be exponential as a tree
    auto X = Mgr.MakeVar("X", Int32Type);
    ExpT Exp = X;
    for (u32 i = 0; i < 64; ++i) {
        Exp = Op(SymxOps::OpADD, Exp, Exp);
    }
    BindingMapT Bindings = { { X, Mgr.MakeIntValue(Int32Type, 1) } };
    // 2^64 wraps to 0 in 32 bits
    EXPECT_EQ(EvalSigned(Exp, Bindings), 0);
}

//
// InterpTests.cpp ends here
