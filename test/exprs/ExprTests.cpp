// ExprTests.cpp ---
//
// Filename: ExprTests.cpp
// Author: Abhishek Udupa
// Created: Wed Feb 04 12:04:00 2015 (-0500)
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

#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "../../src/expr/ExprMgr.hpp"

using namespace SYMX;
using namespace Exprs;

class ExprTests : public ::testing::Test
{
protected:
    ExprMgr& Mgr = ExprMgr::Instance();
    TypeRef Int32Type = Mgr.GetInt32Type();
    TypeRef UInt8Type = Mgr.MakeIntType(8, false);
};

TEST_F(ExprTests, StructurallyEqualNodesAreShared)
{
    auto X = Mgr.MakeVar("X", Int32Type);
    auto Y = Mgr.MakeVar("Y", Int32Type);

    auto Sum1 = Mgr.MakeExpr(SymxOps::OpADD, X, Y);
    auto Sum2 = Mgr.MakeExpr(SymxOps::OpADD, Mgr.MakeVar("X", Int32Type),
                             Mgr.MakeVar("Y", Int32Type));
    EXPECT_EQ(Sum1.GetPtr_(), Sum2.GetPtr_());

    auto Swapped = Mgr.MakeExpr(SymxOps::OpADD, Y, X);
    EXPECT_NE(Sum1.GetPtr_(), Swapped.GetPtr_());

    EXPECT_EQ(Mgr.MakeInt32(42).GetPtr_(), Mgr.MakeInt32(42).GetPtr_());
    EXPECT_EQ(Mgr.MakeString("abc").GetPtr_(), Mgr.MakeString("abc").GetPtr_());
}

TEST_F(ExprTests, SameNameDifferentTypeIsDifferentVar)
{
    auto X32 = Mgr.MakeVar("X", Int32Type);
    auto X8 = Mgr.MakeVar("X", UInt8Type);
    EXPECT_NE(X32.GetPtr_(), X8.GetPtr_());
}

TEST_F(ExprTests, TypesAreInterned)
{
    EXPECT_EQ(Mgr.MakeIntType(32, true), Int32Type);
    auto Opt1 = Mgr.MakeOptionType(UInt8Type);
    auto Opt2 = Mgr.MakeOptionType(Mgr.MakeIntType(8, false));
    EXPECT_EQ(Opt1, Opt2);
    EXPECT_EQ(Mgr.MakeSeqType(Mgr.GetCharType()), Mgr.GetStringType());
}

TEST_F(ExprTests, OperandMismatchIsATypeError)
{
    auto B = Mgr.MakeVar("B", Mgr.GetBoolType());
    auto X = Mgr.MakeVar("X", Int32Type);
    auto U = Mgr.MakeVar("U", UInt8Type);

    EXPECT_THROW(Mgr.MakeExpr(SymxOps::OpADD, B, X), ExprTypeError);
    EXPECT_THROW(Mgr.MakeExpr(SymxOps::OpADD, X, U), ExprTypeError);
    EXPECT_THROW(Mgr.MakeExpr(SymxOps::OpAND, X, B), ExprTypeError);
    EXPECT_THROW(Mgr.MakeExpr(SymxOps::OpITE, B, X, U), ExprTypeError);
    EXPECT_THROW(Mgr.MakeExpr(SymxOps::OpBVAND, Mgr.MakeBigInt(1), Mgr.MakeBigInt(2)),
                 ExprTypeError);
}

TEST_F(ExprTests, MalformedLiteralsAreRejected)
{
    EXPECT_THROW(Mgr.MakeString((const char*)nullptr), ExprTypeError);
    EXPECT_THROW(Mgr.MakeInt(UInt8Type, 256), ExprTypeError);
    EXPECT_THROW(Mgr.MakeInt(UInt8Type, -1), ExprTypeError);
    EXPECT_THROW(Mgr.MakeChar(0x30000), ExprTypeError);
    EXPECT_THROW(Mgr.MakeIntType(12, false), ExprTypeError);
    EXPECT_THROW(Mgr.MakeRegexMatch(Mgr.MakeString("a"), "(ab"), ExprTypeError);
}

TEST_F(ExprTests, ModelingErrorsAreTheBaseOfTypeErrors)
{
    EXPECT_THROW(Mgr.MakeInt(UInt8Type, 1000), ModelingError);
    EXPECT_THROW(Mgr.MakeInt(UInt8Type, 1000), SymxError);
}

TEST_F(ExprTests, MapNestingFailsAtConstruction)
{
    auto MapType = Mgr.MakeMapType(Int32Type, Int32Type);
    EXPECT_THROW(Mgr.MakeMapType(Int32Type, MapType), ExprTypeError);
    EXPECT_THROW(Mgr.MakeMapType(MapType, Int32Type), ExprTypeError);
    EXPECT_THROW(Mgr.MakeSeqType(MapType), ExprTypeError);
    EXPECT_THROW(Mgr.MakeSeqType(Mgr.MakeDMapType(Int32Type, Int32Type)), ExprTypeError);
}

TEST_F(ExprTests, MapsBuriedInCompositesAreNestedToo)
{
    auto DMapType = Mgr.MakeDMapType(Int32Type, Int32Type);
    auto OptDMapType = Mgr.MakeOptionType(DMapType);
    auto PairType = Mgr.MakeTupleType({ Int32Type, Mgr.MakeMapType(Int32Type, Int32Type) });

    EXPECT_TRUE(OptDMapType->ContainsDMap());
    EXPECT_TRUE(PairType->ContainsMap());
    EXPECT_FALSE(PairType->ContainsDMap());

    EXPECT_THROW(Mgr.MakeMapType(Int32Type, OptDMapType), ExprTypeError);
    EXPECT_THROW(Mgr.MakeMapType(Int32Type, PairType), ExprTypeError);
    EXPECT_THROW(Mgr.MakeMapType(PairType, Int32Type), ExprTypeError);
    EXPECT_THROW(Mgr.MakeMapType(Int32Type, Mgr.MakeSeqType(OptDMapType)), ExprTypeError);
    EXPECT_THROW(Mgr.MakeSeqType(OptDMapType), ExprTypeError);
    EXPECT_THROW(Mgr.MakeSeqType(PairType), ExprTypeError);

    // A default-valued map may still hold composites of plain values
    auto Inner = Mgr.MakeMapType(Int32Type, Mgr.MakeOptionType(Int32Type));
    EXPECT_FALSE(Inner->ContainsDMap());
    auto Outer = Mgr.MakeDMapType(Int32Type, Mgr.MakeOptionType(Int32Type));
    EXPECT_TRUE(Outer->ContainsDMap());
}

TEST_F(ExprTests, LocalSimplifications)
{
    auto B = Mgr.MakeVar("B", Mgr.GetBoolType());
    auto X = Mgr.MakeVar("X", Int32Type);
    auto Y = Mgr.MakeVar("Y", Int32Type);

    EXPECT_EQ(Mgr.MakeExpr(SymxOps::OpITE, Mgr.MakeTrue(), X, Y), X);
    EXPECT_EQ(Mgr.MakeExpr(SymxOps::OpITE, Mgr.MakeFalse(), X, Y), Y);
    EXPECT_EQ(Mgr.MakeExpr(SymxOps::OpITE, B, X, X), X);
    EXPECT_EQ(Mgr.MakeExpr(SymxOps::OpNOT, Mgr.MakeExpr(SymxOps::OpNOT, B)), B);
    EXPECT_EQ(Mgr.MakeExpr(SymxOps::OpNOT, Mgr.MakeTrue()), Mgr.MakeFalse());
    EXPECT_EQ(Mgr.MakeExpr(SymxOps::OpAND, B, Mgr.MakeFalse()), Mgr.MakeFalse());
    EXPECT_EQ(Mgr.MakeExpr(SymxOps::OpOR, B, Mgr.MakeTrue()), Mgr.MakeTrue());
    EXPECT_EQ(Mgr.MakeExpr(SymxOps::OpEQ, X, X), Mgr.MakeTrue());
    EXPECT_EQ(Mgr.MakeExpr(SymxOps::OpEQ, Mgr.MakeInt32(1), Mgr.MakeInt32(2)),
              Mgr.MakeFalse());
    EXPECT_EQ(Mgr.MakeExpr(SymxOps::OpBVAND, Mgr.MakeInt(UInt8Type, 0xF0),
                           Mgr.MakeInt(UInt8Type, 0x3C)),
              Mgr.MakeInt(UInt8Type, 0x30));
    EXPECT_EQ(Mgr.MakeExpr(SymxOps::OpOPTISSOME, Mgr.MakeExpr(SymxOps::OpOPTSOME, X)),
              Mgr.MakeTrue());

    auto PointType = Mgr.MakeRecordType("Point", { { "x", Int32Type }, { "y", Int32Type } });
    auto Point = Mgr.MakeRecord(PointType, { X, Y });
    EXPECT_EQ(Mgr.MakeProject(Point, "y"), Y);
}

TEST_F(ExprTests, RecordFieldsAreChecked)
{
    auto PointType = Mgr.MakeRecordType("Point", { { "x", Int32Type }, { "y", Int32Type } });
    auto P = Mgr.MakeVar("P", PointType);
    EXPECT_THROW(Mgr.MakeProject(P, "z"), ExprTypeError);
    EXPECT_THROW(Mgr.MakeWithField(P, "x", Mgr.MakeTrue()), ExprTypeError);
    EXPECT_THROW(Mgr.MakeRecord(PointType, { Mgr.MakeInt32(1) }), ExprTypeError);
    EXPECT_EQ(Mgr.MakeProject(P, "x")->GetType(), Int32Type);
}

TEST_F(ExprTests, OperatorResultTypes)
{
    auto S = Mgr.MakeVar("S", Mgr.GetStringType());
    auto M = Mgr.MakeVar("M", Mgr.MakeMapType(Int32Type, Mgr.GetBoolType()));
    auto D = Mgr.MakeVar("D", Mgr.MakeDMapType(Int32Type, Int32Type));

    EXPECT_EQ(Mgr.MakeExpr(SymxOps::OpSEQLENGTH, S)->GetType(), Mgr.GetBigIntType());
    EXPECT_EQ(Mgr.MakeExpr(SymxOps::OpSEQAT, S, Mgr.MakeBigInt(0))->GetType(),
              Mgr.GetStringType());
    EXPECT_EQ(Mgr.MakeExpr(SymxOps::OpMAPGET, M, Mgr.MakeInt32(1))->GetType(),
              Mgr.MakeOptionType(Mgr.GetBoolType()));
    EXPECT_EQ(Mgr.MakeExpr(SymxOps::OpDMAPGET, D, Mgr.MakeInt32(1))->GetType(), Int32Type);
    EXPECT_EQ(Mgr.MakeExpr(SymxOps::OpDMAPCOUNT, D)->GetType(), Int32Type);
    EXPECT_EQ(Mgr.MakeCast(Mgr.MakeVar("X", Int32Type), UInt8Type)->GetType(), UInt8Type);
}

TEST_F(ExprTests, VarGathererKeepsFirstOccurrenceOrder)
{
    auto X = Mgr.MakeVar("X", Int32Type);
    auto Y = Mgr.MakeVar("Y", Int32Type);
    auto Z = Mgr.MakeVar("Z", Int32Type);
    auto Exp = Mgr.MakeExpr(SymxOps::OpLT, Mgr.MakeExpr(SymxOps::OpADD, Y, X),
                            Mgr.MakeExpr(SymxOps::OpMUL, Z, Y));
    auto Vars = VarGatherer::Do(Exp);
    ASSERT_EQ(Vars.size(), 3u);
    EXPECT_EQ(Vars[0], Y);
    EXPECT_EQ(Vars[1], X);
    EXPECT_EQ(Vars[2], Z);
}

TEST_F(ExprTests, SubstitutionRebuildsThroughTheManager)
{
    auto X = Mgr.MakeVar("X", Int32Type);
    auto Y = Mgr.MakeVar("Y", Int32Type);
    auto Exp = Mgr.MakeExpr(SymxOps::OpEQ, X, Y);

    SubstMapT Subst = { { Y, X } };
    EXPECT_EQ(Mgr.Substitute(Subst, Exp), Mgr.MakeTrue());

    SubstMapT Subst2 = { { Y, Mgr.MakeInt32(3) } };
    auto Substituted = Mgr.Substitute(Subst2, Exp);
    EXPECT_EQ(Substituted, Mgr.MakeExpr(SymxOps::OpEQ, X, Mgr.MakeInt32(3)));
}

TEST_F(ExprTests, RebuildingDoesNotGrowTheTables)
{
    auto X = Mgr.MakeVar("InternX", Int32Type);
    auto NumExps = Mgr.GetNumExpressions();
    auto NumTypes = Mgr.GetNumTypes();

    auto First = Mgr.MakeExpr(SymxOps::OpMUL, X, Mgr.MakeInt32(12345));
    EXPECT_EQ(Mgr.GetNumExpressions(), NumExps + 2);

    auto Second = Mgr.MakeExpr(SymxOps::OpMUL, X, Mgr.MakeInt32(12345));
    EXPECT_EQ(First.GetPtr_(), Second.GetPtr_());
    EXPECT_EQ(Mgr.GetNumExpressions(), NumExps + 2);

    Mgr.MakeSeqType(Int32Type);
    Mgr.MakeSeqType(Int32Type);
    EXPECT_LE(Mgr.GetNumTypes(), NumTypes + 1);
}

TEST_F(ExprTests, ConcurrentBuildersConvergeToOneNode)
{
    const u32 NumThreads = 8;
    vector<const ExpressionBase*> Results(NumThreads, nullptr);
    vector<thread> Threads;

    for (u32 i = 0; i < NumThreads; ++i) {
        Threads.push_back(thread([this, i, &Results] ()
                                 {
                                     auto A = Mgr.MakeVar("ConcA", Int32Type);
                                     auto B = Mgr.MakeVar("ConcB", Int32Type);
                                     ExpT Exp = A;
                                     for (u32 j = 0; j < 50; ++j) {
                                         Exp = Mgr.MakeExpr(SymxOps::OpADD, Exp, B);
                                     }
                                     Results[i] = Exp.GetPtr_();
                                 }));
    }
    for (auto& Thread : Threads) {
        Thread.join();
    }
    for (u32 i = 1; i < NumThreads; ++i) {
        EXPECT_EQ(Results[i], Results[0]);
    }
}

//
// ExprTests.cpp ends here
