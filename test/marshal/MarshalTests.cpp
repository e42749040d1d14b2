// MarshalTests.cpp ---
//
// Filename: MarshalTests.cpp
// Author: Abhishek Udupa
// Created: Tue Apr 07 09:21:00 2015 (-0500)
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
#include "../../src/marshal/RecordMarshaler.hpp"
#include "../../src/marshal/ValueConverter.hpp"
#include "../../src/solver/Solver.hpp"

using namespace SYMX;
using namespace Exprs;
using Marshal::RecordMarshaler;
using Marshal::ValueConverter;
using Marshal::NamedValuesT;
using Query::Solver;

struct Point
{
    i64 X;
    i64 Y;
    string Label;

    Point()
        : X(0), Y(0), Label("origin")
    {
        // Nothing here
    }

    Point(i64 X, i64 Y)
        : X(X), Y(Y), Label("")
    {
        // Nothing here
    }
};

class MarshalTests : public ::testing::Test
{
protected:
    ExprMgr& Mgr = ExprMgr::Instance();
    TypeRef Int32Type = Mgr.GetInt32Type();

    RecordMarshaler<Point> MakePointMarshaler()
    {
        RecordMarshaler<Point> Marshaler;
        Marshaler.AddDefaultConstructor()
            .AddConstructor({ "x", "y" }, [] (const vector<ValueRef>& Args) -> Point
                            {
                                return Point(ValueConverter::ToInt64(Args[0]),
                                             ValueConverter::ToInt64(Args[1]));
                            })
            .AddField("label", [] (Point& P, const ValueRef& Value)
                      {
                          P.Label = ValueConverter::ToString(Value);
                      });
        return Marshaler;
    }
};

TEST_F(MarshalTests, PrefersTheConstructorTakingMostNames)
{
    auto Marshaler = MakePointMarshaler();
    NamedValuesT Values = { { "x", ValueConverter::FromInt64(Int32Type, 3) },
                            { "y", ValueConverter::FromInt64(Int32Type, -4) },
                            { "label", ValueConverter::FromString("p") } };
    auto P = Marshaler.Build(Values);
    EXPECT_EQ(P.X, 3);
    EXPECT_EQ(P.Y, -4);
    EXPECT_EQ(P.Label, "p");
}

TEST_F(MarshalTests, FallsBackToDefaultConstructorAndSetters)
{
    auto Marshaler = MakePointMarshaler();
    auto P = Marshaler.Build({ { "label", ValueConverter::FromString("here") } });
    EXPECT_EQ(P.X, 0);
    EXPECT_EQ(P.Label, "here");

    auto Q = Marshaler.Build(NamedValuesT());
    EXPECT_EQ(Q.Label, "origin");
}

TEST_F(MarshalTests, UnmatchedNameIsAnError)
{
    auto Marshaler = MakePointMarshaler();
    EXPECT_THROW(Marshaler.Build({ { "z", ValueConverter::FromInt64(Int32Type, 1) } }),
                 ModelingError);
}

TEST_F(MarshalTests, PartialConstructorArgumentsDoNotFit)
{
    // "x" alone is a known name but only the (x, y) constructor takes it
    auto Marshaler = MakePointMarshaler();
    EXPECT_THROW(Marshaler.Build({ { "x", ValueConverter::FromInt64(Int32Type, 1) } }),
                 ModelingError);
}

TEST_F(MarshalTests, AmbiguousConstructorsAreAnError)
{
    RecordMarshaler<Point> Marshaler;
    auto Factory = [] (const vector<ValueRef>& Args) -> Point
        {
            return Point(ValueConverter::ToInt64(Args[0]), 0);
        };
    Marshaler.AddConstructor({ "x" }, Factory)
        .AddConstructor({ "y" }, Factory)
        .AddField("x", [] (Point& P, const ValueRef& Value)
                  {
                      P.X = ValueConverter::ToInt64(Value);
                  })
        .AddField("y", [] (Point& P, const ValueRef& Value)
                  {
                      P.Y = ValueConverter::ToInt64(Value);
                  });

    NamedValuesT Values = { { "x", ValueConverter::FromInt64(Int32Type, 1) },
                            { "y", ValueConverter::FromInt64(Int32Type, 2) } };
    EXPECT_THROW(Marshaler.Build(Values), ModelingError);
}

TEST_F(MarshalTests, RegistrationErrors)
{
    RecordMarshaler<Point> Marshaler;
    auto Setter = [] (Point&, const ValueRef&) { };
    Marshaler.AddField("x", Setter);
    EXPECT_THROW(Marshaler.AddField("x", Setter), ModelingError);
    EXPECT_THROW(Marshaler.AddConstructor({ "a", "a" }, [] (const vector<ValueRef>&) -> Point
                                          {
                                              return Point();
                                          }),
                 ModelingError);
    EXPECT_EQ(Marshaler.GetNumFields(), 1u);
    EXPECT_EQ(Marshaler.GetNumConstructors(), 0u);
}

TEST_F(MarshalTests, SolutionsMarshalRecords)
{
    auto PointType = Mgr.MakeRecordType("MarshalPoint", { { "x", Int32Type }, { "y", Int32Type } });
    auto P = Mgr.MakeVar("MarshalP", PointType);
    auto Pred = Mgr.MakeExpr(SymxOps::OpAND,
                             Mgr.MakeExpr(SymxOps::OpEQ, Mgr.MakeProject(P, "x"),
                                          Mgr.MakeInt32(12)),
                             Mgr.MakeExpr(SymxOps::OpEQ, Mgr.MakeProject(P, "y"),
                                          Mgr.MakeInt32(-5)));
    auto Result = Solver::Solve(Pred);
    ASSERT_TRUE(Result.IsSatisfiable());

    auto Native = Result.GetAs(P, MakePointMarshaler());
    EXPECT_EQ(Native.X, 12);
    EXPECT_EQ(Native.Y, -5);

    auto X = Mgr.MakeVar("MarshalX", Int32Type);
    auto Other = Solver::Solve(Mgr.MakeExpr(SymxOps::OpEQ, X, Mgr.MakeInt32(1)));
    EXPECT_THROW(Other.GetAs(X, MakePointMarshaler()), ModelingError);
}

TEST_F(MarshalTests, ConvertsScalars)
{
    auto UInt8Type = Mgr.MakeIntType(8, false);
    EXPECT_TRUE(ValueConverter::ToBool(ValueConverter::FromBool(true)));
    EXPECT_EQ(ValueConverter::ToInt64(ValueConverter::FromInt64(Int32Type, -7)), -7);
    EXPECT_EQ(ValueConverter::ToUInt64(ValueConverter::FromUInt64(UInt8Type, 200)), 200u);
    EXPECT_EQ(ValueConverter::ToBigInt(ValueConverter::FromBigInt(BigIntT(1) << 80)),
              BigIntT(1) << 80);
    EXPECT_EQ(ValueConverter::ToString(ValueConverter::FromString("cow")), "cow");
    EXPECT_EQ(ValueConverter::ToCodePoint(Mgr.MakeCharValue('z')), (u32)'z');

    EXPECT_THROW(ValueConverter::ToBool(ValueConverter::FromString("true")), ModelingError);
    EXPECT_THROW(ValueConverter::ToUInt64(ValueConverter::FromInt64(Int32Type, -1)),
                 ModelingError);
    EXPECT_THROW(ValueConverter::ToInt64(ValueConverter::FromBigInt(BigIntT(1) << 70)),
                 ModelingError);
}

TEST_F(MarshalTests, ParsesText)
{
    auto Int8Type = Mgr.MakeIntType(8, true);
    auto UInt8Type = Mgr.MakeIntType(8, false);

    EXPECT_TRUE(ValueConverter::ToBool(ValueConverter::Parse(Mgr.GetBoolType(), " TRUE ")));
    EXPECT_EQ(ValueConverter::ToInt64(ValueConverter::Parse(Int8Type, "-12")), -12);
    EXPECT_EQ(ValueConverter::ToUInt64(ValueConverter::Parse(UInt8Type, "255")), 255u);
    EXPECT_EQ(ValueConverter::ToBigInt(ValueConverter::Parse(Mgr.GetBigIntType(),
                                                             "123456789012345678901234567890")),
              BigIntT("123456789012345678901234567890"));
    EXPECT_EQ(ValueConverter::ToString(ValueConverter::Parse(Mgr.GetStringType(), " a b ")),
              " a b ");
    EXPECT_EQ(ValueConverter::ToCodePoint(ValueConverter::Parse(Mgr.GetCharType(), "q")),
              (u32)'q');

    EXPECT_THROW(ValueConverter::Parse(Mgr.GetBoolType(), "yes"), ModelingError);
    EXPECT_THROW(ValueConverter::Parse(Int8Type, "300"), ModelingError);
    EXPECT_THROW(ValueConverter::Parse(Int8Type, "twelve"), ModelingError);
    EXPECT_THROW(ValueConverter::Parse(UInt8Type, "-1"), ModelingError);
    EXPECT_THROW(ValueConverter::Parse(Mgr.GetBigIntType(), "12abc"), ModelingError);
    EXPECT_THROW(ValueConverter::Parse(Mgr.GetCharType(), "ab"), ModelingError);
}

//
// MarshalTests.cpp ends here
