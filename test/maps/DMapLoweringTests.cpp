// DMapLoweringTests.cpp ---
//
// Filename: DMapLoweringTests.cpp
// Author: Abhishek Udupa
// Created: Fri Jul 03 15:52:00 2015 (-0500)
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
#include "../../src/maps/DMapLowering.hpp"
#include "../../src/solver/Solver.hpp"

using namespace SYMX;
using namespace Exprs;
using Maps::DMapLowering;
using Query::Solver;
using Query::Solution;

class DMapLoweringTests : public ::testing::Test
{
protected:
    ExprMgr& Mgr = ExprMgr::Instance();
    TypeRef Int32Type = Mgr.GetInt32Type();
    TypeRef DMapType = Mgr.MakeDMapType(Int32Type, Int32Type);

    ExpT Set(const ExpT& Map, i32 Key, i32 Value)
    {
        return Mgr.MakeExpr(SymxOps::OpDMAPSET, Map, Mgr.MakeInt32(Key), Mgr.MakeInt32(Value));
    }

    ExpT Get(const ExpT& Map, i32 Key)
    {
        return Mgr.MakeExpr(SymxOps::OpDMAPGET, Map, Mgr.MakeInt32(Key));
    }

    ExpT Eq(const ExpT& A, const ExpT& B)
    {
        return Mgr.MakeExpr(SymxOps::OpEQ, A, B);
    }

    ExpT Empty()
    {
        return Mgr.MakeEmptyDMap(DMapType);
    }

    static i64 GetInt(const ValueRef& Value)
    {
        return Value->SAs<IntValue>()->GetSigned();
    }
};

class DMapBackendTests : public DMapLoweringTests,
                         public ::testing::WithParamInterface<BackendT>
{
    // Nothing here
};

TEST_F(DMapLoweringTests, MapFreeExpressionsAreUntouched)
{
    auto X = Mgr.MakeVar("LowerX", Int32Type);
    auto Exp = Eq(X, Mgr.MakeInt32(3));
    EXPECT_TRUE(DMapLowering::IsMapFree(Exp));

    DMapLowering Lowering;
    EXPECT_EQ(Lowering.Do(Exp), Exp);
}

TEST_F(DMapLoweringTests, LoweredExpressionsAreMapFree)
{
    auto M = Mgr.MakeVar("LowerM", DMapType);
    auto Exp = Eq(Set(M, 1, 10), Set(Set(Empty(), 1, 10), 2, 20));
    EXPECT_FALSE(DMapLowering::IsMapFree(Exp));

    DMapLowering Lowering;
    auto Lowered = Lowering.Do(Exp);
    EXPECT_TRUE(DMapLowering::IsMapFree(Lowered));
    EXPECT_EQ(Lowering.GetPerKeyVars(M).size(), 2u);

    auto const& Universes = Lowering.GetUniverses();
    ASSERT_EQ(Universes.size(), 1u);
    EXPECT_EQ(Universes.begin()->second.size(), 2u);
}

TEST_F(DMapLoweringTests, SymbolicKeysAreRejected)
{
    auto M = Mgr.MakeVar("SymKeyM", DMapType);
    auto K = Mgr.MakeVar("SymKeyK", Int32Type);
    auto Exp = Eq(Mgr.MakeExpr(SymxOps::OpDMAPGET, M, K), Mgr.MakeInt32(1));

    DMapLowering Lowering;
    EXPECT_THROW(Lowering.Do(Exp), CapabilityError);
    EXPECT_THROW(Solver::Solve(Exp), CapabilityError);
}

TEST_F(DMapLoweringTests, NestedDMapsAreRejected)
{
    auto NestedType = Mgr.MakeOptionType(DMapType);
    auto O = Mgr.MakeVar("NestedO", NestedType);
    auto Exp = Mgr.MakeExpr(SymxOps::OpOPTISSOME, O);

    DMapLowering Lowering;
    EXPECT_THROW(Lowering.Do(Exp), CapabilityError);
}

TEST_F(DMapLoweringTests, UniverseCannotGrowAfterLowering)
{
    auto M = Mgr.MakeVar("GrowM", DMapType);
    auto Session = Solver::MakeSession(BackendT::SMT);
    Session->Assert(Eq(Get(M, 1), Mgr.MakeInt32(10)));
    EXPECT_THROW(Session->Assert(Eq(Get(M, 2), Mgr.MakeInt32(20))), CapabilityError);
}

TEST_P(DMapBackendTests, SetOnlyEqualsWhatItSets)
{
    auto M = Mgr.MakeVar("UnsatM", DMapType);
    auto Result = Solver::Solve(Eq(Set(M, 1, 10), Empty()), GetParam());
    EXPECT_FALSE(Result.IsSatisfiable());
}

TEST_P(DMapBackendTests, EqualityDeterminesUntouchedKeys)
{
    auto M = Mgr.MakeVar("SatM", DMapType);
    auto Result = Solver::Solve(Eq(Set(M, 1, 10), Set(Set(Empty(), 1, 10), 2, 20)),
                                GetParam());
    ASSERT_TRUE(Result.IsSatisfiable());

    auto Value = Result.Get(M)->SAs<DMapValue>();
    EXPECT_EQ(GetInt(Value->Get(Mgr.MakeIntValue(Int32Type, 2))), 20);
    EXPECT_EQ(GetInt(Value->Get(Mgr.MakeIntValue(Int32Type, 7))), 0);
}

TEST_P(DMapBackendTests, CountAfterResetToDefault)
{
    auto M = Mgr.MakeVar("CountM", DMapType);
    auto Updated = Set(Set(M, 1, 10), 1, 0);
    auto Count = Mgr.MakeExpr(SymxOps::OpDMAPCOUNT, Updated);
    auto Pred = Mgr.MakeExpr(SymxOps::OpAND, Eq(M, Empty()),
                             Mgr.MakeExpr(SymxOps::OpNOT, Eq(Count, Mgr.MakeInt32(0))));
    EXPECT_FALSE(Solver::Solve(Pred, GetParam()).IsSatisfiable());
}

TEST_P(DMapBackendTests, CountReflectsNonDefaultEntries)
{
    auto M = Mgr.MakeVar("CountM2", DMapType);
    auto Pred = Mgr.MakeExpr(SymxOps::OpAND,
                             Eq(Mgr.MakeExpr(SymxOps::OpDMAPCOUNT, M), Mgr.MakeInt32(2)),
                             Eq(Get(M, 1), Mgr.MakeInt32(5)),
                             Eq(Get(M, 3), Mgr.MakeInt32(0)));
    auto Result = Solver::Solve(Mgr.MakeExpr(SymxOps::OpAND, Pred,
                                             Mgr.MakeExpr(SymxOps::OpNOT,
                                                          Eq(Get(M, 2), Mgr.MakeInt32(0)))),
                                GetParam());
    ASSERT_TRUE(Result.IsSatisfiable());
    auto Value = Result.Get(M)->SAs<DMapValue>();
    EXPECT_EQ(Value->Count(), 2u);
    EXPECT_EQ(GetInt(Value->Get(Mgr.MakeIntValue(Int32Type, 1))), 5);
    EXPECT_NE(GetInt(Value->Get(Mgr.MakeIntValue(Int32Type, 2))), 0);
}

TEST_P(DMapBackendTests, UnconstrainedMapReadsAsEmpty)
{
    auto M = Mgr.MakeVar("FreeM", DMapType);
    auto X = Mgr.MakeVar("FreeX", Int32Type);
    auto Result = Solver::Solve(Mgr.MakeExpr(SymxOps::OpAND, Eq(X, Mgr.MakeInt32(1)),
                                             Eq(Mgr.MakeExpr(SymxOps::OpDMAPCOUNT, M),
                                                Mgr.MakeExpr(SymxOps::OpDMAPCOUNT, M))),
                                GetParam());
    ASSERT_TRUE(Result.IsSatisfiable());
    EXPECT_EQ(Result.Get(M)->SAs<DMapValue>()->Count(), 0u);
}

INSTANTIATE_TEST_SUITE_P(Backends, DMapBackendTests,
                        ::testing::Values(BackendT::SMT, BackendT::BDD));

//
// DMapLoweringTests.cpp ends here
