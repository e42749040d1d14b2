// DDTests.cpp ---
//
// Filename: DDTests.cpp
// Author: Abhishek Udupa
// Created: Thu Apr 30 04:02:00 2015 (-0500)
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
#include "../../src/dd/DDManager.hpp"
#include "../../src/dd/DDSolver.hpp"
#include "../../src/dd/DDBitBlaster.hpp"
#include "../../src/dd/DDCapabilityChecker.hpp"
#include "../../src/solver/Solver.hpp"

using namespace SYMX;
using namespace Exprs;
using DD::DDManager;
using DD::DDNodeRef;
using DD::DDSolver;
using DD::DDBitBlaster;
using DD::DDCapabilityChecker;
using TP::TPResult;
using Query::Solver;

TEST(DDManagerTests, NodesAreCanonical)
{
    DDManager Mgr;
    auto A = Mgr.MakeVarNode(Mgr.NewVar());
    auto B = Mgr.MakeVarNode(Mgr.NewVar());

    EXPECT_EQ(Mgr.MakeAnd(A, B), Mgr.MakeAnd(B, A));
    EXPECT_EQ(Mgr.MakeNot(Mgr.MakeNot(A)), A);
    // De Morgan
    EXPECT_EQ(Mgr.MakeNot(Mgr.MakeAnd(A, B)), Mgr.MakeOr(Mgr.MakeNot(A), Mgr.MakeNot(B)));
    EXPECT_EQ(Mgr.MakeOr(A, Mgr.MakeNot(A)), DDManager::TrueNode);
    EXPECT_EQ(Mgr.MakeAnd(A, Mgr.MakeNot(A)), DDManager::FalseNode);
    EXPECT_EQ(Mgr.MakeXor(A, A), DDManager::FalseNode);
    EXPECT_EQ(Mgr.MakeIff(A, B), Mgr.MakeNot(Mgr.MakeXor(A, B)));
    EXPECT_EQ(Mgr.MakeImplies(A, B), Mgr.MakeOr(Mgr.MakeNot(A), B));
    EXPECT_EQ(Mgr.ITE(A, B, B), B);
}

TEST(DDManagerTests, RestrictFixesVariables)
{
    DDManager Mgr;
    auto VA = Mgr.NewVar();
    auto VB = Mgr.NewVar();
    auto A = Mgr.MakeVarNode(VA);
    auto B = Mgr.MakeVarNode(VB);
    auto F = Mgr.MakeXor(A, B);

    EXPECT_EQ(Mgr.Restrict(F, VA, true), Mgr.MakeNot(B));
    EXPECT_EQ(Mgr.Restrict(F, VA, false), B);
    EXPECT_EQ(Mgr.Restrict(Mgr.Restrict(F, VA, true), VB, true), DDManager::FalseNode);
}

TEST(DDManagerTests, SatPathsSatisfyTheFunction)
{
    DDManager Mgr;
    vector<u32> Vars;
    for (u32 i = 0; i < 4; ++i) {
        Vars.push_back(Mgr.NewVar());
    }
    // v0 != v1 and v2 and not v3
    auto F = Mgr.MakeAnd(Mgr.MakeXor(Mgr.MakeVarNode(Vars[0]), Mgr.MakeVarNode(Vars[1])),
                         Mgr.MakeAnd(Mgr.MakeVarNode(Vars[2]),
                                     Mgr.MakeNot(Mgr.MakeVarNode(Vars[3]))));
    vector<i08> Assignment;
    ASSERT_TRUE(Mgr.FindSatPath(F, Assignment));

    auto G = F;
    for (u32 i = 0; i < Assignment.size(); ++i) {
        if (Assignment[i] >= 0) {
            G = Mgr.Restrict(G, i, Assignment[i] == 1);
        }
    }
    EXPECT_EQ(G, DDManager::TrueNode);
    EXPECT_FALSE(Mgr.FindSatPath(DDManager::FalseNode, Assignment));
    EXPECT_GT(Mgr.GetSize(F), 2u);
}

TEST(DDManagerTests, NodeLimitRaisesEngineError)
{
    DDManager Mgr(16);
    DDNodeRef F = DDManager::FalseNode;
    auto Build = [&] ()
        {
            for (u32 i = 0; i < 64; ++i) {
                F = Mgr.MakeXor(F, Mgr.MakeVarNode(Mgr.NewVar()));
            }
        };
    EXPECT_THROW(Build(), EngineError);
}

class DDSolverTests : public ::testing::Test
{
protected:
    ExprMgr& Mgr = ExprMgr::Instance();
    TypeRef Int8Type = Mgr.MakeIntType(8, true);
    TypeRef UInt8Type = Mgr.MakeIntType(8, false);

    ExpT Eq(const ExpT& A, const ExpT& B)
    {
        return Mgr.MakeExpr(SymxOps::OpEQ, A, B);
    }

    // Every model of Pred over X, enumerated on the decision diagram backend
    set<i64> AllValues(const ExpT& Pred, const ExpT& X)
    {
        set<i64> Retval;
        for (auto const& TheSolution : Solver::FindAll(Pred, BackendT::BDD)) {
            Retval.insert(TheSolution.Get(X)->SAs<IntValue>()->GetSigned());
        }
        return Retval;
    }

    // Brute force over all 8 bit values of X
    set<i64> AllValuesByEvaluation(const ExpT& Pred, const ExpT& X)
    {
        set<i64> Retval;
        auto const& Type = X->GetType();
        bool Signed = Type->SAs<IntegerType>()->IsSigned();
        for (i64 v = (Signed ? -128 : 0); v < (Signed ? 128 : 256); ++v) {
            Interp::BindingMapT Bindings = { { X, Mgr.MakeIntValue(Type, v) } };
            if (Interp::ExpressionEvaluator::DoBool(Pred, Bindings)) {
                Retval.insert(v);
            }
        }
        return Retval;
    }
};

TEST_F(DDSolverTests, SignedArithmeticMatchesInterpreter)
{
    auto X = Mgr.MakeVar("DDSignedX", Int8Type);
    auto Sq = Mgr.MakeExpr(SymxOps::OpMUL, X, X);
    auto Pred = Mgr.MakeExpr(SymxOps::OpAND,
                             Mgr.MakeExpr(SymxOps::OpLT, Sq, Mgr.MakeInt(Int8Type, 20)),
                             Mgr.MakeExpr(SymxOps::OpGE,
                                          Mgr.MakeExpr(SymxOps::OpSUB, X, Mgr.MakeInt(Int8Type, 3)),
                                          Mgr.MakeInt(Int8Type, -10)));
    EXPECT_EQ(AllValues(Pred, X), AllValuesByEvaluation(Pred, X));
}

TEST_F(DDSolverTests, UnsignedBitOpsMatchInterpreter)
{
    auto X = Mgr.MakeVar("DDUnsignedX", UInt8Type);
    auto Masked = Mgr.MakeExpr(SymxOps::OpBVAND, Mgr.MakeExpr(SymxOps::OpBVXOR, X,
                                                              Mgr.MakeInt(UInt8Type, 0x0F)),
                               Mgr.MakeInt(UInt8Type, 0x3C));
    auto Pred = Mgr.MakeExpr(SymxOps::OpAND,
                             Eq(Masked, Mgr.MakeInt(UInt8Type, 0x30)),
                             Mgr.MakeExpr(SymxOps::OpGT, X, Mgr.MakeInt(UInt8Type, 200)));
    EXPECT_EQ(AllValues(Pred, X), AllValuesByEvaluation(Pred, X));
}

TEST_F(DDSolverTests, CastsMatchInterpreter)
{
    auto X = Mgr.MakeVar("DDCastX", Int8Type);
    auto Widened = Mgr.MakeCast(X, Mgr.MakeIntType(16, false));
    auto Pred = Mgr.MakeExpr(SymxOps::OpGT, Widened, Mgr.MakeInt(Mgr.MakeIntType(16, false),
                                                                 65530));
    EXPECT_EQ(AllValues(Pred, X), AllValuesByEvaluation(Pred, X));
}

TEST_F(DDSolverTests, SmallKeyMaps)
{
    auto MapType = Mgr.MakeMapType(UInt8Type, Int8Type);
    auto M = Mgr.MakeVar("DDMapM", MapType);
    auto K = Mgr.MakeVar("DDMapK", UInt8Type);
    auto Stored = Mgr.MakeExpr(SymxOps::OpMAPSET, M, K, Mgr.MakeInt(Int8Type, 42));
    auto Got = Mgr.MakeExpr(SymxOps::OpMAPGET, Stored, Mgr.MakeInt(UInt8Type, 7));
    auto Pred = Mgr.MakeExpr(SymxOps::OpAND, Mgr.MakeExpr(SymxOps::OpOPTISSOME, Got),
                             Eq(Mgr.MakeExpr(SymxOps::OpOPTVALUE, Got), Mgr.MakeInt(Int8Type, 42)),
                             Eq(Mgr.MakeExpr(SymxOps::OpMAPGET, M, Mgr.MakeInt(UInt8Type, 7)),
                                Mgr.MakeNone(Int8Type)));

    auto Result = Solver::Solve(Pred, BackendT::BDD);
    ASSERT_TRUE(Result.IsSatisfiable());
    EXPECT_EQ(Result.Get(K)->SAs<IntValue>()->GetUnsigned(), 7u);
    EXPECT_TRUE(Interp::ExpressionEvaluator::DoBool(Pred, Result.GetModel()));
}

TEST_F(DDSolverTests, LookupWithSymbolicKey)
{
    auto MapType = Mgr.MakeMapType(UInt8Type, Mgr.GetInt32Type());
    auto M = Mgr.MakeVar("DDLookupM", MapType);
    auto X = Mgr.MakeVar("DDLookupX", UInt8Type);
    auto Got = Mgr.MakeExpr(SymxOps::OpMAPGET, M, X);
    auto Pred = Mgr.MakeExpr(SymxOps::OpAND,
                             Eq(Mgr.MakeExpr(SymxOps::OpOPTVALUE, Got), Mgr.MakeInt32(7)),
                             Mgr.MakeExpr(SymxOps::OpGT, X, Mgr.MakeInt(UInt8Type, 200)));

    // 256 entries of 33 bits each, looked up by an 8 bit key
    DDSolver Session(1u << 21);
    Session.Assert(Pred);
    ASSERT_EQ(Session.CheckSat(), TPResult::SATISFIABLE);
    auto Key = Session.GetModelValue(X);
    EXPECT_GT(Key->SAs<IntValue>()->GetUnsigned(), 200u);
    auto Entry = Session.GetModelValue(M)->SAs<MapValue>()->Find(Key);
    ASSERT_FALSE(Entry.IsNull_());
    EXPECT_EQ(Entry->SAs<IntValue>()->GetSigned(), 7);

    auto Result = Solver::Solve(Pred, BackendT::BDD);
    ASSERT_TRUE(Result.IsSatisfiable());
    EXPECT_TRUE(Interp::ExpressionEvaluator::DoBool(Pred, Result.GetModel()));
}

TEST_F(DDSolverTests, PushAndPop)
{
    auto X = Mgr.MakeVar("DDPushX", Int8Type);
    DDSolver Session;
    Session.Assert(Mgr.MakeExpr(SymxOps::OpGT, X, Mgr.MakeInt(Int8Type, 0)));
    Session.Push();
    Session.Assert(Mgr.MakeExpr(SymxOps::OpLT, X, Mgr.MakeInt(Int8Type, 0)));
    EXPECT_EQ(Session.CheckSat(), TPResult::UNSATISFIABLE);
    Session.Pop();
    EXPECT_EQ(Session.CheckSat(), TPResult::SATISFIABLE);
    EXPECT_GT(Session.GetModelValue(X)->SAs<IntValue>()->GetSigned(), 0);
    EXPECT_EQ(Session.GetBackend(), BackendT::BDD);
}

TEST_F(DDSolverTests, ModelValuesNeedSatisfiability)
{
    auto X = Mgr.MakeVar("DDModelX", Int8Type);
    DDSolver Session;
    Session.Assert(Mgr.MakeFalse());
    EXPECT_EQ(Session.CheckSat(), TPResult::UNSATISFIABLE);
    EXPECT_THROW(Session.GetModelValue(X), ModelingError);
}

TEST_F(DDSolverTests, NodeLimitIsEnforcedPerSession)
{
    auto X = Mgr.MakeVar("DDLimitX", Mgr.GetInt32Type());
    auto Y = Mgr.MakeVar("DDLimitY", Mgr.GetInt32Type());
    DDSolver Session(256);
    EXPECT_THROW(Session.Assert(Eq(Mgr.MakeExpr(SymxOps::OpMUL, X, Y), Mgr.MakeInt32(391))),
                 EngineError);
}

TEST_F(DDSolverTests, CapabilityChecks)
{
    EXPECT_EQ(DDCapabilityChecker::CheckType(Int8Type), "");
    EXPECT_EQ(DDCapabilityChecker::CheckType(Mgr.MakeMapType(Mgr.GetBoolType(), Int8Type)), "");
    EXPECT_NE(DDCapabilityChecker::CheckType(Mgr.GetBigIntType()), "");
    EXPECT_NE(DDCapabilityChecker::CheckType(Mgr.GetStringType()), "");
    EXPECT_NE(DDCapabilityChecker::CheckType(Mgr.MakeMapType(Mgr.GetInt32Type(), Int8Type)), "");

    EXPECT_EQ(DDBitBlaster::GetNumBits(Mgr.MakeOptionType(Int8Type)), 9u);
    EXPECT_EQ(DDBitBlaster::GetNumBits(Mgr.MakeMapType(Mgr.GetBoolType(), Int8Type)), 18u);

    auto B = Mgr.MakeVar("DDBigB", Mgr.GetBigIntType());
    EXPECT_THROW(Solver::Solve(Eq(B, Mgr.MakeBigInt(BigIntT(1))), BackendT::BDD),
                 CapabilityError);
}

//
// DDTests.cpp ends here
