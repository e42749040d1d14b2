// LibTests.cpp ---
//
// Filename: LibTests.cpp
// Author: Abhishek Udupa
// Created: Wed Jun 17 00:44:00 2015 (-0500)
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

#include <stdio.h>
#include <fstream>
#include <iterator>

#include <gtest/gtest.h>

#include "../../src/lib/SymxLib.hpp"
#include "../../src/utils/LogManager.hpp"
#include "../../src/expr/ExprMgr.hpp"
#include "../../src/solver/Solver.hpp"

using namespace SYMX;
using namespace Exprs;
using Logging::LogManager;

class LibTests : public ::testing::Test
{
protected:
    virtual void TearDown() override
    {
        SymxLib::Initialize(SymxLibOptionsT());
    }
};

TEST_F(LibTests, OptionsAreValidated)
{
    EXPECT_THROW(LogManager::EnableLogOption("No.Such.Option"), SymxError);
    EXPECT_THROW(LogManager::DisableLogOption("No.Such.Option"), SymxError);
    EXPECT_NE(LogManager::GetLogOptions().find("Solver.FindAll"), string::npos);
}

TEST_F(LibTests, AllAndNoneToggleEverything)
{
    LogManager::EnableLogOption("Symx.All");
    EXPECT_TRUE(LogManager::IsOptionEnabled("TheoremProver.Assertions"));
    EXPECT_TRUE(LogManager::IsOptionEnabled("DD.Stats"));
    EXPECT_FALSE(LogManager::IsLoggingDisabled());

    LogManager::DisableLogOption("DD.Stats");
    EXPECT_FALSE(LogManager::IsOptionEnabled("DD.Stats"));

    LogManager::EnableLogOption("Symx.None");
    EXPECT_FALSE(LogManager::IsOptionEnabled("TheoremProver.Assertions"));
    EXPECT_TRUE(LogManager::IsLoggingDisabled());
    EXPECT_TRUE(LogManager::GetEnabledLogOptions().empty());
}

TEST_F(LibTests, MinimalOutputIsOptIn)
{
    SymxLib::Initialize(SymxLibOptionsT());
    EXPECT_TRUE(LogManager::IsLoggingDisabled());
    LogManager::EnableLogOption("Symx.Minimal");
    EXPECT_FALSE(LogManager::IsLoggingDisabled());
}

TEST_F(LibTests, InitializeAppliesOptions)
{
    SymxLibOptionsT Options;
    Options.LogFileName = "symx_lib_test.log";
    Options.LoggingOptions = { "Solver.FindAll", "Symx.Minimal" };
    Options.Z3TimeoutMs = 10000;
    Options.Z3RandomSeed = 7;
    SymxLib::Initialize(Options);

    EXPECT_EQ(SymxLib::GetOptions().Z3TimeoutMs, 10000u);
    EXPECT_TRUE(LogManager::IsOptionEnabled("Solver.FindAll"));
    EXPECT_FALSE(LogManager::IsOptionEnabled("DD.Stats"));

    // Queries still work with the options in force
    auto& Mgr = ExprMgr::Instance();
    auto X = Mgr.MakeVar("LibX", Mgr.GetInt32Type());
    auto Pred = Mgr.MakeExpr(SymxOps::OpEQ, X, Mgr.MakeInt32(9));
    EXPECT_EQ(Query::Solver::FindAll(Pred).Take(5).size(), 1u);

    LogManager::GetLogStream() << "marker" << endl;
    SymxLib::Finalize();

    ifstream LogFile("symx_lib_test.log");
    ASSERT_TRUE(LogFile.good());
    string Contents((istreambuf_iterator<char>(LogFile)), istreambuf_iterator<char>());
    EXPECT_NE(Contents.find("marker"), string::npos);
    remove("symx_lib_test.log");
}

//
// LibTests.cpp ends here
