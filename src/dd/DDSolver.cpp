// DDSolver.cpp ---
//
// Filename: DDSolver.cpp
// Author: Abhishek Udupa
// Created: Thu Jan 08 20:45:00 2015 (-0500)
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

#include "../expr/Expressions.hpp"
#include "../utils/LogManager.hpp"

#include "DDCapabilityChecker.hpp"
#include "DDSolver.hpp"

namespace SYMX {
    namespace DD {

        using TP::TPResult;

        DDSolver::DDSolver()
            : SolverSession(), Mgr(), Blaster(Mgr), Root(DDManager::TrueNode)
        {
            // Nothing here
        }

        DDSolver::DDSolver(u64 MaxNodes)
            : SolverSession(), Mgr(MaxNodes), Blaster(Mgr), Root(DDManager::TrueNode)
        {
            // Nothing here
        }

        DDSolver::~DDSolver()
        {
            // Nothing here
        }

        BackendT DDSolver::GetBackend() const
        {
            return BackendT::BDD;
        }

        void DDSolver::AssertLowered(const ExpT& Assertion)
        {
            DDCapabilityChecker::Do(Assertion);
            auto Bits = Blaster.Blast(Assertion);
            Root = Mgr.MakeAnd(Root, Bits[0]);
            Assignment.clear();

            SYMX_LOG_SHORT(DDStats,
                           Out_ << "After assertion: " << Mgr.GetStats()
                                << ", conjunction size: " << Mgr.GetSize(Root) << endl;
                           );
        }

        TPResult DDSolver::CheckSatLowered()
        {
            SYMX_LOG_MIN_SHORT(
                               Out_ << "Searching for a satisfying path over "
                                    << Mgr.GetNumVars() << " variables... ";
                               );

            auto Sat = Mgr.FindSatPath(Root, Assignment);

            SYMX_LOG_MIN_SHORT(
                               Out_ << "Done!" << endl;
                               );
            SYMX_LOG_SHORT(DDStats,
                           Out_ << Mgr.GetStats() << ", result: "
                                << (Sat ? "sat" : "unsat") << endl;
                           );

            return (Sat ? TPResult::SATISFIABLE : TPResult::UNSATISFIABLE);
        }

        ValueRef DDSolver::GetLoweredModelValue(const ExpT& Var)
        {
            auto const& VarType = Var->GetType();
            DDCapabilityChecker::Do(VarType);

            auto Indices = Blaster.GetVarIndices(Var);
            if (Indices == nullptr) {
                return VarType->GetDefaultValue();
            }

            // Bits off the satisfying path read 0
            vector<bool> Bits(Indices->size());
            for (u32 i = 0; i < Indices->size(); ++i) {
                auto Index = (*Indices)[i];
                Bits[i] = (Index < Assignment.size() && Assignment[Index] == 1);
            }
            return Blaster.Raise(VarType, Bits);
        }

        void DDSolver::PushLowered()
        {
            RootStack.push_back(Root);
        }

        void DDSolver::PopLowered(u32 NumScopes)
        {
            Root = RootStack[RootStack.size() - NumScopes];
            RootStack.resize(RootStack.size() - NumScopes);
            Assignment.clear();
        }

        const DDManager& DDSolver::GetManager() const
        {
            return Mgr;
        }

        DDNodeRef DDSolver::GetRoot() const
        {
            return Root;
        }

    } /* end namespace DD */
} /* end namespace SYMX */

//
// DDSolver.cpp ends here
