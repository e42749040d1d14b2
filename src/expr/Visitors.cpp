// Visitors.cpp ---
//
// Filename: Visitors.cpp
// Author: Abhishek Udupa
// Created: Wed May 27 11:28:00 2015 (-0500)
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

#include "ExprMgr.hpp"
#include "Visitors.hpp"

namespace SYMX {
    namespace Exprs {

        // VarGatherer implementation
        VarGatherer::VarGatherer()
            : ExpressionVisitorBase("VarGatherer")
        {
            // Nothing here
        }

        VarGatherer::~VarGatherer()
        {
            // Nothing here
        }

        void VarGatherer::VisitVarExpression(const VarExpression* Exp)
        {
            if (Visited.insert(Exp).second) {
                GatheredVars.push_back(Exp);
            }
        }

        void VarGatherer::VisitOpExpression(const OpExpression* Exp)
        {
            // Shared subtrees are only walked once
            if (!Visited.insert(Exp).second) {
                return;
            }
            ExpressionVisitorBase::VisitOpExpression(Exp);
        }

        vector<ExpT> VarGatherer::Do(const ExpT& Exp)
        {
            VarGatherer TheGatherer;
            Exp->Accept(&TheGatherer);
            return TheGatherer.GatheredVars;
        }

        vector<ExpT> VarGatherer::Do(const vector<ExpT>& Exps)
        {
            VarGatherer TheGatherer;
            for (auto const& Exp : Exps) {
                Exp->Accept(&TheGatherer);
            }
            return TheGatherer.GatheredVars;
        }

        // Substitutor implementation
        Substitutor::Substitutor(const SubstMapT& Subst)
            : ExpressionVisitorBase("Substitutor"), Subst(Subst)
        {
            // Nothing here
        }

        Substitutor::~Substitutor()
        {
            // Nothing here
        }

        void Substitutor::VisitConstExpression(const ConstExpression* Exp)
        {
            auto it = Subst.find(Exp);
            if (it != Subst.end()) {
                SubstStack.push_back(it->second);
            } else {
                SubstStack.push_back(Exp);
            }
        }

        void Substitutor::VisitVarExpression(const VarExpression* Exp)
        {
            auto it = Subst.find(Exp);
            if (it != Subst.end()) {
                SubstStack.push_back(it->second);
            } else {
                SubstStack.push_back(Exp);
            }
        }

        void Substitutor::VisitOpExpression(const OpExpression* Exp)
        {
            auto it = Subst.find(Exp);
            if (it != Subst.end()) {
                SubstStack.push_back(it->second);
                return;
            }
            auto it2 = Rebuilt.find(Exp);
            if (it2 != Rebuilt.end()) {
                SubstStack.push_back(it2->second);
                return;
            }

            ExpressionVisitorBase::VisitOpExpression(Exp);
            const u32 NumChildren = Exp->GetChildren().size();
            vector<ExpT> SubstChildren(NumChildren);
            bool Changed = false;
            for (u32 i = 0; i < NumChildren; ++i) {
                SubstChildren[NumChildren - i - 1] = SubstStack.back();
                SubstStack.pop_back();
                if (SubstChildren[NumChildren - i - 1] != Exp->GetChildren()[NumChildren - i - 1]) {
                    Changed = true;
                }
            }

            ExpT Result = Exp;
            if (Changed) {
                Result = ExprMgr::Instance().MakeOpLike(Exp, SubstChildren);
            }
            Rebuilt[Exp] = Result;
            SubstStack.push_back(Result);
        }

        ExpT Substitutor::Do(const SubstMapT& Subst, const ExpT& Exp)
        {
            Substitutor TheSubstitutor(Subst);
            Exp->Accept(&TheSubstitutor);
            return TheSubstitutor.SubstStack[0];
        }

    } /* end namespace Exprs */
} /* end namespace SYMX */

//
// Visitors.cpp ends here
