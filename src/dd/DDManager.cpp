// DDManager.cpp ---
//
// Filename: DDManager.cpp
// Author: Abhishek Udupa
// Created: Fri Jan 09 00:27:00 2015 (-0500)
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

#include <unordered_set>
#include <sstream>
#include <algorithm>

#include "DDManager.hpp"

namespace SYMX {
    namespace DD {

        const DDNodeRef DDManager::FalseNode;
        const DDNodeRef DDManager::TrueNode;
        const u32 DDManager::TerminalVar;

        DDManager::DDManager(u64 MaxNodes)
            : NumVars(0), MaxNodes(MaxNodes), NumITECalls(0), NumITECacheHits(0)
        {
            Nodes.push_back({ TerminalVar, FalseNode, FalseNode });
            Nodes.push_back({ TerminalVar, TrueNode, TrueNode });
        }

        DDManager::~DDManager()
        {
            // Nothing here
        }

        u32 DDManager::NewVar()
        {
            return NumVars++;
        }

        u32 DDManager::GetNumVars() const
        {
            return NumVars;
        }

        u64 DDManager::GetNumNodes() const
        {
            return Nodes.size();
        }

        DDNodeRef DDManager::MakeNode(u32 Var, DDNodeRef Low, DDNodeRef High)
        {
            if (Low == High) {
                return Low;
            }

            auto Key = make_tuple(Var, Low, High);
            auto it = UniqueTable.find(Key);
            if (it != UniqueTable.end()) {
                return it->second;
            }

            if (Nodes.size() >= MaxNodes) {
                throw EngineError((string)"Decision diagram exceeded the limit of " +
                                  to_string(MaxNodes) + " nodes");
            }
            DDNodeRef Retval = Nodes.size();
            Nodes.push_back({ Var, Low, High });
            UniqueTable[Key] = Retval;
            return Retval;
        }

        inline DDNodeRef DDManager::CofactorLow(DDNodeRef Node, u32 Var) const
        {
            auto const& TheNode = Nodes[Node];
            return (TheNode.Var == Var ? TheNode.Low : Node);
        }

        inline DDNodeRef DDManager::CofactorHigh(DDNodeRef Node, u32 Var) const
        {
            auto const& TheNode = Nodes[Node];
            return (TheNode.Var == Var ? TheNode.High : Node);
        }

        DDNodeRef DDManager::MakeConst(bool Value) const
        {
            return (Value ? TrueNode : FalseNode);
        }

        DDNodeRef DDManager::MakeVarNode(u32 Var)
        {
            if (Var >= NumVars) {
                throw InternalError((string)"Decision diagram variable " + to_string(Var) +
                                    " was never created" +
                                    "\nAt: " + __FILE__ + ":" + to_string(__LINE__));
            }
            return MakeNode(Var, FalseNode, TrueNode);
        }

        DDNodeRef DDManager::ITE(DDNodeRef F, DDNodeRef G, DDNodeRef H)
        {
            // Terminal cases
            if (F == TrueNode) {
                return G;
            }
            if (F == FalseNode) {
                return H;
            }
            if (G == H) {
                return G;
            }
            if (G == TrueNode && H == FalseNode) {
                return F;
            }

            ++NumITECalls;
            auto Key = make_tuple(F, G, H);
            auto it = ITECache.find(Key);
            if (it != ITECache.end()) {
                ++NumITECacheHits;
                return it->second;
            }

            auto Top = min(Nodes[F].Var, min(Nodes[G].Var, Nodes[H].Var));
            auto Then = ITE(CofactorHigh(F, Top), CofactorHigh(G, Top), CofactorHigh(H, Top));
            auto Else = ITE(CofactorLow(F, Top), CofactorLow(G, Top), CofactorLow(H, Top));
            auto Retval = MakeNode(Top, Else, Then);

            ITECache[Key] = Retval;
            return Retval;
        }

        DDNodeRef DDManager::MakeNot(DDNodeRef F)
        {
            return ITE(F, FalseNode, TrueNode);
        }

        DDNodeRef DDManager::MakeAnd(DDNodeRef F, DDNodeRef G)
        {
            return ITE(F, G, FalseNode);
        }

        DDNodeRef DDManager::MakeOr(DDNodeRef F, DDNodeRef G)
        {
            return ITE(F, TrueNode, G);
        }

        DDNodeRef DDManager::MakeXor(DDNodeRef F, DDNodeRef G)
        {
            return ITE(F, MakeNot(G), G);
        }

        DDNodeRef DDManager::MakeIff(DDNodeRef F, DDNodeRef G)
        {
            return ITE(F, G, MakeNot(G));
        }

        DDNodeRef DDManager::MakeImplies(DDNodeRef F, DDNodeRef G)
        {
            return ITE(F, G, TrueNode);
        }

        DDNodeRef DDManager::RestrictRec(DDNodeRef Node, u32 Var, bool Value,
                                         unordered_map<DDNodeRef, DDNodeRef>& Memo)
        {
            auto const NodeVar = Nodes[Node].Var;
            // Var cannot occur below a node with a larger variable
            if (NodeVar == TerminalVar || NodeVar > Var) {
                return Node;
            }
            if (NodeVar == Var) {
                return (Value ? Nodes[Node].High : Nodes[Node].Low);
            }

            auto it = Memo.find(Node);
            if (it != Memo.end()) {
                return it->second;
            }
            auto Low = RestrictRec(Nodes[Node].Low, Var, Value, Memo);
            auto High = RestrictRec(Nodes[Node].High, Var, Value, Memo);
            auto Retval = MakeNode(NodeVar, Low, High);
            Memo[Node] = Retval;
            return Retval;
        }

        DDNodeRef DDManager::Restrict(DDNodeRef F, u32 Var, bool Value)
        {
            unordered_map<DDNodeRef, DDNodeRef> Memo;
            return RestrictRec(F, Var, Value, Memo);
        }

        bool DDManager::FindSatPath(DDNodeRef F, vector<i08>& Assignment) const
        {
            Assignment.assign(NumVars, -1);
            if (F == FalseNode) {
                return false;
            }

            // In a reduced diagram every non terminal node has a path
            // to the true terminal, so walking never backtracks
            auto Current = F;
            while (Current != TrueNode) {
                auto const& TheNode = Nodes[Current];
                if (TheNode.Low != FalseNode) {
                    Assignment[TheNode.Var] = 0;
                    Current = TheNode.Low;
                } else {
                    Assignment[TheNode.Var] = 1;
                    Current = TheNode.High;
                }
            }
            return true;
        }

        u64 DDManager::GetSize(DDNodeRef F) const
        {
            unordered_set<DDNodeRef> Visited;
            vector<DDNodeRef> Worklist = { F };
            while (!Worklist.empty()) {
                auto Current = Worklist.back();
                Worklist.pop_back();
                if (!Visited.insert(Current).second) {
                    continue;
                }
                if (Nodes[Current].Var != TerminalVar) {
                    Worklist.push_back(Nodes[Current].Low);
                    Worklist.push_back(Nodes[Current].High);
                }
            }
            return Visited.size();
        }

        string DDManager::GetStats() const
        {
            ostringstream sstr;
            sstr << "Variables: " << NumVars << ", nodes: " << Nodes.size()
                 << ", ITE calls: " << NumITECalls << ", ITE cache hits: "
                 << NumITECacheHits;
            return sstr.str();
        }

    } /* end namespace DD */
} /* end namespace SYMX */

//
// DDManager.cpp ends here
