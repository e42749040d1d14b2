// DDManager.hpp ---
//
// Filename: DDManager.hpp
// Author: Abhishek Udupa
// Created: Wed May 20 18:28:00 2015 (-0500)
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

// A small reduced ordered binary decision diagram package. Nodes
// live in one array owned by the manager and are referred to by
// index; node 0 is the false terminal and node 1 the true
// terminal. Every node is unique (hash consed through the unique
// table), so two functions are equal iff their indices are.
// Variables are ordered by creation. Nodes are never collected;
// a manager lives as long as the solver session that owns it.

#if !defined SYMX_DD_MANAGER_HPP_
#define SYMX_DD_MANAGER_HPP_

#include <vector>
#include <unordered_map>
#include <tuple>

#include <boost/functional/hash.hpp>

#include "../common/SymxFwdDecls.hpp"

namespace SYMX {
    namespace DD {

        typedef u32 DDNodeRef;

        class DDManager
        {
        private:
            struct DDNode
            {
                u32 Var;
                DDNodeRef Low;
                DDNodeRef High;
            };

            typedef tuple<u32, u32, u32> NodeKeyT;

            class NodeKeyHasher
            {
            public:
                inline u64 operator () (const NodeKeyT& Key) const
                {
                    u64 Retval = 0;
                    boost::hash_combine(Retval, get<0>(Key));
                    boost::hash_combine(Retval, get<1>(Key));
                    boost::hash_combine(Retval, get<2>(Key));
                    return Retval;
                }
            };

            vector<DDNode> Nodes;
            unordered_map<NodeKeyT, DDNodeRef, NodeKeyHasher> UniqueTable;
            unordered_map<NodeKeyT, DDNodeRef, NodeKeyHasher> ITECache;
            u32 NumVars;
            u64 MaxNodes;
            u64 NumITECalls;
            u64 NumITECacheHits;

            DDNodeRef MakeNode(u32 Var, DDNodeRef Low, DDNodeRef High);
            // Cofactors of Node with respect to Var, which must not
            // be below the top variable of Node
            inline DDNodeRef CofactorLow(DDNodeRef Node, u32 Var) const;
            inline DDNodeRef CofactorHigh(DDNodeRef Node, u32 Var) const;
            DDNodeRef RestrictRec(DDNodeRef Node, u32 Var, bool Value,
                                  unordered_map<DDNodeRef, DDNodeRef>& Memo);

        public:
            static const DDNodeRef FalseNode = 0;
            static const DDNodeRef TrueNode = 1;
            static const u32 TerminalVar = UINT32_MAX;

            // EngineError is raised when a diagram would grow beyond
            // MaxNodes nodes
            DDManager(u64 MaxNodes = (1ULL << 24));
            DDManager(const DDManager& Other) = delete;
            DDManager(DDManager&& Other) = delete;
            ~DDManager();

            // A fresh variable, ordered below all existing ones
            u32 NewVar();
            u32 GetNumVars() const;
            u64 GetNumNodes() const;

            DDNodeRef MakeConst(bool Value) const;
            // The function that is true iff Var is true
            DDNodeRef MakeVarNode(u32 Var);

            DDNodeRef ITE(DDNodeRef F, DDNodeRef G, DDNodeRef H);
            DDNodeRef MakeNot(DDNodeRef F);
            DDNodeRef MakeAnd(DDNodeRef F, DDNodeRef G);
            DDNodeRef MakeOr(DDNodeRef F, DDNodeRef G);
            DDNodeRef MakeXor(DDNodeRef F, DDNodeRef G);
            DDNodeRef MakeIff(DDNodeRef F, DDNodeRef G);
            DDNodeRef MakeImplies(DDNodeRef F, DDNodeRef G);

            // F with Var fixed to Value
            DDNodeRef Restrict(DDNodeRef F, u32 Var, bool Value);

            // Fills Assignment (indexed by variable, -1 when the path
            // does not test the variable) with one path to the true
            // terminal. False iff F is unsatisfiable.
            bool FindSatPath(DDNodeRef F, vector<i08>& Assignment) const;

            // Number of nodes reachable from F, terminals included
            u64 GetSize(DDNodeRef F) const;

            string GetStats() const;
        };

    } /* end namespace DD */
} /* end namespace SYMX */

#endif /* SYMX_DD_MANAGER_HPP_ */

//
// DDManager.hpp ends here
