// InternTable.hpp ---
//
// Filename: InternTable.hpp
// Author: Abhishek Udupa
// Created: Sun Jan 18 06:18:00 2015 (-0500)
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

#if !defined SYMX_INTERN_TABLE_HPP_
#define SYMX_INTERN_TABLE_HPP_

#include <unordered_set>
#include <mutex>
#include <array>

#include "../common/SymxFwdDecls.hpp"
#include "SmartPtr.hpp"

namespace SYMX {

    // Hash-consing table for the immutable nodes (types, expressions,
    // regex nodes) handed out by the managers. The first node
    // inserted with a given structure is canonical, so interned
    // nodes can be compared by pointer. Nodes are never evicted.
    //
    // The table is split into shards, each with its own lock, since
    // every manager is shared by all threads of the process.
    template <typename OBJTYPE, typename HASHERTYPE, typename EQTYPE,
              u32 NUMSHARDS = 16>
    class InternTable
    {
    public:
        typedef CSmartPtr<OBJTYPE> PtrType;

    private:
        typedef unordered_set<PtrType, HASHERTYPE, EQTYPE> SetType;

        struct Shard
        {
            SetType Nodes;
            mutable mutex ShardMutex;
        };

        array<Shard, NUMSHARDS> Shards;

    public:
        InternTable()
        {
            // Nothing here
        }

        InternTable(const InternTable& Other) = delete;
        InternTable& operator = (const InternTable& Other) = delete;

        // Takes ownership of Node. If an equal node is already
        // interned, Node is released and the existing one returned.
        inline PtrType Intern(const OBJTYPE* Node)
        {
            PtrType Candidate(Node);
            auto& TheShard = Shards[HASHERTYPE()(Candidate) % NUMSHARDS];

            lock_guard<mutex> Guard(TheShard.ShardMutex);
            return *(TheShard.Nodes.insert(Candidate).first);
        }

        template <typename T, typename... ArgTypes>
        inline PtrType Make(ArgTypes&&... Args)
        {
            return Intern(new T(forward<ArgTypes>(Args)...));
        }

        inline u64 Size() const
        {
            u64 Retval = 0;
            for (auto const& TheShard : Shards) {
                lock_guard<mutex> Guard(TheShard.ShardMutex);
                Retval += TheShard.Nodes.size();
            }
            return Retval;
        }
    };

} /* end namespace SYMX */

#endif /* SYMX_INTERN_TABLE_HPP_ */

//
// InternTable.hpp ends here
