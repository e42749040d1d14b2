// DMapLowering.hpp ---
//
// Filename: DMapLowering.hpp
// Author: Abhishek Udupa
// Created: Sat Jan 24 02:55:00 2015 (-0500)
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

// Lowers default-valued map operations into per-key expressions
// over a finite key universe, for the solver backends.
//
// For each default-valued map type, the universe is the set of
// constant keys touched anywhere in the query. A map typed
// expression is flattened into one expression per universe key:
// variables become per-key variables, Set becomes a conditional
// over the keys, Get selects an entry, equality is the per-key
// conjunction and Count sums per-key indicators. Keys outside the
// universe are fixed at the default.
//
// One lowering object is used per solver session, so that repeated
// assertions agree on the universes and the per-key variables.

#if !defined SYMX_DMAP_LOWERING_HPP_
#define SYMX_DMAP_LOWERING_HPP_

#include <functional>
#include <unordered_map>
#include <unordered_set>

#include "../common/SymxFwdDecls.hpp"
#include "DMapKeyCollector.hpp"

namespace SYMX {
    namespace Maps {

        class DMapLowering
        {
        private:
            KeyUniverseMapT Universes;
            // Types whose universe was used for flattening
            unordered_set<const Exprs::TypeBase*> FrozenTypes;
            unordered_map<const Exprs::ExpressionBase*, vector<ExpT>> Flattened;
            unordered_map<const Exprs::ExpressionBase*, ExpT> Lowered;
            // Per-key variables of every lowered map variable
            unordered_map<const Exprs::ExpressionBase*, vector<ExpT>> PerKeyVars;

            const KeyUniverseT& GetUniverse(const TypeRef& DMapType);
            u32 GetKeyIndex(const TypeRef& DMapType, const ValueRef& Key);

            const vector<ExpT>& Flatten(const ExpT& Exp);
            ExpT LowerExp(const ExpT& Exp);

        public:
            DMapLowering();
            ~DMapLowering();

            // Checks capabilities, collects keys and lowers. Throws
            // CapabilityError on symbolic keys, on unsupported nesting
            // and when a universe that was already used would grow.
            ExpT Do(const ExpT& Exp);

            // True if Exp has no default-valued map anywhere
            static bool IsMapFree(const ExpT& Exp);

            // Name of the per-key variable of a map variable
            static string MakePerKeyVarName(const string& MapVarName, const ValueRef& Key);
            const vector<ExpT>& GetPerKeyVars(const ExpT& MapVar);

            // Rebuilds the value of a map variable from the per-key
            // model values. Only entries that differ from the default
            // become overrides; a variable that was never lowered is
            // the empty map.
            ValueRef RaiseMapVar(const ExpT& MapVar,
                                 const function<ValueRef(const ExpT&)>& GetModelValue);

            const KeyUniverseMapT& GetUniverses() const;
        };

    } /* end namespace Maps */
} /* end namespace SYMX */

#endif /* SYMX_DMAP_LOWERING_HPP_ */

//
// DMapLowering.hpp ends here
