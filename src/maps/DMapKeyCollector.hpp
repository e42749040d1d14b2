// DMapKeyCollector.hpp ---
//
// Filename: DMapKeyCollector.hpp
// Author: Abhishek Udupa
// Created: Tue Jun 23 08:16:00 2015 (-0500)
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

// Key universes of default-valued maps, and the checks that
// decide whether a query can be lowered for a backend at all

#if !defined SYMX_DMAP_KEY_COLLECTOR_HPP_
#define SYMX_DMAP_KEY_COLLECTOR_HPP_

#include <set>
#include <map>
#include <unordered_set>

#include "../common/SymxFwdDecls.hpp"
#include "../expr/Expressions.hpp"
#include "../expr/Visitors.hpp"
#include "../expr/Values.hpp"

namespace SYMX {
    namespace Maps {

        using Exprs::ExpT;
        using Exprs::TypeRef;
        using Exprs::ValueRef;

        typedef set<ValueRef, Exprs::ValuePtrCompare> KeyUniverseT;
        // Keyed on the (interned) default-valued map type
        typedef map<const Exprs::TypeBase*, KeyUniverseT> KeyUniverseMapT;

        // Rejects types a backend translation of default-valued maps
        // cannot encode: map typed keys or values of a default-valued
        // map, and default-valued maps nested in records, options or
        // sequences
        class DMapCapabilityChecker : public Exprs::ExpressionVisitorBase
        {
        private:
            unordered_set<const Exprs::ExpressionBase*> Visited;
            unordered_set<const Exprs::TypeBase*> CheckedTypes;

            void CheckType(const TypeRef& Type, const Exprs::ExpressionBase* Exp);

        public:
            DMapCapabilityChecker();
            virtual ~DMapCapabilityChecker();

            virtual void VisitConstExpression(const Exprs::ConstExpression* Exp) override;
            virtual void VisitVarExpression(const Exprs::VarExpression* Exp) override;
            virtual void VisitOpExpression(const Exprs::OpExpression* Exp) override;

            static void Do(const ExpT& Exp);
        };

        // Gathers, per default-valued map type, every key that the
        // expression touches. Keys of Get and Set must be constants.
        class DMapKeyCollector : public Exprs::ExpressionVisitorBase
        {
        private:
            unordered_set<const Exprs::ExpressionBase*> Visited;
            KeyUniverseMapT& Universes;

            void CollectFromValue(const ValueRef& Value);

        public:
            DMapKeyCollector(KeyUniverseMapT& Universes);
            virtual ~DMapKeyCollector();

            virtual void VisitConstExpression(const Exprs::ConstExpression* Exp) override;
            virtual void VisitVarExpression(const Exprs::VarExpression* Exp) override;
            virtual void VisitOpExpression(const Exprs::OpExpression* Exp) override;

            // Adds the keys of Exp to Universes
            static void Do(const ExpT& Exp, KeyUniverseMapT& Universes);
        };

    } /* end namespace Maps */
} /* end namespace SYMX */

#endif /* SYMX_DMAP_KEY_COLLECTOR_HPP_ */

//
// DMapKeyCollector.hpp ends here
