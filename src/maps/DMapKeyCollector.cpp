// DMapKeyCollector.cpp ---
//
// Filename: DMapKeyCollector.cpp
// Author: Abhishek Udupa
// Created: Wed Jan 28 00:21:00 2015 (-0500)
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

#include "../expr/SymxOps.hpp"
#include "../expr/ExprTypes.hpp"

#include "DMapKeyCollector.hpp"

namespace SYMX {
    namespace Maps {

        using namespace Exprs;

        // DMapCapabilityChecker implementation
        DMapCapabilityChecker::DMapCapabilityChecker()
            : ExpressionVisitorBase("DMapCapabilityChecker")
        {
            // Nothing here
        }

        DMapCapabilityChecker::~DMapCapabilityChecker()
        {
            // Nothing here
        }

        void DMapCapabilityChecker::CheckType(const TypeRef& Type, const ExpressionBase* Exp)
        {
            if (!CheckedTypes.insert(Type.GetPtr_()).second) {
                return;
            }

            auto TypeAsDMap = Type->As<DMapType>();
            if (TypeAsDMap != nullptr) {
                if (TypeAsDMap->GetKeyType()->ContainsMap() ||
                    TypeAsDMap->GetValueType()->ContainsMap()) {
                    throw CapabilityError((string)"Default-valued maps with map typed keys " +
                                          "or values cannot be translated: " +
                                          Type->ToString() + " in expression:\n" +
                                          Exp->ToString());
                }
                return;
            }

            if (Type->ContainsDMap()) {
                throw CapabilityError((string)"Default-valued maps nested inside records, " +
                                      "options or sequences cannot be translated: " +
                                      Type->ToString() + " in expression:\n" +
                                      Exp->ToString());
            }
        }

        void DMapCapabilityChecker::VisitConstExpression(const ConstExpression* Exp)
        {
            CheckType(Exp->GetType(), Exp);
        }

        void DMapCapabilityChecker::VisitVarExpression(const VarExpression* Exp)
        {
            CheckType(Exp->GetType(), Exp);
        }

        void DMapCapabilityChecker::VisitOpExpression(const OpExpression* Exp)
        {
            if (!Visited.insert(Exp).second) {
                return;
            }
            ExpressionVisitorBase::VisitOpExpression(Exp);
            CheckType(Exp->GetType(), Exp);
        }

        void DMapCapabilityChecker::Do(const ExpT& Exp)
        {
            DMapCapabilityChecker TheChecker;
            Exp->Accept(&TheChecker);
        }

        // DMapKeyCollector implementation
        DMapKeyCollector::DMapKeyCollector(KeyUniverseMapT& Universes)
            : ExpressionVisitorBase("DMapKeyCollector"), Universes(Universes)
        {
            // Nothing here
        }

        DMapKeyCollector::~DMapKeyCollector()
        {
            // Nothing here
        }

        void DMapKeyCollector::CollectFromValue(const ValueRef& Value)
        {
            auto ValueAsDMap = Value->As<DMapValue>();
            if (ValueAsDMap == nullptr) {
                return;
            }
            auto& Universe = Universes[Value->GetType().GetPtr_()];
            for (auto const& Entry : ValueAsDMap->GetCanonicalEntries()) {
                Universe.insert(Entry.first);
            }
        }

        void DMapKeyCollector::VisitConstExpression(const ConstExpression* Exp)
        {
            CollectFromValue(Exp->GetConstValue());
        }

        void DMapKeyCollector::VisitVarExpression(const VarExpression* Exp)
        {
            // A map variable on its own touches no keys, but its type
            // still gets a (possibly empty) universe
            if (Exp->GetType()->Is<DMapType>()) {
                Universes[Exp->GetType().GetPtr_()];
            }
        }

        void DMapKeyCollector::VisitOpExpression(const OpExpression* Exp)
        {
            if (!Visited.insert(Exp).second) {
                return;
            }
            ExpressionVisitorBase::VisitOpExpression(Exp);

            auto OpCode = Exp->GetOpCode();
            if (OpCode != SymxOps::OpDMAPGET && OpCode != SymxOps::OpDMAPSET) {
                return;
            }

            auto const& Children = Exp->GetChildren();
            auto KeyAsConst = Children[1]->As<ConstExpression>();
            if (KeyAsConst == nullptr) {
                throw CapabilityError((string)"Default-valued map keys must be constants " +
                                      "for solver translation, got symbolic key " +
                                      Children[1]->ToString() + " in expression:\n" +
                                      Exp->ToString());
            }
            Universes[Children[0]->GetType().GetPtr_()].insert(KeyAsConst->GetConstValue());
        }

        void DMapKeyCollector::Do(const ExpT& Exp, KeyUniverseMapT& Universes)
        {
            DMapKeyCollector TheCollector(Universes);
            Exp->Accept(&TheCollector);
        }

    } /* end namespace Maps */
} /* end namespace SYMX */

//
// DMapKeyCollector.cpp ends here
