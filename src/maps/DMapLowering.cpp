// DMapLowering.cpp ---
//
// Filename: DMapLowering.cpp
// Author: Abhishek Udupa
// Created: Wed Jul 22 10:18:00 2015 (-0500)
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

#include "../expr/ExprMgr.hpp"
#include "../expr/SymxOps.hpp"
#include "../expr/ExprTypes.hpp"
#include "../utils/LogManager.hpp"

#include "DMapLowering.hpp"

namespace SYMX {
    namespace Maps {

        using namespace Exprs;

        namespace Detail {

            class DMapTypeFinder : public ExpressionVisitorBase
            {
            private:
                unordered_set<const ExpressionBase*> Visited;

            public:
                bool Found;

                DMapTypeFinder()
                    : ExpressionVisitorBase("DMapTypeFinder"), Found(false)
                {
                    // Nothing here
                }

                virtual ~DMapTypeFinder()
                {
                    // Nothing here
                }

                virtual void VisitConstExpression(const ConstExpression* Exp) override
                {
                    Found = Found || Exp->GetType()->ContainsDMap();
                }

                virtual void VisitVarExpression(const VarExpression* Exp) override
                {
                    Found = Found || Exp->GetType()->ContainsDMap();
                }

                virtual void VisitOpExpression(const OpExpression* Exp) override
                {
                    if (Found || !Visited.insert(Exp).second) {
                        return;
                    }
                    Found = Exp->GetType()->ContainsDMap();
                    ExpressionVisitorBase::VisitOpExpression(Exp);
                }
            };

        } /* end namespace Detail */

        DMapLowering::DMapLowering()
        {
            // Nothing here
        }

        DMapLowering::~DMapLowering()
        {
            // Nothing here
        }

        bool DMapLowering::IsMapFree(const ExpT& Exp)
        {
            Detail::DMapTypeFinder TheFinder;
            Exp->Accept(&TheFinder);
            return !TheFinder.Found;
        }

        string DMapLowering::MakePerKeyVarName(const string& MapVarName, const ValueRef& Key)
        {
            return MapVarName + "!dmap!" + Key->ToString();
        }

        const KeyUniverseMapT& DMapLowering::GetUniverses() const
        {
            return Universes;
        }

        const KeyUniverseT& DMapLowering::GetUniverse(const TypeRef& DMapType)
        {
            FrozenTypes.insert(DMapType.GetPtr_());
            return Universes[DMapType.GetPtr_()];
        }

        u32 DMapLowering::GetKeyIndex(const TypeRef& DMapType, const ValueRef& Key)
        {
            auto const& Universe = GetUniverse(DMapType);
            auto it = Universe.find(Key);
            if (it == Universe.end()) {
                throw InternalError((string)"Key " + Key->ToString() + " missing from the " +
                                    "universe of " + DMapType->ToString() +
                                    "\nAt: " + __FILE__ + ":" + to_string(__LINE__));
            }
            return (u32)distance(Universe.begin(), it);
        }

        const vector<ExpT>& DMapLowering::GetPerKeyVars(const ExpT& MapVar)
        {
            auto it = PerKeyVars.find(MapVar.GetPtr_());
            if (it != PerKeyVars.end()) {
                return it->second;
            }

            auto& Mgr = ExprMgr::Instance();
            auto const& MapTypeRef = MapVar->GetType();
            auto const& ValueType = MapTypeRef->SAs<DMapType>()->GetValueType();
            auto const& VarName = MapVar->SAs<VarExpression>()->GetVarName();

            vector<ExpT> Vars;
            for (auto const& Key : GetUniverse(MapTypeRef)) {
                Vars.push_back(Mgr.MakeVar(MakePerKeyVarName(VarName, Key), ValueType));
            }
            return (PerKeyVars[MapVar.GetPtr_()] = Vars);
        }

        const vector<ExpT>& DMapLowering::Flatten(const ExpT& Exp)
        {
            auto it = Flattened.find(Exp.GetPtr_());
            if (it != Flattened.end()) {
                return it->second;
            }

            auto& Mgr = ExprMgr::Instance();
            auto const& MapTypeRef = Exp->GetType();
            auto const& Universe = GetUniverse(MapTypeRef);
            const u32 NumKeys = Universe.size();
            vector<ExpT> Entries;

            auto ExpAsConst = Exp->As<ConstExpression>();
            auto ExpAsVar = Exp->As<VarExpression>();
            auto ExpAsOp = Exp->As<OpExpression>();

            if (ExpAsConst != nullptr) {
                auto MapValue = ExpAsConst->GetConstValue()->SAs<DMapValue>();
                for (auto const& Key : Universe) {
                    Entries.push_back(Mgr.MakeVal(MapValue->Get(Key)));
                }
            } else if (ExpAsVar != nullptr) {
                Entries = GetPerKeyVars(Exp);
            } else if (ExpAsOp != nullptr && ExpAsOp->GetOpCode() == SymxOps::OpITE) {
                auto const& Children = ExpAsOp->GetChildren();
                auto Cond = LowerExp(Children[0]);
                auto const& Then = Flatten(Children[1]);
                auto const& Else = Flatten(Children[2]);
                for (u32 i = 0; i < NumKeys; ++i) {
                    Entries.push_back(Mgr.MakeExpr(SymxOps::OpITE, Cond, Then[i], Else[i]));
                }
            } else if (ExpAsOp != nullptr && ExpAsOp->GetOpCode() == SymxOps::OpDMAPSET) {
                auto const& Children = ExpAsOp->GetChildren();
                auto const& Base = Flatten(Children[0]);
                auto NewValue = LowerExp(Children[2]);
                // The key comparisons are between constants, the
                // conditionals fold away on construction
                u32 i = 0;
                for (auto const& Key : Universe) {
                    auto KeyMatches = Mgr.MakeExpr(SymxOps::OpEQ, Mgr.MakeVal(Key), Children[1]);
                    Entries.push_back(Mgr.MakeExpr(SymxOps::OpITE, KeyMatches,
                                                   NewValue, Base[i]));
                    ++i;
                }
            } else {
                throw CapabilityError((string)"Cannot lower default-valued map expression:\n" +
                                      Exp->ToString());
            }

            SYMX_LOG_FULL(MapLoweringDetailed,
                          Out_ << "Flattened " << Exp->ToString() << " into "
                               << Entries.size() << " per-key entries" << endl;
                          );

            return (Flattened[Exp.GetPtr_()] = Entries);
        }

        ExpT DMapLowering::LowerExp(const ExpT& Exp)
        {
            auto it = Lowered.find(Exp.GetPtr_());
            if (it != Lowered.end()) {
                return it->second;
            }

            auto ExpAsOp = Exp->As<OpExpression>();
            if (ExpAsOp == nullptr) {
                if (Exp->GetType()->Is<DMapType>()) {
                    throw InternalError((string)"Map typed leaf reached outside of flattening: " +
                                        Exp->ToString() + "\nAt: " + __FILE__ + ":" +
                                        to_string(__LINE__));
                }
                return Exp;
            }

            auto& Mgr = ExprMgr::Instance();
            auto const& Children = ExpAsOp->GetChildren();
            auto OpCode = ExpAsOp->GetOpCode();
            ExpT Retval = ExpT::NullPtr;

            if (OpCode == SymxOps::OpDMAPGET) {
                auto const& Entries = Flatten(Children[0]);
                auto Key = Children[1]->SAs<ConstExpression>()->GetConstValue();
                Retval = Entries[GetKeyIndex(Children[0]->GetType(), Key)];
            } else if (OpCode == SymxOps::OpDMAPCOUNT) {
                auto const& Entries = Flatten(Children[0]);
                auto const& Default =
                    Children[0]->GetType()->SAs<DMapType>()->GetValueType()->GetDefaultValue();
                auto DefaultExp = Mgr.MakeVal(Default);
                auto One = Mgr.MakeInt32(1);
                auto Zero = Mgr.MakeInt32(0);
                Retval = Zero;
                for (auto const& Entry : Entries) {
                    auto IsDefault = Mgr.MakeExpr(SymxOps::OpEQ, Entry, DefaultExp);
                    auto Indicator = Mgr.MakeExpr(SymxOps::OpITE, IsDefault, Zero, One);
                    Retval = (Retval == Zero ? Indicator :
                              Mgr.MakeExpr(SymxOps::OpADD, Retval, Indicator));
                }
            } else if (OpCode == SymxOps::OpEQ && Children[0]->GetType()->Is<DMapType>()) {
                auto const& Entries1 = Flatten(Children[0]);
                auto const& Entries2 = Flatten(Children[1]);
                vector<ExpT> Conjuncts;
                const u32 NumKeys = Entries1.size();
                for (u32 i = 0; i < NumKeys; ++i) {
                    Conjuncts.push_back(Mgr.MakeExpr(SymxOps::OpEQ, Entries1[i], Entries2[i]));
                }
                Retval = Mgr.MakeExpr(SymxOps::OpAND, Conjuncts);
            } else if (Exp->GetType()->Is<DMapType>()) {
                throw InternalError((string)"Map typed operator reached outside of " +
                                    "flattening: " + Exp->ToString() + "\nAt: " + __FILE__ +
                                    ":" + to_string(__LINE__));
            } else {
                vector<ExpT> NewChildren;
                bool Changed = false;
                for (auto const& Child : Children) {
                    NewChildren.push_back(LowerExp(Child));
                    Changed = Changed || (NewChildren.back() != Child);
                }
                Retval = (Changed ? Mgr.MakeOpLike(ExpAsOp, NewChildren) : Exp);
            }

            Lowered[Exp.GetPtr_()] = Retval;
            return Retval;
        }

        ExpT DMapLowering::Do(const ExpT& Exp)
        {
            if (IsMapFree(Exp)) {
                return Exp;
            }

            DMapCapabilityChecker::Do(Exp);

            KeyUniverseMapT NewUniverses = Universes;
            DMapKeyCollector::Do(Exp, NewUniverses);
            for (auto const& TypeUniverse : NewUniverses) {
                if (FrozenTypes.find(TypeUniverse.first) == FrozenTypes.end()) {
                    continue;
                }
                if (TypeUniverse.second.size() != Universes[TypeUniverse.first].size()) {
                    throw CapabilityError((string)"The key universe of " +
                                          TypeUniverse.first->ToString() +
                                          " grew after it was used in an earlier assertion" +
                                          " of the same session; assert all default-valued" +
                                          " map constraints together");
                }
            }
            Universes = NewUniverses;

            auto Retval = LowerExp(Exp);

            SYMX_LOG_FULL(MapLoweringDetailed,
                          Out_ << "Lowered:" << endl << Exp->ToString() << endl
                               << "To:" << endl << Retval->ToString() << endl;
                          );
            return Retval;
        }

        ValueRef DMapLowering::RaiseMapVar(const ExpT& MapVar,
                                           const function<ValueRef(const ExpT&)>& GetModelValue)
        {
            auto& Mgr = ExprMgr::Instance();
            auto const& MapTypeRef = MapVar->GetType();
            if (PerKeyVars.find(MapVar.GetPtr_()) == PerKeyVars.end()) {
                return MapTypeRef->GetDefaultValue();
            }

            auto const& Vars = PerKeyVars[MapVar.GetPtr_()];
            auto const& Universe = Universes[MapTypeRef.GetPtr_()];
            auto const& Default = MapTypeRef->SAs<DMapType>()->GetValueType()->GetDefaultValue();

            OverrideListT Overrides;
            u32 i = 0;
            for (auto const& Key : Universe) {
                auto Value = GetModelValue(Vars[i]);
                if (!Value->Equals(*Default)) {
                    Overrides.push_back(make_pair(Key, Value));
                }
                ++i;
            }
            return Mgr.MakeDMapValue(MapTypeRef, Overrides);
        }

    } /* end namespace Maps */
} /* end namespace SYMX */

//
// DMapLowering.cpp ends here
