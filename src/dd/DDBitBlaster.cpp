// DDBitBlaster.cpp ---
//
// Filename: DDBitBlaster.cpp
// Author: Abhishek Udupa
// Created: Fri Jun 19 07:44:00 2015 (-0500)
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

#include "../expr/ExprMgr.hpp"
#include "../expr/SymxOps.hpp"

#include "DDBitBlaster.hpp"

namespace SYMX {
    namespace DD {

        using namespace Exprs;

        namespace Detail {

            // Collects the key operands of map operations
            class MapKeyGatherer : public ExpressionVisitorBase
            {
            private:
                unordered_set<const ExpressionBase*> Visited;

            public:
                vector<ExpT> Keys;

                MapKeyGatherer()
                    : ExpressionVisitorBase("MapKeyGatherer")
                {
                    // Nothing here
                }

                virtual ~MapKeyGatherer()
                {
                    // Nothing here
                }

                virtual void VisitOpExpression(const OpExpression* Exp) override
                {
                    if (!Visited.insert(Exp).second) {
                        return;
                    }
                    auto OpCode = Exp->GetOpCode();
                    if (OpCode == SymxOps::OpMAPGET || OpCode == SymxOps::OpMAPSET ||
                        OpCode == SymxOps::OpMAPDELETE) {
                        Keys.push_back(Exp->GetChildren()[1]);
                    }
                    ExpressionVisitorBase::VisitOpExpression(Exp);
                }
            };

        } /* end namespace Detail */

        DDBitBlaster::DDBitBlaster(DDManager& Mgr)
            : ExpressionVisitorBase("DDBitBlaster"), Mgr(Mgr)
        {
            // Nothing here
        }

        DDBitBlaster::~DDBitBlaster()
        {
            // Nothing here
        }

        u32 DDBitBlaster::GetNumBits(const TypeRef& Type)
        {
            switch (Type->GetKind()) {
            case TypeKindT::Boolean:
                return 1;
            case TypeKindT::Integer:
                return Type->SAs<IntegerType>()->GetWidth();
            case TypeKindT::Option:
                return 1 + GetNumBits(Type->SAs<OptionType>()->GetInnerType());
            case TypeKindT::Record: {
                u32 Retval = 0;
                for (auto const& Field : Type->SAs<RecordType>()->GetFields()) {
                    Retval += GetNumBits(Field.second);
                }
                return Retval;
            }
            case TypeKindT::Map: {
                auto TypeAsMap = Type->SAs<MapType>();
                return (GetDomainSize(TypeAsMap->GetKeyType()) *
                        (1 + GetNumBits(TypeAsMap->GetValueType())));
            }
            default:
                throw InternalError((string)"Type " + Type->ToString() +
                                    " has no finite bit layout" +
                                    "\nAt: " + __FILE__ + ":" + to_string(__LINE__));
            }
        }

        u32 DDBitBlaster::GetDomainSize(const TypeRef& KeyType)
        {
            if (KeyType->Is<BooleanType>()) {
                return 2;
            }
            return (1u << KeyType->SAs<IntegerType>()->GetWidth());
        }

        ValueRef DDBitBlaster::GetDomainKey(const TypeRef& KeyType, u32 KeyIndex)
        {
            auto& ExpMgr = ExprMgr::Instance();
            if (KeyType->Is<BooleanType>()) {
                return ExpMgr.MakeBoolValue(KeyIndex != 0);
            }
            return new IntValue(KeyType, KeyIndex);
        }

        BitsT DDBitBlaster::MakeAdd(const BitsT& A, const BitsT& B, bool Subtract)
        {
            // A - B is A + ~B + 1
            const u32 Width = A.size();
            BitsT Retval(Width);
            auto Carry = Mgr.MakeConst(Subtract);
            for (u32 i = 0; i < Width; ++i) {
                auto BBit = (Subtract ? Mgr.MakeNot(B[i]) : B[i]);
                auto HalfSum = Mgr.MakeXor(A[i], BBit);
                Retval[i] = Mgr.MakeXor(HalfSum, Carry);
                Carry = Mgr.MakeOr(Mgr.MakeAnd(A[i], BBit), Mgr.MakeAnd(Carry, HalfSum));
            }
            return Retval;
        }

        BitsT DDBitBlaster::MakeMul(const BitsT& A, const BitsT& B)
        {
            const u32 Width = A.size();
            BitsT Retval(Width, DDManager::FalseNode);
            for (u32 i = 0; i < Width; ++i) {
                BitsT Partial(Width, DDManager::FalseNode);
                for (u32 j = i; j < Width; ++j) {
                    Partial[j] = Mgr.MakeAnd(A[j - i], B[i]);
                }
                Retval = MakeAdd(Retval, Partial, false);
            }
            return Retval;
        }

        DDNodeRef DDBitBlaster::MakeLT(const BitsT& A, const BitsT& B, bool OrEqual, bool Signed)
        {
            const u32 Width = A.size();
            auto Retval = Mgr.MakeConst(OrEqual);
            for (u32 i = 0; i < Width; ++i) {
                auto ABit = A[i];
                auto BBit = B[i];
                // Signed order is the unsigned order with the sign bits flipped
                if (Signed && i == Width - 1) {
                    ABit = Mgr.MakeNot(ABit);
                    BBit = Mgr.MakeNot(BBit);
                }
                auto BitLT = Mgr.MakeAnd(Mgr.MakeNot(ABit), BBit);
                Retval = Mgr.MakeOr(BitLT, Mgr.MakeAnd(Mgr.MakeIff(ABit, BBit), Retval));
            }
            return Retval;
        }

        BitsT DDBitBlaster::MakeMux(DDNodeRef Cond, const BitsT& Then, const BitsT& Else)
        {
            const u32 Width = Then.size();
            BitsT Retval(Width);
            for (u32 i = 0; i < Width; ++i) {
                Retval[i] = Mgr.ITE(Cond, Then[i], Else[i]);
            }
            return Retval;
        }

        DDNodeRef DDBitBlaster::MakeOptionEQ(const TypeRef& InnerType, const BitsT& A,
                                             const BitsT& B, u32 Offset)
        {
            auto InnerEQ = MakeEQ(InnerType, A, B, Offset + 1);
            return Mgr.MakeAnd(Mgr.MakeIff(A[Offset], B[Offset]),
                               Mgr.MakeImplies(A[Offset], InnerEQ));
        }

        DDNodeRef DDBitBlaster::MakeEQ(const TypeRef& Type, const BitsT& A,
                                       const BitsT& B, u32 Offset)
        {
            switch (Type->GetKind()) {
            case TypeKindT::Boolean:
            case TypeKindT::Integer: {
                auto Retval = Mgr.MakeConst(true);
                const u32 Width = GetNumBits(Type);
                for (u32 i = Offset; i < Offset + Width; ++i) {
                    Retval = Mgr.MakeAnd(Retval, Mgr.MakeIff(A[i], B[i]));
                }
                return Retval;
            }

            case TypeKindT::Option:
                return MakeOptionEQ(Type->SAs<OptionType>()->GetInnerType(), A, B, Offset);

            case TypeKindT::Record: {
                auto Retval = Mgr.MakeConst(true);
                for (auto const& Field : Type->SAs<RecordType>()->GetFields()) {
                    Retval = Mgr.MakeAnd(Retval, MakeEQ(Field.second, A, B, Offset));
                    Offset += GetNumBits(Field.second);
                }
                return Retval;
            }

            case TypeKindT::Map: {
                auto TypeAsMap = Type->SAs<MapType>();
                auto const& ValueType = TypeAsMap->GetValueType();
                const u32 EntryWidth = 1 + GetNumBits(ValueType);
                const u32 DomainSize = GetDomainSize(TypeAsMap->GetKeyType());
                auto Retval = Mgr.MakeConst(true);
                for (u32 i = 0; i < DomainSize; ++i) {
                    Retval = Mgr.MakeAnd(Retval, MakeOptionEQ(ValueType, A, B,
                                                              Offset + i * EntryWidth));
                }
                return Retval;
            }

            default:
                throw InternalError((string)"Cannot compare values of type " + Type->ToString() +
                                    " with decision diagrams" +
                                    "\nAt: " + __FILE__ + ":" + to_string(__LINE__));
            }
        }

        DDNodeRef DDBitBlaster::MakeKeyIs(const BitsT& KeyBits, u32 KeyIndex)
        {
            auto Retval = Mgr.MakeConst(true);
            for (u32 i = 0; i < KeyBits.size(); ++i) {
                auto Bit = ((KeyIndex >> i) & 1) != 0;
                Retval = Mgr.MakeAnd(Retval, (Bit ? KeyBits[i] : Mgr.MakeNot(KeyBits[i])));
            }
            return Retval;
        }

        void DDBitBlaster::BlastValue(const ValueRef& Value, BitsT& Out)
        {
            auto const& Type = Value->GetType();
            switch (Type->GetKind()) {
            case TypeKindT::Boolean:
                Out.push_back(Mgr.MakeConst(Value->SAs<BoolValue>()->GetValue()));
                return;

            case TypeKindT::Integer: {
                auto Bits = Value->SAs<IntValue>()->GetBits();
                const u32 Width = Type->SAs<IntegerType>()->GetWidth();
                for (u32 i = 0; i < Width; ++i) {
                    Out.push_back(Mgr.MakeConst(((Bits >> i) & 1) != 0));
                }
                return;
            }

            case TypeKindT::Option: {
                auto ValueAsOpt = Value->SAs<OptionValue>();
                Out.push_back(Mgr.MakeConst(ValueAsOpt->IsSome()));
                if (ValueAsOpt->IsSome()) {
                    BlastValue(ValueAsOpt->GetInner(), Out);
                } else {
                    BlastValue(Type->SAs<OptionType>()->GetInnerType()->GetDefaultValue(), Out);
                }
                return;
            }

            case TypeKindT::Record:
                for (auto const& FieldValue : Value->SAs<RecordValue>()->GetFieldValues()) {
                    BlastValue(FieldValue, Out);
                }
                return;

            case TypeKindT::Map: {
                auto TypeAsMap = Type->SAs<MapType>();
                auto const& KeyType = TypeAsMap->GetKeyType();
                auto const& ValueDefault = TypeAsMap->GetValueType()->GetDefaultValue();
                auto ValueAsMap = Value->SAs<MapValue>();
                const u32 DomainSize = GetDomainSize(KeyType);
                for (u32 i = 0; i < DomainSize; ++i) {
                    auto Entry = ValueAsMap->Find(GetDomainKey(KeyType, i));
                    Out.push_back(Mgr.MakeConst(!Entry.IsNull_()));
                    BlastValue((Entry.IsNull_() ? ValueDefault : Entry), Out);
                }
                return;
            }

            default:
                throw CapabilityError((string)"The decision diagram backend cannot encode " +
                                      "the value " + Value->ToString());
            }
        }

        BitsT DDBitBlaster::BlastValue(const ValueRef& Value)
        {
            BitsT Retval;
            BlastValue(Value, Retval);
            return Retval;
        }

        BitsT DDBitBlaster::BlastOp(const OpExpression* Exp, const vector<BitsT>& Args)
        {
            auto const& Children = Exp->GetChildren();
            auto const& Type = Exp->GetType();

            switch (Exp->GetOpCode()) {
            case SymxOps::OpAND: {
                auto Retval = Mgr.MakeConst(true);
                for (auto const& Arg : Args) {
                    Retval = Mgr.MakeAnd(Retval, Arg[0]);
                }
                return BitsT(1, Retval);
            }

            case SymxOps::OpOR: {
                auto Retval = Mgr.MakeConst(false);
                for (auto const& Arg : Args) {
                    Retval = Mgr.MakeOr(Retval, Arg[0]);
                }
                return BitsT(1, Retval);
            }

            case SymxOps::OpNOT:
                return BitsT(1, Mgr.MakeNot(Args[0][0]));
            case SymxOps::OpIMPLIES:
                return BitsT(1, Mgr.MakeImplies(Args[0][0], Args[1][0]));
            case SymxOps::OpITE:
                return MakeMux(Args[0][0], Args[1], Args[2]);
            case SymxOps::OpEQ:
                return BitsT(1, MakeEQ(Children[0]->GetType(), Args[0], Args[1], 0));

            case SymxOps::OpADD:
                return MakeAdd(Args[0], Args[1], false);
            case SymxOps::OpSUB:
                return MakeAdd(Args[0], Args[1], true);
            case SymxOps::OpMUL:
                return MakeMul(Args[0], Args[1]);

            case SymxOps::OpLT:
            case SymxOps::OpLE:
            case SymxOps::OpGT:
            case SymxOps::OpGE: {
                auto OpCode = Exp->GetOpCode();
                auto Signed = Children[0]->GetType()->SAs<IntegerType>()->IsSigned();
                auto OrEqual = (OpCode == SymxOps::OpLE || OpCode == SymxOps::OpGE);
                if (OpCode == SymxOps::OpLT || OpCode == SymxOps::OpLE) {
                    return BitsT(1, MakeLT(Args[0], Args[1], OrEqual, Signed));
                }
                return BitsT(1, MakeLT(Args[1], Args[0], OrEqual, Signed));
            }

            case SymxOps::OpBVAND:
            case SymxOps::OpBVOR:
            case SymxOps::OpBVXOR: {
                auto OpCode = Exp->GetOpCode();
                BitsT Retval(Args[0].size());
                for (u32 i = 0; i < Retval.size(); ++i) {
                    if (OpCode == SymxOps::OpBVAND) {
                        Retval[i] = Mgr.MakeAnd(Args[0][i], Args[1][i]);
                    } else if (OpCode == SymxOps::OpBVOR) {
                        Retval[i] = Mgr.MakeOr(Args[0][i], Args[1][i]);
                    } else {
                        Retval[i] = Mgr.MakeXor(Args[0][i], Args[1][i]);
                    }
                }
                return Retval;
            }

            case SymxOps::OpBVNOT: {
                BitsT Retval(Args[0].size());
                for (u32 i = 0; i < Retval.size(); ++i) {
                    Retval[i] = Mgr.MakeNot(Args[0][i]);
                }
                return Retval;
            }

            case SymxOps::OpCAST: {
                // Truncate, or extend by the signedness of the source
                auto SourceType = Children[0]->GetType()->SAs<IntegerType>();
                const u32 TargetWidth = Type->SAs<IntegerType>()->GetWidth();
                auto const& Source = Args[0];
                auto Fill = (SourceType->IsSigned() ? Source.back() : DDManager::FalseNode);
                BitsT Retval(TargetWidth, Fill);
                for (u32 i = 0; i < TargetWidth && i < Source.size(); ++i) {
                    Retval[i] = Source[i];
                }
                return Retval;
            }

            case SymxOps::OpMKRECORD: {
                BitsT Retval;
                for (auto const& Arg : Args) {
                    Retval.insert(Retval.end(), Arg.begin(), Arg.end());
                }
                return Retval;
            }

            case SymxOps::OpPROJECT:
            case SymxOps::OpWITHFIELD: {
                auto RecType = Children[0]->GetType()->SAs<RecordType>();
                auto const& Fields = RecType->GetFields();
                auto Index = RecType->GetFieldIndex(Exp->GetPayload());
                u32 Offset = 0;
                for (i32 i = 0; i < Index; ++i) {
                    Offset += GetNumBits(Fields[i].second);
                }
                const u32 Width = GetNumBits(Fields[Index].second);
                if (Exp->GetOpCode() == SymxOps::OpPROJECT) {
                    return BitsT(Args[0].begin() + Offset, Args[0].begin() + Offset + Width);
                }
                BitsT Retval = Args[0];
                copy(Args[1].begin(), Args[1].end(), Retval.begin() + Offset);
                return Retval;
            }

            case SymxOps::OpOPTSOME: {
                BitsT Retval(1, DDManager::TrueNode);
                Retval.insert(Retval.end(), Args[0].begin(), Args[0].end());
                return Retval;
            }

            case SymxOps::OpOPTISSOME:
                return BitsT(1, Args[0][0]);

            case SymxOps::OpOPTVALUE: {
                BitsT Inner(Args[0].begin() + 1, Args[0].end());
                return MakeMux(Args[0][0], Inner, BlastValue(Type->GetDefaultValue()));
            }

            case SymxOps::OpMAPGET:
            case SymxOps::OpMAPSET:
            case SymxOps::OpMAPDELETE: {
                auto TypeAsMap = Children[0]->GetType()->SAs<MapType>();
                auto const& ValueType = TypeAsMap->GetValueType();
                const u32 EntryWidth = 1 + GetNumBits(ValueType);
                const u32 DomainSize = GetDomainSize(TypeAsMap->GetKeyType());
                auto const& MapBits = Args[0];
                auto const& KeyBits = Args[1];
                auto GetEntry = [&] (u32 KeyIndex) -> BitsT
                    {
                        auto Start = MapBits.begin() + KeyIndex * EntryWidth;
                        return BitsT(Start, Start + EntryWidth);
                    };

                BitsT KeyMatches(DomainSize);
                for (u32 i = 0; i < DomainSize; ++i) {
                    KeyMatches[i] = MakeKeyIs(KeyBits, i);
                }

                if (Exp->GetOpCode() == SymxOps::OpMAPGET) {
                    // Exactly one key matches
                    BitsT Retval(EntryWidth, DDManager::FalseNode);
                    for (u32 i = 0; i < DomainSize; ++i) {
                        auto Entry = GetEntry(i);
                        for (u32 j = 0; j < EntryWidth; ++j) {
                            Retval[j] = Mgr.MakeOr(Retval[j], Mgr.MakeAnd(KeyMatches[i], Entry[j]));
                        }
                    }
                    return Retval;
                }

                BitsT NewEntry;
                if (Exp->GetOpCode() == SymxOps::OpMAPSET) {
                    NewEntry.push_back(DDManager::TrueNode);
                    NewEntry.insert(NewEntry.end(), Args[2].begin(), Args[2].end());
                } else {
                    NewEntry.push_back(DDManager::FalseNode);
                    BlastValue(ValueType->GetDefaultValue(), NewEntry);
                }

                BitsT Retval;
                Retval.reserve(MapBits.size());
                for (u32 i = 0; i < DomainSize; ++i) {
                    auto Entry = MakeMux(KeyMatches[i], NewEntry, GetEntry(i));
                    Retval.insert(Retval.end(), Entry.begin(), Entry.end());
                }
                return Retval;
            }

            default:
                throw CapabilityError((string)"The decision diagram backend cannot encode " +
                                      "operation " + SymxOps::OpToString(Exp->GetOpCode()));
            }
        }

        void DDBitBlaster::VisitConstExpression(const ConstExpression* Exp)
        {
            BitStack.push_back(BlastValue(Exp->GetConstValue()));
        }

        const BitsT& DDBitBlaster::AllocateVar(const ExpT& Var)
        {
            auto it = Blasted.find(Var);
            if (it != Blasted.end()) {
                return it->second;
            }

            const u32 NumBits = GetNumBits(Var->GetType());
            vector<u32> Indices(NumBits);
            BitsT Bits(NumBits);
            for (u32 i = 0; i < NumBits; ++i) {
                Indices[i] = Mgr.NewVar();
                Bits[i] = Mgr.MakeVarNode(Indices[i]);
            }
            VarIndices[Var] = Indices;
            return (Blasted[Var] = Bits);
        }

        void DDBitBlaster::VisitVarExpression(const VarExpression* Exp)
        {
            BitStack.push_back(AllocateVar(Exp));
        }

        void DDBitBlaster::VisitOpExpression(const OpExpression* Exp)
        {
            ExpT TheExp = Exp;
            auto it = Blasted.find(TheExp);
            if (it != Blasted.end()) {
                BitStack.push_back(it->second);
                return;
            }

            ExpressionVisitorBase::VisitOpExpression(Exp);
            const u32 NumChildren = Exp->GetChildren().size();
            vector<BitsT> Args(BitStack.end() - NumChildren, BitStack.end());
            BitStack.resize(BitStack.size() - NumChildren);

            auto Retval = BlastOp(Exp, Args);
            Blasted[TheExp] = Retval;
            BitStack.push_back(Retval);
        }

        BitsT DDBitBlaster::Blast(const ExpT& Exp)
        {
            // Variables that select map entries are ordered above the
            // entries. Below them, a lookup with a symbolic key would
            // need a node for every combination of entry bits.
            Detail::MapKeyGatherer Gatherer;
            Exp->Accept(&Gatherer);
            if (!Gatherer.Keys.empty()) {
                for (auto const& Var : VarGatherer::Do(Gatherer.Keys)) {
                    AllocateVar(Var);
                }
            }

            BitStack.clear();
            Exp->Accept(this);
            if (BitStack.size() != 1) {
                throw InternalError((string)"Bit blasting left " + to_string(BitStack.size()) +
                                    " results on the stack" +
                                    "\nAt: " + __FILE__ + ":" + to_string(__LINE__));
            }
            auto Retval = BitStack.back();
            BitStack.clear();
            return Retval;
        }

        const vector<u32>* DDBitBlaster::GetVarIndices(const ExpT& Var) const
        {
            auto it = VarIndices.find(Var);
            if (it == VarIndices.end()) {
                return nullptr;
            }
            return &(it->second);
        }

        ValueRef DDBitBlaster::RaiseBits(const TypeRef& Type, const vector<bool>& Bits, u32& Offset)
        {
            auto& ExpMgr = ExprMgr::Instance();

            switch (Type->GetKind()) {
            case TypeKindT::Boolean:
                return ExpMgr.MakeBoolValue(Bits[Offset++]);

            case TypeKindT::Integer: {
                const u32 Width = Type->SAs<IntegerType>()->GetWidth();
                u64 Value = 0;
                for (u32 i = 0; i < Width; ++i) {
                    if (Bits[Offset + i]) {
                        Value |= ((u64)1 << i);
                    }
                }
                Offset += Width;
                return new IntValue(Type, Value);
            }

            case TypeKindT::Option: {
                auto const& InnerType = Type->SAs<OptionType>()->GetInnerType();
                auto IsSome = Bits[Offset++];
                auto Inner = RaiseBits(InnerType, Bits, Offset);
                if (!IsSome) {
                    return ExpMgr.MakeNoneValue(InnerType);
                }
                return ExpMgr.MakeSomeValue(Inner);
            }

            case TypeKindT::Record: {
                vector<ValueRef> FieldValues;
                for (auto const& Field : Type->SAs<RecordType>()->GetFields()) {
                    FieldValues.push_back(RaiseBits(Field.second, Bits, Offset));
                }
                return ExpMgr.MakeRecordValue(Type, FieldValues);
            }

            case TypeKindT::Map: {
                auto TypeAsMap = Type->SAs<MapType>();
                auto const& KeyType = TypeAsMap->GetKeyType();
                auto const& ValueType = TypeAsMap->GetValueType();
                const u32 DomainSize = GetDomainSize(KeyType);
                ValueMapT Entries;
                for (u32 i = 0; i < DomainSize; ++i) {
                    auto IsSome = Bits[Offset++];
                    auto Value = RaiseBits(ValueType, Bits, Offset);
                    if (IsSome) {
                        Entries[GetDomainKey(KeyType, i)] = Value;
                    }
                }
                return ExpMgr.MakeMapValue(Type, Entries);
            }

            default:
                throw InternalError((string)"Cannot raise a value of type " + Type->ToString() +
                                    " from decision diagram bits" +
                                    "\nAt: " + __FILE__ + ":" + to_string(__LINE__));
            }
        }

        ValueRef DDBitBlaster::Raise(const TypeRef& Type, const vector<bool>& Bits)
        {
            if (Bits.size() != GetNumBits(Type)) {
                throw InternalError((string)"Expected " + to_string(GetNumBits(Type)) +
                                    " bits for a value of type " + Type->ToString() +
                                    ", got " + to_string(Bits.size()) +
                                    "\nAt: " + __FILE__ + ":" + to_string(__LINE__));
            }
            u32 Offset = 0;
            return RaiseBits(Type, Bits, Offset);
        }

    } /* end namespace DD */
} /* end namespace SYMX */

//
// DDBitBlaster.cpp ends here
