// ExprMgr.cpp ---
//
// Filename: ExprMgr.cpp
// Author: Abhishek Udupa
// Created: Tue Apr 28 00:46:00 2015 (-0500)
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

#include "../utils/UnicodeUtils.hpp"
#include "../regex/RegexMgr.hpp"
#include "../interp/ValueOps.hpp"

#include "ExprMgr.hpp"

namespace SYMX {
    namespace Exprs {

        namespace Detail {

            static inline bool IsFixedInt(const TypeRef& Type)
            {
                return Type->Is<IntegerType>();
            }

            static inline bool IsNumeric(const TypeRef& Type)
            {
                return (Type->Is<IntegerType>() || Type->Is<BigIntType>());
            }

            static inline const SeqType* GetSeqType(const ExpT& Exp)
            {
                return Exp->GetType()->As<SeqType>();
            }

            static inline bool IsConstTrue(const ExpT& Exp)
            {
                auto AsConst = Exp->As<ConstExpression>();
                return (AsConst != nullptr &&
                        AsConst->GetConstValue()->Is<BoolValue>() &&
                        AsConst->GetConstValue()->SAs<BoolValue>()->GetValue());
            }

            static inline bool IsConstFalse(const ExpT& Exp)
            {
                auto AsConst = Exp->As<ConstExpression>();
                return (AsConst != nullptr &&
                        AsConst->GetConstValue()->Is<BoolValue>() &&
                        !AsConst->GetConstValue()->SAs<BoolValue>()->GetValue());
            }

            static inline const OpExpression* AsOp(const ExpT& Exp, i64 OpCode)
            {
                auto AsOpExp = Exp->As<OpExpression>();
                if (AsOpExp == nullptr || AsOpExp->GetOpCode() != OpCode) {
                    return nullptr;
                }
                return AsOpExp;
            }

        } /* end namespace Detail */

        ExprMgr::ExprMgr()
            : FreshVarCounter((u64)0)
        {
            BoolType = MakeType<BooleanType>();
            BigIntType = MakeType<Exprs::BigIntType>();
            CharType = MakeType<Exprs::CharType>();
            StringType = MakeType<SeqType>(CharType);
            Int32Type = MakeType<IntegerType>(32u, true);

            TrueExp = Intern(new ConstExpression(new BoolValue(BoolType, true)));
            FalseExp = Intern(new ConstExpression(new BoolValue(BoolType, false)));
        }

        ExprMgr::~ExprMgr()
        {
            // Nothing here
        }

        ExprMgr& ExprMgr::Instance()
        {
            static ExprMgr TheManager;
            return TheManager;
        }

        const TypeRef& ExprMgr::GetBoolType() const
        {
            return BoolType;
        }

        const TypeRef& ExprMgr::GetBigIntType() const
        {
            return BigIntType;
        }

        const TypeRef& ExprMgr::GetCharType() const
        {
            return CharType;
        }

        const TypeRef& ExprMgr::GetStringType() const
        {
            return StringType;
        }

        const TypeRef& ExprMgr::GetInt32Type() const
        {
            return Int32Type;
        }

        TypeRef ExprMgr::MakeIntType(u32 Width, bool Signed)
        {
            return MakeType<IntegerType>(Width, Signed);
        }

        TypeRef ExprMgr::MakeSeqType(const TypeRef& ElemType)
        {
            return MakeType<SeqType>(ElemType);
        }

        TypeRef ExprMgr::MakeOptionType(const TypeRef& InnerType)
        {
            return MakeType<OptionType>(InnerType);
        }

        TypeRef ExprMgr::MakeRecordType(const string& Name, const FieldListT& Fields)
        {
            return MakeType<RecordType>(Name, Fields);
        }

        TypeRef ExprMgr::MakeTupleType(const vector<TypeRef>& ElemTypes)
        {
            FieldListT Fields;
            for (u32 i = 0; i < ElemTypes.size(); ++i) {
                Fields.push_back(make_pair(RecordType::GetTupleFieldName(i), ElemTypes[i]));
            }
            return MakeType<RecordType>(RecordType::TupleName, Fields);
        }

        TypeRef ExprMgr::MakeMapType(const TypeRef& KeyType, const TypeRef& ValueType)
        {
            return MakeType<MapType>(KeyType, ValueType);
        }

        TypeRef ExprMgr::MakeDMapType(const TypeRef& KeyType, const TypeRef& ValueType)
        {
            return MakeType<DMapType>(KeyType, ValueType);
        }

        void ExprMgr::CheckValueType(const ValueRef& Value, const TypeRef& Type,
                                     const string& Context) const
        {
            if (Value.IsNull_()) {
                throw ExprTypeError((string)"Null value in " + Context);
            }
            if (Value->GetType() != Type) {
                throw ExprTypeError((string)"Expected a value of type " + Type->ToString() +
                                    " in " + Context + ", but got " + Value->ToString() +
                                    " of type " + Value->GetType()->ToString());
            }
        }

        // Values
        ValueRef ExprMgr::MakeBoolValue(bool Value)
        {
            return new BoolValue(BoolType, Value);
        }

        ValueRef ExprMgr::MakeIntValue(const TypeRef& IntType, i64 Value)
        {
            auto TypeAsInt = IntType->As<IntegerType>();
            if (TypeAsInt == nullptr) {
                throw ExprTypeError((string)"Integer literal of non integer type " +
                                    IntType->ToString());
            }
            bool InRange;
            if (TypeAsInt->IsSigned()) {
                InRange = (Value >= TypeAsInt->GetMinSigned() &&
                           Value <= TypeAsInt->GetMaxSigned());
            } else {
                InRange = (Value >= 0 && (u64)Value <= TypeAsInt->GetMaxUnsigned());
            }
            if (!InRange) {
                throw ExprTypeError((string)"Integer literal " + to_string(Value) +
                                    " is out of range for type " + IntType->ToString());
            }
            return new IntValue(IntType, (u64)Value);
        }

        ValueRef ExprMgr::MakeUIntValue(const TypeRef& IntType, u64 Value)
        {
            auto TypeAsInt = IntType->As<IntegerType>();
            if (TypeAsInt == nullptr) {
                throw ExprTypeError((string)"Integer literal of non integer type " +
                                    IntType->ToString());
            }
            u64 Max = (TypeAsInt->IsSigned() ? (u64)TypeAsInt->GetMaxSigned() :
                       TypeAsInt->GetMaxUnsigned());
            if (Value > Max) {
                throw ExprTypeError((string)"Integer literal " + to_string(Value) +
                                    " is out of range for type " + IntType->ToString());
            }
            return new IntValue(IntType, Value);
        }

        ValueRef ExprMgr::MakeBigIntValue(const BigIntT& Value)
        {
            return new BigIntValue(BigIntType, Value);
        }

        ValueRef ExprMgr::MakeCharValue(u32 CodePoint)
        {
            if (CodePoint > Exprs::CharType::MaxCodePoint) {
                throw ExprTypeError((string)"Code point " + to_string(CodePoint) +
                                    " is out of the supported range [0, " +
                                    to_string(Exprs::CharType::MaxCodePoint) + "]");
            }
            return new CharValue(CharType, CodePoint);
        }

        ValueRef ExprMgr::MakeStringValue(const string& UTF8String)
        {
            return MakeStringValue(UnicodeUtils::DecodeUTF8(UTF8String));
        }

        ValueRef ExprMgr::MakeStringValue(const vector<u32>& CodePoints)
        {
            vector<ValueRef> Chars;
            Chars.reserve(CodePoints.size());
            for (auto CodePoint : CodePoints) {
                Chars.push_back(MakeCharValue(CodePoint));
            }
            return new SeqValue(StringType, std::move(Chars));
        }

        ValueRef ExprMgr::MakeSeqValue(const TypeRef& ElemType, const vector<ValueRef>& Elems)
        {
            auto SeqTypeRef = MakeSeqType(ElemType);
            for (auto const& Elem : Elems) {
                CheckValueType(Elem, ElemType, "sequence literal");
            }
            return new SeqValue(SeqTypeRef, Elems);
        }

        ValueRef ExprMgr::MakeSomeValue(const ValueRef& Inner)
        {
            if (Inner.IsNull_()) {
                throw ExprTypeError("Null value in option literal");
            }
            return new OptionValue(MakeOptionType(Inner->GetType()), Inner);
        }

        ValueRef ExprMgr::MakeNoneValue(const TypeRef& InnerType)
        {
            return new OptionValue(MakeOptionType(InnerType), ValueRef::NullPtr);
        }

        ValueRef ExprMgr::MakeRecordValue(const TypeRef& RecType,
                                          const vector<ValueRef>& FieldValues)
        {
            auto TypeAsRec = RecType->As<RecordType>();
            if (TypeAsRec == nullptr) {
                throw ExprTypeError((string)"Record literal of non record type " +
                                    RecType->ToString());
            }
            auto const& Fields = TypeAsRec->GetFields();
            if (Fields.size() != FieldValues.size()) {
                throw ExprTypeError((string)"Record literal of type " + RecType->ToString() +
                                    " needs " + to_string(Fields.size()) + " field values, " +
                                    "but got " + to_string(FieldValues.size()));
            }
            for (u32 i = 0; i < Fields.size(); ++i) {
                CheckValueType(FieldValues[i], Fields[i].second,
                               (string)"field \"" + Fields[i].first + "\" of a record literal");
            }
            return new RecordValue(RecType, FieldValues);
        }

        ValueRef ExprMgr::MakeTupleValue(const vector<ValueRef>& ElemValues)
        {
            vector<TypeRef> ElemTypes;
            for (auto const& Elem : ElemValues) {
                if (Elem.IsNull_()) {
                    throw ExprTypeError("Null value in tuple literal");
                }
                ElemTypes.push_back(Elem->GetType());
            }
            return new RecordValue(MakeTupleType(ElemTypes), ElemValues);
        }

        ValueRef ExprMgr::MakeMapValue(const TypeRef& MapTypeRef, const ValueMapT& Entries)
        {
            auto TypeAsMap = MapTypeRef->As<MapType>();
            if (TypeAsMap == nullptr) {
                throw ExprTypeError((string)"Map literal of non map type " +
                                    MapTypeRef->ToString());
            }
            for (auto const& Entry : Entries) {
                CheckValueType(Entry.first, TypeAsMap->GetKeyType(), "map literal key");
                CheckValueType(Entry.second, TypeAsMap->GetValueType(), "map literal value");
            }
            return new MapValue(MapTypeRef, Entries);
        }

        ValueRef ExprMgr::MakeDMapValue(const TypeRef& DMapTypeRef,
                                        const OverrideListT& Overrides)
        {
            auto TypeAsDMap = DMapTypeRef->As<DMapType>();
            if (TypeAsDMap == nullptr) {
                throw ExprTypeError((string)"Default valued map literal of type " +
                                    DMapTypeRef->ToString());
            }
            for (auto const& Override : Overrides) {
                CheckValueType(Override.first, TypeAsDMap->GetKeyType(), "map literal key");
                CheckValueType(Override.second, TypeAsDMap->GetValueType(),
                               "map literal value");
            }
            return new DMapValue(DMapTypeRef, Overrides);
        }

        // Constants
        ExpT ExprMgr::MakeVal(const ValueRef& Value)
        {
            if (Value.IsNull_()) {
                throw ExprTypeError("Null value used as a constant");
            }
            return Intern(new ConstExpression(Value));
        }

        const ExpT& ExprMgr::MakeTrue() const
        {
            return TrueExp;
        }

        const ExpT& ExprMgr::MakeFalse() const
        {
            return FalseExp;
        }

        ExpT ExprMgr::MakeBool(bool Value)
        {
            return (Value ? TrueExp : FalseExp);
        }

        ExpT ExprMgr::MakeInt(const TypeRef& IntType, i64 Value)
        {
            return MakeVal(MakeIntValue(IntType, Value));
        }

        ExpT ExprMgr::MakeUInt(const TypeRef& IntType, u64 Value)
        {
            return MakeVal(MakeUIntValue(IntType, Value));
        }

        ExpT ExprMgr::MakeInt32(i32 Value)
        {
            return MakeVal(MakeIntValue(Int32Type, Value));
        }

        ExpT ExprMgr::MakeBigInt(const BigIntT& Value)
        {
            return MakeVal(MakeBigIntValue(Value));
        }

        ExpT ExprMgr::MakeChar(u32 CodePoint)
        {
            return MakeVal(MakeCharValue(CodePoint));
        }

        ExpT ExprMgr::MakeString(const string& UTF8String)
        {
            return MakeVal(MakeStringValue(UTF8String));
        }

        ExpT ExprMgr::MakeString(const char* UTF8String)
        {
            if (UTF8String == nullptr) {
                throw ExprTypeError("Null string literal");
            }
            return MakeString(string(UTF8String));
        }

        ExpT ExprMgr::MakeNone(const TypeRef& InnerType)
        {
            return MakeVal(MakeNoneValue(InnerType));
        }

        ExpT ExprMgr::MakeEmptySeq(const TypeRef& ElemType)
        {
            return MakeVal(MakeSeqValue(ElemType, vector<ValueRef>()));
        }

        ExpT ExprMgr::MakeEmptyMap(const TypeRef& MapTypeRef)
        {
            return MakeVal(MakeMapValue(MapTypeRef, ValueMapT()));
        }

        ExpT ExprMgr::MakeEmptyDMap(const TypeRef& DMapTypeRef)
        {
            return MakeVal(MakeDMapValue(DMapTypeRef, OverrideListT()));
        }

        // Variables
        ExpT ExprMgr::MakeVar(const string& VarName, const TypeRef& VarType)
        {
            if (VarName == "") {
                throw ExprTypeError("Variables must be named");
            }
            if (VarType.IsNull_()) {
                throw ExprTypeError((string)"Null type for variable \"" + VarName + "\"");
            }
            return Intern(new VarExpression(VarName, VarType));
        }

        ExpT ExprMgr::MakeFreshVar(const TypeRef& VarType, const string& Prefix)
        {
            auto Id = FreshVarCounter.fetch_add(1);
            return MakeVar(Prefix + "!" + to_string(Id), VarType);
        }

        // Type checking of operator applications
        TypeRef ExprMgr::CheckOp(i64 OpCode, const vector<ExpT>& Children,
                                 const string& Payload, const TypeRef& TypeHint)
        {
            const u32 NumChildren = Children.size();
            const string OpName = SymxOps::OpToString(OpCode);

            auto CheckArity = [&] (u32 Expected) -> void
                {
                    if (NumChildren != Expected) {
                        throw ExprTypeError(OpName + " expects " + to_string(Expected) +
                                            " operands, but got " + to_string(NumChildren));
                    }
                };
            auto Mismatch = [&] (u32 Pos, const string& Expected) -> ExprTypeError
                {
                    return ExprTypeError((string)"Operand " + to_string(Pos + 1) + " of " +
                                         OpName + " must be " + Expected + ", but " +
                                         Children[Pos]->ToString() + " has type " +
                                         Children[Pos]->GetType()->ToString());
                };
            auto CheckBool = [&] (u32 Pos) -> void
                {
                    if (Children[Pos]->GetType() != BoolType) {
                        throw Mismatch(Pos, "Bool");
                    }
                };
            auto CheckSameType = [&] (u32 Pos, const TypeRef& Type) -> void
                {
                    if (Children[Pos]->GetType() != Type) {
                        throw Mismatch(Pos, "of type " + Type->ToString());
                    }
                };
            auto CheckSeq = [&] (u32 Pos) -> const SeqType*
                {
                    auto Retval = Detail::GetSeqType(Children[Pos]);
                    if (Retval == nullptr) {
                        throw Mismatch(Pos, "a sequence");
                    }
                    return Retval;
                };

            switch (OpCode) {
            case SymxOps::OpAND:
            case SymxOps::OpOR:
                for (u32 i = 0; i < NumChildren; ++i) {
                    CheckBool(i);
                }
                return BoolType;

            case SymxOps::OpNOT:
                CheckArity(1);
                CheckBool(0);
                return BoolType;

            case SymxOps::OpIMPLIES:
                CheckArity(2);
                CheckBool(0);
                CheckBool(1);
                return BoolType;

            case SymxOps::OpITE:
                CheckArity(3);
                CheckBool(0);
                CheckSameType(2, Children[1]->GetType());
                return Children[1]->GetType();

            case SymxOps::OpEQ:
                CheckArity(2);
                CheckSameType(1, Children[0]->GetType());
                return BoolType;

            case SymxOps::OpADD:
            case SymxOps::OpSUB:
            case SymxOps::OpMUL:
                CheckArity(2);
                if (!Detail::IsNumeric(Children[0]->GetType())) {
                    throw Mismatch(0, "an integer");
                }
                CheckSameType(1, Children[0]->GetType());
                return Children[0]->GetType();

            case SymxOps::OpLT:
            case SymxOps::OpLE:
            case SymxOps::OpGT:
            case SymxOps::OpGE:
                CheckArity(2);
                if (!Detail::IsNumeric(Children[0]->GetType()) &&
                    Children[0]->GetType() != CharType) {
                    throw Mismatch(0, "an integer or a character");
                }
                CheckSameType(1, Children[0]->GetType());
                return BoolType;

            case SymxOps::OpBVAND:
            case SymxOps::OpBVOR:
            case SymxOps::OpBVXOR:
                CheckArity(2);
                if (!Detail::IsFixedInt(Children[0]->GetType())) {
                    throw Mismatch(0, "a fixed width integer");
                }
                CheckSameType(1, Children[0]->GetType());
                return Children[0]->GetType();

            case SymxOps::OpBVNOT:
                CheckArity(1);
                if (!Detail::IsFixedInt(Children[0]->GetType())) {
                    throw Mismatch(0, "a fixed width integer");
                }
                return Children[0]->GetType();

            case SymxOps::OpCAST:
                CheckArity(1);
                if (!Detail::IsNumeric(Children[0]->GetType())) {
                    throw Mismatch(0, "an integer");
                }
                if (TypeHint.IsNull_() || !Detail::IsNumeric(TypeHint)) {
                    throw ExprTypeError((string)"The target of a CAST must be an integer type");
                }
                return TypeHint;

            case SymxOps::OpMKRECORD: {
                auto TypeAsRec = (TypeHint.IsNull_() ? nullptr : TypeHint->As<RecordType>());
                if (TypeAsRec == nullptr) {
                    throw ExprTypeError("MKRECORD requires a record type");
                }
                auto const& Fields = TypeAsRec->GetFields();
                CheckArity(Fields.size());
                for (u32 i = 0; i < NumChildren; ++i) {
                    CheckSameType(i, Fields[i].second);
                }
                return TypeHint;
            }

            case SymxOps::OpPROJECT:
            case SymxOps::OpWITHFIELD: {
                CheckArity(OpCode == SymxOps::OpPROJECT ? 1 : 2);
                auto TypeAsRec = Children[0]->GetType()->As<RecordType>();
                if (TypeAsRec == nullptr) {
                    throw Mismatch(0, "a record");
                }
                auto Index = TypeAsRec->GetFieldIndex(Payload);
                if (Index < 0) {
                    throw ExprTypeError((string)"Record type " + TypeAsRec->ToString() +
                                        " has no field named \"" + Payload + "\"");
                }
                auto const& FieldType = TypeAsRec->GetFields()[Index].second;
                if (OpCode == SymxOps::OpPROJECT) {
                    return FieldType;
                }
                CheckSameType(1, FieldType);
                return Children[0]->GetType();
            }

            case SymxOps::OpOPTSOME:
                CheckArity(1);
                return MakeOptionType(Children[0]->GetType());

            case SymxOps::OpOPTISSOME:
            case SymxOps::OpOPTVALUE: {
                CheckArity(1);
                auto TypeAsOpt = Children[0]->GetType()->As<OptionType>();
                if (TypeAsOpt == nullptr) {
                    throw Mismatch(0, "an option");
                }
                return (OpCode == SymxOps::OpOPTISSOME ? BoolType : TypeAsOpt->GetInnerType());
            }

            case SymxOps::OpSEQUNIT:
                CheckArity(1);
                return MakeSeqType(Children[0]->GetType());

            case SymxOps::OpSEQCONCAT:
                if (NumChildren < 2) {
                    throw ExprTypeError(OpName + " expects at least two operands");
                }
                CheckSeq(0);
                for (u32 i = 1; i < NumChildren; ++i) {
                    CheckSameType(i, Children[0]->GetType());
                }
                return Children[0]->GetType();

            case SymxOps::OpSEQLENGTH:
                CheckArity(1);
                CheckSeq(0);
                return BigIntType;

            case SymxOps::OpSEQAT:
                CheckArity(2);
                CheckSeq(0);
                CheckSameType(1, BigIntType);
                return Children[0]->GetType();

            case SymxOps::OpSEQSLICE:
                CheckArity(3);
                CheckSeq(0);
                CheckSameType(1, BigIntType);
                CheckSameType(2, BigIntType);
                return Children[0]->GetType();

            case SymxOps::OpSEQINDEXOF:
                CheckArity(3);
                CheckSeq(0);
                CheckSameType(1, Children[0]->GetType());
                CheckSameType(2, BigIntType);
                return BigIntType;

            case SymxOps::OpSEQCONTAINS:
            case SymxOps::OpSEQSTARTSWITH:
            case SymxOps::OpSEQENDSWITH:
                CheckArity(2);
                CheckSeq(0);
                CheckSameType(1, Children[0]->GetType());
                return BoolType;

            case SymxOps::OpSEQREPLACEFIRST:
                CheckArity(3);
                CheckSeq(0);
                CheckSameType(1, Children[0]->GetType());
                CheckSameType(2, Children[0]->GetType());
                return Children[0]->GetType();

            case SymxOps::OpSEQREGEX:
                CheckArity(1);
                CheckSameType(0, StringType);
                // Throws on an unparsable pattern
                Regex::RegexMgr::Instance().Parse(Payload);
                return BoolType;

            case SymxOps::OpMAPGET:
            case SymxOps::OpMAPSET:
            case SymxOps::OpMAPDELETE: {
                CheckArity(OpCode == SymxOps::OpMAPSET ? 3 : 2);
                auto TypeAsMap = Children[0]->GetType()->As<MapType>();
                if (TypeAsMap == nullptr) {
                    throw Mismatch(0, "a map");
                }
                CheckSameType(1, TypeAsMap->GetKeyType());
                if (OpCode == SymxOps::OpMAPGET) {
                    return MakeOptionType(TypeAsMap->GetValueType());
                }
                if (OpCode == SymxOps::OpMAPSET) {
                    CheckSameType(2, TypeAsMap->GetValueType());
                }
                return Children[0]->GetType();
            }

            case SymxOps::OpDMAPGET:
            case SymxOps::OpDMAPSET: {
                CheckArity(OpCode == SymxOps::OpDMAPSET ? 3 : 2);
                auto TypeAsDMap = Children[0]->GetType()->As<DMapType>();
                if (TypeAsDMap == nullptr) {
                    throw Mismatch(0, "a default valued map");
                }
                CheckSameType(1, TypeAsDMap->GetKeyType());
                if (OpCode == SymxOps::OpDMAPGET) {
                    return TypeAsDMap->GetValueType();
                }
                CheckSameType(2, TypeAsDMap->GetValueType());
                return Children[0]->GetType();
            }

            case SymxOps::OpDMAPCOUNT:
                CheckArity(1);
                if (!Children[0]->GetType()->Is<DMapType>()) {
                    throw Mismatch(0, "a default valued map");
                }
                return Int32Type;

            default:
                throw ExprTypeError((string)"Unknown op code: " + to_string(OpCode));
            }
        }

        ExpT ExprMgr::SimplifyOp(i64 OpCode, const vector<ExpT>& Children,
                                 const string& Payload, const TypeRef& ResultType)
        {
            switch (OpCode) {
            case SymxOps::OpITE:
                if (Detail::IsConstTrue(Children[0])) {
                    return Children[1];
                }
                if (Detail::IsConstFalse(Children[0])) {
                    return Children[2];
                }
                if (Children[1] == Children[2]) {
                    return Children[1];
                }
                return ExpT::NullPtr;

            case SymxOps::OpNOT: {
                if (Detail::IsConstTrue(Children[0])) {
                    return FalseExp;
                }
                if (Detail::IsConstFalse(Children[0])) {
                    return TrueExp;
                }
                auto ChildAsNot = Detail::AsOp(Children[0], SymxOps::OpNOT);
                if (ChildAsNot != nullptr) {
                    return ChildAsNot->GetChildren()[0];
                }
                return ExpT::NullPtr;
            }

            case SymxOps::OpAND:
            case SymxOps::OpOR: {
                // The absorbing and the neutral constant
                const bool IsAnd = (OpCode == SymxOps::OpAND);
                const ExpT& Absorbing = (IsAnd ? FalseExp : TrueExp);
                const ExpT& Neutral = (IsAnd ? TrueExp : FalseExp);

                vector<ExpT> Remaining;
                for (auto const& Child : Children) {
                    if (Child == Absorbing) {
                        return Absorbing;
                    }
                    if (Child != Neutral) {
                        Remaining.push_back(Child);
                    }
                }
                if (Remaining.size() == 0) {
                    return Neutral;
                }
                if (Remaining.size() == 1) {
                    return Remaining[0];
                }
                if (Remaining.size() != Children.size()) {
                    return Intern(new OpExpression(OpCode, Remaining, BoolType));
                }
                return ExpT::NullPtr;
            }

            case SymxOps::OpIMPLIES:
                if (Detail::IsConstTrue(Children[0])) {
                    return Children[1];
                }
                if (Detail::IsConstFalse(Children[0]) || Detail::IsConstTrue(Children[1])) {
                    return TrueExp;
                }
                if (Detail::IsConstFalse(Children[1])) {
                    return MakeExpr(SymxOps::OpNOT, Children[0]);
                }
                return ExpT::NullPtr;

            case SymxOps::OpEQ: {
                if (Children[0] == Children[1]) {
                    return TrueExp;
                }
                auto Const1 = Children[0]->As<ConstExpression>();
                auto Const2 = Children[1]->As<ConstExpression>();
                if (Const1 != nullptr && Const2 != nullptr) {
                    return MakeBool(Const1->GetConstValue()->Equals(*(Const2->GetConstValue())));
                }
                return ExpT::NullPtr;
            }

            case SymxOps::OpBVAND:
            case SymxOps::OpBVOR:
            case SymxOps::OpBVXOR:
            case SymxOps::OpBVNOT: {
                vector<ValueRef> ConstArgs;
                for (auto const& Child : Children) {
                    auto ChildAsConst = Child->As<ConstExpression>();
                    if (ChildAsConst == nullptr) {
                        return ExpT::NullPtr;
                    }
                    ConstArgs.push_back(ChildAsConst->GetConstValue());
                }
                if (OpCode == SymxOps::OpBVNOT) {
                    return MakeVal(Interp::ValueOps::BitNot(ConstArgs[0]));
                }
                return MakeVal(Interp::ValueOps::BitOp(OpCode, ConstArgs[0], ConstArgs[1]));
            }

            case SymxOps::OpPROJECT: {
                auto const& Record = Children[0];
                auto RecType = Record->GetType()->SAs<RecordType>();
                auto Index = RecType->GetFieldIndex(Payload);

                auto RecordAsMk = Detail::AsOp(Record, SymxOps::OpMKRECORD);
                if (RecordAsMk != nullptr) {
                    return RecordAsMk->GetChildren()[Index];
                }
                auto RecordAsUpdate = Detail::AsOp(Record, SymxOps::OpWITHFIELD);
                if (RecordAsUpdate != nullptr) {
                    if (RecordAsUpdate->GetPayload() == Payload) {
                        return RecordAsUpdate->GetChildren()[1];
                    }
                    return MakeProject(RecordAsUpdate->GetChildren()[0], Payload);
                }
                auto RecordAsConst = Record->As<ConstExpression>();
                if (RecordAsConst != nullptr) {
                    return MakeVal(RecordAsConst->GetConstValue()->
                                   SAs<RecordValue>()->GetFieldValue((u32)Index));
                }
                return ExpT::NullPtr;
            }

            case SymxOps::OpOPTISSOME: {
                if (Detail::AsOp(Children[0], SymxOps::OpOPTSOME) != nullptr) {
                    return TrueExp;
                }
                auto ChildAsConst = Children[0]->As<ConstExpression>();
                if (ChildAsConst != nullptr) {
                    return MakeBool(ChildAsConst->GetConstValue()->
                                    SAs<OptionValue>()->IsSome());
                }
                return ExpT::NullPtr;
            }

            case SymxOps::OpOPTVALUE: {
                auto ChildAsSome = Detail::AsOp(Children[0], SymxOps::OpOPTSOME);
                if (ChildAsSome != nullptr) {
                    return ChildAsSome->GetChildren()[0];
                }
                return ExpT::NullPtr;
            }

            default:
                return ExpT::NullPtr;
            }
        }

        ExpT ExprMgr::MakeOp(i64 OpCode, const vector<ExpT>& Children,
                             const string& Payload, const TypeRef& TypeHint)
        {
            if (!SymxOps::IsOpCode(OpCode)) {
                throw ExprTypeError((string)"Unknown op code: " + to_string(OpCode));
            }
            for (auto const& Child : Children) {
                if (Child.IsNull_()) {
                    throw ExprTypeError((string)"Null operand for " +
                                        SymxOps::OpToString(OpCode));
                }
            }

            auto ResultType = CheckOp(OpCode, Children, Payload, TypeHint);
            auto Simplified = SimplifyOp(OpCode, Children, Payload, ResultType);
            if (!Simplified.IsNull_()) {
                return Simplified;
            }
            return Intern(new OpExpression(OpCode, Children, ResultType, Payload));
        }

        ExpT ExprMgr::MakeExpr(i64 OpCode, const vector<ExpT>& Children)
        {
            switch (OpCode) {
            case SymxOps::OpCAST:
                throw ExprTypeError("Use ExprMgr::MakeCast() to construct casts");
            case SymxOps::OpMKRECORD:
                throw ExprTypeError("Use ExprMgr::MakeRecord() to construct records");
            case SymxOps::OpPROJECT:
                throw ExprTypeError("Use ExprMgr::MakeProject() to construct projections");
            case SymxOps::OpWITHFIELD:
                throw ExprTypeError("Use ExprMgr::MakeWithField() to construct record updates");
            case SymxOps::OpSEQREGEX:
                throw ExprTypeError("Use ExprMgr::MakeRegexMatch() to construct regex matches");
            default:
                return MakeOp(OpCode, Children, "", TypeRef::NullPtr);
            }
        }

        ExpT ExprMgr::MakeExpr(i64 OpCode, const ExpT& Child1)
        {
            vector<ExpT> Children = { Child1 };
            return MakeExpr(OpCode, Children);
        }

        ExpT ExprMgr::MakeExpr(i64 OpCode, const ExpT& Child1, const ExpT& Child2)
        {
            vector<ExpT> Children = { Child1, Child2 };
            return MakeExpr(OpCode, Children);
        }

        ExpT ExprMgr::MakeExpr(i64 OpCode, const ExpT& Child1, const ExpT& Child2,
                               const ExpT& Child3)
        {
            vector<ExpT> Children = { Child1, Child2, Child3 };
            return MakeExpr(OpCode, Children);
        }

        ExpT ExprMgr::MakeCast(const ExpT& Exp, const TypeRef& TargetType)
        {
            if (!Exp.IsNull_() && Exp->GetType() == TargetType) {
                return Exp;
            }
            vector<ExpT> Children = { Exp };
            return MakeOp(SymxOps::OpCAST, Children, "", TargetType);
        }

        ExpT ExprMgr::MakeRecord(const TypeRef& RecType, const vector<ExpT>& FieldExps)
        {
            return MakeOp(SymxOps::OpMKRECORD, FieldExps, "", RecType);
        }

        ExpT ExprMgr::MakeTuple(const vector<ExpT>& ElemExps)
        {
            vector<TypeRef> ElemTypes;
            for (auto const& Elem : ElemExps) {
                if (Elem.IsNull_()) {
                    throw ExprTypeError("Null operand for MKRECORD");
                }
                ElemTypes.push_back(Elem->GetType());
            }
            return MakeOp(SymxOps::OpMKRECORD, ElemExps, "", MakeTupleType(ElemTypes));
        }

        ExpT ExprMgr::MakeProject(const ExpT& RecordExp, const string& FieldName)
        {
            vector<ExpT> Children = { RecordExp };
            return MakeOp(SymxOps::OpPROJECT, Children, FieldName, TypeRef::NullPtr);
        }

        ExpT ExprMgr::MakeWithField(const ExpT& RecordExp, const string& FieldName,
                                    const ExpT& FieldExp)
        {
            vector<ExpT> Children = { RecordExp, FieldExp };
            return MakeOp(SymxOps::OpWITHFIELD, Children, FieldName, TypeRef::NullPtr);
        }

        ExpT ExprMgr::MakeRegexMatch(const ExpT& StringExp, const string& Pattern)
        {
            vector<ExpT> Children = { StringExp };
            return MakeOp(SymxOps::OpSEQREGEX, Children, Pattern, TypeRef::NullPtr);
        }

        ExpT ExprMgr::MakeOpLike(const OpExpression* Exp, const vector<ExpT>& NewChildren)
        {
            return MakeOp(Exp->GetOpCode(), NewChildren, Exp->GetPayload(), Exp->GetType());
        }

        ExpT ExprMgr::Substitute(const SubstMapT& Subst, const ExpT& Exp)
        {
            return Substitutor::Do(Subst, Exp);
        }

        vector<ExpT> ExprMgr::GatherVars(const ExpT& Exp) const
        {
            return VarGatherer::Do(Exp);
        }

        u64 ExprMgr::GetNumExpressions() const
        {
            return ExpCache.Size();
        }

        u64 ExprMgr::GetNumTypes() const
        {
            return TypeCache.Size();
        }

    } /* end namespace Exprs */
} /* end namespace SYMX */

//
// ExprMgr.cpp ends here
