// ExprTypes.cpp ---
//
// Filename: ExprTypes.cpp
// Author: Abhishek Udupa
// Created: Wed Jan 14 04:20:00 2015 (-0500)
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

#include <boost/functional/hash.hpp>
#include <boost/lexical_cast.hpp>

#include "ExprTypes.hpp"
#include "Values.hpp"

namespace SYMX {
    namespace Exprs {

        TypeBase::TypeBase()
            : HashValid(false), HashCode(0)
        {
            // Nothing here
        }

        TypeBase::~TypeBase()
        {
            // Nothing here
        }

        u64 TypeBase::Hash() const
        {
            if (!HashValid.load(memory_order_acquire)) {
                HashCode.store(ComputeHashValue(), memory_order_relaxed);
                HashValid.store(true, memory_order_release);
            }
            return HashCode.load(memory_order_relaxed);
        }

        i32 TypeBase::Compare(const TypeBase& Other) const
        {
            auto MyKind = (i32)GetKind();
            auto OtherKind = (i32)Other.GetKind();
            if (MyKind != OtherKind) {
                return (MyKind < OtherKind ? -1 : 1);
            }
            return CompareSameKind(Other);
        }

        bool TypeBase::Equals(const TypeBase& Other) const
        {
            return (&Other == this || Compare(Other) == 0);
        }

        bool TypeBase::LT(const TypeBase& Other) const
        {
            return (Compare(Other) < 0);
        }

        const ValueRef& TypeBase::GetDefaultValue() const
        {
            call_once(DefaultValueFlag, [this] () { DefaultValue = MakeDefaultValue(); });
            return DefaultValue;
        }

        bool TypeBase::ContainsMap() const
        {
            return false;
        }

        bool TypeBase::ContainsDMap() const
        {
            return false;
        }

        // BooleanType
        BooleanType::BooleanType()
            : TypeBase()
        {
            // Nothing here
        }

        BooleanType::~BooleanType()
        {
            // Nothing here
        }

        u64 BooleanType::ComputeHashValue() const
        {
            u64 Retval = 0;
            boost::hash_combine(Retval, string("BooleanType"));
            return Retval;
        }

        i32 BooleanType::CompareSameKind(const TypeBase& Other) const
        {
            return 0;
        }

        ValueRef BooleanType::MakeDefaultValue() const
        {
            return new BoolValue(this, false);
        }

        TypeKindT BooleanType::GetKind() const
        {
            return TypeKindT::Boolean;
        }

        string BooleanType::ToString(u32 Verbosity) const
        {
            return "Bool";
        }

        // IntegerType
        IntegerType::IntegerType(u32 Width, bool Signed)
            : TypeBase(), Width(Width), Signed(Signed)
        {
            if (Width != 8 && Width != 16 && Width != 32 && Width != 64) {
                throw ExprTypeError((string)"Integer types must be 8, 16, 32 or 64 " +
                                    "bits wide, got a width of " + to_string(Width));
            }
        }

        IntegerType::~IntegerType()
        {
            // Nothing here
        }

        u32 IntegerType::GetWidth() const
        {
            return Width;
        }

        bool IntegerType::IsSigned() const
        {
            return Signed;
        }

        u64 IntegerType::GetMask() const
        {
            if (Width == 64) {
                return UINT64_MAX;
            }
            return (((u64)1 << Width) - 1);
        }

        i64 IntegerType::GetMinSigned() const
        {
            if (Width == 64) {
                return INT64_MIN;
            }
            return -((i64)1 << (Width - 1));
        }

        i64 IntegerType::GetMaxSigned() const
        {
            if (Width == 64) {
                return INT64_MAX;
            }
            return (((i64)1 << (Width - 1)) - 1);
        }

        u64 IntegerType::GetMaxUnsigned() const
        {
            return GetMask();
        }

        u64 IntegerType::ComputeHashValue() const
        {
            u64 Retval = 0;
            boost::hash_combine(Retval, string("IntegerType"));
            boost::hash_combine(Retval, Width);
            boost::hash_combine(Retval, Signed);
            return Retval;
        }

        i32 IntegerType::CompareSameKind(const TypeBase& Other) const
        {
            auto OtherAsInt = Other.SAs<IntegerType>();
            if (Width != OtherAsInt->Width) {
                return (Width < OtherAsInt->Width ? -1 : 1);
            }
            if (Signed != OtherAsInt->Signed) {
                return (Signed ? 1 : -1);
            }
            return 0;
        }

        ValueRef IntegerType::MakeDefaultValue() const
        {
            return new IntValue(this, 0);
        }

        TypeKindT IntegerType::GetKind() const
        {
            return TypeKindT::Integer;
        }

        string IntegerType::ToString(u32 Verbosity) const
        {
            return (Signed ? (string)"Int" : (string)"UInt") + to_string(Width);
        }

        // BigIntType
        BigIntType::BigIntType()
            : TypeBase()
        {
            // Nothing here
        }

        BigIntType::~BigIntType()
        {
            // Nothing here
        }

        u64 BigIntType::ComputeHashValue() const
        {
            u64 Retval = 0;
            boost::hash_combine(Retval, string("BigIntType"));
            return Retval;
        }

        i32 BigIntType::CompareSameKind(const TypeBase& Other) const
        {
            return 0;
        }

        ValueRef BigIntType::MakeDefaultValue() const
        {
            return new BigIntValue(this, BigIntT(0));
        }

        TypeKindT BigIntType::GetKind() const
        {
            return TypeKindT::BigInt;
        }

        string BigIntType::ToString(u32 Verbosity) const
        {
            return "BigInt";
        }

        // CharType
        CharType::CharType()
            : TypeBase()
        {
            // Nothing here
        }

        CharType::~CharType()
        {
            // Nothing here
        }

        u64 CharType::ComputeHashValue() const
        {
            u64 Retval = 0;
            boost::hash_combine(Retval, string("CharType"));
            return Retval;
        }

        i32 CharType::CompareSameKind(const TypeBase& Other) const
        {
            return 0;
        }

        ValueRef CharType::MakeDefaultValue() const
        {
            return new CharValue(this, 0);
        }

        TypeKindT CharType::GetKind() const
        {
            return TypeKindT::Char;
        }

        string CharType::ToString(u32 Verbosity) const
        {
            return "Char";
        }

        // SeqType
        SeqType::SeqType(const TypeRef& ElemType)
            : TypeBase(), ElemType(ElemType)
        {
            // Also catches maps under options, records and sequences
            if (ElemType->ContainsMap()) {
                throw ExprTypeError((string)"Map types cannot be used in the element " +
                                    "type of a sequence. Element type: " +
                                    ElemType->ToString());
            }
        }

        SeqType::~SeqType()
        {
            // Nothing here
        }

        const TypeRef& SeqType::GetElemType() const
        {
            return ElemType;
        }

        bool SeqType::IsString() const
        {
            return ElemType->Is<CharType>();
        }

        u64 SeqType::ComputeHashValue() const
        {
            u64 Retval = 0;
            boost::hash_combine(Retval, string("SeqType"));
            boost::hash_combine(Retval, ElemType->Hash());
            return Retval;
        }

        i32 SeqType::CompareSameKind(const TypeBase& Other) const
        {
            return ElemType->Compare(*(Other.SAs<SeqType>()->ElemType));
        }

        ValueRef SeqType::MakeDefaultValue() const
        {
            return new SeqValue(this, vector<ValueRef>());
        }

        TypeKindT SeqType::GetKind() const
        {
            return TypeKindT::Seq;
        }

        string SeqType::ToString(u32 Verbosity) const
        {
            if (IsString()) {
                return "String";
            }
            return (string)"Seq<" + ElemType->ToString(Verbosity) + ">";
        }

        bool SeqType::ContainsMap() const
        {
            return ElemType->ContainsMap();
        }

        bool SeqType::ContainsDMap() const
        {
            return ElemType->ContainsDMap();
        }

        // OptionType
        OptionType::OptionType(const TypeRef& InnerType)
            : TypeBase(), InnerType(InnerType)
        {
            // Nothing here
        }

        OptionType::~OptionType()
        {
            // Nothing here
        }

        const TypeRef& OptionType::GetInnerType() const
        {
            return InnerType;
        }

        u64 OptionType::ComputeHashValue() const
        {
            u64 Retval = 0;
            boost::hash_combine(Retval, string("OptionType"));
            boost::hash_combine(Retval, InnerType->Hash());
            return Retval;
        }

        i32 OptionType::CompareSameKind(const TypeBase& Other) const
        {
            return InnerType->Compare(*(Other.SAs<OptionType>()->InnerType));
        }

        ValueRef OptionType::MakeDefaultValue() const
        {
            return new OptionValue(this, ValueRef::NullPtr);
        }

        TypeKindT OptionType::GetKind() const
        {
            return TypeKindT::Option;
        }

        string OptionType::ToString(u32 Verbosity) const
        {
            return (string)"Option<" + InnerType->ToString(Verbosity) + ">";
        }

        bool OptionType::ContainsMap() const
        {
            return InnerType->ContainsMap();
        }

        bool OptionType::ContainsDMap() const
        {
            return InnerType->ContainsDMap();
        }

        // RecordType
        const string RecordType::TupleName = "Tuple";

        RecordType::RecordType(const string& Name, const FieldListT& Fields)
            : TypeBase(), Name(Name), Fields(Fields)
        {
            if (Name == "") {
                throw ExprTypeError("Record types must be named");
            }
            for (u32 i = 0; i < Fields.size(); ++i) {
                if (Fields[i].first == "") {
                    throw ExprTypeError((string)"Empty field name in record type \"" +
                                        Name + "\"");
                }
                if (Fields[i].second.IsNull_()) {
                    throw ExprTypeError((string)"Null type for field \"" +
                                        Fields[i].first + "\" in record type \"" +
                                        Name + "\"");
                }
                for (u32 j = 0; j < i; ++j) {
                    if (Fields[j].first == Fields[i].first) {
                        throw ExprTypeError((string)"Duplicate field \"" + Fields[i].first +
                                            "\" in record type \"" + Name + "\"");
                    }
                }
            }
        }

        RecordType::~RecordType()
        {
            // Nothing here
        }

        const string& RecordType::GetName() const
        {
            return Name;
        }

        const FieldListT& RecordType::GetFields() const
        {
            return Fields;
        }

        u32 RecordType::GetNumFields() const
        {
            return Fields.size();
        }

        i32 RecordType::GetFieldIndex(const string& FieldName) const
        {
            const u32 NumFields = Fields.size();
            for (u32 i = 0; i < NumFields; ++i) {
                if (Fields[i].first == FieldName) {
                    return (i32)i;
                }
            }
            return -1;
        }

        const TypeRef& RecordType::GetFieldType(const string& FieldName) const
        {
            auto Index = GetFieldIndex(FieldName);
            if (Index < 0) {
                throw ExprTypeError((string)"Record type \"" + Name + "\" has no field " +
                                    "named \"" + FieldName + "\"");
            }
            return Fields[Index].second;
        }

        bool RecordType::IsTuple() const
        {
            return (Name == TupleName);
        }

        string RecordType::GetTupleFieldName(u32 Index)
        {
            return (string)"Item" + to_string(Index + 1);
        }

        u64 RecordType::ComputeHashValue() const
        {
            u64 Retval = 0;
            boost::hash_combine(Retval, string("RecordType"));
            boost::hash_combine(Retval, Name);
            for (auto const& Field : Fields) {
                boost::hash_combine(Retval, Field.first);
                boost::hash_combine(Retval, Field.second->Hash());
            }
            return Retval;
        }

        i32 RecordType::CompareSameKind(const TypeBase& Other) const
        {
            auto OtherAsRec = Other.SAs<RecordType>();
            if (Name != OtherAsRec->Name) {
                return (Name < OtherAsRec->Name ? -1 : 1);
            }
            if (Fields.size() != OtherAsRec->Fields.size()) {
                return (Fields.size() < OtherAsRec->Fields.size() ? -1 : 1);
            }
            const u32 NumFields = Fields.size();
            for (u32 i = 0; i < NumFields; ++i) {
                if (Fields[i].first != OtherAsRec->Fields[i].first) {
                    return (Fields[i].first < OtherAsRec->Fields[i].first ? -1 : 1);
                }
                auto Res = Fields[i].second->Compare(*(OtherAsRec->Fields[i].second));
                if (Res != 0) {
                    return Res;
                }
            }
            return 0;
        }

        ValueRef RecordType::MakeDefaultValue() const
        {
            vector<ValueRef> FieldValues;
            for (auto const& Field : Fields) {
                FieldValues.push_back(Field.second->GetDefaultValue());
            }
            return new RecordValue(this, FieldValues);
        }

        TypeKindT RecordType::GetKind() const
        {
            return TypeKindT::Record;
        }

        string RecordType::ToString(u32 Verbosity) const
        {
            string Retval = Name;
            if (IsTuple()) {
                Retval += "<";
                bool First = true;
                for (auto const& Field : Fields) {
                    Retval += (First ? "" : ", ") + Field.second->ToString(Verbosity);
                    First = false;
                }
                return Retval + ">";
            }
            if (Verbosity == 0) {
                return Retval;
            }
            Retval += " { ";
            for (auto const& Field : Fields) {
                Retval += Field.first + " : " + Field.second->ToString(Verbosity) + "; ";
            }
            return Retval + "}";
        }

        bool RecordType::ContainsMap() const
        {
            for (auto const& Field : Fields) {
                if (Field.second->ContainsMap()) {
                    return true;
                }
            }
            return false;
        }

        bool RecordType::ContainsDMap() const
        {
            for (auto const& Field : Fields) {
                if (Field.second->ContainsDMap()) {
                    return true;
                }
            }
            return false;
        }

        // MapTypeBase
        MapTypeBase::MapTypeBase(const TypeRef& KeyType, const TypeRef& ValueType)
            : TypeBase(), KeyType(KeyType), ValueType(ValueType)
        {
            // Nothing here
        }

        MapTypeBase::~MapTypeBase()
        {
            // Nothing here
        }

        const TypeRef& MapTypeBase::GetKeyType() const
        {
            return KeyType;
        }

        const TypeRef& MapTypeBase::GetValueType() const
        {
            return ValueType;
        }

        u64 MapTypeBase::ComputeHashValue() const
        {
            u64 Retval = 0;
            boost::hash_combine(Retval, (i32)GetKind());
            boost::hash_combine(Retval, KeyType->Hash());
            boost::hash_combine(Retval, ValueType->Hash());
            return Retval;
        }

        i32 MapTypeBase::CompareSameKind(const TypeBase& Other) const
        {
            auto OtherAsMap = Other.SAs<MapTypeBase>();
            auto Res = KeyType->Compare(*(OtherAsMap->KeyType));
            if (Res != 0) {
                return Res;
            }
            return ValueType->Compare(*(OtherAsMap->ValueType));
        }

        bool MapTypeBase::ContainsMap() const
        {
            return true;
        }

        // MapType
        MapType::MapType(const TypeRef& KeyType, const TypeRef& ValueType)
            : MapTypeBase(KeyType, ValueType)
        {
            if (KeyType->ContainsMap() || ValueType->ContainsMap()) {
                throw ExprTypeError((string)"Map types cannot be nested inside a map. " +
                                    "Key type: " + KeyType->ToString() + ", value type: " +
                                    ValueType->ToString());
            }
        }

        MapType::~MapType()
        {
            // Nothing here
        }

        ValueRef MapType::MakeDefaultValue() const
        {
            return new MapValue(this, ValueMapT());
        }

        TypeKindT MapType::GetKind() const
        {
            return TypeKindT::Map;
        }

        string MapType::ToString(u32 Verbosity) const
        {
            return (string)"Map<" + KeyType->ToString(Verbosity) + ", " +
                ValueType->ToString(Verbosity) + ">";
        }

        bool MapType::ContainsDMap() const
        {
            return (KeyType->ContainsDMap() || ValueType->ContainsDMap());
        }

        // DMapType
        DMapType::DMapType(const TypeRef& KeyType, const TypeRef& ValueType)
            : MapTypeBase(KeyType, ValueType)
        {
            // Nothing here
        }

        DMapType::~DMapType()
        {
            // Nothing here
        }

        ValueRef DMapType::MakeDefaultValue() const
        {
            return new DMapValue(this, OverrideListT());
        }

        TypeKindT DMapType::GetKind() const
        {
            return TypeKindT::DMap;
        }

        string DMapType::ToString(u32 Verbosity) const
        {
            return (string)"DMap<" + KeyType->ToString(Verbosity) + ", " +
                ValueType->ToString(Verbosity) + ">";
        }

        bool DMapType::ContainsDMap() const
        {
            return true;
        }

    } /* end namespace Exprs */
} /* end namespace SYMX */

//
// ExprTypes.cpp ends here
