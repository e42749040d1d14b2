// Values.cpp ---
//
// Filename: Values.cpp
// Author: Abhishek Udupa
// Created: Wed Feb 18 00:30:00 2015 (-0500)
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

#include "../utils/UnicodeUtils.hpp"

#include "Values.hpp"

namespace SYMX {
    namespace Exprs {

        namespace Detail {

            static inline i32 CompareValueVectors(const vector<ValueRef>& Vec1,
                                                  const vector<ValueRef>& Vec2)
            {
                const u32 MinSize = min(Vec1.size(), Vec2.size());
                for (u32 i = 0; i < MinSize; ++i) {
                    auto Res = Vec1[i]->Compare(*(Vec2[i]));
                    if (Res != 0) {
                        return Res;
                    }
                }
                if (Vec1.size() == Vec2.size()) {
                    return 0;
                }
                return (Vec1.size() < Vec2.size() ? -1 : 1);
            }

            static inline i32 CompareValueMaps(const ValueMapT& Map1, const ValueMapT& Map2)
            {
                auto it1 = Map1.begin();
                auto it2 = Map2.begin();
                for (; it1 != Map1.end() && it2 != Map2.end(); ++it1, ++it2) {
                    auto Res = it1->first->Compare(*(it2->first));
                    if (Res != 0) {
                        return Res;
                    }
                    Res = it1->second->Compare(*(it2->second));
                    if (Res != 0) {
                        return Res;
                    }
                }
                if (Map1.size() == Map2.size()) {
                    return 0;
                }
                return (Map1.size() < Map2.size() ? -1 : 1);
            }

            static inline string MapEntriesToString(const ValueMapT& Entries, u32 Verbosity)
            {
                string Retval = "{";
                bool First = true;
                for (auto const& Entry : Entries) {
                    Retval += (First ? "" : ", ") + Entry.first->ToString(Verbosity) +
                        " -> " + Entry.second->ToString(Verbosity);
                    First = false;
                }
                return Retval + "}";
            }

        } /* end namespace Detail */

        // ValueBase
        ValueBase::ValueBase(const TypeRef& ValType)
            : ValType(ValType), HashValid(false), HashCode(0)
        {
            // Nothing here
        }

        ValueBase::~ValueBase()
        {
            // Nothing here
        }

        const TypeRef& ValueBase::GetType() const
        {
            return ValType;
        }

        u64 ValueBase::Hash() const
        {
            if (!HashValid.load(memory_order_acquire)) {
                HashCode.store(ComputeHashValue(), memory_order_relaxed);
                HashValid.store(true, memory_order_release);
            }
            return HashCode.load(memory_order_relaxed);
        }

        i32 ValueBase::Compare(const ValueBase& Other) const
        {
            if (&Other == this) {
                return 0;
            }
            if (ValType != Other.ValType) {
                auto Res = ValType->Compare(*(Other.ValType));
                if (Res != 0) {
                    return Res;
                }
            }
            return CompareSameType(Other);
        }

        bool ValueBase::Equals(const ValueBase& Other) const
        {
            if (&Other == this) {
                return true;
            }
            if (Hash() != Other.Hash()) {
                return false;
            }
            return (Compare(Other) == 0);
        }

        bool ValueBase::LT(const ValueBase& Other) const
        {
            return (Compare(Other) < 0);
        }

        // BoolValue
        BoolValue::BoolValue(const TypeRef& BoolType, bool Value)
            : ValueBase(BoolType), Value(Value)
        {
            // Nothing here
        }

        BoolValue::~BoolValue()
        {
            // Nothing here
        }

        bool BoolValue::GetValue() const
        {
            return Value;
        }

        u64 BoolValue::ComputeHashValue() const
        {
            u64 Retval = 0;
            boost::hash_combine(Retval, GetType()->Hash());
            boost::hash_combine(Retval, Value);
            return Retval;
        }

        i32 BoolValue::CompareSameType(const ValueBase& Other) const
        {
            auto OtherValue = Other.SAs<BoolValue>()->Value;
            if (Value == OtherValue) {
                return 0;
            }
            return (Value ? 1 : -1);
        }

        string BoolValue::ToString(u32 Verbosity) const
        {
            return (Value ? "true" : "false");
        }

        // IntValue
        IntValue::IntValue(const TypeRef& IntType, u64 Bits)
            : ValueBase(IntType),
              Bits(Bits & IntType->SAs<IntegerType>()->GetMask())
        {
            // Nothing here
        }

        IntValue::~IntValue()
        {
            // Nothing here
        }

        u64 IntValue::GetBits() const
        {
            return Bits;
        }

        i64 IntValue::GetSigned() const
        {
            auto Width = GetWidth();
            if (Width == 64) {
                return (i64)Bits;
            }
            u64 SignBit = (u64)1 << (Width - 1);
            if ((Bits & SignBit) != 0) {
                return (i64)(Bits | ~(GetType()->SAs<IntegerType>()->GetMask()));
            }
            return (i64)Bits;
        }

        u64 IntValue::GetUnsigned() const
        {
            return Bits;
        }

        BigIntT IntValue::ToBigInt() const
        {
            if (IsSigned()) {
                return BigIntT(GetSigned());
            }
            return BigIntT(Bits);
        }

        bool IntValue::IsSigned() const
        {
            return GetType()->SAs<IntegerType>()->IsSigned();
        }

        u32 IntValue::GetWidth() const
        {
            return GetType()->SAs<IntegerType>()->GetWidth();
        }

        u64 IntValue::ComputeHashValue() const
        {
            u64 Retval = 0;
            boost::hash_combine(Retval, GetType()->Hash());
            boost::hash_combine(Retval, Bits);
            return Retval;
        }

        i32 IntValue::CompareSameType(const ValueBase& Other) const
        {
            auto OtherAsInt = Other.SAs<IntValue>();
            if (IsSigned()) {
                auto Mine = GetSigned();
                auto Theirs = OtherAsInt->GetSigned();
                return (Mine == Theirs ? 0 : (Mine < Theirs ? -1 : 1));
            } else {
                auto Theirs = OtherAsInt->Bits;
                return (Bits == Theirs ? 0 : (Bits < Theirs ? -1 : 1));
            }
        }

        string IntValue::ToString(u32 Verbosity) const
        {
            if (IsSigned()) {
                return to_string(GetSigned());
            }
            return to_string(Bits);
        }

        // BigIntValue
        BigIntValue::BigIntValue(const TypeRef& BigIntType, const BigIntT& Value)
            : ValueBase(BigIntType), Value(Value)
        {
            // Nothing here
        }

        BigIntValue::~BigIntValue()
        {
            // Nothing here
        }

        const BigIntT& BigIntValue::GetValue() const
        {
            return Value;
        }

        u64 BigIntValue::ComputeHashValue() const
        {
            u64 Retval = 0;
            boost::hash_combine(Retval, GetType()->Hash());
            boost::hash_combine(Retval, Value.str());
            return Retval;
        }

        i32 BigIntValue::CompareSameType(const ValueBase& Other) const
        {
            return Value.compare(Other.SAs<BigIntValue>()->Value);
        }

        string BigIntValue::ToString(u32 Verbosity) const
        {
            return Value.str();
        }

        // CharValue
        CharValue::CharValue(const TypeRef& CharType, u32 CodePoint)
            : ValueBase(CharType), CodePoint(CodePoint)
        {
            // Nothing here
        }

        CharValue::~CharValue()
        {
            // Nothing here
        }

        u32 CharValue::GetCodePoint() const
        {
            return CodePoint;
        }

        u64 CharValue::ComputeHashValue() const
        {
            u64 Retval = 0;
            boost::hash_combine(Retval, GetType()->Hash());
            boost::hash_combine(Retval, CodePoint);
            return Retval;
        }

        i32 CharValue::CompareSameType(const ValueBase& Other) const
        {
            auto Theirs = Other.SAs<CharValue>()->CodePoint;
            return (CodePoint == Theirs ? 0 : (CodePoint < Theirs ? -1 : 1));
        }

        string CharValue::ToString(u32 Verbosity) const
        {
            return (string)"'" + UnicodeUtils::EscapeCodePoint(CodePoint) + "'";
        }

        // SeqValue
        SeqValue::SeqValue(const TypeRef& SeqType, const vector<ValueRef>& Elems)
            : ValueBase(SeqType), Elems(Elems)
        {
            // Nothing here
        }

        SeqValue::SeqValue(const TypeRef& SeqType, vector<ValueRef>&& Elems)
            : ValueBase(SeqType), Elems(std::move(Elems))
        {
            // Nothing here
        }

        SeqValue::~SeqValue()
        {
            // Nothing here
        }

        const vector<ValueRef>& SeqValue::GetElems() const
        {
            return Elems;
        }

        u64 SeqValue::GetLength() const
        {
            return Elems.size();
        }

        bool SeqValue::IsString() const
        {
            return GetType()->SAs<SeqType>()->IsString();
        }

        vector<u32> SeqValue::GetCodePoints() const
        {
            if (!IsString()) {
                throw InternalError((string)"SeqValue::GetCodePoints() called on a value " +
                                    "of type " + GetType()->ToString() + "\nAt: " +
                                    __FILE__ + ":" + to_string(__LINE__));
            }
            vector<u32> Retval;
            Retval.reserve(Elems.size());
            for (auto const& Elem : Elems) {
                Retval.push_back(Elem->SAs<CharValue>()->GetCodePoint());
            }
            return Retval;
        }

        string SeqValue::GetString() const
        {
            return UnicodeUtils::EncodeUTF8(GetCodePoints());
        }

        u64 SeqValue::ComputeHashValue() const
        {
            u64 Retval = 0;
            boost::hash_combine(Retval, GetType()->Hash());
            for (auto const& Elem : Elems) {
                boost::hash_combine(Retval, Elem->Hash());
            }
            return Retval;
        }

        i32 SeqValue::CompareSameType(const ValueBase& Other) const
        {
            return Detail::CompareValueVectors(Elems, Other.SAs<SeqValue>()->Elems);
        }

        string SeqValue::ToString(u32 Verbosity) const
        {
            if (IsString()) {
                string Retval = "\"";
                for (auto const& Elem : Elems) {
                    auto CodePoint = Elem->SAs<CharValue>()->GetCodePoint();
                    if (CodePoint == '"' || CodePoint == '\\') {
                        Retval += "\\";
                    }
                    Retval += UnicodeUtils::EscapeCodePoint(CodePoint);
                }
                return Retval + "\"";
            }

            string Retval = "[";
            bool First = true;
            for (auto const& Elem : Elems) {
                Retval += (First ? "" : ", ") + Elem->ToString(Verbosity);
                First = false;
            }
            return Retval + "]";
        }

        // OptionValue
        OptionValue::OptionValue(const TypeRef& OptionType, const ValueRef& Inner)
            : ValueBase(OptionType), Inner(Inner)
        {
            // Nothing here
        }

        OptionValue::~OptionValue()
        {
            // Nothing here
        }

        bool OptionValue::IsSome() const
        {
            return !Inner.IsNull_();
        }

        const ValueRef& OptionValue::GetInner() const
        {
            return Inner;
        }

        u64 OptionValue::ComputeHashValue() const
        {
            u64 Retval = 0;
            boost::hash_combine(Retval, GetType()->Hash());
            boost::hash_combine(Retval, IsSome());
            if (IsSome()) {
                boost::hash_combine(Retval, Inner->Hash());
            }
            return Retval;
        }

        // None orders before every Some
        i32 OptionValue::CompareSameType(const ValueBase& Other) const
        {
            auto OtherAsOpt = Other.SAs<OptionValue>();
            if (!IsSome() || !OtherAsOpt->IsSome()) {
                if (IsSome() == OtherAsOpt->IsSome()) {
                    return 0;
                }
                return (IsSome() ? 1 : -1);
            }
            return Inner->Compare(*(OtherAsOpt->Inner));
        }

        string OptionValue::ToString(u32 Verbosity) const
        {
            if (!IsSome()) {
                return "None";
            }
            return (string)"Some(" + Inner->ToString(Verbosity) + ")";
        }

        // RecordValue
        RecordValue::RecordValue(const TypeRef& RecordType, const vector<ValueRef>& FieldValues)
            : ValueBase(RecordType), FieldValues(FieldValues)
        {
            // Nothing here
        }

        RecordValue::~RecordValue()
        {
            // Nothing here
        }

        const vector<ValueRef>& RecordValue::GetFieldValues() const
        {
            return FieldValues;
        }

        const ValueRef& RecordValue::GetFieldValue(u32 Index) const
        {
            return FieldValues[Index];
        }

        const ValueRef& RecordValue::GetFieldValue(const string& FieldName) const
        {
            auto Index = GetType()->SAs<RecordType>()->GetFieldIndex(FieldName);
            if (Index < 0) {
                throw ModelingError((string)"Record value of type " + GetType()->ToString() +
                                    " has no field named \"" + FieldName + "\"");
            }
            return FieldValues[Index];
        }

        u64 RecordValue::ComputeHashValue() const
        {
            u64 Retval = 0;
            boost::hash_combine(Retval, GetType()->Hash());
            for (auto const& FieldValue : FieldValues) {
                boost::hash_combine(Retval, FieldValue->Hash());
            }
            return Retval;
        }

        i32 RecordValue::CompareSameType(const ValueBase& Other) const
        {
            return Detail::CompareValueVectors(FieldValues,
                                               Other.SAs<RecordValue>()->FieldValues);
        }

        string RecordValue::ToString(u32 Verbosity) const
        {
            auto RecType = GetType()->SAs<RecordType>();
            auto const& Fields = RecType->GetFields();
            const u32 NumFields = Fields.size();
            string Retval;

            if (RecType->IsTuple()) {
                Retval = "(";
                for (u32 i = 0; i < NumFields; ++i) {
                    Retval += (i == 0 ? "" : ", ") + FieldValues[i]->ToString(Verbosity);
                }
                return Retval + ")";
            }

            Retval = RecType->GetName() + "{";
            for (u32 i = 0; i < NumFields; ++i) {
                Retval += (i == 0 ? "" : ", ") + Fields[i].first + "=" +
                    FieldValues[i]->ToString(Verbosity);
            }
            return Retval + "}";
        }

        // MapValue
        MapValue::MapValue(const TypeRef& MapType, const ValueMapT& Entries)
            : ValueBase(MapType), Entries(Entries)
        {
            // Nothing here
        }

        MapValue::MapValue(const TypeRef& MapType, ValueMapT&& Entries)
            : ValueBase(MapType), Entries(std::move(Entries))
        {
            // Nothing here
        }

        MapValue::~MapValue()
        {
            // Nothing here
        }

        const ValueMapT& MapValue::GetEntries() const
        {
            return Entries;
        }

        ValueRef MapValue::Find(const ValueRef& Key) const
        {
            auto it = Entries.find(Key);
            if (it == Entries.end()) {
                return ValueRef::NullPtr;
            }
            return it->second;
        }

        u64 MapValue::ComputeHashValue() const
        {
            u64 Retval = 0;
            boost::hash_combine(Retval, GetType()->Hash());
            for (auto const& Entry : Entries) {
                boost::hash_combine(Retval, Entry.first->Hash());
                boost::hash_combine(Retval, Entry.second->Hash());
            }
            return Retval;
        }

        i32 MapValue::CompareSameType(const ValueBase& Other) const
        {
            return Detail::CompareValueMaps(Entries, Other.SAs<MapValue>()->Entries);
        }

        string MapValue::ToString(u32 Verbosity) const
        {
            return Detail::MapEntriesToString(Entries, Verbosity);
        }

        // DMapValue
        DMapValue::DMapValue(const TypeRef& DMapType, const OverrideListT& Overrides)
            : ValueBase(DMapType), Overrides(Overrides),
              Default(DMapType->SAs<MapTypeBase>()->GetValueType()->GetDefaultValue())
        {
            // Later overrides shadow earlier ones
            for (auto it = Overrides.rbegin(); it != Overrides.rend(); ++it) {
                if (Canonical.find(it->first) != Canonical.end()) {
                    continue;
                }
                Canonical[it->first] = it->second;
            }
            for (auto it = Canonical.begin(); it != Canonical.end(); ) {
                if (it->second->Equals(*Default)) {
                    it = Canonical.erase(it);
                } else {
                    ++it;
                }
            }
        }

        DMapValue::~DMapValue()
        {
            // Nothing here
        }

        const OverrideListT& DMapValue::GetOverrides() const
        {
            return Overrides;
        }

        const ValueRef& DMapValue::GetDefault() const
        {
            return Default;
        }

        const ValueMapT& DMapValue::GetCanonicalEntries() const
        {
            return Canonical;
        }

        const ValueRef& DMapValue::Get(const ValueRef& Key) const
        {
            for (auto it = Overrides.rbegin(); it != Overrides.rend(); ++it) {
                if (it->first->Equals(*Key)) {
                    return it->second;
                }
            }
            return Default;
        }

        ValueRef DMapValue::Set(const ValueRef& Key, const ValueRef& Value) const
        {
            OverrideListT NewOverrides;
            NewOverrides.reserve(Overrides.size() + 1);
            for (auto const& Override : Overrides) {
                if (!Override.first->Equals(*Key)) {
                    NewOverrides.push_back(Override);
                }
            }
            NewOverrides.push_back(make_pair(Key, Value));
            return new DMapValue(GetType(), NewOverrides);
        }

        u32 DMapValue::Count() const
        {
            return Canonical.size();
        }

        u64 DMapValue::ComputeHashValue() const
        {
            u64 Retval = 0;
            boost::hash_combine(Retval, GetType()->Hash());
            for (auto const& Entry : Canonical) {
                boost::hash_combine(Retval, Entry.first->Hash());
                boost::hash_combine(Retval, Entry.second->Hash());
            }
            return Retval;
        }

        i32 DMapValue::CompareSameType(const ValueBase& Other) const
        {
            return Detail::CompareValueMaps(Canonical, Other.SAs<DMapValue>()->Canonical);
        }

        string DMapValue::ToString(u32 Verbosity) const
        {
            if (Verbosity > 0) {
                string Retval = "DMap[";
                bool First = true;
                for (auto const& Override : Overrides) {
                    Retval += (First ? "" : ", ") + Override.first->ToString(Verbosity) +
                        " := " + Override.second->ToString(Verbosity);
                    First = false;
                }
                return Retval + "; default = " + Default->ToString(Verbosity) + "]";
            }
            return (string)"DMap" + Detail::MapEntriesToString(Canonical, Verbosity);
        }

    } /* end namespace Exprs */
} /* end namespace SYMX */

//
// Values.cpp ends here
