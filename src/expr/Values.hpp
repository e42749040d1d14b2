// Values.hpp ---
//
// Filename: Values.hpp
// Author: Abhishek Udupa
// Created: Fri May 01 17:15:00 2015 (-0500)
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

// Concrete values: the results of evaluation, the entries of
// solver models and the payload of constant expressions

#if !defined SYMX_VALUES_HPP_
#define SYMX_VALUES_HPP_

#include <vector>
#include <map>
#include <atomic>
#include <boost/multiprecision/cpp_int.hpp>

#include "../common/SymxFwdDecls.hpp"
#include "../containers/RefCountable.hpp"
#include "../containers/SmartPtr.hpp"

#include "ExprTypes.hpp"

namespace SYMX {
    namespace Exprs {

        typedef boost::multiprecision::cpp_int BigIntT;

        class ValueBase : public RefCountable, public Stringifiable
        {
        private:
            TypeRef ValType;
            mutable atomic<bool> HashValid;
            mutable atomic<u64> HashCode;

        protected:
            virtual u64 ComputeHashValue() const = 0;
            // Only called with a value of the same type
            virtual i32 CompareSameType(const ValueBase& Other) const = 0;

        public:
            ValueBase(const TypeRef& ValType);
            virtual ~ValueBase();

            const TypeRef& GetType() const;

            u64 Hash() const;
            i32 Compare(const ValueBase& Other) const;
            bool Equals(const ValueBase& Other) const;
            bool LT(const ValueBase& Other) const;

            template <typename T>
            inline T* As()
            {
                return dynamic_cast<T*>(this);
            }

            template <typename T>
            inline const T* As() const
            {
                return dynamic_cast<const T*>(this);
            }

            template <typename T>
            inline T* SAs()
            {
                return static_cast<T*>(this);
            }

            template <typename T>
            inline const T* SAs() const
            {
                return static_cast<const T*>(this);
            }

            template <typename T>
            inline bool Is() const
            {
                return (dynamic_cast<const T*>(this) != nullptr);
            }
        };

        class ValuePtrHasher
        {
        public:
            inline u64 operator () (const ValueRef& Value) const
            {
                return Value->Hash();
            }
        };

        class ValuePtrEquals
        {
        public:
            inline bool operator () (const ValueRef& Value1, const ValueRef& Value2) const
            {
                return Value1->Equals(*Value2);
            }
        };

        class ValuePtrCompare
        {
        public:
            inline bool operator () (const ValueRef& Value1, const ValueRef& Value2) const
            {
                return Value1->LT(*Value2);
            }
        };

        class BoolValue : public ValueBase
        {
        private:
            bool Value;

        protected:
            virtual u64 ComputeHashValue() const override;
            virtual i32 CompareSameType(const ValueBase& Other) const override;

        public:
            BoolValue(const TypeRef& BoolType, bool Value);
            virtual ~BoolValue();

            bool GetValue() const;
            virtual string ToString(u32 Verbosity = 0) const override;
        };

        // Raw bits, masked to the width of the type
        class IntValue : public ValueBase
        {
        private:
            u64 Bits;

        protected:
            virtual u64 ComputeHashValue() const override;
            virtual i32 CompareSameType(const ValueBase& Other) const override;

        public:
            IntValue(const TypeRef& IntType, u64 Bits);
            virtual ~IntValue();

            u64 GetBits() const;
            // Sign extended according to the signedness of the type
            i64 GetSigned() const;
            u64 GetUnsigned() const;
            BigIntT ToBigInt() const;
            bool IsSigned() const;
            u32 GetWidth() const;

            virtual string ToString(u32 Verbosity = 0) const override;
        };

        class BigIntValue : public ValueBase
        {
        private:
            BigIntT Value;

        protected:
            virtual u64 ComputeHashValue() const override;
            virtual i32 CompareSameType(const ValueBase& Other) const override;

        public:
            BigIntValue(const TypeRef& BigIntType, const BigIntT& Value);
            virtual ~BigIntValue();

            const BigIntT& GetValue() const;
            virtual string ToString(u32 Verbosity = 0) const override;
        };

        class CharValue : public ValueBase
        {
        private:
            u32 CodePoint;

        protected:
            virtual u64 ComputeHashValue() const override;
            virtual i32 CompareSameType(const ValueBase& Other) const override;

        public:
            CharValue(const TypeRef& CharType, u32 CodePoint);
            virtual ~CharValue();

            u32 GetCodePoint() const;
            virtual string ToString(u32 Verbosity = 0) const override;
        };

        class SeqValue : public ValueBase
        {
        private:
            vector<ValueRef> Elems;

        protected:
            virtual u64 ComputeHashValue() const override;
            virtual i32 CompareSameType(const ValueBase& Other) const override;

        public:
            SeqValue(const TypeRef& SeqType, const vector<ValueRef>& Elems);
            SeqValue(const TypeRef& SeqType, vector<ValueRef>&& Elems);
            virtual ~SeqValue();

            const vector<ValueRef>& GetElems() const;
            u64 GetLength() const;
            bool IsString() const;
            // Code points, only valid for strings
            vector<u32> GetCodePoints() const;
            // UTF-8 encoding, only valid for strings
            string GetString() const;

            virtual string ToString(u32 Verbosity = 0) const override;
        };

        class OptionValue : public ValueBase
        {
        private:
            // Null for None
            ValueRef Inner;

        protected:
            virtual u64 ComputeHashValue() const override;
            virtual i32 CompareSameType(const ValueBase& Other) const override;

        public:
            OptionValue(const TypeRef& OptionType, const ValueRef& Inner);
            virtual ~OptionValue();

            bool IsSome() const;
            const ValueRef& GetInner() const;

            virtual string ToString(u32 Verbosity = 0) const override;
        };

        class RecordValue : public ValueBase
        {
        private:
            vector<ValueRef> FieldValues;

        protected:
            virtual u64 ComputeHashValue() const override;
            virtual i32 CompareSameType(const ValueBase& Other) const override;

        public:
            RecordValue(const TypeRef& RecordType, const vector<ValueRef>& FieldValues);
            virtual ~RecordValue();

            const vector<ValueRef>& GetFieldValues() const;
            const ValueRef& GetFieldValue(u32 Index) const;
            const ValueRef& GetFieldValue(const string& FieldName) const;

            virtual string ToString(u32 Verbosity = 0) const override;
        };

        typedef map<ValueRef, ValueRef, ValuePtrCompare> ValueMapT;

        class MapValue : public ValueBase
        {
        private:
            ValueMapT Entries;

        protected:
            virtual u64 ComputeHashValue() const override;
            virtual i32 CompareSameType(const ValueBase& Other) const override;

        public:
            MapValue(const TypeRef& MapType, const ValueMapT& Entries);
            MapValue(const TypeRef& MapType, ValueMapT&& Entries);
            virtual ~MapValue();

            const ValueMapT& GetEntries() const;
            // Null if the key is absent
            ValueRef Find(const ValueRef& Key) const;

            virtual string ToString(u32 Verbosity = 0) const override;
        };

        typedef vector<pair<ValueRef, ValueRef>> OverrideListT;

        // An override list over a default. Lookups walk the list from
        // the most recent override. Identity is extensional: two maps
        // are equal iff they agree on every key.
        class DMapValue : public ValueBase
        {
        private:
            OverrideListT Overrides;
            ValueRef Default;
            // Sorted, non-default entries
            ValueMapT Canonical;

        protected:
            virtual u64 ComputeHashValue() const override;
            virtual i32 CompareSameType(const ValueBase& Other) const override;

        public:
            DMapValue(const TypeRef& DMapType, const OverrideListT& Overrides);
            virtual ~DMapValue();

            const OverrideListT& GetOverrides() const;
            const ValueRef& GetDefault() const;
            const ValueMapT& GetCanonicalEntries() const;

            const ValueRef& Get(const ValueRef& Key) const;
            // A new map with Key bound to Value, replacing any
            // earlier override of Key
            ValueRef Set(const ValueRef& Key, const ValueRef& Value) const;
            // Number of keys that read something other than the default
            u32 Count() const;

            virtual string ToString(u32 Verbosity = 0) const override;
        };

    } /* end namespace Exprs */
} /* end namespace SYMX */

#endif /* SYMX_VALUES_HPP_ */

//
// Values.hpp ends here
