// ExprTypes.hpp ---
//
// Filename: ExprTypes.hpp
// Author: Abhishek Udupa
// Created: Sun May 03 22:33:00 2015 (-0500)
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

#if !defined SYMX_EXPR_TYPES_HPP_
#define SYMX_EXPR_TYPES_HPP_

#include <vector>
#include <utility>
#include <atomic>
#include <mutex>

#include "../common/SymxFwdDecls.hpp"
#include "../containers/RefCountable.hpp"
#include "../containers/SmartPtr.hpp"

namespace SYMX {
    namespace Exprs {

        // Raised for every ill-typed or malformed construction
        class ExprTypeError : public ModelingError
        {
        public:
            inline ExprTypeError(const string& Message)
                : ModelingError((string)"ExprTypeError: " + Message)
            {
                // Nothing here
            }

            inline virtual ~ExprTypeError() throw ()
            {
                // Nothing here
            }
        };

        // Rank of each kind of type in the total order on types
        enum class TypeKindT {
            Boolean, Integer, BigInt, Char, Seq, Option, Record, Map, DMap
        };

        class TypeBase : public RefCountable, public Stringifiable
        {
        private:
            mutable atomic<bool> HashValid;
            mutable atomic<u64> HashCode;
            mutable once_flag DefaultValueFlag;
            mutable ValueRef DefaultValue;

        protected:
            virtual u64 ComputeHashValue() const = 0;
            virtual i32 CompareSameKind(const TypeBase& Other) const = 0;
            virtual ValueRef MakeDefaultValue() const = 0;

        public:
            TypeBase();
            virtual ~TypeBase();

            virtual TypeKindT GetKind() const = 0;

            u64 Hash() const;
            i32 Compare(const TypeBase& Other) const;
            bool Equals(const TypeBase& Other) const;
            bool LT(const TypeBase& Other) const;

            // The value every unconstrained variable of this type reads
            const ValueRef& GetDefaultValue() const;

            // True if this type is or contains a general or
            // default-valued map anywhere in its structure
            virtual bool ContainsMap() const;
            virtual bool ContainsDMap() const;

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

        class BooleanType : public TypeBase
        {
        protected:
            virtual u64 ComputeHashValue() const override;
            virtual i32 CompareSameKind(const TypeBase& Other) const override;
            virtual ValueRef MakeDefaultValue() const override;

        public:
            BooleanType();
            virtual ~BooleanType();

            virtual TypeKindT GetKind() const override;
            virtual string ToString(u32 Verbosity = 0) const override;
        };

        // Two's complement fixed width integers, all arithmetic
        // wraps around modulo 2^Width
        class IntegerType : public TypeBase
        {
        private:
            u32 Width;
            bool Signed;

        protected:
            virtual u64 ComputeHashValue() const override;
            virtual i32 CompareSameKind(const TypeBase& Other) const override;
            virtual ValueRef MakeDefaultValue() const override;

        public:
            IntegerType(u32 Width, bool Signed);
            virtual ~IntegerType();

            u32 GetWidth() const;
            bool IsSigned() const;
            u64 GetMask() const;
            i64 GetMinSigned() const;
            i64 GetMaxSigned() const;
            u64 GetMaxUnsigned() const;

            virtual TypeKindT GetKind() const override;
            virtual string ToString(u32 Verbosity = 0) const override;
        };

        class BigIntType : public TypeBase
        {
        protected:
            virtual u64 ComputeHashValue() const override;
            virtual i32 CompareSameKind(const TypeBase& Other) const override;
            virtual ValueRef MakeDefaultValue() const override;

        public:
            BigIntType();
            virtual ~BigIntType();

            virtual TypeKindT GetKind() const override;
            virtual string ToString(u32 Verbosity = 0) const override;
        };

        class CharType : public TypeBase
        {
        protected:
            virtual u64 ComputeHashValue() const override;
            virtual i32 CompareSameKind(const TypeBase& Other) const override;
            virtual ValueRef MakeDefaultValue() const override;

        public:
            static const u32 MaxCodePoint = 0x2FFFF;

            CharType();
            virtual ~CharType();

            virtual TypeKindT GetKind() const override;
            virtual string ToString(u32 Verbosity = 0) const override;
        };

        class SeqType : public TypeBase
        {
        private:
            TypeRef ElemType;

        protected:
            virtual u64 ComputeHashValue() const override;
            virtual i32 CompareSameKind(const TypeBase& Other) const override;
            virtual ValueRef MakeDefaultValue() const override;

        public:
            SeqType(const TypeRef& ElemType);
            virtual ~SeqType();

            const TypeRef& GetElemType() const;
            bool IsString() const;

            virtual TypeKindT GetKind() const override;
            virtual string ToString(u32 Verbosity = 0) const override;
            virtual bool ContainsMap() const override;
            virtual bool ContainsDMap() const override;
        };

        class OptionType : public TypeBase
        {
        private:
            TypeRef InnerType;

        protected:
            virtual u64 ComputeHashValue() const override;
            virtual i32 CompareSameKind(const TypeBase& Other) const override;
            virtual ValueRef MakeDefaultValue() const override;

        public:
            OptionType(const TypeRef& InnerType);
            virtual ~OptionType();

            const TypeRef& GetInnerType() const;

            virtual TypeKindT GetKind() const override;
            virtual string ToString(u32 Verbosity = 0) const override;
            virtual bool ContainsMap() const override;
            virtual bool ContainsDMap() const override;
        };

        typedef vector<pair<string, TypeRef>> FieldListT;

        // Tuples are records named "Tuple", with fields Item1 ... ItemN
        class RecordType : public TypeBase
        {
        private:
            string Name;
            FieldListT Fields;

        protected:
            virtual u64 ComputeHashValue() const override;
            virtual i32 CompareSameKind(const TypeBase& Other) const override;
            virtual ValueRef MakeDefaultValue() const override;

        public:
            static const string TupleName;

            RecordType(const string& Name, const FieldListT& Fields);
            virtual ~RecordType();

            const string& GetName() const;
            const FieldListT& GetFields() const;
            u32 GetNumFields() const;
            // -1 if there is no such field
            i32 GetFieldIndex(const string& FieldName) const;
            const TypeRef& GetFieldType(const string& FieldName) const;
            bool IsTuple() const;

            static string GetTupleFieldName(u32 Index);

            virtual TypeKindT GetKind() const override;
            virtual string ToString(u32 Verbosity = 0) const override;
            virtual bool ContainsMap() const override;
            virtual bool ContainsDMap() const override;
        };

        // Common base for the two kinds of maps
        class MapTypeBase : public TypeBase
        {
        protected:
            TypeRef KeyType;
            TypeRef ValueType;

            virtual u64 ComputeHashValue() const override;
            virtual i32 CompareSameKind(const TypeBase& Other) const override;

        public:
            MapTypeBase(const TypeRef& KeyType, const TypeRef& ValueType);
            virtual ~MapTypeBase();

            const TypeRef& GetKeyType() const;
            const TypeRef& GetValueType() const;

            virtual bool ContainsMap() const override;
        };

        // General finite map. Get yields Option<ValueType>
        class MapType : public MapTypeBase
        {
        protected:
            virtual ValueRef MakeDefaultValue() const override;

        public:
            MapType(const TypeRef& KeyType, const TypeRef& ValueType);
            virtual ~MapType();

            virtual TypeKindT GetKind() const override;
            virtual string ToString(u32 Verbosity = 0) const override;
            virtual bool ContainsDMap() const override;
        };

        // Default valued map: every key reads the default value of
        // ValueType unless overridden
        class DMapType : public MapTypeBase
        {
        protected:
            virtual ValueRef MakeDefaultValue() const override;

        public:
            DMapType(const TypeRef& KeyType, const TypeRef& ValueType);
            virtual ~DMapType();

            virtual TypeKindT GetKind() const override;
            virtual string ToString(u32 Verbosity = 0) const override;
            virtual bool ContainsDMap() const override;
        };

        // Hashers and comparators for the type cache
        class TypePtrHasher
        {
        public:
            inline u64 operator () (const TypeRef& Type) const
            {
                return Type->Hash();
            }
        };

        class TypePtrEquals
        {
        public:
            inline bool operator () (const TypeRef& Type1, const TypeRef& Type2) const
            {
                return Type1->Equals(*Type2);
            }
        };

        class TypePtrCompare
        {
        public:
            inline bool operator () (const TypeRef& Type1, const TypeRef& Type2) const
            {
                return Type1->LT(*Type2);
            }
        };

    } /* end namespace Exprs */
} /* end namespace SYMX */

#endif /* SYMX_EXPR_TYPES_HPP_ */

//
// ExprTypes.hpp ends here
