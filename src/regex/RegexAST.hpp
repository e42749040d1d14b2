// RegexAST.hpp ---
//
// Filename: RegexAST.hpp
// Author: Abhishek Udupa
// Created: Sun May 10 15:50:00 2015 (-0500)
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

// Hash consed regular expressions over code points. Nodes are
// only created through the RegexMgr, which keeps them in a
// normal form: concatenations and unions associate to the
// right, unions are sorted and free of duplicates, and
// character classes are sorted lists of disjoint ranges.

#if !defined SYMX_REGEX_AST_HPP_
#define SYMX_REGEX_AST_HPP_

#include <vector>
#include <utility>
#include <atomic>

#include "../common/SymxFwdDecls.hpp"
#include "../containers/RefCountable.hpp"
#include "../containers/SmartPtr.hpp"

namespace SYMX {
    namespace Regex {

        enum class RegexKindT {
            Empty, Epsilon, CharClass, Concat, Union, Star
        };

        // Inclusive ranges of code points
        typedef vector<pair<u32, u32>> CharRangeListT;

        class RegexBase : public RefCountable, public Stringifiable
        {
        private:
            RegexKindT Kind;
            bool Nullable;
            mutable atomic<bool> HashValid;
            mutable atomic<u64> HashCode;

        protected:
            virtual u64 ComputeHashValue() const = 0;
            virtual i32 CompareSameKind(const RegexBase& Other) const = 0;

        public:
            RegexBase(RegexKindT Kind, bool Nullable);
            virtual ~RegexBase();

            RegexKindT GetKind() const;
            // True iff the empty string is accepted
            bool IsNullable() const;
            u64 Hash() const;
            i32 Compare(const RegexBase& Other) const;
            bool LT(const RegexBase& Other) const;
            // Assumes that children are already interned
            virtual bool FastEQ(const RegexBase& Other) const;

            template <typename T>
            inline const T* As() const
            {
                return dynamic_cast<const T*>(this);
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

        class RegexEmpty : public RegexBase
        {
        protected:
            virtual u64 ComputeHashValue() const override;
            virtual i32 CompareSameKind(const RegexBase& Other) const override;

        public:
            RegexEmpty();
            virtual ~RegexEmpty();
            virtual string ToString(u32 Verbosity = 0) const override;
        };

        class RegexEpsilon : public RegexBase
        {
        protected:
            virtual u64 ComputeHashValue() const override;
            virtual i32 CompareSameKind(const RegexBase& Other) const override;

        public:
            RegexEpsilon();
            virtual ~RegexEpsilon();
            virtual string ToString(u32 Verbosity = 0) const override;
        };

        class RegexCharClass : public RegexBase
        {
        private:
            CharRangeListT Ranges;

        protected:
            virtual u64 ComputeHashValue() const override;
            virtual i32 CompareSameKind(const RegexBase& Other) const override;

        public:
            // Ranges must be sorted, disjoint and non adjacent
            RegexCharClass(const CharRangeListT& Ranges);
            virtual ~RegexCharClass();

            const CharRangeListT& GetRanges() const;
            bool Contains(u32 CodePoint) const;

            virtual bool FastEQ(const RegexBase& Other) const override;
            virtual string ToString(u32 Verbosity = 0) const override;
        };

        // Common base for concatenation and union
        class RegexBinaryBase : public RegexBase
        {
        private:
            RegexRef Left;
            RegexRef Right;

        protected:
            virtual u64 ComputeHashValue() const override;
            virtual i32 CompareSameKind(const RegexBase& Other) const override;

        public:
            RegexBinaryBase(RegexKindT Kind, bool Nullable,
                            const RegexRef& Left, const RegexRef& Right);
            virtual ~RegexBinaryBase();

            const RegexRef& GetLeft() const;
            const RegexRef& GetRight() const;

            virtual bool FastEQ(const RegexBase& Other) const override;
        };

        class RegexConcat : public RegexBinaryBase
        {
        public:
            RegexConcat(const RegexRef& Left, const RegexRef& Right);
            virtual ~RegexConcat();
            virtual string ToString(u32 Verbosity = 0) const override;
        };

        class RegexUnion : public RegexBinaryBase
        {
        public:
            RegexUnion(const RegexRef& Left, const RegexRef& Right);
            virtual ~RegexUnion();
            virtual string ToString(u32 Verbosity = 0) const override;
        };

        class RegexStar : public RegexBase
        {
        private:
            RegexRef Inner;

        protected:
            virtual u64 ComputeHashValue() const override;
            virtual i32 CompareSameKind(const RegexBase& Other) const override;

        public:
            RegexStar(const RegexRef& Inner);
            virtual ~RegexStar();

            const RegexRef& GetInner() const;

            virtual bool FastEQ(const RegexBase& Other) const override;
            virtual string ToString(u32 Verbosity = 0) const override;
        };

        class RegexPtrHasher
        {
        public:
            inline u64 operator () (const RegexRef& Regex) const
            {
                return Regex->Hash();
            }
        };

        class FastRegexPtrEquals
        {
        public:
            inline bool operator () (const RegexRef& Regex1, const RegexRef& Regex2) const
            {
                return Regex1->FastEQ(*Regex2);
            }
        };

        class RegexPtrCompare
        {
        public:
            inline bool operator () (const RegexRef& Regex1, const RegexRef& Regex2) const
            {
                return Regex1->LT(*Regex2);
            }
        };

    } /* end namespace Regex */
} /* end namespace SYMX */

#endif /* SYMX_REGEX_AST_HPP_ */

//
// RegexAST.hpp ends here
