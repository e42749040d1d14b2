// Expressions.hpp ---
//
// Filename: Expressions.hpp
// Author: Abhishek Udupa
// Created: Thu May 21 01:13:00 2015 (-0500)
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

// Classes for expressions

#if !defined SYMX_EXPRESSIONS_HPP_
#define SYMX_EXPRESSIONS_HPP_

#include <vector>
#include <atomic>

#include "../common/SymxFwdDecls.hpp"
#include "../containers/RefCountable.hpp"
#include "../containers/SmartPtr.hpp"
#include "ExprTypes.hpp"
#include "Values.hpp"

namespace SYMX {
    namespace Exprs {

        // Expressions are immutable and interned by the ExprMgr,
        // so two expressions are structurally equal iff they are
        // the same object. The structural comparisons below are
        // only needed by the interning cache itself and for
        // producing deterministic orders.
        class ExpressionBase : public RefCountable, public Stringifiable
        {
        private:
            TypeRef ExpType;
            mutable atomic<bool> HashValid;
            mutable atomic<u64> HashCode;

        protected:
            virtual u64 ComputeHashValue() const = 0;
            // Rank of the kind of expression, in the total order
            virtual i32 GetKindRank() const = 0;
            virtual i32 CompareSameKind(const ExpressionBase& Other) const = 0;

        public:
            ExpressionBase(const TypeRef& ExpType);
            virtual ~ExpressionBase();

            const TypeRef& GetType() const;
            u64 Hash() const;
            i32 Compare(const ExpressionBase& Other) const;
            bool Equals(const ExpressionBase& Other) const;
            bool LT(const ExpressionBase& Other) const;

            // Fast eq which assumes that children can be compared for
            // equality by simple pointer equality
            virtual bool FastEQ(const ExpressionBase& Other) const;

            virtual void Accept(ExpressionVisitorBase* Visitor) const = 0;

            // Downcasts
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

        class ConstExpression : public ExpressionBase
        {
        private:
            ValueRef ConstValue;

        protected:
            virtual u64 ComputeHashValue() const override;
            virtual i32 GetKindRank() const override;
            virtual i32 CompareSameKind(const ExpressionBase& Other) const override;

        public:
            ConstExpression(const ValueRef& ConstValue);
            virtual ~ConstExpression();

            const ValueRef& GetConstValue() const;

            virtual void Accept(ExpressionVisitorBase* Visitor) const override;
            virtual string ToString(u32 Verbosity = 0) const override;
        };

        class VarExpression : public ExpressionBase
        {
        private:
            string VarName;

        protected:
            virtual u64 ComputeHashValue() const override;
            virtual i32 GetKindRank() const override;
            virtual i32 CompareSameKind(const ExpressionBase& Other) const override;

        public:
            VarExpression(const string& VarName, const TypeRef& VarType);
            virtual ~VarExpression();

            const string& GetVarName() const;

            virtual void Accept(ExpressionVisitorBase* Visitor) const override;
            virtual string ToString(u32 Verbosity = 0) const override;
        };

        class OpExpression : public ExpressionBase
        {
        private:
            i64 OpCode;
            vector<ExpT> Children;
            // Field name for PROJECT and WITHFIELD, pattern for
            // SEQREGEX, empty otherwise
            string Payload;

        protected:
            virtual u64 ComputeHashValue() const override;
            virtual i32 GetKindRank() const override;
            virtual i32 CompareSameKind(const ExpressionBase& Other) const override;

        public:
            OpExpression(i64 OpCode, const vector<ExpT>& Children,
                         const TypeRef& ResultType, const string& Payload = "");
            virtual ~OpExpression();

            i64 GetOpCode() const;
            const vector<ExpT>& GetChildren() const;
            const string& GetPayload() const;

            virtual bool FastEQ(const ExpressionBase& Other) const override;
            virtual void Accept(ExpressionVisitorBase* Visitor) const override;
            virtual string ToString(u32 Verbosity = 0) const override;
        };

        // Hashers and comparators
        class ExpressionPtrHasher
        {
        public:
            inline u64 operator () (const ExpT& Exp) const
            {
                return Exp->Hash();
            }
        };

        class ExpressionPtrEquals
        {
        public:
            inline bool operator () (const ExpT& Exp1, const ExpT& Exp2) const
            {
                return Exp1->Equals(*Exp2);
            }
        };

        class FastExpressionPtrEquals
        {
        public:
            inline bool operator () (const ExpT& Exp1, const ExpT& Exp2) const
            {
                return Exp1->FastEQ(*Exp2);
            }
        };

        class ExpressionPtrCompare
        {
        public:
            inline bool operator () (const ExpT& Exp1, const ExpT& Exp2) const
            {
                return Exp1->LT(*Exp2);
            }
        };

    } /* end namespace Exprs */
} /* end namespace SYMX */

#endif /* SYMX_EXPRESSIONS_HPP_ */

//
// Expressions.hpp ends here
