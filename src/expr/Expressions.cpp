// Expressions.cpp ---
//
// Filename: Expressions.cpp
// Author: Abhishek Udupa
// Created: Thu Mar 26 14:57:00 2015 (-0500)
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

#include "SymxOps.hpp"
#include "Visitors.hpp"
#include "Expressions.hpp"

namespace SYMX {
    namespace Exprs {

        // ExpressionBase
        ExpressionBase::ExpressionBase(const TypeRef& ExpType)
            : ExpType(ExpType), HashValid(false), HashCode(0)
        {
            // Nothing here
        }

        ExpressionBase::~ExpressionBase()
        {
            // Nothing here
        }

        const TypeRef& ExpressionBase::GetType() const
        {
            return ExpType;
        }

        u64 ExpressionBase::Hash() const
        {
            if (!HashValid.load(memory_order_acquire)) {
                HashCode.store(ComputeHashValue(), memory_order_relaxed);
                HashValid.store(true, memory_order_release);
            }
            return HashCode.load(memory_order_relaxed);
        }

        i32 ExpressionBase::Compare(const ExpressionBase& Other) const
        {
            if (&Other == this) {
                return 0;
            }
            auto MyRank = GetKindRank();
            auto OtherRank = Other.GetKindRank();
            if (MyRank != OtherRank) {
                return (MyRank < OtherRank ? -1 : 1);
            }
            if (ExpType != Other.ExpType) {
                auto Res = ExpType->Compare(*(Other.ExpType));
                if (Res != 0) {
                    return Res;
                }
            }
            return CompareSameKind(Other);
        }

        bool ExpressionBase::Equals(const ExpressionBase& Other) const
        {
            if (&Other == this) {
                return true;
            }
            if (Hash() != Other.Hash()) {
                return false;
            }
            return (Compare(Other) == 0);
        }

        bool ExpressionBase::LT(const ExpressionBase& Other) const
        {
            return (Compare(Other) < 0);
        }

        bool ExpressionBase::FastEQ(const ExpressionBase& Other) const
        {
            return Equals(Other);
        }

        // ConstExpression
        ConstExpression::ConstExpression(const ValueRef& ConstValue)
            : ExpressionBase(ConstValue->GetType()), ConstValue(ConstValue)
        {
            // Nothing here
        }

        ConstExpression::~ConstExpression()
        {
            // Nothing here
        }

        const ValueRef& ConstExpression::GetConstValue() const
        {
            return ConstValue;
        }

        u64 ConstExpression::ComputeHashValue() const
        {
            u64 Retval = 0;
            boost::hash_combine(Retval, GetKindRank());
            boost::hash_combine(Retval, ConstValue->Hash());
            return Retval;
        }

        i32 ConstExpression::GetKindRank() const
        {
            return 0;
        }

        i32 ConstExpression::CompareSameKind(const ExpressionBase& Other) const
        {
            return ConstValue->Compare(*(Other.SAs<ConstExpression>()->ConstValue));
        }

        void ConstExpression::Accept(ExpressionVisitorBase* Visitor) const
        {
            Visitor->VisitConstExpression(this);
        }

        string ConstExpression::ToString(u32 Verbosity) const
        {
            return ConstValue->ToString(Verbosity);
        }

        // VarExpression
        VarExpression::VarExpression(const string& VarName, const TypeRef& VarType)
            : ExpressionBase(VarType), VarName(VarName)
        {
            // Nothing here
        }

        VarExpression::~VarExpression()
        {
            // Nothing here
        }

        const string& VarExpression::GetVarName() const
        {
            return VarName;
        }

        u64 VarExpression::ComputeHashValue() const
        {
            u64 Retval = 0;
            boost::hash_combine(Retval, GetKindRank());
            boost::hash_combine(Retval, VarName);
            boost::hash_combine(Retval, GetType()->Hash());
            return Retval;
        }

        i32 VarExpression::GetKindRank() const
        {
            return 1;
        }

        i32 VarExpression::CompareSameKind(const ExpressionBase& Other) const
        {
            return VarName.compare(Other.SAs<VarExpression>()->VarName);
        }

        void VarExpression::Accept(ExpressionVisitorBase* Visitor) const
        {
            Visitor->VisitVarExpression(this);
        }

        string VarExpression::ToString(u32 Verbosity) const
        {
            if (Verbosity > 0) {
                return VarName + " : " + GetType()->ToString();
            }
            return VarName;
        }

        // OpExpression
        OpExpression::OpExpression(i64 OpCode, const vector<ExpT>& Children,
                                   const TypeRef& ResultType, const string& Payload)
            : ExpressionBase(ResultType), OpCode(OpCode),
              Children(Children), Payload(Payload)
        {
            // Nothing here
        }

        OpExpression::~OpExpression()
        {
            // Nothing here
        }

        i64 OpExpression::GetOpCode() const
        {
            return OpCode;
        }

        const vector<ExpT>& OpExpression::GetChildren() const
        {
            return Children;
        }

        const string& OpExpression::GetPayload() const
        {
            return Payload;
        }

        u64 OpExpression::ComputeHashValue() const
        {
            u64 Retval = 0;
            boost::hash_combine(Retval, GetKindRank());
            boost::hash_combine(Retval, OpCode);
            for (auto const& Child : Children) {
                boost::hash_combine(Retval, Child->Hash());
            }
            boost::hash_combine(Retval, Payload);
            boost::hash_combine(Retval, GetType()->Hash());
            return Retval;
        }

        i32 OpExpression::GetKindRank() const
        {
            return 2;
        }

        i32 OpExpression::CompareSameKind(const ExpressionBase& Other) const
        {
            auto OtherAsOp = Other.SAs<OpExpression>();
            if (OpCode != OtherAsOp->OpCode) {
                return (OpCode < OtherAsOp->OpCode ? -1 : 1);
            }
            auto const& OtherChildren = OtherAsOp->Children;
            if (Children.size() != OtherChildren.size()) {
                return (Children.size() < OtherChildren.size() ? -1 : 1);
            }
            const u32 NumChildren = Children.size();
            for (u32 i = 0; i < NumChildren; ++i) {
                auto Res = Children[i]->Compare(*(OtherChildren[i]));
                if (Res != 0) {
                    return Res;
                }
            }
            return Payload.compare(OtherAsOp->Payload);
        }

        bool OpExpression::FastEQ(const ExpressionBase& Other) const
        {
            auto OtherAsOp = Other.As<OpExpression>();
            if (OtherAsOp == nullptr) {
                return false;
            }
            if (OpCode != OtherAsOp->OpCode ||
                GetType() != OtherAsOp->GetType() ||
                Payload != OtherAsOp->Payload) {
                return false;
            }
            auto const& OtherChildren = OtherAsOp->Children;
            if (Children.size() != OtherChildren.size()) {
                return false;
            }
            const u32 NumChildren = Children.size();
            for (u32 i = 0; i < NumChildren; ++i) {
                if (Children[i] != OtherChildren[i]) {
                    return false;
                }
            }
            return true;
        }

        void OpExpression::Accept(ExpressionVisitorBase* Visitor) const
        {
            Visitor->VisitOpExpression(this);
        }

        string OpExpression::ToString(u32 Verbosity) const
        {
            string Retval = (string)"(" + SymxOps::OpToString(OpCode);
            if (Payload.length() > 0) {
                Retval += "[" + Payload + "]";
            }
            if (OpCode == SymxOps::OpCAST || OpCode == SymxOps::OpMKRECORD) {
                Retval += "<" + GetType()->ToString() + ">";
            }
            for (auto const& Child : Children) {
                Retval += " " + Child->ToString(Verbosity);
            }
            return Retval + ")";
        }

        // ExpressionVisitorBase
        ExpressionVisitorBase::ExpressionVisitorBase(const string& Name)
            : Name(Name)
        {
            // Nothing here
        }

        ExpressionVisitorBase::~ExpressionVisitorBase()
        {
            // Nothing here
        }

        const string& ExpressionVisitorBase::GetName() const
        {
            return Name;
        }

        void ExpressionVisitorBase::VisitConstExpression(const ConstExpression* Exp)
        {
            return;
        }

        void ExpressionVisitorBase::VisitVarExpression(const VarExpression* Exp)
        {
            return;
        }

        void ExpressionVisitorBase::VisitOpExpression(const OpExpression* Exp)
        {
            auto const& Children = Exp->GetChildren();
            for (auto const& Child : Children) {
                Child->Accept(this);
            }
            return;
        }

    } /* end namespace Exprs */
} /* end namespace SYMX */

//
// Expressions.cpp ends here
