// ExprMgr.hpp ---
//
// Filename: ExprMgr.hpp
// Author: Abhishek Udupa
// Created: Sun Jun 07 03:40:00 2015 (-0500)
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

// The process wide manager for types and expressions. Every
// type and expression is constructed through it, type checked
// on construction, locally simplified and interned.

#if !defined SYMX_EXPR_MGR_HPP_
#define SYMX_EXPR_MGR_HPP_

#include <vector>
#include <atomic>

#include "../common/SymxFwdDecls.hpp"
#include "../containers/InternTable.hpp"
#include "ExprTypes.hpp"
#include "Values.hpp"
#include "Expressions.hpp"
#include "SymxOps.hpp"
#include "Visitors.hpp"

namespace SYMX {
    namespace Exprs {

        class ExprMgr
        {
        private:
            typedef InternTable<TypeBase, TypePtrHasher, TypePtrEquals> TypeCacheT;
            typedef InternTable<ExpressionBase, ExpressionPtrHasher,
                                FastExpressionPtrEquals> ExpCacheT;

            TypeCacheT TypeCache;
            ExpCacheT ExpCache;
            atomic<u64> FreshVarCounter;

            // Commonly used types, created once
            TypeRef BoolType;
            TypeRef BigIntType;
            TypeRef CharType;
            TypeRef StringType;
            TypeRef Int32Type;

            ExpT TrueExp;
            ExpT FalseExp;

            ExprMgr();

            inline ExpT Intern(const ExpressionBase* Exp)
            {
                return ExpCache.Intern(Exp);
            }

            // Checks the operands of an operator application and
            // returns the type of the result. TypeHint supplies the
            // target type of CAST and MKRECORD.
            TypeRef CheckOp(i64 OpCode, const vector<ExpT>& Children,
                            const string& Payload, const TypeRef& TypeHint);

            // Local, semantics preserving rewrites. Returns null if
            // no rewrite applies.
            ExpT SimplifyOp(i64 OpCode, const vector<ExpT>& Children,
                            const string& Payload, const TypeRef& ResultType);

            ExpT MakeOp(i64 OpCode, const vector<ExpT>& Children,
                        const string& Payload, const TypeRef& TypeHint);

            void CheckValueType(const ValueRef& Value, const TypeRef& Type,
                                const string& Context) const;

        public:
            ExprMgr(const ExprMgr& Other) = delete;
            ExprMgr(ExprMgr&& Other) = delete;
            ~ExprMgr();

            static ExprMgr& Instance();

            // Types
            template <typename T, typename... ArgTypes>
            inline TypeRef MakeType(ArgTypes&&... Args)
            {
                return TypeCache.Make<T>(forward<ArgTypes>(Args)...);
            }

            const TypeRef& GetBoolType() const;
            const TypeRef& GetBigIntType() const;
            const TypeRef& GetCharType() const;
            const TypeRef& GetStringType() const;
            const TypeRef& GetInt32Type() const;

            TypeRef MakeIntType(u32 Width, bool Signed);
            TypeRef MakeSeqType(const TypeRef& ElemType);
            TypeRef MakeOptionType(const TypeRef& InnerType);
            TypeRef MakeRecordType(const string& Name, const FieldListT& Fields);
            TypeRef MakeTupleType(const vector<TypeRef>& ElemTypes);
            TypeRef MakeMapType(const TypeRef& KeyType, const TypeRef& ValueType);
            TypeRef MakeDMapType(const TypeRef& KeyType, const TypeRef& ValueType);

            // Values, checked against their types
            ValueRef MakeBoolValue(bool Value);
            ValueRef MakeIntValue(const TypeRef& IntType, i64 Value);
            ValueRef MakeUIntValue(const TypeRef& IntType, u64 Value);
            ValueRef MakeBigIntValue(const BigIntT& Value);
            ValueRef MakeCharValue(u32 CodePoint);
            ValueRef MakeStringValue(const string& UTF8String);
            ValueRef MakeStringValue(const vector<u32>& CodePoints);
            ValueRef MakeSeqValue(const TypeRef& ElemType, const vector<ValueRef>& Elems);
            ValueRef MakeSomeValue(const ValueRef& Inner);
            ValueRef MakeNoneValue(const TypeRef& InnerType);
            ValueRef MakeRecordValue(const TypeRef& RecordType,
                                     const vector<ValueRef>& FieldValues);
            ValueRef MakeTupleValue(const vector<ValueRef>& ElemValues);
            ValueRef MakeMapValue(const TypeRef& MapType, const ValueMapT& Entries);
            ValueRef MakeDMapValue(const TypeRef& DMapType, const OverrideListT& Overrides);

            // Constants
            ExpT MakeVal(const ValueRef& Value);
            const ExpT& MakeTrue() const;
            const ExpT& MakeFalse() const;
            ExpT MakeBool(bool Value);
            ExpT MakeInt(const TypeRef& IntType, i64 Value);
            ExpT MakeUInt(const TypeRef& IntType, u64 Value);
            ExpT MakeInt32(i32 Value);
            ExpT MakeBigInt(const BigIntT& Value);
            ExpT MakeChar(u32 CodePoint);
            ExpT MakeString(const string& UTF8String);
            // Fails on a null literal
            ExpT MakeString(const char* UTF8String);
            ExpT MakeNone(const TypeRef& InnerType);
            ExpT MakeEmptySeq(const TypeRef& ElemType);
            ExpT MakeEmptyMap(const TypeRef& MapType);
            ExpT MakeEmptyDMap(const TypeRef& DMapType);

            // Variables
            ExpT MakeVar(const string& VarName, const TypeRef& VarType);
            ExpT MakeFreshVar(const TypeRef& VarType, const string& Prefix = "fresh");

            // Operators
            ExpT MakeExpr(i64 OpCode, const vector<ExpT>& Children);
            ExpT MakeExpr(i64 OpCode, const ExpT& Child1);
            ExpT MakeExpr(i64 OpCode, const ExpT& Child1, const ExpT& Child2);
            ExpT MakeExpr(i64 OpCode, const ExpT& Child1, const ExpT& Child2,
                          const ExpT& Child3);

            ExpT MakeCast(const ExpT& Exp, const TypeRef& TargetType);
            ExpT MakeRecord(const TypeRef& RecordType, const vector<ExpT>& FieldExps);
            ExpT MakeTuple(const vector<ExpT>& ElemExps);
            ExpT MakeProject(const ExpT& RecordExp, const string& FieldName);
            ExpT MakeWithField(const ExpT& RecordExp, const string& FieldName,
                               const ExpT& FieldExp);
            ExpT MakeRegexMatch(const ExpT& StringExp, const string& Pattern);

            // Rebuilds an operator application over new children,
            // keeping its op code, payload and (for CAST and MKRECORD)
            // its type
            ExpT MakeOpLike(const OpExpression* Exp, const vector<ExpT>& NewChildren);

            ExpT Substitute(const SubstMapT& Subst, const ExpT& Exp);
            vector<ExpT> GatherVars(const ExpT& Exp) const;

            u64 GetNumExpressions() const;
            u64 GetNumTypes() const;
        };

    } /* end namespace Exprs */
} /* end namespace SYMX */

#endif /* SYMX_EXPR_MGR_HPP_ */

//
// ExprMgr.hpp ends here
