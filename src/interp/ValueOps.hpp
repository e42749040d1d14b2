// ValueOps.hpp ---
//
// Filename: ValueOps.hpp
// Author: Abhishek Udupa
// Created: Mon Jan 12 15:04:00 2015 (-0500)
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

// Concrete semantics of every operator, shared by the
// evaluator, the compiler and constant folding

#if !defined SYMX_VALUE_OPS_HPP_
#define SYMX_VALUE_OPS_HPP_

#include <vector>

#include "../common/SymxFwdDecls.hpp"
#include "../expr/Values.hpp"

namespace SYMX {
    namespace Interp {

        using Exprs::ValueRef;
        using Exprs::TypeRef;
        using Exprs::BigIntT;

        class ValueOps
        {
        public:
            static bool GetBool(const ValueRef& Value);
            static const BigIntT& GetBigInt(const ValueRef& Value);
            static ValueRef MakeBool(bool Value);

            // Fixed width arithmetic wraps, BigInt arithmetic is exact
            static ValueRef Add(const ValueRef& Value1, const ValueRef& Value2);
            static ValueRef Sub(const ValueRef& Value1, const ValueRef& Value2);
            static ValueRef Mul(const ValueRef& Value1, const ValueRef& Value2);
            // OpLT, OpLE, OpGT or OpGE. Respects the signedness of
            // fixed width integers.
            static ValueRef Compare(i64 OpCode, const ValueRef& Value1, const ValueRef& Value2);
            static ValueRef Equals(const ValueRef& Value1, const ValueRef& Value2);

            static ValueRef BitOp(i64 OpCode, const ValueRef& Value1, const ValueRef& Value2);
            static ValueRef BitNot(const ValueRef& Value);
            static ValueRef Cast(const ValueRef& Value, const TypeRef& TargetType);

            static ValueRef MkRecord(const TypeRef& RecordType, const vector<ValueRef>& Fields);
            static ValueRef Project(const ValueRef& Record, const string& FieldName);
            static ValueRef WithField(const ValueRef& Record, const string& FieldName,
                                      const ValueRef& FieldValue);

            static ValueRef OptSome(const TypeRef& OptionType, const ValueRef& Value);
            static ValueRef OptIsSome(const ValueRef& Option);
            // The inner value, or the default of the inner type for None
            static ValueRef OptValue(const ValueRef& Option);

            static ValueRef SeqUnit(const TypeRef& SeqType, const ValueRef& Elem);
            static ValueRef SeqConcat(const vector<ValueRef>& Seqs);
            static ValueRef SeqLength(const ValueRef& Seq);
            // Unit sequence of the element at Index, or empty when
            // Index is out of range
            static ValueRef SeqAt(const ValueRef& Seq, const ValueRef& Index);
            static ValueRef SeqSlice(const ValueRef& Seq, const ValueRef& Offset,
                                     const ValueRef& Length);
            // -1 when not found
            static ValueRef SeqIndexOf(const ValueRef& Seq, const ValueRef& Sub,
                                       const ValueRef& Offset);
            static ValueRef SeqContains(const ValueRef& Seq, const ValueRef& Sub);
            static ValueRef SeqStartsWith(const ValueRef& Seq, const ValueRef& Prefix);
            static ValueRef SeqEndsWith(const ValueRef& Seq, const ValueRef& Suffix);
            static ValueRef SeqReplaceFirst(const ValueRef& Seq, const ValueRef& Sub,
                                            const ValueRef& Replacement);
            static ValueRef SeqRegexMatch(const ValueRef& Seq, const Regex::RegexRef& Regex);

            static ValueRef MapGet(const TypeRef& ResultType, const ValueRef& Map,
                                   const ValueRef& Key);
            static ValueRef MapSet(const ValueRef& Map, const ValueRef& Key, const ValueRef& Value);
            static ValueRef MapDelete(const ValueRef& Map, const ValueRef& Key);

            static ValueRef DMapGet(const ValueRef& Map, const ValueRef& Key);
            static ValueRef DMapSet(const ValueRef& Map, const ValueRef& Key, const ValueRef& Value);
            static ValueRef DMapCount(const ValueRef& Map);

            // Applies an operator to already evaluated operands
            static ValueRef Apply(const Exprs::OpExpression* Exp, const vector<ValueRef>& Args);
        };

    } /* end namespace Interp */
} /* end namespace SYMX */

#endif /* SYMX_VALUE_OPS_HPP_ */

//
// ValueOps.hpp ends here
