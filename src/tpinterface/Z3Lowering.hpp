// Z3Lowering.hpp ---
//
// Filename: Z3Lowering.hpp
// Author: Abhishek Udupa
// Created: Fri Mar 20 23:37:00 2015 (-0500)
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

// Translation of (map lowered) expressions into Z3 terms, and of
// Z3 model values back into values.
//
// Encoding:
//   Bool              -> Bool
//   fixed width ints  -> bit-vectors of the same width
//   BigInt            -> Int
//   Char              -> String of length one (an assumption is
//                        added for every character typed term)
//   String            -> String
//   Seq<T>            -> Seq<T'>
//   Option<T>         -> datatype None | Some(value : T')
//   records           -> tuple sorts
//   Map<K, V>         -> Array K' -> Option<V'>, a key is absent
//                        iff it maps to None

#if !defined SYMX_Z3_LOWERING_HPP_
#define SYMX_Z3_LOWERING_HPP_

#include <vector>
#include <unordered_map>

#include <z3.h>

#include "../common/SymxFwdDecls.hpp"
#include "../containers/RefCountable.hpp"
#include "../containers/SmartPtr.hpp"
#include "../expr/Expressions.hpp"
#include "../expr/Visitors.hpp"
#include "../regex/RegexAST.hpp"

#include "Z3Objects.hpp"

namespace SYMX {
    namespace TP {

        using Exprs::ExpT;
        using Exprs::ValueRef;
        using Exprs::TypeRef;

        // Remembers the sorts and declarations made for a session, so
        // that every assertion and every model query of the session
        // agree on them
        class Z3LoweredContext : public RefCountable
        {
        private:
            Z3Ctx Ctx;
            unordered_map<TypeRef, Z3Sort, SmartPtrIdentityHasher> TypeToSort;
            unordered_map<Regex::RegexRef, Z3Expr, SmartPtrIdentityHasher> LoweredRegexes;
            u64 SortCounter;
            vector<Z3Expr> Assumptions;

            Z3Sort MakeOptionSort(const Exprs::OptionType* Type);
            Z3Sort MakeRecordSort(const Exprs::RecordType* Type);
            // Null if terms of Type are unconstrained
            Z3Expr MakeTypeConstraint(const Z3Expr& Term, const TypeRef& Type);

        public:
            Z3LoweredContext(const Z3Ctx& Ctx);
            virtual ~Z3LoweredContext();

            const Z3Ctx& GetZ3Ctx() const;

            // Throws CapabilityError for types without an encoding
            const Z3Sort& GetZ3Sort(const TypeRef& Type);

            Z3Expr GetLoweredRegex(const Regex::RegexRef& Regex) const;
            void AddLoweredRegex(const Regex::RegexRef& Regex, const Z3Expr& Lowered);

            void AddAssumption(const Z3Expr& Assumption);
            const vector<Z3Expr>& GetAssumptions() const;
            void ClearAssumptions();

            // Constraints that every term of Type must satisfy, added
            // as assumptions
            void AddTypeAssumptions(const Z3Expr& Term, const TypeRef& Type);

            Z3Expr LowerValue(const ValueRef& Value);
            Z3Expr MakeNoneTerm(const TypeRef& OptType);
            Z3Expr MakeSomeTerm(const TypeRef& OptType, const Z3Expr& Inner);
        };

        typedef SmartPtr<Z3LoweredContext> Z3LCRef;

        // Escapes code points for Z3 string literals
        extern string MakeZ3StringLiteral(const vector<u32>& CodePoints);
        // Decodes the printed form of Z3 string values
        extern vector<u32> ParseZ3StringLiteral(const string& Literal);

        class Z3Lowerer : public Exprs::ExpressionVisitorBase
        {
        private:
            Z3LCRef LCtx;
            Z3Ctx Ctx;
            vector<Z3Expr> ExpStack;
            unordered_map<const Exprs::ExpressionBase*, Z3Expr> Lowered;

            Z3Expr LowerOp(const Exprs::OpExpression* Exp, const vector<Z3Expr>& Args);
            Z3Expr LowerArith(i64 OpCode, const TypeRef& Type, const vector<Z3Expr>& Args);
            Z3Expr LowerCompare(i64 OpCode, const TypeRef& Type, const vector<Z3Expr>& Args);
            Z3Expr LowerCast(const TypeRef& FromType, const TypeRef& ToType, const Z3Expr& Arg);
            Z3Expr LowerSeqOp(const Exprs::OpExpression* Exp, const vector<Z3Expr>& Args);
            Z3Expr LowerMapOp(const Exprs::OpExpression* Exp, const vector<Z3Expr>& Args);

        public:
            Z3Lowerer(const Z3LCRef& LCtx);
            virtual ~Z3Lowerer();

            virtual void VisitConstExpression(const Exprs::ConstExpression* Exp) override;
            virtual void VisitVarExpression(const Exprs::VarExpression* Exp) override;
            virtual void VisitOpExpression(const Exprs::OpExpression* Exp) override;

            static Z3Expr Do(const ExpT& Exp, const Z3LCRef& LCtx);
        };

        // Turns the Z3 term of a model value back into a value of
        // the given type
        // Maps whose model puts a value at every unstored key are
        // expanded when the key type has at most this many bits
        static const u32 MaxExpandedKeyWidth = 8;

        class Z3Raiser
        {
        private:
            Z3LCRef LCtx;
            Z3Ctx Ctx;
            Z3Model Model;

            void RaiseSeqElems(const Z3Expr& LExp, const TypeRef& ElemType,
                               vector<ValueRef>& Elems);
            // Collects the stored keys of an array term, mapped to
            // option values, and the option value of every other key
            void RaiseMapEntries(const Z3Expr& LExp, const Exprs::MapType* Type,
                                 ValueRef& Default, Exprs::ValueMapT& Stores);
            ValueRef RaiseMap(const Z3Expr& LExp, const TypeRef& Type);
            Z3_app GetApp(const Z3Expr& LExp) const;
            vector<u32> GetCodePoints(const Z3Expr& LExp) const;

        public:
            Z3Raiser(const Z3LCRef& LCtx, const Z3Model& Model);
            ~Z3Raiser();

            ValueRef Raise(const Z3Expr& LExp, const TypeRef& Type);

            static ValueRef Do(const Z3Expr& LExp, const TypeRef& Type,
                               const Z3LCRef& LCtx, const Z3Model& Model);
        };

    } /* end namespace TP */
} /* end namespace SYMX */

#endif /* SYMX_Z3_LOWERING_HPP_ */

//
// Z3Lowering.hpp ends here
