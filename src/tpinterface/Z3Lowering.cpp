// Z3Lowering.cpp ---
//
// Filename: Z3Lowering.cpp
// Author: Abhishek Udupa
// Created: Mon Apr 13 12:41:00 2015 (-0500)
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

#include <sstream>

#include "../expr/ExprMgr.hpp"
#include "../expr/SymxOps.hpp"
#include "../regex/RegexMgr.hpp"

#include "Z3Lowering.hpp"
#include "Z3RegexLowerer.hpp"

namespace SYMX {
    namespace TP {

        using namespace Exprs;

        namespace Detail {

            // True if the type has a character that is not part of a
            // string. Such characters need a length constraint, which
            // cannot be stated for elements of sequences and maps.
            static inline bool HasBareChar(const TypeRef& Type)
            {
                switch (Type->GetKind()) {
                case TypeKindT::Char:
                    return true;
                case TypeKindT::Seq: {
                    auto TypeAsSeq = Type->SAs<SeqType>();
                    return (!TypeAsSeq->IsString() && HasBareChar(TypeAsSeq->GetElemType()));
                }
                case TypeKindT::Option:
                    return HasBareChar(Type->SAs<OptionType>()->GetInnerType());
                case TypeKindT::Record:
                    for (auto const& Field : Type->SAs<RecordType>()->GetFields()) {
                        if (HasBareChar(Field.second)) {
                            return true;
                        }
                    }
                    return false;
                case TypeKindT::Map:
                case TypeKindT::DMap: {
                    auto TypeAsMap = Type->SAs<MapTypeBase>();
                    return (HasBareChar(TypeAsMap->GetKeyType()) ||
                            HasBareChar(TypeAsMap->GetValueType()));
                }
                default:
                    return false;
                }
            }

            // Terms of such types get assumptions when they are declared
            static inline bool NeedsConstraint(const TypeRef& Type)
            {
                return (HasBareChar(Type) || Type->ContainsMap());
            }

            static inline vector<Z3_ast> ToASTs(const vector<Z3Expr>& Terms)
            {
                vector<Z3_ast> Retval(Terms.size());
                for (u32 i = 0; i < Terms.size(); ++i) {
                    Retval[i] = Terms[i];
                }
                return Retval;
            }

            static inline u32 ParseHexDigits(const string& Literal, u32 Start, u32 End)
            {
                u32 Retval = 0;
                for (u32 i = Start; i < End; ++i) {
                    auto Digit = Literal[i];
                    Retval <<= 4;
                    if (Digit >= '0' && Digit <= '9') {
                        Retval |= (Digit - '0');
                    } else if (Digit >= 'a' && Digit <= 'f') {
                        Retval |= (Digit - 'a' + 10);
                    } else if (Digit >= 'A' && Digit <= 'F') {
                        Retval |= (Digit - 'A' + 10);
                    } else {
                        throw EngineError((string)"Malformed escape in string value \"" +
                                          Literal + "\" returned by Z3");
                    }
                }
                return Retval;
            }

        } /* end namespace Detail */

        string MakeZ3StringLiteral(const vector<u32>& CodePoints)
        {
            ostringstream sstr;
            for (auto CodePoint : CodePoints) {
                if (CodePoint >= 32 && CodePoint < 127 && CodePoint != '\\') {
                    sstr << (char)CodePoint;
                } else {
                    sstr << "\\u{" << hex << CodePoint << dec << "}";
                }
            }
            return sstr.str();
        }

        vector<u32> ParseZ3StringLiteral(const string& Literal)
        {
            vector<u32> Retval;
            const u32 Length = Literal.length();
            u32 i = 0;

            while (i < Length) {
                if (Literal[i] != '\\' || i + 1 == Length) {
                    Retval.push_back((u08)Literal[i]);
                    ++i;
                    continue;
                }

                auto Escape = Literal[i + 1];
                if (Escape == 'u' && i + 2 < Length && Literal[i + 2] == '{') {
                    auto Close = Literal.find('}', i + 3);
                    if (Close == string::npos) {
                        throw EngineError((string)"Unterminated escape in string value \"" +
                                          Literal + "\" returned by Z3");
                    }
                    Retval.push_back(Detail::ParseHexDigits(Literal, i + 3, Close));
                    i = Close + 1;
                } else if (Escape == 'u' && i + 5 < Length) {
                    Retval.push_back(Detail::ParseHexDigits(Literal, i + 2, i + 6));
                    i += 6;
                } else if (Escape == 'x' && i + 3 < Length) {
                    Retval.push_back(Detail::ParseHexDigits(Literal, i + 2, i + 4));
                    i += 4;
                } else {
                    switch (Escape) {
                    case 'n': Retval.push_back('\n'); break;
                    case 't': Retval.push_back('\t'); break;
                    case 'r': Retval.push_back('\r'); break;
                    case 'a': Retval.push_back('\a'); break;
                    case 'b': Retval.push_back('\b'); break;
                    case 'f': Retval.push_back('\f'); break;
                    case 'v': Retval.push_back('\v'); break;
                    default: Retval.push_back((u08)Escape); break;
                    }
                    i += 2;
                }
            }
            return Retval;
        }

        // Z3LoweredContext implementation
        Z3LoweredContext::Z3LoweredContext(const Z3Ctx& Ctx)
            : Ctx(Ctx), SortCounter(0)
        {
            // Nothing here
        }

        Z3LoweredContext::~Z3LoweredContext()
        {
            // The Z3 objects must go before the context goes
            Assumptions.clear();
            LoweredRegexes.clear();
            TypeToSort.clear();
        }

        const Z3Ctx& Z3LoweredContext::GetZ3Ctx() const
        {
            return Ctx;
        }

        Z3Sort Z3LoweredContext::MakeOptionSort(const OptionType* Type)
        {
            auto const& InnerSort = GetZ3Sort(Type->GetInnerType());
            auto Suffix = "!" + to_string(SortCounter++);

            auto NoneName = Z3_mk_string_symbol(*Ctx, ("None" + Suffix).c_str());
            auto IsNoneName = Z3_mk_string_symbol(*Ctx, ("is-None" + Suffix).c_str());
            auto SomeName = Z3_mk_string_symbol(*Ctx, ("Some" + Suffix).c_str());
            auto IsSomeName = Z3_mk_string_symbol(*Ctx, ("is-Some" + Suffix).c_str());
            Z3_symbol ValueName = Z3_mk_string_symbol(*Ctx, ("value" + Suffix).c_str());

            Z3_sort FieldSorts[1] = { InnerSort };
            unsigned SortRefs[1] = { 0 };
            Z3_constructor Constructors[2];
            Constructors[0] = Z3_mk_constructor(*Ctx, NoneName, IsNoneName, 0,
                                                nullptr, nullptr, nullptr);
            Constructors[1] = Z3_mk_constructor(*Ctx, SomeName, IsSomeName, 1,
                                                &ValueName, FieldSorts, SortRefs);
            auto DTName = Z3_mk_string_symbol(*Ctx, ("Option" + Suffix).c_str());
            Z3Sort Retval(Ctx, Z3_mk_datatype(*Ctx, DTName, 2, Constructors));

            // The queried declarations are only held by the
            // constructors and by the last result of the context, so
            // each one is referenced before the next call into Z3
            Z3_func_decl NoneDecl, IsNoneDecl, SomeDecl, IsSomeDecl, ValueDecl;
            Z3_query_constructor(*Ctx, Constructors[0], 0, &NoneDecl, &IsNoneDecl, nullptr);
            Ctx->CheckError("option sort construction");
            Retval.AddFuncDecl("None", NoneDecl);
            Retval.AddFuncDecl("is-None", IsNoneDecl);

            Z3_query_constructor(*Ctx, Constructors[1], 1, &SomeDecl, &IsSomeDecl, &ValueDecl);
            Ctx->CheckError("option sort construction");
            Retval.AddFuncDecl("Some", SomeDecl);
            Retval.AddFuncDecl("is-Some", IsSomeDecl);
            Retval.AddFuncDecl("Some-value", ValueDecl);

            Z3_del_constructor(*Ctx, Constructors[0]);
            Z3_del_constructor(*Ctx, Constructors[1]);
            return Retval;
        }

        Z3Sort Z3LoweredContext::MakeRecordSort(const RecordType* Type)
        {
            auto const& Fields = Type->GetFields();
            const u32 NumFields = Fields.size();
            auto Suffix = "!" + to_string(SortCounter++);

            vector<Z3_symbol> FieldNames(NumFields);
            vector<Z3_sort> FieldSorts(NumFields);
            // Keeps the field sorts referenced until the tuple is made
            vector<Z3Sort> FieldSortRefs;
            for (u32 i = 0; i < NumFields; ++i) {
                FieldNames[i] = Z3_mk_string_symbol(*Ctx, (Type->GetName() + "." +
                                                           Fields[i].first + Suffix).c_str());
                FieldSortRefs.push_back(GetZ3Sort(Fields[i].second));
                FieldSorts[i] = FieldSortRefs.back();
            }

            Z3_func_decl MkDecl;
            vector<Z3_func_decl> ProjDecls(NumFields);
            auto TupleName = Z3_mk_string_symbol(*Ctx, (Type->GetName() + Suffix).c_str());
            Z3Sort Retval(Ctx, Z3_mk_tuple_sort(*Ctx, TupleName, NumFields, FieldNames.data(),
                                                FieldSorts.data(), &MkDecl, ProjDecls.data()));
            // Referenced before any other call into Z3, see MakeOptionSort
            Retval.AddFuncDecl("mk", MkDecl);
            for (u32 i = 0; i < NumFields; ++i) {
                Retval.AddFuncDecl("field!" + Fields[i].first, ProjDecls[i]);
            }
            return Retval;
        }

        const Z3Sort& Z3LoweredContext::GetZ3Sort(const TypeRef& Type)
        {
            auto it = TypeToSort.find(Type);
            if (it != TypeToSort.end()) {
                return it->second;
            }

            Z3Sort LoweredSort;
            switch (Type->GetKind()) {
            case TypeKindT::Boolean:
                LoweredSort = Z3Sort(Ctx, Z3_mk_bool_sort(*Ctx));
                break;

            case TypeKindT::Integer:
                LoweredSort = Z3Sort(Ctx, Z3_mk_bv_sort(*Ctx,
                                                        Type->SAs<IntegerType>()->GetWidth()));
                break;

            case TypeKindT::BigInt:
                LoweredSort = Z3Sort(Ctx, Z3_mk_int_sort(*Ctx));
                break;

            case TypeKindT::Char:
                LoweredSort = Z3Sort(Ctx, Z3_mk_string_sort(*Ctx));
                break;

            case TypeKindT::Seq: {
                auto TypeAsSeq = Type->SAs<SeqType>();
                if (TypeAsSeq->IsString()) {
                    LoweredSort = Z3Sort(Ctx, Z3_mk_string_sort(*Ctx));
                    break;
                }
                if (Detail::HasBareChar(TypeAsSeq->GetElemType())) {
                    throw CapabilityError((string)"The SMT backend cannot encode characters " +
                                          "inside the sequence type " + Type->ToString());
                }
                auto const& ElemSort = GetZ3Sort(TypeAsSeq->GetElemType());
                LoweredSort = Z3Sort(Ctx, Z3_mk_seq_sort(*Ctx, ElemSort));
                break;
            }

            case TypeKindT::Option:
                LoweredSort = MakeOptionSort(Type->SAs<OptionType>());
                break;

            case TypeKindT::Record:
                LoweredSort = MakeRecordSort(Type->SAs<RecordType>());
                break;

            case TypeKindT::Map: {
                auto TypeAsMap = Type->SAs<MapType>();
                if (Detail::HasBareChar(Type)) {
                    throw CapabilityError((string)"The SMT backend cannot encode characters " +
                                          "inside the map type " + Type->ToString());
                }
                auto OptType = ExprMgr::Instance().MakeOptionType(TypeAsMap->GetValueType());
                auto const& KeySort = GetZ3Sort(TypeAsMap->GetKeyType());
                auto const& RangeSort = GetZ3Sort(OptType);
                LoweredSort = Z3Sort(Ctx, Z3_mk_array_sort(*Ctx, KeySort, RangeSort));
                break;
            }

            default:
                throw InternalError((string)"Type " + Type->ToString() +
                                    " should have been lowered before reaching Z3" +
                                    "\nAt: " + __FILE__ + ":" + to_string(__LINE__));
            }

            return (TypeToSort[Type] = LoweredSort);
        }

        Z3Expr Z3LoweredContext::GetLoweredRegex(const Regex::RegexRef& Regex) const
        {
            auto it = LoweredRegexes.find(Regex);
            if (it == LoweredRegexes.end()) {
                return Z3Expr();
            }
            return it->second;
        }

        void Z3LoweredContext::AddLoweredRegex(const Regex::RegexRef& Regex,
                                               const Z3Expr& Lowered)
        {
            LoweredRegexes[Regex] = Lowered;
        }

        void Z3LoweredContext::AddAssumption(const Z3Expr& Assumption)
        {
            Assumptions.push_back(Assumption);
        }

        const vector<Z3Expr>& Z3LoweredContext::GetAssumptions() const
        {
            return Assumptions;
        }

        void Z3LoweredContext::ClearAssumptions()
        {
            Assumptions.clear();
        }

        Z3Expr Z3LoweredContext::MakeNoneTerm(const TypeRef& OptType)
        {
            auto const& OptSort = GetZ3Sort(OptType);
            return Z3Expr(Ctx, Z3_mk_app(*Ctx, OptSort.GetFuncDecl("None"), 0, nullptr));
        }

        Z3Expr Z3LoweredContext::MakeSomeTerm(const TypeRef& OptType, const Z3Expr& Inner)
        {
            auto const& OptSort = GetZ3Sort(OptType);
            Z3_ast Arg = Inner;
            return Z3Expr(Ctx, Z3_mk_app(*Ctx, OptSort.GetFuncDecl("Some"), 1, &Arg));
        }

        Z3Expr Z3LoweredContext::MakeTypeConstraint(const Z3Expr& Term, const TypeRef& Type)
        {
            if (!Detail::NeedsConstraint(Type)) {
                return Z3Expr();
            }

            switch (Type->GetKind()) {
            case TypeKindT::Char: {
                Z3Expr Length(Ctx, Z3_mk_seq_length(*Ctx, Term));
                Z3Expr One(Ctx, Z3_mk_int(*Ctx, 1, Z3_mk_int_sort(*Ctx)));
                return Z3Expr(Ctx, Z3_mk_eq(*Ctx, Length, One));
            }

            case TypeKindT::Option: {
                auto const& Sort = GetZ3Sort(Type);
                Z3_ast Arg = Term;
                Z3Expr Inner(Ctx, Z3_mk_app(*Ctx, Sort.GetFuncDecl("Some-value"), 1, &Arg));
                auto InnerConstraint = MakeTypeConstraint(Inner,
                                                          Type->SAs<OptionType>()->GetInnerType());
                Z3Expr IsSome(Ctx, Z3_mk_app(*Ctx, Sort.GetFuncDecl("is-Some"), 1, &Arg));
                return Z3Expr(Ctx, Z3_mk_implies(*Ctx, IsSome, InnerConstraint));
            }

            case TypeKindT::Record: {
                auto const& Sort = GetZ3Sort(Type);
                vector<Z3Expr> Conjuncts;
                Z3_ast Arg = Term;
                for (auto const& Field : Type->SAs<RecordType>()->GetFields()) {
                    if (!Detail::NeedsConstraint(Field.second)) {
                        continue;
                    }
                    Z3Expr FieldTerm(Ctx, Z3_mk_app(*Ctx, Sort.GetFuncDecl("field!" + Field.first),
                                                    1, &Arg));
                    Conjuncts.push_back(MakeTypeConstraint(FieldTerm, Field.second));
                }
                auto Args = Detail::ToASTs(Conjuncts);
                return Z3Expr(Ctx, Z3_mk_and(*Ctx, Args.size(), Args.data()));
            }

            case TypeKindT::Map: {
                // Maps are finite: the array is None everywhere except
                // at the stored keys. Without this, models may put the
                // contents of a map in the array default.
                GetZ3Sort(Type);
                auto OptType = ExprMgr::Instance().MakeOptionType(
                    Type->SAs<MapType>()->GetValueType());
                Z3Expr Default(Ctx, Z3_mk_array_default(*Ctx, Term));
                return Z3Expr(Ctx, Z3_mk_eq(*Ctx, Default, MakeNoneTerm(OptType)));
            }

            default:
                // Sequences with characters or maps are rejected when
                // their types or sorts are made
                GetZ3Sort(Type);
                return Z3Expr();
            }
        }

        void Z3LoweredContext::AddTypeAssumptions(const Z3Expr& Term, const TypeRef& Type)
        {
            auto Constraint = MakeTypeConstraint(Term, Type);
            if (!Constraint.IsNull()) {
                AddAssumption(Constraint);
            }
        }

        Z3Expr Z3LoweredContext::LowerValue(const ValueRef& Value)
        {
            auto const& Type = Value->GetType();
            auto const& Sort = GetZ3Sort(Type);

            switch (Type->GetKind()) {
            case TypeKindT::Boolean:
                return Z3Expr(Ctx, Value->SAs<BoolValue>()->GetValue() ?
                              Z3_mk_true(*Ctx) : Z3_mk_false(*Ctx));

            case TypeKindT::Integer:
                return Z3Expr(Ctx, Z3_mk_unsigned_int64(*Ctx, Value->SAs<IntValue>()->GetBits(),
                                                        Sort));

            case TypeKindT::BigInt: {
                auto Str = Value->SAs<BigIntValue>()->GetValue().str();
                return Z3Expr(Ctx, Z3_mk_numeral(*Ctx, Str.c_str(), Sort));
            }

            case TypeKindT::Char: {
                vector<u32> CodePoints = { Value->SAs<CharValue>()->GetCodePoint() };
                return Z3Expr(Ctx, Z3_mk_string(*Ctx, MakeZ3StringLiteral(CodePoints).c_str()));
            }

            case TypeKindT::Seq: {
                auto ValueAsSeq = Value->SAs<SeqValue>();
                if (ValueAsSeq->IsString()) {
                    auto Literal = MakeZ3StringLiteral(ValueAsSeq->GetCodePoints());
                    return Z3Expr(Ctx, Z3_mk_string(*Ctx, Literal.c_str()));
                }
                auto const& Elems = ValueAsSeq->GetElems();
                if (Elems.size() == 0) {
                    return Z3Expr(Ctx, Z3_mk_seq_empty(*Ctx, Sort));
                }
                vector<Z3Expr> Units;
                for (auto const& Elem : Elems) {
                    auto LoweredElem = LowerValue(Elem);
                    Units.push_back(Z3Expr(Ctx, Z3_mk_seq_unit(*Ctx, LoweredElem)));
                }
                if (Units.size() == 1) {
                    return Units[0];
                }
                auto Args = Detail::ToASTs(Units);
                return Z3Expr(Ctx, Z3_mk_seq_concat(*Ctx, Args.size(), Args.data()));
            }

            case TypeKindT::Option: {
                auto ValueAsOpt = Value->SAs<OptionValue>();
                if (!ValueAsOpt->IsSome()) {
                    return MakeNoneTerm(Type);
                }
                return MakeSomeTerm(Type, LowerValue(ValueAsOpt->GetInner()));
            }

            case TypeKindT::Record: {
                vector<Z3Expr> LoweredFields;
                for (auto const& FieldValue : Value->SAs<RecordValue>()->GetFieldValues()) {
                    LoweredFields.push_back(LowerValue(FieldValue));
                }
                auto Args = Detail::ToASTs(LoweredFields);
                return Z3Expr(Ctx, Z3_mk_app(*Ctx, Sort.GetFuncDecl("mk"),
                                             Args.size(), Args.data()));
            }

            case TypeKindT::Map: {
                // A constant array of None, with a store per entry. The
                // range is the option sort the map sort was made with.
                auto TypeAsMap = Type->SAs<MapType>();
                auto OptType = ExprMgr::Instance().MakeOptionType(TypeAsMap->GetValueType());
                Z3Sort KeySort(Ctx, Z3_get_array_sort_domain(*Ctx, Sort));
                Z3Sort RangeSort(Ctx, Z3_get_array_sort_range(*Ctx, Sort));
                if (!(RangeSort == GetZ3Sort(OptType))) {
                    throw InternalError((string)"Map sort " + Sort.ToString() +
                                        " does not range over the option sort " +
                                        GetZ3Sort(OptType).ToString() +
                                        "\nAt: " + __FILE__ + ":" + to_string(__LINE__));
                }

                auto None = MakeNoneTerm(OptType);
                Z3Expr Retval(Ctx, Z3_mk_const_array(*Ctx, KeySort, None));
                for (auto const& Entry : Value->SAs<MapValue>()->GetEntries()) {
                    auto Key = LowerValue(Entry.first);
                    auto Some = MakeSomeTerm(OptType, LowerValue(Entry.second));
                    Retval = Z3Expr(Ctx, Z3_mk_store(*Ctx, Retval, Key, Some));
                }
                return Retval;
            }

            default:
                throw InternalError((string)"Value " + Value->ToString() +
                                    " should have been lowered before reaching Z3" +
                                    "\nAt: " + __FILE__ + ":" + to_string(__LINE__));
            }
        }

        // Z3Lowerer implementation
        Z3Lowerer::Z3Lowerer(const Z3LCRef& LCtx)
            : ExpressionVisitorBase("Z3Lowerer"), LCtx(LCtx), Ctx(LCtx->GetZ3Ctx())
        {
            // Nothing here
        }

        Z3Lowerer::~Z3Lowerer()
        {
            // Nothing here
        }

        void Z3Lowerer::VisitConstExpression(const ConstExpression* Exp)
        {
            ExpStack.push_back(LCtx->LowerValue(Exp->GetConstValue()));
        }

        void Z3Lowerer::VisitVarExpression(const VarExpression* Exp)
        {
            auto it = Lowered.find(Exp);
            if (it != Lowered.end()) {
                ExpStack.push_back(it->second);
                return;
            }

            auto const& Type = Exp->GetType();
            auto const& Sort = LCtx->GetZ3Sort(Type);
            auto Sym = Z3_mk_string_symbol(*Ctx, Exp->GetVarName().c_str());
            Z3Expr LoweredExp(Ctx, Z3_mk_const(*Ctx, Sym, Sort));
            LCtx->AddTypeAssumptions(LoweredExp, Type);
            Lowered[Exp] = LoweredExp;
            ExpStack.push_back(LoweredExp);
        }

        void Z3Lowerer::VisitOpExpression(const OpExpression* Exp)
        {
            auto it = Lowered.find(Exp);
            if (it != Lowered.end()) {
                ExpStack.push_back(it->second);
                return;
            }

            ExpressionVisitorBase::VisitOpExpression(Exp);

            const u32 NumChildren = Exp->GetChildren().size();
            vector<Z3Expr> Args(ExpStack.end() - NumChildren, ExpStack.end());
            ExpStack.resize(ExpStack.size() - NumChildren);

            auto Retval = LowerOp(Exp, Args);
            Lowered[Exp] = Retval;
            ExpStack.push_back(Retval);
        }

        Z3Expr Z3Lowerer::LowerArith(i64 OpCode, const TypeRef& Type, const vector<Z3Expr>& Args)
        {
            if (Type->Is<IntegerType>()) {
                switch (OpCode) {
                case SymxOps::OpADD:
                    return Z3Expr(Ctx, Z3_mk_bvadd(*Ctx, Args[0], Args[1]));
                case SymxOps::OpSUB:
                    return Z3Expr(Ctx, Z3_mk_bvsub(*Ctx, Args[0], Args[1]));
                default:
                    return Z3Expr(Ctx, Z3_mk_bvmul(*Ctx, Args[0], Args[1]));
                }
            }

            auto ASTs = Detail::ToASTs(Args);
            switch (OpCode) {
            case SymxOps::OpADD:
                return Z3Expr(Ctx, Z3_mk_add(*Ctx, 2, ASTs.data()));
            case SymxOps::OpSUB:
                return Z3Expr(Ctx, Z3_mk_sub(*Ctx, 2, ASTs.data()));
            default:
                return Z3Expr(Ctx, Z3_mk_mul(*Ctx, 2, ASTs.data()));
            }
        }

        Z3Expr Z3Lowerer::LowerCompare(i64 OpCode, const TypeRef& Type,
                                       const vector<Z3Expr>& Args)
        {
            auto const& A = Args[0];
            auto const& B = Args[1];

            if (Type->Is<IntegerType>()) {
                if (Type->SAs<IntegerType>()->IsSigned()) {
                    switch (OpCode) {
                    case SymxOps::OpLT: return Z3Expr(Ctx, Z3_mk_bvslt(*Ctx, A, B));
                    case SymxOps::OpLE: return Z3Expr(Ctx, Z3_mk_bvsle(*Ctx, A, B));
                    case SymxOps::OpGT: return Z3Expr(Ctx, Z3_mk_bvsgt(*Ctx, A, B));
                    default: return Z3Expr(Ctx, Z3_mk_bvsge(*Ctx, A, B));
                    }
                } else {
                    switch (OpCode) {
                    case SymxOps::OpLT: return Z3Expr(Ctx, Z3_mk_bvult(*Ctx, A, B));
                    case SymxOps::OpLE: return Z3Expr(Ctx, Z3_mk_bvule(*Ctx, A, B));
                    case SymxOps::OpGT: return Z3Expr(Ctx, Z3_mk_bvugt(*Ctx, A, B));
                    default: return Z3Expr(Ctx, Z3_mk_bvuge(*Ctx, A, B));
                    }
                }
            }

            if (Type->Is<CharType>()) {
                // Lexicographic order coincides with code point order
                // on strings of length one
                switch (OpCode) {
                case SymxOps::OpLT: return Z3Expr(Ctx, Z3_mk_str_lt(*Ctx, A, B));
                case SymxOps::OpLE: return Z3Expr(Ctx, Z3_mk_str_le(*Ctx, A, B));
                case SymxOps::OpGT: return Z3Expr(Ctx, Z3_mk_str_lt(*Ctx, B, A));
                default: return Z3Expr(Ctx, Z3_mk_str_le(*Ctx, B, A));
                }
            }

            switch (OpCode) {
            case SymxOps::OpLT: return Z3Expr(Ctx, Z3_mk_lt(*Ctx, A, B));
            case SymxOps::OpLE: return Z3Expr(Ctx, Z3_mk_le(*Ctx, A, B));
            case SymxOps::OpGT: return Z3Expr(Ctx, Z3_mk_gt(*Ctx, A, B));
            default: return Z3Expr(Ctx, Z3_mk_ge(*Ctx, A, B));
            }
        }

        Z3Expr Z3Lowerer::LowerCast(const TypeRef& FromType, const TypeRef& ToType,
                                    const Z3Expr& Arg)
        {
            auto FromAsInt = FromType->As<IntegerType>();
            auto ToAsInt = ToType->As<IntegerType>();

            if (FromAsInt == nullptr && ToAsInt == nullptr) {
                return Arg;
            }
            if (ToAsInt == nullptr) {
                return Z3Expr(Ctx, Z3_mk_bv2int(*Ctx, Arg, FromAsInt->IsSigned()));
            }
            if (FromAsInt == nullptr) {
                return Z3Expr(Ctx, Z3_mk_int2bv(*Ctx, ToAsInt->GetWidth(), Arg));
            }

            auto FromWidth = FromAsInt->GetWidth();
            auto ToWidth = ToAsInt->GetWidth();
            if (ToWidth < FromWidth) {
                return Z3Expr(Ctx, Z3_mk_extract(*Ctx, ToWidth - 1, 0, Arg));
            } else if (ToWidth > FromWidth) {
                if (FromAsInt->IsSigned()) {
                    return Z3Expr(Ctx, Z3_mk_sign_ext(*Ctx, ToWidth - FromWidth, Arg));
                } else {
                    return Z3Expr(Ctx, Z3_mk_zero_ext(*Ctx, ToWidth - FromWidth, Arg));
                }
            }
            // Only the signedness changes, the bits stay
            return Arg;
        }

        Z3Expr Z3Lowerer::LowerSeqOp(const OpExpression* Exp, const vector<Z3Expr>& Args)
        {
            switch (Exp->GetOpCode()) {
            case SymxOps::OpSEQUNIT:
                // A character already is a string of length one
                if (Exp->GetType()->SAs<SeqType>()->IsString()) {
                    return Args[0];
                }
                return Z3Expr(Ctx, Z3_mk_seq_unit(*Ctx, Args[0]));

            case SymxOps::OpSEQCONCAT: {
                auto ASTs = Detail::ToASTs(Args);
                return Z3Expr(Ctx, Z3_mk_seq_concat(*Ctx, ASTs.size(), ASTs.data()));
            }

            case SymxOps::OpSEQLENGTH:
                return Z3Expr(Ctx, Z3_mk_seq_length(*Ctx, Args[0]));
            case SymxOps::OpSEQAT:
                return Z3Expr(Ctx, Z3_mk_seq_at(*Ctx, Args[0], Args[1]));
            case SymxOps::OpSEQSLICE:
                return Z3Expr(Ctx, Z3_mk_seq_extract(*Ctx, Args[0], Args[1], Args[2]));
            case SymxOps::OpSEQINDEXOF:
                return Z3Expr(Ctx, Z3_mk_seq_index(*Ctx, Args[0], Args[1], Args[2]));
            case SymxOps::OpSEQCONTAINS:
                return Z3Expr(Ctx, Z3_mk_seq_contains(*Ctx, Args[0], Args[1]));
            case SymxOps::OpSEQSTARTSWITH:
                return Z3Expr(Ctx, Z3_mk_seq_prefix(*Ctx, Args[1], Args[0]));
            case SymxOps::OpSEQENDSWITH:
                return Z3Expr(Ctx, Z3_mk_seq_suffix(*Ctx, Args[1], Args[0]));
            case SymxOps::OpSEQREPLACEFIRST:
                return Z3Expr(Ctx, Z3_mk_seq_replace(*Ctx, Args[0], Args[1], Args[2]));

            case SymxOps::OpSEQREGEX: {
                auto Pattern = Regex::RegexMgr::Instance().Parse(Exp->GetPayload());
                auto LoweredRegex = Z3RegexLowerer::Do(Pattern, LCtx);
                return Z3Expr(Ctx, Z3_mk_seq_in_re(*Ctx, Args[0], LoweredRegex));
            }

            default:
                throw InternalError((string)"Unhandled sequence op " +
                                    SymxOps::OpToString(Exp->GetOpCode()) +
                                    "\nAt: " + __FILE__ + ":" + to_string(__LINE__));
            }
        }

        Z3Expr Z3Lowerer::LowerMapOp(const OpExpression* Exp, const vector<Z3Expr>& Args)
        {
            auto OpCode = Exp->GetOpCode();
            if (OpCode == SymxOps::OpMAPGET) {
                return Z3Expr(Ctx, Z3_mk_select(*Ctx, Args[0], Args[1]));
            }

            auto TypeAsMap = Exp->GetType()->SAs<MapType>();
            auto OptType = ExprMgr::Instance().MakeOptionType(TypeAsMap->GetValueType());

            if (OpCode == SymxOps::OpMAPSET) {
                auto Some = LCtx->MakeSomeTerm(OptType, Args[2]);
                return Z3Expr(Ctx, Z3_mk_store(*Ctx, Args[0], Args[1], Some));
            }

            auto None = LCtx->MakeNoneTerm(OptType);
            return Z3Expr(Ctx, Z3_mk_store(*Ctx, Args[0], Args[1], None));
        }

        Z3Expr Z3Lowerer::LowerOp(const OpExpression* Exp, const vector<Z3Expr>& Args)
        {
            auto OpCode = Exp->GetOpCode();
            auto const& Children = Exp->GetChildren();

            switch (OpCode) {
            case SymxOps::OpAND:
            case SymxOps::OpOR: {
                auto ASTs = Detail::ToASTs(Args);
                if (OpCode == SymxOps::OpAND) {
                    return Z3Expr(Ctx, Z3_mk_and(*Ctx, ASTs.size(), ASTs.data()));
                }
                return Z3Expr(Ctx, Z3_mk_or(*Ctx, ASTs.size(), ASTs.data()));
            }

            case SymxOps::OpNOT:
                return Z3Expr(Ctx, Z3_mk_not(*Ctx, Args[0]));
            case SymxOps::OpIMPLIES:
                return Z3Expr(Ctx, Z3_mk_implies(*Ctx, Args[0], Args[1]));
            case SymxOps::OpITE:
                return Z3Expr(Ctx, Z3_mk_ite(*Ctx, Args[0], Args[1], Args[2]));
            case SymxOps::OpEQ:
                return Z3Expr(Ctx, Z3_mk_eq(*Ctx, Args[0], Args[1]));

            case SymxOps::OpADD:
            case SymxOps::OpSUB:
            case SymxOps::OpMUL:
                return LowerArith(OpCode, Exp->GetType(), Args);

            case SymxOps::OpLT:
            case SymxOps::OpLE:
            case SymxOps::OpGT:
            case SymxOps::OpGE:
                return LowerCompare(OpCode, Children[0]->GetType(), Args);

            case SymxOps::OpBVAND:
                return Z3Expr(Ctx, Z3_mk_bvand(*Ctx, Args[0], Args[1]));
            case SymxOps::OpBVOR:
                return Z3Expr(Ctx, Z3_mk_bvor(*Ctx, Args[0], Args[1]));
            case SymxOps::OpBVXOR:
                return Z3Expr(Ctx, Z3_mk_bvxor(*Ctx, Args[0], Args[1]));
            case SymxOps::OpBVNOT:
                return Z3Expr(Ctx, Z3_mk_bvnot(*Ctx, Args[0]));

            case SymxOps::OpCAST:
                return LowerCast(Children[0]->GetType(), Exp->GetType(), Args[0]);

            case SymxOps::OpMKRECORD: {
                auto const& Sort = LCtx->GetZ3Sort(Exp->GetType());
                auto ASTs = Detail::ToASTs(Args);
                return Z3Expr(Ctx, Z3_mk_app(*Ctx, Sort.GetFuncDecl("mk"),
                                             ASTs.size(), ASTs.data()));
            }

            case SymxOps::OpPROJECT: {
                auto const& Sort = LCtx->GetZ3Sort(Children[0]->GetType());
                Z3_ast Arg = Args[0];
                return Z3Expr(Ctx, Z3_mk_app(*Ctx, Sort.GetFuncDecl("field!" + Exp->GetPayload()),
                                             1, &Arg));
            }

            case SymxOps::OpWITHFIELD: {
                auto const& Sort = LCtx->GetZ3Sort(Exp->GetType());
                auto const& Fields = Exp->GetType()->SAs<RecordType>()->GetFields();
                vector<Z3Expr> NewFields;
                Z3_ast Arg = Args[0];
                for (auto const& Field : Fields) {
                    if (Field.first == Exp->GetPayload()) {
                        NewFields.push_back(Args[1]);
                    } else {
                        NewFields.push_back(Z3Expr(Ctx, Z3_mk_app(*Ctx, Sort.GetFuncDecl("field!" +
                                                                                        Field.first),
                                                                  1, &Arg)));
                    }
                }
                auto ASTs = Detail::ToASTs(NewFields);
                return Z3Expr(Ctx, Z3_mk_app(*Ctx, Sort.GetFuncDecl("mk"),
                                             ASTs.size(), ASTs.data()));
            }

            case SymxOps::OpOPTSOME:
                return LCtx->MakeSomeTerm(Exp->GetType(), Args[0]);

            case SymxOps::OpOPTISSOME: {
                auto const& Sort = LCtx->GetZ3Sort(Children[0]->GetType());
                Z3_ast Arg = Args[0];
                return Z3Expr(Ctx, Z3_mk_app(*Ctx, Sort.GetFuncDecl("is-Some"), 1, &Arg));
            }

            case SymxOps::OpOPTVALUE: {
                // None reads the default of the inner type
                auto const& Sort = LCtx->GetZ3Sort(Children[0]->GetType());
                Z3_ast Arg = Args[0];
                Z3Expr IsSome(Ctx, Z3_mk_app(*Ctx, Sort.GetFuncDecl("is-Some"), 1, &Arg));
                Z3Expr Inner(Ctx, Z3_mk_app(*Ctx, Sort.GetFuncDecl("Some-value"), 1, &Arg));
                auto Default = LCtx->LowerValue(Exp->GetType()->GetDefaultValue());
                return Z3Expr(Ctx, Z3_mk_ite(*Ctx, IsSome, Inner, Default));
            }

            case SymxOps::OpSEQUNIT:
            case SymxOps::OpSEQCONCAT:
            case SymxOps::OpSEQLENGTH:
            case SymxOps::OpSEQAT:
            case SymxOps::OpSEQSLICE:
            case SymxOps::OpSEQINDEXOF:
            case SymxOps::OpSEQCONTAINS:
            case SymxOps::OpSEQSTARTSWITH:
            case SymxOps::OpSEQENDSWITH:
            case SymxOps::OpSEQREPLACEFIRST:
            case SymxOps::OpSEQREGEX:
                return LowerSeqOp(Exp, Args);

            case SymxOps::OpMAPGET:
            case SymxOps::OpMAPSET:
            case SymxOps::OpMAPDELETE:
                return LowerMapOp(Exp, Args);

            default:
                throw InternalError((string)"Op " + SymxOps::OpToString(OpCode) +
                                    " should have been lowered before reaching Z3" +
                                    "\nAt: " + __FILE__ + ":" + to_string(__LINE__));
            }
        }

        Z3Expr Z3Lowerer::Do(const ExpT& Exp, const Z3LCRef& LCtx)
        {
            Z3Lowerer TheLowerer(LCtx);
            Exp->Accept(&TheLowerer);
            return TheLowerer.ExpStack.back();
        }

        // Z3Raiser implementation
        Z3Raiser::Z3Raiser(const Z3LCRef& LCtx, const Z3Model& Model)
            : LCtx(LCtx), Ctx(LCtx->GetZ3Ctx()), Model(Model)
        {
            // Nothing here
        }

        Z3Raiser::~Z3Raiser()
        {
            // Nothing here
        }

        Z3_app Z3Raiser::GetApp(const Z3Expr& LExp) const
        {
            if (!Z3_is_app(*Ctx, LExp)) {
                throw EngineError((string)"Unexpected model term from Z3: " + LExp.ToString());
            }
            return Z3_to_app(*Ctx, LExp);
        }

        vector<u32> Z3Raiser::GetCodePoints(const Z3Expr& LExp) const
        {
            if (!Z3_is_string(*Ctx, LExp)) {
                throw EngineError((string)"Expected a string literal in the model, got: " +
                                  LExp.ToString());
            }
            return ParseZ3StringLiteral(Z3_get_string(*Ctx, LExp));
        }

        void Z3Raiser::RaiseSeqElems(const Z3Expr& LExp, const TypeRef& ElemType,
                                     vector<ValueRef>& Elems)
        {
            auto App = GetApp(LExp);
            auto Kind = Z3_get_decl_kind(*Ctx, Z3_get_app_decl(*Ctx, App));
            switch (Kind) {
            case Z3_OP_SEQ_EMPTY:
                break;
            case Z3_OP_SEQ_UNIT:
                Elems.push_back(Raise(Z3Expr(Ctx, Z3_get_app_arg(*Ctx, App, 0)), ElemType));
                break;
            case Z3_OP_SEQ_CONCAT: {
                auto NumArgs = Z3_get_app_num_args(*Ctx, App);
                for (u32 i = 0; i < NumArgs; ++i) {
                    RaiseSeqElems(Z3Expr(Ctx, Z3_get_app_arg(*Ctx, App, i)), ElemType, Elems);
                }
                break;
            }
            default:
                throw EngineError((string)"Unexpected sequence term in the model: " +
                                  LExp.ToString());
            }
        }

        void Z3Raiser::RaiseMapEntries(const Z3Expr& LExp, const MapType* Type,
                                       ValueRef& Default, ValueMapT& Stores)
        {
            auto OptType = ExprMgr::Instance().MakeOptionType(Type->GetValueType());

            if (Z3_is_as_array(*Ctx, LExp)) {
                auto Decl = Z3_get_as_array_func_decl(*Ctx, LExp);
                auto Interp = Z3_model_get_func_interp(*Ctx, Model, Decl);
                if (Interp == nullptr) {
                    Ctx->CheckError("array interpretation");
                    throw EngineError((string)"No interpretation for the array " +
                                      LExp.ToString() + " in the model");
                }
                Z3_func_interp_inc_ref(*Ctx, Interp);
                Z3Expr LElse(Ctx, Z3_func_interp_get_else(*Ctx, Interp));
                vector<pair<Z3Expr, Z3Expr>> LEntries;
                auto NumEntries = Z3_func_interp_get_num_entries(*Ctx, Interp);
                for (u32 i = 0; i < NumEntries; ++i) {
                    auto Entry = Z3_func_interp_get_entry(*Ctx, Interp, i);
                    Z3_func_entry_inc_ref(*Ctx, Entry);
                    Z3Expr LKey(Ctx, Z3_func_entry_get_arg(*Ctx, Entry, 0));
                    Z3Expr LValue(Ctx, Z3_func_entry_get_value(*Ctx, Entry));
                    Z3_func_entry_dec_ref(*Ctx, Entry);
                    LEntries.push_back(make_pair(LKey, LValue));
                }
                Z3_func_interp_dec_ref(*Ctx, Interp);

                Default = Raise(LElse, OptType);
                for (auto const& LEntry : LEntries) {
                    Stores[Raise(LEntry.first, Type->GetKeyType())] =
                        Raise(LEntry.second, OptType);
                }
                return;
            }

            auto App = GetApp(LExp);
            auto Kind = Z3_get_decl_kind(*Ctx, Z3_get_app_decl(*Ctx, App));
            switch (Kind) {
            case Z3_OP_CONST_ARRAY:
                Default = Raise(Z3Expr(Ctx, Z3_get_app_arg(*Ctx, App, 0)), OptType);
                break;
            case Z3_OP_STORE:
                // Inner stores are older
                RaiseMapEntries(Z3Expr(Ctx, Z3_get_app_arg(*Ctx, App, 0)), Type,
                                Default, Stores);
                Stores[Raise(Z3Expr(Ctx, Z3_get_app_arg(*Ctx, App, 1)), Type->GetKeyType())] =
                    Raise(Z3Expr(Ctx, Z3_get_app_arg(*Ctx, App, 2)), OptType);
                break;
            default:
                throw EngineError((string)"Unexpected array term in the model: " +
                                  LExp.ToString());
            }
        }

        ValueRef Z3Raiser::RaiseMap(const Z3Expr& LExp, const TypeRef& Type)
        {
            auto& Mgr = ExprMgr::Instance();
            auto TypeAsMap = Type->SAs<MapType>();
            auto const& KeyType = TypeAsMap->GetKeyType();
            ValueRef Default = ValueRef::NullPtr;
            ValueMapT Stores;
            RaiseMapEntries(LExp, TypeAsMap, Default, Stores);

            ValueMapT Entries;
            auto DefaultAsOpt = Default->SAs<OptionValue>();
            if (DefaultAsOpt->IsSome()) {
                // Every key outside the stores is present
                vector<ValueRef> Keys;
                if (KeyType->Is<BooleanType>()) {
                    Keys.push_back(Mgr.MakeBoolValue(false));
                    Keys.push_back(Mgr.MakeBoolValue(true));
                } else if (KeyType->Is<IntegerType>() &&
                           KeyType->SAs<IntegerType>()->GetWidth() <= MaxExpandedKeyWidth) {
                    const u64 NumKeys = (u64)1 << KeyType->SAs<IntegerType>()->GetWidth();
                    for (u64 Bits = 0; Bits < NumKeys; ++Bits) {
                        Keys.push_back(new IntValue(KeyType, Bits));
                    }
                } else {
                    throw CapabilityError((string)"The model maps every unstored key of " +
                                          Type->ToString() + " to " +
                                          DefaultAsOpt->GetInner()->ToString() +
                                          ", which is not a finite map");
                }
                for (auto const& Key : Keys) {
                    Entries[Key] = DefaultAsOpt->GetInner();
                }
            }

            for (auto const& Store : Stores) {
                auto StoredAsOpt = Store.second->SAs<OptionValue>();
                if (StoredAsOpt->IsSome()) {
                    Entries[Store.first] = StoredAsOpt->GetInner();
                } else {
                    Entries.erase(Store.first);
                }
            }
            return Mgr.MakeMapValue(Type, Entries);
        }

        ValueRef Z3Raiser::Raise(const Z3Expr& LExp, const TypeRef& Type)
        {
            auto& Mgr = ExprMgr::Instance();

            switch (Type->GetKind()) {
            case TypeKindT::Boolean: {
                auto BoolVal = Z3_get_bool_value(*Ctx, LExp);
                if (BoolVal == Z3_L_UNDEF) {
                    throw EngineError((string)"Expected a boolean literal in the model, got: " +
                                      LExp.ToString());
                }
                return Mgr.MakeBoolValue(BoolVal == Z3_L_TRUE);
            }

            case TypeKindT::Integer: {
                uint64_t Bits = 0;
                if (!Z3_get_numeral_uint64(*Ctx, LExp, &Bits)) {
                    throw EngineError((string)"Expected a bit-vector literal in the model, got: " +
                                      LExp.ToString());
                }
                return new IntValue(Type, Bits);
            }

            case TypeKindT::BigInt: {
                if (!Z3_is_numeral_ast(*Ctx, LExp)) {
                    throw EngineError((string)"Expected an integer literal in the model, got: " +
                                      LExp.ToString());
                }
                string Str = Z3_get_numeral_string(*Ctx, LExp);
                return Mgr.MakeBigIntValue(BigIntT(Str.c_str()));
            }

            case TypeKindT::Char: {
                auto CodePoints = GetCodePoints(LExp);
                if (CodePoints.size() != 1) {
                    throw EngineError((string)"Character valued term has the model value " +
                                      LExp.ToString() + ", which is not of length one");
                }
                return Mgr.MakeCharValue(CodePoints[0]);
            }

            case TypeKindT::Seq: {
                auto TypeAsSeq = Type->SAs<SeqType>();
                if (TypeAsSeq->IsString()) {
                    return Mgr.MakeStringValue(GetCodePoints(LExp));
                }
                vector<ValueRef> Elems;
                RaiseSeqElems(LExp, TypeAsSeq->GetElemType(), Elems);
                return Mgr.MakeSeqValue(TypeAsSeq->GetElemType(), Elems);
            }

            case TypeKindT::Option: {
                auto const& Sort = LCtx->GetZ3Sort(Type);
                auto App = GetApp(LExp);
                auto Decl = Z3_get_app_decl(*Ctx, App);
                auto const& InnerType = Type->SAs<OptionType>()->GetInnerType();
                if (Z3_is_eq_func_decl(*Ctx, Decl, Sort.GetFuncDecl("None"))) {
                    return Mgr.MakeNoneValue(InnerType);
                }
                if (Z3_is_eq_func_decl(*Ctx, Decl, Sort.GetFuncDecl("Some"))) {
                    auto Inner = Raise(Z3Expr(Ctx, Z3_get_app_arg(*Ctx, App, 0)), InnerType);
                    return Mgr.MakeSomeValue(Inner);
                }
                throw EngineError((string)"Unexpected option term in the model: " +
                                  LExp.ToString());
            }

            case TypeKindT::Record: {
                auto App = GetApp(LExp);
                auto const& Fields = Type->SAs<RecordType>()->GetFields();
                if (Z3_get_app_num_args(*Ctx, App) != Fields.size()) {
                    throw EngineError((string)"Unexpected record term in the model: " +
                                      LExp.ToString());
                }
                vector<ValueRef> FieldValues;
                for (u32 i = 0; i < Fields.size(); ++i) {
                    FieldValues.push_back(Raise(Z3Expr(Ctx, Z3_get_app_arg(*Ctx, App, i)),
                                                Fields[i].second));
                }
                return Mgr.MakeRecordValue(Type, FieldValues);
            }

            case TypeKindT::Map:
                return RaiseMap(LExp, Type);

            default:
                throw InternalError((string)"Cannot raise values of type " + Type->ToString() +
                                    " from Z3 models" +
                                    "\nAt: " + __FILE__ + ":" + to_string(__LINE__));
            }
        }

        ValueRef Z3Raiser::Do(const Z3Expr& LExp, const TypeRef& Type,
                              const Z3LCRef& LCtx, const Z3Model& Model)
        {
            Z3Raiser TheRaiser(LCtx, Model);
            return TheRaiser.Raise(LExp, Type);
        }

    } /* end namespace TP */
} /* end namespace SYMX */

//
// Z3Lowering.cpp ends here
