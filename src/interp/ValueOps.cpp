// ValueOps.cpp ---
//
// Filename: ValueOps.cpp
// Author: Abhishek Udupa
// Created: Tue Jan 20 18:40:00 2015 (-0500)
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

#include "../expr/ExprMgr.hpp"
#include "../regex/RegexMgr.hpp"
#include "../regex/RegexMatcher.hpp"

#include "ValueOps.hpp"

namespace SYMX {
    namespace Interp {

        using namespace Exprs;

        namespace Detail {

            static inline const vector<ValueRef>& Elems(const ValueRef& Seq)
            {
                return Seq->SAs<SeqValue>()->GetElems();
            }

            static inline bool MatchesAt(const vector<ValueRef>& Seq, const vector<ValueRef>& Sub,
                                         u64 Position)
            {
                if (Position + Sub.size() > Seq.size()) {
                    return false;
                }
                for (u64 i = 0; i < Sub.size(); ++i) {
                    if (!Seq[Position + i]->Equals(*(Sub[i]))) {
                        return false;
                    }
                }
                return true;
            }

            // First position at or after Start where Sub occurs, or -1
            static inline i64 FindSub(const vector<ValueRef>& Seq, const vector<ValueRef>& Sub,
                                      u64 Start)
            {
                if (Start > Seq.size()) {
                    return -1;
                }
                for (u64 i = Start; i + Sub.size() <= Seq.size(); ++i) {
                    if (MatchesAt(Seq, Sub, i)) {
                        return (i64)i;
                    }
                }
                return -1;
            }

            static inline ValueRef MakeSeq(const TypeRef& SeqType, vector<ValueRef>&& Elems)
            {
                return new SeqValue(SeqType, std::move(Elems));
            }

        } /* end namespace Detail */

        bool ValueOps::GetBool(const ValueRef& Value)
        {
            return Value->SAs<BoolValue>()->GetValue();
        }

        const BigIntT& ValueOps::GetBigInt(const ValueRef& Value)
        {
            return Value->SAs<BigIntValue>()->GetValue();
        }

        ValueRef ValueOps::MakeBool(bool Value)
        {
            return ExprMgr::Instance().MakeBoolValue(Value);
        }

        ValueRef ValueOps::Add(const ValueRef& Value1, const ValueRef& Value2)
        {
            if (Value1->Is<IntValue>()) {
                return new IntValue(Value1->GetType(),
                                    Value1->SAs<IntValue>()->GetBits() +
                                    Value2->SAs<IntValue>()->GetBits());
            }
            return ExprMgr::Instance().MakeBigIntValue(GetBigInt(Value1) + GetBigInt(Value2));
        }

        ValueRef ValueOps::Sub(const ValueRef& Value1, const ValueRef& Value2)
        {
            if (Value1->Is<IntValue>()) {
                return new IntValue(Value1->GetType(),
                                    Value1->SAs<IntValue>()->GetBits() -
                                    Value2->SAs<IntValue>()->GetBits());
            }
            return ExprMgr::Instance().MakeBigIntValue(GetBigInt(Value1) - GetBigInt(Value2));
        }

        ValueRef ValueOps::Mul(const ValueRef& Value1, const ValueRef& Value2)
        {
            if (Value1->Is<IntValue>()) {
                return new IntValue(Value1->GetType(),
                                    Value1->SAs<IntValue>()->GetBits() *
                                    Value2->SAs<IntValue>()->GetBits());
            }
            return ExprMgr::Instance().MakeBigIntValue(GetBigInt(Value1) * GetBigInt(Value2));
        }

        ValueRef ValueOps::Compare(i64 OpCode, const ValueRef& Value1, const ValueRef& Value2)
        {
            auto Res = Value1->Compare(*Value2);
            switch (OpCode) {
            case SymxOps::OpLT:
                return MakeBool(Res < 0);
            case SymxOps::OpLE:
                return MakeBool(Res <= 0);
            case SymxOps::OpGT:
                return MakeBool(Res > 0);
            case SymxOps::OpGE:
                return MakeBool(Res >= 0);
            default:
                throw InternalError((string)"Not a comparison: " + SymxOps::OpToString(OpCode) +
                                    "\nAt: " + __FILE__ + ":" + to_string(__LINE__));
            }
        }

        ValueRef ValueOps::Equals(const ValueRef& Value1, const ValueRef& Value2)
        {
            return MakeBool(Value1->Equals(*Value2));
        }

        ValueRef ValueOps::BitOp(i64 OpCode, const ValueRef& Value1, const ValueRef& Value2)
        {
            auto Bits1 = Value1->SAs<IntValue>()->GetBits();
            auto Bits2 = Value2->SAs<IntValue>()->GetBits();
            switch (OpCode) {
            case SymxOps::OpBVAND:
                return new IntValue(Value1->GetType(), Bits1 & Bits2);
            case SymxOps::OpBVOR:
                return new IntValue(Value1->GetType(), Bits1 | Bits2);
            case SymxOps::OpBVXOR:
                return new IntValue(Value1->GetType(), Bits1 ^ Bits2);
            default:
                throw InternalError((string)"Not a bitwise operator: " +
                                    SymxOps::OpToString(OpCode) +
                                    "\nAt: " + __FILE__ + ":" + to_string(__LINE__));
            }
        }

        ValueRef ValueOps::BitNot(const ValueRef& Value)
        {
            return new IntValue(Value->GetType(), ~(Value->SAs<IntValue>()->GetBits()));
        }

        ValueRef ValueOps::Cast(const ValueRef& Value, const TypeRef& TargetType)
        {
            BigIntT Source = (Value->Is<IntValue>() ? Value->SAs<IntValue>()->ToBigInt() :
                              GetBigInt(Value));
            auto TargetAsInt = TargetType->As<IntegerType>();
            if (TargetAsInt == nullptr) {
                return ExprMgr::Instance().MakeBigIntValue(Source);
            }
            // Reduce modulo 2^Width
            BigIntT Modulus = BigIntT(1) << TargetAsInt->GetWidth();
            BigIntT Reduced = Source % Modulus;
            if (Reduced < 0) {
                Reduced += Modulus;
            }
            return new IntValue(TargetType, Reduced.convert_to<u64>());
        }

        ValueRef ValueOps::MkRecord(const TypeRef& RecType, const vector<ValueRef>& Fields)
        {
            return new RecordValue(RecType, Fields);
        }

        ValueRef ValueOps::Project(const ValueRef& Record, const string& FieldName)
        {
            return Record->SAs<RecordValue>()->GetFieldValue(FieldName);
        }

        ValueRef ValueOps::WithField(const ValueRef& Record, const string& FieldName,
                                     const ValueRef& FieldValue)
        {
            auto RecType = Record->GetType()->SAs<RecordType>();
            auto Fields = Record->SAs<RecordValue>()->GetFieldValues();
            Fields[RecType->GetFieldIndex(FieldName)] = FieldValue;
            return new RecordValue(Record->GetType(), Fields);
        }

        ValueRef ValueOps::OptSome(const TypeRef& OptType, const ValueRef& Value)
        {
            return new OptionValue(OptType, Value);
        }

        ValueRef ValueOps::OptIsSome(const ValueRef& Option)
        {
            return MakeBool(Option->SAs<OptionValue>()->IsSome());
        }

        ValueRef ValueOps::OptValue(const ValueRef& Option)
        {
            auto AsOption = Option->SAs<OptionValue>();
            if (AsOption->IsSome()) {
                return AsOption->GetInner();
            }
            return Option->GetType()->SAs<OptionType>()->GetInnerType()->GetDefaultValue();
        }

        ValueRef ValueOps::SeqUnit(const TypeRef& SeqTypeRef, const ValueRef& Elem)
        {
            vector<ValueRef> Elems = { Elem };
            return Detail::MakeSeq(SeqTypeRef, std::move(Elems));
        }

        ValueRef ValueOps::SeqConcat(const vector<ValueRef>& Seqs)
        {
            vector<ValueRef> Elems;
            for (auto const& Seq : Seqs) {
                auto const& SeqElems = Detail::Elems(Seq);
                Elems.insert(Elems.end(), SeqElems.begin(), SeqElems.end());
            }
            return Detail::MakeSeq(Seqs[0]->GetType(), std::move(Elems));
        }

        ValueRef ValueOps::SeqLength(const ValueRef& Seq)
        {
            return ExprMgr::Instance().MakeBigIntValue(BigIntT(Detail::Elems(Seq).size()));
        }

        ValueRef ValueOps::SeqAt(const ValueRef& Seq, const ValueRef& Index)
        {
            auto const& Elems = Detail::Elems(Seq);
            auto const& I = GetBigInt(Index);
            vector<ValueRef> Retval;
            if (I >= 0 && I < BigIntT(Elems.size())) {
                Retval.push_back(Elems[I.convert_to<u64>()]);
            }
            return Detail::MakeSeq(Seq->GetType(), std::move(Retval));
        }

        ValueRef ValueOps::SeqSlice(const ValueRef& Seq, const ValueRef& Offset,
                                    const ValueRef& Length)
        {
            auto const& Elems = Detail::Elems(Seq);
            auto const& Off = GetBigInt(Offset);
            auto const& Len = GetBigInt(Length);
            vector<ValueRef> Retval;
            if (Off < 0 || Off >= BigIntT(Elems.size()) || Len <= 0) {
                return Detail::MakeSeq(Seq->GetType(), std::move(Retval));
            }
            u64 Start = Off.convert_to<u64>();
            u64 Available = Elems.size() - Start;
            u64 Count = (Len < BigIntT(Available) ? Len.convert_to<u64>() : Available);
            Retval.insert(Retval.end(), Elems.begin() + Start, Elems.begin() + Start + Count);
            return Detail::MakeSeq(Seq->GetType(), std::move(Retval));
        }

        ValueRef ValueOps::SeqIndexOf(const ValueRef& Seq, const ValueRef& Sub,
                                      const ValueRef& Offset)
        {
            auto const& Elems = Detail::Elems(Seq);
            auto const& Off = GetBigInt(Offset);
            auto& Mgr = ExprMgr::Instance();
            if (Off < 0 || Off > BigIntT(Elems.size())) {
                return Mgr.MakeBigIntValue(BigIntT(-1));
            }
            return Mgr.MakeBigIntValue(BigIntT(Detail::FindSub(Elems, Detail::Elems(Sub),
                                                               Off.convert_to<u64>())));
        }

        ValueRef ValueOps::SeqContains(const ValueRef& Seq, const ValueRef& Sub)
        {
            return MakeBool(Detail::FindSub(Detail::Elems(Seq), Detail::Elems(Sub), 0) >= 0);
        }

        ValueRef ValueOps::SeqStartsWith(const ValueRef& Seq, const ValueRef& Prefix)
        {
            return MakeBool(Detail::MatchesAt(Detail::Elems(Seq), Detail::Elems(Prefix), 0));
        }

        ValueRef ValueOps::SeqEndsWith(const ValueRef& Seq, const ValueRef& Suffix)
        {
            auto const& Elems = Detail::Elems(Seq);
            auto const& SuffixElems = Detail::Elems(Suffix);
            if (SuffixElems.size() > Elems.size()) {
                return MakeBool(false);
            }
            return MakeBool(Detail::MatchesAt(Elems, SuffixElems,
                                              Elems.size() - SuffixElems.size()));
        }

        ValueRef ValueOps::SeqReplaceFirst(const ValueRef& Seq, const ValueRef& Sub,
                                           const ValueRef& Replacement)
        {
            auto const& Elems = Detail::Elems(Seq);
            auto const& SubElems = Detail::Elems(Sub);
            auto const& ReplElems = Detail::Elems(Replacement);

            auto Position = Detail::FindSub(Elems, SubElems, 0);
            if (Position < 0) {
                return Seq;
            }
            vector<ValueRef> Retval(Elems.begin(), Elems.begin() + Position);
            Retval.insert(Retval.end(), ReplElems.begin(), ReplElems.end());
            Retval.insert(Retval.end(), Elems.begin() + Position + SubElems.size(), Elems.end());
            return Detail::MakeSeq(Seq->GetType(), std::move(Retval));
        }

        ValueRef ValueOps::SeqRegexMatch(const ValueRef& Seq, const Regex::RegexRef& Pattern)
        {
            return MakeBool(Regex::RegexMatcher::Accepts(Pattern,
                                                         Seq->SAs<SeqValue>()->GetCodePoints()));
        }

        ValueRef ValueOps::MapGet(const TypeRef& ResultType, const ValueRef& Map,
                                  const ValueRef& Key)
        {
            return new OptionValue(ResultType, Map->SAs<MapValue>()->Find(Key));
        }

        ValueRef ValueOps::MapSet(const ValueRef& Map, const ValueRef& Key, const ValueRef& Value)
        {
            auto Entries = Map->SAs<MapValue>()->GetEntries();
            Entries[Key] = Value;
            return new MapValue(Map->GetType(), std::move(Entries));
        }

        ValueRef ValueOps::MapDelete(const ValueRef& Map, const ValueRef& Key)
        {
            auto Entries = Map->SAs<MapValue>()->GetEntries();
            Entries.erase(Key);
            return new MapValue(Map->GetType(), std::move(Entries));
        }

        ValueRef ValueOps::DMapGet(const ValueRef& Map, const ValueRef& Key)
        {
            return Map->SAs<DMapValue>()->Get(Key);
        }

        ValueRef ValueOps::DMapSet(const ValueRef& Map, const ValueRef& Key, const ValueRef& Value)
        {
            return Map->SAs<DMapValue>()->Set(Key, Value);
        }

        ValueRef ValueOps::DMapCount(const ValueRef& Map)
        {
            auto& Mgr = ExprMgr::Instance();
            return Mgr.MakeIntValue(Mgr.GetInt32Type(), (i64)Map->SAs<DMapValue>()->Count());
        }

        ValueRef ValueOps::Apply(const OpExpression* Exp, const vector<ValueRef>& Args)
        {
            switch (Exp->GetOpCode()) {
            case SymxOps::OpAND:
                for (auto const& Arg : Args) {
                    if (!GetBool(Arg)) {
                        return MakeBool(false);
                    }
                }
                return MakeBool(true);

            case SymxOps::OpOR:
                for (auto const& Arg : Args) {
                    if (GetBool(Arg)) {
                        return MakeBool(true);
                    }
                }
                return MakeBool(false);

            case SymxOps::OpNOT:
                return MakeBool(!GetBool(Args[0]));
            case SymxOps::OpIMPLIES:
                return MakeBool(!GetBool(Args[0]) || GetBool(Args[1]));
            case SymxOps::OpITE:
                return (GetBool(Args[0]) ? Args[1] : Args[2]);
            case SymxOps::OpEQ:
                return Equals(Args[0], Args[1]);

            case SymxOps::OpADD:
                return Add(Args[0], Args[1]);
            case SymxOps::OpSUB:
                return Sub(Args[0], Args[1]);
            case SymxOps::OpMUL:
                return Mul(Args[0], Args[1]);
            case SymxOps::OpLT:
            case SymxOps::OpLE:
            case SymxOps::OpGT:
            case SymxOps::OpGE:
                return Compare(Exp->GetOpCode(), Args[0], Args[1]);

            case SymxOps::OpBVAND:
            case SymxOps::OpBVOR:
            case SymxOps::OpBVXOR:
                return BitOp(Exp->GetOpCode(), Args[0], Args[1]);
            case SymxOps::OpBVNOT:
                return BitNot(Args[0]);
            case SymxOps::OpCAST:
                return Cast(Args[0], Exp->GetType());

            case SymxOps::OpMKRECORD:
                return MkRecord(Exp->GetType(), Args);
            case SymxOps::OpPROJECT:
                return Project(Args[0], Exp->GetPayload());
            case SymxOps::OpWITHFIELD:
                return WithField(Args[0], Exp->GetPayload(), Args[1]);

            case SymxOps::OpOPTSOME:
                return OptSome(Exp->GetType(), Args[0]);
            case SymxOps::OpOPTISSOME:
                return OptIsSome(Args[0]);
            case SymxOps::OpOPTVALUE:
                return OptValue(Args[0]);

            case SymxOps::OpSEQUNIT:
                return SeqUnit(Exp->GetType(), Args[0]);
            case SymxOps::OpSEQCONCAT:
                return SeqConcat(Args);
            case SymxOps::OpSEQLENGTH:
                return SeqLength(Args[0]);
            case SymxOps::OpSEQAT:
                return SeqAt(Args[0], Args[1]);
            case SymxOps::OpSEQSLICE:
                return SeqSlice(Args[0], Args[1], Args[2]);
            case SymxOps::OpSEQINDEXOF:
                return SeqIndexOf(Args[0], Args[1], Args[2]);
            case SymxOps::OpSEQCONTAINS:
                return SeqContains(Args[0], Args[1]);
            case SymxOps::OpSEQSTARTSWITH:
                return SeqStartsWith(Args[0], Args[1]);
            case SymxOps::OpSEQENDSWITH:
                return SeqEndsWith(Args[0], Args[1]);
            case SymxOps::OpSEQREPLACEFIRST:
                return SeqReplaceFirst(Args[0], Args[1], Args[2]);
            case SymxOps::OpSEQREGEX:
                return SeqRegexMatch(Args[0], Regex::RegexMgr::Instance().Parse(Exp->GetPayload()));

            case SymxOps::OpMAPGET:
                return MapGet(Exp->GetType(), Args[0], Args[1]);
            case SymxOps::OpMAPSET:
                return MapSet(Args[0], Args[1], Args[2]);
            case SymxOps::OpMAPDELETE:
                return MapDelete(Args[0], Args[1]);

            case SymxOps::OpDMAPGET:
                return DMapGet(Args[0], Args[1]);
            case SymxOps::OpDMAPSET:
                return DMapSet(Args[0], Args[1], Args[2]);
            case SymxOps::OpDMAPCOUNT:
                return DMapCount(Args[0]);

            default:
                throw InternalError((string)"Unhandled op code " +
                                    SymxOps::OpToString(Exp->GetOpCode()) +
                                    "\nAt: " + __FILE__ + ":" + to_string(__LINE__));
            }
        }

    } /* end namespace Interp */
} /* end namespace SYMX */

//
// ValueOps.cpp ends here
