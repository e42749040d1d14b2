// DDCapabilityChecker.cpp ---
//
// Filename: DDCapabilityChecker.cpp
// Author: Abhishek Udupa
// Created: Sat Feb 07 16:56:00 2015 (-0500)
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

#include "DDCapabilityChecker.hpp"

namespace SYMX {
    namespace DD {

        using namespace Exprs;

        const u32 DDCapabilityChecker::MaxMapKeyWidth;

        DDCapabilityChecker::DDCapabilityChecker()
            : ExpressionVisitorBase("DDCapabilityChecker")
        {
            // Nothing here
        }

        DDCapabilityChecker::~DDCapabilityChecker()
        {
            // Nothing here
        }

        string DDCapabilityChecker::CheckType(const TypeRef& Type)
        {
            switch (Type->GetKind()) {
            case TypeKindT::Boolean:
            case TypeKindT::Integer:
                return "";

            case TypeKindT::BigInt:
                return "unbounded integers";
            case TypeKindT::Char:
                return "characters";
            case TypeKindT::Seq:
                return (Type->SAs<SeqType>()->IsString() ? "strings" : "sequences");

            case TypeKindT::Option:
                return CheckType(Type->SAs<OptionType>()->GetInnerType());

            case TypeKindT::Record:
                for (auto const& Field : Type->SAs<RecordType>()->GetFields()) {
                    auto Reason = CheckType(Field.second);
                    if (Reason != "") {
                        return Reason;
                    }
                }
                return "";

            case TypeKindT::Map: {
                auto TypeAsMap = Type->SAs<MapType>();
                auto const& KeyType = TypeAsMap->GetKeyType();
                if (KeyType->Is<IntegerType>()) {
                    if (KeyType->SAs<IntegerType>()->GetWidth() > MaxMapKeyWidth) {
                        return (string)"maps with a key domain larger than 2^" +
                            to_string(MaxMapKeyWidth);
                    }
                } else if (!KeyType->Is<BooleanType>()) {
                    return "maps with key type " + KeyType->ToString();
                }
                return CheckType(TypeAsMap->GetValueType());
            }

            case TypeKindT::DMap:
                // Lowered before it gets here
                return "default valued maps that were not lowered";
            }
            return "type " + Type->ToString();
        }

        void DDCapabilityChecker::CheckExp(const ExpressionBase* Exp)
        {
            auto Reason = CheckType(Exp->GetType());
            if (Reason != "") {
                throw CapabilityError((string)"The decision diagram backend cannot encode " +
                                      Reason + ", in expression:\n" + Exp->ToString());
            }
        }

        void DDCapabilityChecker::VisitConstExpression(const ConstExpression* Exp)
        {
            CheckExp(Exp);
        }

        void DDCapabilityChecker::VisitVarExpression(const VarExpression* Exp)
        {
            CheckExp(Exp);
        }

        void DDCapabilityChecker::VisitOpExpression(const OpExpression* Exp)
        {
            if (!Visited.insert(Exp).second) {
                return;
            }

            auto OpCode = Exp->GetOpCode();
            if (OpCode >= SymxOps::OpSEQUNIT && OpCode <= SymxOps::OpSEQREGEX) {
                throw CapabilityError((string)"The decision diagram backend cannot encode " +
                                      "sequence or regex operation " +
                                      SymxOps::OpToString(OpCode) + ", in expression:\n" +
                                      Exp->ToString());
            }
            if (OpCode >= SymxOps::OpDMAPGET && OpCode <= SymxOps::OpDMAPCOUNT) {
                throw InternalError((string)"Default valued map operation reached the " +
                                    "decision diagram backend unlowered:\n" + Exp->ToString() +
                                    "\nAt: " + __FILE__ + ":" + to_string(__LINE__));
            }

            CheckExp(Exp);
            ExpressionVisitorBase::VisitOpExpression(Exp);
        }

        void DDCapabilityChecker::Do(const ExpT& Exp)
        {
            DDCapabilityChecker TheChecker;
            Exp->Accept(&TheChecker);
        }

        void DDCapabilityChecker::Do(const TypeRef& Type)
        {
            auto Reason = CheckType(Type);
            if (Reason != "") {
                throw CapabilityError((string)"The decision diagram backend cannot encode " +
                                      Reason + " (type " + Type->ToString() + ")");
            }
        }

    } /* end namespace DD */
} /* end namespace SYMX */

//
// DDCapabilityChecker.cpp ends here
