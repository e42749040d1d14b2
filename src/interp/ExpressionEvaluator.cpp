// ExpressionEvaluator.cpp ---
//
// Filename: ExpressionEvaluator.cpp
// Author: Abhishek Udupa
// Created: Tue Jan 06 05:16:00 2015 (-0500)
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

#include "../expr/SymxOps.hpp"
#include "../expr/ExprTypes.hpp"

#include "ValueOps.hpp"
#include "ExpressionEvaluator.hpp"

namespace SYMX {
    namespace Interp {

        using namespace Exprs;

        void CheckBinding(const ExpT& Var, const ValueRef& Value)
        {
            auto VarAsVar = Var->As<VarExpression>();
            if (VarAsVar == nullptr) {
                throw ModelingError((string)"Only variables can be bound, got: " +
                                    Var->ToString());
            }
            if (Value == ValueRef::NullPtr) {
                throw ModelingError((string)"Null value bound to variable \"" +
                                    VarAsVar->GetVarName() + "\"");
            }
            auto const& VarType = Var->GetType();
            auto const& ValueType = Value->GetType();
            if (VarType != ValueType && !VarType->Equals(*ValueType)) {
                throw ModelingError((string)"Value " + Value->ToString() + " of type " +
                                    ValueType->ToString() + " bound to variable \"" +
                                    VarAsVar->GetVarName() + "\" of type " +
                                    VarType->ToString());
            }
        }

        ExpressionEvaluator::ExpressionEvaluator(const BindingMapT& Bindings)
            : ExpressionVisitorBase("ExpressionEvaluator"), Bindings(Bindings)
        {
            // Nothing here
        }

        ExpressionEvaluator::~ExpressionEvaluator()
        {
            // Nothing here
        }

        inline ValueRef ExpressionEvaluator::EvaluateChild(const ExpT& Child)
        {
            Child->Accept(this);
            auto Retval = EvalStack.back();
            EvalStack.pop_back();
            return Retval;
        }

        inline bool ExpressionEvaluator::Memoized(const ExpressionBase* Exp)
        {
            auto it = Evaluated.find(Exp);
            if (it == Evaluated.end()) {
                return false;
            }
            EvalStack.push_back(it->second);
            return true;
        }

        inline void ExpressionEvaluator::Record(const ExpressionBase* Exp, const ValueRef& Value)
        {
            Evaluated[Exp] = Value;
            EvalStack.push_back(Value);
        }

        void ExpressionEvaluator::VisitConstExpression(const ConstExpression* Exp)
        {
            EvalStack.push_back(Exp->GetConstValue());
        }

        void ExpressionEvaluator::VisitVarExpression(const VarExpression* Exp)
        {
            if (Memoized(Exp)) {
                return;
            }
            auto it = Bindings.find(Exp);
            if (it == Bindings.end()) {
                throw ModelingError((string)"No binding for variable \"" + Exp->GetVarName() +
                                    "\" of type " + Exp->GetType()->ToString());
            }
            CheckBinding(Exp, it->second);
            Record(Exp, it->second);
        }

        void ExpressionEvaluator::VisitOpExpression(const OpExpression* Exp)
        {
            if (Memoized(Exp)) {
                return;
            }

            auto const& Children = Exp->GetChildren();
            auto OpCode = Exp->GetOpCode();

            if (OpCode == SymxOps::OpITE) {
                auto Cond = EvaluateChild(Children[0]);
                if (ValueOps::GetBool(Cond)) {
                    Record(Exp, EvaluateChild(Children[1]));
                } else {
                    Record(Exp, EvaluateChild(Children[2]));
                }
                return;
            }

            if (OpCode == SymxOps::OpAND || OpCode == SymxOps::OpOR) {
                // AND stops at the first false, OR at the first true
                const bool Deciding = (OpCode == SymxOps::OpOR);
                for (auto const& Child : Children) {
                    if (ValueOps::GetBool(EvaluateChild(Child)) == Deciding) {
                        Record(Exp, ValueOps::MakeBool(Deciding));
                        return;
                    }
                }
                Record(Exp, ValueOps::MakeBool(!Deciding));
                return;
            }

            if (OpCode == SymxOps::OpIMPLIES) {
                if (!ValueOps::GetBool(EvaluateChild(Children[0]))) {
                    Record(Exp, ValueOps::MakeBool(true));
                } else {
                    Record(Exp, EvaluateChild(Children[1]));
                }
                return;
            }

            const u32 NumChildren = Children.size();
            vector<ValueRef> ChildValues(NumChildren);
            for (u32 i = 0; i < NumChildren; ++i) {
                ChildValues[i] = EvaluateChild(Children[i]);
            }
            Record(Exp, ValueOps::Apply(Exp, ChildValues));
        }

        ValueRef ExpressionEvaluator::Do(const ExpT& Exp, const BindingMapT& Bindings)
        {
            if (Exp == ExpT::NullPtr) {
                throw ModelingError((string)"Cannot evaluate a null expression");
            }
            ExpressionEvaluator TheEvaluator(Bindings);
            return TheEvaluator.EvaluateChild(Exp);
        }

        bool ExpressionEvaluator::DoBool(const ExpT& Exp, const BindingMapT& Bindings)
        {
            if (!Exp->GetType()->Is<BooleanType>()) {
                throw ExprTypeError((string)"Expected a Boolean expression, got: " +
                                    Exp->ToString());
            }
            return ValueOps::GetBool(Do(Exp, Bindings));
        }

    } /* end namespace Interp */
} /* end namespace SYMX */

//
// ExpressionEvaluator.cpp ends here
