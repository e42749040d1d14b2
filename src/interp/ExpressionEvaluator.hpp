// ExpressionEvaluator.hpp ---
//
// Filename: ExpressionEvaluator.hpp
// Author: Abhishek Udupa
// Created: Wed Mar 04 22:53:00 2015 (-0500)
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

#if !defined SYMX_EXPRESSION_EVALUATOR_HPP_
#define SYMX_EXPRESSION_EVALUATOR_HPP_

#include <unordered_map>
#include <vector>

#include "../common/SymxFwdDecls.hpp"
#include "../expr/Expressions.hpp"
#include "../expr/Visitors.hpp"
#include "../expr/Values.hpp"

namespace SYMX {
    namespace Interp {

        using Exprs::ExpT;
        using Exprs::ValueRef;

        // Free variable to value
        typedef unordered_map<ExpT, ValueRef, SmartPtrIdentityHasher> BindingMapT;

        // Structural interpretation of an expression against a
        // complete binding of its free variables. Every node is
        // evaluated at most once. The untaken branch of an ITE and
        // the operands after a deciding AND/OR operand are not
        // evaluated at all.
        class ExpressionEvaluator : public Exprs::ExpressionVisitorBase
        {
        private:
            const BindingMapT& Bindings;
            unordered_map<const Exprs::ExpressionBase*, ValueRef> Evaluated;
            vector<ValueRef> EvalStack;

            inline ValueRef EvaluateChild(const ExpT& Child);
            inline bool Memoized(const Exprs::ExpressionBase* Exp);
            inline void Record(const Exprs::ExpressionBase* Exp, const ValueRef& Value);

        public:
            ExpressionEvaluator(const BindingMapT& Bindings);
            virtual ~ExpressionEvaluator();

            virtual void VisitConstExpression(const Exprs::ConstExpression* Exp) override;
            virtual void VisitVarExpression(const Exprs::VarExpression* Exp) override;
            virtual void VisitOpExpression(const Exprs::OpExpression* Exp) override;

            // Throws ModelingError on a missing or mistyped binding
            static ValueRef Do(const ExpT& Exp, const BindingMapT& Bindings);
            static bool DoBool(const ExpT& Exp, const BindingMapT& Bindings);
        };

        // Validates a single binding against its variable
        void CheckBinding(const ExpT& Var, const ValueRef& Value);

    } /* end namespace Interp */
} /* end namespace SYMX */

#endif /* SYMX_EXPRESSION_EVALUATOR_HPP_ */

//
// ExpressionEvaluator.hpp ends here
