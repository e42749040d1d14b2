// Solution.hpp ---
//
// Filename: Solution.hpp
// Author: Abhishek Udupa
// Created: Mon Feb 16 20:41:00 2015 (-0500)
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

// The result of one solve: whether the query was satisfiable and,
// if so, a value for each of its free variables

#if !defined SYMX_SOLUTION_HPP_
#define SYMX_SOLUTION_HPP_

#include <vector>

#include "../common/SymxFwdDecls.hpp"
#include "../expr/Expressions.hpp"
#include "../expr/Values.hpp"
#include "../interp/ExpressionEvaluator.hpp"
#include "../marshal/RecordMarshaler.hpp"

namespace SYMX {
    namespace Query {

        using Exprs::ExpT;
        using Exprs::ValueRef;
        using Interp::BindingMapT;

        class Solution : public Stringifiable
        {
        private:
            bool Satisfiable;
            // In order of first occurrence in the query
            vector<ExpT> Vars;
            BindingMapT Model;

        public:
            // An unsatisfiable solution
            Solution();
            Solution(const vector<ExpT>& Vars, const BindingMapT& Model);
            Solution(const Solution& Other);
            Solution(Solution&& Other);
            virtual ~Solution();

            Solution& operator = (const Solution& Other);
            Solution& operator = (Solution&& Other);

            bool IsSatisfiable() const;

            // The value of Var in the model, or the default value of
            // its type if the query left it unconstrained. Throws
            // ModelingError if the solution is unsatisfiable.
            ValueRef Get(const ExpT& Var) const;

            // Marshals a record valued variable
            template <typename T>
            inline T GetAs(const ExpT& Var, const Marshal::RecordMarshaler<T>& Marshaler) const
            {
                auto Value = Get(Var);
                auto ValueAsRec = Value->As<Exprs::RecordValue>();
                if (ValueAsRec == nullptr) {
                    throw ModelingError((string)"Cannot marshal the non record value " +
                                        Value->ToString() + " of " + Var->ToString());
                }
                auto RecType = Value->GetType()->SAs<Exprs::RecordType>();
                Marshal::NamedValuesT NamedValues;
                auto const& Fields = RecType->GetFields();
                for (u32 i = 0; i < Fields.size(); ++i) {
                    NamedValues[Fields[i].first] = ValueAsRec->GetFieldValue(i);
                }
                return Marshaler.Build(NamedValues);
            }

            const vector<ExpT>& GetVars() const;
            const BindingMapT& GetModel() const;

            virtual string ToString(u32 Verbosity = 0) const override;
        };

    } /* end namespace Query */
} /* end namespace SYMX */

#endif /* SYMX_SOLUTION_HPP_ */

//
// Solution.hpp ends here
