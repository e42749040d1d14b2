// Solution.cpp ---
//
// Filename: Solution.cpp
// Author: Abhishek Udupa
// Created: Thu Feb 12 23:11:00 2015 (-0500)
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

#include "Solution.hpp"

namespace SYMX {
    namespace Query {

        using namespace Exprs;

        Solution::Solution()
            : Satisfiable(false)
        {
            // Nothing here
        }

        Solution::Solution(const vector<ExpT>& Vars, const BindingMapT& Model)
            : Satisfiable(true), Vars(Vars), Model(Model)
        {
            // Nothing here
        }

        Solution::Solution(const Solution& Other)
            : Satisfiable(Other.Satisfiable), Vars(Other.Vars), Model(Other.Model)
        {
            // Nothing here
        }

        Solution::Solution(Solution&& Other)
            : Satisfiable(Other.Satisfiable), Vars(move(Other.Vars)), Model(move(Other.Model))
        {
            // Nothing here
        }

        Solution::~Solution()
        {
            // Nothing here
        }

        Solution& Solution::operator = (const Solution& Other)
        {
            if (&Other == this) {
                return *this;
            }
            Satisfiable = Other.Satisfiable;
            Vars = Other.Vars;
            Model = Other.Model;
            return *this;
        }

        Solution& Solution::operator = (Solution&& Other)
        {
            Satisfiable = Other.Satisfiable;
            Vars = move(Other.Vars);
            Model = move(Other.Model);
            return *this;
        }

        bool Solution::IsSatisfiable() const
        {
            return Satisfiable;
        }

        ValueRef Solution::Get(const ExpT& Var) const
        {
            if (!Satisfiable) {
                throw ModelingError((string)"Cannot read " +
                                    (Var.IsNull_() ? string("null") : Var->ToString()) +
                                    " from an unsatisfiable solution");
            }
            if (Var.IsNull_() || !Var->Is<VarExpression>()) {
                throw ModelingError((string)"Solutions can only be queried for variables, got: " +
                                    (Var.IsNull_() ? string("null") : Var->ToString()));
            }
            auto it = Model.find(Var);
            if (it == Model.end()) {
                return Var->GetType()->GetDefaultValue();
            }
            return it->second;
        }

        const vector<ExpT>& Solution::GetVars() const
        {
            return Vars;
        }

        const BindingMapT& Solution::GetModel() const
        {
            return Model;
        }

        string Solution::ToString(u32 Verbosity) const
        {
            if (!Satisfiable) {
                return "unsat";
            }
            ostringstream sstr;
            sstr << "sat {";
            bool First = true;
            for (auto const& Var : Vars) {
                if (!First) {
                    sstr << ", ";
                }
                First = false;
                sstr << Var->ToString() << " = " << Get(Var)->ToString();
            }
            sstr << "}";
            return sstr.str();
        }

    } /* end namespace Query */
} /* end namespace SYMX */

//
// Solution.cpp ends here
