// Function.cpp ---
//
// Filename: Function.cpp
// Author: Abhishek Udupa
// Created: Sun May 24 18:11:00 2015 (-0500)
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

#include <unordered_set>
#include <sstream>

#include "../expr/ExprMgr.hpp"
#include "../interp/ExpressionEvaluator.hpp"

#include "Solver.hpp"
#include "Function.hpp"

namespace SYMX {
    namespace Query {

        using namespace Exprs;

        Function::Function(const vector<ExpT>& Params, const ExpT& Body)
            : Params(Params), Body(Body), Compiled(Compile::CompiledFunctionRef::NullPtr)
        {
            if (Body.IsNull_()) {
                throw ModelingError("The body of a function cannot be null");
            }

            unordered_set<ExpT, SmartPtrIdentityHasher> ParamSet;
            for (auto const& Param : Params) {
                if (Param.IsNull_() || !Param->Is<VarExpression>()) {
                    throw ModelingError((string)"Function parameters must be variables, got: " +
                                        (Param.IsNull_() ? string("null") : Param->ToString()));
                }
                if (!ParamSet.insert(Param).second) {
                    throw ModelingError((string)"Parameter " + Param->ToString() +
                                        " appears more than once");
                }
            }
            for (auto const& Var : VarGatherer::Do(Body)) {
                if (ParamSet.find(Var) == ParamSet.end()) {
                    throw ModelingError((string)"Variable " + Var->ToString() +
                                        " in the body of a function is not a parameter");
                }
            }
        }

        Function::~Function()
        {
            // Nothing here
        }

        const vector<ExpT>& Function::GetParams() const
        {
            return Params;
        }

        const ExpT& Function::GetBody() const
        {
            return Body;
        }

        void Function::Compile()
        {
            if (Compiled.IsNull_()) {
                Compiled = Compile::Compiler::Compile(Body, Params);
            }
        }

        bool Function::IsCompiled() const
        {
            return !Compiled.IsNull_();
        }

        ValueRef Function::Evaluate(const vector<ValueRef>& Args) const
        {
            if (!Compiled.IsNull_()) {
                return Compiled->Evaluate(Args);
            }

            if (Args.size() != Params.size()) {
                throw ModelingError((string)"Function expects " + to_string(Params.size()) +
                                    " arguments, got " + to_string(Args.size()));
            }
            Interp::BindingMapT Bindings;
            for (u32 i = 0; i < Params.size(); ++i) {
                Interp::CheckBinding(Params[i], Args[i]);
                Bindings[Params[i]] = Args[i];
            }
            return Interp::ExpressionEvaluator::Do(Body, Bindings);
        }

        ExpT Function::MakeCondition(const InvariantT& Invariant) const
        {
            auto Condition = Invariant(Params, Body);
            if (Condition.IsNull_()) {
                throw ModelingError("The invariant of a function produced a null expression");
            }
            return Condition;
        }

        boost::optional<vector<ValueRef>> Function::Find(const InvariantT& Invariant,
                                                         BackendT Backend) const
        {
            auto TheSolution = Solver::FindFirst(MakeCondition(Invariant), Backend);
            if (!TheSolution) {
                return boost::none;
            }
            vector<ValueRef> Retval;
            for (auto const& Param : Params) {
                Retval.push_back(TheSolution->Get(Param));
            }
            return Retval;
        }

        SolutionEnumerator Function::FindAll(const InvariantT& Invariant, BackendT Backend) const
        {
            return Solver::FindAll(MakeCondition(Invariant), Backend);
        }

        string Function::ToString(u32 Verbosity) const
        {
            ostringstream sstr;
            sstr << "fun (";
            for (u32 i = 0; i < Params.size(); ++i) {
                if (i > 0) {
                    sstr << ", ";
                }
                sstr << Params[i]->ToString() << " : " << Params[i]->GetType()->ToString();
            }
            sstr << ") -> " << Body->ToString();
            return sstr.str();
        }

    } /* end namespace Query */
} /* end namespace SYMX */

//
// Function.cpp ends here
