// Visitors.hpp ---
//
// Filename: Visitors.hpp
// Author: Abhishek Udupa
// Created: Fri Mar 13 11:10:00 2015 (-0500)
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

#if !defined SYMX_VISITORS_HPP_
#define SYMX_VISITORS_HPP_

#include <vector>
#include <unordered_map>
#include <unordered_set>

#include "../common/SymxFwdDecls.hpp"
#include "Expressions.hpp"

namespace SYMX {
    namespace Exprs {

        typedef unordered_map<ExpT, ExpT, SmartPtrIdentityHasher> SubstMapT;

        class ExpressionVisitorBase
        {
        private:
            string Name;

        public:
            ExpressionVisitorBase(const string& Name);
            virtual ~ExpressionVisitorBase();
            const string& GetName() const;

            virtual void VisitConstExpression(const ConstExpression* Exp);
            virtual void VisitVarExpression(const VarExpression* Exp);
            virtual void VisitOpExpression(const OpExpression* Exp);
        };

        // Collects the free variables of an expression, in the
        // order of their first occurrence in a left to right walk
        class VarGatherer : public ExpressionVisitorBase
        {
        private:
            unordered_set<const ExpressionBase*> Visited;
            vector<ExpT> GatheredVars;

        public:
            VarGatherer();
            virtual ~VarGatherer();

            virtual void VisitVarExpression(const VarExpression* Exp) override;
            virtual void VisitOpExpression(const OpExpression* Exp) override;

            static vector<ExpT> Do(const ExpT& Exp);
            static vector<ExpT> Do(const vector<ExpT>& Exps);
        };

        // Replaces nodes by nodes. Rebuilt nodes go through the
        // manager, so they are interned and simplified.
        class Substitutor : public ExpressionVisitorBase
        {
        private:
            const SubstMapT& Subst;
            unordered_map<const ExpressionBase*, ExpT> Rebuilt;
            vector<ExpT> SubstStack;

        public:
            Substitutor(const SubstMapT& Subst);
            virtual ~Substitutor();

            virtual void VisitConstExpression(const ConstExpression* Exp) override;
            virtual void VisitVarExpression(const VarExpression* Exp) override;
            virtual void VisitOpExpression(const OpExpression* Exp) override;

            static ExpT Do(const SubstMapT& Subst, const ExpT& Exp);
        };

    } /* end namespace Exprs */
} /* end namespace SYMX */

#endif /* SYMX_VISITORS_HPP_ */

//
// Visitors.hpp ends here
