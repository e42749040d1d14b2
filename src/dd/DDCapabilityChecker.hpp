// DDCapabilityChecker.hpp ---
//
// Filename: DDCapabilityChecker.hpp
// Author: Abhishek Udupa
// Created: Sun Jul 12 00:02:00 2015 (-0500)
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

// Rejects, before any diagram is built, expressions the decision
// diagram backend cannot encode with a finite number of bits

#if !defined SYMX_DD_CAPABILITY_CHECKER_HPP_
#define SYMX_DD_CAPABILITY_CHECKER_HPP_

#include <unordered_set>

#include "../common/SymxFwdDecls.hpp"
#include "../expr/Visitors.hpp"

namespace SYMX {
    namespace DD {

        using Exprs::ExpT;
        using Exprs::TypeRef;

        class DDCapabilityChecker : public Exprs::ExpressionVisitorBase
        {
        private:
            unordered_set<const Exprs::ExpressionBase*> Visited;

            void CheckExp(const Exprs::ExpressionBase* Exp);

        public:
            // Largest width of an integer map key
            static const u32 MaxMapKeyWidth = 8;

            DDCapabilityChecker();
            virtual ~DDCapabilityChecker();

            virtual void VisitConstExpression(const Exprs::ConstExpression* Exp) override;
            virtual void VisitVarExpression(const Exprs::VarExpression* Exp) override;
            virtual void VisitOpExpression(const Exprs::OpExpression* Exp) override;

            // Empty string if Type can be blasted, the reason otherwise
            static string CheckType(const TypeRef& Type);
            // Throws CapabilityError
            static void Do(const ExpT& Exp);
            static void Do(const TypeRef& Type);
        };

    } /* end namespace DD */
} /* end namespace SYMX */

#endif /* SYMX_DD_CAPABILITY_CHECKER_HPP_ */

//
// DDCapabilityChecker.hpp ends here
