// DDBitBlaster.hpp ---
//
// Filename: DDBitBlaster.hpp
// Author: Abhishek Udupa
// Created: Fri Jul 03 16:01:00 2015 (-0500)
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

// Translates finite domain expressions into vectors of decision
// diagrams, one per bit of the value. Layouts, from the lowest bit:
//   Boolean     one bit
//   Integer     the two's complement bits, least significant first
//   Option      the "is some" bit, then the inner value
//   Record      the fields in declaration order
//   Map         for each key of the domain, in order, an
//               Option<Value> entry
// The bits of the inner value of a None are unconstrained, so
// equality is decided per type rather than bit by bit.

#if !defined SYMX_DD_BIT_BLASTER_HPP_
#define SYMX_DD_BIT_BLASTER_HPP_

#include <vector>
#include <unordered_map>

#include "../common/SymxFwdDecls.hpp"
#include "../expr/Visitors.hpp"

#include "DDManager.hpp"

namespace SYMX {
    namespace DD {

        using Exprs::ExpT;
        using Exprs::TypeRef;
        using Exprs::ValueRef;

        typedef vector<DDNodeRef> BitsT;

        class DDBitBlaster : public Exprs::ExpressionVisitorBase
        {
        private:
            DDManager& Mgr;
            unordered_map<ExpT, BitsT, SmartPtrIdentityHasher> Blasted;
            // Diagram variables allocated to each variable expression
            unordered_map<ExpT, vector<u32>, SmartPtrIdentityHasher> VarIndices;
            vector<BitsT> BitStack;

            BitsT MakeAdd(const BitsT& A, const BitsT& B, bool Subtract);
            BitsT MakeMul(const BitsT& A, const BitsT& B);
            DDNodeRef MakeLT(const BitsT& A, const BitsT& B, bool OrEqual, bool Signed);
            BitsT MakeMux(DDNodeRef Cond, const BitsT& Then, const BitsT& Else);
            DDNodeRef MakeEQ(const TypeRef& Type, const BitsT& A, const BitsT& B, u32 Offset);
            DDNodeRef MakeOptionEQ(const TypeRef& InnerType, const BitsT& A,
                                   const BitsT& B, u32 Offset);
            // The key with index KeyIndex in the domain
            DDNodeRef MakeKeyIs(const BitsT& KeyBits, u32 KeyIndex);

            // Fresh diagram variables for Var, unless it has some
            const BitsT& AllocateVar(const ExpT& Var);
            void BlastValue(const ValueRef& Value, BitsT& Out);
            ValueRef RaiseBits(const TypeRef& Type, const vector<bool>& Bits, u32& Offset);
            BitsT BlastOp(const Exprs::OpExpression* Exp, const vector<BitsT>& Args);

        public:
            DDBitBlaster(DDManager& Mgr);
            virtual ~DDBitBlaster();

            virtual void VisitConstExpression(const Exprs::ConstExpression* Exp) override;
            virtual void VisitVarExpression(const Exprs::VarExpression* Exp) override;
            virtual void VisitOpExpression(const Exprs::OpExpression* Exp) override;

            static u32 GetNumBits(const TypeRef& Type);
            // Number of keys in the domain of a map key type
            static u32 GetDomainSize(const TypeRef& KeyType);
            static ValueRef GetDomainKey(const TypeRef& KeyType, u32 KeyIndex);

            BitsT Blast(const ExpT& Exp);
            BitsT BlastValue(const ValueRef& Value);

            // Null if Var was never blasted
            const vector<u32>* GetVarIndices(const ExpT& Var) const;
            // Bits laid out as GetNumBits(Type) describes
            ValueRef Raise(const TypeRef& Type, const vector<bool>& Bits);
        };

    } /* end namespace DD */
} /* end namespace SYMX */

#endif /* SYMX_DD_BIT_BLASTER_HPP_ */

//
// DDBitBlaster.hpp ends here
