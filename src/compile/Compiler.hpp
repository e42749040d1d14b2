// Compiler.hpp ---
//
// Filename: Compiler.hpp
// Author: Abhishek Udupa
// Created: Sun Apr 12 17:31:00 2015 (-0500)
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

// One time lowering of an expression into a tree of specialized
// evaluator objects. Parameters are read from argument slots and
// nodes shared in the DAG are evaluated once per call through
// memo slots.

#if !defined SYMX_COMPILER_HPP_
#define SYMX_COMPILER_HPP_

#include <vector>
#include <unordered_map>

#include "../common/SymxFwdDecls.hpp"
#include "../containers/RefCountable.hpp"
#include "../containers/SmartPtr.hpp"
#include "../expr/Expressions.hpp"
#include "../expr/Values.hpp"

namespace SYMX {
    namespace Compile {

        using Exprs::ExpT;
        using Exprs::ValueRef;
        using Exprs::TypeRef;

        typedef const Exprs::ExpressionBase* ExpPtrT;

        // Per call state: the arguments and the memo slots
        struct EvalFrame
        {
            const vector<ValueRef>& Args;
            vector<ValueRef> MemoSlots;

            EvalFrame(const vector<ValueRef>& Args, u32 NumMemoSlots);
        };

        class RValueInterpreter
        {
        protected:
            ExpPtrT Exp;

        public:
            RValueInterpreter(ExpPtrT Exp);
            virtual ~RValueInterpreter();

            ExpPtrT GetExp() const;

            virtual ValueRef Evaluate(EvalFrame& Frame) const = 0;

            template <typename T>
            inline T* As()
            {
                return dynamic_cast<T*>(this);
            }

            template <typename T>
            inline const T* As() const
            {
                return dynamic_cast<const T*>(this);
            }

            template <typename T>
            inline T* SAs()
            {
                return static_cast<T*>(this);
            }

            template <typename T>
            inline const T* SAs() const
            {
                return static_cast<const T*>(this);
            }

            template <typename T>
            inline bool Is() const
            {
                return (dynamic_cast<const T*>(this) != nullptr);
            }
        };

        class CompiledConstInterpreter : public RValueInterpreter
        {
        private:
            ValueRef Value;

        public:
            CompiledConstInterpreter(const ValueRef& Value, ExpPtrT Exp);
            virtual ~CompiledConstInterpreter();

            virtual ValueRef Evaluate(EvalFrame& Frame) const override;
        };

        class ArgInterpreter : public RValueInterpreter
        {
        private:
            u32 Slot;

        public:
            ArgInterpreter(u32 Slot, ExpPtrT Exp);
            virtual ~ArgInterpreter();

            u32 GetSlot() const;
            virtual ValueRef Evaluate(EvalFrame& Frame) const override;
        };

        // Evaluates the wrapped interpreter at most once per call
        class MemoInterpreter : public RValueInterpreter
        {
        private:
            const RValueInterpreter* Inner;
            u32 Slot;

        public:
            MemoInterpreter(const RValueInterpreter* Inner, u32 Slot);
            virtual ~MemoInterpreter();

            virtual ValueRef Evaluate(EvalFrame& Frame) const override;
        };

        class OpInterpreter : public RValueInterpreter
        {
        protected:
            vector<const RValueInterpreter*> SubInterps;
            const u32 NumSubInterps;
            i64 OpCode;

            inline void EvaluateSubInterps(EvalFrame& Frame, vector<ValueRef>& SubEvals) const;

        public:
            OpInterpreter(const vector<const RValueInterpreter*>& SubInterps, ExpPtrT Exp);
            virtual ~OpInterpreter();
        };

        class ITEInterpreter : public OpInterpreter
        {
        public:
            ITEInterpreter(const vector<const RValueInterpreter*>& SubInterps, ExpPtrT Exp);
            virtual ~ITEInterpreter();

            virtual ValueRef Evaluate(EvalFrame& Frame) const override;
        };

        // AND, OR and IMPLIES, all short circuiting
        class ConnectiveInterpreter : public OpInterpreter
        {
        public:
            ConnectiveInterpreter(const vector<const RValueInterpreter*>& SubInterps,
                                  ExpPtrT Exp);
            virtual ~ConnectiveInterpreter();

            virtual ValueRef Evaluate(EvalFrame& Frame) const override;
        };

        class NOTInterpreter : public OpInterpreter
        {
        public:
            NOTInterpreter(const vector<const RValueInterpreter*>& SubInterps, ExpPtrT Exp);
            virtual ~NOTInterpreter();

            virtual ValueRef Evaluate(EvalFrame& Frame) const override;
        };

        class EQInterpreter : public OpInterpreter
        {
        public:
            EQInterpreter(const vector<const RValueInterpreter*>& SubInterps, ExpPtrT Exp);
            virtual ~EQInterpreter();

            virtual ValueRef Evaluate(EvalFrame& Frame) const override;
        };

        // ADD, SUB and MUL
        class ArithInterpreter : public OpInterpreter
        {
        public:
            ArithInterpreter(const vector<const RValueInterpreter*>& SubInterps, ExpPtrT Exp);
            virtual ~ArithInterpreter();

            virtual ValueRef Evaluate(EvalFrame& Frame) const override;
        };

        class CompareInterpreter : public OpInterpreter
        {
        public:
            CompareInterpreter(const vector<const RValueInterpreter*>& SubInterps, ExpPtrT Exp);
            virtual ~CompareInterpreter();

            virtual ValueRef Evaluate(EvalFrame& Frame) const override;
        };

        class BitOpInterpreter : public OpInterpreter
        {
        public:
            BitOpInterpreter(const vector<const RValueInterpreter*>& SubInterps, ExpPtrT Exp);
            virtual ~BitOpInterpreter();

            virtual ValueRef Evaluate(EvalFrame& Frame) const override;
        };

        class CastInterpreter : public OpInterpreter
        {
        private:
            TypeRef TargetType;

        public:
            CastInterpreter(const vector<const RValueInterpreter*>& SubInterps, ExpPtrT Exp);
            virtual ~CastInterpreter();

            virtual ValueRef Evaluate(EvalFrame& Frame) const override;
        };

        // MKRECORD, PROJECT and WITHFIELD
        class RecordInterpreter : public OpInterpreter
        {
        private:
            string FieldName;

        public:
            RecordInterpreter(const vector<const RValueInterpreter*>& SubInterps, ExpPtrT Exp);
            virtual ~RecordInterpreter();

            virtual ValueRef Evaluate(EvalFrame& Frame) const override;
        };

        class OptionInterpreter : public OpInterpreter
        {
        public:
            OptionInterpreter(const vector<const RValueInterpreter*>& SubInterps, ExpPtrT Exp);
            virtual ~OptionInterpreter();

            virtual ValueRef Evaluate(EvalFrame& Frame) const override;
        };

        class SeqInterpreter : public OpInterpreter
        {
        public:
            SeqInterpreter(const vector<const RValueInterpreter*>& SubInterps, ExpPtrT Exp);
            virtual ~SeqInterpreter();

            virtual ValueRef Evaluate(EvalFrame& Frame) const override;
        };

        // The pattern is parsed once, at lowering time
        class RegexInterpreter : public OpInterpreter
        {
        private:
            Regex::RegexRef Pattern;

        public:
            RegexInterpreter(const vector<const RValueInterpreter*>& SubInterps, ExpPtrT Exp);
            virtual ~RegexInterpreter();

            virtual ValueRef Evaluate(EvalFrame& Frame) const override;
        };

        // General and default-valued maps
        class MapInterpreter : public OpInterpreter
        {
        public:
            MapInterpreter(const vector<const RValueInterpreter*>& SubInterps, ExpPtrT Exp);
            virtual ~MapInterpreter();

            virtual ValueRef Evaluate(EvalFrame& Frame) const override;
        };

        class CompiledFunction : public RefCountable
        {
            friend class Compiler;

        private:
            ExpT Body;
            vector<ExpT> Params;
            vector<RValueInterpreter*> RegisteredInterps;
            const RValueInterpreter* Root;
            u32 NumMemoSlots;

            CompiledFunction(const ExpT& Body, const vector<ExpT>& Params);

        public:
            virtual ~CompiledFunction();

            const ExpT& GetBody() const;
            const vector<ExpT>& GetParams() const;
            u32 GetNumMemoSlots() const;
            u32 GetNumInterpreters() const;

            // Checks the number and types of the arguments, then evaluates.
            // Safe to call concurrently.
            ValueRef Evaluate(const vector<ValueRef>& Args) const;
        };

        typedef CSmartPtr<CompiledFunction> CompiledFunctionRef;

        class Compiler
        {
        private:
            CompiledFunction* Function;
            unordered_map<ExpPtrT, u32> ParamSlots;
            unordered_map<ExpPtrT, u32> RefCounts;
            unordered_map<ExpPtrT, const RValueInterpreter*> Interps;

            Compiler(CompiledFunction* Function);

            void CountReferences(const ExpT& Exp);
            const RValueInterpreter* MakeInterpreter(const ExpT& Exp);
            const RValueInterpreter* MakeOpInterpreter(const Exprs::OpExpression* Exp,
                                                       const vector<const RValueInterpreter*>&
                                                       SubInterps);
            inline const RValueInterpreter* RegisterInterp(RValueInterpreter* Interp);

        public:
            ~Compiler();

            // Throws ModelingError if Exp has a free variable that is
            // not among Params, or if Params are not distinct variables
            static CompiledFunctionRef Compile(const ExpT& Exp, const vector<ExpT>& Params);
        };

    } /* end namespace Compile */
} /* end namespace SYMX */

#endif /* SYMX_COMPILER_HPP_ */

//
// Compiler.hpp ends here
