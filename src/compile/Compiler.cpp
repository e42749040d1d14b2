// Compiler.cpp ---
//
// Filename: Compiler.cpp
// Author: Abhishek Udupa
// Created: Sun Feb 22 00:24:00 2015 (-0500)
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
#include "../interp/ValueOps.hpp"
#include "../interp/ExpressionEvaluator.hpp"
#include "../regex/RegexMgr.hpp"
#include "../utils/LogManager.hpp"

#include "Compiler.hpp"

namespace SYMX {
    namespace Compile {

        using namespace Exprs;
        using Interp::ValueOps;

        EvalFrame::EvalFrame(const vector<ValueRef>& Args, u32 NumMemoSlots)
            : Args(Args), MemoSlots(NumMemoSlots)
        {
            // Nothing here
        }

        // Interpreters
        RValueInterpreter::RValueInterpreter(ExpPtrT Exp)
            : Exp(Exp)
        {
            // Nothing here
        }

        RValueInterpreter::~RValueInterpreter()
        {
            // Nothing here
        }

        ExpPtrT RValueInterpreter::GetExp() const
        {
            return Exp;
        }

        CompiledConstInterpreter::CompiledConstInterpreter(const ValueRef& Value, ExpPtrT Exp)
            : RValueInterpreter(Exp), Value(Value)
        {
            // Nothing here
        }

        CompiledConstInterpreter::~CompiledConstInterpreter()
        {
            // Nothing here
        }

        ValueRef CompiledConstInterpreter::Evaluate(EvalFrame& Frame) const
        {
            return Value;
        }

        ArgInterpreter::ArgInterpreter(u32 Slot, ExpPtrT Exp)
            : RValueInterpreter(Exp), Slot(Slot)
        {
            // Nothing here
        }

        ArgInterpreter::~ArgInterpreter()
        {
            // Nothing here
        }

        u32 ArgInterpreter::GetSlot() const
        {
            return Slot;
        }

        ValueRef ArgInterpreter::Evaluate(EvalFrame& Frame) const
        {
            return Frame.Args[Slot];
        }

        MemoInterpreter::MemoInterpreter(const RValueInterpreter* Inner, u32 Slot)
            : RValueInterpreter(Inner->GetExp()), Inner(Inner), Slot(Slot)
        {
            // Nothing here
        }

        MemoInterpreter::~MemoInterpreter()
        {
            // Nothing here
        }

        ValueRef MemoInterpreter::Evaluate(EvalFrame& Frame) const
        {
            auto& Cached = Frame.MemoSlots[Slot];
            if (Cached == ValueRef::NullPtr) {
                Cached = Inner->Evaluate(Frame);
            }
            return Cached;
        }

        OpInterpreter::OpInterpreter(const vector<const RValueInterpreter*>& SubInterps,
                                     ExpPtrT Exp)
            : RValueInterpreter(Exp), SubInterps(SubInterps),
              NumSubInterps(SubInterps.size()),
              OpCode(Exp->SAs<OpExpression>()->GetOpCode())
        {
            // Nothing here
        }

        OpInterpreter::~OpInterpreter()
        {
            // Nothing here
        }

        inline void OpInterpreter::EvaluateSubInterps(EvalFrame& Frame,
                                                      vector<ValueRef>& SubEvals) const
        {
            SubEvals.resize(NumSubInterps);
            for (u32 i = 0; i < NumSubInterps; ++i) {
                SubEvals[i] = SubInterps[i]->Evaluate(Frame);
            }
        }

        ITEInterpreter::ITEInterpreter(const vector<const RValueInterpreter*>& SubInterps,
                                       ExpPtrT Exp)
            : OpInterpreter(SubInterps, Exp)
        {
            // Nothing here
        }

        ITEInterpreter::~ITEInterpreter()
        {
            // Nothing here
        }

        // Only the selected branch is evaluated
        ValueRef ITEInterpreter::Evaluate(EvalFrame& Frame) const
        {
            if (ValueOps::GetBool(SubInterps[0]->Evaluate(Frame))) {
                return SubInterps[1]->Evaluate(Frame);
            } else {
                return SubInterps[2]->Evaluate(Frame);
            }
        }

        ConnectiveInterpreter::ConnectiveInterpreter(const vector<const RValueInterpreter*>&
                                                     SubInterps, ExpPtrT Exp)
            : OpInterpreter(SubInterps, Exp)
        {
            // Nothing here
        }

        ConnectiveInterpreter::~ConnectiveInterpreter()
        {
            // Nothing here
        }

        ValueRef ConnectiveInterpreter::Evaluate(EvalFrame& Frame) const
        {
            if (OpCode == SymxOps::OpIMPLIES) {
                if (!ValueOps::GetBool(SubInterps[0]->Evaluate(Frame))) {
                    return ValueOps::MakeBool(true);
                }
                return SubInterps[1]->Evaluate(Frame);
            }

            const bool Deciding = (OpCode == SymxOps::OpOR);
            for (auto SubInterp : SubInterps) {
                if (ValueOps::GetBool(SubInterp->Evaluate(Frame)) == Deciding) {
                    return ValueOps::MakeBool(Deciding);
                }
            }
            return ValueOps::MakeBool(!Deciding);
        }

        NOTInterpreter::NOTInterpreter(const vector<const RValueInterpreter*>& SubInterps,
                                       ExpPtrT Exp)
            : OpInterpreter(SubInterps, Exp)
        {
            // Nothing here
        }

        NOTInterpreter::~NOTInterpreter()
        {
            // Nothing here
        }

        ValueRef NOTInterpreter::Evaluate(EvalFrame& Frame) const
        {
            return ValueOps::MakeBool(!ValueOps::GetBool(SubInterps[0]->Evaluate(Frame)));
        }

        EQInterpreter::EQInterpreter(const vector<const RValueInterpreter*>& SubInterps,
                                     ExpPtrT Exp)
            : OpInterpreter(SubInterps, Exp)
        {
            // Nothing here
        }

        EQInterpreter::~EQInterpreter()
        {
            // Nothing here
        }

        ValueRef EQInterpreter::Evaluate(EvalFrame& Frame) const
        {
            auto Value1 = SubInterps[0]->Evaluate(Frame);
            auto Value2 = SubInterps[1]->Evaluate(Frame);
            return ValueOps::Equals(Value1, Value2);
        }

        ArithInterpreter::ArithInterpreter(const vector<const RValueInterpreter*>& SubInterps,
                                           ExpPtrT Exp)
            : OpInterpreter(SubInterps, Exp)
        {
            // Nothing here
        }

        ArithInterpreter::~ArithInterpreter()
        {
            // Nothing here
        }

        ValueRef ArithInterpreter::Evaluate(EvalFrame& Frame) const
        {
            auto Value1 = SubInterps[0]->Evaluate(Frame);
            auto Value2 = SubInterps[1]->Evaluate(Frame);
            switch (OpCode) {
            case SymxOps::OpADD:
                return ValueOps::Add(Value1, Value2);
            case SymxOps::OpSUB:
                return ValueOps::Sub(Value1, Value2);
            default:
                return ValueOps::Mul(Value1, Value2);
            }
        }

        CompareInterpreter::CompareInterpreter(const vector<const RValueInterpreter*>&
                                               SubInterps, ExpPtrT Exp)
            : OpInterpreter(SubInterps, Exp)
        {
            // Nothing here
        }

        CompareInterpreter::~CompareInterpreter()
        {
            // Nothing here
        }

        ValueRef CompareInterpreter::Evaluate(EvalFrame& Frame) const
        {
            auto Value1 = SubInterps[0]->Evaluate(Frame);
            auto Value2 = SubInterps[1]->Evaluate(Frame);
            return ValueOps::Compare(OpCode, Value1, Value2);
        }

        BitOpInterpreter::BitOpInterpreter(const vector<const RValueInterpreter*>& SubInterps,
                                           ExpPtrT Exp)
            : OpInterpreter(SubInterps, Exp)
        {
            // Nothing here
        }

        BitOpInterpreter::~BitOpInterpreter()
        {
            // Nothing here
        }

        ValueRef BitOpInterpreter::Evaluate(EvalFrame& Frame) const
        {
            if (OpCode == SymxOps::OpBVNOT) {
                return ValueOps::BitNot(SubInterps[0]->Evaluate(Frame));
            }
            auto Value1 = SubInterps[0]->Evaluate(Frame);
            auto Value2 = SubInterps[1]->Evaluate(Frame);
            return ValueOps::BitOp(OpCode, Value1, Value2);
        }

        CastInterpreter::CastInterpreter(const vector<const RValueInterpreter*>& SubInterps,
                                         ExpPtrT Exp)
            : OpInterpreter(SubInterps, Exp), TargetType(Exp->GetType())
        {
            // Nothing here
        }

        CastInterpreter::~CastInterpreter()
        {
            // Nothing here
        }

        ValueRef CastInterpreter::Evaluate(EvalFrame& Frame) const
        {
            return ValueOps::Cast(SubInterps[0]->Evaluate(Frame), TargetType);
        }

        RecordInterpreter::RecordInterpreter(const vector<const RValueInterpreter*>& SubInterps,
                                             ExpPtrT Exp)
            : OpInterpreter(SubInterps, Exp),
              FieldName(Exp->SAs<OpExpression>()->GetPayload())
        {
            // Nothing here
        }

        RecordInterpreter::~RecordInterpreter()
        {
            // Nothing here
        }

        ValueRef RecordInterpreter::Evaluate(EvalFrame& Frame) const
        {
            vector<ValueRef> SubEvals;
            EvaluateSubInterps(Frame, SubEvals);
            switch (OpCode) {
            case SymxOps::OpMKRECORD:
                return ValueOps::MkRecord(Exp->GetType(), SubEvals);
            case SymxOps::OpPROJECT:
                return ValueOps::Project(SubEvals[0], FieldName);
            default:
                return ValueOps::WithField(SubEvals[0], FieldName, SubEvals[1]);
            }
        }

        OptionInterpreter::OptionInterpreter(const vector<const RValueInterpreter*>& SubInterps,
                                             ExpPtrT Exp)
            : OpInterpreter(SubInterps, Exp)
        {
            // Nothing here
        }

        OptionInterpreter::~OptionInterpreter()
        {
            // Nothing here
        }

        ValueRef OptionInterpreter::Evaluate(EvalFrame& Frame) const
        {
            auto Value = SubInterps[0]->Evaluate(Frame);
            switch (OpCode) {
            case SymxOps::OpOPTSOME:
                return ValueOps::OptSome(Exp->GetType(), Value);
            case SymxOps::OpOPTISSOME:
                return ValueOps::OptIsSome(Value);
            default:
                return ValueOps::OptValue(Value);
            }
        }

        SeqInterpreter::SeqInterpreter(const vector<const RValueInterpreter*>& SubInterps,
                                       ExpPtrT Exp)
            : OpInterpreter(SubInterps, Exp)
        {
            // Nothing here
        }

        SeqInterpreter::~SeqInterpreter()
        {
            // Nothing here
        }

        ValueRef SeqInterpreter::Evaluate(EvalFrame& Frame) const
        {
            vector<ValueRef> SubEvals;
            EvaluateSubInterps(Frame, SubEvals);
            return ValueOps::Apply(Exp->SAs<OpExpression>(), SubEvals);
        }

        RegexInterpreter::RegexInterpreter(const vector<const RValueInterpreter*>& SubInterps,
                                           ExpPtrT Exp)
            : OpInterpreter(SubInterps, Exp),
              Pattern(Regex::RegexMgr::Instance().Parse(Exp->SAs<OpExpression>()->GetPayload()))
        {
            // Nothing here
        }

        RegexInterpreter::~RegexInterpreter()
        {
            // Nothing here
        }

        ValueRef RegexInterpreter::Evaluate(EvalFrame& Frame) const
        {
            return ValueOps::SeqRegexMatch(SubInterps[0]->Evaluate(Frame), Pattern);
        }

        MapInterpreter::MapInterpreter(const vector<const RValueInterpreter*>& SubInterps,
                                       ExpPtrT Exp)
            : OpInterpreter(SubInterps, Exp)
        {
            // Nothing here
        }

        MapInterpreter::~MapInterpreter()
        {
            // Nothing here
        }

        ValueRef MapInterpreter::Evaluate(EvalFrame& Frame) const
        {
            vector<ValueRef> SubEvals;
            EvaluateSubInterps(Frame, SubEvals);
            switch (OpCode) {
            case SymxOps::OpMAPGET:
                return ValueOps::MapGet(Exp->GetType(), SubEvals[0], SubEvals[1]);
            case SymxOps::OpMAPSET:
                return ValueOps::MapSet(SubEvals[0], SubEvals[1], SubEvals[2]);
            case SymxOps::OpMAPDELETE:
                return ValueOps::MapDelete(SubEvals[0], SubEvals[1]);
            case SymxOps::OpDMAPGET:
                return ValueOps::DMapGet(SubEvals[0], SubEvals[1]);
            case SymxOps::OpDMAPSET:
                return ValueOps::DMapSet(SubEvals[0], SubEvals[1], SubEvals[2]);
            default:
                return ValueOps::DMapCount(SubEvals[0]);
            }
        }

        // CompiledFunction
        CompiledFunction::CompiledFunction(const ExpT& Body, const vector<ExpT>& Params)
            : Body(Body), Params(Params), Root(nullptr), NumMemoSlots(0)
        {
            // Nothing here
        }

        CompiledFunction::~CompiledFunction()
        {
            for (auto Interp : RegisteredInterps) {
                delete Interp;
            }
            RegisteredInterps.clear();
        }

        const ExpT& CompiledFunction::GetBody() const
        {
            return Body;
        }

        const vector<ExpT>& CompiledFunction::GetParams() const
        {
            return Params;
        }

        u32 CompiledFunction::GetNumMemoSlots() const
        {
            return NumMemoSlots;
        }

        u32 CompiledFunction::GetNumInterpreters() const
        {
            return RegisteredInterps.size();
        }

        ValueRef CompiledFunction::Evaluate(const vector<ValueRef>& Args) const
        {
            if (Args.size() != Params.size()) {
                throw ModelingError((string)"Compiled function expects " +
                                    to_string(Params.size()) + " arguments, got " +
                                    to_string(Args.size()));
            }
            const u32 NumArgs = Args.size();
            for (u32 i = 0; i < NumArgs; ++i) {
                Interp::CheckBinding(Params[i], Args[i]);
            }

            EvalFrame Frame(Args, NumMemoSlots);
            return Root->Evaluate(Frame);
        }

        // Compiler
        Compiler::Compiler(CompiledFunction* Function)
            : Function(Function)
        {
            // Nothing here
        }

        Compiler::~Compiler()
        {
            // Nothing here
        }

        inline const RValueInterpreter* Compiler::RegisterInterp(RValueInterpreter* Interp)
        {
            Function->RegisteredInterps.push_back(Interp);
            return Interp;
        }

        void Compiler::CountReferences(const ExpT& Exp)
        {
            auto Count = ++RefCounts[Exp.GetPtr_()];
            if (Count > 1) {
                return;
            }
            auto ExpAsOp = Exp->As<OpExpression>();
            if (ExpAsOp == nullptr) {
                return;
            }
            for (auto const& Child : ExpAsOp->GetChildren()) {
                CountReferences(Child);
            }
        }

        const RValueInterpreter* Compiler::MakeInterpreter(const ExpT& Exp)
        {
            auto ExpPtr = Exp.GetPtr_();
            auto it = Interps.find(ExpPtr);
            if (it != Interps.end()) {
                return it->second;
            }

            const RValueInterpreter* Retval = nullptr;

            auto ExpAsConst = Exp->As<ConstExpression>();
            auto ExpAsVar = Exp->As<VarExpression>();
            auto ExpAsOp = Exp->As<OpExpression>();

            if (ExpAsConst != nullptr) {
                Retval = RegisterInterp(new CompiledConstInterpreter(ExpAsConst->GetConstValue(),
                                                                     ExpPtr));
            } else if (ExpAsVar != nullptr) {
                auto SlotIt = ParamSlots.find(ExpPtr);
                if (SlotIt == ParamSlots.end()) {
                    throw ModelingError((string)"Free variable \"" + ExpAsVar->GetVarName() +
                                        "\" is not a parameter of the compiled function");
                }
                Retval = RegisterInterp(new ArgInterpreter(SlotIt->second, ExpPtr));
            } else if (ExpAsOp != nullptr) {
                vector<const RValueInterpreter*> SubInterps;
                for (auto const& Child : ExpAsOp->GetChildren()) {
                    SubInterps.push_back(MakeInterpreter(Child));
                }
                Retval = MakeOpInterpreter(ExpAsOp, SubInterps);
                if (RefCounts[ExpPtr] > 1) {
                    Retval = RegisterInterp(new MemoInterpreter(Retval,
                                                                Function->NumMemoSlots++));
                }
            } else {
                throw InternalError((string)"Unexpected expression type in compilation:\n" +
                                    Exp->ToString() + "\nAt: " + __FILE__ + ":" +
                                    to_string(__LINE__));
            }

            Interps[ExpPtr] = Retval;
            return Retval;
        }

        const RValueInterpreter*
        Compiler::MakeOpInterpreter(const OpExpression* Exp,
                                    const vector<const RValueInterpreter*>& SubInterps)
        {
            switch (Exp->GetOpCode()) {
            case SymxOps::OpITE:
                return RegisterInterp(new ITEInterpreter(SubInterps, Exp));
            case SymxOps::OpAND:
            case SymxOps::OpOR:
            case SymxOps::OpIMPLIES:
                return RegisterInterp(new ConnectiveInterpreter(SubInterps, Exp));
            case SymxOps::OpNOT:
                return RegisterInterp(new NOTInterpreter(SubInterps, Exp));
            case SymxOps::OpEQ:
                return RegisterInterp(new EQInterpreter(SubInterps, Exp));

            case SymxOps::OpADD:
            case SymxOps::OpSUB:
            case SymxOps::OpMUL:
                return RegisterInterp(new ArithInterpreter(SubInterps, Exp));
            case SymxOps::OpLT:
            case SymxOps::OpLE:
            case SymxOps::OpGT:
            case SymxOps::OpGE:
                return RegisterInterp(new CompareInterpreter(SubInterps, Exp));
            case SymxOps::OpBVAND:
            case SymxOps::OpBVOR:
            case SymxOps::OpBVXOR:
            case SymxOps::OpBVNOT:
                return RegisterInterp(new BitOpInterpreter(SubInterps, Exp));
            case SymxOps::OpCAST:
                return RegisterInterp(new CastInterpreter(SubInterps, Exp));

            case SymxOps::OpMKRECORD:
            case SymxOps::OpPROJECT:
            case SymxOps::OpWITHFIELD:
                return RegisterInterp(new RecordInterpreter(SubInterps, Exp));

            case SymxOps::OpOPTSOME:
            case SymxOps::OpOPTISSOME:
            case SymxOps::OpOPTVALUE:
                return RegisterInterp(new OptionInterpreter(SubInterps, Exp));

            case SymxOps::OpSEQREGEX:
                return RegisterInterp(new RegexInterpreter(SubInterps, Exp));

            case SymxOps::OpMAPGET:
            case SymxOps::OpMAPSET:
            case SymxOps::OpMAPDELETE:
            case SymxOps::OpDMAPGET:
            case SymxOps::OpDMAPSET:
            case SymxOps::OpDMAPCOUNT:
                return RegisterInterp(new MapInterpreter(SubInterps, Exp));

            case SymxOps::OpSEQUNIT:
            case SymxOps::OpSEQCONCAT:
            case SymxOps::OpSEQLENGTH:
            case SymxOps::OpSEQAT:
            case SymxOps::OpSEQSLICE:
            case SymxOps::OpSEQINDEXOF:
            case SymxOps::OpSEQCONTAINS:
            case SymxOps::OpSEQSTARTSWITH:
            case SymxOps::OpSEQENDSWITH:
            case SymxOps::OpSEQREPLACEFIRST:
                return RegisterInterp(new SeqInterpreter(SubInterps, Exp));

            default:
                throw InternalError((string)"Unhandled op code in compilation: " +
                                    SymxOps::OpToString(Exp->GetOpCode()) +
                                    "\nAt: " + __FILE__ + ":" + to_string(__LINE__));
            }
        }

        CompiledFunctionRef Compiler::Compile(const ExpT& Exp, const vector<ExpT>& Params)
        {
            if (Exp == ExpT::NullPtr) {
                throw ModelingError((string)"Cannot compile a null expression");
            }

            auto Function = new CompiledFunction(Exp, Params);
            // Owned by Retval from here on, also on the error paths
            CompiledFunctionRef Retval = Function;
            Compiler TheCompiler(Function);

            const u32 NumParams = Params.size();
            for (u32 i = 0; i < NumParams; ++i) {
                auto ParamAsVar = Params[i]->As<VarExpression>();
                if (ParamAsVar == nullptr) {
                    throw ModelingError((string)"Parameter " + to_string(i) +
                                        " of a compiled function is not a variable: " +
                                        Params[i]->ToString());
                }
                if (!TheCompiler.ParamSlots.insert(make_pair(Params[i].GetPtr_(), i)).second) {
                    throw ModelingError((string)"Parameter \"" + ParamAsVar->GetVarName() +
                                        "\" appears more than once");
                }
            }

            TheCompiler.CountReferences(Exp);
            Function->Root = TheCompiler.MakeInterpreter(Exp);

            SYMX_LOG_FULL(CompilerLowering,
                          Out_ << "Compiled " << Exp->ToString() << " into "
                               << Retval->GetNumInterpreters() << " interpreters with "
                               << Retval->GetNumMemoSlots() << " memo slots" << endl;
                          );
            return Retval;
        }

    } /* end namespace Compile */
} /* end namespace SYMX */

//
// Compiler.cpp ends here
