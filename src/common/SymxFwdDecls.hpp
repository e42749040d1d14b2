// SymxFwdDecls.hpp ---
//
// Filename: SymxFwdDecls.hpp
// Author: Abhishek Udupa
// Created: Sun Jul 05 12:16:00 2015 (-0500)
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

// Forward declarations of classes and types

#if !defined SYMX_SYMX_FWD_DECLS_HPP_
#define SYMX_SYMX_FWD_DECLS_HPP_

#include "SymxTypes.hpp"
#include <list>

namespace SYMX {

    // SmartPtrs and such
    class RefCountable;
    template <typename T> class SmartPtr;
    template <typename T> class CSmartPtr;

    // Which decision procedure a query is routed to
    enum class BackendT {
        SMT, BDD
    };

    namespace Exprs {

        // Types
        class TypeBase;
        class BooleanType;
        class IntegerType;
        class BigIntType;
        class CharType;
        class SeqType;
        class OptionType;
        class RecordType;
        class MapType;
        class DMapType;

        typedef CSmartPtr<TypeBase> TypeRef;

        // Values
        class ValueBase;
        class BoolValue;
        class IntValue;
        class BigIntValue;
        class CharValue;
        class SeqValue;
        class OptionValue;
        class RecordValue;
        class MapValue;
        class DMapValue;

        typedef CSmartPtr<ValueBase> ValueRef;

        // Expressions
        class ExpressionBase;
        class ConstExpression;
        class VarExpression;
        class OpExpression;

        typedef CSmartPtr<ExpressionBase> ExpT;

        class ExpressionVisitorBase;
        class ExprMgr;
        struct SymxOps;

    } /* end namespace Exprs */

    namespace Regex {
        class RegexBase;
        typedef CSmartPtr<RegexBase> RegexRef;
        class RegexMgr;
        class RegexMatcher;
    } /* end namespace Regex */

    namespace Interp {
        class ExpressionEvaluator;
    } /* end namespace Interp */

    namespace Compile {
        class RValueInterpreter;
        class Compiler;
        class CompiledFunction;
    } /* end namespace Compile */

    namespace Maps {
        class DMapKeyCollector;
        class DMapLowering;
    } /* end namespace Maps */

    namespace TP {
        class Z3CtxWrapper;
        typedef SmartPtr<Z3CtxWrapper> Z3Ctx;

        class Z3Expr;
        class Z3Sort;
        class Z3Solver;
        class Z3Model;

        class SolverSession;
        class Z3TheoremProver;
        class Z3LoweredContext;
    } /* end namespace TP */

    namespace DD {
        class DDManager;
        class DDBitBlaster;
        class DDSolver;
    } /* end namespace DD */

    namespace Marshal {
        template <typename T> class RecordMarshaler;
        class ValueConverter;
    } /* end namespace Marshal */

    namespace Query {
        class Solution;
        class Solver;
        class SolutionEnumerator;
        class Function;
    } /* end namespace Query */

} /* end namespace SYMX */

#endif /* SYMX_SYMX_FWD_DECLS_HPP_ */

//
// SymxFwdDecls.hpp ends here
