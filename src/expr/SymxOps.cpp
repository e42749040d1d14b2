// SymxOps.cpp ---
//
// Filename: SymxOps.cpp
// Author: Abhishek Udupa
// Created: Mon Mar 02 20:22:00 2015 (-0500)
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

#include "SymxOps.hpp"

namespace SYMX {
    namespace Exprs {

        // Logic
        const i64 SymxOps::OpAND;
        const i64 SymxOps::OpOR;
        const i64 SymxOps::OpNOT;
        const i64 SymxOps::OpIMPLIES;
        const i64 SymxOps::OpITE;
        const i64 SymxOps::OpEQ;

        // Arithmetic
        const i64 SymxOps::OpADD;
        const i64 SymxOps::OpSUB;
        const i64 SymxOps::OpMUL;
        const i64 SymxOps::OpLT;
        const i64 SymxOps::OpLE;
        const i64 SymxOps::OpGT;
        const i64 SymxOps::OpGE;

        // Bitwise
        const i64 SymxOps::OpBVAND;
        const i64 SymxOps::OpBVOR;
        const i64 SymxOps::OpBVXOR;
        const i64 SymxOps::OpBVNOT;

        // Width/signedness conversion
        const i64 SymxOps::OpCAST;

        // Records
        const i64 SymxOps::OpMKRECORD;
        const i64 SymxOps::OpPROJECT;
        const i64 SymxOps::OpWITHFIELD;

        // Options
        const i64 SymxOps::OpOPTSOME;
        const i64 SymxOps::OpOPTISSOME;
        const i64 SymxOps::OpOPTVALUE;

        // Sequences
        const i64 SymxOps::OpSEQUNIT;
        const i64 SymxOps::OpSEQCONCAT;
        const i64 SymxOps::OpSEQLENGTH;
        const i64 SymxOps::OpSEQAT;
        const i64 SymxOps::OpSEQSLICE;
        const i64 SymxOps::OpSEQINDEXOF;
        const i64 SymxOps::OpSEQCONTAINS;
        const i64 SymxOps::OpSEQSTARTSWITH;
        const i64 SymxOps::OpSEQENDSWITH;
        const i64 SymxOps::OpSEQREPLACEFIRST;
        const i64 SymxOps::OpSEQREGEX;

        // General maps
        const i64 SymxOps::OpMAPGET;
        const i64 SymxOps::OpMAPSET;
        const i64 SymxOps::OpMAPDELETE;

        // Default valued maps
        const i64 SymxOps::OpDMAPGET;
        const i64 SymxOps::OpDMAPSET;
        const i64 SymxOps::OpDMAPCOUNT;

        string SymxOps::OpToString(i64 OpCode)
        {
            switch (OpCode) {
            case OpAND: return "AND";
            case OpOR: return "OR";
            case OpNOT: return "NOT";
            case OpIMPLIES: return "IMPLIES";
            case OpITE: return "ITE";
            case OpEQ: return "EQ";
            case OpADD: return "ADD";
            case OpSUB: return "SUB";
            case OpMUL: return "MUL";
            case OpLT: return "LT";
            case OpLE: return "LE";
            case OpGT: return "GT";
            case OpGE: return "GE";
            case OpBVAND: return "BVAND";
            case OpBVOR: return "BVOR";
            case OpBVXOR: return "BVXOR";
            case OpBVNOT: return "BVNOT";
            case OpCAST: return "CAST";
            case OpMKRECORD: return "MKRECORD";
            case OpPROJECT: return "PROJECT";
            case OpWITHFIELD: return "WITHFIELD";
            case OpOPTSOME: return "OPTSOME";
            case OpOPTISSOME: return "OPTISSOME";
            case OpOPTVALUE: return "OPTVALUE";
            case OpSEQUNIT: return "SEQUNIT";
            case OpSEQCONCAT: return "SEQCONCAT";
            case OpSEQLENGTH: return "SEQLENGTH";
            case OpSEQAT: return "SEQAT";
            case OpSEQSLICE: return "SEQSLICE";
            case OpSEQINDEXOF: return "SEQINDEXOF";
            case OpSEQCONTAINS: return "SEQCONTAINS";
            case OpSEQSTARTSWITH: return "SEQSTARTSWITH";
            case OpSEQENDSWITH: return "SEQENDSWITH";
            case OpSEQREPLACEFIRST: return "SEQREPLACEFIRST";
            case OpSEQREGEX: return "SEQREGEX";
            case OpMAPGET: return "MAPGET";
            case OpMAPSET: return "MAPSET";
            case OpMAPDELETE: return "MAPDELETE";
            case OpDMAPGET: return "DMAPGET";
            case OpDMAPSET: return "DMAPSET";
            case OpDMAPCOUNT: return "DMAPCOUNT";
            default:
                throw InternalError((string)"Unknown op code " + to_string(OpCode) +
                                    "\nAt: " + __FILE__ + ":" + to_string(__LINE__));
            }
        }

        bool SymxOps::IsOpCode(i64 OpCode)
        {
            return (OpCode >= OpAND && OpCode <= OpDMAPCOUNT);
        }

    } /* end namespace Exprs */
} /* end namespace SYMX */

//
// SymxOps.cpp ends here
