// SymxOps.hpp ---
//
// Filename: SymxOps.hpp
// Author: Abhishek Udupa
// Created: Wed May 27 13:30:00 2015 (-0500)
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

#if !defined SYMX_SYMX_OPS_HPP_
#define SYMX_SYMX_OPS_HPP_

#include "../common/SymxFwdDecls.hpp"

namespace SYMX {
    namespace Exprs {

        struct SymxOps
        {
            // Logic
            static const i64 OpAND = 1000;
            static const i64 OpOR = 1001;
            static const i64 OpNOT = 1002;
            static const i64 OpIMPLIES = 1003;
            static const i64 OpITE = 1004;
            static const i64 OpEQ = 1005;

            // Arithmetic, over fixed width integers and BigInt
            static const i64 OpADD = 1006;
            static const i64 OpSUB = 1007;
            static const i64 OpMUL = 1008;
            static const i64 OpLT = 1009;
            static const i64 OpLE = 1010;
            static const i64 OpGT = 1011;
            static const i64 OpGE = 1012;

            // Bitwise, fixed width integers only
            static const i64 OpBVAND = 1013;
            static const i64 OpBVOR = 1014;
            static const i64 OpBVXOR = 1015;
            static const i64 OpBVNOT = 1016;

            // Width/signedness conversion, the target type is the type of the node
            static const i64 OpCAST = 1017;

            // Records. The field name is carried as the payload of PROJECT and WITHFIELD
            static const i64 OpMKRECORD = 1018;
            static const i64 OpPROJECT = 1019;
            static const i64 OpWITHFIELD = 1020;

            // Options
            static const i64 OpOPTSOME = 1021;
            static const i64 OpOPTISSOME = 1022;
            static const i64 OpOPTVALUE = 1023;

            // Sequences. The pattern is carried as the payload of SEQREGEX
            static const i64 OpSEQUNIT = 1024;
            static const i64 OpSEQCONCAT = 1025;
            static const i64 OpSEQLENGTH = 1026;
            static const i64 OpSEQAT = 1027;
            static const i64 OpSEQSLICE = 1028;
            static const i64 OpSEQINDEXOF = 1029;
            static const i64 OpSEQCONTAINS = 1030;
            static const i64 OpSEQSTARTSWITH = 1031;
            static const i64 OpSEQENDSWITH = 1032;
            static const i64 OpSEQREPLACEFIRST = 1033;
            static const i64 OpSEQREGEX = 1034;

            // General maps
            static const i64 OpMAPGET = 1035;
            static const i64 OpMAPSET = 1036;
            static const i64 OpMAPDELETE = 1037;

            // Default valued maps
            static const i64 OpDMAPGET = 1038;
            static const i64 OpDMAPSET = 1039;
            static const i64 OpDMAPCOUNT = 1040;

            static string OpToString(i64 OpCode);
            static bool IsOpCode(i64 OpCode);
        };

    } /* end namespace Exprs */
} /* end namespace SYMX */

#endif /* SYMX_SYMX_OPS_HPP_ */

//
// SymxOps.hpp ends here
