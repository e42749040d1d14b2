// UnicodeUtils.cpp ---
//
// Filename: UnicodeUtils.cpp
// Author: Abhishek Udupa
// Created: Fri May 01 20:50:00 2015 (-0500)
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

#include "UnicodeUtils.hpp"

namespace SYMX {
    namespace UnicodeUtils {

        vector<u32> DecodeUTF8(const string& Str)
        {
            vector<u32> Retval;
            Retval.reserve(Str.length());
            const u32 Length = Str.length();
            u32 i = 0;

            while (i < Length) {
                u08 Lead = (u08)Str[i];
                u32 CodePoint;
                u32 NumTrailing;

                if (Lead < 0x80) {
                    CodePoint = Lead;
                    NumTrailing = 0;
                } else if ((Lead & 0xE0) == 0xC0) {
                    CodePoint = Lead & 0x1F;
                    NumTrailing = 1;
                } else if ((Lead & 0xF0) == 0xE0) {
                    CodePoint = Lead & 0x0F;
                    NumTrailing = 2;
                } else if ((Lead & 0xF8) == 0xF0) {
                    CodePoint = Lead & 0x07;
                    NumTrailing = 3;
                } else {
                    throw ModelingError((string)"Malformed UTF-8 lead byte at offset " +
                                        to_string(i) + " in string literal");
                }

                if (i + NumTrailing >= Length) {
                    throw ModelingError((string)"Truncated UTF-8 sequence at offset " +
                                        to_string(i) + " in string literal");
                }

                for (u32 j = 1; j <= NumTrailing; ++j) {
                    u08 Cont = (u08)Str[i + j];
                    if ((Cont & 0xC0) != 0x80) {
                        throw ModelingError((string)"Malformed UTF-8 continuation byte at " +
                                            "offset " + to_string(i + j) +
                                            " in string literal");
                    }
                    CodePoint = (CodePoint << 6) | (Cont & 0x3F);
                }

                Retval.push_back(CodePoint);
                i += NumTrailing + 1;
            }
            return Retval;
        }

        string EncodeUTF8(u32 CodePoint)
        {
            string Retval;
            if (CodePoint < 0x80) {
                Retval.push_back((char)CodePoint);
            } else if (CodePoint < 0x800) {
                Retval.push_back((char)(0xC0 | (CodePoint >> 6)));
                Retval.push_back((char)(0x80 | (CodePoint & 0x3F)));
            } else if (CodePoint < 0x10000) {
                Retval.push_back((char)(0xE0 | (CodePoint >> 12)));
                Retval.push_back((char)(0x80 | ((CodePoint >> 6) & 0x3F)));
                Retval.push_back((char)(0x80 | (CodePoint & 0x3F)));
            } else {
                Retval.push_back((char)(0xF0 | (CodePoint >> 18)));
                Retval.push_back((char)(0x80 | ((CodePoint >> 12) & 0x3F)));
                Retval.push_back((char)(0x80 | ((CodePoint >> 6) & 0x3F)));
                Retval.push_back((char)(0x80 | (CodePoint & 0x3F)));
            }
            return Retval;
        }

        string EncodeUTF8(const vector<u32>& CodePoints)
        {
            string Retval;
            Retval.reserve(CodePoints.size());
            for (auto CodePoint : CodePoints) {
                Retval += EncodeUTF8(CodePoint);
            }
            return Retval;
        }

        string EscapeCodePoint(u32 CodePoint)
        {
            if (CodePoint >= 32 && CodePoint < 127) {
                return string(1, (char)CodePoint);
            }
            ostringstream sstr;
            sstr << "\\u{" << hex << CodePoint << "}";
            return sstr.str();
        }

    } /* end namespace UnicodeUtils */
} /* end namespace SYMX */

//
// UnicodeUtils.cpp ends here
