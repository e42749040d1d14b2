// SymxLib.hpp ---
//
// Filename: SymxLib.hpp
// Author: Abhishek Udupa
// Created: Sun Feb 22 18:48:00 2015 (-0500)
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

#if !defined SYMX_SYMX_LIB_HPP_
#define SYMX_SYMX_LIB_HPP_

#include <set>

#include "../common/SymxFwdDecls.hpp"

namespace SYMX {

class SymxLibOptionsT
{
public:
    string LogFileName;
    LogFileCompressionTechniqueT LogCompressionTechnique;
    set<string> LoggingOptions;
    // Zero means no timeout
    u32 Z3TimeoutMs;
    u32 Z3RandomSeed;

    SymxLibOptionsT();
    virtual ~SymxLibOptionsT();

    SymxLibOptionsT(const SymxLibOptionsT& Other);
    SymxLibOptionsT& operator = (const SymxLibOptionsT& Other);
};

class SymxLib
{
private:
    static SymxLibOptionsT& SymxLibOptions();

    SymxLib();
    SymxLib(const SymxLib& Other) = delete;
    SymxLib(SymxLib&& Other) = delete;

public:
    static void Initialize();
    static void Initialize(const SymxLibOptionsT& LibOptions);
    static void Finalize();

    static const SymxLibOptionsT& GetOptions();
};

__attribute__((constructor)) extern void SymxLibInitialize_();
__attribute__((destructor)) extern void SymxLibFinalize_();

} /* end namespace SYMX */

#endif /* SYMX_SYMX_LIB_HPP_ */

//
// SymxLib.hpp ends here
