// SymxLib.cpp ---
//
// Filename: SymxLib.cpp
// Author: Abhishek Udupa
// Created: Wed Jan 07 00:21:00 2015 (-0500)
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

#include <stdlib.h>
#include <string.h>

#include "../utils/LogManager.hpp"

#include "SymxLib.hpp"

namespace SYMX {

SymxLibOptionsT::SymxLibOptionsT()
    : LogFileName(""),
      LogCompressionTechnique(LogFileCompressionTechniqueT::COMPRESS_NONE),
      LoggingOptions(), Z3TimeoutMs(0), Z3RandomSeed(0)
{
    // Nothing here
}

SymxLibOptionsT::~SymxLibOptionsT()
{
    // Nothing here
}

SymxLibOptionsT::SymxLibOptionsT(const SymxLibOptionsT& Other)
    : LogFileName(Other.LogFileName),
      LogCompressionTechnique(Other.LogCompressionTechnique),
      LoggingOptions(Other.LoggingOptions),
      Z3TimeoutMs(Other.Z3TimeoutMs),
      Z3RandomSeed(Other.Z3RandomSeed)
{
    // Nothing here
}

SymxLibOptionsT& SymxLibOptionsT::operator = (const SymxLibOptionsT& Other)
{
    if (&Other == this) {
        return *this;
    }
    LogFileName = Other.LogFileName;
    LogCompressionTechnique = Other.LogCompressionTechnique;
    LoggingOptions = Other.LoggingOptions;
    Z3TimeoutMs = Other.Z3TimeoutMs;
    Z3RandomSeed = Other.Z3RandomSeed;
    return *this;
}

SymxLibOptionsT& SymxLib::SymxLibOptions()
{
    static SymxLibOptionsT SymxLibOptions_;
    return SymxLibOptions_;
}

SymxLib::SymxLib()
{
    // Nothing here
}

void SymxLib::Initialize()
{
    Logging::LogManager::Initialize();
}

void SymxLib::Initialize(const SymxLibOptionsT& LibOptions)
{
    SymxLibOptions() = LibOptions;
    Logging::LogManager::Initialize(SymxLibOptions().LogFileName,
                                    SymxLibOptions().LogCompressionTechnique);
    Logging::LogManager::EnableLogOptions(SymxLibOptions().LoggingOptions.begin(),
                                          SymxLibOptions().LoggingOptions.end());
}

void SymxLib::Finalize()
{
    Logging::LogManager::Finalize();
}

const SymxLibOptionsT& SymxLib::GetOptions()
{
    return SymxLibOptions();
}

__attribute__((constructor)) void SymxLibInitialize_()
{
    SymxLib::Initialize();
}

__attribute__((destructor)) void SymxLibFinalize_()
{
    SymxLib::Finalize();
}

} /* end namespace SYMX */

//
// SymxLib.cpp ends here
