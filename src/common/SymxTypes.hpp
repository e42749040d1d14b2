// SymxTypes.hpp ---
//
// Filename: SymxTypes.hpp
// Author: Abhishek Udupa
// Created: Sun Jul 12 23:51:00 2015 (-0500)
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

// Common types used throughout the library

#if !defined SYMX_SYMX_TYPES_HPP_
#define SYMX_SYMX_TYPES_HPP_

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <iomanip>
#include <fstream>
#include <sstream>
#include <string>
#include <inttypes.h>
#include <exception>
#include <functional>

#ifndef BOOST_SYSTEM_NO_DEPRECATED
#define BOOST_SYSTEM_NO_DEPRECATED 1
#endif

using namespace std;

namespace SYMX {
typedef int8_t i08;

typedef uint8_t u08;
typedef int16_t i16;
typedef uint16_t u16;
typedef int32_t i32;
typedef uint32_t u32;
typedef int64_t i64;
typedef uint64_t u64;

enum class LogFileCompressionTechniqueT {
    COMPRESS_NONE, COMPRESS_GZIP, COMPRESS_BZIP2
};

class InternalError : public exception
{
private:
    string ErrorMsg;

public:

    inline InternalError(const string& ErrorMsg)
        : ErrorMsg((string)"InternalError: " + ErrorMsg) {}
    inline virtual ~InternalError() throw() {}
    inline virtual const char* what() const throw() override { return ErrorMsg.c_str(); }
};

// Root of all errors surfaced to clients of the library
class SymxError : public exception
{
private:
    string ErrorMsg;

public:
    inline SymxError(const string& ErrorMsg)
        : ErrorMsg(ErrorMsg)
    {
        // Nothing here
    }

    inline virtual ~SymxError() throw ()
    {
        // Nothing here
    }

    inline virtual const char* what() const throw() override { return ErrorMsg.c_str(); }
};

// Malformed construction: bad literals, mismatched operand types,
// illegal type nesting, unmatched marshaling names, missing bindings
// and queries against an absent model
class ModelingError : public SymxError
{
public:
    inline ModelingError(const string& ErrorMsg)
        : SymxError((string)"ModelingError: " + ErrorMsg)
    {
        // Nothing here
    }

    inline virtual ~ModelingError() throw ()
    {
        // Nothing here
    }
};

// A well typed expression that the selected backend cannot encode
class CapabilityError : public SymxError
{
public:
    inline CapabilityError(const string& ErrorMsg)
        : SymxError((string)"CapabilityError: " + ErrorMsg)
    {
        // Nothing here
    }

    inline virtual ~CapabilityError() throw ()
    {
        // Nothing here
    }
};

// Failures reported by the underlying decision procedure
class EngineError : public SymxError
{
public:
    inline EngineError(const string& ErrorMsg)
        : SymxError((string)"EngineError: " + ErrorMsg)
    {
        // Nothing here
    }

    inline virtual ~EngineError() throw ()
    {
        // Nothing here
    }
};

class UnimplementedException : public exception
{
private:
    string MethodName;
    string FileName;
    u32 LineNum;
    string ErrMsg;
public:
    inline UnimplementedException(const string& MethodName,
                                  const string& FileName,
                                  u32 LineNum)
        : MethodName(MethodName), FileName(FileName),
          LineNum(LineNum)
    {
        ErrMsg = (string)"Unimplemented method: " + MethodName +
            (string)", at " + FileName + (string)":" +
            to_string(LineNum);
    }

    inline virtual ~UnimplementedException()
    {
        // Nothing here
    }

    inline virtual const char* what() const throw() override
    {
        return ErrMsg.c_str();
    }
};

// Base class for all stringifiable classes
class Stringifiable
{
public:
    inline Stringifiable() {}
    inline virtual ~Stringifiable() {}

    virtual string ToString(u32 Verbosity = 0) const = 0;
};

static inline ostream& operator << (ostream& Out, const Stringifiable& Obj)
{
    Out << Obj.ToString();
    return Out;
}

} /* end namespace SYMX */

#endif /* SYMX_SYMX_TYPES_HPP_ */

//
// SymxTypes.hpp ends here
