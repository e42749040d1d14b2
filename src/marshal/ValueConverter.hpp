// ValueConverter.hpp ---
//
// Filename: ValueConverter.hpp
// Author: Abhishek Udupa
// Created: Sun Mar 29 19:10:00 2015 (-0500)
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

// Conversions between scalar and string values and native C++ values

#if !defined SYMX_VALUE_CONVERTER_HPP_
#define SYMX_VALUE_CONVERTER_HPP_

#include "../common/SymxFwdDecls.hpp"
#include "../expr/Values.hpp"

namespace SYMX {
    namespace Marshal {

        using Exprs::ValueRef;
        using Exprs::TypeRef;
        using Exprs::BigIntT;

        class ValueConverter
        {
        private:
            ValueConverter() = delete;

        public:
            // All of these throw ModelingError when the value has the
            // wrong type or does not fit the native type
            static bool ToBool(const ValueRef& Value);
            // Integers read with the signedness of their type
            static i64 ToInt64(const ValueRef& Value);
            static u64 ToUInt64(const ValueRef& Value);
            static BigIntT ToBigInt(const ValueRef& Value);
            static u32 ToCodePoint(const ValueRef& Value);
            // UTF-8
            static string ToString(const ValueRef& Value);

            static ValueRef FromBool(bool Value);
            // Throws ModelingError if Value is not representable in IntType
            static ValueRef FromInt64(const TypeRef& IntType, i64 Value);
            static ValueRef FromUInt64(const TypeRef& IntType, u64 Value);
            static ValueRef FromBigInt(const BigIntT& Value);
            static ValueRef FromString(const string& UTF8String);

            // Parses the text form of a scalar of the given type, as
            // used by configuration and test inputs
            static ValueRef Parse(const TypeRef& Type, const string& Text);
        };

    } /* end namespace Marshal */
} /* end namespace SYMX */

#endif /* SYMX_VALUE_CONVERTER_HPP_ */

//
// ValueConverter.hpp ends here
