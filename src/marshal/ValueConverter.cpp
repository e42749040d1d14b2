// ValueConverter.cpp ---
//
// Filename: ValueConverter.cpp
// Author: Abhishek Udupa
// Created: Sat Feb 14 12:38:00 2015 (-0500)
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

#include <boost/lexical_cast.hpp>
#include <boost/algorithm/string.hpp>

#include "../expr/ExprMgr.hpp"

#include "ValueConverter.hpp"

namespace SYMX {
    namespace Marshal {

        using namespace Exprs;

        namespace Detail {

            template <typename T>
            static inline const T* Expect(const ValueRef& Value, const string& Expected)
            {
                auto Retval = (Value.IsNull_() ? nullptr : Value->As<T>());
                if (Retval == nullptr) {
                    throw ModelingError((string)"Expected " + Expected + ", got: " +
                                        (Value.IsNull_() ? string("null") : Value->ToString()));
                }
                return Retval;
            }

        } /* end namespace Detail */

        bool ValueConverter::ToBool(const ValueRef& Value)
        {
            return Detail::Expect<BoolValue>(Value, "a boolean")->GetValue();
        }

        i64 ValueConverter::ToInt64(const ValueRef& Value)
        {
            if (Value->Is<BigIntValue>()) {
                auto const& Big = Value->SAs<BigIntValue>()->GetValue();
                if (Big < BigIntT(INT64_MIN) || Big > BigIntT(INT64_MAX)) {
                    throw ModelingError((string)"Value " + Value->ToString() +
                                        " does not fit a 64 bit signed integer");
                }
                return Big.convert_to<i64>();
            }
            auto ValueAsInt = Detail::Expect<IntValue>(Value, "an integer");
            if (!ValueAsInt->IsSigned() && ValueAsInt->GetUnsigned() > (u64)INT64_MAX) {
                throw ModelingError((string)"Value " + Value->ToString() +
                                    " does not fit a 64 bit signed integer");
            }
            return ValueAsInt->GetSigned();
        }

        u64 ValueConverter::ToUInt64(const ValueRef& Value)
        {
            if (Value->Is<BigIntValue>()) {
                auto const& Big = Value->SAs<BigIntValue>()->GetValue();
                if (Big < 0 || Big > BigIntT(UINT64_MAX)) {
                    throw ModelingError((string)"Value " + Value->ToString() +
                                        " does not fit a 64 bit unsigned integer");
                }
                return Big.convert_to<u64>();
            }
            auto ValueAsInt = Detail::Expect<IntValue>(Value, "an integer");
            if (ValueAsInt->IsSigned() && ValueAsInt->GetSigned() < 0) {
                throw ModelingError((string)"Negative value " + Value->ToString() +
                                    " cannot be read as an unsigned integer");
            }
            return ValueAsInt->GetUnsigned();
        }

        BigIntT ValueConverter::ToBigInt(const ValueRef& Value)
        {
            if (Value->Is<IntValue>()) {
                return Value->SAs<IntValue>()->ToBigInt();
            }
            return Detail::Expect<BigIntValue>(Value, "an integer")->GetValue();
        }

        u32 ValueConverter::ToCodePoint(const ValueRef& Value)
        {
            return Detail::Expect<CharValue>(Value, "a character")->GetCodePoint();
        }

        string ValueConverter::ToString(const ValueRef& Value)
        {
            auto ValueAsSeq = Detail::Expect<SeqValue>(Value, "a string");
            if (!ValueAsSeq->IsString()) {
                throw ModelingError((string)"Expected a string, got the sequence: " +
                                    Value->ToString());
            }
            return ValueAsSeq->GetString();
        }

        ValueRef ValueConverter::FromBool(bool Value)
        {
            return ExprMgr::Instance().MakeBoolValue(Value);
        }

        ValueRef ValueConverter::FromInt64(const TypeRef& IntType, i64 Value)
        {
            return ExprMgr::Instance().MakeIntValue(IntType, Value);
        }

        ValueRef ValueConverter::FromUInt64(const TypeRef& IntType, u64 Value)
        {
            return ExprMgr::Instance().MakeUIntValue(IntType, Value);
        }

        ValueRef ValueConverter::FromBigInt(const BigIntT& Value)
        {
            return ExprMgr::Instance().MakeBigIntValue(Value);
        }

        ValueRef ValueConverter::FromString(const string& UTF8String)
        {
            return ExprMgr::Instance().MakeStringValue(UTF8String);
        }

        ValueRef ValueConverter::Parse(const TypeRef& Type, const string& Text)
        {
            auto& Mgr = ExprMgr::Instance();
            auto Trimmed = boost::algorithm::trim_copy(Text);

            try {
                switch (Type->GetKind()) {
                case TypeKindT::Boolean:
                    if (boost::algorithm::iequals(Trimmed, "true")) {
                        return Mgr.MakeBoolValue(true);
                    }
                    if (boost::algorithm::iequals(Trimmed, "false")) {
                        return Mgr.MakeBoolValue(false);
                    }
                    break;

                case TypeKindT::Integer:
                    if (Type->SAs<IntegerType>()->IsSigned()) {
                        return Mgr.MakeIntValue(Type, boost::lexical_cast<i64>(Trimmed));
                    }
                    if (boost::algorithm::starts_with(Trimmed, "-")) {
                        break;
                    }
                    return Mgr.MakeUIntValue(Type, boost::lexical_cast<u64>(Trimmed));

                case TypeKindT::BigInt:
                    return Mgr.MakeBigIntValue(BigIntT(Trimmed.c_str()));

                case TypeKindT::Seq:
                    if (Type->SAs<SeqType>()->IsString()) {
                        // Strings are taken verbatim
                        return Mgr.MakeStringValue(Text);
                    }
                    break;

                case TypeKindT::Char: {
                    auto Str = Mgr.MakeStringValue(Text);
                    auto CodePoints = Str->SAs<SeqValue>()->GetCodePoints();
                    if (CodePoints.size() == 1) {
                        return Mgr.MakeCharValue(CodePoints[0]);
                    }
                    break;
                }

                default:
                    break;
                }
            } catch (const boost::bad_lexical_cast& Ex) {
                throw ModelingError((string)"Cannot parse \"" + Text + "\" as a value of type " +
                                    Type->ToString() + ": " + Ex.what());
            } catch (const std::runtime_error& Ex) {
                // Malformed big integer text
                throw ModelingError((string)"Cannot parse \"" + Text + "\" as a value of type " +
                                    Type->ToString() + ": " + Ex.what());
            }

            throw ModelingError((string)"Cannot parse \"" + Text + "\" as a value of type " +
                                Type->ToString());
        }

    } /* end namespace Marshal */
} /* end namespace SYMX */

//
// ValueConverter.cpp ends here
