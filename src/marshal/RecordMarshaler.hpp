// RecordMarshaler.hpp ---
//
// Filename: RecordMarshaler.hpp
// Author: Abhishek Udupa
// Created: Fri Jan 23 09:25:00 2015 (-0500)
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

// Builds native objects from named field values. A marshaler for T
// knows the settable fields of T (name plus setter) and the ways of
// constructing a T (parameter names plus factory). Build() picks the
// constructor whose parameters are all among the given names, then
// sets the remaining names through their setters. When several
// constructors fit, the one with the most parameters is used.

#if !defined SYMX_RECORD_MARSHALER_HPP_
#define SYMX_RECORD_MARSHALER_HPP_

#include <map>
#include <set>
#include <vector>
#include <functional>
#include <algorithm>

#include <boost/algorithm/string/join.hpp>

#include "../common/SymxFwdDecls.hpp"
#include "../expr/Values.hpp"

namespace SYMX {
    namespace Marshal {

        using Exprs::ValueRef;

        typedef map<string, ValueRef> NamedValuesT;

        template <typename T>
        class RecordMarshaler
        {
        public:
            typedef function<void(T&, const ValueRef&)> SetterT;
            // Called with the values of the parameters, in the order
            // they were registered
            typedef function<T(const vector<ValueRef>&)> FactoryT;

        private:
            struct ConstructorT
            {
                vector<string> ParamNames;
                FactoryT Factory;
            };

            map<string, SetterT> Setters;
            vector<ConstructorT> Constructors;

            inline bool Fits(const ConstructorT& Constructor, const NamedValuesT& Values) const
            {
                for (auto const& ParamName : Constructor.ParamNames) {
                    if (Values.find(ParamName) == Values.end()) {
                        return false;
                    }
                }
                // Every name the constructor does not take needs a setter
                for (auto const& NameValue : Values) {
                    auto const& Params = Constructor.ParamNames;
                    if (find(Params.begin(), Params.end(), NameValue.first) == Params.end() &&
                        Setters.find(NameValue.first) == Setters.end()) {
                        return false;
                    }
                }
                return true;
            }

            inline bool IsKnownName(const string& Name) const
            {
                if (Setters.find(Name) != Setters.end()) {
                    return true;
                }
                for (auto const& Constructor : Constructors) {
                    auto const& Params = Constructor.ParamNames;
                    if (find(Params.begin(), Params.end(), Name) != Params.end()) {
                        return true;
                    }
                }
                return false;
            }

        public:
            RecordMarshaler()
            {
                // Nothing here
            }

            ~RecordMarshaler()
            {
                // Nothing here
            }

            RecordMarshaler& AddField(const string& Name, const SetterT& Setter)
            {
                if (Setters.find(Name) != Setters.end()) {
                    throw ModelingError((string)"Field \"" + Name + "\" is already registered");
                }
                Setters[Name] = Setter;
                return *this;
            }

            RecordMarshaler& AddConstructor(const vector<string>& ParamNames,
                                            const FactoryT& Factory)
            {
                set<string> Distinct(ParamNames.begin(), ParamNames.end());
                if (Distinct.size() != ParamNames.size()) {
                    throw ModelingError((string)"Constructor parameters (" +
                                        boost::algorithm::join(ParamNames, ", ") +
                                        ") are not distinct");
                }
                Constructors.push_back({ ParamNames, Factory });
                return *this;
            }

            // Shorthand for a constructor without parameters
            RecordMarshaler& AddDefaultConstructor()
            {
                return AddConstructor({}, [] (const vector<ValueRef>&) -> T
                                      {
                                          return T();
                                      });
            }

            u32 GetNumFields() const
            {
                return Setters.size();
            }

            u32 GetNumConstructors() const
            {
                return Constructors.size();
            }

            T Build(const NamedValuesT& Values) const
            {
                for (auto const& NameValue : Values) {
                    if (!IsKnownName(NameValue.first)) {
                        throw ModelingError((string)"\"" + NameValue.first + "\" matches no " +
                                            "field or constructor parameter");
                    }
                }

                const ConstructorT* Chosen = nullptr;
                bool Ambiguous = false;
                for (auto const& Constructor : Constructors) {
                    if (!Fits(Constructor, Values)) {
                        continue;
                    }
                    if (Chosen == nullptr ||
                        Constructor.ParamNames.size() > Chosen->ParamNames.size()) {
                        Chosen = &Constructor;
                        Ambiguous = false;
                    } else if (Constructor.ParamNames.size() == Chosen->ParamNames.size()) {
                        Ambiguous = true;
                    }
                }

                vector<string> Names;
                for (auto const& NameValue : Values) {
                    Names.push_back(NameValue.first);
                }
                if (Chosen == nullptr) {
                    throw ModelingError((string)"No constructor fits the names (" +
                                        boost::algorithm::join(Names, ", ") + ")");
                }
                if (Ambiguous) {
                    throw ModelingError((string)"More than one constructor fits the names (" +
                                        boost::algorithm::join(Names, ", ") + ")");
                }

                vector<ValueRef> Args;
                for (auto const& ParamName : Chosen->ParamNames) {
                    Args.push_back(Values.find(ParamName)->second);
                }
                T Retval = Chosen->Factory(Args);

                auto const& Params = Chosen->ParamNames;
                for (auto const& NameValue : Values) {
                    if (find(Params.begin(), Params.end(), NameValue.first) == Params.end()) {
                        Setters.find(NameValue.first)->second(Retval, NameValue.second);
                    }
                }
                return Retval;
            }
        };

    } /* end namespace Marshal */
} /* end namespace SYMX */

#endif /* SYMX_RECORD_MARSHALER_HPP_ */

//
// RecordMarshaler.hpp ends here
