// LogManager.cpp ---
//
// Filename: LogManager.cpp
// Author: Abhishek Udupa
// Created: Tue Mar 10 00:44:00 2015 (-0500)
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

#include <boost/iostreams/filtering_stream.hpp>
#include <boost/iostreams/filter/bzip2.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/device/file.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include "LogManager.hpp"

namespace SYMX {
    namespace Logging {

        namespace Detail {

            struct TopicInfo
            {
                const char* Name;
                const char* Description;
            };

            // Indexed by LogTopicT
            static const TopicInfo Topics[(u32)LogTopicT::NumTopics] = {
                { "TheoremProver.Assertions",
                  "Print assertions as they are asserted into the theorem prover." },
                { "TheoremProver.Lowered",
                  "Print the Z3 terms obtained by lowering each assertion." },
                { "TheoremProver.Models",
                  "Print the model obtained after each satisfiable check." },
                { "DD.Stats",
                  "Print node counts of the decision diagram manager after each "
                  "assertion and check." },
                { "Compiler.Lowering",
                  "Print the expressions lowered by the compiler along with the "
                  "argument and memo slots assigned to them." },
                { "MapLowering.Detailed",
                  "Print key universes and flattened entries computed when lowering "
                  "default-valued maps for a backend." },
                { "Solver.FindAll",
                  "Print each solution and blocking clause produced while "
                  "enumerating solutions." },
                { "Symx.Minimal",
                  "Progress output from the solver front end. Honored even when the "
                  "library is built without -DSYMX_ENABLE_TRACING_." }
            };

            static const char* AllOption = "Symx.All";
            static const char* NoneOption = "Symx.None";
            static const u32 AllTopicsMask = (1u << (u32)LogTopicT::NumTopics) - 1;

        } /* end namespace Detail */

        atomic<u32>& LogManager::EnabledMask()
        {
            static atomic<u32> EnabledMask_(0);
            return EnabledMask_;
        }

        atomic<bool>& LogManager::Silenced()
        {
            static atomic<bool> Silenced_(false);
            return Silenced_;
        }

        ostream*& LogManager::LogStream()
        {
            static ostream* LogStream_ = nullptr;
            return LogStream_;
        }

        LogManager::LogManager()
        {
            // Nothing here
        }

        u32 LogManager::ParseOption(const string& OptionName)
        {
            if (OptionName == Detail::AllOption) {
                return Detail::AllTopicsMask;
            }
            for (u32 i = 0; i < (u32)LogTopicT::NumTopics; ++i) {
                if (OptionName == Detail::Topics[i].Name) {
                    return (1u << i);
                }
            }
            throw SymxError((string)"Log option \"" + OptionName + "\" is not " +
                            "a recognized log option.\nIn call to " + __FUNCTION__ +
                            " at " + __FILE__ + ":" + to_string(__LINE__));
        }

        void LogManager::Initialize(const string& LogFileName,
                                    LogFileCompressionTechniqueT LogCompressionTechnique)
        {
            Finalize();

            if (LogFileName == "") {
                LogStream() = &std::cout;
                return;
            }

            auto FileName = LogFileName;
            auto FileStream = new boost::iostreams::filtering_ostream();
            auto OpenFlags = ios_base::out;

            switch (LogCompressionTechnique) {
            case LogFileCompressionTechniqueT::COMPRESS_BZIP2:
                FileStream->push(boost::iostreams::bzip2_compressor(9));
                if (!boost::algorithm::ends_with(FileName, ".bz2")) {
                    FileName += ".bz2";
                }
                OpenFlags |= ios_base::binary;
                break;
            case LogFileCompressionTechniqueT::COMPRESS_GZIP:
                FileStream->push(boost::iostreams::gzip_compressor(9));
                if (!boost::algorithm::ends_with(FileName, ".gz")) {
                    FileName += ".gz";
                }
                OpenFlags |= ios_base::binary;
                break;
            default:
                break;
            }

            FileStream->push(boost::iostreams::file_sink(FileName, OpenFlags));
            LogStream() = FileStream;
        }

        void LogManager::Finalize()
        {
            auto Stream = LogStream();
            if (Stream != nullptr && Stream != &cout) {
                // Resetting the chain flushes the compressor and closes the sink
                auto FileStream = static_cast<boost::iostreams::filtering_ostream*>(Stream);
                FileStream->reset();
                delete FileStream;
            } else if (Stream != nullptr) {
                Stream->flush();
            }
            LogStream() = nullptr;
            Silenced() = false;
            EnabledMask() = 0;
        }

        ostream& LogManager::GetLogStream()
        {
            if (LogStream() == nullptr) {
                return cout;
            }
            return *(LogStream());
        }

        void LogManager::EnableLogOption(const string& OptionName)
        {
            if (OptionName == Detail::NoneOption) {
                Silenced() = true;
                EnabledMask() = 0;
                return;
            }
            auto Bits = ParseOption(OptionName);
            Silenced() = false;
            EnabledMask().fetch_or(Bits);
        }

        void LogManager::DisableLogOption(const string& OptionName)
        {
            if (OptionName == Detail::NoneOption) {
                Silenced() = false;
                return;
            }
            EnabledMask().fetch_and(~ParseOption(OptionName));
        }

        vector<string> LogManager::GetEnabledLogOptions()
        {
            vector<string> Retval;
            auto Mask = EnabledMask().load();
            for (u32 i = 0; i < (u32)LogTopicT::NumTopics; ++i) {
                if ((Mask & (1u << i)) != 0) {
                    Retval.push_back(Detail::Topics[i].Name);
                }
            }
            return Retval;
        }

        const char* LogManager::GetTopicName(LogTopicT Topic)
        {
            return Detail::Topics[(u32)Topic].Name;
        }

        bool LogManager::IsOptionEnabled(const string& OptionName)
        {
            auto Bits = ParseOption(OptionName);
            return (!Silenced().load() && (EnabledMask().load() & Bits) == Bits);
        }

        string LogManager::GetLogOptions()
        {
            ostringstream sstr;
            sstr << "Available logging options:" << endl;
            for (auto const& Topic : Detail::Topics) {
                sstr << left << setw(24) << setfill(' ') << Topic.Name
                     << ": " << Topic.Description << endl;
            }
            sstr << left << setw(24) << setfill(' ') << Detail::AllOption
                 << ": Turns on every option." << endl;
            sstr << left << setw(24) << setfill(' ') << Detail::NoneOption
                 << ": Turns off every option, including Symx.Minimal." << endl;
            return sstr.str();
        }

    } /* end namespace Logging */
} /* end namespace SYMX */

//
// LogManager.cpp ends here
