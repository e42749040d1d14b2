// LogManager.hpp ---
//
// Filename: LogManager.hpp
// Author: Abhishek Udupa
// Created: Sat Mar 07 20:14:00 2015 (-0500)
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

#if !defined SYMX_LOG_MANAGER_HPP_
#define SYMX_LOG_MANAGER_HPP_

#include <atomic>
#include <vector>

#include "../common/SymxFwdDecls.hpp"

namespace SYMX {
    namespace Logging {

        // One bit per topic in the enabled mask. Minimal is the only
        // topic that is honored without SYMX_ENABLE_TRACING_
        enum class LogTopicT : u32 {
            TheoremProverAssertions = 0,
            TheoremProverLowered,
            TheoremProverModels,
            DDStats,
            CompilerLowering,
            MapLoweringDetailed,
            SolverFindAll,
            Minimal,
            NumTopics
        };

        class LogManager
        {
        private:
            static atomic<u32>& EnabledMask();
            static atomic<bool>& Silenced();
            static ostream*& LogStream();

            // Accepts the topic names as well as Symx.All and Symx.None
            static u32 ParseOption(const string& OptionName);

            LogManager();

        public:
            LogManager(const LogManager& Other) = delete;
            LogManager(LogManager&& Other) = delete;

            static void Initialize(const string& LogFileName = "",
                                   LogFileCompressionTechniqueT LogCompressionTechnique =
                                   LogFileCompressionTechniqueT::COMPRESS_NONE);
            static void Finalize();

            static ostream& GetLogStream();
            static void EnableLogOption(const string& OptionName);
            template <typename ForwardIterator>
            static inline void EnableLogOptions(const ForwardIterator& First,
                                                const ForwardIterator& Last);
            static void DisableLogOption(const string& OptionName);
            static vector<string> GetEnabledLogOptions();

            static const char* GetTopicName(LogTopicT Topic);
            static inline bool IsTopicEnabled(LogTopicT Topic);
            static bool IsOptionEnabled(const string& OptionName);
            static inline bool IsLoggingDisabled();
            static string GetLogOptions();
        };

        template <typename ForwardIterator>
        inline void LogManager::EnableLogOptions(const ForwardIterator& First,
                                                 const ForwardIterator& Last)
        {
            for (auto it = First; it != Last; ++it) {
                EnableLogOption(*it);
            }
        }

        inline bool LogManager::IsTopicEnabled(LogTopicT Topic)
        {
            return (!Silenced().load(memory_order_relaxed) &&
                    (EnabledMask().load(memory_order_relaxed) & (1u << (u32)Topic)) != 0);
        }

        inline bool LogManager::IsLoggingDisabled()
        {
            return !IsTopicEnabled(LogTopicT::Minimal);
        }

    } /* end namespace Logging */
} /* end namespace SYMX */

#ifdef SYMX_ENABLE_TRACING_
#define SYMX_LOG_CODE(...) { __VA_ARGS__ } ((void)0)
#else
#define SYMX_LOG_CODE(...) ((void)0)
#endif /* SYMX_ENABLE_TRACING_ */

#define SYMX_LOG_IF_(TOPIC_, ...) \
    if (SYMX::Logging::LogManager::IsTopicEnabled(SYMX::Logging::LogTopicT::TOPIC_)) { \
        ostream& Out_ = SYMX::Logging::LogManager::GetLogStream(); \
        __VA_ARGS__ \
        Out_.flush(); \
    }

// Framed with the topic and the source location
#define SYMX_LOG_FULL(TOPIC_, ...) \
    SYMX_LOG_CODE(SYMX_LOG_IF_(TOPIC_, \
        Out_ << "------------- [" \
             << SYMX::Logging::LogManager::GetTopicName(SYMX::Logging::LogTopicT::TOPIC_) \
             << "], at " << __FUNCTION__ << ", " << __FILE__ << ":" << __LINE__ \
             << " -------------" << endl; \
        __VA_ARGS__ \
        Out_ << string(80, '-') << endl;))

#define SYMX_LOG_SHORT(TOPIC_, ...) \
    SYMX_LOG_CODE(SYMX_LOG_IF_(TOPIC_, __VA_ARGS__))

#define SYMX_LOG_MIN_SHORT(...) \
    SYMX_LOG_IF_(Minimal, __VA_ARGS__) \
    ((void)0)

#endif /* SYMX_LOG_MANAGER_HPP_ */

//
// LogManager.hpp ends here
