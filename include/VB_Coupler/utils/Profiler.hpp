// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#pragma once

#include <chrono>
#include <limits>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace vbc
{
// --- Profiler macros, use these instead of the timer class ---
#define PROFILE_SESSION(name) ::vbc::Profiler::get().beginSession(name)
#define PROFILE_END_SESSION() ::vbc::Profiler::get().endSession()

#define PROFILE_FUNCTION() ::vbc::ProfileTimer ANONYMOUS_VARIABLE_LINE(__profiler_timer_)(__FUNCTION__)
#define PROFILE_SCOPE(name) ::vbc::ProfileTimer ANONYMOUS_VARIABLE_LINE(__profiler_timer_)(name)

#define PASTE_HELPER(a, b) a##b
#define PASTE(a, b) PASTE_HELPER(a, b)
#define ANONYMOUS_VARIABLE_LINE(name) PASTE(name, __LINE__)

    struct ProfileResult
    {
        std::string name;
        long long count = 0;
        double totalTime = 0.0; // ms
        double minTime = std::numeric_limits<double>::max();
        double maxTime = 0.0;
    };

    /**
     * @brief aggregates scoped timings per scope name between beginSession() and endSession().
     * Timings submitted outside of a session are dropped.
     */
    class Profiler
    {
    public:
        static Profiler &get()
        {
            static Profiler instance;
            return instance;
        }

        Profiler(const Profiler &) = delete;
        Profiler &operator=(const Profiler &) = delete;

        void beginSession(const std::string &name);
        void endSession();
        bool isActive() const { return m_Active; }

        void submit(const char *name, double elapsed_ms);

        // snapshot of the current session, sorted by total time
        std::vector<ProfileResult> getResults();

    private:
        Profiler() = default;
        ~Profiler() = default;

        std::string formatReport(const std::vector<ProfileResult> &results) const;

        std::mutex m_Mutex;
        bool m_Active = false;
        std::string m_CurrentSessionName = "Untitled";
        std::map<std::string, ProfileResult> m_Results;
    };

    class ProfileTimer
    {
    public:
        explicit ProfileTimer(const char *name);
        ~ProfileTimer();

    private:
        const char *m_Name;
        std::chrono::time_point<std::chrono::steady_clock> m_StartTimepoint;
    };

} // namespace vbc
