// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#include "VB_Coupler/utils/Profiler.hpp"
#include "VB_Coupler/utils/Logger.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace vbc
{

    void Profiler::beginSession(const std::string &name)
    {
        std::lock_guard<std::mutex> lock(m_Mutex);
        m_CurrentSessionName = name;
        m_Results.clear();
        m_Active = true;
        LOG_INFO("Profiler session started: '{}'", m_CurrentSessionName);
    }

    void Profiler::endSession()
    {
        std::vector<ProfileResult> results = getResults();
        {
            std::lock_guard<std::mutex> lock(m_Mutex);
            m_Active = false;
            m_Results.clear();
        }
        // one log call so the report is not interleaved with other threads
        LOG_INFO("{}", formatReport(results));
        LOG_INFO("Profiler session ended: '{}'", m_CurrentSessionName);
    }

    void Profiler::submit(const char *name, double elapsed_ms)
    {
        std::lock_guard<std::mutex> lock(m_Mutex);
        if (!m_Active)
        {
            return;
        }

        ProfileResult &entry = m_Results[name];
        entry.name = name;
        entry.count++;
        entry.totalTime += elapsed_ms;
        entry.minTime = std::min(entry.minTime, elapsed_ms);
        entry.maxTime = std::max(entry.maxTime, elapsed_ms);
    }

    std::vector<ProfileResult> Profiler::getResults()
    {
        std::lock_guard<std::mutex> lock(m_Mutex);
        std::vector<ProfileResult> sorted_results;
        sorted_results.reserve(m_Results.size());
        for (const auto &pair : m_Results)
        {
            sorted_results.push_back(pair.second);
        }
        std::sort(sorted_results.begin(), sorted_results.end(), [](const auto &a, const auto &b)
                  { return a.totalTime > b.totalTime; });
        return sorted_results;
    }

    std::string Profiler::formatReport(const std::vector<ProfileResult> &results) const
    {
        std::stringstream report;
        report << std::fixed << std::setprecision(3);
        report << "\n\n"
               << "==================== Profiler Report: " << m_CurrentSessionName << " ====================\n"
               << std::left << std::setw(48) << "Scope Name"
               << std::setw(12) << "Avg (ms)"
               << std::setw(12) << "Total (ms)"
               << std::setw(12) << "Min (ms)"
               << std::setw(12) << "Max (ms)"
               << std::setw(10) << "Calls" << "\n"
               << std::string(106, '-') << "\n";

        for (const auto &result : results)
        {
            const double avg_time = result.count > 0 ? result.totalTime / result.count : 0.0;
            report << std::left << std::setw(48) << result.name
                   << std::setw(12) << avg_time
                   << std::setw(12) << result.totalTime
                   << std::setw(12) << result.minTime
                   << std::setw(12) << result.maxTime
                   << std::setw(10) << result.count << "\n";
        }
        report << std::string(106, '=') << "\n";
        return report.str();
    }

    ProfileTimer::ProfileTimer(const char *name)
        : m_Name(name), m_StartTimepoint(std::chrono::steady_clock::now())
    {
    }

    ProfileTimer::~ProfileTimer()
    {
        const auto end_timepoint = std::chrono::steady_clock::now();
        const double duration = std::chrono::duration<double, std::milli>(end_timepoint - m_StartTimepoint).count();
        Profiler::get().submit(m_Name, duration);
    }

} // namespace vbc
