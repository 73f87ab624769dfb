// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#include "VB_Coupler/utils/Logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <algorithm>
#include <iostream>
#include <map>
#include <mutex>
#include <vector>

namespace vbc
{
    std::shared_ptr<spdlog::logger> Logger::s_CoreLogger;

    spdlog::level::level_enum Logger::parseLevel(const std::string &level_str)
    {
        static const std::map<std::string, spdlog::level::level_enum> level_map = {
            {"trace", spdlog::level::trace},
            {"debug", spdlog::level::debug},
            {"info", spdlog::level::info},
            {"warn", spdlog::level::warn},
            {"error", spdlog::level::err},
            {"critical", spdlog::level::critical},
            {"off", spdlog::level::off}};

        auto it = level_map.find(level_str);
        if (it != level_map.end())
        {
            return it->second;
        }
        // the logger may not exist yet, so report on stderr
        std::cerr << "[Logger Warning] Invalid log level string '" << level_str
                  << "'. Defaulting to 'info'." << std::endl;
        return spdlog::level::info;
    }

    void Logger::init(const std::string &level_str, const std::string &log_filepath)
    {
        const spdlog::level::level_enum log_level = parseLevel(level_str);

        std::vector<spdlog::sink_ptr> sinks;
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();

#ifdef NDEBUG
        console_sink->set_pattern("%^[%T] [%l] %v%$");
        console_sink->set_level(std::max(log_level, spdlog::level::info));
#else
        console_sink->set_pattern("%^[%T.%e] [%l] [thread %t] %v%$ %@");
        console_sink->set_level(log_level);
#endif
        sinks.push_back(console_sink);

        if (!log_filepath.empty())
        {
            // truncate the log of the previous run
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_filepath, true);
            file_sink->set_pattern("[%Y-%m-%d %T.%e] [%l] [thread %t] [%s:%# %!()] %v");
            sinks.push_back(file_sink);
        }

        if (s_CoreLogger)
        {
            spdlog::drop(s_CoreLogger->name());
        }
        s_CoreLogger = std::make_shared<spdlog::logger>("VB_COUPLER", begin(sinks), end(sinks));
        spdlog::register_logger(s_CoreLogger);

        s_CoreLogger->set_level(log_level);
        s_CoreLogger->flush_on(spdlog::level::warn);
    }

    std::shared_ptr<spdlog::logger> &Logger::getCoreLogger()
    {
        // engines may log from several threads before anyone called init()
        static std::once_flag fallback_flag;
        std::call_once(fallback_flag, []()
                       {
            if (s_CoreLogger)
                return;
            s_CoreLogger = spdlog::get("VB_COUPLER");
            if (!s_CoreLogger)
            {
                s_CoreLogger = spdlog::stdout_color_mt("VB_COUPLER");
                s_CoreLogger->set_pattern("%^[%T] [%l] %v%$");
                s_CoreLogger->set_level(spdlog::level::info);
            } });
        return s_CoreLogger;
    }

} // namespace vbc
