// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h> // for ostream support
#include <cstdlib>
#include <memory>
#include <string>

#include <Eigen/Core>

template <typename T, int R, int C, int O, int MR, int MC>
struct fmt::formatter<Eigen::Matrix<T, R, C, O, MR, MC>>
{
    constexpr auto parse(format_parse_context &ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(const Eigen::Matrix<T, R, C, O, MR, MC> &m, FormatContext &ctx) const
    {
        auto out = ctx.out();
        if (m.cols() == 1)
        {
            out = fmt::format_to(out, "[");
            for (int i = 0; i < m.rows(); ++i)
            {
                out = fmt::format_to(out, "{:.4f}{}", m(i, 0), (i < m.rows() - 1) ? ", " : "");
            }
            out = fmt::format_to(out, "]");
        }
        else
        {
            out = fmt::format_to(out, "\n[\n");
            for (int i = 0; i < m.rows(); ++i)
            {
                out = fmt::format_to(out, "  [");
                for (int j = 0; j < m.cols(); ++j)
                {
                    out = fmt::format_to(out, "{: .4f}{}", m(i, j), (j < m.cols() - 1) ? ", " : "");
                }
                out = fmt::format_to(out, "]\n");
            }
            out = fmt::format_to(out, "]");
        }
        return out;
    }
};

namespace vbc
{
    class Logger
    {
    public:
        // console + file sinks. An empty log_filepath keeps the console sink only.
        static void init(const std::string &level_str = "info", const std::string &log_filepath = "coupling.log");

        // falls back to a console-only logger when init() was never called,
        // so the library can be used without any logging setup.
        static std::shared_ptr<spdlog::logger> &getCoreLogger();

        static spdlog::level::level_enum parseLevel(const std::string &level_str);

    private:
        static std::shared_ptr<spdlog::logger> s_CoreLogger;
    };

#define LOG_TRACE(fmt, ...) ::vbc::Logger::getCoreLogger()->log(spdlog::source_loc{__FILE__, __LINE__, SPDLOG_FUNCTION}, spdlog::level::trace, fmt, ##__VA_ARGS__)
#define LOG_DEBUG(fmt, ...) ::vbc::Logger::getCoreLogger()->log(spdlog::source_loc{__FILE__, __LINE__, SPDLOG_FUNCTION}, spdlog::level::debug, fmt, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...) ::vbc::Logger::getCoreLogger()->log(spdlog::source_loc{__FILE__, __LINE__, SPDLOG_FUNCTION}, spdlog::level::info, fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...) ::vbc::Logger::getCoreLogger()->log(spdlog::source_loc{__FILE__, __LINE__, SPDLOG_FUNCTION}, spdlog::level::warn, fmt, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) ::vbc::Logger::getCoreLogger()->log(spdlog::source_loc{__FILE__, __LINE__, SPDLOG_FUNCTION}, spdlog::level::err, fmt, ##__VA_ARGS__)
#define LOG_CRITICAL(fmt, ...) ::vbc::Logger::getCoreLogger()->log(spdlog::source_loc{__FILE__, __LINE__, SPDLOG_FUNCTION}, spdlog::level::critical, fmt, ##__VA_ARGS__)

#ifdef NDEBUG // Release mode
#define ASSERT(condition, fmt, ...) ((void)0)
#else // Debug mode
#define ASSERT(condition, fmt, ...)                            \
    if (!(condition))                                          \
    {                                                          \
        LOG_CRITICAL("Assertion Failed: " fmt, ##__VA_ARGS__); \
        std::abort();                                          \
    }
#endif

} // namespace vbc
