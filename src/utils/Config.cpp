// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#include "VB_Coupler/utils/Config.hpp"
#include "VB_Coupler/utils/Logger.hpp"
#include "VB_Coupler/common/Exceptions.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace vbc
{

    void CouplingParameters::validate() const
    {
        auto fail = [](const std::string &msg)
        {
            LOG_ERROR("Invalid coupling configuration: {}", msg);
            throw ConfigurationError(msg);
        };

        if (grid_dim != 2 && grid_dim != 3)
            fail(fmt::format("grid_dim must be 2 or 3, got {}.", grid_dim));
        if (!std::isfinite(stiffness) || !std::isfinite(damping))
            fail("stiffness and damping must be finite.");
        // positive gains amplify the velocity mismatch
        if (stiffness > 0)
            fail(fmt::format("stiffness must be non-positive, got {}.", stiffness));
        if (damping > 0)
            fail(fmt::format("damping must be non-positive, got {}.", damping));
        if (!(dx > 0) || !std::isfinite(dx))
            fail(fmt::format("dx must be positive, got {}.", dx));
        if (precision != "single" && precision != "double")
            fail(fmt::format("precision must be 'single' or 'double', got '{}'.", precision));
        if (precision != compiledPrecision())
            fail(fmt::format("precision '{}' requested but the library was built with '{}'.", precision, compiledPrecision()));
        if (num_threads < 1)
            fail(fmt::format("num_threads must be positive, got {}.", num_threads));
        if (interp_kernel_width < 1)
            fail(fmt::format("interp_kernel_width must be a positive number of cells, got {}.", interp_kernel_width));
        if (eulerian_grid_coordinate_shift && !std::isfinite(*eulerian_grid_coordinate_shift))
            fail("eulerian_grid_coordinate_shift must be finite.");
    }

    bool Config::load(const std::string &filepath)
    {
        // the logger is not configured yet, report on stderr
        if (!std::filesystem::exists(filepath))
        {
            std::cerr << "[Config FATAL] Configuration file not found at path: '" << filepath << "'" << std::endl;
            return false;
        }

        std::ifstream f(filepath);
        if (!f.is_open())
        {
            std::cerr << "[Config FATAL] Could not open configuration file: '" << filepath << "'. Check permissions." << std::endl;
            return false;
        }

        nlohmann::json data;
        try
        {
            data = nlohmann::json::parse(f);
        }
        catch (const nlohmann::json::exception &e)
        {
            std::cerr << "[Config FATAL] JSON parsing failed in file '" << filepath << "':\n    - Error: " << e.what() << std::endl;
            return false;
        }

        const std::string log_level = data.value("log_level", "info");
        const std::string log_file = data.value("log_file", "coupling.log");
        Logger::init(log_level, log_file);
        LOG_INFO("Logger initialized. Log level: '{}', Log file: '{}'", log_level, log_file);
        LOG_INFO("Loading coupling configuration from: '{}'", filepath);

        return parseAndValidate(data, filepath);
    }

    bool Config::loadFromString(const std::string &json_text)
    {
        nlohmann::json data;
        try
        {
            data = nlohmann::json::parse(json_text);
        }
        catch (const nlohmann::json::exception &e)
        {
            LOG_CRITICAL("JSON parsing failed for in-memory configuration:\n    - Error: {}", e.what());
            return false;
        }
        return parseAndValidate(data, "<string>");
    }

    bool Config::parseAndValidate(const nlohmann::json &data, const std::string &source)
    {
        try
        {
            m_params = data.get<CouplingParameters>();
        }
        catch (const nlohmann::json::exception &e)
        {
            LOG_CRITICAL("JSON validation failed for coupling parameters in '{}':\n    - Error: {}", source, e.what());
            return false;
        }

        try
        {
            m_params.validate();
        }
        catch (const ConfigurationError &e)
        {
            LOG_CRITICAL("Coupling parameters in '{}' rejected: {}", source, e.what());
            return false;
        }

        LOG_INFO("Coupling parameters parsed: dim {}, stiffness {}, damping {}, dx {}, kernel width {}, threads {}.",
                 m_params.grid_dim, m_params.stiffness, m_params.damping, m_params.dx,
                 m_params.interp_kernel_width, m_params.num_threads);
        return true;
    }

} // namespace vbc
