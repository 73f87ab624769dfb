// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

#include "VB_Coupler/common/Types.hpp"

namespace vbc
{
    /**
     * @brief construction-time configuration of one body-flow coupling.
     *
     * stiffness and damping are the gains of the virtual boundary feedback law,
     * both non-positive. interp_kernel_width is the half-width of the discrete
     * delta kernel in grid cells.
     */
    struct CouplingParameters
    {
        int grid_dim = 3;

        real stiffness = -5e4;
        real damping = -2e1;

        real dx = 1.0;
        std::string precision = compiledPrecision(); // "single" or "double"
        int num_threads = 1;
        int interp_kernel_width = 2;

        // only the first body coupled to a shared Eulerian grid should reset it
        bool enable_eulerian_forcing_reset = false;

        // world coordinate of cell (0, 0, 0) along each axis; dx / 2 if unset
        std::optional<real> eulerian_grid_coordinate_shift;

        real start_time = 0.0;

        std::string log_level = "info";
        std::string log_file = "coupling.log";

        real getEulerianGridCoordinateShift() const
        {
            return eulerian_grid_coordinate_shift.value_or(real(0.5) * dx);
        }

        // throws ConfigurationError on the first statically detectable problem
        void validate() const;
    };

    inline void from_json(const nlohmann::json &j, CouplingParameters &params)
    {
        params.grid_dim = j.value("grid_dim", params.grid_dim);
        params.stiffness = j.value("stiffness", params.stiffness);
        params.damping = j.value("damping", params.damping);
        params.dx = j.value("dx", params.dx);
        params.precision = j.value("precision", params.precision);
        params.num_threads = j.value("num_threads", params.num_threads);
        params.interp_kernel_width = j.value("interp_kernel_width", params.interp_kernel_width);
        params.enable_eulerian_forcing_reset = j.value("enable_eulerian_forcing_reset", params.enable_eulerian_forcing_reset);
        if (j.contains("eulerian_grid_coordinate_shift") && !j.at("eulerian_grid_coordinate_shift").is_null())
        {
            params.eulerian_grid_coordinate_shift = j.at("eulerian_grid_coordinate_shift").get<real>();
        }
        params.start_time = j.value("start_time", params.start_time);
        params.log_level = j.value("log_level", params.log_level);
        params.log_file = j.value("log_file", params.log_file);
    }

    inline void to_json(nlohmann::json &j, const CouplingParameters &params)
    {
        j = nlohmann::json{
            {"grid_dim", params.grid_dim},
            {"stiffness", params.stiffness},
            {"damping", params.damping},
            {"dx", params.dx},
            {"precision", params.precision},
            {"num_threads", params.num_threads},
            {"interp_kernel_width", params.interp_kernel_width},
            {"enable_eulerian_forcing_reset", params.enable_eulerian_forcing_reset},
            {"start_time", params.start_time},
            {"log_level", params.log_level},
            {"log_file", params.log_file}};
        if (params.eulerian_grid_coordinate_shift)
        {
            j["eulerian_grid_coordinate_shift"] = *params.eulerian_grid_coordinate_shift;
        }
    }

    class Config
    {
    public:
        // reads a JSON file, sets up the logger from it and validates the parameters.
        // Returns false on any failure, which has been reported already.
        bool load(const std::string &filepath);

        // same as load() on an in-memory document, without touching the logger.
        bool loadFromString(const std::string &json_text);

        const CouplingParameters &getParams() const { return m_params; }

    private:
        bool parseAndValidate(const nlohmann::json &data, const std::string &source);

        CouplingParameters m_params;
    };

} // namespace vbc
