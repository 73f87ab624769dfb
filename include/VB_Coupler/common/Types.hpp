// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#pragma once

#include <Eigen/Core>
#include <Eigen/Dense>

#include <array>
#include <string>
#include <type_traits>

namespace vbc
{
#ifdef VBC_USE_SINGLE_PRECISION
    using real = float;
#else
    using real = double; // float or double.
#endif

    using Vector3r = Eigen::Matrix<real, 3, 1>;
    using VectorXr = Eigen::Matrix<real, Eigen::Dynamic, 1>;

    using Matrix3r = Eigen::Matrix<real, 3, 3>;
    using MatrixXr = Eigen::Matrix<real, Eigen::Dynamic, Eigen::Dynamic>;
    using Matrix3Xr = Eigen::Matrix<real, 3, Eigen::Dynamic>;
    using MatrixXi = Eigen::Matrix<int, Eigen::Dynamic, Eigen::Dynamic>;

    // Eulerian grid extent, {nx, ny, nz}. nz is 1 for 2D grids.
    using GridSize = std::array<int, 3>;

    // "single" or "double", the precision vbc::real was compiled with.
    inline std::string compiledPrecision()
    {
        return std::is_same_v<real, double> ? "double" : "single";
    }

} // namespace vbc
