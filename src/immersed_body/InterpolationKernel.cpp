// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#include "VB_Coupler/immersed_body/InterpolationKernel.hpp"
#include "VB_Coupler/common/Exceptions.hpp"
#include "VB_Coupler/utils/Logger.hpp"
#include "VB_Coupler/utils/Profiler.hpp"

#include "omp.h"

#include <algorithm>
#include <cmath>
#include <vector>

namespace vbc
{

    namespace ib
    {
        namespace
        {
            constexpr real kPi = real(3.14159265358979323846);
        }

        InterpolationKernel::InterpolationKernel(int grid_dim, real dx, int interp_kernel_width,
                                                 real eul_grid_coord_shift, int num_threads)
            : m_dim(grid_dim),
              m_dx(dx),
              m_width(interp_kernel_width),
              m_shift(eul_grid_coord_shift),
              m_num_threads(num_threads)
        {
            if ((grid_dim != 2 && grid_dim != 3) || !(dx > 0) || interp_kernel_width < 1 || num_threads < 1)
            {
                LOG_CRITICAL("Invalid interpolation kernel setup: dim {}, dx {}, width {}, threads {}.",
                             grid_dim, dx, interp_kernel_width, num_threads);
                throw ConfigurationError("Invalid interpolation kernel configuration.");
            }
            m_points_per_dim = 2 * m_width;
            m_support_size = 1;
            for (int d = 0; d < m_dim; ++d)
            {
                m_support_size *= m_points_per_dim;
            }
        }

        real InterpolationKernel::delta1D(real r) const
        {
            const real abs_r = std::abs(r);
            if (abs_r >= m_width)
            {
                return real(0);
            }
            return (real(1) + std::cos(kPi * abs_r / m_width)) / (2 * m_width);
        }

        void InterpolationKernel::updateLocalSupport(const MatrixXr &lag_positions, const GridSize &grid_size)
        {
            PROFILE_FUNCTION();
            ASSERT(lag_positions.rows() == m_dim, "Marker positions have {} rows, kernel dim is {}.", lag_positions.rows(), m_dim);

            const int num_markers = static_cast<int>(lag_positions.cols());
            m_num_markers = num_markers;
            m_support_grid_size = grid_size;
            m_support_origin.resize(m_dim, num_markers);
            m_weights_1d.resize(m_dim * m_points_per_dim, num_markers);

            // exceptions must not cross the parallel region, failures are collected first
            std::vector<char> out_of_domain(num_markers, 0);

#pragma omp parallel for num_threads(m_num_threads)
            for (int m = 0; m < num_markers; ++m)
            {
                for (int d = 0; d < m_dim; ++d)
                {
                    const real s = (lag_positions(d, m) - m_shift) / m_dx;
                    // support [floor(s) - w + 1, floor(s) + w] within [0, n - 1], checked before the integer cast
                    if (!std::isfinite(s) || s < m_width - 1 || s >= grid_size[d] - m_width)
                    {
                        out_of_domain[m] = 1;
                        break;
                    }
                    const int nearest = static_cast<int>(std::floor(s));
                    const int origin = nearest - m_width + 1;
                    m_support_origin(d, m) = origin;
                    for (int p = 0; p < m_points_per_dim; ++p)
                    {
                        m_weights_1d(d * m_points_per_dim + p, m) = delta1D(static_cast<real>(origin + p) - s);
                    }
                }
            }

            const auto first_bad = std::find(out_of_domain.begin(), out_of_domain.end(), 1);
            if (first_bad != out_of_domain.end())
            {
                const int m = static_cast<int>(first_bad - out_of_domain.begin());
                m_num_markers = 0;
                LOG_CRITICAL("Lagrangian marker {} at {} has kernel support outside the Eulerian grid {}x{}x{}.",
                             m, VectorXr(lag_positions.col(m)), grid_size[0], grid_size[1], grid_size[2]);
                throw OutOfDomainError("Immersed body marker support left the Eulerian domain.", m);
            }
        }

        real InterpolationKernel::supportWeight(int m, int q, int cell[3]) const
        {
            real weight = 1;
            cell[2] = 0;
            for (int d = 0; d < m_dim; ++d)
            {
                const int p = q % m_points_per_dim;
                q /= m_points_per_dim;
                cell[d] = m_support_origin(d, m) + p;
                weight *= m_weights_1d(d * m_points_per_dim + p, m);
            }
            return weight;
        }

        void InterpolationKernel::checkSupport(const grid::EulerianField &eul_field, long num_values) const
        {
            if (eul_field.getDim() != m_dim || eul_field.getGridSize() != m_support_grid_size || num_values != m_num_markers)
            {
                LOG_CRITICAL("Kernel support is stale: computed for {} markers on {}x{}x{}, used with {} markers on {}x{}x{}.",
                             m_num_markers, m_support_grid_size[0], m_support_grid_size[1], m_support_grid_size[2],
                             num_values, eul_field.getNx(), eul_field.getNy(), eul_field.getNz());
                throw std::logic_error("Interpolation kernel support does not match the requested transfer.");
            }
        }

        void InterpolationKernel::interpolateEulerianToLagrangian(const grid::EulerianField &eul_field, MatrixXr &lag_values) const
        {
            PROFILE_FUNCTION();
            checkSupport(eul_field, m_num_markers);
            lag_values.setZero(m_dim, m_num_markers);

#pragma omp parallel for num_threads(m_num_threads)
            for (int m = 0; m < m_num_markers; ++m)
            {
                int cell[3];
                for (int q = 0; q < m_support_size; ++q)
                {
                    const real weight = supportWeight(m, q, cell);
                    for (int c = 0; c < m_dim; ++c)
                    {
                        lag_values(c, m) += weight * eul_field(c, cell[0], cell[1], cell[2]);
                    }
                }
            }
        }

        void InterpolationKernel::interpolateEulerianToLagrangian(const grid::EulerianField &eul_field,
                                                                  const MatrixXr &lag_positions, MatrixXr &lag_values)
        {
            updateLocalSupport(lag_positions, eul_field.getGridSize());
            interpolateEulerianToLagrangian(eul_field, lag_values);
        }

        void InterpolationKernel::spreadLagrangianToEulerian(const MatrixXr &lag_values, grid::EulerianField &eul_field)
        {
            PROFILE_FUNCTION();
            checkSupport(eul_field, lag_values.cols());
            ASSERT(lag_values.rows() == m_dim, "Spread values have {} rows, kernel dim is {}.", lag_values.rows(), m_dim);

            const real inv_cell_volume = real(1) / std::pow(m_dx, m_dim);
            m_spread_weights.resize(m_support_size, m_num_markers);

#pragma omp parallel for num_threads(m_num_threads)
            for (int m = 0; m < m_num_markers; ++m)
            {
                int cell[3];
                for (int q = 0; q < m_support_size; ++q)
                {
                    m_spread_weights(q, m) = supportWeight(m, q, cell) * inv_cell_volume;
                }
            }

            // one writer per component and markers in index order: race free and
            // independent of the thread count
            const int scatter_threads = std::min(m_num_threads, m_dim);
#pragma omp parallel for num_threads(scatter_threads)
            for (int c = 0; c < m_dim; ++c)
            {
                real *component = eul_field.componentData(c);
                int cell[3];
                for (int m = 0; m < m_num_markers; ++m)
                {
                    const real value = lag_values(c, m);
                    for (int q = 0; q < m_support_size; ++q)
                    {
                        int rest = q;
                        cell[2] = 0;
                        for (int d = 0; d < m_dim; ++d)
                        {
                            cell[d] = m_support_origin(d, m) + rest % m_points_per_dim;
                            rest /= m_points_per_dim;
                        }
                        component[eul_field.linearIndex(cell[0], cell[1], cell[2])] += value * m_spread_weights(q, m);
                    }
                }
            }
        }

        void InterpolationKernel::spreadLagrangianToEulerian(const MatrixXr &lag_values, const MatrixXr &lag_positions,
                                                             grid::EulerianField &eul_field)
        {
            updateLocalSupport(lag_positions, eul_field.getGridSize());
            spreadLagrangianToEulerian(lag_values, eul_field);
        }

        real InterpolationKernel::computeSupportWeightSum(int marker) const
        {
            ASSERT(marker >= 0 && marker < m_num_markers, "Marker {} has no cached support.", marker);
            real sum = 0;
            int cell[3];
            for (int q = 0; q < m_support_size; ++q)
            {
                sum += supportWeight(marker, q, cell);
            }
            return sum;
        }

    } // namespace ib

} // namespace vbc
