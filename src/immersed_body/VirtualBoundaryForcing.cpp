// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#include "VB_Coupler/immersed_body/VirtualBoundaryForcing.hpp"
#include "VB_Coupler/common/Exceptions.hpp"
#include "VB_Coupler/utils/Logger.hpp"

#include "omp.h"

#include <cmath>

namespace vbc
{

    namespace ib
    {

        VirtualBoundaryForcing::VirtualBoundaryForcing(real stiffness, real damping, int grid_dim, int num_lag_nodes, int num_threads)
            : m_stiffness(stiffness),
              m_damping(damping),
              m_num_threads(num_threads),
              m_velocity_mismatch(MatrixXr::Zero(grid_dim, num_lag_nodes)),
              m_displacement_error(MatrixXr::Zero(grid_dim, num_lag_nodes))
        {
            if (!std::isfinite(stiffness) || !std::isfinite(damping) || stiffness > 0 || damping > 0)
            {
                LOG_CRITICAL("Virtual boundary gains must be finite and non-positive, got stiffness {} and damping {}.",
                             stiffness, damping);
                throw ConfigurationError("Virtual boundary stiffness/damping violate the sign convention.");
            }
        }

        void VirtualBoundaryForcing::computeVelocityMismatch(const MatrixXr &lag_grid_body_velocity,
                                                             const MatrixXr &lag_grid_flow_velocity)
        {
            ASSERT(lag_grid_body_velocity.rows() == m_velocity_mismatch.rows() &&
                       lag_grid_body_velocity.cols() == m_velocity_mismatch.cols() &&
                       lag_grid_flow_velocity.rows() == m_velocity_mismatch.rows() &&
                       lag_grid_flow_velocity.cols() == m_velocity_mismatch.cols(),
                   "Marker velocity fields do not match the forcing grid shape.");
            m_velocity_mismatch = lag_grid_body_velocity - lag_grid_flow_velocity;
        }

        void VirtualBoundaryForcing::computeForcing(MatrixXr &lag_grid_forcing) const
        {
            const int num_lag_nodes = static_cast<int>(m_velocity_mismatch.cols());
            lag_grid_forcing.resize(m_velocity_mismatch.rows(), num_lag_nodes);
#pragma omp parallel for num_threads(m_num_threads)
            for (int m = 0; m < num_lag_nodes; ++m)
            {
                lag_grid_forcing.col(m) = m_stiffness * m_displacement_error.col(m) + m_damping * m_velocity_mismatch.col(m);
            }
        }

        void VirtualBoundaryForcing::advanceDisplacementError(real dt)
        {
            m_displacement_error += dt * m_velocity_mismatch;
        }

        void VirtualBoundaryForcing::reset()
        {
            m_velocity_mismatch.setZero();
            m_displacement_error.setZero();
        }

        real VirtualBoundaryForcing::getDisplacementErrorL2Norm() const
        {
            if (m_displacement_error.cols() == 0)
            {
                return real(0);
            }
            return std::sqrt(m_displacement_error.squaredNorm() / m_displacement_error.cols());
        }

    } // namespace ib

} // namespace vbc
