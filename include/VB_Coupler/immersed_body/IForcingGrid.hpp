// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#pragma once

#include "VB_Coupler/common/Types.hpp"
#include <string>

namespace vbc
{

    namespace ib
    {
        /**
         * @brief Lagrangian marker discretization of one immersed body.
         *
         * A forcing grid keeps a const reference to the body it samples and
         * owns the grid_dim x num_lag_nodes marker position and velocity fields.
         * The marker count is fixed at construction.
         */
        class IForcingGrid
        {
        public:
            virtual ~IForcingGrid() = default;

            IForcingGrid(const IForcingGrid &) = delete;
            IForcingGrid &operator=(const IForcingGrid &) = delete;

            // marker positions from the current body state; call before the velocity update
            virtual void computeLagGridPositionField() = 0;

            virtual void computeLagGridVelocityField() = 0;

            /**
             * @brief reduces marker forcing into the body's force/torque accumulators.
             * @param lag_grid_forcing_field force the fluid exerts on the body at each marker, grid_dim x num_lag_nodes.
             * @param body_flow_forces 3 x getNumBodyForceNodes(), overwritten.
             * @param body_flow_torques 3 x getNumBodyTorqueNodes(), overwritten.
             */
            virtual void transferForcingFromGridToBody(
                const MatrixXr &lag_grid_forcing_field,
                Matrix3Xr &body_flow_forces,
                Matrix3Xr &body_flow_torques) const = 0;

            virtual real getMaximumLagrangianGridSpacing() const = 0;

            virtual int getNumBodyForceNodes() const = 0;
            virtual int getNumBodyTorqueNodes() const = 0;

            virtual std::string getName() const = 0;

            int getGridDim() const { return m_grid_dim; }
            int getNumLagNodes() const { return m_num_lag_nodes; }
            int getDofPerMarker() const { return m_grid_dim; }

            const MatrixXr &getPositionField() const { return m_position_field; }
            const MatrixXr &getVelocityField() const { return m_velocity_field; }

        protected:
            IForcingGrid(int grid_dim, int num_lag_nodes)
                : m_grid_dim(grid_dim),
                  m_num_lag_nodes(num_lag_nodes),
                  m_position_field(MatrixXr::Zero(grid_dim, num_lag_nodes)),
                  m_velocity_field(MatrixXr::Zero(grid_dim, num_lag_nodes))
            {
            }

            int m_grid_dim;
            int m_num_lag_nodes;
            MatrixXr m_position_field;
            MatrixXr m_velocity_field;
        };

    } // namespace ib

} // namespace vbc
