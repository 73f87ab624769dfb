// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#include "VB_Coupler/immersed_body/CosseratRodForcingGrid.hpp"
#include "VB_Coupler/common/Exceptions.hpp"
#include "VB_Coupler/utils/Logger.hpp"

namespace vbc
{

    namespace ib
    {
        namespace
        {
            // validates before the base class allocates marker storage
            int checkedNumMarkers(const std::string &name, int grid_dim, const body::CosseratRod &rod, int num_markers)
            {
                if (grid_dim != 2 && grid_dim != 3)
                {
                    LOG_CRITICAL("{}: grid_dim must be 2 or 3, got {}.", name, grid_dim);
                    throw InvalidGeometryError(name + ": unsupported grid dimension.");
                }
                if (rod.getNumElements() < 1)
                {
                    LOG_CRITICAL("{}: the Cosserat rod has no elements.", name);
                    throw InvalidGeometryError(name + ": rod without elements.");
                }
                return num_markers;
            }
        } // namespace

        // --- element centric ---

        CosseratRodElementCentricForcingGrid::CosseratRodElementCentricForcingGrid(
            int grid_dim, const body::CosseratRod &cosserat_rod)
            : IForcingGrid(grid_dim, checkedNumMarkers("CosseratRodElementCentricForcingGrid", grid_dim,
                                                       cosserat_rod, cosserat_rod.getNumElements())),
              m_cosserat_rod(cosserat_rod)
        {
            computeLagGridPositionField();
            computeLagGridVelocityField();
            LOG_INFO("{} created with {} Lagrangian markers.", getName(), m_num_lag_nodes);
        }

        void CosseratRodElementCentricForcingGrid::computeLagGridPositionField()
        {
            m_position_field = m_cosserat_rod.computeElementPositions().topRows(m_grid_dim);
        }

        void CosseratRodElementCentricForcingGrid::computeLagGridVelocityField()
        {
            m_velocity_field = m_cosserat_rod.computeElementVelocities().topRows(m_grid_dim);
        }

        void CosseratRodElementCentricForcingGrid::transferForcingFromGridToBody(
            const MatrixXr &lag_grid_forcing_field,
            Matrix3Xr &body_flow_forces,
            Matrix3Xr &body_flow_torques) const
        {
            ASSERT(lag_grid_forcing_field.cols() == m_num_lag_nodes, "Forcing field has {} markers, grid has {}.",
                   lag_grid_forcing_field.cols(), m_num_lag_nodes);

            body_flow_forces.setZero(3, getNumBodyForceNodes());
            body_flow_forces.block(0, 1, m_grid_dim, m_num_lag_nodes) += real(0.5) * lag_grid_forcing_field;
            body_flow_forces.block(0, 0, m_grid_dim, m_num_lag_nodes) += real(0.5) * lag_grid_forcing_field;
            body_flow_torques.setZero(3, getNumBodyTorqueNodes());
        }

        real CosseratRodElementCentricForcingGrid::getMaximumLagrangianGridSpacing() const
        {
            return m_cosserat_rod.computeElementLengths().maxCoeff();
        }

        // --- nodal ---

        CosseratRodNodalForcingGrid::CosseratRodNodalForcingGrid(int grid_dim, const body::CosseratRod &cosserat_rod)
            : IForcingGrid(grid_dim, checkedNumMarkers("CosseratRodNodalForcingGrid", grid_dim,
                                                       cosserat_rod, cosserat_rod.getNumNodes())),
              m_cosserat_rod(cosserat_rod)
        {
            computeLagGridPositionField();
            computeLagGridVelocityField();
            LOG_INFO("{} created with {} Lagrangian markers.", getName(), m_num_lag_nodes);
        }

        void CosseratRodNodalForcingGrid::computeLagGridPositionField()
        {
            m_position_field = m_cosserat_rod.getPositions().topRows(m_grid_dim);
        }

        void CosseratRodNodalForcingGrid::computeLagGridVelocityField()
        {
            m_velocity_field = m_cosserat_rod.getVelocities().topRows(m_grid_dim);
        }

        void CosseratRodNodalForcingGrid::transferForcingFromGridToBody(
            const MatrixXr &lag_grid_forcing_field,
            Matrix3Xr &body_flow_forces,
            Matrix3Xr &body_flow_torques) const
        {
            body_flow_forces.setZero(3, getNumBodyForceNodes());
            body_flow_forces.topRows(m_grid_dim) = lag_grid_forcing_field;
            body_flow_torques.setZero(3, getNumBodyTorqueNodes());
        }

        real CosseratRodNodalForcingGrid::getMaximumLagrangianGridSpacing() const
        {
            return m_cosserat_rod.computeElementLengths().maxCoeff();
        }

    } // namespace ib

} // namespace vbc
