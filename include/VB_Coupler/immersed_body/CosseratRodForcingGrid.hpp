// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#pragma once

#include "VB_Coupler/immersed_body/IForcingGrid.hpp"
#include "VB_Coupler/body/CosseratRod.hpp"

namespace vbc
{

    namespace ib
    {
        /**
         * @brief one marker per rod element, at the element midpoint.
         *
         * Marker kinematics average the two adjacent nodes. Each marker's forcing
         * is split equally between those two nodes. Markers coincide with the
         * element centroids, so no torque is transferred.
         */
        class CosseratRodElementCentricForcingGrid : public IForcingGrid
        {
        public:
            CosseratRodElementCentricForcingGrid(int grid_dim, const body::CosseratRod &cosserat_rod);

            void computeLagGridPositionField() override;
            void computeLagGridVelocityField() override;
            void transferForcingFromGridToBody(
                const MatrixXr &lag_grid_forcing_field,
                Matrix3Xr &body_flow_forces,
                Matrix3Xr &body_flow_torques) const override;

            real getMaximumLagrangianGridSpacing() const override;
            int getNumBodyForceNodes() const override { return m_cosserat_rod.getNumNodes(); }
            int getNumBodyTorqueNodes() const override { return m_cosserat_rod.getNumElements(); }
            std::string getName() const override { return "CosseratRodElementCentricForcingGrid"; }

        private:
            const body::CosseratRod &m_cosserat_rod;
        };

        // one marker per rod node; forcing goes to that node, no torque.
        class CosseratRodNodalForcingGrid : public IForcingGrid
        {
        public:
            CosseratRodNodalForcingGrid(int grid_dim, const body::CosseratRod &cosserat_rod);

            void computeLagGridPositionField() override;
            void computeLagGridVelocityField() override;
            void transferForcingFromGridToBody(
                const MatrixXr &lag_grid_forcing_field,
                Matrix3Xr &body_flow_forces,
                Matrix3Xr &body_flow_torques) const override;

            real getMaximumLagrangianGridSpacing() const override;
            int getNumBodyForceNodes() const override { return m_cosserat_rod.getNumNodes(); }
            int getNumBodyTorqueNodes() const override { return m_cosserat_rod.getNumElements(); }
            std::string getName() const override { return "CosseratRodNodalForcingGrid"; }

        private:
            const body::CosseratRod &m_cosserat_rod;
        };

    } // namespace ib

} // namespace vbc
