// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#pragma once

#include "VB_Coupler/immersed_body/IForcingGrid.hpp"
#include "VB_Coupler/body/RigidBody.hpp"

#include <memory>
#include <vector>

namespace vbc
{

    namespace ib
    {
        /**
         * @brief forcing grid of a rigid body, markers at fixed body-frame offsets p_m.
         *
         *   x_m = com + Q^T p_m,  v_m = v_com + omega_lab x (Q^T p_m)
         *
         * The body receives one force and one torque; the torque is expressed in
         * the body frame, as rigid-body integrators advance omega there.
         * Surface samplings for particular shapes are built by the factories below.
         */
        class RigidBodyForcingGrid : public IForcingGrid
        {
        public:
            RigidBodyForcingGrid(int grid_dim, const body::RigidBody &rigid_body,
                                 const Matrix3Xr &local_frame_relative_positions,
                                 real max_lag_grid_spacing, std::string name);

            void computeLagGridPositionField() override;
            void computeLagGridVelocityField() override;
            void transferForcingFromGridToBody(
                const MatrixXr &lag_grid_forcing_field,
                Matrix3Xr &body_flow_forces,
                Matrix3Xr &body_flow_torques) const override;

            real getMaximumLagrangianGridSpacing() const override { return m_max_lag_grid_spacing; }
            int getNumBodyForceNodes() const override { return 1; }
            int getNumBodyTorqueNodes() const override { return 1; }
            std::string getName() const override { return m_name; }

            const Matrix3Xr &getLocalFrameRelativePositionField() const { return m_local_frame_relative_position_field; }

        private:
            const body::RigidBody &m_rigid_body;
            Matrix3Xr m_local_frame_relative_position_field;
            real m_max_lag_grid_spacing;
            std::string m_name;
        };

        struct SphereSurfaceSampling
        {
            Matrix3Xr local_positions;
            std::vector<int> num_points_along_latitudes; // pole to pole
            real max_spacing = 0;
        };

        /**
         * n_eq / 2 + 1 latitude rings at polar angles pi * i / (n_lat - 1); ring i
         * carries max(1, round(n_eq * sin(theta_i))) equally spaced points, so the
         * equator has n_eq points and each pole a single one.
         */
        SphereSurfaceSampling sampleSphereSurface(real radius, int num_forcing_points_along_equator);

        // n points on a circle of the given radius in the body frame's (d1, d2) plane.
        Matrix3Xr sampleCircle(real radius, int num_forcing_points);

        // 3D only. Throws InvalidGeometryError on grid_dim != 3, radius <= 0 or fewer than 4 points.
        std::unique_ptr<RigidBodyForcingGrid> makeSphereForcingGrid(
            int grid_dim, const body::Sphere &sphere, int num_forcing_points_along_equator);

        // 2D only. Throws InvalidGeometryError on grid_dim != 2, radius <= 0 or fewer than 3 points.
        std::unique_ptr<RigidBodyForcingGrid> makeCircularCylinderForcingGrid(
            int grid_dim, const body::Cylinder &cylinder, int num_forcing_points);

    } // namespace ib

} // namespace vbc
