// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#include "VB_Coupler/immersed_body/RigidBodyForcingGrid.hpp"
#include "VB_Coupler/common/Exceptions.hpp"
#include "VB_Coupler/common/MathUtils.hpp"
#include "VB_Coupler/utils/Logger.hpp"

#include <algorithm>
#include <cmath>

namespace vbc
{

    namespace ib
    {
        namespace
        {
            constexpr real kPi = real(3.14159265358979323846);

            void checkRigidGeometry(const std::string &name, int grid_dim, int expected_dim,
                                    real radius, int num_points, int min_points)
            {
                if (grid_dim != expected_dim)
                {
                    LOG_CRITICAL("{} is only valid for {}D grids, got grid_dim {}.", name, expected_dim, grid_dim);
                    throw InvalidGeometryError(name + ": unsupported grid dimension.");
                }
                if (!(radius > 0))
                {
                    LOG_CRITICAL("{} needs a positive radius, got {}.", name, radius);
                    throw InvalidGeometryError(name + ": non-positive radius.");
                }
                if (num_points < min_points)
                {
                    LOG_CRITICAL("{} needs at least {} forcing points, got {}.", name, min_points, num_points);
                    throw InvalidGeometryError(name + ": too few forcing points.");
                }
            }
        } // namespace

        RigidBodyForcingGrid::RigidBodyForcingGrid(int grid_dim, const body::RigidBody &rigid_body,
                                                   const Matrix3Xr &local_frame_relative_positions,
                                                   real max_lag_grid_spacing, std::string name)
            : IForcingGrid(grid_dim, static_cast<int>(local_frame_relative_positions.cols())),
              m_rigid_body(rigid_body),
              m_local_frame_relative_position_field(local_frame_relative_positions),
              m_max_lag_grid_spacing(max_lag_grid_spacing),
              m_name(std::move(name))
        {
            if (grid_dim != 2 && grid_dim != 3)
            {
                LOG_CRITICAL("{}: grid_dim must be 2 or 3, got {}.", m_name, grid_dim);
                throw InvalidGeometryError(m_name + ": unsupported grid dimension.");
            }
            if (m_num_lag_nodes == 0)
            {
                LOG_CRITICAL("{}: a rigid body forcing grid needs at least one marker.", m_name);
                throw InvalidGeometryError(m_name + ": empty forcing grid.");
            }

            computeLagGridPositionField();
            computeLagGridVelocityField();
            LOG_INFO("{} created with {} Lagrangian markers, max spacing {}.", m_name, m_num_lag_nodes, m_max_lag_grid_spacing);
        }

        void RigidBodyForcingGrid::computeLagGridPositionField()
        {
            const body::RigidBodyState &state = m_rigid_body.getState();
            Matrix3Xr lab_positions = state.director.transpose() * m_local_frame_relative_position_field;
            lab_positions.colwise() += state.position;
            m_position_field = lab_positions.topRows(m_grid_dim);
        }

        void RigidBodyForcingGrid::computeLagGridVelocityField()
        {
            const body::RigidBodyState &state = m_rigid_body.getState();
            const Matrix3Xr lab_relative_positions = state.director.transpose() * m_local_frame_relative_position_field;
            Matrix3Xr lab_velocities = crossProductMatrix(m_rigid_body.getAngularVelocityInLabFrame()) * lab_relative_positions;
            lab_velocities.colwise() += state.velocity;
            m_velocity_field = lab_velocities.topRows(m_grid_dim);
        }

        void RigidBodyForcingGrid::transferForcingFromGridToBody(
            const MatrixXr &lag_grid_forcing_field,
            Matrix3Xr &body_flow_forces,
            Matrix3Xr &body_flow_torques) const
        {
            ASSERT(lag_grid_forcing_field.rows() == m_grid_dim && lag_grid_forcing_field.cols() == m_num_lag_nodes,
                   "Forcing field shape mismatch in {}.", m_name);

            const body::RigidBodyState &state = m_rigid_body.getState();
            const Matrix3Xr forcing = padToThreeDimensions(lag_grid_forcing_field);
            MatrixXr relative_positions_in_grid = m_position_field;
            relative_positions_in_grid.colwise() -= VectorXr(state.position.topRows(m_grid_dim));
            const Matrix3Xr relative_positions = padToThreeDimensions(relative_positions_in_grid);

            Vector3r torque_lab = Vector3r::Zero();
            for (int m = 0; m < m_num_lag_nodes; ++m)
            {
                torque_lab += relative_positions.col(m).cross(forcing.col(m));
            }

            body_flow_forces.setZero(3, 1);
            body_flow_forces.col(0) = forcing.rowwise().sum();
            body_flow_torques.setZero(3, 1);
            body_flow_torques.col(0) = state.director * torque_lab;
        }

        SphereSurfaceSampling sampleSphereSurface(real radius, int num_forcing_points_along_equator)
        {
            SphereSurfaceSampling sampling;
            const int num_latitudes = num_forcing_points_along_equator / 2 + 1;
            const real polar_spacing = radius * kPi / (num_latitudes - 1);

            int num_points = 0;
            sampling.num_points_along_latitudes.resize(num_latitudes);
            for (int i = 0; i < num_latitudes; ++i)
            {
                const real polar_angle = kPi * i / (num_latitudes - 1);
                const int n = std::max(1, static_cast<int>(std::lround(num_forcing_points_along_equator * std::sin(polar_angle))));
                sampling.num_points_along_latitudes[i] = n;
                num_points += n;
            }

            sampling.local_positions.resize(3, num_points);
            sampling.max_spacing = polar_spacing;
            int column = 0;
            for (int i = 0; i < num_latitudes; ++i)
            {
                const real polar_angle = kPi * i / (num_latitudes - 1);
                const real ring_radius = radius * std::sin(polar_angle);
                const int n = sampling.num_points_along_latitudes[i];
                for (int j = 0; j < n; ++j)
                {
                    const real azimuth = 2 * kPi * j / n;
                    sampling.local_positions.col(column++) = Vector3r(
                        ring_radius * std::cos(azimuth),
                        ring_radius * std::sin(azimuth),
                        radius * std::cos(polar_angle));
                }
                if (n > 1)
                {
                    sampling.max_spacing = std::max(sampling.max_spacing, 2 * kPi * ring_radius / n);
                }
            }
            return sampling;
        }

        Matrix3Xr sampleCircle(real radius, int num_forcing_points)
        {
            Matrix3Xr local_positions(3, num_forcing_points);
            for (int j = 0; j < num_forcing_points; ++j)
            {
                const real angle = 2 * kPi * j / num_forcing_points;
                local_positions.col(j) = Vector3r(radius * std::cos(angle), radius * std::sin(angle), 0);
            }
            return local_positions;
        }

        std::unique_ptr<RigidBodyForcingGrid> makeSphereForcingGrid(
            int grid_dim, const body::Sphere &sphere, int num_forcing_points_along_equator)
        {
            checkRigidGeometry("SphereForcingGrid", grid_dim, 3, sphere.getRadius(), num_forcing_points_along_equator, 4);
            const SphereSurfaceSampling sampling = sampleSphereSurface(sphere.getRadius(), num_forcing_points_along_equator);
            return std::make_unique<RigidBodyForcingGrid>(
                grid_dim, sphere, sampling.local_positions, sampling.max_spacing, "SphereForcingGrid");
        }

        std::unique_ptr<RigidBodyForcingGrid> makeCircularCylinderForcingGrid(
            int grid_dim, const body::Cylinder &cylinder, int num_forcing_points)
        {
            checkRigidGeometry("CircularCylinderForcingGrid", grid_dim, 2, cylinder.getRadius(), num_forcing_points, 3);
            const Matrix3Xr local_positions = sampleCircle(cylinder.getRadius(), num_forcing_points);
            return std::make_unique<RigidBodyForcingGrid>(
                grid_dim, cylinder, local_positions,
                maximumConsecutiveSpacing(local_positions, true), "CircularCylinderForcingGrid");
        }

    } // namespace ib

} // namespace vbc
