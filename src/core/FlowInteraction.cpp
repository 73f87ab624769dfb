// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#include "VB_Coupler/core/FlowInteraction.hpp"
#include "VB_Coupler/common/Exceptions.hpp"
#include "VB_Coupler/immersed_body/RigidBodyForcingGrid.hpp"
#include "VB_Coupler/immersed_body/CosseratRodForcingGrid.hpp"
#include "VB_Coupler/utils/Logger.hpp"
#include "VB_Coupler/utils/Profiler.hpp"

#include <cmath>

namespace vbc
{
    namespace
    {
        const CouplingParameters &validated(const CouplingParameters &params)
        {
            params.validate();
            return params;
        }

        std::unique_ptr<ib::IForcingGrid> checkedForcingGrid(std::unique_ptr<ib::IForcingGrid> forcing_grid, int grid_dim)
        {
            if (!forcing_grid)
            {
                LOG_CRITICAL("FlowInteraction requires a forcing grid.");
                throw ConfigurationError("Missing forcing grid.");
            }
            if (forcing_grid->getGridDim() != grid_dim)
            {
                LOG_CRITICAL("{} is {}D but the coupling is configured for {}D.",
                             forcing_grid->getName(), forcing_grid->getGridDim(), grid_dim);
                throw ConfigurationError("Forcing grid dimension does not match grid_dim.");
            }
            return forcing_grid;
        }
    } // namespace

    FlowInteraction::FlowInteraction(std::unique_ptr<ib::IForcingGrid> forcing_grid,
                                     grid::EulerianField &eul_grid_forcing_field,
                                     const grid::EulerianField &eul_grid_velocity_field,
                                     const CouplingParameters &params)
        : m_params(validated(params)),
          m_forcing_grid(checkedForcingGrid(std::move(forcing_grid), params.grid_dim)),
          m_eul_grid_forcing_field(eul_grid_forcing_field),
          m_eul_grid_velocity_field(eul_grid_velocity_field),
          m_kernel(params.grid_dim, params.dx, params.interp_kernel_width,
                   params.getEulerianGridCoordinateShift(), params.num_threads),
          m_virtual_boundary_forcing(params.stiffness, params.damping, params.grid_dim,
                                     m_forcing_grid->getNumLagNodes(), params.num_threads),
          m_lag_grid_flow_velocity_field(MatrixXr::Zero(params.grid_dim, m_forcing_grid->getNumLagNodes())),
          m_lag_grid_forcing_field(MatrixXr::Zero(params.grid_dim, m_forcing_grid->getNumLagNodes())),
          m_body_flow_forces(Matrix3Xr::Zero(3, m_forcing_grid->getNumBodyForceNodes())),
          m_body_flow_torques(Matrix3Xr::Zero(3, m_forcing_grid->getNumBodyTorqueNodes())),
          m_time(params.start_time)
    {
        validateEulerianFields();

        const real max_lag_grid_spacing = m_forcing_grid->getMaximumLagrangianGridSpacing();
        if (max_lag_grid_spacing > m_params.dx)
        {
            LOG_WARN("{}: maximum Lagrangian grid spacing {} exceeds the Eulerian grid spacing {}; "
                     "the body may leak flow between markers.",
                     m_forcing_grid->getName(), max_lag_grid_spacing, m_params.dx);
        }

        LOG_INFO("FlowInteraction set up for {} ({} markers) on a {}D grid: stiffness {}, damping {}, kernel width {}, "
                 "forcing reset {}.",
                 m_forcing_grid->getName(), m_forcing_grid->getNumLagNodes(), m_params.grid_dim,
                 m_params.stiffness, m_params.damping, m_params.interp_kernel_width,
                 m_params.enable_eulerian_forcing_reset ? "on" : "off");
    }

    void FlowInteraction::validateEulerianFields() const
    {
        auto check = [this](const grid::EulerianField &field, const char *name)
        {
            if (field.getDim() != m_params.grid_dim)
            {
                LOG_CRITICAL("Eulerian {} field is {}D, coupling is {}D.", name, field.getDim(), m_params.grid_dim);
                throw ConfigurationError("Eulerian field dimension mismatch.");
            }
            if (std::abs(field.getDx() - m_params.dx) > real(1e-6) * m_params.dx)
            {
                LOG_CRITICAL("Eulerian {} field spacing {} differs from the configured dx {}.", name, field.getDx(), m_params.dx);
                throw ConfigurationError("Eulerian field spacing mismatch.");
            }
            for (int d = 0; d < m_params.grid_dim; ++d)
            {
                if (field.getGridSize()[d] < m_kernel.getSupportPointsPerDim())
                {
                    LOG_CRITICAL("Kernel support of {} cells does not fit the Eulerian {} field ({} cells along axis {}).",
                                 m_kernel.getSupportPointsPerDim(), name, field.getGridSize()[d], d);
                    throw ConfigurationError("Interpolation kernel wider than the Eulerian grid.");
                }
            }
        };

        check(m_eul_grid_velocity_field, "velocity");
        check(m_eul_grid_forcing_field, "forcing");
        if (!m_eul_grid_velocity_field.hasSameShape(m_eul_grid_forcing_field))
        {
            LOG_CRITICAL("Eulerian velocity and forcing fields have different shapes.");
            throw ConfigurationError("Eulerian field shape mismatch.");
        }
    }

    void FlowInteraction::timeStep(real dt)
    {
        PROFILE_FUNCTION();
        if (m_awaiting_apply)
        {
            LOG_ERROR("timeStep() called twice without apply(); the displacement error would be integrated twice.");
            throw std::logic_error("FlowInteraction::timeStep called before apply of the previous step.");
        }
        if (!(dt > 0) || !std::isfinite(dt))
        {
            LOG_ERROR("Coupling time step must be positive and finite, got {}.", dt);
            throw std::invalid_argument("Non-positive coupling time step.");
        }

        // --- UpdateKinematics ---
        m_forcing_grid->computeLagGridPositionField();
        m_forcing_grid->computeLagGridVelocityField();

        // --- Interpolate ---
        m_kernel.updateLocalSupport(m_forcing_grid->getPositionField(), m_eul_grid_velocity_field.getGridSize());
        m_kernel.interpolateEulerianToLagrangian(m_eul_grid_velocity_field, m_lag_grid_flow_velocity_field);

        // --- ComputeForcing ---
        m_virtual_boundary_forcing.computeVelocityMismatch(m_forcing_grid->getVelocityField(), m_lag_grid_flow_velocity_field);
        m_virtual_boundary_forcing.computeForcing(m_lag_grid_forcing_field);
        m_virtual_boundary_forcing.advanceDisplacementError(dt);

        m_time += dt;
        ++m_step_count;
        m_awaiting_apply = true;

        LOG_TRACE("Coupling step {} at t = {}: grid deviation {}", m_step_count, m_time, getGridDeviationErrorL2Norm());
    }

    void FlowInteraction::apply()
    {
        PROFILE_FUNCTION();
        if (!m_awaiting_apply)
        {
            LOG_ERROR("apply() called without a preceding timeStep().");
            throw std::logic_error("FlowInteraction::apply called before timeStep.");
        }

        spreadForcingToEulerianGrid();
        computeFlowForcesAndTorques();
        m_awaiting_apply = false;
    }

    void FlowInteraction::spreadForcingToEulerianGrid()
    {
        if (m_params.enable_eulerian_forcing_reset)
        {
            m_eul_grid_forcing_field.setZero();
        }
        // the fluid feels the reaction of the force it exerts on the body
        m_lag_grid_spread_buffer = -m_lag_grid_forcing_field;
        m_kernel.spreadLagrangianToEulerian(m_lag_grid_spread_buffer, m_eul_grid_forcing_field);
    }

    void FlowInteraction::computeFlowForcesAndTorques()
    {
        m_forcing_grid->transferForcingFromGridToBody(m_lag_grid_forcing_field, m_body_flow_forces, m_body_flow_torques);
    }

    void FlowInteraction::reset()
    {
        m_virtual_boundary_forcing.reset();
        m_lag_grid_flow_velocity_field.setZero();
        m_lag_grid_forcing_field.setZero();
        m_body_flow_forces.setZero();
        m_body_flow_torques.setZero();
        m_time = m_params.start_time;
        m_step_count = 0;
        m_awaiting_apply = false;
        LOG_INFO("FlowInteraction for {} reset to t = {}.", m_forcing_grid->getName(), m_time);
    }

    RodForcingGridType parseRodForcingGridType(const std::string &name)
    {
        if (name == "element_centric")
            return RodForcingGridType::ElementCentric;
        if (name == "nodal")
            return RodForcingGridType::Nodal;

        LOG_CRITICAL("Unknown rod forcing grid type: '{}'. Supported types are 'element_centric' and 'nodal'.", name);
        throw ConfigurationError("Invalid rod forcing grid type.");
    }

    std::unique_ptr<FlowInteraction> makeSphereFlowInteraction(
        const body::Sphere &sphere, int num_forcing_points_along_equator,
        grid::EulerianField &eul_grid_forcing_field, const grid::EulerianField &eul_grid_velocity_field,
        const CouplingParameters &params)
    {
        return std::make_unique<FlowInteraction>(
            ib::makeSphereForcingGrid(params.grid_dim, sphere, num_forcing_points_along_equator),
            eul_grid_forcing_field, eul_grid_velocity_field, params);
    }

    std::unique_ptr<FlowInteraction> makeCircularCylinderFlowInteraction(
        const body::Cylinder &cylinder, int num_forcing_points,
        grid::EulerianField &eul_grid_forcing_field, const grid::EulerianField &eul_grid_velocity_field,
        const CouplingParameters &params)
    {
        return std::make_unique<FlowInteraction>(
            ib::makeCircularCylinderForcingGrid(params.grid_dim, cylinder, num_forcing_points),
            eul_grid_forcing_field, eul_grid_velocity_field, params);
    }

    std::unique_ptr<FlowInteraction> makeCosseratRodFlowInteraction(
        const body::CosseratRod &cosserat_rod, RodForcingGridType forcing_grid_type,
        grid::EulerianField &eul_grid_forcing_field, const grid::EulerianField &eul_grid_velocity_field,
        const CouplingParameters &params)
    {
        std::unique_ptr<ib::IForcingGrid> forcing_grid;
        switch (forcing_grid_type)
        {
        case RodForcingGridType::ElementCentric:
            forcing_grid = std::make_unique<ib::CosseratRodElementCentricForcingGrid>(params.grid_dim, cosserat_rod);
            break;
        case RodForcingGridType::Nodal:
            forcing_grid = std::make_unique<ib::CosseratRodNodalForcingGrid>(params.grid_dim, cosserat_rod);
            break;
        }
        return std::make_unique<FlowInteraction>(std::move(forcing_grid), eul_grid_forcing_field,
                                                 eul_grid_velocity_field, params);
    }

} // namespace vbc
