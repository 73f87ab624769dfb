// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#pragma once

#include "VB_Coupler/utils/Config.hpp"
#include "VB_Coupler/grid/EulerianField.hpp"
#include "VB_Coupler/immersed_body/IForcingGrid.hpp"
#include "VB_Coupler/immersed_body/InterpolationKernel.hpp"
#include "VB_Coupler/immersed_body/VirtualBoundaryForcing.hpp"
#include "VB_Coupler/body/RigidBody.hpp"
#include "VB_Coupler/body/CosseratRod.hpp"

#include <memory>
#include <string>

namespace vbc
{
    /**
     * @brief couples one immersed body to an Eulerian flow through virtual boundary forcing.
     *
     * Every coupling step is timeStep(dt) followed by apply():
     *   timeStep: marker kinematics -> interpolate flow velocity -> feedback forcing
     *   apply:    [reset Eulerian forcing] -> spread forcing -> reduce into body force/torque
     *
     * The engine reads the Eulerian velocity field and accumulates into the
     * Eulerian forcing field; both are owned by the flow solver and must outlive
     * the engine. The marker forcing is the force the fluid exerts on the body;
     * the fluid receives its negative.
     *
     * After an OutOfDomainError the displacement-error integrator is left as is;
     * the engine should be discarded.
     */
    class FlowInteraction
    {
    public:
        FlowInteraction(std::unique_ptr<ib::IForcingGrid> forcing_grid,
                        grid::EulerianField &eul_grid_forcing_field,
                        const grid::EulerianField &eul_grid_velocity_field,
                        const CouplingParameters &params);
        ~FlowInteraction() = default;

        FlowInteraction(const FlowInteraction &) = delete;
        FlowInteraction &operator=(const FlowInteraction &) = delete;

        // UpdateKinematics, Interpolate, ComputeForcing; advances time and the integrator by dt
        void timeStep(real dt);

        // Spread, ReduceToBody
        void apply();

        // ReduceToBody alone, from the last computed marker forcing
        void computeFlowForcesAndTorques();

        void reset();

        real getGridDeviationErrorL2Norm() const { return m_virtual_boundary_forcing.getDisplacementErrorL2Norm(); }

        real getTime() const { return m_time; }
        long getStepCount() const { return m_step_count; }
        bool isAwaitingApply() const { return m_awaiting_apply; }

        const CouplingParameters &getParams() const { return m_params; }
        const ib::IForcingGrid &getForcingGrid() const { return *m_forcing_grid; }
        const ib::InterpolationKernel &getInterpolationKernel() const { return m_kernel; }

        const MatrixXr &getLagGridPositionField() const { return m_forcing_grid->getPositionField(); }
        const MatrixXr &getLagGridVelocityField() const { return m_forcing_grid->getVelocityField(); }
        const MatrixXr &getLagGridFlowVelocityField() const { return m_lag_grid_flow_velocity_field; }
        const MatrixXr &getLagGridVelocityMismatchField() const { return m_virtual_boundary_forcing.getVelocityMismatch(); }
        const MatrixXr &getLagGridDisplacementErrorField() const { return m_virtual_boundary_forcing.getDisplacementError(); }
        const MatrixXr &getLagGridForcingField() const { return m_lag_grid_forcing_field; }

        const Matrix3Xr &getBodyFlowForces() const { return m_body_flow_forces; }
        const Matrix3Xr &getBodyFlowTorques() const { return m_body_flow_torques; }

    private:
        void validateEulerianFields() const;
        void spreadForcingToEulerianGrid();

        CouplingParameters m_params;
        std::unique_ptr<ib::IForcingGrid> m_forcing_grid;
        grid::EulerianField &m_eul_grid_forcing_field;
        const grid::EulerianField &m_eul_grid_velocity_field;

        ib::InterpolationKernel m_kernel;
        ib::VirtualBoundaryForcing m_virtual_boundary_forcing;

        MatrixXr m_lag_grid_flow_velocity_field;
        MatrixXr m_lag_grid_forcing_field;
        MatrixXr m_lag_grid_spread_buffer;
        Matrix3Xr m_body_flow_forces;
        Matrix3Xr m_body_flow_torques;

        real m_time;
        long m_step_count = 0;
        bool m_awaiting_apply = false;
    };

    enum class RodForcingGridType
    {
        ElementCentric,
        Nodal,
    };

    // "element_centric" or "nodal"; throws ConfigurationError otherwise
    RodForcingGridType parseRodForcingGridType(const std::string &name);

    std::unique_ptr<FlowInteraction> makeSphereFlowInteraction(
        const body::Sphere &sphere, int num_forcing_points_along_equator,
        grid::EulerianField &eul_grid_forcing_field, const grid::EulerianField &eul_grid_velocity_field,
        const CouplingParameters &params);

    std::unique_ptr<FlowInteraction> makeCircularCylinderFlowInteraction(
        const body::Cylinder &cylinder, int num_forcing_points,
        grid::EulerianField &eul_grid_forcing_field, const grid::EulerianField &eul_grid_velocity_field,
        const CouplingParameters &params);

    std::unique_ptr<FlowInteraction> makeCosseratRodFlowInteraction(
        const body::CosseratRod &cosserat_rod, RodForcingGridType forcing_grid_type,
        grid::EulerianField &eul_grid_forcing_field, const grid::EulerianField &eul_grid_velocity_field,
        const CouplingParameters &params);

} // namespace vbc
