// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#include "catch2/catch.hpp"

#include "VB_Coupler/core/FlowInteraction.hpp"
#include "VB_Coupler/immersed_body/CosseratRodForcingGrid.hpp"
#include "VB_Coupler/common/Exceptions.hpp"

#include <cmath>
#include <random>
#include <vector>

using namespace vbc;

namespace
{
    CouplingParameters makeParams(int grid_dim, real stiffness, real damping, int width)
    {
        CouplingParameters params;
        params.grid_dim = grid_dim;
        params.stiffness = stiffness;
        params.damping = damping;
        params.dx = 1.0;
        params.interp_kernel_width = width;
        params.num_threads = 2;
        return params;
    }

    // one element whose midpoint sits on the cell centre (4.5, 4.5, 4.5), moving at (1, 0, 0)
    body::CosseratRod makeSingleElementRod()
    {
        body::CosseratRod rod = body::CosseratRod::straightRod(1, Vector3r(4, 4.5, 4.5), Vector3r(1, 0, 0), 1.0);
        rod.getVelocities().row(0).setOnes();
        return rod;
    }

    // forward-Euler toy fluid driven only by the coupling forcing
    void advanceToyFluid(grid::EulerianField &velocity, const grid::EulerianField &forcing, real dt)
    {
        for (size_t n = 0; n < velocity.data().size(); ++n)
            velocity.data()[n] += dt * forcing.data()[n];
    }
} // namespace

TEST_CASE("flow_interaction_single_marker_step", "[flow_interaction]")
{
    body::CosseratRod rod = makeSingleElementRod();
    grid::EulerianField velocity(3, {8, 8, 8}, 1.0);
    grid::EulerianField forcing(3, {8, 8, 8}, 1.0);
    const CouplingParameters params = makeParams(3, -100.0, -10.0, 1);

    auto coupling = makeCosseratRodFlowInteraction(rod, RodForcingGridType::ElementCentric, forcing, velocity, params);

    coupling->timeStep(0.01);
    REQUIRE(coupling->getLagGridForcingField()(0, 0) == Approx(-10.0));
    REQUIRE(coupling->getLagGridForcingField()(1, 0) == 0);
    REQUIRE(coupling->getLagGridDisplacementErrorField()(0, 0) == Approx(0.01));
    REQUIRE(coupling->isAwaitingApply());

    coupling->apply();
    // a width-1 kernel centred on a cell puts all of the weight there
    REQUIRE(forcing(0, 4, 4, 4) == Approx(10.0));
    REQUIRE(forcing.volumeIntegral(0) == Approx(10.0));
    REQUIRE(coupling->getBodyFlowForces()(0, 0) == Approx(-5.0));
    REQUIRE(coupling->getBodyFlowForces()(0, 1) == Approx(-5.0));
    REQUIRE(coupling->getBodyFlowTorques().isZero());

    coupling->timeStep(0.01);
    REQUIRE(coupling->getLagGridForcingField()(0, 0) == Approx(-11.0));
    coupling->apply();

    // no reset: the second step accumulates on top of the first
    REQUIRE(forcing(0, 4, 4, 4) == Approx(21.0));

    REQUIRE(coupling->getStepCount() == 2);
    REQUIRE(coupling->getTime() == Approx(0.02));
}

TEST_CASE("flow_interaction_forcing_reset", "[flow_interaction]")
{
    body::CosseratRod rod = makeSingleElementRod();
    grid::EulerianField velocity(3, {8, 8, 8}, 1.0);
    grid::EulerianField forcing(3, {8, 8, 8}, 1.0);
    CouplingParameters params = makeParams(3, -100.0, -10.0, 1);
    params.enable_eulerian_forcing_reset = true;

    // stale values from a previous flow step
    forcing.setConstant(Vector3r(3, 3, 3));

    auto coupling = makeCosseratRodFlowInteraction(rod, RodForcingGridType::ElementCentric, forcing, velocity, params);
    coupling->timeStep(0.01);
    coupling->apply();
    coupling->timeStep(0.01);
    coupling->apply();

    REQUIRE(forcing(0, 4, 4, 4) == Approx(11.0));
    REQUIRE(forcing.volumeIntegral(0) == Approx(11.0));
    REQUIRE(forcing.volumeIntegral(1) == 0);
}

TEST_CASE("flow_interaction_bodies_sharing_one_grid", "[flow_interaction]")
{
    grid::EulerianField velocity(3, {8, 8, 8}, 1.0);
    grid::EulerianField forcing(3, {8, 8, 8}, 1.0);

    // the first body clears the forcing field, the second adds on top of it
    CouplingParameters first_params = makeParams(3, -100.0, -10.0, 1);
    first_params.enable_eulerian_forcing_reset = true;
    const CouplingParameters second_params = makeParams(3, -100.0, -10.0, 1);

    body::CosseratRod first_rod = makeSingleElementRod();
    body::CosseratRod second_rod = body::CosseratRod::straightRod(1, Vector3r(2, 2.5, 2.5), Vector3r(1, 0, 0), 1.0);
    second_rod.getVelocities().row(0).setOnes();

    auto first = makeCosseratRodFlowInteraction(first_rod, RodForcingGridType::ElementCentric, forcing, velocity, first_params);
    auto second = makeCosseratRodFlowInteraction(second_rod, RodForcingGridType::ElementCentric, forcing, velocity, second_params);

    for (int step = 0; step < 2; ++step)
    {
        first->timeStep(0.01);
        second->timeStep(0.01);
        first->apply();
        second->apply();
    }

    // only the latest step of each body remains on the grid
    REQUIRE(forcing(0, 4, 4, 4) == Approx(11.0));
    REQUIRE(forcing(0, 2, 2, 2) == Approx(11.0));
    REQUIRE(forcing.volumeIntegral(0) == Approx(22.0));

    const real total_body_force = first->getBodyFlowForces().row(0).sum() + second->getBodyFlowForces().row(0).sum();
    REQUIRE(forcing.volumeIntegral(0) + total_body_force == Approx(0).margin(1e-12));
}

TEST_CASE("flow_interaction_momentum_exchange_balances", "[flow_interaction]")
{
    const real dx = 0.5;
    CouplingParameters params = makeParams(2, 0.0, -1.0, 2);
    params.dx = dx;
    params.enable_eulerian_forcing_reset = true;

    grid::EulerianField velocity(2, {32, 32, 1}, dx);
    grid::EulerianField forcing(2, {32, 32, 1}, dx);
    std::mt19937 gen(3u);
    std::uniform_real_distribution<real> dist(-1, 1);
    for (real &v : velocity.data())
        v = dist(gen);

    body::Cylinder cylinder(Vector3r(8, 8, 0), 2.0, 1.0);
    auto coupling = makeCircularCylinderFlowInteraction(cylinder, 48, forcing, velocity, params);

    coupling->timeStep(0.1);
    coupling->apply();

    // body at rest: the marker forcing is the interpolated flow velocity
    const MatrixXr &lag_forcing = coupling->getLagGridForcingField();
    REQUIRE(lag_forcing.isApprox(coupling->getLagGridFlowVelocityField()));
    REQUIRE(lag_forcing.cwiseAbs().maxCoeff() > 0);

    const Matrix3Xr &body_force = coupling->getBodyFlowForces();
    REQUIRE(forcing.volumeIntegral(0) + body_force(0, 0) == Approx(0).margin(1e-10));
    REQUIRE(forcing.volumeIntegral(1) + body_force(1, 0) == Approx(0).margin(1e-10));
    REQUIRE(body_force(0, 0) == Approx(lag_forcing.row(0).sum()));
}

TEST_CASE("flow_interaction_body_in_quiescent_flow", "[flow_interaction]")
{
    body::Sphere sphere(Vector3r(8, 8, 8), 2.0);
    grid::EulerianField velocity(3, {16, 16, 16}, 1.0);
    grid::EulerianField forcing(3, {16, 16, 16}, 1.0);
    const CouplingParameters params = makeParams(3, -5e4, -2e1, 2);

    auto coupling = makeSphereFlowInteraction(sphere, 16, forcing, velocity, params);
    for (int step = 0; step < 3; ++step)
    {
        coupling->timeStep(1e-3);
        coupling->apply();
    }

    REQUIRE(coupling->getLagGridForcingField().isZero());
    REQUIRE(forcing.maxAbs() == 0);
    REQUIRE(coupling->getBodyFlowForces().isZero());
    REQUIRE(coupling->getBodyFlowTorques().isZero());
    REQUIRE(coupling->getGridDeviationErrorL2Norm() == 0);
}

TEST_CASE("flow_interaction_error_decreases_with_stiffness", "[flow_interaction]")
{
    // one marker at (8.5, 8.5); sum of squared kernel weights g = 0.375^2
    const real g = real(0.140625);
    const real dt = 0.01;
    const int num_steps = 800;

    std::vector<real> residuals;
    std::vector<real> deviations;
    for (real stiffness : {-1.0, -4.0, -16.0})
    {
        // critically damped feedback loop
        const real damping = -2 * std::sqrt(-stiffness / g);
        CouplingParameters params = makeParams(2, stiffness, damping, 2);
        params.enable_eulerian_forcing_reset = true;

        body::CosseratRod rod = body::CosseratRod::straightRod(1, Vector3r(8, 8.5, 0), Vector3r(1, 0, 0), 1.0);
        rod.getVelocities().row(0).setOnes();
        grid::EulerianField velocity(2, {16, 16, 1}, 1.0);
        grid::EulerianField forcing(2, {16, 16, 1}, 1.0);

        auto coupling = makeCosseratRodFlowInteraction(rod, RodForcingGridType::ElementCentric, forcing, velocity, params);
        REQUIRE(coupling->getLagGridPositionField()(0, 0) == Approx(8.5));

        for (int step = 0; step < num_steps; ++step)
        {
            coupling->timeStep(dt);
            coupling->apply();
            advanceToyFluid(velocity, forcing, dt);
        }
        residuals.push_back(coupling->getLagGridVelocityMismatchField().col(0).norm());
        deviations.push_back(coupling->getGridDeviationErrorL2Norm());
    }

    REQUIRE(residuals[0] < 0.2);
    REQUIRE(residuals[1] < residuals[0]);
    REQUIRE(residuals[2] < residuals[1]);
    REQUIRE(deviations[1] < deviations[0]);
    REQUIRE(deviations[2] < deviations[1]);
}

TEST_CASE("flow_interaction_call_order_and_reset", "[flow_interaction]")
{
    body::CosseratRod rod = makeSingleElementRod();
    grid::EulerianField velocity(3, {8, 8, 8}, 1.0);
    grid::EulerianField forcing(3, {8, 8, 8}, 1.0);
    CouplingParameters params = makeParams(3, -100.0, -10.0, 1);
    params.start_time = 1.5;

    auto coupling = makeCosseratRodFlowInteraction(rod, RodForcingGridType::Nodal, forcing, velocity, params);
    REQUIRE(coupling->getForcingGrid().getNumLagNodes() == 2);
    REQUIRE(coupling->getTime() == Approx(1.5));

    REQUIRE_THROWS_AS(coupling->apply(), std::logic_error);
    REQUIRE_THROWS_AS(coupling->timeStep(0.0), std::invalid_argument);
    REQUIRE_THROWS_AS(coupling->timeStep(-0.1), std::invalid_argument);

    coupling->timeStep(0.1);
    REQUIRE_THROWS_AS(coupling->timeStep(0.1), std::logic_error);
    coupling->apply();
    coupling->timeStep(0.1);
    coupling->apply();

    REQUIRE(coupling->getTime() == Approx(1.7));
    REQUIRE(coupling->getGridDeviationErrorL2Norm() > 0);

    coupling->reset();
    REQUIRE(coupling->getTime() == Approx(1.5));
    REQUIRE(coupling->getStepCount() == 0);
    REQUIRE(coupling->getGridDeviationErrorL2Norm() == 0);
    REQUIRE(coupling->getLagGridForcingField().isZero());
    REQUIRE_FALSE(coupling->isAwaitingApply());
}

TEST_CASE("flow_interaction_body_leaving_the_domain", "[flow_interaction]")
{
    body::CosseratRod rod = makeSingleElementRod();
    grid::EulerianField velocity(3, {8, 8, 8}, 1.0);
    grid::EulerianField forcing(3, {8, 8, 8}, 1.0);
    auto coupling = makeCosseratRodFlowInteraction(rod, RodForcingGridType::ElementCentric, forcing, velocity,
                                                   makeParams(3, -100.0, -10.0, 1));

    rod.getPositions().row(0).array() += 3.0;
    REQUIRE_THROWS_AS(coupling->timeStep(0.01), OutOfDomainError);
}

TEST_CASE("flow_interaction_rejects_inconsistent_setup", "[flow_interaction]")
{
    body::CosseratRod rod = makeSingleElementRod();
    body::Sphere sphere(Vector3r(4, 4, 4), 1.0);
    grid::EulerianField velocity(3, {8, 8, 8}, 1.0);
    grid::EulerianField forcing(3, {8, 8, 8}, 1.0);

    REQUIRE(parseRodForcingGridType("element_centric") == RodForcingGridType::ElementCentric);
    REQUIRE(parseRodForcingGridType("nodal") == RodForcingGridType::Nodal);
    REQUIRE_THROWS_AS(parseRodForcingGridType("surface"), ConfigurationError);

    SECTION("positive gains")
    {
        const CouplingParameters params = makeParams(3, 100.0, -10.0, 1);
        REQUIRE_THROWS_AS(makeCosseratRodFlowInteraction(rod, RodForcingGridType::Nodal, forcing, velocity, params),
                          ConfigurationError);
    }

    SECTION("kernel wider than the grid")
    {
        grid::EulerianField small_velocity(3, {8, 8, 3}, 1.0);
        grid::EulerianField small_forcing(3, {8, 8, 3}, 1.0);
        const CouplingParameters params = makeParams(3, -100.0, -10.0, 2);
        REQUIRE_THROWS_AS(makeSphereFlowInteraction(sphere, 8, small_forcing, small_velocity, params),
                          ConfigurationError);
    }

    SECTION("mismatched eulerian fields")
    {
        grid::EulerianField coarse_forcing(3, {8, 8, 8}, 2.0);
        grid::EulerianField other_forcing(3, {8, 8, 9}, 1.0);
        const CouplingParameters params = makeParams(3, -100.0, -10.0, 1);
        REQUIRE_THROWS_AS(makeSphereFlowInteraction(sphere, 8, coarse_forcing, velocity, params), ConfigurationError);
        REQUIRE_THROWS_AS(makeSphereFlowInteraction(sphere, 8, other_forcing, velocity, params), ConfigurationError);
    }

    SECTION("body and grid dimension disagree")
    {
        const CouplingParameters params = makeParams(2, -100.0, -10.0, 1);
        grid::EulerianField velocity_2d(2, {8, 8, 1}, 1.0);
        grid::EulerianField forcing_2d(2, {8, 8, 1}, 1.0);
        REQUIRE_THROWS_AS(makeSphereFlowInteraction(sphere, 8, forcing_2d, velocity_2d, params), InvalidGeometryError);
        REQUIRE_THROWS_AS(makeCosseratRodFlowInteraction(rod, RodForcingGridType::ElementCentric, forcing, velocity, params),
                          ConfigurationError);
    }

    SECTION("missing forcing grid")
    {
        const CouplingParameters params = makeParams(3, -100.0, -10.0, 1);
        REQUIRE_THROWS_AS(FlowInteraction(nullptr, forcing, velocity, params), ConfigurationError);
    }
}
