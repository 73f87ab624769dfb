// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#include "catch2/catch.hpp"

#include "VB_Coupler/immersed_body/InterpolationKernel.hpp"
#include "VB_Coupler/common/Exceptions.hpp"

#include <limits>
#include <random>

using namespace vbc;

namespace
{
    MatrixXr randomPositions(int dim, int num_markers, real lo, real hi, unsigned seed)
    {
        std::mt19937 gen(seed);
        std::uniform_real_distribution<real> dist(lo, hi);
        MatrixXr positions(dim, num_markers);
        for (int m = 0; m < num_markers; ++m)
            for (int d = 0; d < dim; ++d)
                positions(d, m) = dist(gen);
        return positions;
    }

    void fillRandom(grid::EulerianField &field, unsigned seed)
    {
        std::mt19937 gen(seed);
        std::uniform_real_distribution<real> dist(-1, 1);
        for (real &v : field.data())
            v = dist(gen);
    }
} // namespace

TEST_CASE("cosine_delta_profile", "[kernel]")
{
    ib::InterpolationKernel kernel(3, 1.0, 2, 0.5, 1);

    REQUIRE(kernel.delta1D(0) == Approx(0.5));
    REQUIRE(kernel.delta1D(1) == Approx(0.25));
    REQUIRE(kernel.delta1D(-1) == Approx(0.25));
    REQUIRE(kernel.delta1D(2) == 0);
    REQUIRE(kernel.delta1D(-2.5) == 0);
    REQUIRE(kernel.getSupportPointsPerDim() == 4);
    REQUIRE(kernel.getSupportSize() == 64);

    // 2w consecutive integer offsets sum to one for any fractional shift
    for (real r : {0.0, 0.1, 0.37, 0.5, 0.99})
    {
        real sum = 0;
        for (int k = -2; k <= 1; ++k)
            sum += kernel.delta1D(r + k);
        REQUIRE(sum == Approx(1.0));
    }
}

TEST_CASE("kernel_partition_of_unity", "[kernel]")
{
    const GridSize grid_size = {16, 12, 10};
    for (int width : {1, 2, 3})
    {
        ib::InterpolationKernel kernel(3, 0.5, width, 0.25, 2);
        const MatrixXr positions = randomPositions(3, 40, 1.75, 3.25, 7u + width);
        kernel.updateLocalSupport(positions, grid_size);

        for (int m = 0; m < kernel.getNumMarkers(); ++m)
            REQUIRE(kernel.computeSupportWeightSum(m) == Approx(1.0).epsilon(1e-10));

        // a uniform field is reproduced exactly
        grid::EulerianField field(3, grid_size, 0.5);
        field.setConstant(Vector3r(1.5, -0.5, 2.0));
        MatrixXr values;
        kernel.interpolateEulerianToLagrangian(field, values);
        REQUIRE(values.rows() == 3);
        REQUIRE(values.cols() == 40);
        for (int m = 0; m < 40; ++m)
        {
            REQUIRE(values(0, m) == Approx(1.5));
            REQUIRE(values(1, m) == Approx(-0.5));
            REQUIRE(values(2, m) == Approx(2.0));
        }
    }
}

TEST_CASE("kernel_spreading_conserves_the_integral", "[kernel]")
{
    const real dx = 0.5;
    ib::InterpolationKernel kernel(2, dx, 2, 0.25, 1);
    grid::EulerianField field(2, {20, 20, 1}, dx);

    MatrixXr positions(2, 2);
    positions << 4.1, 4.3,
        3.7, 5.9;
    MatrixXr values(2, 2);
    values << 1.0, 2.0,
        -3.0, 0.5;

    kernel.spreadLagrangianToEulerian(values, positions, field);
    REQUIRE(field.volumeIntegral(0) == Approx(3.0));
    REQUIRE(field.volumeIntegral(1) == Approx(-2.5));

    // spreading accumulates
    kernel.spreadLagrangianToEulerian(values, field);
    REQUIRE(field.volumeIntegral(0) == Approx(6.0));
}

TEST_CASE("kernel_interpolation_and_spreading_are_adjoint", "[kernel]")
{
    const real dx = 0.5;
    const GridSize grid_size = {14, 14, 14};
    ib::InterpolationKernel kernel(3, dx, 2, 0.25, 3);

    grid::EulerianField velocity(3, grid_size, dx);
    fillRandom(velocity, 11u);
    const MatrixXr positions = randomPositions(3, 25, 2.0, 5.0, 12u);
    MatrixXr forcing = randomPositions(3, 25, -1.0, 1.0, 13u);

    MatrixXr interpolated;
    kernel.interpolateEulerianToLagrangian(velocity, positions, interpolated);
    grid::EulerianField spread(3, grid_size, dx);
    kernel.spreadLagrangianToEulerian(forcing, spread);

    const real lagrangian_product = (interpolated.array() * forcing.array()).sum();
    real eulerian_product = 0;
    for (size_t n = 0; n < spread.data().size(); ++n)
        eulerian_product += spread.data()[n] * velocity.data()[n];
    eulerian_product *= dx * dx * dx;

    REQUIRE(eulerian_product == Approx(lagrangian_product).epsilon(1e-10));
}

TEST_CASE("kernel_spreading_independent_of_thread_count", "[kernel]")
{
    const GridSize grid_size = {12, 12, 12};
    // markers packed close together so their supports overlap heavily
    const MatrixXr positions = randomPositions(3, 60, 4.0, 6.0, 21u);
    const MatrixXr values = randomPositions(3, 60, -1.0, 1.0, 22u);

    grid::EulerianField serial(3, grid_size, 1.0);
    grid::EulerianField threaded(3, grid_size, 1.0);

    ib::InterpolationKernel serial_kernel(3, 1.0, 2, 0.5, 1);
    ib::InterpolationKernel threaded_kernel(3, 1.0, 2, 0.5, 4);
    serial_kernel.spreadLagrangianToEulerian(values, positions, serial);
    threaded_kernel.spreadLagrangianToEulerian(values, positions, threaded);

    REQUIRE(serial.data() == threaded.data());
}

TEST_CASE("kernel_out_of_domain", "[kernel]")
{
    // 8 cells, w = 2: supports must stay within cells 0..7
    ib::InterpolationKernel kernel(2, 1.0, 2, 0.5, 1);
    const GridSize grid_size = {8, 8, 1};

    MatrixXr positions(2, 3);
    positions << 4.0, 2.0, 6.0,
        4.0, 4.0, 4.0;
    REQUIRE_NOTHROW(kernel.updateLocalSupport(positions, grid_size));
    REQUIRE(kernel.getSupportOrigin()(0, 1) == 0);
    REQUIRE(kernel.getSupportOrigin()(0, 2) == 4);

    SECTION("below the lower boundary")
    {
        positions(0, 1) = 1.0;
        try
        {
            kernel.updateLocalSupport(positions, grid_size);
            FAIL("expected OutOfDomainError");
        }
        catch (const OutOfDomainError &e)
        {
            REQUIRE(e.markerIndex() == 1);
        }
    }

    SECTION("beyond the upper boundary")
    {
        positions(1, 2) = 6.5;
        REQUIRE_THROWS_AS(kernel.updateLocalSupport(positions, grid_size), OutOfDomainError);
    }

    SECTION("far outside the grid")
    {
        positions(0, 2) = 1e12;
        REQUIRE_THROWS_AS(kernel.updateLocalSupport(positions, grid_size), OutOfDomainError);
        positions(0, 2) = -1e12;
        REQUIRE_THROWS_AS(kernel.updateLocalSupport(positions, grid_size), OutOfDomainError);
        positions(0, 2) = 6.0;
        positions(1, 0) = std::numeric_limits<real>::max();
        REQUIRE_THROWS_AS(kernel.updateLocalSupport(positions, grid_size), OutOfDomainError);
    }

    SECTION("non finite position")
    {
        positions(0, 0) = std::numeric_limits<real>::quiet_NaN();
        REQUIRE_THROWS_AS(kernel.updateLocalSupport(positions, grid_size), OutOfDomainError);
    }
}

TEST_CASE("kernel_rejects_stale_support_and_bad_setup", "[kernel]")
{
    REQUIRE_THROWS_AS(ib::InterpolationKernel(3, 1.0, 0, 0.5, 1), ConfigurationError);
    REQUIRE_THROWS_AS(ib::InterpolationKernel(3, -1.0, 2, 0.5, 1), ConfigurationError);
    REQUIRE_THROWS_AS(ib::InterpolationKernel(1, 1.0, 2, 0.5, 1), ConfigurationError);
    REQUIRE_THROWS_AS(ib::InterpolationKernel(2, 1.0, 2, 0.5, 0), ConfigurationError);

    ib::InterpolationKernel kernel(2, 1.0, 2, 0.5, 1);
    grid::EulerianField field(2, {10, 10, 1}, 1.0);
    MatrixXr values;
    REQUIRE_THROWS_AS(kernel.interpolateEulerianToLagrangian(field, values), std::logic_error);

    MatrixXr positions = MatrixXr::Constant(2, 2, 5.0);
    kernel.updateLocalSupport(positions, field.getGridSize());
    grid::EulerianField larger(2, {12, 10, 1}, 1.0);
    REQUIRE_THROWS_AS(kernel.interpolateEulerianToLagrangian(larger, values), std::logic_error);
    REQUIRE_THROWS_AS(kernel.spreadLagrangianToEulerian(MatrixXr::Zero(2, 3), field), std::logic_error);
}
