// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#include "catch2/catch.hpp"

#include "VB_Coupler/grid/EulerianField.hpp"
#include "VB_Coupler/common/Exceptions.hpp"

using namespace vbc;

TEST_CASE("eulerian_field_layout", "[grid]")
{
    SECTION("2d grids have a single z layer")
    {
        grid::EulerianField field(2, {6, 4, 9}, 0.5);
        REQUIRE(field.getNz() == 1);
        REQUIRE(field.getNumCells() == 24);
        REQUIRE(field.data().size() == 48);
    }

    SECTION("component major, x fastest")
    {
        grid::EulerianField field(3, {4, 5, 6}, 1.0);
        field(1, 2, 3, 4) = 7.0;
        const long expected = field.getNumCells() + (4 * 5 + 3) * 4 + 2;
        REQUIRE(field.data()[expected] == 7.0);
        REQUIRE(field.componentData(1)[field.linearIndex(2, 3, 4)] == 7.0);
    }
}

TEST_CASE("eulerian_field_reductions", "[grid]")
{
    grid::EulerianField field(3, {4, 5, 6}, 0.5);
    field.setConstant(Vector3r(1, -2, 3));

    REQUIRE(field.volumeIntegral(0) == Approx(120 * 0.125));
    REQUIRE(field.volumeIntegral(1) == Approx(-2 * 120 * 0.125));
    REQUIRE(field.maxAbs() == Approx(3.0));

    field.setZero();
    REQUIRE(field.maxAbs() == 0);

    grid::EulerianField same(3, {4, 5, 6}, 0.5);
    grid::EulerianField other(3, {4, 5, 7}, 0.5);
    REQUIRE(field.hasSameShape(same));
    REQUIRE_FALSE(field.hasSameShape(other));
}

TEST_CASE("eulerian_field_rejects_bad_setup", "[grid]")
{
    REQUIRE_THROWS_AS(grid::EulerianField(4, {4, 4, 4}, 1.0), ConfigurationError);
    REQUIRE_THROWS_AS(grid::EulerianField(3, {4, 0, 4}, 1.0), ConfigurationError);
    REQUIRE_THROWS_AS(grid::EulerianField(2, {4, 4, 1}, 0.0), ConfigurationError);
    // nz is ignored in 2D
    REQUIRE_NOTHROW(grid::EulerianField(2, {4, 4, 0}, 1.0));
}
