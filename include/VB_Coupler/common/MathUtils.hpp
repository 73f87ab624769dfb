// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#pragma once

#include "VB_Coupler/common/Types.hpp"

namespace vbc
{

    // [a]_x such that [a]_x * b = a x b
    Matrix3r crossProductMatrix(const Vector3r &a);

    // embeds the first rows of a 2 x N or 3 x N block into 3 x N, zero-filling z
    Matrix3Xr padToThreeDimensions(const MatrixXr &field);

    // largest distance between consecutive columns, optionally wrapping around
    real maximumConsecutiveSpacing(const Matrix3Xr &points, bool closed);

} // namespace vbc
