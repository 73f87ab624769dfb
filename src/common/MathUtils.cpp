// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#include "VB_Coupler/common/MathUtils.hpp"
#include "VB_Coupler/utils/Logger.hpp"

#include <algorithm>

namespace vbc
{

    Matrix3r crossProductMatrix(const Vector3r &a)
    {
        Matrix3r A = Matrix3r::Zero();
        A(1, 0) = a.z();
        A(2, 0) = -a.y();
        A(0, 1) = -a.z();
        A(2, 1) = a.x();
        A(0, 2) = a.y();
        A(1, 2) = -a.x();
        return A;
    }

    Matrix3Xr padToThreeDimensions(const MatrixXr &field)
    {
        ASSERT(field.rows() == 2 || field.rows() == 3, "Expected a 2 x N or 3 x N field, got {} rows.", field.rows());
        Matrix3Xr padded = Matrix3Xr::Zero(3, field.cols());
        padded.topRows(field.rows()) = field;
        return padded;
    }

    real maximumConsecutiveSpacing(const Matrix3Xr &points, bool closed)
    {
        const int n = static_cast<int>(points.cols());
        real spacing = 0;
        for (int i = 0; i + 1 < n; ++i)
        {
            spacing = std::max(spacing, (points.col(i + 1) - points.col(i)).norm());
        }
        if (closed && n > 1)
        {
            spacing = std::max(spacing, (points.col(0) - points.col(n - 1)).norm());
        }
        return spacing;
    }

} // namespace vbc
