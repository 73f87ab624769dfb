// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#include "VB_Coupler/body/CosseratRod.hpp"
#include "VB_Coupler/common/Exceptions.hpp"
#include "VB_Coupler/utils/Logger.hpp"

namespace vbc
{

    namespace body
    {

        CosseratRod::CosseratRod(const Matrix3Xr &node_positions)
            : m_num_elems(static_cast<int>(node_positions.cols()) - 1),
              m_positions(node_positions)
        {
            if (node_positions.cols() < 1)
            {
                LOG_CRITICAL("CosseratRod needs at least one node position.");
                throw InvalidGeometryError("Cosserat rod without nodes.");
            }
            m_velocities = Matrix3Xr::Zero(3, m_num_elems + 1);
        }

        CosseratRod CosseratRod::straightRod(int n_elems, const Vector3r &start, const Vector3r &direction,
                                             real base_length)
        {
            if (n_elems < 0)
            {
                LOG_CRITICAL("Cannot build a straight rod with {} elements.", n_elems);
                throw InvalidGeometryError("Negative number of rod elements.");
            }
            const Vector3r unit_direction = direction.normalized();
            Matrix3Xr positions(3, n_elems + 1);
            for (int n = 0; n <= n_elems; ++n)
            {
                const real s = n_elems > 0 ? base_length * n / n_elems : real(0);
                positions.col(n) = start + s * unit_direction;
            }
            return CosseratRod(positions);
        }

        Matrix3Xr CosseratRod::computeElementPositions() const
        {
            return real(0.5) * (m_positions.rightCols(m_num_elems) + m_positions.leftCols(m_num_elems));
        }

        Matrix3Xr CosseratRod::computeElementVelocities() const
        {
            return real(0.5) * (m_velocities.rightCols(m_num_elems) + m_velocities.leftCols(m_num_elems));
        }

        VectorXr CosseratRod::computeElementLengths() const
        {
            return (m_positions.rightCols(m_num_elems) - m_positions.leftCols(m_num_elems)).colwise().norm().transpose();
        }

    } // namespace body

} // namespace vbc
