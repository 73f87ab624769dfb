// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#pragma once

#include "VB_Coupler/common/Types.hpp"

namespace vbc
{

    namespace body
    {
        /**
         * @brief nodal kinematic state of a discretized Cosserat rod.
         *
         * n_elems elements connect n_elems + 1 nodes. Nodal quantities are stored
         * as columns of 3 x (n_elems + 1) matrices, elemental ones as 3 x n_elems.
         * The rod is advanced by an external integrator; the coupling only reads it.
         */
        class CosseratRod
        {
        public:
            explicit CosseratRod(const Matrix3Xr &node_positions);

            // straight rod of equal elements from start along direction
            static CosseratRod straightRod(int n_elems, const Vector3r &start, const Vector3r &direction,
                                           real base_length);

            int getNumElements() const { return m_num_elems; }
            int getNumNodes() const { return m_num_elems + 1; }

            const Matrix3Xr &getPositions() const { return m_positions; }
            Matrix3Xr &getPositions() { return m_positions; }
            const Matrix3Xr &getVelocities() const { return m_velocities; }
            Matrix3Xr &getVelocities() { return m_velocities; }

            // element midpoints and the average of the two node velocities
            Matrix3Xr computeElementPositions() const;
            Matrix3Xr computeElementVelocities() const;
            VectorXr computeElementLengths() const;

        private:
            int m_num_elems;
            Matrix3Xr m_positions;
            Matrix3Xr m_velocities;
        };

    } // namespace body

} // namespace vbc
