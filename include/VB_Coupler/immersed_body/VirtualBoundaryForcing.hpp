// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#pragma once

#include "VB_Coupler/common/Types.hpp"

namespace vbc
{

    namespace ib
    {
        /**
         * @brief proportional-integral feedback law of the virtual boundary method.
         *
         *   mismatch = v_body - v_flow
         *   forcing  = stiffness * displacement_error + damping * mismatch
         *   displacement_error += mismatch * dt   (after the forcing is evaluated)
         *
         * forcing is the force the fluid exerts on the body at each marker. With
         * both gains non-positive it opposes the body's motion relative to the flow.
         * The stability of the loop depends jointly on the gains and dt and is the
         * caller's responsibility.
         */
        class VirtualBoundaryForcing
        {
        public:
            VirtualBoundaryForcing(real stiffness, real damping, int grid_dim, int num_lag_nodes, int num_threads);

            void computeVelocityMismatch(const MatrixXr &lag_grid_body_velocity, const MatrixXr &lag_grid_flow_velocity);

            // uses the displacement error accumulated so far
            void computeForcing(MatrixXr &lag_grid_forcing) const;

            void advanceDisplacementError(real dt);

            void reset();

            // root mean square of the per-marker displacement error magnitude
            real getDisplacementErrorL2Norm() const;

            real getStiffness() const { return m_stiffness; }
            real getDamping() const { return m_damping; }
            const MatrixXr &getVelocityMismatch() const { return m_velocity_mismatch; }
            const MatrixXr &getDisplacementError() const { return m_displacement_error; }

        private:
            real m_stiffness;
            real m_damping;
            int m_num_threads;
            MatrixXr m_velocity_mismatch;
            MatrixXr m_displacement_error;
        };

    } // namespace ib

} // namespace vbc
