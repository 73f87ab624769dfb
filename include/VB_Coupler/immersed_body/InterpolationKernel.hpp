// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#pragma once

#include "VB_Coupler/common/Types.hpp"
#include "VB_Coupler/grid/EulerianField.hpp"

namespace vbc
{

    namespace ib
    {
        /**
         * @brief cosine discrete delta kernel transferring fields between Lagrangian markers and Eulerian cells.
         *
         * phi(r) = (1 + cos(pi r / w)) / (2 w) for |r| < w, r in grid cells and w the
         * kernel half-width; multi-dimensional weights are tensor products. Each
         * marker's support is the 2w cells per axis starting at floor((x - shift) / dx) - w + 1.
         *
         * Interpolation and spreading use the same weights (spreading additionally
         * divides by dx^dim), which makes them discrete adjoints.
         *
         * The support is cached by updateLocalSupport() and reused by the overloads
         * without positions; the overloads taking positions refresh it first.
         * An instance owns its scratch buffers, so it must not be shared between
         * concurrently stepped couplings.
         */
        class InterpolationKernel
        {
        public:
            InterpolationKernel(int grid_dim, real dx, int interp_kernel_width,
                                real eul_grid_coord_shift, int num_threads);

            real delta1D(real r) const;

            // throws OutOfDomainError if any marker's support leaves [0, n - 1] along any axis
            void updateLocalSupport(const MatrixXr &lag_positions, const GridSize &grid_size);

            void interpolateEulerianToLagrangian(const grid::EulerianField &eul_field, MatrixXr &lag_values) const;
            void interpolateEulerianToLagrangian(const grid::EulerianField &eul_field,
                                                 const MatrixXr &lag_positions, MatrixXr &lag_values);

            // accumulates into eul_field, contributions of overlapping markers are summed
            void spreadLagrangianToEulerian(const MatrixXr &lag_values, grid::EulerianField &eul_field);
            void spreadLagrangianToEulerian(const MatrixXr &lag_values, const MatrixXr &lag_positions,
                                            grid::EulerianField &eul_field);

            // sum of the interpolation weights of one marker over its support
            real computeSupportWeightSum(int marker) const;

            int getGridDim() const { return m_dim; }
            int getKernelWidth() const { return m_width; }
            int getSupportPointsPerDim() const { return m_points_per_dim; }
            int getSupportSize() const { return m_support_size; }
            int getNumMarkers() const { return m_num_markers; }
            const MatrixXi &getSupportOrigin() const { return m_support_origin; }

        private:
            void checkSupport(const grid::EulerianField &eul_field, long num_values) const;

            // tensor-product weight and cell of support point q of marker m
            real supportWeight(int m, int q, int cell[3]) const;

            int m_dim;
            real m_dx;
            int m_width;
            real m_shift;
            int m_num_threads;

            int m_points_per_dim;
            int m_support_size;

            int m_num_markers = 0;
            GridSize m_support_grid_size = {0, 0, 0};
            MatrixXi m_support_origin; // dim x num_markers, lowest cell index of the support
            MatrixXr m_weights_1d;     // (dim * 2w) x num_markers
            MatrixXr m_spread_weights; // (2w)^dim x num_markers, scratch
        };

    } // namespace ib

} // namespace vbc
