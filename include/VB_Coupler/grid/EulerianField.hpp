// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#pragma once

#include "VB_Coupler/common/Types.hpp"
#include <vector>

namespace vbc
{

    namespace grid
    {

        /**
         * @brief dense vector field on a uniform 2D or 3D grid, one component per spatial dimension.
         *
         * Component-major storage, x fastest within a component:
         * data[c * num_cells + (k * ny + j) * nx + i].
         */
        class EulerianField
        {
        public:
            EulerianField(int grid_dim, const GridSize &grid_size, real dx);
            ~EulerianField() = default;

            void setZero();
            void setConstant(const VectorXr &value);

            int getDim() const { return m_dim; }
            int getNx() const { return m_grid_size[0]; }
            int getNy() const { return m_grid_size[1]; }
            int getNz() const { return m_grid_size[2]; }
            const GridSize &getGridSize() const { return m_grid_size; }
            long getNumCells() const { return m_num_cells; }
            real getDx() const { return m_dx; }

            long linearIndex(int i, int j, int k = 0) const
            {
                return (static_cast<long>(k) * m_grid_size[1] + j) * m_grid_size[0] + i;
            }

            real &operator()(int component, int i, int j, int k = 0)
            {
                return m_data[component * m_num_cells + linearIndex(i, j, k)];
            }
            real operator()(int component, int i, int j, int k = 0) const
            {
                return m_data[component * m_num_cells + linearIndex(i, j, k)];
            }

            real *componentData(int component) { return m_data.data() + component * m_num_cells; }
            const real *componentData(int component) const { return m_data.data() + component * m_num_cells; }

            std::vector<real> &data() { return m_data; }
            const std::vector<real> &data() const { return m_data; }

            // sum of one component over every cell, times the cell volume dx^dim
            real volumeIntegral(int component) const;
            real maxAbs() const;

            bool hasSameShape(const EulerianField &other) const;

        private:
            int m_dim;
            GridSize m_grid_size;
            long m_num_cells;
            real m_dx;
            std::vector<real> m_data;
        };

    } // namespace grid

} // namespace vbc
