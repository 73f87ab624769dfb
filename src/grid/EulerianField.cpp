// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#include "VB_Coupler/grid/EulerianField.hpp"
#include "VB_Coupler/common/Exceptions.hpp"
#include "VB_Coupler/utils/Logger.hpp"

#include <algorithm>
#include <cmath>

namespace vbc
{

    namespace grid
    {

        EulerianField::EulerianField(int grid_dim, const GridSize &grid_size, real dx)
            : m_dim(grid_dim), m_grid_size(grid_size), m_dx(dx)
        {
            if (grid_dim != 2 && grid_dim != 3)
            {
                LOG_CRITICAL("EulerianField supports 2D and 3D grids only, got dim {}.", grid_dim);
                throw ConfigurationError("Invalid Eulerian grid dimension.");
            }
            if (grid_dim == 2)
            {
                m_grid_size[2] = 1;
            }
            for (int d = 0; d < grid_dim; ++d)
            {
                if (m_grid_size[d] < 1)
                {
                    LOG_CRITICAL("Eulerian grid size along axis {} must be positive, got {}.", d, m_grid_size[d]);
                    throw ConfigurationError("Invalid Eulerian grid size.");
                }
            }
            if (!(dx > 0))
            {
                LOG_CRITICAL("Eulerian grid spacing must be positive, got {}.", dx);
                throw ConfigurationError("Invalid Eulerian grid spacing.");
            }

            m_num_cells = static_cast<long>(m_grid_size[0]) * m_grid_size[1] * m_grid_size[2];
            m_data.assign(static_cast<size_t>(m_num_cells) * m_dim, real(0));

            LOG_DEBUG("Created {}D EulerianField with grid size {}x{}x{}, dx {}", m_dim,
                      m_grid_size[0], m_grid_size[1], m_grid_size[2], m_dx);
        }

        void EulerianField::setZero()
        {
            std::fill(m_data.begin(), m_data.end(), real(0));
        }

        void EulerianField::setConstant(const VectorXr &value)
        {
            ASSERT(value.size() == m_dim, "Constant value has {} components, field has {}.", value.size(), m_dim);
            for (int c = 0; c < m_dim; ++c)
            {
                std::fill(componentData(c), componentData(c) + m_num_cells, value[c]);
            }
        }

        real EulerianField::volumeIntegral(int component) const
        {
            const real *values = componentData(component);
            real sum = 0;
            for (long n = 0; n < m_num_cells; ++n)
            {
                sum += values[n];
            }
            return sum * std::pow(m_dx, m_dim);
        }

        real EulerianField::maxAbs() const
        {
            real result = 0;
            for (const real v : m_data)
            {
                result = std::max(result, std::abs(v));
            }
            return result;
        }

        bool EulerianField::hasSameShape(const EulerianField &other) const
        {
            return m_dim == other.m_dim && m_grid_size == other.m_grid_size && m_dx == other.m_dx;
        }

    } // namespace grid

} // namespace vbc
