// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#pragma once

#include <stdexcept>
#include <string>

namespace vbc
{
    /**
     * @brief base class of every structured failure raised by the coupling core.
     */
    class CouplingError : public std::runtime_error
    {
    public:
        explicit CouplingError(const std::string &what) : std::runtime_error(what) {}
    };

    // body / forcing grid mismatch detected while building a forcing grid.
    class InvalidGeometryError : public CouplingError
    {
    public:
        explicit InvalidGeometryError(const std::string &what) : CouplingError(what) {}
    };

    // a marker's kernel support left the allocated Eulerian grid.
    class OutOfDomainError : public CouplingError
    {
    public:
        OutOfDomainError(const std::string &what, int marker_index)
            : CouplingError(what), m_marker_index(marker_index) {}

        int markerIndex() const { return m_marker_index; }

    private:
        int m_marker_index;
    };

    class ConfigurationError : public CouplingError
    {
    public:
        explicit ConfigurationError(const std::string &what) : CouplingError(what) {}
    };

} // namespace vbc
