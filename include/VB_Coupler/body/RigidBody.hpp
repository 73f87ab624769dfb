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
         * @brief kinematic state of a rigid body, advanced by an external integrator.
         *
         * director rows are the body frame axes expressed in the lab frame, so
         * lab = director^T * local. omega is expressed in the body frame.
         */
        struct RigidBodyState
        {
            Vector3r position = Vector3r::Zero();
            Vector3r velocity = Vector3r::Zero();
            Vector3r omega = Vector3r::Zero();
            Matrix3r director = Matrix3r::Identity();
        };

        class RigidBody
        {
        public:
            virtual ~RigidBody() = default;

            const RigidBodyState &getState() const { return m_state; }
            RigidBodyState &getState() { return m_state; }

            const Vector3r &getCenterOfMass() const { return m_state.position; }
            const Vector3r &getVelocity() const { return m_state.velocity; }
            const Matrix3r &getDirector() const { return m_state.director; }

            Vector3r getAngularVelocityInLabFrame() const
            {
                return m_state.director.transpose() * m_state.omega;
            }

        protected:
            explicit RigidBody(const Vector3r &center)
            {
                m_state.position = center;
            }

            RigidBodyState m_state;
        };

        class Sphere : public RigidBody
        {
        public:
            Sphere(const Vector3r &center, real radius)
                : RigidBody(center), m_radius(radius) {}

            real getRadius() const { return m_radius; }

        private:
            real m_radius;
        };

        // circular cylinder, axis along the body frame's third director
        class Cylinder : public RigidBody
        {
        public:
            Cylinder(const Vector3r &center, real radius, real length)
                : RigidBody(center), m_radius(radius), m_length(length) {}

            real getRadius() const { return m_radius; }
            real getLength() const { return m_length; }

        private:
            real m_radius;
            real m_length;
        };

    } // namespace body

} // namespace vbc
