// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/eigen.h>
#include <pybind11/numpy.h>

#include "VB_Coupler/core/FlowInteraction.hpp"
#include "VB_Coupler/common/Exceptions.hpp"
#include "VB_Coupler/utils/Config.hpp"
#include "VB_Coupler/utils/Logger.hpp"
#include "VB_Coupler/utils/Profiler.hpp"

namespace
{
    // (dim, nz, ny, nx) view onto the field storage, kept alive by the field
    pybind11::array_t<vbc::real> fieldView(vbc::grid::EulerianField &field, pybind11::handle owner)
    {
        const auto sz = static_cast<pybind11::ssize_t>(sizeof(vbc::real));
        const pybind11::ssize_t nx = field.getNx(), ny = field.getNy(), nz = field.getNz();
        return pybind11::array_t<vbc::real>(
            {static_cast<pybind11::ssize_t>(field.getDim()), nz, ny, nx},
            {nz * ny * nx * sz, ny * nx * sz, nx * sz, sz},
            field.data().data(), owner);
    }
} // namespace

PYBIND11_MODULE(vb_coupler, m)
{
    m.doc() = "Virtual boundary coupling of immersed bodies to Eulerian flow solvers";

    pybind11::register_exception<vbc::CouplingError>(m, "CouplingError", PyExc_RuntimeError);
    pybind11::register_exception<vbc::InvalidGeometryError>(m, "InvalidGeometryError", PyExc_RuntimeError);
    pybind11::register_exception<vbc::OutOfDomainError>(m, "OutOfDomainError", PyExc_RuntimeError);
    pybind11::register_exception<vbc::ConfigurationError>(m, "ConfigurationError", PyExc_ValueError);

    m.def("init_logger", &vbc::Logger::init,
          pybind11::arg("level") = "info", pybind11::arg("filepath") = "coupling.log",
          "Route library logging to the console and an optional file.");
    m.def("compiled_precision", &vbc::compiledPrecision, "Floating point precision the library was built with.");
    m.def("begin_profiler", [](const std::string &name)
          { PROFILE_SESSION(name); }, pybind11::arg("name"), "Activate the built-in profiler.");
    m.def("end_profiler", []()
          { PROFILE_END_SESSION(); }, "End the profiling session and log results.");

    pybind11::class_<vbc::CouplingParameters>(m, "CouplingParameters")
        .def(pybind11::init<>())
        .def_readwrite("grid_dim", &vbc::CouplingParameters::grid_dim)
        .def_readwrite("stiffness", &vbc::CouplingParameters::stiffness)
        .def_readwrite("damping", &vbc::CouplingParameters::damping)
        .def_readwrite("dx", &vbc::CouplingParameters::dx)
        .def_readwrite("precision", &vbc::CouplingParameters::precision)
        .def_readwrite("num_threads", &vbc::CouplingParameters::num_threads)
        .def_readwrite("interp_kernel_width", &vbc::CouplingParameters::interp_kernel_width)
        .def_readwrite("enable_eulerian_forcing_reset", &vbc::CouplingParameters::enable_eulerian_forcing_reset)
        .def_readwrite("eulerian_grid_coordinate_shift", &vbc::CouplingParameters::eulerian_grid_coordinate_shift)
        .def_readwrite("start_time", &vbc::CouplingParameters::start_time)
        .def_readwrite("log_level", &vbc::CouplingParameters::log_level)
        .def_readwrite("log_file", &vbc::CouplingParameters::log_file)
        .def("validate", &vbc::CouplingParameters::validate);

    pybind11::class_<vbc::Config>(m, "Config")
        .def(pybind11::init<>(), "Default constructor")
        .def("load", &vbc::Config::load, pybind11::arg("filepath"), "Load configuration from a JSON file.")
        .def("load_from_string", &vbc::Config::loadFromString, pybind11::arg("json_text"))
        .def("get_params", &vbc::Config::getParams,
             pybind11::return_value_policy::reference_internal,
             "Get a reference to the loaded coupling parameters.");

    pybind11::class_<vbc::grid::EulerianField>(m, "EulerianField")
        .def(pybind11::init<int, const vbc::GridSize &, vbc::real>(),
             pybind11::arg("grid_dim"), pybind11::arg("grid_size"), pybind11::arg("dx"))
        .def("set_zero", &vbc::grid::EulerianField::setZero)
        .def("set_constant", &vbc::grid::EulerianField::setConstant, pybind11::arg("value"))
        .def("volume_integral", &vbc::grid::EulerianField::volumeIntegral, pybind11::arg("component"))
        .def_property_readonly("grid_size", &vbc::grid::EulerianField::getGridSize)
        .def_property_readonly("dx", &vbc::grid::EulerianField::getDx)
        .def("as_array", [](pybind11::object self)
             { return fieldView(self.cast<vbc::grid::EulerianField &>(), self); },
             "Writable (dim, nz, ny, nx) view of the field data.");

    pybind11::module_ body_m = m.def_submodule("body", "Bodies whose state is advanced by an external integrator");

    pybind11::class_<vbc::body::RigidBody>(body_m, "RigidBody")
        .def_property(
            "position", [](const vbc::body::RigidBody &b)
            { return b.getState().position; },
            [](vbc::body::RigidBody &b, const vbc::Vector3r &v)
            { b.getState().position = v; })
        .def_property(
            "velocity", [](const vbc::body::RigidBody &b)
            { return b.getState().velocity; },
            [](vbc::body::RigidBody &b, const vbc::Vector3r &v)
            { b.getState().velocity = v; })
        .def_property(
            "omega", [](const vbc::body::RigidBody &b)
            { return b.getState().omega; },
            [](vbc::body::RigidBody &b, const vbc::Vector3r &v)
            { b.getState().omega = v; })
        .def_property(
            "director", [](const vbc::body::RigidBody &b)
            { return b.getState().director; },
            [](vbc::body::RigidBody &b, const vbc::Matrix3r &q)
            { b.getState().director = q; });

    pybind11::class_<vbc::body::Sphere, vbc::body::RigidBody>(body_m, "Sphere")
        .def(pybind11::init<const vbc::Vector3r &, vbc::real>(), pybind11::arg("center"), pybind11::arg("radius"))
        .def_property_readonly("radius", &vbc::body::Sphere::getRadius);

    pybind11::class_<vbc::body::Cylinder, vbc::body::RigidBody>(body_m, "Cylinder")
        .def(pybind11::init<const vbc::Vector3r &, vbc::real, vbc::real>(),
             pybind11::arg("center"), pybind11::arg("radius"), pybind11::arg("length"))
        .def_property_readonly("radius", &vbc::body::Cylinder::getRadius)
        .def_property_readonly("length", &vbc::body::Cylinder::getLength);

    pybind11::class_<vbc::body::CosseratRod>(body_m, "CosseratRod")
        .def(pybind11::init<const vbc::Matrix3Xr &>(), pybind11::arg("node_positions"))
        .def_static("straight_rod", &vbc::body::CosseratRod::straightRod,
                    pybind11::arg("n_elems"), pybind11::arg("start"), pybind11::arg("direction"),
                    pybind11::arg("base_length"))
        .def_property_readonly("n_elems", &vbc::body::CosseratRod::getNumElements)
        .def_property(
            "positions", [](const vbc::body::CosseratRod &r)
            { return r.getPositions(); },
            [](vbc::body::CosseratRod &r, const vbc::Matrix3Xr &x)
            { r.getPositions() = x; })
        .def_property(
            "velocities", [](const vbc::body::CosseratRod &r)
            { return r.getVelocities(); },
            [](vbc::body::CosseratRod &r, const vbc::Matrix3Xr &v)
            { r.getVelocities() = v; });

    pybind11::enum_<vbc::RodForcingGridType>(m, "RodForcingGridType")
        .value("ELEMENT_CENTRIC", vbc::RodForcingGridType::ElementCentric)
        .value("NODAL", vbc::RodForcingGridType::Nodal);

    pybind11::class_<vbc::FlowInteraction>(m, "FlowInteraction")
        .def("time_step", &vbc::FlowInteraction::timeStep, pybind11::arg("dt"),
             "Update marker kinematics, interpolate the flow and compute the feedback forcing.")
        .def("apply", &vbc::FlowInteraction::apply,
             "Spread the forcing onto the Eulerian grid and reduce it onto the body.")
        .def("compute_flow_forces_and_torques", &vbc::FlowInteraction::computeFlowForcesAndTorques)
        .def("reset", &vbc::FlowInteraction::reset)
        .def("get_grid_deviation_error_l2_norm", &vbc::FlowInteraction::getGridDeviationErrorL2Norm)
        .def_property_readonly("time", &vbc::FlowInteraction::getTime)
        .def_property_readonly("step_count", &vbc::FlowInteraction::getStepCount)
        .def_property_readonly("lag_grid_position_field", &vbc::FlowInteraction::getLagGridPositionField)
        .def_property_readonly("lag_grid_velocity_field", &vbc::FlowInteraction::getLagGridVelocityField)
        .def_property_readonly("lag_grid_flow_velocity_field", &vbc::FlowInteraction::getLagGridFlowVelocityField)
        .def_property_readonly("lag_grid_velocity_mismatch_field", &vbc::FlowInteraction::getLagGridVelocityMismatchField)
        .def_property_readonly("lag_grid_displacement_error_field", &vbc::FlowInteraction::getLagGridDisplacementErrorField)
        .def_property_readonly("lag_grid_forcing_field", &vbc::FlowInteraction::getLagGridForcingField)
        .def_property_readonly("body_flow_forces", &vbc::FlowInteraction::getBodyFlowForces)
        .def_property_readonly("body_flow_torques", &vbc::FlowInteraction::getBodyFlowTorques);

    // the engine references the body and both fields; keep them alive with it
    m.def("make_sphere_flow_interaction", &vbc::makeSphereFlowInteraction,
          pybind11::arg("sphere"), pybind11::arg("num_forcing_points_along_equator"),
          pybind11::arg("eul_grid_forcing_field"), pybind11::arg("eul_grid_velocity_field"), pybind11::arg("params"),
          pybind11::keep_alive<0, 1>(), pybind11::keep_alive<0, 3>(), pybind11::keep_alive<0, 4>());
    m.def("make_circular_cylinder_flow_interaction", &vbc::makeCircularCylinderFlowInteraction,
          pybind11::arg("cylinder"), pybind11::arg("num_forcing_points"),
          pybind11::arg("eul_grid_forcing_field"), pybind11::arg("eul_grid_velocity_field"), pybind11::arg("params"),
          pybind11::keep_alive<0, 1>(), pybind11::keep_alive<0, 3>(), pybind11::keep_alive<0, 4>());
    m.def("make_cosserat_rod_flow_interaction", &vbc::makeCosseratRodFlowInteraction,
          pybind11::arg("cosserat_rod"), pybind11::arg("forcing_grid_type"),
          pybind11::arg("eul_grid_forcing_field"), pybind11::arg("eul_grid_velocity_field"), pybind11::arg("params"),
          pybind11::keep_alive<0, 1>(), pybind11::keep_alive<0, 3>(), pybind11::keep_alive<0, 4>());
}
