#include "cobra/common/types.hpp"
#include "pybind_utils.hpp"

#include <complex>
#include <cstdint>
#include <map>
#include <span>
#include <string>
#include <vector>

#include <pybind11/complex.h>
#include <pybind11/numpy.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "cobra/cobra.hpp"
#include "cobra/exceptions.hpp"

namespace cobra {
using branch::BranchKind;
using branch::ContinuationBranchData;
using branch::ContinuationObject;
using branch::ContinuationPoint;
using config::ContinuationSettings;
using config::SystemConfig;

namespace py = pybind11;

namespace {

wire::Scalar to_scalar(const py::handle& obj) {
    if (obj.is_none()) {
        return std::monostate{};
    }
    if (py::isinstance<py::str>(obj)) {
        return obj.cast<std::string>();
    }
    if (py::isinstance<py::float_>(obj) || py::isinstance<py::int_>(obj)) {
        return obj.cast<double>();
    }
    return std::monostate{};
}

// None, a [re, im] sequence, or a {"re": .., "im": ..} mapping.
wire::RawEigenvalue to_raw_eigenvalue(const py::handle& obj) {
    if (py::isinstance<py::dict>(obj)) {
        const auto record = obj.cast<py::dict>();
        return wire::StructuredEigenvalue{
            .re = record.contains("re") ? to_scalar(record["re"])
                                        : wire::Scalar{},
            .im = record.contains("im") ? to_scalar(record["im"])
                                        : wire::Scalar{}};
    }
    if (py::isinstance<py::list>(obj) || py::isinstance<py::tuple>(obj)) {
        std::vector<wire::Scalar> tuple;
        for (const auto& item : obj) {
            tuple.push_back(to_scalar(item));
        }
        return tuple;
    }
    return std::monostate{};
}

std::vector<std::int64_t> index_values(const ContinuationBranchData& data) {
    return branch::logical_values(data.indices);
}

} // namespace

PYBIND11_MODULE(libcobra, m) {
    m.doc() = "Python bindings for the cobra continuation library";

    py::register_exception<ValidationError>(m, "ValidationError",
                                            PyExc_ValueError);
    py::register_exception<EngineError>(m, "EngineError",
                                        PyExc_RuntimeError);

    m.def("is_valid_name", &is_valid_name, py::arg("name"));
    m.def("validate_name", &validate_name, py::arg("name"));
    m.def("compute_batch_size", &jobs::compute_batch_size,
          py::arg("max_steps"));

    py::enum_<Direction>(m, "Direction")
        .value("FORWARD", Direction::kForward)
        .value("BACKWARD", Direction::kBackward);

    auto m_branch = m.def_submodule("branch", "Branch data model submodule");
    py::enum_<BranchKind>(m_branch, "BranchKind")
        .value("EQUILIBRIUM", BranchKind::kEquilibrium)
        .value("LIMIT_CYCLE", BranchKind::kLimitCycle)
        .value("HOMOCLINIC_CURVE", BranchKind::kHomoclinicCurve)
        .value("HOMOTOPY_SADDLE_CURVE", BranchKind::kHomotopySaddleCurve)
        .value("FOLD_CURVE", BranchKind::kFoldCurve)
        .value("HOPF_CURVE", BranchKind::kHopfCurve)
        .value("LPC_CURVE", BranchKind::kLPCCurve)
        .value("PD_CURVE", BranchKind::kPDCurve)
        .value("NS_CURVE", BranchKind::kNSCurve)
        .value("ISOCHRONE_CURVE", BranchKind::kIsochroneCurve);

    py::class_<ContinuationPoint>(m_branch, "ContinuationPoint")
        .def(py::init<>())
        .def_readwrite("state", &ContinuationPoint::state)
        .def_readwrite("param_value", &ContinuationPoint::param_value)
        .def_readwrite("param2_value", &ContinuationPoint::param2_value)
        .def_readwrite("eigenvalues", &ContinuationPoint::eigenvalues)
        .def_readwrite("auxiliary", &ContinuationPoint::auxiliary)
        .def_property(
            "stability",
            [](const ContinuationPoint& p) {
                return std::string(branch::to_string(p.stability));
            },
            [](ContinuationPoint& p, const std::string& tag) {
                p.stability = branch::parse_bifurcation_type(tag);
            });

    py::class_<ContinuationBranchData>(m_branch, "ContinuationBranchData")
        .def(py::init<>())
        .def_readwrite("points", &ContinuationBranchData::points)
        .def_property(
            "indices", &index_values,
            [](ContinuationBranchData& d, const std::vector<std::int64_t>& v) {
                d.indices = branch::to_logical(v);
            })
        .def_property(
            "bifurcations",
            [](const ContinuationBranchData& d) {
                std::vector<SizeType> values;
                values.reserve(d.bifurcations.size());
                for (const auto& idx : d.bifurcations) {
                    values.push_back(idx.value);
                }
                return values;
            },
            [](ContinuationBranchData& d, const std::vector<SizeType>& v) {
                d.bifurcations.clear();
                for (const auto idx : v) {
                    d.bifurcations.push_back(ArrayIndex{idx});
                }
            })
        .def_property_readonly(
            "states",
            [](const ContinuationBranchData& d) {
                std::vector<std::vector<double>> rows;
                rows.reserve(d.points.size());
                for (const auto& p : d.points) {
                    rows.push_back(p.state);
                }
                return python::rows_to_numpy(rows);
            })
        .def_property_readonly(
            "min_seed_index",
            [](const ContinuationBranchData& d) -> std::optional<std::int64_t> {
                if (!d.resume_state || !d.resume_state->min_index_seed) {
                    return std::nullopt;
                }
                return d.resume_state->min_index_seed->endpoint_index.value;
            })
        .def_property_readonly(
            "max_seed_index",
            [](const ContinuationBranchData& d) -> std::optional<std::int64_t> {
                if (!d.resume_state || !d.resume_state->max_index_seed) {
                    return std::nullopt;
                }
                return d.resume_state->max_index_seed->endpoint_index.value;
            })
        .def("__len__", &ContinuationBranchData::size)
        .def("is_consistent", &branch::is_consistent);

    py::class_<ContinuationSettings>(m_branch, "ContinuationSettings")
        .def(py::init<>())
        .def_readwrite("step_size", &ContinuationSettings::step_size)
        .def_readwrite("min_step_size", &ContinuationSettings::min_step_size)
        .def_readwrite("max_step_size", &ContinuationSettings::max_step_size)
        .def_readwrite("max_steps", &ContinuationSettings::max_steps)
        .def_readwrite("corrector_steps",
                       &ContinuationSettings::corrector_steps)
        .def_readwrite("corrector_tolerance",
                       &ContinuationSettings::corrector_tolerance)
        .def_readwrite("step_tolerance", &ContinuationSettings::step_tolerance)
        .def("sanitized", &ContinuationSettings::sanitized)
        .def("validate", &ContinuationSettings::validate);
    m_branch.def("default_settings", &config::default_settings,
                 py::arg("kind"));

    py::class_<ContinuationObject>(m_branch, "ContinuationObject")
        .def(py::init<>())
        .def_readwrite("name", &ContinuationObject::name)
        .def_readwrite("system_name", &ContinuationObject::system_name)
        .def_readwrite("parameter_name", &ContinuationObject::parameter_name)
        .def_readwrite("parent_object", &ContinuationObject::parent_object)
        .def_readwrite("start_object", &ContinuationObject::start_object)
        .def_readwrite("branch_kind", &ContinuationObject::branch_kind)
        .def_readwrite("data", &ContinuationObject::data)
        .def_readwrite("settings", &ContinuationObject::settings)
        .def_readwrite("params", &ContinuationObject::params)
        .def_readwrite("map_iterations", &ContinuationObject::map_iterations)
        .def("describe", &branch::describe_branch);

    m_branch.def("format_number", &branch::format_number, py::arg("value"));
    m_branch.def(
        "interpret_lc_stability",
        [](const std::vector<std::complex<double>>& multipliers) {
            return branch::interpret_lc_stability(multipliers);
        },
        py::arg("multipliers"));

    auto m_wire = m.def_submodule("wire", "Engine wire codec submodule");
    m_wire.def(
        "normalize_eigenvalue_array",
        [](const py::object& raw) {
            if (raw.is_none()) {
                return wire::normalize_eigenvalue_array(std::nullopt);
            }
            std::vector<wire::RawEigenvalue> entries;
            for (const auto& item : raw) {
                entries.push_back(to_raw_eigenvalue(item));
            }
            return wire::normalize_eigenvalue_array(entries);
        },
        py::arg("raw"));

    auto m_seeds = m.def_submodule("seeds", "Seed derivation submodule");
    m_seeds.def(
        "discard_initial_approximation_point",
        [](const ContinuationBranchData& data, Direction side,
           std::optional<double> step_hint) {
            return seeds::discard_initial_approximation_point(
                data, {.side = side, .step_hint = step_hint});
        },
        py::arg("data"), py::arg("side") = Direction::kForward,
        py::arg("step_hint") = std::nullopt);
    m_seeds.def(
        "augmented_state",
        [](const ContinuationPoint& point) {
            return python::to_numpy(seeds::augmented_state(point));
        },
        py::arg("point"));

    auto m_params = m.def_submodule("params", "Parameter resolution submodule");
    py::enum_<config::SystemType>(m_params, "SystemType")
        .value("FLOW", config::SystemType::kFlow)
        .value("MAP", config::SystemType::kMap);
    py::class_<SystemConfig>(m_params, "SystemConfig")
        .def(py::init<>())
        .def_readwrite("name", &SystemConfig::name)
        .def_readwrite("equations", &SystemConfig::equations)
        .def_readwrite("params", &SystemConfig::params)
        .def_readwrite("param_names", &SystemConfig::param_names)
        .def_readwrite("var_names", &SystemConfig::var_names)
        .def_readwrite("solver", &SystemConfig::solver)
        .def_readwrite("type", &SystemConfig::type)
        .def("validate", [](const SystemConfig& system) {
            return config::validate_system(system).errors;
        });
    m_params.def(
        "get_branch_params",
        [](const SystemConfig& system, const ContinuationObject& branch) {
            return python::to_numpy(
                params::get_branch_params(system, branch, nullptr));
        },
        py::arg("system"), py::arg("branch"));
    m_params.def(
        "resolve_point_params",
        [](const SystemConfig& system, const ContinuationObject& branch,
           SizeType point) {
            require(point < branch.data.size(), "Select a valid branch point.");
            return python::to_numpy(params::resolve_point_params(
                system, branch,
                branch::point_at(branch.data, ArrayIndex{point}), nullptr));
        },
        py::arg("system"), py::arg("branch"), py::arg("point"));

    py::class_<params::SubsystemSnapshot>(m_params, "SubsystemSnapshot")
        .def_readonly("free_variable_names",
                      &params::SubsystemSnapshot::free_variable_names)
        .def_readonly("frozen_param_names_by_var",
                      &params::SubsystemSnapshot::frozen_param_names_by_var)
        .def_readonly("hash", &params::SubsystemSnapshot::hash);
    m_params.def(
        "build_subsystem_snapshot",
        [](const SystemConfig& system,
           const std::map<std::string, double>& frozen) {
            return params::build_subsystem_snapshot(
                system, params::FrozenVariables{.values_by_var = frozen});
        },
        py::arg("system"), py::arg("frozen"));
    m_params.def(
        "project_state_to_reduced",
        [](const params::SubsystemSnapshot& snapshot,
           const python::PyArrayT<double>& state) {
            return python::to_numpy(
                params::project_state_to_reduced(snapshot, python::as_span(state)));
        },
        py::arg("snapshot"), py::arg("state"));
    m_params.def(
        "embed_reduced_state",
        [](const params::SubsystemSnapshot& snapshot,
           const python::PyArrayT<double>& state) {
            return python::to_numpy(
                params::embed_reduced_state(snapshot, python::as_span(state)));
        },
        py::arg("snapshot"), py::arg("state"));
}
} // namespace cobra
