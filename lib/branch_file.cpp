#include "cobra/io/branch_file.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <limits>
#include <stdexcept>

#include <hdf5.h>
#include <highfive/highfive.hpp>
#include <spdlog/spdlog.h>

#include "cobra/branch/branch_type.hpp"
#include "cobra/branch/continuation_kind.hpp"
#include "cobra/branch/point.hpp"
#include "cobra/exceptions.hpp"

namespace cobra::io {

namespace {

constexpr std::string_view kFormatVersion = "1.0.0-cpp";
constexpr auto kNaN = std::numeric_limits<double>::quiet_NaN();

HighFive::DataSetCreateProps compressed_props(std::vector<hsize_t> chunk) {
    HighFive::DataSetCreateProps props;
    props.add(HighFive::Chunking(chunk));
    props.add(HighFive::Deflate(9));
    return props;
}

// Writes a row-major (dims...) block of doubles. Empty blocks get no
// chunking, HDF5 rejects zero-sized chunks.
void write_block(HighFive::Group& group,
                 const std::string& name,
                 const std::vector<SizeType>& dims,
                 const std::vector<double>& flat) {
    HighFive::DataSpace space(dims);
    const bool empty = flat.empty();
    HighFive::DataSetCreateProps props;
    if (!empty) {
        std::vector<hsize_t> chunk(dims.begin(), dims.end());
        chunk[0] = static_cast<hsize_t>(std::min<SizeType>(1024, dims[0]));
        props = compressed_props(chunk);
    }
    auto dataset = group.createDataSet(name, space,
                                       HighFive::create_datatype<double>(),
                                       props);
    if (!empty) {
        dataset.write_raw(flat.data(), HighFive::create_datatype<double>());
    }
}

std::vector<double> read_block(const HighFive::DataSet& dataset) {
    const auto dims  = dataset.getDimensions();
    SizeType count   = 1;
    for (const auto dim : dims) {
        count *= dim;
    }
    std::vector<double> flat(count);
    if (count > 0) {
        dataset.read_raw(flat.data(), HighFive::create_datatype<double>());
    }
    return flat;
}

void write_branch_type(HighFive::Group& group, const branch::BranchType& type) {
    group.createAttribute("branch_type", std::string(branch::kind_name(type)));
    if (const auto mesh = branch::mesh(type)) {
        group.createAttribute("mesh", std::vector<SizeType>{mesh->ntst,
                                                            mesh->ncol});
    }
    if (const auto p1 = branch::param1_name(type)) {
        group.createAttribute("param1_name", *p1);
    }
    if (const auto p2 = branch::param2_name(type)) {
        group.createAttribute("param2_name", *p2);
    }
    if (const auto* homoc = std::get_if<branch::HomoclinicCurve>(&type)) {
        group.createAttribute(
            "free_flags",
            std::vector<int>{homoc->free_time ? 1 : 0, homoc->free_eps0 ? 1 : 0,
                             homoc->free_eps1 ? 1 : 0});
    }
    if (const auto* homotopy =
            std::get_if<branch::HomotopySaddleCurve>(&type)) {
        group.createAttribute("stage",
                              std::string(branch::to_string(homotopy->stage)));
    }
}

template <typename T>
T read_attribute_or(const HighFive::Group& group,
                    const std::string& name,
                    T fallback) {
    if (!group.hasAttribute(name)) {
        return fallback;
    }
    return group.getAttribute(name).read<T>();
}

std::optional<branch::BranchType> read_branch_type(const HighFive::Group& group) {
    if (!group.hasAttribute("branch_type")) {
        return std::nullopt;
    }
    const auto tag  = group.getAttribute("branch_type").read<std::string>();
    const auto mesh = read_attribute_or<std::vector<SizeType>>(
        group, "mesh", {branch::kDefaultLimitCycleMesh.ntst,
                        branch::kDefaultLimitCycleMesh.ncol});
    error_check::check_equal(mesh.size(), 2U, "mesh attribute must hold 2 values");
    const auto p1 = read_attribute_or<std::string>(group, "param1_name", "");
    const auto p2 = read_attribute_or<std::string>(group, "param2_name", "");
    const branch::CycleCurveFields fields{
        .param1_name = p1, .param2_name = p2, .ntst = mesh[0], .ncol = mesh[1]};

    if (tag == "Equilibrium") {
        return branch::Equilibrium{};
    }
    if (tag == "LimitCycle") {
        return branch::LimitCycle{.ntst = mesh[0], .ncol = mesh[1]};
    }
    if (tag == "HomoclinicCurve") {
        const auto flags =
            read_attribute_or<std::vector<int>>(group, "free_flags", {0, 1, 1});
        error_check::check_equal(flags.size(), 3U,
                                 "free_flags attribute must hold 3 values");
        return branch::HomoclinicCurve{.ntst        = mesh[0],
                                       .ncol        = mesh[1],
                                       .param1_name = p1,
                                       .param2_name = p2,
                                       .free_time   = flags[0] != 0,
                                       .free_eps0   = flags[1] != 0,
                                       .free_eps1   = flags[2] != 0};
    }
    if (tag == "HomotopySaddleCurve") {
        const auto stage = branch::parse_homotopy_stage(
            read_attribute_or<std::string>(group, "stage", "StageA"));
        return branch::HomotopySaddleCurve{
            .ntst        = mesh[0],
            .ncol        = mesh[1],
            .param1_name = p1,
            .param2_name = p2,
            .stage       = stage.value_or(branch::HomotopyStage::kStageA)};
    }
    if (tag == "FoldCurve") {
        return branch::FoldCurve{.param1_name = p1, .param2_name = p2};
    }
    if (tag == "HopfCurve") {
        return branch::HopfCurve{.param1_name = p1, .param2_name = p2};
    }
    if (tag == "LPCCurve") {
        return branch::LPCCurve{fields};
    }
    if (tag == "PDCurve") {
        return branch::PDCurve{fields};
    }
    if (tag == "NSCurve") {
        return branch::NSCurve{fields};
    }
    if (tag == "IsochroneCurve") {
        return branch::IsochroneCurve{fields};
    }
    spdlog::warn("Unknown branch type '{}' in branch file, dropping it", tag);
    return std::nullopt;
}

void write_settings(HighFive::Group& group,
                    const config::ContinuationSettings& settings) {
    auto settings_group = group.createGroup("settings");
    settings_group.createAttribute("step_size", settings.step_size);
    settings_group.createAttribute("min_step_size", settings.min_step_size);
    settings_group.createAttribute("max_step_size", settings.max_step_size);
    settings_group.createAttribute("max_steps", settings.max_steps);
    settings_group.createAttribute("corrector_steps", settings.corrector_steps);
    settings_group.createAttribute("corrector_tolerance",
                                   settings.corrector_tolerance);
    settings_group.createAttribute("step_tolerance", settings.step_tolerance);
}

config::ContinuationSettings read_settings(const HighFive::Group& group) {
    config::ContinuationSettings settings;
    if (!group.exist("settings")) {
        return settings;
    }
    const auto sg = group.getGroup("settings");
    settings.step_size = read_attribute_or(sg, "step_size", settings.step_size);
    settings.min_step_size =
        read_attribute_or(sg, "min_step_size", settings.min_step_size);
    settings.max_step_size =
        read_attribute_or(sg, "max_step_size", settings.max_step_size);
    settings.max_steps = read_attribute_or(sg, "max_steps", settings.max_steps);
    settings.corrector_steps =
        read_attribute_or(sg, "corrector_steps", settings.corrector_steps);
    settings.corrector_tolerance = read_attribute_or(
        sg, "corrector_tolerance", settings.corrector_tolerance);
    settings.step_tolerance =
        read_attribute_or(sg, "step_tolerance", settings.step_tolerance);
    return settings;
}

} // namespace

BranchFileWriter::BranchFileWriter(std::filesystem::path filename, Mode mode)
    : m_filepath(std::move(filename)),
      m_mode(mode) {}

void BranchFileWriter::write_branch(const branch::ContinuationObject& branch) {
    std::lock_guard<std::mutex> lock(m_hdf5_mutex);

    HighFive::File file    = open_file();
    HighFive::Group groups = open_branches_group(file);
    if (groups.exist(branch.name)) {
        throw std::runtime_error(
            std::format("Branch {} already exists in {}.", branch.name,
                        m_filepath.string()));
    }
    HighFive::Group group = groups.createGroup(branch.name);
    const auto& points    = branch.data.points;
    const SizeType n      = points.size();

    SizeType dim = 0;
    SizeType k   = 0;
    for (const auto& point : points) {
        dim = std::max(dim, point.state.size());
        k   = std::max(k, point.eigenvalues.size());
    }

    std::vector<double> states(n * dim, kNaN);
    std::vector<SizeType> state_sizes(n);
    std::vector<double> eigenvalues(n * k * 2, kNaN);
    std::vector<double> param_values(n);
    std::vector<double> param2_values(n, kNaN);
    std::vector<std::string> stability(n);
    for (SizeType i = 0; i < n; ++i) {
        const auto& point = points[i];
        std::ranges::copy(point.state, states.begin() +
                                           static_cast<IndexType>(i * dim));
        state_sizes[i] = point.state.size();
        for (SizeType j = 0; j < point.eigenvalues.size(); ++j) {
            eigenvalues[(i * k + j) * 2]     = point.eigenvalues[j].real();
            eigenvalues[(i * k + j) * 2 + 1] = point.eigenvalues[j].imag();
        }
        param_values[i]  = point.param_value;
        param2_values[i] = point.param2_value.value_or(kNaN);
        stability[i]     = std::string(branch::to_string(point.stability));
    }
    std::vector<std::int64_t> bifurcations;
    bifurcations.reserve(branch.data.bifurcations.size());
    for (const auto& idx : branch.data.bifurcations) {
        bifurcations.push_back(static_cast<std::int64_t>(idx.value));
    }

    write_block(group, "states", {n, dim}, states);
    write_block(group, "eigenvalues", {n, k, 2}, eigenvalues);
    group.createDataSet("state_sizes", state_sizes);
    group.createDataSet("param_values", param_values);
    group.createDataSet("param2_values", param2_values);
    group.createDataSet("indices",
                        branch::logical_values(branch::resolved_indices(branch.data)));
    group.createDataSet("bifurcations", bifurcations);
    group.createDataSet("stability", stability);

    group.createAttribute("system_name", branch.system_name);
    group.createAttribute("parameter_name", branch.parameter_name);
    group.createAttribute("parent_object", branch.parent_object);
    group.createAttribute("start_object", branch.start_object);
    group.createAttribute("kind", std::string(branch::to_string(branch.branch_kind)));
    group.createAttribute("params", branch.params);
    group.createAttribute("timestamp", branch.timestamp);
    if (branch.map_iterations) {
        group.createAttribute("map_iterations", *branch.map_iterations);
    }
    if (branch.data.branch_type) {
        write_branch_type(group, *branch.data.branch_type);
    }
    write_settings(group, branch.settings);
    spdlog::debug("Wrote branch '{}' ({} points) to {}", branch.name, n,
                  m_filepath.string());
}

HighFive::File BranchFileWriter::open_file() {
    HighFive::File::AccessMode open_mode;
    // kWrite truncates once per writer; later branches append.
    if (m_mode == Mode::kWrite && !m_opened) {
        open_mode = HighFive::File::Overwrite;
    } else if (std::filesystem::exists(m_filepath)) {
        open_mode = HighFive::File::ReadWrite;
    } else {
        open_mode = HighFive::File::Create;
    }

    HighFive::File file(m_filepath.string(), open_mode);
    if (!file.isValid()) {
        throw std::runtime_error("Failed to create valid HDF5 file");
    }
    if (!file.hasAttribute("format_version")) {
        file.createAttribute("format_version", std::string(kFormatVersion));
    }
    m_opened = true;
    return file;
}

HighFive::Group BranchFileWriter::open_branches_group(HighFive::File& file) {
    return file.exist("branches") ? file.getGroup("branches")
                                  : file.createGroup("branches");
}

std::vector<std::string>
list_branch_file(const std::filesystem::path& filename) {
    HighFive::File file(filename.string(), HighFive::File::ReadOnly);
    if (!file.exist("branches")) {
        return {};
    }
    return file.getGroup("branches").listObjectNames();
}

branch::ContinuationObject
read_branch_file(const std::filesystem::path& filename, std::string_view name) {
    HighFive::File file(filename.string(), HighFive::File::ReadOnly);
    const std::string path = std::format("branches/{}", name);
    if (!file.exist("branches") || !file.getGroup("branches").exist(std::string(name))) {
        throw std::runtime_error(std::format("Branch {} not found in {}.", name,
                                             filename.string()));
    }
    const HighFive::Group group = file.getGroup(path);

    const auto states_ds = group.getDataSet("states");
    const auto dims      = states_ds.getDimensions();
    error_check::check_equal(dims.size(), 2U, "states must be 2-D");
    const SizeType n   = dims[0];
    const SizeType dim = dims[1];
    const auto states  = read_block(states_ds);

    const auto eig_ds   = group.getDataSet("eigenvalues");
    const auto eig_dims = eig_ds.getDimensions();
    error_check::check_equal(eig_dims.size(), 3U, "eigenvalues must be 3-D");
    error_check::check_equal(eig_dims[0], n, "eigenvalues rows must match states");
    const SizeType k       = eig_dims[1];
    const auto eigenvalues = read_block(eig_ds);

    const auto state_sizes =
        group.getDataSet("state_sizes").read<std::vector<SizeType>>();
    const auto param_values =
        group.getDataSet("param_values").read<std::vector<double>>();
    const auto param2_values =
        group.getDataSet("param2_values").read<std::vector<double>>();
    const auto stability =
        group.getDataSet("stability").read<std::vector<std::string>>();
    const auto indices =
        group.getDataSet("indices").read<std::vector<std::int64_t>>();
    const auto bifurcations =
        group.getDataSet("bifurcations").read<std::vector<std::int64_t>>();
    error_check::check_equal(param_values.size(), n,
                             "param_values must match states");
    error_check::check_equal(state_sizes.size(), n,
                             "state_sizes must match states");

    branch::ContinuationObject result;
    result.name = std::string(name);
    result.data.points.reserve(n);
    for (SizeType i = 0; i < n; ++i) {
        branch::ContinuationPoint point;
        const auto row = states.begin() + static_cast<IndexType>(i * dim);
        point.state.assign(row, row + static_cast<IndexType>(
                                          std::min(state_sizes[i], dim)));
        point.param_value = param_values[i];
        if (i < param2_values.size() && !std::isnan(param2_values[i])) {
            point.param2_value = param2_values[i];
        }
        if (i < stability.size()) {
            point.stability = branch::parse_bifurcation_type(stability[i]);
        }
        for (SizeType j = 0; j < k; ++j) {
            const double re = eigenvalues[(i * k + j) * 2];
            const double im = eigenvalues[(i * k + j) * 2 + 1];
            if (std::isnan(re) && std::isnan(im)) {
                break;
            }
            point.eigenvalues.emplace_back(re, im);
        }
        result.data.points.push_back(std::move(point));
    }
    result.data.indices = branch::to_logical(indices);
    branch::ensure_indices(result.data);
    for (const auto idx : bifurcations) {
        if (idx >= 0 && static_cast<SizeType>(idx) < n) {
            result.data.bifurcations.push_back(
                ArrayIndex{static_cast<SizeType>(idx)});
        }
    }
    result.data.branch_type = read_branch_type(group);

    result.system_name    = read_attribute_or<std::string>(group, "system_name", "");
    result.parameter_name =
        read_attribute_or<std::string>(group, "parameter_name", "");
    result.parent_object =
        read_attribute_or<std::string>(group, "parent_object", "");
    result.start_object =
        read_attribute_or<std::string>(group, "start_object", "");
    result.timestamp = read_attribute_or<std::string>(group, "timestamp", "");
    result.params =
        read_attribute_or<std::vector<double>>(group, "params", {});
    const auto kind = branch::parse_branch_kind(
        read_attribute_or<std::string>(group, "kind", "equilibrium"));
    result.branch_kind = kind.value_or(branch::BranchKind::kEquilibrium);
    if (group.hasAttribute("map_iterations")) {
        result.map_iterations =
            group.getAttribute("map_iterations").read<SizeType>();
    }
    result.settings = read_settings(group);
    return result;
}

} // namespace cobra::io
