#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

#include "cobra/branch/continuation_object.hpp"
#include "cobra/config/system.hpp"
#include "cobra/params/subsystem.hpp"

namespace cobra::storage {

class NotFoundError : public std::out_of_range {
public:
    using std::out_of_range::out_of_range;
};

enum class ObjectKind : std::uint8_t { kEquilibrium, kLimitCycle, kOrbit };

[[nodiscard]] std::string_view to_string(ObjectKind kind) noexcept;

// Analysis object a branch can hang off: a solved equilibrium, a limit
// cycle, or a simulated orbit.
struct StoredObject {
    std::string name;
    ObjectKind kind{ObjectKind::kEquilibrium};
    // Solved state (equilibrium) or collocation profile (limit cycle).
    std::vector<double> state;
    std::optional<std::vector<double>> parameters;
    std::optional<std::vector<double>> custom_parameters;
    std::optional<params::FrozenVariables> frozen_variables;
    std::optional<params::SubsystemSnapshot> subsystem;
    // Orbit samples, one row per time point: [t, x0, x1, ...].
    std::vector<std::vector<double>> orbit;
    // Branch a limit-cycle object was taken from.
    std::optional<std::string> origin_branch;

    [[nodiscard]] bool is_solved() const noexcept { return !state.empty(); }
};

// Persistence collaborator. Loads throw NotFoundError for unknown names.
class ObjectStore {
public:
    ObjectStore()                              = default;
    virtual ~ObjectStore()                     = default;
    ObjectStore(const ObjectStore&)            = delete;
    ObjectStore& operator=(const ObjectStore&) = delete;
    ObjectStore(ObjectStore&&)                 = delete;
    ObjectStore& operator=(ObjectStore&&)      = delete;

    [[nodiscard]] virtual config::SystemConfig
    load_system(std::string_view system) const = 0;
    virtual void save_system(const config::SystemConfig& system) = 0;

    [[nodiscard]] virtual StoredObject
    load_object(std::string_view system, std::string_view object) const = 0;
    virtual void save_object(std::string_view system,
                             const StoredObject& object) = 0;

    [[nodiscard]] virtual branch::ContinuationObject
    load_branch(std::string_view system,
                std::string_view object,
                std::string_view branch) const = 0;
    virtual void save_branch(std::string_view system,
                             std::string_view object,
                             const branch::ContinuationObject& branch) = 0;
    [[nodiscard]] virtual std::vector<std::string>
    list_branches(std::string_view system, std::string_view object) const = 0;
    virtual void delete_branch(std::string_view system,
                               std::string_view object,
                               std::string_view branch) = 0;

    // Renames cascade into parent_object / start_object of stored branches
    // and into limit-cycle provenance.
    virtual void rename_object(std::string_view system,
                               std::string_view old_name,
                               std::string_view new_name) = 0;
    virtual void rename_branch(std::string_view system,
                               std::string_view object,
                               std::string_view old_name,
                               std::string_view new_name) = 0;
};

class InMemoryObjectStore final : public ObjectStore {
public:
    InMemoryObjectStore() = default;

    [[nodiscard]] config::SystemConfig
    load_system(std::string_view system) const override;
    void save_system(const config::SystemConfig& system) override;

    [[nodiscard]] StoredObject
    load_object(std::string_view system,
                std::string_view object) const override;
    void save_object(std::string_view system,
                     const StoredObject& object) override;

    [[nodiscard]] branch::ContinuationObject
    load_branch(std::string_view system,
                std::string_view object,
                std::string_view branch) const override;
    void save_branch(std::string_view system,
                     std::string_view object,
                     const branch::ContinuationObject& branch) override;
    [[nodiscard]] std::vector<std::string>
    list_branches(std::string_view system,
                  std::string_view object) const override;
    void delete_branch(std::string_view system,
                       std::string_view object,
                       std::string_view branch) override;

    void rename_object(std::string_view system,
                       std::string_view old_name,
                       std::string_view new_name) override;
    void rename_branch(std::string_view system,
                       std::string_view object,
                       std::string_view old_name,
                       std::string_view new_name) override;

    [[nodiscard]] SizeType branch_count() const;

private:
    using ObjectKey = std::pair<std::string, std::string>;
    using BranchKey = std::tuple<std::string, std::string, std::string>;

    mutable std::mutex m_mutex;
    std::map<std::string, config::SystemConfig, std::less<>> m_systems;
    std::map<ObjectKey, StoredObject> m_objects;
    std::map<BranchKey, branch::ContinuationObject> m_branches;
};

} // namespace cobra::storage
