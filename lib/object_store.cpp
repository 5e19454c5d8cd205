#include "cobra/storage/object_store.hpp"

#include <format>

#include <spdlog/spdlog.h>

#include "cobra/common/naming.hpp"
#include "cobra/exceptions.hpp"

namespace cobra::storage {

std::string_view to_string(ObjectKind kind) noexcept {
    switch (kind) {
    case ObjectKind::kEquilibrium:
        return "equilibrium";
    case ObjectKind::kLimitCycle:
        return "limit_cycle";
    case ObjectKind::kOrbit:
        return "orbit";
    }
    return "unknown";
}

config::SystemConfig
InMemoryObjectStore::load_system(std::string_view system) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_systems.find(system);
    if (it == m_systems.end()) {
        throw NotFoundError(std::format("System \"{}\" does not exist.", system));
    }
    return it->second;
}

void InMemoryObjectStore::save_system(const config::SystemConfig& system) {
    validate_name(system.name);
    std::lock_guard<std::mutex> lock(m_mutex);
    m_systems.insert_or_assign(system.name, system);
}

StoredObject InMemoryObjectStore::load_object(std::string_view system,
                                              std::string_view object) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it =
        m_objects.find(ObjectKey{std::string(system), std::string(object)});
    if (it == m_objects.end()) {
        throw NotFoundError(std::format(
            "Object \"{}\" does not exist in system \"{}\".", object, system));
    }
    return it->second;
}

void InMemoryObjectStore::save_object(std::string_view system,
                                      const StoredObject& object) {
    validate_name(object.name);
    std::lock_guard<std::mutex> lock(m_mutex);
    m_objects.insert_or_assign(ObjectKey{std::string(system), object.name},
                               object);
}

branch::ContinuationObject
InMemoryObjectStore::load_branch(std::string_view system,
                                 std::string_view object,
                                 std::string_view branch) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_branches.find(BranchKey{
        std::string(system), std::string(object), std::string(branch)});
    if (it == m_branches.end()) {
        throw NotFoundError(
            std::format("Branch \"{}\" does not exist under object \"{}\".",
                        branch, object));
    }
    return it->second;
}

void InMemoryObjectStore::save_branch(std::string_view system,
                                      std::string_view object,
                                      const branch::ContinuationObject& branch) {
    validate_name(branch.name);
    std::lock_guard<std::mutex> lock(m_mutex);
    m_branches.insert_or_assign(
        BranchKey{std::string(system), std::string(object), branch.name},
        branch);
    spdlog::debug("Saved branch {}/{}/{} ({} points)", system, object,
                  branch.name, branch.data.size());
}

std::vector<std::string>
InMemoryObjectStore::list_branches(std::string_view system,
                                   std::string_view object) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> names;
    for (const auto& [key, value] : m_branches) {
        if (std::get<0>(key) == system && std::get<1>(key) == object) {
            names.push_back(std::get<2>(key));
        }
    }
    return names;
}

void InMemoryObjectStore::delete_branch(std::string_view system,
                                        std::string_view object,
                                        std::string_view branch) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_branches.erase(BranchKey{std::string(system), std::string(object),
                               std::string(branch)});
}

void InMemoryObjectStore::rename_object(std::string_view system,
                                        std::string_view old_name,
                                        std::string_view new_name) {
    validate_name(new_name);
    std::lock_guard<std::mutex> lock(m_mutex);
    const ObjectKey old_key{std::string(system), std::string(old_name)};
    const ObjectKey new_key{std::string(system), std::string(new_name)};
    if (m_objects.contains(new_key)) {
        throw ValidationError(
            std::format("Object \"{}\" already exists.", new_name));
    }
    auto node = m_objects.extract(old_key);
    if (!node) {
        throw NotFoundError(
            std::format("Object \"{}\" does not exist.", old_name));
    }
    node.key()         = new_key;
    node.mapped().name = new_name;
    m_objects.insert(std::move(node));

    std::map<BranchKey, branch::ContinuationObject> updated;
    for (auto it = m_branches.begin(); it != m_branches.end();) {
        const auto& [sys, obj, name] = it->first;
        if (sys != system || obj != old_name) {
            ++it;
            continue;
        }
        auto moved = std::move(it->second);
        // Branches started from the object itself record it as start_object.
        if (moved.start_object == moved.parent_object) {
            moved.start_object = std::string(new_name);
        }
        moved.parent_object = std::string(new_name);
        updated.emplace(BranchKey{sys, std::string(new_name), name},
                        std::move(moved));
        it = m_branches.erase(it);
    }
    m_branches.merge(updated);
}

void InMemoryObjectStore::rename_branch(std::string_view system,
                                        std::string_view object,
                                        std::string_view old_name,
                                        std::string_view new_name) {
    validate_name(new_name);
    std::lock_guard<std::mutex> lock(m_mutex);
    const BranchKey old_key{std::string(system), std::string(object),
                            std::string(old_name)};
    const BranchKey new_key{std::string(system), std::string(object),
                            std::string(new_name)};
    if (!m_branches.contains(old_key)) {
        throw NotFoundError(
            std::format("Branch \"{}\" does not exist under object \"{}\".",
                        old_name, object));
    }
    if (m_branches.contains(new_key)) {
        throw ValidationError(
            std::format("Branch \"{}\" already exists under object \"{}\".",
                        new_name, object));
    }
    auto node                   = m_branches.extract(old_key);
    node.key()                  = new_key;
    node.mapped().name          = new_name;
    node.mapped().parent_object = std::string(object);
    m_branches.insert(std::move(node));

    for (auto& [key, value] : m_branches) {
        if (std::get<0>(key) == system && value.start_object == old_name) {
            value.start_object = std::string(new_name);
        }
    }
    for (auto& [key, value] : m_objects) {
        if (key.first == system && value.kind == ObjectKind::kLimitCycle &&
            value.origin_branch == old_name) {
            value.origin_branch = std::string(new_name);
        }
    }
}

SizeType InMemoryObjectStore::branch_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_branches.size();
}

} // namespace cobra::storage
