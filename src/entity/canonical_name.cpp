#include <spdlog/spdlog.h>
#include <lore/common/text_utils.h>
#include <lore/entity/canonical_name.h>
#include <lore/entity/entity_store.h>

#include <format>

namespace lore::entity {

namespace {
constexpr const char* kLocationPrefix = "Location";
}

CanonicalNameResolver::CanonicalNameResolver(const EntityStore& store,
                                             std::optional<TimePoint> activeOn)
    : store_(store), activeOn_(activeOn) {
    for (const auto& entity : store_.entities()) {
        for (const auto& child : entity.contains) {
            containedBy_.try_emplace(common::foldCase(child), entity.name);
        }
    }
}

std::optional<std::string> CanonicalNameResolver::parentOf(const Entity& entity) const {
    if (auto loc = entity.activeLocation(activeOn_)) {
        return loc;
    }
    auto links = entity.activeAccessLinks(activeOn_);
    if (!links.empty()) {
        return links.front();
    }
    auto it = containedBy_.find(common::foldCase(entity.name));
    if (it != containedBy_.end() && !common::equalsFolded(it->second, entity.name)) {
        return it->second;
    }
    return std::nullopt;
}

std::string CanonicalNameResolver::resolve(EntityId id) {
    if (auto it = memo_.find(id); it != memo_.end()) {
        return it->second;
    }

    const auto& entity = store_.at(id);
    if (entity.effectiveType(activeOn_) != EntityType::Location) {
        auto flat = std::format("{}/{}", entityTypeToString(entity.effectiveType(activeOn_)),
                                entity.name);
        memo_.emplace(id, flat);
        return flat;
    }

    std::unordered_set<EntityId> visited;
    if (auto path = walk(id, visited)) {
        return *path;
    }

    ++cycles_;
    spdlog::warn("Containment cycle detected while resolving '{}', using flat name", entity.name);
    return std::format("{}/{}", kLocationPrefix, entity.name);
}

std::optional<std::string> CanonicalNameResolver::walk(EntityId id,
                                                       std::unordered_set<EntityId>& visited) {
    if (auto it = memo_.find(id); it != memo_.end()) {
        return it->second;
    }
    if (!visited.insert(id).second) {
        return std::nullopt;
    }

    const auto& entity = store_.at(id);
    std::string path;

    auto parentName = parentOf(entity);
    if (!parentName) {
        path = std::format("{}/{}", kLocationPrefix, entity.name);
    } else {
        auto parentId = store_.find(*parentName);
        if (!parentId || store_.at(*parentId).effectiveType(activeOn_) != EntityType::Location) {
            path = std::format("{}/{}/{}", kLocationPrefix, *parentName, entity.name);
        } else {
            auto parentPath = walk(*parentId, visited);
            if (!parentPath) {
                return std::nullopt;
            }
            path = std::format("{}/{}", *parentPath, entity.name);
        }
    }

    memo_.emplace(id, path);
    return path;
}

void CanonicalNameResolver::applyAll(EntityStore& store) {
    for (EntityId id = 0; id < store.size(); ++id) {
        store.at(id).canonicalName = resolve(id);
    }
    if (cycles_ > 0) {
        spdlog::info("Canonical names assigned with {} containment cycle(s) broken", cycles_);
    }
}

} // namespace lore::entity
