#pragma once

#include <lore/core/types.h>
#include <lore/entity/entity.h>

#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace lore::entity {

class EntityStore;

/**
 * @brief Derives path-style canonical names.
 *
 * Non-location entities map to "{Type}/{Name}". Locations are placed under their parent
 * (active location, then first active access link, then whichever entity lists them in
 * "contains"), e.g. "Location/Erathia/Zamek Steadwick". A name with no entity behind it
 * becomes a literal path segment. Containment cycles fall back to "Location/{Name}".
 *
 * Results are memoized per resolver instance so shared ancestors are walked once.
 */
class CanonicalNameResolver {
public:
    CanonicalNameResolver(const EntityStore& store, std::optional<TimePoint> activeOn);

    std::string resolve(EntityId id);

    // Assign canonicalName on every entity of the store
    void applyAll(EntityStore& store);

    std::size_t cyclesDetected() const { return cycles_; }

private:
    // Empty optional signals a cycle somewhere above `id`
    std::optional<std::string> walk(EntityId id, std::unordered_set<EntityId>& visited);
    std::optional<std::string> parentOf(const Entity& entity) const;

    const EntityStore& store_;
    std::optional<TimePoint> activeOn_;
    std::unordered_map<EntityId, std::string> memo_;
    // folded child name -> name of the first entity listing it in "contains"
    std::unordered_map<std::string, std::string> containedBy_;
    std::size_t cycles_ = 0;
};

} // namespace lore::entity
