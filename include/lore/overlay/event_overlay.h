#pragma once

#include <lore/core/types.h>
#include <lore/entity/entity_store.h>
#include <lore/search/fuzzy_resolver.h>

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace lore::overlay {

/**
 * @brief A dated change to one entity, as recorded in an external event log.
 */
struct ChangeRecord {
    TimePoint date;
    std::string targetName;
    std::vector<std::pair<std::string, std::string>> tags;
};

struct OverlayReport {
    std::size_t applied = 0;
    std::size_t skipped = 0;
    std::size_t entriesAppended = 0;
    // Names of entities whose histories changed, in first-touched order
    std::vector<std::string> touched;
    std::vector<std::string> warnings;
};

/**
 * @brief Replays change records onto the histories of an already built store.
 *
 * Records apply in ascending date order. Targets resolve by exact name/alias first, then
 * through the fuzzy resolver; a player identity maps back to its linked entity. Unknown
 * targets skip only their own record. Values without an explicit range are dated from the
 * record's date onwards. Touched entities are re-sorted and re-derived once at the end.
 *
 * The name index is not rebuilt; aliases added by events resolve only after a rebuild.
 */
class EventOverlayMerger {
public:
    EventOverlayMerger(entity::EntityStore& store, const search::FuzzyResolver& resolver);

    OverlayReport apply(std::vector<ChangeRecord> records);

    // Entity a change record's target refers to, if any
    Result<EntityId> resolveTarget(const std::string& targetName) const;

private:
    Result<void> applyRecord(const ChangeRecord& record, OverlayReport& report);

    entity::EntityStore& store_;
    const search::FuzzyResolver& resolver_;
    std::vector<EntityId> touched_;
    bool containmentChanged_ = false;
};

} // namespace lore::overlay
