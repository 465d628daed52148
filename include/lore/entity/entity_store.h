#pragma once

#include <lore/core/types.h>
#include <lore/entity/declaration.h>
#include <lore/entity/entity.h>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace lore::entity {

struct EntityStoreOptions {
    // Instant the derived ActiveState projections are computed for (unscoped when empty)
    std::optional<TimePoint> activeOn;

    // Additional section label -> type mappings (labels compared case-insensitively)
    std::unordered_map<std::string, EntityType> extraSectionLabels;
};

/**
 * @brief Merged registry of entities built from ordered declaration sources.
 *
 * Entities live in an arena and are addressed by EntityId (their position in creation
 * order). Names are case-insensitive identity keys: a second declaration of a known name
 * merges into the existing entity instead of replacing it.
 *
 * Not thread-safe while merging; read-only use after finalize() may be shared.
 */
class EntityStore {
public:
    struct Stats {
        std::size_t entityCount = 0;
        std::size_t historyEntries = 0;
        std::size_t skippedLines = 0;
        std::size_t skippedSections = 0;
        std::map<EntityType, std::size_t> perType;
    };

    explicit EntityStore(EntityStoreOptions options = {});

    /**
     * @brief Merge all sources in the given order, then finalize.
     */
    static EntityStore build(const std::vector<DeclarationSource>& sources,
                             EntityStoreOptions options = {});

    // Merge one source; later sources win ties once histories are sorted
    void addSource(const DeclarationSource& source);

    /**
     * @brief Sort every history, derive active projections and assign canonical names.
     */
    void finalize();

    // Re-run the derivation for a subset of entities after their histories changed
    void refresh(const std::vector<EntityId>& ids);

    void recomputeCanonicalNames();

    // Primary-name lookup, case-insensitive
    std::optional<EntityId> find(std::string_view name) const;

    // Lookup through every name an entity answers to; first created entity wins
    std::optional<EntityId> findByAnyName(std::string_view name) const;

    Entity& at(EntityId id) { return entities_.at(id); }
    const Entity& at(EntityId id) const { return entities_.at(id); }

    const Entity* get(std::string_view name) const;

    const std::vector<Entity>& entities() const { return entities_; }
    std::size_t size() const { return entities_.size(); }
    bool empty() const { return entities_.empty(); }

    const EntityStoreOptions& options() const { return options_; }
    std::optional<TimePoint> activeOn() const { return options_.activeOn; }

    // Warnings raised while merging (also logged)
    const std::vector<std::string>& warnings() const { return warnings_; }

    Stats getStats() const;

    // Section label -> entity type, honoring extraSectionLabels
    std::optional<EntityType> typeForSection(std::string_view label) const;

private:
    void addDeclaration(const DeclarationSource& source, EntityType type,
                        const EntityDeclaration& decl);
    EntityId findOrCreate(const std::string& name, EntityType type, const std::string& sourceId);
    void warn(std::string message);

    EntityStoreOptions options_;
    std::vector<Entity> entities_;
    std::unordered_map<std::string, EntityId> byName_;
    std::vector<std::string> warnings_;
    std::size_t skippedLines_ = 0;
    std::size_t skippedSections_ = 0;
};

} // namespace lore::entity
