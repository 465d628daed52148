#pragma once

#include <lore/core/types.h>
#include <lore/entity/entity_store.h>
#include <lore/entity/identity.h>

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace lore::search {

using entity::EntityType;
using entity::OwnerRef;

// Full names and aliases always win over single-word tokens
enum class NamePriority { Token = 0, FullNameOrAlias = 1 };

struct NameIndexEntry {
    OwnerRef owner;
    EntityType ownerType = EntityType::NPC;
    NamePriority priority = NamePriority::Token;
    // Two or more distinct owners claimed this key at the same priority
    bool ambiguous = false;
    std::vector<OwnerRef> owners;
};

struct NameIndexOptions {
    // Minimum length (code points) of a word taken from a multi-word name
    std::size_t minTokenLength = 3;
    // Aliases are indexed only when active at this instant (all aliases when empty)
    std::optional<TimePoint> activeOn;
};

/**
 * @brief Reverse lookup from every known name, alias and token to its owner.
 *
 * Keys are case-folded; lookup is exact. The index is immutable once built and keeps a
 * pointer to the store it was built from, which must outlive it.
 *
 * Players are de-duplicated against store entities of type Player/PlayerCharacter that
 * share a name with them: such entities index their names under the player, so the two
 * never make each other's keys ambiguous.
 */
class NameIndex {
public:
    static Result<NameIndex> build(const entity::EntityStore& store,
                                   std::vector<entity::PlayerRecord> players = {},
                                   NameIndexOptions options = {});

    // Case-insensitive exact lookup
    const NameIndexEntry* find(std::string_view key) const;

    const std::unordered_map<std::string, NameIndexEntry>& entries() const { return entries_; }

    // All keys, sorted
    std::vector<std::string> keys() const;

    std::size_t size() const { return entries_.size(); }
    std::size_t ambiguousCount() const;

    const std::string& displayName(const OwnerRef& owner) const;
    EntityType ownerType(const OwnerRef& owner) const;

    // Store entities folded into a player identity
    const std::vector<EntityId>& linkedEntities(std::size_t playerId) const;

    const std::vector<entity::PlayerRecord>& players() const { return players_; }
    const entity::EntityStore& store() const { return *store_; }
    const NameIndexOptions& options() const { return options_; }

private:
    NameIndex(const entity::EntityStore& store, std::vector<entity::PlayerRecord> players,
              NameIndexOptions options);

    void linkPlayers();
    void indexIdentity(const entity::Identity& identity, const OwnerRef& owner, EntityType type);
    void insert(std::string_view name, const OwnerRef& owner, EntityType type,
                NamePriority priority);

    const entity::EntityStore* store_;
    std::vector<entity::PlayerRecord> players_;
    NameIndexOptions options_;
    std::vector<std::vector<EntityId>> playerEntities_;
    std::unordered_map<EntityId, std::size_t> entityToPlayer_;
    std::unordered_map<std::string, NameIndexEntry> entries_;
};

} // namespace lore::search
