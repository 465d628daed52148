#pragma once

#include <lore/common/text_utils.h>
#include <lore/core/types.h>
#include <lore/temporal/time_scoped.h>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lore::entity {

using temporal::History;

enum class EntityType { NPC, Organization, Location, Player, PlayerCharacter, Item };

enum class EntityStatus { Active, Inactive, Removed };

constexpr const char* entityTypeToString(EntityType type) {
    switch (type) {
        case EntityType::NPC: return "NPC";
        case EntityType::Organization: return "Organization";
        case EntityType::Location: return "Location";
        case EntityType::Player: return "Player";
        case EntityType::PlayerCharacter: return "PlayerCharacter";
        case EntityType::Item: return "Item";
    }
    return "NPC";
}

constexpr const char* entityStatusToString(EntityStatus status) {
    switch (status) {
        case EntityStatus::Active: return "Active";
        case EntityStatus::Inactive: return "Inactive";
        case EntityStatus::Removed: return "Removed";
    }
    return "Active";
}

// Case-insensitive; accepts the English type names and their Polish equivalents
std::optional<EntityType> entityTypeFromString(std::string_view text);
std::optional<EntityStatus> entityStatusFromString(std::string_view text);

/**
 * @brief Attribute tags with behavior of their own. Anything else is an override.
 */
enum class AttributeTag {
    Location,
    AccessLink,
    TypeOverride,
    Owner,
    Group,
    Alias,
    GenericName,
    Status,
    Quantity,
    Contains,
    Override
};

AttributeTag attributeTagFromKey(std::string_view key);

// Tags whose changes can move an entity in the location hierarchy
bool affectsContainment(AttributeTag tag);

/**
 * @brief Projection of an entity's histories as of one instant.
 */
struct ActiveState {
    std::optional<std::string> location;
    std::optional<std::string> typeOverride;
    std::optional<std::string> owner;
    std::optional<std::string> quantity;
    EntityStatus status = EntityStatus::Active;
    std::vector<std::string> accessLinks;
    std::vector<std::string> groups;
    std::vector<std::string> aliases;
};

/**
 * @brief A uniquely named world record with temporally scoped attributes.
 *
 * Histories are append-only. After sortHistories() every history is ordered by validFrom
 * with unbounded starts first, which the active* projections rely on.
 */
struct Entity {
    std::string name;
    common::NameSet names;
    EntityType type = EntityType::NPC;
    std::string canonicalName;

    History location;
    History accessLinks;
    History typeOverride;
    History owner;
    History groups;
    History status;
    History quantity;
    History aliases;
    std::vector<std::string> genericNames;
    std::map<std::string, History> overrides;
    std::vector<std::string> contains;

    // Derived as of the owning store's activeOn
    ActiveState active;

    Entity() = default;
    Entity(std::string entityName, EntityType entityType);

    /**
     * @brief Append one parsed attribute value to the history selected by `key`.
     * @return The tag the key mapped to.
     */
    AttributeTag applyAttribute(std::string_view key, const temporal::ScopedText& value);

    void sortHistories();
    void deriveActive(std::optional<TimePoint> at);

    bool hasName(std::string_view candidate) const { return names.contains(candidate); }

    // Declared type, unless an active type override names a known type
    EntityType effectiveType(std::optional<TimePoint> at = std::nullopt) const;

    std::optional<std::string> activeLocation(std::optional<TimePoint> at = std::nullopt) const;
    std::optional<std::string> activeOwner(std::optional<TimePoint> at = std::nullopt) const;
    std::optional<std::string> activeQuantity(std::optional<TimePoint> at = std::nullopt) const;
    std::optional<std::string> activeTypeOverride(std::optional<TimePoint> at = std::nullopt) const;
    EntityStatus activeStatus(std::optional<TimePoint> at = std::nullopt) const;
    std::vector<std::string> activeAccessLinks(std::optional<TimePoint> at = std::nullopt) const;
    std::vector<std::string> activeGroups(std::optional<TimePoint> at = std::nullopt) const;
    std::vector<std::string> activeAliases(std::optional<TimePoint> at = std::nullopt) const;

    const History* overrideHistory(std::string_view key) const;
    std::optional<std::string> activeOverride(std::string_view key,
                                              std::optional<TimePoint> at = std::nullopt) const;

    // Total number of history entries across all tracked properties
    std::size_t historySize() const;

private:
    History* historyFor(AttributeTag tag);
};

} // namespace lore::entity
