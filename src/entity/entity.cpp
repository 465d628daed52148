#include <spdlog/spdlog.h>
#include <lore/entity/entity.h>

#include <algorithm>
#include <array>
#include <utility>

namespace lore::entity {

namespace {

struct TypeName {
    const char* text;
    EntityType type;
};

// Folded spellings, English and Polish
constexpr std::array<TypeName, 16> kTypeNames{{
    {"npc", EntityType::NPC},
    {"bn", EntityType::NPC},
    {"organization", EntityType::Organization},
    {"faction", EntityType::Organization},
    {"organizacja", EntityType::Organization},
    {"frakcja", EntityType::Organization},
    {"location", EntityType::Location},
    {"lokacja", EntityType::Location},
    {"miejsce", EntityType::Location},
    {"player", EntityType::Player},
    {"gracz", EntityType::Player},
    {"playercharacter", EntityType::PlayerCharacter},
    {"player character", EntityType::PlayerCharacter},
    {"postać gracza", EntityType::PlayerCharacter},
    {"item", EntityType::Item},
    {"przedmiot", EntityType::Item},
}};

struct StatusName {
    const char* text;
    EntityStatus status;
};

constexpr std::array<StatusName, 12> kStatusNames{{
    {"active", EntityStatus::Active},
    {"aktywny", EntityStatus::Active},
    {"aktywna", EntityStatus::Active},
    {"aktywne", EntityStatus::Active},
    {"inactive", EntityStatus::Inactive},
    {"nieaktywny", EntityStatus::Inactive},
    {"nieaktywna", EntityStatus::Inactive},
    {"nieaktywne", EntityStatus::Inactive},
    {"removed", EntityStatus::Removed},
    {"usunięty", EntityStatus::Removed},
    {"usunięta", EntityStatus::Removed},
    {"usunięte", EntityStatus::Removed},
}};

struct TagKey {
    const char* key;
    AttributeTag tag;
};

constexpr std::array<TagKey, 24> kTagKeys{{
    {"location", AttributeTag::Location},
    {"lokacja", AttributeTag::Location},
    {"access", AttributeTag::AccessLink},
    {"access-link", AttributeTag::AccessLink},
    {"dostęp", AttributeTag::AccessLink},
    {"dostep", AttributeTag::AccessLink},
    {"type", AttributeTag::TypeOverride},
    {"type-override", AttributeTag::TypeOverride},
    {"typ", AttributeTag::TypeOverride},
    {"owner", AttributeTag::Owner},
    {"właściciel", AttributeTag::Owner},
    {"wlasciciel", AttributeTag::Owner},
    {"group", AttributeTag::Group},
    {"grupa", AttributeTag::Group},
    {"alias", AttributeTag::Alias},
    {"generic-name", AttributeTag::GenericName},
    {"generic", AttributeTag::GenericName},
    {"nazwa", AttributeTag::GenericName},
    {"status", AttributeTag::Status},
    {"quantity", AttributeTag::Quantity},
    {"ilość", AttributeTag::Quantity},
    {"ilosc", AttributeTag::Quantity},
    {"contains", AttributeTag::Contains},
    {"zawiera", AttributeTag::Contains},
}};

} // namespace

std::optional<EntityType> entityTypeFromString(std::string_view text) {
    const auto folded = common::foldCase(common::trimmed(text));
    for (const auto& entry : kTypeNames) {
        if (folded == entry.text) {
            return entry.type;
        }
    }
    return std::nullopt;
}

std::optional<EntityStatus> entityStatusFromString(std::string_view text) {
    const auto folded = common::foldCase(common::trimmed(text));
    for (const auto& entry : kStatusNames) {
        if (folded == entry.text) {
            return entry.status;
        }
    }
    return std::nullopt;
}

AttributeTag attributeTagFromKey(std::string_view key) {
    const auto folded = common::foldCase(common::trimmed(key));
    for (const auto& entry : kTagKeys) {
        if (folded == entry.key) {
            return entry.tag;
        }
    }
    return AttributeTag::Override;
}

bool affectsContainment(AttributeTag tag) {
    return tag == AttributeTag::Location || tag == AttributeTag::AccessLink ||
           tag == AttributeTag::TypeOverride || tag == AttributeTag::Contains;
}

Entity::Entity(std::string entityName, EntityType entityType)
    : name(std::move(entityName)), type(entityType) {
    names.insert(name);
}

History* Entity::historyFor(AttributeTag tag) {
    switch (tag) {
        case AttributeTag::Location: return &location;
        case AttributeTag::AccessLink: return &accessLinks;
        case AttributeTag::TypeOverride: return &typeOverride;
        case AttributeTag::Owner: return &owner;
        case AttributeTag::Group: return &groups;
        case AttributeTag::Status: return &status;
        case AttributeTag::Quantity: return &quantity;
        case AttributeTag::Alias: return &aliases;
        default: return nullptr;
    }
}

AttributeTag Entity::applyAttribute(std::string_view key, const temporal::ScopedText& value) {
    const auto tag = attributeTagFromKey(key);

    switch (tag) {
        case AttributeTag::GenericName: {
            if (std::find(genericNames.begin(), genericNames.end(), value.text) ==
                genericNames.end()) {
                genericNames.push_back(value.text);
            }
            names.insert(value.text);
            return tag;
        }
        case AttributeTag::Contains: {
            for (auto& child : common::splitList(value.text, ',')) {
                const bool known = std::any_of(contains.begin(), contains.end(),
                                               [&](const std::string& existing) {
                                                   return common::equalsFolded(existing, child);
                                               });
                if (!known) {
                    contains.push_back(std::move(child));
                }
            }
            return tag;
        }
        case AttributeTag::Override: {
            auto it = std::find_if(overrides.begin(), overrides.end(), [&](const auto& kv) {
                return common::equalsFolded(kv.first, key);
            });
            if (it == overrides.end()) {
                it = overrides.emplace(common::trimmed(key), History{}).first;
            }
            it->second.push_back(value.toScoped());
            return tag;
        }
        case AttributeTag::Status: {
            auto scoped = value.toScoped();
            if (auto parsed = entityStatusFromString(value.text)) {
                scoped.value = entityStatusToString(*parsed);
            } else {
                spdlog::warn("Unknown status '{}' for '{}', kept verbatim", value.text, name);
            }
            status.push_back(std::move(scoped));
            return tag;
        }
        case AttributeTag::Alias:
            names.insert(value.text);
            aliases.push_back(value.toScoped());
            return tag;
        default:
            break;
    }

    if (auto* history = historyFor(tag)) {
        history->push_back(value.toScoped());
    }
    return tag;
}

void Entity::sortHistories() {
    for (auto* history :
         {&location, &accessLinks, &typeOverride, &owner, &groups, &status, &quantity, &aliases}) {
        temporal::sortHistory(*history);
    }
    for (auto& [_, history] : overrides) {
        temporal::sortHistory(history);
    }
}

void Entity::deriveActive(std::optional<TimePoint> at) {
    active.location = activeLocation(at);
    active.typeOverride = activeTypeOverride(at);
    active.owner = activeOwner(at);
    active.quantity = activeQuantity(at);
    active.status = activeStatus(at);
    active.accessLinks = activeAccessLinks(at);
    active.groups = activeGroups(at);
    active.aliases = activeAliases(at);
}

EntityType Entity::effectiveType(std::optional<TimePoint> at) const {
    if (auto overrideText = activeTypeOverride(at)) {
        if (auto parsed = entityTypeFromString(*overrideText)) {
            return *parsed;
        }
    }
    return type;
}

std::optional<std::string> Entity::activeLocation(std::optional<TimePoint> at) const {
    return temporal::activeValue(location, at);
}

std::optional<std::string> Entity::activeOwner(std::optional<TimePoint> at) const {
    return temporal::activeValue(owner, at);
}

std::optional<std::string> Entity::activeQuantity(std::optional<TimePoint> at) const {
    return temporal::activeValue(quantity, at);
}

std::optional<std::string> Entity::activeTypeOverride(std::optional<TimePoint> at) const {
    return temporal::activeValue(typeOverride, at);
}

EntityStatus Entity::activeStatus(std::optional<TimePoint> at) const {
    if (auto text = temporal::activeValue(status, at)) {
        if (auto parsed = entityStatusFromString(*text)) {
            return *parsed;
        }
    }
    return EntityStatus::Active;
}

std::vector<std::string> Entity::activeAccessLinks(std::optional<TimePoint> at) const {
    return temporal::activeValues(accessLinks, at);
}

std::vector<std::string> Entity::activeGroups(std::optional<TimePoint> at) const {
    return temporal::activeValues(groups, at);
}

std::vector<std::string> Entity::activeAliases(std::optional<TimePoint> at) const {
    return temporal::activeValues(aliases, at);
}

const History* Entity::overrideHistory(std::string_view key) const {
    for (const auto& [k, history] : overrides) {
        if (common::equalsFolded(k, key)) {
            return &history;
        }
    }
    return nullptr;
}

std::optional<std::string> Entity::activeOverride(std::string_view key,
                                                  std::optional<TimePoint> at) const {
    if (const auto* history = overrideHistory(key)) {
        return temporal::activeValue(*history, at);
    }
    return std::nullopt;
}

std::size_t Entity::historySize() const {
    std::size_t total = location.size() + accessLinks.size() + typeOverride.size() +
                        owner.size() + groups.size() + status.size() + quantity.size() +
                        aliases.size();
    for (const auto& [_, history] : overrides) {
        total += history.size();
    }
    return total;
}

} // namespace lore::entity
