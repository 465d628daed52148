#include <spdlog/spdlog.h>
#include <lore/common/text_utils.h>
#include <lore/entity/canonical_name.h>
#include <lore/entity/entity_store.h>

#include <array>
#include <format>

namespace lore::entity {

namespace {

struct SectionLabel {
    const char* label;
    EntityType type;
};

constexpr std::array<SectionLabel, 28> kSectionLabels{{
    {"npc", EntityType::NPC},
    {"npcs", EntityType::NPC},
    {"bn", EntityType::NPC},
    {"postacie", EntityType::NPC},
    {"postacie niezależne", EntityType::NPC},
    {"organization", EntityType::Organization},
    {"organizations", EntityType::Organization},
    {"factions", EntityType::Organization},
    {"organizacje", EntityType::Organization},
    {"frakcje", EntityType::Organization},
    {"location", EntityType::Location},
    {"locations", EntityType::Location},
    {"lokacje", EntityType::Location},
    {"miejsca", EntityType::Location},
    {"player", EntityType::Player},
    {"players", EntityType::Player},
    {"gracze", EntityType::Player},
    {"player character", EntityType::PlayerCharacter},
    {"player characters", EntityType::PlayerCharacter},
    {"playercharacter", EntityType::PlayerCharacter},
    {"playercharacters", EntityType::PlayerCharacter},
    {"postacie graczy", EntityType::PlayerCharacter},
    {"item", EntityType::Item},
    {"items", EntityType::Item},
    {"przedmioty", EntityType::Item},
    {"organisation", EntityType::Organization},
    {"organisations", EntityType::Organization},
    {"faction", EntityType::Organization},
}};

std::string joinValue(const AttributeLine& line, std::size_t colon) {
    auto value = common::trimmed(std::string_view(line.text).substr(colon + 1));
    for (const auto& cont : line.continuation) {
        auto piece = common::trimmed(cont);
        if (piece.empty()) {
            continue;
        }
        if (!value.empty()) {
            value.push_back('\n');
        }
        value += piece;
    }
    return value;
}

} // namespace

EntityStore::EntityStore(EntityStoreOptions options) : options_(std::move(options)) {}

EntityStore EntityStore::build(const std::vector<DeclarationSource>& sources,
                               EntityStoreOptions options) {
    EntityStore store(std::move(options));
    for (const auto& source : sources) {
        store.addSource(source);
    }
    store.finalize();
    return store;
}

std::optional<EntityType> EntityStore::typeForSection(std::string_view label) const {
    const auto folded = common::foldCase(common::trimmed(label));
    for (const auto& [extra, type] : options_.extraSectionLabels) {
        if (common::foldCase(extra) == folded) {
            return type;
        }
    }
    for (const auto& entry : kSectionLabels) {
        if (folded == entry.label) {
            return entry.type;
        }
    }
    return entityTypeFromString(folded);
}

void EntityStore::addSource(const DeclarationSource& source) {
    spdlog::debug("Merging declaration source '{}' ({} sections)", source.id,
                  source.sections.size());

    for (const auto& section : source.sections) {
        auto type = typeForSection(section.label);
        if (!type) {
            spdlog::debug("Skipping section '{}' in '{}': no entity type", section.label,
                          source.id);
            ++skippedSections_;
            continue;
        }
        for (const auto& decl : section.entities) {
            addDeclaration(source, *type, decl);
        }
    }
}

EntityId EntityStore::findOrCreate(const std::string& name, EntityType type,
                                   const std::string& sourceId) {
    auto key = common::foldCase(name);
    auto it = byName_.find(key);
    if (it != byName_.end()) {
        auto& existing = entities_[it->second];
        if (existing.type != type) {
            warn(std::format("'{}' redeclared as {} in '{}', keeping {}", name,
                             entityTypeToString(type), sourceId,
                             entityTypeToString(existing.type)));
        }
        return it->second;
    }

    const EntityId id = entities_.size();
    entities_.emplace_back(name, type);
    byName_.emplace(std::move(key), id);
    return id;
}

void EntityStore::addDeclaration(const DeclarationSource& source, EntityType type,
                                 const EntityDeclaration& decl) {
    const auto name = common::trimmed(decl.name);
    if (name.empty()) {
        warn(std::format("Skipping unnamed declaration in '{}'", source.id));
        return;
    }

    const EntityId id = findOrCreate(name, type, source.id);

    for (const auto& line : decl.lines) {
        const auto colon = line.text.find(':');
        if (colon == std::string::npos) {
            ++skippedLines_;
            warn(std::format("{}: '{}' has no attribute key, skipped ('{}')", source.id, name,
                             line.text));
            continue;
        }

        const auto key = common::trimmed(std::string_view(line.text).substr(0, colon));
        if (key.empty()) {
            ++skippedLines_;
            warn(std::format("{}: '{}' has an empty attribute key, skipped ('{}')", source.id,
                             name, line.text));
            continue;
        }

        const auto value = joinValue(line, colon);
        if (value.empty()) {
            ++skippedLines_;
            warn(std::format("{}: '{}' attribute '{}' has no value, skipped", source.id, name,
                             key));
            continue;
        }

        entities_[id].applyAttribute(key, temporal::parseScopedValue(value));
    }
}

void EntityStore::finalize() {
    for (auto& entity : entities_) {
        entity.sortHistories();
        entity.deriveActive(options_.activeOn);
    }
    recomputeCanonicalNames();

    spdlog::info("Entity store ready: {} entities, {} history entries, {} skipped lines",
                 entities_.size(), getStats().historyEntries, skippedLines_);
}

void EntityStore::refresh(const std::vector<EntityId>& ids) {
    for (auto id : ids) {
        auto& entity = entities_.at(id);
        entity.sortHistories();
        entity.deriveActive(options_.activeOn);
    }
}

void EntityStore::recomputeCanonicalNames() {
    CanonicalNameResolver resolver(*this, options_.activeOn);
    resolver.applyAll(*this);
}

std::optional<EntityId> EntityStore::find(std::string_view name) const {
    auto it = byName_.find(common::foldCase(common::trimmed(name)));
    if (it == byName_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<EntityId> EntityStore::findByAnyName(std::string_view name) const {
    if (auto id = find(name)) {
        return id;
    }
    const auto trimmedName = common::trimmed(name);
    for (EntityId id = 0; id < entities_.size(); ++id) {
        if (entities_[id].hasName(trimmedName)) {
            return id;
        }
    }
    return std::nullopt;
}

const Entity* EntityStore::get(std::string_view name) const {
    if (auto id = find(name)) {
        return &entities_[*id];
    }
    return nullptr;
}

EntityStore::Stats EntityStore::getStats() const {
    Stats stats;
    stats.entityCount = entities_.size();
    stats.skippedLines = skippedLines_;
    stats.skippedSections = skippedSections_;
    for (const auto& entity : entities_) {
        stats.historyEntries += entity.historySize();
        stats.perType[entity.type]++;
    }
    return stats;
}

void EntityStore::warn(std::string message) {
    spdlog::warn("{}", message);
    warnings_.push_back(std::move(message));
}

} // namespace lore::entity
