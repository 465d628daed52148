#include <spdlog/spdlog.h>
#include <lore/common/text_utils.h>
#include <lore/search/name_index.h>

#include <algorithm>

namespace lore::search {

using entity::EntityIdentity;
using entity::IdentityKind;
using entity::PlayerIdentity;

NameIndex::NameIndex(const entity::EntityStore& store, std::vector<entity::PlayerRecord> players,
                     NameIndexOptions options)
    : store_(&store), players_(std::move(players)), options_(options),
      playerEntities_(players_.size()) {}

Result<NameIndex> NameIndex::build(const entity::EntityStore& store,
                                   std::vector<entity::PlayerRecord> players,
                                   NameIndexOptions options) {
    if (options.minTokenLength == 0) {
        return Error{ErrorCode::InvalidArgument, "minTokenLength must be at least 1"};
    }

    NameIndex index(store, std::move(players), options);
    index.linkPlayers();

    for (EntityId id = 0; id < store.size(); ++id) {
        EntityIdentity identity(store.at(id), id, options.activeOn);
        if (auto it = index.entityToPlayer_.find(id); it != index.entityToPlayer_.end()) {
            index.indexIdentity(identity, OwnerRef{IdentityKind::Player, it->second},
                                EntityType::Player);
        } else {
            index.indexIdentity(identity, identity.ref(), identity.ownerType());
        }
    }

    for (std::size_t pid = 0; pid < index.players_.size(); ++pid) {
        PlayerIdentity identity(index.players_[pid], pid);
        index.indexIdentity(identity, identity.ref(), identity.ownerType());
    }

    spdlog::debug("Name index built: {} keys ({} ambiguous), {} players", index.size(),
                  index.ambiguousCount(), index.players_.size());
    return index;
}

void NameIndex::linkPlayers() {
    for (std::size_t pid = 0; pid < players_.size(); ++pid) {
        common::NameSet playerNames;
        playerNames.insert(players_[pid].name);
        for (const auto& alias : players_[pid].aliases) {
            playerNames.insert(alias);
        }

        for (EntityId id = 0; id < store_->size(); ++id) {
            const auto& e = store_->at(id);
            const auto type = e.effectiveType(options_.activeOn);
            if (type != EntityType::Player && type != EntityType::PlayerCharacter) {
                continue;
            }
            if (entityToPlayer_.contains(id)) {
                continue;
            }
            const bool shared = std::any_of(e.names.begin(), e.names.end(),
                                            [&](const auto& n) { return playerNames.contains(n); });
            if (shared) {
                entityToPlayer_.emplace(id, pid);
                playerEntities_[pid].push_back(id);
                spdlog::debug("Player '{}' merged with entity '{}'", players_[pid].name, e.name);
            }
        }
    }
}

void NameIndex::indexIdentity(const entity::Identity& identity, const OwnerRef& owner,
                              EntityType type) {
    std::vector<std::string> names{identity.name()};
    auto aliases = identity.aliases(options_.activeOn);
    names.insert(names.end(), aliases.begin(), aliases.end());

    for (const auto& name : names) {
        insert(name, owner, type, NamePriority::FullNameOrAlias);
    }

    for (const auto& name : names) {
        auto words = common::splitWhitespace(name);
        if (words.size() < 2) {
            continue;
        }
        for (const auto& word : words) {
            auto token = common::trimPunctuation(word);
            if (common::codePointLength(token) >= options_.minTokenLength) {
                insert(token, owner, type, NamePriority::Token);
            }
        }
    }
}

void NameIndex::insert(std::string_view name, const OwnerRef& owner, EntityType type,
                       NamePriority priority) {
    auto key = common::foldCase(common::trimmed(name));
    if (key.empty()) {
        return;
    }

    auto [it, created] = entries_.try_emplace(std::move(key));
    auto& entry = it->second;
    if (created || entry.priority < priority) {
        entry.owner = owner;
        entry.ownerType = type;
        entry.priority = priority;
        entry.ambiguous = false;
        entry.owners = {owner};
        return;
    }
    if (entry.priority > priority) {
        return;
    }
    if (std::find(entry.owners.begin(), entry.owners.end(), owner) == entry.owners.end()) {
        entry.owners.push_back(owner);
        entry.ambiguous = true;
    }
}

const NameIndexEntry* NameIndex::find(std::string_view key) const {
    auto it = entries_.find(common::foldCase(common::trimmed(key)));
    return it == entries_.end() ? nullptr : &it->second;
}

std::vector<std::string> NameIndex::keys() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& [key, _] : entries_) {
        out.push_back(key);
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::size_t NameIndex::ambiguousCount() const {
    return static_cast<std::size_t>(std::count_if(
        entries_.begin(), entries_.end(), [](const auto& kv) { return kv.second.ambiguous; }));
}

const std::string& NameIndex::displayName(const OwnerRef& owner) const {
    if (owner.kind == IdentityKind::Player) {
        return players_.at(owner.id).name;
    }
    return store_->at(owner.id).name;
}

EntityType NameIndex::ownerType(const OwnerRef& owner) const {
    if (owner.kind == IdentityKind::Player) {
        return EntityType::Player;
    }
    return store_->at(owner.id).effectiveType(options_.activeOn);
}

const std::vector<EntityId>& NameIndex::linkedEntities(std::size_t playerId) const {
    return playerEntities_.at(playerId);
}

} // namespace lore::search
