#pragma once

#include <lore/core/types.h>
#include <lore/entity/entity.h>

#include <optional>
#include <string>
#include <vector>

namespace lore::entity {

/**
 * @brief Identity record supplied from outside the store (a real-world player).
 */
struct PlayerRecord {
    std::string name;
    std::vector<std::string> aliases;
};

enum class IdentityKind { Entity, Player };

/**
 * @brief Reference to the owner of an index key: a store entity or an external player.
 */
struct OwnerRef {
    IdentityKind kind = IdentityKind::Entity;
    std::size_t id = 0;

    bool operator==(const OwnerRef&) const = default;
};

/**
 * @brief Anything that can own names in the index.
 */
class Identity {
public:
    virtual ~Identity() = default;

    virtual const std::string& name() const = 0;
    // Every name besides the primary one that should resolve to this identity
    virtual std::vector<std::string> aliases(std::optional<TimePoint> at) const = 0;
    virtual IdentityKind kind() const = 0;
    virtual EntityType ownerType() const = 0;
    virtual OwnerRef ref() const = 0;
};

class EntityIdentity final : public Identity {
public:
    EntityIdentity(const Entity& entity, EntityId id, std::optional<TimePoint> activeOn = {})
        : entity_(entity), id_(id), activeOn_(activeOn) {}

    const std::string& name() const override { return entity_.name; }

    // Active aliases plus generic names (the latter are untemporal)
    std::vector<std::string> aliases(std::optional<TimePoint> at) const override {
        auto out = entity_.activeAliases(at);
        out.insert(out.end(), entity_.genericNames.begin(), entity_.genericNames.end());
        return out;
    }

    IdentityKind kind() const override { return IdentityKind::Entity; }
    EntityType ownerType() const override { return entity_.effectiveType(activeOn_); }
    OwnerRef ref() const override { return OwnerRef{IdentityKind::Entity, id_}; }

    const Entity& entity() const { return entity_; }

private:
    const Entity& entity_;
    EntityId id_;
    std::optional<TimePoint> activeOn_;
};

class PlayerIdentity final : public Identity {
public:
    PlayerIdentity(const PlayerRecord& record, std::size_t id) : record_(record), id_(id) {}

    const std::string& name() const override { return record_.name; }
    std::vector<std::string> aliases(std::optional<TimePoint>) const override {
        return record_.aliases;
    }
    IdentityKind kind() const override { return IdentityKind::Player; }
    EntityType ownerType() const override { return EntityType::Player; }
    OwnerRef ref() const override { return OwnerRef{IdentityKind::Player, id_}; }

private:
    const PlayerRecord& record_;
    std::size_t id_;
};

} // namespace lore::entity
