#include <spdlog/spdlog.h>
#include <lore/world/world_builder.h>

namespace lore::world {

Result<EntityId> World::resolveEntity(const std::string& query) const {
    overlay::EventOverlayMerger lookup(*store, *resolver);
    return lookup.resolveTarget(query);
}

WorldBuilder::WorldBuilder(config::EngineConfig config) : config_(std::move(config)) {}

WorldBuilder& WorldBuilder::addSource(entity::DeclarationSource source) {
    sources_.push_back(std::move(source));
    return *this;
}

WorldBuilder& WorldBuilder::addPlayer(entity::PlayerRecord player) {
    players_.push_back(std::move(player));
    return *this;
}

WorldBuilder& WorldBuilder::addChange(overlay::ChangeRecord record) {
    changes_.push_back(std::move(record));
    return *this;
}

search::FuzzyResolverOptions WorldBuilder::resolverOptions() const {
    search::FuzzyResolverOptions options;
    options.rules.minStemLength = config_.minStemLength;
    options.enableCache = config_.enableCache;
    options.strictFuzzyTies = config_.strictFuzzyTies;
    return options;
}

Result<std::unique_ptr<search::NameIndex>>
WorldBuilder::buildIndex(const entity::EntityStore& store) const {
    search::NameIndexOptions options;
    options.minTokenLength = config_.minTokenLength;
    options.activeOn = config_.activeOn;

    auto index = search::NameIndex::build(store, players_, options);
    if (!index) {
        return index.error();
    }
    return std::make_unique<search::NameIndex>(std::move(index).value());
}

Result<World> WorldBuilder::build() const {
    if (auto valid = config_.validate(); !valid) {
        return valid.error();
    }

    entity::EntityStoreOptions storeOptions;
    storeOptions.activeOn = config_.activeOn;

    World world;
    world.store = std::make_unique<entity::EntityStore>(
        entity::EntityStore::build(sources_, storeOptions));

    auto index = buildIndex(*world.store);
    if (!index) {
        return index.error();
    }
    world.index = std::move(index).value();
    world.resolver = std::make_unique<search::FuzzyResolver>(*world.index, resolverOptions());

    if (!changes_.empty()) {
        overlay::EventOverlayMerger merger(*world.store, *world.resolver);
        world.overlay = merger.apply(changes_);

        // Resolver first: it refers to the index being replaced
        world.resolver.reset();
        auto rebuilt = buildIndex(*world.store);
        if (!rebuilt) {
            return rebuilt.error();
        }
        world.index = std::move(rebuilt).value();
        world.resolver =
            std::make_unique<search::FuzzyResolver>(*world.index, resolverOptions());
    }

    spdlog::info("World ready: {} entities, {} players, {} index keys ({} ambiguous)",
                 world.store->size(), players_.size(), world.index->size(),
                 world.index->ambiguousCount());
    return world;
}

} // namespace lore::world
