#include <spdlog/spdlog.h>
#include <lore/common/text_utils.h>
#include <lore/overlay/event_overlay.h>

#include <algorithm>
#include <format>

namespace lore::overlay {

using entity::IdentityKind;

EventOverlayMerger::EventOverlayMerger(entity::EntityStore& store,
                                       const search::FuzzyResolver& resolver)
    : store_(store), resolver_(resolver) {}

Result<EntityId> EventOverlayMerger::resolveTarget(const std::string& targetName) const {
    if (auto id = store_.findByAnyName(targetName)) {
        return *id;
    }

    const auto result = resolver_.resolve(targetName);
    if (!result.resolved()) {
        return Error{ErrorCode::NotFound, std::format("no entity matches '{}'", targetName)};
    }

    const auto& owner = *result.owner;
    if (owner.kind == IdentityKind::Entity) {
        spdlog::debug("Event target '{}' resolved to '{}' ({})", targetName,
                      store_.at(owner.id).name,
                      search::matchConfidenceToString(result.confidence));
        return owner.id;
    }

    const auto& index = resolver_.index();
    const auto& linked = index.linkedEntities(owner.id);
    if (!linked.empty()) {
        return linked.front();
    }

    const auto& player = index.players().at(owner.id);
    if (auto id = store_.findByAnyName(player.name)) {
        return *id;
    }
    for (const auto& alias : player.aliases) {
        if (auto id = store_.findByAnyName(alias)) {
            return *id;
        }
    }
    return Error{ErrorCode::NotFound,
                 std::format("'{}' resolved to player '{}' who has no entity", targetName,
                             player.name)};
}

Result<void> EventOverlayMerger::applyRecord(const ChangeRecord& record, OverlayReport& report) {
    auto target = resolveTarget(record.targetName);
    if (!target) {
        return target.error();
    }

    const EntityId id = target.value();
    auto& entity = store_.at(id);
    std::size_t appended = 0;

    for (const auto& [key, raw] : record.tags) {
        if (common::trimmed(key).empty() || common::trimmed(raw).empty()) {
            auto message = std::format("{} '{}': empty tag or value skipped",
                                       temporal::formatDate(record.date), record.targetName);
            spdlog::warn("{}", message);
            report.warnings.push_back(std::move(message));
            continue;
        }

        auto parsed = temporal::parseScopedValue(raw);
        if (!parsed.hasBounds()) {
            parsed.validFrom = record.date;
        }

        const auto tag = entity.applyAttribute(key, parsed);
        if (entity::affectsContainment(tag)) {
            containmentChanged_ = true;
        }
        ++appended;
    }

    if (appended > 0) {
        report.entriesAppended += appended;
        if (std::find(touched_.begin(), touched_.end(), id) == touched_.end()) {
            touched_.push_back(id);
            report.touched.push_back(entity.name);
        }
    }
    return {};
}

OverlayReport EventOverlayMerger::apply(std::vector<ChangeRecord> records) {
    OverlayReport report;
    touched_.clear();
    containmentChanged_ = false;

    std::stable_sort(records.begin(), records.end(),
                     [](const ChangeRecord& a, const ChangeRecord& b) { return a.date < b.date; });

    for (const auto& record : records) {
        auto result = applyRecord(record, report);
        if (!result) {
            ++report.skipped;
            auto message = std::format("{} event for '{}' skipped: {}",
                                       temporal::formatDate(record.date), record.targetName,
                                       result.error().message);
            spdlog::warn("{}", message);
            report.warnings.push_back(std::move(message));
            continue;
        }
        ++report.applied;
    }

    store_.refresh(touched_);
    if (containmentChanged_) {
        store_.recomputeCanonicalNames();
    }

    spdlog::info("Event overlay: {} applied, {} skipped, {} entities touched", report.applied,
                 report.skipped, report.touched.size());
    return report;
}

} // namespace lore::overlay
