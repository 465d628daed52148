#include <spdlog/spdlog.h>
#include <lore/common/text_utils.h>
#include <lore/search/fuzzy_resolver.h>

#include <algorithm>
#include <mutex>

namespace lore::search {

namespace {

std::string cacheKey(std::string_view query, std::optional<EntityType> ownerType) {
    std::string key(query);
    key.push_back('\x1f');
    key += ownerType ? entity::entityTypeToString(*ownerType) : "*";
    return key;
}

} // namespace

FuzzyResolver::FuzzyResolver(const NameIndex& index, FuzzyResolverOptions options)
    : index_(index), options_(std::move(options)) {
    options_.rules.normalize();
    buildStemIndex();

    for (const auto& key : index_.keys()) {
        tree_.add(key);
    }
    spdlog::debug("Fuzzy resolver ready: {} stems, {} BK-tree keys", stemIndex_.size(),
                  tree_.size());
}

void FuzzyResolver::buildStemIndex() {
    for (const auto& [key, entry] : index_.entries()) {
        const auto stem = stemPhrase(key, options_.rules);
        for (const auto* form : {&key, &stem}) {
            auto& owners = stemIndex_[*form];
            for (const auto& owner : entry.owners) {
                auto it = std::find_if(owners.begin(), owners.end(),
                                       [&](const StemOwner& s) { return s.owner == owner; });
                if (it == owners.end()) {
                    owners.push_back({owner, entry.priority});
                } else if (it->priority < entry.priority) {
                    it->priority = entry.priority;
                }
            }
        }
    }
}

std::size_t FuzzyResolver::fuzzyThreshold(std::size_t keyLength) {
    return keyLength < 5 ? 1 : keyLength / 3;
}

ResolutionResult FuzzyResolver::resolve(std::string_view query,
                                        std::optional<EntityType> ownerType) const {
    if (!options_.enableCache) {
        return resolveUncached(query, ownerType);
    }

    const auto key = cacheKey(query, ownerType);
    {
        std::shared_lock lock(cacheMutex_);
        if (auto it = cache_.find(key); it != cache_.end()) {
            hits_.fetch_add(1, std::memory_order_relaxed);
            return it->second;
        }
    }

    misses_.fetch_add(1, std::memory_order_relaxed);
    auto result = resolveUncached(query, ownerType);

    std::unique_lock lock(cacheMutex_);
    cache_.emplace(key, result);
    return result;
}

ResolutionResult FuzzyResolver::resolveUncached(std::string_view query,
                                                std::optional<EntityType> ownerType) const {
    const auto folded = common::foldCase(common::trimmed(query));
    if (folded.empty()) {
        return {};
    }

    if (auto hit = exactStage(folded, ownerType)) {
        return *hit;
    }
    if (auto hit = stemStage(folded, ownerType)) {
        spdlog::debug("Resolved '{}' by suffix stripping via '{}'", query, hit->matchedKey);
        return *hit;
    }
    if (auto hit = alternationStage(folded, ownerType)) {
        spdlog::debug("Resolved '{}' by stem alternation via '{}'", query, hit->matchedKey);
        return *hit;
    }
    if (auto hit = fuzzyStage(folded, ownerType)) {
        spdlog::debug("Resolved '{}' fuzzily to '{}' (distance {})", query, hit->matchedKey,
                      hit->distance);
        return *hit;
    }

    spdlog::debug("Could not resolve '{}'", query);
    return {};
}

bool FuzzyResolver::accepts(const OwnerRef& owner, std::optional<EntityType> ownerType) const {
    return !ownerType || index_.ownerType(owner) == *ownerType;
}

std::optional<ResolutionResult>
FuzzyResolver::exactStage(const std::string& folded, std::optional<EntityType> ownerType) const {
    const auto* entry = index_.find(folded);
    if (!entry || entry->ambiguous || !accepts(entry->owner, ownerType)) {
        return std::nullopt;
    }
    return ResolutionResult{entry->owner, MatchConfidence::Exact, folded, 0};
}

std::optional<OwnerRef> FuzzyResolver::lookupStem(const std::string& stem,
                                                  std::optional<EntityType> ownerType) const {
    auto it = stemIndex_.find(stem);
    if (it == stemIndex_.end()) {
        return std::nullopt;
    }

    // Uniqueness is decided over every owner; the type filter only applies to the winner
    std::optional<NamePriority> best;
    std::vector<OwnerRef> winners;
    for (const auto& candidate : it->second) {
        if (!best || candidate.priority > *best) {
            best = candidate.priority;
            winners = {candidate.owner};
        } else if (candidate.priority == *best) {
            winners.push_back(candidate.owner);
        }
    }

    if (winners.size() != 1 || !accepts(winners.front(), ownerType)) {
        return std::nullopt;
    }
    return winners.front();
}

std::optional<ResolutionResult>
FuzzyResolver::stemStage(const std::string& folded, std::optional<EntityType> ownerType) const {
    const auto stem = stemPhrase(folded, options_.rules);
    if (auto owner = lookupStem(stem, ownerType)) {
        return ResolutionResult{*owner, MatchConfidence::Morphological, stem, 0};
    }
    return std::nullopt;
}

std::optional<ResolutionResult>
FuzzyResolver::alternationStage(const std::string& folded,
                                std::optional<EntityType> ownerType) const {
    for (const auto& candidate : alternationCandidates(folded, options_.rules)) {
        for (const auto& form : {candidate, stemPhrase(candidate, options_.rules)}) {
            if (auto owner = lookupStem(form, ownerType)) {
                return ResolutionResult{*owner, MatchConfidence::Morphological, form, 0};
            }
        }
    }
    return std::nullopt;
}

std::optional<ResolutionResult>
FuzzyResolver::fuzzyStage(const std::string& folded, std::optional<EntityType> ownerType) const {
    const auto queryLength = common::codePointLength(folded);
    const auto radius = std::max<std::size_t>(1, queryLength / 2);

    struct Candidate {
        std::string key;
        std::size_t distance;
        std::size_t length;
        OwnerRef owner;
    };
    std::vector<Candidate> candidates;

    for (auto& [key, dist] : tree_.search(folded, radius)) {
        const auto keyLength = common::codePointLength(key);
        const auto threshold = fuzzyThreshold(keyLength);
        const auto gap = keyLength > queryLength ? keyLength - queryLength
                                                 : queryLength - keyLength;
        if (gap > threshold || dist > threshold) {
            continue;
        }
        const auto* entry = index_.find(key);
        if (!entry || entry->ambiguous || !accepts(entry->owner, ownerType)) {
            continue;
        }
        candidates.push_back({key, dist, keyLength, entry->owner});
    }

    if (candidates.empty()) {
        return std::nullopt;
    }

    std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
        if (a.distance != b.distance) {
            return a.distance < b.distance;
        }
        if (a.length != b.length) {
            return a.length < b.length;
        }
        return a.key < b.key;
    });

    const auto& best = candidates.front();
    if (options_.strictFuzzyTies) {
        for (std::size_t i = 1; i < candidates.size() && candidates[i].distance == best.distance;
             ++i) {
            if (!(candidates[i].owner == best.owner)) {
                spdlog::debug("Fuzzy tie between '{}' and '{}' left unresolved", best.key,
                              candidates[i].key);
                return std::nullopt;
            }
        }
    }

    return ResolutionResult{best.owner, MatchConfidence::Fuzzy, best.key, best.distance};
}

void FuzzyResolver::clearCache() {
    std::unique_lock lock(cacheMutex_);
    cache_.clear();
    hits_ = 0;
    misses_ = 0;
}

FuzzyResolver::CacheStats FuzzyResolver::cacheStats() const {
    std::shared_lock lock(cacheMutex_);
    return CacheStats{hits_.load(), misses_.load(), cache_.size()};
}

} // namespace lore::search
