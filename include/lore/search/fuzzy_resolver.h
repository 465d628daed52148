#pragma once

#include <lore/core/types.h>
#include <lore/search/bk_tree.h>
#include <lore/search/morphology.h>
#include <lore/search/name_index.h>

#include <atomic>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace lore::search {

enum class MatchConfidence { Exact, Morphological, Fuzzy };

constexpr const char* matchConfidenceToString(MatchConfidence confidence) {
    switch (confidence) {
        case MatchConfidence::Exact: return "exact";
        case MatchConfidence::Morphological: return "morphological";
        case MatchConfidence::Fuzzy: return "fuzzy";
    }
    return "exact";
}

/**
 * @brief Outcome of resolving one query. An empty owner means unresolved.
 */
struct ResolutionResult {
    std::optional<OwnerRef> owner;
    MatchConfidence confidence = MatchConfidence::Exact;
    std::string matchedKey;
    // Edit distance for fuzzy matches, 0 otherwise
    std::size_t distance = 0;

    bool resolved() const { return owner.has_value(); }
};

struct FuzzyResolverOptions {
    MorphologyRules rules = MorphologyRules::polish();
    bool enableCache = true;
    // Treat equally close fuzzy candidates with different owners as unresolved
    bool strictFuzzyTies = false;
};

/**
 * @brief Multi-stage query resolution over a NameIndex.
 *
 * Stages, first success wins:
 *  1. exact key lookup (ambiguous keys are a miss)
 *  2. suffix stripping against a stem index
 *  3. consonant alternation reversal, then the stem index again
 *  4. Levenshtein search through a BK-tree with a length-scaled threshold
 *
 * An optional owner type restricts every stage. The resolver never mutates the index;
 * concurrent resolve() calls are safe, the query cache is guarded by a shared mutex.
 */
class FuzzyResolver {
public:
    struct CacheStats {
        std::size_t hits = 0;
        std::size_t misses = 0;
        std::size_t entries = 0;
    };

    explicit FuzzyResolver(const NameIndex& index, FuzzyResolverOptions options = {});

    ResolutionResult resolve(std::string_view query,
                             std::optional<EntityType> ownerType = std::nullopt) const;

    // Largest accepted edit distance for a key of `keyLength` code points
    static std::size_t fuzzyThreshold(std::size_t keyLength);

    void clearCache();
    CacheStats cacheStats() const;

    const NameIndex& index() const { return index_; }
    const BKTree& tree() const { return tree_; }

private:
    struct StemOwner {
        OwnerRef owner;
        NamePriority priority;
    };

    void buildStemIndex();
    ResolutionResult resolveUncached(std::string_view query,
                                     std::optional<EntityType> ownerType) const;

    std::optional<ResolutionResult> exactStage(const std::string& folded,
                                               std::optional<EntityType> ownerType) const;
    std::optional<ResolutionResult> stemStage(const std::string& folded,
                                              std::optional<EntityType> ownerType) const;
    std::optional<ResolutionResult> alternationStage(const std::string& folded,
                                                     std::optional<EntityType> ownerType) const;
    std::optional<ResolutionResult> fuzzyStage(const std::string& folded,
                                               std::optional<EntityType> ownerType) const;

    std::optional<OwnerRef> lookupStem(const std::string& stem,
                                       std::optional<EntityType> ownerType) const;
    bool accepts(const OwnerRef& owner, std::optional<EntityType> ownerType) const;

    const NameIndex& index_;
    FuzzyResolverOptions options_;
    std::unordered_map<std::string, std::vector<StemOwner>> stemIndex_;
    BKTree tree_;

    mutable std::shared_mutex cacheMutex_;
    mutable std::unordered_map<std::string, ResolutionResult> cache_;
    mutable std::atomic<std::size_t> hits_{0};
    mutable std::atomic<std::size_t> misses_{0};
};

} // namespace lore::search
