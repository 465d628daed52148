#pragma once

#include <lore/core/types.h>

#include <algorithm>
#include <limits>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace lore::search {

/**
 * @brief Distance metric interface for BK-tree
 */
class IDistanceMetric {
public:
    virtual ~IDistanceMetric() = default;
    virtual size_t distance(const std::string& s1, const std::string& s2) const = 0;
};

/**
 * @brief Levenshtein distance over Unicode code points of UTF-8 input
 *
 * Comparison is exact; callers fold case before inserting or querying.
 */
class LevenshteinDistance : public IDistanceMetric {
public:
    size_t distance(const std::string& s1, const std::string& s2) const override;
};

/**
 * @brief BK-tree node
 */
struct BKNode {
    std::string value;
    std::unordered_map<size_t, std::unique_ptr<BKNode>> children;

    explicit BKNode(const std::string& val) : value(val) {}
};

/**
 * @brief BK-tree for fast fuzzy string matching
 *
 * A BK-tree (Burkhard-Keller tree) is a metric tree specifically adapted to
 * discrete metric spaces. It finds all strings within a given edit distance
 * without comparing the query against every stored string.
 *
 * Average time complexity: O(log n)
 * Worst case: O(n) for pathological cases
 */
class BKTree {
public:
    /**
     * @brief Construct BK-tree with specified distance metric
     * @param metric Distance metric to use (defaults to Levenshtein)
     */
    explicit BKTree(std::unique_ptr<IDistanceMetric> metric =
                        std::make_unique<LevenshteinDistance>());

    /**
     * @brief Add a string to the tree (duplicates are ignored)
     */
    void add(const std::string& value);

    void addBatch(const std::vector<std::string>& values);

    /**
     * @brief Search for strings within a given distance
     * @param query Query string
     * @param maxDistance Maximum edit distance
     * @return Matching strings with their distances, ordered by distance then value
     */
    std::vector<std::pair<std::string, size_t>> search(const std::string& query,
                                                       size_t maxDistance) const;

    /**
     * @brief Search for best N matches
     */
    std::vector<std::pair<std::string, size_t>>
    searchBest(const std::string& query, size_t maxResults,
               size_t maxDistance = std::numeric_limits<size_t>::max()) const;

    size_t size() const { return size_; }
    bool empty() const { return root_ == nullptr; }
    void clear();


    struct Stats {
        size_t nodeCount;
        size_t maxDepth;
        double averageBranching;
        size_t totalStrings;
    };
    Stats getStats() const;

private:
    std::unique_ptr<BKNode> root_;
    std::unique_ptr<IDistanceMetric> metric_;
    size_t size_ = 0;

    bool addToNode(BKNode* node, const std::string& value);
    void searchNode(const BKNode* node, const std::string& query, size_t maxDistance,
                    std::vector<std::pair<std::string, size_t>>& results) const;
    void collectStats(const BKNode* node, size_t depth, Stats& stats) const;
};

} // namespace lore::search
