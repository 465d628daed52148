#include <lore/common/text_utils.h>
#include <lore/search/bk_tree.h>

#include <algorithm>

namespace lore::search {

// Levenshtein Distance Implementation
size_t LevenshteinDistance::distance(const std::string& s1, const std::string& s2) const {
    const auto a = common::decodeUtf8(s1);
    const auto b = common::decodeUtf8(s2);
    const size_t m = a.length();
    const size_t n = b.length();

    if (m == 0)
        return n;
    if (n == 0)
        return m;

    // Use two rows instead of full matrix for space efficiency
    std::vector<size_t> prevRow(n + 1);
    std::vector<size_t> currRow(n + 1);

    for (size_t j = 0; j <= n; ++j) {
        prevRow[j] = j;
    }

    for (size_t i = 1; i <= m; ++i) {
        currRow[0] = i;

        for (size_t j = 1; j <= n; ++j) {
            size_t cost = (a[i - 1] == b[j - 1]) ? 0 : 1;

            currRow[j] = std::min({
                prevRow[j] + 1,       // deletion
                currRow[j - 1] + 1,   // insertion
                prevRow[j - 1] + cost // substitution
            });
        }

        std::swap(prevRow, currRow);
    }

    return prevRow[n];
}

// BKTree Implementation
BKTree::BKTree(std::unique_ptr<IDistanceMetric> metric) : metric_(std::move(metric)) {}

void BKTree::add(const std::string& value) {
    if (!root_) {
        root_ = std::make_unique<BKNode>(value);
        size_++;
        return;
    }

    if (addToNode(root_.get(), value)) {
        size_++;
    }
}

bool BKTree::addToNode(BKNode* node, const std::string& value) {
    while (true) {
        size_t dist = metric_->distance(node->value, value);
        if (dist == 0) {
            // String already exists
            return false;
        }

        auto it = node->children.find(dist);
        if (it == node->children.end()) {
            node->children[dist] = std::make_unique<BKNode>(value);
            return true;
        }
        node = it->second.get();
    }
}

void BKTree::addBatch(const std::vector<std::string>& values) {
    for (const auto& value : values) {
        add(value);
    }
}

std::vector<std::pair<std::string, size_t>> BKTree::search(const std::string& query,
                                                           size_t maxDistance) const {
    std::vector<std::pair<std::string, size_t>> results;

    if (!root_) {
        return results;
    }

    searchNode(root_.get(), query, maxDistance, results);

    std::ranges::sort(results, [](const auto& a, const auto& b) {
        if (a.second != b.second) {
            return a.second < b.second;
        }
        return a.first < b.first;
    });

    return results;
}

void BKTree::searchNode(const BKNode* node, const std::string& query, size_t maxDistance,
                        std::vector<std::pair<std::string, size_t>>& results) const {
    size_t dist = metric_->distance(node->value, query);

    if (dist <= maxDistance) {
        results.emplace_back(node->value, dist);
    }

    // Use triangle inequality to prune search space
    size_t minDist = (dist > maxDistance) ? dist - maxDistance : 0;
    size_t maxDist = dist + maxDistance;

    for (const auto& [childDist, childNode] : node->children) {
        if (childDist >= minDist && childDist <= maxDist) {
            searchNode(childNode.get(), query, maxDistance, results);
        }
    }
}

std::vector<std::pair<std::string, size_t>>
BKTree::searchBest(const std::string& query, size_t maxResults, size_t maxDistance) const {
    auto results = search(query, maxDistance);

    if (results.size() > maxResults) {
        results.resize(maxResults);
    }

    return results;
}

void BKTree::clear() {
    root_.reset();
    size_ = 0;
}

BKTree::Stats BKTree::getStats() const {
    Stats stats{};
    stats.totalStrings = size_;

    if (root_) {
        collectStats(root_.get(), 0, stats);
    }

    if (stats.nodeCount > 0) {
        stats.averageBranching /= static_cast<double>(stats.nodeCount);
    }
    return stats;
}

void BKTree::collectStats(const BKNode* node, size_t depth, Stats& stats) const {
    stats.nodeCount++;
    stats.maxDepth = std::max(stats.maxDepth, depth);
    stats.averageBranching += node->children.size();

    for (const auto& [_, child] : node->children) {
        collectStats(child.get(), depth + 1, stats);
    }
}

} // namespace lore::search
