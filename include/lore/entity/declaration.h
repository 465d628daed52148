#pragma once

#include <string>
#include <vector>

namespace lore::entity {

// Input records produced by the external structured-text reader.

/**
 * @brief One "key: value" line of a declaration, with its indented continuation lines.
 */
struct AttributeLine {
    std::string text;
    std::vector<std::string> continuation;
};

struct EntityDeclaration {
    std::string name;
    std::vector<AttributeLine> lines;
};

// Entities grouped under a section header; the label selects the entity type
struct SectionBlock {
    std::string label;
    std::vector<EntityDeclaration> entities;
};

/**
 * @brief One declaration file.
 *
 * Sources are merged in the order the caller supplies them: lowest precedence first.
 */
struct DeclarationSource {
    std::string id;
    std::vector<SectionBlock> sections;
};

} // namespace lore::entity
