#pragma once

#include <kgrag/search/retrieval_types.h>

#include <cstddef>
#include <string>

namespace kgrag::search {

struct ContextOptions {
    size_t maxChars = 12000;          // whole block, in characters
    size_t maxPassageChars = 400;     // per passage text
    size_t maxPassages = 0;           // 0 = no limit
    bool annotateRelations = true;    // "(Source: id, via REL)" for neighbors
};

/**
 * @brief Renders a result as a numbered, source-attributed context block.
 *
 * Each passage reads "[i] <text> (Source: <id>)"; passages are separated by a
 * blank line. Stops before the passage that would exceed maxChars.
 */
class ContextAssembler {
public:
    explicit ContextAssembler(ContextOptions options = {}) : options_(options) {}

    std::string assemble(const RetrievalResult& result) const;

private:
    ContextOptions options_;
};

} // namespace kgrag::search
