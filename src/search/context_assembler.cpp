#include <kgrag/common/utf8_utils.h>
#include <kgrag/search/context_assembler.h>

#include <fmt/format.h>

namespace kgrag::search {

std::string ContextAssembler::assemble(const RetrievalResult& result) const {
    std::string out;
    size_t outChars = 0;
    size_t index = 0;

    for (const auto& c : result.candidates) {
        if (options_.maxPassages > 0 && index >= options_.maxPassages)
            break;

        std::string source = c.chunkId;
        if (options_.annotateRelations && !c.isSeed && c.relationType)
            source += ", via " + *c.relationType;

        std::string block = fmt::format("[{}] {} (Source: {})", index + 1,
                                        common::utf8Prefix(c.text, options_.maxPassageChars),
                                        source);
        const size_t separator = out.empty() ? 0 : 2;
        const size_t blockChars = common::utf8Length(block);
        if (outChars + separator + blockChars > options_.maxChars)
            break;

        if (separator)
            out += "\n\n";
        out += block;
        outChars += separator + blockChars;
        ++index;
    }
    return out;
}

} // namespace kgrag::search
