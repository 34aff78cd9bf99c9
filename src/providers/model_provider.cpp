#include <kgrag/common/utf8_utils.h>
#include <kgrag/providers/model_provider.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace kgrag::providers {

Result<std::string> prepareModelInput(std::string_view text, size_t maxChars) {
    const bool blank = std::all_of(text.begin(), text.end(),
                                   [](unsigned char c) { return std::isspace(c) != 0; });
    if (blank) {
        return Error{ErrorCode::InvalidArgument, "model input text is empty"};
    }

    if (maxChars > 0 && text.size() > maxChars) {
        const size_t length = common::utf8Length(text);
        if (length > maxChars) {
            spdlog::debug("truncating model input from {} to {} characters", length, maxChars);
            return common::utf8Prefix(text, maxChars);
        }
    }
    return std::string(text);
}

} // namespace kgrag::providers
