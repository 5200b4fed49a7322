#include <engram/memory/text.hpp>
#include <engram/core/utils.hpp>

namespace engram {

std::string normalize_text(const std::string& text) {
    return normalize_whitespace(to_lower(text));
}

std::string fingerprint(const std::string& context,
                        const std::string& action,
                        const std::string& result) {
    return sha256_hex(normalize_text(context + "|" + action + "|" + result));
}

} // namespace engram
