/*
 * engram - Text normalization and content fingerprints
 */
#ifndef engram_MEMORY_TEXT_HPP
#define engram_MEMORY_TEXT_HPP

#include <string>

namespace engram {

// Lowercase, collapse whitespace runs to one space, trim both ends
std::string normalize_text(const std::string& text);

// SHA-256 hex of normalize_text(context + "|" + action + "|" + result).
// Equal for inputs that differ only in case or whitespace.
std::string fingerprint(const std::string& context,
                        const std::string& action,
                        const std::string& result);

} // namespace engram

#endif // engram_MEMORY_TEXT_HPP
