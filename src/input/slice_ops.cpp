#include "input/slice_ops.h"
#include "query/label.h"

namespace slice_ops {

std::optional<size_t> seekBackward(std::string_view bytes, size_t from, char needle) {
    if (from >= bytes.size()) return std::nullopt;

    size_t idx = from;
    while (true) {
        if (bytes[idx] == needle) return idx;
        if (idx == 0) return std::nullopt;
        idx--;
    }
}

std::optional<std::pair<size_t, char>> seekNonWhitespaceForward(std::string_view bytes, size_t from) {
    for (size_t idx = from; idx < bytes.size(); idx++) {
        if (!isJsonWhitespace(bytes[idx])) {
            return std::make_pair(idx, bytes[idx]);
        }
    }
    return std::nullopt;
}

std::optional<std::pair<size_t, char>> seekNonWhitespaceBackward(std::string_view bytes, size_t from) {
    if (from >= bytes.size()) return std::nullopt;

    size_t idx = from;
    while (true) {
        if (!isJsonWhitespace(bytes[idx])) return std::make_pair(idx, bytes[idx]);
        if (idx == 0) return std::nullopt;
        idx--;
    }
}

bool isMemberMatch(std::string_view bytes, size_t from, size_t to, const Label& label) {
    const std::string_view quoted = label.bytesWithQuotes();
    if (from > to || to >= bytes.size() || to - from + 1 != quoted.size()) {
        return false;
    }
    if (bytes.substr(from, quoted.size()) != quoted) {
        return false;
    }

    // An odd run of backslashes before the opening quote escapes it
    size_t backslashes = 0;
    for (size_t i = from; i > 0 && bytes[i - 1] == '\\'; i--) {
        backslashes++;
    }
    if (backslashes % 2 != 0) {
        return false;
    }

    // Only a key is followed by a colon
    auto next = seekNonWhitespaceForward(bytes, to + 1);
    return next.has_value() && next->second == ':';
}

} // namespace slice_ops
