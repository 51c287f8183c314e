#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>

class Label;

// Random-access helpers shared by every contiguous Input backend.
// `bytes` is the whole padded buffer.
namespace slice_ops {

inline bool isJsonWhitespace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

std::optional<size_t> seekBackward(std::string_view bytes, size_t from, char needle);

std::optional<std::pair<size_t, char>> seekNonWhitespaceForward(std::string_view bytes, size_t from);

std::optional<std::pair<size_t, char>> seekNonWhitespaceBackward(std::string_view bytes, size_t from);

bool isMemberMatch(std::string_view bytes, size_t from, size_t to, const Label& label);

} // namespace slice_ops
