#pragma once

#include <string>
#include <string_view>

/**
 * Label - the JSON object key a query searches for.
 *
 * Holds the key exactly as it appears between the quotes in the document
 * (already in its escaped form). Immutable once built; one Label is shared by
 * every matching attempt for the same query term.
 */
class Label {
public:
    explicit Label(std::string_view key);

    // Key bytes without the surrounding quotes
    std::string_view bytes() const;

    // Key bytes including both delimiting quotes: bytes().size() + 2
    std::string_view bytesWithQuotes() const;

    bool operator==(const Label& other) const { return quoted_ == other.quoted_; }
    bool operator!=(const Label& other) const { return !(*this == other); }

private:
    std::string quoted_;
};
