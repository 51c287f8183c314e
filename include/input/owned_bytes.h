#pragma once

#include <istream>
#include <string>
#include <string_view>
#include "input/input.h"

// Input over an owned, zero-padded copy of the data
class OwnedBytes : public Input {
public:
    explicit OwnedBytes(std::string_view contents);

    // Reads the whole file into memory. Throws InputError on failure,
    // including when `path` names a directory.
    static OwnedBytes readFile(const std::string& path);

    // Reads `in` until end of stream; `name` labels error messages.
    static OwnedBytes readStream(std::istream& in, const std::string& name);

    size_t len() const override { return buffer_.size(); }
    size_t dataLen() const override { return dataLen_; }
    const char* window(size_t offset, size_t size) const override;

    std::optional<size_t> seekBackward(size_t from, char needle) const override;
    std::optional<std::pair<size_t, char>> seekNonWhitespaceForward(size_t from) const override;
    std::optional<std::pair<size_t, char>> seekNonWhitespaceBackward(size_t from) const override;
    bool isMemberMatch(size_t from, size_t to, const Label& label) const override;

private:
    std::string buffer_;
    size_t dataLen_;
};
