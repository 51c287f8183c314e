#pragma once

#include <string>
#include "input/input.h"

/**
 * MmapInput - Input backed by a read-only memory map of a file.
 *
 * The mapping is padded with zero bytes up to the next multiple of
 * MAX_BLOCK_SIZE. The fastest backend, but only usable on regular files.
 */
class MmapInput : public Input {
public:
    /**
     * Tag required by mapFile. Passing it states that the file will not be
     * modified, in or out of process, while the MmapInput is alive. Nothing
     * checks this; a file changed under the map is undefined behavior.
     */
    struct AssumeUnmodified {
        explicit AssumeUnmodified() = default;
    };

    // Throws InputError when the file cannot be stat-ed or mapped, or is not
    // a regular file (terminal, pipe).
    static MmapInput mapFile(int fd, AssumeUnmodified);
    static MmapInput mapFile(const std::string& path, AssumeUnmodified);

    static constexpr size_t DEFAULT_PAGE_SIZE = 4096;

    // `paddedLen` rounded up to whole pages. A non-positive `pageSize` (a
    // failed sysconf) is replaced by DEFAULT_PAGE_SIZE.
    static size_t mappedLength(size_t paddedLen, long pageSize);

    ~MmapInput() override;

    MmapInput(const MmapInput&) = delete;
    MmapInput& operator=(const MmapInput&) = delete;
    MmapInput(MmapInput&& other) noexcept;
    MmapInput& operator=(MmapInput&& other) noexcept;

    size_t len() const override { return paddedLen_; }
    size_t dataLen() const override { return dataLen_; }
    const char* window(size_t offset, size_t size) const override;

    std::optional<size_t> seekBackward(size_t from, char needle) const override;
    std::optional<std::pair<size_t, char>> seekNonWhitespaceForward(size_t from) const override;
    std::optional<std::pair<size_t, char>> seekNonWhitespaceBackward(size_t from) const override;
    bool isMemberMatch(size_t from, size_t to, const Label& label) const override;

private:
    MmapInput(char* base, size_t mappedLen, size_t dataLen, size_t paddedLen);

    std::string_view bytes() const { return std::string_view(base_, paddedLen_); }
    void release() noexcept;

    char* base_;
    size_t mappedLen_;  // Whole reservation, a multiple of the page size
    size_t dataLen_;
    size_t paddedLen_;
};
