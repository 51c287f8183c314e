#ifndef JSONLABEL_INPUT_H
#define JSONLABEL_INPUT_H

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

class Label;

// Default block size used by the matchers
constexpr size_t BLOCK_SIZE = 64;

// Every input is padded to a multiple of this; block sizes must divide it
constexpr size_t MAX_BLOCK_SIZE = 128;

// Length of `len` bytes once rounded up to the next multiple of MAX_BLOCK_SIZE
inline size_t paddedLength(size_t len) {
    const size_t rem = len % MAX_BLOCK_SIZE;
    return rem == 0 ? len : len + (MAX_BLOCK_SIZE - rem);
}

/**
 * I/O failure while opening, mapping or reading a backing store.
 * Carries the errno value of the failed call.
 */
class InputError : public std::system_error {
public:
    InputError(int errnum, const std::string& what)
        : std::system_error(errnum, std::generic_category(), what) {}
};

/**
 * Block - read-only view of exactly N bytes of an Input.
 *
 * Does not own its bytes: a Block is valid only as long as the Input that
 * produced it is alive.
 */
template <size_t N>
class Block {
public:
    Block(const char* data, size_t offset) : data_(data), offset_(offset) {}

    const char* data() const { return data_; }

    // Absolute offset of the first byte of the block
    size_t offset() const { return offset_; }

    static constexpr size_t size() { return N; }

    char operator[](size_t i) const { return data_[i]; }

    std::string_view view() const { return std::string_view(data_, N); }

private:
    const char* data_;
    size_t offset_;
};

template <size_t N>
class BlockIterator;

/**
 * Input - windowed byte source consumed by the label matchers.
 *
 * The logical length is always padded to a multiple of MAX_BLOCK_SIZE with
 * zero bytes, so block iteration never produces a short block. Once built an
 * Input is read-only and can back any number of iterators.
 */
class Input {
public:
    virtual ~Input() = default;

    // Padded length
    virtual size_t len() const = 0;

    // Length of the real data, without padding
    virtual size_t dataLen() const = 0;

    // Pointer to `size` bytes starting at `offset`, or nullptr once `offset`
    // reaches the padded end
    virtual const char* window(size_t offset, size_t size) const = 0;

    virtual std::optional<size_t> seekBackward(size_t from, char needle) const = 0;
    virtual std::optional<std::pair<size_t, char>> seekNonWhitespaceForward(size_t from) const = 0;
    virtual std::optional<std::pair<size_t, char>> seekNonWhitespaceBackward(size_t from) const = 0;

    // True iff the inclusive span [from, to] holds label.bytesWithQuotes()
    // as an unescaped object key.
    virtual bool isMemberMatch(size_t from, size_t to, const Label& label) const = 0;

    template <size_t N>
    BlockIterator<N> iterBlocks() const;
};

/**
 * BlockIterator - forward-only cursor over an Input yielding N-byte blocks.
 *
 * Copies are independent cursors over the same Input.
 */
template <size_t N>
class BlockIterator {
public:
    static_assert(N > 0 && MAX_BLOCK_SIZE % N == 0, "block size must divide MAX_BLOCK_SIZE");

    explicit BlockIterator(const Input& input) : input_(&input), idx_(0) {}

    // Next block, or std::nullopt once the input is exhausted
    std::optional<Block<N>> next() {
        const char* data = input_->window(idx_, N);
        if (data == nullptr) {
            return std::nullopt;
        }
        Block<N> block(data, idx_);
        idx_ += N;
        return block;
    }

    // Offset of the next block to be produced
    size_t getOffset() const { return idx_; }

    void skip(size_t count) { idx_ += count * N; }

private:
    const Input* input_;
    size_t idx_;
};

template <size_t N>
BlockIterator<N> Input::iterBlocks() const {
    return BlockIterator<N>(*this);
}

#endif // JSONLABEL_INPUT_H
