#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include "input/input.h"
#include "memmem/first_block.h"
#include "memmem/mask_64.h"
#include "memmem/memmem_interface.h"
#include "query/label.h"
#include "utils/SimdUtils.h"

/**
 * Bit-parallel strategy. Each block is processed as 64-byte windows: the
 * SIMD byte-mask kernel marks the label's first and second characters and
 * findInMask validates the adjacent pairs. Bit 63 of `first` is carried into
 * the next window, so a pair split across windows or blocks is still seen.
 */
template <size_t N>
class BitmaskMemmem : public Memmem<N> {
public:
    static_assert(N % 64 == 0, "bitmask matcher needs whole 64-byte windows");

    BitmaskMemmem(const Input& input, BlockIterator<N>& iter) : input_(input), iter_(iter) {}

    std::optional<LabelMatch<N>> findLabel(std::optional<Block<N>> firstBlock,
                                           size_t startIdx,
                                           const Label& label) override {
        if (firstBlock) {
            if (auto res = findLabelInFirstBlock(input_, *firstBlock, startIdx, label)) {
                return res;
            }
        }
        return findLabelMasked(label, startIdx, iter_.getOffset());
    }

private:
    std::optional<LabelMatch<N>> findLabelMasked(const Label& label, size_t startIdx, size_t offset) {
        const std::string_view quoted = label.bytesWithQuotes();
        const char firstChar = quoted[1];
        const bool hasSecond = quoted.size() > 2;
        const char secondChar = hasSecond ? quoted[2] : '"';

        uint64_t previousBlock = 0;
        while (auto block = iter_.next()) {
            for (size_t w = 0; w < N; w += 64) {
                const char* window = block->data() + w;
                const uint64_t first = SimdUtils::byteMask64(window, firstChar);
                uint64_t second = hasSecond ? SimdUtils::byteMask64(window, secondChar) : ~uint64_t{0};

                // Bit idx stands for a quote at offset + w + idx - 2, which
                // must not come before startIdx
                if (startIdx + 2 > offset + w) {
                    const size_t below = startIdx + 2 - (offset + w);
                    second &= below >= 64 ? 0 : ~((uint64_t{1} << below) - 1);
                }

                if (auto pos = findInMask(input_, label, previousBlock, first, second, offset + w)) {
                    return LabelMatch<N>{*pos, *block};
                }
                previousBlock = first >> 63;
            }
            offset += N;
        }
        return std::nullopt;
    }

    const Input& input_;
    BlockIterator<N>& iter_;
};
