#pragma once

#include <cstddef>
#include <optional>
#include "input/input.h"
#include "memmem/first_block.h"
#include "memmem/memmem_interface.h"
#include "query/label.h"
#include "utils/Log.h"

// Scalar fallback: byte-by-byte scan for the label's first character
template <size_t N>
class LinearMemmem : public Memmem<N> {
public:
    LinearMemmem(const Input& input, BlockIterator<N>& iter) : input_(input), iter_(iter) {}

    std::optional<LabelMatch<N>> findLabel(std::optional<Block<N>> firstBlock,
                                           size_t startIdx,
                                           const Label& label) override {
        if (firstBlock) {
            if (auto res = findLabelInFirstBlock(input_, *firstBlock, startIdx, label)) {
                return res;
            }
        }
        return findLabelSequential(label, startIdx, iter_.getOffset());
    }

private:
    std::optional<LabelMatch<N>> findLabelSequential(const Label& label, size_t startIdx, size_t offset) {
        const size_t labelSize = label.bytesWithQuotes().size();
        const char firstChar = label.bytesWithQuotes()[1];

        while (auto block = iter_.next()) {
            for (size_t i = 0; i < N; i++) {
                if ((*block)[i] != firstChar) continue;

                // The opening quote sits one byte before the first character
                const size_t j = offset + i;
                if (j == 0 || j - 1 < startIdx) continue;

                Log::debug("linear candidate [", j - 1, ", ", j + labelSize - 2, "]");
                if (input_.isMemberMatch(j - 1, j + labelSize - 2, label)) {
                    return LabelMatch<N>{j - 1, *block};
                }
            }
            offset += N;
        }
        return std::nullopt;
    }

    const Input& input_;
    BlockIterator<N>& iter_;
};
