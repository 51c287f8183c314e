#pragma once

#include <cstddef>
#include <optional>
#include "input/input.h"
#include "memmem/memmem_interface.h"
#include "query/label.h"

// Scans a block the caller already holds, from `startIdx` onwards, for an
// opening quote that starts a confirmed match.
template <size_t N>
std::optional<LabelMatch<N>> findLabelInFirstBlock(const Input& input,
                                                   const Block<N>& block,
                                                   size_t startIdx,
                                                   const Label& label) {
    const size_t labelSize = label.bytesWithQuotes().size();
    const size_t begin = startIdx > block.offset() ? startIdx - block.offset() : 0;

    for (size_t i = begin; i < N; i++) {
        if (block[i] != '"') continue;

        const size_t j = block.offset() + i;
        if (input.isMemberMatch(j, j + labelSize - 1, label)) {
            return LabelMatch<N>{j, block};
        }
    }
    return std::nullopt;
}
