#pragma once

#include <cstddef>
#include <optional>
#include "input/input.h"
#include "query/label.h"

// Confirmed match: absolute offset of the label's opening quote, and the
// block in which the scan found it
template <size_t N>
struct LabelMatch {
    size_t position;
    Block<N> block;
};

/**
 * Memmem - strategy for finding the next occurrence of a label as an object
 * key. Every strategy has the same contract and differs only in speed.
 */
template <size_t N>
class Memmem {
public:
    virtual ~Memmem() = default;

    /**
     * Finds the first confirmed match at or after `startIdx`.
     *
     * `firstBlock` is a block the caller already holds that spans `startIdx`;
     * it is scanned before any block is pulled from the iterator. Returns
     * std::nullopt once the iterator is exhausted. Throws InputError when
     * reading the input fails.
     */
    virtual std::optional<LabelMatch<N>> findLabel(std::optional<Block<N>> firstBlock,
                                                   size_t startIdx,
                                                   const Label& label) = 0;
};
