#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

class Input;
class Label;

/**
 * Finds the first confirmed match among the candidates of one 64-byte window.
 *
 * Mask convention, for the window starting at absolute `offset`:
 *   first  - bit i set iff byte i equals label.bytesWithQuotes()[1]
 *   second - bit i set iff byte i equals label.bytesWithQuotes()[2]
 *            (all bits set for the empty label)
 *   previousBlock - bit 63 of the previous window's `first`, in bit 0
 *
 * A set bit idx in (previousBlock | first << 1) & second is the byte two
 * positions after a possible opening quote, so the candidate span is
 * [offset + idx - 2, offset + idx + |label with quotes| - 3]. Candidates are
 * validated in ascending order and the first accepted quote offset is
 * returned. std::nullopt means no match in this window only.
 */
std::optional<size_t> findInMask(const Input& input,
                                 const Label& label,
                                 uint64_t previousBlock,
                                 uint64_t first,
                                 uint64_t second,
                                 size_t offset);
