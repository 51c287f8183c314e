#include "memmem/mask_64.h"
#include "input/input.h"
#include "query/label.h"
#include "utils/Log.h"

std::optional<size_t> findInMask(const Input& input,
                                 const Label& label,
                                 uint64_t previousBlock,
                                 uint64_t first,
                                 uint64_t second,
                                 size_t offset) {
    const size_t labelSize = label.bytesWithQuotes().size();
    uint64_t result = (previousBlock | (first << 1)) & second;

    while (result != 0) {
        const size_t idx = static_cast<size_t>(__builtin_ctzll(result));

        // No room for an opening quote before the start of the input
        if (offset + idx >= 2) {
            const size_t from = offset + idx - 2;
            const size_t to = offset + idx + labelSize - 3;
            Log::debug("mask candidate [", from, ", ", to, "]");

            if (input.isMemberMatch(from, to, label)) {
                return from;
            }
        }
        result &= ~(uint64_t{1} << idx);
    }
    return std::nullopt;
}
