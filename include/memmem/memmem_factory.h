#pragma once

#include <cstddef>
#include <memory>
#include "input/input.h"
#include "memmem/memmem_interface.h"
#include "memmem/impl/bitmask_memmem.h"
#include "memmem/impl/linear_memmem.h"

struct MemmemConfig {
    // Always use the linear matcher, whatever the CPU supports
    static bool ForceLinear;
};

// True when the bitmask matcher should be preferred on this CPU.
// Initializes SimdUtils on first use.
bool useBitmaskMemmem();

template <size_t N>
std::unique_ptr<Memmem<N>> createBestMemmem(const Input& input, BlockIterator<N>& iter) {
    if constexpr (N % 64 == 0) {
        if (useBitmaskMemmem()) {
            return std::make_unique<BitmaskMemmem<N>>(input, iter);
        }
    }
    return std::make_unique<LinearMemmem<N>>(input, iter);
}
