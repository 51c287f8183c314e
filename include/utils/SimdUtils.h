#ifndef SIMD_UTILS_H
#define SIMD_UTILS_H

#include "simd/simd_detect.h"
#include <cstdint>
#include <cstddef>

// Bit i of the result is set iff data[i] == target, for i in [0, 64)
using SIMDByteMaskFunc = uint64_t (*)(const char*, char);

class SimdUtils {
public:
    // Picks the byte-mask kernel for the running CPU
    static void initialize();
    static uint64_t byteMask64Scalar(const char* data, char target);

    static SIMDType activeSIMD;
    static SIMDByteMaskFunc byteMask64;

#if defined(__x86_64__) || defined(_M_X64) || defined(__i386__) || defined(_M_IX86)
    static uint64_t byteMask64AVX512(const char* data, char target);
    static uint64_t byteMask64AVX2(const char* data, char target);
    static uint64_t byteMask64SSE(const char* data, char target);
#endif
#if defined(__ARM_NEON) || defined(__aarch64__)
    static uint64_t byteMask64NEON(const char* data, char target);
#endif
};

#endif // SIMD_UTILS_H
