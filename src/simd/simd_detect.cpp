#include "simd/simd_detect.h"
#include <cstdint>

#if defined(__x86_64__) || defined(__i386__)
#include <cpuid.h>

namespace {

// Register state the OS saves on context switch (XCR0)
uint64_t readXcr0() {
    uint32_t lo, hi;
    __asm__ volatile("xgetbv" : "=a"(lo), "=d"(hi) : "c"(0));
    return (static_cast<uint64_t>(hi) << 32) | lo;
}

} // namespace
#endif

SIMDType SIMDDetector::detectBestSIMD() {
#if defined(__x86_64__) || defined(__i386__)
    uint32_t eax, ebx, ecx, edx;

    if (!__get_cpuid(1, &eax, &ebx, &ecx, &edx)) return SIMDType::SCALAR;
    const bool sse42 = ecx & (1u << 20);
    const bool sse2 = edx & (1u << 26);
    const bool osxsave = ecx & (1u << 27);

    if (osxsave && __get_cpuid_max(0, nullptr) >= 7) {
        const uint64_t xcr0 = readXcr0();
        const bool ymmState = (xcr0 & 0x6) == 0x6;
        const bool zmmState = (xcr0 & 0xE6) == 0xE6;

        __cpuid_count(7, 0, eax, ebx, ecx, edx);

        // AVX512BW (byte compares), then AVX2
        if (zmmState && (ebx & (1u << 16)) && (ebx & (1u << 30))) return SIMDType::AVX512;
        if (ymmState && (ebx & (1u << 5))) return SIMDType::AVX2;
    }

    if (sse42) return SIMDType::SSE4_2;
    if (sse2) return SIMDType::SSE2;

#elif defined(__aarch64__)
    // Advanced SIMD is mandatory on AArch64
    return SIMDType::NEON;
#endif

    return SIMDType::SCALAR;
}

const char* SIMDDetector::name(SIMDType type) {
    switch (type) {
        case SIMDType::AVX512: return "AVX512";
        case SIMDType::AVX2:   return "AVX2";
        case SIMDType::SSE4_2: return "SSE4.2";
        case SIMDType::SSE2:   return "SSE2";
        case SIMDType::NEON:   return "NEON";
        case SIMDType::SCALAR: break;
    }
    return "SCALAR";
}
