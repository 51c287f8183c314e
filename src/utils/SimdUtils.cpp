#include "utils/SimdUtils.h"
#include <cstring>
#include <cstddef>
#if defined(__x86_64__) || defined(_M_X64) || defined(__i386__) || defined(_M_IX86)
#include <immintrin.h>
#endif
#if defined(__ARM_NEON) || defined(__aarch64__)
#include <arm_neon.h>
#endif

SIMDType SimdUtils::activeSIMD = SIMDType::SCALAR;
SIMDByteMaskFunc SimdUtils::byteMask64 = SimdUtils::byteMask64Scalar;

void SimdUtils::initialize() {
    activeSIMD = SIMDDetector::detectBestSIMD();

#if defined(__x86_64__) || defined(_M_X64) || defined(__i386__) || defined(_M_IX86)
    switch (activeSIMD) {
        case SIMDType::AVX512: byteMask64 = byteMask64AVX512; break;
        case SIMDType::AVX2:   byteMask64 = byteMask64AVX2; break;
        case SIMDType::SSE4_2:
        case SIMDType::SSE2:   byteMask64 = byteMask64SSE; break;
        default:               byteMask64 = byteMask64Scalar; break;
    }
#elif defined(__ARM_NEON) || defined(__aarch64__)
    byteMask64 = activeSIMD == SIMDType::NEON ? byteMask64NEON : byteMask64Scalar;
#else
    byteMask64 = byteMask64Scalar;
#endif
}

#if defined(__x86_64__) || defined(_M_X64) || defined(__i386__) || defined(_M_IX86)
namespace {

// Compiled for their instruction set only; reached through the dispatch above
__attribute__((target("avx512f,avx512bw")))
uint64_t maskAVX512(const char* data, char target) {
    __m512i chunk = _mm512_loadu_si512(data);
    return _mm512_cmpeq_epi8_mask(chunk, _mm512_set1_epi8(target));
}

__attribute__((target("avx2")))
uint64_t maskAVX2(const char* data, char target) {
    const __m256i needle = _mm256_set1_epi8(target);
    __m256i lo = _mm256_loadu_si256(reinterpret_cast<const __m256i*>(data));
    __m256i hi = _mm256_loadu_si256(reinterpret_cast<const __m256i*>(data + 32));
    uint64_t loMask = static_cast<uint32_t>(_mm256_movemask_epi8(_mm256_cmpeq_epi8(lo, needle)));
    uint64_t hiMask = static_cast<uint32_t>(_mm256_movemask_epi8(_mm256_cmpeq_epi8(hi, needle)));
    return loMask | (hiMask << 32);
}

__attribute__((target("sse2")))
uint64_t maskSSE(const char* data, char target) {
    const __m128i needle = _mm_set1_epi8(target);
    uint64_t mask = 0;
    for (int i = 0; i < 4; i++) {
        __m128i chunk = _mm_loadu_si128(reinterpret_cast<const __m128i*>(data + 16 * i));
        uint64_t bits = static_cast<uint16_t>(_mm_movemask_epi8(_mm_cmpeq_epi8(chunk, needle)));
        mask |= bits << (16 * i);
    }
    return mask;
}

} // namespace

uint64_t SimdUtils::byteMask64AVX512(const char* data, char target) {
    return maskAVX512(data, target);
}

uint64_t SimdUtils::byteMask64AVX2(const char* data, char target) {
    return maskAVX2(data, target);
}

uint64_t SimdUtils::byteMask64SSE(const char* data, char target) {
    return maskSSE(data, target);
}
#endif

#if defined(__ARM_NEON) || defined(__aarch64__)
uint64_t SimdUtils::byteMask64NEON(const char* data, char target) {
    const uint8x16_t needle = vdupq_n_u8(static_cast<uint8_t>(target));
    uint64_t mask = 0;

    for (int i = 0; i < 4; i++) {
        uint8x16_t chunk = vld1q_u8(reinterpret_cast<const uint8_t*>(data) + 16 * i);
        uint8_t lanes[16];
        vst1q_u8(lanes, vceqq_u8(chunk, needle));

        for (int j = 0; j < 16; j++) {
            if (lanes[j]) mask |= uint64_t{1} << (16 * i + j);
        }
    }
    return mask;
}
#endif

uint64_t SimdUtils::byteMask64Scalar(const char* data, char target) {
    uint64_t mask = 0;
    for (int i = 0; i < 64; i++) {
        if (data[i] == target) mask |= uint64_t{1} << i;
    }
    return mask;
}
