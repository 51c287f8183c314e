#include "memmem/memmem_factory.h"
#include "simd/simd_detect.h"
#include "utils/Log.h"
#include "utils/SimdUtils.h"

bool MemmemConfig::ForceLinear = false;

bool useBitmaskMemmem() {
    static const bool initialized = [] {
        SimdUtils::initialize();
        Log::debug("byte-mask kernel: ", SIMDDetector::name(SimdUtils::activeSIMD));
        return true;
    }();
    (void)initialized;

    if (MemmemConfig::ForceLinear) return false;

    switch (SimdUtils::activeSIMD) {
        case SIMDType::AVX512:
        case SIMDType::AVX2:
        case SIMDType::SSE4_2:
        case SIMDType::SSE2:
        case SIMDType::NEON:
            return true;
        case SIMDType::SCALAR:
        default:
            return false;
    }
}
