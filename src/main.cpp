#include <iostream>
#include <iomanip>
#include <chrono>
#include <cstring>
#include <memory>
#include <string>
#include <vector>
#include "input/input.h"
#include "input/mmap_input.h"
#include "input/owned_bytes.h"
#include "memmem/memmem_factory.h"
#include "query/label.h"
#include "simd/simd_detect.h"
#include "utils/Log.h"
#include "utils/SimdUtils.h"

namespace {

void printUsage() {
    std::cout << "Usage:\n";
    std::cout << "  ./build/jsonlabel [--linear] [--owned] [--verbose] [<file.json>] <label>\n\n";
    std::cout << "  Reads standard input when the file is omitted or is '-'.\n\n";
    std::cout << "  --linear    use the linear matcher even when SIMD is available\n";
    std::cout << "  --owned     read the file into memory instead of mapping it\n";
    std::cout << "  --verbose   print debug diagnostics to stderr\n";
}

// Every offset at which `label` occurs as a key
std::vector<size_t> findAll(const Input& input, const Label& label) {
    std::vector<size_t> positions;
    auto iter = input.iterBlocks<BLOCK_SIZE>();
    auto memmem = createBestMemmem<BLOCK_SIZE>(input, iter);

    std::optional<Block<BLOCK_SIZE>> resumeBlock;
    size_t startIdx = 0;
    while (auto match = memmem->findLabel(resumeBlock, startIdx, label)) {
        positions.push_back(match->position);
        resumeBlock = match->block;
        startIdx = match->position + 1;
    }
    return positions;
}

std::unique_ptr<Input> openInput(const std::string& path, bool owned) {
    if (path == "-") {
        return std::make_unique<OwnedBytes>(OwnedBytes::readStream(std::cin, "standard input"));
    }
    if (!owned) {
        try {
            return std::make_unique<MmapInput>(MmapInput::mapFile(path, MmapInput::AssumeUnmodified{}));
        } catch (const InputError& err) {
            Log::warn("Creating a memory map failed: '", err.what(),
                      "'. Falling back to a slower input strategy.");
        }
    }
    return std::make_unique<OwnedBytes>(OwnedBytes::readFile(path));
}

} // namespace

int main(int argc, char* argv[]) {
    bool owned = false;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--linear") == 0) {
            MemmemConfig::ForceLinear = true;
        } else if (std::strcmp(argv[i], "--owned") == 0) {
            owned = true;
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            Log::Verbose = true;
        } else if (std::strcmp(argv[i], "--help") == 0) {
            printUsage();
            return 0;
        } else {
            positional.emplace_back(argv[i]);
        }
    }

    if (positional.empty() || positional.size() > 2) {
        printUsage();
        return 1;
    }

    const std::string path = positional.size() == 2 ? positional[0] : "-";
    const Label label(positional.back());

    std::unique_ptr<Input> input;
    std::vector<size_t> positions;
    std::chrono::microseconds duration{0};

    try {
        input = openInput(path, owned);

        auto start = std::chrono::high_resolution_clock::now();
        positions = findAll(*input, label);
        auto end = std::chrono::high_resolution_clock::now();
        duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start);
    } catch (const InputError& err) {
        Log::error(err.what());
        return 2;
    }

    for (size_t pos : positions) {
        std::cout << pos << "\n";
    }

    std::cerr << "\n" << std::string(68, '=') << "\n";
    std::cerr << "SEARCH SUMMARY:\n";
    std::cerr << std::string(68, '=') << "\n";
    std::cerr << "  Label:           " << label.bytesWithQuotes() << "\n";
    std::cerr << "  Matcher:         " << (useBitmaskMemmem() ? "bitmask" : "linear") << "\n";
    std::cerr << "  SIMD:            " << SIMDDetector::name(SimdUtils::activeSIMD) << "\n";
    std::cerr << "  Input size:      " << input->dataLen() << " bytes\n";
    std::cerr << "  Matches:         " << positions.size() << "\n";
    std::cerr << "  Search time:     " << duration.count() << " µs\n";

    if (duration.count() > 0) {
        double throughput = (input->dataLen() / (duration.count() / 1000000.0)) / (1024.0 * 1024.0);
        std::cerr << "  Throughput:      " << std::fixed << std::setprecision(2)
                  << throughput << " MB/s\n";
    }
    std::cerr << std::string(68, '=') << "\n";

    return 0;
}
