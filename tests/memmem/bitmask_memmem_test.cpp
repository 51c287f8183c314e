#include "memmem/impl/bitmask_memmem.h"
#include "memmem/impl/linear_memmem.h"
#include "memmem/memmem_factory.h"
#include "input/owned_bytes.h"
#include "memmem_test_utils.h"
#include "utils/SimdUtils.h"
#include <gtest/gtest.h>
#include <random>
#include <string>
#include <vector>

class BitmaskMemmemTest : public ::testing::Test {
protected:
    void SetUp() override {
        SimdUtils::initialize();
    }

    template <size_t N>
    std::optional<LabelMatch<N>> findFirst(const Input& input, BlockIterator<N>& iter, const Label& label,
                                           size_t startIdx = 0) {
        BitmaskMemmem<N> memmem(input, iter);
        return memmem.findLabel(std::nullopt, startIdx, label);
    }

    // 256 spaces with `"key":1` placed so the opening quote lands on `quote`
    static std::string keyAt(size_t quote) {
        std::string data(256, ' ');
        data.replace(quote, 7, R"("key":1)");
        return data;
    }

    Label key{"key"};
};

TEST_F(BitmaskMemmemTest, FindsKeyInsideWindow) {
    OwnedBytes input(keyAt(20));
    auto iter = input.iterBlocks<64>();

    auto match = findFirst(input, iter, key);
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->position, 20u);
    EXPECT_EQ(match->block.offset(), 0u);
    EXPECT_EQ(iter.getOffset(), 64u);
}

TEST_F(BitmaskMemmemTest, QuoteIsLastByteOfBlock) {
    OwnedBytes input(keyAt(63));
    auto iter = input.iterBlocks<64>();

    auto match = findFirst(input, iter, key);
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->position, 63u);
    EXPECT_EQ(match->block.offset(), 64u);
}

TEST_F(BitmaskMemmemTest, FirstCharacterIsLastByteOfBlock) {
    // Needs the carry: first marker at 63, second marker at 64
    OwnedBytes input(keyAt(62));
    auto iter = input.iterBlocks<64>();

    auto match = findFirst(input, iter, key);
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->position, 62u);
    EXPECT_EQ(match->block.offset(), 64u);
    EXPECT_EQ(iter.getOffset(), 128u);
}

TEST_F(BitmaskMemmemTest, CarryBetweenWindowsOfOneBlock) {
    OwnedBytes input(keyAt(126));
    auto iter = input.iterBlocks<128>();

    auto match = findFirst(input, iter, key);
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->position, 126u);
    EXPECT_EQ(match->block.offset(), 128u);

    OwnedBytes interior(keyAt(62));
    auto interiorIter = interior.iterBlocks<128>();
    auto interiorMatch = findFirst(interior, interiorIter, key);
    ASSERT_TRUE(interiorMatch.has_value());
    EXPECT_EQ(interiorMatch->position, 62u);
    EXPECT_EQ(interiorMatch->block.offset(), 0u);
}

TEST_F(BitmaskMemmemTest, RejectsValueOccurrences) {
    std::string data = R"({"a":"key","b":"the key","c":["key"],"key":3})";
    OwnedBytes input(data);
    auto iter = input.iterBlocks<64>();

    auto match = findFirst(input, iter, key);
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->position, data.find(R"("key":3)"));
}

TEST_F(BitmaskMemmemTest, NoMatchExhaustsIterator) {
    OwnedBytes input(R"({"keys":1,"a":"key","ke":2})");
    auto iter = input.iterBlocks<64>();

    EXPECT_FALSE(findFirst(input, iter, key).has_value());
    EXPECT_FALSE(iter.next().has_value());
}

TEST_F(BitmaskMemmemTest, StartIdxSkipsEarlierMatches) {
    std::string data = R"({"key":1,"key":2})";
    OwnedBytes input(data);
    auto iter = input.iterBlocks<64>();

    auto match = findFirst(input, iter, key, 2);
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->position, 9u);
}

TEST_F(BitmaskMemmemTest, SingleCharacterAndEmptyLabels) {
    std::string data = R"({"b":"a","a" : {"":0}})";
    OwnedBytes input(data);

    auto iter = input.iterBlocks<64>();
    auto a = findFirst(input, iter, Label("a"));
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->position, data.find(R"("a" :)"));

    auto emptyIter = input.iterBlocks<64>();
    auto empty = findFirst(input, emptyIter, Label(""));
    ASSERT_TRUE(empty.has_value());
    EXPECT_EQ(empty->position, data.find(R"("":)"));
}

TEST_F(BitmaskMemmemTest, AgreesWithLinearAtEveryBoundaryPosition) {
    for (size_t quote = 1; quote < 200; quote++) {
        OwnedBytes input(keyAt(quote));

        auto linearIter = input.iterBlocks<64>();
        LinearMemmem<64> linear(input, linearIter);
        auto expected = linear.findLabel(std::nullopt, 0, key);
        ASSERT_TRUE(expected.has_value()) << "quote at " << quote;
        EXPECT_EQ(expected->position, quote);

        auto iter = input.iterBlocks<64>();
        auto match = findFirst(input, iter, key);
        ASSERT_TRUE(match.has_value()) << "quote at " << quote;
        EXPECT_EQ(match->position, quote);
    }
}

TEST_F(BitmaskMemmemTest, RandomInputsMatchValidator) {
    std::mt19937 rng(7);
    const char alphabet[] = {'"', 'k', 'e', 'y', ':', ' ', '\\', ','};
    std::uniform_int_distribution<int> pick(0, 7);
    std::uniform_int_distribution<size_t> length(1, 400);

    for (int round = 0; round < 300; round++) {
        std::string data(length(rng), ' ');
        for (auto& c : data) c = alphabet[pick(rng)];
        OwnedBytes input(data);

        const std::vector<size_t> expected = validatorPositions(input, key);
        EXPECT_EQ((findAllMatches<64, BitmaskMemmem>(input, key)), expected) << data;
        EXPECT_EQ((findAllMatches<128, BitmaskMemmem>(input, key)), expected) << data;
        EXPECT_EQ((findAllMatches<64, LinearMemmem>(input, key)), expected) << data;
        EXPECT_EQ((findAllMatches<8, LinearMemmem>(input, key)), expected) << data;
    }
}

TEST_F(BitmaskMemmemTest, FactoryHonorsForceLinear) {
    OwnedBytes input(keyAt(10));
    auto iter = input.iterBlocks<64>();

    MemmemConfig::ForceLinear = true;
    auto forced = createBestMemmem<64>(input, iter);
    MemmemConfig::ForceLinear = false;
    EXPECT_NE(dynamic_cast<LinearMemmem<64>*>(forced.get()), nullptr);

    auto best = createBestMemmem<64>(input, iter);
    if (SimdUtils::activeSIMD == SIMDType::SCALAR) {
        EXPECT_NE(dynamic_cast<LinearMemmem<64>*>(best.get()), nullptr);
    } else {
        EXPECT_NE(dynamic_cast<BitmaskMemmem<64>*>(best.get()), nullptr);
    }

    auto match = best->findLabel(std::nullopt, 0, key);
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->position, 10u);
}

TEST_F(BitmaskMemmemTest, FactoryFallsBackForSmallBlocks) {
    OwnedBytes input(keyAt(10));
    auto iter = input.iterBlocks<8>();

    auto memmem = createBestMemmem<8>(input, iter);
    EXPECT_NE(dynamic_cast<LinearMemmem<8>*>(memmem.get()), nullptr);
}
