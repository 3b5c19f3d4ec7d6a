#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include <string>

#include "huffkit/codec/codebook.hpp"
#include "huffkit/codec/frequency.hpp"
#include "huffkit/codec/huffman.hpp"
#include "huffkit/codec/stats.hpp"

using namespace huffkit::codec;

class CompressionStatsTest : public ::testing::Test {
protected:
    void SetUp() override { spdlog::set_level(spdlog::level::off); }

    static auto efficiencyOf(std::string_view text) -> EfficiencyReport {
        FrequencyTable table = countFrequencies(asSymbols(text));
        if (table.empty()) {
            return analyzeEfficiency(table, Codebook{});
        }
        return analyzeEfficiency(table,
                                 generateCodebook(buildHuffmanTree(table)));
    }
};

TEST_F(CompressionStatsTest, EmptyInputReportsNoData) {
    CompressionStats stats = compress("").stats;
    EXPECT_EQ(stats.symbolCount, 0u);
    EXPECT_EQ(stats.originalBits, 0u);
    EXPECT_EQ(stats.compressedBits, 0u);
    EXPECT_DOUBLE_EQ(stats.ratio(), 0.0);
    EXPECT_DOUBLE_EQ(stats.compressionRate(), 0.0);
    EXPECT_DOUBLE_EQ(stats.compressionFactor(), 0.0);
    EXPECT_EQ(stats.savedBits(), 0);
}

TEST_F(CompressionStatsTest, SkewedInputFigures) {
    CompressionStats stats = compress("AAAAAAAB").stats;
    EXPECT_EQ(stats.symbolCount, 8u);
    EXPECT_EQ(stats.distinctSymbols, 2u);
    EXPECT_EQ(stats.originalBits, 64u);
    EXPECT_EQ(stats.compressedBits, 8u);
    EXPECT_DOUBLE_EQ(stats.ratio(), 0.125);
    EXPECT_EQ(stats.savedBits(), 56);
    EXPECT_DOUBLE_EQ(stats.compressionRate(), 87.5);
    EXPECT_DOUBLE_EQ(stats.compressionFactor(), 8.0);
    EXPECT_EQ(stats.tree.leafCount, 2u);
    EXPECT_EQ(stats.tree.internalCount, 1u);
}

TEST_F(CompressionStatsTest, TimingCanBeDisabled) {
    CodecOptions options;
    options.measureTime = false;
    EXPECT_EQ(compress("timing", options).stats.elapsed.count(), 0);
}

TEST_F(CompressionStatsTest, EntropyOfUniformPair) {
    EXPECT_DOUBLE_EQ(shannonEntropy(countFrequencies(asSymbols("ABAB"))), 1.0);
    EXPECT_DOUBLE_EQ(shannonEntropy(FrequencyTable{}), 0.0);
}

TEST_F(CompressionStatsTest, DyadicDistributionIsFullyEfficient) {
    // p = 1/2, 1/4, 1/4: Huffman lengths equal -log2 p
    EfficiencyReport report = efficiencyOf("AAAABBCC");
    EXPECT_DOUBLE_EQ(report.entropy, 1.5);
    EXPECT_DOUBLE_EQ(report.averageBitsPerSymbol, 1.5);
    EXPECT_DOUBLE_EQ(report.efficiency, 1.0);
}

TEST_F(CompressionStatsTest, SingleSymbolHasZeroEfficiency) {
    EfficiencyReport report = efficiencyOf("AAAA");
    EXPECT_DOUBLE_EQ(report.entropy, 0.0);
    EXPECT_DOUBLE_EQ(report.averageBitsPerSymbol, 1.0);
    EXPECT_DOUBLE_EQ(report.efficiency, 0.0);
}

TEST_F(CompressionStatsTest, AverageLengthNeverBelowEntropy) {
    EfficiencyReport report =
        efficiencyOf("she sells sea shells by the sea shore");
    EXPECT_GE(report.averageBitsPerSymbol, report.entropy);
    EXPECT_LT(report.averageBitsPerSymbol, report.entropy + 1.0);
    EXPECT_GT(report.efficiency, 0.0);
    EXPECT_LE(report.efficiency, 1.0);
}

TEST_F(CompressionStatsTest, IntegrityCheckComparesSequences) {
    EXPECT_TRUE(verifyIntegrity(asSymbols("same"), asSymbols("same")));
    EXPECT_FALSE(verifyIntegrity(asSymbols("same"), asSymbols("sane")));
    EXPECT_FALSE(verifyIntegrity(asSymbols("same"), asSymbols("sam")));
}
