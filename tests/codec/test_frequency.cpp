#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include <string>
#include <vector>

#include "huffkit/codec/frequency.hpp"
#include "huffkit/codec/huffman.hpp"

using namespace huffkit::codec;

class FrequencyTableTest : public ::testing::Test {
protected:
    void SetUp() override { spdlog::set_level(spdlog::level::off); }
};

TEST_F(FrequencyTableTest, EmptyInputGivesEmptyTable) {
    FrequencyTable table = countFrequencies({});
    EXPECT_TRUE(table.empty());
    EXPECT_EQ(table.size(), 0u);
    EXPECT_EQ(table.totalCount(), 0u);
    EXPECT_TRUE(table.entries().empty());
}

TEST_F(FrequencyTableTest, CountsEachDistinctSymbol) {
    FrequencyTable table = countFrequencies(asSymbols("abracadabra"));
    EXPECT_FALSE(table.empty());
    EXPECT_EQ(table.size(), 5u);
    EXPECT_EQ(table.totalCount(), 11u);
    EXPECT_EQ(table.count('a'), 5u);
    EXPECT_EQ(table.count('b'), 2u);
    EXPECT_EQ(table.count('r'), 2u);
    EXPECT_EQ(table.count('c'), 1u);
    EXPECT_EQ(table.count('d'), 1u);
    EXPECT_EQ(table.count('z'), 0u);
    EXPECT_FALSE(table.contains('z'));
}

TEST_F(FrequencyTableTest, EntriesAreInAscendingSymbolOrder) {
    FrequencyTable table = countFrequencies(asSymbols("zyxzz"));
    auto entries = table.entries();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0], (FrequencyTable::Entry{'x', 1}));
    EXPECT_EQ(entries[1], (FrequencyTable::Entry{'y', 1}));
    EXPECT_EQ(entries[2], (FrequencyTable::Entry{'z', 3}));
}

TEST_F(FrequencyTableTest, CoversTheWholeByteRange) {
    std::vector<Symbol> data;
    for (int i = 0; i < 256; ++i) {
        data.push_back(static_cast<Symbol>(i));
        data.push_back(static_cast<Symbol>(i));
    }
    FrequencyTable table = countFrequencies(data);
    EXPECT_EQ(table.size(), 256u);
    EXPECT_EQ(table.count(0x00), 2u);
    EXPECT_EQ(table.count(0xFF), 2u);
}

TEST_F(FrequencyTableTest, FromEntriesSkipsZeroAndAccumulates) {
    std::vector<FrequencyTable::Entry> entries = {
        {'a', 3}, {'b', 0}, {'a', 2}, {'c', 1}};
    FrequencyTable table = FrequencyTable::fromEntries(entries);
    EXPECT_EQ(table.size(), 2u);
    EXPECT_EQ(table.count('a'), 5u);
    EXPECT_FALSE(table.contains('b'));
    EXPECT_EQ(table.totalCount(), 6u);
}

TEST_F(FrequencyTableTest, EqualInputsGiveEqualTables) {
    EXPECT_EQ(countFrequencies(asSymbols("hello")),
              countFrequencies(asSymbols("olleh")));
}
