#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include <string>
#include <vector>

#include "huffkit/codec/config.hpp"
#include "huffkit/codec/container.hpp"
#include "huffkit/codec/huffman.hpp"
#include "huffkit/codec/huffman_error.hpp"

using namespace huffkit::codec;

class ContainerTest : public ::testing::Test {
protected:
    void SetUp() override {
        spdlog::set_level(spdlog::level::off);
        text = "container frames keep payload and tree together";
        frame = writeContainer(compress(text));
    }

    std::string text;
    std::vector<u8> frame;
};

TEST_F(ContainerTest, HeaderLayout) {
    CompressionResult result = compress(text);
    ASSERT_EQ(frame.size(), kContainerHeaderBytes + result.tree.size() +
                                result.payload.bytes.size());
    EXPECT_EQ(frame[0], 'H');
    EXPECT_EQ(frame[1], 'U');
    EXPECT_EQ(frame[2], 'F');
    EXPECT_EQ(frame[3], 'K');
    EXPECT_EQ(frame[4], kContainerVersion);
    EXPECT_EQ(frame[5], result.payload.validBitsInLastByte);
    EXPECT_EQ(frame[6], text.size());  // low byte of the symbol count
}

TEST_F(ContainerTest, ReadRestoresParts) {
    CompressionResult result = compress(text);
    Container container = readContainer(frame);
    EXPECT_EQ(container.payload, result.payload);
    EXPECT_EQ(container.tree, result.tree);
    EXPECT_EQ(container.symbolCount, text.size());
}

TEST_F(ContainerTest, DecompressesToOriginal) {
    auto decoded = decompressContainer(frame);
    EXPECT_EQ(std::string(decoded.begin(), decoded.end()), text);
}

TEST_F(ContainerTest, EmptyInputFrame) {
    std::vector<u8> empty = writeContainer(compress(""));
    EXPECT_EQ(empty.size(), kContainerHeaderBytes);
    EXPECT_TRUE(decompressContainer(empty).empty());
}

TEST_F(ContainerTest, RejectsBadMagic) {
    frame[0] = 'X';
    EXPECT_THROW(readContainer(frame), MalformedPayloadException);
}

TEST_F(ContainerTest, RejectsUnknownVersion) {
    frame[4] = 0x7F;
    EXPECT_THROW(readContainer(frame), MalformedPayloadException);
}

TEST_F(ContainerTest, RejectsTruncation) {
    frame.pop_back();
    EXPECT_THROW(readContainer(frame), MalformedPayloadException);
    EXPECT_THROW(readContainer(std::vector<u8>(frame.begin(), frame.begin() + 10)),
                 MalformedPayloadException);
}

TEST_F(ContainerTest, RejectsTrailingBytes) {
    frame.push_back(0x00);
    EXPECT_THROW(readContainer(frame), MalformedPayloadException);
}

TEST_F(ContainerTest, RejectsWrongSymbolCount) {
    frame[6] = static_cast<u8>(frame[6] + 1);
    EXPECT_THROW(decompressContainer(frame), MalformedPayloadException);
}
