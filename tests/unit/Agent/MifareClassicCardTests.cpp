/**
 * @file MifareClassicCardTests.cpp
 * @brief Unit tests for the MIFARE Classic command layer
 */

#include <gtest/gtest.h>
#include "Agent/MifareClassicCard.h"
#include "Mocks/SimulatedTag.h"

#include <vector>

using namespace agent;
using namespace error;

// Mock transceiver that records frames and replays one scripted answer
class MockTransceiver : public ITagTransceiver {
public:
    etl::expected<TagFrame, Error> transceive(const etl::ivector<uint8_t>& command) override {
        lastCommand.assign(command.begin(), command.end());
        ++calls;
        if (nextError) {
            return etl::unexpected(*nextError);
        }
        return nextResponse;
    }

    std::vector<uint8_t> lastCommand;
    TagFrame nextResponse;
    etl::optional<Error> nextError;
    int calls = 0;
};

class MifareClassicCardTest : public ::testing::Test {
protected:
    void SetUp() override {
        card = new MifareClassicCard(transceiver);
        uid = {{0x01, 0x02, 0x03, 0x04}};
        key = {{0xA0, 0xA1, 0xA2, 0xA3, 0xA4, 0xA5}};
    }

    void TearDown() override {
        delete card;
    }

    MockTransceiver transceiver;
    MifareClassicCard* card;
    spool::TagUid uid;
    spool::SectorKey key;
};

// Test: Authentication frame carries key type, first block, key and UID
TEST_F(MifareClassicCardTest, AuthenticateFrame) {
    ASSERT_TRUE(card->authenticate(uid, 2, KeyType::B, key).has_value());

    std::vector<uint8_t> expected = {0x61, 0x08, 0xA0, 0xA1, 0xA2, 0xA3, 0xA4, 0xA5, 0x01, 0x02, 0x03, 0x04};
    EXPECT_EQ(transceiver.lastCommand, expected);
}

TEST_F(MifareClassicCardTest, AuthenticateRejectsBadSector) {
    auto result = card->authenticate(uid, 16, KeyType::A, key);
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().isCode(HardwareError::NotSupported));
    EXPECT_EQ(transceiver.calls, 0);
}

// Test: Reads need authentication for the block's own sector
TEST_F(MifareClassicCardTest, ReadRequiresMatchingSector) {
    auto unauthenticated = card->readBlock(4);
    ASSERT_FALSE(unauthenticated.has_value());
    EXPECT_TRUE(unauthenticated.error().isCode(LinkError::AuthenticationError));

    ASSERT_TRUE(card->authenticate(uid, 1, KeyType::A, key).has_value());
    auto otherSector = card->readBlock(8);
    EXPECT_FALSE(otherSector.has_value());

    transceiver.nextResponse.assign(16, 0x5A);
    auto block = card->readBlock(6);
    ASSERT_TRUE(block.has_value());
    EXPECT_EQ((*block)[0], 0x5A);
    std::vector<uint8_t> expected = {0x30, 0x06};
    EXPECT_EQ(transceiver.lastCommand, expected);
}

TEST_F(MifareClassicCardTest, ReadRejectsShortAnswer) {
    ASSERT_TRUE(card->authenticate(uid, 0, KeyType::A, key).has_value());
    transceiver.nextResponse.assign(4, 0x00);

    auto block = card->readBlock(1);
    ASSERT_FALSE(block.has_value());
    EXPECT_TRUE(block.error().isCode(HardwareError::ReadFailed));
}

// Test: Block 0 and trailers are never written
TEST_F(MifareClassicCardTest, WriteRefusesProtectedBlocks) {
    ASSERT_TRUE(card->authenticate(uid, 0, KeyType::A, key).has_value());
    spool::Block data;
    data.fill(0x11);

    auto block0 = card->writeBlock(0, data);
    ASSERT_FALSE(block0.has_value());
    EXPECT_TRUE(block0.error().isCode(AgentError::UnsupportedOperation));

    auto trailer = card->writeBlock(3, data);
    EXPECT_FALSE(trailer.has_value());

    int callsBefore = transceiver.calls;
    ASSERT_TRUE(card->writeBlock(2, data).has_value());
    EXPECT_EQ(transceiver.calls, callsBefore + 1);
    ASSERT_EQ(transceiver.lastCommand.size(), 18u);
    EXPECT_EQ(transceiver.lastCommand[0], 0xA0);
    EXPECT_EQ(transceiver.lastCommand[1], 0x02);
    EXPECT_EQ(transceiver.lastCommand[17], 0x11);
}

// Test: A failed authentication or reset drops the session
TEST_F(MifareClassicCardTest, FailedAuthenticationClearsState) {
    ASSERT_TRUE(card->authenticate(uid, 1, KeyType::A, key).has_value());

    transceiver.nextError = Error::fromLink(LinkError::AuthenticationError);
    EXPECT_FALSE(card->authenticate(uid, 1, KeyType::B, key).has_value());

    transceiver.nextError.reset();
    transceiver.nextResponse.assign(16, 0x00);
    EXPECT_FALSE(card->readBlock(4).has_value());

    ASSERT_TRUE(card->authenticate(uid, 1, KeyType::A, key).has_value());
    card->reset();
    EXPECT_FALSE(card->readBlock(4).has_value());
}

// Test: Against the simulated tag
TEST(MifareClassicCardSimulationTest, ReadWriteCycle) {
    SimulatedTag tag;
    MifareClassicCard card(tag);
    spool::SectorKey factory = {{0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF}};

    ASSERT_TRUE(card.authenticate(tag.uid, 1, KeyType::A, factory).has_value());

    spool::Block data;
    data.fill(0x42);
    ASSERT_TRUE(card.writeBlock(5, data).has_value());

    auto back = card.readBlock(5);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ((*back)[15], 0x42);

    spool::SectorKey wrong = {{0, 0, 0, 0, 0, 0}};
    auto rejected = card.authenticate(tag.uid, 2, KeyType::A, wrong);
    ASSERT_FALSE(rejected.has_value());
    EXPECT_TRUE(rejected.error().isCode(LinkError::AuthenticationError));
}
