#include <gtest/gtest.h>
#include "Error/Error.h"

using namespace error;

// Test: Error creation from different layers
TEST(ErrorTest, CreateFromHardware) {
    Error err = Error::fromHardware(HardwareError::DeviceNotFound);

    EXPECT_TRUE(err.is<HardwareError>());
    EXPECT_FALSE(err.is<LinkError>());
    EXPECT_EQ(err.getLayer(), ErrorLayer::Hardware);

    auto hwErr = err.get<HardwareError>();
    EXPECT_EQ(hwErr, HardwareError::DeviceNotFound);
}

TEST(ErrorTest, CreateFromBridge) {
    Error err = Error::fromBridge(BridgeError::RequestInProgress);

    EXPECT_TRUE(err.is<BridgeError>());
    EXPECT_FALSE(err.is<AgentError>());
    EXPECT_EQ(err.getLayer(), ErrorLayer::Bridge);
}

// Test: isCode matches only the exact layer and code
TEST(ErrorTest, IsCode) {
    Error err = Error::fromAgent(AgentError::NoTagPresent);

    EXPECT_TRUE(err.isCode(AgentError::NoTagPresent));
    EXPECT_FALSE(err.isCode(AgentError::Cancelled));
    EXPECT_FALSE(err.isCode(BridgeError::Timeout));
}

// Test: toString uses "<Layer> Error: <Name>"
TEST(ErrorTest, ToStringFormat) {
    EXPECT_EQ(std::string(Error::fromHardware(HardwareError::InvalidFrame).toString().c_str()),
              "Hardware Error: InvalidFrame");
    EXPECT_EQ(std::string(Error::fromLink(LinkError::AuthenticationError).toString().c_str()),
              "Link Error: AuthenticationFailed");
    EXPECT_EQ(std::string(Error::fromTransport(TransportError::ConnectionClosed).toString().c_str()),
              "Transport Error: ConnectionClosed");
    EXPECT_EQ(std::string(Error::fromKdf(KdfError::InvalidInput).toString().c_str()),
              "KeyDerivation Error: InvalidInput");
    EXPECT_EQ(std::string(Error::fromCodec(CodecError::FieldOutOfRange).toString().c_str()),
              "TagCodec Error: FieldOutOfRange");
    EXPECT_EQ(std::string(Error::fromAgent(AgentError::UnsupportedTagType).toString().c_str()),
              "Agent Error: UnsupportedTagType");
    EXPECT_EQ(std::string(Error::fromBridge(BridgeError::NoBridgeConnected).toString().c_str()),
              "Bridge Error: NoBridgeConnected");
}

// Test: Error type checking
TEST(ErrorTest, TypeChecking) {
    Error err = Error::fromCodec(CodecError::MalformedImage);

    EXPECT_TRUE(err.is<CodecError>());
    EXPECT_FALSE(err.is<HardwareError>());
    EXPECT_FALSE(err.is<KdfError>());
}

// Test: Different error values
TEST(ErrorTest, DifferentValues) {
    Error err1 = Error::fromHardware(HardwareError::DeviceNotFound);
    Error err2 = Error::fromHardware(HardwareError::NotSupported);

    EXPECT_NE(err1.get<HardwareError>(), err2.get<HardwareError>());
}

// Test: Link codes keep the reader status byte values
TEST(ErrorTest, LinkCodesMatchStatusBytes) {
    EXPECT_EQ(static_cast<uint8_t>(LinkError::Timeout), 0x01);
    EXPECT_EQ(static_cast<uint8_t>(LinkError::AuthenticationError), 0x14);
}
