/**
 * @file Error.h
 * @brief Layered error type shared by every SpoolBridge module
 * @version 0.2
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include "HardwareError.h"
#include "LinkError.h"
#include "TransportError.h"
#include "KdfError.h"
#include "CodecError.h"
#include "AgentError.h"
#include "BridgeError.h"

#include <etl/variant.h>
#include <etl/string_view.h>
#include <etl/string.h>

#include <type_traits>

namespace error {

    enum class ErrorLayer : uint8_t {
        Hardware,
        Link,
        Transport,
        Kdf,
        Codec,
        Agent,
        Bridge
    };


    class Error {
        public:

            using ErrorVariant = etl::variant<
                HardwareError,
                LinkError,
                TransportError,
                KdfError,
                CodecError,
                AgentError,
                BridgeError
            >;

            Error(ErrorLayer layer, ErrorVariant errorCode)
                : layer(layer), errorCode(errorCode) {}

            static Error fromHardware(HardwareError err) {
                return Error{ErrorLayer::Hardware, err};
            }

            static Error fromLink(LinkError err) {
                return Error{ErrorLayer::Link, err};
            }

            static Error fromTransport(TransportError err) {
                return Error{ErrorLayer::Transport, err};
            }

            static Error fromKdf(KdfError err) {
                return Error{ErrorLayer::Kdf, err};
            }

            static Error fromCodec(CodecError err) {
                return Error{ErrorLayer::Codec, err};
            }

            static Error fromAgent(AgentError err) {
                return Error{ErrorLayer::Agent, err};
            }

            static Error fromBridge(BridgeError err) {
                return Error{ErrorLayer::Bridge, err};
            }

            template<typename T>
            bool is() const {
                return etl::holds_alternative<T>(errorCode);
            }

            template<typename T>
            T get() const {
                return etl::get<T>(errorCode);
            }

            /**
             * @brief Check for one specific code of one layer
             *
             * @tparam T Layer enum type
             * @param code Expected code
             * @return true The error holds exactly this code
             */
            template<typename T>
            bool isCode(T code) const {
                return is<T>() && get<T>() == code;
            }

            ErrorLayer getLayer() const {
                return layer;
            }

            etl::string_view layerName(ErrorLayer layer) const {
                switch (layer) {
                    case ErrorLayer::Hardware:
                        return "Hardware";
                    case ErrorLayer::Link:
                        return "Link";
                    case ErrorLayer::Transport:
                        return "Transport";
                    case ErrorLayer::Kdf:
                        return "KeyDerivation";
                    case ErrorLayer::Codec:
                        return "TagCodec";
                    case ErrorLayer::Agent:
                        return "Agent";
                    case ErrorLayer::Bridge:
                        return "Bridge";
                    default:
                        return "Unknown";
                }
            }

            etl::string_view nameOf(HardwareError err) const {
                switch (err) {
                    case HardwareError::Ok:
                        return "Ok";
                    case HardwareError::Timeout:
                        return "Timeout";
                    case HardwareError::DeviceNotFound:
                        return "DeviceNotFound";
                    case HardwareError::WriteFailed:
                        return "WriteFailed";
                    case HardwareError::ReadFailed:
                        return "ReadFailed";
                    case HardwareError::BufferOverflow:
                        return "BufferOverflow";
                    case HardwareError::NotSupported:
                        return "NotSupported";
                    case HardwareError::InvalidFrame:
                        return "InvalidFrame";
                    case HardwareError::Unknown:
                        return "UnknownError";
                    default:
                        return "UndefinedHardwareError";
                }
            }

            etl::string_view nameOf(LinkError err) const {
                switch (err) {
                    case LinkError::Ok:
                        return "Success";
                    case LinkError::Timeout:
                        return "Timeout";
                    case LinkError::CrcError:
                        return "CrcError";
                    case LinkError::ParityError:
                        return "ParityError";
                    case LinkError::AuthenticationError:
                        return "AuthenticationFailed";
                    case LinkError::NakReceived:
                        return "NakReceived";
                    case LinkError::CardDisappeared:
                        return "CardDisappeared";
                    default:
                        return "UndefinedLinkError";
                }
            }

            etl::string_view nameOf(TransportError err) const {
                switch (err) {
                    case TransportError::Ok:
                        return "Ok";
                    case TransportError::NotOpen:
                        return "NotOpen";
                    case TransportError::ResolveFailed:
                        return "ResolveFailed";
                    case TransportError::ConnectFailed:
                        return "ConnectFailed";
                    case TransportError::ConnectionClosed:
                        return "ConnectionClosed";
                    case TransportError::SendFailed:
                        return "SendFailed";
                    case TransportError::ReceiveFailed:
                        return "ReceiveFailed";
                    case TransportError::FrameTooLarge:
                        return "FrameTooLarge";
                    default:
                        return "UndefinedTransportError";
                }
            }

            etl::string_view nameOf(KdfError err) const {
                switch (err) {
                    case KdfError::Ok:
                        return "Ok";
                    case KdfError::InvalidInput:
                        return "InvalidInput";
                    case KdfError::BackendFailure:
                        return "BackendFailure";
                    default:
                        return "UndefinedKdfError";
                }
            }

            etl::string_view nameOf(CodecError err) const {
                switch (err) {
                    case CodecError::Ok:
                        return "Ok";
                    case CodecError::MalformedImage:
                        return "MalformedImage";
                    case CodecError::FieldOutOfRange:
                        return "FieldOutOfRange";
                    case CodecError::InvalidEncoding:
                        return "InvalidEncoding";
                    default:
                        return "UndefinedCodecError";
                }
            }

            etl::string_view nameOf(AgentError err) const {
                switch (err) {
                    case AgentError::Ok:
                        return "Ok";
                    case AgentError::NoTagPresent:
                        return "NoTagPresent";
                    case AgentError::UnsupportedTagType:
                        return "UnsupportedTagType";
                    case AgentError::Cancelled:
                        return "Cancelled";
                    case AgentError::Busy:
                        return "Busy";
                    case AgentError::UnsupportedOperation:
                        return "UnsupportedOperation";
                    default:
                        return "UndefinedAgentError";
                }
            }

            etl::string_view nameOf(BridgeError err) const {
                switch (err) {
                    case BridgeError::Ok:
                        return "Ok";
                    case BridgeError::NoBridgeConnected:
                        return "NoBridgeConnected";
                    case BridgeError::RequestInProgress:
                        return "RequestInProgress";
                    case BridgeError::Timeout:
                        return "Timeout";
                    case BridgeError::ProtocolViolation:
                        return "ProtocolViolation";
                    case BridgeError::UnsupportedOperation:
                        return "UnsupportedOperation";
                    case BridgeError::AgentReported:
                        return "AgentReported";
                    default:
                        return "UndefinedBridgeError";
                }
            }

            etl::string<160> toString() const {
                etl::string<160> result;
                auto layer_name = layerName(layer);
                result.assign(layer_name.begin(), layer_name.end());
                result.append(" Error: ");

                auto error_name = etl::visit([this](auto&& arg) {
                        return nameOf(arg);
                    }, errorCode);

                result.append(error_name.begin(), error_name.end());
                return result;
            }

        private:
            ErrorLayer   layer;
            ErrorVariant errorCode;

    };

} // namespace error
