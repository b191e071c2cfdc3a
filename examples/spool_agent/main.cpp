/**
 * @file main.cpp
 * @brief Tag agent: serves bridge requests with a PN532 reader on a serial port
 *
 * Flow:
 *   1) Open the serial port and initialise the PN532
 *   2) Listen for one initiator at a time on TCP
 *   3) Execute READ_TAG / WRITE_TAG against the presented tag until the initiator leaves
 */

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

#include "Agent/BridgeAgent.h"
#include "Agent/MifareClassicCard.h"
#include "Comms/Serial/SerialBusPosix.hpp"
#include "Comms/Tcp/TcpLineTransport.hpp"
#include "Pn532/Pn532Driver.h"
#include "Pn532/Pn532TagReader.h"
#include "Spool/KeyDerivation.h"
#include "Utils/Logging.h"

using namespace comms::serial;
using namespace comms::tcp;
using namespace pn532;

namespace
{
    constexpr uint32_t ACCEPT_WAIT_MS = 500;
    constexpr uint32_t RECEIVE_WAIT_MS = 200;

    std::atomic<bool> interrupted(false);

    void onSignal(int)
    {
        interrupted = true;
    }

    struct Args
    {
        std::string serialDevice;
        uint32_t baudRate = 115200;
        std::string bindAddress = "0.0.0.0";
        uint16_t port = 8765;
        agent::AgentOptions agentOptions;
    };

    void printUsage(const char* exe)
    {
        std::cout << "Usage: " << exe << " <serial device> [options]\n";
        std::cout << "Options:\n";
        std::cout << "  --baud <n>             Default: 115200\n";
        std::cout << "  --bind <address>       Default: 0.0.0.0\n";
        std::cout << "  --port <n>             Default: $SPOOLBRIDGE_PORT or 8765\n";
        std::cout << "  --device-name <name>   Name reported in STATUS\n";
        std::cout << "  --no-derive            Do not derive keys when a request carries none\n";
        std::cout << "  --no-auto-read         Do not report tags scanned while idle\n";
        std::cout << "  --log-level <debug|info|warn|error|off>\n";
    }

    uint16_t parsePort(const std::string& value)
    {
        const unsigned long parsed = std::stoul(value, nullptr, 10);
        if (parsed == 0 || parsed > 0xFFFFUL)
        {
            throw std::runtime_error("Port out of range: " + value);
        }
        return static_cast<uint16_t>(parsed);
    }

    Args parseArgs(int argc, char* argv[])
    {
        if (argc < 2)
        {
            throw std::runtime_error("Missing serial device");
        }

        Args args;
        args.serialDevice = argv[1];
        if (const char* port = std::getenv("SPOOLBRIDGE_PORT"))
        {
            args.port = parsePort(port);
        }

        for (int i = 2; i < argc; ++i)
        {
            const std::string opt = argv[i];
            auto requireValue = [&](const char* optionName) -> std::string
            {
                if ((i + 1) >= argc)
                {
                    throw std::runtime_error(std::string("Missing value for ") + optionName);
                }
                return argv[++i];
            };

            if (opt == "--baud")
            {
                args.baudRate = static_cast<uint32_t>(std::stoul(requireValue("--baud"), nullptr, 10));
            }
            else if (opt == "--bind")
            {
                args.bindAddress = requireValue("--bind");
            }
            else if (opt == "--port")
            {
                args.port = parsePort(requireValue("--port"));
            }
            else if (opt == "--device-name")
            {
                args.agentOptions.deviceName = requireValue("--device-name");
            }
            else if (opt == "--no-derive")
            {
                args.agentOptions.deriveKeysLocally = false;
            }
            else if (opt == "--no-auto-read")
            {
                args.agentOptions.autoReadWithoutRequest = false;
            }
            else if (opt == "--log-level")
            {
                const std::string level = requireValue("--log-level");
                Logger::setLevel(Logger::parseLevel(level.c_str(), Logger::getLevel()));
            }
            else
            {
                throw std::runtime_error("Unknown option: " + opt);
            }
        }
        return args;
    }

    void serveInitiator(comms::ITransport& connection,
                        Pn532TagReader& reader,
                        agent::MifareClassicCard& card,
                        const spool::KeyDerivation& kdf,
                        const agent::AgentOptions& options)
    {
        agent::BridgeAgent bridgeAgent(connection, reader, card, kdf, options);
        auto started = bridgeAgent.start();
        if (!started)
        {
            LOG_WARN("Initiator left before STATUS: %s", started.error().toString().c_str());
            bridgeAgent.stop();
            return;
        }

        while (!interrupted)
        {
            auto serviced = bridgeAgent.serviceOnce(RECEIVE_WAIT_MS);
            if (!serviced)
            {
                LOG_INFO("Initiator disconnected: %s", serviced.error().toString().c_str());
                break;
            }
        }
        bridgeAgent.stop();
    }
}

int main(int argc, char* argv[])
{
    try
    {
        const Args args = parseArgs(argc, argv);
        std::signal(SIGINT, onSignal);
        std::signal(SIGTERM, onSignal);

        SerialOptions serialOptions;
        serialOptions.device = args.serialDevice;
        serialOptions.baudRate = args.baudRate;
        SerialBusPosix serial(serialOptions);
        auto opened = serial.open();
        if (!opened)
        {
            std::cerr << "Serial open failed: " << opened.error().toString().c_str() << "\n";
            return 1;
        }

        Pn532Driver driver(serial);
        Pn532TagReader reader(driver);
        auto firmware = reader.init();
        if (!firmware)
        {
            std::cerr << "PN532 init failed: " << firmware.error().toString().c_str() << "\n";
            return 1;
        }
        std::cout << "Reader: " << firmware.value().toString().c_str() << "\n";

        agent::MifareClassicCard card(reader);
        spool::KeyDerivation kdf(spool::KdfParameters::bambuDefaults());

        TcpLineTransportOptions serverOptions;
        serverOptions.host = args.bindAddress;
        serverOptions.port = args.port;
        TcpLineServer server(serverOptions);
        auto listening = server.open();
        if (!listening)
        {
            std::cerr << "Cannot listen on port " << args.port << ": " << listening.error().toString().c_str() << "\n";
            return 1;
        }
        std::cout << "Agent listening on " << args.bindAddress << ":" << server.boundPort() << "\n";

        while (!interrupted)
        {
            auto accepted = server.accept(ACCEPT_WAIT_MS);
            if (!accepted)
            {
                std::cerr << "Accept failed: " << accepted.error().toString().c_str() << "\n";
                return 1;
            }
            if (!accepted.value())
            {
                continue;
            }

            card.reset();
            serveInitiator(*accepted.value(), reader, card, kdf, args.agentOptions);
        }

        server.close();
        serial.close();
        return 0;
    }
    catch (const std::exception& ex)
    {
        printUsage(argv[0]);
        std::cerr << "\nError: " << ex.what() << "\n";
        return 1;
    }
}
