/**
 * @file main.cpp
 * @brief Initiator side of the bridge: read, write or clone a spool tag via a remote agent
 *
 * Flow:
 *   1) Connect to the agent (SPOOLBRIDGE_HOST / SPOOLBRIDGE_PORT, or --host / --port)
 *   2) Issue one request and wait for the tag to be presented
 *   3) Print the decoded record or the number of blocks written
 */

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>

#include "Bridge/BridgeSession.h"
#include "Comms/Tcp/TcpLineTransport.hpp"
#include "Spool/DumpFormat.h"
#include "Spool/KeyDerivation.h"
#include "Utils/Logging.h"

using namespace comms::tcp;
using namespace bridge;

namespace
{
    std::atomic<bool> interrupted(false);

    void onSignal(int)
    {
        interrupted = true;
    }

    struct Args
    {
        std::string command;
        std::string dumpFile;
        std::string host = "127.0.0.1";
        uint16_t port = 8765;
        uint32_t timeoutMs = BridgeSessionOptions::DEFAULT_TIMEOUT_MS;
        std::string keyUid;
        bool rewriteUid = false;
        std::string saveTo;
    };

    void printUsage(const char* exe)
    {
        std::cout << "Usage: " << exe << " <read|write|clone|listen> [dump file] [options]\n";
        std::cout << "Options:\n";
        std::cout << "  --host <name>          Default: $SPOOLBRIDGE_HOST or 127.0.0.1\n";
        std::cout << "  --port <n>             Default: $SPOOLBRIDGE_PORT or 8765\n";
        std::cout << "  --timeout <ms>         Default: 30000\n";
        std::cout << "  --key-uid <hex>        read: send keys derived from this UID\n";
        std::cout << "                         write: derive keys from this UID instead of the dump's\n";
        std::cout << "  --rewrite-uid          clone: ask the agent to copy the source UID\n";
        std::cout << "  --save <file>          read: store the image as a Proxmark3 dump\n";
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
            throw std::runtime_error("Missing command");
        }

        Args args;
        if (const char* host = std::getenv("SPOOLBRIDGE_HOST"))
        {
            args.host = host;
        }
        if (const char* port = std::getenv("SPOOLBRIDGE_PORT"))
        {
            args.port = parsePort(port);
        }

        args.command = argv[1];
        int i = 2;
        if (args.command == "write" || args.command == "clone")
        {
            if (argc < 3)
            {
                throw std::runtime_error("Missing dump file");
            }
            args.dumpFile = argv[2];
            i = 3;
        }
        else if (args.command != "read" && args.command != "listen")
        {
            throw std::runtime_error("Unknown command: " + args.command);
        }

        for (; i < argc; ++i)
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

            if (opt == "--host")
            {
                args.host = requireValue("--host");
            }
            else if (opt == "--port")
            {
                args.port = parsePort(requireValue("--port"));
            }
            else if (opt == "--timeout")
            {
                args.timeoutMs = static_cast<uint32_t>(std::stoul(requireValue("--timeout"), nullptr, 10));
            }
            else if (opt == "--key-uid")
            {
                args.keyUid = requireValue("--key-uid");
            }
            else if (opt == "--rewrite-uid")
            {
                args.rewriteUid = true;
            }
            else if (opt == "--save")
            {
                args.saveTo = requireValue("--save");
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

    spool::TagImage loadDump(const std::string& path)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in)
        {
            throw std::runtime_error("Cannot open " + path);
        }
        const std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        auto image = spool::DumpFormat::fromFileContents(contents);
        if (!image)
        {
            throw std::runtime_error(std::string("Cannot import dump: ") + image.error().toString().c_str());
        }
        return image.value();
    }

    spool::TagUid parseUid(const std::string& text)
    {
        auto uid = spool::uidFromHex(etl::string_view(text.data(), text.size()));
        if (!uid)
        {
            throw std::runtime_error("Invalid UID: " + text);
        }
        return uid.value();
    }

    void printRead(const ReadResult& result)
    {
        std::cout << result.record.toString();
        std::cout << "Readable sectors: " << result.readable.count() << "/16\n";
    }

    int reportFailure(const char* what, const error::Error& err, const BridgeSession& session)
    {
        std::cerr << what << " failed: " << err.toString().c_str();
        if (err.isCode(error::BridgeError::AgentReported) && !session.lastAgentMessage().empty())
        {
            std::cerr << " (" << session.lastAgentMessage() << ")";
        }
        std::cerr << "\n";
        return 1;
    }

    etl::expected<uint32_t, error::Error> writeWithKeysOf(BridgeSession& session,
                                                         const spool::KeyDerivation& kdf,
                                                         const spool::TagUid& keyUid,
                                                         const spool::TagImage& image,
                                                         uint32_t timeoutMs)
    {
        auto keys = kdf.derive(keyUid);
        if (!keys)
        {
            return etl::unexpected<error::Error>(keys.error());
        }
        return session.requestWrite(image, keys.value(), timeoutMs);
    }

    int runListen(BridgeSession& session)
    {
        session.setTagDetectedListener([](const spool::TagUid& uid) {
            std::cout << "Tag detected: " << spool::uidToHex(uid) << "\n";
        });
        session.setTagDataListener([](const ReadResult& result) {
            printRead(result);
            std::cout << "\n";
        });

        std::cout << "Listening for scans, Ctrl-C to stop\n";
        while (!interrupted)
        {
            session.service(session.getOptions().pollIntervalMs);
        }
        return 0;
    }
}

int main(int argc, char* argv[])
{
    try
    {
        const Args args = parseArgs(argc, argv);
        std::signal(SIGINT, onSignal);

        TcpLineTransportOptions transportOptions;
        transportOptions.host = args.host;
        transportOptions.port = args.port;
        TcpLineTransport transport(transportOptions);

        spool::KeyDerivation kdf(spool::KdfParameters::bambuDefaults());
        BridgeSession session(transport, kdf);

        auto started = session.start();
        if (!started && args.command != "listen")
        {
            std::cerr << "Cannot reach agent at " << args.host << ":" << args.port << ": "
                      << started.error().toString().c_str() << "\n";
            return 1;
        }

        if (args.command == "listen")
        {
            return runListen(session);
        }

        std::cout << "Present a tag to the agent...\n";
        if (args.command == "read")
        {
            auto result = args.keyUid.empty()
                ? session.requestRead(args.timeoutMs)
                : session.requestRead(args.timeoutMs, parseUid(args.keyUid));
            if (!result)
            {
                return reportFailure("Read", result.error(), session);
            }
            printRead(result.value());

            if (!args.saveTo.empty())
            {
                std::ofstream out(args.saveTo);
                out << spool::DumpFormat::toProxmark3(result.value().image) << "\n";
                if (!out)
                {
                    std::cerr << "Cannot write " << args.saveTo << "\n";
                    return 1;
                }
            }
            return 0;
        }

        const spool::TagImage image = loadDump(args.dumpFile);
        if (args.command == "write")
        {
            auto written = args.keyUid.empty()
                ? session.requestWrite(image, args.timeoutMs)
                : writeWithKeysOf(session, kdf, parseUid(args.keyUid), image, args.timeoutMs);
            if (!written)
            {
                return reportFailure("Write", written.error(), session);
            }
            std::cout << "Blocks written: " << written.value() << "\n";
            return 0;
        }

        CloneOptions cloneOptions;
        cloneOptions.rewriteUid = args.rewriteUid;
        auto cloned = session.requestClone(image.uid(), image, cloneOptions, args.timeoutMs);
        if (!cloned)
        {
            return reportFailure("Clone", cloned.error(), session);
        }
        std::cout << "Blocks written: " << cloned.value() << "\n";
        return 0;
    }
    catch (const std::exception& ex)
    {
        printUsage(argv[0]);
        std::cerr << "\nError: " << ex.what() << "\n";
        return 1;
    }
}
