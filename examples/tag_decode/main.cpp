/**
 * @file main.cpp
 * @brief Decode a filament tag dump, optionally converting it
 *
 * Flow:
 *   1) Load a dump (binary, hex, base64 or Proxmark3 text)
 *   2) Print the decoded record
 *   3) Optionally write the image back out in another format
 */

#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>

#include "Spool/DumpFormat.h"
#include "Spool/TagCodec.h"
#include "Utils/Logging.h"

namespace
{
    enum class OutputFormat
    {
        None,
        Binary,
        Hex,
        Base64,
        Proxmark3
    };

    struct Args
    {
        std::string input;
        OutputFormat format = OutputFormat::None;
        std::string output;
    };

    void printUsage(const char* exe)
    {
        std::cout << "Usage: " << exe << " <dump file> [options]\n";
        std::cout << "Options:\n";
        std::cout << "  --convert <bin|hex|base64|pm3>   Write the image in this format\n";
        std::cout << "  --out <file>                     Destination, default stdout\n";
        std::cout << "  --log-level <debug|info|warn|error|off>\n";
    }

    OutputFormat parseFormat(const std::string& value)
    {
        if (value == "bin") return OutputFormat::Binary;
        if (value == "hex") return OutputFormat::Hex;
        if (value == "base64") return OutputFormat::Base64;
        if (value == "pm3") return OutputFormat::Proxmark3;
        throw std::runtime_error("Unknown format: " + value);
    }

    Args parseArgs(int argc, char* argv[])
    {
        if (argc < 2)
        {
            throw std::runtime_error("Missing dump file");
        }

        Args args;
        args.input = argv[1];
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

            if (opt == "--convert")
            {
                args.format = parseFormat(requireValue("--convert"));
            }
            else if (opt == "--out")
            {
                args.output = requireValue("--out");
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

    std::string readFile(const std::string& path)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in)
        {
            throw std::runtime_error("Cannot open " + path);
        }
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    std::string render(const spool::TagImage& image, OutputFormat format)
    {
        switch (format)
        {
            case OutputFormat::Binary:
            {
                const auto bytes = spool::DumpFormat::toBinary(image);
                return std::string(bytes.begin(), bytes.end());
            }
            case OutputFormat::Hex:
                return spool::DumpFormat::toHex(image) + "\n";
            case OutputFormat::Base64:
                return spool::DumpFormat::toBase64(image) + "\n";
            case OutputFormat::Proxmark3:
                return spool::DumpFormat::toProxmark3(image) + "\n";
            default:
                return std::string();
        }
    }
}

int main(int argc, char* argv[])
{
    try
    {
        const Args args = parseArgs(argc, argv);

        auto image = spool::DumpFormat::fromFileContents(readFile(args.input));
        if (!image)
        {
            std::cerr << "Cannot import " << args.input << ": " << image.error().toString().c_str() << "\n";
            return 1;
        }

        if (args.format == OutputFormat::None)
        {
            std::cout << spool::TagCodec::decode(image.value()).toString();
            return 0;
        }

        const std::string rendered = render(image.value(), args.format);
        if (args.output.empty())
        {
            std::cout << rendered;
        }
        else
        {
            std::ofstream out(args.output, std::ios::binary);
            out << rendered;
            if (!out)
            {
                std::cerr << "Cannot write " << args.output << "\n";
                return 1;
            }
        }
        return 0;
    }
    catch (const std::exception& ex)
    {
        printUsage(argv[0]);
        std::cerr << "\nError: " << ex.what() << "\n";
        return 1;
    }
}
