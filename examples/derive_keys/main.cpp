/**
 * @file main.cpp
 * @brief Print the 16 sector keys of a filament tag UID
 *
 * Usage:
 *   derive_keys <UID hex>
 */

#include <iostream>
#include <string>

#include "Spool/KeyDerivation.h"

int main(int argc, char* argv[])
{
    if (argc != 2)
    {
        std::cerr << "Usage: " << argv[0] << " <UID hex, e.g. 7AD43F1C>\n";
        return 1;
    }

    const std::string uid = argv[1];
    spool::KeyDerivation kdf(spool::KdfParameters::bambuDefaults());
    auto keys = kdf.deriveFromHex(etl::string_view(uid.data(), uid.size()));
    if (!keys)
    {
        std::cerr << "Key derivation failed: " << keys.error().toString().c_str() << "\n";
        return 1;
    }

    const auto hex = spool::keySetToHex(keys.value());
    for (size_t sector = 0; sector < hex.size(); ++sector)
    {
        std::cout << "Sector " << (sector < 10 ? " " : "") << sector << ": " << hex[sector] << "\n";
    }
    return 0;
}
