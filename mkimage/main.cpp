#include "xorhunt/Rc4.h"
#include "xorhunt/SignatureCatalog.h"
#include "xorhunt/XorKey.h"

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <random>
#include <string>
#include <vector>

// Writes an obfuscated test image: pseudo-random filler with one magic
// planted at a known offset, then XORed (or RC4-encrypted) with the key.

namespace {

void printUsage(const char *prog) {
    std::cerr << "Usage: " << prog
              << " <out> <key> <offset> [size] [signature] [--width=N] [--phase=signature|buffer] [--cipher=xor|rc4]\n"
              << "  <key>       XOR key, decimal or 0x hex\n"
              << "  <offset>    where the magic is planted\n"
              << "  [size]      image size in bytes (default 65536)\n"
              << "  [signature] built-in signature name (default Squashfs)\n";
}

} // namespace

int main(int argc, char **argv) {
    std::vector<std::string> positional;
    unsigned width = 4;
    xorhunt::KeyPhase phase = xorhunt::KeyPhase::Signature;
    xorhunt::Cipher cipher = xorhunt::Cipher::Xor;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--width=", 0) == 0) {
            uint64_t w = 0;
            if (!xorhunt::parseKeyValue(arg.substr(8), w) || !xorhunt::validKeyWidth(static_cast<unsigned>(w))) {
                std::cerr << "Key width must be 1, 2, 3 or 4\n";
                return 1;
            }
            width = static_cast<unsigned>(w);
        } else if (arg.rfind("--phase=", 0) == 0) {
            if (!xorhunt::parseKeyPhase(arg.substr(8), phase)) {
                std::cerr << "Phase must be \"signature\" or \"buffer\"\n";
                return 1;
            }
        } else if (arg.rfind("--cipher=", 0) == 0) {
            if (!xorhunt::parseCipher(arg.substr(9), cipher)) {
                std::cerr << "Cipher must be \"xor\" or \"rc4\"\n";
                return 1;
            }
        } else {
            positional.push_back(arg);
        }
    }
    if (positional.size() < 3 || positional.size() > 5) {
        printUsage(argv[0]);
        return 1;
    }

    uint64_t key = 0;
    uint64_t offset = 0;
    uint64_t size = 65536;
    if (!xorhunt::parseKeyValue(positional[1], key) || key >= xorhunt::keySpaceSize(width)) {
        std::cerr << "Invalid key\n";
        return 1;
    }
    if (!xorhunt::parseKeyValue(positional[2], offset)) {
        std::cerr << "Invalid offset\n";
        return 1;
    }
    if (positional.size() >= 4 && (!xorhunt::parseKeyValue(positional[3], size) || size == 0)) {
        std::cerr << "Invalid size\n";
        return 1;
    }
    std::string sigName = positional.size() == 5 ? positional[4] : "Squashfs";
    auto catalog = xorhunt::SignatureCatalog::firmware();
    const xorhunt::SignatureEntry *sig = catalog.find(sigName);
    if (!sig) {
        std::cerr << "Unknown signature " << sigName << "\n";
        return 1;
    }
    if (offset + sig->length() > size) {
        std::cerr << "Signature does not fit at offset " << offset << "\n";
        return 1;
    }

    std::vector<uint8_t> image(static_cast<size_t>(size));
    std::mt19937 rng(0x5eed);
    std::uniform_int_distribution<int> dist(0, 255);
    for (auto &b : image) b = static_cast<uint8_t>(dist(rng));
    for (size_t k = 0; k < sig->length(); ++k) {
        image[static_cast<size_t>(offset + k)] = sig->little[k];
    }

    if (cipher == xorhunt::Cipher::Rc4) {
        uint8_t keyBytes[xorhunt::kMaxKeyWidth] = {};
        for (unsigned i = 0; i < width; ++i) keyBytes[i] = xorhunt::keyByte(static_cast<uint32_t>(key), i);
        xorhunt::Rc4 rc4(keyBytes, width);
        rc4.apply(image.data(), image.data(), image.size());
    } else {
        for (uint64_t p = 0; p < size; ++p) {
            uint64_t idx = phase == xorhunt::KeyPhase::Signature ? (p + width - offset % width) % width : p % width;
            image[static_cast<size_t>(p)] ^=
                xorhunt::keyByte(static_cast<uint32_t>(key), static_cast<unsigned>(idx));
        }
    }

    std::ofstream out(positional[0], std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out.good()) {
        std::cerr << "Cannot open " << positional[0] << " for writing\n";
        return 2;
    }
    out.write(reinterpret_cast<const char *>(image.data()), static_cast<std::streamsize>(image.size()));
    if (!out.good()) {
        std::cerr << "Write to " << positional[0] << " failed\n";
        return 2;
    }
    std::cout << "wrote " << size << " bytes to " << positional[0] << " with " << sig->name << " at offset "
              << offset << " under " << xorhunt::cipherName(cipher) << " key "
              << xorhunt::formatKey(static_cast<uint32_t>(key), width) << "\n";
    return 0;
}
