#include "Hunter.h"

#include "xorhunt/Log.h"

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

namespace {

void printUsage(const char *prog) {
    std::cerr << "Usage: " << prog << " [options] <key|first-last|all> <file> [threads]\n"
              << "  <key>          single key, decimal or 0x hex (e.g. 0x2A)\n"
              << "  <first-last>   inclusive key range searched exhaustively\n"
              << "  all            the whole key space of the key width\n"
              << "  [threads]      worker count (default: hardware threads)\n"
              << "Options:\n"
              << "  --width=N            key width in bytes, 1-4 (default 4)\n"
              << "  --cipher=C           xor | rc4 (default xor)\n"
              << "  --phase=P            signature | buffer (default signature, xor only)\n"
              << "  --max-size=BYTES     scan window cap, K/M/G suffix allowed (default 1M)\n"
              << "  --reject-oversized   fail instead of truncating larger files\n"
              << "  --catalog=NAME       filesystems | firmware (default filesystems)\n"
              << "  --signatures=FILE    extra signatures, one \"name LE-bytes [| BE-bytes]\" per line\n"
              << "  --limit=N            stop after N matches, 0 for no limit (default 100000)\n"
              << "  --brute              try every key instead of deriving keys from the data (rc4 always does)\n"
              << "  --quiet              no progress or diagnostics\n";
}

bool parseCount(const char *text, size_t &out) {
    char *end = nullptr;
    unsigned long long v = std::strtoull(text, &end, 10);
    if (!end || *end != '\0' || text[0] == '\0' || text[0] == '-') return false;
    out = static_cast<size_t>(v);
    return true;
}

bool splitOption(const std::string &arg, std::string &name, std::string &value) {
    auto eq = arg.find('=');
    if (eq == std::string::npos) {
        name = arg;
        value.clear();
        return false;
    }
    name = arg.substr(0, eq);
    value = arg.substr(eq + 1);
    return true;
}

} // namespace

int main(int argc, char **argv) {
    HuntOptions options;
    options.params.matchLimit = 100000;
    std::vector<std::string> positional;
    std::string keyText;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0) {
            positional.push_back(arg);
            continue;
        }
        std::string name;
        std::string value;
        bool hasValue = splitOption(arg, name, value);
        if (name == "--help") {
            printUsage(argv[0]);
            return kExitOk;
        } else if (name == "--width" && hasValue) {
            size_t w = 0;
            if (!parseCount(value.c_str(), w) || !xorhunt::validKeyWidth(static_cast<unsigned>(w))) {
                std::cerr << "Key width must be 1, 2, 3 or 4\n";
                return kExitConfig;
            }
            options.params.keyWidth = static_cast<unsigned>(w);
        } else if (name == "--cipher" && hasValue) {
            if (!xorhunt::parseCipher(value, options.params.cipher)) {
                std::cerr << "Cipher must be \"xor\" or \"rc4\"\n";
                return kExitConfig;
            }
        } else if (name == "--phase" && hasValue) {
            if (!xorhunt::parseKeyPhase(value, options.params.phase)) {
                std::cerr << "Phase must be \"signature\" or \"buffer\"\n";
                return kExitConfig;
            }
        } else if (name == "--max-size" && hasValue) {
            if (!xorhunt::FirmwareImage::parseByteSize(value, options.load.maxBytes) || options.load.maxBytes == 0) {
                std::cerr << "Invalid size cap\n";
                return kExitConfig;
            }
        } else if (name == "--reject-oversized" && !hasValue) {
            options.load.policy = xorhunt::OversizePolicy::Reject;
        } else if (name == "--catalog" && hasValue) {
            options.catalogName = value;
        } else if (name == "--signatures" && hasValue) {
            options.signatureFile = value;
        } else if (name == "--limit" && hasValue) {
            if (!parseCount(value.c_str(), options.params.matchLimit)) {
                std::cerr << "Invalid match limit\n";
                return kExitConfig;
            }
        } else if (name == "--brute" && !hasValue) {
            options.params.strategy = xorhunt::KeyStrategy::Enumerate;
        } else if (name == "--quiet" && !hasValue) {
            options.quiet = true;
        } else {
            std::cerr << "Unknown option " << arg << "\n";
            printUsage(argv[0]);
            return kExitConfig;
        }
    }

    if (positional.size() < 2 || positional.size() > 3) {
        printUsage(argv[0]);
        return kExitConfig;
    }
    keyText = positional[0];
    options.path = positional[1];
    if (positional.size() == 3) {
        if (!parseCount(positional[2].c_str(), options.params.workers) || options.params.workers == 0) {
            std::cerr << "Thread count must be a positive integer\n";
            return kExitConfig;
        }
    }

    std::string error;
    if (!xorhunt::parseKeySpec(keyText, options.params.keyWidth, options.keys, error)) {
        std::cerr << error << "\n";
        return kExitConfig;
    }
    if (options.quiet) xorhunt::setLogEnabled(false);

    Hunter hunter(std::move(options));
    return hunter.run();
}
