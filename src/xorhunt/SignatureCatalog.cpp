#include "xorhunt/SignatureCatalog.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace xorhunt {

namespace {
std::string trim(const std::string &s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}
} // namespace

SignatureCatalog SignatureCatalog::filesystems() {
    SignatureCatalog c;
    // "hsqs" on disk for little-endian images, "sqsh" for big-endian ones
    c.add("Squashfs", {0x68, 0x73, 0x71, 0x73}, {0x73, 0x71, 0x73, 0x68});
    c.add("CramFS", {0x45, 0x3D, 0xCD, 0x28}, {0x28, 0xCD, 0x3D, 0x45});
    c.add("JFFS2", {0x85, 0x19}, {0x19, 0x85});
    return c;
}

SignatureCatalog SignatureCatalog::firmware() {
    SignatureCatalog c = filesystems();
    c.add("ELF", {0x7F, 0x45, 0x4C, 0x46});
    c.add("uImage", {0x27, 0x05, 0x19, 0x56});
    c.add("gzip", {0x1F, 0x8B});
    c.add("LZMA", {0x5D, 0x00, 0x00, 0x80});
    return c;
}

bool SignatureCatalog::byName(const std::string &name, SignatureCatalog &out) {
    if (name == "filesystems" || name == "fs") {
        out = filesystems();
        return true;
    }
    if (name == "firmware" || name == "fw") {
        out = firmware();
        return true;
    }
    return false;
}

bool SignatureCatalog::add(SignatureEntry entry) {
    lastError_.clear();
    if (entry.name.empty()) {
        lastError_ = "signature name is empty";
        return false;
    }
    if (entry.little.empty()) {
        lastError_ = "signature '" + entry.name + "' has no bytes";
        return false;
    }
    if (!entry.big.empty() && entry.big.size() != entry.little.size()) {
        lastError_ = "signature '" + entry.name + "' has byte orders of different length";
        return false;
    }
    entries_.push_back(std::move(entry));
    return true;
}

bool SignatureCatalog::add(const std::string &name, std::vector<uint8_t> little, std::vector<uint8_t> big) {
    return add(SignatureEntry{name, std::move(little), std::move(big)});
}

bool SignatureCatalog::parseHexBytes(const std::string &text, std::vector<uint8_t> &out) {
    out.clear();
    std::istringstream iss(text);
    std::string tok;
    while (iss >> tok) {
        if (tok.size() > 2 && tok[0] == '0' && (tok[1] == 'x' || tok[1] == 'X')) {
            tok = tok.substr(2);
        }
        if (tok.empty() || tok.size() % 2 != 0) {
            out.clear();
            return false;
        }
        for (size_t i = 0; i < tok.size(); i += 2) {
            char pair[3] = {tok[i], tok[i + 1], '\0'};
            if (!std::isxdigit(static_cast<unsigned char>(pair[0])) ||
                !std::isxdigit(static_cast<unsigned char>(pair[1]))) {
                out.clear();
                return false;
            }
            out.push_back(static_cast<uint8_t>(std::strtoul(pair, nullptr, 16)));
        }
    }
    return !out.empty();
}

bool SignatureCatalog::loadFromFile(const std::string &path) {
    lastError_.clear();
    std::ifstream f(path);
    if (!f.good()) {
        lastError_ = "cannot open signature file " + path;
        return false;
    }
    std::stringstream ss;
    ss << f.rdbuf();
    if (!loadFromString(ss.str())) {
        lastError_ = path + ": " + lastError_;
        return false;
    }
    return true;
}

bool SignatureCatalog::loadFromString(const std::string &text) {
    lastError_.clear();
    std::vector<SignatureEntry> parsed;
    std::istringstream iss(text);
    std::string line;
    int lineNo = 0;
    while (std::getline(iss, line)) {
        ++lineNo;
        auto hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        line = trim(line);
        if (line.empty()) continue;

        auto split = line.find_first_of(" \t");
        if (split == std::string::npos) {
            lastError_ = "line " + std::to_string(lineNo) + ": missing signature bytes";
            return false;
        }
        SignatureEntry entry;
        entry.name = line.substr(0, split);
        std::string rest = line.substr(split + 1);
        std::string littleText = rest;
        std::string bigText;
        auto bar = rest.find('|');
        if (bar != std::string::npos) {
            littleText = rest.substr(0, bar);
            bigText = trim(rest.substr(bar + 1));
        }
        if (!parseHexBytes(littleText, entry.little)) {
            lastError_ = "line " + std::to_string(lineNo) + ": bad little-endian bytes";
            return false;
        }
        if (bar != std::string::npos && !parseHexBytes(bigText, entry.big)) {
            lastError_ = "line " + std::to_string(lineNo) + ": bad big-endian bytes";
            return false;
        }
        if (!entry.big.empty() && entry.big.size() != entry.little.size()) {
            lastError_ = "line " + std::to_string(lineNo) + ": byte orders differ in length";
            return false;
        }
        parsed.push_back(std::move(entry));
    }
    // all-or-nothing so a bad file leaves the catalog untouched
    for (auto &entry : parsed) {
        entries_.push_back(std::move(entry));
    }
    return true;
}

const SignatureEntry *SignatureCatalog::find(const std::string &name) const {
    for (const auto &entry : entries_) {
        if (entry.name == name) return &entry;
    }
    return nullptr;
}

size_t SignatureCatalog::minLength() const {
    size_t len = 0;
    for (const auto &entry : entries_) {
        if (len == 0 || entry.length() < len) len = entry.length();
    }
    return len;
}

size_t SignatureCatalog::maxLength() const {
    size_t len = 0;
    for (const auto &entry : entries_) {
        len = std::max(len, entry.length());
    }
    return len;
}

} // namespace xorhunt
