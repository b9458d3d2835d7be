#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace xorhunt {

enum class Endianness {
    Little,
    Big
};

inline const char *endiannessName(Endianness e) {
    return e == Endianness::Little ? "Little Endian" : "Big Endian";
}

struct SignatureEntry {
    std::string name;
    std::vector<uint8_t> little;
    std::vector<uint8_t> big; // empty for byte-order-free magics

    size_t length() const { return little.size(); }
    bool hasBig() const { return !big.empty(); }
    const std::vector<uint8_t> &bytes(Endianness e) const { return e == Endianness::Little ? little : big; }
};

// Read-only table of magic sequences consulted identically by every worker.
// Adding a filesystem is an add() call, never a change to the matching code.
class SignatureCatalog {
public:
    SignatureCatalog() = default;

    // Squashfs, CramFS and JFFS2 in both byte orders.
    static SignatureCatalog filesystems();
    // filesystems() plus ELF, U-Boot uImage, gzip and LZMA headers.
    static SignatureCatalog firmware();
    static bool byName(const std::string &name, SignatureCatalog &out);

    bool add(SignatureEntry entry);
    bool add(const std::string &name, std::vector<uint8_t> little, std::vector<uint8_t> big = {});

    // Lines of "name LE-bytes [| BE-bytes]"; '#' starts a comment.
    bool loadFromFile(const std::string &path);
    bool loadFromString(const std::string &text);

    // "68 73 71 73", "68737173" and "0x68 0x73" are all accepted.
    static bool parseHexBytes(const std::string &text, std::vector<uint8_t> &out);

    const std::vector<SignatureEntry> &entries() const { return entries_; }
    const SignatureEntry &at(size_t index) const { return entries_.at(index); }
    const SignatureEntry *find(const std::string &name) const;
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    size_t minLength() const;
    size_t maxLength() const;

    const std::string &lastError() const { return lastError_; }

private:
    std::vector<SignatureEntry> entries_;
    std::string lastError_;
};

} // namespace xorhunt
