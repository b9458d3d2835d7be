#pragma once

#include "xorhunt/ScanTypes.h"

#include <string>

namespace xorhunt {

// Four line block: key, filesystem, offset (hex and decimal), endianness.
std::string formatMatch(const Match &match, unsigned keyWidth, Cipher cipher = Cipher::Xor);
std::string formatOffset(uint64_t offset);
std::string formatShard(const ShardReport &shard, const ScanParams &params);
std::string describeScan(const ScanParams &params);

} // namespace xorhunt
