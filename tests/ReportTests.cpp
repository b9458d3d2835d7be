#include <gtest/gtest.h>

#include "xorhunt/Report.h"

#include <string>

using namespace xorhunt;

TEST(ReportTest, OffsetShowsHexAndDecimal) {
    EXPECT_EQ(formatOffset(4096), "0x1000 (4096 bytes)");
    EXPECT_EQ(formatOffset(0), "0x0 (0 bytes)");
}

TEST(ReportTest, MatchBlock) {
    Match m{0xDEADBEEF, 4096, "Squashfs", 0, Endianness::Big};
    std::string text = formatMatch(m, 4);
    EXPECT_NE(text.find("XOR Key: 0xDEADBEEF"), std::string::npos);
    EXPECT_NE(text.find("Filesystem: Squashfs"), std::string::npos);
    EXPECT_NE(text.find("Offset: 0x1000 (4096 bytes)"), std::string::npos);
    EXPECT_NE(text.find("Endianness: Big Endian"), std::string::npos);
}

TEST(ReportTest, IncompleteShardNamesError) {
    ScanParams params;
    params.mode = ScanMode::Exhaustive;
    params.keyWidth = 2;
    ShardReport shard;
    shard.assignment.worker = 3;
    shard.assignment.keyBegin = 0x100;
    shard.assignment.keyEnd = 0x200;
    shard.error = "out of memory";
    EXPECT_EQ(formatShard(shard, params), "shard 3 keys 0x0100 .. 0x01FF: INCOMPLETE (out of memory)");
    shard.completed = true;
    shard.matches = 2;
    EXPECT_EQ(formatShard(shard, params), "shard 3 keys 0x0100 .. 0x01FF: 2 match(es)");
}

TEST(ReportTest, DescribeSingleKeyScan) {
    ScanParams params;
    params.key = 0x5A;
    params.keyWidth = 1;
    params.workers = 2;
    EXPECT_EQ(describeScan(params), "single key 0x5A, 1 byte key, signature phase, 2 worker(s)");
}

TEST(ReportTest, Rc4ScanNamesCipher) {
    Match m{0x1234, 16, "CramFS", 1, Endianness::Little};
    EXPECT_NE(formatMatch(m, 2, Cipher::Rc4).find("RC4 Key: 0x1234"), std::string::npos);

    ScanParams params;
    params.mode = ScanMode::Exhaustive;
    params.cipher = Cipher::Rc4;
    params.firstKey = 0;
    params.lastKey = 0xFF;
    params.keyWidth = 1;
    params.workers = 4;
    EXPECT_EQ(describeScan(params), "RC4 keys 0x00 to 0xFF (enumerated), 1 byte key, 4 worker(s)");
}
