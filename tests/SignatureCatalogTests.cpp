#include <gtest/gtest.h>

#include "xorhunt/SignatureCatalog.h"

#include <filesystem>
#include <fstream>
#include <vector>

using namespace xorhunt;

TEST(SignatureCatalogTest, FilesystemTable) {
    auto c = SignatureCatalog::filesystems();
    ASSERT_EQ(c.size(), 3u);
    const auto *sq = c.find("Squashfs");
    ASSERT_NE(sq, nullptr);
    EXPECT_EQ(sq->little, (std::vector<uint8_t>{0x68, 0x73, 0x71, 0x73}));
    EXPECT_EQ(sq->big, (std::vector<uint8_t>{0x73, 0x71, 0x73, 0x68}));
    const auto *cram = c.find("CramFS");
    ASSERT_NE(cram, nullptr);
    EXPECT_EQ(cram->little, (std::vector<uint8_t>{0x45, 0x3D, 0xCD, 0x28}));
    EXPECT_EQ(cram->big, (std::vector<uint8_t>{0x28, 0xCD, 0x3D, 0x45}));
    const auto *jffs2 = c.find("JFFS2");
    ASSERT_NE(jffs2, nullptr);
    EXPECT_EQ(jffs2->little, (std::vector<uint8_t>{0x85, 0x19}));
    EXPECT_EQ(jffs2->big, (std::vector<uint8_t>{0x19, 0x85}));
    EXPECT_EQ(c.minLength(), 2u);
    EXPECT_EQ(c.maxLength(), 4u);
}

TEST(SignatureCatalogTest, FirmwareExtendsFilesystems) {
    auto c = SignatureCatalog::firmware();
    EXPECT_GT(c.size(), SignatureCatalog::filesystems().size());
    ASSERT_NE(c.find("ELF"), nullptr);
    EXPECT_FALSE(c.find("ELF")->hasBig());
    EXPECT_NE(c.find("Squashfs"), nullptr);
    EXPECT_EQ(c.find("NTFS"), nullptr);
}

TEST(SignatureCatalogTest, ByName) {
    SignatureCatalog c;
    EXPECT_TRUE(SignatureCatalog::byName("fs", c));
    EXPECT_EQ(c.size(), 3u);
    EXPECT_TRUE(SignatureCatalog::byName("firmware", c));
    EXPECT_NE(c.find("gzip"), nullptr);
    EXPECT_FALSE(SignatureCatalog::byName("everything", c));
}

TEST(SignatureCatalogTest, AddValidatesEntries) {
    SignatureCatalog c;
    EXPECT_FALSE(c.add("", {0x01}));
    EXPECT_FALSE(c.add("Empty", {}));
    EXPECT_FALSE(c.add("Skewed", {0x01, 0x02}, {0x02}));
    EXPECT_FALSE(c.lastError().empty());
    EXPECT_TRUE(c.add("UBI", {0x55, 0x42, 0x49, 0x23}));
    EXPECT_EQ(c.size(), 1u);
    EXPECT_EQ(c.at(0).bytes(Endianness::Little).size(), 4u);
}

TEST(SignatureCatalogTest, ParseHexBytes) {
    std::vector<uint8_t> out;
    ASSERT_TRUE(SignatureCatalog::parseHexBytes("68 73 71 73", out));
    EXPECT_EQ(out, (std::vector<uint8_t>{0x68, 0x73, 0x71, 0x73}));
    ASSERT_TRUE(SignatureCatalog::parseHexBytes("0x85 0x19", out));
    EXPECT_EQ(out, (std::vector<uint8_t>{0x85, 0x19}));
    ASSERT_TRUE(SignatureCatalog::parseHexBytes("453dcd28", out));
    EXPECT_EQ(out.size(), 4u);
    EXPECT_FALSE(SignatureCatalog::parseHexBytes("", out));
    EXPECT_FALSE(SignatureCatalog::parseHexBytes("123", out));
    EXPECT_FALSE(SignatureCatalog::parseHexBytes("zz", out));
}

TEST(SignatureCatalogTest, LoadFromString) {
    SignatureCatalog c = SignatureCatalog::filesystems();
    const char *text =
        "# extra magics\n"
        "UBI 55 42 49 23\n"
        "\n"
        "YAFFS2 0x03 0x00 0x00 0x00 | 00 00 00 03   # object header\n";
    ASSERT_TRUE(c.loadFromString(text)) << c.lastError();
    EXPECT_EQ(c.size(), 5u);
    const auto *yaffs = c.find("YAFFS2");
    ASSERT_NE(yaffs, nullptr);
    EXPECT_TRUE(yaffs->hasBig());
    EXPECT_EQ(yaffs->big.back(), 0x03);
}

/**
 * @brief A bad line rejects the whole file and names the line.
 */
TEST(SignatureCatalogTest, LoadFromStringIsAllOrNothing) {
    SignatureCatalog c;
    EXPECT_FALSE(c.loadFromString("Good 01 02\nBad 01 02 | 03\n"));
    EXPECT_EQ(c.lastError(), "line 2: byte orders differ in length");
    EXPECT_TRUE(c.empty());
    EXPECT_FALSE(c.loadFromString("NameOnly\n"));
    EXPECT_EQ(c.lastError(), "line 1: missing signature bytes");
}

TEST(SignatureCatalogTest, LoadFromFile) {
    auto path = std::filesystem::temp_directory_path() / "xorhunt_signatures.txt";
    {
        std::ofstream out(path);
        out << "ROMFS 2D 72 6F 6D 31 66 73 2D\n";
    }
    SignatureCatalog c;
    EXPECT_TRUE(c.loadFromFile(path.string()));
    ASSERT_EQ(c.size(), 1u);
    EXPECT_EQ(c.at(0).length(), 8u);
    std::filesystem::remove(path);

    EXPECT_FALSE(c.loadFromFile(path.string()));
    EXPECT_FALSE(c.lastError().empty());
}
