#include <gtest/gtest.h>

#include "Hunter.h"
#include "TestSupport.h"
#include "xorhunt/Log.h"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace xorhunt;
using namespace xorhunt::testing;
namespace fs = std::filesystem;

class HunterTest : public ::testing::Test {
protected:
    void SetUp() override {
        setLogEnabled(false);
        dir_ = fs::temp_directory_path() /
               ("xorhunt_hunter_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
        setLogEnabled(true);
    }

    std::string writeBytes(const std::string &name, const std::vector<uint8_t> &bytes) {
        fs::path p = dir_ / name;
        std::ofstream out(p, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char *>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        return p.string();
    }

    std::string writeText(const std::string &name, const std::string &text) {
        fs::path p = dir_ / name;
        std::ofstream out(p, std::ios::trunc);
        out << text;
        return p.string();
    }

    // Squashfs planted at 256 under 0x5A, single byte key.
    std::string plantedImage(size_t size = 2048) {
        auto buffer = makeFiller(size);
        plant(buffer, 256, SignatureCatalog::filesystems().find("Squashfs")->little, 0x5A, 1);
        return writeBytes("planted.bin", buffer);
    }

    static HuntOptions options(const std::string &path, uint64_t first, uint64_t last, unsigned width = 1) {
        HuntOptions o;
        o.path = path;
        o.keys.exhaustive = first != last;
        o.keys.first = first;
        o.keys.last = last;
        o.params.keyWidth = width;
        o.params.workers = 2;
        o.params.matchLimit = 100000;
        o.quiet = true;
        return o;
    }

    static int runHunter(HuntOptions o) {
        Hunter hunter(std::move(o));
        return hunter.run();
    }

    fs::path dir_;
};

TEST_F(HunterTest, SuccessfulScanExitsZero) {
    EXPECT_EQ(runHunter(options(plantedImage(), 0x5A, 0x5A)), kExitOk);
    EXPECT_EQ(runHunter(options(plantedImage(), 0x00, 0xFF)), kExitOk);
}

TEST_F(HunterTest, MissingInputExitsWithInputCode) {
    EXPECT_EQ(runHunter(options((dir_ / "absent.bin").string(), 0x5A, 0x5A)), kExitInput);
}

TEST_F(HunterTest, DirectoryInputExitsWithInputCode) {
    EXPECT_EQ(runHunter(options(dir_.string(), 0x5A, 0x5A)), kExitInput);
}

TEST_F(HunterTest, RejectedOversizedInputExitsThree) {
    auto o = options(plantedImage(4096), 0x5A, 0x5A);
    o.load.maxBytes = 1024;
    o.load.policy = OversizePolicy::Reject;
    EXPECT_EQ(runHunter(o), kExitOversized);

    o.load.policy = OversizePolicy::Truncate;
    EXPECT_EQ(runHunter(o), kExitOk);
}

TEST_F(HunterTest, ConfigurationErrorsExitOne) {
    auto path = plantedImage();

    auto unknownCatalog = options(path, 0x5A, 0x5A);
    unknownCatalog.catalogName = "bootloaders";
    EXPECT_EQ(runHunter(unknownCatalog), kExitConfig);

    auto badSignatures = options(path, 0x5A, 0x5A);
    badSignatures.signatureFile = writeText("bad.sig", "Broken 68 7\n");
    EXPECT_EQ(runHunter(badSignatures), kExitConfig);

    EXPECT_EQ(runHunter(options(writeBytes("empty.bin", {}), 0x5A, 0x5A)), kExitConfig);

    auto noWorkers = options(path, 0x5A, 0x5A);
    noWorkers.params.workers = 0;
    EXPECT_EQ(runHunter(noWorkers), kExitConfig);
}

TEST_F(HunterTest, MatchLimitExitsFive) {
    std::vector<uint8_t> bytes;
    for (int i = 0; i < 200; ++i) {
        bytes.push_back(0x85);
        bytes.push_back(0x19);
    }
    auto o = options(writeBytes("jffs2.bin", bytes), 0x00, 0x00);
    o.params.matchLimit = 10;
    EXPECT_EQ(runHunter(o), kExitLimit);
    o.params.matchLimit = 0;
    EXPECT_EQ(runHunter(o), kExitOk);
}

TEST_F(HunterTest, Rc4ImageExitsZero) {
    auto buffer = makeFiller(2048, 4);
    plant(buffer, 300, SignatureCatalog::filesystems().find("CramFS")->little, 0);
    rc4Encrypt(buffer, 0x77, 1);
    auto o = options(writeBytes("rc4.bin", buffer), 0x00, 0xFF);
    o.params.cipher = Cipher::Rc4;
    EXPECT_EQ(runHunter(o), kExitOk);
}

TEST(HunterExitCodeTest, EveryErrorHasItsOwnCode) {
    EXPECT_EQ(Hunter::exitCodeFor(ScanError::None), 0);
    EXPECT_EQ(Hunter::exitCodeFor(ScanError::InvalidConfiguration), 1);
    EXPECT_EQ(Hunter::exitCodeFor(ScanError::InputNotFound), 2);
    EXPECT_EQ(Hunter::exitCodeFor(ScanError::InputUnreadable), 2);
    EXPECT_EQ(Hunter::exitCodeFor(ScanError::OversizedInput), 3);
    EXPECT_EQ(Hunter::exitCodeFor(ScanError::WorkerFailure), 4);
    EXPECT_EQ(kExitLimit, 5);
    EXPECT_EQ(kExitCancelled, 130);
}
