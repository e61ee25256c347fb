// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include "../src/core/delivery/LogCodeDelivery.h"
#include "../src/core/delivery/SpoolCodeDelivery.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

#include <sys/stat.h>

using namespace AuthKeep;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

CodeMessage sample_message() {
    return CodeMessage{"alice@example.com", "abc123", "482913",
                       from_epoch_ms(1767225900000),  // 2026-01-01 00:05:00 UTC
                       5min};
}

} // namespace

class SpoolCodeDeliveryTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = fs::temp_directory_path() / "authkeep_spool_tests";
        fs::remove_all(test_dir);
        spool_dir = test_dir / "outbox";
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    [[nodiscard]] std::vector<fs::path> spooled_files() const {
        std::vector<fs::path> files;
        for (const auto& entry : fs::directory_iterator(spool_dir)) {
            files.push_back(entry.path());
        }
        return files;
    }

    fs::path test_dir;
    fs::path spool_dir;
};

TEST(CodeMessageFormatTest, ContainsCodeRecipientAndExpiry) {
    const std::string text = SpoolCodeDelivery::format_message(sample_message());

    EXPECT_EQ(text.rfind("To: alice@example.com\n", 0), 0u);
    EXPECT_NE(text.find("Your one-time code: 482913"), std::string::npos);
    EXPECT_NE(text.find("Expires: 2026-01-01 00:05:00 UTC"), std::string::npos);
    EXPECT_NE(text.find("Code expires in 5 minutes"), std::string::npos);
    EXPECT_NE(text.find("Never share this code"), std::string::npos);
}

TEST_F(SpoolCodeDeliveryTest, CreatesPrivateDirectoryAndFile) {
    SpoolCodeDelivery delivery(spool_dir);
    ASSERT_TRUE(delivery.deliver(sample_message()).has_value());

    struct stat dir_st{};
    ASSERT_EQ(stat(spool_dir.c_str(), &dir_st), 0);
    EXPECT_EQ(dir_st.st_mode & 0777, 0700u);

    const auto files = spooled_files();
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].extension(), ".msg");
    EXPECT_EQ(files[0].stem().string().size(), 2 * SpoolCodeDelivery::FILE_ID_BYTES);

    struct stat file_st{};
    ASSERT_EQ(stat(files[0].c_str(), &file_st), 0);
    EXPECT_EQ(file_st.st_mode & 0777, 0600u);

    std::ifstream in(files[0]);
    std::stringstream content;
    content << in.rdbuf();
    EXPECT_EQ(content.str(), SpoolCodeDelivery::format_message(sample_message()));
}

TEST_F(SpoolCodeDeliveryTest, EachMessageGetsItsOwnFile) {
    SpoolCodeDelivery delivery(spool_dir);
    ASSERT_TRUE(delivery.deliver(sample_message()).has_value());
    ASSERT_TRUE(delivery.deliver(sample_message()).has_value());
    EXPECT_EQ(spooled_files().size(), 2u);
}

TEST_F(SpoolCodeDeliveryTest, UnwritableLocationFails) {
    // A regular file where the spool directory's parent should be
    fs::create_directories(test_dir);
    std::ofstream(test_dir / "blocker") << "x";

    SpoolCodeDelivery delivery(test_dir / "blocker" / "outbox");
    auto result = delivery.deliver(sample_message());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), AuthError::InternalError);
}

TEST(LogCodeDeliveryTest, AlwaysSucceeds) {
    LogCodeDelivery production(true);
    LogCodeDelivery development(false);
    EXPECT_TRUE(production.deliver(sample_message()).has_value());
    EXPECT_TRUE(development.deliver(sample_message()).has_value());
}
