// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include "../src/core/repositories/DurableAuthStore.h"
#include "../src/core/io/StoreIO.h"
#include "../src/core/services/OtpSessionService.h"
#include "TestDoubles.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include <sys/stat.h>

using namespace AuthKeep;
using namespace AuthKeep::Testing;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

class DurableAuthStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = fs::temp_directory_path() / "authkeep_store_tests";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
        store_path = test_dir / "auth.store";
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    void write_raw(const std::string& bytes, fs::perms perms = fs::perms::owner_read | fs::perms::owner_write) {
        std::ofstream(store_path, std::ios::binary) << bytes;
        fs::permissions(store_path, perms, fs::perm_options::replace);
    }

    static authkeep::AuditLogEntry audit_entry(int n) {
        authkeep::AuditLogEntry entry;
        entry.set_event_type("OtpVerified");
        entry.set_subject_hash("subject-" + std::to_string(n));
        entry.set_timestamp(1'700'000'000'000 + n);
        (*entry.mutable_details())["attempts"] = std::to_string(n % 3);
        return entry;
    }

    fs::path test_dir;
    fs::path store_path;
    ManualClock clock;
};

TEST_F(DurableAuthStoreTest, MissingFileStartsEmpty) {
    auto store = DurableAuthStore::open(store_path);
    ASSERT_TRUE(store.has_value());
    EXPECT_EQ((*store)->path(), store_path);
    EXPECT_EQ((*store)->snapshot().otp_sessions_size(), 0);
    EXPECT_FALSE(fs::exists(store_path));
}

TEST_F(DurableAuthStoreTest, StateSurvivesReopen) {
    std::string session_id;
    std::string code;
    {
        auto store = DurableAuthStore::open(store_path);
        ASSERT_TRUE(store.has_value());
        OtpSessionService otp(store->get(), store->get(), &clock);

        auto issued = otp.create_session("alice@example.com");
        ASSERT_TRUE(issued.has_value());
        session_id = issued->session_id;
        code = std::string(issued->code.view());

        authkeep::WebAuthnCredential credential;
        credential.set_credential_id("cred-1");
        credential.set_hashed_identifier(issued->hashed_identifier);
        credential.set_counter(7);
        credential.set_is_active(true);
        ASSERT_TRUE((*store)->insert_credential(credential).has_value());
    }

    ASSERT_TRUE(fs::exists(store_path));
    struct stat st{};
    ASSERT_EQ(stat(store_path.c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0600u);

    auto reopened = DurableAuthStore::open(store_path);
    ASSERT_TRUE(reopened.has_value());
    EXPECT_EQ((*reopened)->find_credential("cred-1")->counter(), 7u);
    EXPECT_FALSE((*reopened)->audit_entries().empty());

    OtpSessionService otp(reopened->get(), reopened->get(), &clock);
    auto verified = otp.verify_session(session_id, code);
    ASSERT_TRUE(verified.has_value());
    EXPECT_TRUE(verified->success);
}

TEST_F(DurableAuthStoreTest, SnapshotNeverContainsCode) {
    std::string code;
    fs::path audit_path;
    {
        auto store = DurableAuthStore::open(store_path);
        ASSERT_TRUE(store.has_value());
        OtpSessionService otp(store->get(), store->get(), &clock);
        auto issued = otp.create_session("alice@example.com");
        ASSERT_TRUE(issued.has_value());
        code = std::string(issued->code.view());
        audit_path = (*store)->audit_path();
    }

    for (const auto& path : {store_path, audit_path}) {
        auto bytes = StoreIO::read_file(path);
        ASSERT_TRUE(bytes.has_value()) << path;
        const std::string raw(bytes->begin(), bytes->end());
        EXPECT_EQ(raw.find("alice@example.com"), std::string::npos) << path;
        EXPECT_EQ(raw.find(code), std::string::npos) << path;
    }
}

TEST_F(DurableAuthStoreTest, CorruptFileIsRejected) {
    write_raw("\xff\xff\xff\xff\xff");
    auto store = DurableAuthStore::open(store_path);
    ASSERT_FALSE(store.has_value());
    EXPECT_EQ(store.error(), AuthError::InternalError);
}

TEST_F(DurableAuthStoreTest, UnknownSchemaVersionIsRejected) {
    authkeep::StoreSnapshot snapshot;
    snapshot.set_schema_version(99);
    write_raw(snapshot.SerializeAsString());

    auto store = DurableAuthStore::open(store_path);
    ASSERT_FALSE(store.has_value());
    EXPECT_EQ(store.error(), AuthError::ConfigurationError);
}

TEST_F(DurableAuthStoreTest, WorldReadableFileIsRejected) {
    authkeep::StoreSnapshot snapshot;
    snapshot.set_schema_version(1);
    write_raw(snapshot.SerializeAsString(),
              fs::perms::owner_read | fs::perms::owner_write | fs::perms::others_read);

    auto store = DurableAuthStore::open(store_path);
    ASSERT_FALSE(store.has_value());
    EXPECT_EQ(store.error(), AuthError::ConfigurationError);
}

TEST_F(DurableAuthStoreTest, SymlinkIsRejected) {
    authkeep::StoreSnapshot snapshot;
    snapshot.set_schema_version(1);
    write_raw(snapshot.SerializeAsString());
    const fs::path link = test_dir / "link.store";
    fs::create_symlink(store_path, link);

    auto store = DurableAuthStore::open(link);
    ASSERT_FALSE(store.has_value());
    EXPECT_EQ(store.error(), AuthError::ConfigurationError);
}

TEST_F(DurableAuthStoreTest, FailedPersistRollsBackMutation) {
    auto store = DurableAuthStore::open(test_dir / "missing-dir" / "auth.store");
    ASSERT_TRUE(store.has_value());

    authkeep::WebAuthnCredential credential;
    credential.set_credential_id("cred-1");
    credential.set_is_active(true);
    auto inserted = (*store)->insert_credential(credential);
    ASSERT_FALSE(inserted.has_value());
    EXPECT_EQ(inserted.error(), RepositoryError::SAVE_FAILED);
    EXPECT_FALSE((*store)->find_credential("cred-1").has_value());
}

// ============================================================================
// Audit log
// ============================================================================

TEST_F(DurableAuthStoreTest, AuditEntriesDoNotGrowSnapshot) {
    auto store = DurableAuthStore::open(store_path);
    ASSERT_TRUE(store.has_value());

    authkeep::WebAuthnCredential credential;
    credential.set_credential_id("cred-1");
    credential.set_is_active(true);
    ASSERT_TRUE((*store)->insert_credential(credential).has_value());
    const auto snapshot_size = fs::file_size(store_path);

    for (int i = 0; i < 200; ++i) {
        (*store)->append(audit_entry(i));
    }

    EXPECT_EQ(fs::file_size(store_path), snapshot_size);
    EXPECT_EQ((*store)->snapshot().ByteSizeLong(), snapshot_size);
    ASSERT_TRUE(fs::exists((*store)->audit_path()));
    EXPECT_GT(fs::file_size((*store)->audit_path()), snapshot_size);

    struct stat st{};
    ASSERT_EQ(stat((*store)->audit_path().c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0600u);
}

TEST_F(DurableAuthStoreTest, AuditEntriesSurviveReopenInOrder) {
    {
        auto store = DurableAuthStore::open(store_path);
        ASSERT_TRUE(store.has_value());
        for (int i = 0; i < 50; ++i) {
            (*store)->append(audit_entry(i));
        }
    }

    auto reopened = DurableAuthStore::open(store_path);
    ASSERT_TRUE(reopened.has_value());
    const auto entries = (*reopened)->audit_entries();
    ASSERT_EQ(entries.size(), 50u);
    EXPECT_EQ(entries.front().subject_hash(), "subject-0");
    EXPECT_EQ(entries.back().subject_hash(), "subject-49");
    EXPECT_EQ(entries.back().details().at("attempts"), "1");
}

TEST_F(DurableAuthStoreTest, TornAuditRecordIsDroppedOnOpen) {
    fs::path audit_path;
    uintmax_t intact_size = 0;
    {
        auto store = DurableAuthStore::open(store_path);
        ASSERT_TRUE(store.has_value());
        for (int i = 0; i < 3; ++i) {
            (*store)->append(audit_entry(i));
        }
        audit_path = (*store)->audit_path();
        intact_size = fs::file_size(audit_path);
    }

    // Length prefix promises 50 bytes but only one follows
    {
        std::ofstream out(audit_path, std::ios::binary | std::ios::app);
        out.write("\x00\x00\x00\x32x", 5);
    }

    {
        auto reopened = DurableAuthStore::open(store_path);
        ASSERT_TRUE(reopened.has_value());
        EXPECT_EQ((*reopened)->audit_entries().size(), 3u);
        EXPECT_EQ(fs::file_size(audit_path), intact_size);
        (*reopened)->append(audit_entry(3));
    }

    auto again = DurableAuthStore::open(store_path);
    ASSERT_TRUE(again.has_value());
    const auto entries = (*again)->audit_entries();
    ASSERT_EQ(entries.size(), 4u);
    EXPECT_EQ(entries.back().subject_hash(), "subject-3");
}

TEST_F(DurableAuthStoreTest, AuditLogRotatesAtSizeLimit) {
    constexpr size_t limit = 2048;
    auto store = DurableAuthStore::open(store_path, limit);
    ASSERT_TRUE(store.has_value());

    for (int i = 0; i < 200; ++i) {
        (*store)->append(audit_entry(i));
    }

    const fs::path rotated = (*store)->audit_path().string() + ".1";
    EXPECT_TRUE(fs::exists(rotated));
    EXPECT_LE(fs::file_size((*store)->audit_path()), limit);
    EXPECT_LE(fs::file_size(rotated), limit);
    EXPECT_EQ((*store)->audit_entries().size(), 200u);

    // Only the current file is reloaded
    auto reopened = DurableAuthStore::open(store_path, limit);
    ASSERT_TRUE(reopened.has_value());
    const auto entries = (*reopened)->audit_entries();
    ASSERT_FALSE(entries.empty());
    EXPECT_LT(entries.size(), 200u);
    EXPECT_EQ(entries.back().subject_hash(), "subject-199");
}

TEST_F(DurableAuthStoreTest, FailedAuditAppendIsNotRetained) {
    auto store = DurableAuthStore::open(test_dir / "missing-dir" / "auth.store");
    ASSERT_TRUE(store.has_value());

    (*store)->append(audit_entry(0));
    EXPECT_TRUE((*store)->audit_entries().empty());
}

TEST_F(DurableAuthStoreTest, WorldReadableAuditFileIsRejected) {
    const fs::path audit_path = store_path.string() + ".audit";
    std::ofstream(audit_path, std::ios::binary) << "";
    fs::permissions(audit_path,
                    fs::perms::owner_read | fs::perms::owner_write | fs::perms::others_read,
                    fs::perm_options::replace);

    auto store = DurableAuthStore::open(store_path);
    ASSERT_FALSE(store.has_value());
    EXPECT_EQ(store.error(), AuthError::ConfigurationError);
}

TEST(InMemoryAuthStoreAudit, RetainsOnlyMostRecentEntries) {
    InMemoryAuthStore store;
    const size_t total = InMemoryAuthStore::MAX_AUDIT_TAIL + 5;
    for (size_t i = 0; i < total; ++i) {
        authkeep::AuditLogEntry entry;
        entry.set_event_type("OtpCreated");
        entry.set_subject_hash("subject-" + std::to_string(i));
        store.append(entry);
    }

    const auto entries = store.audit_entries();
    ASSERT_EQ(entries.size(), InMemoryAuthStore::MAX_AUDIT_TAIL);
    EXPECT_EQ(entries.front().subject_hash(), "subject-5");
    EXPECT_EQ(entries.back().subject_hash(), "subject-" + std::to_string(total - 1));
}
