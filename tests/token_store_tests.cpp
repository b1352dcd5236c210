#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sys/stat.h>

#include "ibauth/auth/token_store.hpp"
#include "ibauth/common/errors.hpp"
#include "test_support.hpp"

namespace ibauth::auth
{
    namespace fs = std::filesystem;

    class TokenStoreTest : public ::testing::Test
    {
    protected:
        test::TempDir dir;
        PersistedTokenRecord record{
            .access_token = "ACC91bd",
            .access_token_secret = "ZW5jcnlwdGVkLXNlY3JldC1ieXRlcw==",
            .live_session_token = "lg8VO7rt97u60u3OV3bcYIrixSI=",
            .consumer_key = "TESTCONS",
            .realm = "limited_poa",
            .timestamp = "2024-05-01T09:30:00"
        };

        void write(const std::string& path, const std::string& content)
        {
            std::ofstream file(path);
            file << content;
        }
    };

    TEST_F(TokenStoreTest, SaveThenLoadRoundTrip)
    {
        TokenStore store(dir.file("tokens.json"));
        store.save(record);

        auto loaded = store.load();

        ASSERT_TRUE(loaded.has_value());
        EXPECT_EQ(*loaded, record);
    }

    TEST_F(TokenStoreTest, FileIsOwnerOnly)
    {
        TokenStore store(dir.file("tokens.json"));
        store.save(record);

        auto perms = fs::status(store.path()).permissions();

        EXPECT_EQ(perms & (fs::perms::group_all | fs::perms::others_all), fs::perms::none);
        EXPECT_NE(perms & fs::perms::owner_read, fs::perms::none);
        EXPECT_NE(perms & fs::perms::owner_write, fs::perms::none);
    }

    TEST_F(TokenStoreTest, OverwriteRestrictsPreexistingFile)
    {
        auto path = dir.file("tokens.json");
        write(path, "{}");
        fs::permissions(path, fs::perms::owner_all | fs::perms::group_read | fs::perms::others_read);

        TokenStore store(path);
        store.save(record);

        auto perms = fs::status(path).permissions();
        EXPECT_EQ(perms & (fs::perms::group_all | fs::perms::others_all), fs::perms::none);

        auto loaded = store.load();
        ASSERT_TRUE(loaded.has_value());
        EXPECT_EQ(*loaded, record);
    }

    TEST_F(TokenStoreTest, FileIsCreatedOwnerOnlyRegardlessOfUmask)
    {
        auto path = dir.file("fresh.json");

        auto previous = ::umask(0);
        TokenStore::write_owner_only(path, "{}");
        ::umask(previous);

        EXPECT_EQ(fs::status(path).permissions(), fs::perms::owner_read | fs::perms::owner_write);
    }

    TEST_F(TokenStoreTest, ExistingFileIsNeverReopened)
    {
        auto path = dir.file("taken.json");
        write(path, "held by someone else");

        EXPECT_THROW(TokenStore::write_owner_only(path, "{}"), StorageError);
    }

    TEST_F(TokenStoreTest, StaleTemporaryFileIsReplaced)
    {
        auto path = dir.file("tokens.json");
        write(path + ".tmp", "left behind");
        fs::permissions(path + ".tmp", fs::perms::owner_all | fs::perms::group_read | fs::perms::others_read);

        TokenStore store(path);
        store.save(record);

        EXPECT_FALSE(fs::exists(path + ".tmp"));
        EXPECT_EQ(fs::status(path).permissions(), fs::perms::owner_read | fs::perms::owner_write);
        auto loaded = store.load();
        ASSERT_TRUE(loaded.has_value());
        EXPECT_EQ(*loaded, record);
    }

    TEST_F(TokenStoreTest, CreatesParentDirectory)
    {
        TokenStore store(dir.file("nested/config/tokens.json"));
        store.save(record);

        EXPECT_TRUE(store.load().has_value());
        EXPECT_FALSE(fs::exists(store.path() + ".tmp"));
    }

    TEST_F(TokenStoreTest, MissingFileIsAbsent)
    {
        TokenStore store(dir.file("missing.json"));

        EXPECT_FALSE(store.load().has_value());
    }

    TEST_F(TokenStoreTest, RecordWithoutLiveSessionTokenIsAbsent)
    {
        auto path = dir.file("tokens.json");
        write(path, R"({"access_token": "ACC91bd", "access_token_secret": "c2VjcmV0", "consumer_key": "TESTCONS"})");

        EXPECT_FALSE(TokenStore(path).load().has_value());
    }

    TEST_F(TokenStoreTest, RecordWithoutAccessTokenIsAbsent)
    {
        auto path = dir.file("tokens.json");
        write(path, R"({"live_session_token": "bHN0", "consumer_key": "TESTCONS"})");

        EXPECT_FALSE(TokenStore(path).load().has_value());
    }

    TEST_F(TokenStoreTest, CorruptFileIsAbsent)
    {
        auto path = dir.file("tokens.json");
        write(path, "{ not json");

        EXPECT_FALSE(TokenStore(path).load().has_value());

        write(path, "[1, 2, 3]");
        EXPECT_FALSE(TokenStore(path).load().has_value());
    }

    TEST_F(TokenStoreTest, ClearRemovesFile)
    {
        TokenStore store(dir.file("tokens.json"));
        store.save(record);
        store.clear();

        EXPECT_FALSE(fs::exists(store.path()));
        EXPECT_FALSE(store.load().has_value());

        // clearing twice is fine
        EXPECT_NO_THROW(store.clear());
    }

    TEST_F(TokenStoreTest, UnwritableLocationThrows)
    {
        auto blocker = dir.file("blocker");
        write(blocker, "file, not a directory");

        TokenStore store(blocker + "/tokens.json");

        EXPECT_THROW(store.save(record), StorageError);
    }

    TEST_F(TokenStoreTest, TimestampIsIso8601)
    {
        auto timestamp = TokenStore::current_timestamp();

        ASSERT_EQ(timestamp.size(), 19u);
        EXPECT_EQ(timestamp[4], '-');
        EXPECT_EQ(timestamp[7], '-');
        EXPECT_EQ(timestamp[10], 'T');
        EXPECT_EQ(timestamp[13], ':');
        EXPECT_EQ(timestamp[16], ':');
    }
} // namespace ibauth::auth
