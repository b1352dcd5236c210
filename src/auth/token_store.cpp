#include "ibauth/auth/token_store.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

#include "ibauth/common/errors.hpp"
#include "ibauth/common/logging.hpp"

namespace ibauth::auth
{
    namespace fs = std::filesystem;
    using json   = nlohmann::json;

    namespace
    {
        constexpr auto kOwnerOnly = fs::perms::owner_read | fs::perms::owner_write;

        std::string string_field(const json& j, const char* key)
        {
            auto it = j.find(key);
            if (it == j.end() || !it->is_string())
                return {};
            return it->get<std::string>();
        }
    }

    TokenStore::TokenStore(std::string path)
        : path_(std::move(path))
    {
    }

    std::string TokenStore::current_timestamp()
    {
        auto now    = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);

        std::tm local{};
        localtime_r(&time_t, &local);

        std::ostringstream oss;
        oss << std::put_time(&local, "%Y-%m-%dT%H:%M:%S");
        return oss.str();
    }

    void TokenStore::write_owner_only(const std::string& path, const std::string& contents)
    {
        int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, S_IRUSR | S_IWUSR);
        if (fd < 0)
            throw StorageError("Cannot create token file " + path + ": " + std::strerror(errno));

        size_t written = 0;
        while (written < contents.size())
        {
            auto n = ::write(fd, contents.data() + written, contents.size() - written);
            if (n < 0 && errno == EINTR)
                continue;
            if (n < 0)
            {
                const int err = errno;
                ::close(fd);
                ::unlink(path.c_str());
                throw StorageError("Failed to write token file " + path + ": " + std::strerror(err));
            }
            written += static_cast<size_t>(n);
        }

        if (::fsync(fd) != 0)
        {
            const int err = errno;
            ::close(fd);
            ::unlink(path.c_str());
            throw StorageError("Failed to flush token file " + path + ": " + std::strerror(err));
        }

        if (::close(fd) != 0)
        {
            const int err = errno;
            ::unlink(path.c_str());
            throw StorageError("Failed to close token file " + path + ": " + std::strerror(err));
        }
    }

    void TokenStore::save(const PersistedTokenRecord& record) const
    {
        std::lock_guard<std::mutex> lock(file_mutex_);

        json j = {
            {"access_token", record.access_token},
            {"access_token_secret", record.access_token_secret},
            {"live_session_token", record.live_session_token},
            {"consumer_key", record.consumer_key},
            {"realm", record.realm},
            {"timestamp", record.timestamp}
        };

        const fs::path target(path_);
        const fs::path temp(path_ + ".tmp");
        std::error_code ec;

        if (target.has_parent_path())
        {
            fs::create_directories(target.parent_path(), ec);
            if (ec)
                throw StorageError("Cannot create token directory " + target.parent_path().string() + ": " + ec.message());
        }

        // a leftover from an interrupted save may be readable by others
        fs::remove(temp, ec);
        if (ec)
            throw StorageError("Cannot remove stale token file " + temp.string() + ": " + ec.message());

        write_owner_only(temp.string(), j.dump(2) + "\n");

        fs::rename(temp, target, ec);
        if (ec)
        {
            std::error_code ignored;
            fs::remove(temp, ignored);
            throw StorageError("Cannot replace token file " + path_ + ": " + ec.message());
        }

        fs::permissions(target, kOwnerOnly, fs::perm_options::replace, ec);
        if (ec)
            throw StorageError("Cannot restrict token file permissions: " + path_);

        logger()->info("Saved tokens to {}", path_);
    }

    std::optional<PersistedTokenRecord> TokenStore::load() const
    {
        std::lock_guard<std::mutex> lock(file_mutex_);

        std::ifstream file(path_);
        if (!file.is_open())
            return std::nullopt; // file doesn't exist yet

        json j;
        try
        {
            file >> j;
        }
        catch (const json::exception& e)
        {
            logger()->warn("Ignoring unreadable token file {}: {}", path_, e.what());
            return std::nullopt;
        }

        if (!j.is_object())
        {
            logger()->warn("Ignoring token file {}: not a JSON object", path_);
            return std::nullopt;
        }

        PersistedTokenRecord record{
            .access_token = string_field(j, "access_token"),
            .access_token_secret = string_field(j, "access_token_secret"),
            .live_session_token = string_field(j, "live_session_token"),
            .consumer_key = string_field(j, "consumer_key"),
            .realm = string_field(j, "realm"),
            .timestamp = string_field(j, "timestamp")
        };

        if (record.access_token.empty() || record.live_session_token.empty())
        {
            logger()->debug("Token file {} is incomplete, re-authentication required", path_);
            return std::nullopt;
        }

        logger()->info("Loaded tokens from {} (saved {})", path_, record.timestamp);
        return record;
    }

    void TokenStore::clear() const
    {
        std::lock_guard<std::mutex> lock(file_mutex_);

        std::error_code ec;
        fs::remove(path_, ec);
        if (ec)
            throw StorageError("Cannot remove token file " + path_ + ": " + ec.message());
    }
} // namespace ibauth::auth
