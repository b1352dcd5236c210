#pragma once

#include <string>
#include <optional>
#include <mutex>

#include "ibauth/common/types.hpp"

namespace ibauth::auth
{
    /**
     * JSON token file readable and writable by the owner only
     */
    class TokenStore
    {
    private:
        std::string path_;
        mutable std::mutex file_mutex_;

    public:
        explicit TokenStore(std::string path);

        /**
         * Write the record, replacing any previous file atomically
         * @throws StorageError if the file cannot be written or restricted
         */
        void save(const PersistedTokenRecord& record) const;

        // nullopt when the file is absent, unreadable, or lacks access_token / live_session_token
        std::optional<PersistedTokenRecord> load() const;

        // remove the file if present; @throws StorageError on failure
        void clear() const;

        [[nodiscard]] const std::string& path() const { return path_; }

        // local time, ISO-8601
        static std::string current_timestamp();

        /**
         * Create a new file with mode 0600 from the first syscall on and write
         * contents through that descriptor
         * @throws StorageError if the file already exists or the write fails
         */
        static void write_owner_only(const std::string& path, const std::string& contents);
    };
} // namespace ibauth::auth
