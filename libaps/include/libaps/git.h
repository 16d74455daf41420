//
// Created by cv2 on 10/19/26.
//

#pragma once

#include "error.h"
#include "logging.h"

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace aps {

    struct ExecResult {
        int exit_code = -1;
        std::string stdout_str;
        std::string stderr_str;
        // Set when the program could not be started at all.
        std::string spawn_error;

        bool spawned() const { return spawn_error.empty(); }
        bool success() const { return spawned() && exit_code == 0; }
    };

    // Runs args[0] from PATH with the inherited environment and collects its output.
    ExecResult exec_command(const std::vector<std::string>& args);

    // A process-unique temporary directory, removed with everything in it on destruction.
    class TempDir {
    public:
        static std::expected<TempDir, Error> create(const std::string& prefix);

        ~TempDir();
        TempDir(TempDir&& other) noexcept;
        TempDir& operator=(TempDir&& other) noexcept;
        TempDir(const TempDir&) = delete;
        TempDir& operator=(const TempDir&) = delete;

        const std::filesystem::path& path() const { return m_path; }

    private:
        explicit TempDir(std::filesystem::path path) : m_path(std::move(path)) {}
        void release();

        std::filesystem::path m_path;
    };

    namespace git {

        inline constexpr const char* AUTO_REF = "auto";

        // "auto" expands to the default branch names in the order they are tried.
        std::vector<std::string> refs_to_try(const std::string& ref);

        std::string short_commit(const std::string& commit);

        struct Clone {
            TempDir dir;
            std::filesystem::path repo_path;
            std::string resolved_ref;
            std::string commit;
        };

        /**
         * @brief Clones `url` at `ref` (or the first working default branch for "auto")
         * into a fresh temporary directory and resolves the checked out commit.
         * If every candidate ref fails, the error carries the git output of each attempt.
         */
        std::expected<Clone, Error> clone_and_resolve(const std::string& url, const std::string& ref, bool shallow,
                                                      const log::Logger& logger);

        // Reproduces a recorded install: full clone without checkout, then checkout of `commit`.
        std::expected<Clone, Error> clone_at_commit(const std::string& url, const std::string& commit,
                                                    const std::string& resolved_ref, const log::Logger& logger);

        /**
         * @brief Asks the remote for the commit a branch currently points to, without cloning.
         * @return The commit id, std::nullopt if no candidate ref exists on the remote,
         * or GitOperationFailed if git could not be run.
         */
        std::expected<std::optional<std::string>, Error> remote_commit(const std::string& url, const std::string& ref,
                                                                       const log::Logger& logger);

    } // namespace git

} // namespace aps
