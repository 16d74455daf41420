//
// Created by cv2 on 10/19/26.
//

#include "libaps/git.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace aps {

    static void drain(int fd, std::string& out, bool& open) {
        char buf[4096];
        const ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            out.append(buf, static_cast<size_t>(n));
        } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
            close(fd);
            open = false;
        }
    }

    ExecResult exec_command(const std::vector<std::string>& args) {
        ExecResult result;

        if (args.empty()) {
            result.spawn_error = "empty command";
            return result;
        }

        int stdout_pipe[2], stderr_pipe[2], exec_pipe[2];
        if (pipe(stdout_pipe) != 0) {
            result.spawn_error = std::strerror(errno);
            return result;
        }
        if (pipe(stderr_pipe) != 0) {
            result.spawn_error = std::strerror(errno);
            close(stdout_pipe[0]);
            close(stdout_pipe[1]);
            return result;
        }
        // Closed on a successful exec, carries errno back otherwise.
        if (pipe2(exec_pipe, O_CLOEXEC) != 0) {
            result.spawn_error = std::strerror(errno);
            for (int fd : {stdout_pipe[0], stdout_pipe[1], stderr_pipe[0], stderr_pipe[1]}) close(fd);
            return result;
        }

        pid_t pid = fork();
        if (pid < 0) {
            result.spawn_error = std::strerror(errno);
            for (int fd : {stdout_pipe[0], stdout_pipe[1], stderr_pipe[0], stderr_pipe[1], exec_pipe[0], exec_pipe[1]}) close(fd);
            return result;
        }

        if (pid == 0) {
            // Child process
            close(stdout_pipe[0]);
            close(stderr_pipe[0]);
            close(exec_pipe[0]);
            dup2(stdout_pipe[1], STDOUT_FILENO);
            dup2(stderr_pipe[1], STDERR_FILENO);
            close(stdout_pipe[1]);
            close(stderr_pipe[1]);

            std::vector<char*> c_args;
            for (const auto& arg : args) {
                c_args.push_back(const_cast<char*>(arg.c_str()));
            }
            c_args.push_back(nullptr);

            execvp(c_args[0], c_args.data());
            const int err = errno;
            ssize_t ignored = write(exec_pipe[1], &err, sizeof(err));
            (void)ignored;
            _exit(127);
        }

        // Parent process
        close(stdout_pipe[1]);
        close(stderr_pipe[1]);
        close(exec_pipe[1]);

        int exec_errno = 0;
        ssize_t n;
        do {
            n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
        } while (n < 0 && errno == EINTR);
        close(exec_pipe[0]);

        // Read both streams together so neither pipe can fill up and block the child.
        bool out_open = true, err_open = true;
        while (out_open || err_open) {
            pollfd fds[2];
            nfds_t count = 0;
            if (out_open) fds[count++] = {stdout_pipe[0], POLLIN, 0};
            if (err_open) fds[count++] = {stderr_pipe[0], POLLIN, 0};

            if (poll(fds, count, -1) < 0) {
                if (errno == EINTR) continue;
                break;
            }
            for (nfds_t i = 0; i < count; ++i) {
                if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
                if (fds[i].fd == stdout_pipe[0]) {
                    drain(stdout_pipe[0], result.stdout_str, out_open);
                } else {
                    drain(stderr_pipe[0], result.stderr_str, err_open);
                }
            }
        }
        if (out_open) close(stdout_pipe[0]);
        if (err_open) close(stderr_pipe[0]);

        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}

        if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
            result.spawn_error = "failed to execute " + args[0] + ": " + std::strerror(exec_errno);
            return result;
        }

        if (WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
        }
        return result;
    }

    std::expected<TempDir, Error> TempDir::create(const std::string& prefix) {
        std::error_code ec;
        const auto base = std::filesystem::temp_directory_path(ec);
        if (ec) {
            return std::unexpected(io_error("Failed to locate temporary directory", ec));
        }

        std::string tmpl = (base / (prefix + "XXXXXX")).string();
        if (mkdtemp(tmpl.data()) == nullptr) {
            return std::unexpected(Error{ErrorKind::IOFailure, "Failed to create temporary directory: " + std::string(std::strerror(errno))});
        }
        return TempDir(std::filesystem::path(tmpl));
    }

    TempDir::~TempDir() {
        release();
    }

    TempDir::TempDir(TempDir&& other) noexcept : m_path(std::move(other.m_path)) {
        other.m_path.clear();
    }

    TempDir& TempDir::operator=(TempDir&& other) noexcept {
        if (this != &other) {
            release();
            m_path = std::move(other.m_path);
            other.m_path.clear();
        }
        return *this;
    }

    void TempDir::release() {
        if (!m_path.empty()) {
            std::error_code ec;
            std::filesystem::remove_all(m_path, ec);
            m_path.clear();
        }
    }

    namespace git {

        static std::string trim(const std::string& s) {
            const auto first = s.find_first_not_of(" \t\r\n");
            if (first == std::string::npos) return "";
            const auto last = s.find_last_not_of(" \t\r\n");
            return s.substr(first, last - first + 1);
        }

        static Error git_error(const std::string& what, const ExecResult& res) {
            if (!res.spawned()) {
                return Error{ErrorKind::GitOperationFailed, what + ": " + res.spawn_error};
            }
            return Error{ErrorKind::GitOperationFailed, what + ": " + trim(res.stderr_str)};
        }

        std::vector<std::string> refs_to_try(const std::string& ref) {
            if (ref == AUTO_REF) {
                return {"main", "master"};
            }
            return {ref};
        }

        std::string short_commit(const std::string& commit) {
            return commit.substr(0, 8);
        }

        static std::expected<std::string, Error> head_commit(const std::filesystem::path& repo) {
            auto res = exec_command({"git", "-C", repo.string(), "rev-parse", "HEAD"});
            if (!res.success()) {
                return std::unexpected(git_error("Failed to get HEAD commit", res));
            }
            return trim(res.stdout_str);
        }

        std::expected<Clone, Error> clone_and_resolve(const std::string& url, const std::string& ref, bool shallow,
                                                      const log::Logger& logger) {
            logger.info("Fetching from git: " + url);

            auto dir = TempDir::create("aps-git-");
            if (!dir) return std::unexpected(dir.error());
            const auto repo_path = dir->path() / "repo";

            const auto candidates = refs_to_try(ref);
            std::string failures;
            std::optional<std::string> resolved;

            for (const auto& candidate : candidates) {
                logger.debug("Trying to clone " + url + " with ref '" + candidate + "'");

                // A failed attempt may leave a partial checkout behind.
                std::error_code ec;
                std::filesystem::remove_all(repo_path, ec);

                std::vector<std::string> args = {"git", "clone"};
                if (shallow) {
                    args.insert(args.end(), {"--depth", "1"});
                }
                args.insert(args.end(), {"--branch", candidate, "--single-branch", url, repo_path.string()});

                auto res = exec_command(args);
                if (!res.spawned()) {
                    return std::unexpected(git_error("Failed to run git clone", res));
                }
                if (res.exit_code == 0) {
                    resolved = candidate;
                    break;
                }

                logger.debug("Clone with ref '" + candidate + "' failed: " + trim(res.stderr_str));
                if (!failures.empty()) failures += "; ";
                failures += "[" + candidate + "] " + trim(res.stderr_str);
            }

            if (!resolved) {
                std::string tried;
                for (const auto& candidate : candidates) {
                    tried += tried.empty() ? candidate : ", " + candidate;
                }
                return std::unexpected(Error{ErrorKind::GitOperationFailed,
                                             "Failed to clone " + url + " with refs [" + tried + "]: " + failures});
            }

            auto commit = head_commit(repo_path);
            if (!commit) return std::unexpected(commit.error());

            logger.info("Cloned " + url + " at ref '" + *resolved + "' (commit " + short_commit(*commit) + ")");
            return Clone{std::move(*dir), repo_path, *resolved, *commit};
        }

        std::expected<Clone, Error> clone_at_commit(const std::string& url, const std::string& commit,
                                                    const std::string& resolved_ref, const log::Logger& logger) {
            logger.info("Fetching locked commit " + short_commit(commit) + " from git: " + url);

            auto dir = TempDir::create("aps-git-");
            if (!dir) return std::unexpected(dir.error());
            const auto repo_path = dir->path() / "repo";

            auto clone = exec_command({"git", "clone", "--no-checkout", url, repo_path.string()});
            if (!clone.success()) {
                return std::unexpected(git_error("Failed to clone " + url, clone));
            }

            auto checkout = exec_command({"git", "-C", repo_path.string(), "checkout", commit});
            if (!checkout.success()) {
                return std::unexpected(git_error("Failed to checkout commit " + short_commit(commit), checkout));
            }

            logger.info("Cloned " + url + " at locked commit " + short_commit(commit) + " (ref was '" + resolved_ref + "')");
            return Clone{std::move(*dir), repo_path, resolved_ref, commit};
        }

        std::expected<std::optional<std::string>, Error> remote_commit(const std::string& url, const std::string& ref,
                                                                       const log::Logger& logger) {
            for (const auto& candidate : refs_to_try(ref)) {
                logger.debug("Checking remote ref '" + candidate + "' for " + url);

                auto res = exec_command({"git", "ls-remote", "--refs", url, "refs/heads/" + candidate});
                if (!res.spawned()) {
                    return std::unexpected(git_error("Failed to run git ls-remote", res));
                }
                if (res.exit_code != 0) {
                    logger.debug("git ls-remote failed for ref '" + candidate + "': " + trim(res.stderr_str));
                    continue;
                }

                // "<sha>\trefs/heads/<branch>"
                const auto line = res.stdout_str.substr(0, res.stdout_str.find('\n'));
                const auto sha = trim(line.substr(0, line.find_first_of(" \t")));
                if (!sha.empty()) {
                    logger.debug("Found remote commit " + sha + " for ref '" + candidate + "'");
                    return sha;
                }
            }
            return std::nullopt;
        }

    } // namespace git

} // namespace aps
