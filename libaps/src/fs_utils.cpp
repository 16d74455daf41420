//
// Created by cv2 on 10/19/26.
//

#include "libaps/fs_utils.h"
#include "libaps/error.h"

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace aps::fs {

    static bool is_name_char(char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
    }

    std::string expand_path(const std::string& input) {
        std::string result;
        size_t i = 0;

        // A leading "~" or "~/" refers to the home directory.
        if (!input.empty() && input[0] == '~' && (input.size() == 1 || input[1] == '/')) {
            const char* home = std::getenv("HOME");
            if (!home) {
                return input;
            }
            result = home;
            i = 1;
        }

        while (i < input.size()) {
            const char c = input[i];
            if (c != '$' || i + 1 >= input.size()) {
                result.push_back(c);
                ++i;
                continue;
            }

            std::string name;
            size_t next = i + 1;
            if (input[next] == '{') {
                const auto close = input.find('}', next + 1);
                if (close == std::string::npos) {
                    return input;
                }
                name = input.substr(next + 1, close - next - 1);
                next = close + 1;
            } else {
                while (next < input.size() && is_name_char(input[next])) {
                    name.push_back(input[next]);
                    ++next;
                }
            }

            if (name.empty()) {
                result.push_back(c);
                ++i;
                continue;
            }

            const char* value = std::getenv(name.c_str());
            if (!value) {
                return input;
            }
            result += value;
            i = next;
        }

        return result;
    }

    std::filesystem::path strip_trailing_separators(const std::filesystem::path& path) {
        std::string str = path.string();
        if (str.empty()) {
            return std::filesystem::path(".");
        }
        const auto last = str.find_last_not_of('/');
        if (last == std::string::npos) {
            return std::filesystem::path("/");
        }
        str.erase(last + 1);
        return std::filesystem::path(str);
    }

    bool exists_or_symlink(const std::filesystem::path& path) {
        std::error_code ec;
        return std::filesystem::exists(std::filesystem::symlink_status(path, ec));
    }

    bool is_symlink_only_dir(const std::filesystem::path& dir) {
        std::error_code ec;
        std::filesystem::directory_iterator it(dir, ec);
        if (ec) {
            return false;
        }

        for (const auto& entry : it) {
            const auto st = std::filesystem::symlink_status(entry.path(), ec);
            if (ec) {
                return false;
            }
            if (std::filesystem::is_symlink(st)) {
                continue;
            }
            // A real directory is fine as long as it only holds links itself.
            if (std::filesystem::is_directory(st)) {
                if (!is_symlink_only_dir(entry.path())) {
                    return false;
                }
                continue;
            }
            return false;
        }
        return true;
    }

    std::filesystem::path normalize_for_comparison(const std::filesystem::path& path) {
        std::error_code ec;
        const auto canonical = std::filesystem::weakly_canonical(path, ec);
        if (ec) {
            return strip_trailing_separators(path.lexically_normal());
        }
        return strip_trailing_separators(canonical);
    }

    bool is_within(const std::filesystem::path& path, const std::filesystem::path& ancestor) {
        const auto p = strip_trailing_separators(path.lexically_normal());
        const auto a = strip_trailing_separators(ancestor.lexically_normal());

        auto pit = p.begin();
        for (auto ait = a.begin(); ait != a.end(); ++ait, ++pit) {
            if (pit == p.end() || *pit != *ait) {
                return false;
            }
        }
        return true;
    }

    void remove_path(const std::filesystem::path& path) {
        std::error_code ec;
        const auto st = std::filesystem::symlink_status(path, ec);
        if (!std::filesystem::exists(st)) {
            return;
        }

        if (std::filesystem::is_directory(st)) {
            std::filesystem::remove_all(path, ec);
        } else {
            std::filesystem::remove(path, ec);
        }
        if (ec) {
            throw SyncException(ErrorKind::IOFailure, "Failed to remove " + path.string() + ": " + ec.message());
        }
    }

    void copy_tree(const std::filesystem::path& from, const std::filesystem::path& to, bool follow_symlinks) {
        std::error_code ec;
        const auto st = follow_symlinks ? std::filesystem::status(from, ec) : std::filesystem::symlink_status(from, ec);
        if (ec) {
            throw SyncException(ErrorKind::IOFailure, "Failed to stat " + from.string() + ": " + ec.message());
        }

        if (std::filesystem::is_symlink(st)) {
            std::filesystem::copy_symlink(from, to, ec);
            if (ec) {
                throw SyncException(ErrorKind::IOFailure, "Failed to copy symlink " + from.string() + ": " + ec.message());
            }
        } else if (std::filesystem::is_directory(st)) {
            std::filesystem::create_directories(to, ec);
            if (ec) {
                throw SyncException(ErrorKind::IOFailure, "Failed to create directory " + to.string() + ": " + ec.message());
            }
            std::filesystem::directory_iterator it(from, ec);
            if (ec) {
                throw SyncException(ErrorKind::IOFailure, "Failed to read directory " + from.string() + ": " + ec.message());
            }
            for (const auto& entry : it) {
                copy_tree(entry.path(), to / entry.path().filename(), follow_symlinks);
            }
        } else if (std::filesystem::is_regular_file(st)) {
            std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing, ec);
            if (ec) {
                throw SyncException(ErrorKind::IOFailure, "Failed to copy " + from.string() + " to " + to.string() + ": " + ec.message());
            }
        } else {
            throw SyncException(ErrorKind::IOFailure, "Unsupported file type for copy: " + from.string());
        }
    }

    std::string local_timestamp(const char* format) {
        const auto now = std::chrono::system_clock::now();
        const auto in_time_t = std::chrono::system_clock::to_time_t(now);
        std::tm local{};
        localtime_r(&in_time_t, &local);
        std::stringstream ss;
        ss << std::put_time(&local, format);
        return ss.str();
    }

    std::string utc_timestamp_rfc3339() {
        const auto now = std::chrono::system_clock::now();
        const auto in_time_t = std::chrono::system_clock::to_time_t(now);
        std::tm utc{};
        gmtime_r(&in_time_t, &utc);
        std::stringstream ss;
        ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }

} // namespace aps::fs
