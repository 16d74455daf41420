//
// Created by cv2 on 10/19/26.
//

#include "libaps/checksum.h"

#include <picosha2.h>

#include <algorithm>
#include <array>
#include <fstream>
#include <vector>

namespace aps {

    static std::string render(const picosha2::hash256_one_by_one& hasher) {
        return std::string(CHECKSUM_ALGORITHM) + ":" + picosha2::get_hash_hex_string(hasher);
    }

    static std::expected<void, Error> feed_file(picosha2::hash256_one_by_one& hasher, const std::filesystem::path& file) {
        std::ifstream in(file, std::ios::binary);
        if (!in.is_open()) {
            return std::unexpected(Error{ErrorKind::IOFailure, "Failed to open " + file.string() + " for hashing"});
        }

        std::array<char, 64 * 1024> buffer{};
        while (in) {
            in.read(buffer.data(), buffer.size());
            const auto count = in.gcount();
            if (count > 0) {
                hasher.process(buffer.begin(), buffer.begin() + count);
            }
        }
        if (in.bad()) {
            return std::unexpected(Error{ErrorKind::IOFailure, "Failed to read " + file.string() + " for hashing"});
        }
        return {};
    }

    static std::expected<std::string, Error> checksum_directory(const std::filesystem::path& root) {
        std::vector<std::pair<std::string, std::filesystem::path>> files;

        std::error_code ec;
        std::filesystem::recursive_directory_iterator it(root, std::filesystem::directory_options::none, ec);
        if (ec) {
            return std::unexpected(io_error("Failed to read directory " + root.string(), ec));
        }

        for (const auto end = std::filesystem::recursive_directory_iterator(); it != end; it.increment(ec)) {
            if (ec) {
                return std::unexpected(io_error("Failed to walk directory " + root.string(), ec));
            }
            // Links are not followed and not hashed, only regular file content counts.
            if (it->is_symlink(ec) || !it->is_regular_file(ec)) {
                continue;
            }
            files.emplace_back(it->path().lexically_relative(root).generic_string(), it->path());
        }
        if (ec) {
            return std::unexpected(io_error("Failed to walk directory " + root.string(), ec));
        }

        std::sort(files.begin(), files.end(), [](const auto& a, const auto& b) { return a.first < b.first; });

        picosha2::hash256_one_by_one hasher;
        for (const auto& [relative, absolute] : files) {
            hasher.process(relative.begin(), relative.end());
            const char separator = '\0';
            hasher.process(&separator, &separator + 1);

            auto fed = feed_file(hasher, absolute);
            if (!fed) return std::unexpected(fed.error());
        }
        hasher.finish();
        return render(hasher);
    }

    std::expected<std::string, Error> compute_checksum(const std::filesystem::path& path) {
        std::error_code ec;
        const auto status = std::filesystem::status(path, ec);
        if (ec || !std::filesystem::exists(status)) {
            return std::unexpected(Error{ErrorKind::SourceUnavailable, "Cannot compute checksum, path does not exist: " + path.string()});
        }

        if (std::filesystem::is_directory(status)) {
            return checksum_directory(path);
        }

        picosha2::hash256_one_by_one hasher;
        auto fed = feed_file(hasher, path);
        if (!fed) return std::unexpected(fed.error());
        hasher.finish();
        return render(hasher);
    }

    std::string checksum_string(std::string_view content) {
        picosha2::hash256_one_by_one hasher;
        hasher.process(content.begin(), content.end());
        hasher.finish();
        return render(hasher);
    }

}
