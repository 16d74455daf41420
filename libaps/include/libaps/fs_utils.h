//
// Created by cv2 on 10/19/26.
//

#pragma once

#include <filesystem>
#include <string>

namespace aps::fs {

    // Expands "~", "$VAR" and "${VAR}". If a referenced variable is not set
    // the input is returned unchanged.
    std::string expand_path(const std::string& input);

    // Removes trailing separators so parent_path()/filename() behave ("dir/" -> "dir").
    std::filesystem::path strip_trailing_separators(const std::filesystem::path& path);

    // True if something (including a dangling symlink) is present at path.
    bool exists_or_symlink(const std::filesystem::path& path);

    // True if every entry below dir, at every depth, is either a symlink or a
    // directory that itself satisfies this. An empty directory qualifies.
    bool is_symlink_only_dir(const std::filesystem::path& dir);

    // Canonical form when resolvable, lexical normal form otherwise.
    std::filesystem::path normalize_for_comparison(const std::filesystem::path& path);

    // Component-wise: true if path equals ancestor or lies below it.
    bool is_within(const std::filesystem::path& path, const std::filesystem::path& ancestor);

    // Removes whatever is at path (file, symlink or directory tree). Throws SyncException.
    void remove_path(const std::filesystem::path& path);

    // Recursively copies a file or directory. With follow_symlinks the link
    // targets are copied, otherwise links are recreated as links. Throws SyncException.
    void copy_tree(const std::filesystem::path& from, const std::filesystem::path& to, bool follow_symlinks);

    // Timestamps in local time ("%Y-%m-%d-%H%M") and UTC RFC 3339.
    std::string local_timestamp(const char* format);
    std::string utc_timestamp_rfc3339();

} // namespace aps::fs
