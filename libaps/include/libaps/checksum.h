//
// Created by cv2 on 10/19/26.
//

#pragma once

#include "error.h"

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

namespace aps {

    inline constexpr const char* CHECKSUM_ALGORITHM = "sha256";

    // Fingerprint of a file (raw bytes) or a directory tree (sorted relative
    // paths plus contents). Rendered as "sha256:<hex>".
    std::expected<std::string, Error> compute_checksum(const std::filesystem::path& path);

    // Same digest and format over an in-memory string, used for generated content.
    std::string checksum_string(std::string_view content);

}
