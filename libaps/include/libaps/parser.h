//
// Created by cv2 on 10/19/26.
//

#pragma once

#include "error.h"
#include "manifest.h"

#include <expected>
#include <filesystem>
#include <string>

namespace aps {

    class ManifestParser {
    public:
        // Parses an aps.yaml file. Structural problems are reported as ManifestInvalid.
        // Does not run Manifest::validate().
        static std::expected<Manifest, Error> parse(const std::filesystem::path& file_path);

        static std::expected<Manifest, Error> parse_from_string(const std::string& content);
    };

} // namespace aps
