//
// Created by cv2 on 10/19/26.
//

#pragma once

#include "logging.h"

#include <filesystem>
#include <functional>
#include <string>

namespace aps {

    struct InstallOptions {
        bool dry_run = false;
        bool yes = false;     // overwrite conflicts and remove orphans without asking
        bool strict = false;  // structural warnings become errors
        bool upgrade = false; // ignore locked commits and follow the declared refs
    };

    // Everything a run needs from its surroundings. Passed explicitly through the engine.
    struct RunContext {
        // Directory containing the manifest. Relative roots and destinations resolve against it.
        std::filesystem::path base_dir;
        // Whether a user can answer prompts.
        bool interactive = false;
        // Asks a yes/no question, only consulted when interactive.
        std::function<bool(const std::string&)> confirm;
        log::Logger logger{};

        bool ask(const std::string& question) const {
            return interactive && confirm && confirm(question);
        }
    };

}
