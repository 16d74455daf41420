//
// Created by cv2 on 10/19/26.
//

#include "../include/libaps/backup.h"
#include "../include/libaps/fs_utils.h"
#include "../include/libaps/logging.h"
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

const std::filesystem::path TEST_ROOT = std::filesystem::temp_directory_path() / "aps_test_backup";
const aps::log::Logger logger;

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

void test_backup_names() {
    logger.info("Running test: Backup Names...");
    const auto base = TEST_ROOT / "project";

    assert(aps::backup_name_for(base, base / "AGENTS.md", "2026-10-19-1200") == "AGENTS.md-2026-10-19-1200");
    assert(aps::backup_name_for(base, base / ".cursor" / "rules", "2026-10-19-1200") == ".cursor-rules-2026-10-19-1200");
    // Same path, different minute, different name.
    assert(aps::backup_name_for(base, base / "AGENTS.md", "2026-10-19-1201") !=
           aps::backup_name_for(base, base / "AGENTS.md", "2026-10-19-1200"));

    logger.ok("Test Passed: Backup Names");
}

void test_backup_copies_content() {
    logger.info("Running test: Backup Copies Content...");
    const auto base = TEST_ROOT / "project";
    write_file(base / "AGENTS.md", "my own notes");
    write_file(base / ".cursor" / "rules" / "local.mdc", "local rule");

    auto file_backup = aps::create_backup(base, base / "AGENTS.md", logger);
    assert(file_backup.has_value());
    assert(file_backup->parent_path() == base / aps::BACKUP_DIR);
    assert(read_file(*file_backup) == "my own notes");
    // The backed up file stays where it was.
    assert(std::filesystem::exists(base / "AGENTS.md"));

    auto dir_backup = aps::create_backup(base, base / ".cursor" / "rules", logger);
    assert(dir_backup.has_value());
    assert(dir_backup->filename().string().rfind(".cursor-rules-", 0) == 0);
    assert(read_file(*dir_backup / "local.mdc") == "local rule");

    logger.ok("Test Passed: Backup Copies Content");
}

void test_has_conflict() {
    logger.info("Running test: Conflict Detection...");
    const auto dir = TEST_ROOT / "conflicts";
    std::filesystem::create_directories(dir);

    // Nothing there.
    assert(!aps::has_conflict(dir / "missing"));

    // A regular file.
    write_file(dir / "file.md", "x");
    assert(aps::has_conflict(dir / "file.md"));

    // A symlink, even to a file.
    std::filesystem::create_symlink(dir / "file.md", dir / "link.md");
    assert(!aps::has_conflict(dir / "link.md"));

    // Empty directory.
    std::filesystem::create_directories(dir / "empty");
    assert(!aps::has_conflict(dir / "empty"));

    // Directory holding only symlinks, at any depth.
    std::filesystem::create_directories(dir / "linked" / "sub");
    std::filesystem::create_symlink(dir / "file.md", dir / "linked" / "a.md");
    std::filesystem::create_symlink(dir / "file.md", dir / "linked" / "sub" / "b.md");
    assert(!aps::has_conflict(dir / "linked"));

    // One real file anywhere makes it a conflict.
    write_file(dir / "linked" / "sub" / "real.md", "y");
    assert(aps::has_conflict(dir / "linked"));

    logger.ok("Test Passed: Conflict Detection");
}

void test_path_helpers() {
    logger.info("Running test: Path Helpers...");

    assert(aps::fs::strip_trailing_separators("dir/sub/") == std::filesystem::path("dir/sub"));
    assert(aps::fs::strip_trailing_separators("dir") == std::filesystem::path("dir"));
    assert(aps::fs::strip_trailing_separators("/") == std::filesystem::path("/"));

    assert(aps::fs::is_within("/a/b/c", "/a/b"));
    assert(aps::fs::is_within("/a/b", "/a/b"));
    assert(!aps::fs::is_within("/a/bc", "/a/b"));
    assert(!aps::fs::is_within("/a", "/a/b"));

    setenv("APS_TEST_ROOT", "/opt/assets", 1);
    assert(aps::fs::expand_path("$APS_TEST_ROOT/rules") == "/opt/assets/rules");
    assert(aps::fs::expand_path("${APS_TEST_ROOT}/rules") == "/opt/assets/rules");
    unsetenv("APS_TEST_UNSET_VARIABLE");
    assert(aps::fs::expand_path("$APS_TEST_UNSET_VARIABLE/rules") == "$APS_TEST_UNSET_VARIABLE/rules");

    const char* home = std::getenv("HOME");
    if (home) {
        assert(aps::fs::expand_path("~/assets") == std::string(home) + "/assets");
    }
    assert(aps::fs::expand_path("plain/path") == "plain/path");

    logger.ok("Test Passed: Path Helpers");
}

int main() {
    std::filesystem::remove_all(TEST_ROOT);

    try {
        test_backup_names();
        test_backup_copies_content();
        test_has_conflict();
        test_path_helpers();
    } catch (const std::exception& e) {
        logger.error(std::string("A backup test failed: ") + e.what());
        std::filesystem::remove_all(TEST_ROOT);
        return 1;
    }

    std::filesystem::remove_all(TEST_ROOT);
    logger.ok("All backup tests completed successfully!");
    return 0;
}
