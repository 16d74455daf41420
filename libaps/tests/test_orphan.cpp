//
// Created by cv2 on 10/19/26.
//

#include "../include/libaps/orphan.h"
#include "../include/libaps/backup.h"
#include "../include/libaps/logging.h"
#include <cassert>
#include <filesystem>
#include <fstream>

const std::filesystem::path TEST_ROOT = std::filesystem::temp_directory_path() / "aps_test_orphan";
const aps::log::Logger logger;

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
}

aps::Entry make_entry(const std::string& id, aps::AssetKind kind, std::optional<std::string> dest) {
    aps::FilesystemSource source;
    source.root = "/unused";
    aps::Entry entry;
    entry.id = id;
    entry.kind = kind;
    entry.source = aps::Source{source};
    entry.dest = std::move(dest);
    return entry;
}

aps::Lockfile lock_with(const std::string& id, const std::string& dest) {
    aps::Lockfile lockfile;
    lockfile.upsert(id, aps::LockedEntry::for_filesystem("filesystem:/unused", dest, "sha256:0", true, std::nullopt, {}));
    return lockfile;
}

void test_paths_overlap() {
    logger.info("Running test: Path Overlap...");
    assert(aps::paths_overlap("/p/.cursor", "/p/.cursor/rules"));
    assert(aps::paths_overlap("/p/.cursor/rules", "/p/.cursor"));
    assert(aps::paths_overlap("/p/a/../b", "/p/b"));
    assert(!aps::paths_overlap("/p/rules", "/p/rules-old"));
    logger.ok("Test Passed: Path Overlap");
}

void test_detect_moved_destination() {
    logger.info("Running test: Detect Moved Destination...");
    const auto base = TEST_ROOT / "moved";
    write_file(base / "assets" / "AGENTS.md", "x");
    std::filesystem::create_directories(base / "old");
    std::filesystem::create_symlink(base / "assets" / "AGENTS.md", base / "old" / "AGENTS.md");

    const auto entry = make_entry("agents", aps::AssetKind::AgentsMd, std::nullopt);
    const auto lockfile = lock_with("agents", "old/AGENTS.md");

    auto orphans = aps::detect_orphans({&entry}, lockfile, base, logger);
    assert(orphans.size() == 1);
    assert(orphans[0].entry_id == "agents");
    assert(orphans[0].previous_dest == base / "old" / "AGENTS.md");
    assert(orphans[0].current_dest == base / "AGENTS.md");

    // Unchanged destination.
    const auto same = lock_with("agents", "AGENTS.md");
    assert(aps::detect_orphans({&entry}, same, base, logger).empty());

    // Previous destination already gone.
    const auto gone = lock_with("agents", "never/AGENTS.md");
    assert(aps::detect_orphans({&entry}, gone, base, logger).empty());

    // Entries without lock history are ignored.
    const auto other = make_entry("other", aps::AssetKind::AgentsMd, "OTHER.md");
    assert(aps::detect_orphans({&other}, lockfile, base, logger).empty());

    logger.ok("Test Passed: Detect Moved Destination");
}

void test_overlap_is_never_an_orphan() {
    logger.info("Running test: Overlapping Destinations Are Not Orphans...");
    const auto base = TEST_ROOT / "overlap";
    write_file(base / ".cursor" / "rules" / "a.mdc", "a");

    // Was .cursor, now .cursor/rules: deleting .cursor would take the live install with it.
    const auto narrowed = make_entry("rules", aps::AssetKind::CursorRules, ".cursor/rules");
    assert(aps::detect_orphans({&narrowed}, lock_with("rules", ".cursor"), base, logger).empty());

    // Was .cursor/rules, now .cursor.
    const auto widened = make_entry("rules", aps::AssetKind::CursorRules, ".cursor");
    assert(aps::detect_orphans({&widened}, lock_with("rules", ".cursor/rules"), base, logger).empty());

    logger.ok("Test Passed: Overlapping Destinations Are Not Orphans");
}

void test_symlinked_destination_is_not_an_orphan() {
    logger.info("Running test: Symlinked Destination Is Not An Orphan...");
    const auto base = TEST_ROOT / "aliased";
    write_file(base / "new_rules" / "a.mdc", "a");
    std::filesystem::create_directory_symlink(base / "new_rules", base / "old_rules");

    // old_rules resolves to new_rules, so removing it would hit the live install.
    const auto entry = make_entry("rules", aps::AssetKind::CursorRules, "new_rules");
    assert(aps::detect_orphans({&entry}, lock_with("rules", "old_rules"), base, logger).empty());
    assert(aps::detect_orphans({&entry}, lock_with("rules", "old_rules/"), base, logger).empty());
    assert(std::filesystem::exists(base / "new_rules" / "a.mdc"));

    logger.ok("Test Passed: Symlinked Destination Is Not An Orphan");
}

void test_cleanup() {
    logger.info("Running test: Orphan Cleanup...");
    const auto base = TEST_ROOT / "cleanup";
    write_file(base / "assets" / "a.mdc", "a");
    std::filesystem::create_directories(base / "links");
    std::filesystem::create_symlink(base / "assets" / "a.mdc", base / "links" / "a.mdc");
    write_file(base / "copied" / "b.mdc", "b");

    aps::RunContext ctx;
    ctx.base_dir = base;

    const std::vector<aps::OrphanCandidate> orphans = {
        {"links", base / "links", base / "new-links"},
        {"copied", base / "copied", base / "new-copied"},
    };

    // Dry run and non-interactive runs without --yes only report.
    aps::InstallOptions dry;
    dry.dry_run = true;
    assert(aps::cleanup_orphans(orphans, dry, ctx) == 0);
    assert(aps::cleanup_orphans(orphans, {}, ctx) == 0);
    assert(std::filesystem::exists(base / "links"));
    assert(std::filesystem::exists(base / "copied"));

    // Interactive decline.
    ctx.interactive = true;
    ctx.confirm = [](const std::string&) { return false; };
    assert(aps::cleanup_orphans(orphans, {}, ctx) == 0);
    assert(std::filesystem::exists(base / "copied"));

    aps::InstallOptions yes;
    yes.yes = true;
    assert(aps::cleanup_orphans(orphans, yes, ctx) == 2);
    assert(!std::filesystem::exists(base / "links"));
    assert(!std::filesystem::exists(base / "copied"));
    // The link target is untouched.
    assert(std::filesystem::exists(base / "assets" / "a.mdc"));

    // Only the directory with real content was backed up.
    size_t backups = 0;
    for (const auto& item : std::filesystem::directory_iterator(base / aps::BACKUP_DIR)) {
        assert(item.path().filename().string().rfind("copied-", 0) == 0);
        assert(std::filesystem::exists(item.path() / "b.mdc"));
        ++backups;
    }
    assert(backups == 1);

    logger.ok("Test Passed: Orphan Cleanup");
}

int main() {
    std::filesystem::remove_all(TEST_ROOT);

    try {
        test_paths_overlap();
        test_detect_moved_destination();
        test_overlap_is_never_an_orphan();
        test_symlinked_destination_is_not_an_orphan();
        test_cleanup();
    } catch (const std::exception& e) {
        logger.error(std::string("An orphan test failed: ") + e.what());
        std::filesystem::remove_all(TEST_ROOT);
        return 1;
    }

    std::filesystem::remove_all(TEST_ROOT);
    logger.ok("All orphan tests completed successfully!");
    return 0;
}
