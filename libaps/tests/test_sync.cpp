//
// Created by cv2 on 10/19/26.
//

#include "../include/libaps/sync.h"
#include "../include/libaps/backup.h"
#include "../include/libaps/parser.h"
#include "../include/libaps/logging.h"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <sstream>

const std::filesystem::path TEST_ROOT = std::filesystem::temp_directory_path() / "aps_test_sync";
const aps::log::Logger logger;

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

struct SyncFixture {
    std::filesystem::path m_base;
    std::filesystem::path m_assets;
    std::filesystem::path m_manifest_path;
    aps::RunContext m_ctx;

    explicit SyncFixture(const std::string& name)
        : m_base(TEST_ROOT / name / "project"), m_assets(TEST_ROOT / name / "assets"),
          m_manifest_path(m_base / aps::MANIFEST_NAME) {
        write_file(m_assets / "AGENTS.md", "shared rules");
        write_file(m_assets / "rules" / "a.mdc", "a");
        write_file(m_assets / "skills" / "demo" / "SKILL.md", "demo");
        std::filesystem::create_directories(m_base);
        m_ctx.base_dir = m_base;
    }

    // One manifest entry line per id, each pointing into the asset directory.
    std::string entry_yaml(const std::string& id, const std::string& kind, const std::string& path,
                           const std::string& extra = "") const {
        return "  - id: " + id + "\n"
               "    kind: " + kind + "\n"
               "    source:\n"
               "      type: filesystem\n"
               "      root: " + m_assets.string() + "\n"
               "      path: " + path + "\n" + extra;
    }

    std::expected<aps::SyncReport, aps::Error> sync(const std::string& entries, aps::SyncOptions options = {}) {
        const std::string yaml = "entries:\n" + entries;
        write_file(m_manifest_path, yaml);
        auto manifest = aps::ManifestParser::parse(m_manifest_path);
        assert(manifest.has_value());
        return aps::run_sync(*manifest, m_manifest_path, options, m_ctx);
    }

    aps::Lockfile lockfile() const {
        auto loaded = aps::Lockfile::load(m_base / aps::LOCKFILE_NAME, logger);
        assert(loaded.has_value());
        return *loaded;
    }
};

void test_full_sync_then_current() {
    logger.info("Running test: Full Sync Then Current...");
    SyncFixture fx("full");
    const auto entries = fx.entry_yaml("agents", "agents_md", "AGENTS.md") +
                         fx.entry_yaml("rules", "cursor_rules", "rules");

    auto first = fx.sync(entries);
    assert(first.has_value());
    assert(!first->failure.has_value());
    assert(first->lockfile_saved);
    assert(first->results.size() == 2);
    assert(aps::status_of(first->results[0]) == aps::SyncStatus::Synced);
    assert(std::filesystem::is_symlink(fx.m_base / "AGENTS.md"));
    assert(std::filesystem::is_symlink(fx.m_base / ".cursor" / "rules" / "a.mdc"));
    assert(fx.lockfile().entries().size() == 2);

    auto second = fx.sync(entries);
    assert(second.has_value());
    for (const auto& result : second->results) {
        assert(aps::status_of(result) == aps::SyncStatus::Current);
        assert(std::string(aps::to_string(aps::status_of(result))) == "current");
    }
    assert(fx.lockfile().entries().size() == 2);

    logger.ok("Test Passed: Full Sync Then Current");
}

void test_partial_failure_keeps_progress() {
    logger.info("Running test: Partial Failure Keeps Progress...");
    SyncFixture fx("partial");
    const auto agents = fx.entry_yaml("agents", "agents_md", "AGENTS.md");
    const auto skills = fx.entry_yaml("skills", "agent_skill", "skills");
    const auto broken = fx.entry_yaml("broken", "cursor_rules", "does-not-exist");

    auto first = fx.sync(skills);
    assert(first.has_value() && !first->failure.has_value());

    auto second = fx.sync(agents + broken + skills);
    assert(second.has_value());
    assert(second->failure.has_value());
    assert(second->failure->entry_id == "broken");
    assert(second->failure->error.kind == aps::ErrorKind::SourceUnavailable);
    assert(second->results.size() == 1);
    assert(second->lockfile_saved);

    // The entry that succeeded before the failure is recorded, the earlier state is kept.
    const auto lockfile = fx.lockfile();
    assert(lockfile.find("agents") != nullptr);
    assert(lockfile.find("skills") != nullptr);
    assert(lockfile.find("broken") == nullptr);

    logger.ok("Test Passed: Partial Failure Keeps Progress");
}

void test_only_and_stale_entries() {
    logger.info("Running test: --only and Stale Entries...");
    SyncFixture fx("only");
    const auto agents = fx.entry_yaml("agents", "agents_md", "AGENTS.md");
    const auto rules = fx.entry_yaml("rules", "cursor_rules", "rules");

    auto full = fx.sync(agents + rules);
    assert(full.has_value());
    assert(fx.lockfile().entries().size() == 2);

    aps::SyncOptions unknown;
    unknown.only = {"nope"};
    auto missing = fx.sync(agents + rules, unknown);
    assert(!missing.has_value());
    assert(missing.error().kind == aps::ErrorKind::EntryNotFound);

    // A filtered run never prunes.
    aps::SyncOptions only_agents;
    only_agents.only = {"agents"};
    auto filtered = fx.sync(agents, only_agents);
    assert(filtered.has_value());
    assert(filtered->results.size() == 1);
    assert(filtered->stale_removed.empty());
    assert(fx.lockfile().entries().size() == 2);

    // A full run drops ids the manifest no longer has.
    auto pruned = fx.sync(agents);
    assert(pruned.has_value());
    assert((pruned->stale_removed == std::vector<std::string>{"rules"}));
    assert(fx.lockfile().entries().size() == 1);

    logger.ok("Test Passed: --only and Stale Entries");
}

void test_moved_destination_cleans_orphan() {
    logger.info("Running test: Moved Destination Cleans Orphan...");
    const std::string copy = "      symlink: false\n";
    const std::string in_docs = copy + "    dest: docs/AGENTS.md\n";

    SyncFixture fx("orphan");
    auto first = fx.sync(fx.entry_yaml("agents", "agents_md", "AGENTS.md", in_docs));
    assert(first.has_value());
    assert(std::filesystem::is_regular_file(fx.m_base / "docs" / "AGENTS.md"));

    // Without --yes and without a terminal the old copy stays.
    auto kept = fx.sync(fx.entry_yaml("agents", "agents_md", "AGENTS.md", copy));
    assert(kept.has_value());
    assert(kept->orphans.size() == 1);
    assert(kept->orphans_removed == 0);
    assert(std::filesystem::is_regular_file(fx.m_base / "docs" / "AGENTS.md"));
    assert(std::filesystem::is_regular_file(fx.m_base / "AGENTS.md"));
    assert(fx.lockfile().find("agents")->dest == "AGENTS.md");

    SyncFixture confirmed("orphan_yes");
    assert(confirmed.sync(confirmed.entry_yaml("agents", "agents_md", "AGENTS.md", in_docs)).has_value());

    aps::SyncOptions yes;
    yes.install.yes = true;
    auto cleaned = confirmed.sync(confirmed.entry_yaml("agents", "agents_md", "AGENTS.md", copy), yes);
    assert(cleaned.has_value());
    assert(cleaned->orphans.size() == 1);
    assert(cleaned->orphans_removed == 1);
    assert(!std::filesystem::exists(std::filesystem::symlink_status(confirmed.m_base / "docs" / "AGENTS.md")));
    assert(read_file(confirmed.m_base / "AGENTS.md") == "shared rules");
    assert(std::filesystem::exists(confirmed.m_base / aps::BACKUP_DIR));
    assert(confirmed.lockfile().find("agents")->dest == "AGENTS.md");

    logger.ok("Test Passed: Moved Destination Cleans Orphan");
}

void test_dry_run_writes_nothing() {
    logger.info("Running test: Dry Run Writes Nothing...");
    SyncFixture fx("dry");
    aps::SyncOptions dry;
    dry.install.dry_run = true;

    auto report = fx.sync(fx.entry_yaml("agents", "agents_md", "AGENTS.md"), dry);
    assert(report.has_value());
    assert(!report->lockfile_saved);
    assert(report->results.size() == 1);
    assert(!std::filesystem::exists(std::filesystem::symlink_status(fx.m_base / "AGENTS.md")));
    assert(!std::filesystem::exists(fx.m_base / aps::LOCKFILE_NAME));

    logger.ok("Test Passed: Dry Run Writes Nothing");
}

void test_invalid_lockfile_aborts() {
    logger.info("Running test: Invalid Lockfile Aborts...");
    SyncFixture fx("badlock");
    write_file(fx.m_base / aps::LOCKFILE_NAME, "entries: [\n");

    auto report = fx.sync(fx.entry_yaml("agents", "agents_md", "AGENTS.md"));
    assert(!report.has_value());
    assert(report.error().kind == aps::ErrorKind::LockfileInvalid);
    assert(!std::filesystem::exists(std::filesystem::symlink_status(fx.m_base / "AGENTS.md")));

    logger.ok("Test Passed: Invalid Lockfile Aborts");
}

int main() {
    std::filesystem::remove_all(TEST_ROOT);

    try {
        test_full_sync_then_current();
        test_partial_failure_keeps_progress();
        test_only_and_stale_entries();
        test_moved_destination_cleans_orphan();
        test_dry_run_writes_nothing();
        test_invalid_lockfile_aborts();
    } catch (const std::exception& e) {
        logger.error(std::string("A sync test failed: ") + e.what());
        std::filesystem::remove_all(TEST_ROOT);
        return 1;
    }

    std::filesystem::remove_all(TEST_ROOT);
    logger.ok("All sync tests completed successfully!");
    return 0;
}
