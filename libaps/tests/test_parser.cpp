//
// Created by cv2 on 10/19/26.
//

#include "../include/libaps/parser.h"
#include "../include/libaps/logging.h"
#include <cassert>
#include <filesystem>
#include <fstream>

const std::filesystem::path TEST_ROOT = std::filesystem::temp_directory_path() / "aps_test_parser";
const aps::log::Logger logger;

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
}

void test_parse_full_manifest() {
    logger.info("Running test: Parse Full Manifest...");
    const std::string yaml = R"(
entries:
  - id: agents
    kind: agents_md
    source:
      type: filesystem
      root: $HOME/assets
      path: AGENTS.md
  - id: rules
    kind: cursor_rules
    source:
      type: filesystem
      root: ../shared
      symlink: false
    dest: ./.cursor/rules/
    include:
      - python
      - rust
  - id: skills
    kind: agent_skill
    source:
      type: git
      url: https://example.com/skills.git
      shallow: false
      path: skills
  - id: combined
    kind: composite_agents_md
    sources:
      - type: filesystem
        root: $HOME/a
        path: base.md
      - type: git
        repo: https://example.com/docs.git
        ref: v2
        path: extra.md
)";

    auto manifest = aps::ManifestParser::parse_from_string(yaml);
    assert(manifest.has_value());
    assert(manifest->entries.size() == 4);
    assert(manifest->validate().has_value());

    const auto* agents = manifest->find("agents");
    assert(agents != nullptr);
    assert(agents->kind == aps::AssetKind::AgentsMd);
    const auto& agents_source = std::get<aps::FilesystemSource>(*agents->source);
    assert(agents_source.root == "$HOME/assets");
    assert(agents_source.symlink);
    assert(aps::source_sub_path(*agents->source) == "AGENTS.md");
    assert(aps::source_display_name(*agents->source) == "filesystem:$HOME/assets");
    assert(agents->destination() == std::filesystem::path("AGENTS.md"));

    const auto* rules = manifest->find("rules");
    assert(rules != nullptr);
    assert(!std::get<aps::FilesystemSource>(*rules->source).symlink);
    assert(aps::source_sub_path(*rules->source) == ".");
    assert((rules->include == std::vector<std::string>{"python", "rust"}));
    assert(aps::destination_path(*rules, "/work") == std::filesystem::path("/work/./.cursor/rules"));

    const auto* skills = manifest->find("skills");
    assert(skills != nullptr);
    const auto& git = std::get<aps::GitSource>(*skills->source);
    assert(git.repo == "https://example.com/skills.git");
    assert(git.ref == "auto");
    assert(!git.shallow);
    assert(skills->destination() == std::filesystem::path(".claude/skills"));

    const auto* combined = manifest->find("combined");
    assert(combined != nullptr);
    assert(combined->is_composite());
    assert(combined->sources.size() == 2);
    assert(std::get<aps::GitSource>(combined->sources[1]).ref == "v2");
    assert(aps::source_display_path(combined->sources[0]) == "$HOME/a/base.md");
    assert(aps::source_display_path(combined->sources[1]) == "https://example.com/docs.git:extra.md");

    assert(manifest->find("nope") == nullptr);

    logger.ok("Test Passed: Parse Full Manifest");
}

void test_parse_errors() {
    logger.info("Running test: Parse Errors...");

    auto unknown_kind = aps::ManifestParser::parse_from_string(
        "entries:\n  - id: x\n    kind: vim_rules\n    source: {type: filesystem, root: /tmp}\n");
    assert(!unknown_kind.has_value());
    assert(unknown_kind.error().kind == aps::ErrorKind::ManifestInvalid);

    auto unknown_type = aps::ManifestParser::parse_from_string(
        "entries:\n  - id: x\n    kind: agents_md\n    source: {type: http, root: /tmp}\n");
    assert(!unknown_type.has_value());

    auto no_repo = aps::ManifestParser::parse_from_string(
        "entries:\n  - id: x\n    kind: agents_md\n    source: {type: git, ref: main}\n");
    assert(!no_repo.has_value());

    auto broken = aps::ManifestParser::parse_from_string("entries: [\n");
    assert(!broken.has_value());
    assert(broken.error().kind == aps::ErrorKind::ManifestInvalid);

    auto missing = aps::ManifestParser::parse(TEST_ROOT / "nowhere" / "aps.yaml");
    assert(!missing.has_value());

    auto empty = aps::ManifestParser::parse_from_string("");
    assert(empty.has_value() && empty->entries.empty());

    logger.ok("Test Passed: Parse Errors");
}

void test_validate() {
    logger.info("Running test: Manifest Validation...");

    auto duplicate = aps::ManifestParser::parse_from_string(
        "entries:\n"
        "  - {id: a, kind: agents_md, source: {type: filesystem, root: /tmp}}\n"
        "  - {id: a, kind: cursor_rules, source: {type: filesystem, root: /tmp}}\n");
    assert(duplicate.has_value());
    auto dup_result = duplicate->validate();
    assert(!dup_result.has_value());
    assert(dup_result.error().message.find("Duplicate") != std::string::npos);

    auto no_source = aps::ManifestParser::parse_from_string("entries:\n  - {id: a, kind: cursor_rules}\n");
    assert(no_source.has_value());
    assert(!no_source->validate().has_value());

    auto composite_without_sources = aps::ManifestParser::parse_from_string(
        "entries:\n  - {id: a, kind: composite_agents_md, source: {type: filesystem, root: /tmp}}\n");
    assert(composite_without_sources.has_value());
    assert(!composite_without_sources->validate().has_value());

    logger.ok("Test Passed: Manifest Validation");
}

void test_overlapping_destinations() {
    logger.info("Running test: Overlapping Destinations...");
    auto manifest = aps::ManifestParser::parse_from_string(
        "entries:\n"
        "  - {id: hooks, kind: cursor_hooks, source: {type: filesystem, root: /tmp}}\n"
        "  - {id: rules, kind: cursor_rules, source: {type: filesystem, root: /tmp}}\n"
        "  - {id: skills, kind: agent_skill, source: {type: filesystem, root: /tmp}}\n");
    assert(manifest.has_value());

    const auto warnings = manifest->detect_overlapping_destinations();
    assert(warnings.size() == 1);
    assert(warnings[0].find("hooks") != std::string::npos);
    assert(warnings[0].find("rules") != std::string::npos);

    logger.ok("Test Passed: Overlapping Destinations");
}

void test_discover_manifest() {
    logger.info("Running test: Manifest Discovery...");
    const auto project = TEST_ROOT / "project";
    write_file(project / "aps.yaml", "entries: []\n");
    std::filesystem::create_directories(project / "src" / "deep");

    auto found = aps::discover_manifest(project / "src" / "deep");
    assert(found.has_value());
    assert(*found == project / "aps.yaml");

    auto parsed = aps::ManifestParser::parse(*found);
    assert(parsed.has_value() && parsed->entries.empty());

    // A repository root stops the walk even if a manifest sits above it.
    const auto repo = project / "vendor" / "repo";
    std::filesystem::create_directories(repo / ".git");
    std::filesystem::create_directories(repo / "sub");
    auto blocked = aps::discover_manifest(repo / "sub");
    assert(!blocked.has_value());
    assert(blocked.error().kind == aps::ErrorKind::ManifestInvalid);

    logger.ok("Test Passed: Manifest Discovery");
}

int main() {
    std::filesystem::remove_all(TEST_ROOT);

    try {
        test_parse_full_manifest();
        test_parse_errors();
        test_validate();
        test_overlapping_destinations();
        test_discover_manifest();
    } catch (const std::exception& e) {
        logger.error(std::string("A parser test failed: ") + e.what());
        std::filesystem::remove_all(TEST_ROOT);
        return 1;
    }

    std::filesystem::remove_all(TEST_ROOT);
    logger.ok("All parser tests completed successfully!");
    return 0;
}
