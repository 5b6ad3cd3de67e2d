#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <stdexcept>
#include <yaml-cpp/yaml.h>
#include "guard_config.hpp"
#include "ignore_pattern_matcher.hpp"
#include "test_utils.hpp"

using namespace stagegate;
using namespace stagegate::test;

namespace fs = std::filesystem;

TEST_CASE("GuardConfig: defaults from data dir", "[config]") {
    auto config = GuardConfig::withDataDir("/var/lib/stagegate");

    REQUIRE(config.data_dir == fs::path("/var/lib/stagegate"));
    REQUIRE(config.staging_root == fs::path("/var/lib/stagegate/staging"));
    REQUIRE(config.max_file_bytes == GuardConfig::kDefaultMaxFileBytes);
    REQUIRE(config.ignore_patterns == IgnorePatternMatcher::defaultPatterns());
    REQUIRE(config.allowed_dotfiles.count(".gitignore") == 1);
    REQUIRE(config.allowed_dotfiles.count(".gitattributes") == 1);
}

TEST_CASE("GuardConfigLoader: loading from file", "[config]") {
    TempDirectory dir("stagegate_config");

    SECTION("Full configuration") {
        auto file = dir.writeFile("stagegate.yaml", R"(
data-dir: ./data
staging-root: /srv/staging
max-file-bytes: 2048
allowed-dotfiles:
  - .gitignore
  - .editorconfig
ignore-patterns:
  - "*.pem"
  - vault
)");
        auto config = GuardConfigLoader(file).load();

        REQUIRE(config.data_dir == (dir.fsPath() / "data").lexically_normal());
        REQUIRE(config.staging_root == fs::path("/srv/staging"));
        REQUIRE(config.max_file_bytes == 2048);
        REQUIRE(config.allowed_dotfiles.size() == 2);
        REQUIRE(config.allowed_dotfiles.count(".editorconfig") == 1);
        REQUIRE(config.ignore_patterns == std::vector<std::string>{"*.pem", "vault"});
    }

    SECTION("Relative paths resolve against the config directory") {
        auto file = dir.writeFile("stagegate.yaml", "staging-root: ./uploads\n");
        auto config = GuardConfigLoader(file).load();
        REQUIRE(config.staging_root == (dir.fsPath() / "uploads").lexically_normal());
    }

    SECTION("Empty file yields defaults rooted at the config directory") {
        auto file = dir.writeFile("stagegate.yaml", "");
        auto config = GuardConfigLoader(file).load();
        REQUIRE(config.staging_root == (dir.fsPath() / "staging").lexically_normal());
        REQUIRE(config.ignore_patterns == IgnorePatternMatcher::defaultPatterns());
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(GuardConfigLoader(dir.fsPath() / "missing.yaml").load(), std::runtime_error);
    }

    SECTION("Malformed YAML") {
        auto file = dir.writeFile("stagegate.yaml", "ignore-patterns: [unclosed\n");
        REQUIRE_THROWS_AS(GuardConfigLoader(file).load(), std::runtime_error);
    }
}

TEST_CASE("GuardConfigLoader: invalid values", "[config]") {
    const fs::path base = "/etc/stagegate";

    SECTION("Non-positive size limit") {
        REQUIRE_THROWS_AS(GuardConfigLoader::fromYaml(YAML::Load("max-file-bytes: 0"), base),
                          std::runtime_error);
    }

    SECTION("Size limit of the wrong type") {
        REQUIRE_THROWS_AS(GuardConfigLoader::fromYaml(YAML::Load("max-file-bytes: lots"), base),
                          std::runtime_error);
    }

    SECTION("Allowlist entries must be dotfile names") {
        REQUIRE_THROWS_AS(GuardConfigLoader::fromYaml(YAML::Load("allowed-dotfiles: [gitignore]"), base),
                          std::runtime_error);
        REQUIRE_THROWS_AS(GuardConfigLoader::fromYaml(YAML::Load("allowed-dotfiles: [.a/.b]"), base),
                          std::runtime_error);
    }

    SECTION("Root must be a mapping") {
        REQUIRE_THROWS_AS(GuardConfigLoader::fromYaml(YAML::Load("- a\n- b\n"), base),
                          std::runtime_error);
    }
}
