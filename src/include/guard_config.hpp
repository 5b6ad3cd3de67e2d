#pragma once

#include <cstddef>
#include <filesystem>
#include <set>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace stagegate {

/**
 * Process-wide staging configuration, loaded once at startup and injected
 * into the guard and the staging service. Never attacker influenced.
 */
struct GuardConfig {
    static constexpr size_t kDefaultMaxFileBytes = 1024 * 1024;

    std::filesystem::path data_dir;          // Staging root defaults to <data_dir>/staging
    std::filesystem::path staging_root;      // Absolute; one subdirectory per project
    std::vector<std::string> ignore_patterns;
    std::set<std::string> allowed_dotfiles;
    size_t max_file_bytes = kDefaultMaxFileBytes;

    /**
     * Build a configuration rooted at <data_dir>/staging with the default
     * ignore patterns and dotfile allowlist.
     */
    static GuardConfig withDataDir(const std::filesystem::path& data_dir);
};

/**
 * Loads GuardConfig from a stagegate.yaml file.
 *
 * Recognized keys:
 *   data-dir          base data directory (default: directory of the file)
 *   staging-root      explicit staging root (default: <data-dir>/staging)
 *   max-file-bytes    upload size limit
 *   allowed-dotfiles  extensionless dotfiles exempt from the hidden-directory rule
 *   ignore-patterns   secret/credential globs (default: built-in set)
 *
 * Relative paths are resolved against the configuration file's directory.
 */
class GuardConfigLoader {
public:
    explicit GuardConfigLoader(const std::filesystem::path& config_file_path);

    /**
     * @throws std::runtime_error if the file is missing, unparsable or invalid
     */
    GuardConfig load() const;

    /**
     * Interpret an already parsed document.
     *
     * @param root Parsed YAML document
     * @param base_path Directory used to resolve relative paths
     * @throws std::runtime_error on invalid values
     */
    static GuardConfig fromYaml(const YAML::Node& root, const std::filesystem::path& base_path);

    std::filesystem::path getConfigFilePath() const { return config_file_path_; }
    std::filesystem::path getBasePath() const { return base_path_; }

private:
    std::filesystem::path config_file_path_;
    std::filesystem::path base_path_;

    static std::filesystem::path resolvePath(const std::filesystem::path& base,
                                             const std::string& value);
};

} // namespace stagegate
