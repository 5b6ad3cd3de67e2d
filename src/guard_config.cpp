#include "guard_config.hpp"

#include <stdexcept>
#include <crow/logging.h>

#include "filename_sanitizer.hpp"
#include "ignore_pattern_matcher.hpp"

namespace stagegate {

GuardConfig GuardConfig::withDataDir(const std::filesystem::path& data_dir) {
    GuardConfig config;
    config.data_dir = std::filesystem::absolute(data_dir).lexically_normal();
    config.staging_root = config.data_dir / "staging";
    config.ignore_patterns = IgnorePatternMatcher::defaultPatterns();
    config.allowed_dotfiles = FilenameSanitizer::defaultAllowedDotfiles();
    return config;
}

GuardConfigLoader::GuardConfigLoader(const std::filesystem::path& config_file_path)
    : config_file_path_(std::filesystem::absolute(config_file_path)),
      base_path_(config_file_path_.parent_path()) {
    CROW_LOG_DEBUG << "GuardConfigLoader initialized with config file: " << config_file_path_.string();
}

GuardConfig GuardConfigLoader::load() const {
    if (!std::filesystem::exists(config_file_path_)) {
        throw std::runtime_error("Configuration file not found: " + config_file_path_.string());
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(config_file_path_.string());
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse YAML file '" + config_file_path_.string() + "': " + e.what());
    }

    return fromYaml(root, base_path_);
}

std::filesystem::path GuardConfigLoader::resolvePath(const std::filesystem::path& base,
                                                     const std::string& value) {
    std::filesystem::path path(value);
    if (path.is_absolute()) {
        return path.lexically_normal();
    }
    return std::filesystem::absolute(base / path).lexically_normal();
}

GuardConfig GuardConfigLoader::fromYaml(const YAML::Node& root, const std::filesystem::path& base_path) {
    if (root && !root.IsNull() && !root.IsMap()) {
        throw std::runtime_error("Configuration root must be a mapping");
    }

    try {
        std::filesystem::path data_dir = base_path;
        if (root["data-dir"]) {
            data_dir = resolvePath(base_path, root["data-dir"].as<std::string>());
        }

        GuardConfig config = GuardConfig::withDataDir(data_dir);

        if (root["staging-root"]) {
            config.staging_root = resolvePath(base_path, root["staging-root"].as<std::string>());
        }

        if (root["max-file-bytes"]) {
            auto max_bytes = root["max-file-bytes"].as<long long>();
            if (max_bytes <= 0) {
                throw std::runtime_error("max-file-bytes must be positive");
            }
            config.max_file_bytes = static_cast<size_t>(max_bytes);
        }

        if (root["allowed-dotfiles"]) {
            config.allowed_dotfiles.clear();
            for (const auto& dotfile : root["allowed-dotfiles"]) {
                auto name = dotfile.as<std::string>();
                if (name.size() < 2 || name.front() != '.' || name.find('/') != std::string::npos) {
                    throw std::runtime_error("allowed-dotfiles entries must be single dotfile names, got: " + name);
                }
                config.allowed_dotfiles.insert(name);
            }
        }

        if (root["ignore-patterns"]) {
            config.ignore_patterns = root["ignore-patterns"].as<std::vector<std::string>>();
        }

        CROW_LOG_INFO << "Staging root: " << config.staging_root.string();
        CROW_LOG_DEBUG << "Ignore patterns loaded: " << config.ignore_patterns.size();
        CROW_LOG_DEBUG << "Max upload size: " << config.max_file_bytes << " bytes";
        return config;
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("Invalid staging configuration: ") + e.what());
    }
}

} // namespace stagegate
