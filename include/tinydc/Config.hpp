#ifndef TINYDC_CONFIG_HPP
#define TINYDC_CONFIG_HPP

#include <filesystem>
#include <string>
#include <unordered_map>

// Lightweight YAML-like loader for tinydc settings.
// Parses simple "key: value" lines, ignoring comments (#) and blank lines.
class AppConfig {
public:
    bool LoadFromFile(const std::filesystem::path& path);

    // Accessors with defaults.
    std::string GetString(const std::string& key, const std::string& fallback) const;
    int GetInt(const std::string& key, int fallback) const;
    bool GetBool(const std::string& key, bool fallback) const;

    void SetString(const std::string& key, const std::string& value);

    // $XDG_CONFIG_HOME/tinydc/config.yml, falling back to ~/.config/tinydc/config.yml.
    static std::filesystem::path DefaultPath();

    // "index_file" if set, else $TINYDC_INDEX, else ~/.tiny-dc. A leading "~/" is expanded.
    std::filesystem::path IndexFile() const;

private:
    std::unordered_map<std::string, std::string> values_;
};

// Home directory from $HOME, or the current directory when unset.
std::filesystem::path HomeDirectory();

#endif // TINYDC_CONFIG_HPP
