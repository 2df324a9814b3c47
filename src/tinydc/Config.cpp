#include "tinydc/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace {
std::string Trim(const std::string& s) {
    std::size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start])) != 0) {
        ++start;
    }
    std::size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])) != 0) {
        --end;
    }
    return s.substr(start, end - start);
}

std::filesystem::path ExpandHome(const std::string& raw) {
    if (raw == "~") {
        return HomeDirectory();
    }
    if (raw.rfind("~/", 0) == 0) {
        return HomeDirectory() / raw.substr(2);
    }
    return raw;
}
}

std::filesystem::path HomeDirectory() {
    const char* home = std::getenv("HOME");
    if (home != nullptr && home[0] != '\0') {
        return home;
    }
    std::error_code ec;
    std::filesystem::path cwd = std::filesystem::current_path(ec);
    return ec ? std::filesystem::path(".") : cwd;
}

bool AppConfig::LoadFromFile(const std::filesystem::path& path) {
    values_.clear();
    std::ifstream in(path);
    if (!in.is_open()) {
        return false;
    }

    std::string line;
    while (std::getline(in, line)) {
        const std::string trimmed = Trim(line);
        if (trimmed.empty() || trimmed[0] == '#') {
            continue;
        }
        const std::size_t colon = trimmed.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        std::string key = Trim(trimmed.substr(0, colon));
        std::string value = Trim(trimmed.substr(colon + 1));
        values_[key] = value;
    }

    return true;
}

std::string AppConfig::GetString(const std::string& key, const std::string& fallback) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return fallback;
    }
    return it->second;
}

int AppConfig::GetInt(const std::string& key, int fallback) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return fallback;
    }
    try {
        return std::stoi(it->second);
    } catch (const std::invalid_argument&) {
        return fallback;
    } catch (const std::out_of_range&) {
        return fallback;
    }
}

bool AppConfig::GetBool(const std::string& key, bool fallback) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return fallback;
    }
    std::string v = it->second;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "true" || v == "yes" || v == "1" || v == "on") {
        return true;
    }
    if (v == "false" || v == "no" || v == "0" || v == "off") {
        return false;
    }
    return fallback;
}

void AppConfig::SetString(const std::string& key, const std::string& value) {
    values_[key] = value;
}

std::filesystem::path AppConfig::DefaultPath() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg != nullptr && xdg[0] != '\0') {
        return std::filesystem::path(xdg) / "tinydc" / "config.yml";
    }
    return HomeDirectory() / ".config" / "tinydc" / "config.yml";
}

std::filesystem::path AppConfig::IndexFile() const {
    const std::string configured = GetString("index_file", "");
    if (!configured.empty()) {
        return ExpandHome(configured);
    }
    const char* env = std::getenv("TINYDC_INDEX");
    if (env != nullptr && env[0] != '\0') {
        return ExpandHome(env);
    }
    return HomeDirectory() / ".tiny-dc";
}
