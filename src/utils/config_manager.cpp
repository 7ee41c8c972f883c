#include "config_manager.hpp"
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace Evo {

namespace {

std::string trim(const std::string& text) {
    const char* ws = " \t\r\n";
    size_t begin = text.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    size_t end = text.find_last_not_of(ws);
    return text.substr(begin, end - begin + 1);
}

} // namespace

ConfigManager::ConfigManager(std::string config_dir) {
    if (config_dir.empty()) {
        if (const char* env = std::getenv("EVO_CONFIG_DIR")) {
            config_dir = env;
        } else {
            std::string home;
            if (const char* h = std::getenv("HOME")) home = h;
            else if (const char* h = std::getenv("USERPROFILE")) home = h;
            config_dir = home.empty() ? "./config" : home + "/.evo/config";
        }
    }
    config_dir_ = config_dir;
    fs::create_directories(config_dir_);
}

bool ConfigManager::load_config(const std::string& filename) {
    std::ifstream file((fs::path(config_dir_) / filename).string());
    if (!file) return false;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        size_t pos = line.find('=');
        if (pos != std::string::npos) {
            std::string key = trim(line.substr(0, pos));
            std::string value = trim(line.substr(pos + 1));
            if (!key.empty()) config_data_[key] = value;
        }
    }
    return true;
}

bool ConfigManager::save_config(const std::string& filename) {
    std::ofstream file((fs::path(config_dir_) / filename).string());
    if (!file) return false;
    // Sorted so saved files diff cleanly
    for (const auto& key : get_keys()) {
        file << key << "=" << config_data_.at(key) << std::endl;
    }
    return true;
}

std::string ConfigManager::get_string(const std::string& key, const std::string& default_value) const {
    auto it = config_data_.find(key);
    return it != config_data_.end() ? it->second : default_value;
}

int ConfigManager::get_int(const std::string& key, int default_value) const {
    std::string val = get_string(key);
    if (val.empty()) return default_value;
    return std::stoi(val);
}

double ConfigManager::get_double(const std::string& key, double default_value) const {
    std::string val = get_string(key);
    if (val.empty()) return default_value;
    return std::stod(val);
}

size_t ConfigManager::get_size(const std::string& key, size_t default_value) const {
    std::string val = get_string(key);
    if (val.empty()) return default_value;
    long long parsed = std::stoll(val);
    if (parsed < 0) {
        throw std::invalid_argument("Configuration key " + key + " must not be negative");
    }
    return static_cast<size_t>(parsed);
}

bool ConfigManager::get_bool(const std::string& key, bool default_value) const {
    std::string val = get_string(key);
    if (val.empty()) return default_value;
    return val == "true" || val == "1";
}

void ConfigManager::set_string(const std::string& key, const std::string& value) {
    config_data_[key] = value;
}

void ConfigManager::set_int(const std::string& key, int value) {
    set_string(key, std::to_string(value));
}

void ConfigManager::set_size(const std::string& key, size_t value) {
    set_string(key, std::to_string(value));
}

void ConfigManager::set_double(const std::string& key, double value) {
    std::ostringstream out;
    out << value;
    set_string(key, out.str());
}

void ConfigManager::set_bool(const std::string& key, bool value) {
    set_string(key, value ? "true" : "false");
}

bool ConfigManager::has_key(const std::string& key) const {
    return config_data_.count(key) > 0;
}

std::vector<std::string> ConfigManager::get_keys() const {
    std::vector<std::string> keys;
    for (const auto& p : config_data_) {
        keys.push_back(p.first);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

void ConfigManager::clear() {
    config_data_.clear();
}

} // namespace Evo
