#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>
#include <filesystem>

namespace Evo {

namespace fs = std::filesystem;

// Flat key=value configuration store. Lines starting with '#' are comments.
// The directory comes from the argument, then $EVO_CONFIG_DIR, then ~/.evo/config.
class ConfigManager {
public:
    ConfigManager(std::string config_dir = "");
    ~ConfigManager() {}

    // Configuration loading/saving
    bool load_config(const std::string& filename = "evo_config.txt");
    bool save_config(const std::string& filename = "evo_config.txt");

    // Value access
    std::string get_string(const std::string& key, const std::string& default_value = "") const;
    int get_int(const std::string& key, int default_value = 0) const;
    double get_double(const std::string& key, double default_value = 0.0) const;
    bool get_bool(const std::string& key, bool default_value = false) const;
    // Counts and sizes. Throws std::invalid_argument on negative values.
    size_t get_size(const std::string& key, size_t default_value = 0) const;

    // Value setting
    void set_string(const std::string& key, const std::string& value);
    void set_int(const std::string& key, int value);
    void set_double(const std::string& key, double value);
    void set_bool(const std::string& key, bool value);
    void set_size(const std::string& key, size_t value);

    bool has_key(const std::string& key) const;
    std::vector<std::string> get_keys() const;
    void clear();

    std::string getConfigDir() const { return config_dir_; }

private:
    std::string config_dir_;
    std::unordered_map<std::string, std::string> config_data_;
};

} // namespace Evo
