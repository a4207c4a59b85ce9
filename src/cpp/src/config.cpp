#include "viewmark/config.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace viewmark {

namespace {

std::string get_home_dir() {
    const char* home = std::getenv("HOME");
    if (home) {
        return std::string(home);
    }
    return ".";
}

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string bool_str(bool value) {
    return value ? "true" : "false";
}

std::string number_str(double value) {
    std::ostringstream out;
    out << value;
    return out.str();
}

} // anonymous namespace

Config::Config(const std::string& config_path)
    : path_(config_path.empty()
            ? get_home_dir() + "/" + DEFAULT_CONFIG_FILENAME
            : config_path) {
    set_defaults();
}

void Config::set_defaults() {
    data_["STORE_PATH"]          = get_home_dir() + "/" + DEFAULT_STORE_FILENAME;
    data_["ANIMATE"]             = bool_str(true);
    data_["TRANSITION_DURATION"] = number_str(DEFAULT_TRANSITION_DURATION);
    data_["AUTOSAVE"]            = bool_str(true);
    data_["SHOW_MARKERS"]        = bool_str(true);
    data_["SHOW_LABELS"]         = bool_str(true);
    data_["MIN_SATURATION"]      = number_str(DEFAULT_MIN_SATURATION);
    data_["MIN_VALUE"]           = number_str(DEFAULT_MIN_VALUE);
    data_["LOG_LEVEL"]           = DEFAULT_LOG_LEVEL;
}

void Config::load() {
    std::ifstream file(path_);
    if (!file.is_open()) {
        return; // Missing file is silently ignored
    }

    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }
        std::string key   = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Only update keys we know about
        if (data_.count(key)) {
            data_[key] = value;
        }
    }
}

bool Config::save() const {
    std::ofstream file(path_);
    if (!file.is_open()) {
        return false;
    }
    for (const auto& [key, value] : data_) {
        file << key << "=" << value << "\n";
    }
    return static_cast<bool>(file);
}

std::string Config::get(const std::string& key,
                         const std::string& default_val) const {
    auto it = data_.find(key);
    if (it != data_.end()) {
        return it->second;
    }
    return default_val;
}

void Config::set(const std::string& key, const std::string& value) {
    data_[key] = value;
}

bool Config::get_bool(const std::string& key, bool default_val) const {
    std::string value = lower(get(key));
    if (value == "true" || value == "1" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "false" || value == "0" || value == "no" || value == "off") {
        return false;
    }
    return default_val;
}

double Config::get_double(const std::string& key, double default_val) const {
    try {
        double value = std::stod(get(key, number_str(default_val)));
        return std::isfinite(value) ? value : default_val;
    } catch (const std::invalid_argument&) {
        return default_val;
    } catch (const std::out_of_range&) {
        return default_val;
    }
}

std::string Config::store_path() const {
    return get("STORE_PATH", get_home_dir() + "/" + DEFAULT_STORE_FILENAME);
}

void Config::set_store_path(const std::string& value) {
    data_["STORE_PATH"] = value;
}

bool Config::animate() const {
    return get_bool("ANIMATE", true);
}

void Config::set_animate(bool value) {
    data_["ANIMATE"] = bool_str(value);
}

double Config::transition_duration() const {
    return get_double("TRANSITION_DURATION", DEFAULT_TRANSITION_DURATION);
}

void Config::set_transition_duration(double value) {
    data_["TRANSITION_DURATION"] = number_str(value);
}

bool Config::autosave() const {
    return get_bool("AUTOSAVE", true);
}

void Config::set_autosave(bool value) {
    data_["AUTOSAVE"] = bool_str(value);
}

bool Config::show_markers() const {
    return get_bool("SHOW_MARKERS", true);
}

void Config::set_show_markers(bool value) {
    data_["SHOW_MARKERS"] = bool_str(value);
}

bool Config::show_labels() const {
    return get_bool("SHOW_LABELS", true);
}

void Config::set_show_labels(bool value) {
    data_["SHOW_LABELS"] = bool_str(value);
}

float Config::min_saturation() const {
    return static_cast<float>(get_double("MIN_SATURATION", DEFAULT_MIN_SATURATION));
}

void Config::set_min_saturation(float value) {
    data_["MIN_SATURATION"] = number_str(value);
}

float Config::min_value() const {
    return static_cast<float>(get_double("MIN_VALUE", DEFAULT_MIN_VALUE));
}

void Config::set_min_value(float value) {
    data_["MIN_VALUE"] = number_str(value);
}

std::string Config::log_level() const {
    return get("LOG_LEVEL", DEFAULT_LOG_LEVEL);
}

void Config::set_log_level(const std::string& value) {
    data_["LOG_LEVEL"] = value;
}

} // namespace viewmark
