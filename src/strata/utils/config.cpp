// src/strata/utils/config.cpp
#include "strata/utils/config.hpp"
#include "strata/utils/logger.hpp"
#include <fstream>

namespace strata {
namespace utils {

std::shared_ptr<Config> Config::instance_ = nullptr;
std::mutex Config::instance_mutex_;

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = s.find_last_not_of(" \t\r");
    return s.substr(first, last - first + 1);
}

} // namespace

std::shared_ptr<Config> Config::instance() {
    std::lock_guard<std::mutex> lock(instance_mutex_);
    if (!instance_) {
        instance_ = std::make_shared<Config>();
    }
    return instance_;
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        Logger::warn() << "Cannot open config file: " << filename << Logger::endl;
        return false;
    }

    load_from_stream(file);
    Logger::debug() << "Loaded config from " << filename << Logger::endl;
    return true;
}

void Config::load_from_stream(std::istream& in) {
    std::lock_guard<std::mutex> lock(mutex_);
    values_.clear();

    std::string line;
    while (std::getline(in, line)) {
        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#') {
            continue;
        }

        size_t pos = trimmed.find('=');
        if (pos == std::string::npos) {
            continue;
        }

        std::string key = trim(trimmed.substr(0, pos));
        if (!key.empty()) {
            values_[key] = trim(trimmed.substr(pos + 1));
        }
    }
}

std::vector<double> Config::get_list(const std::string& key) const {
    std::string raw;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = values_.find(key);
        if (it == values_.end()) {
            return {};
        }
        raw = it->second;
    }

    std::vector<double> values;
    std::stringstream ss(raw);
    std::string item;
    while (std::getline(ss, item, ',')) {
        std::istringstream iss(trim(item));
        double value = 0.0;
        if (!(iss >> value)) {
            Logger::warn() << "Config key '" << key << "' has a non-numeric element: "
                           << item << Logger::endl;
            return {};
        }
        values.push_back(value);
    }
    return values;
}

bool Config::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_.count(key) > 0;
}

std::vector<std::string> Config::keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(values_.size());
    for (const auto& [key, _] : values_) {
        result.push_back(key);
    }
    return result;
}

void Config::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    values_.clear();
}

} // namespace utils
} // namespace strata
