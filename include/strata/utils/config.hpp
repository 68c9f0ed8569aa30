// include/strata/utils/config.hpp
#pragma once
#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <memory>
#include <sstream>

namespace strata {
namespace utils {

// Process-wide key = value settings. Lines starting with '#' are comments.
class Config {
private:
    std::map<std::string, std::string> values_;
    mutable std::mutex mutex_;
    static std::shared_ptr<Config> instance_;
    static std::mutex instance_mutex_;

public:
    Config() = default;

    static std::shared_ptr<Config> instance();

    // Replaces the current contents. Returns false if the file cannot be opened.
    bool load_from_file(const std::string& filename);
    void load_from_stream(std::istream& in);

    template<typename T>
    T get(const std::string& key, const T& default_value) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = values_.find(key);
        if (it == values_.end()) {
            return default_value;
        }

        std::istringstream iss(it->second);
        T value;
        if (!(iss >> value)) {
            return default_value;
        }

        return value;
    }

    std::string get(const std::string& key, const std::string& default_value) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = values_.find(key);
        return (it != values_.end()) ? it->second : default_value;
    }

    std::string get(const std::string& key, const char* default_value) const {
        return get(key, std::string(default_value));
    }

    // Comma-separated numbers, e.g. "10, 50, 5". Empty if the key is missing
    // or any element fails to parse.
    std::vector<double> get_list(const std::string& key) const;

    bool contains(const std::string& key) const;
    std::vector<std::string> keys() const;

    template<typename T>
    void set(const std::string& key, const T& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::ostringstream oss;
        oss << value;
        values_[key] = oss.str();
    }

    void clear();
};

} // namespace utils
} // namespace strata
