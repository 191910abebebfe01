// include/lotbook/utils/config.hpp
#pragma once
#include <string>
#include <unordered_map>
#include <mutex>
#include <memory>
#include <istream>
#include <sstream>

namespace lotbook {
namespace utils {

// key = value settings, '#' starts a comment line
class Config {
private:
    std::unordered_map<std::string, std::string> values_;
    mutable std::mutex mutex_;
    static std::shared_ptr<Config> instance_;
    static std::mutex instance_mutex_;

public:
    Config() = default;

    static std::shared_ptr<Config> instance();

    bool load_from_file(const std::string& filename);
    void load_from_stream(std::istream& input);

    bool contains(const std::string& key) const;

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

    std::string get(const std::string& key, const std::string& default_value) const;
    std::string get(const std::string& key, const char* default_value) const;

    // Accepts true/false, yes/no, on/off, 1/0
    bool get_bool(const std::string& key, bool default_value) const;

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
} // namespace lotbook
