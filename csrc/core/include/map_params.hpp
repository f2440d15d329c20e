#pragma once

#include <cctype>
#include <cstdlib>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace mdchunk {

// Process-wide registry of named size parameters. Values registered here take
// precedence over built-in defaults but never over values passed explicitly.
class MapParams {
public:
    using MapType = std::unordered_map<std::string, size_t>;

    explicit MapParams(std::string env_prefix = "") : _env_prefix(std::move(env_prefix)) {}

    size_t get_param_value(
        const std::string_view& param_name,
        const std::optional<size_t>& value,
        size_t default_value) const
    {
        if (value.has_value()) return *value;
        {
            std::lock_guard<std::mutex> guard(_lock);
            auto it = _params.find(std::string(param_name));
            if (it != _params.end()) return it->second;
        }
        if (auto env_value = get_env(param_name)) return *env_value;
        return default_value;
    }

    void set_default(const std::string_view& param_name, size_t value) {
        std::lock_guard<std::mutex> guard(_lock);
        _params[std::string(param_name)] = value;
    }

    void set_default(const MapType& updates) {
        std::lock_guard<std::mutex> guard(_lock);
        for (const auto& entry : updates) {
            _params[entry.first] = entry.second;
        }
    }

    MapType get_default() const {
        std::lock_guard<std::mutex> guard(_lock);
        return _params;
    }

    std::optional<size_t> get_default(const std::string& param_name) const {
        std::lock_guard<std::mutex> guard(_lock);
        auto it = _params.find(param_name);
        if (it == _params.end()) return std::nullopt;
        return it->second;
    }

    void reset_default() {
        std::lock_guard<std::mutex> guard(_lock);
        _params.clear();
    }

private:
    // MDCHUNK_PARENT_TARGET_SIZE style override for `parent_target_size`.
    std::optional<size_t> get_env(const std::string_view& param_name) const {
        if (_env_prefix.empty()) return std::nullopt;
        std::string key = _env_prefix;
        for (char c : param_name)
            key.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));

        const char* raw = std::getenv(key.c_str());
        if (raw == nullptr || *raw == '\0') return std::nullopt;

        const char* digits = raw;
        while (std::isspace(static_cast<unsigned char>(*digits))) ++digits;
        if (*digits == '-' || *digits == '+')
            throw std::invalid_argument("Environment variable " + key + " is not a number: " + raw);

        char* end = nullptr;
        const unsigned long long parsed = std::strtoull(digits, &end, 10);
        if (end == digits || *end != '\0')
            throw std::invalid_argument("Environment variable " + key + " is not a number: " + raw);
        return static_cast<size_t>(parsed);
    }

    mutable std::mutex _lock;
    MapType _params;
    std::string _env_prefix;
};

} // namespace mdchunk
