#pragma once

#include <string>
#include <string_view>
#include <filesystem>
#include <fstream>
#include <expected>
#include <type_traits>
#include <nlohmann/json.hpp>
#include <glm/glm.hpp>

namespace Lattice {

/**
 * @brief Errors reported by configuration load/save
 */
enum class ConfigError {
    FileNotFound,
    ParseError,
    WriteError
};

[[nodiscard]] const char* ConfigErrorToString(ConfigError error);

/**
 * @brief JSON-based configuration with dot-separated key paths
 *
 * Values missing from the file fall back to the caller's default, so a
 * partial file only overrides what it names.
 */
class Config {
public:
    Config() = default;

    /**
     * @brief Load configuration from JSON file
     * @param filepath Path to configuration file
     */
    [[nodiscard]] std::expected<void, ConfigError> Load(const std::filesystem::path& filepath);

    /**
     * @brief Parse configuration from an in-memory JSON document
     */
    [[nodiscard]] std::expected<void, ConfigError> LoadFromString(std::string_view text);

    /**
     * @brief Save current configuration to JSON file
     * @param filepath Path to save to (uses loaded path if empty)
     */
    [[nodiscard]] std::expected<void, ConfigError> Save(const std::filesystem::path& filepath = "") const;

    /**
     * @brief Get a configuration value with type safety
     * @tparam T The expected type
     * @param key Dot-separated key path (e.g., "server.port")
     * @param defaultValue Value to return if key not found or mistyped
     */
    template<typename T>
    T Get(std::string_view key, const T& defaultValue = T{}) const;

    /**
     * @brief Set a configuration value, creating intermediate objects
     */
    template<typename T>
    void Set(std::string_view key, const T& value);

    [[nodiscard]] bool Has(std::string_view key) const;

    const nlohmann::json& GetJson() const { return m_data; }

    /**
     * @brief Write a default configuration file covering every section
     */
    [[nodiscard]] static std::expected<void, ConfigError> CreateDefault(const std::filesystem::path& filepath);

private:
    nlohmann::json* NavigateToKey(std::string_view key, bool create);
    const nlohmann::json* NavigateToKey(std::string_view key) const;

    nlohmann::json m_data = nlohmann::json::object();
    std::filesystem::path m_filepath;
};

// Template implementations
template<typename T>
T Config::Get(std::string_view key, const T& defaultValue) const {
    const auto* node = NavigateToKey(key);
    if (!node || node->is_null()) {
        return defaultValue;
    }

    try {
        if constexpr (std::is_same_v<T, glm::vec3>) {
            if (node->is_array() && node->size() >= 3) {
                return glm::vec3(
                    (*node)[0].get<float>(),
                    (*node)[1].get<float>(),
                    (*node)[2].get<float>()
                );
            }
        } else {
            return node->get<T>();
        }
    } catch (const nlohmann::json::exception&) {
        return defaultValue;
    }
    return defaultValue;
}

template<typename T>
void Config::Set(std::string_view key, const T& value) {
    auto* node = NavigateToKey(key, true);
    if (node) {
        if constexpr (std::is_same_v<T, glm::vec3>) {
            *node = nlohmann::json::array({value.x, value.y, value.z});
        } else {
            *node = value;
        }
    }
}

} // namespace Lattice
