#include "config/Config.hpp"
#include "core/Logger.hpp"
#include <iomanip>
#include <vector>

namespace Lattice {

const char* ConfigErrorToString(ConfigError error) {
    switch (error) {
        case ConfigError::FileNotFound: return "file not found";
        case ConfigError::ParseError:   return "parse error";
        case ConfigError::WriteError:   return "write error";
    }
    return "unknown";
}

namespace {

std::vector<std::string> SplitKey(std::string_view key) {
    std::vector<std::string> parts;
    size_t start = 0;
    size_t end = 0;
    while ((end = key.find('.', start)) != std::string_view::npos) {
        parts.emplace_back(key.substr(start, end - start));
        start = end + 1;
    }
    parts.emplace_back(key.substr(start));
    return parts;
}

} // namespace

std::expected<void, ConfigError> Config::Load(const std::filesystem::path& filepath) {
    m_filepath = filepath;

    std::ifstream file(filepath);
    if (!file.is_open()) {
        LATTICE_LOG_WARN("Config file not found: {}", filepath.string());
        return std::unexpected(ConfigError::FileNotFound);
    }

    try {
        m_data = nlohmann::json::parse(file);
        LATTICE_LOG_INFO("Loaded configuration from: {}", filepath.string());
        return {};
    } catch (const nlohmann::json::exception& e) {
        LATTICE_LOG_ERROR("Failed to parse config file {}: {}", filepath.string(), e.what());
        return std::unexpected(ConfigError::ParseError);
    }
}

std::expected<void, ConfigError> Config::LoadFromString(std::string_view text) {
    try {
        m_data = nlohmann::json::parse(text);
        return {};
    } catch (const nlohmann::json::exception& e) {
        LATTICE_LOG_ERROR("Failed to parse config: {}", e.what());
        return std::unexpected(ConfigError::ParseError);
    }
}

std::expected<void, ConfigError> Config::Save(const std::filesystem::path& filepath) const {
    const auto& path = filepath.empty() ? m_filepath : filepath;
    if (path.empty()) {
        return std::unexpected(ConfigError::FileNotFound);
    }

    try {
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }

        std::ofstream file(path);
        if (!file.is_open()) {
            LATTICE_LOG_ERROR("Failed to open config file for writing: {}", path.string());
            return std::unexpected(ConfigError::WriteError);
        }

        file << std::setw(4) << m_data << std::endl;
        LATTICE_LOG_INFO("Saved configuration to: {}", path.string());
        return {};
    } catch (const std::exception& e) {
        LATTICE_LOG_ERROR("Failed to save config file: {}", e.what());
        return std::unexpected(ConfigError::WriteError);
    }
}

bool Config::Has(std::string_view key) const {
    return NavigateToKey(key) != nullptr;
}

nlohmann::json* Config::NavigateToKey(std::string_view key, bool create) {
    nlohmann::json* current = &m_data;
    for (const auto& p : SplitKey(key)) {
        if (!current->is_object()) {
            if (!create) {
                return nullptr;
            }
            *current = nlohmann::json::object();
        }
        if (!current->contains(p)) {
            if (!create) {
                return nullptr;
            }
            (*current)[p] = nlohmann::json::object();
        }
        current = &(*current)[p];
    }
    return current;
}

const nlohmann::json* Config::NavigateToKey(std::string_view key) const {
    const nlohmann::json* current = &m_data;
    for (const auto& p : SplitKey(key)) {
        if (!current->is_object() || !current->contains(p)) {
            return nullptr;
        }
        current = &(*current)[p];
    }
    return current;
}

std::expected<void, ConfigError> Config::CreateDefault(const std::filesystem::path& filepath) {
    nlohmann::json config;

    // Server settings
    config["server"]["name"] = "Lattice Server";
    config["server"]["bind_address"] = "0.0.0.0";
    config["server"]["port"] = 5000;
    config["server"]["max_clients"] = 64;
    config["server"]["tick_rate"] = 60;
    config["server"]["spawn_half_extent"] = 20.0;
    config["server"]["spawn_height"] = 171.0;
    config["server"]["spawn_seed"] = 0;
    config["server"]["timeout_seconds"] = 10.0;

    // Client settings
    config["client"]["server_address"] = "127.0.0.1";
    config["client"]["server_port"] = 5000;
    config["client"]["tick_rate"] = 60;
    config["client"]["connect_timeout_seconds"] = 5.0;
    config["client"]["timeout_seconds"] = 10.0;

    // World settings
    config["world"]["view_distance"] = 16;
    config["world"]["async_generation"] = false;
    config["world"]["worker_threads"] = 0;
    config["world"]["max_pending_generation"] = 4096;
    config["world"]["ground_height"] = 64;

    // Logging
    config["logging"]["level"] = "info";
    config["logging"]["file"] = "";

    try {
        if (filepath.has_parent_path()) {
            std::filesystem::create_directories(filepath.parent_path());
        }

        std::ofstream file(filepath);
        if (!file.is_open()) {
            return std::unexpected(ConfigError::WriteError);
        }
        file << std::setw(4) << config << std::endl;
        LATTICE_LOG_INFO("Created default configuration file: {}", filepath.string());
        return {};
    } catch (const std::exception& e) {
        LATTICE_LOG_ERROR("Failed to create default config: {}", e.what());
        return std::unexpected(ConfigError::WriteError);
    }
}

} // namespace Lattice
