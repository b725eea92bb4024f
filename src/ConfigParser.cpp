#include "ConfigParser.hpp"

#include "FileScanner.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <system_error>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

const std::string& ConfigParser::getSortRoot() const {
    return m_sort_root;
}

bool ConfigParser::isRecursive() const {
    return m_recursive;
}

const std::vector<std::string>& ConfigParser::getAudioExtensions() const {
    return m_extensions;
}

bool ConfigParser::load(const std::string& configRoot) {
    // tagmv.json lives in a config folder beside the executable/config root.
    const std::filesystem::path configPath = std::filesystem::path(configRoot) / "config" / "tagmv.json";

    std::error_code ec;
    const bool present = std::filesystem::exists(configPath, ec);
    if (ec) {
        std::cerr << "Unable to check configuration file `" << configPath.string() << "`: " << ec.message() << std::endl;
        return false;
    }

    if (!present) {
        resetToDefaults();
        return true;
    }

    return loadFile(configPath);
}

bool ConfigParser::loadFile(const std::filesystem::path& configPath) {
    resetToDefaults();

    std::ifstream jsonFile(configPath);
    if (!jsonFile) {
        std::cerr << "Failed to open configuration file: " << configPath << std::endl;
        return false;
    }

    json data;
    try {
        jsonFile >> data;
    } catch (const json::parse_error& e) {
        std::cerr << "Failed to parse configuration file: " << e.what() << std::endl;
        return false;
    }

    if (!data.is_object()) {
        std::cerr << "Invalid configuration: top level must be an object." << std::endl;
        return false;
    }

    loadPlaceholders(data);

    if (auto it = data.find("sort_root"); it != data.end()) {
        if (!it->is_string()) {
            std::cerr << "`sort_root` must be a string." << std::endl;
            return false;
        }
        m_sort_root = applyPlaceholders(it->get<std::string>());
    }

    if (auto it = data.find("recursive"); it != data.end()) {
        if (!it->is_boolean()) {
            std::cerr << "`recursive` must be a boolean value." << std::endl;
            return false;
        }
        m_recursive = it->get<bool>();
    }

    bool useDefaultExtensions = true;
    if (auto it = data.find("use_default_extensions"); it != data.end()) {
        if (!it->is_boolean()) {
            std::cerr << "`use_default_extensions` must be a boolean value." << std::endl;
            return false;
        }
        useDefaultExtensions = it->get<bool>();
    }

    if (!useDefaultExtensions) {
        m_extensions.clear();
    }

    if (auto it = data.find("custom_extensions"); it != data.end()) {
        if (!parseExtensionArray(*it, "custom_extensions")) {
            return false;
        }
    }

    if (m_extensions.empty()) {
        std::cerr << "No audio extensions configured. Enable `use_default_extensions` or add entries to `custom_extensions`."
                  << std::endl;
    }

    std::cout << "Loaded configuration from " << configPath << " (" << m_extensions.size() << " extension(s))" << std::endl;
    return true;
}

void ConfigParser::resetToDefaults() {
    m_sort_root.clear();
    m_recursive = false;
    m_extensions = builtInDefaultExtensions();
    m_placeholders.clear();
}

bool ConfigParser::parseExtensionArray(const json& extensionsArray, const std::string& sectionName) {
    if (!extensionsArray.is_array()) {
        std::cerr << "Invalid configuration: `" << sectionName << "` must be an array." << std::endl;
        return false;
    }

    for (const auto& ext : extensionsArray) {
        if (!ext.is_string()) {
            std::cerr << "Invalid entry in `" << sectionName << "`: each extension must be a string." << std::endl;
            return false;
        }

        std::string normalized = normalizeExtension(ext.get<std::string>());
        if (normalized.size() < 2) {
            std::cerr << "Invalid entry in `" << sectionName << "`: extension cannot be empty." << std::endl;
            return false;
        }

        if (std::find(m_extensions.begin(), m_extensions.end(), normalized) == m_extensions.end()) {
            m_extensions.push_back(std::move(normalized));
        }
    }

    return true;
}

std::vector<std::string> ConfigParser::builtInDefaultExtensions() {
    return {".mp3", ".m4a", ".flac", ".ogg", ".wma", ".aac", ".wav"};
}

void ConfigParser::loadPlaceholders(const json& data) {
    m_placeholders.clear();

    if (const char* home = std::getenv("HOME")) {
        m_placeholders["home"] = home;
    }

    auto addPlaceholder = [this](const std::string& key, const json& value) {
        if (!value.is_string()) {
            std::cerr << "Placeholder `" << key << "` must be a string." << std::endl;
            return;
        }
        m_placeholders[key] = value.get<std::string>();
    };

    if (auto placeholdersIt = data.find("placeholders"); placeholdersIt != data.end()) {
        if (!placeholdersIt->is_object()) {
            std::cerr << "`placeholders` must be an object of key/value strings." << std::endl;
        } else {
            for (auto it = placeholdersIt->begin(); it != placeholdersIt->end(); ++it) {
                addPlaceholder(it.key(), it.value());
            }
        }
    }
}

std::string ConfigParser::applyPlaceholders(const std::string& value) const {
    std::string result = value;
    for (const auto& [key, replacement] : m_placeholders) {
        const std::string token = "{{" + key + "}}";
        std::size_t pos = 0;
        while ((pos = result.find(token, pos)) != std::string::npos) {
            result.replace(pos, token.size(), replacement);
            pos += replacement.size();
        }
    }

    if (result.find("{{") != std::string::npos) {
        std::cerr << "Warning: unresolved placeholder detected in value `" << result << "`." << std::endl;
    }

    return result;
}
