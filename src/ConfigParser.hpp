#ifndef CONFIG_PARSER_HPP
#define CONFIG_PARSER_HPP

#include <filesystem>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json_fwd.hpp>

// Parses config/tagmv.json and exposes the sort root, scan mode and audio extensions.
class ConfigParser {
public:
    // Load <configRoot>/config/tagmv.json. A missing file leaves the defaults in place;
    // returns false on I/O or validation errors.
    bool load(const std::string& configRoot);
    // Load a specific configuration file.
    bool loadFile(const std::filesystem::path& configPath);

    // Configured default directory with placeholders applied; empty when unset.
    const std::string& getSortRoot() const;
    bool isRecursive() const;
    // Normalized extensions (".mp3") to treat as audio files.
    const std::vector<std::string>& getAudioExtensions() const;

private:
    void resetToDefaults();
    // Collect placeholder tokens (built-in and user-defined) for later substitution.
    void loadPlaceholders(const nlohmann::json& data);
    // Replace placeholder tokens in strings, logging warnings for unresolved entries.
    std::string applyPlaceholders(const std::string& value) const;
    // Parse and validate a JSON array of extension strings.
    bool parseExtensionArray(const nlohmann::json& extensionsArray, const std::string& sectionName);
    static std::vector<std::string> builtInDefaultExtensions();

    std::string m_sort_root;
    bool m_recursive = false;
    std::vector<std::string> m_extensions = builtInDefaultExtensions();
    std::unordered_map<std::string, std::string> m_placeholders;
};

#endif
