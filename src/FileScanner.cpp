#include "FileScanner.hpp"

#include "MovePlanner.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <system_error>

namespace {
bool isHidden(const std::string& name) {
    return !name.empty() && name.front() == '.';
}

bool isAudioFile(const std::filesystem::path& file, const ScanOptions& options) {
    if (!file.has_extension()) {
        return false;
    }
    return options.extensions.count(normalizeExtension(file.extension().string())) != 0;
}

bool accept(const std::filesystem::directory_entry& entry, const ScanOptions& options) {
    std::error_code ec;
    if (!entry.is_regular_file(ec) || ec) {
        return false;
    }
    return !isHidden(entry.path().filename().string()) && isAudioFile(entry.path(), options);
}

bool scanFlat(const std::filesystem::path& dir, const ScanOptions& options, std::vector<std::filesystem::path>& files) {
    std::error_code ec;
    std::filesystem::directory_iterator iter(dir, ec);
    if (ec) {
        std::cerr << "Unable to enumerate `" << dir.string() << "`: " << ec.message() << std::endl;
        return false;
    }

    for (; iter != std::filesystem::directory_iterator(); iter.increment(ec)) {
        if (accept(*iter, options)) {
            files.push_back(iter->path());
        }
    }
    if (ec) {
        std::cerr << "Unable to enumerate `" << dir.string() << "`: " << ec.message() << std::endl;
        return false;
    }
    return true;
}

bool scanRecursive(const std::filesystem::path& dir, const ScanOptions& options, std::vector<std::filesystem::path>& files) {
    std::error_code ec;
    std::filesystem::recursive_directory_iterator iter(dir, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) {
        std::cerr << "Unable to enumerate `" << dir.string() << "`: " << ec.message() << std::endl;
        return false;
    }

    for (; iter != std::filesystem::recursive_directory_iterator(); iter.increment(ec)) {
        const auto& entry = *iter;
        std::error_code typeErr;
        if (entry.is_directory(typeErr)) {
            const std::string name = entry.path().filename().string();
            if (isHidden(name) || name == kUnsortedFolder) {
                iter.disable_recursion_pending();
            }
            continue;
        }
        if (accept(entry, options)) {
            files.push_back(entry.path());
        }
    }
    if (ec) {
        std::cerr << "Unable to enumerate `" << dir.string() << "`: " << ec.message() << std::endl;
        return false;
    }
    return true;
}
} // namespace

std::string normalizeExtension(std::string extension) {
    extension.erase(std::remove_if(extension.begin(), extension.end(), [](unsigned char ch) {
        return std::isspace(ch);
    }), extension.end());

    if (extension.empty()) {
        return {};
    }

    if (extension.front() != '.') {
        extension.insert(extension.begin(), '.');
    }

    std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return extension;
}

bool scanAudioFiles(const std::filesystem::path& dir, const ScanOptions& options, std::vector<std::filesystem::path>& files) {
    files.clear();
    const bool scanned = options.recursive ? scanRecursive(dir, options, files) : scanFlat(dir, options, files);
    if (!scanned) {
        files.clear();
        return false;
    }

    std::sort(files.begin(), files.end());
    return true;
}
