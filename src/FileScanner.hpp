#ifndef FILE_SCANNER_HPP
#define FILE_SCANNER_HPP

#include <filesystem>
#include <string>
#include <unordered_set>
#include <vector>

struct ScanOptions {
    bool recursive = false;
    // Normalized extensions (".mp3"); see normalizeExtension.
    std::unordered_set<std::string> extensions;
};

// Normalize extensions (trim whitespace, enforce dot prefix, lower-case).
std::string normalizeExtension(std::string extension);

// Collect audio files under dir, sorted by path. Hidden files and folders, and the
// _Unsorted folder in recursive mode, are skipped. Returns false if dir cannot be read.
bool scanAudioFiles(const std::filesystem::path& dir, const ScanOptions& options, std::vector<std::filesystem::path>& files);

#endif
