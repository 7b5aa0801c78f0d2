#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <cstdint>
#include "diff_types.hpp"

namespace fs = std::filesystem;

// Diff-and-content provider: turns a multi-file diff into one record per
// file and optionally attaches the post-change content of each file.
class DiffReader {
public:
    explicit DiffReader(bool verbose = false);

    // Split `git diff` / `git format-patch` / `diff -u` / `diff -ruN` output per file
    std::vector<FileDiffInput> readUnifiedDiff(const std::string& text) const;

    // Parse a JSON array (or {"files": [...]}) of objects shaped like a
    // hosting API's pull request file list: filename, previous_filename,
    // status, patch and optionally head_file
    std::vector<FileDiffInput> readJson(const std::string& text) const;

    // Read from a file path, or standard input when path is "-"
    std::vector<FileDiffInput> readFile(const fs::path& path, bool isJson) const;

    // Fill newFileText from a checkout of the post-change tree. Files that
    // are missing or larger than MAX_FILE_SIZE are left without content.
    void attachNewFileContents(std::vector<FileDiffInput>& files, const fs::path& repoRoot) const;

    // Maximum file size to load as full content (10 MB)
    static constexpr uintmax_t MAX_FILE_SIZE = 10 * 1024 * 1024;

private:
    bool verbose_;

    static std::string readStream(std::istream& in);
    static std::string stripPathPrefix(const std::string& path);
};
