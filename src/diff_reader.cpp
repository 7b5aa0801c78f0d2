#include "diff_reader.hpp"
#include "hunk_parser.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace {

bool startsWith(const std::string& line, const char* prefix) {
    return line.rfind(prefix, 0) == 0;
}

// "--- a/src/x.cpp\t2024-01-01 ..." -> "a/src/x.cpp"
std::string headerPath(const std::string& line) {
    std::string path = line.substr(4);
    const auto tab = path.find('\t');
    if (tab != std::string::npos) {
        path.erase(tab);
    }
    if (path.size() >= 2 && path.front() == '"' && path.back() == '"') {
        path = path.substr(1, path.size() - 2);
    }
    return path;
}

// "diff -ruN old/x new/x" opens a file in recursive diff output when a
// file header or binary marker follows it
bool isPlainDiffCommand(const std::vector<std::string>& lines, size_t i) {
    if (!startsWith(lines[i], "diff ") || i + 1 >= lines.size()) {
        return false;
    }
    return startsWith(lines[i + 1], "--- ") || HunkParser::isBinaryMarker(lines[i + 1]);
}

// Absent, null and non-string fields all read as missing
std::optional<std::string> stringField(const json& item, const char* key) {
    const auto it = item.find(key);
    if (it == item.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

void finalizePaths(FileDiffInput& input) {
    if (input.path.empty()) {
        input.path = input.oldPath;
    }
    if (input.oldPath.empty()) {
        input.oldPath = input.path;
    }
}

}

DiffReader::DiffReader(bool verbose)
    : verbose_(verbose) {
}

std::string DiffReader::stripPathPrefix(const std::string& path) {
    if (path.size() > 2 && (startsWith(path, "a/") || startsWith(path, "b/"))) {
        return path.substr(2);
    }
    return path;
}

std::vector<FileDiffInput> DiffReader::readUnifiedDiff(const std::string& text) const {
    std::vector<std::string> lines;
    {
        std::istringstream stream(text);
        std::string line;
        while (std::getline(stream, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            lines.push_back(line);
        }
    }

    std::vector<FileDiffInput> files;
    FileDiffInput current;
    bool open = false;
    bool sawHunk = false;
    int oldRemaining = 0;
    int newRemaining = 0;

    auto finish = [&]() {
        if (open) {
            finalizePaths(current);
            files.push_back(std::move(current));
        }
        current = FileDiffInput{};
        open = false;
        sawHunk = false;
        oldRemaining = 0;
        newRemaining = 0;
    };

    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string& line = lines[i];
        const bool inHunk = oldRemaining > 0 || newRemaining > 0;

        if (inHunk) {
            // Track the hunk body so "--- " inside it is never taken for a header
            const char marker = line.empty() ? ' ' : line[0];
            if (marker == ' ') {
                --oldRemaining;
                --newRemaining;
            } else if (marker == '+') {
                --newRemaining;
            } else if (marker == '-') {
                --oldRemaining;
            } else if (marker != '\\') {
                // Malformed body; let the parser report it
                oldRemaining = 0;
                newRemaining = 0;
            }
            oldRemaining = std::max(oldRemaining, 0);
            newRemaining = std::max(newRemaining, 0);
        } else {
            if (startsWith(line, "diff --git ")) {
                finish();
                open = true;
                const std::string paths = line.substr(11);
                const auto split = paths.rfind(" b/");
                if (split != std::string::npos) {
                    current.oldPath = stripPathPrefix(paths.substr(0, split));
                    current.path = paths.substr(split + 3);
                }
            } else if (isPlainDiffCommand(lines, i)) {
                finish();
                open = true;
                // The last two words are the compared paths
                std::istringstream words(line);
                std::vector<std::string> tokens;
                std::string word;
                while (words >> word) {
                    tokens.push_back(word);
                }
                if (tokens.size() >= 3) {
                    current.oldPath = stripPathPrefix(tokens[tokens.size() - 2]);
                    current.path = stripPathPrefix(tokens.back());
                }
            } else if (startsWith(line, "Only in ")) {
                // Recursive diff notes a file present on one side only
                continue;
            } else if (startsWith(line, "--- ") && i + 1 < lines.size() &&
                       startsWith(lines[i + 1], "+++ ") && (!open || sawHunk)) {
                // Plain "diff -u" output has no "diff --git" line
                finish();
                open = true;
            } else if (line == "-- " && open) {
                // format-patch signature trailer
                finish();
                continue;
            }

            if (startsWith(line, "--- ")) {
                const std::string path = headerPath(line);
                if (path == "/dev/null") {
                    current.editType = EditType::Added;
                } else {
                    current.oldPath = stripPathPrefix(path);
                }
            } else if (startsWith(line, "+++ ")) {
                const std::string path = headerPath(line);
                if (path == "/dev/null") {
                    current.editType = EditType::Deleted;
                } else {
                    current.path = stripPathPrefix(path);
                }
            } else if (startsWith(line, "rename from ")) {
                current.oldPath = line.substr(12);
                current.editType = EditType::Renamed;
            } else if (startsWith(line, "rename to ")) {
                current.path = line.substr(10);
                current.editType = EditType::Renamed;
            } else if (startsWith(line, "new file mode")) {
                current.editType = EditType::Added;
            } else if (startsWith(line, "deleted file mode")) {
                current.editType = EditType::Deleted;
            } else if (startsWith(line, "@@")) {
                sawHunk = true;
                if (auto header = HunkHeader::parse(line)) {
                    oldRemaining = header->oldCount;
                    newRemaining = header->newCount;
                }
            }
        }

        // Text before the first file (e.g. a commit message) is dropped
        if (open) {
            current.rawDiff += line;
            current.rawDiff += '\n';
        }
    }

    finish();

    // "+++ /dev/null" leaves only the old path
    for (auto& file : files) {
        if (file.editType == EditType::Deleted && file.path.empty()) {
            file.path = file.oldPath;
        }
    }

    if (verbose_) {
        std::cout << "Read " << files.size() << " file diffs" << std::endl;
    }

    return files;
}

std::vector<FileDiffInput> DiffReader::readJson(const std::string& text) const {
    std::vector<FileDiffInput> files;

    try {
        const json doc = json::parse(text);
        const json& list = (doc.is_object() && doc.contains("files")) ? doc.at("files") : doc;

        if (!list.is_array()) {
            throw std::runtime_error("Expected a JSON array of files");
        }

        for (const auto& item : list) {
            FileDiffInput input;
            input.path = item.at("filename").get<std::string>();
            input.oldPath = stringField(item, "previous_filename").value_or(input.path);
            input.editType = editTypeFromString(stringField(item, "status").value_or(""));
            input.rawDiff = stringField(item, "patch").value_or("");
            input.newFileText = stringField(item, "head_file");

            files.push_back(std::move(input));
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid diff JSON: ") + e.what());
    }

    if (verbose_) {
        std::cout << "Read " << files.size() << " file entries from JSON" << std::endl;
    }

    return files;
}

std::vector<FileDiffInput> DiffReader::readFile(const fs::path& path, bool isJson) const {
    std::string content;

    if (path == "-") {
        content = readStream(std::cin);
    } else {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            throw std::runtime_error("Failed to open diff file: " + path.string());
        }
        content = readStream(file);
    }

    return isJson ? readJson(content) : readUnifiedDiff(content);
}

void DiffReader::attachNewFileContents(std::vector<FileDiffInput>& files, const fs::path& repoRoot) const {
    for (auto& file : files) {
        if (file.newFileText || file.editType == EditType::Deleted) {
            continue;
        }

        const fs::path filePath = repoRoot / file.path;
        std::error_code ec;
        if (!fs::is_regular_file(filePath, ec)) {
            continue;
        }

        const auto size = fs::file_size(filePath, ec);
        if (ec || size > MAX_FILE_SIZE) {
            if (verbose_) {
                std::cout << "Skipping full content of " << file.path << " (too large or unreadable)" << std::endl;
            }
            continue;
        }

        std::ifstream in(filePath, std::ios::binary);
        if (!in) {
            std::cerr << "Warning: Could not read " << filePath << ", context will not be extended" << std::endl;
            continue;
        }
        file.newFileText = readStream(in);
    }
}

std::string DiffReader::readStream(std::istream& in) {
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}
