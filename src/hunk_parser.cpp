#include "hunk_parser.hpp"
#include <climits>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace {

// Header-derived edit type, before any provider hint is applied
EditType inferEditType(const FilePatch& patch, EditType fromHeaders) {
    if (fromHeaders != EditType::Unknown) {
        return fromHeaders;
    }
    if (!patch.oldPath.empty() && patch.oldPath != patch.path) {
        return EditType::Renamed;
    }
    if (patch.hunks.empty()) {
        return EditType::Modified;
    }

    bool allAdded = true;
    bool allDeleted = true;
    for (const auto& hunk : patch.hunks) {
        allAdded = allAdded && hunk.oldStart == 0 && hunk.oldCount == 0;
        allDeleted = allDeleted && hunk.newStart == 0 && hunk.newCount == 0;
    }
    if (allAdded) {
        return EditType::Added;
    }
    if (allDeleted) {
        return EditType::Deleted;
    }
    return EditType::Modified;
}

bool startsWith(const std::string& line, const char* prefix) {
    return line.rfind(prefix, 0) == 0;
}

}

std::string ParseError::toString() const {
    std::ostringstream ss;
    ss << path << ":" << lineNumber << ": " << message;
    return ss.str();
}

std::optional<HunkHeader> HunkHeader::parse(const std::string& line) {
    static const std::regex headerRegex(R"(^@@ -(\d+)(?:,(\d+))? \+(\d+)(?:,(\d+))? @@ ?(.*)$)");

    std::smatch match;
    if (!std::regex_match(line, match, headerRegex)) {
        return std::nullopt;
    }

    HunkHeader header;
    try {
        header.oldStart = std::stoi(match[1].str());
        header.oldCount = match[2].matched ? std::stoi(match[2].str()) : 1;
        header.newStart = std::stoi(match[3].str());
        header.newCount = match[4].matched ? std::stoi(match[4].str()) : 1;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
    // Line counters run up to start + count and must stay in range
    if (header.oldCount > INT_MAX - header.oldStart || header.newCount > INT_MAX - header.newStart) {
        return std::nullopt;
    }
    header.section = match[5].str();
    return header;
}

ParseResult HunkParser::parse(const std::string& rawDiff,
                              const std::string& oldPath,
                              const std::string& newPath,
                              NumberingMode numbering) {
    ParseResult result;
    FilePatch& patch = result.patch;
    patch.path = newPath;
    patch.oldPath = oldPath.empty() ? newPath : oldPath;
    patch.numbering = numbering;

    EditType headerEditType = EditType::Unknown;

    auto fail = [&](size_t lineNumber, const std::string& message) {
        result.error = ParseError{newPath, lineNumber, message};
        patch.hunks.clear();
        return result;
    };

    std::istringstream stream(rawDiff);
    std::string line;
    size_t lineNumber = 0;

    bool inHunk = false;
    Hunk current;
    int oldLine = 0;
    int newLine = 0;
    int oldRemaining = 0;
    int newRemaining = 0;

    while (std::getline(stream, line)) {
        ++lineNumber;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (startsWith(line, "@@")) {
            if (inHunk) {
                return fail(lineNumber, "hunk ended early: " + std::to_string(oldRemaining) +
                            " old and " + std::to_string(newRemaining) + " new lines missing");
            }

            auto header = HunkHeader::parse(line);
            if (!header) {
                return fail(lineNumber, "malformed hunk header: " + line);
            }

            if (!patch.hunks.empty()) {
                const Hunk& previous = patch.hunks.back();
                if (header->oldStart < previous.oldStart ||
                    (previous.oldCount > 0 && header->oldStart < previous.oldEnd())) {
                    return fail(lineNumber, "hunk out of order or overlapping previous hunk");
                }
            }

            current = Hunk{};
            current.oldStart = header->oldStart;
            current.oldCount = header->oldCount;
            current.newStart = header->newStart;
            current.newCount = header->newCount;
            current.section = header->section;

            // Counters are seeded from the header's start values
            oldLine = header->oldStart;
            newLine = header->newStart;
            oldRemaining = header->oldCount;
            newRemaining = header->newCount;

            if (oldRemaining == 0 && newRemaining == 0) {
                patch.hunks.push_back(current);
            } else {
                inHunk = true;
            }
            continue;
        }

        if (!inHunk) {
            if (patch.isBinary) {
                continue;
            }
            if (patch.hunks.empty() && isFileHeaderLine(line)) {
                if (startsWith(line, "new file mode")) {
                    headerEditType = EditType::Added;
                } else if (startsWith(line, "deleted file mode")) {
                    headerEditType = EditType::Deleted;
                } else if (startsWith(line, "rename from") || startsWith(line, "copy from")) {
                    headerEditType = EditType::Renamed;
                }
                continue;
            }
            if (isBinaryMarker(line)) {
                patch.isBinary = true;
                continue;
            }
            if (line.empty()) {
                continue;
            }
            if (line[0] == '\\' && !patch.hunks.empty() && !patch.hunks.back().lines.empty()) {
                patch.hunks.back().lines.back().noNewlineAtEof = true;
                continue;
            }
            if (patch.hunks.empty()) {
                return fail(lineNumber, "content outside of any hunk: " + line);
            }
            return fail(lineNumber, "hunk body longer than its header counts");
        }

        // Some tools strip the single space from blank context lines
        const char marker = line.empty() ? ' ' : line[0];
        const std::string text = line.empty() ? std::string() : line.substr(1);

        switch (marker) {
            case ' ':
                if (oldRemaining == 0 || newRemaining == 0) {
                    return fail(lineNumber, "context line exceeds hunk header counts");
                }
                current.lines.push_back(Line::context(oldLine++, newLine++, text));
                --oldRemaining;
                --newRemaining;
                break;
            case '+':
                if (newRemaining == 0) {
                    return fail(lineNumber, "added line exceeds hunk header counts");
                }
                current.lines.push_back(Line::added(newLine++, text));
                --newRemaining;
                break;
            case '-':
                if (oldRemaining == 0) {
                    return fail(lineNumber, "removed line exceeds hunk header counts");
                }
                current.lines.push_back(Line::removed(oldLine++, text));
                --oldRemaining;
                break;
            case '\\':
                // "\ No newline at end of file" does not consume a line number
                if (current.lines.empty()) {
                    return fail(lineNumber, "no-newline marker before any hunk line");
                }
                current.lines.back().noNewlineAtEof = true;
                break;
            default:
                return fail(lineNumber, std::string("unrecognized line marker '") + marker + "'");
        }

        if (oldRemaining == 0 && newRemaining == 0) {
            patch.hunks.push_back(std::move(current));
            current = Hunk{};
            inHunk = false;
        }
    }

    if (inHunk) {
        return fail(lineNumber, "unexpected end of diff inside a hunk");
    }

    patch.editType = inferEditType(patch, headerEditType);
    return result;
}

ParseResult HunkParser::parseFile(const FileDiffInput& input, NumberingMode numbering) {
    ParseResult result = parse(input.rawDiff, input.oldPath, input.path, numbering);
    if (result.ok() && input.editType != EditType::Unknown) {
        result.patch.editType = input.editType;
    }
    return result;
}

bool HunkParser::isFileHeaderLine(const std::string& line) {
    static const char* const prefixes[] = {
        "diff ", "index ", "--- ", "+++ ", "new file mode", "deleted file mode",
        "old mode", "new mode", "similarity index", "dissimilarity index",
        "rename from", "rename to", "copy from", "copy to"
    };

    for (const char* prefix : prefixes) {
        if (startsWith(line, prefix)) {
            return true;
        }
    }
    return false;
}

bool HunkParser::isBinaryMarker(const std::string& line) {
    if (line == "GIT binary patch") {
        return true;
    }
    const std::string suffix = " differ";
    return startsWith(line, "Binary files ") && line.size() >= suffix.size() &&
           line.compare(line.size() - suffix.size(), suffix.size(), suffix) == 0;
}
