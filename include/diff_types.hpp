#pragma once

#include <string>
#include <vector>
#include <optional>

// How a file was changed in the pull request
enum class EditType {
    Added,
    Deleted,
    Modified,
    Renamed,
    Unknown
};

// Whether serialized hunks carry new-file line numbers
enum class NumberingMode {
    Annotated,  // Prefix new-side lines with their line number (review style)
    Plain       // Emit a clean unified patch (suggestion style)
};

struct Line {
    enum class Kind {
        Context,
        Added,
        Removed
    };

    Kind kind = Kind::Context;
    std::optional<int> oldNumber;   // Set for Context and Removed lines
    std::optional<int> newNumber;   // Set for Context and Added lines
    std::string text;               // Line content without the leading marker
    bool noNewlineAtEof = false;    // Followed by "\ No newline at end of file"

    static Line context(int oldNumber, int newNumber, const std::string& text) {
        return Line{Kind::Context, oldNumber, newNumber, text, false};
    }

    static Line added(int newNumber, const std::string& text) {
        return Line{Kind::Added, std::nullopt, newNumber, text, false};
    }

    static Line removed(int oldNumber, const std::string& text) {
        return Line{Kind::Removed, oldNumber, std::nullopt, text, false};
    }

    char marker() const {
        switch (kind) {
            case Kind::Added:
                return '+';
            case Kind::Removed:
                return '-';
            default:
                return ' ';
        }
    }

    bool operator==(const Line& other) const {
        return kind == other.kind && oldNumber == other.oldNumber &&
               newNumber == other.newNumber && text == other.text &&
               noNewlineAtEof == other.noNewlineAtEof;
    }
    bool operator!=(const Line& other) const { return !(*this == other); }
};

struct Hunk {
    int oldStart = 0;
    int oldCount = 0;
    int newStart = 0;
    int newCount = 0;
    std::string section;        // Text after the closing "@@", usually the enclosing function
    std::vector<Line> lines;

    // One past the last old/new line covered by this hunk
    int oldEnd() const { return oldStart + oldCount; }
    int newEnd() const { return newStart + newCount; }

    bool hasRemovals() const;
    bool hasAdditions() const;

    bool operator==(const Hunk& other) const {
        return oldStart == other.oldStart && oldCount == other.oldCount &&
               newStart == other.newStart && newCount == other.newCount &&
               section == other.section && lines == other.lines;
    }
    bool operator!=(const Hunk& other) const { return !(*this == other); }
};

struct FilePatch {
    std::string path;
    std::string oldPath;        // Differs from path for renames
    EditType editType = EditType::Modified;
    std::vector<Hunk> hunks;
    bool isBinary = false;
    NumberingMode numbering = NumberingMode::Annotated;

    size_t lineCount() const;

    // Map a new-file line number back to the line record that carries it.
    // Used when placing inline comments on lines the model referenced.
    std::optional<Line> findByNewLine(int newNumber) const;

    // Copy of this patch keeping only the first `count` hunks
    FilePatch withFirstHunks(size_t count) const;

    bool operator==(const FilePatch& other) const {
        return path == other.path && oldPath == other.oldPath &&
               editType == other.editType && hunks == other.hunks &&
               isBinary == other.isBinary && numbering == other.numbering;
    }
    bool operator!=(const FilePatch& other) const { return !(*this == other); }
};

// One file as delivered by the diff provider
struct FileDiffInput {
    std::string path;
    std::string oldPath;
    EditType editType = EditType::Unknown;
    std::string rawDiff;                        // Unified diff text for this file only
    std::optional<std::string> newFileText;     // Full post-change content when available
};

std::string editTypeToString(EditType type);
EditType editTypeFromString(const std::string& name);
