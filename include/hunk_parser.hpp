#pragma once

#include <string>
#include <vector>
#include <optional>
#include "diff_types.hpp"

struct ParseError {
    std::string path;
    size_t lineNumber = 0;      // 1-based line within the file's diff text
    std::string message;

    std::string toString() const;
};

struct ParseResult {
    FilePatch patch;                    // Hunks are only meaningful when ok()
    std::optional<ParseError> error;

    bool ok() const { return !error.has_value(); }
};

// Parsed "@@ -a,b +c,d @@ section" header
struct HunkHeader {
    int oldStart = 0;
    int oldCount = 1;
    int newStart = 0;
    int newCount = 1;
    std::string section;

    // Returns nullopt when the line does not follow the hunk header grammar
    static std::optional<HunkHeader> parse(const std::string& line);
};

// Turns one file's unified diff into hunks with old/new line numbers.
// Failures are returned as values scoped to that file; nothing throws.
class HunkParser {
public:
    // `numbering` is stored on the resulting patch and decides how the
    // patch is later serialized for the model
    static ParseResult parse(const std::string& rawDiff,
                             const std::string& oldPath,
                             const std::string& newPath,
                             NumberingMode numbering = NumberingMode::Annotated);

    // Parse a provider record, carrying over its edit type
    static ParseResult parseFile(const FileDiffInput& input,
                                 NumberingMode numbering = NumberingMode::Annotated);

    // "Binary files ... differ" or "GIT binary patch"
    static bool isBinaryMarker(const std::string& line);

private:
    static bool isFileHeaderLine(const std::string& line);
};
