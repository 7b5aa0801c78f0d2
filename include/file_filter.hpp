#pragma once

#include <string>
#include <vector>
#include <memory>
#include <unordered_set>
#include "diff_types.hpp"
#include "pattern_matcher.hpp"

struct FilterDecision {
    enum class Reason {
        Included,
        Ignored,                // Matched an ignore glob or regex
        NotAllowedExtension,    // Allow-list configured and extension absent
        Binary                  // NUL byte in the sample or known binary extension
    };

    bool included = true;
    Reason reason = Reason::Included;
    std::string detail;         // Matching pattern or extension, for reporting

    static std::string reasonToString(Reason reason);
};

// A file rejected before or during parsing
struct FileExclusion {
    enum class Reason {
        Ignored,
        NotAllowedExtension,
        Binary,
        ParseError
    };

    std::string path;
    Reason reason = Reason::Ignored;
    std::string detail;

    static std::string reasonToString(Reason reason);
};

// Admits or rejects a file's diff before any parsing work is spent on it.
// Holds only immutable state, so one instance may serve concurrent requests.
class FileFilter {
public:
    struct Outcome {
        std::vector<FileDiffInput> admitted;
        std::vector<FileExclusion> excluded;
    };

    explicit FileFilter(std::shared_ptr<const PatternMatcher> matcher,
                        std::vector<std::string> allowedExtensions = {});

    // Decide on one file. `sampledContent` may be any prefix of the file
    // content (or the diff text when the content is unknown).
    FilterDecision decide(const std::string& path, const std::string& sampledContent) const;

    // Apply decide() to every file, preserving order
    Outcome filter(const std::vector<FileDiffInput>& files) const;

    // Lower-cased extension without the dot; empty when the file has none
    static std::string extensionOf(const std::string& path);

    static bool hasBinaryExtension(const std::string& path);

    // NUL byte within the first BINARY_SAMPLE_SIZE bytes
    static bool looksBinary(const std::string& content);

    static constexpr size_t BINARY_SAMPLE_SIZE = 8000;

private:
    std::shared_ptr<const PatternMatcher> matcher_;
    std::unordered_set<std::string> allowedExtensions_;
};
