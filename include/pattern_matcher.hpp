#pragma once

#include <string>
#include <vector>
#include <optional>
#include <regex>

// Compiled set of ignore patterns. Built once when configuration loads and
// shared read-only by every pipeline invocation afterwards.
class PatternMatcher {
public:
    PatternMatcher() = default;

    // Constructor with glob and regex ignore patterns
    PatternMatcher(const std::vector<std::string>& ignoreGlobs,
                   const std::vector<std::string>& ignoreRegexes = {});

    // Add a glob ignore pattern (e.g. "*.lock", "vendor/**"); returns false
    // and records the pattern as invalid when it does not compile
    bool addIgnorePattern(const std::string& pattern);

    // Add a regex ignore pattern; returns false and records the pattern
    // as invalid when it does not compile
    bool addIgnoreRegex(const std::string& pattern);

    // Add glob ignore patterns from a comma-separated string (e.g. "*.lock,dist/**")
    void setExcludePatterns(const std::string& patternsStr);

    // Check if a path matches any ignore pattern
    bool isIgnored(const std::string& path) const;

    // The first pattern (glob or regex) that matches the path, if any
    std::optional<std::string> matchingPattern(const std::string& path) const;

    bool empty() const { return ignorePatterns_.empty() && regexPatterns_.empty(); }

    // Glob and regex patterns that failed to compile
    const std::vector<std::string>& invalidPatterns() const { return invalidPatterns_; }

    // Split a comma-separated list, trimming whitespace and dropping empty entries
    static std::vector<std::string> splitPatternString(const std::string& patternsStr);

    // Convert a glob into an anchored regex string
    static std::string globToRegex(const std::string& glob);

private:
    std::vector<std::string> ignorePatterns_;
    std::vector<std::regex> ignoreRegexes_;
    std::vector<bool> matchFileName_;       // Glob has no '/', also try it against the file name
    std::vector<std::string> regexPatterns_;
    std::vector<std::regex> compiledRegexes_;
    std::vector<std::string> invalidPatterns_;
};
