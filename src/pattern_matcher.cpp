#include "pattern_matcher.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace {

std::string fileNameOf(const std::string& path) {
    const auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

}

PatternMatcher::PatternMatcher(const std::vector<std::string>& ignoreGlobs,
                               const std::vector<std::string>& ignoreRegexes) {
    for (const auto& pattern : ignoreGlobs) {
        addIgnorePattern(pattern);
    }
    for (const auto& pattern : ignoreRegexes) {
        addIgnoreRegex(pattern);
    }
}

bool PatternMatcher::addIgnorePattern(const std::string& pattern) {
    if (pattern.empty()) {
        return false;
    }
    try {
        // A bad character class such as "[z-a]" survives conversion
        std::regex compiled(globToRegex(pattern));
        ignorePatterns_.push_back(pattern);
        ignoreRegexes_.push_back(std::move(compiled));
        matchFileName_.push_back(pattern.find('/') == std::string::npos);
        return true;
    } catch (const std::regex_error&) {
        invalidPatterns_.push_back(pattern);
        return false;
    }
}

bool PatternMatcher::addIgnoreRegex(const std::string& pattern) {
    try {
        std::regex compiled(pattern);
        regexPatterns_.push_back(pattern);
        compiledRegexes_.push_back(std::move(compiled));
        return true;
    } catch (const std::regex_error&) {
        invalidPatterns_.push_back(pattern);
        return false;
    }
}

void PatternMatcher::setExcludePatterns(const std::string& patternsStr) {
    // Split comma-separated string and add each pattern as ignore pattern
    for (const auto& pattern : splitPatternString(patternsStr)) {
        addIgnorePattern(pattern);
    }
}

std::vector<std::string> PatternMatcher::splitPatternString(const std::string& patternsStr) {
    std::vector<std::string> patterns;
    std::stringstream ss(patternsStr);
    std::string pattern;

    while (std::getline(ss, pattern, ',')) {
        // Trim whitespace
        pattern.erase(pattern.begin(), std::find_if(pattern.begin(), pattern.end(),
            [](unsigned char ch) { return !std::isspace(ch); }));
        pattern.erase(std::find_if(pattern.rbegin(), pattern.rend(),
            [](unsigned char ch) { return !std::isspace(ch); }).base(), pattern.end());

        if (!pattern.empty()) {
            patterns.push_back(pattern);
        }
    }

    return patterns;
}

bool PatternMatcher::isIgnored(const std::string& path) const {
    return matchingPattern(path).has_value();
}

std::optional<std::string> PatternMatcher::matchingPattern(const std::string& path) const {
    const std::string filename = fileNameOf(path);

    for (size_t i = 0; i < ignorePatterns_.size(); ++i) {
        if (std::regex_match(path, ignoreRegexes_[i])) {
            return ignorePatterns_[i];
        }

        // "*.lock" should catch "deps/yarn.lock" as well as "yarn.lock"
        if (matchFileName_[i] && filename != path &&
            std::regex_match(filename, ignoreRegexes_[i])) {
            return ignorePatterns_[i];
        }
    }

    // Regex patterns are searched anywhere in the path
    for (size_t i = 0; i < regexPatterns_.size(); ++i) {
        if (std::regex_search(path, compiledRegexes_[i])) {
            return regexPatterns_[i];
        }
    }

    return std::nullopt;
}

std::string PatternMatcher::globToRegex(const std::string& pattern) {
    std::string regexStr = "^";

    for (size_t i = 0; i < pattern.size(); ++i) {
        const char c = pattern[i];

        if (c == '*') {
            if (i + 1 < pattern.size() && pattern[i + 1] == '*') {
                if (i + 2 < pattern.size() && pattern[i + 2] == '/') {
                    // **/ matches any directory depth, including none
                    regexStr += "(?:.*/)?";
                    i += 2;
                } else {
                    // Just ** matches anything
                    regexStr += ".*";
                    i++;
                }
            } else {
                // * matches any character except directory separator
                regexStr += "[^/]*";
            }
        } else if (c == '?') {
            // ? matches any single character except directory separator
            regexStr += "[^/]";
        } else if (c == '[') {
            const auto close = pattern.find(']', i + 1);
            if (close == std::string::npos) {
                regexStr += "\\[";
                continue;
            }
            regexStr += '[';
            size_t j = i + 1;
            if (j < close && (pattern[j] == '!' || pattern[j] == '^')) {
                regexStr += '^';
                ++j;
            }
            for (; j < close; ++j) {
                if (pattern[j] == '\\') {
                    regexStr += "\\\\";
                } else {
                    regexStr += pattern[j];
                }
            }
            regexStr += ']';
            i = close;
        } else if (c == '.' || c == '(' || c == ')' || c == ']' || c == '{' || c == '}' ||
                   c == '+' || c == '^' || c == '$' || c == '|' || c == '\\') {
            // Escape special regex characters
            regexStr += '\\';
            regexStr += c;
        } else {
            // Other characters match literally
            regexStr += c;
        }
    }

    regexStr += "$";
    return regexStr;
}
