#include "file_filter.hpp"
#include <algorithm>
#include <cctype>

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

FileExclusion::Reason exclusionReasonFor(FilterDecision::Reason reason) {
    switch (reason) {
        case FilterDecision::Reason::NotAllowedExtension:
            return FileExclusion::Reason::NotAllowedExtension;
        case FilterDecision::Reason::Binary:
            return FileExclusion::Reason::Binary;
        default:
            return FileExclusion::Reason::Ignored;
    }
}

}

std::string FilterDecision::reasonToString(Reason reason) {
    switch (reason) {
        case Reason::Included:
            return "included";
        case Reason::Ignored:
            return "ignored";
        case Reason::NotAllowedExtension:
            return "extension not allowed";
        case Reason::Binary:
            return "binary";
        default:
            return "unknown";
    }
}

std::string FileExclusion::reasonToString(Reason reason) {
    switch (reason) {
        case Reason::Ignored:
            return "ignored";
        case Reason::NotAllowedExtension:
            return "extension not allowed";
        case Reason::Binary:
            return "binary";
        case Reason::ParseError:
            return "parse error";
        default:
            return "unknown";
    }
}

FileFilter::FileFilter(std::shared_ptr<const PatternMatcher> matcher,
                       std::vector<std::string> allowedExtensions)
    : matcher_(std::move(matcher)) {
    if (!matcher_) {
        matcher_ = std::make_shared<const PatternMatcher>();
    }

    // Accept ".py", "py" and "PY" alike
    for (auto& ext : allowedExtensions) {
        if (!ext.empty() && ext[0] == '.') {
            ext.erase(0, 1);
        }
        if (!ext.empty()) {
            allowedExtensions_.insert(toLower(ext));
        }
    }
}

FilterDecision FileFilter::decide(const std::string& path, const std::string& sampledContent) const {
    FilterDecision decision;

    if (auto pattern = matcher_->matchingPattern(path)) {
        decision.included = false;
        decision.reason = FilterDecision::Reason::Ignored;
        decision.detail = *pattern;
        return decision;
    }

    const std::string ext = extensionOf(path);
    if (!allowedExtensions_.empty() && allowedExtensions_.count(ext) == 0) {
        decision.included = false;
        decision.reason = FilterDecision::Reason::NotAllowedExtension;
        decision.detail = ext.empty() ? "(none)" : ext;
        return decision;
    }

    if (hasBinaryExtension(path)) {
        decision.included = false;
        decision.reason = FilterDecision::Reason::Binary;
        decision.detail = ext;
        return decision;
    }

    if (looksBinary(sampledContent)) {
        decision.included = false;
        decision.reason = FilterDecision::Reason::Binary;
        decision.detail = "NUL byte in content";
        return decision;
    }

    return decision;
}

FileFilter::Outcome FileFilter::filter(const std::vector<FileDiffInput>& files) const {
    Outcome outcome;
    outcome.admitted.reserve(files.size());

    for (const auto& file : files) {
        const std::string& sample = file.newFileText ? *file.newFileText : file.rawDiff;
        FilterDecision decision = decide(file.path, sample);
        if (decision.included) {
            outcome.admitted.push_back(file);
        } else {
            outcome.excluded.push_back({file.path, exclusionReasonFor(decision.reason), decision.detail});
        }
    }

    return outcome;
}

std::string FileFilter::extensionOf(const std::string& path) {
    const auto slash = path.find_last_of('/');
    const std::string filename = slash == std::string::npos ? path : path.substr(slash + 1);
    const auto dot = filename.find_last_of('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == filename.size()) {
        return "";
    }
    return toLower(filename.substr(dot + 1));
}

bool FileFilter::hasBinaryExtension(const std::string& path) {
    // Common binary file extensions
    static const std::unordered_set<std::string> binaryExtensions = {
        "png", "jpg", "jpeg", "gif", "bmp", "ico", "svg", "webp", "tiff", "tif",
        "mp3", "mp4", "wav", "avi", "mov", "mkv", "flac", "ogg", "webm",
        "zip", "tar", "gz", "bz2", "xz", "7z", "rar",
        "pdf", "doc", "docx", "xls", "xlsx", "ppt", "pptx",
        "exe", "dll", "so", "dylib", "bin", "obj", "o", "a", "lib",
        "woff", "woff2", "ttf", "eot", "otf",
        "pyc", "pyo", "class", "jar", "sqlite", "db", "dat"
    };

    return binaryExtensions.count(extensionOf(path)) > 0;
}

bool FileFilter::looksBinary(const std::string& content) {
    const size_t sampleSize = std::min(content.size(), BINARY_SAMPLE_SIZE);
    return content.find('\0') < sampleSize;
}
