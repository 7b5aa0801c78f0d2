#include "diff_types.hpp"
#include <algorithm>
#include <cstddef>
#include <unordered_map>

bool Hunk::hasRemovals() const {
    return std::any_of(lines.begin(), lines.end(),
                       [](const Line& line) { return line.kind == Line::Kind::Removed; });
}

bool Hunk::hasAdditions() const {
    return std::any_of(lines.begin(), lines.end(),
                       [](const Line& line) { return line.kind == Line::Kind::Added; });
}

size_t FilePatch::lineCount() const {
    size_t count = 0;
    for (const auto& hunk : hunks) {
        count += hunk.lines.size();
    }
    return count;
}

std::optional<Line> FilePatch::findByNewLine(int newNumber) const {
    for (const auto& hunk : hunks) {
        if (newNumber < hunk.newStart || newNumber >= hunk.newEnd()) {
            continue;
        }
        for (const auto& line : hunk.lines) {
            if (line.newNumber && *line.newNumber == newNumber) {
                return line;
            }
        }
    }
    return std::nullopt;
}

FilePatch FilePatch::withFirstHunks(size_t count) const {
    FilePatch result;
    result.path = path;
    result.oldPath = oldPath;
    result.editType = editType;
    result.isBinary = isBinary;
    result.numbering = numbering;
    const size_t kept = std::min(count, hunks.size());
    result.hunks.assign(hunks.begin(), hunks.begin() + static_cast<std::ptrdiff_t>(kept));
    return result;
}

std::string editTypeToString(EditType type) {
    switch (type) {
        case EditType::Added:
            return "added";
        case EditType::Deleted:
            return "deleted";
        case EditType::Modified:
            return "modified";
        case EditType::Renamed:
            return "renamed";
        default:
            return "unknown";
    }
}

EditType editTypeFromString(const std::string& name) {
    // Accepts both our own names and the status strings hosting APIs return
    static const std::unordered_map<std::string, EditType> editTypeMap = {
        {"added", EditType::Added},
        {"new", EditType::Added},
        {"deleted", EditType::Deleted},
        {"removed", EditType::Deleted},
        {"modified", EditType::Modified},
        {"changed", EditType::Modified},
        {"renamed", EditType::Renamed},
        {"copied", EditType::Renamed}
    };

    auto it = editTypeMap.find(name);
    if (it != editTypeMap.end()) {
        return it->second;
    }
    return EditType::Unknown;
}
