#include "context_extender.hpp"
#include <algorithm>
#include <climits>
#include <sstream>

std::vector<Hunk> ContextExtender::extend(const std::vector<Hunk>& hunks,
                                          const std::optional<std::string>& fullNewFileText,
                                          int before,
                                          int after) {
    before = std::max(before, 0);
    after = std::max(after, 0);
    if (!fullNewFileText || hunks.empty() || (before == 0 && after == 0)) {
        return hunks;
    }

    const std::vector<std::string> fileLines = splitLines(*fullNewFileText);
    const int fileLength = static_cast<int>(fileLines.size());

    std::vector<Hunk> extended;
    extended.reserve(hunks.size());

    for (size_t i = 0; i < hunks.size(); ++i) {
        const Hunk& hunk = hunks[i];
        const int oldFirst = firstOld(hunk);
        const int newFirst = firstNew(hunk);
        const int oldEnd = oldFirst + hunk.oldCount;
        const int newEnd = newFirst + hunk.newCount;

        // Never reach back into the previous hunk or before line 1
        int oldFloor = 1;
        int newFloor = 1;
        if (i > 0) {
            const Hunk& previous = hunks[i - 1];
            oldFloor = std::max(1, firstOld(previous) + previous.oldCount);
            newFloor = std::max(1, firstNew(previous) + previous.newCount);
        }

        int leading = std::min({before, oldFirst - oldFloor, newFirst - newFloor});
        if (leading < 0 || newFirst - 1 > fileLength) {
            leading = 0;
        }

        // Nor past the end of the file or into the next hunk
        int oldCeiling = INT_MAX;
        int newCeiling = fileLength + 1;
        if (i + 1 < hunks.size()) {
            const Hunk& next = hunks[i + 1];
            oldCeiling = firstOld(next);
            newCeiling = std::min(newCeiling, firstNew(next));
        }

        const int trailing = std::max(0, std::min({after, oldCeiling - oldEnd, newCeiling - newEnd}));

        Hunk result;
        result.oldStart = hunk.oldStart;
        result.newStart = hunk.newStart;
        result.section = hunk.section;
        result.lines.reserve(hunk.lines.size() + static_cast<size_t>(leading + trailing));

        for (int k = leading; k > 0; --k) {
            const int newNumber = newFirst - k;
            result.lines.push_back(Line::context(oldFirst - k, newNumber, fileLines[newNumber - 1]));
        }
        result.lines.insert(result.lines.end(), hunk.lines.begin(), hunk.lines.end());
        for (int k = 0; k < trailing; ++k) {
            const int newNumber = newEnd + k;
            result.lines.push_back(Line::context(oldEnd + k, newNumber, fileLines[newNumber - 1]));
        }

        recomputeCounts(result);
        extended.push_back(std::move(result));
    }

    return mergeHunks(extended);
}

FilePatch ContextExtender::extend(const FilePatch& patch,
                                  const std::optional<std::string>& fullNewFileText,
                                  int before,
                                  int after) {
    FilePatch result = patch;
    result.hunks = extend(patch.hunks, fullNewFileText, before, after);
    return result;
}

ContextExtender::LineRange ContextExtender::window(const Hunk& hunk, size_t fileLength, int before, int after) {
    const long long length = static_cast<long long>(fileLength);
    const long long first = firstNew(hunk) - 1;
    const long long last = first + hunk.newCount;

    LineRange range;
    range.begin = static_cast<size_t>(std::clamp(first - std::max(before, 0), 0LL, length));
    range.end = static_cast<size_t>(std::clamp(last + std::max(after, 0), 0LL, length));
    if (range.end < range.begin) {
        range.end = range.begin;
    }
    return range;
}

std::vector<Hunk> ContextExtender::mergeHunks(const std::vector<Hunk>& hunks) {
    std::vector<Hunk> merged;
    merged.reserve(hunks.size());

    for (const auto& hunk : hunks) {
        if (!merged.empty()) {
            Hunk& last = merged.back();
            const int lastOldEnd = firstOld(last) + last.oldCount;
            const int lastNewEnd = firstNew(last) + last.newCount;

            if (firstOld(hunk) <= lastOldEnd && firstNew(hunk) <= lastNewEnd) {
                for (const auto& line : hunk.lines) {
                    const bool alreadyEmitted =
                        (line.oldNumber && *line.oldNumber < lastOldEnd) ||
                        (line.newNumber && *line.newNumber < lastNewEnd);
                    if (!alreadyEmitted) {
                        last.lines.push_back(line);
                    }
                }
                recomputeCounts(last);
                continue;
            }
        }
        merged.push_back(hunk);
    }

    return merged;
}

std::vector<std::string> ContextExtender::splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

void ContextExtender::recomputeCounts(Hunk& hunk) {
    int oldCount = 0;
    int newCount = 0;
    std::optional<int> oldStart;
    std::optional<int> newStart;

    for (const auto& line : hunk.lines) {
        if (line.oldNumber) {
            if (!oldStart) {
                oldStart = *line.oldNumber;
            }
            ++oldCount;
        }
        if (line.newNumber) {
            if (!newStart) {
                newStart = *line.newNumber;
            }
            ++newCount;
        }
    }

    // A side with no lines keeps its "line before the change" start
    if (oldStart) {
        hunk.oldStart = *oldStart;
    }
    if (newStart) {
        hunk.newStart = *newStart;
    }
    hunk.oldCount = oldCount;
    hunk.newCount = newCount;
}
