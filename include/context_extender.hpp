#pragma once

#include <string>
#include <vector>
#include <optional>
#include "diff_types.hpp"

// Widens hunks with surrounding lines of the post-change file and merges
// hunks that end up touching or overlapping.
class ContextExtender {
public:
    // 0-based half-open range of lines requested from the backing file
    struct LineRange {
        size_t begin = 0;
        size_t end = 0;

        size_t size() const { return end > begin ? end - begin : 0; }
    };

    // Best effort: without the full new-file text the hunks come back unchanged
    static std::vector<Hunk> extend(const std::vector<Hunk>& hunks,
                                    const std::optional<std::string>& fullNewFileText,
                                    int before,
                                    int after);

    // Same as extend() for a whole patch
    static FilePatch extend(const FilePatch& patch,
                            const std::optional<std::string>& fullNewFileText,
                            int before,
                            int after);

    // Range of the new file a single hunk would cover once extended,
    // clamped to [0, fileLength)
    static LineRange window(const Hunk& hunk, size_t fileLength, int before, int after);

    // Merge adjacent or overlapping hunks, dropping lines already emitted
    static std::vector<Hunk> mergeHunks(const std::vector<Hunk>& hunks);

    static std::vector<std::string> splitLines(const std::string& text);

private:
    // First line a hunk occupies; a zero-count side points at the line before the change
    static int firstOld(const Hunk& hunk) { return hunk.oldCount > 0 ? hunk.oldStart : hunk.oldStart + 1; }
    static int firstNew(const Hunk& hunk) { return hunk.newCount > 0 ? hunk.newStart : hunk.newStart + 1; }

    static void recomputeCounts(Hunk& hunk);
};
