#include "patch_formatter.hpp"
#include <sstream>

namespace {

const char* const NO_NEWLINE_MARKER = "\\ No newline at end of file";

// Budget left unspent before another omitted-file list is attempted
constexpr size_t LIST_DELTA_TOKENS = 10;

}

std::string PatchFormatter::format(const FilePatch& patch) {
    return format(patch, patch.numbering);
}

std::string PatchFormatter::format(const FilePatch& patch, NumberingMode mode) {
    if (patch.editType == EditType::Deleted) {
        return "## File '" + patch.path + "' was deleted\n";
    }
    return mode == NumberingMode::Annotated ? formatAnnotated(patch) : formatPlain(patch);
}

std::string PatchFormatter::formatAll(const std::vector<FilePatch>& patches) {
    std::string result;
    for (const auto& patch : patches) {
        result += format(patch);
    }
    return result;
}

std::string PatchFormatter::formatHunkHeader(const Hunk& hunk) {
    std::ostringstream ss;
    ss << "@@ -" << hunk.oldStart << "," << hunk.oldCount
       << " +" << hunk.newStart << "," << hunk.newCount << " @@";
    if (!hunk.section.empty()) {
        ss << " " << hunk.section;
    }
    return ss.str();
}

std::string PatchFormatter::formatHunks(const std::vector<Hunk>& hunks) {
    std::ostringstream ss;
    for (const auto& hunk : hunks) {
        ss << formatHunkHeader(hunk) << "\n";
        for (const auto& line : hunk.lines) {
            ss << line.marker() << line.text << "\n";
            if (line.noNewlineAtEof) {
                ss << NO_NEWLINE_MARKER << "\n";
            }
        }
    }
    return ss.str();
}

std::string PatchFormatter::formatAnnotated(const FilePatch& patch) {
    std::ostringstream ss;
    ss << "## File: '" << patch.path << "'\n";

    if (patch.hunks.empty()) {
        ss << "\n(empty patch)\n";
        return ss.str();
    }

    for (const auto& hunk : patch.hunks) {
        const bool hasPlus = hunk.hasAdditions();
        const bool hasMinus = hunk.hasRemovals();

        if (!hunk.section.empty()) {
            ss << "\n@@ " << hunk.section;
        }

        // New side: context and added lines, each prefixed with its new line number
        if (hasPlus || !hasMinus) {
            ss << "\n__new hunk__\n";
            for (const auto& line : hunk.lines) {
                if (line.kind == Line::Kind::Removed) {
                    continue;
                }
                ss << *line.newNumber << " " << line.marker() << line.text << "\n";
            }
        }

        // Old side only when something was removed
        if (hasMinus) {
            ss << "\n__old hunk__\n";
            for (const auto& line : hunk.lines) {
                if (line.kind == Line::Kind::Added) {
                    continue;
                }
                ss << line.marker() << line.text << "\n";
            }
        }
    }

    return ss.str();
}

std::string PatchFormatter::formatPlain(const FilePatch& patch) {
    std::ostringstream ss;
    ss << "\n\n## File: '" << patch.path << "'\n\n";
    ss << formatHunks(patch.hunks);
    return ss.str();
}

std::string PatchFormatter::formatOmittedFiles(const std::vector<std::pair<std::string, EditType>>& omitted,
                                               const Tokenizer& tokenizer,
                                               size_t budget) {
    std::vector<std::string> added;
    std::vector<std::string> modified;
    std::vector<std::string> deleted;

    for (const auto& entry : omitted) {
        switch (entry.second) {
            case EditType::Added:
                added.push_back(entry.first);
                break;
            case EditType::Deleted:
                deleted.push_back(entry.first);
                break;
            default:
                modified.push_back(entry.first);
                break;
        }
    }

    std::string result;
    size_t remaining = budget;

    auto appendList = [&](const std::string& label, const std::vector<std::string>& files) {
        if (files.empty() || remaining < LIST_DELTA_TOKENS) {
            return;
        }

        std::ostringstream ss;
        ss << "\n\n### Additional " << label << " files (not included in diff):";
        for (const auto& file : files) {
            ss << "\n- " << file;
        }

        const std::string clipped = tokenizer.clip(ss.str(), remaining);
        if (!clipped.empty()) {
            const size_t tokens = tokenizer.countTokens(clipped) + 2;
            result += clipped;
            remaining = tokens >= remaining ? 0 : remaining - tokens;
        }
    };

    appendList("added", added);
    appendList("modified", modified);
    appendList("deleted", deleted);

    return result;
}
