#include "diffpack.hpp"
#include "hunk_parser.hpp"
#include "context_extender.hpp"
#include "patch_formatter.hpp"
#include <algorithm>
#include <iostream>
#include <sstream>
#include <unordered_map>

using json = nlohmann::json;

namespace {

std::string lineKindToString(Line::Kind kind) {
    switch (kind) {
        case Line::Kind::Added:
            return "added";
        case Line::Kind::Removed:
            return "removed";
        default:
            return "context";
    }
}

json hunkToJson(const Hunk& hunk) {
    json lines = json::array();
    for (const auto& line : hunk.lines) {
        json entry = {
            {"kind", lineKindToString(line.kind)},
            {"text", line.text}
        };
        entry["old"] = line.oldNumber ? json(*line.oldNumber) : json(nullptr);
        entry["new"] = line.newNumber ? json(*line.newNumber) : json(nullptr);
        if (line.noNewlineAtEof) {
            entry["no_newline_at_eof"] = true;
        }
        lines.push_back(std::move(entry));
    }

    return json{
        {"old_start", hunk.oldStart},
        {"old_count", hunk.oldCount},
        {"new_start", hunk.newStart},
        {"new_count", hunk.newCount},
        {"section", hunk.section},
        {"lines", std::move(lines)}
    };
}

}

DiffPack::DiffPack(PipelineContext context, bool verbose)
    : context_(std::move(context)),
      filter_(context_.matcher, context_.allowedExtensions),
      planner_(Tokenizer(context_.model.encoding)),
      verbose_(verbose) {
}

std::string DiffPack::getTokenizerName() const {
    return planner_.tokenizer().getEncodingName();
}

std::vector<FilePatch> DiffPack::parseAndExtend(const std::vector<FileDiffInput>& files,
                                                std::vector<FileExclusion>& exclusions) const {
    std::vector<FilePatch> patches;
    patches.reserve(files.size());

    for (const auto& file : files) {
        ParseResult parsed = HunkParser::parseFile(file, context_.numbering);
        if (!parsed.ok()) {
            // Files are independent units of failure
            std::cerr << "Warning: Failed to parse diff of " << file.path << ": "
                      << parsed.error->message << std::endl;
            exclusions.push_back({file.path, FileExclusion::Reason::ParseError, parsed.error->toString()});
            continue;
        }

        if (parsed.patch.isBinary) {
            if (verbose_) {
                std::cout << "Skipping binary patch: " << file.path << std::endl;
            }
            exclusions.push_back({file.path, FileExclusion::Reason::Binary, "binary patch"});
            continue;
        }

        patches.push_back(ContextExtender::extend(parsed.patch, file.newFileText,
                                                  context_.extraLinesBefore,
                                                  context_.extraLinesAfter));
    }

    return patches;
}

PackResult DiffPack::run(const std::vector<FileDiffInput>& files) const {
    const auto startTime = std::chrono::steady_clock::now();

    PackResult result;
    result.inputFiles = files.size();

    FileFilter::Outcome filtered = filter_.filter(files);
    if (verbose_) {
        for (const auto& exclusion : filtered.excluded) {
            std::cout << "Excluded " << exclusion.path << " ("
                      << FileExclusion::reasonToString(exclusion.reason) << ": "
                      << exclusion.detail << ")" << std::endl;
        }
    }

    std::vector<FileExclusion> parseExclusions;
    std::vector<FilePatch> patches = parseAndExtend(filtered.admitted, parseExclusions);

    // Keep exclusions in input order
    std::unordered_map<std::string, size_t> position;
    for (size_t i = 0; i < files.size(); ++i) {
        position.emplace(files[i].path, i);
    }
    result.exclusions = std::move(filtered.excluded);
    result.exclusions.insert(result.exclusions.end(), parseExclusions.begin(), parseExclusions.end());
    std::stable_sort(result.exclusions.begin(), result.exclusions.end(),
                     [&](const FileExclusion& a, const FileExclusion& b) {
                         return position[a.path] < position[b.path];
                     });

    result.compression = planner_.plan(patches, context_.budget);
    result.prompt = PatchFormatter::formatAll(result.compression.patches);

    if (result.compression.wasCompressed) {
        if (verbose_) {
            std::cout << "Diff exceeds token budget of " << context_.budget.limit
                      << ", dropped " << result.compression.omittedHunks << " hunks and "
                      << result.compression.omittedFiles << " files" << std::endl;
        }

        const size_t used = result.compression.totalTokens;
        if (!result.compression.omittedPaths.empty() &&
            context_.budget.limit > used + OMITTED_LIST_MIN_TOKENS) {
            std::unordered_map<std::string, EditType> editTypes;
            for (const auto& patch : patches) {
                editTypes.emplace(patch.path, patch.editType);
            }

            std::vector<std::pair<std::string, EditType>> omitted;
            for (const auto& path : result.compression.omittedPaths) {
                omitted.emplace_back(path, editTypes[path]);
            }

            result.prompt += PatchFormatter::formatOmittedFiles(omitted, planner_.tokenizer(),
                                                                context_.budget.limit - used);
        }
    }

    result.tokenCount = planner_.tokenizer().countTokens(result.prompt);

    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime);

    return result;
}

std::string DiffPack::getSummary(const PackResult& result) const {
    std::unordered_map<int, size_t> excludedByReason;
    for (const auto& exclusion : result.exclusions) {
        ++excludedByReason[static_cast<int>(exclusion.reason)];
    }

    std::stringstream ss;
    ss << "Diff processing summary:" << std::endl;
    ss << "  Model: " << context_.model.modelId
       << (context_.model.known ? "" : " (unknown, using fallback context size)") << std::endl;
    ss << "  Token budget: " << context_.budget.limit << " (" << getTokenizerName() << ")" << std::endl;
    ss << "  Input files: " << result.inputFiles << std::endl;

    for (auto reason : {FileExclusion::Reason::Ignored, FileExclusion::Reason::NotAllowedExtension,
                        FileExclusion::Reason::Binary, FileExclusion::Reason::ParseError}) {
        const auto it = excludedByReason.find(static_cast<int>(reason));
        if (it != excludedByReason.end()) {
            ss << "  Excluded (" << FileExclusion::reasonToString(reason) << "): " << it->second << std::endl;
        }
    }

    ss << "  Included files: " << result.compression.patches.size() << std::endl;
    if (result.compression.wasCompressed) {
        ss << "  Truncated files: " << result.compression.truncatedPaths.size() << std::endl;
        ss << "  Omitted files: " << result.compression.omittedFiles << std::endl;
        ss << "  Omitted hunks: " << result.compression.omittedHunks << std::endl;
    }
    ss << "  Token count: " << result.tokenCount << std::endl;

    if (verbose_) {
        ss << "  Processing time: " << result.duration.count() << " ms" << std::endl;
    }

    if (result.nothingToProcess()) {
        ss << "  Nothing to process: no file content fits the request" << std::endl;
    }

    return ss.str();
}

json DiffPack::toJson(const PackResult& result) const {
    json files = json::array();
    for (const auto& patch : result.compression.patches) {
        json hunks = json::array();
        for (const auto& hunk : patch.hunks) {
            hunks.push_back(hunkToJson(hunk));
        }
        files.push_back({
            {"path", patch.path},
            {"old_path", patch.oldPath},
            {"edit_type", editTypeToString(patch.editType)},
            {"hunks", std::move(hunks)}
        });
    }

    json excluded = json::array();
    for (const auto& exclusion : result.exclusions) {
        excluded.push_back({
            {"path", exclusion.path},
            {"reason", FileExclusion::reasonToString(exclusion.reason)},
            {"detail", exclusion.detail}
        });
    }

    return json{
        {"model", context_.model.modelId},
        {"token_budget", context_.budget.limit},
        {"token_count", result.tokenCount},
        {"was_compressed", result.compression.wasCompressed},
        {"omitted_files", result.compression.omittedFiles},
        {"omitted_hunks", result.compression.omittedHunks},
        {"omitted_paths", result.compression.omittedPaths},
        {"truncated_paths", result.compression.truncatedPaths},
        {"nothing_to_process", result.nothingToProcess()},
        {"files", std::move(files)},
        {"excluded", std::move(excluded)},
        {"prompt", result.prompt}
    };
}
