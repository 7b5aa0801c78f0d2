#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <nlohmann/json.hpp>
#include "diff_types.hpp"
#include "config.hpp"
#include "file_filter.hpp"
#include "compression_planner.hpp"

enum class OutputFormat {
    Prompt,     // Serialized diff ready for prompt assembly
    Json        // Structured patch records
};

struct PackResult {
    CompressionResult compression;
    std::vector<FileExclusion> exclusions;  // Filtered out or failed to parse, in input order
    std::string prompt;                     // Serialized patches plus omitted-file listing
    size_t inputFiles = 0;
    size_t tokenCount = 0;                  // Estimated tokens of `prompt`
    std::chrono::milliseconds duration{0};

    // Nothing survived filtering, parsing or the budget. Reported, not fatal.
    bool nothingToProcess() const { return compression.patches.empty(); }
};

// Runs the whole pipeline for one request: filter, parse, extend, plan and
// serialize. run() is const and keeps no per-request state, so a single
// instance can serve concurrent requests.
class DiffPack {
public:
    explicit DiffPack(PipelineContext context, bool verbose = false);

    PackResult run(const std::vector<FileDiffInput>& files) const;

    // Get the summary of a processed request
    std::string getSummary(const PackResult& result) const;

    // Structured form of a result, for --format json
    nlohmann::json toJson(const PackResult& result) const;

    const PipelineContext& context() const { return context_; }

    // Tokenizer name used for the budget
    std::string getTokenizerName() const;

    // Minimum budget left before the omitted-file listing is attempted
    static constexpr size_t OMITTED_LIST_MIN_TOKENS = 10;

private:
    PipelineContext context_;
    FileFilter filter_;
    CompressionPlanner planner_;
    bool verbose_;

    std::vector<FilePatch> parseAndExtend(const std::vector<FileDiffInput>& files,
                                          std::vector<FileExclusion>& exclusions) const;
};
