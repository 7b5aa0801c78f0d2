#pragma once

#include <string>
#include <vector>
#include <memory>
#include <filesystem>
#include <nlohmann/json.hpp>
#include "diff_types.hpp"
#include "pattern_matcher.hpp"
#include "model_registry.hpp"
#include "compression_planner.hpp"

namespace fs = std::filesystem;

// User-facing settings. Layered as built-in defaults, then an optional JSON
// file, then command line flags.
struct DiffPackConfig {
    std::string model = "gpt-4o";                // Target model identifier
    size_t maxModelTokens = 32000;               // Context window assumed for unknown models
    size_t outputBufferTokens = 1500;            // Tokens reserved for the model's answer
    int patchExtraLinesBefore = 5;               // Context lines pulled in above each hunk
    int patchExtraLinesAfter = 1;                // Context lines pulled in below each hunk
    std::vector<std::string> ignoreGlobs;        // e.g. "*.lock", "dist/**"
    std::vector<std::string> ignoreRegexes;      // Searched anywhere in the path
    std::vector<std::string> allowedExtensions;  // Empty means every extension is allowed
    bool addLineNumbers = true;                  // Annotated (true) or plain (false) patches

    // Overlay the keys present in `j` onto `base`
    static DiffPackConfig fromJson(const nlohmann::json& j, const DiffPackConfig& base);
    static DiffPackConfig fromJson(const nlohmann::json& j);

    // Load a JSON config file on top of `base`
    static DiffPackConfig loadFile(const fs::path& path, const DiffPackConfig& base);
    static DiffPackConfig loadFile(const fs::path& path);

    nlohmann::json toJson() const;

    // Throws std::runtime_error on values the pipeline cannot use
    void validate() const;
};

// Defaults to the built-in settings as the base; defined here because a
// default argument cannot construct the class before it is complete
inline DiffPackConfig DiffPackConfig::fromJson(const nlohmann::json& j) {
    return fromJson(j, DiffPackConfig());
}

inline DiffPackConfig DiffPackConfig::loadFile(const fs::path& path) {
    return loadFile(path, DiffPackConfig());
}

// Immutable per-request context passed explicitly through every pipeline
// stage. Patterns are compiled and the model resolved exactly once, here.
struct PipelineContext {
    int extraLinesBefore = 0;
    int extraLinesAfter = 0;
    NumberingMode numbering = NumberingMode::Annotated;
    std::shared_ptr<const PatternMatcher> matcher;
    std::vector<std::string> allowedExtensions;
    ModelDescriptor model;
    TokenBudget budget;

    static PipelineContext fromConfig(const DiffPackConfig& config);
};
