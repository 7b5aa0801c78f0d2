#include "config.hpp"
#include <fstream>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

DiffPackConfig DiffPackConfig::fromJson(const json& j, const DiffPackConfig& base) {
    if (!j.is_object()) {
        throw std::runtime_error("Configuration must be a JSON object");
    }

    DiffPackConfig config = base;

    try {
        if (j.contains("model")) {
            config.model = j.at("model").get<std::string>();
        }
        if (j.contains("max_model_tokens")) {
            config.maxModelTokens = j.at("max_model_tokens").get<size_t>();
        }
        if (j.contains("output_buffer_tokens")) {
            config.outputBufferTokens = j.at("output_buffer_tokens").get<size_t>();
        }
        if (j.contains("patch_extra_lines_before")) {
            config.patchExtraLinesBefore = j.at("patch_extra_lines_before").get<int>();
        }
        if (j.contains("patch_extra_lines_after")) {
            config.patchExtraLinesAfter = j.at("patch_extra_lines_after").get<int>();
        }
        if (j.contains("ignore")) {
            const auto& ignore = j.at("ignore");
            if (ignore.contains("glob")) {
                config.ignoreGlobs = ignore.at("glob").get<std::vector<std::string>>();
            }
            if (ignore.contains("regex")) {
                config.ignoreRegexes = ignore.at("regex").get<std::vector<std::string>>();
            }
        }
        if (j.contains("allowed_extensions")) {
            config.allowedExtensions = j.at("allowed_extensions").get<std::vector<std::string>>();
        }
        if (j.contains("add_line_numbers")) {
            config.addLineNumbers = j.at("add_line_numbers").get<bool>();
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid configuration value: ") + e.what());
    }

    config.validate();
    return config;
}

DiffPackConfig DiffPackConfig::loadFile(const fs::path& path, const DiffPackConfig& base) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open config file: " + path.string());
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Error parsing config file " + path.string() + ": " + e.what());
    }

    return fromJson(j, base);
}

json DiffPackConfig::toJson() const {
    return json{
        {"model", model},
        {"max_model_tokens", maxModelTokens},
        {"output_buffer_tokens", outputBufferTokens},
        {"patch_extra_lines_before", patchExtraLinesBefore},
        {"patch_extra_lines_after", patchExtraLinesAfter},
        {"ignore", {{"glob", ignoreGlobs}, {"regex", ignoreRegexes}}},
        {"allowed_extensions", allowedExtensions},
        {"add_line_numbers", addLineNumbers}
    };
}

void DiffPackConfig::validate() const {
    if (patchExtraLinesBefore < 0 || patchExtraLinesAfter < 0) {
        throw std::runtime_error("patch_extra_lines_before/after must be non-negative");
    }
    if (model.empty()) {
        throw std::runtime_error("model must not be empty");
    }
}

PipelineContext PipelineContext::fromConfig(const DiffPackConfig& config) {
    config.validate();

    PipelineContext context;
    context.extraLinesBefore = config.patchExtraLinesBefore;
    context.extraLinesAfter = config.patchExtraLinesAfter;
    context.numbering = config.addLineNumbers ? NumberingMode::Annotated : NumberingMode::Plain;
    context.allowedExtensions = config.allowedExtensions;

    auto matcher = std::make_shared<PatternMatcher>(config.ignoreGlobs, config.ignoreRegexes);
    for (const auto& pattern : matcher->invalidPatterns()) {
        std::cerr << "Warning: Ignoring invalid pattern: " << pattern << std::endl;
    }
    context.matcher = std::move(matcher);

    context.model = ModelRegistry::resolve(config.model, config.maxModelTokens);
    context.budget.modelId = config.model;
    context.budget.limit = context.model.maxContext > config.outputBufferTokens
        ? context.model.maxContext - config.outputBufferTokens
        : 0;

    return context;
}
