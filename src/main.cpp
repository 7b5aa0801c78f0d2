#include <iostream>
#include <fstream>
#include <CLI/CLI.hpp>
#include "diffpack.hpp"
#include "diff_reader.hpp"
#include "config.hpp"

int main(int argc, char** argv) {
    try {
        CLI::App app{"diffpack - Fit a pull request diff into a model's context window"};

        std::string inputPath;
        std::string outputPath;
        std::string configPath;
        std::string repoDir;
        std::string formatStr = "prompt";
        std::string model;
        size_t maxTokens = 0;
        int extraLinesBefore = 0;
        int extraLinesAfter = 0;
        std::string ignorePatterns;
        std::vector<std::string> ignoreRegexes;
        std::string allowedExtensions;
        bool jsonInput = false;
        bool noLineNumbers = false;
        bool verbose = false;

        // Required diff input
        app.add_option("-i,--input", inputPath, "Unified diff file, or - for standard input (required)")
            ->required();

        app.add_flag("--json", jsonInput, "Input is a JSON list of {filename, status, patch, head_file} objects");

        // Post-change checkout used to extend hunks with context
        app.add_option("--repo", repoDir, "Directory holding the post-change files")
            ->check(CLI::ExistingDirectory);

        // Optional output file
        app.add_option("-o,--output", outputPath, "Output file (default: standard output)");

        app.add_option("--config", configPath, "JSON configuration file")
            ->check(CLI::ExistingFile);

        app.add_option("-f,--format", formatStr, "Output format: prompt, json (default: prompt)")
            ->check(CLI::IsMember({"prompt", "json"}));

        // Overrides for configuration values
        auto modelOpt = app.add_option("--model", model, "Target model (default: gpt-4o)");
        auto maxTokensOpt = app.add_option("--max-tokens", maxTokens,
                                           "Context window assumed for unknown models (default: 32000)");
        auto beforeOpt = app.add_option("--extra-lines-before", extraLinesBefore,
                                        "Context lines added above each hunk (default: 5)")
            ->check(CLI::NonNegativeNumber);
        auto afterOpt = app.add_option("--extra-lines-after", extraLinesAfter,
                                       "Context lines added below each hunk (default: 1)")
            ->check(CLI::NonNegativeNumber);
        auto ignoreOpt = app.add_option("--ignore", ignorePatterns,
                                        "Comma-separated list of glob patterns for files to ignore (e.g. *.lock,dist/**)");
        auto ignoreRegexOpt = app.add_option("--ignore-regex", ignoreRegexes,
                                             "Regex for paths to ignore (repeatable)");
        auto allowExtOpt = app.add_option("--allow-ext", allowedExtensions,
                                          "Comma-separated list of extensions to keep (e.g. cpp,hpp)");
        app.add_flag("--no-line-numbers", noLineNumbers, "Emit plain patches without line numbers");

        // Optional verbose flag
        app.add_flag("-v,--verbose", verbose, "Enable verbose output");

        // Parse command line arguments
        CLI11_PARSE(app, argc, argv);

        // Defaults, then the config file, then flags
        DiffPackConfig config;
        if (!configPath.empty()) {
            config = DiffPackConfig::loadFile(configPath, config);
            if (verbose) {
                std::cout << "Loaded configuration from " << configPath << std::endl;
            }
        }
        if (modelOpt->count() > 0) {
            config.model = model;
        }
        if (maxTokensOpt->count() > 0) {
            config.maxModelTokens = maxTokens;
        }
        if (beforeOpt->count() > 0) {
            config.patchExtraLinesBefore = extraLinesBefore;
        }
        if (afterOpt->count() > 0) {
            config.patchExtraLinesAfter = extraLinesAfter;
        }
        if (ignoreOpt->count() > 0) {
            for (const auto& pattern : PatternMatcher::splitPatternString(ignorePatterns)) {
                config.ignoreGlobs.push_back(pattern);
            }
        }
        if (ignoreRegexOpt->count() > 0) {
            config.ignoreRegexes.insert(config.ignoreRegexes.end(), ignoreRegexes.begin(), ignoreRegexes.end());
        }
        if (allowExtOpt->count() > 0) {
            config.allowedExtensions = PatternMatcher::splitPatternString(allowedExtensions);
        }
        if (noLineNumbers) {
            config.addLineNumbers = false;
        }

        DiffReader reader(verbose);
        std::vector<FileDiffInput> files = reader.readFile(inputPath, jsonInput);
        if (!repoDir.empty()) {
            reader.attachNewFileContents(files, repoDir);
        }

        DiffPack diffPack(PipelineContext::fromConfig(config), verbose);
        PackResult result = diffPack.run(files);

        const OutputFormat format = formatStr == "json" ? OutputFormat::Json : OutputFormat::Prompt;
        const std::string output = format == OutputFormat::Json
            ? diffPack.toJson(result).dump(2) + "\n"
            : result.prompt;

        if (outputPath.empty()) {
            std::cout << output;
            if (format == OutputFormat::Prompt && !output.empty() && output.back() != '\n') {
                std::cout << std::endl;
            }
        } else {
            std::ofstream out(outputPath, std::ios::binary);
            if (!out) {
                std::cerr << "Error: Failed to open output file: " << outputPath << std::endl;
                return 1;
            }
            out << output;
            if (verbose) {
                std::cout << "Output written to " << outputPath << std::endl;
            }
        }

        // Print summary
        if (verbose) {
            std::cerr << diffPack.getSummary(result);
        }

        if (result.nothingToProcess()) {
            std::cerr << "Warning: Nothing to process, no file content fits the request" << std::endl;
            return 2;
        }

        return 0;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
