#pragma once

#include <string>
#include <vector>
#include "diff_types.hpp"
#include "tokenizer.hpp"

struct TokenBudget {
    size_t limit = 0;
    std::string modelId;
};

struct CompressionResult {
    std::vector<FilePatch> patches;         // Surviving files, in input order
    bool wasCompressed = false;
    size_t omittedFiles = 0;
    size_t omittedHunks = 0;                // Includes every hunk of an omitted file
    std::vector<std::string> omittedPaths;  // Files dropped entirely, in input order
    std::vector<std::string> truncatedPaths;// Files that lost trailing hunks, in input order
    size_t totalTokens = 0;                 // Estimated cost of the surviving patches

    bool empty() const { return patches.empty(); }
};

// Decides which hunks survive when the serialized diff exceeds the budget.
//
// Files are reduced largest first (ties broken by ascending path), each by
// dropping its last hunk until the running total fits or the file has no
// hunks left, in which case it is omitted. Because the removal sequence does
// not depend on the limit, a larger limit always stops earlier in it: the
// plan is deterministic and never keeps less for a bigger budget.
class CompressionPlanner {
public:
    explicit CompressionPlanner(Tokenizer tokenizer);

    CompressionResult plan(const std::vector<FilePatch>& patches, const TokenBudget& budget) const;

    // Estimated tokens of the serialized patch
    size_t cost(const FilePatch& patch) const;

    const Tokenizer& tokenizer() const { return tokenizer_; }

private:
    Tokenizer tokenizer_;
};
