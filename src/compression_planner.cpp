#include "compression_planner.hpp"
#include "patch_formatter.hpp"
#include <algorithm>
#include <numeric>

CompressionPlanner::CompressionPlanner(Tokenizer tokenizer)
    : tokenizer_(std::move(tokenizer)) {
}

size_t CompressionPlanner::cost(const FilePatch& patch) const {
    return tokenizer_.estimate(PatchFormatter::format(patch));
}

CompressionResult CompressionPlanner::plan(const std::vector<FilePatch>& patches,
                                           const TokenBudget& budget) const {
    CompressionResult result;

    std::vector<size_t> costs;
    costs.reserve(patches.size());
    for (const auto& patch : patches) {
        costs.push_back(cost(patch));
    }
    size_t runningTotal = std::accumulate(costs.begin(), costs.end(), static_cast<size_t>(0));

    // Fast path: everything fits as is
    if (runningTotal <= budget.limit) {
        result.patches = patches;
        result.totalTokens = runningTotal;
        return result;
    }

    result.wasCompressed = true;

    // Largest first; equal costs fall back to path, then input position
    std::vector<size_t> order(patches.size());
    std::iota(order.begin(), order.end(), 0);
    std::sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        if (costs[a] != costs[b]) {
            return costs[a] > costs[b];
        }
        if (patches[a].path != patches[b].path) {
            return patches[a].path < patches[b].path;
        }
        return a < b;
    });

    std::vector<std::vector<Hunk>> keptHunks;
    keptHunks.reserve(patches.size());
    for (const auto& patch : patches) {
        keptHunks.push_back(patch.hunks);
    }
    std::vector<size_t> removedHunks(patches.size(), 0);
    std::vector<bool> omitted(patches.size(), false);

    for (size_t index : order) {
        if (runningTotal <= budget.limit) {
            break;
        }

        std::vector<Hunk>& hunks = keptHunks[index];
        while (runningTotal > budget.limit) {
            // Earliest hunks are the last to go
            if (!hunks.empty()) {
                hunks.pop_back();
                ++removedHunks[index];
            }

            if (hunks.empty()) {
                omitted[index] = true;
                runningTotal -= costs[index];
                costs[index] = 0;
                break;
            }

            FilePatch reduced = patches[index].withFirstHunks(0);
            reduced.hunks = hunks;
            const size_t reducedCost = cost(reduced);
            runningTotal = runningTotal - costs[index] + reducedCost;
            costs[index] = reducedCost;
        }
    }

    for (size_t i = 0; i < patches.size(); ++i) {
        result.omittedHunks += removedHunks[i];

        if (omitted[i]) {
            ++result.omittedFiles;
            result.omittedPaths.push_back(patches[i].path);
            continue;
        }

        if (removedHunks[i] > 0) {
            FilePatch truncated = patches[i].withFirstHunks(0);
            truncated.hunks = std::move(keptHunks[i]);
            result.truncatedPaths.push_back(patches[i].path);
            result.patches.push_back(std::move(truncated));
        } else {
            result.patches.push_back(patches[i]);
        }
    }

    result.totalTokens = runningTotal;
    return result;
}
