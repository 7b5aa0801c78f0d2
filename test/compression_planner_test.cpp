#include <catch2/catch_test_macros.hpp>
#include "compression_planner.hpp"
#include <algorithm>
#include <map>

namespace {

// A modified file with `hunkCount` hunks of `linesPerHunk` replaced lines each
FilePatch makePatch(const std::string& path, int hunkCount, int linesPerHunk) {
    FilePatch patch;
    patch.path = path;
    patch.oldPath = path;

    for (int h = 0; h < hunkCount; ++h) {
        Hunk hunk;
        hunk.oldStart = 1 + h * 100;
        hunk.newStart = 1 + h * 100;
        hunk.oldCount = linesPerHunk;
        hunk.newCount = linesPerHunk;
        for (int i = 0; i < linesPerHunk; ++i) {
            const std::string suffix = std::to_string(h) + "_" + std::to_string(i);
            hunk.lines.push_back(Line::removed(hunk.oldStart + i, "value_" + suffix + " = old(" + suffix + ")"));
        }
        for (int i = 0; i < linesPerHunk; ++i) {
            const std::string suffix = std::to_string(h) + "_" + std::to_string(i);
            hunk.lines.push_back(Line::added(hunk.newStart + i, "value_" + suffix + " = new(" + suffix + ")"));
        }
        patch.hunks.push_back(hunk);
    }
    return patch;
}

TokenBudget budgetOf(size_t limit) {
    TokenBudget budget;
    budget.limit = limit;
    budget.modelId = "test-model";
    return budget;
}

// Hunks kept per path; omitted files are absent
std::map<std::string, size_t> keptHunks(const CompressionResult& result) {
    std::map<std::string, size_t> kept;
    for (const auto& patch : result.patches) {
        kept[patch.path] = patch.hunks.size();
    }
    return kept;
}

}

TEST_CASE("CompressionPlanner leaves fitting diffs alone", "[CompressionPlanner]") {
    CompressionPlanner planner{Tokenizer(TokenizerEncoding::CHAR_RATIO)};
    std::vector<FilePatch> patches = {makePatch("a.py", 2, 3), makePatch("b.py", 1, 2)};

    const size_t total = planner.cost(patches[0]) + planner.cost(patches[1]);

    for (size_t limit : {total, total + 1, total * 10}) {
        auto result = planner.plan(patches, budgetOf(limit));
        REQUIRE_FALSE(result.wasCompressed);
        REQUIRE(result.patches == patches);
        REQUIRE(result.totalTokens == total);
        REQUIRE(result.omittedFiles == 0);
        REQUIRE(result.omittedHunks == 0);
        REQUIRE(result.omittedPaths.empty());
        REQUIRE(result.truncatedPaths.empty());
    }
}

TEST_CASE("CompressionPlanner truncates the largest file first", "[CompressionPlanner]") {
    CompressionPlanner planner{Tokenizer(TokenizerEncoding::CHAR_RATIO)};
    const FilePatch small = makePatch("small.py", 1, 4);
    const FilePatch large = makePatch("large.py", 5, 4);
    REQUIRE(planner.cost(large) > planner.cost(small));

    // Room for the small file whole and the first two hunks of the large one
    const size_t limit = planner.cost(small) + planner.cost(large.withFirstHunks(2));
    REQUIRE(limit < planner.cost(small) + planner.cost(large));

    auto result = planner.plan({small, large}, budgetOf(limit));

    REQUIRE(result.wasCompressed);
    REQUIRE(result.patches.size() == 2);
    REQUIRE(result.patches[0] == small);
    REQUIRE(result.patches[1].path == "large.py");
    REQUIRE(result.patches[1].hunks.size() == 2);
    REQUIRE(result.patches[1].hunks[0] == large.hunks[0]);
    REQUIRE(result.patches[1].hunks[1] == large.hunks[1]);
    REQUIRE(result.truncatedPaths == std::vector<std::string>{"large.py"});
    REQUIRE(result.omittedHunks == 3);
    REQUIRE(result.omittedFiles == 0);
    REQUIRE(result.totalTokens == limit);
}

TEST_CASE("CompressionPlanner omits files that lose every hunk", "[CompressionPlanner]") {
    CompressionPlanner planner{Tokenizer(TokenizerEncoding::CHAR_RATIO)};
    std::vector<FilePatch> patches = {
        makePatch("a.py", 1, 2),
        makePatch("b.py", 3, 6),
        makePatch("c.py", 1, 3)
    };

    SECTION("Only the largest file goes") {
        const size_t limit = planner.cost(patches[0]) + planner.cost(patches[2]);
        auto result = planner.plan(patches, budgetOf(limit));

        REQUIRE(result.omittedFiles == 1);
        REQUIRE(result.omittedPaths == std::vector<std::string>{"b.py"});
        REQUIRE(result.omittedHunks == 3);
        REQUIRE(result.patches.size() == 2);
        REQUIRE(result.patches[0].path == "a.py");
        REQUIRE(result.patches[1].path == "c.py");
    }

    SECTION("Nothing fits") {
        auto result = planner.plan(patches, budgetOf(0));

        REQUIRE(result.wasCompressed);
        REQUIRE(result.empty());
        REQUIRE(result.omittedFiles == 3);
        REQUIRE(result.omittedHunks == 5);
        const std::vector<std::string> expected = {"a.py", "b.py", "c.py"};
        REQUIRE(result.omittedPaths == expected);
        REQUIRE(result.totalTokens == 0);
    }
}

TEST_CASE("CompressionPlanner breaks cost ties by path", "[CompressionPlanner]") {
    CompressionPlanner planner{Tokenizer(TokenizerEncoding::CHAR_RATIO)};
    const FilePatch a = makePatch("a.py", 2, 3);
    const FilePatch b = makePatch("b.py", 2, 3);
    REQUIRE(planner.cost(a) == planner.cost(b));

    const size_t limit = planner.cost(a.withFirstHunks(1)) + planner.cost(b);
    auto result = planner.plan({b, a}, budgetOf(limit));

    REQUIRE(result.truncatedPaths == std::vector<std::string>{"a.py"});
    REQUIRE(result.patches[0] == b);
    REQUIRE(result.patches[1].hunks.size() == 1);
}

TEST_CASE("CompressionPlanner is monotone in the budget", "[CompressionPlanner]") {
    CompressionPlanner planner{Tokenizer(TokenizerEncoding::CHAR_RATIO)};
    std::vector<FilePatch> patches = {
        makePatch("api/handler.py", 4, 3),
        makePatch("api/models.py", 2, 5),
        makePatch("README.md", 1, 1),
        makePatch("core/engine.py", 6, 2),
        makePatch("core/util.py", 3, 3)
    };

    size_t total = 0;
    for (const auto& patch : patches) {
        total += planner.cost(patch);
    }

    std::map<std::string, size_t> previous;
    for (size_t limit = 0; limit <= total + 20; limit += 7) {
        auto result = planner.plan(patches, budgetOf(limit));
        REQUIRE(result.totalTokens <= limit);

        auto kept = keptHunks(result);
        for (const auto& entry : previous) {
            REQUIRE(kept.count(entry.first) == 1);
            REQUIRE(kept[entry.first] >= entry.second);
        }
        previous = kept;
    }

    REQUIRE(previous.size() == patches.size());
}

TEST_CASE("CompressionPlanner is deterministic", "[CompressionPlanner]") {
    CompressionPlanner planner{Tokenizer(TokenizerEncoding::CHAR_RATIO)};
    std::vector<FilePatch> patches = {
        makePatch("x.py", 3, 2),
        makePatch("y.py", 2, 4),
        makePatch("z.py", 4, 1)
    };

    size_t total = 0;
    for (const auto& patch : patches) {
        total += planner.cost(patch);
    }
    const TokenBudget budget = budgetOf(total / 2);

    auto first = planner.plan(patches, budget);
    auto second = planner.plan(patches, budget);
    REQUIRE(first.patches == second.patches);
    REQUIRE(first.omittedPaths == second.omittedPaths);
    REQUIRE(first.totalTokens == second.totalTokens);

    // Input order changes the output order only
    std::vector<FilePatch> reversed(patches.rbegin(), patches.rend());
    auto third = planner.plan(reversed, budget);
    REQUIRE(keptHunks(third) == keptHunks(first));
    REQUIRE(third.totalTokens == first.totalTokens);
}
