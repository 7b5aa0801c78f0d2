#include <catch2/catch_test_macros.hpp>
#include "context_extender.hpp"
#include "hunk_parser.hpp"

namespace {

// "line 1\nline 2\n...line N\n"
std::string numberedFile(int lineCount) {
    std::string text;
    for (int i = 1; i <= lineCount; ++i) {
        text += "line " + std::to_string(i) + "\n";
    }
    return text;
}

// Three context lines and one insertion after line 11 of the old file
Hunk insertionHunk() {
    Hunk hunk;
    hunk.oldStart = 10;
    hunk.oldCount = 3;
    hunk.newStart = 10;
    hunk.newCount = 4;
    hunk.lines = {
        Line::context(10, 10, "line 10"),
        Line::context(11, 11, "line 11"),
        Line::added(12, "inserted"),
        Line::context(12, 13, "line 13")
    };
    return hunk;
}

}

TEST_CASE("ContextExtender widens a hunk with surrounding lines", "[ContextExtender]") {
    // New file: old lines 1..11, the insertion, then old lines 12..19 shifted by one
    std::string newFile;
    for (int i = 1; i <= 20; ++i) {
        newFile += (i == 12 ? std::string("inserted") : "line " + std::to_string(i)) + "\n";
    }

    auto result = ContextExtender::extend(std::vector<Hunk>{insertionHunk()}, newFile, 2, 2);

    REQUIRE(result.size() == 1);
    const Hunk& hunk = result[0];

    SECTION("Extended range covers old 8-14 and new 8-15") {
        REQUIRE(hunk.oldStart == 8);
        REQUIRE(hunk.oldCount == 7);
        REQUIRE(hunk.newStart == 8);
        REQUIRE(hunk.newCount == 8);
        REQUIRE(hunk.oldEnd() == 15);
    }

    SECTION("Pulled lines carry both numbers and new-file text") {
        REQUIRE(hunk.lines.size() == 8);
        REQUIRE(hunk.lines.front() == Line::context(8, 8, "line 8"));
        REQUIRE(hunk.lines[1] == Line::context(9, 9, "line 9"));
        REQUIRE(hunk.lines[6] == Line::context(13, 14, "line 14"));
        REQUIRE(hunk.lines.back() == Line::context(14, 15, "line 15"));
    }

    SECTION("Original lines are untouched") {
        REQUIRE(hunk.lines[2] == Line::context(10, 10, "line 10"));
        REQUIRE(hunk.lines[4] == Line::added(12, "inserted"));
    }
}

TEST_CASE("ContextExtender clamps at file edges", "[ContextExtender]") {
    SECTION("Start of file") {
        Hunk hunk;
        hunk.oldStart = 2;
        hunk.oldCount = 1;
        hunk.newStart = 2;
        hunk.newCount = 1;
        hunk.lines = {Line::context(2, 2, "line 2")};

        auto result = ContextExtender::extend(std::vector<Hunk>{hunk}, numberedFile(5), 5, 0);
        REQUIRE(result[0].oldStart == 1);
        REQUIRE(result[0].newStart == 1);
        REQUIRE(result[0].lines.size() == 2);
    }

    SECTION("End of file") {
        Hunk hunk;
        hunk.oldStart = 4;
        hunk.oldCount = 1;
        hunk.newStart = 4;
        hunk.newCount = 1;
        hunk.lines = {Line::context(4, 4, "line 4")};

        auto result = ContextExtender::extend(std::vector<Hunk>{hunk}, numberedFile(5), 0, 10);
        REQUIRE(result[0].newCount == 2);
        REQUIRE(result[0].lines.back() == Line::context(5, 5, "line 5"));
    }

    SECTION("Window never leaves the file") {
        Hunk hunk = insertionHunk();
        for (size_t length : {0u, 3u, 11u, 14u, 40u}) {
            for (int before : {0, 2, 50}) {
                for (int after : {0, 1, 50}) {
                    auto range = ContextExtender::window(hunk, length, before, after);
                    REQUIRE(range.begin <= range.end);
                    REQUIRE(range.end <= length);
                }
            }
        }

        auto range = ContextExtender::window(hunk, 40, 2, 2);
        REQUIRE(range.begin == 7);
        REQUIRE(range.end == 15);
        REQUIRE(range.size() == 8);
    }
}

TEST_CASE("ContextExtender respects neighbouring hunks", "[ContextExtender]") {
    const std::string diff =
        "@@ -3,1 +3,1 @@\n"
        "-old 3\n"
        "+line 3\n"
        "@@ -6,1 +6,1 @@\n"
        "-old 6\n"
        "+line 6\n";

    auto parsed = HunkParser::parse(diff, "f.txt", "f.txt");
    REQUIRE(parsed.ok());

    SECTION("Small extension keeps hunks apart") {
        auto result = ContextExtender::extend(parsed.patch.hunks, numberedFile(10), 1, 0);
        REQUIRE(result.size() == 2);
        REQUIRE(result[0].newStart == 2);
        REQUIRE(result[1].newStart == 5);
    }

    SECTION("Touching hunks are merged without duplicate lines") {
        auto result = ContextExtender::extend(parsed.patch.hunks, numberedFile(10), 2, 2);
        REQUIRE(result.size() == 1);

        const Hunk& hunk = result[0];
        REQUIRE(hunk.newStart == 1);
        REQUIRE(hunk.newCount == 8);
        REQUIRE(hunk.oldStart == 1);
        REQUIRE(hunk.oldCount == 8);

        int lastNew = 0;
        for (const auto& line : hunk.lines) {
            if (line.newNumber) {
                REQUIRE(*line.newNumber > lastNew);
                lastNew = *line.newNumber;
            }
        }
    }
}

TEST_CASE("ContextExtender is a no-op without full text", "[ContextExtender]") {
    std::vector<Hunk> hunks = {insertionHunk()};

    REQUIRE(ContextExtender::extend(hunks, std::nullopt, 5, 5) == hunks);
    REQUIRE(ContextExtender::extend(hunks, numberedFile(30), 0, 0) == hunks);

    FilePatch patch;
    patch.path = "a.py";
    patch.hunks = hunks;
    REQUIRE(ContextExtender::extend(patch, std::nullopt, 3, 3) == patch);
}

TEST_CASE("ContextExtender splits lines", "[ContextExtender]") {
    auto lines = ContextExtender::splitLines("a\r\nb\n\nc");
    REQUIRE(lines.size() == 4);
    REQUIRE(lines[0] == "a");
    REQUIRE(lines[2].empty());
    REQUIRE(lines[3] == "c");
}
