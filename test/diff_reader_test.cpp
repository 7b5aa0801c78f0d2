#include <catch2/catch_test_macros.hpp>
#include "diff_reader.hpp"
#include "hunk_parser.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

// Helper function to create temporary files for testing
void createTestFile(const fs::path& filePath, const std::string& content) {
    fs::create_directories(filePath.parent_path());
    std::ofstream file(filePath, std::ios::binary);
    file << content;
}

const char* const GIT_DIFF =
    "From 1234abcd Mon Sep 17 00:00:00 2001\n"
    "Subject: [PATCH] Tidy things\n"
    "\n"
    "diff --git a/src/app.py b/src/app.py\n"
    "index 3b18e51..a8c1f2d 100644\n"
    "--- a/src/app.py\n"
    "+++ b/src/app.py\n"
    "@@ -1,3 +1,3 @@\n"
    " import os\n"
    "--- a comment line starting with dashes\n"
    "+# a comment line\n"
    " print(os.name)\n"
    "diff --git a/docs/new.md b/docs/new.md\n"
    "new file mode 100644\n"
    "--- /dev/null\n"
    "+++ b/docs/new.md\n"
    "@@ -0,0 +1 @@\n"
    "+# Title\n"
    "diff --git a/old.txt b/old.txt\n"
    "deleted file mode 100644\n"
    "--- a/old.txt\n"
    "+++ /dev/null\n"
    "@@ -1 +0,0 @@\n"
    "-bye\n"
    "diff --git a/lib/a.py b/lib/b.py\n"
    "similarity index 90%\n"
    "rename from lib/a.py\n"
    "rename to lib/b.py\n"
    "-- \n"
    "2.43.0\n";

}

TEST_CASE("DiffReader splits a multi-file git diff", "[DiffReader]") {
    DiffReader reader;
    auto files = reader.readUnifiedDiff(GIT_DIFF);

    REQUIRE(files.size() == 4);

    SECTION("Modified file keeps its whole body") {
        REQUIRE(files[0].path == "src/app.py");
        REQUIRE(files[0].oldPath == "src/app.py");
        REQUIRE(files[0].editType == EditType::Unknown);
        REQUIRE(files[0].rawDiff.find("--- a comment line starting with dashes\n") != std::string::npos);
        REQUIRE(files[0].rawDiff.find("diff --git a/docs") == std::string::npos);
    }

    SECTION("Added and deleted files") {
        REQUIRE(files[1].path == "docs/new.md");
        REQUIRE(files[1].editType == EditType::Added);
        REQUIRE(files[2].path == "old.txt");
        REQUIRE(files[2].editType == EditType::Deleted);
    }

    SECTION("Rename and patch trailer") {
        REQUIRE(files[3].path == "lib/b.py");
        REQUIRE(files[3].oldPath == "lib/a.py");
        REQUIRE(files[3].editType == EditType::Renamed);
        REQUIRE(files[3].rawDiff.find("2.43.0") == std::string::npos);
    }
}

TEST_CASE("DiffReader reads plain diff -u output", "[DiffReader]") {
    const std::string diff =
        "--- a/one.c\t2024-01-01 10:00:00\n"
        "+++ b/one.c\t2024-01-02 10:00:00\n"
        "@@ -1 +1 @@\n"
        "-int x;\n"
        "+int y;\n"
        "--- a/two.c\n"
        "+++ b/two.c\n"
        "@@ -2 +2 @@\n"
        "-a\n"
        "+b\n";

    DiffReader reader;
    auto files = reader.readUnifiedDiff(diff);

    REQUIRE(files.size() == 2);
    REQUIRE(files[0].path == "one.c");
    REQUIRE(files[1].path == "two.c");
    REQUIRE(files[1].rawDiff.rfind("--- a/two.c", 0) == 0);
}

TEST_CASE("DiffReader reads recursive diff output", "[DiffReader]") {
    const std::string diff =
        "diff -ruN a/x.txt b/x.txt\n"
        "--- a/x.txt\t2024-01-01 10:00:00\n"
        "+++ b/x.txt\t2024-01-02 10:00:00\n"
        "@@ -1 +1 @@\n"
        "-one\n"
        "+two\n"
        "Only in b: extra\n"
        "diff -ru a/y.txt b/y.txt\n"
        "--- a/y.txt\n"
        "+++ b/y.txt\n"
        "@@ -3 +3 @@\n"
        "-old\n"
        "+new\n"
        "diff -r a/img.bin b/img.bin\n"
        "Binary files a/img.bin and b/img.bin differ\n";

    DiffReader reader;
    auto files = reader.readUnifiedDiff(diff);

    REQUIRE(files.size() == 3);
    REQUIRE(files[0].path == "x.txt");
    REQUIRE(files[0].rawDiff.find("Only in") == std::string::npos);
    REQUIRE(files[0].rawDiff.find("y.txt") == std::string::npos);
    REQUIRE(files[1].path == "y.txt");
    REQUIRE(files[2].path == "img.bin");

    SECTION("Every file parses on its own") {
        auto first = HunkParser::parseFile(files[0]);
        REQUIRE(first.ok());
        REQUIRE(first.patch.hunks.size() == 1);

        auto second = HunkParser::parseFile(files[1]);
        REQUIRE(second.ok());
        REQUIRE(second.patch.hunks[0].newStart == 3);

        auto binary = HunkParser::parseFile(files[2]);
        REQUIRE(binary.ok());
        REQUIRE(binary.patch.isBinary);
    }
}

TEST_CASE("DiffReader reads JSON file lists", "[DiffReader]") {
    DiffReader reader;

    SECTION("Hosting API shape") {
        const std::string json = R"({
            "files": [
                {"filename": "src/a.py", "status": "modified", "patch": "@@ -1 +1 @@\n-a\n+b\n",
                 "head_file": "b\n"},
                {"filename": "src/c.py", "previous_filename": "src/old_c.py", "status": "renamed"},
                {"filename": "gone.py", "status": "removed", "patch": "@@ -1 +0,0 @@\n-x\n"}
            ]
        })";

        auto files = reader.readJson(json);
        REQUIRE(files.size() == 3);
        REQUIRE(files[0].editType == EditType::Modified);
        REQUIRE(files[0].newFileText.has_value());
        REQUIRE(*files[0].newFileText == "b\n");
        REQUIRE(files[1].oldPath == "src/old_c.py");
        REQUIRE(files[1].editType == EditType::Renamed);
        REQUIRE(files[1].rawDiff.empty());
        REQUIRE(files[2].editType == EditType::Deleted);
        REQUIRE_FALSE(files[2].newFileText.has_value());
    }

    SECTION("Bare array") {
        auto files = reader.readJson(R"([{"filename": "x.py", "patch": ""}])");
        REQUIRE(files.size() == 1);
        REQUIRE(files[0].oldPath == "x.py");
        REQUIRE(files[0].editType == EditType::Unknown);
    }

    SECTION("Null fields read as missing") {
        auto files = reader.readJson(R"([
            {"filename": "a.py", "previous_filename": null, "status": null, "patch": null, "head_file": null},
            {"filename": "b.py", "status": "added", "patch": "@@ -0,0 +1 @@\n+x\n"}
        ])");
        REQUIRE(files.size() == 2);
        REQUIRE(files[0].oldPath == "a.py");
        REQUIRE(files[0].editType == EditType::Unknown);
        REQUIRE(files[0].rawDiff.empty());
        REQUIRE_FALSE(files[0].newFileText.has_value());
        REQUIRE(files[1].editType == EditType::Added);
    }

    SECTION("Malformed input") {
        REQUIRE_THROWS_AS(reader.readJson("{not json"), std::runtime_error);
        REQUIRE_THROWS_AS(reader.readJson(R"({"files": 3})"), std::runtime_error);
        REQUIRE_THROWS_AS(reader.readJson(R"([{"status": "added"}])"), std::runtime_error);
    }
}

TEST_CASE("DiffReader attaches post-change file contents", "[DiffReader]") {
    fs::path tempDir = fs::temp_directory_path() / "diffpack_reader_test";
    fs::remove_all(tempDir);
    createTestFile(tempDir / "src" / "a.py", "line 1\nline 2\n");

    std::vector<FileDiffInput> files(3);
    files[0].path = "src/a.py";
    files[1].path = "src/missing.py";
    files[2].path = "src/a.py";
    files[2].editType = EditType::Deleted;

    DiffReader reader;
    reader.attachNewFileContents(files, tempDir);

    REQUIRE(files[0].newFileText.has_value());
    REQUIRE(*files[0].newFileText == "line 1\nline 2\n");
    REQUIRE_FALSE(files[1].newFileText.has_value());
    REQUIRE_FALSE(files[2].newFileText.has_value());

    SECTION("Reading from a file") {
        createTestFile(tempDir / "change.diff", "diff --git a/x b/x\n@@ -1 +1 @@\n-a\n+b\n");
        auto read = reader.readFile(tempDir / "change.diff", false);
        REQUIRE(read.size() == 1);
        REQUIRE(read[0].path == "x");

        REQUIRE_THROWS_AS(reader.readFile(tempDir / "absent.diff", false), std::runtime_error);
    }

    fs::remove_all(tempDir);
}
