#pragma once

#include <string>
#include <vector>
#include <utility>
#include "diff_types.hpp"
#include "tokenizer.hpp"

// Serializes file patches into the text submitted to the model
class PatchFormatter {
public:
    // Render one file using the numbering mode captured on the patch
    static std::string format(const FilePatch& patch);

    static std::string format(const FilePatch& patch, NumberingMode mode);

    static std::string formatAll(const std::vector<FilePatch>& patches);

    // Clean unified-diff text of the hunks, with recomputed headers
    static std::string formatHunks(const std::vector<Hunk>& hunks);

    static std::string formatHunkHeader(const Hunk& hunk);

    // Lists of files left out of the diff, grouped by edit type and clipped
    // to `budget` tokens. Empty when nothing fits.
    static std::string formatOmittedFiles(const std::vector<std::pair<std::string, EditType>>& omitted,
                                          const Tokenizer& tokenizer,
                                          size_t budget);

private:
    static std::string formatAnnotated(const FilePatch& patch);
    static std::string formatPlain(const FilePatch& patch);
};
