#pragma once

#include <string>
#include <cstdint>
#include <vector>
#include <unordered_map>
#include <memory>

// Check if tiktoken is enabled
#ifdef USE_TIKTOKEN
// Forward declaration for cpp-tiktoken
class GptEncoding;
#endif

// Supported tokenizer encodings
enum class TokenizerEncoding {
    CL100K_BASE,  // ChatGPT models, text-embedding-ada-002
    P50K_BASE,    // Code models, text-davinci-002, text-davinci-003
    P50K_EDIT,    // Edit models like text-davinci-edit-001, code-davinci-edit-001
    R50K_BASE,    // GPT-3 models like davinci
    O200K_BASE,   // GPT-4o, GPT-4.1, GPT-5 and o-series models
    CHAR_RATIO    // Unrecognized models: fixed characters-per-token ratio
};

// Maps text to an estimated token count. Estimation never fails: if the
// BPE encoder is unavailable or rejects the input, the count degrades to
// a heuristic instead.
class Tokenizer {
public:
    Tokenizer(TokenizerEncoding encoding = TokenizerEncoding::CL100K_BASE);
    ~Tokenizer();

    // Count tokens in a string
    size_t countTokens(const std::string& text) const;

    // Alias used by the compression planner
    size_t estimate(const std::string& text) const { return countTokens(text); }

    // Clip text to at most maxTokens, optionally marking the cut
    std::string clip(const std::string& text, size_t maxTokens, bool addTruncationMarker = true) const;

    // Get the encoding name as a string
    std::string getEncodingName() const;

    TokenizerEncoding getEncoding() const { return encodingType_; }

    // True when counts come from a real BPE encoder
    bool isExact() const;

    // Get all supported encoding names
    static std::vector<std::string> getSupportedEncodings();

    // Convert string to TokenizerEncoding enum
    static TokenizerEncoding encodingFromString(const std::string& encodingName);

    // Convert TokenizerEncoding enum to string
    static std::string encodingToString(TokenizerEncoding encoding);

    // Estimators used when no BPE encoder is available
    static size_t approximateTokens(const std::string& text);
    static size_t charRatioTokens(const std::string& text);

    static constexpr size_t CHARS_PER_TOKEN = 4;

private:
    TokenizerEncoding encodingType_;

    // Cache string representation of encoding type
    std::string encodingName_;

#ifdef USE_TIKTOKEN
    // Pointer to the cpp-tiktoken encoder
    std::shared_ptr<GptEncoding> encoding_;
#endif

    // Static mapping of encoding names to enum values
    static const std::unordered_map<std::string, TokenizerEncoding> encodingMap_;

    // Initialize the tokenizer based on the encoding type
    void initializeEncoding();
};
