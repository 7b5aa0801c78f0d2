#include "tokenizer.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

// In cpp-tiktoken, the header is in a subdirectory
#ifdef USE_TIKTOKEN
#include <tiktoken/encoding.h>
#endif

// Static initialization of encoding map
const std::unordered_map<std::string, TokenizerEncoding> Tokenizer::encodingMap_ = {
    {"cl100k", TokenizerEncoding::CL100K_BASE},
    {"cl100k_base", TokenizerEncoding::CL100K_BASE},
    {"p50k", TokenizerEncoding::P50K_BASE},
    {"p50k_base", TokenizerEncoding::P50K_BASE},
    {"p50k_edit", TokenizerEncoding::P50K_EDIT},
    {"r50k", TokenizerEncoding::R50K_BASE},
    {"r50k_base", TokenizerEncoding::R50K_BASE},
    {"gpt2", TokenizerEncoding::R50K_BASE},
    {"o200k", TokenizerEncoding::O200K_BASE},
    {"o200k_base", TokenizerEncoding::O200K_BASE},
    {"char_ratio", TokenizerEncoding::CHAR_RATIO}
};

Tokenizer::Tokenizer(TokenizerEncoding encoding)
    : encodingType_(encoding) {
    initializeEncoding();
}

Tokenizer::~Tokenizer() = default;

void Tokenizer::initializeEncoding() {
    encodingName_ = encodingToString(encodingType_);

#ifdef USE_TIKTOKEN
    // Convert our enum to the LanguageModel enum used by cpp-tiktoken
    LanguageModel model;

    switch (encodingType_) {
        case TokenizerEncoding::CL100K_BASE:
            model = LanguageModel::CL100K_BASE;
            break;
        case TokenizerEncoding::P50K_BASE:
            model = LanguageModel::P50K_BASE;
            break;
        case TokenizerEncoding::P50K_EDIT:
            model = LanguageModel::P50K_EDIT;
            break;
        case TokenizerEncoding::R50K_BASE:
            model = LanguageModel::R50K_BASE;
            break;
        case TokenizerEncoding::O200K_BASE:
            model = LanguageModel::O200K_BASE;
            break;
        default:
            // Heuristic encodings have no BPE table
            return;
    }

    // A missing vocabulary file leaves encoding_ empty; counting then
    // degrades to the approximation
    try {
        encoding_ = GptEncoding::get_encoding(model);
    } catch (const std::exception&) {
        encoding_.reset();
    }
#endif
}

bool Tokenizer::isExact() const {
#ifdef USE_TIKTOKEN
    return encoding_ != nullptr;
#else
    return false;
#endif
}

size_t Tokenizer::countTokens(const std::string& text) const {
    if (text.empty()) {
        return 0;
    }

    if (encodingType_ == TokenizerEncoding::CHAR_RATIO) {
        return charRatioTokens(text);
    }

#ifdef USE_TIKTOKEN
    if (encoding_) {
        try {
            // Encode the text into tokens using cpp-tiktoken
            return encoding_->encode(text).size();
        } catch (const std::exception&) {
            // Special-token sequences in the diff are rejected by the encoder
            return approximateTokens(text);
        }
    }
#endif

    return approximateTokens(text);
}

size_t Tokenizer::charRatioTokens(const std::string& text) {
    return (text.size() + CHARS_PER_TOKEN - 1) / CHARS_PER_TOKEN;
}

size_t Tokenizer::approximateTokens(const std::string& text) {
    // Quick estimate for empty or very short texts
    if (text.empty()) {
        return 0;
    }

    if (text.length() <= CHARS_PER_TOKEN) {
        return 1;
    }

    // Count tokens based on word boundaries and special characters
    size_t tokenCount = 0;
    bool inWord = false;
    size_t currentWordLength = 0;

    for (const char c : text) {
        const unsigned char uc = static_cast<unsigned char>(c);
        if (std::isspace(uc) || c == '.' || c == ',' || c == '!' || c == '?' ||
            c == ':' || c == ';' || c == '(' || c == ')' || c == '[' || c == ']' ||
            c == '{' || c == '}' || c == '"' || c == '\'' || c == '`') {

            if (inWord) {
                // End of a word - add tokens based on word length
                tokenCount += (currentWordLength + CHARS_PER_TOKEN - 1) / CHARS_PER_TOKEN;
                inWord = false;
                currentWordLength = 0;
            }

            // Count separators and punctuation as potential tokens
            if (!std::isspace(uc)) {
                tokenCount += 1;
            }
        } else {
            if (!inWord) {
                inWord = true;
            }
            currentWordLength++;
        }
    }

    // Handle the last word if the text doesn't end with a delimiter
    if (inWord) {
        tokenCount += (currentWordLength + CHARS_PER_TOKEN - 1) / CHARS_PER_TOKEN;
    }

    return std::max(tokenCount, static_cast<size_t>(1));
}

std::string Tokenizer::clip(const std::string& text, size_t maxTokens, bool addTruncationMarker) const {
    if (text.empty() || maxTokens == 0) {
        return "";
    }

    const size_t inputTokens = countTokens(text);
    if (inputTokens <= maxTokens) {
        return text;
    }

    // Estimate the character budget from the observed ratio, with a safety margin
    const double charsPerToken = static_cast<double>(text.size()) / static_cast<double>(inputTokens);
    size_t outputChars = static_cast<size_t>(0.9 * charsPerToken * static_cast<double>(maxTokens));
    outputChars = std::min(outputChars, text.size());

    // Do not split a UTF-8 sequence
    while (outputChars > 0 && outputChars < text.size() &&
           (static_cast<unsigned char>(text[outputChars]) & 0xC0) == 0x80) {
        --outputChars;
    }

    std::string clipped = text.substr(0, outputChars);
    if (addTruncationMarker) {
        clipped += "\n...(truncated)";
    }
    return clipped;
}

std::string Tokenizer::getEncodingName() const {
    return encodingName_;
}

std::vector<std::string> Tokenizer::getSupportedEncodings() {
    return {"cl100k_base", "p50k_base", "p50k_edit", "r50k_base", "o200k_base", "gpt2", "char_ratio"};
}

TokenizerEncoding Tokenizer::encodingFromString(const std::string& encodingName) {
    auto it = encodingMap_.find(encodingName);
    if (it != encodingMap_.end()) {
        return it->second;
    }
    throw std::runtime_error("Unsupported encoding name: " + encodingName);
}

std::string Tokenizer::encodingToString(TokenizerEncoding encoding) {
    switch (encoding) {
        case TokenizerEncoding::CL100K_BASE:
            return "cl100k_base";
        case TokenizerEncoding::P50K_BASE:
            return "p50k_base";
        case TokenizerEncoding::P50K_EDIT:
            return "p50k_edit";
        case TokenizerEncoding::R50K_BASE:
            return "r50k_base";
        case TokenizerEncoding::O200K_BASE:
            return "o200k_base";
        case TokenizerEncoding::CHAR_RATIO:
            return "char_ratio";
        default:
            throw std::runtime_error("Unknown encoding enum value");
    }
}
