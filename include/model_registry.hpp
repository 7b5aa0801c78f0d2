#pragma once

#include <string>
#include "tokenizer.hpp"

// Everything the pipeline needs to know about the target model, resolved
// once when configuration loads
struct ModelDescriptor {
    std::string modelId;
    size_t maxContext = 0;
    TokenizerEncoding encoding = TokenizerEncoding::CHAR_RATIO;
    bool known = false;         // False when maxContext came from the configured fallback
};

class ModelRegistry {
public:
    // Look up a model's context window and tokenizer. Unknown models get
    // `fallbackMaxTokens` and the character-ratio estimator.
    static ModelDescriptor resolve(const std::string& modelId, size_t fallbackMaxTokens);

    // Context window for a known model, 0 when unknown
    static size_t maxTokensFor(const std::string& modelId);

    // Strip provider prefixes such as "openai/" and "azure/"
    static std::string normalizeModelName(const std::string& modelId);
};
