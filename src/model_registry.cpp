#include "model_registry.hpp"
#include <unordered_map>
#include <vector>

namespace {

struct ModelInfo {
    size_t maxContext;
    TokenizerEncoding encoding;
};

bool startsWith(const std::string& value, const std::string& prefix) {
    return value.rfind(prefix, 0) == 0;
}

bool contains(const std::string& value, const std::string& needle) {
    return value.find(needle) != std::string::npos;
}

// Exact model names
const std::unordered_map<std::string, ModelInfo>& exactModels() {
    static const std::unordered_map<std::string, ModelInfo> models = {
        // GPT-3.5
        {"gpt-3.5-turbo", {16000, TokenizerEncoding::CL100K_BASE}},
        {"gpt-3.5-turbo-0125", {16000, TokenizerEncoding::CL100K_BASE}},
        {"gpt-3.5-turbo-1106", {16000, TokenizerEncoding::CL100K_BASE}},
        {"gpt-3.5-turbo-16k", {16000, TokenizerEncoding::CL100K_BASE}},
        {"gpt-3.5-turbo-16k-0613", {16000, TokenizerEncoding::CL100K_BASE}},
        {"gpt-3.5-turbo-0613", {4000, TokenizerEncoding::CL100K_BASE}},

        // GPT-4
        {"gpt-4", {8000, TokenizerEncoding::CL100K_BASE}},
        {"gpt-4-0613", {8000, TokenizerEncoding::CL100K_BASE}},
        {"gpt-4-32k", {32000, TokenizerEncoding::CL100K_BASE}},
        {"gpt-4-1106-preview", {128000, TokenizerEncoding::CL100K_BASE}},
        {"gpt-4-0125-preview", {128000, TokenizerEncoding::CL100K_BASE}},
        {"gpt-4-turbo-preview", {128000, TokenizerEncoding::CL100K_BASE}},
        {"gpt-4-turbo-2024-04-09", {128000, TokenizerEncoding::CL100K_BASE}},
        {"gpt-4-turbo", {128000, TokenizerEncoding::CL100K_BASE}},

        // GPT-4o
        {"gpt-4o", {128000, TokenizerEncoding::O200K_BASE}},
        {"gpt-4o-2024-05-13", {128000, TokenizerEncoding::O200K_BASE}},
        {"gpt-4o-mini", {128000, TokenizerEncoding::O200K_BASE}},
        {"gpt-4o-mini-2024-07-18", {128000, TokenizerEncoding::O200K_BASE}},
        {"gpt-4o-2024-08-06", {128000, TokenizerEncoding::O200K_BASE}},
        {"gpt-4o-2024-11-20", {128000, TokenizerEncoding::O200K_BASE}},
        {"gpt-4.5-preview", {128000, TokenizerEncoding::O200K_BASE}},
        {"gpt-4.5-preview-2025-02-27", {128000, TokenizerEncoding::O200K_BASE}},

        // GPT-4.1
        {"gpt-4.1", {1047576, TokenizerEncoding::O200K_BASE}},
        {"gpt-4.1-2025-04-14", {1047576, TokenizerEncoding::O200K_BASE}},
        {"gpt-4.1-mini", {1047576, TokenizerEncoding::O200K_BASE}},
        {"gpt-4.1-mini-2025-04-14", {1047576, TokenizerEncoding::O200K_BASE}},
        {"gpt-4.1-nano", {1047576, TokenizerEncoding::O200K_BASE}},
        {"gpt-4.1-nano-2025-04-14", {1047576, TokenizerEncoding::O200K_BASE}},

        // GPT-5
        {"gpt-5", {200000, TokenizerEncoding::O200K_BASE}},
        {"gpt-5-2025-08-07", {200000, TokenizerEncoding::O200K_BASE}},
        {"gpt-5-mini", {200000, TokenizerEncoding::O200K_BASE}},
        {"gpt-5-nano", {200000, TokenizerEncoding::O200K_BASE}},
        {"gpt-5.1", {200000, TokenizerEncoding::O200K_BASE}},
        {"gpt-5.1-2025-11-13", {200000, TokenizerEncoding::O200K_BASE}},
        {"gpt-5.1-chat-latest", {200000, TokenizerEncoding::O200K_BASE}},
        {"gpt-5.1-codex", {200000, TokenizerEncoding::O200K_BASE}},
        {"gpt-5.1-codex-mini", {200000, TokenizerEncoding::O200K_BASE}},
        {"gpt-5.2", {400000, TokenizerEncoding::O200K_BASE}},
        {"gpt-5.2-2025-12-11", {400000, TokenizerEncoding::O200K_BASE}},
        {"gpt-5.2-codex", {400000, TokenizerEncoding::O200K_BASE}},
        {"gpt-5.2-chat-latest", {128000, TokenizerEncoding::O200K_BASE}},

        // o-series reasoning models
        {"o1-mini", {128000, TokenizerEncoding::O200K_BASE}},
        {"o1-mini-2024-09-12", {128000, TokenizerEncoding::O200K_BASE}},
        {"o1-preview", {128000, TokenizerEncoding::O200K_BASE}},
        {"o1-preview-2024-09-12", {128000, TokenizerEncoding::O200K_BASE}},
        {"o1", {204800, TokenizerEncoding::O200K_BASE}},
        {"o1-2024-12-17", {204800, TokenizerEncoding::O200K_BASE}},
        {"o3-mini", {204800, TokenizerEncoding::O200K_BASE}},
        {"o3-mini-2025-01-31", {204800, TokenizerEncoding::O200K_BASE}},
        {"o3", {200000, TokenizerEncoding::O200K_BASE}},
        {"o3-2025-04-16", {200000, TokenizerEncoding::O200K_BASE}},
        {"o4-mini", {200000, TokenizerEncoding::O200K_BASE}},
        {"o4-mini-2025-04-16", {200000, TokenizerEncoding::O200K_BASE}},

        // Other providers
        {"deepseek/deepseek-chat", {128000, TokenizerEncoding::O200K_BASE}},
        {"deepseek/deepseek-reasoner", {64000, TokenizerEncoding::O200K_BASE}},
        {"mistral/open-codestral-mamba", {256000, TokenizerEncoding::O200K_BASE}}
    };
    return models;
}

// Model families matched by substring or prefix, checked in order.
// Models outside the OpenAI family have no public BPE table; o200k_base
// is the closest approximation.
struct FamilyRule {
    enum class Match { Contains, Prefix };
    Match match;
    std::string pattern;
    ModelInfo info;
};

const std::vector<FamilyRule>& familyRules() {
    static const std::vector<FamilyRule> rules = {
        {FamilyRule::Match::Contains, "claude-opus-4", {200000, TokenizerEncoding::O200K_BASE}},
        {FamilyRule::Match::Contains, "claude-sonnet-4", {200000, TokenizerEncoding::O200K_BASE}},
        {FamilyRule::Match::Contains, "claude-haiku-4", {200000, TokenizerEncoding::O200K_BASE}},
        {FamilyRule::Match::Contains, "claude-3-7-sonnet", {200000, TokenizerEncoding::O200K_BASE}},
        {FamilyRule::Match::Contains, "claude-3", {100000, TokenizerEncoding::O200K_BASE}},
        {FamilyRule::Match::Contains, "claude-2", {100000, TokenizerEncoding::O200K_BASE}},
        {FamilyRule::Match::Contains, "claude-instant", {100000, TokenizerEncoding::O200K_BASE}},
        {FamilyRule::Match::Prefix, "gemini/", {1048576, TokenizerEncoding::O200K_BASE}},
        {FamilyRule::Match::Contains, "gemini-", {1048576, TokenizerEncoding::O200K_BASE}},
        {FamilyRule::Match::Prefix, "groq/", {128000, TokenizerEncoding::O200K_BASE}},
        {FamilyRule::Match::Prefix, "xai/", {131072, TokenizerEncoding::O200K_BASE}},
        {FamilyRule::Match::Prefix, "mistral/", {128000, TokenizerEncoding::O200K_BASE}}
    };
    return rules;
}

const ModelInfo* lookup(const std::string& normalized) {
    const auto& models = exactModels();
    auto it = models.find(normalized);
    if (it != models.end()) {
        return &it->second;
    }

    for (const auto& rule : familyRules()) {
        const bool matched = rule.match == FamilyRule::Match::Prefix
            ? startsWith(normalized, rule.pattern)
            : contains(normalized, rule.pattern);
        if (matched) {
            return &rule.info;
        }
    }
    return nullptr;
}

}

std::string ModelRegistry::normalizeModelName(const std::string& modelId) {
    for (const std::string prefix : {"openai/", "azure/"}) {
        if (startsWith(modelId, prefix)) {
            return modelId.substr(prefix.size());
        }
    }
    return modelId;
}

size_t ModelRegistry::maxTokensFor(const std::string& modelId) {
    const ModelInfo* info = lookup(normalizeModelName(modelId));
    return info ? info->maxContext : 0;
}

ModelDescriptor ModelRegistry::resolve(const std::string& modelId, size_t fallbackMaxTokens) {
    ModelDescriptor descriptor;
    descriptor.modelId = modelId;

    if (const ModelInfo* info = lookup(normalizeModelName(modelId))) {
        descriptor.maxContext = info->maxContext;
        descriptor.encoding = info->encoding;
        descriptor.known = true;
    } else {
        descriptor.maxContext = fallbackMaxTokens;
        descriptor.encoding = TokenizerEncoding::CHAR_RATIO;
        descriptor.known = false;
    }

    return descriptor;
}
