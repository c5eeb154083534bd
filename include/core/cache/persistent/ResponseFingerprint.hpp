#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/cache/metrics/CacheConfig.hpp"

namespace fanws {
namespace core {
namespace cache {

// Канонический запрос к AI-провайдеру
struct RequestDescriptor {
    std::string provider;          // openai, anthropic, ...
    std::string endpoint;          // /chat/completions
    nlohmann::json parameters = nlohmann::json::object();  // model, prompt, max_tokens, ...
};

// Поля проекта, которые подставляются в промпт
struct PromptContext {
    std::string projectName;
    std::string genre;
    std::string style;
    std::string targetAudience;
    std::vector<std::string> themes;
    std::string setting;
    std::vector<std::string> characters;
    std::string recentContent;     // Полный текст; в отпечаток попадает только хвост
    std::string outline;           // Полный план; в отпечаток попадает только начало
};

/**
 * @brief Отпечаток запроса с учётом контекста проекта.
 * @details Канонизация: JSON с отсортированными ключами (nlohmann::json хранит объекты
 *          упорядоченно), затем SHA-256 в hex. В отпечаток входят только те фрагменты
 *          контекста, которые реально подставляются в промпт, поэтому любое изменение
 *          подставляемого фрагмента даёт новый ключ.
 */
class ContextFingerprint {
public:
    explicit ContextFingerprint(const ResponseCacheConfig& config = ResponseCacheConfig{});

    std::string compute(const RequestDescriptor& request, const PromptContext& context) const;
    nlohmann::json canonicalize(const RequestDescriptor& request, const PromptContext& context) const;

    // Ограниченные фрагменты, разрезанные по границе символа UTF-8
    static std::string utf8Tail(const std::string& text, size_t maxBytes);
    static std::string utf8Head(const std::string& text, size_t maxBytes);

    static std::string sha256Hex(const std::string& data);

private:
    size_t recentContentExcerpt_;
    size_t outlineExcerpt_;
    size_t maxCharacters_;
};

} // namespace cache
} // namespace core
} // namespace fanws
