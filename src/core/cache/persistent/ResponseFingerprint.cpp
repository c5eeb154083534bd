#include "core/cache/persistent/ResponseFingerprint.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <openssl/sha.h>

namespace fanws {
namespace core {
namespace cache {

namespace {

inline bool isContinuationByte(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

} // namespace

ContextFingerprint::ContextFingerprint(const ResponseCacheConfig& config)
    : recentContentExcerpt_(config.recentContentExcerpt)
    , outlineExcerpt_(config.outlineExcerpt)
    , maxCharacters_(config.maxCharacters) {
}

std::string ContextFingerprint::utf8Tail(const std::string& text, size_t maxBytes) {
    if (text.size() <= maxBytes) return text;
    size_t start = text.size() - maxBytes;
    while (start < text.size() && isContinuationByte(static_cast<unsigned char>(text[start]))) {
        ++start;
    }
    return text.substr(start);
}

std::string ContextFingerprint::utf8Head(const std::string& text, size_t maxBytes) {
    if (text.size() <= maxBytes) return text;
    size_t end = maxBytes;
    while (end > 0 && isContinuationByte(static_cast<unsigned char>(text[end]))) {
        --end;
    }
    return text.substr(0, end);
}

std::string ContextFingerprint::sha256Hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256_CTX sha256;
    SHA256_Init(&sha256);
    SHA256_Update(&sha256, data.data(), data.size());
    SHA256_Final(hash, &sha256);

    std::stringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

nlohmann::json ContextFingerprint::canonicalize(const RequestDescriptor& request,
                                                const PromptContext& context) const {
    std::vector<std::string> characters(
        context.characters.begin(),
        context.characters.begin() + std::min(maxCharacters_, context.characters.size()));

    // Пустые поля в промпт не подставляются, поэтому и в отпечаток не входят
    nlohmann::json ctx = nlohmann::json::object();
    if (!context.projectName.empty()) ctx["project_name"] = context.projectName;
    if (!context.genre.empty()) ctx["genre"] = context.genre;
    if (!context.style.empty()) ctx["style"] = context.style;
    if (!context.targetAudience.empty()) ctx["target_audience"] = context.targetAudience;
    if (!context.themes.empty()) ctx["themes"] = context.themes;
    if (!context.setting.empty()) ctx["setting"] = context.setting;
    if (!characters.empty()) ctx["characters"] = characters;
    if (!context.recentContent.empty()) {
        ctx["recent_content"] = utf8Tail(context.recentContent, recentContentExcerpt_);
    }
    if (!context.outline.empty()) {
        ctx["outline"] = utf8Head(context.outline, outlineExcerpt_);
    }

    return {
        {"api", request.provider},
        {"endpoint", request.endpoint},
        {"data", request.parameters.is_null() ? nlohmann::json::object() : request.parameters},
        {"project_context", ctx}
    };
}

std::string ContextFingerprint::compute(const RequestDescriptor& request,
                                        const PromptContext& context) const {
    return sha256Hex(canonicalize(request, context).dump());
}

} // namespace cache
} // namespace core
} // namespace fanws
