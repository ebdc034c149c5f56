#include "tokenizer.hpp"

namespace toktrans {

std::optional<std::string> Tokenizer::special_role(TokenType token) const {
    for (const auto& [role, special] : special_tokens()) {
        if (special.id == token) {
            return role;
        }
    }
    return std::nullopt;
}

TokenSequence token_ids(const std::vector<TokenSpan>& spans) {
    TokenSequence result;
    result.reserve(spans.size());
    for (const auto& span : spans) {
        result.push_back(span.id);
    }
    return result;
}

OffsetMapping offsets(const std::vector<TokenSpan>& spans) {
    OffsetMapping result;
    result.reserve(spans.size());
    for (const auto& span : spans) {
        result.push_back({span.start, span.end});
    }
    return result;
}

} // namespace toktrans
