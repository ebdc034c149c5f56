#include "equivalence.hpp"

namespace toktrans {

const std::vector<std::string>& default_probe_texts() {
    static const std::vector<std::string> probes = {
        "The Three Laws of Robotics are a set of rules devised by Isaac Asimov.",
        "Die Drei Gesetze der Robotik (oft abgek\xC3\xBCrzt als Die Drei Gesetze) sind eine Reihe von Regeln.",
        "A robot may not injure a human being or, through inaction, allow a human being to come to harm.",
        "1942, 1950 and 2058 A.D.: 56th Edition, 3.14159 and 1,000,000",
        "  leading spaces,\ttabs\nand\n\nnewlines   trailing  ",
        "def f(x): return {'a': [x ** 2, x // 3]}  # comment",
        "\xE2\x80\x9CQuoted\xE2\x80\x9D \xE2\x80\x94 \xC3\xA9t\xC3\xA9, na\xC3\xAFve, \xE6\x97\xA5\xE6\x9C\xAC\xE8\xAA\x9E",
        "!!!???...;;;---",
    };
    return probes;
}

bool check_tokenizer_equivalence(const Tokenizer& a, const Tokenizer& b) {
    return check_tokenizer_equivalence(a, b, default_probe_texts());
}

bool check_tokenizer_equivalence(const Tokenizer& a, const Tokenizer& b, const std::vector<std::string>& probes) {
    if (&a == &b) {
        return true;
    }

    if (a.vocab_size() != b.vocab_size()) {
        return false;
    }

    SpecialTokenMap a_special = a.special_tokens();
    SpecialTokenMap b_special = b.special_tokens();
    if (a_special != b_special) {
        return false;
    }

    for (std::size_t id = 0; id < a.vocab_size(); ++id) {
        TokenType token = static_cast<TokenType>(id);
        if (a.decode_token(token) != b.decode_token(token)) {
            return false;
        }
    }

    std::vector<std::string> texts = probes;
    for (const auto& [role, special] : a_special) {
        texts.push_back("before " + special.text + " after");
    }

    for (const auto& text : texts) {
        if (a.encode(text) != b.encode(text)) {
            return false;
        }
    }

    return true;
}

} // namespace toktrans
