#include "alignment.hpp"
#include "errors.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace toktrans {

namespace {

using Replacement = std::pair<std::string, std::string>;

// Standard special text -> foreign special text of the same role ("" when absent)
std::vector<Replacement> special_replacements(const Tokenizer& std_tok, const Tokenizer& foreign_tok) {
    SpecialTokenMap std_special = std_tok.special_tokens();
    SpecialTokenMap foreign_special = foreign_tok.special_tokens();

    std::vector<Replacement> replacements;
    for (const auto& [role, special] : std_special) {
        if (special.text.empty()) {
            continue;
        }
        auto it = foreign_special.find(role);
        std::string replacement = it != foreign_special.end() ? it->second.text : std::string();
        if (replacement == special.text) {
            continue;
        }
        bool duplicate = std::any_of(replacements.begin(), replacements.end(),
                                     [&](const Replacement& r) { return r.first == special.text; });
        if (!duplicate) {
            replacements.push_back({special.text, replacement});
        }
    }

    std::stable_sort(replacements.begin(), replacements.end(),
                     [](const Replacement& a, const Replacement& b) { return a.first.size() > b.first.size(); });
    return replacements;
}

SpecialTextRewrite rewrite_text(const std::string& text, const std::vector<Replacement>& replacements) {
    SpecialTextRewrite rewrite;
    std::size_t pos = 0;

    while (pos < text.size()) {
        std::size_t found = std::string::npos;
        const Replacement* match = nullptr;
        for (const auto& replacement : replacements) {
            std::size_t at = text.find(replacement.first, pos);
            if (at != std::string::npos && (found == std::string::npos || at < found)) {
                found = at;
                match = &replacement;
            }
        }

        if (!match) {
            rewrite.text.append(text, pos, std::string::npos);
            break;
        }

        rewrite.text.append(text, pos, found - pos);
        std::size_t rewritten_start = rewrite.text.size();
        rewrite.text += match->second;
        rewrite.corrections.push_back({found, found + match->first.size(), rewritten_start, rewrite.text.size()});
        pos = found + match->first.size();
    }

    return rewrite;
}

void check_corrections(const SpecialTextRewrite& rewrite) {
    long long shift = 0;
    std::size_t last_orig = 0;
    std::size_t last_rewritten = 0;

    for (const auto& c : rewrite.corrections) {
        if (c.orig_start > c.orig_end || c.rewritten_start > c.rewritten_end) {
            throw OffsetMisalignment("correction span is reversed");
        }
        if (c.rewritten_end > rewrite.text.size()) {
            throw OffsetMisalignment("correction ends at " + std::to_string(c.rewritten_end) +
                                     " beyond rewritten text of length " + std::to_string(rewrite.text.size()));
        }
        if (c.orig_start < last_orig || c.rewritten_start < last_rewritten) {
            throw OffsetMisalignment("correction table is not sorted");
        }
        long long expected = static_cast<long long>(c.rewritten_start) + shift;
        if (static_cast<long long>(c.orig_start) != expected) {
            throw OffsetMisalignment("correction at original offset " + std::to_string(c.orig_start) +
                                     " disagrees with the accumulated shift");
        }
        shift = static_cast<long long>(c.orig_end) - static_cast<long long>(c.rewritten_end);
        last_orig = c.orig_end;
        last_rewritten = c.rewritten_end;
    }
}

std::size_t shifted(std::size_t pos, long long shift) {
    return static_cast<std::size_t>(static_cast<long long>(pos) + shift);
}

// A token starting at pos: starts after every replacement ending at or before pos
std::size_t map_start(std::size_t pos, const std::vector<OffsetCorrection>& corrections) {
    long long shift = 0;
    for (const auto& c : corrections) {
        if (c.rewritten_end <= pos) {
            shift = static_cast<long long>(c.orig_end) - static_cast<long long>(c.rewritten_end);
            continue;
        }
        if (c.rewritten_start < pos) {
            return c.orig_start;
        }
        break;
    }
    return shifted(pos, shift);
}

// A token ending at pos: stays before a removed span sitting exactly at pos
std::size_t map_end(std::size_t pos, const std::vector<OffsetCorrection>& corrections) {
    long long shift = 0;
    for (const auto& c : corrections) {
        bool removed = c.rewritten_start == c.rewritten_end;
        if (c.rewritten_end < pos || (c.rewritten_end == pos && !removed)) {
            shift = static_cast<long long>(c.orig_end) - static_cast<long long>(c.rewritten_end);
            continue;
        }
        if (c.rewritten_start < pos) {
            return c.orig_end;
        }
        break;
    }
    return shifted(pos, shift);
}

} // namespace

std::vector<SpecialTextRewrite> translate_special_token_text(const std::vector<std::string>& texts,
                                                             const Tokenizer& std_tok,
                                                             const Tokenizer& foreign_tok) {
    std::vector<Replacement> replacements = special_replacements(std_tok, foreign_tok);

    std::vector<SpecialTextRewrite> rewrites;
    rewrites.reserve(texts.size());
    for (const auto& text : texts) {
        rewrites.push_back(rewrite_text(text, replacements));
    }
    return rewrites;
}

void check_offsets(const OffsetMapping& offsets, std::size_t text_length) {
    std::size_t last_start = 0;
    for (std::size_t i = 0; i < offsets.size(); ++i) {
        const auto& offset = offsets[i];
        if (offset.start > offset.end || offset.end > text_length) {
            throw OffsetMisalignment("offset " + std::to_string(i) + " [" + std::to_string(offset.start) + ", " +
                                     std::to_string(offset.end) + ") does not fit text of length " +
                                     std::to_string(text_length));
        }
        if (offset.start < last_start) {
            throw OffsetMisalignment("offset " + std::to_string(i) + " starts before its predecessor");
        }
        last_start = offset.start;
    }
}

OffsetMapping pad_offsets(const OffsetMapping& offsets, const SpecialTextRewrite& rewrite) {
    check_corrections(rewrite);
    check_offsets(offsets, rewrite.text.size());

    if (rewrite.corrections.empty()) {
        return offsets;
    }

    OffsetMapping padded;
    padded.reserve(offsets.size());
    for (const auto& offset : offsets) {
        std::size_t start = map_start(offset.start, rewrite.corrections);
        std::size_t end = offset.start == offset.end ? start : map_end(offset.end, rewrite.corrections);
        padded.push_back({start, std::max(start, end)});
    }
    return padded;
}

AlignedBatch align_batch(const std::vector<std::string>& texts,
                         const Tokenizer& std_tok,
                         const Tokenizer& foreign_tok,
                         bool debug) {
    std::vector<SpecialTextRewrite> rewrites = translate_special_token_text(texts, std_tok, foreign_tok);

    AlignedBatch batch;
    batch.std_ids.resize(texts.size());
    batch.std_offsets.resize(texts.size());
    batch.foreign_texts.resize(texts.size());
    batch.foreign_ids.resize(texts.size());
    batch.foreign_offsets.resize(texts.size());
    batch.errors.resize(texts.size());

    for (std::size_t b = 0; b < texts.size(); ++b) {
        try {
            auto std_spans = std_tok.encode(texts[b]);
            OffsetMapping std_offsets = offsets(std_spans);
            check_offsets(std_offsets, texts[b].size());

            auto foreign_spans = foreign_tok.encode(rewrites[b].text);
            OffsetMapping foreign_offsets = pad_offsets(offsets(foreign_spans), rewrites[b]);

            batch.std_ids[b] = token_ids(std_spans);
            batch.std_offsets[b] = std::move(std_offsets);
            batch.foreign_texts[b] = rewrites[b].text;
            batch.foreign_ids[b] = token_ids(foreign_spans);
            batch.foreign_offsets[b] = std::move(foreign_offsets);
        } catch (const OffsetMisalignment& e) {
            batch.errors[b] = std::string("offset misalignment: ") + e.what();
            if (debug) {
                std::cout << "align_batch - Element " << b << " dropped, " << batch.errors[b] << std::endl;
            }
        }
    }

    return batch;
}

} // namespace toktrans
