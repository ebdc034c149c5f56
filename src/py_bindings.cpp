#include <nanobind/nanobind.h>
#include <nanobind/ndarray.h>
#include <nanobind/operators.h>
#include <nanobind/trampoline.h>
#include <nanobind/stl/map.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/pair.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/tuple.h>
#include <nanobind/stl/vector.h>

#include "alignment.hpp"
#include "bpe.hpp"
#include "equivalence.hpp"
#include "errors.hpp"
#include "loss.hpp"
#include "session.hpp"
#include "topk_codec.hpp"

#include <algorithm>
#include <fstream>
#include <memory>

namespace nb = nanobind;
using namespace nb::literals;
using namespace toktrans;

using InputArray = nb::ndarray<const float, nb::ndim<3>, nb::c_contig, nb::device::cpu>;
using OutputArray = nb::ndarray<nb::numpy, float, nb::ndim<3>>;

// Helper functions for type conversion
Tensor3 to_tensor(const InputArray& array) {
    Tensor3 tensor(array.shape(0), array.shape(1), array.shape(2));
    std::copy(array.data(), array.data() + tensor.values.size(), tensor.values.begin());
    return tensor;
}

OutputArray to_numpy(Tensor3&& tensor) {
    // The capsule takes ownership of the buffer
    Tensor3* owned = std::make_unique<Tensor3>(std::move(tensor)).release();
    nb::capsule owner(owned, [](void* p) noexcept { std::unique_ptr<Tensor3> doomed(static_cast<Tensor3*>(p)); });
    return OutputArray(owned->values.data(), {owned->batch, owned->sequence, owned->width}, owner);
}

// Lets Python classes implement the tokenizer interface
class PyTokenizer : public Tokenizer {
public:
    NB_TRAMPOLINE(Tokenizer, 4);

    std::vector<TokenSpan> encode(const std::string& text) const override {
        NB_OVERRIDE_PURE(encode, text);
    }

    std::string decode(const TokenSequence& tokens) const override {
        NB_OVERRIDE_PURE(decode, tokens);
    }

    std::size_t vocab_size() const override {
        NB_OVERRIDE_PURE(vocab_size);
    }

    SpecialTokenMap special_tokens() const override {
        NB_OVERRIDE_PURE(special_tokens);
    }
};

nb::tuple translate_wrapper(TranslationSession& self,
                            const InputArray& foreign,
                            const AlignedBatch& batch,
                            const Tokenizer& foreign_tok,
                            const Tokenizer& std_tok) {
    Tensor3 input = to_tensor(foreign);
    TranslationResult result;
    {
        nb::gil_scoped_release release;
        result = self.translate(input, batch, foreign_tok, std_tok);
    }
    return nb::make_tuple(to_numpy(std::move(result.probs)), result.elements, result.stats);
}

void save_wrapper(const BpeTokenizer& self, const std::string& path) {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("cannot open " + path + " for writing");
    }
    self.save(out);
}

BpeTokenizer load_wrapper(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("cannot open " + path);
    }
    return BpeTokenizer::load(in);
}

/**
 * Python module 'toktrans': the top-k wire codec plus cross-tokenizer
 * translation of next-token distributions.
 */
NB_MODULE(toktrans, m) {
    m.doc() = "Cross-tokenizer probability translation";

    nb::exception<InvalidK>(m, "InvalidK", PyExc_ValueError);
    nb::exception<ShapeMismatch>(m, "ShapeMismatch", PyExc_ValueError);
    nb::exception<OffsetMisalignment>(m, "OffsetMisalignment", PyExc_RuntimeError);
    nb::exception<TranslationMapMiss>(m, "TranslationMapMiss", PyExc_RuntimeError);

    m.attr("EPSILON") = kEpsilon;

    // Codec and loss
    m.def("encode_topk", [](const InputArray& probs, int k) { return to_numpy(encode_topk(to_tensor(probs), k)); },
          "probs"_a, "k"_a);
    m.def("decode_topk",
          [](const InputArray& encoded, std::size_t vocab_size, int k) {
              return to_numpy(decode_topk(to_tensor(encoded), vocab_size, k));
          },
          "encoded"_a, "vocab_size"_a, "k"_a);
    m.def("decode_topk_logits",
          [](const InputArray& encoded, std::size_t vocab_size, int k) {
              return to_numpy(decode_topk_logits(to_tensor(encoded), vocab_size, k));
          },
          "encoded"_a, "vocab_size"_a, "k"_a);
    m.def("encode_logits_topk",
          [](const InputArray& logits, int k) { return to_numpy(encode_logits_topk(to_tensor(logits), k)); },
          "logits"_a, "k"_a);
    m.def("softmax", [](const InputArray& logits) { return to_numpy(softmax(to_tensor(logits))); }, "logits"_a);
    m.def("probs_to_logits", [](const InputArray& probs) { return to_numpy(probs_to_logits(to_tensor(probs))); },
          "probs"_a);
    m.def("causal_lm_loss",
          [](const InputArray& logits, const std::vector<TokenSequence>& labels) {
              return causal_lm_loss(to_tensor(logits), labels);
          },
          "logits"_a, "labels"_a);
    m.def("causal_lm_nll",
          [](const InputArray& logits, const std::vector<TokenSequence>& labels) {
              return causal_lm_nll(to_tensor(logits), labels);
          },
          "logits"_a, "labels"_a);

    // Tokenizers
    nb::class_<TokenSpan>(m, "TokenSpan")
        .def(nb::init<TokenType, std::size_t, std::size_t>(), "id"_a, "start"_a, "end"_a)
        .def_rw("id", &TokenSpan::id)
        .def_rw("start", &TokenSpan::start)
        .def_rw("end", &TokenSpan::end)
        .def(nb::self == nb::self);

    nb::class_<Offset>(m, "Offset")
        .def(nb::init<std::size_t, std::size_t>(), "start"_a, "end"_a)
        .def_rw("start", &Offset::start)
        .def_rw("end", &Offset::end);

    nb::class_<SpecialToken>(m, "SpecialToken")
        .def(nb::init<std::string, TokenType>(), "text"_a, "id"_a)
        .def_rw("text", &SpecialToken::text)
        .def_rw("id", &SpecialToken::id);

    nb::class_<Tokenizer, PyTokenizer>(m, "Tokenizer")
        .def(nb::init<>())
        .def("encode", &Tokenizer::encode, "text"_a)
        .def("decode", &Tokenizer::decode, "tokens"_a)
        .def("vocab_size", &Tokenizer::vocab_size)
        .def("special_tokens", &Tokenizer::special_tokens)
        .def("decode_token", &Tokenizer::decode_token, "token"_a)
        .def("special_role", &Tokenizer::special_role, "token"_a);

    nb::class_<BpeTokenizer, Tokenizer>(m, "BpeTokenizer")
        .def(nb::init<const std::vector<TokenPair>&, const std::map<std::string, std::string>&>(),
             "merges"_a = std::vector<TokenPair>(), "special_texts"_a = std::map<std::string, std::string>())
        .def("learn", &BpeTokenizer::learn, "corpus"_a, "max_merges"_a, "debug"_a = false)
        .def("merges", &BpeTokenizer::merges)
        .def("save", &save_wrapper, "path"_a)
        .def_static("load", &load_wrapper, "path"_a);

    m.def("check_tokenizer_equivalence",
          nb::overload_cast<const Tokenizer&, const Tokenizer&>(&check_tokenizer_equivalence), "a"_a, "b"_a);

    // Alignment
    nb::class_<AlignedBatch>(m, "AlignedBatch")
        .def_ro("std_ids", &AlignedBatch::std_ids)
        .def_ro("std_offsets", &AlignedBatch::std_offsets)
        .def_ro("foreign_texts", &AlignedBatch::foreign_texts)
        .def_ro("foreign_ids", &AlignedBatch::foreign_ids)
        .def_ro("foreign_offsets", &AlignedBatch::foreign_offsets)
        .def_ro("errors", &AlignedBatch::errors)
        .def("__len__", &AlignedBatch::size)
        .def("ok", &AlignedBatch::ok, "index"_a);

    m.def("align_batch", &align_batch, "texts"_a, "std_tok"_a, "foreign_tok"_a, "debug"_a = false);

    // Translation
    nb::enum_<InputKind>(m, "InputKind")
        .value("Probabilities", InputKind::Probabilities)
        .value("Logits", InputKind::Logits);

    nb::enum_<MissPolicy>(m, "MissPolicy")
        .value("Drop", MissPolicy::Drop)
        .value("FloorFill", MissPolicy::FloorFill)
        .value("Error", MissPolicy::Error);

    nb::class_<TranslationConfig>(m, "TranslationConfig")
        .def(nb::init<>())
        .def_rw("input", &TranslationConfig::input)
        .def_rw("miss_policy", &TranslationConfig::miss_policy)
        .def_rw("skip_equivalent", &TranslationConfig::skip_equivalent)
        .def_rw("debug", &TranslationConfig::debug);

    nb::class_<TranslationStats>(m, "TranslationStats")
        .def_ro("rows", &TranslationStats::rows)
        .def_ro("unanchored_rows", &TranslationStats::unanchored_rows)
        .def_ro("partial_rows", &TranslationStats::partial_rows)
        .def_ro("missed_tokens", &TranslationStats::missed_tokens)
        .def_ro("missed_mass", &TranslationStats::missed_mass)
        .def_ro("failed_elements", &TranslationStats::failed_elements)
        .def_ro("fast_path", &TranslationStats::fast_path);

    nb::class_<ElementStatus>(m, "ElementStatus")
        .def_ro("ok", &ElementStatus::ok)
        .def_ro("error", &ElementStatus::error);

    nb::class_<TranslationSession>(m, "TranslationSession")
        .def(nb::init<TranslationConfig>(), "config"_a = TranslationConfig())
        .def("translate", &translate_wrapper, "foreign"_a, "batch"_a, "foreign_tok"_a, "std_tok"_a,
             nb::keep_alive<1, 4>(), nb::keep_alive<1, 5>())
        .def("equivalent", &TranslationSession::equivalent, "a"_a, "b"_a,
             nb::keep_alive<1, 2>(), nb::keep_alive<1, 3>())
        .def_prop_rw("config", &TranslationSession::config, &TranslationSession::set_config)
        .def("map_count", &TranslationSession::map_count)
        .def("clear", &TranslationSession::clear);
}
