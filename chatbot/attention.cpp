#include "chatbot/attention.h"

#include "chatbot/errors.h"

#include <cmath>

namespace chatbot {

namespace {

struct ScoreVisitor {
    const torch::Tensor& hidden;
    const torch::Tensor& encoder_outputs;

    torch::Tensor operator()(const DotScore& score) const { return score(hidden, encoder_outputs); }
    torch::Tensor operator()(GeneralScore& score) const { return score->forward(hidden, encoder_outputs); }
    torch::Tensor operator()(ConcatScore& score) const { return score->forward(hidden, encoder_outputs); }
};

} // namespace

AttentionMethod parse_attention_method(const std::string& name) {
    if (name == "dot") return AttentionMethod::Dot;
    if (name == "general") return AttentionMethod::General;
    if (name == "concat") return AttentionMethod::Concat;
    throw ValidationError("'" + name + "' is not a valid attention method (expected dot, general or concat)");
}

std::string to_string(AttentionMethod method) {
    switch (method) {
        case AttentionMethod::Dot: return "dot";
        case AttentionMethod::General: return "general";
        case AttentionMethod::Concat: return "concat";
    }
    return "unknown";
}

torch::Tensor DotScore::operator()(const torch::Tensor& hidden, const torch::Tensor& encoder_outputs) const {
    return torch::sum(hidden * encoder_outputs, /*dim=*/2);
}

GeneralScoreImpl::GeneralScoreImpl(int64_t hidden_size) {
    attn = register_module("attn", torch::nn::Linear(hidden_size, hidden_size));
}

torch::Tensor GeneralScoreImpl::forward(const torch::Tensor& hidden, const torch::Tensor& encoder_outputs) {
    torch::Tensor energy = attn(encoder_outputs); // [T, B, H]
    return torch::sum(hidden * energy, /*dim=*/2);
}

ConcatScoreImpl::ConcatScoreImpl(int64_t hidden_size) {
    attn = register_module("attn", torch::nn::Linear(hidden_size * 2, hidden_size));
    const double bound = 1.0 / std::sqrt(static_cast<double>(hidden_size));
    v = register_parameter("v", torch::empty({hidden_size}).uniform_(-bound, bound));
}

torch::Tensor ConcatScoreImpl::forward(const torch::Tensor& hidden, const torch::Tensor& encoder_outputs) {
    torch::Tensor expanded = hidden.expand({encoder_outputs.size(0), -1, -1}); // [T, B, H]
    torch::Tensor energy = torch::tanh(attn(torch::cat({expanded, encoder_outputs}, /*dim=*/2))); // [T, B, H]
    return torch::sum(v * energy, /*dim=*/2);
}

AttentionImpl::AttentionImpl(AttentionMethod method, int64_t hidden_size)
    : method_(method), hidden_size_(hidden_size) {
    switch (method_) {
        case AttentionMethod::Dot:
            break;
        case AttentionMethod::General:
            score_.emplace<GeneralScore>(register_module("score", GeneralScore(hidden_size)));
            break;
        case AttentionMethod::Concat:
            score_.emplace<ConcatScore>(register_module("score", ConcatScore(hidden_size)));
            break;
    }
}

torch::Tensor AttentionImpl::forward(const torch::Tensor& hidden, const torch::Tensor& encoder_outputs) {
    TORCH_CHECK(hidden.dim() == 3 && hidden.size(0) == 1, "attention expects a single decoder step [1, B, H], got ",
                hidden.sizes());
    TORCH_CHECK(encoder_outputs.dim() == 3 && encoder_outputs.size(2) == hidden_size_,
                "attention expects encoder outputs [T, B, ", hidden_size_, "], got ", encoder_outputs.sizes());

    torch::Tensor energies = std::visit(ScoreVisitor{hidden, encoder_outputs}, score_); // [T, B]
    return torch::softmax(energies.t(), /*dim=*/1).unsqueeze(1); // [B, 1, T]
}

} // namespace chatbot
