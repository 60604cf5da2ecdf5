#pragma once

#include <torch/torch.h>

#include <cstdint>
#include <string>
#include <variant>

namespace chatbot {

enum class AttentionMethod { Dot, General, Concat };

// "dot", "general" or "concat"; anything else throws ValidationError.
AttentionMethod parse_attention_method(const std::string& name);
std::string to_string(AttentionMethod method);

// Luong scores. All take hidden [1, B, H] and encoder_outputs [T, B, H]
// and return unnormalized energies [T, B].
struct DotScore {
    torch::Tensor operator()(const torch::Tensor& hidden, const torch::Tensor& encoder_outputs) const;
};

struct GeneralScoreImpl : torch::nn::Module {
    torch::nn::Linear attn{nullptr};

    explicit GeneralScoreImpl(int64_t hidden_size);
    torch::Tensor forward(const torch::Tensor& hidden, const torch::Tensor& encoder_outputs);
};
TORCH_MODULE(GeneralScore);

struct ConcatScoreImpl : torch::nn::Module {
    torch::nn::Linear attn{nullptr};
    torch::Tensor v; // [H]

    explicit ConcatScoreImpl(int64_t hidden_size);
    torch::Tensor forward(const torch::Tensor& hidden, const torch::Tensor& encoder_outputs);
};
TORCH_MODULE(ConcatScore);

// Attention weights of one decoder state over all encoder timesteps.
// Padding positions are not masked; a caller attending over a padded batch
// has to suppress them itself.
struct AttentionImpl : torch::nn::Module {
    AttentionImpl(AttentionMethod method, int64_t hidden_size);
    AttentionImpl(const std::string& method, int64_t hidden_size)
        : AttentionImpl(parse_attention_method(method), hidden_size) {}

    // hidden: [1, B, H], encoder_outputs: [T, B, H]
    // Returns: softmax weights [B, 1, T]
    torch::Tensor forward(const torch::Tensor& hidden, const torch::Tensor& encoder_outputs);

    AttentionMethod method() const { return method_; }
    int64_t hidden_size() const { return hidden_size_; }

private:
    AttentionMethod method_;
    int64_t hidden_size_;
    std::variant<DotScore, GeneralScore, ConcatScore> score_;
};
TORCH_MODULE(Attention);

} // namespace chatbot
