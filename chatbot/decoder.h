#pragma once

#include "chatbot/attention.h"

#include <torch/torch.h>

#include <cstdint>
#include <string>
#include <tuple>

namespace chatbot {

// One decoding timestep with Luong global attention. The caller owns the
// loop (teacher forcing or free running) and passes the hidden state back in.
struct LuongAttnDecoderRNNImpl : torch::nn::Module {
    torch::nn::Embedding embedding{nullptr};
    torch::nn::Dropout embedding_dropout{nullptr};
    torch::nn::GRU gru{nullptr};
    Attention attn{nullptr};
    torch::nn::Linear concat{nullptr}; // [h_t; c_t] -> H
    torch::nn::Linear out{nullptr};    // H -> vocabulary
    int64_t hidden_size;
    int64_t output_size;
    int64_t n_layers;

    LuongAttnDecoderRNNImpl(const std::string& attn_method, torch::nn::Embedding embedding, int64_t hidden_size,
                            int64_t output_size, int64_t n_layers = 1, double dropout = 0.1);

    // input_step: [1, B] token ids
    // last_hidden: [n_layers, B, H]
    // encoder_outputs: [T, B, H]
    // Returns: probabilities [B, output_size], hidden [n_layers, B, H]
    // Target-side PAD positions are not masked; use the batch mask when scoring.
    std::tuple<torch::Tensor, torch::Tensor> forward(const torch::Tensor& input_step, const torch::Tensor& last_hidden,
                                                     const torch::Tensor& encoder_outputs);
};
TORCH_MODULE(LuongAttnDecoderRNN);

} // namespace chatbot
