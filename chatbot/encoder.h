#pragma once

#include <torch/torch.h>

#include <cstdint>
#include <tuple>

namespace chatbot {

// Bidirectional GRU over a padded, length-sorted batch. The two directions
// are summed, so outputs keep the hidden width of the embedding.
struct EncoderRNNImpl : torch::nn::Module {
    torch::nn::Embedding embedding{nullptr}; // Shared with the decoder, embedding dim == hidden_size
    torch::nn::GRU gru{nullptr};
    int64_t hidden_size;
    int64_t n_layers;

    EncoderRNNImpl(int64_t hidden_size, torch::nn::Embedding embedding, int64_t n_layers = 1, double dropout = 0.0);

    // input_seq: [T, B] token ids, input_lengths: [B] non-increasing
    // Returns: outputs [T, B, H], hidden [2 * n_layers, B, H]
    // Steps past an item's length hold zeros; nothing here masks them.
    std::tuple<torch::Tensor, torch::Tensor> forward(const torch::Tensor& input_seq, const torch::Tensor& input_lengths,
                                                     torch::Tensor hidden = {});
};
TORCH_MODULE(EncoderRNN);

} // namespace chatbot
