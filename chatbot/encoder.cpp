#include "chatbot/encoder.h"

namespace chatbot {

namespace rnn_utils = torch::nn::utils::rnn;

EncoderRNNImpl::EncoderRNNImpl(int64_t hidden_size, torch::nn::Embedding embedding, int64_t n_layers, double dropout)
    : hidden_size(hidden_size), n_layers(n_layers) {
    this->embedding = register_module("embedding", std::move(embedding));
    // Inter-layer dropout only makes sense with more than one layer
    gru = register_module("gru", torch::nn::GRU(torch::nn::GRUOptions(hidden_size, hidden_size)
                                                    .num_layers(n_layers)
                                                    .dropout(n_layers == 1 ? 0.0 : dropout)
                                                    .bidirectional(true)));
}

std::tuple<torch::Tensor, torch::Tensor> EncoderRNNImpl::forward(const torch::Tensor& input_seq,
                                                                 const torch::Tensor& input_lengths,
                                                                 torch::Tensor hidden) {
    TORCH_CHECK(input_seq.dim() == 2, "encoder expects time-major ids [T, B], got ", input_seq.sizes());
    TORCH_CHECK(input_lengths.dim() == 1 && input_lengths.size(0) == input_seq.size(1),
                "encoder expects one length per batch item, got ", input_lengths.sizes());

    torch::Tensor embedded = embedding(input_seq); // [T, B, H]

    // Lengths must live on the CPU as int64; enforce_sorted rejects unsorted batches
    torch::Tensor packed_lengths = input_lengths.to(torch::kCPU, torch::kLong);
    rnn_utils::PackedSequence packed = rnn_utils::pack_padded_sequence(embedded, packed_lengths,
                                                                       /*batch_first=*/false,
                                                                       /*enforce_sorted=*/true);

    auto gru_out = gru->forward_with_packed_input(packed, hidden);
    torch::Tensor outputs = std::get<0>(rnn_utils::pad_packed_sequence(std::get<0>(gru_out),
                                                                       /*batch_first=*/false,
                                                                       /*padding_value=*/0.0,
                                                                       /*total_length=*/input_seq.size(0))); // [T, B, 2H]

    // Sum forward and backward halves
    outputs = outputs.slice(/*dim=*/2, 0, hidden_size) + outputs.slice(/*dim=*/2, hidden_size, 2 * hidden_size);
    return {outputs, std::get<1>(gru_out)};
}

} // namespace chatbot
