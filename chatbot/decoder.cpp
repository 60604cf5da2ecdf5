#include "chatbot/decoder.h"

namespace chatbot {

LuongAttnDecoderRNNImpl::LuongAttnDecoderRNNImpl(const std::string& attn_method, torch::nn::Embedding embedding,
                                                 int64_t hidden_size, int64_t output_size, int64_t n_layers,
                                                 double dropout)
    : hidden_size(hidden_size), output_size(output_size), n_layers(n_layers) {
    // Built first so an unknown method fails before any other layer is allocated
    attn = register_module("attn", Attention(attn_method, hidden_size));
    this->embedding = register_module("embedding", std::move(embedding));
    embedding_dropout = register_module("embedding_dropout", torch::nn::Dropout(dropout));
    gru = register_module("gru", torch::nn::GRU(torch::nn::GRUOptions(hidden_size, hidden_size)
                                                    .num_layers(n_layers)
                                                    .dropout(n_layers == 1 ? 0.0 : dropout)));
    concat = register_module("concat", torch::nn::Linear(hidden_size * 2, hidden_size));
    out = register_module("out", torch::nn::Linear(hidden_size, output_size));
}

std::tuple<torch::Tensor, torch::Tensor> LuongAttnDecoderRNNImpl::forward(const torch::Tensor& input_step,
                                                                          const torch::Tensor& last_hidden,
                                                                          const torch::Tensor& encoder_outputs) {
    TORCH_CHECK(input_step.dim() == 2 && input_step.size(0) == 1, "decoder runs one step at a time, got input ",
                input_step.sizes());

    torch::Tensor embedded = embedding_dropout(embedding(input_step)); // [1, B, H]
    auto gru_out = gru(embedded, last_hidden);
    torch::Tensor rnn_output = std::get<0>(gru_out); // [1, B, H]
    torch::Tensor hidden = std::get<1>(gru_out);     // [n_layers, B, H]

    torch::Tensor attn_weights = attn(rnn_output, encoder_outputs);                  // [B, 1, T]
    torch::Tensor context = torch::bmm(attn_weights, encoder_outputs.transpose(0, 1)); // [B, 1, H]

    // Luong eq. 5
    torch::Tensor concat_input = torch::cat({rnn_output.squeeze(0), context.squeeze(1)}, /*dim=*/1); // [B, 2H]
    torch::Tensor concat_output = torch::tanh(concat(concat_input));                               // [B, H]

    // Luong eq. 6
    torch::Tensor output = torch::softmax(out(concat_output), /*dim=*/1); // [B, output_size]
    return {output, hidden};
}

} // namespace chatbot
