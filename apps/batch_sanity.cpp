#include "chatbot/batch.h"
#include "chatbot/config.h"
#include "chatbot/decoder.h"
#include "chatbot/encoder.h"
#include "chatbot/errors.h"
#include "chatbot/pipeline.h"

#include <torch/torch.h>

#include <filesystem>
#include <iostream>
#include <random>
#include <string>
#include <vector>

namespace fs = std::filesystem;

const int64_t SMALL_BATCH_SIZE = 5;

// Usage: batch_sanity [base_path] [dot|general|concat]
// Loads the prepared artifacts, assembles one random batch and runs the
// encoder plus a single decoder step over it.
int main(int argc, char* argv[]) {
    const fs::path base_path = argc > 1 ? fs::path(argv[1]) : fs::path("generated");
    chatbot::ModelConfig config;
    config.hidden_size = 64;
    if (argc > 2) config.attn_method = argv[2];

    torch::manual_seed(0);

    try {
        auto vocab = chatbot::load_vocabulary((base_path / "vocab.json").string());
        auto pairs = chatbot::read_pairs((base_path / "processed_pairs.txt").string());
        if (pairs.empty()) {
            std::cerr << "No sentence pairs in " << base_path << std::endl;
            return 1;
        }
        std::cout << "Loaded " << vocab->num_words() << " words and " << pairs.size() << " pairs" << std::endl;

        std::mt19937 rng(std::random_device{}());
        std::uniform_int_distribution<size_t> pick(0, pairs.size() - 1);
        std::vector<chatbot::SentencePair> pair_batch;
        for (int64_t i = 0; i < SMALL_BATCH_SIZE; ++i) pair_batch.push_back(pairs[pick(rng)]);

        chatbot::PaddedBatch batch = chatbot::batch_to_train_data(*vocab, pair_batch);
        std::cout << "input_variable: " << batch.input << std::endl;
        std::cout << "lengths: " << batch.lengths << std::endl;
        std::cout << "target_variable: " << batch.target << std::endl;
        std::cout << "mask: " << batch.mask << std::endl;
        std::cout << "max_target_len: " << batch.max_target_len << std::endl;

        torch::nn::Embedding embedding(vocab->num_words(), config.hidden_size);
        chatbot::EncoderRNN encoder(config.hidden_size, embedding, config.encoder_n_layers, config.dropout);
        chatbot::LuongAttnDecoderRNN decoder(config.attn_method, embedding, config.hidden_size, vocab->num_words(),
                                             config.decoder_n_layers, config.dropout);
        encoder->eval();
        decoder->eval();
        std::cout << encoder << std::endl << decoder << std::endl;

        torch::NoGradGuard no_grad;
        auto encoded = encoder->forward(batch.input, batch.lengths);
        torch::Tensor encoder_outputs = std::get<0>(encoded);
        // First decoder_n_layers rows of the encoder state seed the decoder
        torch::Tensor decoder_hidden = std::get<1>(encoded).slice(0, 0, config.decoder_n_layers);
        torch::Tensor decoder_input = torch::full({1, batch.input.size(1)}, chatbot::SOS_TOKEN, torch::kLong);

        auto step = decoder->forward(decoder_input, decoder_hidden, encoder_outputs);
        torch::Tensor probabilities = std::get<0>(step);
        std::cout << "encoder_outputs: " << encoder_outputs.sizes() << std::endl;
        std::cout << "decoder_output: " << probabilities.sizes() << ", row sums " << probabilities.sum(1) << std::endl;
    } catch (const chatbot::IOError& e) {
        std::cerr << "I/O error: " << e.what() << std::endl;
        return 1;
    } catch (const c10::Error& e) {
        std::cerr << "Error running the model: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
