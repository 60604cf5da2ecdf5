#include "chatbot/decoder.h"

#include "chatbot/config.h"
#include "chatbot/encoder.h"
#include "chatbot/errors.h"

#include <gtest/gtest.h>

namespace chatbot {
namespace {

const int64_t VOCAB = 10;
const int64_t HIDDEN = 6;
const int64_t SEQ_LEN = 4;
const int64_t BATCH = 3;

class DecoderStepTest : public ::testing::TestWithParam<std::string> {};

TEST_P(DecoderStepTest, ReturnsDistributionAndNextHidden) {
    torch::manual_seed(11);
    LuongAttnDecoderRNN decoder(GetParam(), torch::nn::Embedding(VOCAB, HIDDEN), HIDDEN, VOCAB, /*n_layers=*/2);
    decoder->eval();

    torch::Tensor input_step = torch::full({1, BATCH}, SOS_TOKEN, torch::kLong);
    torch::Tensor hidden = torch::zeros({2, BATCH, HIDDEN});
    torch::Tensor encoder_outputs = torch::randn({SEQ_LEN, BATCH, HIDDEN});

    auto step = decoder->forward(input_step, hidden, encoder_outputs);
    torch::Tensor probabilities = std::get<0>(step);
    torch::Tensor next_hidden = std::get<1>(step);

    EXPECT_EQ(probabilities.sizes().vec(), (std::vector<int64_t>{BATCH, VOCAB}));
    EXPECT_EQ(next_hidden.sizes().vec(), (std::vector<int64_t>{2, BATCH, HIDDEN}));
    EXPECT_TRUE(torch::allclose(probabilities.sum(/*dim=*/1), torch::ones({BATCH}), 1e-5, 1e-6));
    EXPECT_GE(probabilities.min().item<float>(), 0.0f);
    EXPECT_FALSE(torch::equal(next_hidden, hidden));
}

INSTANTIATE_TEST_SUITE_P(AllMethods, DecoderStepTest, ::testing::Values("dot", "general", "concat"));

TEST(LuongAttnDecoderRNNTest, DropoutIsInactiveInEval) {
    torch::manual_seed(12);
    LuongAttnDecoderRNN decoder("general", torch::nn::Embedding(VOCAB, HIDDEN), HIDDEN, VOCAB, 1, /*dropout=*/0.5);
    decoder->eval();

    torch::Tensor input_step = torch::tensor({4, 5, 6}, torch::kLong).view({1, BATCH});
    torch::Tensor hidden = torch::randn({1, BATCH, HIDDEN});
    torch::Tensor encoder_outputs = torch::randn({SEQ_LEN, BATCH, HIDDEN});

    torch::NoGradGuard no_grad;
    torch::Tensor first = std::get<0>(decoder->forward(input_step, hidden, encoder_outputs));
    torch::Tensor second = std::get<0>(decoder->forward(input_step, hidden, encoder_outputs));
    EXPECT_TRUE(torch::equal(first, second));
}

TEST(LuongAttnDecoderRNNTest, UnknownAttentionMethodFailsAtConstruction) {
    EXPECT_THROW(LuongAttnDecoderRNN("bahdanau", torch::nn::Embedding(VOCAB, HIDDEN), HIDDEN, VOCAB), ValidationError);
}

TEST(LuongAttnDecoderRNNTest, RunsOneStepAtATime) {
    LuongAttnDecoderRNN decoder("dot", torch::nn::Embedding(VOCAB, HIDDEN), HIDDEN, VOCAB);
    torch::Tensor two_steps = torch::ones({2, BATCH}, torch::kLong);
    EXPECT_THROW(decoder->forward(two_steps, torch::zeros({1, BATCH, HIDDEN}), torch::randn({SEQ_LEN, BATCH, HIDDEN})),
                 c10::Error);
}

TEST(LuongAttnDecoderRNNTest, SharesEmbeddingWithEncoderOverAPaddedBatch) {
    torch::manual_seed(13);
    torch::nn::Embedding embedding(VOCAB, HIDDEN);
    EncoderRNN encoder(HIDDEN, embedding, /*n_layers=*/2);
    LuongAttnDecoderRNN decoder("concat", embedding, HIDDEN, VOCAB, /*n_layers=*/2);
    encoder->eval();
    decoder->eval();
    EXPECT_EQ(encoder->embedding.ptr(), decoder->embedding.ptr());

    torch::Tensor input_short = torch::tensor({3, 4, 5, 2, 2, 0}, torch::kLong).view({3, 2});
    torch::Tensor lengths = torch::tensor({3, 2}, torch::kLong);

    auto encoded = encoder->forward(input_short, lengths);
    torch::Tensor decoder_hidden = std::get<1>(encoded).slice(0, 0, 2);
    torch::Tensor decoder_input = torch::full({1, 2}, SOS_TOKEN, torch::kLong);

    // Teacher forced loop driven from outside the module
    for (int64_t t = 0; t < 3; ++t) {
        auto step = decoder->forward(decoder_input, decoder_hidden, std::get<0>(encoded));
        decoder_hidden = std::get<1>(step);
        EXPECT_TRUE(torch::allclose(std::get<0>(step).sum(1), torch::ones({2}), 1e-5, 1e-6));
        decoder_input = input_short.slice(0, t, t + 1);
    }
}

} // namespace
} // namespace chatbot
