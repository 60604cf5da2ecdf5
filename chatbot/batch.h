#pragma once

#include "chatbot/config.h"
#include "chatbot/text.h"
#include "chatbot/vocabulary.h"

#include <torch/torch.h>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace chatbot {

using IndexMatrix = std::vector<std::vector<int64_t>>;

// Batch-major sequences -> time-major rows, right-padded with fill_value.
// zero_padding({{1,2,3},{4,5}}) == {{1,4},{2,5},{3,0}}
IndexMatrix zero_padding(const IndexMatrix& sequences, int64_t fill_value = PAD_TOKEN);

// 1 where the entry is not pad_value.
std::vector<std::vector<bool>> binary_matrix(const IndexMatrix& padded, int64_t pad_value = PAD_TOKEN);

// Padded input ids [T, B] and lengths [B] (int64, CPU).
std::pair<torch::Tensor, torch::Tensor> input_var(const std::vector<std::string>& sentences, const Vocabulary& vocab);

struct OutputVar {
    torch::Tensor target; // [T, B]
    torch::Tensor mask;   // [T, B] bool, false on PAD
    int64_t max_target_len = 0;
};
OutputVar output_var(const std::vector<std::string>& sentences, const Vocabulary& vocab);

struct PaddedBatch {
    torch::Tensor input;   // [T_in, B]
    torch::Tensor lengths; // [B], non-increasing
    torch::Tensor target;  // [T_out, B]
    torch::Tensor mask;    // [T_out, B]
    int64_t max_target_len = 0;
};

// Stable sort on input token count, longest first. Packing in the encoder relies on it.
void sort_by_input_length(std::vector<SentencePair>& pairs);

// Sorts a copy of `pair_batch`, then indexes, pads and masks it.
// Unknown tokens raise LookupError; an empty batch raises ValidationError.
PaddedBatch batch_to_train_data(const Vocabulary& vocab, std::vector<SentencePair> pair_batch);

} // namespace chatbot
