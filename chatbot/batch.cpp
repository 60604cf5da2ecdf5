#include "chatbot/batch.h"

#include "chatbot/errors.h"

#include <algorithm>
#include <tuple>

namespace chatbot {

namespace {

IndexMatrix index_batch(const std::vector<std::string>& sentences, const Vocabulary& vocab) {
    if (sentences.empty()) throw ValidationError("cannot assemble an empty batch");
    IndexMatrix indexes;
    indexes.reserve(sentences.size());
    for (const auto& sentence : sentences) {
        indexes.push_back(vocab.indexes_from_sentence(sentence));
    }
    return indexes;
}

// Time-major rows -> [T, B] int64 tensor.
torch::Tensor to_tensor(const IndexMatrix& rows) {
    const int64_t steps = static_cast<int64_t>(rows.size());
    const int64_t batch = steps == 0 ? 0 : static_cast<int64_t>(rows.front().size());
    std::vector<int64_t> flat;
    flat.reserve(steps * batch);
    for (const auto& row : rows) flat.insert(flat.end(), row.begin(), row.end());
    return torch::tensor(flat, torch::kLong).view({steps, batch});
}

} // namespace

IndexMatrix zero_padding(const IndexMatrix& sequences, int64_t fill_value) {
    size_t max_len = 0;
    for (const auto& seq : sequences) max_len = std::max(max_len, seq.size());

    IndexMatrix padded(max_len, std::vector<int64_t>(sequences.size(), fill_value));
    for (size_t b = 0; b < sequences.size(); ++b) {
        for (size_t t = 0; t < sequences[b].size(); ++t) {
            padded[t][b] = sequences[b][t];
        }
    }
    return padded;
}

std::vector<std::vector<bool>> binary_matrix(const IndexMatrix& padded, int64_t pad_value) {
    std::vector<std::vector<bool>> mask;
    mask.reserve(padded.size());
    for (const auto& row : padded) {
        std::vector<bool> mask_row;
        mask_row.reserve(row.size());
        for (int64_t token : row) mask_row.push_back(token != pad_value);
        mask.push_back(std::move(mask_row));
    }
    return mask;
}

std::pair<torch::Tensor, torch::Tensor> input_var(const std::vector<std::string>& sentences, const Vocabulary& vocab) {
    IndexMatrix indexes = index_batch(sentences, vocab);
    std::vector<int64_t> lengths;
    lengths.reserve(indexes.size());
    for (const auto& seq : indexes) lengths.push_back(static_cast<int64_t>(seq.size()));

    torch::Tensor padded = to_tensor(zero_padding(indexes));
    return {padded, torch::tensor(lengths, torch::kLong)};
}

OutputVar output_var(const std::vector<std::string>& sentences, const Vocabulary& vocab) {
    IndexMatrix indexes = index_batch(sentences, vocab);
    OutputVar out;
    for (const auto& seq : indexes) out.max_target_len = std::max(out.max_target_len, static_cast<int64_t>(seq.size()));

    IndexMatrix padded = zero_padding(indexes);
    IndexMatrix mask_rows;
    mask_rows.reserve(padded.size());
    for (const auto& row : binary_matrix(padded, PAD_TOKEN)) {
        mask_rows.emplace_back(row.begin(), row.end());
    }
    out.target = to_tensor(padded);
    out.mask = to_tensor(mask_rows).to(torch::kBool);
    return out;
}

void sort_by_input_length(std::vector<SentencePair>& pairs) {
    std::stable_sort(pairs.begin(), pairs.end(), [](const SentencePair& a, const SentencePair& b) {
        return split_words(a.first).size() > split_words(b.first).size();
    });
}

PaddedBatch batch_to_train_data(const Vocabulary& vocab, std::vector<SentencePair> pair_batch) {
    sort_by_input_length(pair_batch);
    std::vector<std::string> input_batch, output_batch;
    for (const auto& pair : pair_batch) {
        input_batch.push_back(pair.first);
        output_batch.push_back(pair.second);
    }

    PaddedBatch batch;
    std::tie(batch.input, batch.lengths) = input_var(input_batch, vocab);
    OutputVar output = output_var(output_batch, vocab);
    batch.target = output.target;
    batch.mask = output.mask;
    batch.max_target_len = output.max_target_len;
    return batch;
}

} // namespace chatbot
