#include "chatbot/pipeline.h"

#include "chatbot/errors.h"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace chatbot {

std::vector<SentencePair> read_pairs(const std::string& path, bool normalize) {
    std::ifstream in(path);
    if (!in) throw IOError("cannot open pairs file '" + path + "'");

    std::vector<SentencePair> pairs;
    std::string line;
    size_t line_number = 0;
    while (std::getline(in, line)) {
        ++line_number;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        size_t tab = line.find('\t');
        if (tab == std::string::npos || line.find('\t', tab + 1) != std::string::npos)
            throw ValidationError(path + ":" + std::to_string(line_number) + ": expected two tab separated fields");

        std::string input = line.substr(0, tab);
        std::string target = line.substr(tab + 1);
        if (normalize) {
            input = normalize_string(input);
            target = normalize_string(target);
        }
        pairs.emplace_back(std::move(input), std::move(target));
    }
    if (in.bad()) throw IOError("error while reading '" + path + "'");
    return pairs;
}

void write_pairs(const std::string& path, const std::vector<SentencePair>& pairs) {
    std::ofstream out(path);
    if (!out) throw IOError("cannot write pairs file '" + path + "'");
    size_t line_number = 0;
    for (const auto& pair : pairs) {
        ++line_number;
        if (pair.first.find_first_of("\t\r\n") != std::string::npos ||
            pair.second.find_first_of("\t\r\n") != std::string::npos)
            throw ValidationError(path + ":" + std::to_string(line_number) +
                                  ": sentence contains a tab or line break");
        out << pair.first << '\t' << pair.second << '\n';
    }
    out.flush();
    if (!out) throw IOError("error while writing '" + path + "'");
}

PreparedData prepare_data(const std::string& datafile, const std::string& corpus_name) {
    std::cout << "Start preparing training data ..." << std::endl;
    std::cout << "Reading lines..." << std::endl;
    std::vector<SentencePair> pairs = read_pairs(datafile, /*normalize=*/true);
    std::cout << "Read " << pairs.size() << " sentence pairs" << std::endl;

    PreparedData data{VocabularyBuilder(corpus_name), filter_pairs(pairs)};
    std::cout << "Trimmed to " << data.pairs.size() << " sentence pairs" << std::endl;

    std::cout << "Counting words..." << std::endl;
    for (const auto& pair : data.pairs) {
        data.builder.add_sentence(pair.first);
        data.builder.add_sentence(pair.second);
    }
    std::cout << "Counted words: " << data.builder.view().num_words() << std::endl;
    return data;
}

std::vector<SentencePair> trim_rare_words(VocabularyBuilder& builder, const std::vector<SentencePair>& pairs,
                                          int64_t min_count) {
    builder.trim(min_count);
    const Vocabulary& vocab = builder.view();

    std::vector<SentencePair> keep_pairs;
    for (const auto& pair : pairs) {
        if (vocab.contains_all(pair.first) && vocab.contains_all(pair.second)) keep_pairs.push_back(pair);
    }

    const double ratio = pairs.empty() ? 0.0 : static_cast<double>(keep_pairs.size()) / pairs.size();
    std::ostringstream ratio_text;
    ratio_text << std::fixed << std::setprecision(4) << ratio;
    std::cout << "Trimmed from " << pairs.size() << " pairs to " << keep_pairs.size() << ", " << ratio_text.str()
              << " of total" << std::endl;
    return keep_pairs;
}

void save_vocabulary(const Vocabulary& vocab, const std::string& path) {
    std::ofstream out(path);
    if (!out) throw IOError("cannot write vocabulary file '" + path + "'");
    out << vocab.to_json().dump(2) << '\n';
    out.flush();
    if (!out) throw IOError("error while writing '" + path + "'");
}

std::shared_ptr<const Vocabulary> load_vocabulary(const std::string& path, const std::string& name) {
    std::ifstream in(path);
    if (!in) throw IOError("cannot open vocabulary file '" + path + "'");

    nlohmann::json persisted;
    try {
        in >> persisted;
    } catch (const nlohmann::json::parse_error& e) {
        throw ValidationError("vocabulary file '" + path + "' is not valid JSON: " + e.what());
    }
    return std::make_shared<const Vocabulary>(Vocabulary::from_json(persisted, name));
}

} // namespace chatbot
