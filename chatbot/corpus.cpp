#include "chatbot/corpus.h"

#include "chatbot/config.h"
#include "chatbot/errors.h"

#include <algorithm>
#include <fstream>
#include <regex>

#include <unicode/unistr.h>

namespace chatbot {

namespace {

std::string latin1_to_utf8(const std::string& raw) {
    icu::UnicodeString text(raw.data(), static_cast<int32_t>(raw.size()), "ISO-8859-1");
    std::string utf8;
    text.toUTF8String(utf8);
    return utf8;
}

std::vector<std::string> split_fields(const std::string& line, size_t expected, const std::string& path,
                                      size_t line_number) {
    const std::string separator = CORNELL_FIELD_SEPARATOR;
    std::vector<std::string> fields;
    size_t start = 0;
    while (fields.size() + 1 < expected) {
        size_t pos = line.find(separator, start);
        if (pos == std::string::npos) break;
        fields.push_back(line.substr(start, pos - start));
        start = pos + separator.size();
    }
    fields.push_back(line.substr(start));
    if (fields.size() != expected)
        throw ValidationError(path + ":" + std::to_string(line_number) + ": expected " + std::to_string(expected) +
                              " fields, got " + std::to_string(fields.size()));
    return fields;
}

// Tabs and line breaks inside an utterance would split the pairs file record.
std::string flatten_separators(std::string s) {
    std::replace_if(s.begin(), s.end(), [](char c) { return c == '\t' || c == '\n' || c == '\r'; }, ' ');
    return s;
}

std::string strip(const std::string& s) {
    const char* whitespace = " \t\r\n\f\v";
    size_t begin = s.find_first_not_of(whitespace);
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(whitespace);
    return s.substr(begin, end - begin + 1);
}

std::ifstream open_corpus_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw IOError("cannot open corpus file '" + path + "'");
    return in;
}

} // namespace

std::unordered_map<std::string, MovieLine> load_lines(const std::string& path) {
    std::ifstream in = open_corpus_file(path);
    std::unordered_map<std::string, MovieLine> lines;
    std::string raw;
    size_t line_number = 0;
    while (std::getline(in, raw)) {
        ++line_number;
        if (strip(raw).empty()) continue;
        std::vector<std::string> fields = split_fields(latin1_to_utf8(raw), 5, path, line_number);
        MovieLine line{fields[0], fields[1], fields[2], fields[3], fields[4]};
        lines[line.line_id] = std::move(line);
    }
    if (in.bad()) throw IOError("error while reading '" + path + "'");
    return lines;
}

std::vector<Conversation> load_conversations(const std::string& path,
                                             const std::unordered_map<std::string, MovieLine>& lines) {
    static const std::regex utterance_id_pattern("L[0-9]+");

    std::ifstream in = open_corpus_file(path);
    std::vector<Conversation> conversations;
    std::string raw;
    size_t line_number = 0;
    while (std::getline(in, raw)) {
        ++line_number;
        if (strip(raw).empty()) continue;
        std::vector<std::string> fields = split_fields(latin1_to_utf8(raw), 4, path, line_number);

        Conversation conv{fields[0], fields[1], fields[2], fields[3], {}};
        auto begin = std::sregex_iterator(conv.utterance_ids.begin(), conv.utterance_ids.end(), utterance_id_pattern);
        for (auto it = begin; it != std::sregex_iterator(); ++it) {
            auto found = lines.find(it->str());
            if (found == lines.end())
                throw LookupError(path + ":" + std::to_string(line_number) + ": unknown line id " + it->str());
            conv.lines.push_back(found->second);
        }
        conversations.push_back(std::move(conv));
    }
    if (in.bad()) throw IOError("error while reading '" + path + "'");
    return conversations;
}

std::vector<SentencePair> extract_sentence_pairs(const std::vector<Conversation>& conversations) {
    std::vector<SentencePair> pairs;
    for (const auto& conv : conversations) {
        for (size_t i = 0; i + 1 < conv.lines.size(); ++i) {
            std::string input_line = strip(flatten_separators(conv.lines[i].text));
            std::string target_line = strip(flatten_separators(conv.lines[i + 1].text));
            if (!input_line.empty() && !target_line.empty()) {
                pairs.emplace_back(std::move(input_line), std::move(target_line));
            }
        }
    }
    return pairs;
}

} // namespace chatbot
