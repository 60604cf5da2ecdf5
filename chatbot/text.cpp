#include "chatbot/text.h"

#include "chatbot/config.h"

#include <sstream>
#include <stdexcept>

#include <unicode/normalizer2.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utf8.h>
#include <unicode/utf16.h>

namespace chatbot {

namespace {

const icu::Normalizer2& nfd_instance() {
    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* nfd = icu::Normalizer2::getNFDInstance(status);
    if (U_FAILURE(status))
        throw std::runtime_error(std::string("Normalizer2::getNFDInstance(): ") + u_errorName(status));
    return *nfd;
}

// Accumulates filtered code points into space separated tokens.
// Nothing but [a-z.!?] and single inner spaces ever reaches `out`.
class TokenSink {
public:
    explicit TokenSink(std::string& out) : out_(out) {}

    void push(UChar32 c) {
        if (u_charType(c) == U_NON_SPACING_MARK) return; // Drop accents left by the decomposition

        if (c >= 'A' && c <= 'Z') c += 'a' - 'A';
        if (c >= 'a' && c <= 'z') {
            append(static_cast<char>(c));
        } else if (c == '.' || c == '!' || c == '?') {
            pending_space_ = true;
            append(static_cast<char>(c));
            pending_space_ = true;
        } else {
            pending_space_ = true;
        }
    }

private:
    void append(char c) {
        if (pending_space_ && !out_.empty()) out_.push_back(' ');
        pending_space_ = false;
        out_.push_back(c);
    }

    std::string& out_;
    bool pending_space_ = false;
};

} // namespace

std::vector<std::string> split_words(const std::string& text) {
    std::vector<std::string> words;
    std::istringstream ss(text);
    std::string word;
    while (ss >> word) words.push_back(word);
    return words;
}

std::string normalize_string(const std::string& text) {
    const icu::Normalizer2& nfd = nfd_instance();

    std::string normalized;
    normalized.reserve(text.size());
    TokenSink sink(normalized);

    const auto* bytes = reinterpret_cast<const uint8_t*>(text.data());
    const int32_t length = static_cast<int32_t>(text.size());
    icu::UnicodeString decomposition;

    for (int32_t i = 0; i < length;) {
        UChar32 c;
        U8_NEXT(bytes, i, length, c);
        if (c < 0) { // Ill-formed UTF-8 sequence
            sink.push(' ');
            continue;
        }
        c = u_tolower(c);
        if (!nfd.getDecomposition(c, decomposition)) {
            sink.push(c);
            continue;
        }
        for (int32_t j = 0; j < decomposition.length();) {
            UChar32 part = decomposition.char32At(j);
            j += U16_LENGTH(part);
            sink.push(part);
        }
    }
    return normalized;
}

bool filter_pair(const SentencePair& pair) {
    return static_cast<int64_t>(split_words(pair.first).size()) < MAX_SENT_LENGTH &&
           static_cast<int64_t>(split_words(pair.second).size()) < MAX_SENT_LENGTH;
}

std::vector<SentencePair> filter_pairs(const std::vector<SentencePair>& pairs) {
    std::vector<SentencePair> kept;
    for (const auto& pair : pairs) {
        if (filter_pair(pair)) kept.push_back(pair);
    }
    return kept;
}

} // namespace chatbot
