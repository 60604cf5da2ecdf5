#pragma once

#include <stdexcept>
#include <string>

namespace chatbot {

// Bad construction arguments or malformed persisted data.
struct ValidationError : std::invalid_argument {
    explicit ValidationError(const std::string& what) : std::invalid_argument(what) {}
};

// A token (or corpus line id) is missing from a frozen table.
struct LookupError : std::out_of_range {
    explicit LookupError(const std::string& what) : std::out_of_range(what) {}
};

// Missing or unreadable corpus, pairs or vocabulary file.
struct IOError : std::runtime_error {
    explicit IOError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace chatbot
