#pragma once
#include <stdexcept>
#include <string>

namespace Frontier {

// Structurally invalid input reaching the store, e.g. an empty domain key.
class InvalidInput : public std::invalid_argument {
public:
    explicit InvalidInput(const std::string& what) : std::invalid_argument(what) {
    }
};

class CodecError : public std::runtime_error {
public:
    explicit CodecError(const std::string& what) : std::runtime_error(what) {
    }
};

}  // namespace Frontier
