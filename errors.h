#pragma once
#include <stdexcept>
#include <string>

namespace panelnest {

struct PackingError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Bad dimensions, quantities or options; raised before any packing is attempted.
struct InvalidInputError : PackingError {
    using PackingError::PackingError;
};

// Every stock type is used up while a new sheet is still required.
struct StockExhaustedError : PackingError {
    using PackingError::PackingError;
};

// Malformed job file.
struct JobFormatError : PackingError {
    using PackingError::PackingError;
};

}  // namespace panelnest
