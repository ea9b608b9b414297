#pragma once

#include <stdexcept>
#include <string>

namespace mgwind {

// Raised before any computation when the inputs or settings of a retrieval
// are inconsistent (mismatched grids, missing fields, invalid coefficients).
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace mgwind
