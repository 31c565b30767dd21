#pragma once
//
// Fatal errors raised by the reformatting pipeline
//

#include <stdexcept>
#include <string>

namespace topline {

// ============================================================================
// Input dataset does not conform to the declared summary schema
// ============================================================================

class SchemaMismatchError : public std::runtime_error {
public:
    explicit SchemaMismatchError(const std::string& message)
        : std::runtime_error("Input schema mismatch: " + message) {}
};

// ============================================================================
// Report tables are unusable (empty allow-list, bad historical schema, ...)
// ============================================================================

class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error("Invalid report configuration: " + message) {}
};

} // namespace topline
