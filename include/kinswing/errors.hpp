#pragma once
// Error taxonomy for the kinswing pipeline.
//
// Input validation failures are thrown and end the stage before any result
// is produced. Per-kinase computational edge cases are not errors; they
// surface as NA fields in the result tables.

#include <stdexcept>
#include <string>

namespace kinswing {

class KinswingError : public std::runtime_error {
public:
    KinswingError(const std::string& message, std::string key)
        : std::runtime_error(message), key_(std::move(key)) {}

    // Identifier that triggered the error (kinase, peptide or column)
    const std::string& key() const { return key_; }

private:
    std::string key_;
};

// Residue symbol outside the alphabet and not the wild-card
class InvalidAlphabetError : public KinswingError {
public:
    InvalidAlphabetError(char symbol, const std::string& record)
        : KinswingError("Invalid residue '" + std::string(1, symbol) +
                        "' in record " + record, record),
          symbol_(symbol) {}

    char symbol() const { return symbol_; }

private:
    char symbol_;
};

// A kinase with no usable substrate after normalization and filtering
class EmptyKinaseGroupError : public KinswingError {
public:
    explicit EmptyKinaseGroupError(const std::string& kinase_id)
        : KinswingError("No usable substrates for kinase " + kinase_id, kinase_id) {}
};

// Wrong column count, unparsable value or inconsistent cross-table reference
class MalformedInputError : public KinswingError {
public:
    MalformedInputError(const std::string& message, const std::string& key)
        : KinswingError(message, key) {}
};

// Sequence too short for the configured window and not centerable
class SequenceLengthError : public KinswingError {
public:
    SequenceLengthError(const std::string& record, size_t length, size_t required)
        : KinswingError("Sequence of record " + record + " has length " +
                        std::to_string(length) + ", need " + std::to_string(required) +
                        " around the phosphosite", record) {}
};

// Option value outside its valid range
class ConfigurationError : public KinswingError {
public:
    ConfigurationError(const std::string& option, const std::string& message)
        : KinswingError("Invalid " + option + ": " + message, option) {}
};

}  // namespace kinswing
