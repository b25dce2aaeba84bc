#pragma once
#include <stdexcept>
#include <string>

// Malformed input to the RLP/ABI codecs or hex helpers.
class EncodingError : public std::runtime_error {
public:
  explicit EncodingError(const std::string& what) : std::runtime_error(what) {}
};

// Private key is not a valid secp256k1 scalar.
class InvalidKeyError : public std::runtime_error {
public:
  explicit InvalidKeyError(const std::string& what) : std::runtime_error(what) {}
};

// Signature could not be parsed or no public key could be recovered from it.
class RecoveryError : public std::runtime_error {
public:
  explicit RecoveryError(const std::string& what) : std::runtime_error(what) {}
};

// Structurally invalid arguments to an assembler or builder.
class ValidationError : public std::runtime_error {
public:
  explicit ValidationError(const std::string& what) : std::runtime_error(what) {}
};

// Node rejected a request or could not be reached. what() is the node's message.
class SubmissionError : public std::runtime_error {
public:
  explicit SubmissionError(const std::string& what) : std::runtime_error(what) {}
};

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};
