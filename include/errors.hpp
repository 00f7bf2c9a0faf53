#pragma once
#include <stdexcept>
#include <string>

enum class ErrorKind {
    DimensionMismatch,
    DecodeFailure,
    ModelFailure,
    EncodeFailure,
    ConfigError,
    Cancelled
};

const char* errorKindName(ErrorKind kind);

class PipelineError : public std::runtime_error {
public:
    PipelineError(ErrorKind kind, const std::string& msg)
        : std::runtime_error(std::string(errorKindName(kind)) + ": " + msg),
          kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};
