#include "errors.hpp"

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::DimensionMismatch: return "dimension mismatch";
        case ErrorKind::DecodeFailure:     return "decode failure";
        case ErrorKind::ModelFailure:      return "model failure";
        case ErrorKind::EncodeFailure:     return "encode failure";
        case ErrorKind::ConfigError:       return "config error";
        case ErrorKind::Cancelled:         return "cancelled";
    }
    return "unknown error";
}
