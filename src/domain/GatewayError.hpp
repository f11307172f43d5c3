/**
 * @file GatewayError.hpp
 * @brief Error taxonomy shared by every gateway stage.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace promptwarden::domain {

/**
 * @enum ErrorKind
 * @brief Structured failure categories reported to callers.
 */
enum class ErrorKind {
    UnsupportedFormat,
    ExtractionFailure,
    ScannerUnavailable,
    GuardrailBlocked,
    ModelUnavailable,
    ModelTimeout,
    EmptyInput
};

inline std::string ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UnsupportedFormat: return "UnsupportedFormat";
        case ErrorKind::ExtractionFailure: return "ExtractionFailure";
        case ErrorKind::ScannerUnavailable: return "ScannerUnavailable";
        case ErrorKind::GuardrailBlocked: return "GuardrailBlocked";
        case ErrorKind::ModelUnavailable: return "ModelUnavailable";
        case ErrorKind::ModelTimeout: return "ModelTimeout";
        case ErrorKind::EmptyInput: return "EmptyInput";
    }
    return "Unknown";
}

/** @brief True for failures caused by the caller's content rather than the backend. */
inline bool IsClientError(ErrorKind kind) {
    return kind == ErrorKind::UnsupportedFormat ||
           kind == ErrorKind::ExtractionFailure ||
           kind == ErrorKind::EmptyInput;
}

/**
 * @class GatewayError
 * @brief Exception carrying an ErrorKind and the stage (or scanner) that raised it.
 */
class GatewayError : public std::runtime_error {
public:
    GatewayError(ErrorKind kind, const std::string& stage, const std::string& message)
        : std::runtime_error(message), m_kind(kind), m_stage(stage) {}

    ErrorKind kind() const { return m_kind; }
    const std::string& stage() const { return m_stage; }

private:
    ErrorKind m_kind;
    std::string m_stage;
};

} // namespace promptwarden::domain
