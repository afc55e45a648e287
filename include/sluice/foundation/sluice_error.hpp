#pragma once

/// @file sluice_error.hpp
/// @brief Error type used with Result<T, SluiceError>.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "sluice/foundation/error_code.hpp"

namespace sluice::foundation {

/// Error carrying a categorized code, a human-readable message, and
/// optional type-erased context (e.g. the RequestId that failed).
class SluiceError {
public:
    SluiceError() = default;

    explicit SluiceError(ErrorCode code)
        : code_(code) {}

    SluiceError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    SluiceError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Access typed context data (nullptr on type mismatch or when empty).
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

    [[nodiscard]] bool isSuccess() const noexcept {
        return code_ == ErrorCode::Success;
    }

    /// "Subsystem/code_name: message", for logs and status payloads.
    [[nodiscard]] std::string describe() const {
        std::string out(subsystem());
        out += '/';
        out += errorCodeName(code_);
        if (!message_.empty()) {
            out += ": ";
            out += message_;
        }
        return out;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

} // namespace sluice::foundation
