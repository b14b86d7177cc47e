#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <source_location>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace drawcore {

    enum class ErrorCode : uint8_t {
        Success = 0,
        ResourceCreation,
        InvalidHandle,
        InvalidArgument,
        ContextLost,
        SynchronizationTimeout,
        // Draw rejections. The draw is not issued and device state is untouched.
        MissingAttribute,
        UniformLayoutMismatch,
        UnsupportedFeature,
        TextureBinding,
        FramebufferMismatch,
        InvalidDrawParameters
    };

    [[nodiscard]] constexpr bool isDrawError(ErrorCode code) noexcept
    {
        return code >= ErrorCode::MissingAttribute && code <= ErrorCode::InvalidDrawParameters;
    }

    [[nodiscard]] constexpr bool isRetryable(ErrorCode code) noexcept
    {
        return code == ErrorCode::SynchronizationTimeout;
    }

    struct LayoutDiffEntry {
        std::string member{};
        std::string expected{};
        std::string provided{};

        friend bool operator==(const LayoutDiffEntry&, const LayoutDiffEntry&) = default;
    };

    struct ErrorContext {
        ErrorCode code{ ErrorCode::Success };
        const char* operation{ nullptr };
        const char* subsystem{ "drawcore" };
        const char* objectName{ nullptr };
        uint64_t objectHandle{ 0 };
        bool retryable{ false };
        const char* callsiteFile{ nullptr };
        uint32_t callsiteLine{ 0 };
        std::string detail{};
        std::vector<LayoutDiffEntry> layoutDiff{};
    };

    template<typename T>
    class Expected {
    public:
        Expected(const T& value)
            : value_(value), error_() {
        }

        Expected(T&& value)
            : value_(std::move(value)), error_() {
        }

        Expected(const ErrorContext& error)
            : value_(), error_(error) {
        }

        Expected(ErrorContext&& error)
            : value_(), error_(std::move(error)) {
        }

        [[nodiscard]] bool hasValue() const noexcept { return value_.has_value(); }
        [[nodiscard]] explicit operator bool() const noexcept { return hasValue(); }
        [[nodiscard]] const T& value() const { return *value_; }
        [[nodiscard]] T& value() { return *value_; }
        [[nodiscard]] ErrorCode error() const noexcept { return error_.code; }
        [[nodiscard]] const ErrorContext& context() const noexcept { return error_; }

    private:
        std::optional<T> value_{};
        ErrorContext error_{};
    };

    template<>
    class Expected<void> {
    public:
        Expected() = default;

        Expected(const ErrorContext& error)
            : error_(error) {
        }

        Expected(ErrorContext&& error)
            : error_(std::move(error)) {
        }

        [[nodiscard]] bool hasValue() const noexcept { return error_.code == ErrorCode::Success; }
        [[nodiscard]] explicit operator bool() const noexcept { return hasValue(); }
        [[nodiscard]] ErrorCode error() const noexcept { return error_.code; }
        [[nodiscard]] const ErrorContext& context() const noexcept { return error_; }

    private:
        ErrorContext error_{};
    };

    class DrawcoreException : public std::runtime_error {
    public:
        explicit DrawcoreException(ErrorContext context);

        [[nodiscard]] ErrorCode code() const noexcept { return context_.code; }
        [[nodiscard]] const ErrorContext& context() const noexcept { return context_; }

    private:
        ErrorContext context_{};
    };

    class ResourceCreationError : public DrawcoreException {
    public:
        using DrawcoreException::DrawcoreException;
    };

    class ContextLostError : public DrawcoreException {
    public:
        using DrawcoreException::DrawcoreException;
    };

    class SynchronizationTimeoutError : public DrawcoreException {
    public:
        using DrawcoreException::DrawcoreException;
    };

    class DrawRejectedError : public DrawcoreException {
    public:
        using DrawcoreException::DrawcoreException;
    };

    [[noreturn]] void throwError(const ErrorContext& context);

    template<typename T>
    [[nodiscard]] T valueOrThrow(Expected<T>&& result)
    {
        if (!result.hasValue()) {
            throwError(result.context());
        }
        return std::move(result.value());
    }

    inline void valueOrThrow(const Expected<void>& result)
    {
        if (!result.hasValue()) {
            throwError(result.context());
        }
    }

    enum class Severity : uint8_t {
        Info,
        Warning,
        Error
    };

    struct DiagnosticMessage {
        Severity severity = Severity::Warning;
        const char* subsystem = "drawcore";
        const char* objectName = nullptr;
        const char* operation = nullptr;
        const char* callsiteFile = nullptr;
        uint32_t callsiteLine = 0;
        ErrorCode code = ErrorCode::Success;
        std::string text;
    };

    using DiagnosticSink = std::function<void(const DiagnosticMessage&)>;

    void setDiagnosticSink(DiagnosticSink sink);
    void clearDiagnosticSink() noexcept;
    void reportDiagnostic(DiagnosticMessage message);

    // Only filters the stderr fallback; an installed sink sees every message.
    void setMinimumSeverity(Severity severity) noexcept;
    [[nodiscard]] Severity minimumSeverity() noexcept;

    void reportInfo(const char* subsystem,
        const char* operation,
        std::string text,
        const std::source_location& location = std::source_location::current());

    [[nodiscard]] ErrorContext makeError(
        const char* operation,
        ErrorCode code,
        const char* subsystem = "drawcore",
        const char* objectName = nullptr,
        std::string detail = {},
        uint64_t objectHandle = 0,
        const std::source_location& location = std::source_location::current());

    [[nodiscard]] const char* errorCodeToString(ErrorCode code) noexcept;
    [[nodiscard]] const char* severityToString(Severity severity) noexcept;

    [[nodiscard]] std::string errorMessage(const ErrorContext& context);

#define DRAWCORE_RETURN_IF_FAILED(expr) \
    do { \
        const auto _drawcore_res = (expr); \
        if (!_drawcore_res.hasValue()) { \
            return _drawcore_res.context(); \
        } \
    } while (false)

} // namespace drawcore
