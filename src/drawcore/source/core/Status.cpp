#include <atomic>
#include <iostream>
#include <mutex>
#include <string>

#include <drawcore/core/Status.h>

namespace
{
    std::mutex& diagnosticsMutex()
    {
        static std::mutex m;
        return m;
    }

    drawcore::DiagnosticSink& diagnosticSink()
    {
        static drawcore::DiagnosticSink sink;
        return sink;
    }

    std::atomic<drawcore::Severity>& minimumSeverityStorage()
    {
        static std::atomic<drawcore::Severity> severity{ drawcore::Severity::Warning };
        return severity;
    }

    drawcore::Severity severityFor(drawcore::ErrorCode code) noexcept
    {
        return code == drawcore::ErrorCode::ContextLost ? drawcore::Severity::Error : drawcore::Severity::Warning;
    }
}

namespace drawcore {

    DrawcoreException::DrawcoreException(ErrorContext context)
        : std::runtime_error(errorMessage(context))
        , context_(std::move(context))
    {
    }

    void throwError(const ErrorContext& context)
    {
        switch (context.code) {
        case ErrorCode::ResourceCreation:
            throw ResourceCreationError(context);
        case ErrorCode::ContextLost:
            throw ContextLostError(context);
        case ErrorCode::SynchronizationTimeout:
            throw SynchronizationTimeoutError(context);
        default:
            break;
        }
        if (isDrawError(context.code)) {
            throw DrawRejectedError(context);
        }
        throw DrawcoreException(context);
    }

    void setDiagnosticSink(DiagnosticSink sink)
    {
        const std::lock_guard<std::mutex> lock(diagnosticsMutex());
        diagnosticSink() = std::move(sink);
    }

    void clearDiagnosticSink() noexcept
    {
        const std::lock_guard<std::mutex> lock(diagnosticsMutex());
        diagnosticSink() = nullptr;
    }

    void setMinimumSeverity(Severity severity) noexcept
    {
        minimumSeverityStorage().store(severity, std::memory_order_relaxed);
    }

    Severity minimumSeverity() noexcept
    {
        return minimumSeverityStorage().load(std::memory_order_relaxed);
    }

    void reportDiagnostic(DiagnosticMessage message)
    {
        DiagnosticSink sink;
        {
            const std::lock_guard<std::mutex> lock(diagnosticsMutex());
            sink = diagnosticSink();
        }

        if (sink) {
            sink(message);
            return;
        }

        if (message.severity < minimumSeverity()) {
            return;
        }

        std::cerr << "[" << (message.subsystem ? message.subsystem : "drawcore") << "] "
                  << severityToString(message.severity) << " "
                  << (message.operation ? message.operation : "operation")
                  << ": " << message.text << " ("
                  << errorCodeToString(message.code)
                  << ", file=" << (message.callsiteFile ? message.callsiteFile : "<unknown>")
                  << ":" << message.callsiteLine << ")\n";
    }

    void reportInfo(const char* subsystem,
        const char* operation,
        std::string text,
        const std::source_location& location)
    {
        DiagnosticMessage msg{};
        msg.severity = Severity::Info;
        msg.subsystem = subsystem;
        msg.operation = operation;
        msg.callsiteFile = location.file_name();
        msg.callsiteLine = location.line();
        msg.text = std::move(text);
        reportDiagnostic(std::move(msg));
    }

    ErrorContext makeError(
        const char* operation,
        ErrorCode code,
        const char* subsystem,
        const char* objectName,
        std::string detail,
        uint64_t objectHandle,
        const std::source_location& location)
    {
        ErrorContext context{
            .code = code,
            .operation = operation,
            .subsystem = subsystem,
            .objectName = objectName,
            .objectHandle = objectHandle,
            .retryable = isRetryable(code),
            .callsiteFile = location.file_name(),
            .callsiteLine = location.line(),
            .detail = std::move(detail)
        };

        DiagnosticMessage msg{};
        msg.severity = severityFor(code);
        msg.subsystem = subsystem;
        msg.objectName = objectName;
        msg.operation = operation;
        msg.callsiteFile = context.callsiteFile;
        msg.callsiteLine = context.callsiteLine;
        msg.code = code;
        msg.text = errorMessage(context);
        reportDiagnostic(std::move(msg));

        return context;
    }

    const char* errorCodeToString(ErrorCode code) noexcept
    {
        switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::ResourceCreation: return "ResourceCreationError";
        case ErrorCode::InvalidHandle: return "InvalidHandle";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::ContextLost: return "ContextLostError";
        case ErrorCode::SynchronizationTimeout: return "SynchronizationTimeoutError";
        case ErrorCode::MissingAttribute: return "MissingAttributeError";
        case ErrorCode::UniformLayoutMismatch: return "UniformLayoutMismatchError";
        case ErrorCode::UnsupportedFeature: return "UnsupportedFeatureError";
        case ErrorCode::TextureBinding: return "TextureBindingError";
        case ErrorCode::FramebufferMismatch: return "FramebufferMismatchError";
        case ErrorCode::InvalidDrawParameters: return "InvalidDrawParameters";
        default: return "UNKNOWN";
        }
    }

    const char* severityToString(Severity severity) noexcept
    {
        switch (severity) {
        case Severity::Info: return "info";
        case Severity::Warning: return "warning";
        case Severity::Error: return "error";
        default: return "unknown";
        }
    }

    std::string errorMessage(const ErrorContext& context)
    {
        std::string msg = context.operation != nullptr ? context.operation : "<unknown>";
        msg += " failed (";
        msg += errorCodeToString(context.code);
        if (context.objectName != nullptr) {
            msg += ", ";
            msg += context.objectName;
        }
        msg += ")";
        if (!context.detail.empty()) {
            msg += ": ";
            msg += context.detail;
        }
        for (const LayoutDiffEntry& entry : context.layoutDiff) {
            msg += "\n  ";
            msg += entry.member;
            msg += ": expected ";
            msg += entry.expected;
            msg += ", provided ";
            msg += entry.provided;
        }
        return msg;
    }

} // namespace drawcore
