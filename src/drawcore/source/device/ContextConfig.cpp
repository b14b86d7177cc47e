#include <chrono>
#include <cstdlib>
#include <string>
#include <utility>

#include <drawcore/device/ContextConfig.h>

namespace drawcore {

    namespace {
        void reportIgnored(const char* key, const std::string& value)
        {
            DiagnosticMessage msg{};
            msg.severity = Severity::Warning;
            msg.subsystem = "config";
            msg.objectName = key;
            msg.operation = "applyEnvironmentOverrides";
            msg.code = ErrorCode::InvalidArgument;
            msg.text = std::string("ignoring ") + key + "=" + value;
            reportDiagnostic(std::move(msg));
        }
    }

    std::optional<std::string> readEnvVar(const char* key)
    {
        if (const char* value = std::getenv(key); value != nullptr && value[0] != '\0') {
            return std::string{ value };
        }
        return std::nullopt;
    }

    const char* rewritePolicyToString(RewritePolicy policy) noexcept
    {
        switch (policy) {
        case RewritePolicy::UsageHint: return "usage";
        case RewritePolicy::AlwaysWait: return "always_wait";
        case RewritePolicy::AlwaysReallocate: return "always_reallocate";
        default: return "unknown";
        }
    }

    void applyEnvironmentOverrides(ContextConfig& config)
    {
        if (const auto mode = readEnvVar("DRAWCORE_CONSUMER_MODE"); mode.has_value()) {
            if (*mode == "inline") {
                config.consumerMode = DeviceThread::Mode::Inline;
            }
            else if (*mode == "dedicated") {
                config.consumerMode = DeviceThread::Mode::Dedicated;
            }
            else {
                reportIgnored("DRAWCORE_CONSUMER_MODE", *mode);
            }
        }

        if (const auto timeout = readEnvVar("DRAWCORE_WAIT_TIMEOUT_MS"); timeout.has_value()) {
            char* end = nullptr;
            const long long ms = std::strtoll(timeout->c_str(), &end, 10);
            if (end != nullptr && *end == '\0' && ms > 0) {
                config.fences.defaultTimeout = std::chrono::milliseconds(ms);
            }
            else {
                reportIgnored("DRAWCORE_WAIT_TIMEOUT_MS", *timeout);
            }
        }

        if (const auto policy = readEnvVar("DRAWCORE_REWRITE_POLICY"); policy.has_value()) {
            if (*policy == "usage") {
                config.rewritePolicy = RewritePolicy::UsageHint;
            }
            else if (*policy == "always_wait") {
                config.rewritePolicy = RewritePolicy::AlwaysWait;
            }
            else if (*policy == "always_reallocate") {
                config.rewritePolicy = RewritePolicy::AlwaysReallocate;
            }
            else {
                reportIgnored("DRAWCORE_REWRITE_POLICY", *policy);
            }
        }

        if (const auto tracking = readEnvVar("DRAWCORE_TRACK_DRAW_READS"); tracking.has_value()) {
            if (*tracking == "all") {
                config.fences.drawReads = DrawReadTracking::All;
            }
            else if (*tracking == "mapped") {
                config.fences.drawReads = DrawReadTracking::MappedOnly;
            }
            else {
                reportIgnored("DRAWCORE_TRACK_DRAW_READS", *tracking);
            }
        }

        if (const auto level = readEnvVar("DRAWCORE_LOG_LEVEL"); level.has_value()) {
            if (*level == "info") {
                config.minimumSeverity = Severity::Info;
            }
            else if (*level == "warning") {
                config.minimumSeverity = Severity::Warning;
            }
            else if (*level == "error") {
                config.minimumSeverity = Severity::Error;
            }
            else {
                reportIgnored("DRAWCORE_LOG_LEVEL", *level);
            }
        }
    }

} // namespace drawcore
