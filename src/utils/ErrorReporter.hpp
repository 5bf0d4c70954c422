#pragma once

#include <deque>
#include <string>
#include <vector>
#include <mutex>

namespace utils {

enum class ErrorCategory
{
    Initialization, // logging, startup
    Configuration,  // TOML parsing, invalid config
    Network,        // transport failures on translate/detect calls
    KeyPair,        // host page fetch or key pair parse failures
    Translation,    // endpoint rejected the request, malformed response
    Unknown
};

enum class ErrorSeverity
{
    Info,    // Informational, no action needed
    Warning, // Degraded functionality, but continues
    Error,   // Operation failed, but the client can continue
    Fatal    // Critical error, the process should exit
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string user_message;      // Short, actionable message
    std::string technical_details; // Technical details for logs/bug reports
    std::string timestamp;
    bool is_fatal = false;

    ErrorReport() = default;
    ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string user_msg, std::string tech_details);
};

// Process-wide sink for problems the caller should hear about.
// Every report is logged through plog and kept in a bounded queue (oldest dropped first)
// until the caller drains it with GetPendingErrors(). All members are thread-safe.
//
//   ErrorReporter::ReportWarning(ErrorCategory::KeyPair, "Key pair not found in host page",
//                                "no tkk:'<int>.<int>' assignment");
//   for (const auto& report : ErrorReporter::GetPendingErrors())
//       std::cerr << report.user_message << "\n";
class ErrorReporter
{
public:
    static void ReportError(ErrorCategory category, ErrorSeverity severity, const std::string& user_message,
                            const std::string& technical_details = "");

    // Severity shorthands
    static void ReportFatal(ErrorCategory category, const std::string& user_message,
                            const std::string& technical_details = "");
    static void ReportError(ErrorCategory category, const std::string& user_message,
                            const std::string& technical_details = "");
    static void ReportWarning(ErrorCategory category, const std::string& user_message,
                              const std::string& technical_details = "");

    static bool HasPendingErrors();

    // Takes every queued report, leaving the queue empty
    static std::vector<ErrorReport> GetPendingErrors();

    // Newest queued report, or a default-constructed one
    static ErrorReport GetLastError();

    static void ClearErrors();

    static std::string CategoryToString(ErrorCategory category);
    static std::string SeverityToString(ErrorSeverity severity);

    // Local time, "%Y-%m-%d %H:%M:%S"
    static std::string GetTimestamp();

private:
    static std::mutex s_mutex;
    static std::deque<ErrorReport> s_error_queue;
    static constexpr size_t MAX_QUEUE_SIZE = 100;
};

} // namespace utils
