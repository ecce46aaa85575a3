#pragma once
/// @file DiagnosticSink.hpp
/// @brief Injectable sinks for non-fatal diagnostics

#include <string>
#include <vector>

namespace PropFile {

/// @brief Severity of a reported diagnostic
enum class Severity {
    Warning, ///< Recovered condition (decoding replacement, close failure)
    Error    ///< Malformed content that was left untouched
};

/// @brief A single reported diagnostic
struct Diagnostic {
    Severity severity;
    std::string message;
};

/// @brief Receiver for non-fatal diagnostics
///
/// Parsing and escaping never fail outright. Conditions worth a warning
/// (malformed unicode escapes, undecodable bytes, close failures) are
/// reported here instead of through a global logger.
class DiagnosticSink {
  public:
    virtual ~DiagnosticSink() = default;

    /// @brief Report one diagnostic
    /// @param severity Severity of the event
    /// @param message Human readable description
    virtual void report(Severity severity, const std::string& message) = 0;
};

/// @brief Sink that discards everything
class NullDiagnosticSink : public DiagnosticSink {
  public:
    void report(Severity, const std::string&) override {}
};

/// @brief Sink that keeps every diagnostic in memory
class CollectingDiagnosticSink : public DiagnosticSink {
  public:
    void report(Severity severity, const std::string& message) override;

    /// @brief Diagnostics in the order they were reported
    const std::vector<Diagnostic>& diagnostics() const noexcept { return diagnostics_; }

    /// @brief Number of diagnostics with the given severity
    size_t count(Severity severity) const noexcept;

    bool empty() const noexcept { return diagnostics_.empty(); }

    void clear() noexcept { diagnostics_.clear(); }

  private:
    std::vector<Diagnostic> diagnostics_;
};

/// @brief Sink that prints "[propfile] SEVERITY message" lines to stderr
class StderrDiagnosticSink : public DiagnosticSink {
  public:
    void report(Severity severity, const std::string& message) override;
};

/// @brief Shared discarding sink used where no sink was supplied
DiagnosticSink& nullDiagnosticSink() noexcept;

/// @brief Printable name of a severity ("WARNING" / "ERROR")
const char* severityName(Severity severity) noexcept;

} // namespace PropFile
