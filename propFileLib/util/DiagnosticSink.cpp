#include <propfile/util/DiagnosticSink.hpp>

#include <algorithm>
#include <cstdio>

namespace PropFile {

void CollectingDiagnosticSink::report(Severity severity, const std::string& message) {
    diagnostics_.push_back(Diagnostic{severity, message});
}

size_t CollectingDiagnosticSink::count(Severity severity) const noexcept {
    return static_cast<size_t>(
        std::count_if(diagnostics_.begin(), diagnostics_.end(),
                      [severity](const Diagnostic& d) { return d.severity == severity; }));
}

void StderrDiagnosticSink::report(Severity severity, const std::string& message) {
    // 한 줄 단위로 출력해 다른 로그와 섞여도 구분 가능하게 한다.
    std::fprintf(stderr, "[propfile] %s %s\n", severityName(severity), message.c_str());
}

DiagnosticSink& nullDiagnosticSink() noexcept {
    static NullDiagnosticSink sink;
    return sink;
}

const char* severityName(Severity severity) noexcept {
    switch (severity) {
    case Severity::Warning:
        return "WARNING";
    case Severity::Error:
        return "ERROR";
    }
    return "UNKNOWN";
}

} // namespace PropFile
