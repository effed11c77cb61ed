#include <folio/core/diagnostics.h>

#include <algorithm>
#include <iterator>
#include <sstream>

namespace folio::core {

const char* severity_name(Severity severity) {
    switch (severity) {
        case Severity::Info:    return "info";
        case Severity::Warning: return "warning";
        case Severity::Error:   return "error";
    }
    return "unknown";
}

std::string format_diagnostic(const DiagnosticEvent& event) {
    std::ostringstream oss;
    oss << "[" << severity_name(event.severity) << "]";
    if (!event.module.empty()) oss << " " << event.module;
    if (!event.stage.empty()) oss << "/" << event.stage;
    if (event.span != 0) oss << " @" << event.span;
    oss << ": " << event.message;
    return oss.str();
}

void DiagnosticEmitter::emit(Severity severity, const std::string& module,
                             const std::string& stage, const std::string& message,
                             std::uint64_t span) {
    if (severity < min_severity_) {
        return;
    }

    DiagnosticEvent event{std::chrono::steady_clock::now(), severity, module, stage, message, span};
    for (const auto& observer : observers_) {
        observer(event);
    }
    events_.push_back(std::move(event));
}

void DiagnosticEmitter::add_observer(DiagnosticObserver observer) {
    observers_.push_back(std::move(observer));
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_severity(Severity severity) const {
    std::vector<DiagnosticEvent> result;
    std::copy_if(events_.begin(), events_.end(), std::back_inserter(result),
                 [severity](const DiagnosticEvent& e) { return e.severity == severity; });
    return result;
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_module(const std::string& module) const {
    std::vector<DiagnosticEvent> result;
    std::copy_if(events_.begin(), events_.end(), std::back_inserter(result),
                 [&module](const DiagnosticEvent& e) { return e.module == module; });
    return result;
}

std::size_t DiagnosticEmitter::count(Severity severity) const {
    return static_cast<std::size_t>(
        std::count_if(events_.begin(), events_.end(),
                      [severity](const DiagnosticEvent& e) { return e.severity == severity; }));
}

}  // namespace folio::core
