#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace folio::core {

enum class Severity {
    Info,
    Warning,
    Error,
};

const char* severity_name(Severity severity);

// One message from a layouter. `module` names the layouter (flow, page,
// inline, ...), `stage` the phase or the error kind.
struct DiagnosticEvent {
    std::chrono::steady_clock::time_point timestamp;
    Severity severity = Severity::Info;
    std::string module;
    std::string stage;
    std::string message;
    // Source span of the content that triggered the event, 0 if detached.
    std::uint64_t span = 0;
};

// "[warning] flow/layout @3: message"
std::string format_diagnostic(const DiagnosticEvent& event);

using DiagnosticObserver = std::function<void(const DiagnosticEvent&)>;

// Collects the diagnostics of a layout call. Events below the minimum
// severity are dropped before observers see them.
class DiagnosticEmitter {
public:
    explicit DiagnosticEmitter(Severity min_severity = Severity::Info)
        : min_severity_(min_severity) {}

    void emit(Severity severity, const std::string& module, const std::string& stage,
              const std::string& message, std::uint64_t span = 0);

    void info(const std::string& module, const std::string& stage, const std::string& message,
              std::uint64_t span = 0) {
        emit(Severity::Info, module, stage, message, span);
    }
    void warn(const std::string& module, const std::string& stage, const std::string& message,
              std::uint64_t span = 0) {
        emit(Severity::Warning, module, stage, message, span);
    }
    void error(const std::string& module, const std::string& stage, const std::string& message,
               std::uint64_t span = 0) {
        emit(Severity::Error, module, stage, message, span);
    }

    void set_min_severity(Severity min) { min_severity_ = min; }
    Severity min_severity() const { return min_severity_; }

    void add_observer(DiagnosticObserver observer);

    const std::vector<DiagnosticEvent>& events() const { return events_; }
    std::vector<DiagnosticEvent> events_by_severity(Severity severity) const;
    std::vector<DiagnosticEvent> events_by_module(const std::string& module) const;
    std::size_t count(Severity severity) const;
    bool has_errors() const { return count(Severity::Error) > 0; }

    void clear() { events_.clear(); }
    std::size_t size() const { return events_.size(); }

private:
    std::vector<DiagnosticEvent> events_;
    std::vector<DiagnosticObserver> observers_;
    Severity min_severity_;
};

}  // namespace folio::core
