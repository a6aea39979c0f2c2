#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace livepatch::core {

enum class Severity {
    Info,
    Warning,
    Error,
};

struct DiagnosticEvent {
    std::chrono::steady_clock::time_point timestamp;
    Severity severity = Severity::Info;
    std::string module;
    std::string stage;
    std::string message;
    std::uint64_t correlation_id = 0;
};

const char* severity_name(Severity severity);

// "[warning] apply/resolve (cid:3): message"
std::string format_diagnostic(const DiagnosticEvent& event);

using DiagnosticObserver = std::function<void(const DiagnosticEvent&)>;

// Structured log sink shared by the parser, the diff engine, the applier and
// the render session. Components take it by pointer; null means silent.
class DiagnosticEmitter {
public:
    void emit(Severity severity, const std::string& module,
              const std::string& stage, const std::string& message);

    void info(const std::string& module, const std::string& stage,
              const std::string& message);
    void warning(const std::string& module, const std::string& stage,
                 const std::string& message);
    void error(const std::string& module, const std::string& stage,
               const std::string& message);

    void set_correlation_id(std::uint64_t id);
    std::uint64_t correlation_id() const;

    void set_min_severity(Severity min);
    Severity min_severity() const;

    void add_observer(DiagnosticObserver observer);

    // When false, events are only forwarded to observers.
    void set_retain_events(bool retain);

    const std::vector<DiagnosticEvent>& events() const;
    std::vector<DiagnosticEvent> events_by_severity(Severity severity) const;
    std::vector<DiagnosticEvent> events_by_module(const std::string& module) const;
    std::size_t count(Severity severity) const;

    void clear();
    std::size_t size() const;

private:
    std::vector<DiagnosticEvent> events_;
    std::vector<DiagnosticObserver> observers_;
    std::uint64_t correlation_id_ = 0;
    Severity min_severity_ = Severity::Info;
    bool retain_events_ = true;
};

// Observer that writes formatted events to stderr.
DiagnosticObserver stderr_observer();

}  // namespace livepatch::core
