#include "livepatch/core/diagnostics.h"

#include <iostream>
#include <sstream>

namespace livepatch::core {

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
    if (!event.module.empty()) {
        oss << " " << event.module;
    }
    if (!event.stage.empty()) {
        oss << "/" << event.stage;
    }
    if (event.correlation_id != 0) {
        oss << " (cid:" << event.correlation_id << ")";
    }
    oss << ": " << event.message;
    return oss.str();
}

void DiagnosticEmitter::emit(Severity severity, const std::string& module,
                             const std::string& stage, const std::string& message) {
    if (severity < min_severity_) {
        return;
    }

    DiagnosticEvent event;
    event.timestamp = std::chrono::steady_clock::now();
    event.severity = severity;
    event.module = module;
    event.stage = stage;
    event.message = message;
    event.correlation_id = correlation_id_;

    for (const auto& observer : observers_) {
        observer(event);
    }

    if (retain_events_) {
        events_.push_back(std::move(event));
    }
}

void DiagnosticEmitter::info(const std::string& module, const std::string& stage,
                             const std::string& message) {
    emit(Severity::Info, module, stage, message);
}

void DiagnosticEmitter::warning(const std::string& module, const std::string& stage,
                                const std::string& message) {
    emit(Severity::Warning, module, stage, message);
}

void DiagnosticEmitter::error(const std::string& module, const std::string& stage,
                              const std::string& message) {
    emit(Severity::Error, module, stage, message);
}

void DiagnosticEmitter::set_correlation_id(std::uint64_t id) {
    correlation_id_ = id;
}

std::uint64_t DiagnosticEmitter::correlation_id() const {
    return correlation_id_;
}

void DiagnosticEmitter::set_min_severity(Severity min) {
    min_severity_ = min;
}

Severity DiagnosticEmitter::min_severity() const {
    return min_severity_;
}

void DiagnosticEmitter::add_observer(DiagnosticObserver observer) {
    observers_.push_back(std::move(observer));
}

void DiagnosticEmitter::set_retain_events(bool retain) {
    retain_events_ = retain;
}

const std::vector<DiagnosticEvent>& DiagnosticEmitter::events() const {
    return events_;
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_severity(Severity severity) const {
    std::vector<DiagnosticEvent> result;
    for (const auto& e : events_) {
        if (e.severity == severity) {
            result.push_back(e);
        }
    }
    return result;
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_module(const std::string& module) const {
    std::vector<DiagnosticEvent> result;
    for (const auto& e : events_) {
        if (e.module == module) {
            result.push_back(e);
        }
    }
    return result;
}

std::size_t DiagnosticEmitter::count(Severity severity) const {
    std::size_t n = 0;
    for (const auto& e : events_) {
        if (e.severity == severity) ++n;
    }
    return n;
}

void DiagnosticEmitter::clear() {
    events_.clear();
}

std::size_t DiagnosticEmitter::size() const {
    return events_.size();
}

DiagnosticObserver stderr_observer() {
    return [](const DiagnosticEvent& event) {
        std::cerr << format_diagnostic(event) << "\n";
    };
}

}  // namespace livepatch::core
