#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "nlohmann/json.hpp"

namespace scriptbox::bus {

enum class EventKind {
    kStart,
    kStdout,
    kStderr,
    kExit,
    kError
};

// One lifecycle or output event of a run. `kind` selects which payload
// fields are meaningful.
struct RunEvent {
    EventKind kind = EventKind::kStart;
    std::string run_id;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();

    // kStart
    std::string file_name;
    // kStdout, kStderr
    std::string chunk;
    // kExit
    std::optional<int> exit_code;
    std::optional<std::string> signal;
    bool timed_out = false;
    // kError
    std::string error;

    bool IsTerminal() const {
        return kind == EventKind::kExit || kind == EventKind::kError;
    }
};

RunEvent MakeStartEvent(const std::string& run_id, const std::string& file_name);
RunEvent MakeOutputEvent(EventKind stream, const std::string& run_id, std::string chunk);
RunEvent MakeExitEvent(const std::string& run_id,
                       std::optional<int> exit_code,
                       std::optional<std::string> signal,
                       bool timed_out);
RunEvent MakeErrorEvent(const std::string& run_id, std::string error);

// Wire names: run:start, run:stdout, run:stderr, run:exit, run:error.
const char* EventName(EventKind kind);

nlohmann::json ToJson(const RunEvent& event);

// Compact JSON; invalid UTF-8 in output chunks is replaced, not rejected.
std::string ToWire(const RunEvent& event);

}  // namespace scriptbox::bus
