#include "bus/events.hpp"

#include <utility>

#include "utils/common.hpp"

namespace scriptbox::bus {

RunEvent MakeStartEvent(const std::string& run_id, const std::string& file_name) {
    RunEvent event{};
    event.kind = EventKind::kStart;
    event.run_id = run_id;
    event.file_name = file_name;
    return event;
}

RunEvent MakeOutputEvent(EventKind stream, const std::string& run_id, std::string chunk) {
    RunEvent event{};
    event.kind = stream;
    event.run_id = run_id;
    event.chunk = std::move(chunk);
    return event;
}

RunEvent MakeExitEvent(const std::string& run_id,
                       std::optional<int> exit_code,
                       std::optional<std::string> signal,
                       bool timed_out) {
    RunEvent event{};
    event.kind = EventKind::kExit;
    event.run_id = run_id;
    event.exit_code = exit_code;
    event.signal = std::move(signal);
    event.timed_out = timed_out;
    return event;
}

RunEvent MakeErrorEvent(const std::string& run_id, std::string error) {
    RunEvent event{};
    event.kind = EventKind::kError;
    event.run_id = run_id;
    event.error = std::move(error);
    return event;
}

const char* EventName(EventKind kind) {
    switch (kind) {
        case EventKind::kStart: return "run:start";
        case EventKind::kStdout: return "run:stdout";
        case EventKind::kStderr: return "run:stderr";
        case EventKind::kExit: return "run:exit";
        case EventKind::kError: return "run:error";
    }
    return "run:unknown";
}

nlohmann::json ToJson(const RunEvent& event) {
    nlohmann::json json = {{"runId", event.run_id}};
    switch (event.kind) {
        case EventKind::kStart:
            json["filename"] = event.file_name;
            json["startedAt"] = utils::ToEpochMs(event.timestamp);
            break;
        case EventKind::kStdout:
        case EventKind::kStderr:
            json["chunk"] = event.chunk;
            break;
        case EventKind::kExit:
            json["code"] = event.exit_code.has_value() ? nlohmann::json(*event.exit_code) : nlohmann::json(nullptr);
            json["signal"] = event.signal.has_value() ? nlohmann::json(*event.signal) : nlohmann::json(nullptr);
            json["timedOut"] = event.timed_out;
            json["finishedAt"] = utils::ToEpochMs(event.timestamp);
            break;
        case EventKind::kError:
            json["error"] = event.error;
            break;
    }
    return json;
}

std::string ToWire(const RunEvent& event) {
    return ToJson(event).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace scriptbox::bus
