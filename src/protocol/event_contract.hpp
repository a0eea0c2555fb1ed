#pragma once
#include <functional>
#include <string>

namespace conductor::protocol {

    enum class EventType {
        RunStarted,
        Turn,        // An agent message was appended
        Paused,      // A pending request was created
        Decision,    // A human decision was applied
        Completed,
        Failed
    };

    // Lifecycle notification for observers (UI, journal). round is 0 outside
    // round-robin discussion turns.
    struct WorkflowEvent {
        std::string run_id;
        EventType type = EventType::RunStarted;
        std::string agent;
        int round = 0;
        std::string content;
    };

    using EventSink = std::function<void(const WorkflowEvent&)>;

    inline std::string to_string(const EventType type) {
        switch (type) {
            case EventType::RunStarted:
                return "run_started";
            case EventType::Turn:
                return "turn";
            case EventType::Paused:
                return "paused";
            case EventType::Decision:
                return "decision";
            case EventType::Completed:
                return "completed";
            case EventType::Failed:
                return "failed";
            default:
                return "unknown";
        }
    }

} // namespace conductor::protocol
