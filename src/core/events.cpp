#include "nrt_predict/core/events.hpp"
#include "nrt_predict/core/utils.hpp"

#include <utility>

namespace nrt_predict::core {

EventEmitter::EventEmitter(std::string run_id, std::ostream& out)
    : run_id_(std::move(run_id)), out_(out) {}

json EventEmitter::base_event(const std::string& type) const {
    return {
        {"type", type},
        {"run_id", run_id_},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::emit(const json& event) {
    out_ << event.dump() << "\n";
    out_.flush();
}

void EventEmitter::run_start(const json& extra) {
    json event = base_event("run_start");
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event);
}

void EventEmitter::run_end(bool success, const std::string& status, const json& extra) {
    json event = base_event("run_end");
    event["success"] = success;
    event["status"] = status;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event);
}

void EventEmitter::stage_start(Stage stage, const json& extra) {
    json event = base_event("stage_start");
    event["stage"] = stage_to_int(stage);
    event["stage_name"] = stage_to_string(stage);
    event["rss_bytes"] = current_rss_bytes();
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event);
}

void EventEmitter::stage_end(Stage stage, const std::string& status, const json& extra) {
    json event = base_event("stage_end");
    event["stage"] = stage_to_int(stage);
    event["stage_name"] = stage_to_string(stage);
    event["status"] = status;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event);
}

void EventEmitter::warning(const std::string& message, const json& extra) {
    json event = base_event("warning");
    event["message"] = message;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event);
}

void EventEmitter::error(const std::string& message, const json& extra) {
    json event = base_event("error");
    event["message"] = message;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event);
}

void EventEmitter::stop_requested(Stage stage) {
    json event = base_event("stop_requested");
    event["stage"] = stage_to_int(stage);
    event["stage_name"] = stage_to_string(stage);
    emit(event);
}

} // namespace nrt_predict::core
