#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace nrt_predict::core {

using json = nlohmann::json;

// Writes one JSON object per line to the event stream.
class EventEmitter {
public:
    EventEmitter(std::string run_id, std::ostream& out);

    void run_start(const json& extra);
    void run_end(bool success, const std::string& status, const json& extra = json::object());

    void stage_start(Stage stage, const json& extra = json::object());
    void stage_end(Stage stage, const std::string& status, const json& extra = json::object());

    void warning(const std::string& message, const json& extra = json::object());
    void error(const std::string& message, const json& extra = json::object());

    void stop_requested(Stage stage);

private:
    void emit(const json& event);
    json base_event(const std::string& type) const;

    std::string run_id_;
    std::ostream& out_;
};

} // namespace nrt_predict::core
