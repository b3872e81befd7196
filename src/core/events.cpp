#include "swath_sampler/core/events.hpp"
#include "swath_sampler/core/utils.hpp"

namespace swath_sampler::core {

json EventEmitter::base_event(const std::string& type, const std::string& run_id) {
    return {
        {"type", type},
        {"run_id", run_id},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::emit(const json& event, std::ostream& out) {
    out << event.dump() << "\n";
    out.flush();
}

void EventEmitter::run_start(const std::string& run_id, const json& extra, std::ostream& out) {
    json event = base_event("run_start", run_id);
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event, out);
}

void EventEmitter::run_end(const std::string& run_id, bool success,
                           const std::string& status, std::ostream& out) {
    json event = base_event("run_end", run_id);
    event["success"] = success;
    event["status"] = status;
    emit(event, out);
}

void EventEmitter::swath_start(const std::string& run_id, int swath_idx, int total_swaths,
                               const std::string& swath_name, const json& extra,
                               std::ostream& out) {
    json event = base_event("swath_start", run_id);
    event["swath_idx"] = swath_idx;
    event["total_swaths"] = total_swaths;
    event["swath_name"] = swath_name;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event, out);
}

void EventEmitter::swath_end(const std::string& run_id, const std::string& swath_name,
                             const std::string& status, const json& extra, std::ostream& out) {
    json event = base_event("swath_end", run_id);
    event["swath_name"] = swath_name;
    event["status"] = status;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event, out);
}

void EventEmitter::tiles_extracted(const std::string& run_id, const std::string& swath_name,
                                   const std::string& tile_set, size_t count,
                                   std::ostream& out) {
    json event = base_event("tiles_extracted", run_id);
    event["swath_name"] = swath_name;
    event["tile_set"] = tile_set;
    event["count"] = count;
    emit(event, out);
}

void EventEmitter::warning(const std::string& run_id, const std::string& message,
                           std::ostream& out) {
    json event = base_event("warning", run_id);
    event["message"] = message;
    emit(event, out);
}

void EventEmitter::error(const std::string& run_id, const std::string& message,
                         std::ostream& out) {
    json event = base_event("error", run_id);
    event["message"] = message;
    emit(event, out);
}

void emit_event(const std::string& type, const std::string& run_id,
                const json& data, std::ostream& out) {
    json event = {
        {"type", type},
        {"run_id", run_id},
        {"ts", get_iso_timestamp()}
    };
    for (auto& [key, value] : data.items()) {
        event[key] = value;
    }
    out << event.dump() << "\n";
    out.flush();
}

} // namespace swath_sampler::core
