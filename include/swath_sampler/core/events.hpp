#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace swath_sampler::core {

using json = nlohmann::json;

// JSON-lines run log, one event object per line.
class EventEmitter {
public:
    EventEmitter() = default;

    void run_start(const std::string& run_id, const json& extra, std::ostream& out);
    void run_end(const std::string& run_id, bool success, const std::string& status, std::ostream& out);

    void swath_start(const std::string& run_id, int swath_idx, int total_swaths,
                     const std::string& swath_name, const json& extra, std::ostream& out);
    void swath_end(const std::string& run_id, const std::string& swath_name,
                   const std::string& status, const json& extra, std::ostream& out);

    void tiles_extracted(const std::string& run_id, const std::string& swath_name,
                         const std::string& tile_set, size_t count, std::ostream& out);

    void warning(const std::string& run_id, const std::string& message, std::ostream& out);
    void error(const std::string& run_id, const std::string& message, std::ostream& out);

private:
    void emit(const json& event, std::ostream& out);
    json base_event(const std::string& type, const std::string& run_id);
};

void emit_event(const std::string& type, const std::string& run_id,
                const json& data, std::ostream& out);

} // namespace swath_sampler::core
