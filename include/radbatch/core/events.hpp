#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace radbatch::core {

using json = nlohmann::json;

// Writes one JSON object per line. Callers serialize access when emitting
// from several worker threads.
class EventEmitter {
public:
    EventEmitter() = default;

    void run_start(const std::string& run_id, const json& extra, std::ostream& out);
    void run_end(const std::string& run_id, bool success, const std::string& status, std::ostream& out);

    void phase_start(const std::string& run_id, Phase phase, const json& extra, std::ostream& out);
    void phase_progress(const std::string& run_id, Phase phase, size_t done, size_t total,
                        const std::string& message, std::ostream& out);
    void phase_end(const std::string& run_id, Phase phase, const std::string& status,
                   const json& extra, std::ostream& out);

    void job_progress(const std::string& run_id, Phase phase, const std::string& label,
                      float percent, std::ostream& out);
    void job_end(const std::string& run_id, Phase phase, const std::string& label,
                 bool success, const json& extra, std::ostream& out);

    void warning(const std::string& run_id, const std::string& message, std::ostream& out);
    void error(const std::string& run_id, const std::string& message, std::ostream& out);

private:
    void emit(const json& event, std::ostream& out);
    json base_event(const std::string& type, const std::string& run_id);
};

void emit_event(const std::string& type, const std::string& run_id,
                const json& data, std::ostream& out);

} // namespace radbatch::core
