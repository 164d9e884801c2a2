/**
 * @file ResultWriter.hpp
 * @brief Serializes the analysis record to its JSON output file.
 */

#pragma once
#include <string>
#include <nlohmann/json.hpp>

#include "domain/PipelineState.hpp"

namespace editalflow::infrastructure {

class ResultWriter {
public:
    /**
     * @brief Output record: bid_number, city, metadata, target_match, threshold_match,
     *        is_relevant, summary, justification (and error when the run failed).
     */
    static nlohmann::ordered_json ToJson(const domain::PipelineState& state);

    /**
     * @brief Writes the record atomically (temp file + rename).
     * @param error Set when the file could not be written.
     * @return True on success.
     */
    static bool Write(const domain::PipelineState& state, const std::string& outputPath, std::string& error);
};

} // namespace editalflow::infrastructure
