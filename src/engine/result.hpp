#pragma once

#include <string>
#include <filesystem>
#include <nlohmann/json.hpp>
#include "ctxpack/types.hpp"

namespace ctxpack::engine {

    /**
     * @brief Abbreviates a count: 999 -> "999", 1234 -> "1.2k", 1234567 -> "1.2M".
     */
    std::string format_count(std::size_t n, int precision = 1);

    /**
     * @brief Human-readable report of one ingest run.
     */
    std::string summary_text(const IngestResult& result, const std::filesystem::path& input_path);

    nlohmann::json to_json(const IngestResult& result);

}
