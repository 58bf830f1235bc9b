#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <cmath>
#include <limits>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include "ctxpack/errors.hpp"
#include "pattern_matcher.hpp"

namespace ctxpack::engine {

    constexpr std::uintmax_t DEFAULT_MAX_FILE_SIZE_BYTES = 1024 * 1024;

    /**
     * @brief Parses a non-negative decimal byte count ("4096").
     * @return std::nullopt on signs, other characters, or overflow.
     */
    inline std::optional<std::uintmax_t> parse_byte_count(const std::string& text) {
        if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) return std::nullopt;
        try {
            return static_cast<std::uintmax_t>(std::stoull(text));
        } catch (const std::out_of_range&) {
            return std::nullopt;
        }
    }

    struct IngestConfig {
        std::filesystem::path input_path;
        std::filesystem::path output_path;
        std::vector<std::string> include_patterns = {"*"};
        std::vector<std::string> exclude_patterns;
        bool respect_ignore_files = true;
        std::vector<std::string> ignore_file_names = {".gitignore"};
        std::optional<std::uintmax_t> max_file_size_bytes = DEFAULT_MAX_FILE_SIZE_BYTES; // Unset = no limit
        bool skip_binary_files = true;
        std::optional<std::filesystem::path> vocab_path;   // WordPiece vocab for token estimates

        /**
         * @brief Returns a copy with blank patterns dropped and an empty include list
         * widened to "*".
         */
        IngestConfig normalized() const {
            IngestConfig cfg = *this;
            cfg.include_patterns = normalize_patterns(include_patterns, true);
            cfg.exclude_patterns = normalize_patterns(exclude_patterns, false);
            cfg.ignore_file_names = normalize_patterns(ignore_file_names, false);
            return cfg;
        }

        /**
         * @brief Overlays the keys present in a JSON object onto this config.
         * @throws IngestError(InvalidConfig) on a non-object or mistyped value.
         */
        void apply_json(const nlohmann::json& j) {
            if (!j.is_object()) {
                throw IngestError(IngestError::Kind::InvalidConfig, "Config root must be a JSON object");
            }

            try {
                if (j.contains("input_path")) input_path = j.at("input_path").get<std::string>();
                if (j.contains("output_path")) output_path = j.at("output_path").get<std::string>();
                if (j.contains("include_patterns")) include_patterns = j.at("include_patterns").get<std::vector<std::string>>();
                if (j.contains("exclude_patterns")) exclude_patterns = j.at("exclude_patterns").get<std::vector<std::string>>();
                if (j.contains("respect_ignore_files")) respect_ignore_files = j.at("respect_ignore_files").get<bool>();
                if (j.contains("ignore_file_names")) ignore_file_names = j.at("ignore_file_names").get<std::vector<std::string>>();
                if (j.contains("skip_binary_files")) skip_binary_files = j.at("skip_binary_files").get<bool>();

                if (j.contains("max_file_size_bytes")) {
                    const auto& v = j.at("max_file_size_bytes");
                    if (v.is_null()) {
                        max_file_size_bytes.reset();
                    } else if (v.is_number_unsigned() || (v.is_number_integer() && v.get<std::int64_t>() >= 0)) {
                        max_file_size_bytes = v.get<std::uintmax_t>();
                    } else {
                        throw IngestError(IngestError::Kind::InvalidConfig,
                                          "max_file_size_bytes must be a non-negative integer or null, got " + v.dump());
                    }
                } else if (j.contains("max_file_size_mb")) {
                    const auto& v = j.at("max_file_size_mb");
                    if (v.is_null()) {
                        max_file_size_bytes.reset();
                    } else {
                        double bytes = v.get<double>() * 1024 * 1024;
                        if (!std::isfinite(bytes) || bytes < 0
                            || bytes >= static_cast<double>(std::numeric_limits<std::uintmax_t>::max())) {
                            throw IngestError(IngestError::Kind::InvalidConfig,
                                              "max_file_size_mb out of range: " + v.dump());
                        }
                        max_file_size_bytes = static_cast<std::uintmax_t>(bytes);
                    }
                }

                if (j.contains("vocab_path")) {
                    const auto& v = j.at("vocab_path");
                    if (v.is_null()) vocab_path.reset();
                    else vocab_path = std::filesystem::path(v.get<std::string>());
                }
            } catch (const nlohmann::json::exception& e) {
                throw IngestError(IngestError::Kind::InvalidConfig, std::string("Invalid config value: ") + e.what());
            }
        }

        /**
         * @brief Loads a config from a JSON file. A missing file yields the defaults.
         */
        static IngestConfig load(const std::filesystem::path& path) {
            IngestConfig cfg;
            if (!std::filesystem::exists(path)) return cfg;

            std::ifstream f(path);
            if (!f.is_open()) {
                throw IngestError(IngestError::Kind::InvalidConfig, "Cannot open config file: " + path.string());
            }

            nlohmann::json j;
            try {
                j = nlohmann::json::parse(f);
            } catch (const nlohmann::json::exception& e) {
                throw IngestError(IngestError::Kind::InvalidConfig,
                                  "Malformed config file " + path.string() + ": " + e.what());
            }
            cfg.apply_json(j);
            return cfg;
        }
    };

}
