#pragma once
#include <string>
#include <vector>
#include <map>
#include <filesystem>
#include <cstddef>

namespace ctxpack::engine {

    struct FileEntry {
        std::filesystem::path absolute_path;
        std::string relative_path; // always '/'-separated, relative to the ingest root

        std::string display_name() const {
            return relative_path.empty() ? absolute_path.filename().string() : relative_path;
        }
    };

    struct IngestResult {
        std::filesystem::path output_path;
        bool is_directory = false;
        std::vector<std::string> files;
        std::map<std::string, std::size_t> file_line_counts;
        std::size_t token_count = 0;

        std::size_t file_count() const { return files.size(); }
    };

}
