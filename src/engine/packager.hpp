#pragma once

#include <atomic>
#include <fstream>
#include <string>
#include <vector>
#include "ctxpack/types.hpp"
#include "config.hpp"
#include "tokenizer.hpp"

namespace ctxpack::engine {

    constexpr std::size_t SEPARATOR_WIDTH = 70;

    /**
     * @brief Decodes raw file bytes for the artifact: invalid UTF-8 sequences become
     * U+FFFD, "\r\n" and lone "\r" become "\n", and a missing final newline is added.
     */
    std::string decode_text(const std::string& raw);

    /**
     * @brief Number of lines in text; a final line without '\n' still counts.
     */
    std::size_t count_lines(const std::string& text);

    /**
     * @brief Streams the tree diagram and the selected files into the output artifact.
     */
    class ContentPackager {
    public:
        /**
         * @param counter Token estimation strategy; must outlive the packager.
         * @param stop_flag Polled between files; when set, packaging is abandoned.
         */
        explicit ContentPackager(const TokenCounter& counter, const std::atomic<bool>* stop_flag = nullptr);

        /**
         * @brief Writes the artifact to config.output_path, creating parent directories.
         *
         * Files are written in tree order. A file that cannot be read gets an inline
         * error marker and a line count of 0; the run continues.
         *
         * @throws IngestError OutputFailure if the artifact cannot be written,
         *         Cancelled if the stop flag was raised. The partial file is left on disk.
         */
        IngestResult package(const IngestConfig& config,
                             const std::string& root_display_name,
                             const std::vector<FileEntry>& entries,
                             bool is_directory) const;

    private:
        const TokenCounter& m_counter;
        const std::atomic<bool>* m_stop_flag;

        void write_chunk(std::ofstream& out, const std::string& chunk, IngestResult& result) const;
        static bool read_file(const std::filesystem::path& path, std::string& content, std::string& error);
    };

}
