#include "packager.hpp"
#include "tree_renderer.hpp"
#include "ctxpack/errors.hpp"
#include <cerrno>
#include <cstring>
#include <iostream>
#include <iterator>

namespace ctxpack::engine {

    namespace {

        const std::string SEPARATOR(SEPARATOR_WIDTH, '=');
        const char* REPLACEMENT_CHARACTER = "\xEF\xBF\xBD";

        // Length of the well-formed UTF-8 sequence at s[i], or the length of its maximal
        // ill-formed prefix negated (at least 1) when it is invalid.
        int utf8_sequence(const std::string& s, size_t i) {
            auto byte = [&](size_t k) { return static_cast<unsigned char>(s[k]); };
            unsigned char b = byte(i);

            int length = 0;
            unsigned char lo = 0x80, hi = 0xBF;
            if (b >= 0xC2 && b <= 0xDF) { length = 2; }
            else if (b == 0xE0) { length = 3; lo = 0xA0; }
            else if ((b >= 0xE1 && b <= 0xEC) || b == 0xEE || b == 0xEF) { length = 3; }
            else if (b == 0xED) { length = 3; hi = 0x9F; }
            else if (b == 0xF0) { length = 4; lo = 0x90; }
            else if (b >= 0xF1 && b <= 0xF3) { length = 4; }
            else if (b == 0xF4) { length = 4; hi = 0x8F; }
            else return -1;

            for (int k = 1; k < length; ++k) {
                if (i + k >= s.size()) return -k;
                unsigned char c = byte(i + k);
                unsigned char min = (k == 1) ? lo : 0x80;
                unsigned char max = (k == 1) ? hi : 0xBF;
                if (c < min || c > max) return -k;
            }
            return length;
        }

    }

    std::string decode_text(const std::string& raw) {
        std::string text;
        text.reserve(raw.size() + 1);

        size_t i = 0;
        while (i < raw.size()) {
            char c = raw[i];
            if (static_cast<unsigned char>(c) < 0x80) {
                if (c == '\r') {
                    text += '\n';
                    if (i + 1 < raw.size() && raw[i + 1] == '\n') ++i;
                } else {
                    text += c;
                }
                ++i;
                continue;
            }

            int length = utf8_sequence(raw, i);
            if (length > 0) {
                text.append(raw, i, static_cast<size_t>(length));
                i += static_cast<size_t>(length);
            } else {
                text += REPLACEMENT_CHARACTER;
                i += static_cast<size_t>(-length);
            }
        }

        if (text.empty() || text.back() != '\n') text += '\n';
        return text;
    }

    std::size_t count_lines(const std::string& text) {
        if (text.empty()) return 0;
        std::size_t lines = 0;
        for (char c : text) {
            if (c == '\n') ++lines;
        }
        return text.back() == '\n' ? lines : lines + 1;
    }

    ContentPackager::ContentPackager(const TokenCounter& counter, const std::atomic<bool>* stop_flag)
        : m_counter(counter), m_stop_flag(stop_flag) {}

    IngestResult ContentPackager::package(const IngestConfig& config,
                                          const std::string& root_display_name,
                                          const std::vector<FileEntry>& entries,
                                          bool is_directory) const {
        const auto& output_path = config.output_path;
        if (output_path.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(output_path.parent_path(), ec);
            if (ec) {
                throw IngestError(IngestError::Kind::OutputFailure,
                                  "Cannot create output directory " + output_path.parent_path().string() + ": " + ec.message());
            }
        }

        std::ofstream out(output_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw IngestError(IngestError::Kind::OutputFailure, "Cannot open output file: " + output_path.string());
        }

        IngestResult result;
        result.output_path = output_path;
        result.is_directory = is_directory;

        std::string tree_block = "DIRECTORY TREE:\n";
        for (const auto& line : TreeRenderer::render(root_display_name, entries, is_directory)) {
            tree_block += line;
            tree_block += '\n';
        }
        tree_block += '\n';
        write_chunk(out, tree_block, result);

        for (const auto& entry : TreeRenderer::order_entries(entries)) {
            if (m_stop_flag && m_stop_flag->load()) {
                throw IngestError(IngestError::Kind::Cancelled, "Packaging cancelled, partial output left at " + output_path.string());
            }

            std::string name = entry.display_name();
            result.files.push_back(name);

            write_chunk(out, SEPARATOR + "\nFILE: " + name + "\n" + SEPARATOR + "\n", result);

            std::string raw;
            std::string error;
            if (read_file(entry.absolute_path, raw, error)) {
                std::string text = decode_text(raw);
                write_chunk(out, text, result);
                result.file_line_counts[name] = count_lines(text);
            } else {
                std::cerr << "[ContentPackager] Failed to read " << entry.absolute_path.string() << ": " << error << "\n";
                write_chunk(out, "[Error reading file: " + error + "]\n", result);
                result.file_line_counts[name] = 0;
            }

            write_chunk(out, "\n", result);
        }

        out.flush();
        if (!out) {
            throw IngestError(IngestError::Kind::OutputFailure, "Failed writing output file: " + output_path.string());
        }
        return result;
    }

    void ContentPackager::write_chunk(std::ofstream& out, const std::string& chunk, IngestResult& result) const {
        out.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        if (!out) {
            throw IngestError(IngestError::Kind::OutputFailure, "Failed writing output file: " + result.output_path.string());
        }
        result.token_count += m_counter.count(chunk);
    }

    bool ContentPackager::read_file(const std::filesystem::path& path, std::string& content, std::string& error) {
        errno = 0;
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open()) {
            error = errno != 0 ? std::strerror(errno) : "cannot open file";
            return false;
        }

        content.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
        if (file.bad()) {
            error = "read failed";
            return false;
        }
        return true;
    }

}
