#include "result.hpp"
#include <iomanip>
#include <sstream>

namespace ctxpack::engine {

    std::string format_count(std::size_t n, int precision) {
        static const char* suffixes[] = {"", "k", "M", "B", "T"};
        constexpr int max_unit = 4;

        if (n < 1000) return std::to_string(n);

        double value = static_cast<double>(n);
        int unit = 0;
        while (value >= 1000.0 && unit < max_unit) {
            value /= 1000.0;
            ++unit;
        }

        std::ostringstream ss;
        ss << std::fixed << std::setprecision(precision) << value;
        std::string text = ss.str();

        // 999950 rounds to "1000.0k"; promote to the next unit instead.
        if (std::stod(text) >= 1000.0 && unit < max_unit) {
            ss.str("");
            ss << std::fixed << std::setprecision(precision) << value / 1000.0;
            text = ss.str();
            ++unit;
        }

        if (text.find('.') != std::string::npos) {
            text.erase(text.find_last_not_of('0') + 1);
            if (text.back() == '.') text.pop_back();
        }
        return text + suffixes[unit];
    }

    std::string summary_text(const IngestResult& result, const std::filesystem::path& input_path) {
        std::ostringstream ss;
        ss << "Analysis complete! Output written to: " << result.output_path.string() << "\n";
        ss << "\n";
        ss << "Summary:\n";
        ss << "Directory: " << input_path.string() << "\n";

        if (result.is_directory) {
            ss << "Files analyzed: " << result.file_count() << "\n";
        } else {
            std::string label = result.files.empty() ? input_path.filename().string() : result.files.front();
            auto it = result.file_line_counts.find(label);
            ss << "File: " << label << "\n";
            ss << "Lines: " << (it != result.file_line_counts.end() ? it->second : 0) << "\n";
        }

        ss << "\n";
        ss << "Estimated tokens: " << format_count(result.token_count, 1);
        return ss.str();
    }

    nlohmann::json to_json(const IngestResult& result) {
        nlohmann::json j;
        j["output_path"] = result.output_path.string();
        j["is_directory"] = result.is_directory;
        j["files"] = result.files;
        j["file_line_counts"] = result.file_line_counts;
        j["token_count"] = result.token_count;
        return j;
    }

}
