#include "classifier.hpp"
#include <fstream>
#include <algorithm>
#include <array>

namespace ctxpack::engine {

    bool is_binary(const std::filesystem::path& path) {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open()) return false;

        std::array<char, BINARY_SNIFF_BYTES> buffer{};
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto got = static_cast<std::size_t>(file.gcount());

        return std::find(buffer.begin(), buffer.begin() + got, '\0') != buffer.begin() + got;
    }

}
