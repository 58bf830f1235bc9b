#pragma once

#include <filesystem>
#include <cstddef>

namespace ctxpack::engine {

    constexpr std::size_t BINARY_SNIFF_BYTES = 8192;

    /**
     * @brief A file is binary iff a NUL byte occurs in its first BINARY_SNIFF_BYTES bytes.
     *
     * Binaries without a NUL in that prefix are reported as text. A file that cannot be
     * opened is reported as text too; the packager records the read failure.
     */
    bool is_binary(const std::filesystem::path& path);

}
