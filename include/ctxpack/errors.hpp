#pragma once
#include <stdexcept>
#include <string>

namespace ctxpack::engine {

    /**
     * @brief Fatal ingest failure. Per-file read errors are never thrown,
     * the packager recovers them inline.
     */
    class IngestError : public std::runtime_error {
    public:
        enum class Kind {
            NotFound,       // Input root does not exist
            InvalidPath,    // Input root is neither a regular file nor a directory
            EmptySelection, // Filters matched zero files
            OutputFailure,  // Output artifact could not be created or written
            Cancelled,      // Stop flag observed while packaging
            InvalidConfig   // Configuration file is malformed
        };

        IngestError(Kind kind, const std::string& message)
            : std::runtime_error(message), m_kind(kind) {}

        Kind kind() const noexcept { return m_kind; }

    private:
        Kind m_kind;
    };

    inline const char* to_string(IngestError::Kind kind) {
        switch (kind) {
            case IngestError::Kind::NotFound: return "not-found";
            case IngestError::Kind::InvalidPath: return "invalid-path";
            case IngestError::Kind::EmptySelection: return "empty-selection";
            case IngestError::Kind::OutputFailure: return "output-failure";
            case IngestError::Kind::Cancelled: return "cancelled";
            case IngestError::Kind::InvalidConfig: return "invalid-config";
        }
        return "unknown";
    }

}
