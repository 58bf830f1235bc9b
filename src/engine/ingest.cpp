#include "ingest.hpp"
#include "packager.hpp"
#include "tree_renderer.hpp"
#include "ctxpack/errors.hpp"
#include "platform.hpp"

namespace ctxpack::engine {

    IngestResult run_ingest(const IngestConfig& config,
                            const TokenCounter& counter,
                            const std::atomic<bool>* stop_flag,
                            TreeWalker::SkipCallback on_skip) {
        if (config.input_path.empty()) {
            throw IngestError(IngestError::Kind::InvalidConfig, "input_path is required");
        }
        if (config.output_path.empty()) {
            throw IngestError(IngestError::Kind::InvalidConfig, "output_path is required");
        }

        IngestConfig cfg = config.normalized();
        cfg.input_path = platform::system::expand_user(cfg.input_path);
        cfg.output_path = platform::system::expand_user(cfg.output_path);

        std::error_code ec;
        auto resolved = std::filesystem::canonical(cfg.input_path, ec);
        if (ec) resolved = std::filesystem::absolute(cfg.input_path, ec).lexically_normal();

        TreeWalker walker(cfg, std::move(on_skip));
        auto entries = walker.collect(resolved);
        if (entries.empty()) {
            throw IngestError(IngestError::Kind::EmptySelection,
                              "No files matched include/exclude filters for '" + config.input_path.string() + "'.");
        }

        bool is_directory = std::filesystem::is_directory(resolved, ec);
        ContentPackager packager(counter, stop_flag);
        return packager.package(cfg, TreeRenderer::root_display_name(resolved), entries, is_directory);
    }

}
