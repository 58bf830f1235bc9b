#pragma once

#include <atomic>
#include "ctxpack/types.hpp"
#include "config.hpp"
#include "tokenizer.hpp"
#include "walker.hpp"

namespace ctxpack::engine {

    /**
     * @brief Runs one ingest: walk, render, package.
     *
     * @param config Run parameters; patterns are normalized here.
     * @param counter Token estimation strategy.
     * @param stop_flag Optional cancellation flag polled while packaging.
     * @param on_skip Optional observer of every skipped file and pruned directory.
     * @throws IngestError InvalidConfig (missing input/output path), NotFound, InvalidPath,
     *         EmptySelection (nothing selected; no output is created), OutputFailure, Cancelled.
     */
    IngestResult run_ingest(const IngestConfig& config,
                            const TokenCounter& counter,
                            const std::atomic<bool>* stop_flag = nullptr,
                            TreeWalker::SkipCallback on_skip = {});

}
