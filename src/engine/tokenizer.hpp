#pragma once

#include <string>
#include <string_view>
#include <memory>
#include <optional>
#include <filesystem>

namespace ctxpack::engine {

    /**
     * @brief Strategy for estimating how many model tokens a piece of text costs.
     */
    class TokenCounter {
    public:
        virtual ~TokenCounter() = default;

        /**
         * @brief Returns the estimated number of tokens in text.
         */
        virtual std::size_t count(std::string_view text) const = 0;

        /**
         * @brief Short label used in logs ("wordpiece", "whitespace").
         */
        virtual std::string name() const = 0;
    };

    /**
     * @brief WordPiece counter over a BERT-style vocab.txt (one token per line).
     * @return nullptr when the vocabulary cannot be read or is empty.
     */
    std::unique_ptr<TokenCounter> create_wordpiece_counter(const std::filesystem::path& vocab_path);

    /**
     * @brief Counts whitespace-separated words.
     */
    std::unique_ptr<TokenCounter> create_whitespace_counter();

    /**
     * @brief Prefers the WordPiece counter, falls back to the whitespace counter.
     */
    std::unique_ptr<TokenCounter> create_token_counter(const std::optional<std::filesystem::path>& vocab_path);

}
