#include "tokenizer.hpp"
#include <cctype>

namespace ctxpack::engine {

    class WhitespaceCounter : public TokenCounter {
    public:
        std::size_t count(std::string_view text) const override {
            std::size_t words = 0;
            bool in_word = false;
            for (char c : text) {
                if (std::isspace(static_cast<unsigned char>(c))) {
                    in_word = false;
                } else if (!in_word) {
                    in_word = true;
                    ++words;
                }
            }
            return words;
        }

        std::string name() const override { return "whitespace"; }
    };

    std::unique_ptr<TokenCounter> create_whitespace_counter() {
        return std::make_unique<WhitespaceCounter>();
    }

    std::unique_ptr<TokenCounter> create_token_counter(const std::optional<std::filesystem::path>& vocab_path) {
        if (vocab_path) {
            if (auto counter = create_wordpiece_counter(*vocab_path)) return counter;
        }
        return create_whitespace_counter();
    }

}
