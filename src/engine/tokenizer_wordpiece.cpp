#include "tokenizer.hpp"
#include <unordered_map>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <algorithm>
#include <cctype>

namespace ctxpack::engine {

    class WordPieceCounter : public TokenCounter {
    public:
        explicit WordPieceCounter(const std::filesystem::path& vocab_path) {
            load_vocab(vocab_path);
        }

        bool ready() const { return !m_vocab.empty(); }

        std::size_t count(std::string_view text) const override {
            std::size_t tokens = 0;
            std::string word;

            // Whitespace separates words; each punctuation character is a word of its own.
            for (char c : text) {
                auto uc = static_cast<unsigned char>(c);
                if (std::isspace(uc)) {
                    tokens += count_word(word);
                    word.clear();
                } else if (std::ispunct(uc)) {
                    tokens += count_word(word);
                    word.clear();
                    tokens += count_word(std::string(1, c));
                } else {
                    word += static_cast<char>(std::tolower(uc));
                }
            }
            tokens += count_word(word);
            return tokens;
        }

        std::string name() const override { return "wordpiece"; }

    private:
        static constexpr std::size_t MAX_WORD_CHARS = 100;

        std::unordered_map<std::string, int64_t> m_vocab;

        void load_vocab(const std::filesystem::path& path) {
            std::ifstream file(path);
            if (!file.is_open()) {
                std::cerr << "[Tokenizer] Failed to load vocab: " << path.string() << "\n";
                return;
            }
            std::string line;
            int64_t id = 0;
            while (std::getline(file, line)) {
                if (!line.empty() && line.back() == '\r') line.pop_back();
                m_vocab.emplace(line, id++);
            }
        }

        // Greedy longest-match-first; a word that cannot be covered is one [UNK] token.
        std::size_t count_word(const std::string& word) const {
            if (word.empty()) return 0;
            if (word.length() > MAX_WORD_CHARS) return 1;

            std::size_t pieces = 0;
            std::size_t start = 0;
            while (start < word.length()) {
                std::size_t end = word.length();
                bool found = false;

                while (start < end) {
                    std::string substr = word.substr(start, end - start);
                    if (start > 0) substr = "##" + substr;
                    if (m_vocab.count(substr)) {
                        found = true;
                        break;
                    }
                    end--;
                }

                if (!found) return 1;
                ++pieces;
                start = end;
            }
            return pieces;
        }
    };

    std::unique_ptr<TokenCounter> create_wordpiece_counter(const std::filesystem::path& vocab_path) {
        auto counter = std::make_unique<WordPieceCounter>(vocab_path);
        if (!counter->ready()) return nullptr;
        return counter;
    }

}
