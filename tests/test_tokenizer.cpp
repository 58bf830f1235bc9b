#include "temp_tree.hpp"
#include "engine/tokenizer.hpp"

using namespace ctxpack::engine;

TEST(WhitespaceCounterTest, CountsWords) {
    auto counter = create_whitespace_counter();
    EXPECT_EQ(counter->name(), "whitespace");
    EXPECT_EQ(counter->count(""), 0u);
    EXPECT_EQ(counter->count("   \n\t"), 0u);
    EXPECT_EQ(counter->count("one"), 1u);
    EXPECT_EQ(counter->count("  int main() {\n\treturn 0;\n}\n"), 6u);
}

class WordPieceCounterTest : public TempTreeTest {
protected:
    fs::path vocab;

    void SetUp() override {
        TempTreeTest::SetUp();
        vocab = write_file("vocab.txt", "[PAD]\n[UNK]\nhello\n,\nworld\n!\nun\n##believ\n##able\r\n");
    }
};

TEST_F(WordPieceCounterTest, SplitsPunctuationAndLowercases) {
    auto counter = create_wordpiece_counter(vocab);
    ASSERT_NE(counter, nullptr);
    EXPECT_EQ(counter->name(), "wordpiece");
    EXPECT_EQ(counter->count("Hello, world!"), 4u);
    EXPECT_EQ(counter->count("HELLO"), 1u);
}

TEST_F(WordPieceCounterTest, GreedySubwordPieces) {
    auto counter = create_wordpiece_counter(vocab);
    ASSERT_NE(counter, nullptr);
    EXPECT_EQ(counter->count("unbelievable"), 3u);
    EXPECT_EQ(counter->count("unable"), 2u);
}

TEST_F(WordPieceCounterTest, UncoverableWordIsOneToken) {
    auto counter = create_wordpiece_counter(vocab);
    ASSERT_NE(counter, nullptr);
    EXPECT_EQ(counter->count("xyz"), 1u);
    EXPECT_EQ(counter->count("unxyz"), 1u);
    EXPECT_EQ(counter->count(std::string(150, 'a')), 1u);
}

TEST_F(WordPieceCounterTest, MissingOrEmptyVocabYieldsNothing) {
    EXPECT_EQ(create_wordpiece_counter(test_dir / "missing.txt"), nullptr);
    EXPECT_EQ(create_wordpiece_counter(write_file("empty.txt")), nullptr);
}

TEST_F(WordPieceCounterTest, FactoryFallsBackToWhitespace) {
    EXPECT_EQ(create_token_counter(std::nullopt)->name(), "whitespace");
    EXPECT_EQ(create_token_counter(test_dir / "missing.txt")->name(), "whitespace");
    EXPECT_EQ(create_token_counter(vocab)->name(), "wordpiece");
}
