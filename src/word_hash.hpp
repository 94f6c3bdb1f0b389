#pragma once

#include <map>
#include <string>
#include <unordered_set>
#include <vector>

// word -> number of occurrences in one document.
// Ordered so that training and untraining walk words in a stable order.
using WordCounts = std::map<std::string, long long>;

struct WordHashOptions
{
    // Tokens shorter than this are dropped.
    std::size_t minLength = 3;

    // Fold ASCII letters to lowercase before counting.
    bool lowercase = true;

    // Tokens (after case folding) that never reach the counts.
    std::unordered_set<std::string> skipWords = defaultSkipWords();

    static const std::unordered_set<std::string>& defaultSkipWords();
};

// Tokenizer turning raw text into a word -> count map.
// Splits on every non-alphanumeric byte before filtering, so "e-mail" yields
// "e" and "mail" and only "mail" survives the length check.
// No stemming: "chinese" and "chines" are different words.
class WordHash
{
public:
    WordHash() = default;
    explicit WordHash(WordHashOptions options);

    WordCounts operator()(const std::string& text) const;

    // Tokens in document order, after filtering.
    std::vector<std::string> words(const std::string& text) const;

    const WordHashOptions& options() const { return options_; }

private:
    WordHashOptions options_;
};
