#pragma once

#include <functional>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "word_hash.hpp"

// Raised when train/untrain names a category that was never added.
class UnknownCategoryError : public std::runtime_error
{
public:
    explicit UnknownCategoryError(const std::string& category)
        : std::runtime_error("No such category: " + category)
        , category_(category)
    {
    }

    const std::string& category() const { return category_; }

private:
    std::string category_;
};

// Raised by classify() when there is nothing to choose from.
class EmptyRegistryError : public std::runtime_error
{
public:
    EmptyRegistryError()
        : std::runtime_error("Cannot classify: no categories registered")
    {
    }
};

enum class ScoringPolicy
{
    // Sum of ln(count / categoryTotal) over distinct known words, plus the
    // log prior. Unknown words contribute nothing.
    Unsmoothed,

    // Add-one smoothing over the shared vocabulary, each word weighted by
    // its count in the scored text.
    Laplace
};

// Multinomial naive Bayes over a mutable set of named categories.
//
//     BayesClassifier b({"interesting", "uninteresting"});
//     b.train("interesting", "Here are some good words. I hope you love them.");
//     b.train("uninteresting", "Here are some bad words, I hate you.");
//     std::string label = b.classify("I hate bad words and you");
//
// Not thread safe; hosts sharing one instance must serialize every call.
class BayesClassifier
{
public:
    using Tokenizer = std::function<WordCounts(const std::string&)>;

    BayesClassifier();
    explicit BayesClassifier(std::vector<std::string> categories,
                             ScoringPolicy policy = ScoringPolicy::Unsmoothed,
                             Tokenizer tokenizer = WordHash());
    BayesClassifier(std::initializer_list<std::string> categories);

    // Registry ----------------------------------------------------------

    // Adding an existing name empties its word ledger; its document count
    // and its position in categories() are kept.
    const std::string& addCategory(const std::string& category);
    const std::string& appendCategory(const std::string& category) { return addCategory(category); }

    std::optional<std::string> removeCategory(const std::string& category);

    // Insertion order.
    const std::vector<std::string>& categories() const { return order_; }
    bool hasCategory(const std::string& category) const;

    // Training ----------------------------------------------------------

    void train(const std::string& category, const std::string& text);
    void train(const std::string& category, const WordCounts& words);

    // Reverses a previous train() with the same arguments. Calling it
    // without a matching train() leaves the counters inconsistent.
    void untrain(const std::string& category, const std::string& text);
    void untrain(const std::string& category, const WordCounts& words);

    // Queries -----------------------------------------------------------

    // Score for every registered category; higher (closer to zero) wins.
    // Untrained categories produce -inf or NaN rather than an error.
    std::unordered_map<std::string, double> scoreAll(const std::string& text) const;

    // Same scores in categories() order.
    std::vector<std::pair<std::string, double>> orderedScores(const std::string& text) const;

    // Highest score; ties go to the category added first.
    std::string classify(const std::string& text) const;

    // Inspection --------------------------------------------------------

    long long documentCount(const std::string& category) const;
    long long wordCount(const std::string& category, const std::string& word) const;
    long long categoryWordTotal(const std::string& category) const;
    std::size_t distinctWords(const std::string& category) const;
    long long totalWords() const { return totalWords_; }
    std::size_t vocabularySize() const;
    ScoringPolicy scoringPolicy() const { return policy_; }

    const Tokenizer& tokenizer() const { return tokenizer_; }

private:
    struct CategoryLedger
    {
        std::unordered_map<std::string, long long> words;
        long long documents = 0;
    };

    CategoryLedger& ledgerFor(const std::string& category);
    const CategoryLedger* findLedger(const std::string& category) const;

    double scoreUnsmoothed(const CategoryLedger& ledger,
                           const WordCounts& words,
                           double totalDocs) const;
    double scoreLaplace(const CategoryLedger& ledger,
                        const WordCounts& words,
                        double totalDocs,
                        const std::unordered_set<std::string>& vocabulary) const;
    std::unordered_set<std::string> collectVocabulary() const;

    std::vector<std::string> order_;
    std::unordered_map<std::string, CategoryLedger> ledgers_;
    long long totalWords_ = 0;

    ScoringPolicy policy_ = ScoringPolicy::Unsmoothed;
    Tokenizer tokenizer_;
};

const char* scoringPolicyName(ScoringPolicy policy);
