#include "bayes_classifier.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

// Multinomial model as described in
// http://nlp.stanford.edu/IR-book/html/htmledition/naive-bayes-text-classification-1.html

const char* scoringPolicyName(ScoringPolicy policy)
{
    switch (policy)
    {
    case ScoringPolicy::Unsmoothed: return "unsmoothed";
    case ScoringPolicy::Laplace:    return "laplace";
    }
    return "unknown";
}

// -------------------------------------------------------------
// Construction / registry
// -------------------------------------------------------------
BayesClassifier::BayesClassifier()
    : tokenizer_(WordHash())
{
}

BayesClassifier::BayesClassifier(std::vector<std::string> categories,
                                 ScoringPolicy policy,
                                 Tokenizer tokenizer)
    : policy_(policy)
    , tokenizer_(std::move(tokenizer))
{
    for (const std::string& c : categories)
        addCategory(c);
}

BayesClassifier::BayesClassifier(std::initializer_list<std::string> categories)
    : BayesClassifier(std::vector<std::string>(categories))
{
}

const std::string& BayesClassifier::addCategory(const std::string& category)
{
    auto it = ledgers_.find(category);
    if (it == ledgers_.end())
    {
        ledgers_.emplace(category, CategoryLedger{});
        order_.push_back(category);
    }
    else
    {
        it->second.words.clear();
    }
    return category;
}

std::optional<std::string> BayesClassifier::removeCategory(const std::string& category)
{
    auto it = ledgers_.find(category);
    if (it == ledgers_.end())
        return std::nullopt;

    ledgers_.erase(it);
    order_.erase(std::find(order_.begin(), order_.end(), category));
    return category;
}

bool BayesClassifier::hasCategory(const std::string& category) const
{
    return ledgers_.find(category) != ledgers_.end();
}

BayesClassifier::CategoryLedger& BayesClassifier::ledgerFor(const std::string& category)
{
    auto it = ledgers_.find(category);
    if (it == ledgers_.end())
        throw UnknownCategoryError(category);
    return it->second;
}

const BayesClassifier::CategoryLedger* BayesClassifier::findLedger(const std::string& category) const
{
    auto it = ledgers_.find(category);
    return it == ledgers_.end() ? nullptr : &it->second;
}

// -------------------------------------------------------------
// Training
// -------------------------------------------------------------
void BayesClassifier::train(const std::string& category, const std::string& text)
{
    train(category, tokenizer_(text));
}

void BayesClassifier::train(const std::string& category, const WordCounts& words)
{
    CategoryLedger& ledger = ledgerFor(category);

    ledger.documents += 1;
    for (const auto& wc : words)
    {
        ledger.words[wc.first] += wc.second;
        totalWords_ += wc.second;
    }
}

void BayesClassifier::untrain(const std::string& category, const std::string& text)
{
    untrain(category, tokenizer_(text));
}

void BayesClassifier::untrain(const std::string& category, const WordCounts& words)
{
    CategoryLedger& ledger = ledgerFor(category);

    ledger.documents -= 1;
    for (const auto& wc : words)
    {
        // Once the global total goes negative the rest of the document is
        // left untouched, ledger included.
        if (totalWords_ < 0)
            continue;

        long long amount = wc.second;
        auto it = ledger.words.find(wc.first);
        const long long orig = (it == ledger.words.end()) ? 0 : it->second;
        const long long updated = orig - wc.second;

        if (updated <= 0)
        {
            // FIXME: the total drops by what the ledger held, not by what was
            // asked for, so a word untrained more often than trained leaves
            // totalWords_ out of step with the ledgers. Scores are unaffected.
            if (it != ledger.words.end())
                ledger.words.erase(it);
            amount = orig;
        }
        else
        {
            it->second = updated;
        }

        totalWords_ -= amount;
    }
}

// -------------------------------------------------------------
// Scoring
// -------------------------------------------------------------
double BayesClassifier::scoreUnsmoothed(const CategoryLedger& ledger,
                                        const WordCounts& words,
                                        double totalDocs) const
{
    double total = 0.0;
    for (const auto& wc : ledger.words)
        total += static_cast<double>(wc.second);

    double score = 0.0;
    for (const auto& wc : words)
    {
        auto it = ledger.words.find(wc.first);
        if (it != ledger.words.end())
            score += std::log(static_cast<double>(it->second) / total);
    }

    // prior
    score += std::log(static_cast<double>(ledger.documents) / totalDocs);
    return score;
}

double BayesClassifier::scoreLaplace(const CategoryLedger& ledger,
                                     const WordCounts& words,
                                     double totalDocs,
                                     const std::unordered_set<std::string>& vocabulary) const
{
    double total = 0.0;
    for (const auto& wc : ledger.words)
        total += static_cast<double>(wc.second);

    const double denominator = total + static_cast<double>(vocabulary.size());

    double score = 0.0;
    for (const auto& wc : words)
    {
        if (vocabulary.find(wc.first) == vocabulary.end())
            continue;

        auto it = ledger.words.find(wc.first);
        const double count = (it == ledger.words.end()) ? 0.0 : static_cast<double>(it->second);
        score += static_cast<double>(wc.second) * std::log((count + 1.0) / denominator);
    }

    score += std::log(static_cast<double>(ledger.documents) / totalDocs);
    return score;
}

std::vector<std::pair<std::string, double>> BayesClassifier::orderedScores(const std::string& text) const
{
    const WordCounts words = tokenizer_(text);

    double totalDocs = 0.0;
    for (const std::string& c : order_)
        totalDocs += static_cast<double>(ledgers_.at(c).documents);

    std::unordered_set<std::string> vocabulary;
    if (policy_ == ScoringPolicy::Laplace)
        vocabulary = collectVocabulary();

    std::vector<std::pair<std::string, double>> scores;
    scores.reserve(order_.size());
    for (const std::string& c : order_)
    {
        const CategoryLedger& ledger = ledgers_.at(c);
        double score = (policy_ == ScoringPolicy::Laplace)
            ? scoreLaplace(ledger, words, totalDocs, vocabulary)
            : scoreUnsmoothed(ledger, words, totalDocs);
        scores.emplace_back(c, score);
    }
    return scores;
}

std::unordered_map<std::string, double> BayesClassifier::scoreAll(const std::string& text) const
{
    std::unordered_map<std::string, double> out;
    for (auto& kv : orderedScores(text))
        out.emplace(std::move(kv.first), kv.second);
    return out;
}

std::string BayesClassifier::classify(const std::string& text) const
{
    if (order_.empty())
        throw EmptyRegistryError();

    const auto scores = orderedScores(text);

    std::size_t best = 0;
    for (std::size_t i = 1; i < scores.size(); ++i)
    {
        const double s = scores[i].second;
        const double b = scores[best].second;
        if (std::isnan(s))
            continue;
        if (std::isnan(b) || s > b)
            best = i;
    }
    return scores[best].first;
}

// -------------------------------------------------------------
// Inspection
// -------------------------------------------------------------
long long BayesClassifier::documentCount(const std::string& category) const
{
    const CategoryLedger* ledger = findLedger(category);
    if (!ledger)
        throw UnknownCategoryError(category);
    return ledger->documents;
}

long long BayesClassifier::wordCount(const std::string& category, const std::string& word) const
{
    const CategoryLedger* ledger = findLedger(category);
    if (!ledger)
        throw UnknownCategoryError(category);

    auto it = ledger->words.find(word);
    return it == ledger->words.end() ? 0 : it->second;
}

long long BayesClassifier::categoryWordTotal(const std::string& category) const
{
    const CategoryLedger* ledger = findLedger(category);
    if (!ledger)
        throw UnknownCategoryError(category);

    long long total = 0;
    for (const auto& wc : ledger->words)
        total += wc.second;
    return total;
}

std::size_t BayesClassifier::distinctWords(const std::string& category) const
{
    const CategoryLedger* ledger = findLedger(category);
    if (!ledger)
        throw UnknownCategoryError(category);
    return ledger->words.size();
}

std::unordered_set<std::string> BayesClassifier::collectVocabulary() const
{
    std::unordered_set<std::string> vocabulary;
    for (const auto& kv : ledgers_)
        for (const auto& wc : kv.second.words)
            vocabulary.insert(wc.first);
    return vocabulary;
}

std::size_t BayesClassifier::vocabularySize() const
{
    return collectVocabulary().size();
}
