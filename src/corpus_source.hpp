#pragma once

#include <string>
#include <vector>

#include "bayes_classifier.hpp"

// One labelled training document.
struct LabelledDocument
{
    std::string category;
    std::string text;
};

// JSON corpus:
//   { "documents": [ { "category": "spam", "text": "..." }, ... ] }
// Entries without a string category and text are skipped.
// Throws std::runtime_error if the file cannot be read or parsed.
void readJsonCorpus(const std::string& path, std::vector<LabelledDocument>& outDocs);

// SQLite corpus, opened read-only. The query must return two text columns,
// category first. Rows with a NULL column are skipped.
// Throws std::runtime_error on open/prepare/step failures.
extern const char* const DEFAULT_CORPUS_QUERY;

void readSqliteCorpus(const std::string& dbPath,
                      std::vector<LabelledDocument>& outDocs,
                      const std::string& query = DEFAULT_CORPUS_QUERY);

// Picks SQLite for .db/.sqlite/.sqlite3 files and JSON otherwise.
// On success returns true and appends to outDocs; on failure returns false,
// leaves outDocs unchanged and sets errorOut.
bool loadCorpus(const std::string& path,
                std::vector<LabelledDocument>& outDocs,
                std::string& errorOut);

// Trains every document in order and returns how many were trained.
// With addMissing, categories not yet registered are added first; without
// it the classifier's UnknownCategoryError propagates.
std::size_t trainFromCorpus(BayesClassifier& classifier,
                            const std::vector<LabelledDocument>& docs,
                            bool addMissing);
