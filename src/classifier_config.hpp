#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "bayes_classifier.hpp"
#include "word_hash.hpp"

// Settings read from a JSON file such as:
//
//   {
//     "categories": ["spam", "ham"],
//     "scoring": "laplace",
//     "tokenizer": { "min_length": 3, "lowercase": true, "skip_words": ["the"] }
//   }
//
// Every key is optional.
struct ClassifierConfig
{
    std::vector<std::string> categories;
    ScoringPolicy            scoring = ScoringPolicy::Unsmoothed;
    WordHashOptions          tokenizer;
};

// Throws std::runtime_error on an unknown scoring name or a value of the
// wrong type.
ClassifierConfig parseClassifierConfig(const nlohmann::json& j);

// Reads and parses a config file. Errors mention the file name.
ClassifierConfig loadClassifierConfig(const std::string& path);

ScoringPolicy parseScoringPolicy(const std::string& name);

BayesClassifier makeClassifier(const ClassifierConfig& config);
