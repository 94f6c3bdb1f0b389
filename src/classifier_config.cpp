#include "classifier_config.hpp"

#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

static std::string toLowerAscii(std::string s)
{
    for (char& c : s)
        c = (char)std::tolower((unsigned char)c);
    return s;
}

static std::string readFileToString(const std::string& filename)
{
    std::ifstream in(filename);
    if (!in)
        throw std::runtime_error("Could not open file: " + filename);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

ScoringPolicy parseScoringPolicy(const std::string& name)
{
    std::string lower = toLowerAscii(name);
    if (lower == "unsmoothed" || lower == "none")
        return ScoringPolicy::Unsmoothed;
    if (lower == "laplace" || lower == "add-one")
        return ScoringPolicy::Laplace;
    throw std::runtime_error("Unknown scoring policy: " + name);
}

ClassifierConfig parseClassifierConfig(const json& j)
{
    ClassifierConfig config;

    if (!j.is_object())
        throw std::runtime_error("Classifier config must be a JSON object");

    if (j.contains("categories"))
    {
        if (!j["categories"].is_array())
            throw std::runtime_error("'categories' must be an array of strings");
        for (const auto& c : j["categories"])
        {
            if (!c.is_string())
                throw std::runtime_error("'categories' must be an array of strings");
            config.categories.push_back(c.get<std::string>());
        }
    }

    if (j.contains("scoring"))
    {
        if (!j["scoring"].is_string())
            throw std::runtime_error("'scoring' must be a string");
        config.scoring = parseScoringPolicy(j["scoring"].get<std::string>());
    }

    if (j.contains("tokenizer"))
    {
        const json& t = j["tokenizer"];
        if (!t.is_object())
            throw std::runtime_error("'tokenizer' must be an object");

        if (t.contains("min_length"))
        {
            if (!t["min_length"].is_number_unsigned())
                throw std::runtime_error("'tokenizer.min_length' must be a non-negative integer");
            config.tokenizer.minLength = t["min_length"].get<std::size_t>();
        }

        if (t.contains("lowercase"))
        {
            if (!t["lowercase"].is_boolean())
                throw std::runtime_error("'tokenizer.lowercase' must be true or false");
            config.tokenizer.lowercase = t["lowercase"].get<bool>();
        }

        // Replaces the default list; an empty array keeps every word.
        if (t.contains("skip_words"))
        {
            if (!t["skip_words"].is_array())
                throw std::runtime_error("'tokenizer.skip_words' must be an array of strings");
            config.tokenizer.skipWords.clear();
            for (const auto& w : t["skip_words"])
            {
                if (!w.is_string())
                    throw std::runtime_error("'tokenizer.skip_words' must be an array of strings");
                config.tokenizer.skipWords.insert(toLowerAscii(w.get<std::string>()));
            }
        }
    }

    return config;
}

ClassifierConfig loadClassifierConfig(const std::string& path)
{
    json j;
    try
    {
        j = json::parse(readFileToString(path));
    }
    catch (const json::parse_error& ex)
    {
        throw std::runtime_error("ClassifierConfig: failed to parse " + path + ": " + ex.what());
    }

    try
    {
        return parseClassifierConfig(j);
    }
    catch (const std::runtime_error& ex)
    {
        throw std::runtime_error("ClassifierConfig: " + path + ": " + ex.what());
    }
}

BayesClassifier makeClassifier(const ClassifierConfig& config)
{
    return BayesClassifier(config.categories, config.scoring, WordHash(config.tokenizer));
}
