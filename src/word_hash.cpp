#include "word_hash.hpp"

#include <cctype>
#include <utility>

// -------------------------------------------------------------
// Skip words
// -------------------------------------------------------------
const std::unordered_set<std::string>& WordHashOptions::defaultSkipWords()
{
    static const std::unordered_set<std::string> SKIP_WORDS = {
        "a","again","all","along","also","an","and","are","as","at","but",
        "by","came","can","cant","couldnt","did","didn","didnt","do","doesnt",
        "dont","ever","first","from","have","her","here","him","how","i","if",
        "in","into","is","isnt","it","itll","just","last","least","like",
        "most","my","new","no","not","now","of","on","or","should","since",
        "so","some","than","that","the","their","then","this","those","to",
        "told","too","true","try","until","url","us","were","when","whether",
        "while","with","within","yes","you","youll"
    };
    return SKIP_WORDS;
}

// -------------------------------------------------------------
// WordHash
// -------------------------------------------------------------
WordHash::WordHash(WordHashOptions options)
    : options_(std::move(options))
{
}

std::vector<std::string> WordHash::words(const std::string& text) const
{
    std::vector<std::string> raw;
    std::string current;
    for (char ch : text)
    {
        unsigned char uch = static_cast<unsigned char>(ch);
        if (std::isalnum(uch))
        {
            if (options_.lowercase)
                current.push_back(static_cast<char>(std::tolower(uch)));
            else
                current.push_back(ch);
        }
        else if (!current.empty())
        {
            raw.push_back(current);
            current.clear();
        }
    }
    if (!current.empty())
        raw.push_back(current);

    std::vector<std::string> filtered;
    filtered.reserve(raw.size());
    for (std::string& w : raw)
    {
        if (w.size() < options_.minLength)
            continue;
        if (options_.skipWords.find(w) != options_.skipWords.end())
            continue;
        filtered.push_back(std::move(w));
    }
    return filtered;
}

WordCounts WordHash::operator()(const std::string& text) const
{
    WordCounts counts;
    for (const std::string& w : words(text))
        ++counts[w];
    return counts;
}
