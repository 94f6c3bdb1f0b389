#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "bayes_classifier.hpp"

// Raised for a name that is neither train_<category> nor untrain_<category>.
class NoSuchOperationError : public std::runtime_error
{
public:
    explicit NoSuchOperationError(const std::string& name)
        : std::runtime_error("No such method: " + name)
    {
    }
};

// Per-category shorthand for train/untrain, resolved against the live
// registry at call time:
//
//     CategoryDispatch d(classifier);
//     d.invoke("train_spam", {"buy cheap pills"});
//     d.invoke("untrain_spam", {"buy cheap pills"});
class CategoryDispatch
{
public:
    enum class Action { Train, Untrain };

    struct Call
    {
        Action      action = Action::Train;
        std::string category;
    };

    explicit CategoryDispatch(BayesClassifier& classifier);

    // Parses name and checks the category is registered.
    // Throws UnknownCategoryError or NoSuchOperationError.
    Call resolve(const std::string& name) const;

    // Applies the resolved action to every text, in order.
    void invoke(const std::string& name, const std::vector<std::string>& texts);

    // Only the shape of the name, no registry lookup.
    static bool parseName(const std::string& name, Call& out);

private:
    BayesClassifier& classifier_;
};
