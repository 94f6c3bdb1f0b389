#include "category_dispatch.hpp"

#include <cctype>

static bool isWordChar(char ch)
{
    unsigned char uch = static_cast<unsigned char>(ch);
    return std::isalnum(uch) || ch == '_';
}

CategoryDispatch::CategoryDispatch(BayesClassifier& classifier)
    : classifier_(classifier)
{
}

bool CategoryDispatch::parseName(const std::string& name, Call& out)
{
    static const std::string TRAIN_PREFIX   = "train_";
    static const std::string UNTRAIN_PREFIX = "untrain_";

    std::string rest;
    if (name.compare(0, UNTRAIN_PREFIX.size(), UNTRAIN_PREFIX) == 0)
    {
        out.action = Action::Untrain;
        rest = name.substr(UNTRAIN_PREFIX.size());
    }
    else if (name.compare(0, TRAIN_PREFIX.size(), TRAIN_PREFIX) == 0)
    {
        out.action = Action::Train;
        rest = name.substr(TRAIN_PREFIX.size());
    }
    else
    {
        return false;
    }

    if (rest.empty())
        return false;
    for (char ch : rest)
    {
        if (!isWordChar(ch))
            return false;
    }

    out.category = rest;
    return true;
}

CategoryDispatch::Call CategoryDispatch::resolve(const std::string& name) const
{
    Call call;
    if (!parseName(name, call))
        throw NoSuchOperationError(name);

    if (!classifier_.hasCategory(call.category))
        throw UnknownCategoryError(call.category);

    return call;
}

void CategoryDispatch::invoke(const std::string& name, const std::vector<std::string>& texts)
{
    const Call call = resolve(name);

    for (const std::string& text : texts)
    {
        if (call.action == Action::Train)
            classifier_.train(call.category, text);
        else
            classifier_.untrain(call.category, text);
    }
}
