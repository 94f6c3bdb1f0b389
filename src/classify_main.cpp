// bayes_classify: train a classifier from a labelled corpus and classify
// the texts given on the command line.

#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "bayes_classifier.hpp"
#include "classifier_config.hpp"
#include "corpus_source.hpp"

struct CommandLine
{
    std::string configPath;
    std::string corpusPath;
    std::string scoring;
    bool        showScores = false;
    std::vector<std::string> texts;
};

static void printUsage(const char* argv0)
{
    std::cerr << "Usage: " << argv0
              << " [--config <file.json>] [--scoring unsmoothed|laplace]"
                 " --corpus <corpus.json|corpus.db> [--scores] <text>...\n";
}

// Returns false on a usage error.
static bool parseCommandLine(int argc, char* argv[], CommandLine& out)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        auto needValue = [&](std::string& target) {
            if (i + 1 >= argc)
            {
                std::cerr << "Missing value for " << arg << "\n";
                return false;
            }
            target = argv[++i];
            return true;
        };

        if (arg == "--config")
        {
            if (!needValue(out.configPath)) return false;
        }
        else if (arg == "--corpus")
        {
            if (!needValue(out.corpusPath)) return false;
        }
        else if (arg == "--scoring")
        {
            if (!needValue(out.scoring)) return false;
        }
        else if (arg == "--scores")
        {
            out.showScores = true;
        }
        else if (arg.size() > 2 && arg.compare(0, 2, "--") == 0)
        {
            std::cerr << "Unknown option: " << arg << "\n";
            return false;
        }
        else
        {
            out.texts.push_back(arg);
        }
    }

    return !out.corpusPath.empty() && !out.texts.empty();
}

static std::string abbreviate(const std::string& s, std::size_t maxLen)
{
    if (s.size() <= maxLen)
        return s;
    return s.substr(0, maxLen - 3) + "...";
}

static std::string runClassification(const CommandLine& cmd)
{
    ClassifierConfig config;
    if (!cmd.configPath.empty())
        config = loadClassifierConfig(cmd.configPath);
    if (!cmd.scoring.empty())
        config.scoring = parseScoringPolicy(cmd.scoring);

    BayesClassifier classifier = makeClassifier(config);

    std::vector<LabelledDocument> docs;
    std::string error;
    if (!loadCorpus(cmd.corpusPath, docs, error))
        throw std::runtime_error(error);

    std::size_t trained = trainFromCorpus(classifier, docs, true);
    std::cerr << "Trained " << trained << " document(s) across "
              << classifier.categories().size() << " categories ("
              << scoringPolicyName(classifier.scoringPolicy()) << " scoring)\n";

    std::ostringstream out;
    for (const std::string& text : cmd.texts)
    {
        out << classifier.classify(text) << "\t" << abbreviate(text, 60) << "\n";

        if (cmd.showScores)
        {
            for (const auto& kv : classifier.orderedScores(text))
            {
                out << "  " << std::left << std::setw(24) << kv.first
                    << std::setprecision(15) << kv.second << "\n";
            }
        }
    }
    return out.str();
}

int main(int argc, char* argv[])
{
    CommandLine cmd;
    if (!parseCommandLine(argc, argv, cmd))
    {
        printUsage(argv[0]);
        return 1;
    }

    try
    {
        std::cout << runClassification(cmd);
        return 0;
    }
    catch (const std::exception& ex)
    {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
