// Training corpus readers.
// - JSON exports with a "documents" array of {category, text} objects.
// - SQLite databases with one row per labelled document.

#include "corpus_source.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>
#include <sqlite3.h>

namespace fs = std::filesystem;
using json   = nlohmann::json;

const char* const DEFAULT_CORPUS_QUERY = "SELECT category, text FROM documents";

// ---------------------------
// RAII wrappers for sqlite3
// ---------------------------
struct SqliteDb
{
    sqlite3* db = nullptr;

    explicit SqliteDb(const std::string& path)
    {
        if (sqlite3_open_v2(path.c_str(), &db, SQLITE_OPEN_READONLY, nullptr) != SQLITE_OK)
        {
            std::string msg = "Failed to open SQLite DB: ";
            msg += path;
            if (db)
            {
                msg += " (";
                msg += sqlite3_errmsg(db);
                msg += ")";
                sqlite3_close(db);
                db = nullptr;
            }
            throw std::runtime_error(msg);
        }
    }

    ~SqliteDb()
    {
        if (db)
        {
            sqlite3_close(db);
        }
    }

    SqliteDb(const SqliteDb&) = delete;
    SqliteDb& operator=(const SqliteDb&) = delete;
};

struct SqliteStmt
{
    sqlite3_stmt* stmt = nullptr;

    SqliteStmt(sqlite3* db, const char* sql)
    {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK)
        {
            std::string msg = "Failed to prepare SQL: ";
            msg += sqlite3_errmsg(db);
            throw std::runtime_error(msg);
        }
    }

    ~SqliteStmt()
    {
        if (stmt)
        {
            sqlite3_finalize(stmt);
        }
    }

    SqliteStmt(const SqliteStmt&) = delete;
    SqliteStmt& operator=(const SqliteStmt&) = delete;
};

// Read a whole file into a string.
static std::string readFileToString(const std::string& filename)
{
    std::ifstream in(filename);
    if (!in)
    {
        throw std::runtime_error("Could not open file: " + filename);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static std::string columnText(sqlite3_stmt* stmt, int col)
{
    const unsigned char* c = sqlite3_column_text(stmt, col);
    return c ? reinterpret_cast<const char*>(c) : std::string();
}

// ---------------------------
// JSON
// ---------------------------
void readJsonCorpus(const std::string& path, std::vector<LabelledDocument>& outDocs)
{
    json j;
    try
    {
        j = json::parse(readFileToString(path));
    }
    catch (const json::parse_error& ex)
    {
        throw std::runtime_error("Failed to parse JSON corpus " + path + ": " + ex.what());
    }

    if (!j.is_object() || !j.contains("documents") || !j["documents"].is_array())
    {
        std::cerr << "CorpusSource: warning: '" << fs::path(path).filename().string()
                  << "' does not contain a valid 'documents' array.\n";
        return;
    }

    std::size_t skipped = 0;
    for (const auto& doc : j["documents"])
    {
        if (!doc.is_object() ||
            !doc.contains("category") || !doc["category"].is_string() ||
            !doc.contains("text")     || !doc["text"].is_string())
        {
            ++skipped;
            continue;
        }

        LabelledDocument d;
        d.category = doc["category"].get<std::string>();
        d.text     = doc["text"].get<std::string>();
        outDocs.push_back(std::move(d));
    }

    if (skipped > 0)
    {
        std::cerr << "CorpusSource: skipped " << skipped
                  << " malformed document(s) in " << path << "\n";
    }
}

// ---------------------------
// SQLite
// ---------------------------
void readSqliteCorpus(const std::string& dbPath,
                      std::vector<LabelledDocument>& outDocs,
                      const std::string& query)
{
    if (!fs::exists(dbPath))
    {
        throw std::runtime_error("Database file does not exist: " + dbPath);
    }

    SqliteDb db(dbPath);
    SqliteStmt stmt(db.db, query.c_str());

    if (sqlite3_column_count(stmt.stmt) < 2)
    {
        throw std::runtime_error("Corpus query must return (category, text) columns: " + query);
    }

    std::size_t skipped = 0;
    while (true)
    {
        int rc = sqlite3_step(stmt.stmt);
        if (rc == SQLITE_DONE) break;
        if (rc != SQLITE_ROW)
        {
            std::string msg = "Error stepping corpus query: ";
            msg += sqlite3_errmsg(db.db);
            throw std::runtime_error(msg);
        }

        if (sqlite3_column_type(stmt.stmt, 0) == SQLITE_NULL ||
            sqlite3_column_type(stmt.stmt, 1) == SQLITE_NULL)
        {
            ++skipped;
            continue;
        }

        LabelledDocument d;
        d.category = columnText(stmt.stmt, 0);
        d.text     = columnText(stmt.stmt, 1);
        outDocs.push_back(std::move(d));
    }

    if (skipped > 0)
    {
        std::cerr << "CorpusSource: skipped " << skipped
                  << " row(s) with NULL columns in " << dbPath << "\n";
    }
}

// ---------------------------
// Dispatch by file type
// ---------------------------
static bool isSqlitePath(const std::string& path)
{
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });
    return ext == ".db" || ext == ".sqlite" || ext == ".sqlite3";
}

bool loadCorpus(const std::string& path,
                std::vector<LabelledDocument>& outDocs,
                std::string& errorOut)
{
    try
    {
        std::vector<LabelledDocument> docs;
        if (isSqlitePath(path))
            readSqliteCorpus(path, docs);
        else
            readJsonCorpus(path, docs);

        outDocs.insert(outDocs.end(),
                       std::make_move_iterator(docs.begin()),
                       std::make_move_iterator(docs.end()));
        errorOut.clear();
        return true;
    }
    catch (const std::exception& ex)
    {
        errorOut = ex.what();
        return false;
    }
}

std::size_t trainFromCorpus(BayesClassifier& classifier,
                            const std::vector<LabelledDocument>& docs,
                            bool addMissing)
{
    std::size_t trained = 0;
    for (const LabelledDocument& d : docs)
    {
        if (addMissing && !classifier.hasCategory(d.category))
            classifier.addCategory(d.category);

        classifier.train(d.category, d.text);
        ++trained;
    }
    return trained;
}
