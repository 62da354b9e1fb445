#include "Database.hpp"

#ifdef GRIDFLOW_USE_SQLITE
#include <sqlite3.h>

#include <memory>
#else
#include <nlohmann/json.hpp>

#include <fstream>
#include <iterator>
#endif

#include <utility>

namespace gridflow::db
{
    namespace
    {
        void setError(std::string *error, const std::string &message)
        {
            if (error)
            {
                *error = message;
            }
        }

#ifdef GRIDFLOW_USE_SQLITE
        struct ConnectionCloser
        {
            void operator()(sqlite3 *handle) const { sqlite3_close(handle); }
        };

        struct StatementFinalizer
        {
            void operator()(sqlite3_stmt *stmt) const { sqlite3_finalize(stmt); }
        };

        using Connection = std::unique_ptr<sqlite3, ConnectionCloser>;
        using Statement = std::unique_ptr<sqlite3_stmt, StatementFinalizer>;

        Connection openConnection(const std::string &file_path, std::string *error)
        {
            sqlite3 *raw = nullptr;
            const int rc = sqlite3_open(file_path.c_str(), &raw);
            Connection handle(raw);
            if (rc != SQLITE_OK)
            {
                setError(error, handle ? sqlite3_errmsg(handle.get()) : "failed to open database");
                return nullptr;
            }
            return handle;
        }

        Statement prepare(sqlite3 *handle, const char *sql, std::string *error)
        {
            sqlite3_stmt *raw = nullptr;
            if (sqlite3_prepare_v2(handle, sql, -1, &raw, nullptr) != SQLITE_OK)
            {
                setError(error, sqlite3_errmsg(handle));
                sqlite3_finalize(raw);
                return nullptr;
            }
            return Statement(raw);
        }
#else
        // Reads the whole fallback document; a missing or empty file is an empty object
        bool readDocument(const std::string &file_path, nlohmann::json &document, std::string *error)
        {
            std::ifstream in(file_path);
            if (!in.good())
            {
                document = nlohmann::json::object();
                return true;
            }

            const std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
            if (content.empty())
            {
                document = nlohmann::json::object();
                return true;
            }

            document = nlohmann::json::parse(content, nullptr, false);
            if (document.is_discarded() || !document.is_object())
            {
                setError(error, "fallback storage file is corrupt");
                return false;
            }
            return true;
        }
#endif
    } // namespace

    Database::Database(std::string file_path)
        : file_path(std::move(file_path))
    {
    }

    std::string Database::defaultFileName(const std::string &stem)
    {
#ifdef GRIDFLOW_USE_SQLITE
        return stem + ".db";
#else
        return stem + ".json";
#endif
    }

    const std::string &Database::path() const
    {
        return file_path;
    }

    bool Database::initialize(std::string *error) const
    {
#ifdef GRIDFLOW_USE_SQLITE
        Connection handle = openConnection(file_path, error);
        if (!handle)
        {
            return false;
        }

        const char *create_sql =
            "CREATE TABLE IF NOT EXISTS app_config ("
            "key TEXT PRIMARY KEY,"
            "value TEXT NOT NULL"
            ");";

        char *errmsg = nullptr;
        if (sqlite3_exec(handle.get(), create_sql, nullptr, nullptr, &errmsg) != SQLITE_OK)
        {
            setError(error, errmsg ? errmsg : "failed to initialize schema");
            sqlite3_free(errmsg);
            return false;
        }
        return true;
#else
        nlohmann::json document;
        if (!readDocument(file_path, document, error))
        {
            return false;
        }
        std::ofstream out(file_path, std::ios::app);
        if (!out.good())
        {
            setError(error, "failed to open fallback storage file");
            return false;
        }
        return true;
#endif
    }

    bool Database::saveValue(const std::string &key, const std::string &value, std::string *error) const
    {
#ifdef GRIDFLOW_USE_SQLITE
        Connection handle = openConnection(file_path, error);
        if (!handle)
        {
            return false;
        }

        Statement stmt = prepare(handle.get(),
                                 "INSERT INTO app_config(key, value) VALUES(?, ?) "
                                 "ON CONFLICT(key) DO UPDATE SET value = excluded.value;",
                                 error);
        if (!stmt)
        {
            return false;
        }

        sqlite3_bind_text(stmt.get(), 1, key.c_str(), static_cast<int>(key.size()), SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt.get(), 2, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);

        if (sqlite3_step(stmt.get()) != SQLITE_DONE)
        {
            setError(error, sqlite3_errmsg(handle.get()));
            return false;
        }
        return true;
#else
        nlohmann::json document;
        if (!readDocument(file_path, document, error))
        {
            return false;
        }
        document[key] = value;

        std::ofstream out(file_path, std::ios::trunc);
        if (!out.good())
        {
            setError(error, "failed to write fallback storage file");
            return false;
        }
        out << document.dump(2);
        return out.good();
#endif
    }

    std::optional<std::string> Database::loadValue(const std::string &key, std::string *error) const
    {
#ifdef GRIDFLOW_USE_SQLITE
        Connection handle = openConnection(file_path, error);
        if (!handle)
        {
            return std::nullopt;
        }

        Statement stmt = prepare(handle.get(), "SELECT value FROM app_config WHERE key = ? LIMIT 1;", error);
        if (!stmt)
        {
            return std::nullopt;
        }
        sqlite3_bind_text(stmt.get(), 1, key.c_str(), static_cast<int>(key.size()), SQLITE_TRANSIENT);

        const int step_rc = sqlite3_step(stmt.get());
        if (step_rc == SQLITE_ROW)
        {
            const unsigned char *text = sqlite3_column_text(stmt.get(), 0);
            return std::string(text ? reinterpret_cast<const char *>(text) : "");
        }
        if (step_rc != SQLITE_DONE)
        {
            setError(error, sqlite3_errmsg(handle.get()));
        }
        return std::nullopt;
#else
        nlohmann::json document;
        if (!readDocument(file_path, document, error))
        {
            return std::nullopt;
        }
        auto it = document.find(key);
        if (it == document.end() || !it->is_string())
        {
            return std::nullopt;
        }
        return it->get<std::string>();
#endif
    }

    bool Database::saveActiveGridConfigJson(const std::string &config_json, std::string *error) const
    {
        return saveValue(ACTIVE_GRID_CONFIG_KEY, config_json, error);
    }

    std::optional<std::string> Database::loadActiveGridConfigJson(std::string *error) const
    {
        return loadValue(ACTIVE_GRID_CONFIG_KEY, error);
    }
} // namespace gridflow::db
