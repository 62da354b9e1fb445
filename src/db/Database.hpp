#pragma once

#include <optional>
#include <string>

namespace gridflow::db
{
    // Key/value store for application settings. Backed by an SQLite table when
    // built with GRIDFLOW_USE_SQLITE, otherwise by a JSON document on disk.
    class Database
    {
    public:
        static constexpr const char *ACTIVE_GRID_CONFIG_KEY = "active_grid_config";

        explicit Database(std::string file_path);

        // Store file name for the compiled backend (.db for SQLite, .json otherwise)
        static std::string defaultFileName(const std::string &stem = "gridflow");

        bool initialize(std::string *error = nullptr) const;

        bool saveValue(const std::string &key, const std::string &value, std::string *error = nullptr) const;
        std::optional<std::string> loadValue(const std::string &key, std::string *error = nullptr) const;

        bool saveActiveGridConfigJson(const std::string &config_json, std::string *error = nullptr) const;
        std::optional<std::string> loadActiveGridConfigJson(std::string *error = nullptr) const;

        const std::string &path() const;

    private:
        std::string file_path;
    };

} // namespace gridflow::db
