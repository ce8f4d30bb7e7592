#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include "sqlite3.h"

struct PipelineResult;

// Report database. Each write replaces the previous run's tables, so writing
// the same result twice leaves the same database behind.
class SQLiteStore
{
private:
    sqlite3* db;
    std::mutex mutex;

    void exec(char const* sql);
    sqlite3_stmt* prepare(char const* sql);
    void step(sqlite3_stmt* stmt);

    void recreateTables();
    void insertVehicles(PipelineResult const& result);
    void insertStations(PipelineResult const& result);
    void insertTimeline(PipelineResult const& result);
    void insertDiagnostics(PipelineResult const& result);

    static void bindOptional(sqlite3_stmt* stmt, int index, std::optional<double> value);

public:
    explicit SQLiteStore(std::string const& path);
    ~SQLiteStore();

    SQLiteStore(SQLiteStore const&) = delete;
    SQLiteStore& operator=(SQLiteStore const&) = delete;

    void writeReport(PipelineResult const& result);

    std::int64_t countRows(std::string const& table);
    std::optional<double> queryDouble(std::string const& sql);
};
