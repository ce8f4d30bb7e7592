#include <iostream>
#include <stdexcept>
#include "SQLiteStore.hpp"
#include "TelemetryPipeline.hpp"

SQLiteStore::SQLiteStore(std::string const& path)
    : db(nullptr)
{
    int rc = sqlite3_open(path.c_str(), &db);
    if (rc != SQLITE_OK)
    {
        std::string message = db ? sqlite3_errmsg(db) : "out of memory";
        if (db) sqlite3_close(db);
        throw std::runtime_error("Failed to open SQLite DB " + path + ": " + message);
    }
}

SQLiteStore::~SQLiteStore()
{
    if (db) sqlite3_close(db);
}

void SQLiteStore::exec(char const* sql)
{
    char* errMsg = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK)
    {
        std::string message = errMsg ? errMsg : "unknown error";
        if (errMsg) sqlite3_free(errMsg);
        throw std::runtime_error("SQLite error: " + message);
    }
}

sqlite3_stmt* SQLiteStore::prepare(char const* sql)
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK)
        throw std::runtime_error(std::string("Failed to prepare statement: ") + sqlite3_errmsg(db));
    return stmt;
}

void SQLiteStore::step(sqlite3_stmt* stmt)
{
    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE)
    {
        std::string message = sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        throw std::runtime_error("SQLite insert failed: " + message);
    }
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
}

void SQLiteStore::bindOptional(sqlite3_stmt* stmt, int index, std::optional<double> value)
{
    if (value)
        sqlite3_bind_double(stmt, index, *value);
    else
        sqlite3_bind_null(stmt, index);
}

void SQLiteStore::recreateTables()
{
    const char* createSql =
        "DROP TABLE IF EXISTS VehicleAggregates;"
        "DROP TABLE IF EXISTS StationAggregates;"
        "DROP TABLE IF EXISTS FleetTimeline;"
        "DROP TABLE IF EXISTS StreamDiagnostics;"
        "DROP TABLE IF EXISTS Anomalies;"
        "CREATE TABLE VehicleAggregates ("
        "  vehicleId TEXT, "
        "  episode INTEGER, "
        "  vehicleType TEXT, "
        "  closedBy TEXT, "
        "  samples INTEGER, "
        "  minSpeed REAL, "
        "  maxSpeed REAL, "
        "  meanSpeed REAL, "
        "  speedVariance REAL, "
        "  pathDistance REAL, "
        "  odometerDistance REAL, "
        "  stoppedTime REAL, "
        "  tripDistance REAL, "
        "  tripDuration REAL, "
        "  waitingTime REAL, "
        "  energyConsumed REAL, "
        "  energyRegenerated REAL, "
        "  energyCharged REAL, "
        "  initialSoc REAL, "
        "  finalSoc REAL, "
        "  chargingSessions INTEGER, "
        "  chargingEnergy REAL, "
        "  energyPerKm REAL, "
        "  PRIMARY KEY (vehicleId, episode)"
        ");"
        "CREATE TABLE StationAggregates ("
        "  stationId TEXT PRIMARY KEY, "
        "  name TEXT, "
        "  capacity INTEGER, "
        "  sessions INTEGER, "
        "  energyDelivered REAL, "
        "  occupiedDuration REAL, "
        "  meanSessionTime REAL, "
        "  maxSessionTime REAL, "
        "  distinctVehicles INTEGER, "
        "  peakConcurrency INTEGER, "
        "  overlapAnomalies INTEGER"
        ");"
        "CREATE TABLE FleetTimeline ("
        "  bucketStart REAL PRIMARY KEY, "
        "  samples INTEGER, "
        "  meanSpeed REAL, "
        "  batterySamples INTEGER, "
        "  meanSoc REAL, "
        "  sessionsEnded INTEGER, "
        "  energyDelivered REAL"
        ");"
        "CREATE TABLE StreamDiagnostics ("
        "  stream TEXT PRIMARY KEY, "
        "  source TEXT, "
        "  present INTEGER, "
        "  recordsRead INTEGER, "
        "  malformed INTEGER"
        ");"
        "CREATE TABLE Anomalies ("
        "  kind TEXT, "
        "  vehicleId TEXT, "
        "  stationId TEXT, "
        "  at REAL, "
        "  detail TEXT"
        ");";

    exec(createSql);
}

void SQLiteStore::insertVehicles(PipelineResult const& result)
{
    sqlite3_stmt* stmt = prepare(
        "INSERT INTO VehicleAggregates VALUES "
        "(?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");

    for (const auto& v : result.vehicles)
    {
        sqlite3_bind_text(stmt, 1, v.vehicleId.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int(stmt, 2, static_cast<int>(v.episode));
        sqlite3_bind_text(stmt, 3, v.vehicleType.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 4, finalizeReasonName(v.reason), -1, SQLITE_STATIC);
        sqlite3_bind_int64(stmt, 5, static_cast<sqlite3_int64>(v.sampleCount));

        if (v.speed)
        {
            sqlite3_bind_double(stmt, 6, v.speed->min);
            sqlite3_bind_double(stmt, 7, v.speed->max);
            sqlite3_bind_double(stmt, 8, v.speed->mean);
            sqlite3_bind_double(stmt, 9, v.speed->variance);
        }
        else
        {
            for (int i = 6; i <= 9; ++i)
                sqlite3_bind_null(stmt, i);
        }

        sqlite3_bind_double(stmt, 10, v.pathDistance);
        bindOptional(stmt, 11, v.odometerDistance);
        sqlite3_bind_double(stmt, 12, v.stoppedTime);
        bindOptional(stmt, 13, v.trip ? std::optional<double>(v.trip->distance) : std::nullopt);
        bindOptional(stmt, 14, v.trip ? std::optional<double>(v.trip->duration) : std::nullopt);
        bindOptional(stmt, 15, v.trip ? std::optional<double>(v.trip->waitingTime) : std::nullopt);
        sqlite3_bind_double(stmt, 16, v.energyConsumed);
        sqlite3_bind_double(stmt, 17, v.energyRegenerated);
        sqlite3_bind_double(stmt, 18, v.energyCharged);
        bindOptional(stmt, 19, v.initialSoc);
        bindOptional(stmt, 20, v.finalSoc);
        sqlite3_bind_int(stmt, 21, static_cast<int>(v.chargingSessions));
        sqlite3_bind_double(stmt, 22, v.chargingEnergyDelivered);
        bindOptional(stmt, 23, v.energyPerKm);

        step(stmt);
    }
    sqlite3_finalize(stmt);
}

void SQLiteStore::insertStations(PipelineResult const& result)
{
    sqlite3_stmt* stmt = prepare(
        "INSERT INTO StationAggregates VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");

    for (const auto& s : result.stations)
    {
        sqlite3_bind_text(stmt, 1, s.stationId.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, s.name.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int(stmt, 3, s.capacity);
        sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(s.sessions));
        sqlite3_bind_double(stmt, 5, s.energyDelivered);
        sqlite3_bind_double(stmt, 6, s.occupiedDuration);
        sqlite3_bind_double(stmt, 7, s.meanSessionTime());
        sqlite3_bind_double(stmt, 8, s.maxSessionTime);
        sqlite3_bind_int64(stmt, 9, static_cast<sqlite3_int64>(s.distinctVehicles));
        sqlite3_bind_int(stmt, 10, s.peakConcurrency);
        sqlite3_bind_int64(stmt, 11, static_cast<sqlite3_int64>(s.overlapAnomalies));
        step(stmt);
    }
    sqlite3_finalize(stmt);
}

void SQLiteStore::insertTimeline(PipelineResult const& result)
{
    sqlite3_stmt* stmt = prepare("INSERT INTO FleetTimeline VALUES (?, ?, ?, ?, ?, ?, ?);");

    for (const auto& b : result.timeline)
    {
        sqlite3_bind_double(stmt, 1, b.start);
        sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(b.samples));
        bindOptional(stmt, 3, b.meanSpeed);
        sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(b.batterySamples));
        bindOptional(stmt, 5, b.meanSoc);
        sqlite3_bind_int64(stmt, 6, static_cast<sqlite3_int64>(b.chargingSessionsEnded));
        sqlite3_bind_double(stmt, 7, b.energyDelivered);
        step(stmt);
    }
    sqlite3_finalize(stmt);
}

void SQLiteStore::insertDiagnostics(PipelineResult const& result)
{
    RunDiagnostics const& diag = result.diagnostics;

    sqlite3_stmt* stmt = prepare("INSERT INTO StreamDiagnostics VALUES (?, ?, ?, ?, ?);");
    for (int k = 0; k < STREAM_KIND_COUNT; ++k)
    {
        auto kind = static_cast<StreamKind>(k);
        StreamCounters const& s = diag.stream(kind);
        sqlite3_bind_text(stmt, 1, streamKindName(kind), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 2, s.source.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int(stmt, 3, s.present ? 1 : 0);
        sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(s.recordsRead));
        sqlite3_bind_int64(stmt, 5, static_cast<sqlite3_int64>(s.malformed));
        step(stmt);
    }
    sqlite3_finalize(stmt);

    stmt = prepare("INSERT INTO Anomalies VALUES (?, ?, ?, ?, ?);");
    auto insert = [this, stmt](char const* kind, std::string const& vehicleId, std::string const& stationId,
                               std::optional<double> at, std::string const& detail)
    {
        sqlite3_bind_text(stmt, 1, kind, -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 2, vehicleId.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 3, stationId.c_str(), -1, SQLITE_TRANSIENT);
        bindOptional(stmt, 4, at);
        sqlite3_bind_text(stmt, 5, detail.c_str(), -1, SQLITE_TRANSIENT);
        step(stmt);
    };

    for (const auto& m : diag.missingCorrelations())
        insert("missing_correlation", m.vehicleId, "", m.at, streamKindName(m.kind));
    for (const auto& o : diag.overlapAnomalies())
        insert("station_overlap", o.vehicleId, o.stationId, o.at,
               std::to_string(o.concurrency) + "/" + std::to_string(o.capacity));
    for (const auto& id : diag.lateChargingVehicles())
        insert("late_charging", id, "", std::nullopt, "");
    for (const auto& id : diag.unfinishedTrips())
        insert("unfinished_trip", id, "", std::nullopt, "");
    for (const auto& id : diag.recycledIds())
        insert("recycled_id", id, "", std::nullopt, "");
    sqlite3_finalize(stmt);
}

void SQLiteStore::writeReport(PipelineResult const& result)
{
    std::lock_guard<std::mutex> lock(mutex);

    exec("BEGIN TRANSACTION;");
    try
    {
        recreateTables();
        insertVehicles(result);
        insertStations(result);
        insertTimeline(result);
        insertDiagnostics(result);
        exec("COMMIT;");
    }
    catch (std::exception const&)
    {
        sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr);
        throw;
    }

    std::cout << "[System] Report database written (" << result.vehicles.size() << " vehicles, "
              << result.stations.size() << " stations)" << std::endl;
}

std::int64_t SQLiteStore::countRows(std::string const& table)
{
    std::lock_guard<std::mutex> lock(mutex);

    std::string sql = "SELECT COUNT(*) FROM " + table + ";";
    sqlite3_stmt* stmt = prepare(sql.c_str());

    std::int64_t count = -1;
    if (sqlite3_step(stmt) == SQLITE_ROW)
        count = sqlite3_column_int64(stmt, 0);
    sqlite3_finalize(stmt);
    return count;
}

std::optional<double> SQLiteStore::queryDouble(std::string const& sql)
{
    std::lock_guard<std::mutex> lock(mutex);

    sqlite3_stmt* stmt = prepare(sql.c_str());

    std::optional<double> result;
    if (sqlite3_step(stmt) == SQLITE_ROW && sqlite3_column_type(stmt, 0) != SQLITE_NULL)
        result = sqlite3_column_double(stmt, 0);
    sqlite3_finalize(stmt);
    return result;
}
