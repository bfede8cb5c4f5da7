#include "infrastructure/database/Database.hpp"

#include <spdlog/spdlog.h>

#include <ctime>
#include <stdexcept>

namespace vlanvision::infra {

// Statement implementation
Statement::Statement(sqlite3_stmt* stmt) : stmt_(stmt) {}

Statement::~Statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

Statement::Statement(Statement&& other) noexcept : stmt_(other.stmt_) {
    other.stmt_ = nullptr;
}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
        stmt_ = other.stmt_;
        other.stmt_ = nullptr;
    }
    return *this;
}

void Statement::bind(int index, int value) {
    if (sqlite3_bind_int(stmt_, index, value) != SQLITE_OK) {
        throw std::runtime_error("Failed to bind int parameter");
    }
}

void Statement::bind(int index, int64_t value) {
    if (sqlite3_bind_int64(stmt_, index, value) != SQLITE_OK) {
        throw std::runtime_error("Failed to bind int64 parameter");
    }
}

void Statement::bind(int index, double value) {
    if (sqlite3_bind_double(stmt_, index, value) != SQLITE_OK) {
        throw std::runtime_error("Failed to bind double parameter");
    }
}

void Statement::bind(int index, const std::string& value) {
    if (sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT) !=
        SQLITE_OK) {
        throw std::runtime_error("Failed to bind text parameter");
    }
}

void Statement::bindNull(int index) {
    if (sqlite3_bind_null(stmt_, index) != SQLITE_OK) {
        throw std::runtime_error("Failed to bind null parameter");
    }
}

bool Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    throw std::runtime_error(std::string("SQLite step failed: ") + sqlite3_errstr(rc));
}

void Statement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

int Statement::columnInt(int index) const {
    return sqlite3_column_int(stmt_, index);
}

int64_t Statement::columnInt64(int index) const {
    return sqlite3_column_int64(stmt_, index);
}

double Statement::columnDouble(int index) const {
    return sqlite3_column_double(stmt_, index);
}

std::string Statement::columnText(int index) const {
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, index));
    return text ? text : "";
}

bool Statement::columnIsNull(int index) const {
    return sqlite3_column_type(stmt_, index) == SQLITE_NULL;
}

// Database implementation
Database::Database(const std::string& path) {
    spdlog::info("Opening database: {}", path);

    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open database: " + error);
    }

    configureConnection();
    createMigrationsTable();
}

Database::~Database() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void Database::configureConnection() {
    execute("PRAGMA journal_mode=WAL");
    execute("PRAGMA synchronous=NORMAL");
    execute("PRAGMA foreign_keys=ON");
}

void Database::execute(const std::string& sql) {
    std::lock_guard lock(mutex_);
    char* errMsg = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg) != SQLITE_OK) {
        std::string error = errMsg ? errMsg : "Unknown error";
        sqlite3_free(errMsg);
        throw std::runtime_error("SQL execution failed: " + error);
    }
}

Statement Database::prepare(const std::string& sql) {
    std::lock_guard lock(mutex_);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("Failed to prepare statement: ") + sqlite3_errmsg(db_));
    }
    return Statement(stmt);
}

int64_t Database::lastInsertRowId() const {
    return sqlite3_last_insert_rowid(db_);
}

int Database::changes() const {
    return sqlite3_changes(db_);
}

void Database::beginTransaction() {
    execute("BEGIN TRANSACTION");
}

void Database::commit() {
    execute("COMMIT");
}

void Database::rollback() {
    execute("ROLLBACK");
}

std::string Database::formatTimestamp(const std::chrono::system_clock::time_point& tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&time, &tm);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &tm);
    return buffer;
}

std::chrono::system_clock::time_point Database::parseTimestamp(const std::string& str) {
    std::tm tm{};
    if (strptime(str.c_str(), "%Y-%m-%d %H:%M:%S", &tm) == nullptr) {
        return {};
    }
    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

void Database::createMigrationsTable() {
    execute(R"(
        CREATE TABLE IF NOT EXISTS schema_migrations (
            version INTEGER PRIMARY KEY,
            applied_at TEXT DEFAULT CURRENT_TIMESTAMP
        )
    )");
}

int Database::schemaVersion() {
    auto stmt = prepare("SELECT MAX(version) FROM schema_migrations");
    if (stmt.step() && !stmt.columnIsNull(0)) {
        return stmt.columnInt(0);
    }
    return 0;
}

void Database::setVersion(int version) {
    auto stmt = prepare("INSERT INTO schema_migrations (version) VALUES (?)");
    stmt.bind(1, version);
    stmt.step();
}

void Database::runMigrations() {
    int currentVersion = schemaVersion();
    spdlog::info("Current schema version: {}", currentVersion);

    // Migration 1: devices, jobs and alerts
    if (currentVersion < 1) {
        spdlog::info("Applying migration 1: Initial schema");
        transaction([this] {
            execute(R"(
                CREATE TABLE IF NOT EXISTS devices (
                    id INTEGER PRIMARY KEY,
                    ip_address TEXT NOT NULL DEFAULT '',
                    mac_address TEXT NOT NULL DEFAULT '',
                    hostname TEXT NOT NULL DEFAULT '',
                    device_class INTEGER NOT NULL DEFAULT 0,
                    vendor TEXT NOT NULL DEFAULT '',
                    sys_descr TEXT NOT NULL DEFAULT '',
                    sys_object_id TEXT NOT NULL DEFAULT '',
                    location TEXT NOT NULL DEFAULT '',
                    vlan_id INTEGER,
                    cpu_percent REAL,
                    uptime_ticks INTEGER,
                    reachability INTEGER NOT NULL DEFAULT 0,
                    consecutive_misses INTEGER NOT NULL DEFAULT 0,
                    merged_into INTEGER,
                    first_seen TEXT,
                    last_seen TEXT
                )
            )");

            execute(R"(
                CREATE TABLE IF NOT EXISTS device_interfaces (
                    device_id INTEGER NOT NULL REFERENCES devices(id) ON DELETE CASCADE,
                    if_index INTEGER NOT NULL,
                    name TEXT NOT NULL DEFAULT '',
                    mac_address TEXT NOT NULL DEFAULT '',
                    admin_status INTEGER NOT NULL DEFAULT 4,
                    oper_status INTEGER NOT NULL DEFAULT 4,
                    speed_bps INTEGER NOT NULL DEFAULT 0,
                    in_octets INTEGER NOT NULL DEFAULT 0,
                    out_octets INTEGER NOT NULL DEFAULT 0,
                    in_errors INTEGER NOT NULL DEFAULT 0,
                    out_errors INTEGER NOT NULL DEFAULT 0,
                    utilization REAL,
                    PRIMARY KEY (device_id, if_index)
                )
            )");

            execute(R"(
                CREATE TABLE IF NOT EXISTS device_ip_history (
                    id INTEGER PRIMARY KEY AUTOINCREMENT,
                    device_id INTEGER NOT NULL REFERENCES devices(id) ON DELETE CASCADE,
                    address TEXT NOT NULL,
                    last_seen TEXT
                )
            )");

            execute("CREATE INDEX IF NOT EXISTS idx_ip_history_device ON device_ip_history(device_id)");

            execute(R"(
                CREATE TABLE IF NOT EXISTS discovery_jobs (
                    id INTEGER PRIMARY KEY,
                    network_range TEXT NOT NULL,
                    techniques TEXT NOT NULL DEFAULT '',
                    origin INTEGER NOT NULL DEFAULT 1,
                    state INTEGER NOT NULL DEFAULT 0,
                    cancelled INTEGER NOT NULL DEFAULT 0,
                    created_at TEXT,
                    started_at TEXT,
                    finished_at TEXT,
                    error_message TEXT NOT NULL DEFAULT '',
                    warnings TEXT NOT NULL DEFAULT '[]',
                    target_count INTEGER NOT NULL DEFAULT 0,
                    units_total INTEGER NOT NULL DEFAULT 0,
                    units_resolved INTEGER NOT NULL DEFAULT 0,
                    devices_updated INTEGER NOT NULL DEFAULT 0,
                    coalesced_requests INTEGER NOT NULL DEFAULT 0
                )
            )");

            execute(R"(
                CREATE TABLE IF NOT EXISTS job_outcomes (
                    job_id INTEGER NOT NULL REFERENCES discovery_jobs(id) ON DELETE CASCADE,
                    address TEXT NOT NULL,
                    outcome INTEGER NOT NULL,
                    PRIMARY KEY (job_id, address)
                )
            )");

            execute("CREATE INDEX IF NOT EXISTS idx_jobs_created ON discovery_jobs(created_at)");

            execute(R"(
                CREATE TABLE IF NOT EXISTS alerts (
                    id INTEGER PRIMARY KEY,
                    device_id INTEGER NOT NULL,
                    interface_index INTEGER,
                    interface_name TEXT NOT NULL DEFAULT '',
                    rule INTEGER NOT NULL,
                    severity INTEGER NOT NULL,
                    message TEXT NOT NULL DEFAULT '',
                    first_fired TEXT,
                    last_seen TEXT,
                    resolved_at TEXT,
                    acknowledged INTEGER NOT NULL DEFAULT 0
                )
            )");

            execute("CREATE INDEX IF NOT EXISTS idx_alerts_first_fired ON alerts(first_fired)");

            setVersion(1);
        });
    }

    // Migration 2: link-layer neighbors
    if (currentVersion < 2) {
        spdlog::info("Applying migration 2: Add device neighbors");
        transaction([this] {
            execute(R"(
                CREATE TABLE IF NOT EXISTS device_neighbors (
                    id INTEGER PRIMARY KEY AUTOINCREMENT,
                    device_id INTEGER NOT NULL REFERENCES devices(id) ON DELETE CASCADE,
                    protocol INTEGER NOT NULL,
                    local_port TEXT NOT NULL DEFAULT '',
                    remote_device_id TEXT NOT NULL DEFAULT '',
                    remote_port TEXT NOT NULL DEFAULT '',
                    remote_address TEXT NOT NULL DEFAULT '',
                    remote_chassis_mac TEXT NOT NULL DEFAULT '',
                    remote_platform TEXT NOT NULL DEFAULT ''
                )
            )");

            execute("CREATE INDEX IF NOT EXISTS idx_neighbors_device ON device_neighbors(device_id)");

            setVersion(2);
        });
    }

    spdlog::info("Database migrations complete. Version: {}", schemaVersion());
}

} // namespace vlanvision::infra
