#include "storage/catalog_database.hpp"
#include "common/logger.hpp"
#include <filesystem>
#include <sqlite3.h>
#include <stdexcept>

namespace {

const int BUSY_TIMEOUT_MS = 10000;

const char* SCHEMA = R"SQL(
CREATE TABLE IF NOT EXISTS backup_jobs (
    job_id            TEXT PRIMARY KEY,
    vm_identifier     TEXT NOT NULL,
    backup_type       TEXT NOT NULL,
    status            TEXT NOT NULL,
    phase             TEXT NOT NULL,
    created_at        INTEGER NOT NULL,
    started_at        INTEGER,
    completed_at      INTEGER,
    error_message     TEXT,
    error_kind        TEXT,
    snapshot_id       TEXT,
    target_descriptor TEXT,
    bytes_transferred INTEGER NOT NULL DEFAULT 0,
    total_bytes       INTEGER NOT NULL DEFAULT 0,
    progress_percent  REAL NOT NULL DEFAULT 0,
    current_phase     TEXT,
    last_telemetry_at INTEGER
);
CREATE INDEX IF NOT EXISTS idx_backup_jobs_vm ON backup_jobs(vm_identifier, created_at);
CREATE INDEX IF NOT EXISTS idx_backup_jobs_status ON backup_jobs(status);

CREATE TABLE IF NOT EXISTS disk_results (
    job_id                      TEXT NOT NULL REFERENCES backup_jobs(job_id) ON DELETE CASCADE,
    disk_index                  INTEGER NOT NULL,
    disk_key                    TEXT,
    source_path                 TEXT,
    capacity_bytes              INTEGER NOT NULL DEFAULT 0,
    port                        INTEGER,
    export_name                 TEXT,
    image_path                  TEXT,
    process_pid                 INTEGER,
    bytes_transferred           INTEGER NOT NULL DEFAULT 0,
    total_bytes                 INTEGER NOT NULL DEFAULT 0,
    progress_percent            REAL NOT NULL DEFAULT 0,
    status                      TEXT NOT NULL,
    change_tracking_id          TEXT,
    previous_change_tracking_id TEXT,
    parent_backup_id            TEXT,
    backup_id                   TEXT,
    error_message               TEXT,
    last_telemetry_at           INTEGER,
    PRIMARY KEY (job_id, disk_index)
);

CREATE TABLE IF NOT EXISTS backups (
    backup_id          TEXT PRIMARY KEY,
    job_id             TEXT,
    vm_identifier      TEXT NOT NULL,
    disk_index         INTEGER NOT NULL,
    backup_type        TEXT NOT NULL,
    parent_backup_id   TEXT,
    image_path         TEXT NOT NULL,
    size_bytes         INTEGER NOT NULL DEFAULT 0,
    change_tracking_id TEXT,
    snapshot_id        TEXT,
    created_at         INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_backups_chain ON backups(vm_identifier, disk_index);
CREATE INDEX IF NOT EXISTS idx_backups_parent ON backups(parent_backup_id);

CREATE TABLE IF NOT EXISTS backup_chains (
    vm_identifier    TEXT NOT NULL,
    disk_index       INTEGER NOT NULL,
    full_backup_id   TEXT NOT NULL,
    latest_backup_id TEXT NOT NULL,
    total_backups    INTEGER NOT NULL,
    total_size_bytes INTEGER NOT NULL DEFAULT 0,
    created_at       INTEGER NOT NULL,
    updated_at       INTEGER NOT NULL,
    PRIMARY KEY (vm_identifier, disk_index)
);
)SQL";

} // namespace

CatalogDatabase::Statement::Statement(sqlite3* db, const std::string& sql)
    : db_(db)
    , stmt_(nullptr)
    , sql_(sql) {
    if (sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), &stmt_, nullptr) != SQLITE_OK) {
        std::string message = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt_);
        stmt_ = nullptr;
        throw std::runtime_error("Error preparing query [" + sql + "]: " + message);
    }
}

CatalogDatabase::Statement::~Statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

CatalogDatabase::Statement::Statement(Statement&& other) noexcept
    : db_(other.db_)
    , stmt_(other.stmt_)
    , sql_(std::move(other.sql_)) {
    other.stmt_ = nullptr;
}

CatalogDatabase::Statement& CatalogDatabase::Statement::bind(int index, const std::string& value) {
    sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    return *this;
}

CatalogDatabase::Statement& CatalogDatabase::Statement::bind(int index, int64_t value) {
    sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value));
    return *this;
}

CatalogDatabase::Statement& CatalogDatabase::Statement::bind(int index, int value) {
    sqlite3_bind_int(stmt_, index, value);
    return *this;
}

CatalogDatabase::Statement& CatalogDatabase::Statement::bind(int index, double value) {
    sqlite3_bind_double(stmt_, index, value);
    return *this;
}

CatalogDatabase::Statement& CatalogDatabase::Statement::bindNull(int index) {
    sqlite3_bind_null(stmt_, index);
    return *this;
}

bool CatalogDatabase::Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    throw std::runtime_error("Error executing query [" + sql_ + "]: " + sqlite3_errmsg(db_));
}

void CatalogDatabase::Statement::execute() {
    while (step()) {
    }
}

void CatalogDatabase::Statement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

std::string CatalogDatabase::Statement::columnText(int column) const {
    const unsigned char* text = sqlite3_column_text(stmt_, column);
    return text ? std::string(reinterpret_cast<const char*>(text)) : std::string();
}

int64_t CatalogDatabase::Statement::columnInt64(int column) const {
    return static_cast<int64_t>(sqlite3_column_int64(stmt_, column));
}

int CatalogDatabase::Statement::columnInt(int column) const {
    return sqlite3_column_int(stmt_, column);
}

double CatalogDatabase::Statement::columnDouble(int column) const {
    return sqlite3_column_double(stmt_, column);
}

bool CatalogDatabase::Statement::isNull(int column) const {
    return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

CatalogDatabase::Transaction::Transaction(CatalogDatabase& database)
    : database_(database)
    , lock_(database.mutex_)
    , finished_(false) {
    if (database_.inTransaction_) {
        throw std::logic_error("nested catalog transaction");
    }
    database_.execute("BEGIN IMMEDIATE;");
    database_.inTransaction_ = true;
}

CatalogDatabase::Transaction::~Transaction() {
    if (!finished_) {
        try {
            database_.execute("ROLLBACK;");
        } catch (const std::exception& e) {
            Logger::error(std::string("Catalog rollback failed: ") + e.what());
        }
        database_.inTransaction_ = false;
    }
}

void CatalogDatabase::Transaction::commit() {
    database_.execute("COMMIT;");
    database_.inTransaction_ = false;
    finished_ = true;
}

CatalogDatabase::CatalogDatabase(const std::string& path)
    : db_(nullptr)
    , path_(path)
    , inTransaction_(false) {
    if (path != ":memory:") {
        std::filesystem::path dir = std::filesystem::path(path).parent_path();
        std::error_code ec;
        if (!dir.empty() && !std::filesystem::exists(dir, ec)) {
            std::filesystem::create_directories(dir, ec);
        }
    }

    if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Could not open catalog [" + path + "]: " + message);
    }

    sqlite3_busy_timeout(db_, BUSY_TIMEOUT_MS);
    execute("PRAGMA foreign_keys = ON;");
    if (path != ":memory:") {
        execute("PRAGMA journal_mode = WAL;");
    }
    execute("PRAGMA synchronous = NORMAL;");
    initializeSchema();
    Logger::info("Opened backup catalog " + path);
}

CatalogDatabase::~CatalogDatabase() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void CatalogDatabase::execute(const std::string& sql) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    char* errorMessage = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errorMessage) != SQLITE_OK) {
        std::string message = errorMessage ? errorMessage : sqlite3_errmsg(db_);
        sqlite3_free(errorMessage);
        throw std::runtime_error("Error executing [" + sql + "]: " + message);
    }
}

CatalogDatabase::Statement CatalogDatabase::prepare(const std::string& sql) {
    return Statement(db_, sql);
}

std::unique_lock<std::recursive_mutex> CatalogDatabase::lock() {
    return std::unique_lock<std::recursive_mutex>(mutex_);
}

int CatalogDatabase::changes() const {
    return sqlite3_changes(db_);
}

void CatalogDatabase::initializeSchema() {
    execute(SCHEMA);
}
