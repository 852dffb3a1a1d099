#include <disambig/metadata/database.h>

#include <spdlog/spdlog.h>

#include <chrono>
#include <thread>
#include <utility>

namespace disambig::metadata {

namespace {

constexpr int kMaxStepAttempts = 5;
constexpr std::chrono::milliseconds kInitialBackoff{10};
constexpr int kBusyTimeoutMs = 5000;

Result<void> bindResult(int rc, const char* kind) {
    if (rc != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError,
                     std::string("Failed to bind ") + kind + ": " + sqlite3_errstr(rc)};
    }
    return {};
}

} // namespace

Statement::~Statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

Statement::Statement(Statement&& other) noexcept : stmt_(std::exchange(other.stmt_, nullptr)) {}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
        stmt_ = std::exchange(other.stmt_, nullptr);
    }
    return *this;
}

Result<void> Statement::bind(int index, std::nullptr_t) {
    return bindResult(sqlite3_bind_null(stmt_, index), "null");
}

Result<void> Statement::bind(int index, int value) {
    return bindResult(sqlite3_bind_int(stmt_, index, value), "int");
}

Result<void> Statement::bind(int index, int64_t value) {
    return bindResult(sqlite3_bind_int64(stmt_, index, value), "int64");
}

Result<void> Statement::bind(int index, double value) {
    return bindResult(sqlite3_bind_double(stmt_, index, value), "double");
}

Result<void> Statement::bind(int index, std::string_view value) {
    return bindResult(sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()),
                                        SQLITE_TRANSIENT),
                      "text");
}

// SQLITE_BUSY and SQLITE_LOCKED are retried with exponential backoff
Result<int> Statement::stepWithRetry(const char* what) {
    auto backoff = kInitialBackoff;
    for (int attempt = 1;; ++attempt) {
        const int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW || rc == SQLITE_DONE) {
            return rc;
        }
        if ((rc != SQLITE_BUSY && rc != SQLITE_LOCKED) || attempt == kMaxStepAttempts) {
            return Error{ErrorCode::DatabaseError,
                         std::string("Failed to ") + what + " statement: " + sqlite3_errstr(rc)};
        }
        sqlite3_reset(stmt_);
        std::this_thread::sleep_for(backoff);
        backoff *= 2;
    }
}

Result<void> Statement::execute() {
    auto rc = stepWithRetry("execute");
    if (!rc) return rc.error();
    return {};
}

Result<bool> Statement::step() {
    auto rc = stepWithRetry("step");
    if (!rc) return rc.error();
    return rc.value() == SQLITE_ROW;
}

int Statement::getInt(int column) const {
    return sqlite3_column_int(stmt_, column);
}

int64_t Statement::getInt64(int column) const {
    return sqlite3_column_int64(stmt_, column);
}

double Statement::getDouble(int column) const {
    return sqlite3_column_double(stmt_, column);
}

std::string Statement::getString(int column) const {
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, column));
    if (!text) {
        return {};
    }
    return std::string(text, static_cast<std::size_t>(sqlite3_column_bytes(stmt_, column)));
}

bool Statement::isNull(int column) const {
    return columnType(column) == SQLITE_NULL;
}

int Statement::columnType(int column) const {
    return sqlite3_column_type(stmt_, column);
}

int Statement::columnCount() const {
    return sqlite3_column_count(stmt_);
}

std::string Statement::columnName(int column) const {
    const char* name = sqlite3_column_name(stmt_, column);
    return name ? name : "";
}

Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept
    : db_(std::exchange(other.db_, nullptr)), path_(std::move(other.path_)),
      inTransaction_(std::exchange(other.inTransaction_, false)) {}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = std::exchange(other.db_, nullptr);
        path_ = std::move(other.path_);
        inTransaction_ = std::exchange(other.inTransaction_, false);
    }
    return *this;
}

Result<void> Database::open(const std::string& path, ConnectionMode mode) {
    close();

    int flags = SQLITE_OPEN_READWRITE;
    if (mode == ConnectionMode::ReadOnly) {
        flags = SQLITE_OPEN_READONLY;
    } else if (mode == ConnectionMode::Create) {
        flags |= SQLITE_OPEN_CREATE;
    } else if (mode == ConnectionMode::Memory) {
        flags |= SQLITE_OPEN_CREATE | SQLITE_OPEN_MEMORY;
    }

    const int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        close();
        return Error{ErrorCode::DatabaseError, "Failed to open store '" + path + "': " + error};
    }

    sqlite3_busy_timeout(db_, kBusyTimeoutMs);
    path_ = path;
    spdlog::debug("Opened store {}", path_);
    return {};
}

void Database::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
    path_.clear();
    inTransaction_ = false;
}

Result<Statement> Database::prepare(const std::string& sql) {
    if (!db_) {
        return Error{ErrorCode::InvalidState, "Database not open"};
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), &stmt, nullptr) !=
        SQLITE_OK) {
        sqlite3_finalize(stmt);
        return Error{ErrorCode::DatabaseError, "Failed to prepare statement: " + lastError()};
    }
    return Statement(stmt);
}

Result<void> Database::execute(const std::string& sql) {
    if (!db_) {
        return Error{ErrorCode::InvalidState, "Database not open"};
    }

    char* errMsg = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg) != SQLITE_OK) {
        std::string error = errMsg ? errMsg : lastError();
        sqlite3_free(errMsg);
        spdlog::error("SQL exec failed ({}): {}", error, sql);
        return Error{ErrorCode::DatabaseError, "Failed to execute SQL: " + error};
    }
    return {};
}

Result<void> Database::beginTransaction() {
    if (inTransaction_) {
        return Error{ErrorCode::InvalidState, "Already in transaction"};
    }
    auto result = execute("BEGIN");
    inTransaction_ = result.has_value();
    return result;
}

Result<void> Database::commit() {
    if (!inTransaction_) {
        return Error{ErrorCode::InvalidState, "Not in transaction"};
    }
    auto result = execute("COMMIT");
    if (result) {
        inTransaction_ = false;
    }
    return result;
}

Result<void> Database::rollback() {
    if (!inTransaction_) {
        return Error{ErrorCode::InvalidState, "Not in transaction"};
    }
    inTransaction_ = false;
    return execute("ROLLBACK");
}

int64_t Database::lastInsertRowId() const {
    return db_ ? sqlite3_last_insert_rowid(db_) : 0;
}

Result<bool> Database::tableExists(const std::string& table) {
    auto stmtResult = prepare("SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto bound = stmt.bind(1, table);
    if (!bound)
        return bound.error();
    return stmt.step();
}

std::string Database::lastError() const {
    return db_ ? sqlite3_errmsg(db_) : "No database connection";
}

} // namespace disambig::metadata
