#pragma once

#include <disambig/core/types.h>
#include <sqlite3.h>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace disambig::metadata {

/**
 * @brief How the store file is opened
 */
enum class ConnectionMode {
    ReadWrite, ///< Existing file, read-write
    ReadOnly,  ///< Existing file, no writes
    Create,    ///< Create the file when missing
    Memory     ///< Private in-memory store (tests)
};

/**
 * @brief Prepared statement owning its sqlite3_stmt handle
 *
 * Obtained from Database::prepare. Columns are read from the current row after a step()
 * returned true.
 */
class Statement {
public:
    Statement() = default;
    explicit Statement(sqlite3_stmt* stmt) noexcept : stmt_(stmt) {}
    ~Statement();

    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    // Parameters are 1-based
    Result<void> bind(int index, std::nullptr_t);
    Result<void> bind(int index, int value);
    Result<void> bind(int index, int64_t value);
    Result<void> bind(int index, double value);
    Result<void> bind(int index, std::string_view value);
    Result<void> bind(int index, const std::string& value) {
        return bind(index, std::string_view(value));
    }
    Result<void> bind(int index, const char* value) {
        return bind(index, std::string_view(value));
    }

    template<typename... Args>
    Result<void> bindAll(Args&&... args) {
        return bindFrom(1, std::forward<Args>(args)...);
    }

    /**
     * @brief Run a statement that returns no rows
     */
    Result<void> execute();

    /**
     * @brief Advance to the next row
     * @return true while a row is available, false once done
     */
    Result<bool> step();

    int getInt(int column) const;
    int64_t getInt64(int column) const;
    double getDouble(int column) const;
    std::string getString(int column) const;
    bool isNull(int column) const;

    // SQLite storage class of a column in the current row (SQLITE_INTEGER, ...)
    int columnType(int column) const;
    int columnCount() const;
    std::string columnName(int column) const;

private:
    Result<int> stepWithRetry(const char* what);

    template<typename T, typename... Rest>
    Result<void> bindFrom(int index, T&& value, Rest&&... rest) {
        auto result = bind(index, std::forward<T>(value));
        if (!result) return result;
        if constexpr (sizeof...(rest) > 0) {
            return bindFrom(index + 1, std::forward<Rest>(rest)...);
        }
        return {};
    }

    Result<void> bindFrom(int) { return {}; }

    sqlite3_stmt* stmt_ = nullptr;
};

/**
 * @brief Owning sqlite3 connection
 */
class Database {
public:
    Database() = default;
    ~Database();

    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    Result<void> open(const std::string& path, ConnectionMode mode = ConnectionMode::ReadWrite);
    void close();

    [[nodiscard]] bool isOpen() const { return db_ != nullptr; }

    Result<Statement> prepare(const std::string& sql);

    /**
     * @brief Run one or more SQL statements without results (DDL, pragmas)
     */
    Result<void> execute(const std::string& sql);

    Result<void> beginTransaction();
    Result<void> commit();
    Result<void> rollback();

    /**
     * @brief Run func inside BEGIN/COMMIT, rolling back when it returns an error
     */
    template<typename Func>
    Result<void> transaction(Func&& func) {
        auto beginResult = beginTransaction();
        if (!beginResult) return beginResult;

        try {
            auto result = func();
            if (!result) {
                auto rb = rollback();
                if (!rb) return rb;
                return result;
            }
            return commit();
        } catch (...) {
            (void)rollback();
            throw;
        }
    }

    int64_t lastInsertRowId() const;

    Result<bool> tableExists(const std::string& table);

    [[nodiscard]] const std::string& path() const { return path_; }

private:
    std::string lastError() const;

    sqlite3* db_ = nullptr;
    std::string path_;
    bool inTransaction_ = false;
};

} // namespace disambig::metadata
