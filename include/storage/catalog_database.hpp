#pragma once

#include <cstdint>
#include <mutex>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

// One SQLite connection shared by every component. Callers hold lock()
// (or a Transaction) around each group of statements.
class CatalogDatabase {
public:
    class Statement {
    public:
        Statement(sqlite3* db, const std::string& sql);
        ~Statement();
        Statement(Statement&& other) noexcept;
        Statement(const Statement&) = delete;
        Statement& operator=(const Statement&) = delete;
        Statement& operator=(Statement&&) = delete;

        Statement& bind(int index, const std::string& value);
        Statement& bind(int index, int64_t value);
        Statement& bind(int index, int value);
        Statement& bind(int index, double value);
        Statement& bindNull(int index);

        // True while a row is available; throws std::runtime_error on errors
        bool step();
        void execute();
        void reset();

        std::string columnText(int column) const;
        int64_t columnInt64(int column) const;
        int columnInt(int column) const;
        double columnDouble(int column) const;
        bool isNull(int column) const;

    private:
        sqlite3* db_;
        sqlite3_stmt* stmt_;
        std::string sql_;
    };

    // BEGIN IMMEDIATE on construction, ROLLBACK unless commit() was called
    class Transaction {
    public:
        explicit Transaction(CatalogDatabase& database);
        ~Transaction();
        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

        void commit();

    private:
        CatalogDatabase& database_;
        std::unique_lock<std::recursive_mutex> lock_;
        bool finished_;
    };

    // ":memory:" gives a private in-memory catalog. Throws std::runtime_error.
    explicit CatalogDatabase(const std::string& path);
    ~CatalogDatabase();

    CatalogDatabase(const CatalogDatabase&) = delete;
    CatalogDatabase& operator=(const CatalogDatabase&) = delete;

    void execute(const std::string& sql);
    Statement prepare(const std::string& sql);
    std::unique_lock<std::recursive_mutex> lock();

    int changes() const;
    // Only meaningful while holding lock()
    bool inTransaction() const { return inTransaction_; }
    const std::string& getPath() const { return path_; }

private:
    void initializeSchema();

    sqlite3* db_;
    std::string path_;
    std::recursive_mutex mutex_;
    bool inTransaction_;
};
