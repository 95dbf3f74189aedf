#include "sqlite_store.hpp"
#include "../cache/entry.hpp"
#include "../errors.hpp"
#include "../plugin.hpp"
#include "../util.hpp"
#include <sqlite3.h>
#include <filesystem>

static middleman::StoreRegistrar reg_sqlite("sqlite",
    [](const middleman::Config& config, middleman::EventLoop& loop) {
        std::string path = config.cache.store_path;
        if (path.empty()) {
            path = middleman::expand_home("~/.middleman/cache.db");
        }
        return std::make_unique<middleman::SqliteStore>(path, loop);
    });

namespace middleman {

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

SqliteStore::SqliteStore(const std::string& path, EventLoop& loop)
    : path_(path), loop_(loop) {
    if (path_ != ":memory:") {
        auto parent = std::filesystem::path(path_).parent_path();
        std::error_code ec;
        if (!parent.empty()) std::filesystem::create_directories(parent, ec);
    }

    if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw StoreIOError("SqliteStore: failed to open database: " + err);
    }

    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);

    init_schema();
}

SqliteStore::~SqliteStore() {
    close();
}

void SqliteStore::init_schema() {
    const char* create_table =
        "CREATE TABLE IF NOT EXISTS cache_entries ("
        "  key   TEXT PRIMARY KEY,"
        "  value TEXT NOT NULL"
        ");";
    char* errmsg = nullptr;
    if (sqlite3_exec(db_, create_table, nullptr, nullptr, &errmsg) != SQLITE_OK) {
        std::string err = errmsg ? errmsg : "unknown error";
        sqlite3_free(errmsg);
        throw StoreIOError("SqliteStore: failed to create schema: " + err);
    }
}

void SqliteStore::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

size_t SqliteStore::count() const {
    if (!db_) return 0;
    StmtGuard g;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM cache_entries;", -1,
                           &g.stmt, nullptr) != SQLITE_OK)
        return 0;
    if (sqlite3_step(g.stmt) != SQLITE_ROW) return 0;
    return static_cast<size_t>(sqlite3_column_int64(g.stmt, 0));
}

// ── Statement helpers (throw StoreIOError) ─────────────────────

static void prepare(sqlite3* db, const char* sql, StmtGuard& g) {
    if (!db) throw StoreIOError("SqliteStore: database is closed");
    if (sqlite3_prepare_v2(db, sql, -1, &g.stmt, nullptr) != SQLITE_OK)
        throw StoreIOError(std::string("SqliteStore: ") + sqlite3_errmsg(db));
}

static void write_row(sqlite3* db, const std::string& key, const std::string& text) {
    StmtGuard g;
    prepare(db, "INSERT OR REPLACE INTO cache_entries (key, value) VALUES (?, ?);", g);
    sqlite3_bind_text(g.stmt, 1, key.c_str(), static_cast<int>(key.size()), SQLITE_TRANSIENT);
    sqlite3_bind_text(g.stmt, 2, text.c_str(), static_cast<int>(text.size()), SQLITE_TRANSIENT);
    if (sqlite3_step(g.stmt) != SQLITE_DONE)
        throw StoreIOError(std::string("SqliteStore: write failed: ") + sqlite3_errmsg(db));
}

void SqliteStore::put_raw(const std::string& key, const std::string& text) {
    write_row(db_, key, text);
}

// ── Store operations ───────────────────────────────────────────

void SqliteStore::get(const std::string& key,
                      Callback<std::optional<nlohmann::json>> done) {
    std::optional<nlohmann::json> value;
    std::exception_ptr error;
    try {
        StmtGuard g;
        prepare(db_, "SELECT value FROM cache_entries WHERE key = ?;", g);
        sqlite3_bind_text(g.stmt, 1, key.c_str(), static_cast<int>(key.size()), SQLITE_TRANSIENT);
        int rc = sqlite3_step(g.stmt);
        if (rc == SQLITE_ROW) {
            const auto* raw = reinterpret_cast<const char*>(sqlite3_column_text(g.stmt, 0));
            std::string text = raw ? raw : "";
            auto parsed = nlohmann::json::parse(text, nullptr, false);
            // Hand unparseable text back as-is; the engine rejects it.
            value = parsed.is_discarded() ? nlohmann::json(text) : std::move(parsed);
        } else if (rc != SQLITE_DONE) {
            throw StoreIOError(std::string("SqliteStore: read failed: ") + sqlite3_errmsg(db_));
        }
    } catch (const StoreIOError&) {
        error = std::current_exception();
    }

    loop_.post([done = std::move(done), value = std::move(value), error]() {
        if (!done) return;
        if (error) done(Result<std::optional<nlohmann::json>>::failure(error));
        else done(Result<std::optional<nlohmann::json>>(value));
    });
}

void SqliteStore::set(const std::string& key, const nlohmann::json& value,
                      Callback<nlohmann::json> done) {
    std::exception_ptr error;
    try {
        std::string text;
        try {
            text = to_portable_json(value).dump();
        } catch (const nlohmann::json::type_error& e) {
            throw StoreIOError(std::string("SqliteStore: cannot serialize value: ") + e.what());
        }
        write_row(db_, key, text);
    } catch (const StoreIOError&) {
        error = std::current_exception();
    }

    loop_.post([done = std::move(done), value, error]() {
        if (!done) return;
        if (error) done(Result<nlohmann::json>::failure(error));
        else done(Result<nlohmann::json>(value));
    });
}

void SqliteStore::del(const std::string& key, Callback<bool> done) {
    std::exception_ptr error;
    try {
        StmtGuard g;
        prepare(db_, "DELETE FROM cache_entries WHERE key = ?;", g);
        sqlite3_bind_text(g.stmt, 1, key.c_str(), static_cast<int>(key.size()), SQLITE_TRANSIENT);
        if (sqlite3_step(g.stmt) != SQLITE_DONE)
            throw StoreIOError(std::string("SqliteStore: delete failed: ") + sqlite3_errmsg(db_));
    } catch (const StoreIOError&) {
        error = std::current_exception();
    }

    loop_.post([done = std::move(done), error]() {
        if (!done) return;
        if (error) done(Result<bool>::failure(error));
        else done(Result<bool>(true));
    });
}

} // namespace middleman
