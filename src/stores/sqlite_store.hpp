#pragma once
#include "../cache/store.hpp"
#include "../event_loop.hpp"
#include <string>

struct sqlite3;

namespace middleman {

// Persistent store in a single SQLite table (key TEXT PRIMARY KEY, value TEXT).
// Values are kept as JSON text in portable form, so byte strings come back as
// {"type":"Buffer","data":[...]} objects. Statements run when the operation is
// issued; the completion is posted to the loop. SQLite failures are reported
// as StoreIOError.
class SqliteStore : public Store {
public:
    // path may be ":memory:". Throws StoreIOError if the database cannot be opened.
    SqliteStore(const std::string& path, EventLoop& loop);
    ~SqliteStore() override;

    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    std::string backend_name() const override { return "sqlite"; }

    void get(const std::string& key,
             Callback<std::optional<nlohmann::json>> done) override;
    void set(const std::string& key, const nlohmann::json& value,
             Callback<nlohmann::json> done) override;
    void del(const std::string& key, Callback<bool> done) override;

    // Close the database. Later operations fail with StoreIOError.
    void close();

    // Number of stored rows; 0 once closed.
    size_t count() const;

    // Store raw text under key, bypassing JSON serialization.
    void put_raw(const std::string& key, const std::string& text);

private:
    void init_schema();

    std::string path_;
    EventLoop& loop_;
    sqlite3* db_ = nullptr;
};

} // namespace middleman
