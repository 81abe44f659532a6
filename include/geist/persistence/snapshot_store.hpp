#pragma once

#include "../types.hpp"
#include "../engine/agent_context.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <vector>

namespace geist {
namespace persistence {

/**
 * @brief Accepts and returns context snapshots keyed by session handle
 */
class ISnapshotSink {
public:
    virtual ~ISnapshotSink() = default;

    virtual Expected<void> save(const std::string& session, const ContextSnapshot& snapshot) = 0;

    /** @brief Most recent snapshot of the session, or nullopt if none was saved. */
    virtual Expected<std::optional<ContextSnapshot>> load_latest(const std::string& session) = 0;
};

/**
 * @brief SQLite-backed snapshot history.
 *
 * Every save appends a row; load_latest returns the newest row of the
 * session. Buffers are stored as JSON arrays.
 */
class SqliteSnapshotStore : public ISnapshotSink {
public:
    ~SqliteSnapshotStore() override {
        for (sqlite3_stmt** stmt : {&stmt_insert_, &stmt_latest_, &stmt_count_}) {
            if (*stmt != nullptr) {
                sqlite3_finalize(*stmt);
                *stmt = nullptr;
            }
        }
        if (db_ != nullptr) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    SqliteSnapshotStore(const SqliteSnapshotStore&) = delete;
    SqliteSnapshotStore& operator=(const SqliteSnapshotStore&) = delete;

    /**
     * @param path Database file, or ":memory:"
     */
    static Expected<std::shared_ptr<SqliteSnapshotStore>> open(const std::string& path) {
        if (path.empty()) {
            return tl::unexpected(Error{
                ErrorCode::InvalidConfig,
                "Snapshot database path cannot be empty"
            });
        }

        sqlite3* db = nullptr;
        if (sqlite3_open(path.c_str(), &db) != SQLITE_OK) {
            std::string message = "Failed to open snapshot database";
            if (db != nullptr && sqlite3_errmsg(db) != nullptr) {
                message += std::string(": ") + sqlite3_errmsg(db);
            }
            if (db != nullptr) {
                sqlite3_close(db);
            }
            return tl::unexpected(Error{ErrorCode::SnapshotStoreFailed, std::move(message), path});
        }

        auto instance = std::shared_ptr<SqliteSnapshotStore>(new SqliteSnapshotStore(db, path));
        if (auto init = instance->initialize_schema(); !init) {
            return tl::unexpected(init.error());
        }
        spdlog::debug("Opened snapshot store {}", path);
        return instance;
    }

    Expected<void> save(const std::string& session, const ContextSnapshot& snapshot) override {
        std::lock_guard<std::mutex> lock(mutex_);

        const auto created_at = static_cast<sqlite3_int64>(
            std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::system_clock::now().time_since_epoch()).count());

        const std::string world = nlohmann::json(snapshot.world_context).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        const std::string task = nlohmann::json(snapshot.task_context).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        const std::string execution = nlohmann::json(snapshot.execution_context).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

        sqlite3_bind_text(stmt_insert_, 1, session.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt_insert_, 2, world.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt_insert_, 3, task.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt_insert_, 4, execution.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt_insert_, 5, created_at);

        const int rc = sqlite3_step(stmt_insert_);
        sqlite3_reset(stmt_insert_);
        sqlite3_clear_bindings(stmt_insert_);
        if (rc != SQLITE_DONE) {
            return tl::unexpected(make_sql_error("Failed to save context snapshot"));
        }

        spdlog::info("Saved snapshot for session '{}' ({} world, {} task, {} execution)",
                     session, snapshot.world_context.size(), snapshot.task_context.size(),
                     snapshot.execution_context.size());
        return {};
    }

    Expected<std::optional<ContextSnapshot>> load_latest(const std::string& session) override {
        std::lock_guard<std::mutex> lock(mutex_);

        sqlite3_bind_text(stmt_latest_, 1, session.c_str(), -1, SQLITE_TRANSIENT);

        const int rc = sqlite3_step(stmt_latest_);
        if (rc == SQLITE_DONE) {
            sqlite3_reset(stmt_latest_);
            sqlite3_clear_bindings(stmt_latest_);
            return std::optional<ContextSnapshot>{};
        }
        if (rc != SQLITE_ROW) {
            auto error = make_sql_error("Failed to load context snapshot");
            sqlite3_reset(stmt_latest_);
            sqlite3_clear_bindings(stmt_latest_);
            return tl::unexpected(std::move(error));
        }

        ContextSnapshot snapshot;
        std::optional<Error> decode_error;
        for (int col = 0; col < 3 && !decode_error; ++col) {
            const auto* raw = reinterpret_cast<const char*>(sqlite3_column_text(stmt_latest_, col));
            auto decoded = decode_buffer(raw != nullptr ? raw : "");
            if (!decoded) {
                decode_error = decoded.error();
                break;
            }
            switch (col) {
                case 0: snapshot.world_context = std::move(*decoded); break;
                case 1: snapshot.task_context = std::move(*decoded); break;
                default: snapshot.execution_context = std::move(*decoded); break;
            }
        }
        sqlite3_reset(stmt_latest_);
        sqlite3_clear_bindings(stmt_latest_);

        if (decode_error) {
            return tl::unexpected(std::move(*decode_error));
        }
        return std::optional<ContextSnapshot>{std::move(snapshot)};
    }

    /** @brief Number of snapshots stored for a session. */
    Expected<size_t> count(const std::string& session) const {
        std::lock_guard<std::mutex> lock(mutex_);

        sqlite3_bind_text(stmt_count_, 1, session.c_str(), -1, SQLITE_TRANSIENT);
        size_t n = 0;
        if (sqlite3_step(stmt_count_) == SQLITE_ROW) {
            n = static_cast<size_t>(sqlite3_column_int64(stmt_count_, 0));
        }
        sqlite3_reset(stmt_count_);
        sqlite3_clear_bindings(stmt_count_);
        return n;
    }

private:
    SqliteSnapshotStore(sqlite3* db, std::string db_path)
        : db_(db)
        , db_path_(std::move(db_path))
    {}

    Expected<void> initialize_schema() {
        char* err_msg = nullptr;
        constexpr const char* schema =
            "CREATE TABLE IF NOT EXISTS context_snapshots("
            "id INTEGER PRIMARY KEY AUTOINCREMENT,"
            "session TEXT NOT NULL,"
            "world_context TEXT NOT NULL,"
            "task_context TEXT NOT NULL,"
            "execution_context TEXT NOT NULL,"
            "created_at INTEGER NOT NULL"
            ");"
            "CREATE INDEX IF NOT EXISTS idx_context_snapshots_session "
            "ON context_snapshots(session, id)";
        if (sqlite3_exec(db_, schema, nullptr, nullptr, &err_msg) != SQLITE_OK) {
            std::string message = err_msg != nullptr ? err_msg : "Unknown SQLite error";
            sqlite3_free(err_msg);
            return tl::unexpected(Error{ErrorCode::SnapshotStoreFailed, std::move(message), db_path_});
        }

        constexpr const char* insert_sql =
            "INSERT INTO context_snapshots(session, world_context, task_context, execution_context, created_at) "
            "VALUES (?1, ?2, ?3, ?4, ?5)";
        if (sqlite3_prepare_v2(db_, insert_sql, -1, &stmt_insert_, nullptr) != SQLITE_OK) {
            return tl::unexpected(make_sql_error("Failed to prepare snapshot insert statement"));
        }

        constexpr const char* latest_sql =
            "SELECT world_context, task_context, execution_context FROM context_snapshots "
            "WHERE session = ?1 ORDER BY id DESC LIMIT 1";
        if (sqlite3_prepare_v2(db_, latest_sql, -1, &stmt_latest_, nullptr) != SQLITE_OK) {
            return tl::unexpected(make_sql_error("Failed to prepare snapshot select statement"));
        }

        constexpr const char* count_sql = "SELECT COUNT(*) FROM context_snapshots WHERE session = ?1";
        if (sqlite3_prepare_v2(db_, count_sql, -1, &stmt_count_, nullptr) != SQLITE_OK) {
            return tl::unexpected(make_sql_error("Failed to prepare snapshot count statement"));
        }
        return {};
    }

    Expected<std::vector<std::string>> decode_buffer(const std::string& text) const {
        auto doc = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
        if (doc.is_discarded() || !doc.is_array()) {
            return tl::unexpected(Error{ErrorCode::SnapshotCorrupted, "Snapshot buffer is not a JSON array", db_path_});
        }
        std::vector<std::string> items;
        items.reserve(doc.size());
        for (const auto& item : doc) {
            if (!item.is_string()) {
                return tl::unexpected(Error{ErrorCode::SnapshotCorrupted, "Snapshot item is not a string", db_path_});
            }
            items.push_back(item.get<std::string>());
        }
        return items;
    }

    Error make_sql_error(const std::string& prefix) const {
        return Error{
            ErrorCode::SnapshotStoreFailed,
            prefix + ": " + sqlite3_errmsg(db_),
            db_path_
        };
    }

    sqlite3* db_ = nullptr;
    std::string db_path_;
    mutable std::mutex mutex_;

    sqlite3_stmt* stmt_insert_ = nullptr;
    sqlite3_stmt* stmt_latest_ = nullptr;
    mutable sqlite3_stmt* stmt_count_ = nullptr;
};

} // namespace persistence
} // namespace geist
