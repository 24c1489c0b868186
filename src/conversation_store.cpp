#include "conversation_store.hpp"
#include "history_codec.hpp"
#include "utils.hpp"
#include <sqlite3.h>
#include <stdexcept>
#include <iostream>
#include <set>

namespace spychat {

// ── SQLite backend ─────────────────────────────────────────────────────

static std::string column_text(sqlite3_stmt* stmt, int col) {
    auto p = sqlite3_column_text(stmt, col);
    return p ? std::string(reinterpret_cast<const char*>(p), sqlite3_column_bytes(stmt, col)) : "";
}

static sqlite3_stmt* prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare statement: " + std::string(sqlite3_errmsg(db)));
    }
    return stmt;
}

static ConversationRow read_row(sqlite3_stmt* stmt) {
    ConversationRow r;
    r.id = column_text(stmt, 0);
    r.owner_id = column_text(stmt, 1);
    r.messages = column_text(stmt, 2);
    r.created_at = sqlite3_column_int64(stmt, 3);
    r.updated_at = sqlite3_column_int64(stmt, 4);
    return r;
}

static const char* kSelectColumns = "SELECT id, spy_id, messages, created_at, updated_at FROM conversations";

SqliteConversationBackend::SqliteConversationBackend(const std::string& db_path) {
    if (db_path != ":memory:") {
        auto parent = fs::path(db_path).parent_path();
        if (!parent.empty()) fs::create_directories(parent);
    }
    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) sqlite3_close(db_);
        throw std::runtime_error("Failed to open conversation DB: " + msg);
    }
    sqlite3_busy_timeout(db_, 5000);
    init_db();
}

SqliteConversationBackend::~SqliteConversationBackend() {
    if (db_) sqlite3_close(db_);
}

void SqliteConversationBackend::init_db() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS conversations (
            id TEXT PRIMARY KEY,
            spy_id TEXT NOT NULL,
            messages TEXT NOT NULL,
            created_at INTEGER DEFAULT 0,
            updated_at INTEGER DEFAULT 0
        );
        CREATE INDEX IF NOT EXISTS idx_conversations_spy ON conversations(spy_id, updated_at);
    )";
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw std::runtime_error("Failed to init conversation DB: " + msg);
    }
}

std::optional<ConversationRow> SqliteConversationBackend::load(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string sql = std::string(kSelectColumns) + " WHERE id = ?";
    sqlite3_stmt* stmt = prepare(db_, sql.c_str());
    sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
    std::optional<ConversationRow> row;
    if (sqlite3_step(stmt) == SQLITE_ROW) row = read_row(stmt);
    sqlite3_finalize(stmt);
    return row;
}

void SqliteConversationBackend::insert(const ConversationRow& row) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* stmt = prepare(db_,
        "INSERT INTO conversations (id, spy_id, messages, created_at, updated_at) VALUES (?, ?, ?, ?, ?)");
    sqlite3_bind_text(stmt, 1, row.id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, row.owner_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, row.messages.data(), static_cast<int>(row.messages.size()), SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 4, row.created_at);
    sqlite3_bind_int64(stmt, 5, row.updated_at);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error("Failed to insert conversation: " + std::string(sqlite3_errmsg(db_)));
    }
}

bool SqliteConversationBackend::update_messages(const std::string& id, const std::string& blob, int64_t updated_at) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* stmt = prepare(db_, "UPDATE conversations SET messages = ?, updated_at = ? WHERE id = ?");
    sqlite3_bind_text(stmt, 1, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, updated_at);
    sqlite3_bind_text(stmt, 3, id.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    int changes = sqlite3_changes(db_);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error("Failed to update conversation: " + std::string(sqlite3_errmsg(db_)));
    }
    return changes > 0;
}

bool SqliteConversationBackend::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* stmt = prepare(db_, "DELETE FROM conversations WHERE id = ?");
    sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    int changes = sqlite3_changes(db_);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error("Failed to delete conversation: " + std::string(sqlite3_errmsg(db_)));
    }
    return changes > 0;
}

std::optional<ConversationRow> SqliteConversationBackend::latest_for_owner(const std::string& owner_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string sql = std::string(kSelectColumns) +
                      " WHERE spy_id = ? ORDER BY updated_at DESC, rowid DESC LIMIT 1";
    sqlite3_stmt* stmt = prepare(db_, sql.c_str());
    sqlite3_bind_text(stmt, 1, owner_id.c_str(), -1, SQLITE_TRANSIENT);
    std::optional<ConversationRow> row;
    if (sqlite3_step(stmt) == SQLITE_ROW) row = read_row(stmt);
    sqlite3_finalize(stmt);
    return row;
}

std::vector<ConversationRow> SqliteConversationBackend::list_for_owner(const std::string& owner_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string sql = std::string(kSelectColumns) + " WHERE spy_id = ? ORDER BY updated_at DESC, rowid DESC";
    sqlite3_stmt* stmt = prepare(db_, sql.c_str());
    sqlite3_bind_text(stmt, 1, owner_id.c_str(), -1, SQLITE_TRANSIENT);
    std::vector<ConversationRow> rows;
    while (sqlite3_step(stmt) == SQLITE_ROW) rows.push_back(read_row(stmt));
    sqlite3_finalize(stmt);
    return rows;
}

std::vector<ConversationRow> SqliteConversationBackend::list(int skip, int limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string sql = std::string(kSelectColumns) + " ORDER BY updated_at DESC, rowid DESC LIMIT ? OFFSET ?";
    sqlite3_stmt* stmt = prepare(db_, sql.c_str());
    sqlite3_bind_int(stmt, 1, limit);
    sqlite3_bind_int(stmt, 2, skip);
    std::vector<ConversationRow> rows;
    while (sqlite3_step(stmt) == SQLITE_ROW) rows.push_back(read_row(stmt));
    sqlite3_finalize(stmt);
    return rows;
}

// ── Log views ──────────────────────────────────────────────────────────

nlohmann::json ConversationLog::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["spy_id"] = owner_id;
    j["created_at"] = iso_time(created_at / 1000);
    j["updated_at"] = iso_time(updated_at / 1000);
    j["messages"] = nlohmann::json::array();
    for (auto& m : messages) j["messages"].push_back(m.to_json());
    return j;
}

nlohmann::json ConversationSummary::to_json() const {
    return {
        {"id", id},
        {"spy_id", owner_id},
        {"message_count", message_count},
        {"created_at", iso_time(created_at / 1000)},
        {"updated_at", iso_time(updated_at / 1000)}
    };
}

// ── Store ──────────────────────────────────────────────────────────────

// Every tool message must answer a tool call made earlier in the log.
static std::optional<Error> check_tool_pairing(const std::vector<Message>& existing,
                                               const std::vector<Message>& added) {
    std::set<std::string> call_ids;
    for (auto& m : existing) {
        for (auto& tc : m.tool_calls) call_ids.insert(tc.id);
    }
    for (auto& m : added) {
        if (m.role == Role::tool) {
            if (m.tool_call_id.empty()) {
                return Error{ErrorKind::invalid_request, "tool message without tool_call_id"};
            }
            if (!call_ids.count(m.tool_call_id)) {
                return Error{ErrorKind::invalid_request,
                             "tool message references unknown tool call " + m.tool_call_id};
            }
        }
        for (auto& tc : m.tool_calls) call_ids.insert(tc.id);
    }
    return std::nullopt;
}

ConversationStore::ConversationStore(ConversationBackend& backend, const PersonaDirectory& personas)
    : backend_(backend), personas_(personas) {}

ConversationLog ConversationStore::to_log(const ConversationRow& row) const {
    auto decoded = HistoryCodec::decode_detailed(row.messages);
    if (decoded.encoding != HistoryEncoding::canonical && decoded.encoding != HistoryEncoding::empty) {
        std::cerr << "[store] Conversation " << row.id << " stored as "
                  << encoding_name(decoded.encoding) << "; upgraded on next write\n";
    }
    ConversationLog log;
    log.id = row.id;
    log.owner_id = row.owner_id;
    log.messages = std::move(decoded.messages);
    log.created_at = row.created_at;
    log.updated_at = row.updated_at;
    return log;
}

ConversationSummary ConversationStore::to_summary(const ConversationRow& row) const {
    ConversationSummary s;
    s.id = row.id;
    s.owner_id = row.owner_id;
    s.message_count = HistoryCodec::decode(row.messages).size();
    s.created_at = row.created_at;
    s.updated_at = row.updated_at;
    return s;
}

Result<std::string> ConversationStore::create_locked(const std::string& owner_id) {
    auto persona = personas_.resolve(owner_id);
    if (is_error(persona)) return get_error(persona);

    ConversationRow row;
    row.id = generate_uuid();
    row.owner_id = owner_id;
    row.messages = HistoryCodec::encode({});
    row.created_at = epoch_now_ms();
    row.updated_at = row.created_at;
    backend_.insert(row);
    std::cerr << "[store] Created conversation " << row.id << " for " << owner_id << "\n";
    return row.id;
}

Result<std::string> ConversationStore::create(const std::string& owner_id) {
    auto guard = owner_locks_.lock(owner_id);
    return create_locked(owner_id);
}

Result<ConversationLog> ConversationStore::get(const std::string& conversation_id) {
    auto row = backend_.load(conversation_id);
    if (!row) return not_found("Conversation " + conversation_id + " not found");
    return to_log(*row);
}

Result<ConversationLog> ConversationStore::get_or_create_for_owner(const std::string& owner_id) {
    auto guard = owner_locks_.lock(owner_id);

    auto persona = personas_.resolve(owner_id);
    if (is_error(persona)) return get_error(persona);

    if (auto row = backend_.latest_for_owner(owner_id)) return to_log(*row);

    auto created = create_locked(owner_id);
    if (is_error(created)) return get_error(created);

    auto row = backend_.load(get_value(created));
    if (!row) return not_found("Conversation vanished after create: " + get_value(created));
    return to_log(*row);
}

Result<size_t> ConversationStore::append(const std::string& conversation_id,
                                         const std::vector<Message>& messages) {
    auto guard = conversation_locks_.lock(conversation_id);

    auto row = backend_.load(conversation_id);
    if (!row) return not_found("Conversation " + conversation_id + " not found");

    auto log = HistoryCodec::decode(row->messages);
    if (auto err = check_tool_pairing(log, messages)) return *err;

    log.insert(log.end(), messages.begin(), messages.end());
    if (!backend_.update_messages(conversation_id, HistoryCodec::encode(log), epoch_now_ms())) {
        return not_found("Conversation " + conversation_id + " deleted during append");
    }
    return log.size();
}

Result<size_t> ConversationStore::replace_messages(const std::string& conversation_id,
                                                   const std::vector<Message>& messages) {
    auto guard = conversation_locks_.lock(conversation_id);

    if (auto err = check_tool_pairing({}, messages)) return *err;
    if (!backend_.update_messages(conversation_id, HistoryCodec::encode(messages), epoch_now_ms())) {
        return not_found("Conversation " + conversation_id + " not found");
    }
    return messages.size();
}

bool ConversationStore::remove(const std::string& conversation_id) {
    auto guard = conversation_locks_.lock(conversation_id);
    bool removed = backend_.remove(conversation_id);
    if (removed) std::cerr << "[store] Deleted conversation " << conversation_id << "\n";
    return removed;
}

std::vector<ConversationSummary> ConversationStore::list_for_owner(const std::string& owner_id) {
    std::vector<ConversationSummary> out;
    for (auto& row : backend_.list_for_owner(owner_id)) out.push_back(to_summary(row));
    return out;
}

std::vector<ConversationSummary> ConversationStore::list(int skip, int limit) {
    std::vector<ConversationSummary> out;
    for (auto& row : backend_.list(skip, limit)) out.push_back(to_summary(row));
    return out;
}

} // namespace spychat
