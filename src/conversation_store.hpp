#pragma once
#include "message.hpp"
#include "errors.hpp"
#include "persona.hpp"
#include "keyed_mutex.hpp"
#include <string>
#include <vector>
#include <mutex>
#include <cstdint>
#include <optional>

struct sqlite3;

namespace spychat {

// One persisted conversation: the message log is an opaque encoded blob
// owned by HistoryCodec. Timestamps are epoch milliseconds.
struct ConversationRow {
    std::string id;
    std::string owner_id;
    std::string messages;
    int64_t created_at = 0;
    int64_t updated_at = 0;
};

class ConversationBackend {
public:
    virtual ~ConversationBackend() = default;
    virtual std::optional<ConversationRow> load(const std::string& id) = 0;
    virtual void insert(const ConversationRow& row) = 0;
    virtual bool update_messages(const std::string& id, const std::string& blob, int64_t updated_at) = 0;
    virtual bool remove(const std::string& id) = 0;
    // Most recently updated row for the owner.
    virtual std::optional<ConversationRow> latest_for_owner(const std::string& owner_id) = 0;
    virtual std::vector<ConversationRow> list_for_owner(const std::string& owner_id) = 0;
    virtual std::vector<ConversationRow> list(int skip, int limit) = 0;
};

class SqliteConversationBackend : public ConversationBackend {
public:
    explicit SqliteConversationBackend(const std::string& db_path);
    ~SqliteConversationBackend() override;

    SqliteConversationBackend(const SqliteConversationBackend&) = delete;
    SqliteConversationBackend& operator=(const SqliteConversationBackend&) = delete;

    std::optional<ConversationRow> load(const std::string& id) override;
    void insert(const ConversationRow& row) override;
    bool update_messages(const std::string& id, const std::string& blob, int64_t updated_at) override;
    bool remove(const std::string& id) override;
    std::optional<ConversationRow> latest_for_owner(const std::string& owner_id) override;
    std::vector<ConversationRow> list_for_owner(const std::string& owner_id) override;
    std::vector<ConversationRow> list(int skip, int limit) override;

private:
    sqlite3* db_ = nullptr;
    std::mutex mutex_;
    void init_db();
};

struct ConversationLog {
    std::string id;
    std::string owner_id;
    std::vector<Message> messages;
    int64_t created_at = 0;
    int64_t updated_at = 0;

    nlohmann::json to_json() const;
};

struct ConversationSummary {
    std::string id;
    std::string owner_id;
    size_t message_count = 0;
    int64_t created_at = 0;
    int64_t updated_at = 0;

    nlohmann::json to_json() const;
};

// Append-only conversation logs on top of a flat-blob backend. Every write is
// a whole-log read-modify-write, serialized per conversation; get-or-create is
// serialized per owner. Different conversations never contend.
class ConversationStore {
public:
    ConversationStore(ConversationBackend& backend, const PersonaDirectory& personas);

    Result<std::string> create(const std::string& owner_id);
    Result<ConversationLog> get(const std::string& conversation_id);
    Result<ConversationLog> get_or_create_for_owner(const std::string& owner_id);

    // Returns the new message count.
    Result<size_t> append(const std::string& conversation_id, const std::vector<Message>& messages);
    Result<size_t> replace_messages(const std::string& conversation_id, const std::vector<Message>& messages);

    bool remove(const std::string& conversation_id);

    std::vector<ConversationSummary> list_for_owner(const std::string& owner_id);
    std::vector<ConversationSummary> list(int skip = 0, int limit = 100);

private:
    ConversationBackend& backend_;
    const PersonaDirectory& personas_;
    KeyedMutex conversation_locks_;
    KeyedMutex owner_locks_;

    ConversationLog to_log(const ConversationRow& row) const;
    ConversationSummary to_summary(const ConversationRow& row) const;
    Result<std::string> create_locked(const std::string& owner_id);
};

} // namespace spychat
