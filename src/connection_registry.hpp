#pragma once
#include <string>
#include <vector>
#include <map>
#include <set>
#include <mutex>
#include <memory>
#include <optional>
#include <nlohmann/json.hpp>

namespace spychat {

// Duplex channel to one client. Owned by the network layer; the registry only
// keeps a shared reference while the connection is open.
class Transport {
public:
    virtual ~Transport() = default;
    // Returns false when the peer is already gone. May throw on protocol errors.
    virtual bool send(const nlohmann::json& envelope) = 0;
    virtual void close() = 0;
};

enum class ConnectionState { connecting, open, closed };

inline const char* connection_state_name(ConnectionState s) {
    switch (s) {
    case ConnectionState::connecting: return "connecting";
    case ConnectionState::open:       return "open";
    case ConnectionState::closed:     return "closed";
    }
    return "closed";
}

class ConnectionRegistry {
public:
    std::string connect(std::shared_ptr<Transport> transport,
                        const std::string& persona_id = "",
                        const std::string& conversation_id = "");
    // Idempotent. Closes the transport the first time.
    void disconnect(const std::string& connection_id);

    bool send_to(const std::string& connection_id, const nlohmann::json& envelope);

    // Each returns the number of connections that accepted the envelope.
    size_t broadcast_to_persona(const std::string& persona_id, const nlohmann::json& envelope);
    size_t broadcast_to_conversation(const std::string& conversation_id, const nlohmann::json& envelope);
    size_t broadcast(const nlohmann::json& envelope);

    // Unknown ids report closed.
    ConnectionState state(const std::string& connection_id) const;
    std::optional<std::string> conversation_of(const std::string& connection_id) const;
    std::optional<std::string> persona_of(const std::string& connection_id) const;

    size_t connection_count() const;
    size_t persona_bucket_count() const;
    size_t conversation_bucket_count() const;

private:
    struct Connection {
        std::string id;
        std::shared_ptr<Transport> transport;
        std::string persona_id;
        std::string conversation_id;
    };
    using Target = std::pair<std::string, std::shared_ptr<Transport>>;

    mutable std::mutex mutex_;
    std::map<std::string, Connection> connections_;
    std::map<std::string, std::set<std::string>> by_persona_;
    std::map<std::string, std::set<std::string>> by_conversation_;

    std::vector<Target> snapshot(const std::set<std::string>* ids) const;
    size_t deliver(const std::vector<Target>& targets, const nlohmann::json& envelope);
    bool deliver_one(const std::string& id, Transport& transport, const nlohmann::json& envelope);
    static void unindex(std::map<std::string, std::set<std::string>>& index,
                        const std::string& key, const std::string& id);
};

} // namespace spychat
