#include "connection_registry.hpp"
#include "utils.hpp"
#include <iostream>

namespace spychat {

std::string ConnectionRegistry::connect(std::shared_ptr<Transport> transport,
                                        const std::string& persona_id,
                                        const std::string& conversation_id) {
    Connection conn;
    conn.id = generate_uuid();
    conn.transport = std::move(transport);
    conn.persona_id = persona_id;
    conn.conversation_id = conversation_id;

    std::string id = conn.id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!persona_id.empty()) by_persona_[persona_id].insert(id);
        if (!conversation_id.empty()) by_conversation_[conversation_id].insert(id);
        connections_.emplace(id, std::move(conn));
    }
    std::cerr << "[registry] Connected " << id
              << (persona_id.empty() ? "" : " spy=" + persona_id)
              << (conversation_id.empty() ? "" : " conversation=" + conversation_id) << "\n";
    return id;
}

void ConnectionRegistry::unindex(std::map<std::string, std::set<std::string>>& index,
                                 const std::string& key, const std::string& id) {
    if (key.empty()) return;
    auto it = index.find(key);
    if (it == index.end()) return;
    it->second.erase(id);
    if (it->second.empty()) index.erase(it);
}

void ConnectionRegistry::disconnect(const std::string& connection_id) {
    std::shared_ptr<Transport> transport;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = connections_.find(connection_id);
        if (it == connections_.end()) return;
        unindex(by_persona_, it->second.persona_id, connection_id);
        unindex(by_conversation_, it->second.conversation_id, connection_id);
        transport = std::move(it->second.transport);
        connections_.erase(it);
    }
    if (transport) transport->close();
    std::cerr << "[registry] Disconnected " << connection_id << "\n";
}

bool ConnectionRegistry::deliver_one(const std::string& id, Transport& transport,
                                     const nlohmann::json& envelope) {
    try {
        return transport.send(envelope);
    } catch (const std::exception& e) {
        std::cerr << "[registry] Send to " << id << " failed: " << e.what() << "\n";
    }
    disconnect(id);
    return false;
}

bool ConnectionRegistry::send_to(const std::string& connection_id, const nlohmann::json& envelope) {
    std::shared_ptr<Transport> transport;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = connections_.find(connection_id);
        if (it == connections_.end()) return false;
        transport = it->second.transport;
    }
    return deliver_one(connection_id, *transport, envelope);
}

std::vector<ConnectionRegistry::Target> ConnectionRegistry::snapshot(const std::set<std::string>* ids) const {
    std::vector<Target> targets;
    if (ids) {
        for (auto& id : *ids) {
            auto it = connections_.find(id);
            if (it != connections_.end()) targets.emplace_back(id, it->second.transport);
        }
    } else {
        for (auto& [id, conn] : connections_) targets.emplace_back(id, conn.transport);
    }
    return targets;
}

// Sends happen outside the lock. Holding the shared_ptr keeps a transport
// alive even if its connection is removed mid-fan-out.
size_t ConnectionRegistry::deliver(const std::vector<Target>& targets, const nlohmann::json& envelope) {
    size_t delivered = 0;
    for (auto& [id, transport] : targets) {
        if (deliver_one(id, *transport, envelope)) delivered++;
    }
    return delivered;
}

size_t ConnectionRegistry::broadcast_to_persona(const std::string& persona_id, const nlohmann::json& envelope) {
    std::vector<Target> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = by_persona_.find(persona_id);
        if (it == by_persona_.end()) return 0;
        targets = snapshot(&it->second);
    }
    return deliver(targets, envelope);
}

size_t ConnectionRegistry::broadcast_to_conversation(const std::string& conversation_id,
                                                     const nlohmann::json& envelope) {
    std::vector<Target> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = by_conversation_.find(conversation_id);
        if (it == by_conversation_.end()) return 0;
        targets = snapshot(&it->second);
    }
    return deliver(targets, envelope);
}

size_t ConnectionRegistry::broadcast(const nlohmann::json& envelope) {
    std::vector<Target> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        targets = snapshot(nullptr);
    }
    return deliver(targets, envelope);
}

ConnectionState ConnectionRegistry::state(const std::string& connection_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.count(connection_id) ? ConnectionState::open : ConnectionState::closed;
}

std::optional<std::string> ConnectionRegistry::conversation_of(const std::string& connection_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(connection_id);
    if (it == connections_.end() || it->second.conversation_id.empty()) return std::nullopt;
    return it->second.conversation_id;
}

std::optional<std::string> ConnectionRegistry::persona_of(const std::string& connection_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(connection_id);
    if (it == connections_.end() || it->second.persona_id.empty()) return std::nullopt;
    return it->second.persona_id;
}

size_t ConnectionRegistry::connection_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.size();
}

size_t ConnectionRegistry::persona_bucket_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return by_persona_.size();
}

size_t ConnectionRegistry::conversation_bucket_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return by_conversation_.size();
}

} // namespace spychat
