#pragma once
#include "connection_registry.hpp"
#include "conversation_store.hpp"
#include "chat_session.hpp"
#include "persona.hpp"
#include <httplib.h>
#include <string>
#include <deque>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <thread>
#include <atomic>

namespace spychat {

// Server-sent-events stream for one client. send() queues a frame; the HTTP
// worker serving the stream drains the queue through next().
class SseTransport : public Transport {
public:
    bool send(const nlohmann::json& envelope) override;
    void close() override;

    // Waits up to `wait` for a frame. Returns false once closed and drained;
    // an empty frame means the wait timed out.
    bool next(std::string& frame, std::chrono::milliseconds wait);
    bool closed() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> frames_;
    bool closed_ = false;
};

class Gateway {
public:
    // Streams past max_streams get 503 so plain requests always find a worker.
    Gateway(SqlitePersonaStore& personas, ConversationStore& store,
            ConnectionRegistry& registry, ChatSession& session, int max_streams = 24);
    ~Gateway();

    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;

    void start(const std::string& host, int port);
    // Binds an ephemeral port and returns it, or -1.
    int start_on_any_port(const std::string& host);
    void stop();

private:
    SqlitePersonaStore& personas_;
    ConversationStore& store_;
    ConnectionRegistry& registry_;
    ChatSession& session_;
    httplib::Server server_;
    std::thread thread_;
    int max_streams_;
    std::atomic<int> open_streams_{0};

    void register_routes();
    void open_stream(const std::string& spy_id, const std::string& conversation_id,
                     httplib::Response& res);
    void post_chat(const std::string& spy_id, const std::string& conversation_id,
                   const httplib::Request& req, httplib::Response& res);
    void post_connection_message(const std::string& connection_id,
                                 const httplib::Request& req, httplib::Response& res);
};

int cmd_serve(const std::string& host, int port);

} // namespace spychat
