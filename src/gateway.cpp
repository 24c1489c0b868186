#include "gateway.hpp"
#include "runtime.hpp"
#include "utils.hpp"
#include <iostream>
#include <csignal>
#include <atomic>

namespace spychat {

// ── SSE transport ──────────────────────────────────────────────────────

bool SseTransport::send(const nlohmann::json& envelope) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) return false;
    frames_.push_back("data: " + envelope.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n\n");
    cv_.notify_all();
    return true;
}

void SseTransport::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    cv_.notify_all();
}

bool SseTransport::next(std::string& frame, std::chrono::milliseconds wait) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, wait, [this] { return closed_ || !frames_.empty(); });
    frame.clear();
    if (!frames_.empty()) {
        frame = std::move(frames_.front());
        frames_.pop_front();
        return true;
    }
    return !closed_;
}

bool SseTransport::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

// ── Helpers ────────────────────────────────────────────────────────────

static void send_json(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), "application/json");
}

static void send_error(httplib::Response& res, int status, const std::string& detail) {
    send_json(res, status, {{"detail", detail}});
}

static int status_for(const Error& e) {
    switch (e.kind) {
    case ErrorKind::not_found:            return 404;
    case ErrorKind::invalid_request:      return 400;
    case ErrorKind::upstream_unavailable: return 503;
    default:                              return 502;
    }
}

static bool parse_body(const httplib::Request& req, httplib::Response& res, nlohmann::json& out) {
    out = nlohmann::json::parse(req.body, nullptr, false);
    if (out.is_discarded() || !out.is_object()) {
        send_error(res, 400, "invalid JSON in request body");
        return false;
    }
    return true;
}

static int query_int(const httplib::Request& req, const char* key, int fallback) {
    if (!req.has_param(key)) return fallback;
    int v = std::atoi(req.get_param_value(key).c_str());
    return v < 0 ? fallback : v;
}

static std::string message_text(const nlohmann::json& body) {
    if (!body.contains("message") || !body["message"].is_string()) return "";
    return body["message"].get<std::string>();
}

// ── Gateway ────────────────────────────────────────────────────────────

static const int kRequestWorkers = 8;

Gateway::Gateway(SqlitePersonaStore& personas, ConversationStore& store,
                 ConnectionRegistry& registry, ChatSession& session, int max_streams)
    : personas_(personas), store_(store), registry_(registry), session_(session),
      max_streams_(max_streams < 1 ? 1 : max_streams) {
    // Each open event stream occupies a worker; the rest serve plain requests.
    size_t workers = static_cast<size_t>(max_streams_ + kRequestWorkers);
    server_.new_task_queue = [workers] { return new httplib::ThreadPool(workers); };
    register_routes();
}

Gateway::~Gateway() {
    stop();
}

void Gateway::start(const std::string& host, int port) {
    thread_ = std::thread([this, host, port]() {
        std::cerr << "[gateway] Listening on " << host << ":" << port << "\n";
        if (!server_.listen(host, port)) {
            std::cerr << "[gateway] Failed to listen on " << host << ":" << port << "\n";
        }
    });
}

int Gateway::start_on_any_port(const std::string& host) {
    int port = server_.bind_to_any_port(host);
    if (port < 0) return -1;
    thread_ = std::thread([this]() { server_.listen_after_bind(); });
    server_.wait_until_ready();
    return port;
}

void Gateway::stop() {
    server_.stop();
    if (thread_.joinable()) thread_.join();
}

void Gateway::open_stream(const std::string& spy_id, const std::string& conversation_id,
                          httplib::Response& res) {
    auto persona = personas_.resolve(spy_id);
    if (is_error(persona)) {
        send_error(res, 404, get_error(persona).message);
        return;
    }

    Result<ConversationLog> log = conversation_id.empty()
        ? store_.get_or_create_for_owner(spy_id)
        : store_.get(conversation_id);
    if (is_error(log)) {
        send_error(res, status_for(get_error(log)), get_error(log).message);
        return;
    }
    if (get_value(log).owner_id != spy_id) {
        send_error(res, 403, "Conversation does not belong to this spy");
        return;
    }

    if (open_streams_.fetch_add(1) >= max_streams_) {
        open_streams_.fetch_sub(1);
        std::cerr << "[gateway] Refusing stream for " << spy_id << ": " << max_streams_ << " already open\n";
        send_error(res, 503, "Too many open streams");
        return;
    }

    auto transport = std::make_shared<SseTransport>();
    std::string id = registry_.connect(transport, spy_id, get_value(log).id);
    auto& p = get_value(persona);
    registry_.send_to(id, system_envelope(
        "Connected to " + p.name + " (" + p.codename + ")", id));

    res.set_header("Cache-Control", "no-cache");
    res.set_header("X-Conversation-Id", get_value(log).id);
    res.set_chunked_content_provider("text/event-stream",
        [transport](size_t, httplib::DataSink& sink) {
            std::string frame;
            if (!transport->next(frame, std::chrono::seconds(15))) {
                sink.done();
                return true;
            }
            if (frame.empty()) frame = ": keepalive\n\n";
            if (sink.is_writable && !sink.is_writable()) return false;
            return sink.write(frame.data(), frame.size());
        },
        [this, id](bool) {
            registry_.disconnect(id);
            open_streams_.fetch_sub(1);
        });
}

void Gateway::post_chat(const std::string& spy_id, const std::string& conversation_id,
                        const httplib::Request& req, httplib::Response& res) {
    nlohmann::json body;
    if (!parse_body(req, res, body)) return;
    std::string text = message_text(body);
    if (text.empty()) {
        send_error(res, 400, "Invalid message format");
        return;
    }

    auto persona = personas_.resolve(spy_id);
    if (is_error(persona)) {
        send_error(res, 404, get_error(persona).message);
        return;
    }
    if (!conversation_id.empty()) {
        auto log = store_.get(conversation_id);
        if (is_error(log)) {
            send_error(res, 404, get_error(log).message);
            return;
        }
        if (get_value(log).owner_id != spy_id) {
            send_error(res, 403, "Conversation does not belong to this spy");
            return;
        }
    }

    auto reply = session_.handle(ChatRequest{spy_id, conversation_id, text, ""});
    if (is_error(reply)) {
        send_error(res, status_for(get_error(reply)), get_error(reply).message);
        return;
    }
    send_json(res, 200, get_value(reply).envelope);
}

void Gateway::post_connection_message(const std::string& connection_id,
                                      const httplib::Request& req, httplib::Response& res) {
    auto spy_id = registry_.persona_of(connection_id);
    if (!spy_id) {
        send_error(res, 404, "Connection " + connection_id + " is not open");
        return;
    }

    auto body = nlohmann::json::parse(req.body, nullptr, false);
    std::string text = body.is_object() ? message_text(body) : "";
    if (text.empty()) {
        auto env = error_envelope("Invalid message format");
        registry_.send_to(connection_id, env);
        send_json(res, 400, env);
        return;
    }

    ChatRequest chat;
    chat.persona_id = *spy_id;
    chat.conversation_id = registry_.conversation_of(connection_id).value_or("");
    chat.text = text;
    chat.origin_connection = connection_id;

    auto reply = session_.handle(chat);
    if (is_error(reply)) {
        auto env = error_envelope(get_error(reply).message);
        registry_.send_to(connection_id, env);
        send_json(res, status_for(get_error(reply)), env);
        return;
    }
    send_json(res, 202, {{"accepted", true}, {"conversation_id", get_value(reply).conversation_id}});
}

void Gateway::register_routes() {
    server_.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string msg = "unknown error";
        try { if (ep) std::rethrow_exception(ep); }
        catch (const std::exception& e) { msg = e.what(); }
        catch (...) { msg = "non-std exception"; }
        std::cerr << "[gateway] Unhandled exception on " << req.path << ": " << msg << "\n";
        send_error(res, 500, msg);
    });

    server_.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        send_json(res, 200, {{"status", "ok"}, {"connections", registry_.connection_count()}});
    });

    // ── Spies ──

    server_.Get("/api/spies", [this](const httplib::Request& req, httplib::Response& res) {
        nlohmann::json arr = nlohmann::json::array();
        for (auto& p : personas_.list(query_int(req, "skip", 0), query_int(req, "limit", 100))) {
            arr.push_back(p.to_json());
        }
        send_json(res, 200, arr);
    });

    server_.Post("/api/spies", [this](const httplib::Request& req, httplib::Response& res) {
        nlohmann::json body;
        if (!parse_body(req, res, body)) return;
        auto created = personas_.create(Persona::from_json(body));
        if (is_error(created)) {
            send_error(res, status_for(get_error(created)), get_error(created).message);
            return;
        }
        send_json(res, 201, get_value(created).to_json());
    });

    server_.Get(R"(/api/spies/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        auto p = personas_.resolve(req.matches[1]);
        if (is_error(p)) {
            send_error(res, 404, get_error(p).message);
            return;
        }
        send_json(res, 200, get_value(p).to_json());
    });

    server_.Put(R"(/api/spies/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        nlohmann::json body;
        if (!parse_body(req, res, body)) return;
        auto p = personas_.update(req.matches[1], Persona::from_json(body));
        if (is_error(p)) {
            send_error(res, status_for(get_error(p)), get_error(p).message);
            return;
        }
        send_json(res, 200, get_value(p).to_json());
    });

    server_.Delete(R"(/api/spies/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        if (!personas_.remove(req.matches[1])) {
            send_error(res, 404, "Spy not found");
            return;
        }
        res.status = 204;
    });

    // ── Chat ──

    server_.Post(R"(/api/chat/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        post_chat(req.matches[1], "", req, res);
    });

    server_.Post(R"(/api/chat/([^/]+)/conversation/([^/]+))",
                 [this](const httplib::Request& req, httplib::Response& res) {
        post_chat(req.matches[1], req.matches[2], req, res);
    });

    // ── Conversations ──

    server_.Post("/api/conversation", [this](const httplib::Request& req, httplib::Response& res) {
        nlohmann::json body;
        if (!parse_body(req, res, body)) return;
        std::string spy_id = body.value("spy_id", "");
        if (spy_id.empty()) {
            send_error(res, 400, "spy_id is required");
            return;
        }
        auto id = store_.create(spy_id);
        if (is_error(id)) {
            send_error(res, status_for(get_error(id)), get_error(id).message);
            return;
        }
        send_json(res, 201, {{"conversation_id", get_value(id)}, {"spy_id", spy_id}});
    });

    server_.Get("/api/conversations", [this](const httplib::Request& req, httplib::Response& res) {
        auto rows = req.has_param("spy_id")
            ? store_.list_for_owner(req.get_param_value("spy_id"))
            : store_.list(query_int(req, "skip", 0), query_int(req, "limit", 100));
        nlohmann::json arr = nlohmann::json::array();
        for (auto& s : rows) arr.push_back(s.to_json());
        send_json(res, 200, arr);
    });

    server_.Get(R"(/api/conversations/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        auto log = store_.get(req.matches[1]);
        if (is_error(log)) {
            send_error(res, 404, get_error(log).message);
            return;
        }
        send_json(res, 200, get_value(log).to_json());
    });

    server_.Delete(R"(/api/conversations/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        if (!store_.remove(req.matches[1])) {
            send_error(res, 404, "Conversation not found");
            return;
        }
        res.status = 204;
    });

    // ── Event streams ──

    server_.Get(R"(/ws/chat/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        open_stream(req.matches[1], "", res);
    });

    server_.Get(R"(/ws/chat/([^/]+)/conversation/([^/]+))",
                [this](const httplib::Request& req, httplib::Response& res) {
        open_stream(req.matches[1], req.matches[2], res);
    });

    server_.Post(R"(/ws/connections/([^/]+)/messages)",
                 [this](const httplib::Request& req, httplib::Response& res) {
        post_connection_message(req.matches[1], req, res);
    });
}

// ── serve command ──────────────────────────────────────────────────────

static std::atomic<bool> g_running{true};

static void signal_handler(int) {
    g_running = false;
}

int cmd_serve(const std::string& host, int port) {
    Config cfg = Config::load(default_config_path());
    std::string bind_host = host.empty() ? cfg.gateway.host : host;
    int bind_port = port > 0 ? port : cfg.gateway.port;

    Runtime rt(cfg);
    Gateway gateway(rt.personas, rt.store, rt.registry, rt.session, cfg.gateway.max_streams);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    gateway.start(bind_host, bind_port);
    std::cerr << "[gateway] Ready. Ctrl+C to quit.\n";
    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cerr << "[gateway] Shutting down...\n";
    rt.registry.broadcast(system_envelope("Server shutting down"));
    gateway.stop();
    std::cerr << "[gateway] Done.\n";
    return 0;
}

} // namespace spychat
