#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include "gateway.hpp"

namespace {

using spychat::ChatSession;
using spychat::ConnectionRegistry;
using spychat::ConversationStore;
using spychat::Gateway;
using spychat::LlmClient;
using spychat::LlmReply;
using spychat::Message;
using spychat::MissionContextCache;
using spychat::Persona;
using spychat::SqliteConversationBackend;
using spychat::SqlitePersonaStore;
using spychat::SseTransport;
using spychat::ToolCallLoop;
using spychat::ToolRegistry;

class EchoLlm : public LlmClient {
public:
    LlmReply complete(const std::string&, const std::vector<Message>& history,
                      const nlohmann::json&) override {
        return LlmReply{"Roger: " + history.back().text(), {}};
    }
};

class GatewayTest : public ::testing::Test {
protected:
    GatewayTest()
        : personas_(":memory:"),
          backend_(":memory:"),
          store_(backend_, personas_),
          loop_(llm_, tools_, cache_),
          session_(store_, personas_, registry_, loop_),
          gateway_(personas_, store_, registry_, session_) {
        Persona p;
        p.id = "spy-7";
        p.name = "Ada Vance";
        p.codename = "NIGHTJAR";
        EXPECT_FALSE(spychat::is_error(personas_.create(p)));
        p.id = "spy-8";
        p.name = "Ivo Brandt";
        p.codename = "KESTREL";
        EXPECT_FALSE(spychat::is_error(personas_.create(p)));

        port_ = gateway_.start_on_any_port("127.0.0.1");
        EXPECT_GT(port_, 0);
    }

    httplib::Client client() {
        httplib::Client cli("127.0.0.1", port_);
        cli.set_read_timeout(10, 0);
        return cli;
    }

    static nlohmann::json body_of(const httplib::Result& res) {
        return nlohmann::json::parse(res->body, nullptr, false);
    }

    SqlitePersonaStore personas_;
    SqliteConversationBackend backend_;
    ConversationStore store_;
    EchoLlm llm_;
    ToolRegistry tools_;
    MissionContextCache cache_;
    ToolCallLoop loop_;
    ConnectionRegistry registry_;
    ChatSession session_;
    Gateway gateway_;
    int port_ = -1;
};

TEST(SseTransportTest, QueuesFramesUntilClosed) {
    SseTransport t;
    EXPECT_TRUE(t.send({{"type", "system"}}));

    std::string frame;
    ASSERT_TRUE(t.next(frame, std::chrono::milliseconds(10)));
    EXPECT_EQ(frame.rfind("data: ", 0), 0u);
    EXPECT_EQ(frame.substr(frame.size() - 2), "\n\n");

    ASSERT_TRUE(t.next(frame, std::chrono::milliseconds(10)));
    EXPECT_TRUE(frame.empty());

    t.close();
    EXPECT_FALSE(t.send({{"type", "late"}}));
    EXPECT_FALSE(t.next(frame, std::chrono::milliseconds(10)));
    EXPECT_TRUE(t.closed());
}

TEST_F(GatewayTest, HealthReportsConnections) {
    auto cli = client();
    auto res = cli.Get("/health");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(body_of(res)["status"], "ok");
    EXPECT_EQ(body_of(res)["connections"], 0);
}

TEST_F(GatewayTest, SpyCrud) {
    auto cli = client();
    auto created = cli.Post("/api/spies", R"({"name": "Mara Quill", "codename": "WREN", "specialty": "Forgery"})",
                            "application/json");
    ASSERT_TRUE(created);
    ASSERT_EQ(created->status, 201);
    std::string id = body_of(created)["id"];
    EXPECT_FALSE(id.empty());

    auto dup = cli.Post("/api/spies", R"({"name": "Other", "codename": "WREN"})", "application/json");
    ASSERT_TRUE(dup);
    EXPECT_EQ(dup->status, 400);

    auto updated = cli.Put("/api/spies/" + id, R"({"biography": "Ex-archivist."})", "application/json");
    ASSERT_TRUE(updated);
    EXPECT_EQ(updated->status, 200);
    EXPECT_EQ(body_of(updated)["biography"], "Ex-archivist.");
    EXPECT_EQ(body_of(updated)["codename"], "WREN");

    auto list = cli.Get("/api/spies");
    ASSERT_TRUE(list);
    EXPECT_EQ(body_of(list).size(), 3u);

    auto removed = cli.Delete("/api/spies/" + id);
    ASSERT_TRUE(removed);
    EXPECT_EQ(removed->status, 204);

    auto gone = cli.Get("/api/spies/" + id);
    ASSERT_TRUE(gone);
    EXPECT_EQ(gone->status, 404);
}

TEST_F(GatewayTest, ChatPersistsAndAnswers) {
    auto cli = client();
    auto res = cli.Post("/api/chat/spy-7", R"({"message": "hello"})", "application/json");
    ASSERT_TRUE(res);
    ASSERT_EQ(res->status, 200);
    auto j = body_of(res);
    EXPECT_EQ(j["type"], "response");
    EXPECT_EQ(j["response"], "Roger: hello");
    EXPECT_EQ(j["status"], "done");
    std::string cid = j["conversation_id"];

    auto again = cli.Post("/api/chat/spy-7/conversation/" + cid, R"({"message": "again"})", "application/json");
    ASSERT_TRUE(again);
    EXPECT_EQ(again->status, 200);
    EXPECT_EQ(body_of(again)["conversation_id"], cid);

    auto log = cli.Get("/api/conversations/" + cid);
    ASSERT_TRUE(log);
    ASSERT_EQ(log->status, 200);
    EXPECT_EQ(body_of(log)["spy_id"], "spy-7");
    EXPECT_EQ(body_of(log)["messages"].size(), 4u);
}

TEST_F(GatewayTest, ChatRejectsBadInput) {
    auto cli = client();

    auto missing = cli.Post("/api/chat/spy-7", R"({"text": "wrong key"})", "application/json");
    ASSERT_TRUE(missing);
    EXPECT_EQ(missing->status, 400);
    EXPECT_EQ(body_of(missing)["detail"], "Invalid message format");

    auto garbage = cli.Post("/api/chat/spy-7", "not json", "application/json");
    ASSERT_TRUE(garbage);
    EXPECT_EQ(garbage->status, 400);

    auto ghost = cli.Post("/api/chat/spy-404", R"({"message": "hi"})", "application/json");
    ASSERT_TRUE(ghost);
    EXPECT_EQ(ghost->status, 404);

    auto nowhere = cli.Post("/api/chat/spy-7/conversation/nope", R"({"message": "hi"})", "application/json");
    ASSERT_TRUE(nowhere);
    EXPECT_EQ(nowhere->status, 404);

    auto theirs = store_.create("spy-8");
    ASSERT_FALSE(spychat::is_error(theirs));
    auto foreign = cli.Post("/api/chat/spy-7/conversation/" + spychat::get_value(theirs),
                            R"({"message": "hi"})", "application/json");
    ASSERT_TRUE(foreign);
    EXPECT_EQ(foreign->status, 403);
}

TEST_F(GatewayTest, ConversationEndpoints) {
    auto cli = client();
    auto created = cli.Post("/api/conversation", R"({"spy_id": "spy-8"})", "application/json");
    ASSERT_TRUE(created);
    ASSERT_EQ(created->status, 201);
    std::string cid = body_of(created)["conversation_id"];

    auto unknown_spy = cli.Post("/api/conversation", R"({"spy_id": "spy-404"})", "application/json");
    ASSERT_TRUE(unknown_spy);
    EXPECT_EQ(unknown_spy->status, 404);

    auto mine = cli.Get("/api/conversations?spy_id=spy-8");
    ASSERT_TRUE(mine);
    ASSERT_EQ(body_of(mine).size(), 1u);
    EXPECT_EQ(body_of(mine)[0]["id"], cid);
    EXPECT_EQ(body_of(mine)[0]["message_count"], 0);

    auto removed = cli.Delete("/api/conversations/" + cid);
    ASSERT_TRUE(removed);
    EXPECT_EQ(removed->status, 204);

    auto gone = cli.Get("/api/conversations/" + cid);
    ASSERT_TRUE(gone);
    EXPECT_EQ(gone->status, 404);
}

TEST_F(GatewayTest, StreamDeliversResponsesForPostedMessages) {
    std::mutex mutex;
    std::string connection_id;
    std::string received;
    std::atomic<bool> got_response{false};

    std::thread reader([&] {
        auto cli = client();
        cli.Get("/ws/chat/spy-7", [&](const char* data, size_t len) {
            std::lock_guard<std::mutex> lock(mutex);
            received.append(data, len);
            size_t pos = 0;
            while ((pos = received.find("data: ", pos)) != std::string::npos) {
                size_t end = received.find("\n\n", pos);
                if (end == std::string::npos) break;
                auto j = nlohmann::json::parse(received.substr(pos + 6, end - pos - 6), nullptr, false);
                if (j.is_object() && j.value("type", "") == "system" && j.contains("connection_id")) {
                    connection_id = j["connection_id"];
                }
                if (j.is_object() && j.value("type", "") == "response") got_response = true;
                pos = end + 2;
            }
            return !got_response.load();
        });
    });

    std::string id;
    for (int i = 0; i < 200 && id.empty(); i++) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        std::lock_guard<std::mutex> lock(mutex);
        id = connection_id;
    }
    ASSERT_FALSE(id.empty());

    auto cli = client();
    auto bad = cli.Post("/ws/connections/" + id + "/messages", R"({"msg": "oops"})", "application/json");
    ASSERT_TRUE(bad);
    EXPECT_EQ(bad->status, 400);

    auto res = cli.Post("/ws/connections/" + id + "/messages", R"({"message": "report"})", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 202);
    EXPECT_TRUE(body_of(res)["accepted"].get<bool>());

    reader.join();
    EXPECT_TRUE(got_response.load());
    {
        std::lock_guard<std::mutex> lock(mutex);
        EXPECT_NE(received.find("Connected to Ada Vance (NIGHTJAR)"), std::string::npos);
        EXPECT_NE(received.find("Invalid message format"), std::string::npos);
        EXPECT_NE(received.find("Roger: report"), std::string::npos);
    }

    // Releases the stream worker so the server can stop promptly.
    registry_.disconnect(id);
}

TEST_F(GatewayTest, StreamsPastTheCapAreRefusedWhileRequestsStillServe) {
    const int kCap = 2;
    Gateway small(personas_, store_, registry_, session_, kCap);
    int port = small.start_on_any_port("127.0.0.1");
    ASSERT_GT(port, 0);

    std::mutex mutex;
    std::vector<std::string> ids;
    std::vector<std::thread> readers;
    for (int i = 0; i < kCap; i++) {
        readers.emplace_back([&, port] {
            httplib::Client cli("127.0.0.1", port);
            cli.set_read_timeout(10, 0);
            std::string received;
            bool seen = false;
            cli.Get("/ws/chat/spy-7", [&](const char* data, size_t len) {
                received.append(data, len);
                size_t pos = received.find("data: ");
                size_t end = received.find("\n\n", pos);
                if (!seen && pos != std::string::npos && end != std::string::npos) {
                    auto j = nlohmann::json::parse(received.substr(pos + 6, end - pos - 6), nullptr, false);
                    if (j.is_object() && j.contains("connection_id")) {
                        std::lock_guard<std::mutex> lock(mutex);
                        ids.push_back(j["connection_id"]);
                        seen = true;
                    }
                }
                // Stays open until the registry closes the connection.
                return true;
            });
        });
    }

    for (int i = 0; i < 300; i++) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (ids.size() == static_cast<size_t>(kCap)) break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    std::vector<std::string> open_ids;
    {
        std::lock_guard<std::mutex> lock(mutex);
        open_ids = ids;
    }
    ASSERT_EQ(open_ids.size(), static_cast<size_t>(kCap));

    httplib::Client cli("127.0.0.1", port);
    cli.set_read_timeout(10, 0);
    auto refused = cli.Get("/ws/chat/spy-8");
    ASSERT_TRUE(refused);
    EXPECT_EQ(refused->status, 503);

    auto health = cli.Get("/health");
    ASSERT_TRUE(health);
    EXPECT_EQ(health->status, 200);
    EXPECT_EQ(body_of(health)["connections"], kCap);

    auto posted = cli.Post("/ws/connections/" + open_ids[0] + "/messages", R"({"message": "status"})",
                           "application/json");
    ASSERT_TRUE(posted);
    EXPECT_EQ(posted->status, 202);

    for (auto& id : open_ids) registry_.disconnect(id);
    for (auto& t : readers) t.join();
    small.stop();
}

TEST_F(GatewayTest, PostToUnknownConnectionIs404) {
    auto cli = client();
    auto res = cli.Post("/ws/connections/nope/messages", R"({"message": "hi"})", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);
}

TEST_F(GatewayTest, StreamForUnknownSpyIs404) {
    auto cli = client();
    auto res = cli.Get("/ws/chat/spy-404");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);
}

}  // namespace
