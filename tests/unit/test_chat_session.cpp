#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "chat_session.hpp"
#include "mission_tools.hpp"

namespace {

using spychat::ChatRequest;
using spychat::ChatSession;
using spychat::ConnectionRegistry;
using spychat::ConversationStore;
using spychat::ErrorKind;
using spychat::get_error;
using spychat::get_value;
using spychat::is_error;
using spychat::LlmClient;
using spychat::LlmReply;
using spychat::Message;
using spychat::MissionBackend;
using spychat::MissionContextCache;
using spychat::Persona;
using spychat::Result;
using spychat::Role;
using spychat::SqliteConversationBackend;
using spychat::SqlitePersonaStore;
using spychat::ToolCall;
using spychat::ToolCallLoop;
using spychat::ToolRegistry;
using spychat::Transport;
using spychat::TurnState;

// Answers "Roger: <last user text>", or calls get_mission_context once when
// the user names a mission and echoes the tool answer afterwards.
class ScriptedLlm : public LlmClient {
public:
    LlmReply complete(const std::string&, const std::vector<Message>& history,
                      const nlohmann::json& tools_spec) override {
        int now = ++active;
        if (now > 1) overlapped = true;
        if (during_turn) during_turn();
        std::this_thread::sleep_for(delay);
        --active;

        const Message& last = history.back();
        if (last.role == Role::tool) return LlmReply{"From the file: " + last.text(), {}};
        if (!tools_spec.empty()) {
            auto ids = spychat::extract_mission_ids(last.text());
            LlmReply r;
            r.tool_calls.push_back(ToolCall{"call_1", "get_mission_context", {{"mission_id", ids.front()}}});
            return r;
        }
        return LlmReply{"Roger: " + last.text(), {}};
    }

    std::function<void()> during_turn;
    std::chrono::milliseconds delay{0};
    std::atomic<int> active{0};
    std::atomic<bool> overlapped{false};
};

class CountingMissions : public MissionBackend {
public:
    Result<std::string> fetch_mission_context(const std::string& id) override {
        reads++;
        return spychat::not_found("No mission found with ID: " + id);
    }
    std::atomic<int> reads{0};
};

class RecordingTransport : public Transport {
public:
    bool send(const nlohmann::json& envelope) override {
        std::lock_guard<std::mutex> lock(mutex_);
        received_.push_back(envelope);
        return true;
    }
    void close() override {}

    std::vector<nlohmann::json> received() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return received_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<nlohmann::json> received_;
};

class ChatSessionTest : public ::testing::Test {
protected:
    ChatSessionTest()
        : personas_(":memory:"),
          backend_(":memory:"),
          store_(backend_, personas_),
          loop_(llm_, tools_, cache_),
          session_(store_, personas_, registry_, loop_) {
        Persona p;
        p.id = "spy-7";
        p.name = "Ada Vance";
        p.codename = "NIGHTJAR";
        EXPECT_FALSE(is_error(personas_.create(p)));
        p.id = "spy-8";
        p.name = "Ivo Brandt";
        p.codename = "KESTREL";
        EXPECT_FALSE(is_error(personas_.create(p)));
        spychat::register_mission_tools(tools_, missions_);
    }

    ChatRequest request(const std::string& text, const std::string& conversation_id = "") {
        ChatRequest r;
        r.persona_id = "spy-7";
        r.conversation_id = conversation_id;
        r.text = text;
        return r;
    }

    SqlitePersonaStore personas_;
    SqliteConversationBackend backend_;
    ConversationStore store_;
    ScriptedLlm llm_;
    CountingMissions missions_;
    ToolRegistry tools_;
    MissionContextCache cache_;
    ToolCallLoop loop_;
    ConnectionRegistry registry_;
    ChatSession session_;
};

TEST_F(ChatSessionTest, FirstTurnCreatesAndPersistsConversation) {
    auto reply = session_.handle(request("hello"));
    ASSERT_FALSE(is_error(reply));
    EXPECT_EQ(get_value(reply).outcome.state, TurnState::done);
    EXPECT_EQ(get_value(reply).envelope["response"], "Roger: hello");
    EXPECT_EQ(get_value(reply).envelope["spy_name"], "Ada Vance");
    EXPECT_EQ(get_value(reply).envelope["status"], "done");

    const std::string cid = get_value(reply).conversation_id;
    auto log = store_.get(cid);
    ASSERT_FALSE(is_error(log));
    ASSERT_EQ(get_value(log).messages.size(), 2u);
    EXPECT_EQ(get_value(log).messages[0], Message::user("hello"));
    EXPECT_EQ(get_value(log).messages[1], Message::assistant("Roger: hello"));

    auto again = session_.handle(request("still there?"));
    ASSERT_FALSE(is_error(again));
    EXPECT_EQ(get_value(again).conversation_id, cid);
    EXPECT_EQ(get_value(store_.get(cid)).messages.size(), 4u);
}

TEST_F(ChatSessionTest, RejectsBadRequests) {
    auto blank = session_.handle(request("   "));
    ASSERT_TRUE(is_error(blank));
    EXPECT_EQ(get_error(blank).kind, ErrorKind::invalid_request);

    ChatRequest ghost = request("hi");
    ghost.persona_id = "spy-404";
    auto unknown = session_.handle(ghost);
    ASSERT_TRUE(is_error(unknown));
    EXPECT_EQ(get_error(unknown).kind, ErrorKind::not_found);

    auto missing = session_.handle(request("hi", "no-such-conversation"));
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).kind, ErrorKind::not_found);
}

TEST_F(ChatSessionTest, ForeignConversationIsRejected) {
    auto other = store_.create("spy-8");
    ASSERT_FALSE(is_error(other));

    auto reply = session_.handle(request("hi", get_value(other)));
    ASSERT_TRUE(is_error(reply));
    EXPECT_EQ(get_error(reply).kind, ErrorKind::invalid_request);
    EXPECT_TRUE(get_value(store_.get(get_value(other))).messages.empty());
}

TEST_F(ChatSessionTest, ResponseReachesBoundAndOriginConnections) {
    auto cid = store_.create("spy-7");
    ASSERT_FALSE(is_error(cid));

    auto bound = std::make_shared<RecordingTransport>();
    auto origin = std::make_shared<RecordingTransport>();
    auto bystander = std::make_shared<RecordingTransport>();
    auto bound_id = registry_.connect(bound, "spy-7", get_value(cid));
    auto origin_id = registry_.connect(origin, "spy-7");
    registry_.connect(bystander, "spy-8");

    ChatRequest r = request("status?", get_value(cid));
    r.origin_connection = origin_id;
    ASSERT_FALSE(is_error(session_.handle(r)));

    ASSERT_EQ(bound->received().size(), 1u);
    EXPECT_EQ(bound->received()[0]["type"], "response");
    EXPECT_EQ(bound->received()[0]["conversation_id"], get_value(cid));
    EXPECT_EQ(origin->received().size(), 1u);
    EXPECT_TRUE(bystander->received().empty());

    // A bound origin gets the envelope once, not twice.
    r.origin_connection = bound_id;
    ASSERT_FALSE(is_error(session_.handle(r)));
    EXPECT_EQ(bound->received().size(), 2u);
}

TEST_F(ChatSessionTest, DisconnectMidTurnStillPersistsReply) {
    auto cid = store_.create("spy-7");
    ASSERT_FALSE(is_error(cid));
    auto t = std::make_shared<RecordingTransport>();
    auto conn = registry_.connect(t, "spy-7", get_value(cid));
    llm_.during_turn = [this, conn] { registry_.disconnect(conn); };

    ChatRequest r = request("are you there", get_value(cid));
    r.origin_connection = conn;
    auto reply = session_.handle(r);
    ASSERT_FALSE(is_error(reply));

    EXPECT_TRUE(t->received().empty());
    auto log = store_.get(get_value(cid));
    ASSERT_FALSE(is_error(log));
    ASSERT_EQ(get_value(log).messages.size(), 2u);
    EXPECT_EQ(get_value(log).messages[1], Message::assistant("Roger: are you there"));
}

TEST_F(ChatSessionTest, TurnsOnOneConversationDoNotInterleave) {
    auto cid = store_.create("spy-7");
    ASSERT_FALSE(is_error(cid));
    const std::string id = get_value(cid);
    llm_.delay = std::chrono::milliseconds(50);

    std::thread a([this, &id] { session_.handle(request("first", id)); });
    std::thread b([this, &id] { session_.handle(request("second", id)); });
    a.join();
    b.join();

    EXPECT_FALSE(llm_.overlapped.load());
    auto log = store_.get(id);
    ASSERT_FALSE(is_error(log));
    auto& msgs = get_value(log).messages;
    ASSERT_EQ(msgs.size(), 4u);
    for (size_t i = 0; i < msgs.size(); i += 2) {
        EXPECT_EQ(msgs[i].role, Role::user);
        EXPECT_EQ(msgs[i + 1], Message::assistant("Roger: " + msgs[i].text()));
    }
}

TEST_F(ChatSessionTest, MissingMissionIsLookedUpOnce) {
    for (int turn = 0; turn < 2; turn++) {
        auto reply = session_.handle(request("tell me about mission atlas-9"));
        ASSERT_FALSE(is_error(reply));
        EXPECT_EQ(get_value(reply).outcome.state, TurnState::done);
        EXPECT_EQ(get_value(reply).envelope["tool_calls"].size(), 1u);
        EXPECT_NE(get_value(reply).outcome.response_text.find("No mission found with ID: atlas-9"),
                  std::string::npos);
    }
    EXPECT_EQ(missions_.reads.load(), 1);
}

}  // namespace
