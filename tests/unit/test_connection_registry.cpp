#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "connection_registry.hpp"

namespace {

using spychat::ConnectionRegistry;
using spychat::ConnectionState;
using spychat::Transport;

class RecordingTransport : public Transport {
public:
    bool send(const nlohmann::json& envelope) override {
        if (on_send) on_send();
        if (fail) throw std::runtime_error("socket reset");
        std::lock_guard<std::mutex> lock(mutex_);
        received_.push_back(envelope);
        return true;
    }

    void close() override { closes++; }

    std::vector<nlohmann::json> received() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return received_;
    }

    std::function<void()> on_send;
    bool fail = false;
    std::atomic<int> closes{0};

private:
    mutable std::mutex mutex_;
    std::vector<nlohmann::json> received_;
};

nlohmann::json envelope(const std::string& text) {
    return {{"type", "response"}, {"response", text}};
}

TEST(ConnectionRegistryTest, ConnectOpensAndIndexes) {
    ConnectionRegistry registry;
    auto t = std::make_shared<RecordingTransport>();
    auto id = registry.connect(t, "spy-7", "c1");

    EXPECT_EQ(registry.state(id), ConnectionState::open);
    EXPECT_EQ(registry.connection_count(), 1u);
    EXPECT_EQ(registry.persona_bucket_count(), 1u);
    EXPECT_EQ(registry.conversation_bucket_count(), 1u);
    EXPECT_EQ(registry.conversation_of(id).value_or(""), "c1");
    EXPECT_EQ(registry.persona_of(id).value_or(""), "spy-7");
}

TEST(ConnectionRegistryTest, DisconnectIsIdempotentAndErasesBuckets) {
    ConnectionRegistry registry;
    auto t = std::make_shared<RecordingTransport>();
    auto id = registry.connect(t, "spy-7", "c1");

    registry.disconnect(id);
    registry.disconnect(id);

    EXPECT_EQ(registry.state(id), ConnectionState::closed);
    EXPECT_EQ(registry.connection_count(), 0u);
    EXPECT_EQ(registry.persona_bucket_count(), 0u);
    EXPECT_EQ(registry.conversation_bucket_count(), 0u);
    EXPECT_EQ(t->closes.load(), 1);
}

TEST(ConnectionRegistryTest, SendToClosedConnectionIsSilentNoOp) {
    ConnectionRegistry registry;
    auto t = std::make_shared<RecordingTransport>();
    auto id = registry.connect(t);

    EXPECT_TRUE(registry.send_to(id, envelope("one")));
    registry.disconnect(id);
    EXPECT_FALSE(registry.send_to(id, envelope("two")));
    EXPECT_FALSE(registry.send_to("never-existed", envelope("three")));
    EXPECT_EQ(t->received().size(), 1u);
}

TEST(ConnectionRegistryTest, BroadcastsReachOnlyTheirIndex) {
    ConnectionRegistry registry;
    auto a = std::make_shared<RecordingTransport>();
    auto b = std::make_shared<RecordingTransport>();
    auto c = std::make_shared<RecordingTransport>();
    registry.connect(a, "spy-7", "c1");
    registry.connect(b, "spy-7", "c2");
    registry.connect(c, "spy-8", "c1");

    EXPECT_EQ(registry.broadcast_to_persona("spy-7", envelope("p")), 2u);
    EXPECT_EQ(registry.broadcast_to_conversation("c1", envelope("c")), 2u);
    EXPECT_EQ(registry.broadcast_to_conversation("nobody", envelope("x")), 0u);
    EXPECT_EQ(registry.broadcast(envelope("all")), 3u);

    EXPECT_EQ(a->received().size(), 3u);
    EXPECT_EQ(b->received().size(), 2u);
    EXPECT_EQ(c->received().size(), 2u);
}

TEST(ConnectionRegistryTest, DisconnectDuringBroadcastStillDeliversToOthers) {
    ConnectionRegistry registry;
    auto a = std::make_shared<RecordingTransport>();
    auto b = std::make_shared<RecordingTransport>();
    std::string id_a = registry.connect(a, "spy-7", "c1");
    std::string id_b = registry.connect(b, "spy-7", "c1");

    // B was open at snapshot time, so it still gets the envelope even when
    // the send to A disconnects it first.
    a->on_send = [&registry, &id_b] { registry.disconnect(id_b); };

    registry.broadcast_to_conversation("c1", envelope("m"));

    EXPECT_EQ(a->received().size(), 1u);
    EXPECT_EQ(b->received().size(), 1u);
    EXPECT_EQ(registry.state(id_a), ConnectionState::open);
    EXPECT_EQ(registry.state(id_b), ConnectionState::closed);
}

TEST(ConnectionRegistryTest, ThrowingTransportIsDisconnected) {
    ConnectionRegistry registry;
    auto bad = std::make_shared<RecordingTransport>();
    auto good = std::make_shared<RecordingTransport>();
    bad->fail = true;
    auto bad_id = registry.connect(bad, "spy-7", "c1");
    registry.connect(good, "spy-7", "c1");

    EXPECT_EQ(registry.broadcast_to_conversation("c1", envelope("m")), 1u);
    EXPECT_EQ(registry.state(bad_id), ConnectionState::closed);
    EXPECT_EQ(good->received().size(), 1u);
    EXPECT_EQ(registry.connection_count(), 1u);
}

TEST(ConnectionRegistryTest, ConcurrentChurnLeavesNoBuckets) {
    ConnectionRegistry registry;
    std::atomic<bool> stop{false};

    std::thread broadcaster([&] {
        while (!stop) registry.broadcast_to_conversation("c1", envelope("tick"));
    });

    std::vector<std::thread> workers;
    for (int w = 0; w < 4; w++) {
        workers.emplace_back([&registry, w] {
            for (int i = 0; i < 200; i++) {
                auto t = std::make_shared<RecordingTransport>();
                auto id = registry.connect(t, "spy-" + std::to_string(w), "c1");
                registry.disconnect(id);
            }
        });
    }
    for (auto& t : workers) t.join();
    stop = true;
    broadcaster.join();

    EXPECT_EQ(registry.connection_count(), 0u);
    EXPECT_EQ(registry.persona_bucket_count(), 0u);
    EXPECT_EQ(registry.conversation_bucket_count(), 0u);
}

}  // namespace
