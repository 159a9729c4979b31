// rhost_scene SceneEvents and ClientManager tests

#include <catch2/catch_test_macros.hpp>
#include <rhost/scene/client.hpp>
#include <rhost/scene/events.hpp>

#include <stdexcept>
#include <string>
#include <vector>

using namespace rhost_scene;

// =============================================================================
// SceneEvents
// =============================================================================

TEST_CASE("SceneEvents restart with no observers", "[scene][events]") {
    SceneEvents events;
    REQUIRE(events.trigger_restart(RegionInfo::create("Sandbox", 1000, 1000)) == 0);
    REQUIRE(events.trigger_shutdown() == 0);
}

TEST_CASE("SceneEvents delivers in registration order", "[scene][events]") {
    SceneEvents events;
    std::vector<std::string> order;

    auto a = events.on_restart([&order](const RegionInfo& info) { order.push_back("a:" + info.region_name); });
    auto b = events.on_restart([&order](const RegionInfo& info) { order.push_back("b:" + info.region_name); });

    REQUIRE(a.is_valid());
    REQUIRE(b.is_valid());
    REQUIRE_FALSE(a == b);
    REQUIRE(events.restart_observer_count() == 2);

    REQUIRE(events.trigger_restart(RegionInfo::create("Sandbox", 1000, 1000)) == 2);
    REQUIRE(order == std::vector<std::string>{"a:Sandbox", "b:Sandbox"});
}

TEST_CASE("SceneEvents unsubscribe", "[scene][events]") {
    SceneEvents events;
    int restarts = 0;
    int shutdowns = 0;

    auto restart_id = events.on_restart([&restarts](const RegionInfo&) { ++restarts; });
    auto shutdown_id = events.on_shutdown([&shutdowns]() { ++shutdowns; });

    REQUIRE(events.unsubscribe(restart_id));
    REQUIRE(events.unsubscribe(shutdown_id));
    REQUIRE_FALSE(events.unsubscribe(restart_id));
    REQUIRE_FALSE(events.unsubscribe(SubscriptionId{}));

    events.trigger_restart(RegionInfo{});
    events.trigger_shutdown();
    REQUIRE(restarts == 0);
    REQUIRE(shutdowns == 0);
}

TEST_CASE("SceneEvents observer may subscribe during delivery", "[scene][events]") {
    SceneEvents events;
    int late_calls = 0;

    auto id = events.on_shutdown([&]() {
        (void)events.on_shutdown([&late_calls]() { ++late_calls; });
    });
    REQUIRE(id.is_valid());

    REQUIRE(events.trigger_shutdown() == 1);
    REQUIRE(late_calls == 0);
    REQUIRE(events.shutdown_observer_count() == 2);
}

TEST_CASE("SceneEvents shutdown exception propagates", "[scene][events]") {
    SceneEvents events;
    (void)events.on_shutdown([]() { throw std::runtime_error("observer failed"); });

    REQUIRE_THROWS_AS(events.trigger_shutdown(), std::runtime_error);
}

// =============================================================================
// ClientManager
// =============================================================================

namespace {

class FakeClient : public IClientAPI {
public:
    FakeClient(std::uint32_t circuit, std::string agent)
        : m_circuit(circuit), m_agent(std::move(agent)) {}

    std::uint32_t circuit_code() const override { return m_circuit; }
    std::string agent_id() const override { return m_agent; }
    void send_layer_data(const std::vector<float>& heightmap) override { last_layer = heightmap; }

    std::vector<float> last_layer;

private:
    std::uint32_t m_circuit;
    std::string m_agent;
};

} // anonymous namespace

TEST_CASE("ClientManager tracks circuits", "[scene][clients]") {
    ClientManager clients;
    auto alice = std::make_shared<FakeClient>(100, "alice");

    REQUIRE(clients.add(alice));
    REQUIRE_FALSE(clients.add(std::make_shared<FakeClient>(100, "mallory")));
    REQUIRE_FALSE(clients.add(nullptr));
    REQUIRE(clients.add(std::make_shared<FakeClient>(101, "bob")));

    REQUIRE(clients.count() == 2);
    REQUIRE(clients.get(100) == alice);
    REQUIRE(clients.get(999) == nullptr);

    std::vector<std::string> agents;
    clients.for_each([&](IClientAPI& client) {
        agents.push_back(client.agent_id());
        clients.remove(client.circuit_code());
    });

    REQUIRE(agents == std::vector<std::string>{"alice", "bob"});
    REQUIRE(clients.count() == 0);
    REQUIRE_FALSE(clients.remove(100));
}
