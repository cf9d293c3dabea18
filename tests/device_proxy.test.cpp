#include <catch2/catch_all.hpp>
#include "devicelink/core/connection/connection_handler.hpp"
#include "mock_link.hpp"
#include <thread>
#include <vector>

using namespace devicelink;

namespace {

    struct ProxyFixture {
        explicit ProxyFixture(ClientIdentity id = ClientIdentity::device("d1"))
            : handler(std::make_shared<ConnectionHandler>(id, provider, connection))
        {
            handler->getSession();
            proxy = provider.last->proxy;
        }

        std::shared_ptr<MockLink> attach(LinkType type, const std::string& cid = "") {
            auto l = std::make_shared<MockLink>(type, cid);
            handler->registerLink(l);
            return l;
        }

        MockSessionProvider provider;
        std::shared_ptr<MockConnection> connection = std::make_shared<MockConnection>();
        std::shared_ptr<ConnectionHandler> handler;
        std::shared_ptr<IDeviceProxy> proxy;
    };

    Message text(const std::string& s) {
        return Message(std::vector<uint8_t>(s.begin(), s.end()));
    }

}

// ------------------------------------------------------------------
// Outbound routing
// ------------------------------------------------------------------
TEST_CASE("C2D messages are stamped with the device address", "[proxy][c2d]") {
    ProxyFixture f;
    auto c2d = f.attach(LinkType::C2D);

    f.proxy->sendC2DMessage(text("hello"));

    auto sent = c2d->sent();
    REQUIRE(sent.size() == 1);
    REQUIRE(sent[0].systemProperties().at(SystemProperties::To) == "/devices/d1");
    REQUIRE(sent[0].body() == text("hello").body());
}

TEST_CASE("C2D messages to a module carry the module address", "[proxy][c2d]") {
    ProxyFixture f(ClientIdentity::module("d1", "m1"));
    auto c2d = f.attach(LinkType::C2D);

    f.proxy->sendC2DMessage(Message{});

    REQUIRE(c2d->sent().at(0).systemProperties().at(SystemProperties::To) == "/devices/d1/modules/m1");
}

TEST_CASE("C2D address segments are percent-encoded", "[proxy][c2d]") {
    ProxyFixture f(ClientIdentity::module("dev 1", "mod#1"));
    auto c2d = f.attach(LinkType::C2D);

    f.proxy->sendC2DMessage(Message{});

    REQUIRE(c2d->sent().at(0).systemProperties().at(SystemProperties::To) == "/devices/dev%201/modules/mod%231");
}

TEST_CASE("Module messages carry the input name", "[proxy][module]") {
    ProxyFixture f(ClientIdentity::module("d1", "m1"));
    auto ml = f.attach(LinkType::ModuleMessages);

    f.proxy->sendMessage(text("t"), "input1");

    auto sent = ml->sent();
    REQUIRE(sent.size() == 1);
    REQUIRE(sent[0].systemProperties().at(SystemProperties::InputName) == "input1");
}

TEST_CASE("invokeMethod() sends the request and returns a placeholder", "[proxy][method]") {
    ProxyFixture f;
    auto ms = f.attach(LinkType::MethodSending, "c");

    DirectMethodRequest req{ "reboot", "r-42", { 1, 2, 3 } };
    auto resp = f.proxy->invokeMethod(req);

    auto sent = ms->sent();
    REQUIRE(sent.size() == 1);
    REQUIRE(sent[0].properties().at(MethodNamePropertyKey) == "reboot");
    REQUIRE(sent[0].systemProperties().at(SystemProperties::CorrelationId) == "r-42");
    REQUIRE((sent[0].body() == std::vector<uint8_t>{ 1, 2, 3 }));

    REQUIRE(resp.correlationId() == "r-42");
    REQUIRE_FALSE(resp.hasResult());
    try {
        (void)resp.status();
        FAIL("placeholder response must not expose a status");
    }
    catch (const GatewayError& e) {
        REQUIRE(e.code() == GatewayErr::NotSupported);
    }
    REQUIRE_THROWS_AS(resp.data(), GatewayError);
}

TEST_CASE("Twin pushes go to the TwinSending link", "[proxy][twin]") {
    ProxyFixture f;
    auto ts = f.attach(LinkType::TwinSending, "t");

    f.proxy->onDesiredPropertyUpdates(text("desired"));
    f.proxy->sendTwinUpdate(text("twin"));

    auto sent = ts->sent();
    REQUIRE(sent.size() == 2);
    REQUIRE(sent[0].body() == text("desired").body());
    REQUIRE(sent[1].body() == text("twin").body());
}

TEST_CASE("Sends without a link are dropped", "[proxy][drop]") {
    ProxyFixture f;
    auto events = f.attach(LinkType::Events);
    auto tr = f.attach(LinkType::TwinReceiving, "t");

    REQUIRE_NOTHROW(f.proxy->sendC2DMessage(text("x")));
    REQUIRE_NOTHROW(f.proxy->sendMessage(text("x"), "in"));
    REQUIRE_NOTHROW(f.proxy->onDesiredPropertyUpdates(text("x")));
    REQUIRE_NOTHROW(f.proxy->sendTwinUpdate(text("x")));

    DirectMethodRequest req{ "m", "c", {} };
    DirectMethodResponse resp;
    REQUIRE_NOTHROW(resp = f.proxy->invokeMethod(req));
    REQUIRE(resp.correlationId().empty());
    REQUIRE_FALSE(resp.hasResult());

    REQUIRE(f.handler->linkCount() == 2);
    REQUIRE(events->sent().empty());
    REQUIRE(tr->sent().empty());
    REQUIRE(f.connection->closeCount == 0);
}

TEST_CASE("Proxy drops messages once its handler is released", "[proxy][drop]") {
    ProxyFixture f;
    f.attach(LinkType::C2D);
    f.handler.reset();

    REQUIRE_NOTHROW(f.proxy->sendC2DMessage(text("late")));
    REQUIRE_NOTHROW(f.proxy->close(nullptr));
    REQUIRE_FALSE(f.proxy->isActive());
    REQUIRE(f.connection->closeCount == 0);
}

// ------------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------------
TEST_CASE("Concurrent proxy closes close the connection once", "[proxy][close][concurrency]") {
    ProxyFixture f;
    std::vector<std::thread> threads;
    for (int i = 0; i < 5; ++i) {
        threads.emplace_back([&] {
            f.proxy->close(std::make_exception_ptr(std::runtime_error("link lost")));
        });
    }
    for (auto& t : threads) t.join();

    REQUIRE_FALSE(f.proxy->isActive());
    REQUIRE(f.connection->closeCount == 1);
}

TEST_CASE("setInactive() does not close the connection", "[proxy][close]") {
    ProxyFixture f;
    f.proxy->setInactive();

    REQUIRE_FALSE(f.proxy->isActive());
    REQUIRE(f.connection->closeCount == 0);

    // an inactive proxy still routes
    auto c2d = f.attach(LinkType::C2D);
    f.proxy->sendC2DMessage(Message{});
    REQUIRE(c2d->sent().size() == 1);
}

TEST_CASE("getUpdatedIdentity() is not supported", "[proxy]") {
    ProxyFixture f;
    REQUIRE(f.proxy->identity() == ClientIdentity::device("d1"));
    REQUIRE_THROWS_AS(f.proxy->getUpdatedIdentity(), GatewayError);
}
