#include <catch2/catch_all.hpp>
#include "devicelink/core/connection/connection_handler_manager.hpp"
#include "mock_link.hpp"
#include <algorithm>
#include <thread>
#include <vector>

using namespace devicelink;

TEST_CASE("getOrCreate() returns the same handler for equal identities", "[manager]") {
    MockSessionProvider provider;
    ConnectionHandlerManager mgr(provider, std::make_shared<MockConnection>());

    auto a = mgr.getOrCreate(ClientIdentity::device("d1"));
    auto b = mgr.getOrCreate(ClientIdentity::device("d1"));
    auto m = mgr.getOrCreate(ClientIdentity::module("d1", "m1"));

    REQUIRE(a == b);
    REQUIRE(a != m);
    REQUIRE(mgr.size() == 2);
    REQUIRE(m->identity() == ClientIdentity::module("d1", "m1"));
}

TEST_CASE("Concurrent getOrCreate() yields one handler", "[manager][concurrency]") {
    MockSessionProvider provider;
    ConnectionHandlerManager mgr(provider, std::make_shared<MockConnection>());

    constexpr int N = 16;
    std::vector<std::shared_ptr<ConnectionHandler>> seen(N);
    std::vector<std::thread> threads;
    for (int i = 0; i < N; ++i) {
        threads.emplace_back([&, i] { seen[i] = mgr.getOrCreate(ClientIdentity::device("d1")); });
    }
    for (auto& t : threads) t.join();

    REQUIRE(mgr.size() == 1);
    for (auto& h : seen) REQUIRE(h == seen.front());
}

TEST_CASE("find(), remove() and listIdentities()", "[manager]") {
    MockSessionProvider provider;
    ConnectionHandlerManager mgr(provider, std::make_shared<MockConnection>());

    REQUIRE(mgr.find(ClientIdentity::device("d1")) == nullptr);
    auto h = mgr.getOrCreate(ClientIdentity::device("d1"));
    mgr.getOrCreate(ClientIdentity::device("d2"));
    REQUIRE(mgr.find(ClientIdentity::device("d1")) == h);

    auto ids = mgr.listIdentities();
    REQUIRE(ids.size() == 2);
    REQUIRE(std::find(ids.begin(), ids.end(), ClientIdentity::device("d2")) != ids.end());

    mgr.remove(ClientIdentity::device("d1"));
    REQUIRE_NOTHROW(mgr.remove(ClientIdentity::device("unknown")));
    REQUIRE(mgr.find(ClientIdentity::device("d1")) == nullptr);
    REQUIRE(mgr.size() == 1);

    // a removed handler stays usable by whoever still holds it
    REQUIRE(h->getSession() != nullptr);
}

TEST_CASE("Handlers share the manager's connection", "[manager]") {
    MockSessionProvider provider;
    auto conn = std::make_shared<MockConnection>();
    ConnectionHandlerManager mgr(provider, conn);

    auto h = mgr.getOrCreate(ClientIdentity::device("d1"));
    h->getSession();
    auto l = std::make_shared<MockLink>(LinkType::C2D);
    h->registerLink(l);
    h->removeLink(l);

    REQUIRE(conn->closeCount == 1);
}

TEST_CASE("Manager rejects a null connection", "[manager][error]") {
    MockSessionProvider provider;
    REQUIRE_THROWS_AS(ConnectionHandlerManager(provider, nullptr), std::invalid_argument);
}
