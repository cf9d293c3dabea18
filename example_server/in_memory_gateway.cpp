// Core API - everything you always need
#include "devicelink/devicelink.hpp"
#include "devicelink/core/util/logger.hpp"

// Other standard libraries
#include <chrono>
#include <format>
#include <iostream>
#include <string>

using namespace devicelink;

namespace {

    std::string bodyText(const Message& m) {
        return std::string(m.body().begin(), m.body().end());
    }

    // Stands in for the protocol layer: prints what would go on the wire.
    class PrintingLink : public ISendingLink {
    public:
        PrintingLink(LinkType type, std::string cid = "")
            : type_(type), cid_(std::move(cid)) {}

        LinkType type() const override { return type_; }
        const std::string& correlationId() const override { return cid_; }

        void close(std::chrono::milliseconds timeout) override {
            std::cout << std::format("  [{}] closed (timeout {} ms)\n", toString(type_), timeout.count());
        }

        void sendMessage(Message message) override {
            std::cout << std::format("  [{}] -> '{}'", toString(type_), bodyText(message));
            for (auto& [k, v] : message.systemProperties())
                std::cout << std::format(" {}={}", k, v);
            for (auto& [k, v] : message.properties())
                std::cout << std::format(" {}={}", k, v);
            std::cout << '\n';
        }

    private:
        LinkType    type_;
        std::string cid_;
    };

    class PrintingConnection : public IClientConnection {
    public:
        void close() override { std::cout << "  physical connection closed\n"; }
    };

    // Minimal cloud-side session: pushes a few messages through the proxy.
    class DemoSession : public IDeviceSession {
    public:
        void bindProxy(std::shared_ptr<IDeviceProxy> proxy) override { proxy_ = std::move(proxy); }

        void close() override {
            if (proxy_) proxy_->close(nullptr);
        }

        IDeviceProxy& proxy() { return *proxy_; }

    private:
        std::shared_ptr<IDeviceProxy> proxy_;
    };

    class DemoSessionProvider : public ISessionProvider {
    public:
        std::shared_ptr<IDeviceSession> createSession(const ClientIdentity& identity) override {
            std::cout << "  session created for " << identity.id() << '\n';
            return std::make_shared<DemoSession>();
        }
    };

    Message text(const std::string& s) {
        return Message(std::vector<uint8_t>(s.begin(), s.end()));
    }

}

int main() {
    Logger::inst().setLevel(LogLevel::Debug);

    ConnectionOptions opts;
    opts.linkCloseTimeout = std::chrono::seconds(5);

    DemoSessionProvider provider;
    ConnectionHandlerManager handlers(provider, std::make_shared<PrintingConnection>(), opts);

    auto handler = handlers.getOrCreate(ClientIdentity::module("edge device", "filter"));
    auto session = std::static_pointer_cast<DemoSession>(handler->getSession());

    std::cout << "== attach links\n";
    auto c2d = std::make_shared<PrintingLink>(LinkType::C2D);
    auto messages = std::make_shared<PrintingLink>(LinkType::ModuleMessages);
    auto methodSending = std::make_shared<PrintingLink>(LinkType::MethodSending, "m-1");
    auto methodReceiving = std::make_shared<PrintingLink>(LinkType::MethodReceiving, "m-1");
    auto twinSending = std::make_shared<PrintingLink>(LinkType::TwinSending, "t-1");
    for (auto& l : { std::shared_ptr<ILink>(c2d), std::shared_ptr<ILink>(messages),
                     std::shared_ptr<ILink>(methodSending), std::shared_ptr<ILink>(methodReceiving),
                     std::shared_ptr<ILink>(twinSending) }) {
        handler->registerLink(l);
    }

    std::cout << "== outbound traffic\n";
    IDeviceProxy& proxy = session->proxy();
    proxy.sendC2DMessage(text("hello device"));
    proxy.sendMessage(text("temperature=21"), "input1");
    auto resp = proxy.invokeMethod({ "reboot", "req-7", {} });
    std::cout << "  invokeMethod placeholder for cid " << resp.correlationId() << '\n';
    proxy.onDesiredPropertyUpdates(text("{\"interval\":30}"));
    proxy.sendTwinUpdate(text("{\"reported\":{}}"));

    std::cout << "== method receiving link reattaches with a new correlation id\n";
    auto methodReceiving2 = std::make_shared<PrintingLink>(LinkType::MethodReceiving, "m-2");
    handler->registerLink(methodReceiving2);
    proxy.invokeMethod({ "reboot", "req-8", {} });

    std::cout << "== detach everything\n";
    for (auto& l : { std::shared_ptr<ILink>(c2d), std::shared_ptr<ILink>(messages),
                     std::shared_ptr<ILink>(methodReceiving2), std::shared_ptr<ILink>(twinSending) }) {
        handler->removeLink(l);
    }
    std::cout << "  proxy active: " << std::boolalpha << proxy.isActive() << '\n';

    handlers.remove(handler->identity());
    return 0;
}
