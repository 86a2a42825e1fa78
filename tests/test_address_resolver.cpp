#include "bulbs/core/AddressResolver.hpp"

#include "support/TestAssert.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace bulbs::core;
using namespace std::chrono_literals;

namespace {

// UDP responder on loopback: answers each probe with the configured replies,
// optionally after a delay.
class FakeResponder {
public:
    explicit FakeResponder(std::vector<std::string> replies,
                           std::chrono::milliseconds delay = std::chrono::milliseconds(0))
    : replies_(std::move(replies))
    , delay_(delay) {
        fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        ::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        socklen_t len = sizeof(addr);
        ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);
        thread_ = std::thread([this]{ run(); });
    }

    ~FakeResponder() {
        running_.store(false);
        if (thread_.joinable()) {
            thread_.join();
        }
        ::close(fd_);
    }

    unsigned short port() const { return port_; }
    std::string probe() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return probe_;
    }

private:
    void run() {
        while (running_.load()) {
            pollfd pfd{fd_, POLLIN, 0};
            if (::poll(&pfd, 1, 50) <= 0) {
                continue;
            }
            char buf[1500];
            sockaddr_in from{};
            socklen_t fromLen = sizeof(from);
            auto n = ::recvfrom(fd_, buf, sizeof(buf), 0, reinterpret_cast<sockaddr*>(&from), &fromLen);
            if (n <= 0) {
                continue;
            }
            {
                std::lock_guard<std::mutex> lock(mutex_);
                probe_.assign(buf, static_cast<std::size_t>(n));
            }
            if (delay_.count() > 0) {
                std::this_thread::sleep_for(delay_);
            }
            for (const auto& reply : replies_) {
                ::sendto(fd_, reply.data(), reply.size(), 0,
                         reinterpret_cast<sockaddr*>(&from), fromLen);
            }
        }
    }

    std::vector<std::string> replies_;
    std::chrono::milliseconds delay_;
    mutable std::mutex mutex_;
    std::string probe_;
    int fd_ = -1;
    unsigned short port_ = 0;
    std::atomic<bool> running_{true};
    std::thread thread_;
};

AddressResolver::Options loopbackOptions(unsigned short port) {
    AddressResolver::Options options;
    options.probeHost = "127.0.0.1";
    options.probePort = port;
    return options;
}

std::string reply(const std::string& st, const std::string& location) {
    std::string text = "HTTP/1.1 200 OK\r\nCACHE-CONTROL: max-age=1800\r\nST: " + st + "\r\n";
    if (!location.empty()) {
        text += "LOCATION: " + location + "\r\n";
    }
    return text + "\r\n";
}

} // namespace

static void testParseReply() {
    AddressResolver resolver;
    const std::string st(config::DISCOVERY_SEARCH_TARGET);

    auto located = resolver.parseReply(reply(st, "http://192.168.1.40:8080/desc.xml"), "192.168.1.99");
    ASSERT_TRUE(located.has_value(), "reply with LOCATION accepted");
    if (located) {
        ASSERT_EQ(*located, DeviceAddress("192.168.1.40", 8080), "LOCATION wins over sender");
    }

    auto bare = resolver.parseReply(reply(st, ""), "192.168.1.41");
    ASSERT_TRUE(bare.has_value(), "reply without LOCATION accepted");
    if (bare) {
        ASSERT_EQ(*bare, DeviceAddress("192.168.1.41"), "sender address on the HTTP port");
    }

    ASSERT_TRUE(!resolver.parseReply(reply("urn:other:device:1", ""), "192.168.1.42"),
                "other search targets ignored");
    ASSERT_TRUE(!resolver.parseReply("M-SEARCH * HTTP/1.1\r\n\r\n", "192.168.1.43"),
                "other probes ignored");
    ASSERT_TRUE(!resolver.parseReply("HTTP/1.1 404 Not Found\r\n\r\n", "192.168.1.44"),
                "non-200 ignored");
}

static void testProbeMessage() {
    AddressResolver resolver;
    const auto probe = resolver.probeMessage();
    ASSERT_TRUE(probe.rfind("M-SEARCH * HTTP/1.1\r\n", 0) == 0, "M-SEARCH request line");
    ASSERT_TRUE(probe.find("MAN: \"ssdp:discover\"\r\n") != std::string::npos, "MAN header");
    ASSERT_TRUE(probe.find("MX: 1\r\n") != std::string::npos, "MX reply window");
    ASSERT_TRUE(probe.find(std::string("ST: ") + std::string(config::DISCOVERY_SEARCH_TARGET))
                    != std::string::npos, "search target");
    ASSERT_TRUE(probe.size() >= 4 && probe.substr(probe.size() - 4) == "\r\n\r\n", "blank line terminates");
}

static void testDiscoverOverLoopback() {
    const std::string st(config::DISCOVERY_SEARCH_TARGET);
    FakeResponder responder({
        reply(st, "http://127.0.0.1:8081/"),
        reply(st, "http://127.0.0.1:8081/"),   // duplicate
        reply("urn:other:device:1", "http://127.0.0.1:9999/"),
        reply(st, ""),
    });

    AddressResolver resolver(loopbackOptions(responder.port()));
    auto found = resolver.discover(1500ms);
    ASSERT_TRUE(found.has_value(), "discovery runs");
    if (found) {
        ASSERT_EQ(found->size(), static_cast<std::size_t>(2), "duplicates and strangers dropped");
        ASSERT_TRUE(found->count(DeviceAddress("127.0.0.1", 8081)) == 1, "LOCATION address found");
        ASSERT_TRUE(found->count(DeviceAddress("127.0.0.1")) == 1, "sender address found");
    }
    ASSERT_TRUE(responder.probe().rfind("M-SEARCH", 0) == 0, "responder saw the probe");
}

static void testSlowReplyWithinReplyWindow() {
    const std::string st(config::DISCOVERY_SEARCH_TARGET);
    FakeResponder responder({reply(st, "http://127.0.0.1:8082/")}, 400ms);

    AddressResolver resolver(loopbackOptions(responder.port()));
    auto found = resolver.discover(2000ms);
    ASSERT_TRUE(found.has_value(), "discovery runs");
    if (found) {
        ASSERT_TRUE(found->count(DeviceAddress("127.0.0.1", 8082)) == 1,
                    "reply held back past the quiescence window still counts");
    }
}

static void testSilenceIsEmptyNotError() {
    FakeResponder responder({});
    AddressResolver resolver(loopbackOptions(responder.port()));

    const auto started = std::chrono::steady_clock::now();
    auto found = resolver.discover(1500ms);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_TRUE(found.has_value(), "silence is not an error");
    if (found) {
        ASSERT_TRUE(found->empty(), "nothing found");
    }
    ASSERT_TRUE(elapsed >= 900ms, "waits out the reply window");
    ASSERT_TRUE(elapsed < 1400ms, "gives up once the reply window passes");
}

static void testBadProbeAddress() {
    AddressResolver::Options options;
    options.probeHost = "not-an-ip";
    AddressResolver resolver(options);
    auto found = resolver.discover(100ms);
    ASSERT_TRUE(!found, "unusable probe address reported");
}

int main() {
    testParseReply();
    testProbeMessage();
    testDiscoverOverLoopback();
    testSlowReplyWithinReplyWindow();
    testSilenceIsEmptyNotError();
    testBadProbeAddress();
    return finishTests("AddressResolver");
}
