#include "bulbs/core/Command.hpp"
#include "bulbs/core/DeviceAddress.hpp"
#include "bulbs/core/DeviceState.hpp"
#include "bulbs/core/Error.hpp"
#include "bulbs/core/Rgb.hpp"

#include "support/TestAssert.hpp"

#include <set>
#include <string>
#include <vector>

using namespace bulbs::core;

static void testParseForms() {
    auto plain = DeviceAddress::parse("192.168.1.20");
    ASSERT_TRUE(plain.has_value(), "plain IPv4 parses");
    ASSERT_EQ(plain->host(), std::string("192.168.1.20"), "plain host");
    ASSERT_EQ(plain->port(), 80, "default port");

    auto withPort = DeviceAddress::parse("bulb-kitchen.local:8080");
    ASSERT_TRUE(withPort.has_value(), "host:port parses");
    ASSERT_EQ(withPort->host(), std::string("bulb-kitchen.local"), "named host");
    ASSERT_EQ(withPort->port(), 8080, "explicit port");

    auto url = DeviceAddress::parse("http://10.0.0.7:81/description.xml");
    ASSERT_TRUE(url.has_value(), "URL parses");
    ASSERT_EQ(url->host(), std::string("10.0.0.7"), "URL host");
    ASSERT_EQ(url->port(), 81, "URL port");

    auto v6 = DeviceAddress::parse("[fe80::1]:8080");
    ASSERT_TRUE(v6.has_value(), "bracketed IPv6 parses");
    ASSERT_EQ(v6->host(), std::string("fe80::1"), "IPv6 host");
    ASSERT_EQ(v6->toString(), std::string("[fe80::1]:8080"), "IPv6 text keeps brackets");
}

static void testParseRejects() {
    for (const char* bad : {"", ":80", "10.0.0.1:", "10.0.0.1:0", "10.0.0.1:70000",
                            "10.0.0.1:http", "[fe80::1"}) {
        auto parsed = DeviceAddress::parse(bad);
        ASSERT_TRUE(!parsed, bad);
        if (!parsed) {
            ASSERT_TRUE(parsed.error() == errc::invalid_command, "reported as invalid_command");
        }
    }
}

static void testEqualityAndText() {
    DeviceAddress a("10.0.0.5");
    DeviceAddress b("10.0.0.5", 80);
    DeviceAddress c("10.0.0.5", 8080);
    ASSERT_TRUE(a == b, "default port equals explicit 80");
    ASSERT_TRUE(a != c, "port is part of identity");
    ASSERT_EQ(a.toString(), std::string("10.0.0.5"), "default port omitted");
    ASSERT_EQ(c.toString(), std::string("10.0.0.5:8080"), "other port shown");
}

static void testNumericOrdering() {
    std::set<DeviceAddress> ordered{
        DeviceAddress("bulb.local"),
        DeviceAddress("10.0.0.10"),
        DeviceAddress("10.0.0.9"),
        DeviceAddress("9.255.255.255"),
    };
    std::vector<std::string> text;
    for (const auto& address : ordered) {
        text.push_back(address.toString());
    }
    ASSERT_EQ(text.size(), static_cast<std::size_t>(4), "four distinct addresses");
    ASSERT_EQ(text[0], std::string("9.255.255.255"), "numeric, not lexical");
    ASSERT_EQ(text[1], std::string("10.0.0.9"), "10.0.0.9 before 10.0.0.10");
    ASSERT_EQ(text[2], std::string("10.0.0.10"), "10.0.0.10 third");
    ASSERT_EQ(text[3], std::string("bulb.local"), "names after IPv4");

    std::set<DeviceAddress> dupes{DeviceAddress("10.0.0.1"), DeviceAddress("10.0.0.1", 80)};
    ASSERT_EQ(dupes.size(), static_cast<std::size_t>(1), "duplicates collapse");
}

static void testColor() {
    auto red = Rgb::parse("#ff0000");
    ASSERT_TRUE(red.has_value(), "#ff0000 parses");
    ASSERT_EQ(static_cast<int>(red->r), 255, "red channel");
    ASSERT_EQ(red->toString(), std::string("#FF0000"), "upper-case text");
    ASSERT_EQ(red->toHex(), std::string("FF0000"), "hex without #");

    auto bare = Rgb::parse("00a1B2");
    ASSERT_TRUE(bare.has_value(), "no leading # is fine");
    ASSERT_EQ(static_cast<int>(bare->b), 0xB2, "blue channel");

    for (const char* bad : {"", "#FFF", "#GG0000", "#FF00000", "FF 000"}) {
        ASSERT_TRUE(!Rgb::parse(bad), bad);
    }
}

static void testBrightness() {
    ASSERT_TRUE(Brightness::make(0).has_value(), "0 accepted");
    ASSERT_TRUE(Brightness::make(100).has_value(), "100 accepted");
    ASSERT_TRUE(!Brightness::make(-1), "-1 rejected");
    ASSERT_TRUE(!Brightness::make(101), "101 rejected");

    auto fromWire = Brightness::fromFraction(0.8);
    ASSERT_TRUE(fromWire.has_value(), "0.8 accepted");
    ASSERT_EQ(fromWire->value(), 80, "0.8 -> 80");
    ASSERT_TRUE(!Brightness::fromFraction(1.5), "1.5 rejected");
    ASSERT_TRUE(!Brightness::fromFraction(-0.1), "-0.1 rejected");
}

static void testCommandMake() {
    auto empty = Command::make(SetPower{true}, {});
    ASSERT_TRUE(!empty, "empty target set rejected");
    if (!empty) {
        ASSERT_TRUE(empty.error() == errc::invalid_command, "invalid_command");
    }

    auto ok = Command::make(Toggle{}, {DeviceAddress("10.0.0.1"), DeviceAddress("10.0.0.1")});
    ASSERT_TRUE(ok.has_value(), "non-empty set accepted");
    ASSERT_EQ(ok->targets.size(), static_cast<std::size_t>(1), "targets deduplicated");
    ASSERT_EQ(describe(ok->operation), std::string("toggle"), "describe toggle");
    ASSERT_EQ(describe(SetColor{*Rgb::parse("#00FF00")}), std::string("color #00FF00"), "describe color");
}

int main() {
    testParseForms();
    testParseRejects();
    testEqualityAndText();
    testNumericOrdering();
    testColor();
    testBrightness();
    testCommandMake();
    return finishTests("DeviceAddress");
}
