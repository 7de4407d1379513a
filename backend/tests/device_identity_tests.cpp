#include <gtest/gtest.h>
#include "device/DeviceIdentity.hpp"
#include "core/DeviceError.hpp"

using namespace droidlink;

TEST(DeviceIdentity, LoopbackWithPortIsLocalEmulator) {
    auto id = parse_address("127.0.0.1:5555");
    EXPECT_EQ(id.serial, "127.0.0.1:5555");
    EXPECT_EQ(id.transport_kind, TransportKind::Local);
    ASSERT_TRUE(id.port.has_value());
    EXPECT_EQ(*id.port, 5555);
    EXPECT_TRUE(is_emulator(id));
    EXPECT_FALSE(is_network_device(id));
    EXPECT_EQ(id.emulator_family, EmulatorFamily::LDPlayer);
}

TEST(DeviceIdentity, EquivalentFormsNormalizeIdentically) {
    auto a = parse_address("127.0.0.1:16384");
    auto b = parse_address("16384");
    auto c = parse_address("127.0.0.1.16384");
    auto d = parse_address(" localhost:16384 ");
    auto e = parse_address("127.0.0.1\xEF\xBC\x9A" "16384");  // full-width colon
    EXPECT_EQ(a, b);
    EXPECT_EQ(a, c);
    EXPECT_EQ(a, d);
    EXPECT_EQ(a, e);
    EXPECT_EQ(a.emulator_family, EmulatorFamily::MuMu12);
}

TEST(DeviceIdentity, NetworkDefaultPortMatchesExplicitPort) {
    auto implicit = parse_address("192.168.1.20");
    auto explicit_port = parse_address("192.168.1.20:5555");
    EXPECT_EQ(implicit, explicit_port);
    EXPECT_EQ(implicit.transport_kind, TransportKind::Network);
    EXPECT_TRUE(is_network_device(implicit));
    EXPECT_FALSE(is_emulator(implicit));
    EXPECT_EQ(implicit.host(), "192.168.1.20");
}

TEST(DeviceIdentity, HttpAddress) {
    auto id = parse_address("http://192.168.1.30");
    EXPECT_EQ(id.transport_kind, TransportKind::Http);
    EXPECT_EQ(id.serial, "http://192.168.1.30:7912");
    EXPECT_EQ(id.host(), "192.168.1.30");
    EXPECT_TRUE(is_over_http(id));
    EXPECT_FALSE(is_emulator(id));

    auto same = parse_address("http://192.168.1.30:7912/");
    EXPECT_EQ(id, same);
}

TEST(DeviceIdentity, UsbSerialAndAvd) {
    auto usb = parse_address("R58M12ABCDE");
    EXPECT_EQ(usb.transport_kind, TransportKind::Local);
    EXPECT_FALSE(usb.emulator_family.has_value());
    EXPECT_FALSE(is_emulator(usb));
    EXPECT_EQ(device_type(usb), "USB");

    auto avd = parse_address("emulator-5554");
    EXPECT_EQ(avd.emulator_family, EmulatorFamily::AndroidVirtualDevice);
    EXPECT_TRUE(is_emulator(avd));
    EXPECT_EQ(avd.port, 5554);
}

TEST(DeviceIdentity, HostMarkerSelectsFamilyWithoutPort) {
    auto id = parse_address("nox");
    EXPECT_EQ(id.emulator_family, EmulatorFamily::Nox);
    EXPECT_FALSE(id.port.has_value());
    auto found = id.with_port(62001);
    EXPECT_EQ(found.serial, "127.0.0.1:62001");
    EXPECT_EQ(found.emulator_family, EmulatorFamily::Nox);
}

TEST(DeviceIdentity, EmbeddedLoopbackIsExtracted) {
    // "MuMu模拟器 127.0.0.1:7555"
    auto id = parse_address("MuMu\xE6\xA8\xA1\xE6\x8B\x9F\xE5\x99\xA8 127.0.0.1:7555");
    EXPECT_EQ(id.serial, "127.0.0.1:7555");
    EXPECT_EQ(id.emulator_family, EmulatorFamily::MuMuLegacy);
}

TEST(DeviceIdentity, RejectsMalformedAddresses) {
    EXPECT_THROW(parse_address(""), ParseError);
    EXPECT_THROW(parse_address("   "), ParseError);
    EXPECT_THROW(parse_address("127.0.0.1:70000"), ParseError);
    EXPECT_THROW(parse_address("127.0.0.1:abc"), ParseError);
    EXPECT_THROW(parse_address("a:b:c"), ParseError);
    EXPECT_THROW(parse_address("80"), ParseError);
    EXPECT_THROW(parse_address("dev$ice"), ParseError);
    try {
        parse_address("");
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.code(), errors::E1100_INVALID_FORMAT);
    }
}

TEST(DeviceIdentity, FamilyPortBands) {
    EXPECT_EQ(family_for_port(16384), EmulatorFamily::MuMu12);
    EXPECT_EQ(family_for_port(17408), EmulatorFamily::MuMu12);
    EXPECT_EQ(family_for_port(7555), EmulatorFamily::MuMuLegacy);
    EXPECT_EQ(family_for_port(62025), EmulatorFamily::Nox);
    EXPECT_EQ(family_for_port(5587), EmulatorFamily::LDPlayer);
    EXPECT_EQ(family_for_port(5667), EmulatorFamily::Vmos);
    EXPECT_FALSE(family_for_port(8080).has_value());
}

TEST(DeviceIdentity, CommonPortsAreDeterministic) {
    auto mumu = common_ports_for(EmulatorFamily::MuMu12);
    ASSERT_FALSE(mumu.empty());
    EXPECT_EQ(mumu.front(), 16384);
    EXPECT_EQ(mumu[1], 16416);
    EXPECT_EQ(common_ports_for(EmulatorFamily::MuMu12), mumu);

    auto nox = common_ports_for(EmulatorFamily::Nox);
    EXPECT_EQ(nox.front(), 62001);
    EXPECT_EQ(nox[1], 62025);

    auto generic = common_ports_for(EmulatorFamily::Generic);
    EXPECT_EQ(generic, (std::vector<uint16_t>{ 5555, 7555, 16384, 62001, 5565 }));
}

TEST(DeviceIdentity, ReviseSerialRepairsCommonTypos) {
    EXPECT_EQ(revise_serial("12127.0.0.1:16384"), "127.0.0.1:16384");
    EXPECT_EQ(revise_serial("auto127.0.0.1:16384"), "127.0.0.1:16384");
    EXPECT_EQ(revise_serial("127,0,0,1:5555"), "127.0.0.1:5555");
    EXPECT_EQ(revise_serial("127\xE3\x80\x82" "0.0.1:5555"), "127.0.0.1:5555");
    EXPECT_EQ(revise_serial("7555"), "127.0.0.1:7555");
}

TEST(DeviceIdentity, GenericLoopbackTakesFamilyOfFoundPort) {
    auto id = parse_address("127.0.0.1");
    EXPECT_EQ(id.emulator_family, EmulatorFamily::Generic);

    auto mumu = id.with_port(16384);
    EXPECT_EQ(mumu.serial, "127.0.0.1:16384");
    EXPECT_EQ(mumu.emulator_family, EmulatorFamily::MuMu12);
    EXPECT_EQ(device_type(mumu), "MuMu");

    // a port outside every band stays generic
    EXPECT_EQ(id.with_port(8080).emulator_family, EmulatorFamily::Generic);
    // an explicit family is never replaced
    EXPECT_EQ(parse_address("nox").with_port(16384).emulator_family, EmulatorFamily::Nox);
}

TEST(DeviceIdentity, WsaSerials) {
    auto wsa = parse_address("wsa-0");
    EXPECT_EQ(wsa.serial, "127.0.0.1:58526");
    EXPECT_EQ(wsa.emulator_family, EmulatorFamily::Wsa);
    EXPECT_TRUE(is_wsa(wsa));
    EXPECT_TRUE(is_emulator(wsa));
    EXPECT_EQ(device_type(wsa), "WSA");
    EXPECT_EQ(parse_address("WSA"), wsa);
    EXPECT_EQ(parse_address("127.0.0.1:58526").emulator_family, EmulatorFamily::Wsa);
    EXPECT_FALSE(is_wsa(parse_address("127.0.0.1:16384")));
}

TEST(DeviceIdentity, LocalNetworkDevices) {
    EXPECT_TRUE(is_local_network_device(parse_address("192.168.1.20")));
    EXPECT_TRUE(is_local_network_device(parse_address("192.168.0.5:5556")));
    EXPECT_FALSE(is_local_network_device(parse_address("10.0.0.9:5555")));
    EXPECT_FALSE(is_local_network_device(parse_address("127.0.0.1:5555")));
    EXPECT_FALSE(is_local_network_device(parse_address("http://192.168.1.30")));
}

TEST(DeviceIdentity, HttpSchemeIsKept) {
    auto plain = parse_address("http://192.168.1.30");
    auto tls = parse_address("https://agent.example.com:8443/");
    EXPECT_EQ(plain.scheme(), "http");
    EXPECT_EQ(tls.scheme(), "https");
    EXPECT_EQ(tls.serial, "https://agent.example.com:8443");
    EXPECT_EQ(tls.host(), "agent.example.com");
    EXPECT_EQ(parse_address("127.0.0.1:5555").scheme(), "");
}
