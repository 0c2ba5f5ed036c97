#include <catch2/catch_test_macros.hpp>

#include "infrastructure/export/DeviceExporter.hpp"

using namespace openfing::core;
using namespace openfing::infra;

namespace {

DiscoveryReport sampleReport() {
    DiscoveryReport report;
    report.method = ScanMethod::FullScan;
    report.deepScan = true;

    Device router;
    router.ip = "192.168.1.1";
    router.mac = "E8:EA:4D:1D:3A:45";
    router.vendor = "Huawei";
    router.hostname = "router.lan";
    router.openPorts = "SSH,HTTP";

    Device unknown;
    unknown.ip = "192.168.1.9";

    report.devices = {router, unknown};
    return report;
}

} // namespace

TEST_CASE("DeviceExporter::toJson", "[DeviceExporter]") {
    auto j = DeviceExporter::toJson(sampleReport());

    REQUIRE(j["scan_method"] == "arp-scan (full scan)");
    REQUIRE(j["deep_scan"] == true);
    REQUIRE(j["device_count"] == 2);
    REQUIRE(j["devices"].size() == 2);

    const auto& first = j["devices"][0];
    REQUIRE(first["ip"] == "192.168.1.1");
    REQUIRE(first["mac"] == "E8:EA:4D:1D:3A:45");
    REQUIRE(first["vendor"] == "Huawei");
    REQUIRE(first["hostname"] == "router.lan");
    REQUIRE(first["open_ports"] == "SSH,HTTP");
    REQUIRE(first["category"] == "Android/Mobile");

    const auto& second = j["devices"][1];
    REQUIRE(second["mac"] == "unknown");
    REQUIRE(second["hostname"] == "?");
    REQUIRE(second["category"] == "Other/Unknown");

    REQUIRE(j["categories"]["Android/Mobile"] == 1);
    REQUIRE(j["categories"]["Other/Unknown"] == 1);
}

TEST_CASE("DeviceExporter::exportToJson", "[DeviceExporter]") {
    SECTION("Empty report") {
        auto text = DeviceExporter::exportToJson(DiscoveryReport{});
        auto j = nlohmann::json::parse(text);

        REQUIRE(j["device_count"] == 0);
        REQUIRE(j["devices"].is_array());
        REQUIRE(j["devices"].empty());
        REQUIRE(j["scan_method"] == "none");
    }

    SECTION("Output parses back to the same document") {
        auto report = sampleReport();
        REQUIRE(nlohmann::json::parse(DeviceExporter::exportToJson(report)) ==
                DeviceExporter::toJson(report));
    }
}

TEST_CASE("DeviceExporter::toCsv", "[DeviceExporter]") {
    auto csv = DeviceExporter::toCsv(sampleReport().devices);

    REQUIRE(csv == "ip,mac,vendor,hostname,open_ports,category\n"
                   "192.168.1.1,E8:EA:4D:1D:3A:45,Huawei,router.lan,\"SSH,HTTP\",Android/Mobile\n"
                   "192.168.1.9,unknown,Unknown,?,,Other/Unknown\n");

    SECTION("Header only for no devices") {
        REQUIRE(DeviceExporter::toCsv({}) == "ip,mac,vendor,hostname,open_ports,category\n");
    }
}

TEST_CASE("DeviceExporter::escapeCsvField", "[DeviceExporter]") {
    REQUIRE(DeviceExporter::escapeCsvField("plain") == "plain");
    REQUIRE(DeviceExporter::escapeCsvField("Apple, Inc.") == "\"Apple, Inc.\"");
    REQUIRE(DeviceExporter::escapeCsvField("say \"hi\"") == "\"say \"\"hi\"\"\"");
    REQUIRE(DeviceExporter::escapeCsvField("") == "");
}
