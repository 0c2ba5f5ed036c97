#include <catch2/catch_test_macros.hpp>

#include "core/discovery/DiscoveryEngine.hpp"

#include <map>
#include <set>

using namespace openfing::core;

namespace {

class FakeProbes : public IDiscoveryProbes {
public:
    std::string fullScan;
    std::string sweep;
    std::string cache;
    std::map<std::string, std::string> cacheEntries;
    std::string nameService;
    std::string serviceLocation;
    std::string netbios;
    std::string reachability;

    std::vector<std::string> calls;
    std::string lastInterface;
    std::string lastPrefix;
    std::vector<uint16_t> lastPorts;

    std::string runFullScan(const std::string& interfaceName) override {
        calls.push_back("fullScan");
        lastInterface = interfaceName;
        return fullScan;
    }

    std::string sweepAndReadCache(const std::string& subnetPrefix) override {
        calls.push_back("sweep");
        lastPrefix = subnetPrefix;
        return sweep;
    }

    std::string readAddressCache() override {
        calls.push_back("cache");
        return cache;
    }

    std::string lookupCacheEntry(const std::string& ip) override {
        auto it = cacheEntries.find(ip);
        return it != cacheEntries.end() ? it->second : "";
    }

    std::string nameServiceBrowse() override {
        calls.push_back("nameService");
        return nameService;
    }

    std::string serviceLocationQuery() override {
        calls.push_back("serviceLocation");
        return serviceLocation;
    }

    std::string nameQuery(const std::string& subnetPrefix) override {
        calls.push_back("nameQuery");
        lastPrefix = subnetPrefix;
        return netbios;
    }

    std::string portReachabilityProbe(const std::string& subnetPrefix,
                                      const std::vector<uint16_t>& ports) override {
        calls.push_back("reachability");
        lastPrefix = subnetPrefix;
        lastPorts = ports;
        return reachability;
    }
};

class FakeInspector : public IHostInspector {
public:
    std::map<std::string, std::string> names;
    std::set<std::pair<std::string, uint16_t>> openPorts;
    int lookups{0};

    std::string resolveHostname(const std::string& ip) override {
        ++lookups;
        auto it = names.find(ip);
        return it != names.end() ? it->second : "";
    }

    bool tcpConnect(const std::string& ip, uint16_t port) override {
        return openPorts.count({ip, port}) > 0;
    }
};

const std::string kSubnet = "192.168.1.0/24";

} // namespace

TEST_CASE("DiscoveryEngine privileged full scan", "[DiscoveryEngine]") {
    FakeProbes probes;
    FakeInspector inspector;
    DiscoveryEngine engine(probes, inspector, "en0");

    SECTION("Uses scan records when available") {
        probes.fullScan = "192.168.1.20\t4c:20:b8:db:d5:e8\tApple, Inc.\n"
                          "192.168.1.1\tE8:EA:4D:1D:3A:45\tHuawei\n";

        auto report = engine.run(kSubnet, true, true, false);

        REQUIRE(report.method == ScanMethod::FullScan);
        REQUIRE(probes.calls == std::vector<std::string>{"fullScan"});
        REQUIRE(probes.lastInterface == "en0");
        REQUIRE(report.devices.size() == 2);
        REQUIRE(report.devices[0].ip == "192.168.1.1");
        REQUIRE(report.devices[0].vendor == "Huawei");
        REQUIRE(report.devices[1].mac == "4C:20:B8:DB:D5:E8");
        REQUIRE(report.devices[1].vendor == "Apple, Inc.");
    }

    SECTION("Empty full scan falls back to the sweep") {
        probes.sweep = "? (192.168.1.7) at aa:bb:cc:dd:ee:07 on en0\n";

        auto report = engine.run(kSubnet, true, true, false);

        REQUIRE(report.method == ScanMethod::PingSweep);
        REQUIRE(probes.calls == std::vector<std::string>{"fullScan", "sweep"});
        REQUIRE(probes.lastPrefix == "192.168.1.");
        REQUIRE(report.devices.size() == 1);
    }

    SECTION("Missing tool goes straight to the sweep") {
        probes.sweep = "? (192.168.1.7) at aa:bb:cc:dd:ee:07 on en0\n";

        auto report = engine.run(kSubnet, true, false, false);

        REQUIRE(report.method == ScanMethod::PingSweep);
        REQUIRE(probes.calls == std::vector<std::string>{"sweep"});
    }

    SECTION("Unknown subnet reads the cache instead of sweeping") {
        probes.cache = "? (10.0.0.2) at aa:bb:cc:dd:ee:02 on en0\n";

        auto report = engine.run("", true, false, false);

        REQUIRE(probes.calls == std::vector<std::string>{"cache"});
        REQUIRE(report.devices.size() == 1);
    }
}

TEST_CASE("DiscoveryEngine unprivileged multi-method", "[DiscoveryEngine]") {
    FakeProbes probes;
    FakeInspector inspector;
    DiscoveryEngine engine(probes, inspector);

    SECTION("Runs every stage in order") {
        auto report = engine.run(kSubnet, false, true, false);

        REQUIRE(report.method == ScanMethod::MultiMethod);
        REQUIRE(probes.calls == std::vector<std::string>{"sweep", "nameService", "serviceLocation",
                                                         "nameQuery", "reachability"});
        REQUIRE(probes.lastPorts == std::vector<uint16_t>{22, 80, 443});
        REQUIRE(report.devices.empty());
    }

    SECTION("Later stages upgrade unknown MACs") {
        probes.netbios = "192.168.1.50\n"
                         "192.168.1.60\n";
        probes.reachability = "192.168.1.50:22\n"
                              "? (192.168.1.50) at e8:ea:4d:1d:3a:45 on en0\n";

        auto report = engine.run(kSubnet, false, false, false);

        REQUIRE(report.devices.size() == 2);
        REQUIRE(report.devices[0].ip == "192.168.1.50");
        REQUIRE(report.devices[0].mac == "E8:EA:4D:1D:3A:45");
        REQUIRE(report.devices[0].vendor == "Huawei");
        REQUIRE(report.devices[1].ip == "192.168.1.60");
        REQUIRE(report.devices[1].mac == "unknown");
    }

    SECTION("Targeted cache lookups supply MACs") {
        probes.serviceLocation = "LOCATION: http://192.168.1.40:49152/desc.xml\n";
        probes.cacheEntries["192.168.1.40"] =
            "192.168.1.40 ether 4c:20:b8:db:d5:e8 C eth0\n";

        auto report = engine.run(kSubnet, false, false, false);

        REQUIRE(report.devices.size() == 1);
        REQUIRE(report.devices[0].mac == "4C:20:B8:DB:D5:E8");
        REQUIRE(report.devices[0].vendor == "Apple");
    }

    SECTION("Unknown subnet skips the subnet-wide stages") {
        auto report = engine.run("", false, false, false);

        REQUIRE(probes.calls ==
                std::vector<std::string>{"cache", "nameService", "serviceLocation"});
        REQUIRE(report.devices.empty());
    }

    SECTION("No duplicate IPs across stages") {
        const std::string cacheLine = "? (192.168.1.9) at aa:bb:cc:dd:ee:09 on en0\n";
        probes.sweep = cacheLine;
        probes.nameService = cacheLine;
        probes.serviceLocation = "LOCATION: http://192.168.1.9/x.xml\n" + cacheLine;
        probes.netbios = "192.168.1.9\n" + cacheLine;
        probes.reachability = "192.168.1.9:80\n" + cacheLine;

        auto report = engine.run(kSubnet, false, false, false);

        REQUIRE(report.devices.size() == 1);
        REQUIRE(report.devices[0].mac == "AA:BB:CC:DD:EE:09");
    }

    SECTION("Broadcast and multicast never become devices") {
        probes.sweep = "? (192.168.1.255) at ff:ff:ff:ff:ff:ff on en0\n"
                       "? (239.1.1.1) at 1:0:5e:1:1:1 on en0\n"
                       "? (192.168.1.8) at 01:00:5e:00:00:01 on en0\n";
        probes.reachability = "239.1.1.1:80\n";

        REQUIRE(engine.discover(kSubnet, false, false, false).empty());
    }
}

TEST_CASE("DiscoveryEngine deep scan", "[DiscoveryEngine]") {
    FakeProbes probes;
    FakeInspector inspector;
    DiscoveryEngine engine(probes, inspector);
    probes.fullScan = "192.168.1.1\tE8:EA:4D:1D:3A:45\tHuawei\n";

    SECTION("Enriches when requested") {
        inspector.names["192.168.1.1"] = "router.lan.\n";
        inspector.openPorts = {{"192.168.1.1", 22}};

        auto devices = engine.discover(kSubnet, true, true, true);

        REQUIRE(devices.size() == 1);
        REQUIRE(devices[0].hostname == "router.lan");
        REQUIRE(devices[0].openPorts == "SSH");
    }

    SECTION("Skipped otherwise") {
        auto report = engine.run(kSubnet, true, true, false);

        REQUIRE(inspector.lookups == 0);
        REQUIRE_FALSE(report.deepScan);
        REQUIRE(report.devices[0].hostname == "?");
        REQUIRE(report.devices[0].openPorts.empty());
    }
}

TEST_CASE("DiscoveryEngine empty network", "[DiscoveryEngine]") {
    FakeProbes probes;
    FakeInspector inspector;
    DiscoveryEngine engine(probes, inspector);

    REQUIRE(engine.discover(kSubnet, true, true, true).empty());
    REQUIRE(inspector.lookups == 0);
}
