// =============================================================================
// src/container_view_test.cpp - Registry view and volume spec parsing
// =============================================================================
// Pure functions only; no daemon, no sockets.
// =============================================================================

#include <nlohmann/json.hpp>

#include "registry/ContainerView.hpp"
#include "registry/VolumeSpec.hpp"
#include "testing/FakeRuntime.hpp"
#include "testing/TestHarness.hpp"

using namespace dockgate;
using dockgate::testing::FakeRuntime;
using dockgate::testing::TestHarness;
using json = nlohmann::json;

static json managed_record(const std::string& port_label, const json& ports, const std::string& status = "running") {
    return FakeRuntime::record("c0ffee0000000000000000000000000000000000000000000000000000000000",
                               "nginx:latest",
                               {{MANAGED_LABEL, "true"}, {PORT_LABEL, port_label}, {NAME_LABEL, "web"}},
                               status, ports, "web");
}

static void test_describe(TestHarness& t) {
    t.section("describe()");

    json raw = managed_record("80", FakeRuntime::binding(80, 49153));
    ContainerDescriptor d = describe(raw);

    t.equal(d.id.substr(0, 6), std::string("c0ffee"), "id copied");
    t.check(d.name && *d.name == "web", "leading '/' stripped from name");
    t.equal(d.image, std::string("nginx:latest"), "image from Config.Image");
    t.equal(d.status, std::string("running"), "status from State.Status");
    t.check(d.managed, "managed marker recognised");
    t.check(d.container_port && *d.container_port == 80, "declared service port parsed from label");
    t.check(d.host_port && *d.host_port == 49153, "bound host port read from first binding");
    t.equal(d.labels.size(), size_t(3), "labels copied");

    ContainerDescriptor again = describe(raw);
    t.check(to_json(again) == to_json(d), "same record gives the same descriptor");

    // Service port label missing: both ports absent even with a binding.
    json no_label = FakeRuntime::record("a1", "redis:7", {{MANAGED_LABEL, "true"}}, "running",
                                        FakeRuntime::binding(6379, 40000));
    ContainerDescriptor nl = describe(no_label);
    t.check(!nl.container_port && !nl.host_port, "missing port label → both ports absent");

    ContainerDescriptor bad = describe(managed_record("eighty", FakeRuntime::binding(80, 49153)));
    t.check(!bad.container_port && !bad.host_port, "unparsable port label → both ports absent");

    ContainerDescriptor padded = describe(managed_record(" 8080 ", FakeRuntime::binding(8080, 40001)));
    t.check(padded.container_port && *padded.container_port == 8080, "label with surrounding spaces parses");

    ContainerDescriptor stopped = describe(managed_record("80", json::object(), "exited"));
    t.check(stopped.container_port && !stopped.host_port, "stopped container: declared port kept, host port absent");

    json null_ports = managed_record("80", json(nullptr));
    t.check(!describe(null_ports).host_port, "Ports: null → host port absent");

    json wrong_key = managed_record("80", FakeRuntime::binding(8080, 40002));
    t.check(!describe(wrong_key).host_port, "binding for a different port is ignored");

    json empty_list = managed_record("80", json{{"80/tcp", json::array()}});
    t.check(!describe(empty_list).host_port, "empty binding list → host port absent");

    json junk_port = managed_record("80", json{{"80/tcp", json::array({{{"HostIp", "127.0.0.1"}, {"HostPort", "abc"}}})}});
    t.check(!describe(junk_port).host_port, "non-numeric HostPort → host port absent");

    json numeric_port = managed_record("80", json{{"80/tcp", json::array({{{"HostPort", 40003}}})}});
    t.check(describe(numeric_port).host_port == std::optional<uint16_t>(40003), "numeric HostPort accepted");

    json unmanaged = FakeRuntime::record("b2", "postgres:16", {{"other", "x"}}, "running", json::object());
    t.check(!describe(unmanaged).managed, "container without marker is not managed");

    t.no_throw("garbage input never throws", []() {
        describe(json(nullptr));
        describe(json::array({1, 2, 3}));
        describe(json{{"Config", "not an object"}, {"NetworkSettings", 42}});
        describe(json{{"Config", {{"Labels", {{PORT_LABEL, 80}}}}}});
    });

    json out = to_json(stopped);
    t.check(out["host_port"].is_null(), "absent host port serialises as null");
    t.equal(out["container_port"].get<int>(), 80, "container_port serialised as number");
    t.check(out.contains("labels") && out["labels"].is_object(), "labels serialised as object");
}

static void test_parse_port(TestHarness& t) {
    t.section("parse_port()");
    t.check(parse_port("1") == std::optional<uint16_t>(1), "lower bound 1");
    t.check(parse_port("65535") == std::optional<uint16_t>(65535), "upper bound 65535");
    t.check(!parse_port("0"), "0 rejected");
    t.check(!parse_port("65536"), "65536 rejected");
    t.check(!parse_port("-1"), "negative rejected");
    t.check(!parse_port(""), "empty rejected");
    t.check(!parse_port("80a"), "trailing junk rejected");
}

static void test_volumes(TestHarness& t) {
    t.section("parse_volumes()");

    auto v = parse_volumes({"/srv/data:/data:ro", "/logs:/var/log"});
    t.equal(v.size(), size_t(2), "two specs → two binds");
    t.check(v.size() == 2 && v[0].host_path == "/srv/data" && v[0].container_path == "/data" && v[0].mode == "ro",
            "three-part spec keeps mode");
    t.check(v.size() == 2 && v[1].mode == "rw", "two-part spec defaults to rw");

    auto upper = parse_volumes({"/a:/b:RO"});
    t.check(upper.size() == 1 && upper[0].mode == "ro", "mode is lower-cased");

    auto weird = parse_volumes({"/a:/b:rwx"});
    t.check(weird.size() == 1 && weird[0].mode == "rw", "unknown mode falls back to rw");

    auto skipped = parse_volumes({"nocolon", "/x:/y"});
    t.check(skipped.size() == 1 && skipped[0].host_path == "/x", "malformed spec skipped, rest parsed");

    auto win = parse_volumes({"C:\\data:/data"});
    t.check(win.size() == 1 && win[0].host_path == "C:\\data" && win[0].container_path == "/data" &&
            win[0].mode == "rw", "drive letter stays on host side");

    auto win_ro = parse_volumes({"D:/cache:/cache:ro"});
    t.check(win_ro.size() == 1 && win_ro[0].host_path == "D:/cache" && win_ro[0].mode == "ro",
            "drive letter with explicit mode");

    auto win_fwd = parse_volumes({"C:/data:/data"});
    t.check(win_fwd.size() == 1 && win_fwd[0].host_path == "C:/data" && win_fwd[0].container_path == "/data" &&
            win_fwd[0].mode == "rw", "forward-slash drive path not split at the drive colon");

    auto dup = parse_volumes({"/h:/one:ro", "/other:/o", "/h:/two"});
    t.check(dup.size() == 2 && dup[0].host_path == "/h" && dup[0].container_path == "/two" &&
            dup[0].mode == "rw", "later spec for same host path replaces earlier");

    t.check(parse_volumes({":/b", "/a:"}).empty(), "empty host or container path skipped");
    t.check(parse_volumes({}).empty(), "no specs → no binds");
}

int main() {
    TestHarness t("DOCKGATE - REGISTRY VIEW / VOLUMES");
    test_describe(t);
    test_parse_port(t);
    test_volumes(t);
    return t.summary();
}
