#include <catch2/catch_all.hpp>
#include <conv/json_conv.hpp>
#include <errors/errors.hpp>
#include <model/bootenv.hpp>
#include <model/machine.hpp>

// NOLINTBEGIN
SCENARIO("Boot environment records read from JSON", "[conv]") {
    GIVEN("A record with keys in mixed case") {
        auto env = model::BootEnv::fromJson(R"({
            "name": "centos-7-install",
            "OS": {
                "Name": "centos-7",
                "isofile": "CentOS-7-x86_64-Minimal.iso",
                "IsoSha256": "ABC",
                "Files": [{"url": "http://mirror/netboot.tar.gz", "NAME": "netboot.tar.gz"}]
            },
            "Templates": [
                {"Name": "pxelinux", "Path": "pxelinux.cfg/{{ Machine.HexAddress }}", "UUID": "t1"},
                {"name": "elilo", "path": "{{ Machine.HexAddress }}.conf", "uuid": "t2"}
            ],
            "Kernel": "images/pxeboot/vmlinuz0",
            "Initrds": ["images/pxeboot/initrd.img"],
            "BootParams": "ksdevice=bootif",
            "RequiredParams": ["ntp_servers"],
            "TenantId": 3
        })");
        THEN("Every field is populated") {
            REQUIRE(env.name == "centos-7-install");
            REQUIRE(env.isInstall());
            REQUIRE(env.os.name == "centos-7");
            REQUIRE(env.os.isoFile == "CentOS-7-x86_64-Minimal.iso");
            REQUIRE(env.os.files.size() == 1);
            REQUIRE(env.os.files[0].name == "netboot.tar.gz");
            REQUIRE(env.templates.size() == 2);
            REQUIRE(env.templates[1].uuid == "t2");
            REQUIRE(env.findTemplate("elilo") != nullptr);
            REQUIRE(env.findTemplate("ipxe") == nullptr);
            REQUIRE(env.initrds == std::vector<std::string>{"images/pxeboot/initrd.img"});
            REQUIRE(env.requiredParams == std::vector<std::string>{"ntp_servers"});
            REQUIRE(env.tenantId == 3);
        }
        WHEN("The record is written back") {
            auto json = conv::JsonHelper::write(env);
            auto copy = model::BootEnv::fromJson(json);
            THEN("Canonical key names are used") {
                REQUIRE(json.find("\"IsoFile\"") != std::string::npos);
                REQUIRE(copy.templates[0].path == "pxelinux.cfg/{{ Machine.HexAddress }}");
            }
        }
    }
    GIVEN("Text that is not JSON") {
        THEN("Parsing fails") {
            REQUIRE_THROWS_AS(model::BootEnv::fromJson("{ not json"), errors::JsonParseError);
        }
    }
    GIVEN("A field of the wrong type") {
        THEN("Parsing fails") {
            REQUIRE_THROWS_AS(
                model::BootEnv::fromJson(R"({"Name": 12})"), errors::JsonParseError);
        }
    }
}

SCENARIO("Machine records keep free-form parameters", "[conv]") {
    model::Machine machine;
    conv::JsonHelper::read(
        std::string_view{R"({
            "Name": "d00-11-22-33-44-55.example.com",
            "Uuid": "3f2a",
            "Address": "192.168.124.11",
            "BootEnv": "discovery",
            "Params": {"ntp_servers": ["10.0.0.1", "10.0.0.2"], "debug": true}
        })"},
        machine);
    REQUIRE(machine.shortName() == "d00-11-22-33-44-55");
    REQUIRE(machine.hexAddress() == "C0A87C0B");
    REQUIRE(machine.path() == "machines/3f2a");
    REQUIRE(machine.hasParam("ntp_servers"));
    REQUIRE(machine.params.at("ntp_servers").size() == 2);
    REQUIRE(machine.params.at("debug") == true);

    machine.address = "fe80::1";
    REQUIRE_FALSE(machine.hexAddress().has_value());
}

SCENARIO("Parameter names that differ only in case stay distinct", "[conv]") {
    model::Machine machine;
    conv::JsonHelper::read(
        std::string_view{R"({
            "Name": "m1.example.com",
            "Params": {"Console": "ttyS0,115200", "console": "tty0"}
        })"},
        machine);
    REQUIRE(machine.params.size() == 2);
    REQUIRE(machine.params.at("Console") == "ttyS0,115200");
    REQUIRE(machine.params.at("console") == "tty0");
}
// NOLINTEND
