#include "../test_tools.hpp"
#include <catch2/catch_all.hpp>
#include <errors/errors.hpp>
#include <store/directory_store.hpp>

// NOLINTBEGIN
SCENARIO("Records are read from a directory tree", "[store]") {
    test::TempDir tempDir;
    auto root = tempDir.getDir() / "store";
    std::filesystem::copy(
        test::samples() / "store", root, std::filesystem::copy_options::recursive);
    store::DirectoryStore store{root};

    GIVEN("The sample store") {
        THEN("Boot environments are listed by name") {
            REQUIRE(
                store.listBootEnvs()
                == std::vector<std::string>{"discovery", "ubuntu-16.04-install"});
        }
        THEN("A boot environment is loaded") {
            auto env = store.loadBootEnv("ubuntu-16.04-install");
            REQUIRE(env.has_value());
            REQUIRE(env->os.name == "ubuntu-16.04");
            REQUIRE(env->templates.size() == 4);
            REQUIRE(env->requiredParams == std::vector<std::string>{"dns-domain"});
            REQUIRE_FALSE(store.loadBootEnv("centos-7-install").has_value());
        }
        THEN("Machines are selected by boot environment") {
            auto machines = store.machinesByBootEnv("discovery");
            REQUIRE(machines.size() == 1);
            REQUIRE(machines[0].name == "d52-54-00-ab-cd-ef.example.com");
            REQUIRE(store.machinesByBootEnv("centos-7-install").empty());
            REQUIRE(store.listMachines().size() == 2);
        }
        THEN("A machine is loaded by name") {
            auto machine = store.loadMachine("d52-54-00-12-34-56.example.com");
            REQUIRE(machine.has_value());
            REQUIRE(machine->params.at("dns-domain") == "example.com");
            REQUIRE_FALSE(store.loadMachine("nobody").has_value());
        }
        THEN("Templates are loaded by identifier") {
            REQUIRE(store.loadTemplate("default-ipxe.tmpl").rfind("#!ipxe", 0) == 0);
            REQUIRE_THROWS_AS(store.loadTemplate("missing.tmpl"), errors::RecordNotFoundError);
        }
        THEN("Names that escape the store are rejected") {
            REQUIRE_THROWS_AS(store.loadTemplate("../config.yaml"), errors::RecordNotFoundError);
            REQUIRE_THROWS_AS(store.loadTemplate(".."), errors::RecordNotFoundError);
            REQUIRE_THROWS_AS(store.loadTemplate(""), errors::RecordNotFoundError);
        }
    }
    WHEN("A boot environment is saved and removed") {
        auto env = store.loadBootEnv("discovery").value();
        env.name = "discovery-copy";
        store.saveBootEnv(env);
        THEN("It can be read back") {
            auto copy = store.loadBootEnv("discovery-copy");
            REQUIRE(copy.has_value());
            REQUIRE(copy->templates.size() == env.templates.size());
            REQUIRE(copy->bootParams == env.bootParams);
            REQUIRE(store.listBootEnvs().size() == 3);
        }
        THEN("Removing it twice reports the second removal as a no-op") {
            REQUIRE(store.removeBootEnv("discovery-copy"));
            REQUIRE_FALSE(store.removeBootEnv("discovery-copy"));
            REQUIRE_FALSE(store.loadBootEnv("discovery-copy").has_value());
        }
    }
}
// NOLINTEND
