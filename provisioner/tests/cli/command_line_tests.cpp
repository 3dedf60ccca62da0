#include "../test_tools.hpp"
#include <catch2/catch_all.hpp>
#include <cli/application.hpp>
#include <cli/command_line.hpp>
#include <errors/errors.hpp>

#include <sstream>

using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::Equals;

// NOLINTBEGIN
SCENARIO("Command line parsing", "[cli]") {
    cli::CommandLine commandLine;

    WHEN("A config file and an action are given") {
        commandLine.parseArgs({"-c", "/etc/provisioner.yaml", "--apply", "centos.json"});
        THEN("Both are recorded") {
            REQUIRE(commandLine.getConfigPath() == "/etc/provisioner.yaml");
            REQUIRE(commandLine.getAction() == cli::Action::Apply);
            REQUIRE(commandLine.getTarget() == "centos.json");
        }
    }
    WHEN("Long options are given in upper case") {
        commandLine.parseArgs({"--LIST"});
        THEN("They still match") {
            REQUIRE(commandLine.getAction() == cli::Action::List);
        }
    }
    WHEN("Nothing is given") {
        commandLine.parseArgs({});
        THEN("There is no action") {
            REQUIRE(commandLine.getAction() == cli::Action::None);
        }
    }
    THEN("Unknown arguments are refused") {
        REQUIRE_THROWS_WITH(
            commandLine.parseArgs({"--frobnicate"}), Equals("Unrecognized command: --frobnicate"));
    }
    THEN("Two different actions are refused") {
        REQUIRE_THROWS_AS(
            commandLine.parseArgs({"-r", "m1", "-x", "m1"}), errors::CommandLineArgumentError);
    }
    THEN("An option value must follow its option") {
        REQUIRE_THROWS_WITH(
            commandLine.parseArgs({"--render"}), ContainsSubstring("missing argument"));
    }
    THEN("Help lists every option") {
        std::ostringstream out;
        cli::CommandLine::printHelp(out);
        REQUIRE_THAT(out.str(), ContainsSubstring("--apply"));
        REQUIRE_THAT(out.str(), ContainsSubstring("-x\t--clear"));
    }
}

SCENARIO("Applying and rendering through the command line", "[cli]") {
    test::TempDir tempDir;
    config::EngineConfig config;
    config.fileRoot = tempDir.getDir() / "tftpboot";
    config.storeRoot = tempDir.getDir() / "store";
    config.provisionerUrl = "http://192.168.124.10:8091";
    config.commandUrl = "https://192.168.124.10:3000";
    std::filesystem::copy(
        test::samples() / "store", config.storeRoot, std::filesystem::copy_options::recursive);

    // discovery boots from these
    test::writeFile(config.fileRoot / "discovery" / "vmlinuz0", "kernel");
    test::writeFile(config.fileRoot / "discovery" / "stage1.img", "initrd");

    cli::Application application{config};
    std::ostringstream out;

    WHEN("The stored environments are listed") {
        application.list(out);
        THEN("Names and operating systems are printed") {
            REQUIRE(out.str() == "discovery\tdiscovery\nubuntu-16.04-install\tubuntu-16.04\n");
        }
    }
    WHEN("The discovery environment is applied") {
        auto definition = tempDir.getDir() / "discovery.json";
        std::filesystem::copy_file(
            test::samples() / "store" / "bootenvs" / "discovery.json", definition);
        cli::CommandLine commandLine;
        commandLine.parseArgs({"--apply", definition.string()});
        application.run(commandLine, out);

        THEN("Its bound machine is re-rendered") {
            REQUIRE(
                out.str()
                == "discovery: Active, media not-install-environment, 0 file(s) fetched, "
                   "1 machine(s) rendered\n");
            auto pxelinux =
                test::readFile(config.fileRoot / "discovery" / "pxelinux.cfg" / "C0A87C16");
            REQUIRE_THAT(pxelinux, ContainsSubstring("KERNEL discovery/vmlinuz0"));
            REQUIRE_THAT(pxelinux, ContainsSubstring("INITRD discovery/stage1.img"));
            REQUIRE_THAT(
                pxelinux, ContainsSubstring("provisioner.web=http://192.168.124.10:8091"));
            auto ipxe = test::readFile(config.fileRoot / "discovery" / "192.168.124.22.ipxe");
            REQUIRE_THAT(
                ipxe, ContainsSubstring("initrd http://192.168.124.10:8091/discovery/stage1.img"));
        }
        AND_WHEN("The machine's files are cleared") {
            std::ostringstream cleared;
            application.clear("d52-54-00-ab-cd-ef.example.com", cleared);
            THEN("All three are removed") {
                REQUIRE(cleared.str() == "d52-54-00-ab-cd-ef.example.com: 3 file(s) removed\n");
                REQUIRE_FALSE(std::filesystem::exists(
                    config.fileRoot / "discovery" / "192.168.124.22.ipxe"));
            }
        }
    }
    WHEN("An environment in use is deleted") {
        THEN("Deletion is refused and the record is kept") {
            REQUIRE_THROWS_AS(application.remove("discovery", out), errors::EnvironmentInUseError);
            REQUIRE(std::filesystem::exists(config.storeRoot / "bootenvs" / "discovery.json"));
        }
    }
    WHEN("An unknown machine is rendered") {
        THEN("The record is reported missing") {
            REQUIRE_THROWS_AS(application.render("nobody", out), errors::RecordNotFoundError);
        }
    }
    WHEN("An Ubuntu machine is rendered") {
        application.render("d52-54-00-12-34-56.example.com", out);
        THEN("The preseed uses the machine's parameters") {
            auto seed = test::readFile(
                config.fileRoot / "ubuntu-16.04" / "install" / "machines"
                / "3e7031fe-3062-45f1-835c-92541bc9cbd3" / "seed");
            REQUIRE_THAT(seed, ContainsSubstring("d-i netcfg/get_domain string example.com"));
            REQUIRE_THAT(
                seed, ContainsSubstring("d-i mirror/http/hostname string 192.168.124.10:8091"));
            REQUIRE_THAT(
                seed, ContainsSubstring("d-i mirror/http/directory string /ubuntu-16.04/install"));
            REQUIRE_THAT(out.str(), ContainsSubstring("seed\t"));
        }
    }
}
// NOLINTEND
