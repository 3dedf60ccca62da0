#include "../test_mocks.hpp"
#include <catch2/catch_all.hpp>
#include <errors/errors.hpp>
#include <lifecycle/bootenv_controller.hpp>
#include <util/digest.hpp>

#include <algorithm>

using Catch::Matchers::Equals;
namespace mock = trompeloeil;

// NOLINTBEGIN
namespace {
    std::vector<std::filesystem::path> filesUnder(const std::filesystem::path &root) {
        std::vector<std::filesystem::path> files;
        if(!std::filesystem::exists(root)) {
            return files;
        }
        for(const auto &entry : std::filesystem::recursive_directory_iterator(root)) {
            if(entry.is_regular_file()) {
                files.push_back(entry.path());
            }
        }
        return files;
    }

    model::BootEnv centosInstall() {
        model::BootEnv env;
        env.name = "centos-7-install";
        env.os.name = "centos-7";
        env.kernel = "images/pxeboot/vmlinuz";
        env.initrds = {"images/pxeboot/initrd.img"};
        env.bootParams = "ksdevice=bootif ks={{ Machine.Url }}/compute.ks";
        env.requiredParams = {"dns-domain"};
        env.templates.push_back(test::templateInfo(
            "pxelinux", "pxelinux.cfg/{{ Machine.HexAddress }}", "default-pxelinux.tmpl"));
        env.templates.push_back(
            test::templateInfo("elilo", "{{ Machine.HexAddress }}.conf", "default-elilo.tmpl"));
        return env;
    }

    struct Fixture {
        test::TempDir tempDir;
        std::filesystem::path fileRoot{tempDir.getDir() / "tftpboot"};
        render::PathResolver paths{fileRoot, "http://10.0.0.1:8091"};
        test::MapTemplateStore templates;
        test::MockMachineStore machines;
        test::MockMediaExtractor extractor;
        test::MockFileDownloader downloader;
        lifecycle::BootEnvController controller{
            paths, templates, machines, extractor, downloader, "https://10.0.0.1:3000"};

        Fixture() {
            templates.put("default-pxelinux.tmpl", "DEFAULT linux\nAPPEND {{ bootParams() }}\n");
            templates.put("default-elilo.tmpl", "image={{ pathFor(\"tftp\", Env.Kernel) }}\n");
        }

        void stageKernel(const model::BootEnv &env) {
            test::writeFile(paths.diskPath(env, env.kernel), "kernel");
            for(const auto &initrd : env.initrds) {
                test::writeFile(paths.diskPath(env, initrd), "initrd");
            }
        }

        std::filesystem::path artifact(const std::string &relative) {
            return fileRoot / "centos-7" / "install" / relative;
        }
    };
} // namespace

SCENARIO("Creating a boot environment", "[lifecycle]") {
    Fixture f;
    auto env = centosInstall();

    GIVEN("An environment with kernel and initrd in place") {
        f.stageKernel(env);
        FORBID_CALL(f.machines, machinesByBootEnv(mock::_));
        FORBID_CALL(f.extractor, extract(mock::_, mock::_, mock::_));

        WHEN("It is created") {
            auto result = f.controller.onChange(env);
            THEN("It becomes active and nothing is rendered") {
                REQUIRE(f.controller.state(env.name) == lifecycle::BootEnvState::Active);
                REQUIRE(result.media == media::PrepareOutcome::NoIsoConfigured);
                REQUIRE(result.machinesRendered == 0);
                REQUIRE(result.compiled != nullptr);
                REQUIRE(result.compiled->templates().size() == 2);
                REQUIRE(f.controller.compiled(env) == result.compiled);
            }
        }
        WHEN("It names an auxiliary file that is missing") {
            model::FileData file;
            file.url = "http://mirror.example.com/centos/7/netboot.img";
            file.name = "images/netboot.img";
            env.os.files.push_back(file);
            REQUIRE_CALL(f.downloader, download(file.url, f.artifact("images/netboot.img")))
                .SIDE_EFFECT(test::writeFile(_2, "netboot"));
            auto result = f.controller.onChange(env);
            THEN("The file is fetched") {
                REQUIRE(result.filesFetched == 1);
            }
        }
    }

    GIVEN("An environment missing ipxe and one of pxelinux or elilo") {
        FORBID_CALL(f.machines, machinesByBootEnv(mock::_));
        FORBID_CALL(f.extractor, extract(mock::_, mock::_, mock::_));
        FORBID_CALL(f.downloader, download(mock::_, mock::_));
        THEN("The change is refused and no file is written") {
            for(const std::string name : {"pxelinux", "elilo"}) {
                auto incomplete = env;
                incomplete.templates.erase(std::find_if(
                    incomplete.templates.begin(),
                    incomplete.templates.end(),
                    [&name](const auto &t) { return t.name == name; }));
                REQUIRE_THROWS_AS(
                    f.controller.onChange(incomplete), errors::IncompleteBootSupportError);
            }
            REQUIRE(filesUnder(f.fileRoot).empty());
            REQUIRE(f.controller.state(env.name) == lifecycle::BootEnvState::Draft);
        }
    }

    GIVEN("An environment with only an ipxe template") {
        f.stageKernel(env);
        env.templates.clear();
        env.templates.push_back(
            test::templateInfo("ipxe", "{{ Machine.Address }}.ipxe", "default-pxelinux.tmpl"));
        THEN("It is accepted") {
            REQUIRE_NOTHROW(f.controller.onChange(env));
        }
    }

    GIVEN("A template without an identifier") {
        env.templates[0].uuid.clear();
        THEN("The change is refused") {
            REQUIRE_THROWS_AS(f.controller.onChange(env), errors::IllegalTemplateError);
        }
    }

    GIVEN("A template that does not parse") {
        f.stageKernel(env);
        f.templates.put("default-elilo.tmpl", "image={{ Env.Kernel ");
        THEN("The change is refused") {
            REQUIRE_THROWS_AS(f.controller.onChange(env), errors::TemplateCompileError);
            REQUIRE(f.controller.state(env.name) == lifecycle::BootEnvState::Draft);
        }
    }

    GIVEN("No kernel on disk") {
        THEN("The change is refused") {
            REQUIRE_THROWS_AS(f.controller.onChange(env), errors::MissingKernelError);
        }
    }

    GIVEN("A directory where the kernel should be") {
        std::filesystem::create_directories(f.paths.diskPath(env, env.kernel));
        THEN("The change is refused") {
            REQUIRE_THROWS_AS(f.controller.onChange(env), errors::MissingKernelError);
        }
    }

    GIVEN("A kernel without its initrd") {
        test::writeFile(f.paths.diskPath(env, env.kernel), "kernel");
        THEN("The change is refused") {
            REQUIRE_THROWS_AS(f.controller.onChange(env), errors::MissingInitrdError);
        }
    }
}

SCENARIO("Updating a boot environment re-renders its machines", "[lifecycle]") {
    Fixture f;
    auto previous = centosInstall();
    auto next = centosInstall();
    next.bootParams = "ksdevice=bootif ks={{ Machine.Url }}/compute.ks text";
    f.stageKernel(next);

    auto m1 = test::machine("m1", "192.168.124.11", next.name, {{"dns-domain", "example.com"}});
    auto m2 = test::machine("m2", "192.168.124.12", next.name);
    auto m3 = test::machine("m3", "192.168.124.13", next.name, {{"dns-domain", "example.com"}});

    GIVEN("Every bound machine can be rendered") {
        REQUIRE_CALL(f.machines, machinesByBootEnv("centos-7-install"))
            .RETURN(std::vector<model::Machine>{m1, m3});
        auto result = f.controller.onChange(next, &previous);
        THEN("Every machine gets the new definition") {
            REQUIRE(result.machinesRendered == 2);
            REQUIRE_THAT(
                test::readFile(f.artifact("pxelinux.cfg/C0A87C0B")),
                Equals("DEFAULT linux\nAPPEND ksdevice=bootif "
                       "ks=http://10.0.0.1:8091/machines/m1-uuid/compute.ks text\n"));
            REQUIRE(
                test::readFile(f.artifact("C0A87C0D.conf"))
                == "image=centos-7/install/images/pxeboot/vmlinuz\n");
        }
    }

    GIVEN("The previous definition was prepared before the cascade") {
        f.controller.validateAndPrepare(previous);
        REQUIRE_CALL(f.machines, machinesByBootEnv("centos-7-install"))
            .RETURN(std::vector<model::Machine>{m1});
        auto result = f.controller.cascadeRender(next, previous);
        THEN("Machines get the new definition") {
            REQUIRE(result.machinesRendered == 1);
            REQUIRE_THAT(
                test::readFile(f.artifact("pxelinux.cfg/C0A87C0B")),
                Equals("DEFAULT linux\nAPPEND ksdevice=bootif "
                       "ks=http://10.0.0.1:8091/machines/m1-uuid/compute.ks text\n"));
        }
    }

    GIVEN("The second of three machines is missing a required parameter") {
        REQUIRE_CALL(f.machines, machinesByBootEnv("centos-7-install"))
            .RETURN(std::vector<model::Machine>{m1, m2, m3});
        THEN("The cascade stops at the failing machine") {
            REQUIRE_THROWS_AS(
                f.controller.onChange(next, &previous), errors::MissingRequiredParamsError);
            REQUIRE(std::filesystem::exists(f.artifact("C0A87C0B.conf")));
            REQUIRE_FALSE(std::filesystem::exists(f.artifact("C0A87C0C.conf")));
            REQUIRE_FALSE(std::filesystem::exists(f.artifact("C0A87C0D.conf")));
        }
    }

    GIVEN("The update renames the environment") {
        next.name = "centos-7.1-install";
        FORBID_CALL(f.machines, machinesByBootEnv(mock::_));
        THEN("The update is refused") {
            REQUIRE_THROWS_WITH(
                f.controller.onChange(next, &previous),
                Equals("Cannot change name of bootenv centos-7-install to centos-7.1-install"));
        }
    }

    GIVEN("The ISO of the new definition fails its checksum") {
        next.os.isoFile = "CentOS-7-x86_64-Minimal.iso";
        next.os.isoSha256 = util::Sha256{}.update("expected").hexDigest();
        test::writeFile(f.paths.isoPath(next.os), "corrupted");
        FORBID_CALL(f.machines, machinesByBootEnv(mock::_));
        FORBID_CALL(f.extractor, extract(mock::_, mock::_, mock::_));
        THEN("The update aborts before any machine is rendered") {
            REQUIRE_THROWS_AS(
                f.controller.onChange(next, &previous), errors::ChecksumMismatchError);
            REQUIRE_FALSE(std::filesystem::exists(f.artifact("C0A87C0B.conf")));
            REQUIRE(f.controller.state(next.name) == lifecycle::BootEnvState::Draft);
        }
    }
}

SCENARIO("Deleting a boot environment", "[lifecycle]") {
    Fixture f;
    auto env = centosInstall();

    GIVEN("A machine still uses the environment") {
        REQUIRE_CALL(f.machines, machinesByBootEnv("centos-7-install"))
            .RETURN(std::vector<model::Machine>{test::machine("m1", "10.0.0.1", env.name)});
        THEN("Deletion is refused") {
            REQUIRE_THROWS_WITH(
                f.controller.onDelete(env),
                Equals("Bootenv centos-7-install in use by Machine m1"));
            REQUIRE(f.controller.state(env.name) == lifecycle::BootEnvState::Draft);
        }
    }
    GIVEN("No machine uses the environment") {
        REQUIRE_CALL(f.machines, machinesByBootEnv("centos-7-install"))
            .RETURN(std::vector<model::Machine>{});
        THEN("Deletion succeeds and the environment is retired") {
            REQUIRE_NOTHROW(f.controller.onDelete(env));
            REQUIRE(f.controller.state(env.name) == lifecycle::BootEnvState::Retired);
        }
    }
    THEN("Unknown environments are drafts") {
        REQUIRE(f.controller.state("never-seen") == lifecycle::BootEnvState::Draft);
        REQUIRE(lifecycle::STATE_NAMES.lookup(lifecycle::BootEnvState::Retired) == "Retired");
    }
}

SCENARIO("Rendering and clearing a single machine", "[lifecycle]") {
    Fixture f;
    auto env = centosInstall();
    auto machine =
        test::machine("m1", "192.168.124.11", env.name, {{"dns-domain", "example.com"}});

    WHEN("The machine is rendered from an environment that was never applied") {
        auto plan = f.controller.renderMachine(machine, env);
        THEN("The environment is compiled on demand") {
            REQUIRE(plan.size() == 2);
            REQUIRE(std::filesystem::exists(f.artifact("pxelinux.cfg/C0A87C0B")));
            REQUIRE(std::filesystem::exists(f.artifact("C0A87C0B.conf")));
        }
        AND_WHEN("Its artifacts are removed") {
            THEN("Both files are gone") {
                REQUIRE(f.controller.removeMachineArtifacts(machine, env) == 2);
                REQUIRE(filesUnder(f.fileRoot).empty());
            }
        }
    }

    WHEN("The machine is rendered again from a changed definition of the same environment") {
        f.controller.renderMachine(machine, env);
        auto changed = env;
        changed.bootParams = "ksdevice=bootif ks={{ Machine.Url }}/compute.ks text";
        changed.templates[1].path = "elilo/{{ Machine.HexAddress }}.conf";
        auto plan = f.controller.renderMachine(machine, changed);

        THEN("The changed definition is rendered") {
            REQUIRE(plan[1].path == f.artifact("elilo/C0A87C0B.conf"));
            REQUIRE(std::filesystem::exists(f.artifact("elilo/C0A87C0B.conf")));
            REQUIRE_THAT(
                test::readFile(f.artifact("pxelinux.cfg/C0A87C0B")),
                Equals("DEFAULT linux\nAPPEND ksdevice=bootif "
                       "ks=http://10.0.0.1:8091/machines/m1-uuid/compute.ks text\n"));
            REQUIRE(f.controller.compiled(changed)->env() == changed);
        }
        AND_WHEN("Its artifacts are removed with the changed definition") {
            auto removed = f.controller.removeMachineArtifacts(machine, changed);
            THEN("The changed paths are removed") {
                REQUIRE(removed == 2);
                REQUIRE_FALSE(std::filesystem::exists(f.artifact("elilo/C0A87C0B.conf")));
                REQUIRE(std::filesystem::exists(f.artifact("C0A87C0B.conf")));
            }
        }
    }
}

SCENARIO("Boot environment definitions compare by their persisted fields", "[lifecycle]") {
    auto env = centosInstall();
    auto same = centosInstall();
    REQUIRE(env == same);
    same.os.files.emplace_back();
    REQUIRE(env != same);
    same = centosInstall();
    same.templates[0].uuid = "other.tmpl";
    REQUIRE(env != same);
    same = centosInstall();
    same.tenantId = 2;
    REQUIRE(env != same);
}
// NOLINTEND
