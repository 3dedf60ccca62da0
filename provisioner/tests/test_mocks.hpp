#pragma once
#include "test_tools.hpp"
#include <catch2/trompeloeil.hpp>
#include <errors/errors.hpp>
#include <media/file_fetcher.hpp>
#include <media/media_extractor.hpp>
#include <model/bootenv.hpp>
#include <model/machine.hpp>
#include <store/record_store.hpp>

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace test {

    class MockTemplateStore : public store::TemplateStore {
    public:
        MAKE_CONST_MOCK1(loadTemplate, std::string(const std::string &), override);
    };

    class MockMachineStore : public store::MachineStore {
    public:
        MAKE_CONST_MOCK1(
            machinesByBootEnv, std::vector<model::Machine>(const std::string &), override);
        MAKE_CONST_MOCK1(
            loadMachine, std::optional<model::Machine>(const std::string &), override);
    };

    class MockMediaExtractor : public media::MediaExtractor {
    public:
        MAKE_MOCK3(
            extract,
            void(const std::string &, const std::filesystem::path &, const std::filesystem::path &),
            override);
    };

    class MockFileDownloader : public media::FileDownloader {
    public:
        MAKE_MOCK2(download, void(const std::string &, const std::filesystem::path &), override);
    };

    /**
     * Template store with fixed contents, for tests that care about output rather than calls.
     */
    class MapTemplateStore : public store::TemplateStore {
        std::map<std::string, std::string> _templates;

    public:
        explicit MapTemplateStore(std::map<std::string, std::string> templates = {})
            : _templates(std::move(templates)) {
        }

        void put(const std::string &id, const std::string &source) {
            _templates[id] = source;
        }

        [[nodiscard]] std::string loadTemplate(const std::string &id) const override {
            auto i = _templates.find(id);
            if(i == _templates.end()) {
                throw errors::RecordNotFoundError("No such template: " + id);
            }
            return i->second;
        }
    };

    class VectorMachineStore : public store::MachineStore {
        std::vector<model::Machine> _machines;

    public:
        void add(model::Machine machine) {
            _machines.push_back(std::move(machine));
        }

        [[nodiscard]] std::vector<model::Machine> machinesByBootEnv(
            const std::string &bootEnv) const override {
            std::vector<model::Machine> result;
            for(const auto &machine : _machines) {
                if(machine.bootEnv == bootEnv) {
                    result.push_back(machine);
                }
            }
            return result;
        }

        [[nodiscard]] std::optional<model::Machine> loadMachine(
            const std::string &name) const override {
            for(const auto &machine : _machines) {
                if(machine.name == name) {
                    return machine;
                }
            }
            return {};
        }
    };

    inline model::Machine machine(
        const std::string &name,
        const std::string &address,
        const std::string &bootEnv,
        std::map<std::string, conv::ValueType> params = {}) {
        model::Machine m;
        m.name = name;
        m.uuid = name + "-uuid";
        m.address = address;
        m.bootEnv = bootEnv;
        m.params = std::move(params);
        return m;
    }

    inline model::TemplateInfo templateInfo(
        const std::string &name, const std::string &path, const std::string &uuid) {
        model::TemplateInfo info;
        info.name = name;
        info.path = path;
        info.uuid = uuid;
        return info;
    }

    /**
     * An environment with an ipxe template that renders to <HexAddress>.ipxe.
     */
    inline model::BootEnv ipxeBootEnv(const std::string &name, const std::string &osName) {
        model::BootEnv env;
        env.name = name;
        env.os.name = osName;
        env.templates.push_back(
            templateInfo("ipxe", "{{ Machine.HexAddress }}.ipxe", "ipxe-tmpl"));
        return env;
    }

} // namespace test
