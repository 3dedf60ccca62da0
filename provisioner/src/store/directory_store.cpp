#include "directory_store.hpp"
#include "conv/json_conv.hpp"
#include "errors/errors.hpp"
#include "logging/logging.hpp"
#include "util/commitable_file.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

static const auto LOG = // NOLINT(cert-err58-cpp)
    logging::Logger::of("com.example.provisioner.store.DirectoryStore");

namespace store {

    std::filesystem::path DirectoryStore::recordPath(
        std::string_view kind, std::string_view name) const {
        if(name.empty() || name.find('/') != std::string_view::npos || name == "."
           || name == "..") {
            LOG.atError("invalid-record-name")
                .kv("kind", kind)
                .kv("name", name)
                .logAndThrow(errors::RecordNotFoundError(
                    "Invalid record name: " + std::string{kind} + "/" + std::string{name}));
        }
        return _root / kind / name;
    }

    std::vector<std::filesystem::path> DirectoryStore::listRecords(std::string_view kind) const {
        std::vector<std::filesystem::path> records;
        auto dir = _root / kind;
        if(!std::filesystem::is_directory(dir)) {
            return records;
        }
        for(const auto &entry : std::filesystem::directory_iterator(dir)) {
            if(entry.is_regular_file() && entry.path().extension() == RECORD_EXT) {
                records.push_back(entry.path());
            }
        }
        std::sort(records.begin(), records.end());
        return records;
    }

    std::string DirectoryStore::loadTemplate(const std::string &id) const {
        auto path = recordPath(TEMPLATES_DIR, id);
        std::ifstream stream{path};
        if(!stream.is_open()) {
            throw errors::RecordNotFoundError("No such template: " + id);
        }
        std::ostringstream buffer;
        buffer << stream.rdbuf();
        return buffer.str();
    }

    std::vector<model::Machine> DirectoryStore::listMachines() const {
        std::vector<model::Machine> machines;
        for(const auto &path : listRecords(MACHINES_DIR)) {
            model::Machine machine;
            conv::JsonHelper::read(path, machine);
            machines.push_back(std::move(machine));
        }
        return machines;
    }

    std::vector<model::Machine> DirectoryStore::machinesByBootEnv(
        const std::string &bootEnv) const {
        auto machines = listMachines();
        machines.erase(
            std::remove_if(
                machines.begin(),
                machines.end(),
                [&bootEnv](const auto &m) { return m.bootEnv != bootEnv; }),
            machines.end());
        return machines;
    }

    std::optional<model::Machine> DirectoryStore::loadMachine(const std::string &name) const {
        auto path = recordPath(MACHINES_DIR, name + std::string{RECORD_EXT});
        if(!std::filesystem::exists(path)) {
            return {};
        }
        model::Machine machine;
        conv::JsonHelper::read(path, machine);
        return machine;
    }

    std::vector<std::string> DirectoryStore::listBootEnvs() const {
        std::vector<std::string> names;
        for(const auto &path : listRecords(BOOTENVS_DIR)) {
            names.push_back(path.stem().string());
        }
        return names;
    }

    std::optional<model::BootEnv> DirectoryStore::loadBootEnv(const std::string &name) const {
        auto path = recordPath(BOOTENVS_DIR, name + std::string{RECORD_EXT});
        if(!std::filesystem::exists(path)) {
            return {};
        }
        model::BootEnv env;
        conv::JsonHelper::read(path, env);
        return env;
    }

    void DirectoryStore::saveBootEnv(model::BootEnv &env) {
        auto path = recordPath(BOOTENVS_DIR, env.name + std::string{RECORD_EXT});
        std::filesystem::create_directories(path.parent_path());
        util::CommitableFile file{path};
        file.begin();
        file << conv::JsonHelper::write(env) << '\n';
        file.commit();
        LOG.atDebug("bootenv-saved").kv("name", env.name).kv("path", path).log();
    }

    bool DirectoryStore::removeBootEnv(const std::string &name) {
        auto path = recordPath(BOOTENVS_DIR, name + std::string{RECORD_EXT});
        bool removed = std::filesystem::remove(path);
        LOG.atDebug("bootenv-removed").kv("name", name).kv("removed", removed).log();
        return removed;
    }

} // namespace store
