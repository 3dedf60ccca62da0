#pragma once
#include "record_store.hpp"

#include <filesystem>

namespace store {

    /**
     * Record store backed by a directory tree:
     *
     *   <root>/machines/<name>.json
     *   <root>/bootenvs/<name>.json
     *   <root>/templates/<uuid>
     */
    class DirectoryStore : public TemplateStore, public MachineStore, public BootEnvStore {
        static constexpr std::string_view MACHINES_DIR{"machines"};
        static constexpr std::string_view BOOTENVS_DIR{"bootenvs"};
        static constexpr std::string_view TEMPLATES_DIR{"templates"};
        static constexpr std::string_view RECORD_EXT{".json"};

        std::filesystem::path _root;

        [[nodiscard]] std::filesystem::path recordPath(
            std::string_view kind, std::string_view name) const;
        [[nodiscard]] std::vector<std::filesystem::path> listRecords(std::string_view kind) const;

    public:
        explicit DirectoryStore(std::filesystem::path root) : _root(std::move(root)) {
        }

        [[nodiscard]] const std::filesystem::path &getRoot() const noexcept {
            return _root;
        }

        [[nodiscard]] std::string loadTemplate(const std::string &id) const override;

        [[nodiscard]] std::vector<model::Machine> machinesByBootEnv(
            const std::string &bootEnv) const override;
        [[nodiscard]] std::optional<model::Machine> loadMachine(
            const std::string &name) const override;
        [[nodiscard]] std::vector<model::Machine> listMachines() const;

        [[nodiscard]] std::vector<std::string> listBootEnvs() const override;
        [[nodiscard]] std::optional<model::BootEnv> loadBootEnv(
            const std::string &name) const override;
        void saveBootEnv(model::BootEnv &env) override;
        bool removeBootEnv(const std::string &name) override;
    };

} // namespace store
