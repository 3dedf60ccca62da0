#pragma once
#include "model/bootenv.hpp"
#include "model/machine.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace store {

    /**
     * Source of content templates, keyed by template identifier.
     */
    class TemplateStore {
    public:
        TemplateStore() = default;
        TemplateStore(const TemplateStore &) = delete;
        TemplateStore(TemplateStore &&) = delete;
        TemplateStore &operator=(const TemplateStore &) = delete;
        TemplateStore &operator=(TemplateStore &&) = delete;
        virtual ~TemplateStore() = default;

        /**
         * Template source text. Throws errors::RecordNotFoundError if there is no such template.
         */
        [[nodiscard]] virtual std::string loadTemplate(const std::string &id) const = 0;
    };

    /**
     * Read access to machine records.
     */
    class MachineStore {
    public:
        MachineStore() = default;
        MachineStore(const MachineStore &) = delete;
        MachineStore(MachineStore &&) = delete;
        MachineStore &operator=(const MachineStore &) = delete;
        MachineStore &operator=(MachineStore &&) = delete;
        virtual ~MachineStore() = default;

        /**
         * Every machine whose bootEnv is the given name, in store order.
         */
        [[nodiscard]] virtual std::vector<model::Machine> machinesByBootEnv(
            const std::string &bootEnv) const = 0;

        [[nodiscard]] virtual std::optional<model::Machine> loadMachine(
            const std::string &name) const = 0;
    };

    class BootEnvStore {
    public:
        BootEnvStore() = default;
        BootEnvStore(const BootEnvStore &) = delete;
        BootEnvStore(BootEnvStore &&) = delete;
        BootEnvStore &operator=(const BootEnvStore &) = delete;
        BootEnvStore &operator=(BootEnvStore &&) = delete;
        virtual ~BootEnvStore() = default;

        [[nodiscard]] virtual std::vector<std::string> listBootEnvs() const = 0;
        [[nodiscard]] virtual std::optional<model::BootEnv> loadBootEnv(
            const std::string &name) const = 0;
        virtual void saveBootEnv(model::BootEnv &env) = 0;
        // Returns false if there was nothing to remove
        virtual bool removeBootEnv(const std::string &name) = 0;
    };

} // namespace store
