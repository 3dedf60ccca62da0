#pragma once
#include "conv/archive.hpp"
#include "model/bootenv.hpp"
#include "model/machine.hpp"
#include "path_resolver.hpp"

#include <string>
#include <utility>

namespace render {

    class CompiledBootEnv;

    /**
     * Everything a single machine render can see. Built fresh for every render and not modified
     * while templates evaluate.
     */
    class RenderContext {
        const model::Machine &_machine;
        const CompiledBootEnv &_compiled;
        const PathResolver &_paths;
        conv::ValueType _data;

    public:
        RenderContext(
            const model::Machine &machine,
            const CompiledBootEnv &compiled,
            const PathResolver &paths,
            conv::ValueType data)
            : _machine(machine), _compiled(compiled), _paths(paths), _data(std::move(data)) {
        }

        [[nodiscard]] const model::Machine &machine() const noexcept {
            return _machine;
        }

        [[nodiscard]] const CompiledBootEnv &compiled() const noexcept {
            return _compiled;
        }

        [[nodiscard]] const model::BootEnv &env() const noexcept;

        [[nodiscard]] const PathResolver &paths() const noexcept {
            return _paths;
        }

        /**
         * Template variables: Machine, Env, ProvisionerURL, CommandURL and TenantId.
         */
        [[nodiscard]] const conv::ValueType &data() const noexcept {
            return _data;
        }
    };

    class RenderContextBuilder {
        const PathResolver &_paths;
        std::string _commandUrl;

        [[nodiscard]] conv::ValueType machineData(const model::Machine &machine) const;
        [[nodiscard]] conv::ValueType envData(const model::BootEnv &env) const;

    public:
        RenderContextBuilder(const PathResolver &paths, std::string commandUrl)
            : _paths(paths), _commandUrl(std::move(commandUrl)) {
        }

        [[nodiscard]] RenderContext build(
            const model::Machine &machine, const CompiledBootEnv &compiled) const;
    };

    /**
     * Makes a context current on this thread for the template helper functions, which are
     * registered once per template engine and cannot carry per-render state themselves.
     */
    class RenderScope {
        static thread_local const RenderContext *_current;
        const RenderContext *_previous;

    public:
        explicit RenderScope(const RenderContext &context) noexcept
            : _previous(std::exchange(_current, &context)) {
        }

        RenderScope(const RenderScope &) = delete;
        RenderScope(RenderScope &&) = delete;
        RenderScope &operator=(const RenderScope &) = delete;
        RenderScope &operator=(RenderScope &&) = delete;

        ~RenderScope() noexcept {
            _current = _previous;
        }

        /**
         * Throws std::logic_error when called outside of a render.
         */
        [[nodiscard]] static const RenderContext &current();
    };

} // namespace render
