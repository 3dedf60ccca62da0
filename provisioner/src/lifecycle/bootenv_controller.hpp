#pragma once
#include "change_handler.hpp"
#include "media/file_fetcher.hpp"
#include "media/media_extractor.hpp"
#include "media/media_preparer.hpp"
#include "model/bootenv.hpp"
#include "model/machine.hpp"
#include "render/path_resolver.hpp"
#include "render/render_pipeline.hpp"
#include "render/template_compiler.hpp"
#include "store/record_store.hpp"
#include "util/lookup_table.hpp"

#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>

namespace lifecycle {

    enum class BootEnvState { Draft, Active, Retired };

    inline constexpr util::LookupTable<BootEnvState, std::string_view, 3> STATE_NAMES{
        BootEnvState::Draft,
        std::string_view{"Draft"},
        BootEnvState::Active,
        std::string_view{"Active"},
        BootEnvState::Retired,
        std::string_view{"Retired"}};

    /**
     * Keeps the rendered artifacts of every machine consistent with boot environment
     * definitions as they are created, updated and deleted. Callers serialize changes to any
     * one environment name; different environments may change concurrently.
     */
    class BootEnvController {
        const render::PathResolver &_paths;
        const store::MachineStore &_machines;
        render::TemplateCompiler _compiler;
        render::RenderPipeline _pipeline;
        media::MediaPreparer _media;
        media::FileFetcher _files;

        mutable std::shared_mutex _cacheMutex;
        std::map<std::string, std::shared_ptr<const render::CompiledBootEnv>, std::less<>>
            _compiled;
        std::map<std::string, BootEnvState, std::less<>> _states;

        void setState(const std::string &name, BootEnvState state);
        void cache(std::shared_ptr<const render::CompiledBootEnv> compiled);

    public:
        BootEnvController(
            const render::PathResolver &paths,
            const store::TemplateStore &templates,
            const store::MachineStore &machines,
            media::MediaExtractor &extractor,
            media::FileDownloader &downloader,
            std::string commandUrl);

        /**
         * Structure check, media, files, template compilation and kernel/initrd checks. The
         * environment becomes Active on success.
         */
        ChangeResult validateAndPrepare(const model::BootEnv &env);

        /**
         * Re-render every machine bound to previous with next. Fails fast on the first machine
         * that cannot be rendered.
         */
        ChangeResult cascadeRender(const model::BootEnv &next, const model::BootEnv &previous);

        /**
         * validateAndPrepare then, for an update, cascadeRender.
         */
        ChangeResult onChange(const model::BootEnv &next, const model::BootEnv *previous = nullptr);

        ChangeResult onChange(
            const model::BootEnv &next, const std::optional<model::BootEnv> &previous) {
            return onChange(next, previous.has_value() ? &previous.value() : nullptr);
        }

        /**
         * Throws errors::EnvironmentInUseError if any machine is bound to the environment.
         */
        void guardDelete(const std::string &name) const;

        void onDelete(const model::BootEnv &env);

        /**
         * The compiled form of env. A cached form is reused only while its definition equals env;
         * otherwise env is compiled and replaces it.
         */
        [[nodiscard]] std::shared_ptr<const render::CompiledBootEnv> compiled(
            const model::BootEnv &env);

        render::RenderPlan renderMachine(const model::Machine &machine, const model::BootEnv &env);

        size_t removeMachineArtifacts(const model::Machine &machine, const model::BootEnv &env);

        [[nodiscard]] BootEnvState state(std::string_view name) const;
    };

} // namespace lifecycle
