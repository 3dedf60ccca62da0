#include "bootenv_controller.hpp"
#include "change_handlers.hpp"
#include "errors/errors.hpp"
#include "logging/logging.hpp"

#include <mutex>

static const auto LOG = // NOLINT(cert-err58-cpp)
    logging::Logger::of("com.example.provisioner.lifecycle.BootEnvController");

namespace lifecycle {

    BootEnvController::BootEnvController(
        const render::PathResolver &paths,
        const store::TemplateStore &templates,
        const store::MachineStore &machines,
        media::MediaExtractor &extractor,
        media::FileDownloader &downloader,
        std::string commandUrl)
        : _paths(paths), _machines(machines), _compiler(templates),
          _pipeline(_compiler, paths, std::move(commandUrl)), _media(paths, extractor),
          _files(paths, downloader) {
    }

    void BootEnvController::setState(const std::string &name, BootEnvState state) {
        std::unique_lock guard{_cacheMutex};
        _states[name] = state;
    }

    void BootEnvController::cache(std::shared_ptr<const render::CompiledBootEnv> compiled) {
        std::unique_lock guard{_cacheMutex};
        _compiled[compiled->env().name] = std::move(compiled);
    }

    BootEnvState BootEnvController::state(std::string_view name) const {
        std::shared_lock guard{_cacheMutex};
        auto i = _states.find(name);
        return i == _states.end() ? BootEnvState::Draft : i->second;
    }

    std::shared_ptr<const render::CompiledBootEnv> BootEnvController::compiled(
        const model::BootEnv &env) {
        {
            std::shared_lock guard{_cacheMutex};
            auto i = _compiled.find(env.name);
            if(i != _compiled.end() && i->second->env() == env) {
                return i->second;
            }
        }
        LOG.atDebug("bootenv-compile").kv("bootenv", env.name).log();
        auto result = _compiler.compile(env);
        cache(result);
        return result;
    }

    ChangeResult BootEnvController::validateAndPrepare(const model::BootEnv &env) {
        LOG.atInfo("bootenv-prepare").kv("bootenv", env.name).log();
        setState(env.name, BootEnvState::Draft);

        ValidateStructureHandler validateStructure;
        PrepareMediaHandler prepareMedia{_media};
        FetchFilesHandler fetchFiles{_files};
        CompileTemplatesHandler compileTemplates{_compiler};
        VerifyBootArtifactsHandler verifyArtifacts{_paths};
        validateStructure.setNextHandler(prepareMedia);
        prepareMedia.setNextHandler(fetchFiles);
        fetchFiles.setNextHandler(compileTemplates);
        compileTemplates.setNextHandler(verifyArtifacts);

        BootEnvChange change{env};
        auto result = validateStructure.handleRequest(change);
        cache(result.compiled);
        setState(env.name, BootEnvState::Active);
        return result;
    }

    ChangeResult BootEnvController::cascadeRender(
        const model::BootEnv &next, const model::BootEnv &previous) {
        CascadeRenderHandler cascade{_machines, _pipeline};
        BootEnvChange change{next, &previous};
        change.result.compiled = compiled(next);
        return cascade.handleRequest(change);
    }

    ChangeResult BootEnvController::onChange(
        const model::BootEnv &next, const model::BootEnv *previous) {
        auto result = validateAndPrepare(next);
        if(previous != nullptr) {
            auto cascade = cascadeRender(next, *previous);
            result.machinesRendered = cascade.machinesRendered;
        }
        LOG.atInfo("bootenv-changed")
            .kv("bootenv", next.name)
            .kv("update", previous != nullptr)
            .kv("media", media::OUTCOME_NAMES.lookup(result.media).value_or("unknown"))
            .kv("filesFetched", result.filesFetched)
            .kv("machinesRendered", result.machinesRendered)
            .log();
        return result;
    }

    void BootEnvController::guardDelete(const std::string &name) const {
        auto machines = _machines.machinesByBootEnv(name);
        if(!machines.empty()) {
            LOG.atWarn("bootenv-in-use")
                .kv("bootenv", name)
                .kv("machine", machines.front().name)
                .kv("machines", machines.size())
                .logAndThrow(errors::EnvironmentInUseError(
                    "Bootenv " + name + " in use by Machine " + machines.front().name));
        }
    }

    void BootEnvController::onDelete(const model::BootEnv &env) {
        guardDelete(env.name);
        {
            std::unique_lock guard{_cacheMutex};
            _compiled.erase(env.name);
            _states[env.name] = BootEnvState::Retired;
        }
        LOG.atInfo("bootenv-retired").kv("bootenv", env.name).log();
    }

    render::RenderPlan BootEnvController::renderMachine(
        const model::Machine &machine, const model::BootEnv &env) {
        return _pipeline.render(*compiled(env), machine);
    }

    size_t BootEnvController::removeMachineArtifacts(
        const model::Machine &machine, const model::BootEnv &env) {
        return _pipeline.deleteRendered(*compiled(env), machine);
    }

} // namespace lifecycle
