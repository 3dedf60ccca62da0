#include "change_handlers.hpp"
#include "errors/errors.hpp"
#include "logging/logging.hpp"

#include <stdexcept>

static const auto LOG = // NOLINT(cert-err58-cpp)
    logging::Logger::of("com.example.provisioner.lifecycle.ChangeHandlers");

namespace lifecycle {

    ChangeResult ValidateStructureHandler::handleRequest(BootEnvChange &change) {
        const auto &env = change.next;
        for(const auto &tmpl : env.templates) {
            if(!tmpl.isComplete()) {
                LOG.atError("illegal-template")
                    .kv("bootenv", env.name)
                    .kv("template", tmpl.name)
                    .logAndThrow(errors::IllegalTemplateError(
                        "bootenv: " + env.name + ": Illegal template: " + tmpl.name
                        + " (name, path and UUID are required)"));
            }
        }
        bool ipxe = env.findTemplate("ipxe") != nullptr;
        bool pxelinux = env.findTemplate("pxelinux") != nullptr;
        bool elilo = env.findTemplate("elilo") != nullptr;
        if(!ipxe && !(pxelinux && elilo)) {
            LOG.atError("incomplete-boot-support")
                .kv("bootenv", env.name)
                .kv("pxelinux", pxelinux)
                .kv("elilo", elilo)
                .logAndThrow(errors::IncompleteBootSupportError(
                    "bootenv: " + env.name + ": Missing elilo or pxelinux template"));
        }
        return passToNext(change);
    }

    ChangeResult PrepareMediaHandler::handleRequest(BootEnvChange &change) {
        change.result.media = _preparer.prepare(change.next);
        LOG.atDebug("media-prepared")
            .kv("bootenv", change.next.name)
            .kv("outcome", media::OUTCOME_NAMES.lookup(change.result.media).value_or("unknown"))
            .log();
        return passToNext(change);
    }

    ChangeResult FetchFilesHandler::handleRequest(BootEnvChange &change) {
        change.result.filesFetched = _fetcher.ensureAll(change.next);
        return passToNext(change);
    }

    ChangeResult CompileTemplatesHandler::handleRequest(BootEnvChange &change) {
        change.result.compiled = _compiler.compile(change.next);
        return passToNext(change);
    }

    ChangeResult VerifyBootArtifactsHandler::handleRequest(BootEnvChange &change) {
        const auto &env = change.next;
        if(!env.kernel.empty()) {
            auto kernel = _paths.diskPath(env, env.kernel);
            if(!std::filesystem::exists(kernel)) {
                LOG.atError("missing-kernel")
                    .kv("bootenv", env.name)
                    .kv("path", kernel)
                    .logAndThrow(errors::MissingKernelError(
                        "bootenv: " + env.name + ": missing kernel " + env.kernel + " ("
                        + kernel.generic_string() + ")"));
            }
            if(!std::filesystem::is_regular_file(kernel)) {
                LOG.atError("invalid-kernel")
                    .kv("bootenv", env.name)
                    .kv("path", kernel)
                    .logAndThrow(errors::MissingKernelError(
                        "bootenv: " + env.name + ": invalid kernel " + env.kernel + " ("
                        + kernel.generic_string() + ")"));
            }
        }
        for(const auto &initrd : env.initrds) {
            auto path = _paths.diskPath(env, initrd);
            if(!std::filesystem::exists(path)) {
                LOG.atError("missing-initrd")
                    .kv("bootenv", env.name)
                    .kv("path", path)
                    .logAndThrow(errors::MissingInitrdError(
                        "bootenv: " + env.name + ": missing initrd " + initrd + " ("
                        + path.generic_string() + ")"));
            }
            if(!std::filesystem::is_regular_file(path)) {
                LOG.atError("invalid-initrd")
                    .kv("bootenv", env.name)
                    .kv("path", path)
                    .logAndThrow(errors::MissingInitrdError(
                        "bootenv: " + env.name + ": invalid initrd " + initrd + " ("
                        + path.generic_string() + ")"));
            }
        }
        return passToNext(change);
    }

    ChangeResult CascadeRenderHandler::handleRequest(BootEnvChange &change) {
        if(change.previous == nullptr) {
            return passToNext(change);
        }
        const auto &previous = *change.previous;
        if(previous.name != change.next.name) {
            LOG.atError("bootenv-renamed")
                .kv("from", previous.name)
                .kv("to", change.next.name)
                .logAndThrow(errors::ImmutableIdentityError(
                    "Cannot change name of bootenv " + previous.name + " to "
                    + change.next.name));
        }
        if(!change.result.compiled) {
            throw std::logic_error("Cascade requires a compiled boot environment");
        }

        auto machines = _machines.machinesByBootEnv(previous.name);
        for(const auto &machine : machines) {
            try {
                _pipeline.render(*change.result.compiled, machine);
            } catch(const errors::Error &e) {
                LOG.atError("cascade-render-failed")
                    .kv("bootenv", change.next.name)
                    .kv("machine", machine.name)
                    .kv("rendered", change.result.machinesRendered)
                    .kv("remaining", machines.size() - change.result.machinesRendered - 1)
                    .cause(e)
                    .log();
                throw;
            }
            ++change.result.machinesRendered;
        }
        LOG.atInfo("cascade-complete")
            .kv("bootenv", change.next.name)
            .kv("machines", change.result.machinesRendered)
            .log();
        return passToNext(change);
    }

} // namespace lifecycle
