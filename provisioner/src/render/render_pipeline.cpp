#include "render_pipeline.hpp"
#include "errors/errors.hpp"
#include "logging/logging.hpp"
#include "param_validator.hpp"
#include "platform/file_descriptor.hpp"

#include <fstream>
#include <system_error>

static const auto LOG = // NOLINT(cert-err58-cpp)
    logging::Logger::of("com.example.provisioner.render.RenderPipeline");

namespace render {

    RenderPlan RenderPipeline::planPaths(
        const CompiledBootEnv &compiled, const RenderContext &context) {
        RenderPlan plan;
        plan.reserve(compiled.templates().size());
        for(const auto &tmpl : compiled.templates()) {
            auto expanded = _compiler.renderPath(tmpl, context);
            std::filesystem::path path = _paths.diskPath(compiled.env(), expanded);
            std::error_code ec;
            std::filesystem::create_directories(path.parent_path(), ec);
            if(ec) {
                LOG.atError("create-directory-error")
                    .kv("path", path.parent_path())
                    .kv("error", ec.message())
                    .logAndThrow(errors::ArtifactWriteError(
                        "Unable to create " + path.parent_path().generic_string() + ": "
                        + ec.message()));
            }
            plan.push_back({tmpl.info.name, std::move(path)});
        }
        return plan;
    }

    void RenderPipeline::writeArtifact(
        const CompiledTemplate &tmpl,
        const RenderContext &context,
        const std::filesystem::path &path) {
        try {
            std::ofstream out;
            out.exceptions(std::ios::failbit | std::ios::badbit);
            out.open(path, std::ios::out | std::ios::trunc | std::ios::binary);
            _compiler.renderContent(out, tmpl, context);
            out.close();
            platform::syncFile(path);
        } catch(const std::ios_base::failure &e) {
            std::error_code ec;
            std::filesystem::remove(path, ec);
            LOG.atError("artifact-write-error")
                .kv("template", tmpl.info.name)
                .kv("path", path)
                .cause(e)
                .logAndThrow(errors::ArtifactWriteError(
                    "Unable to write " + path.generic_string() + ": " + e.what()));
        } catch(const std::system_error &e) {
            std::error_code ec;
            std::filesystem::remove(path, ec);
            LOG.atError("artifact-write-error")
                .kv("template", tmpl.info.name)
                .kv("path", path)
                .cause(e)
                .logAndThrow(errors::ArtifactWriteError(
                    "Unable to write " + path.generic_string() + ": " + e.what()));
        } catch(...) {
            // template failure: never leave a partial artifact behind
            std::error_code ec;
            std::filesystem::remove(path, ec);
            throw;
        }
    }

    RenderPlan RenderPipeline::render(
        const CompiledBootEnv &compiled, const model::Machine &machine) {
        const auto &env = compiled.env();
        requireParams(env, machine);

        auto context = _contexts.build(machine, compiled);
        auto plan = planPaths(compiled, context);
        for(size_t i = 0; i < plan.size(); ++i) {
            writeArtifact(compiled.templates()[i], context, plan[i].path);
            LOG.atDebug("artifact-rendered")
                .kv("bootenv", env.name)
                .kv("machine", machine.name)
                .kv("template", plan[i].templateName)
                .kv("path", plan[i].path)
                .log();
        }
        LOG.atInfo("machine-rendered")
            .kv("bootenv", env.name)
            .kv("machine", machine.name)
            .kv("artifacts", plan.size())
            .log();
        return plan;
    }

    size_t RenderPipeline::deleteRendered(
        const CompiledBootEnv &compiled, const model::Machine &machine) {
        const auto &env = compiled.env();
        auto context = _contexts.build(machine, compiled);
        size_t removed = 0;
        for(const auto &tmpl : compiled.templates()) {
            std::filesystem::path path;
            try {
                path = _paths.diskPath(env, _compiler.renderPath(tmpl, context));
            } catch(const errors::Error &e) {
                LOG.atDebug("artifact-path-skipped")
                    .kv("bootenv", env.name)
                    .kv("machine", machine.name)
                    .kv("template", tmpl.info.name)
                    .cause(e)
                    .log();
                continue;
            } catch(const errors::UnknownProtocolError &e) {
                LOG.atWarn("artifact-path-skipped")
                    .kv("bootenv", env.name)
                    .kv("machine", machine.name)
                    .kv("template", tmpl.info.name)
                    .cause(e)
                    .log();
                continue;
            }
            std::error_code ec;
            if(std::filesystem::remove(path, ec)) {
                ++removed;
            } else if(ec) {
                LOG.atWarn("artifact-remove-error")
                    .kv("path", path)
                    .kv("error", ec.message())
                    .log();
            }
        }
        LOG.atInfo("machine-cleared")
            .kv("bootenv", env.name)
            .kv("machine", machine.name)
            .kv("removed", removed)
            .log();
        return removed;
    }

} // namespace render
