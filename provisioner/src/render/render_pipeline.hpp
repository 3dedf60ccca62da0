#pragma once
#include "model/machine.hpp"
#include "path_resolver.hpp"
#include "render_context.hpp"
#include "template_compiler.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace render {

    struct RenderedArtifact {
        std::string templateName;
        std::filesystem::path path;
    };

    /**
     * Destinations of one render, in template order. Belongs to that render only.
     */
    using RenderPlan = std::vector<RenderedArtifact>;

    /**
     * Writes the artifacts of a compiled boot environment for one machine. Paths for every
     * template are resolved before any content is written, and a file whose content fails to
     * render is removed before the error is passed on.
     */
    class RenderPipeline {
        TemplateCompiler &_compiler;
        const PathResolver &_paths;
        RenderContextBuilder _contexts;

        void writeArtifact(
            const CompiledTemplate &tmpl,
            const RenderContext &context,
            const std::filesystem::path &path);

    public:
        RenderPipeline(
            TemplateCompiler &compiler, const PathResolver &paths, std::string commandUrl)
            : _compiler(compiler), _paths(paths), _contexts(paths, std::move(commandUrl)) {
        }

        /**
         * Resolve every template path to its location on disk, creating parent directories.
         */
        [[nodiscard]] RenderPlan planPaths(
            const CompiledBootEnv &compiled, const RenderContext &context);

        /**
         * Check required parameters, then render every template. Throws
         * errors::MissingRequiredParamsError before anything is written, template errors, or
         * errors::ArtifactWriteError.
         */
        RenderPlan render(const CompiledBootEnv &compiled, const model::Machine &machine);

        /**
         * Remove what render() would have written. Templates whose path cannot be rendered are
         * skipped. Returns the number of files removed.
         */
        size_t deleteRendered(const CompiledBootEnv &compiled, const model::Machine &machine);
    };

} // namespace render
