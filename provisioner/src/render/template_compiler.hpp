#pragma once
#include "model/bootenv.hpp"
#include "render_context.hpp"
#include "store/record_store.hpp"

#include <inja/inja.hpp>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace render {

    struct CompiledTemplate {
        model::TemplateInfo info;
        std::shared_ptr<const inja::Template> path;
        std::shared_ptr<const inja::Template> content;
    };

    /**
     * A boot environment together with its parsed templates. Immutable once built, so any
     * number of machines may render from it at the same time.
     */
    class CompiledBootEnv {
        model::BootEnv _env;
        std::vector<CompiledTemplate> _templates;
        std::shared_ptr<const inja::Template> _bootParams;

    public:
        CompiledBootEnv(
            model::BootEnv env,
            std::vector<CompiledTemplate> templates,
            std::shared_ptr<const inja::Template> bootParams)
            : _env(std::move(env)), _templates(std::move(templates)),
              _bootParams(std::move(bootParams)) {
        }

        [[nodiscard]] const model::BootEnv &env() const noexcept {
            return _env;
        }

        [[nodiscard]] const std::vector<CompiledTemplate> &templates() const noexcept {
            return _templates;
        }

        // null when the environment has no boot parameters
        [[nodiscard]] const std::shared_ptr<const inja::Template> &bootParams() const noexcept {
            return _bootParams;
        }
    };

    /**
     * Owns the template engine and the helper functions templates may call. Rendering is
     * strict: a reference to an undefined variable fails the render.
     */
    class TemplateCompiler {
        const store::TemplateStore &_store;
        inja::Environment _engine;
        std::mutex _parseMutex;

        void registerHelpers();

        [[nodiscard]] std::shared_ptr<const inja::Template> parse(
            const std::string &what, const std::string &source);

    public:
        explicit TemplateCompiler(const store::TemplateStore &store);
        TemplateCompiler(const TemplateCompiler &) = delete;
        TemplateCompiler(TemplateCompiler &&) = delete;
        TemplateCompiler &operator=(const TemplateCompiler &) = delete;
        TemplateCompiler &operator=(TemplateCompiler &&) = delete;
        ~TemplateCompiler() = default;

        /**
         * Parse every path expression, content template and the boot parameters. Throws
         * errors::TemplateCompileError naming the template and carrying its source.
         */
        [[nodiscard]] std::shared_ptr<const CompiledBootEnv> compile(const model::BootEnv &env);

        [[nodiscard]] std::string renderPath(
            const CompiledTemplate &tmpl, const RenderContext &context);

        void renderContent(
            std::ostream &out, const CompiledTemplate &tmpl, const RenderContext &context);

        /**
         * Boot parameters for the machine in context, empty if the environment has none.
         * Throws errors::TemplateEvaluationError.
         */
        [[nodiscard]] std::string renderBootParams(const RenderContext &context);

        /**
         * Render a standalone template against a context.
         */
        [[nodiscard]] std::string renderString(
            std::string_view what, const std::string &source, const RenderContext &context);
    };

} // namespace render
