#include "template_compiler.hpp"
#include "errors/errors.hpp"
#include "logging/logging.hpp"
#include "util/url.hpp"

#include <sstream>

static const auto LOG = // NOLINT(cert-err58-cpp)
    logging::Logger::of("com.example.provisioner.render.TemplateCompiler");

namespace render {

    namespace {
        // Runs a render, translating engine failures to TemplateEvaluationError. Errors raised by
        // helper functions keep their own type.
        template<typename Fn>
        auto evaluate(std::string_view what, Fn &&fn) {
            try {
                return fn();
            } catch(const errors::Error &) {
                throw;
            } catch(const inja::InjaError &e) {
                LOG.atDebug("template-evaluation-error").kv("template", what).cause(e).log();
                throw errors::TemplateEvaluationError(
                    "Error rendering " + std::string{what} + ": " + e.what());
            } catch(const nlohmann::json::exception &e) {
                LOG.atDebug("template-evaluation-error").kv("template", what).cause(e).log();
                throw errors::TemplateEvaluationError(
                    "Error rendering " + std::string{what} + ": " + e.what());
            }
        }

        std::string stringArg(const inja::Arguments &args, size_t index) {
            return args.at(index)->get<std::string>();
        }
    } // namespace

    TemplateCompiler::TemplateCompiler(const store::TemplateStore &store) : _store(store) {
        registerHelpers();
    }

    void TemplateCompiler::registerHelpers() {
        _engine.add_callback("bootParams", 0, [this](inja::Arguments &) -> conv::ValueType {
            return renderBootParams(RenderScope::current());
        });

        _engine.add_callback("param", 1, [](inja::Arguments &args) -> conv::ValueType {
            const auto &context = RenderScope::current();
            auto key = stringArg(args, 0);
            const auto &params = context.machine().params;
            auto i = params.find(key);
            if(i == params.end()) {
                LOG.atDebug("missing-param")
                    .kv("machine", context.machine().name)
                    .kv("key", key)
                    .logAndThrow(errors::MissingParameterError(
                        "No such machine parameter " + key + " for "
                        + context.machine().name));
            }
            return i->second;
        });

        _engine.add_callback("parseUrl", 2, [](inja::Arguments &args) -> conv::ValueType {
            auto segment = stringArg(args, 0);
            auto rawUrl = stringArg(args, 1);
            auto parts = util::parseUrl(rawUrl);
            if(segment == "scheme") {
                return parts.scheme;
            } else if(segment == "host") {
                return parts.host;
            } else if(segment == "path") {
                return parts.path;
            }
            throw errors::UnsupportedSegmentError(
                "No idea how to get URL part " + segment + " from " + rawUrl);
        });

        _engine.add_callback("pathFor", 2, [](inja::Arguments &args) -> conv::ValueType {
            const auto &context = RenderScope::current();
            return context.paths().pathFor(context.env(), stringArg(args, 0), stringArg(args, 1));
        });

        _engine.add_callback("joinInitrds", 1, [](inja::Arguments &args) -> conv::ValueType {
            const auto &context = RenderScope::current();
            return context.paths().joinInitrds(
                context.env(), PathResolver::protocolOf(stringArg(args, 0)));
        });
    }

    std::shared_ptr<const inja::Template> TemplateCompiler::parse(
        const std::string &what, const std::string &source) {
        try {
            std::unique_lock guard{_parseMutex};
            return std::make_shared<const inja::Template>(_engine.parse(source));
        } catch(const inja::InjaError &e) {
            LOG.atError("template-compile-error")
                .kv("template", what)
                .kv("source", source)
                .cause(e)
                .logAndThrow(errors::TemplateCompileError(
                    "Error compiling " + what + ": " + e.what() + "\n---template---\n" + source
                    + "\n---template---"));
        }
    }

    std::shared_ptr<const CompiledBootEnv> TemplateCompiler::compile(const model::BootEnv &env) {
        std::vector<CompiledTemplate> compiled;
        compiled.reserve(env.templates.size());
        for(const auto &info : env.templates) {
            std::string source;
            try {
                source = _store.loadTemplate(info.uuid);
            } catch(const errors::RecordNotFoundError &e) {
                LOG.atError("template-load-error")
                    .kv("bootenv", env.name)
                    .kv("template", info.name)
                    .kv("id", info.uuid)
                    .cause(e)
                    .logAndThrow(errors::TemplateCompileError(
                        "Unable to load template " + info.uuid + " for " + info.name + ": "
                        + e.what()));
            }
            CompiledTemplate tmpl;
            tmpl.info = info;
            tmpl.path = parse(env.name + "/" + info.name + " path", info.path);
            tmpl.content = parse(env.name + "/" + info.name + " (" + info.uuid + ")", source);
            compiled.push_back(std::move(tmpl));
        }

        std::shared_ptr<const inja::Template> bootParams;
        if(!env.bootParams.empty()) {
            bootParams = parse(env.name + " BootParams", env.bootParams);
        }

        LOG.atDebug("bootenv-compiled")
            .kv("bootenv", env.name)
            .kv("templates", compiled.size())
            .log();
        return std::make_shared<const CompiledBootEnv>(env, std::move(compiled), bootParams);
    }

    std::string TemplateCompiler::renderPath(
        const CompiledTemplate &tmpl, const RenderContext &context) {
        RenderScope scope{context};
        return evaluate(tmpl.info.name + " path", [&]() {
            return _engine.render(*tmpl.path, context.data());
        });
    }

    void TemplateCompiler::renderContent(
        std::ostream &out, const CompiledTemplate &tmpl, const RenderContext &context) {
        RenderScope scope{context};
        evaluate(tmpl.info.name, [&]() { _engine.render_to(out, *tmpl.content, context.data()); });
    }

    std::string TemplateCompiler::renderBootParams(const RenderContext &context) {
        const auto &bootParams = context.compiled().bootParams();
        if(!bootParams) {
            return {};
        }
        RenderScope scope{context};
        try {
            return _engine.render(*bootParams, context.data());
        } catch(const errors::Error &e) {
            throw errors::TemplateEvaluationError(
                "Error rendering BootParams for " + context.env().name + ": " + e.what());
        } catch(const inja::InjaError &e) {
            throw errors::TemplateEvaluationError(
                "Error rendering BootParams for " + context.env().name + ": " + e.what());
        } catch(const nlohmann::json::exception &e) {
            throw errors::TemplateEvaluationError(
                "Error rendering BootParams for " + context.env().name + ": " + e.what());
        }
    }

    std::string TemplateCompiler::renderString(
        std::string_view what, const std::string &source, const RenderContext &context) {
        auto tmpl = parse(std::string{what}, source);
        RenderScope scope{context};
        return evaluate(what, [&]() { return _engine.render(*tmpl, context.data()); });
    }

} // namespace render
