#pragma once
#include "change_handler.hpp"
#include "media/file_fetcher.hpp"
#include "media/media_preparer.hpp"
#include "render/path_resolver.hpp"
#include "render/render_pipeline.hpp"
#include "render/template_compiler.hpp"
#include "store/record_store.hpp"

namespace lifecycle {

    /**
     * Every template is complete, and the environment can boot either through iPXE or through
     * both pxelinux and elilo.
     */
    class ValidateStructureHandler : public ChangeHandler {
    public:
        ChangeResult handleRequest(BootEnvChange &change) override;
    };

    class PrepareMediaHandler : public ChangeHandler {
        media::MediaPreparer &_preparer;

    public:
        explicit PrepareMediaHandler(media::MediaPreparer &preparer) : _preparer(preparer) {
        }

        ChangeResult handleRequest(BootEnvChange &change) override;
    };

    class FetchFilesHandler : public ChangeHandler {
        media::FileFetcher &_fetcher;

    public:
        explicit FetchFilesHandler(media::FileFetcher &fetcher) : _fetcher(fetcher) {
        }

        ChangeResult handleRequest(BootEnvChange &change) override;
    };

    class CompileTemplatesHandler : public ChangeHandler {
        render::TemplateCompiler &_compiler;

    public:
        explicit CompileTemplatesHandler(render::TemplateCompiler &compiler)
            : _compiler(compiler) {
        }

        ChangeResult handleRequest(BootEnvChange &change) override;
    };

    /**
     * Kernel and initrds must already be regular files in the install tree.
     */
    class VerifyBootArtifactsHandler : public ChangeHandler {
        const render::PathResolver &_paths;

    public:
        explicit VerifyBootArtifactsHandler(const render::PathResolver &paths) : _paths(paths) {
        }

        ChangeResult handleRequest(BootEnvChange &change) override;
    };

    /**
     * Re-render every machine bound to the replaced definition. Stops at the first machine
     * that fails.
     */
    class CascadeRenderHandler : public ChangeHandler {
        const store::MachineStore &_machines;
        render::RenderPipeline &_pipeline;

    public:
        CascadeRenderHandler(const store::MachineStore &machines, render::RenderPipeline &pipeline)
            : _machines(machines), _pipeline(pipeline) {
        }

        ChangeResult handleRequest(BootEnvChange &change) override;
    };

} // namespace lifecycle
