#pragma once
#include "media/media_preparer.hpp"
#include "model/bootenv.hpp"
#include "render/template_compiler.hpp"

#include <cstddef>
#include <memory>

namespace lifecycle {

    struct ChangeResult {
        media::PrepareOutcome media{media::PrepareOutcome::NotInstallEnvironment};
        size_t filesFetched{0};
        size_t machinesRendered{0};
        std::shared_ptr<const render::CompiledBootEnv> compiled;
    };

    /**
     * A boot environment definition on its way to becoming active. previous is the stored
     * definition being replaced, or null for a new environment.
     */
    struct BootEnvChange {
        const model::BootEnv &next;
        const model::BootEnv *previous{nullptr};
        ChangeResult result;
    };

    /**
     * One step of a change. Each step either throws or hands the change to the next step; the
     * last step returns the accumulated result.
     */
    class ChangeHandler {
        ChangeHandler *_nextHandler{};

    protected:
        ChangeResult passToNext(BootEnvChange &change) {
            if(_nextHandler == nullptr) {
                return change.result;
            }
            return _nextHandler->handleRequest(change);
        }

    public:
        ChangeHandler() = default;
        ChangeHandler(const ChangeHandler &) = delete;
        ChangeHandler(ChangeHandler &&) = delete;
        ChangeHandler &operator=(const ChangeHandler &) = delete;
        ChangeHandler &operator=(ChangeHandler &&) = delete;
        virtual ~ChangeHandler() = default;

        virtual ChangeResult handleRequest(BootEnvChange &change) = 0;

        virtual void setNextHandler(ChangeHandler &handler) {
            _nextHandler = &handler;
        }
    };

} // namespace lifecycle
