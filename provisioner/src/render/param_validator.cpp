#include "param_validator.hpp"
#include "errors/errors.hpp"
#include "logging/logging.hpp"
#include "util/string_util.hpp"

#include <algorithm>

static const auto LOG = // NOLINT(cert-err58-cpp)
    logging::Logger::of("com.example.provisioner.render.ParamValidator");

namespace render {

    std::vector<std::string> missingParams(
        const model::BootEnv &env, const model::Machine &machine) {
        std::vector<std::string> missing;
        for(const auto &key : env.requiredParams) {
            if(!machine.hasParam(key)
               && std::find(missing.begin(), missing.end(), key) == missing.end()) {
                missing.push_back(key);
            }
        }
        return missing;
    }

    void requireParams(const model::BootEnv &env, const model::Machine &machine) {
        auto missing = missingParams(env, machine);
        if(!missing.empty()) {
            LOG.atWarn("missing-required-params")
                .kv("bootenv", env.name)
                .kv("machine", machine.name)
                .kv("missing", util::join(missing, ","))
                .logAndThrow(errors::MissingRequiredParamsError(env.name, machine.name, missing));
        }
    }

} // namespace render
