#pragma once
#include "model/bootenv.hpp"
#include "model/machine.hpp"

#include <string>
#include <vector>

namespace render {

    /**
     * Required parameters of the environment that the machine does not supply, in the order
     * the environment declares them.
     */
    [[nodiscard]] std::vector<std::string> missingParams(
        const model::BootEnv &env, const model::Machine &machine);

    /**
     * Throws errors::MissingRequiredParamsError naming every missing key.
     */
    void requireParams(const model::BootEnv &env, const model::Machine &machine);

} // namespace render
