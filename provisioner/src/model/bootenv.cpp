#include "bootenv.hpp"
#include "conv/json_conv.hpp"

#include <algorithm>

namespace model {

    const TemplateInfo *BootEnv::findTemplate(std::string_view templateName) const {
        auto i = std::find_if(templates.begin(), templates.end(), [templateName](const auto &t) {
            return t.name == templateName;
        });
        return i == templates.end() ? nullptr : &*i;
    }

    BootEnv BootEnv::fromJson(std::string_view json) {
        BootEnv env;
        conv::JsonHelper::read(json, env);
        return env;
    }

} // namespace model
