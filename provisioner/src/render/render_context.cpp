#include "render_context.hpp"
#include "template_compiler.hpp"

#include <stdexcept>

namespace render {

    thread_local const RenderContext *RenderScope::_current = nullptr;

    const RenderContext &RenderScope::current() {
        if(_current == nullptr) {
            throw std::logic_error("Template helper called outside of a render");
        }
        return *_current;
    }

    const model::BootEnv &RenderContext::env() const noexcept {
        return _compiled.env();
    }

    conv::ValueType RenderContextBuilder::machineData(const model::Machine &machine) const {
        conv::ValueType params = conv::ValueType::object();
        for(const auto &[key, value] : machine.params) {
            params[key] = value;
        }
        conv::ValueType data{
            {"Name", machine.name},
            {"Uuid", machine.uuid},
            {"Address", machine.address},
            {"BootEnv", machine.bootEnv},
            {"Params", params},
            {"TenantId", machine.tenantId},
            {"ShortName", machine.shortName()},
            {"Path", machine.path()},
            {"Url", machine.url(_paths.provisionerUrl())},
        };
        // left out entirely when the address is unusable, so templates using it fail to bind
        if(auto hex = machine.hexAddress(); hex.has_value()) {
            data["HexAddress"] = hex.value();
        }
        return data;
    }

    conv::ValueType RenderContextBuilder::envData(const model::BootEnv &env) const {
        conv::ValueType files = conv::ValueType::array();
        for(const auto &file : env.os.files) {
            files.push_back({
                {"URL", file.url},
                {"Name", file.name},
                {"ValidationURL", file.validationUrl},
                {"ValidationMethod", file.validationMethod},
            });
        }
        conv::ValueType templates = conv::ValueType::array();
        for(const auto &tmpl : env.templates) {
            templates.push_back({{"Name", tmpl.name}, {"Path", tmpl.path}, {"UUID", tmpl.uuid}});
        }
        conv::ValueType os{
            {"Name", env.os.name},
            {"Family", env.os.family},
            {"Codename", env.os.codename},
            {"Version", env.os.version},
            {"IsoFile", env.os.isoFile},
            {"IsoSha256", env.os.isoSha256},
            {"IsoUrl", env.os.isoUrl},
            {"Files", files},
            {"InstallUrl", _paths.installUrl(env.os)},
        };
        return {
            {"Name", env.name},
            {"OS", os},
            {"Templates", templates},
            {"Kernel", env.kernel},
            {"Initrds", env.initrds},
            {"BootParams", env.bootParams},
            {"RequiredParams", env.requiredParams},
            {"TenantId", env.tenantId},
        };
    }

    RenderContext RenderContextBuilder::build(
        const model::Machine &machine, const CompiledBootEnv &compiled) const {
        const auto &env = compiled.env();
        conv::ValueType data{
            {"Machine", machineData(machine)},
            {"Env", envData(env)},
            {"ProvisionerURL", _paths.provisionerUrl()},
            {"CommandURL", _commandUrl},
            {"TenantId", env.tenantId},
        };
        return RenderContext{machine, compiled, _paths, std::move(data)};
    }

} // namespace render
