#include "application.hpp"
#include "conv/json_conv.hpp"
#include "errors/errors.hpp"
#include "logging/logging.hpp"

static const auto LOG = // NOLINT(cert-err58-cpp)
    logging::Logger::of("com.example.provisioner.cli.Application");

namespace cli {

    Application::Application(config::EngineConfig config)
        : _config(std::move(config)), _store(_config.storeRoot),
          _paths(_config.fileRoot, _config.provisionerUrl),
          _extractor(_config.explodeIsoCommand),
          _controller(_paths, _store, _store, _extractor, _downloader, _config.commandUrl) {
    }

    model::Machine Application::requireMachine(const std::string &name) const {
        auto machine = _store.loadMachine(name);
        if(!machine.has_value()) {
            LOG.atError("machine-not-found")
                .kv("machine", name)
                .logAndThrow(errors::RecordNotFoundError("No such machine: " + name));
        }
        return std::move(machine.value());
    }

    model::BootEnv Application::requireBootEnv(const std::string &name) const {
        auto env = _store.loadBootEnv(name);
        if(!env.has_value()) {
            LOG.atError("bootenv-not-found")
                .kv("bootenv", name)
                .logAndThrow(errors::RecordNotFoundError("No such bootenv: " + name));
        }
        return std::move(env.value());
    }

    void Application::apply(const std::filesystem::path &definition, std::ostream &out) {
        model::BootEnv env;
        conv::JsonHelper::read(definition, env);
        auto previous = _store.loadBootEnv(env.name);
        auto result = _controller.onChange(env, previous);
        _store.saveBootEnv(env);
        out << env.name << ": "
            << lifecycle::STATE_NAMES.lookup(_controller.state(env.name)).value_or("?")
            << ", media " << media::OUTCOME_NAMES.lookup(result.media).value_or("?") << ", "
            << result.filesFetched << " file(s) fetched, " << result.machinesRendered
            << " machine(s) rendered\n";
    }

    void Application::remove(const std::string &name, std::ostream &out) {
        auto env = requireBootEnv(name);
        _controller.onDelete(env);
        _store.removeBootEnv(name);
        out << name << ": "
            << lifecycle::STATE_NAMES.lookup(_controller.state(name)).value_or("?") << '\n';
    }

    void Application::render(const std::string &machineName, std::ostream &out) {
        auto machine = requireMachine(machineName);
        auto env = requireBootEnv(machine.bootEnv);
        for(const auto &artifact : _controller.renderMachine(machine, env)) {
            out << artifact.templateName << '\t' << artifact.path.generic_string() << '\n';
        }
    }

    void Application::clear(const std::string &machineName, std::ostream &out) {
        auto machine = requireMachine(machineName);
        auto env = requireBootEnv(machine.bootEnv);
        auto removed = _controller.removeMachineArtifacts(machine, env);
        out << machineName << ": " << removed << " file(s) removed\n";
    }

    void Application::list(std::ostream &out) const {
        for(const auto &name : _store.listBootEnvs()) {
            auto env = requireBootEnv(name);
            out << env.name << '\t' << env.os.name << '\n';
        }
    }

    void Application::run(const CommandLine &commandLine, std::ostream &out) {
        const auto &target = commandLine.getTarget();
        switch(commandLine.getAction()) {
            case Action::Apply:
                apply(target, out);
                break;
            case Action::Delete:
                remove(target, out);
                break;
            case Action::Render:
                render(target, out);
                break;
            case Action::Clear:
                clear(target, out);
                break;
            case Action::List:
                list(out);
                break;
            case Action::Help:
            case Action::None:
                CommandLine::printHelp(out);
                break;
        }
    }

} // namespace cli
