#include "command_line.hpp"
#include "command_line_arguments.hpp"
#include "errors/errors.hpp"
#include "logging/logging.hpp"

#include <functional>
#include <tuple>

static const auto LOG = // NOLINT(cert-err58-cpp)
    logging::Logger::of("com.example.provisioner.cli.CommandLine");

namespace cli {

    static inline constexpr std::tuple argumentList{
        makeArgumentFlag(
            [](CommandLine &cli) { cli.setAction(Action::Help); },
            "h",
            "help",
            "Print this usage information"),
        makeArgumentValue(
            [](CommandLine &cli, const std::string &arg) { cli.setConfigPath(arg); },
            "c",
            "config",
            "configuration YAML file"),
        makeArgumentValue(
            [](CommandLine &cli, const std::string &arg) { cli.setAction(Action::Apply, arg); },
            "a",
            "apply",
            "create or update a boot environment from a JSON definition"),
        makeArgumentValue(
            [](CommandLine &cli, const std::string &arg) { cli.setAction(Action::Delete, arg); },
            "d",
            "delete",
            "delete a boot environment no machine is using"),
        makeArgumentValue(
            [](CommandLine &cli, const std::string &arg) { cli.setAction(Action::Render, arg); },
            "r",
            "render",
            "render the boot environment of a machine"),
        makeArgumentValue(
            [](CommandLine &cli, const std::string &arg) { cli.setAction(Action::Clear, arg); },
            "x",
            "clear",
            "remove the rendered files of a machine"),
        makeArgumentFlag(
            [](CommandLine &cli) { cli.setAction(Action::List); },
            "l",
            "list",
            "list boot environments")};

    void CommandLine::setAction(Action action, std::string target) {
        if(_action != Action::None && _action != action) {
            LOG.atError()
                .event("parse-args-error")
                .kv("action", ACTION_NAMES.lookup(action).value_or("?"))
                .logAndThrow(errors::CommandLineArgumentError{
                    "Only one of --apply, --delete, --render, --clear or --list may be given"});
        }
        _action = action;
        _target = std::move(target);
    }

    void CommandLine::printHelp(std::ostream &out) {
        out << "Usage: provisioner-bootenv [-c config.yaml] <action>\n";
        std::apply([&out](auto &&...args) { Argument::printHelp(out, args...); }, argumentList);
    }

    void CommandLine::parseArgs(const std::vector<std::string> &args) {
        for(auto i = args.begin(); i != args.end(); i++) {
            if(!std::apply(
                   [](auto &&...args) { return Argument::processArg(args...); },
                   std::tuple_cat(
                       std::tuple<CommandLine &, ArgumentIterator>{
                           *this, ArgumentIterator{args, i}},
                       argumentList))) {
                LOG.atError()
                    .event("parse-args-error")
                    .logAndThrow(errors::CommandLineArgumentError{
                        std::string("Unrecognized command: ") + *i});
            }
        }
    }

} // namespace cli
