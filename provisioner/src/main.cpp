#include "cli/application.hpp"
#include "cli/command_line.hpp"
#include "config/engine_config.hpp"
#include "errors/errors.hpp"
#include "logging/log_manager.hpp"
#include "logging/logging.hpp"

#include <iostream>
#include <string>
#include <vector>

static const auto LOG = // NOLINT(cert-err58-cpp)
    logging::Logger::of("com.example.provisioner.Main");

int main(int argc, char *argv[]) {
    try {
        cli::CommandLine commandLine;
        commandLine.parseArgs(std::vector<std::string>(argv + 1, argv + argc)); // NOLINT

        if(commandLine.getAction() == cli::Action::Help
           || commandLine.getAction() == cli::Action::None) {
            cli::CommandLine::printHelp(std::cout);
            return 0;
        }

        config::EngineConfig config;
        if(!commandLine.getConfigPath().empty()) {
            config = config::loadConfig(commandLine.getConfigPath());
        }
        logging::LogManager::instance().reconfigure(config.logging.toLogConfig());

        cli::Application application{config};
        application.run(commandLine, std::cout);
        logging::LogManager::instance().syncOutput();
        return 0;
    } catch(const errors::Error &e) {
        LOG.atError("provisioner-failed").cause(e).log();
        std::cerr << e.kind() << ": " << e.what() << '\n';
    } catch(const std::exception &e) {
        LOG.atError("provisioner-failed").cause(e).log();
        std::cerr << e.what() << '\n';
    }
    logging::LogManager::instance().syncOutput();
    return 1;
}
