#pragma once

#include "util/lookup_table.hpp"

#include <filesystem>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace cli {

    enum class Action { None, Help, Apply, Delete, Render, Clear, List };

    inline constexpr util::LookupTable<Action, std::string_view, 7> ACTION_NAMES{
        Action::None,
        std::string_view{"none"},
        Action::Help,
        std::string_view{"help"},
        Action::Apply,
        std::string_view{"apply"},
        Action::Delete,
        std::string_view{"delete"},
        Action::Render,
        std::string_view{"render"},
        Action::Clear,
        std::string_view{"clear"},
        Action::List,
        std::string_view{"list"}};

    /**
     * Options of the provisioner-bootenv tool. Exactly one action may be given.
     */
    class CommandLine final {
    private:
        std::filesystem::path _configPath;
        Action _action{Action::None};
        std::string _target;

    public:
        void parseArgs(const std::vector<std::string> &args);

        static void printHelp(std::ostream &out);

        /**
         * Throws errors::CommandLineArgumentError if an action was already chosen.
         */
        void setAction(Action action, std::string target = {});

        void setConfigPath(std::filesystem::path path) noexcept {
            _configPath = std::move(path);
        }

        [[nodiscard]] const std::filesystem::path &getConfigPath() const noexcept {
            return _configPath;
        }

        [[nodiscard]] Action getAction() const noexcept {
            return _action;
        }

        // file or record name the action applies to
        [[nodiscard]] const std::string &getTarget() const noexcept {
            return _target;
        }
    };

} // namespace cli
