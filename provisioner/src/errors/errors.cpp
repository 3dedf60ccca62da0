#include "errors.hpp"

#include <sstream>

namespace errors {

    std::string MissingRequiredParamsError::describe(
        const std::string &bootEnv,
        const std::string &machine,
        const std::vector<std::string> &missing) {

        std::ostringstream out;
        out << "bootenv: " << bootEnv << " missing required machine params for " << machine
            << ": [";
        bool first = true;
        for(const auto &key : missing) {
            if(!first) {
                out << ", ";
            }
            out << key;
            first = false;
        }
        out << "]";
        return out.str();
    }

} // namespace errors
