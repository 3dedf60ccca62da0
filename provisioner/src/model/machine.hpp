#pragma once
#include "conv/archive.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace model {

    /**
     * Machine record as held by the machine store. Only the fields rendering needs are read.
     */
    struct Machine : public conv::Serializable {
        std::string name;
        std::string uuid;
        std::string address;
        std::string bootEnv;
        std::map<std::string, conv::ValueType> params;
        int64_t tenantId{0};

        void visit(conv::Archive &archive) override {
            archive.setIgnoreCase();
            archive("Name", name);
            archive("Uuid", uuid);
            archive("Address", address);
            archive("BootEnv", bootEnv);
            archive("Params", params);
            archive("TenantId", tenantId);
        }

        /**
         * IPv4 address as eight upper-case hex digits (pxelinux style). No value if the address
         * is not a dotted quad.
         */
        [[nodiscard]] std::optional<std::string> hexAddress() const;

        [[nodiscard]] std::string shortName() const;

        [[nodiscard]] std::string path() const {
            return "machines/" + uuid;
        }

        [[nodiscard]] std::string url(std::string_view provisionerUrl) const {
            return std::string{provisionerUrl} + "/" + path();
        }

        [[nodiscard]] bool hasParam(const std::string &key) const {
            return params.find(key) != params.end();
        }
    };

} // namespace model
