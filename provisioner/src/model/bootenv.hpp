#pragma once
#include "conv/archive.hpp"
#include "util/string_util.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace model {

    /**
     * Auxiliary file an OS install needs beside the ISO (e.g. a netboot image).
     */
    struct FileData : public conv::Serializable {
        std::string url;
        std::string name;
        std::string validationUrl;
        std::string validationMethod;

        void visit(conv::Archive &archive) override {
            archive.setIgnoreCase();
            archive("URL", url);
            archive("Name", name);
            archive("ValidationURL", validationUrl);
            archive("ValidationMethod", validationMethod);
        }

        bool operator==(const FileData &other) const {
            return std::tie(url, name, validationUrl, validationMethod)
                   == std::tie(other.url, other.name, other.validationUrl, other.validationMethod);
        }

        bool operator!=(const FileData &other) const {
            return !(*this == other);
        }
    };

    struct OsInfo : public conv::Serializable {
        std::string name;
        std::string family;
        std::string codename;
        std::string version;
        std::string isoFile;
        std::string isoSha256;
        std::string isoUrl;
        std::vector<FileData> files;

        void visit(conv::Archive &archive) override {
            archive.setIgnoreCase();
            archive("Name", name);
            archive("Family", family);
            archive("Codename", codename);
            archive("Version", version);
            archive("IsoFile", isoFile);
            archive("IsoSha256", isoSha256);
            archive("IsoUrl", isoUrl);
            archive("Files", files);
        }

        bool operator==(const OsInfo &other) const {
            return std::tie(name, family, codename, version, isoFile, isoSha256, isoUrl, files)
                   == std::tie(
                       other.name,
                       other.family,
                       other.codename,
                       other.version,
                       other.isoFile,
                       other.isoSha256,
                       other.isoUrl,
                       other.files);
        }

        bool operator!=(const OsInfo &other) const {
            return !(*this == other);
        }
    };

    /**
     * One artifact of a boot environment: a role name, a path expression and the identifier of
     * the content template in the template store.
     */
    struct TemplateInfo : public conv::Serializable {
        std::string name;
        std::string path;
        std::string uuid;

        void visit(conv::Archive &archive) override {
            archive.setIgnoreCase();
            archive("Name", name);
            archive("Path", path);
            archive("UUID", uuid);
        }

        [[nodiscard]] bool isComplete() const noexcept {
            return !name.empty() && !path.empty() && !uuid.empty();
        }

        bool operator==(const TemplateInfo &other) const {
            return std::tie(name, path, uuid) == std::tie(other.name, other.path, other.uuid);
        }

        bool operator!=(const TemplateInfo &other) const {
            return !(*this == other);
        }
    };

    struct BootEnv : public conv::Serializable {
        static constexpr std::string_view INSTALL_SUFFIX{"-install"};

        std::string name;
        OsInfo os;
        std::vector<TemplateInfo> templates;
        std::string kernel;
        std::vector<std::string> initrds;
        std::string bootParams;
        std::vector<std::string> requiredParams;
        int64_t tenantId{0};

        void visit(conv::Archive &archive) override {
            archive.setIgnoreCase();
            archive("Name", name);
            archive("OS", os);
            archive("Templates", templates);
            archive("Kernel", kernel);
            archive("Initrds", initrds);
            archive("BootParams", bootParams);
            archive("RequiredParams", requiredParams);
            archive("TenantId", tenantId);
        }

        /**
         * Compares every persisted field. Two definitions that compare equal render identical
         * artifacts for the same machine and template contents.
         */
        bool operator==(const BootEnv &other) const {
            return std::tie(
                       name, os, templates, kernel, initrds, bootParams, requiredParams, tenantId)
                   == std::tie(
                       other.name,
                       other.os,
                       other.templates,
                       other.kernel,
                       other.initrds,
                       other.bootParams,
                       other.requiredParams,
                       other.tenantId);
        }

        bool operator!=(const BootEnv &other) const {
            return !(*this == other);
        }

        [[nodiscard]] bool isInstall() const {
            return util::endsWith(name, INSTALL_SUFFIX);
        }

        [[nodiscard]] const TemplateInfo *findTemplate(std::string_view templateName) const;

        [[nodiscard]] static BootEnv fromJson(std::string_view json);
    };

} // namespace model
