#pragma once

#include "archive.hpp"

#include <filesystem>
#include <yaml-cpp/yaml.h>

namespace conv {

    /**
     * Reads a structure out of a yaml-cpp node. Used for configuration, which is read-only.
     */
    class YamlDearchiver : public ArchiveAdapter {
        YAML::Node _node;

        [[nodiscard]] YAML::Node findMember(std::string_view name) const;

    public:
        explicit YamlDearchiver(YAML::Node node) : _node(std::move(node)) {
        }

        std::shared_ptr<ArchiveAdapter> key(std::string_view name) override;
        std::shared_ptr<ArchiveAdapter> list() override;
        [[nodiscard]] std::vector<std::string> keys() const override;

        [[nodiscard]] bool canVisit() const override {
            return _node.IsDefined();
        }

        [[nodiscard]] bool hasValue() const override {
            return _node.IsDefined() && !_node.IsNull();
        }

        void visit(ValueType &vt) override;
        void visit(bool &b) override;
        void visit(int64_t &i) override;
        void visit(double &d) override;
        void visit(std::string &str) override;

        static ValueType toValue(const YAML::Node &node);
    };

    class YamlListDearchiver : public ArchiveAdapter {
        YAML::Node _sequence;
        size_t _index{0};

        [[nodiscard]] YamlDearchiver element() const;

    public:
        explicit YamlListDearchiver(YAML::Node sequence) : _sequence(std::move(sequence)) {
        }

        std::shared_ptr<ArchiveAdapter> key(std::string_view name) override;
        [[nodiscard]] std::vector<std::string> keys() const override;

        [[nodiscard]] bool canVisit() const override {
            return _index < _sequence.size();
        }

        [[nodiscard]] bool hasValue() const override {
            return canVisit();
        }

        void visit(ValueType &vt) override;
        void visit(bool &b) override;
        void visit(int64_t &i) override;
        void visit(double &d) override;
        void visit(std::string &str) override;

        bool advance() noexcept override {
            ++_index;
            return canVisit();
        }
    };

    struct YamlHelper {
        static void read(const std::filesystem::path &path, Serializable &target);
        static void read(const YAML::Node &root, Serializable &target);
    };

} // namespace conv
