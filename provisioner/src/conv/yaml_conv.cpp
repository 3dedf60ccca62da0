#include "yaml_conv.hpp"
#include "errors/errors.hpp"
#include "util/string_util.hpp"

#include <optional>

namespace conv {

    YAML::Node YamlDearchiver::findMember(std::string_view name) const {
        if(!_node.IsMap()) {
            return YAML::Node{YAML::NodeType::Undefined};
        }
        std::optional<YAML::Node> folded;
        for(const auto &i : _node) {
            auto memberName = i.first.as<std::string>();
            if(memberName == name) {
                return i.second;
            }
            if(!folded.has_value() && _ignoreKeyCase && util::iequals(memberName, name)) {
                folded.emplace(i.second);
            }
        }
        return folded.value_or(YAML::Node{YAML::NodeType::Undefined});
    }

    std::shared_ptr<ArchiveAdapter> YamlDearchiver::key(std::string_view name) {
        auto member = findMember(name);
        if(!member.IsDefined()) {
            return NullArchiveEntry::getNull();
        }
        auto child = std::make_shared<YamlDearchiver>(member);
        child->setIgnoreKeyCase(_ignoreKeyCase);
        return child;
    }

    std::shared_ptr<ArchiveAdapter> YamlDearchiver::list() {
        if(!hasValue()) {
            return NullArchiveEntry::getNull();
        }
        if(!_node.IsSequence()) {
            throw errors::ConfigError("Expecting a list");
        }
        auto child = std::make_shared<YamlListDearchiver>(_node);
        child->setIgnoreKeyCase(_ignoreKeyCase);
        return child;
    }

    std::vector<std::string> YamlDearchiver::keys() const {
        std::vector<std::string> names;
        if(_node.IsMap()) {
            for(const auto &i : _node) {
                names.push_back(i.first.as<std::string>());
            }
        }
        return names;
    }

    // NOLINTNEXTLINE(*-no-recursion)
    ValueType YamlDearchiver::toValue(const YAML::Node &node) {
        switch(node.Type()) {
            case YAML::NodeType::Map: {
                auto result = ValueType::object();
                for(const auto &i : node) {
                    result[i.first.as<std::string>()] = toValue(i.second);
                }
                return result;
            }
            case YAML::NodeType::Sequence: {
                auto result = ValueType::array();
                for(const auto &i : node) {
                    result.push_back(toValue(i));
                }
                return result;
            }
            case YAML::NodeType::Scalar:
                // yaml-cpp does not retain scalar types, keep the text form
                return node.Scalar();
            default:
                return nullptr;
        }
    }

    void YamlDearchiver::visit(ValueType &vt) {
        vt = toValue(_node);
    }

    void YamlDearchiver::visit(bool &b) {
        if(!hasValue()) {
            b = false;
            return;
        }
        try {
            b = _node.as<bool>();
        } catch(const YAML::Exception &e) {
            throw errors::ConfigError(std::string("Expecting a boolean: ") + e.what());
        }
    }

    void YamlDearchiver::visit(int64_t &i) {
        if(!hasValue()) {
            i = 0;
            return;
        }
        try {
            i = _node.as<int64_t>();
        } catch(const YAML::Exception &e) {
            throw errors::ConfigError(std::string("Expecting an integer: ") + e.what());
        }
    }

    void YamlDearchiver::visit(double &d) {
        if(!hasValue()) {
            d = 0.0;
            return;
        }
        try {
            d = _node.as<double>();
        } catch(const YAML::Exception &e) {
            throw errors::ConfigError(std::string("Expecting a number: ") + e.what());
        }
    }

    void YamlDearchiver::visit(std::string &str) {
        if(!hasValue()) {
            str.clear();
            return;
        }
        if(!_node.IsScalar()) {
            throw errors::ConfigError("Expecting a scalar value");
        }
        str = _node.Scalar();
    }

    YamlDearchiver YamlListDearchiver::element() const {
        YamlDearchiver element{_sequence[_index]};
        element.setIgnoreKeyCase(_ignoreKeyCase);
        return element;
    }

    std::shared_ptr<ArchiveAdapter> YamlListDearchiver::key(std::string_view name) {
        return element().key(name);
    }

    std::vector<std::string> YamlListDearchiver::keys() const {
        return element().keys();
    }

    void YamlListDearchiver::visit(ValueType &vt) {
        element().visit(vt);
    }

    void YamlListDearchiver::visit(bool &b) {
        element().visit(b);
    }

    void YamlListDearchiver::visit(int64_t &i) {
        element().visit(i);
    }

    void YamlListDearchiver::visit(double &d) {
        element().visit(d);
    }

    void YamlListDearchiver::visit(std::string &str) {
        element().visit(str);
    }

    void YamlHelper::read(const std::filesystem::path &path, Serializable &target) {
        YAML::Node root;
        try {
            root = YAML::LoadFile(path.string());
        } catch(const YAML::Exception &e) {
            throw errors::ConfigError(
                "Unable to read " + path.generic_string() + ": " + e.what());
        }
        read(root, target);
    }

    void YamlHelper::read(const YAML::Node &root, Serializable &target) {
        if(!root.IsMap() && !root.IsNull()) {
            throw errors::ConfigError("Expecting a map");
        }
        Archive::transform<YamlDearchiver>(target, root);
    }

} // namespace conv
