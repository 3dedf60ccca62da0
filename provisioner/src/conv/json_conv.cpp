#include "json_conv.hpp"
#include "errors/errors.hpp"
#include "util/string_util.hpp"

#include <fstream>
#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <sstream>

namespace conv {

    const rapidjson::Value *JsonDearchiver::findMember(std::string_view name) const {
        if(_value == nullptr || !_value->IsObject()) {
            return nullptr;
        }
        // exact match wins over a case-insensitive one
        const rapidjson::Value *folded = nullptr;
        for(auto i = _value->MemberBegin(); i != _value->MemberEnd(); ++i) {
            std::string_view memberName{i->name.GetString(), i->name.GetStringLength()};
            if(memberName == name) {
                return &i->value;
            }
            if(folded == nullptr && _ignoreKeyCase && util::iequals(memberName, name)) {
                folded = &i->value;
            }
        }
        return folded;
    }

    std::shared_ptr<ArchiveAdapter> JsonDearchiver::key(std::string_view name) {
        const auto *member = findMember(name);
        if(member == nullptr) {
            return NullArchiveEntry::getNull();
        }
        auto child = std::make_shared<JsonDearchiver>(member);
        child->setIgnoreKeyCase(_ignoreKeyCase);
        return child;
    }

    std::shared_ptr<ArchiveAdapter> JsonDearchiver::list() {
        if(_value == nullptr || _value->IsNull()) {
            return NullArchiveEntry::getNull();
        }
        if(!_value->IsArray()) {
            throw errors::JsonParseError("Expected a list");
        }
        auto child = std::make_shared<JsonListDearchiver>(_value);
        child->setIgnoreKeyCase(_ignoreKeyCase);
        return child;
    }

    std::vector<std::string> JsonDearchiver::keys() const {
        std::vector<std::string> names;
        if(_value != nullptr && _value->IsObject()) {
            for(auto i = _value->MemberBegin(); i != _value->MemberEnd(); ++i) {
                names.emplace_back(i->name.GetString(), i->name.GetStringLength());
            }
        }
        return names;
    }

    // NOLINTNEXTLINE(*-no-recursion)
    ValueType JsonDearchiver::toValue(const rapidjson::Value &value) {
        switch(value.GetType()) {
            case rapidjson::kNullType:
                return nullptr;
            case rapidjson::kFalseType:
                return false;
            case rapidjson::kTrueType:
                return true;
            case rapidjson::kStringType:
                return std::string{value.GetString(), value.GetStringLength()};
            case rapidjson::kNumberType:
                if(value.IsInt64()) {
                    return value.GetInt64();
                } else if(value.IsUint64()) {
                    return value.GetUint64();
                }
                return value.GetDouble();
            case rapidjson::kArrayType: {
                auto result = ValueType::array();
                for(const auto &element : value.GetArray()) {
                    result.push_back(toValue(element));
                }
                return result;
            }
            case rapidjson::kObjectType: {
                auto result = ValueType::object();
                for(const auto &member : value.GetObject()) {
                    result[std::string{member.name.GetString(), member.name.GetStringLength()}] =
                        toValue(member.value);
                }
                return result;
            }
        }
        return nullptr;
    }

    void JsonDearchiver::visit(ValueType &vt) {
        vt = _value == nullptr ? ValueType{} : toValue(*_value);
    }

    void JsonDearchiver::visit(bool &b) {
        if(!hasValue()) {
            b = false;
        } else if(_value->IsBool()) {
            b = _value->GetBool();
        } else {
            throw errors::JsonParseError("Expected a boolean");
        }
    }

    void JsonDearchiver::visit(int64_t &i) {
        if(!hasValue()) {
            i = 0;
        } else if(_value->IsInt64()) {
            i = _value->GetInt64();
        } else {
            throw errors::JsonParseError("Expected an integer");
        }
    }

    void JsonDearchiver::visit(double &d) {
        if(!hasValue()) {
            d = 0.0;
        } else if(_value->IsNumber()) {
            d = _value->GetDouble();
        } else {
            throw errors::JsonParseError("Expected a number");
        }
    }

    void JsonDearchiver::visit(std::string &str) {
        if(!hasValue()) {
            str.clear();
        } else if(_value->IsString()) {
            str.assign(_value->GetString(), _value->GetStringLength());
        } else {
            throw errors::JsonParseError("Expected a string");
        }
    }

    JsonDearchiver JsonListDearchiver::element() const {
        JsonDearchiver element{&(*_array)[_index]};
        element.setIgnoreKeyCase(_ignoreKeyCase);
        return element;
    }

    std::shared_ptr<ArchiveAdapter> JsonListDearchiver::key(std::string_view name) {
        return element().key(name);
    }

    std::shared_ptr<ArchiveAdapter> JsonListDearchiver::list() {
        return element().list();
    }

    std::vector<std::string> JsonListDearchiver::keys() const {
        return element().keys();
    }

    void JsonListDearchiver::visit(ValueType &vt) {
        element().visit(vt);
    }

    void JsonListDearchiver::visit(bool &b) {
        element().visit(b);
    }

    void JsonListDearchiver::visit(int64_t &i) {
        element().visit(i);
    }

    void JsonListDearchiver::visit(double &d) {
        element().visit(d);
    }

    void JsonListDearchiver::visit(std::string &str) {
        element().visit(str);
    }

    std::shared_ptr<ArchiveAdapter> JsonArchiver::key(std::string_view name) {
        if(!_target->IsObject()) {
            _target->SetObject();
        }
        rapidjson::Value memberName{
            name.data(), static_cast<rapidjson::SizeType>(name.size()), *_allocator};
        _target->AddMember(memberName, rapidjson::Value{}, *_allocator);
        // Member storage is stable until the next AddMember on this object, and keys are
        // visited one at a time.
        auto &member = (_target->MemberEnd() - 1)->value;
        return std::make_shared<JsonArchiver>(&member, _allocator);
    }

    std::shared_ptr<ArchiveAdapter> JsonArchiver::list() {
        _target->SetArray();
        return std::make_shared<JsonListArchiver>(_target, _allocator);
    }

    // NOLINTNEXTLINE(*-no-recursion)
    rapidjson::Value JsonArchiver::fromValue(
        const ValueType &value, rapidjson::Document::AllocatorType &allocator) {
        switch(value.type()) {
            case ValueType::value_t::boolean:
                return rapidjson::Value{value.get<bool>()};
            case ValueType::value_t::number_integer:
                return rapidjson::Value{value.get<int64_t>()};
            case ValueType::value_t::number_unsigned:
                return rapidjson::Value{value.get<uint64_t>()};
            case ValueType::value_t::number_float:
                return rapidjson::Value{value.get<double>()};
            case ValueType::value_t::string: {
                const auto &str = value.get_ref<const std::string &>();
                return rapidjson::Value{
                    str.c_str(), static_cast<rapidjson::SizeType>(str.size()), allocator};
            }
            case ValueType::value_t::array: {
                rapidjson::Value result{rapidjson::kArrayType};
                for(const auto &element : value) {
                    result.PushBack(fromValue(element, allocator), allocator);
                }
                return result;
            }
            case ValueType::value_t::object: {
                rapidjson::Value result{rapidjson::kObjectType};
                for(auto i = value.begin(); i != value.end(); ++i) {
                    const auto &k = i.key();
                    rapidjson::Value name{
                        k.c_str(), static_cast<rapidjson::SizeType>(k.size()), allocator};
                    result.AddMember(name, fromValue(i.value(), allocator), allocator);
                }
                return result;
            }
            default:
                return rapidjson::Value{};
        }
    }

    void JsonArchiver::visit(ValueType &vt) {
        *_target = fromValue(vt, *_allocator);
    }

    void JsonArchiver::visit(bool &b) {
        _target->SetBool(b);
    }

    void JsonArchiver::visit(int64_t &i) {
        _target->SetInt64(i);
    }

    void JsonArchiver::visit(double &d) {
        _target->SetDouble(d);
    }

    void JsonArchiver::visit(std::string &str) {
        _target->SetString(str.c_str(), static_cast<rapidjson::SizeType>(str.size()), *_allocator);
    }

    JsonArchiver JsonListArchiver::current() {
        if(!_hasCurrent) {
            _array->PushBack(rapidjson::Value{}, *_allocator);
            _hasCurrent = true;
        }
        return JsonArchiver{&(*_array)[_array->Size() - 1], _allocator};
    }

    std::shared_ptr<ArchiveAdapter> JsonListArchiver::key(std::string_view name) {
        return current().key(name);
    }

    void JsonListArchiver::visit(ValueType &vt) {
        current().visit(vt);
    }

    void JsonListArchiver::visit(bool &b) {
        current().visit(b);
    }

    void JsonListArchiver::visit(int64_t &i) {
        current().visit(i);
    }

    void JsonListArchiver::visit(double &d) {
        current().visit(d);
    }

    void JsonListArchiver::visit(std::string &str) {
        current().visit(str);
    }

    void JsonHelper::read(std::string_view json, Serializable &target) {
        rapidjson::Document doc;
        doc.Parse(json.data(), json.size());
        if(doc.HasParseError()) {
            throw errors::JsonParseError(
                std::string("Unable to parse JSON: ")
                + rapidjson::GetParseError_En(doc.GetParseError())
                + " at offset " + std::to_string(doc.GetErrorOffset()));
        }
        Archive::transform<JsonDearchiver>(target, &doc);
    }

    void JsonHelper::read(const std::filesystem::path &path, Serializable &target) {
        std::ifstream stream{path};
        if(!stream.is_open()) {
            throw errors::JsonParseError("Unable to open " + path.generic_string());
        }
        std::ostringstream buffer;
        buffer << stream.rdbuf();
        read(buffer.str(), target);
    }

    std::string JsonHelper::write(Serializable &source) {
        rapidjson::Document doc;
        Archive::transform<JsonArchiver>(source, &doc, &doc.GetAllocator());
        rapidjson::StringBuffer buffer;
        rapidjson::PrettyWriter<rapidjson::StringBuffer> writer{buffer};
        doc.Accept(writer);
        return {buffer.GetString(), buffer.GetSize()};
    }

} // namespace conv
