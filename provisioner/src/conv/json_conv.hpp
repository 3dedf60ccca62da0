#pragma once

#include "archive.hpp"

#include <filesystem>
#include <rapidjson/document.h>
#include <string>
#include <string_view>

namespace conv {

    /**
     * Reads a structure out of a parsed RapidJSON value. Missing keys read as defaults.
     */
    class JsonDearchiver : public ArchiveAdapter {
        const rapidjson::Value *_value;

        [[nodiscard]] const rapidjson::Value *findMember(std::string_view name) const;

    public:
        explicit JsonDearchiver(const rapidjson::Value *value) noexcept : _value(value) {
        }

        std::shared_ptr<ArchiveAdapter> key(std::string_view name) override;
        std::shared_ptr<ArchiveAdapter> list() override;
        [[nodiscard]] std::vector<std::string> keys() const override;

        [[nodiscard]] bool canVisit() const override {
            return _value != nullptr;
        }

        [[nodiscard]] bool hasValue() const override {
            return _value != nullptr && !_value->IsNull();
        }

        void visit(ValueType &vt) override;
        void visit(bool &b) override;
        void visit(int64_t &i) override;
        void visit(double &d) override;
        void visit(std::string &str) override;

        static ValueType toValue(const rapidjson::Value &value);
    };

    /**
     * Visits the elements of a RapidJSON array in order.
     */
    class JsonListDearchiver : public ArchiveAdapter {
        const rapidjson::Value *_array;
        rapidjson::SizeType _index{0};

        [[nodiscard]] JsonDearchiver element() const;

    public:
        explicit JsonListDearchiver(const rapidjson::Value *array) noexcept : _array(array) {
        }

        std::shared_ptr<ArchiveAdapter> key(std::string_view name) override;
        std::shared_ptr<ArchiveAdapter> list() override;
        [[nodiscard]] std::vector<std::string> keys() const override;

        [[nodiscard]] bool canVisit() const override {
            return _index < _array->Size();
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

    /**
     * Writes a structure into a RapidJSON value owned by a document.
     */
    class JsonArchiver : public ArchiveAdapter {
    protected:
        rapidjson::Value *_target;
        rapidjson::Document::AllocatorType *_allocator;

    public:
        JsonArchiver(
            rapidjson::Value *target, rapidjson::Document::AllocatorType *allocator) noexcept
            : _target(target), _allocator(allocator) {
        }

        std::shared_ptr<ArchiveAdapter> key(std::string_view name) override;
        std::shared_ptr<ArchiveAdapter> list() override;

        [[nodiscard]] bool canVisit() const override {
            return true;
        }

        [[nodiscard]] bool hasValue() const override {
            return !_target->IsNull();
        }

        [[nodiscard]] bool isArchiving() const noexcept override {
            return true;
        }

        void visit(ValueType &vt) override;
        void visit(bool &b) override;
        void visit(int64_t &i) override;
        void visit(double &d) override;
        void visit(std::string &str) override;

        static rapidjson::Value fromValue(
            const ValueType &value, rapidjson::Document::AllocatorType &allocator);
    };

    /**
     * Appends elements to a RapidJSON array. Each advance() starts a new element.
     */
    class JsonListArchiver : public ArchiveAdapter {
        rapidjson::Value *_array;
        rapidjson::Document::AllocatorType *_allocator;
        bool _hasCurrent{false};

        JsonArchiver current();

    public:
        JsonListArchiver(
            rapidjson::Value *array, rapidjson::Document::AllocatorType *allocator) noexcept
            : _array(array), _allocator(allocator) {
        }

        std::shared_ptr<ArchiveAdapter> key(std::string_view name) override;

        [[nodiscard]] bool canVisit() const override {
            return true;
        }

        [[nodiscard]] bool hasValue() const override {
            return !_array->Empty();
        }

        [[nodiscard]] bool isArchiving() const noexcept override {
            return true;
        }

        void visit(ValueType &vt) override;
        void visit(bool &b) override;
        void visit(int64_t &i) override;
        void visit(double &d) override;
        void visit(std::string &str) override;

        bool advance() noexcept override {
            _hasCurrent = false;
            return true;
        }
    };

    /**
     * Helpers to move Serializable structures to and from JSON text.
     */
    struct JsonHelper {
        static void read(std::string_view json, Serializable &target);
        static void read(const std::filesystem::path &path, Serializable &target);
        [[nodiscard]] static std::string write(Serializable &source);
    };

} // namespace conv
