#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace conv {

    class Archive;

    /**
     * Free-form structured value, used for machine parameters and template data.
     */
    using ValueType = nlohmann::json;

    /**
     * Interface class implemented by structures that implement the archive visit pattern. The
     * same visit() reads a structure from a document or writes it to one.
     */
    // NOLINTNEXTLINE(*-special-member-functions)
    class Serializable {
    public:
        virtual ~Serializable() noexcept = default;
        virtual void visit(Archive &archive) = 0;
    };

    /**
     * Base class for archiver or de-archiver
     */
    class ArchiveAdapter {
    protected:
        bool _ignoreKeyCase = false;

    public:
        ArchiveAdapter() noexcept = default;
        virtual ~ArchiveAdapter() noexcept = default;
        ArchiveAdapter(const ArchiveAdapter &other) = delete;
        ArchiveAdapter(ArchiveAdapter &&) noexcept = default;
        ArchiveAdapter &operator=(const ArchiveAdapter &other) = delete;
        ArchiveAdapter &operator=(ArchiveAdapter &&) = delete;

        void setIgnoreKeyCase(bool ignoreCase = true) noexcept {
            _ignoreKeyCase = ignoreCase;
        }
        [[nodiscard]] bool isIgnoreCase() const noexcept {
            return _ignoreKeyCase;
        }
        /**
         * Visit a key - returned adapter reads or changes value of the key
         */
        virtual std::shared_ptr<ArchiveAdapter> key(std::string_view name) {
            throw std::runtime_error("Not a structure");
        }
        /**
         * Visit as list
         */
        virtual std::shared_ptr<ArchiveAdapter> list() {
            throw std::runtime_error("Not a list");
        }
        [[nodiscard]] virtual bool canVisit() const = 0;
        [[nodiscard]] virtual bool hasValue() const = 0;
        virtual void visit(ValueType &vt) = 0;
        virtual void visit(bool &) = 0;
        virtual void visit(int64_t &) = 0;
        virtual void visit(double &) = 0;
        virtual void visit(std::string &) = 0;
        /**
         * @return true if archiving, false if dearchiving
         */
        [[nodiscard]] virtual bool isArchiving() const noexcept {
            return false;
        }
        /**
         * Call on a list adapter to advance element index
         */
        virtual bool advance() noexcept {
            return false;
        }
        [[nodiscard]] virtual std::vector<std::string> keys() const {
            return {};
        }
    };

    /**
     * Entry that does not exist in the source document; dearchiving produces defaults.
     */
    class NullArchiveEntry : public ArchiveAdapter {
    public:
        static std::shared_ptr<NullArchiveEntry> getNull();

        std::shared_ptr<ArchiveAdapter> key(std::string_view) override {
            return getNull();
        }

        std::shared_ptr<ArchiveAdapter> list() override {
            return getNull();
        }

        [[nodiscard]] bool canVisit() const override {
            return false;
        }

        [[nodiscard]] bool hasValue() const override {
            return false;
        }

        void visit(ValueType &vt) override {
            vt = ValueType{};
        }
        void visit(bool &v) override {
            v = false;
        }
        void visit(int64_t &v) override {
            v = 0;
        }
        void visit(double &v) override {
            v = 0.0;
        }
        void visit(std::string &v) override {
            v.clear();
        }
    };

    class Archive {
        std::shared_ptr<ArchiveAdapter> _adapter;

        template<typename T>
        void visitList(std::vector<T> &value) {
            auto list = Archive(_adapter->list());
            if(list.isArchiving()) {
                for(auto &v : value) {
                    list.visit(v);
                    list->advance();
                }
            } else {
                value.clear();
                while(list->canVisit()) {
                    T v{};
                    list.visit(v);
                    value.push_back(std::move(v));
                    list->advance();
                }
            }
        }

    public:
        explicit Archive(std::shared_ptr<ArchiveAdapter> adapter) : _adapter(std::move(adapter)) {
        }

        void setIgnoreCase(bool f = true) {
            _adapter->setIgnoreKeyCase(f);
        }

        [[nodiscard]] bool isArchiving() const {
            return _adapter->isArchiving();
        }

        [[nodiscard]] bool hasValue() const {
            return _adapter->hasValue();
        }

        template<typename T>
        void operator()(std::string_view name, T &value) {
            key(name).visit(value);
        }

        [[nodiscard]] Archive operator[](std::string_view name) {
            return key(name);
        }

        [[nodiscard]] Archive key(std::string_view name) {
            return Archive(_adapter->key(name));
        }

        [[nodiscard]] std::vector<std::string> keys() const {
            return _adapter->keys();
        }

        template<typename T>
        void visit(std::vector<T> &value) {
            visitList(value);
        }

        template<typename V>
        void visit(std::map<std::string, V> &value) {
            if(isArchiving()) {
                for(auto &kv : value) {
                    key(kv.first).visit(kv.second);
                }
            } else {
                value.clear();
                for(const auto &k : keys()) {
                    V destVal{};
                    key(k).visit(destVal);
                    value.emplace(k, std::move(destVal));
                }
            }
        }

        template<typename T>
        void visit(std::optional<T> &ov) {
            if(isArchiving()) {
                if(ov.has_value()) {
                    visit(ov.value());
                }
            } else if(hasValue()) {
                T v{};
                visit(v);
                ov.emplace(std::move(v));
            } else {
                ov.reset();
            }
        }

        template<typename T>
        void visit(T &value) {
            if constexpr(std::is_base_of_v<Serializable, T>) {
                // Delegate to class itself
                value.visit(*this);
            } else if constexpr(std::is_same_v<T, bool> || std::is_same_v<T, ValueType>) {
                _adapter->visit(value);
            } else if constexpr(std::is_integral_v<T>) {
                auto wide = static_cast<int64_t>(value);
                _adapter->visit(wide);
                value = static_cast<T>(wide);
            } else if constexpr(std::is_floating_point_v<T>) {
                auto wide = static_cast<double>(value);
                _adapter->visit(wide);
                value = static_cast<T>(wide);
            } else {
                _adapter->visit(value);
            }
        }

        [[nodiscard]] ArchiveAdapter *operator->() {
            return _adapter.get();
        }

        /**
         * Combine make and visit together
         */
        template<typename AdapterType, typename DataType, typename... Args>
        static void transform(DataType &data, Args &&...args) {
            static_assert(std::is_base_of_v<ArchiveAdapter, AdapterType>);
            auto archive = Archive(std::make_shared<AdapterType>(std::forward<Args>(args)...));
            archive.visit(data);
        }
    };

} // namespace conv
