#pragma once

#include "../core/dynamic_ref.hpp"
#include "../core/error.hpp"
#include "../core/types.hpp"
#include <datapod/datapod.hpp>
#include <string>
#include <type_traits>
#include <variant>

namespace isogml::timelog {

    // ─── Column scalar kinds ─────────────────────────────────────────────────────
    enum class ScalarKind : u8 { String, Byte, Int16, Int32, UInt16, UInt32, UInt64 };

    inline const char *to_string(ScalarKind k) noexcept {
        switch (k) {
        case ScalarKind::String:
            return "String";
        case ScalarKind::Byte:
            return "Byte";
        case ScalarKind::Int16:
            return "Int16";
        case ScalarKind::Int32:
            return "Int32";
        case ScalarKind::UInt16:
            return "UInt16";
        case ScalarKind::UInt32:
            return "UInt32";
        case ScalarKind::UInt64:
            return "UInt64";
        }
        return "?";
    }

    // Alternative order follows ScalarKind
    using ColumnValues = std::variant<dp::Vector<dp::String>, dp::Vector<u8>, dp::Vector<i16>, dp::Vector<i32>,
                                      dp::Vector<u16>, dp::Vector<u32>, dp::Vector<u64>>;

    // ─── Column ──────────────────────────────────────────────────────────────────
    // One named, typed sequence. Process-data columns additionally carry their
    // DynamicRef identity and are always Int32 by format definition.
    class Column {
        dp::String name_;
        ColumnValues values_;
        dp::Optional<DynamicRef> identity_;

        Column(dp::String name, ColumnValues values, dp::Optional<DynamicRef> identity)
            : name_(std::move(name)), values_(std::move(values)), identity_(std::move(identity)) {}

      public:
        static Column header(dp::String name, ScalarKind kind) {
            return Column(std::move(name), make_values(kind), dp::nullopt);
        }

        static Column process_data(dp::String name, DynamicRef identity) {
            return Column(std::move(name), dp::Vector<i32>{}, std::move(identity));
        }

        const dp::String &name() const noexcept { return name_; }
        ScalarKind kind() const noexcept { return static_cast<ScalarKind>(values_.index()); }
        const dp::Optional<DynamicRef> &identity() const noexcept { return identity_; }

        usize size() const noexcept {
            return std::visit([](const auto &v) { return v.size(); }, values_);
        }

        bool empty() const noexcept { return size() == 0; }

        // Typed access; T must match kind()
        template <typename T> dp::Vector<T> *as() noexcept { return std::get_if<dp::Vector<T>>(&values_); }
        template <typename T> const dp::Vector<T> *as() const noexcept {
            return std::get_if<dp::Vector<T>>(&values_);
        }

        dp::Vector<i32> *as_i32() noexcept { return as<i32>(); }
        const dp::Vector<i32> *as_i32() const noexcept { return as<i32>(); }

        template <typename T> Result<void> push(T value) {
            auto *v = as<T>();
            if (!v) {
                return Result<void>::err(
                    Error::invalid_argument("column " + name_ + " holds " + to_string(kind())));
            }
            v->push_back(std::move(value));
            return {};
        }

        void erase_front() {
            std::visit(
                [](auto &v) {
                    if (!v.empty())
                        v.erase(v.begin());
                },
                values_);
        }

        void truncate(usize rows) {
            std::visit(
                [rows](auto &v) {
                    while (v.size() > rows)
                        v.pop_back();
                },
                values_);
        }

        void clear() {
            std::visit([](auto &v) { v.clear(); }, values_);
        }

        dp::String value_string(usize index) const {
            return std::visit(
                [index](const auto &v) -> dp::String {
                    using T = typename std::decay_t<decltype(v)>::value_type;
                    if (index >= v.size())
                        return dp::String();
                    if constexpr (std::is_same_v<T, dp::String>) {
                        return v[index];
                    } else {
                        // u8 must print as a number, not a character
                        using Wide = std::conditional_t<std::is_signed_v<T>, i64, u64>;
                        return dp::String(std::to_string(static_cast<Wide>(v[index])));
                    }
                },
                values_);
        }

      private:
        static ColumnValues make_values(ScalarKind kind) {
            switch (kind) {
            case ScalarKind::String:
                return dp::Vector<dp::String>{};
            case ScalarKind::Byte:
                return dp::Vector<u8>{};
            case ScalarKind::Int16:
                return dp::Vector<i16>{};
            case ScalarKind::Int32:
                return dp::Vector<i32>{};
            case ScalarKind::UInt16:
                return dp::Vector<u16>{};
            case ScalarKind::UInt32:
                return dp::Vector<u32>{};
            case ScalarKind::UInt64:
                return dp::Vector<u64>{};
            }
            return dp::Vector<dp::String>{};
        }
    };

    // ─── Channel set ─────────────────────────────────────────────────────────────
    // Ordered columns; after a decode completes all columns have equal length.
    class ChannelSet {
        dp::Vector<Column> columns_;

      public:
        Column &add(Column c) {
            columns_.push_back(std::move(c));
            return columns_.back();
        }

        dp::Vector<Column> &columns() noexcept { return columns_; }
        const dp::Vector<Column> &columns() const noexcept { return columns_; }

        usize count() const noexcept { return columns_.size(); }
        bool empty() const noexcept { return columns_.empty(); }

        Column *find(const dp::String &name) noexcept {
            for (auto &c : columns_) {
                if (c.name() == name)
                    return &c;
            }
            return nullptr;
        }

        const Column *find(const dp::String &name) const noexcept {
            for (const auto &c : columns_) {
                if (c.name() == name)
                    return &c;
            }
            return nullptr;
        }

        // All columns carrying the identity; more than one is a schema problem
        dp::Vector<const Column *> find(const DynamicRef &ref) const {
            dp::Vector<const Column *> out;
            for (const auto &c : columns_) {
                if (c.identity().has_value() && *c.identity() == ref)
                    out.push_back(&c);
            }
            return out;
        }

        dp::Optional<usize> index_of(const DynamicRef &ref) const noexcept {
            for (usize i = 0; i < columns_.size(); ++i) {
                if (columns_[i].identity().has_value() && *columns_[i].identity() == ref)
                    return i;
            }
            return dp::nullopt;
        }

        usize rows() const noexcept { return columns_.empty() ? 0 : columns_.front().size(); }

        bool uniform() const noexcept {
            for (const auto &c : columns_) {
                if (c.size() != rows())
                    return false;
            }
            return true;
        }

        void clear() { columns_.clear(); }
    };

} // namespace isogml::timelog
