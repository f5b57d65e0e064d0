#pragma once
/*
===============================================================================
DATA STORE — Typed key/value record for solve parameters and statistics
===============================================================================

OVERVIEW
--------
A Solution carries a DataStore describing how it was produced: the backend
that ran, the effective parameters (keys prefixed "param:") and search
statistics (keys prefixed "stat:"). Values are type-erased so that each
backend can record what it measures without widening a fixed struct.

KEY COMPONENTS
--------------
• Value:     type-erased wrapper around std::any with checked access
• DataStore: ordered string-keyed map of Values (deterministic iteration,
             which keeps report rendering stable)

USAGE EXAMPLES
--------------
    DataStore stats;
    stats["param:TimeLimit"] = 10.0;
    stats["stat:Nodes"] = std::int64_t{1532};
    stats["strategy"] = std::string("exact");

    double limit = stats.get_or("param:TimeLimit", 60.0);
    if (auto nodes = stats["stat:Nodes"].try_get<std::int64_t>()) { ... }

THREAD SAFETY
-------------
• Concurrent const access is safe
• Modification requires external synchronization; a Solution's store is
  only written by the backend that creates it

EXCEPTION SAFETY
----------------
• get<T>(): throws std::bad_any_cast on type mismatch
• DataStore::at(): throws std::out_of_range for unknown keys
• get_or(): no-throw for stored values (returns the default on mismatch)

===============================================================================
*/

#include <any>
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <vector>

namespace assign {

    /**
     * @class Value
     * @brief Type-erased container with safe access methods
     *
     * @note C-string literals are stored as std::string so that callers can
     *       read them back with get<std::string>().
     */
    class Value
    {
        std::any storage_;

    public:
        Value() = default;

        template <typename T>
            requires (!std::is_same_v<std::decay_t<T>, Value>)
        Value(T&& v)
            : storage_(std::forward<T>(v))
        {
        }

        Value(const char* text)
            : storage_(std::string(text))
        {
        }

        template <typename T>
            requires (!std::is_same_v<std::decay_t<T>, Value>)
        Value& operator=(T&& v)
        {
            storage_ = std::forward<T>(v);
            return *this;
        }

        Value& operator=(const char* text)
        {
            storage_ = std::string(text);
            return *this;
        }

        bool has_value() const noexcept { return storage_.has_value(); }

        const std::type_info& type() const noexcept { return storage_.type(); }

        /// @brief True if the stored value is exactly of type T
        template <typename T>
        bool is() const noexcept
        {
            return storage_.type() == typeid(T);
        }

        /**
         * @brief Reference to the stored value if it is a T
         * @return std::nullopt on type mismatch or when empty
         */
        template <typename T>
        std::optional<std::reference_wrapper<const T>> try_get() const noexcept
        {
            if (!is<T>())
                return std::nullopt;
            return std::cref(std::any_cast<const T&>(storage_));
        }

        /// @throws std::bad_any_cast if the stored type is not T
        template <typename T>
        const T& get() const
        {
            return std::any_cast<const T&>(storage_);
        }

        /// @brief Stored value, or default_value on mismatch or when empty
        template <typename T>
        T get_or(const T& default_value) const
        {
            if (is<T>())
                return get<T>();
            return default_value;
        }

        void reset() noexcept { storage_.reset(); }
    };

    /**
     * @class DataStore
     * @brief Ordered string-keyed map of Values
     */
    class DataStore
    {
        std::map<std::string, Value, std::less<>> entries_;

    public:
        using const_iterator = std::map<std::string, Value, std::less<>>::const_iterator;

        /// @brief Access or create the entry for key
        Value& operator[](const std::string& key) { return entries_[key]; }

        /// @throws std::out_of_range if key is absent
        const Value& at(std::string_view key) const
        {
            auto it = entries_.find(key);
            if (it == entries_.end()) {
                throw std::out_of_range("DataStore: no entry '" + std::string(key) + "'");
            }
            return it->second;
        }

        bool contains(std::string_view key) const
        {
            return entries_.find(key) != entries_.end();
        }

        /// @brief Value stored under key as T, or default_value
        template <typename T>
        T get_or(std::string_view key, const T& default_value) const
        {
            auto it = entries_.find(key);
            if (it == entries_.end())
                return default_value;
            return it->second.get_or<T>(default_value);
        }

        /// @brief All keys starting with prefix, in key order
        std::vector<std::string> keys(std::string_view prefix = {}) const
        {
            std::vector<std::string> out;
            for (const auto& [key, value] : entries_) {
                if (key.compare(0, prefix.size(), prefix) == 0)
                    out.push_back(key);
            }
            return out;
        }

        std::size_t size() const noexcept { return entries_.size(); }
        bool empty() const noexcept { return entries_.empty(); }

        const_iterator begin() const noexcept { return entries_.begin(); }
        const_iterator end() const noexcept { return entries_.end(); }
    };

} // namespace assign
