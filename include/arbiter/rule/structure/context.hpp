#pragma once
#include "error.hpp"
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace arbiter::rule {

    // Thread-safe string-keyed store shared by the rules of one run.
    // Every operation locks for the single map access only, so hooks may call back in freely.
    template <typename V> class RuleContext {
      public:
        struct Event {
            enum class Type { Set, Remove, Clear };

            Type type;
            std::string key;
            bool changed;
        };

        using Observer = std::function<void(const Event &)>;
        using value_type = V;

        RuleContext() = default;
        explicit RuleContext(std::size_t capacity) { values_.reserve(capacity); }
        // A repeated key keeps its last value, as if each pair were set in turn.
        RuleContext(std::initializer_list<std::pair<const std::string, V>> seed) {
            values_.reserve(seed.size());
            for (const auto &[key, value] : seed) {
                values_.insert_or_assign(key, value);
            }
        }

        RuleContext(const RuleContext &) = delete;
        RuleContext &operator=(const RuleContext &) = delete;

        inline std::optional<V> get(const std::string &key) const {
            std::shared_lock lock(mutex_);
            auto it = values_.find(key);
            if (it == values_.end())
                return std::nullopt;
            return it->second;
        }

        // Throws KeyNotFound when the key is absent.
        inline V mustGet(const std::string &key) const {
            auto value = get(key);
            if (!value)
                throw KeyNotFound(key);
            return std::move(*value);
        }

        inline void set(const std::string &key, V value) {
            Observer observerCopy;
            {
                std::unique_lock lock(mutex_);
                values_.insert_or_assign(key, std::move(value));
                observerCopy = observer_;
            }
            notify(observerCopy, Event{Event::Type::Set, key, true});
        }

        inline void remove(const std::string &key) {
            Observer observerCopy;
            bool removed = false;
            {
                std::unique_lock lock(mutex_);
                removed = values_.erase(key) > 0;
                observerCopy = observer_;
            }
            notify(observerCopy, Event{Event::Type::Remove, key, removed});
        }

        inline bool has(const std::string &key) const {
            std::shared_lock lock(mutex_);
            return values_.find(key) != values_.end();
        }

        // Unordered snapshot.
        inline std::vector<std::string> keys() const {
            std::shared_lock lock(mutex_);
            std::vector<std::string> result;
            result.reserve(values_.size());
            for (const auto &[key, value] : values_) {
                result.push_back(key);
            }
            return result;
        }

        inline std::size_t size() const {
            std::shared_lock lock(mutex_);
            return values_.size();
        }

        inline bool empty() const { return size() == 0; }

        inline void clear() {
            Observer observerCopy;
            bool changed = false;
            {
                std::unique_lock lock(mutex_);
                changed = !values_.empty();
                values_.clear();
                observerCopy = observer_;
            }
            notify(observerCopy, Event{Event::Type::Clear, "", changed});
        }

        inline void setObserver(Observer observer) {
            std::unique_lock lock(mutex_);
            observer_ = std::move(observer);
        }

      private:
        static void notify(const Observer &observer, const Event &event) {
            if (observer)
                observer(event);
        }

        mutable std::shared_mutex mutex_;
        std::unordered_map<std::string, V> values_;
        Observer observer_;
    };

} // namespace arbiter::rule
