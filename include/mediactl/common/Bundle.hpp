#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "mediactl/common/MediaTypes.hpp"

namespace mediactl {
namespace interfaces {
    class ISessionChannel;
    class IResultReceiver;
}

namespace common {

    class Bundle;

    using BundleRef   = std::shared_ptr<const Bundle>;
    using ChannelRef  = std::shared_ptr<interfaces::ISessionChannel>;
    using ReceiverRef = std::shared_ptr<interfaces::IResultReceiver>;

    // ========================================================================
    // Bundle - opaque parameter/result bag carried by the session protocol
    // ========================================================================
    // Keys are strings, values are a closed set of types. Channel and
    // receiver references travel by handle the same way a transport would
    // pass an endpoint. Nested bundles are shared and immutable.
    // ========================================================================

    class Bundle {
    public:
        using Value = std::variant<
            std::monostate,
            bool,
            int64_t,
            double,
            std::string,
            BundleRef,
            MediaDescription,
            Rating,
            PlaybackState,
            MediaMetadata,
            std::vector<QueueItem>,
            PlaybackInfo,
            KeyEvent,
            ChannelRef,
            ReceiverRef
        >;

        Bundle() = default;

        // ========== Writers ==========

        Bundle& put_bool(const std::string& key, bool v) { return put(key, Value(v)); }
        Bundle& put_int(const std::string& key, int64_t v) { return put(key, Value(v)); }
        Bundle& put_double(const std::string& key, double v) { return put(key, Value(v)); }
        Bundle& put_string(const std::string& key, std::string v) { return put(key, Value(std::move(v))); }
        Bundle& put_bundle(const std::string& key, Bundle v) {
            return put(key, Value(BundleRef(std::make_shared<const Bundle>(std::move(v)))));
        }

        template <typename T>
        Bundle& put(const std::string& key, T v) {
            values_[key] = Value(std::move(v));
            return *this;
        }

        Bundle& put(const std::string& key, Value v) {
            values_[key] = std::move(v);
            return *this;
        }

        // ========== Readers ==========

        bool contains(const std::string& key) const { return values_.count(key) != 0; }
        bool empty() const { return values_.empty(); }
        size_t size() const { return values_.size(); }

        // Pointer to the value if present with exactly type T, nullptr otherwise
        template <typename T>
        const T* get_if(const std::string& key) const {
            auto it = values_.find(key);
            if (it == values_.end()) return nullptr;
            return std::get_if<T>(&it->second);
        }

        template <typename T>
        std::optional<T> get(const std::string& key) const {
            const T* v = get_if<T>(key);
            if (!v) return std::nullopt;
            return *v;
        }

        int64_t get_int(const std::string& key, int64_t fallback = 0) const {
            const int64_t* v = get_if<int64_t>(key);
            return v ? *v : fallback;
        }

        bool get_bool(const std::string& key, bool fallback = false) const {
            const bool* v = get_if<bool>(key);
            return v ? *v : fallback;
        }

        std::string get_string(const std::string& key) const {
            const std::string* v = get_if<std::string>(key);
            return v ? *v : std::string();
        }

        // Empty bundle when absent
        Bundle get_bundle(const std::string& key) const {
            const BundleRef* v = get_if<BundleRef>(key);
            return (v && *v) ? **v : Bundle();
        }

        const std::map<std::string, Value>& values() const { return values_; }

    private:
        std::map<std::string, Value> values_;
    };

    bool operator==(const Bundle& a, const Bundle& b);
    inline bool operator!=(const Bundle& a, const Bundle& b) { return !(a == b); }

} // namespace common
} // namespace mediactl
