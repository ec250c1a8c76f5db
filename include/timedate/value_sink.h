#ifndef TIMEDATE_VALUE_SINK_H
#define TIMEDATE_VALUE_SINK_H

#include <timedate/representation.h>

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace timedate {
    /**
     * A value as handed to the host: what it is, how to show it and the current reading.
     */
    struct PublishedValue {
        std::string unique_id;
        RepresentationKind kind;
        std::string name;
        std::string icon;
        std::string value;

        bool operator==(const PublishedValue &) const = default;
    };

    /**
     * Where publishers push their values. Each publisher writes to its own unique id from one thread at a time,
     * different publishers may write concurrently.
     */
    struct TIMEDATE_EXPORT ValueSink {
        using ptr = std::shared_ptr<ValueSink>;

        virtual ~ValueSink() = default;

        virtual void publish(const PublishedValue &value) = 0;

        /**
         * Removes whatever was last published under unique_id, a no-op if nothing was.
         */
        virtual void retract(std::string_view unique_id) = 0;
    };

    /**
     * Keeps the latest value per unique id, this is the state a host reads back.
     */
    struct TIMEDATE_EXPORT ValueStore : ValueSink {
        void publish(const PublishedValue &value) override;

        void retract(std::string_view unique_id) override;

        [[nodiscard]] std::optional<PublishedValue> get(std::string_view unique_id) const;

        [[nodiscard]] bool contains(std::string_view unique_id) const;

        [[nodiscard]] size_t size() const;

        // Snapshot ordered by unique id
        [[nodiscard]] std::vector<PublishedValue> values() const;

        // Number of publish calls seen, including repeats of the same value
        [[nodiscard]] size_t publish_count() const;

    private:
        struct string_hash {
            using is_transparent = void;
            using is_avalanching = void;

            [[nodiscard]] auto operator()(std::string_view str) const noexcept -> uint64_t {
                return ankerl::unordered_dense::hash<std::string_view>{}(str);
            }
        };

        mutable std::mutex _mutex;
        ankerl::unordered_dense::map<std::string, PublishedValue, string_hash, std::equal_to<> > _values;
        size_t _publish_count{0};
    };
} // namespace timedate

#endif // TIMEDATE_VALUE_SINK_H
