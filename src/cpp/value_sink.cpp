#include <timedate/value_sink.h>

#include <algorithm>

namespace timedate {
    void ValueStore::publish(const PublishedValue &value) {
        std::lock_guard<std::mutex> lock(_mutex);
        _values.insert_or_assign(value.unique_id, value);
        ++_publish_count;
    }

    void ValueStore::retract(std::string_view unique_id) {
        std::lock_guard<std::mutex> lock(_mutex);
        if (auto it = _values.find(unique_id); it != _values.end()) { _values.erase(it); }
    }

    std::optional<PublishedValue> ValueStore::get(std::string_view unique_id) const {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _values.find(unique_id);
        if (it == _values.end()) { return std::nullopt; }
        return it->second;
    }

    bool ValueStore::contains(std::string_view unique_id) const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _values.contains(unique_id);
    }

    size_t ValueStore::size() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _values.size();
    }

    std::vector<PublishedValue> ValueStore::values() const {
        std::vector<PublishedValue> result;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            result.reserve(_values.size());
            for (const auto &[id, value] : _values) { result.push_back(value); }
        }
        std::ranges::sort(result, {}, &PublishedValue::unique_id);
        return result;
    }

    size_t ValueStore::publish_count() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _publish_count;
    }
} // namespace timedate
