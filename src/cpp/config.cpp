#include <timedate/config.h>
#include <timedate/util/errors.h>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace timedate {
    namespace {
        size_t index_of(RepresentationKind kind) {
            const auto index = static_cast<size_t>(kind);
            if (index >= ALL_REPRESENTATION_KINDS.size()) {
                throw_error<std::logic_error>("Unknown representation kind: {}", index);
            }
            return index;
        }

        RepresentationKind require_kind(const std::string &key) {
            if (auto kind = kind_from_option_key(key)) { return *kind; }
            std::vector<std::string_view> valid;
            for (auto kind : ALL_REPRESENTATION_KINDS) { valid.push_back(option_key(kind)); }
            throw_error<ConfigError>("Unknown display option '{}', expected one of: {}", key, fmt::join(valid, ", "));
        }
    } // namespace

    RepresentationOptions::RepresentationOptions(std::initializer_list<RepresentationKind> kinds) {
        for (auto kind : kinds) { enable(kind); }
    }

    void RepresentationOptions::enable(RepresentationKind kind, bool enabled) { _flags.set(index_of(kind), enabled); }

    bool RepresentationOptions::enabled(RepresentationKind kind) const { return _flags.test(index_of(kind)); }

    std::vector<RepresentationKind> RepresentationOptions::enabled_kinds() const {
        std::vector<RepresentationKind> result;
        for (auto kind : ALL_REPRESENTATION_KINDS) {
            if (enabled(kind)) { result.push_back(kind); }
        }
        return result;
    }

    std::vector<RepresentationKind> RepresentationOptions::disabled_kinds() const {
        std::vector<RepresentationKind> result;
        for (auto kind : ALL_REPRESENTATION_KINDS) {
            if (!enabled(kind)) { result.push_back(kind); }
        }
        return result;
    }

    std::map<std::string, bool> RepresentationOptions::to_flags() const {
        std::map<std::string, bool> result;
        for (auto kind : ALL_REPRESENTATION_KINDS) { result.emplace(option_key(kind), enabled(kind)); }
        return result;
    }

    RepresentationOptions options_from_display_options(const std::vector<std::string> &display_options) {
        RepresentationOptions options;
        for (const auto &key : display_options) { options.enable(require_kind(key)); }
        return options;
    }

    RepresentationOptions options_from_flags(const std::map<std::string, bool> &flags) {
        RepresentationOptions options;
        for (const auto &[key, enabled] : flags) { options.enable(require_kind(key), enabled); }
        return options;
    }
} // namespace timedate
