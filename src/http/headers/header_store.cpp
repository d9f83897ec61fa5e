#include "header_store.hpp"

#include <algorithm>

#include "../../utils/string_utils.hpp"

namespace fetchpool::headers {
    HeaderStore::HeaderStore(std::initializer_list<Entry> entries) {
        for (const auto& [key, value] : entries) {
            set(key, value);
        }
    }

    std::vector<HeaderStore::Entry>::iterator HeaderStore::find(std::string_view key) {
        return std::find_if(entries_.begin(), entries_.end(), [&](const Entry& e) { return string_utils::iequals(e.first, key); });
    }

    std::vector<HeaderStore::Entry>::const_iterator HeaderStore::find(std::string_view key) const {
        return std::find_if(entries_.begin(), entries_.end(), [&](const Entry& e) { return string_utils::iequals(e.first, key); });
    }

    void HeaderStore::set(std::string key, std::string value) {
        auto it = find(key);
        if (it != entries_.end()) {
            it->first = std::move(key);
            it->second = std::move(value);
            return;
        }
        entries_.emplace_back(std::move(key), std::move(value));
    }

    void HeaderStore::append(std::string key, std::string_view value) {
        auto it = find(key);
        if (it != entries_.end()) {
            it->second.append(",").append(value);
            return;
        }
        entries_.emplace_back(std::move(key), std::string(value));
    }

    bool HeaderStore::remove(std::string_view key) {
        auto it = find(key);
        if (it == entries_.end()) {
            return false;
        }
        entries_.erase(it);
        return true;
    }

    std::optional<std::string> HeaderStore::get(std::string_view key) const {
        auto it = find(key);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool HeaderStore::contains(std::string_view key) const { return find(key) != entries_.end(); }

    std::vector<std::string> HeaderStore::lines() const {
        std::vector<std::string> out;
        out.reserve(entries_.size());
        for (const auto& [key, value] : entries_) {
            out.push_back(key + ": " + value);
        }
        return out;
    }
}  // namespace fetchpool::headers
