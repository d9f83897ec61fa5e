#ifndef FETCHPOOL_HEADER_STORE_HPP
#define FETCHPOOL_HEADER_STORE_HPP

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fetchpool::headers {
    // Case-insensitive, insertion-ordered key/value store. The most recently
    // written spelling of a key is the one reported back.
    class HeaderStore {
       public:
        using Entry = std::pair<std::string, std::string>;
        using const_iterator = std::vector<Entry>::const_iterator;

        HeaderStore() = default;
        HeaderStore(std::initializer_list<Entry> entries);

        void set(std::string key, std::string value);
        // Joins with "," when the key is already present.
        void append(std::string key, std::string_view value);
        bool remove(std::string_view key);
        void clear() { entries_.clear(); }

        [[nodiscard]] std::optional<std::string> get(std::string_view key) const;
        [[nodiscard]] bool contains(std::string_view key) const;
        [[nodiscard]] size_t size() const { return entries_.size(); }
        [[nodiscard]] bool empty() const { return entries_.empty(); }

        // "Key: Value" for each entry, in order.
        [[nodiscard]] std::vector<std::string> lines() const;

        [[nodiscard]] const_iterator begin() const { return entries_.begin(); }
        [[nodiscard]] const_iterator end() const { return entries_.end(); }

        bool operator==(const HeaderStore& other) const { return entries_ == other.entries_; }

       private:
        std::vector<Entry>::iterator find(std::string_view key);
        [[nodiscard]] std::vector<Entry>::const_iterator find(std::string_view key) const;

        std::vector<Entry> entries_;
    };
}  // namespace fetchpool::headers

#endif
