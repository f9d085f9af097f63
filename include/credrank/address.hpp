/**
 * Address algebra
 *
 * Nodes and edges are identified by sequences of string parts. Two
 * disjoint address spaces (NodeAddress, EdgeAddress) share one template;
 * the tag type keeps them from being mixed at compile time.
 *
 * Canonical form: every part followed by a single NUL byte. The encoding is
 * injective, so equality, hashing, ordering and prefix tests all operate on
 * the raw string:
 *   ["a", "b"]  ->  "a\0b\0"
 *   has_prefix(["a","b"], ["a"])  ==  raw starts with "a\0"
 *
 * Parts may be empty but may not contain NUL.
 */

#pragma once

#include "credrank/error.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace credrank {

struct NodeAddressTag {
    static constexpr char kTag = '\x01';
    static constexpr const char* kName = "NodeAddress";
};

struct EdgeAddressTag {
    static constexpr char kTag = '\x02';
    static constexpr const char* kName = "EdgeAddress";
};

namespace detail {

// Throws InvalidArgumentError when the part contains the separator
void validate_address_part(std::string_view part, const char* kind);

// NodeAddress["a","b"] style rendering of a raw address
std::string display_address(const std::string& raw, const char* kind);

} // namespace detail

template<typename Tag>
class Address {
public:
    static constexpr char kSeparator = '\0';

    Address() = default;

    static Address empty() { return Address(); }

    static Address from_parts(const std::vector<std::string>& parts) {
        Address result;
        for (const auto& part : parts) {
            result.push_part(part);
        }
        return result;
    }

    static Address from_parts(std::initializer_list<std::string_view> parts) {
        Address result;
        for (auto part : parts) {
            result.push_part(part);
        }
        return result;
    }

    // Parses the tagged string form produced by to_string()
    static Address from_string(std::string_view tagged) {
        if (tagged.empty() || tagged.front() != Tag::kTag) {
            throw InvalidArgumentError(std::string("not a ") + Tag::kName + " string", __func__);
        }
        std::string_view body = tagged.substr(1);
        if (!body.empty() && body.back() != kSeparator) {
            throw InvalidArgumentError(std::string("unterminated ") + Tag::kName + " string", __func__);
        }
        Address result;
        result.raw_.assign(body.data(), body.size());
        for (char c : body) {
            if (c == kSeparator) ++result.size_;
        }
        return result;
    }

    template<typename... Parts>
    Address append(const Parts&... parts) const {
        Address result = *this;
        (result.push_part(std::string_view(parts)), ...);
        return result;
    }

    Address append_parts(const std::vector<std::string>& parts) const {
        Address result = *this;
        for (const auto& part : parts) {
            result.push_part(part);
        }
        return result;
    }

    // Concatenates two addresses of the same space
    Address concat(const Address& suffix) const {
        Address result = *this;
        result.raw_ += suffix.raw_;
        result.size_ += suffix.size_;
        return result;
    }

    std::vector<std::string> to_parts() const {
        std::vector<std::string> parts;
        parts.reserve(size_);
        for_each_part([&parts](std::string_view part) { parts.emplace_back(part); });
        return parts;
    }

    // Calls fn(std::string_view) for each part in order
    template<typename Fn>
    void for_each_part(Fn&& fn) const {
        std::size_t begin = 0;
        for (std::size_t i = 0; i < raw_.size(); ++i) {
            if (raw_[i] == kSeparator) {
                fn(std::string_view(raw_).substr(begin, i - begin));
                begin = i + 1;
            }
        }
    }

    bool has_prefix(const Address& prefix) const {
        return raw_.compare(0, prefix.raw_.size(), prefix.raw_) == 0;
    }

    std::size_t size() const { return size_; }
    bool is_empty() const { return size_ == 0; }

    const std::string& raw() const { return raw_; }

    std::string to_string() const { return std::string(1, Tag::kTag) + raw_; }

    std::string display() const { return detail::display_address(raw_, Tag::kName); }

    bool operator==(const Address& other) const { return raw_ == other.raw_; }
    bool operator!=(const Address& other) const { return raw_ != other.raw_; }
    bool operator<(const Address& other) const { return raw_ < other.raw_; }

private:
    void push_part(std::string_view part) {
        detail::validate_address_part(part, Tag::kName);
        raw_.append(part.data(), part.size());
        raw_.push_back(kSeparator);
        ++size_;
    }

    std::string raw_;
    std::size_t size_ = 0;
};

using NodeAddress = Address<NodeAddressTag>;
using EdgeAddress = Address<EdgeAddressTag>;

/**
 * Prefix trie over addresses.
 *
 * Values are attached to prefixes; a lookup walks the parts of an address
 * once and reports every value found on the way, so testing one address
 * against many prefix patterns costs O(|parts|).
 */
template<typename Tag, typename V>
class AddressTrie {
public:
    using AddressType = Address<Tag>;

    AddressTrie() : root_(std::make_unique<TrieNode>()) {}

    AddressTrie(const AddressTrie&) = delete;
    AddressTrie& operator=(const AddressTrie&) = delete;
    AddressTrie(AddressTrie&&) noexcept = default;
    AddressTrie& operator=(AddressTrie&&) noexcept = default;

    void add(const AddressType& prefix, V value) {
        TrieNode* node = root_.get();
        prefix.for_each_part([&node](std::string_view part) {
            auto it = node->children.find(part);
            if (it == node->children.end()) {
                it = node->children.emplace(std::string(part), std::make_unique<TrieNode>()).first;
            }
            node = it->second.get();
        });
        if (node->value) {
            throw InvalidArgumentError("trie already has a value at " + prefix.display(), __func__);
        }
        node->value = std::move(value);
        ++count_;
    }

    // Values at every prefix of the address, shortest prefix first
    std::vector<V> get(const AddressType& address) const {
        std::vector<V> result;
        walk(address, [&result](const V& value) { result.push_back(value); });
        return result;
    }

    // Value at the longest prefix of the address
    std::optional<V> get_last(const AddressType& address) const {
        std::optional<V> result;
        walk(address, [&result](const V& value) { result = value; });
        return result;
    }

    std::size_t size() const { return count_; }

private:
    struct TrieNode {
        std::map<std::string, std::unique_ptr<TrieNode>, std::less<>> children;
        std::optional<V> value;
    };

    template<typename Fn>
    void walk(const AddressType& address, Fn&& fn) const {
        const TrieNode* node = root_.get();
        if (node->value) fn(*node->value);
        address.for_each_part([&node, &fn](std::string_view part) {
            if (!node) return;
            auto it = node->children.find(part);
            if (it == node->children.end()) {
                node = nullptr;
                return;
            }
            node = it->second.get();
            if (node->value) fn(*node->value);
        });
    }

    std::unique_ptr<TrieNode> root_;
    std::size_t count_ = 0;
};

} // namespace credrank

namespace std {

template<typename Tag>
struct hash<credrank::Address<Tag>> {
    size_t operator()(const credrank::Address<Tag>& address) const noexcept {
        return std::hash<std::string>{}(address.raw());
    }
};

} // namespace std
