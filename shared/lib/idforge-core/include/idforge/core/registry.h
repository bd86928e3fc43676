/**
 * @file registry.h
 * @brief Immutable catalog of identifier formats
 *
 * Built once, then shared read-only (std::shared_ptr<const FormatRegistry>)
 * by generators and validators on any number of threads. Construction
 * verifies every definition and throws common::RegistryException on the
 * first inconsistency.
 */

#pragma once

#include "idforge/core/checksum.h"
#include "idforge/core/format_spec.h"
#include <iterator>
#include <memory>
#include <string>
#include <vector>

namespace idforge::core {

/**
 * @brief Lazy, finite, restartable range over the codes of one category
 *
 * Iterating twice yields the same sequence; the range holds no state
 * beyond a view into the registry.
 */
class CodeRange {
public:
    class iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = std::string;
        using difference_type = std::ptrdiff_t;
        using pointer = const std::string*;
        using reference = const std::string&;

        iterator() = default;
        iterator(const FormatSpec* const* pos) : pos_(pos) {}

        reference operator*() const { return (*pos_)->code; }
        pointer operator->() const { return &(*pos_)->code; }
        iterator& operator++() { ++pos_; return *this; }
        iterator operator++(int) { iterator tmp = *this; ++pos_; return tmp; }
        bool operator==(const iterator& other) const { return pos_ == other.pos_; }
        bool operator!=(const iterator& other) const { return pos_ != other.pos_; }

    private:
        const FormatSpec* const* pos_ = nullptr;
    };

    CodeRange() = default;
    CodeRange(const FormatSpec* const* first, const FormatSpec* const* last)
        : first_(first), last_(last) {}

    iterator begin() const { return iterator(first_); }
    iterator end() const { return iterator(last_); }
    size_t size() const { return static_cast<size_t>(last_ - first_); }
    bool empty() const { return first_ == last_; }

    /// @brief Materialize the codes
    std::vector<std::string> toVector() const { return {begin(), end()}; }

private:
    const FormatSpec* const* first_ = nullptr;
    const FormatSpec* const* last_ = nullptr;
};

class FormatRegistry {
public:
    /**
     * @brief Build and verify a registry
     * @throws common::RegistryException on duplicate keys, dangling
     *         algorithm references or inconsistent layouts
     */
    FormatRegistry(ChecksumLibrary algorithms, std::vector<FormatSpec> specs);

    FormatRegistry(const FormatRegistry&) = delete;
    FormatRegistry& operator=(const FormatRegistry&) = delete;

    /// @brief The built-in catalog (every supported scheme)
    static std::shared_ptr<const FormatRegistry> createDefault();

    /**
     * @brief Spec of (category, code)
     * @throws common::UnknownFormatException if not registered
     */
    const FormatSpec& lookup(Category category, const std::string& code) const;

    /// @brief Spec of (category, code), nullptr if not registered
    const FormatSpec* find(Category category, const std::string& code) const;

    /// @brief Codes of a category in ascending order
    CodeRange list(Category category) const;

    /// @brief Every spec in registry order (category, then code)
    const std::vector<const FormatSpec*>& all() const { return ordered_; }

    /// @brief Specs of one category in registry order
    std::vector<const FormatSpec*> ofCategory(Category category) const;

    /**
     * @brief A code and its holder variants
     *
     * "US" yields US plus US-EIN, US-SSN and every other "US-" code of the
     * category, in registry order.
     */
    std::vector<const FormatSpec*> family(Category category, const std::string& code) const;

    const ChecksumLibrary& algorithms() const { return algorithms_; }

    /// @brief Algorithm used by a checksum slot (resolved at construction)
    const ChecksumAlgorithm& algorithmFor(const Token& slot) const;

    size_t size() const { return specs_.size(); }

private:
    void verify(FormatSpec& spec) const;

    ChecksumLibrary algorithms_;
    std::vector<FormatSpec> specs_;           // sorted by (category, code)
    std::vector<const FormatSpec*> ordered_;  // pointers into specs_
};

} // namespace idforge::core
