/**
 * @file engine.h
 * @brief Facade over registry, generator and validator
 *
 * The entry point used by the command-line tool and by embedding
 * applications. An Engine is immutable after construction and safe to
 * share between threads.
 */

#pragma once

#include "idforge/core/generator.h"
#include "idforge/core/registry.h"
#include "idforge/core/validator.h"
#include <cstdint>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace idforge::core {

class Engine;

/**
 * @brief Finite, restartable range of generated records
 *
 * Record i is generated from deriveSeed(baseSeed, i) when it is
 * dereferenced, so iterating twice yields the same records and any
 * record can be regenerated on its own.
 */
class RecordBatch {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = GenerateResult;
        using difference_type = std::ptrdiff_t;
        using pointer = const GenerateResult*;
        using reference = const GenerateResult&;

        iterator() = default;
        iterator(const RecordBatch* batch, size_t index) : batch_(batch), index_(index) {}

        reference operator*() const;
        pointer operator->() const { return &**this; }
        iterator& operator++() { ++index_; current_.reset(); return *this; }
        bool operator==(const iterator& other) const { return index_ == other.index_; }
        bool operator!=(const iterator& other) const { return index_ != other.index_; }

    private:
        const RecordBatch* batch_ = nullptr;
        size_t index_ = 0;
        mutable std::optional<GenerateResult> current_;
    };

    RecordBatch(const Generator* generator, Category category, std::string code,
                size_t count, Constraints constraints, uint64_t baseSeed);

    iterator begin() const { return iterator(this, 0); }
    iterator end() const { return iterator(this, count_); }
    size_t size() const { return count_; }
    uint64_t baseSeed() const { return baseSeed_; }

    /// @brief Generate the index-th record
    GenerateResult at(size_t index) const;

private:
    const Generator* generator_;
    Category category_;
    std::string code_;
    size_t count_;
    Constraints constraints_;
    uint64_t baseSeed_;
};

class Engine {
public:
    /**
     * @brief Constructor
     * @param registry Shared catalog (defaults to the built-in registry)
     * @param settings Generator settings (defaults to the configuration snapshot)
     */
    explicit Engine(std::shared_ptr<const FormatRegistry> registry = FormatRegistry::createDefault(),
                    GeneratorSettings settings = GeneratorSettings::fromConfig());

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    GenerateResult generate(Category category, const std::string& code,
                            const Constraints& constraints = Constraints()) const;

    /**
     * @brief Lazy batch; the base seed is constraints.seed or fresh entropy
     * @throws common::EntropyException if entropy is needed and unavailable
     */
    RecordBatch generateBatch(Category category, const std::string& code, size_t count,
                              const Constraints& constraints = Constraints()) const;

    /**
     * @brief Same records as generateBatch, produced by worker threads
     * @param threads Worker count; 0 uses IDFORGE_THREADS or the hardware concurrency
     */
    std::vector<GenerateResult> generateBatchParallel(Category category, const std::string& code,
                                                      size_t count,
                                                      const Constraints& constraints = Constraints(),
                                                      unsigned threads = 0) const;

    ValidationResult validate(const std::string& input,
                              std::optional<Category> category = std::nullopt,
                              const std::optional<std::string>& code = std::nullopt) const;

    CodeRange listSupported(Category category) const { return registry_->list(category); }

    std::optional<std::string> countryName(const std::string& code) const;

    const FormatRegistry& registry() const { return *registry_; }
    const Generator& generator() const { return generator_; }

private:
    std::shared_ptr<const FormatRegistry> registry_;
    Generator generator_;
    Validator validator_;
};

} // namespace idforge::core
