/**
 * @file engine.cpp
 * @brief Engine facade and restartable record batches
 */

#include "idforge/core/engine.h"
#include "idforge/core/country_names.h"
#include "config/config_manager.h"
#include <algorithm>
#include <exception>
#include <thread>
#include <spdlog/spdlog.h>

namespace idforge::core {

// =============================================================================
// RecordBatch
// =============================================================================

RecordBatch::RecordBatch(const Generator* generator, Category category, std::string code,
                         size_t count, Constraints constraints, uint64_t baseSeed)
    : generator_(generator),
      category_(category),
      code_(std::move(code)),
      count_(count),
      constraints_(std::move(constraints)),
      baseSeed_(baseSeed) {}

GenerateResult RecordBatch::at(size_t index) const {
    Constraints c = constraints_;
    c.seed = deriveSeed(baseSeed_, index);
    return generator_->generate(category_, code_, c);
}

RecordBatch::iterator::reference RecordBatch::iterator::operator*() const {
    if (!current_) {
        current_ = batch_->at(index_);
    }
    return *current_;
}

// =============================================================================
// Engine
// =============================================================================

Engine::Engine(std::shared_ptr<const FormatRegistry> registry, GeneratorSettings settings)
    : registry_(std::move(registry)),
      generator_(registry_, settings),
      validator_(registry_) {
    spdlog::debug("[Engine] Ready: {} formats, max {} attempts, birth years {}-{}",
                  registry_->size(), settings.maxAttempts, settings.minBirthYear,
                  settings.maxBirthYear);
}

GenerateResult Engine::generate(Category category, const std::string& code,
                                const Constraints& constraints) const {
    return generator_.generate(category, code, constraints);
}

RecordBatch Engine::generateBatch(Category category, const std::string& code, size_t count,
                                  const Constraints& constraints) const {
    const uint64_t base = constraints.seed ? *constraints.seed : RandomSource::entropySeed();
    return RecordBatch(&generator_, category, code, count, constraints, base);
}

std::vector<GenerateResult> Engine::generateBatchParallel(Category category,
                                                          const std::string& code, size_t count,
                                                          const Constraints& constraints,
                                                          unsigned threads) const {
    if (threads == 0) {
        int configured = common::ConfigManager::getInstance().getInt(
            common::ConfigManager::THREADS, 0);
        threads = configured > 0 ? static_cast<unsigned>(configured)
                                 : std::thread::hardware_concurrency();
    }
    threads = std::max(1u, threads);
    if (count < threads) {
        threads = std::max<unsigned>(1u, static_cast<unsigned>(count));
    }

    RecordBatch batch = generateBatch(category, code, count, constraints);
    spdlog::info("[Engine] Generating {} {}/{} records on {} threads (base seed {})",
                 count, categoryToString(category), code, threads, batch.baseSeed());

    std::vector<GenerateResult> results(count);
    std::vector<std::exception_ptr> errors(threads);
    std::vector<std::thread> workers;
    workers.reserve(threads);

    // Worker w owns indices w, w + threads, ...; no two workers touch one slot
    for (unsigned w = 0; w < threads; ++w) {
        workers.emplace_back([&batch, &results, &errors, w, threads, count] {
            try {
                for (size_t i = w; i < count; i += threads) {
                    results[i] = batch.at(i);
                }
            } catch (...) {
                errors[w] = std::current_exception();
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    for (const auto& error : errors) {
        if (error) {
            std::rethrow_exception(error);
        }
    }
    return results;
}

ValidationResult Engine::validate(const std::string& input, std::optional<Category> category,
                                  const std::optional<std::string>& code) const {
    return validator_.validate(input, category, code);
}

std::optional<std::string> Engine::countryName(const std::string& code) const {
    return core::countryName(code);
}

} // namespace idforge::core
