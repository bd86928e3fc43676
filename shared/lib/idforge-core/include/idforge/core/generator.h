/**
 * @file generator.h
 * @brief Constrained random identifier generation
 */

#pragma once

#include "idforge/core/random_source.h"
#include "idforge/core/registry.h"
#include "idforge/core/types.h"
#include "idforge/core/validator.h"
#include <memory>
#include <string>

namespace idforge::core {

/**
 * @brief Generator tuning, read once from configuration
 */
struct GeneratorSettings {
    int maxAttempts = 256;     ///< Redraws before UNSATISFIABLE_CONSTRAINT
    int minBirthYear = 1940;   ///< Default birth year window (no requested range)
    int maxBirthYear = 2005;

    /**
     * @brief Snapshot of IDFORGE_MAX_ATTEMPTS, IDFORGE_MIN_BIRTH_YEAR and
     *        IDFORGE_MAX_BIRTH_YEAR; invalid values fall back to the defaults
     */
    static GeneratorSettings fromConfig();
};

/**
 * @brief Produces records that always pass their own validator
 *
 * Each call owns its random engine, so one Generator may be used from
 * any number of threads.
 */
class Generator {
public:
    /**
     * @brief Constructor
     * @throws std::invalid_argument if registry is null
     */
    explicit Generator(std::shared_ptr<const FormatRegistry> registry,
                       GeneratorSettings settings = GeneratorSettings());

    /**
     * @brief Generate one record
     *
     * @param category Identifier category
     * @param code Country or scheme code; "*" or empty picks a random
     *        registered code of the category
     * @param constraints Sex, birth year range, holder and seed. A holder
     *        picks among the code's variants ("US" may yield "US-EIN")
     * @return Record, or UNKNOWN_FORMAT / UNSATISFIABLE_CONSTRAINT
     * @throws common::EntropyException if no seed is given and the
     *         OpenSSL random generator fails
     */
    GenerateResult generate(Category category, const std::string& code,
                            const Constraints& constraints = Constraints()) const;

    /// @brief Generate one record of a registered format
    GenerateResult generate(const FormatSpec& spec, const Constraints& constraints,
                            RandomSource& rng) const;

    const GeneratorSettings& settings() const { return settings_; }

private:
    std::shared_ptr<const FormatRegistry> registry_;
    GeneratorSettings settings_;
    Validator validator_;
};

} // namespace idforge::core
