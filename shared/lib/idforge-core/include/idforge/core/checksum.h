/**
 * @file checksum.h
 * @brief Checksum algorithm library
 *
 * Pure, deterministic check-digit schemes referenced by name from format
 * definitions. Every algorithm maps a payload (the canonical characters the
 * check covers) to its check characters, and verifies a given check.
 *
 * Law: for any payload p where compute(p) yields a value c,
 * verify(p, c) is true.
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace idforge::core {

/// @brief Closed set of algorithm families
enum class ChecksumKind {
    NONE,                 ///< Pass-through, no check characters
    IBAN_MOD97,           ///< ISO 13616: country+check moved to the end, mod 97 == 1
    ISO7064_MOD97_10,     ///< Check = 98 - (N*100 mod 97), A=10..Z=35 (LEI)
    LUHN,                 ///< Double every second digit from the right
    WEIGHTED,             ///< Per-position weights, modulus, residue table
    NUMERIC_MOD,          ///< Payload read as one big integer, mod m
    ISO7064_MOD11_10,     ///< Hybrid system (Steuer-IdNr, OIB)
    ISO7064_MOD11_2,      ///< Pure system, 'X' for 10 (PRC resident ID)
    VERHOEFF,             ///< Dihedral group D5 (Aadhaar)
    ITALIAN_FISCAL_CODE,  ///< Odd/even character tables mod 26
    ABN_MOD89             ///< Australian Business Number leading check pair
};

/// @brief How payload characters map to numeric values
enum class CharValueMap {
    DIGITS,  ///< '0'-'9' only
    ALNUM,   ///< digits, A=10 .. Z=35
    MRZ,     ///< ICAO 9303: digits, A=10 .. Z=35, '<'=0
    RIB,     ///< French RIB: A-I=1-9, J-R=1-9, S-Z=2-9
    CURP,    ///< Mexican CURP: digits, A=10 .. N=23, O=25 .. Z=36 (slot 24 is N-tilde)
    TAIWAN,  ///< Taiwanese region letters, A=10 .. Z=33 in issuing order
    NRIC,    ///< Singapore NRIC prefix offsets: S/F=0, T/G=4
    NIE,     ///< Spanish NIE prefix: X=0, Y=1, Z=2
    USCC     ///< PRC unified social credit code: 31 symbols without I, O, S, V, Z
};

/// @brief What is done to the remainder r before the result table
enum class Residue {
    DIRECT,             ///< v = r
    COMPLEMENT,         ///< v = base - r
    COMPLEMENT_REDUCED  ///< v = (base - r) mod m
};

/// @brief Parameters of the WEIGHTED and NUMERIC_MOD families
struct ChecksumParams {
    std::vector<int> weights;          ///< Cycled over the payload
    std::vector<int> fallbackWeights;  ///< Second pass when the first yields an invalid value
    bool weightsFromRight = false;     ///< weights[0] applies to the rightmost payload character
    bool crossSumProducts = false;     ///< Replace each product by its digit sum
    bool expandTwoDigit = false;       ///< Values >= 10 contribute their two digits separately
    int sumOffset = 0;                 ///< Added to the sum or remainder (implicit characters)
    CharValueMap charMap = CharValueMap::DIGITS;
    int modulus = 10;
    Residue residue = Residue::DIRECT;
    int complementBase = 0;            ///< 0 means the modulus
    std::string table;                 ///< value -> check char; '?' or out of range is invalid
    int shift = 0;                     ///< NUMERIC_MOD: payload multiplied by 10^shift
    std::optional<int> zeroAs;         ///< Substitute for a zero result (Belgian 97)
    std::optional<int> fallbackValue;  ///< Used when both weight passes are invalid
    std::string altPrefix;             ///< NUMERIC_MOD: verify also accepts prefix+payload
    int width = 1;                     ///< Number of check characters
    bool truncateToWidth = false;      ///< Render v mod 10^width instead of rejecting overflow
};

/**
 * @brief One named checksum algorithm instance
 */
class ChecksumAlgorithm {
public:
    ChecksumAlgorithm(std::string name, ChecksumKind kind, ChecksumParams params = {});

    const std::string& name() const { return name_; }
    ChecksumKind kind() const { return kind_; }
    const ChecksumParams& params() const { return params_; }

    /// @brief Number of check characters produced
    int width() const;

    /// @brief Characters a check value may contain
    std::string alphabet() const;

    /**
     * @brief Compute the check characters for a payload
     * @return Check string, or std::nullopt when the payload admits no
     *         valid check value (caller must redraw the payload)
     */
    std::optional<std::string> compute(const std::string& payload) const;

    /// @brief Verify check characters against a payload
    bool verify(const std::string& payload, const std::string& check) const;

private:
    std::string name_;
    ChecksumKind kind_;
    ChecksumParams params_;
};

/**
 * @brief Catalog of named algorithms
 *
 * Format definitions reference algorithms by name; the registry resolves
 * every reference against this catalog at construction.
 */
class ChecksumLibrary {
public:
    /// @brief Register an algorithm (throws RegistryException on duplicate names)
    void add(ChecksumAlgorithm algorithm);

    /// @brief Find by name, nullptr if absent
    const ChecksumAlgorithm* find(const std::string& name) const;

    size_t size() const { return algorithms_.size(); }

    /// @brief Registered names in ascending order
    std::vector<std::string> names() const;

    /// @brief The catalog used by the built-in format registry
    static ChecksumLibrary standard();

private:
    std::map<std::string, ChecksumAlgorithm> algorithms_;
};

/// @name Stand-alone scheme functions (used by the algorithm families)
/// @{

/// @brief Remainder modulo 97 of an alphanumeric numeral (A=10..Z=35), -1 on other characters
int mod97Remainder(const std::string& numeral);

/// @brief Luhn check digit for a digit payload
int luhnCheckDigit(const std::string& digits);

/// @brief Verhoeff check digit for a digit payload
int verhoeffCheckDigit(const std::string& digits);

/// @brief ISO 7064 MOD 11,10 check digit
int iso7064Mod11_10(const std::string& digits);

/// @}

} // namespace idforge::core
