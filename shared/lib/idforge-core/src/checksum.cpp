/**
 * @file checksum.cpp
 * @brief Checksum algorithm families
 */

#include "idforge/core/checksum.h"
#include "exception/exceptions.h"
#include <cstdlib>
#include <set>

namespace idforge::core {

namespace {

const std::string kDigits = "0123456789";

/// Numeric value of a payload character, -1 if the map does not cover it
int charValue(char c, CharValueMap map) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    switch (map) {
        case CharValueMap::DIGITS:
            return -1;
        case CharValueMap::ALNUM:
            return (c >= 'A' && c <= 'Z') ? c - 'A' + 10 : -1;
        case CharValueMap::MRZ:
            if (c == '<') return 0;
            return (c >= 'A' && c <= 'Z') ? c - 'A' + 10 : -1;
        case CharValueMap::RIB:
            if (c >= 'A' && c <= 'I') return c - 'A' + 1;
            if (c >= 'J' && c <= 'R') return c - 'J' + 1;
            if (c >= 'S' && c <= 'Z') return c - 'S' + 2;
            return -1;
        case CharValueMap::CURP:
            if (c >= 'A' && c <= 'N') return c - 'A' + 10;
            if (c >= 'O' && c <= 'Z') return c - 'A' + 11;
            return -1;
        case CharValueMap::TAIWAN: {
            static const std::string order = "ABCDEFGHJKLMNPQRSTUVXYWZIO";
            auto pos = order.find(c);
            return pos == std::string::npos ? -1 : static_cast<int>(pos) + 10;
        }
        case CharValueMap::NRIC:
            if (c == 'S' || c == 'F') return 0;
            if (c == 'T' || c == 'G') return 4;
            return -1;
        case CharValueMap::NIE:
            if (c == 'X') return 0;
            if (c == 'Y') return 1;
            if (c == 'Z') return 2;
            return -1;
        case CharValueMap::USCC: {
            static const std::string symbols = "0123456789ABCDEFGHJKLMNPQRTUWXY";
            auto pos = symbols.find(c);
            return pos == std::string::npos ? -1 : static_cast<int>(pos);
        }
    }
    return -1;
}

int digitSum(long long v) {
    v = std::llabs(v);
    int s = 0;
    while (v > 0) {
        s += static_cast<int>(v % 10);
        v /= 10;
    }
    return s;
}

int positiveMod(long long v, int m) {
    long long r = v % m;
    return static_cast<int>(r < 0 ? r + m : r);
}

int applyResidue(int r, const ChecksumParams& p) {
    int base = p.complementBase != 0 ? p.complementBase : p.modulus;
    switch (p.residue) {
        case Residue::DIRECT:             return r;
        case Residue::COMPLEMENT:         return base - r;
        case Residue::COMPLEMENT_REDUCED: return positiveMod(base - r, p.modulus);
    }
    return r;
}

/// Render a check value through the table, or as zero-padded decimal
std::optional<std::string> renderValue(int v, const ChecksumParams& p) {
    if (v == 0 && p.zeroAs) {
        v = *p.zeroAs;
    }
    if (!p.table.empty()) {
        if (v < 0 || v >= static_cast<int>(p.table.size()) || p.table[v] == '?') {
            return std::nullopt;
        }
        return std::string(1, p.table[v]);
    }
    if (v < 0) {
        return std::nullopt;
    }
    if (p.truncateToWidth) {
        int limit = 1;
        for (int i = 0; i < p.width; ++i) limit *= 10;
        v %= limit;
    }
    std::string s = std::to_string(v);
    if (static_cast<int>(s.size()) > p.width) {
        return std::nullopt;
    }
    return std::string(p.width - s.size(), '0') + s;
}

std::optional<std::vector<int>> payloadValues(const std::string& payload, const ChecksumParams& p) {
    std::vector<int> values;
    values.reserve(payload.size() * 2);
    for (char c : payload) {
        int v = charValue(c, p.charMap);
        if (v < 0) {
            return std::nullopt;
        }
        if (p.expandTwoDigit && v >= 10) {
            values.push_back(v / 10);
            values.push_back(v % 10);
        } else {
            values.push_back(v);
        }
    }
    return values;
}

std::optional<std::string> weightedPass(const std::vector<int>& values,
                                        const std::vector<int>& weights,
                                        const ChecksumParams& p) {
    if (weights.empty()) {
        return std::nullopt;
    }
    long long sum = p.sumOffset;
    const size_t n = values.size();
    for (size_t i = 0; i < n; ++i) {
        size_t idx = p.weightsFromRight ? (n - 1 - i) : i;
        long long product = static_cast<long long>(values[i]) * weights[idx % weights.size()];
        sum += p.crossSumProducts ? digitSum(product) : product;
    }
    return renderValue(applyResidue(positiveMod(sum, p.modulus), p), p);
}

std::optional<std::string> computeWeighted(const std::string& payload, const ChecksumParams& p) {
    auto values = payloadValues(payload, p);
    if (!values) {
        return std::nullopt;
    }
    auto check = weightedPass(*values, p.weights, p);
    if (!check && !p.fallbackWeights.empty()) {
        check = weightedPass(*values, p.fallbackWeights, p);
    }
    if (!check && p.fallbackValue) {
        check = renderValue(*p.fallbackValue, p);
    }
    return check;
}

/// Big-integer remainder; values >= 10 are read as two decimal digits
std::optional<int> numericRemainder(const std::string& payload, const ChecksumParams& p) {
    long long r = 0;
    for (char c : payload) {
        int v = charValue(c, p.charMap);
        if (v < 0) {
            return std::nullopt;
        }
        r = v >= 10 ? (r * 100 + v) % p.modulus : (r * 10 + v) % p.modulus;
    }
    for (int i = 0; i < p.shift; ++i) {
        r = (r * 10) % p.modulus;
    }
    return positiveMod(r + p.sumOffset, p.modulus);
}

std::optional<std::string> computeNumeric(const std::string& payload, const ChecksumParams& p) {
    auto r = numericRemainder(payload, p);
    if (!r) {
        return std::nullopt;
    }
    return renderValue(applyResidue(*r, p), p);
}

bool allDigits(const std::string& s) {
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

// Verhoeff tables (dihedral group D5)
const int kVerhoeffD[10][10] = {
    {0, 1, 2, 3, 4, 5, 6, 7, 8, 9}, {1, 2, 3, 4, 0, 6, 7, 8, 9, 5},
    {2, 3, 4, 0, 1, 7, 8, 9, 5, 6}, {3, 4, 0, 1, 2, 8, 9, 5, 6, 7},
    {4, 0, 1, 2, 3, 9, 5, 6, 7, 8}, {5, 9, 8, 7, 6, 0, 4, 3, 2, 1},
    {6, 5, 9, 8, 7, 1, 0, 4, 3, 2}, {7, 6, 5, 9, 8, 2, 1, 0, 4, 3},
    {8, 7, 6, 5, 9, 3, 2, 1, 0, 4}, {9, 8, 7, 6, 5, 4, 3, 2, 1, 0}
};
const int kVerhoeffP[8][10] = {
    {0, 1, 2, 3, 4, 5, 6, 7, 8, 9}, {1, 5, 7, 6, 2, 8, 3, 0, 9, 4},
    {5, 8, 0, 3, 7, 9, 6, 1, 4, 2}, {8, 9, 1, 6, 0, 4, 3, 5, 2, 7},
    {9, 4, 5, 3, 1, 2, 6, 8, 7, 0}, {4, 2, 8, 6, 5, 7, 3, 9, 0, 1},
    {2, 7, 9, 3, 8, 0, 6, 4, 1, 5}, {7, 0, 4, 6, 9, 1, 3, 2, 5, 8}
};
const int kVerhoeffInv[10] = {0, 4, 3, 2, 1, 5, 6, 7, 8, 9};

// Codice fiscale values of characters in odd (1st, 3rd, ...) positions, by 0-9 / A-Z index
const int kFiscalOdd[26] = {
    1, 0, 5, 7, 9, 13, 15, 17, 19, 21, 2, 4, 18, 20, 11, 3, 6, 8, 12, 14, 16, 10, 22, 25, 24, 23
};

std::optional<std::string> italianFiscalCheck(const std::string& payload) {
    int sum = 0;
    for (size_t i = 0; i < payload.size(); ++i) {
        char c = payload[i];
        int v;
        if (c >= '0' && c <= '9') {
            v = c - '0';
        } else if (c >= 'A' && c <= 'Z') {
            v = c - 'A';
        } else {
            return std::nullopt;
        }
        sum += (i % 2 == 0) ? kFiscalOdd[v] : v;
    }
    return std::string(1, static_cast<char>('A' + sum % 26));
}

bool abnValid(const std::string& number) {
    static const int weights[11] = {10, 1, 3, 5, 7, 9, 11, 13, 15, 17, 19};
    if (number.size() != 11 || !allDigits(number)) {
        return false;
    }
    int sum = 0;
    for (size_t i = 0; i < 11; ++i) {
        int d = number[i] - '0';
        if (i == 0) d -= 1;
        sum += d * weights[i];
    }
    return sum % 89 == 0;
}

} // anonymous namespace

// =============================================================================
// Stand-alone schemes
// =============================================================================

int mod97Remainder(const std::string& numeral) {
    int r = 0;
    for (char c : numeral) {
        if (c >= '0' && c <= '9') {
            r = (r * 10 + (c - '0')) % 97;
        } else if (c >= 'A' && c <= 'Z') {
            r = (r * 100 + (c - 'A' + 10)) % 97;
        } else {
            return -1;
        }
    }
    return r;
}

int luhnCheckDigit(const std::string& digits) {
    int sum = 0;
    bool doubleIt = true;  // rightmost payload digit sits next to the check digit
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        int d = *it - '0';
        if (doubleIt) {
            d *= 2;
            if (d > 9) d -= 9;
        }
        sum += d;
        doubleIt = !doubleIt;
    }
    return (10 - sum % 10) % 10;
}

int verhoeffCheckDigit(const std::string& digits) {
    int c = 0;
    int i = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it, ++i) {
        c = kVerhoeffD[c][kVerhoeffP[(i + 1) % 8][*it - '0']];
    }
    return kVerhoeffInv[c];
}

int iso7064Mod11_10(const std::string& digits) {
    int p = 10;
    for (char ch : digits) {
        int s = (p + (ch - '0')) % 10;
        if (s == 0) s = 10;
        p = (s * 2) % 11;
    }
    return (11 - p) % 10;
}

// =============================================================================
// ChecksumAlgorithm
// =============================================================================

ChecksumAlgorithm::ChecksumAlgorithm(std::string name, ChecksumKind kind, ChecksumParams params)
    : name_(std::move(name)), kind_(kind), params_(std::move(params)) {}

int ChecksumAlgorithm::width() const {
    switch (kind_) {
        case ChecksumKind::NONE:
            return 0;
        case ChecksumKind::IBAN_MOD97:
        case ChecksumKind::ISO7064_MOD97_10:
        case ChecksumKind::ABN_MOD89:
            return 2;
        case ChecksumKind::WEIGHTED:
        case ChecksumKind::NUMERIC_MOD:
            return params_.table.empty() ? params_.width : 1;
        default:
            return 1;
    }
}

std::string ChecksumAlgorithm::alphabet() const {
    switch (kind_) {
        case ChecksumKind::NONE:
            return "";
        case ChecksumKind::ISO7064_MOD11_2:
            return kDigits + "X";
        case ChecksumKind::ITALIAN_FISCAL_CODE:
            return "ABCDEFGHIJKLMNOPQRSTUVWXYZ";
        case ChecksumKind::WEIGHTED:
        case ChecksumKind::NUMERIC_MOD: {
            if (params_.table.empty()) {
                return kDigits;
            }
            std::set<char> seen;
            std::string out;
            for (char c : params_.table) {
                if (c != '?' && seen.insert(c).second) out += c;
            }
            return out;
        }
        default:
            return kDigits;
    }
}

std::optional<std::string> ChecksumAlgorithm::compute(const std::string& payload) const {
    switch (kind_) {
        case ChecksumKind::NONE:
            return std::string();

        case ChecksumKind::IBAN_MOD97: {
            if (payload.size() < 2) return std::nullopt;
            int r = mod97Remainder(payload.substr(2) + payload.substr(0, 2) + "00");
            if (r < 0) return std::nullopt;
            std::string s = std::to_string(98 - r);
            return s.size() < 2 ? "0" + s : s;
        }

        case ChecksumKind::ISO7064_MOD97_10: {
            int r = mod97Remainder(payload + "00");
            if (r < 0) return std::nullopt;
            std::string s = std::to_string(98 - r);
            return s.size() < 2 ? "0" + s : s;
        }

        case ChecksumKind::LUHN:
            if (!allDigits(payload)) return std::nullopt;
            return std::to_string(luhnCheckDigit(payload));

        case ChecksumKind::VERHOEFF:
            if (!allDigits(payload)) return std::nullopt;
            return std::to_string(verhoeffCheckDigit(payload));

        case ChecksumKind::ISO7064_MOD11_10:
            if (!allDigits(payload)) return std::nullopt;
            return std::to_string(iso7064Mod11_10(payload));

        case ChecksumKind::ISO7064_MOD11_2: {
            if (!allDigits(payload)) return std::nullopt;
            int s = 0;
            for (char c : payload) {
                s = ((s + (c - '0')) * 2) % 11;
            }
            int v = (12 - s) % 11;
            return v == 10 ? std::string("X") : std::to_string(v);
        }

        case ChecksumKind::WEIGHTED:
            return computeWeighted(payload, params_);

        case ChecksumKind::NUMERIC_MOD:
            return computeNumeric(payload, params_);

        case ChecksumKind::ITALIAN_FISCAL_CODE:
            return italianFiscalCheck(payload);

        case ChecksumKind::ABN_MOD89:
            for (int pair = 10; pair <= 99; ++pair) {
                std::string candidate = std::to_string(pair);
                if (abnValid(candidate + payload)) {
                    return candidate;
                }
            }
            return std::nullopt;
    }
    return std::nullopt;
}

bool ChecksumAlgorithm::verify(const std::string& payload, const std::string& check) const {
    switch (kind_) {
        case ChecksumKind::NONE:
            return check.empty();

        case ChecksumKind::IBAN_MOD97:
            if (payload.size() < 2 || check.size() != 2 || !allDigits(check)) return false;
            return mod97Remainder(payload.substr(2) + payload.substr(0, 2) + check) == 1;

        case ChecksumKind::ISO7064_MOD97_10:
            if (check.size() != 2 || !allDigits(check)) return false;
            return mod97Remainder(payload + check) == 1;

        case ChecksumKind::ABN_MOD89:
            return check.size() == 2 && abnValid(check + payload);

        case ChecksumKind::NUMERIC_MOD: {
            auto expected = compute(payload);
            if (expected && *expected == check) return true;
            if (!params_.altPrefix.empty()) {
                auto alternate = compute(params_.altPrefix + payload);
                return alternate && *alternate == check;
            }
            return false;
        }

        default: {
            auto expected = compute(payload);
            return expected && *expected == check;
        }
    }
}

// =============================================================================
// ChecksumLibrary
// =============================================================================

void ChecksumLibrary::add(ChecksumAlgorithm algorithm) {
    std::string name = algorithm.name();
    if (name.empty()) {
        throw common::RegistryException("checksum algorithm without a name");
    }
    auto inserted = algorithms_.emplace(name, std::move(algorithm));
    if (!inserted.second) {
        throw common::RegistryException("duplicate checksum algorithm '" + name + "'");
    }
}

const ChecksumAlgorithm* ChecksumLibrary::find(const std::string& name) const {
    auto it = algorithms_.find(name);
    return it == algorithms_.end() ? nullptr : &it->second;
}

std::vector<std::string> ChecksumLibrary::names() const {
    std::vector<std::string> out;
    out.reserve(algorithms_.size());
    for (const auto& entry : algorithms_) {
        out.push_back(entry.first);
    }
    return out;
}

} // namespace idforge::core
