/**
 * @file checksum_catalog.cpp
 * @brief Named algorithm instances used by the built-in formats
 */

#include "idforge/core/checksum.h"

namespace idforge::core {

namespace {

const char* const kDigitTable = "0123456789";

ChecksumParams weighted(std::vector<int> weights, int modulus,
                        Residue residue = Residue::DIRECT, std::string table = "") {
    ChecksumParams p;
    p.weights = std::move(weights);
    p.modulus = modulus;
    p.residue = residue;
    p.table = std::move(table);
    return p;
}

ChecksumParams fromRight(ChecksumParams p) {
    p.weightsFromRight = true;
    return p;
}

ChecksumParams withBase(ChecksumParams p, int base) {
    p.complementBase = base;
    return p;
}

ChecksumParams withFallback(ChecksumParams p, std::vector<int> weights) {
    p.fallbackWeights = std::move(weights);
    return p;
}

ChecksumParams withMap(ChecksumParams p, CharValueMap map) {
    p.charMap = map;
    return p;
}

ChecksumParams numeric(int modulus, Residue residue = Residue::DIRECT, std::string table = "",
                       int width = 1) {
    ChecksumParams p;
    p.modulus = modulus;
    p.residue = residue;
    p.table = std::move(table);
    p.width = width;
    return p;
}

} // anonymous namespace

ChecksumLibrary ChecksumLibrary::standard() {
    ChecksumLibrary lib;
    auto add = [&lib](const char* name, ChecksumKind kind, ChecksumParams params = {}) {
        lib.add(ChecksumAlgorithm(name, kind, std::move(params)));
    };
    const auto W = ChecksumKind::WEIGHTED;
    const auto N = ChecksumKind::NUMERIC_MOD;
    const auto R = Residue::COMPLEMENT_REDUCED;
    const auto C = Residue::COMPLEMENT;

    // --- Generic schemes ---
    add("none", ChecksumKind::NONE);
    add("iban-mod97", ChecksumKind::IBAN_MOD97);
    add("iso7064-mod97-10", ChecksumKind::ISO7064_MOD97_10);
    add("iso7064-mod11-10", ChecksumKind::ISO7064_MOD11_10);
    add("iso7064-mod11-2", ChecksumKind::ISO7064_MOD11_2);
    add("luhn", ChecksumKind::LUHN);
    add("verhoeff", ChecksumKind::VERHOEFF);
    add("italian-fiscal-code", ChecksumKind::ITALIAN_FISCAL_CODE);
    add("abn-mod89", ChecksumKind::ABN_MOD89);
    add("gs1-mod10", W, fromRight(weighted({3, 1}, 10, R)));
    add("mrz-731", W, withMap(weighted({7, 3, 1}, 10), CharValueMap::MRZ));

    // --- Personal identifiers ---
    {
        auto p = withFallback(weighted({1, 2, 3, 4, 5, 6, 7, 8, 9, 1}, 11, Residue::DIRECT, kDigitTable),
                              {3, 4, 5, 6, 7, 8, 9, 1, 2, 3});
        p.fallbackValue = 0;
        add("ee-isikukood", W, p);
    }
    add("kz-iin", W, withFallback(weighted({1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11}, 11,
                                           Residue::DIRECT, kDigitTable),
                                  {3, 4, 5, 6, 7, 8, 9, 10, 11, 1, 2}));
    add("lv-personas-kods", W, withBase(weighted({1, 6, 3, 7, 9, 10, 5, 8, 4, 2}, 11, R, kDigitTable), 1101));
    add("pesel", W, weighted({1, 3, 7, 9}, 10, R));
    add("bg-egn", W, weighted({2, 4, 8, 5, 10, 9, 7, 3, 6}, 11, Residue::DIRECT, "01234567890"));
    add("ro-cnp", W, weighted({2, 7, 9, 1, 4, 6, 3, 5, 8, 2, 7, 9}, 11, Residue::DIRECT, "01234567891"));
    add("no-fnr-k1", W, weighted({3, 7, 6, 1, 8, 9, 4, 5, 2}, 11, R, kDigitTable));
    add("no-fnr-k2", W, weighted({5, 4, 3, 2, 7, 6, 5, 4, 3, 2}, 11, R, kDigitTable));
    add("mod11-32765432", W, weighted({3, 2, 7, 6, 5, 4, 3, 2}, 11, R, kDigitTable));
    add("nl-elfproef", W, weighted({9, 8, 7, 6, 5, 4, 3, 2}, 11, Residue::DIRECT, kDigitTable));
    add("pt-nif", W, weighted({9, 8, 7, 6, 5, 4, 3, 2}, 11, C, "012345678900"));
    add("ie-ppsn", W, weighted({8, 7, 6, 5, 4, 3, 2}, 23, Residue::DIRECT, "WABCDEFGHIJKLMNOPQRSTUV"));
    add("br-cpf-1", W, weighted({10, 9, 8, 7, 6, 5, 4, 3, 2}, 11, C, "012345678900"));
    add("br-cpf-2", W, weighted({11, 10, 9, 8, 7, 6, 5, 4, 3, 2}, 11, C, "012345678900"));
    add("cl-rut", W, fromRight(weighted({2, 3, 4, 5, 6, 7}, 11, C, "0123456789K0")));
    add("mx-curp", W, withMap(weighted({18, 17, 16, 15, 14, 13, 12, 11, 10, 9, 8, 7, 6, 5, 4, 3, 2},
                                       10, R), CharValueMap::CURP));
    add("jp-my-number", W, fromRight(weighted({2, 3, 4, 5, 6, 7, 2, 3, 4, 5, 6}, 11, C, "012345678900")));
    add("kr-rrn", W, weighted({2, 3, 4, 5, 6, 7, 8, 9, 2, 3, 4, 5}, 11, C, "012345678901"));
    add("th-id", W, weighted({13, 12, 11, 10, 9, 8, 7, 6, 5, 4, 3, 2}, 11, C, "012345678901"));
    {
        auto p = withMap(weighted({1, 9, 8, 7, 6, 5, 4, 3, 2, 1}, 10, R), CharValueMap::TAIWAN);
        p.expandTwoDigit = true;
        add("tw-id", W, p);
    }
    add("tr-tckn-1", W, weighted({7, -1}, 10));
    add("tr-tckn-2", W, weighted({1}, 10));
    add("sg-nric", W, withMap(weighted({1, 2, 7, 6, 5, 4, 3, 2}, 11, Residue::DIRECT, "JZIHGFEDCBA"),
                              CharValueMap::NRIC));
    {
        auto p = withMap(weighted({8, 7, 6, 5, 4, 3, 2}, 11, C, "0123456789A0"), CharValueMap::ALNUM);
        p.sumOffset = 324;  // implicit leading space of single-letter prefixes
        add("hk-hkid", W, p);
    }
    add("au-medicare", W, weighted({1, 3, 7, 9, 1, 3, 7, 9}, 10));
    add("uy-ci", W, weighted({2, 9, 8, 7, 6, 3, 4}, 10, R));
    add("md-idnp", W, weighted({7, 3, 1}, 10));
    add("hu-taj", W, weighted({3, 7}, 10));
    add("sv-dui", W, weighted({9, 8, 7, 6, 5, 4, 3, 2}, 10, R));
    {
        auto p = weighted({9, 8, 7, 6, 5, 4, 3, 2, 1}, 101);
        p.width = 2;
        p.truncateToWidth = true;
        add("ru-snils", W, p);
    }
    add("ir-melli", W, weighted({10, 9, 8, 7, 6, 5, 4, 3, 2}, 11, C, "012345678910"));
    add("at-svnr", W, weighted({3, 7, 9, 5, 8, 4, 2, 1, 6}, 11, Residue::DIRECT, kDigitTable));
    add("si-emso", W, weighted({7, 6, 5, 4, 3, 2}, 11, C, "0123456789?0"));
    add("es-dni", N, numeric(23, Residue::DIRECT, "TRWAGMYFPDXBNJZSQVHLCKE"));
    {
        auto p = numeric(23, Residue::DIRECT, "TRWAGMYFPDXBNJZSQVHLCKE");
        p.charMap = CharValueMap::NIE;
        add("es-nie", N, p);
    }
    add("fi-hetu", N, numeric(31, Residue::DIRECT, "0123456789ABCDEFHJKLMNPRSTUVWXY"));
    add("cz-rodne-cislo", N, numeric(11, Residue::DIRECT, "01234567890"));
    add("fr-nir", N, numeric(97, C, "", 2));
    {
        auto p = numeric(97, C, "", 2);
        p.altPrefix = "2";  // born 2000 or later
        add("be-nrn", N, p);
    }
    add("ua-rnokpp", W, weighted({-1, 5, 7, 9, 4, 6, 10, 5, 7}, 11, Residue::DIRECT, "01234567890"));
    add("uz-pinfl", W, weighted({7, 3, 1}, 10));
    add("ni-cedula", N, numeric(23, Residue::DIRECT, "ABCDEFGHJKLMNPQRSTUVWXY"));
    add("kw-civil-id", W, weighted({2, 1, 6, 3, 7, 9, 10, 5, 8, 4, 2}, 11, C, "0123456789??"));
    add("gt-cui", W, fromRight(weighted({2, 3, 4, 5, 6, 7, 8, 9}, 11, R, "0123456789?")));

    // --- Bank routing and national BBAN checks ---
    add("aba-routing", W, weighted({3, 7, 1}, 10, R));
    add("mx-clabe", W, weighted({3, 7, 1}, 10, R));
    add("ar-cbu-1", W, weighted({7, 1, 3, 9, 7, 1, 3}, 10, R));
    add("ar-cbu-2", W, weighted({3, 9, 7, 1, 3, 9, 7, 1, 3, 9, 7, 1, 3}, 10, R));
    {
        auto p = fromRight(weighted({2, 1}, 10, R));
        p.crossSumProducts = true;
        add("de-kontonr-00", W, p);
    }
    add("es-ccc-1", W, weighted({4, 8, 5, 10, 9, 7, 3, 6}, 11, C, "012345678910"));
    add("es-ccc-2", W, weighted({1, 2, 4, 8, 5, 10, 9, 7, 3, 6}, 11, C, "012345678910"));
    {
        auto p = numeric(97, C, "", 2);
        p.charMap = CharValueMap::RIB;
        p.shift = 2;
        add("fr-rib", N, p);
    }
    {
        auto p = numeric(97, Residue::DIRECT, "", 2);
        p.zeroAs = 97;
        add("be-bban", N, p);
    }
    add("no-kontonr", W, weighted({5, 4, 3, 2, 7, 6, 5, 4, 3, 2}, 11, R));
    add("pl-bank", W, weighted({3, 9, 7, 1, 3, 9, 7}, 10, R));
    add("hu-9731", W, weighted({9, 7, 3, 1}, 10, R));
    add("cz-prefix", W, weighted({10, 5, 8, 4, 2}, 11, R, kDigitTable));
    add("cz-account", W, weighted({6, 3, 7, 9, 10, 5, 8, 4, 2}, 11, R, kDigitTable));
    add("ng-nuban", W, weighted({3, 7, 3, 3, 7, 3, 3, 7, 3, 3, 7, 3}, 10, R));

    // --- Company, tax and VAT numbers ---
    {
        auto p = weighted({1, 2}, 10, R);
        p.crossSumProducts = true;
        p.sumOffset = 4;
        add("at-uid", W, p);
    }
    add("be-enterprise", N, numeric(97, C, "", 2));
    {
        auto p = withFallback(weighted({1, 2, 3, 4, 5, 6, 7, 8}, 11, Residue::DIRECT, kDigitTable),
                              {3, 4, 5, 6, 7, 8, 9, 10});
        p.fallbackValue = 0;
        add("mod11-two-stage-8", W, p);
    }
    add("cz-ico", W, weighted({8, 7, 6, 5, 4, 3, 2}, 11, C, "012345678901"));
    add("dk-cvr", W, withBase(weighted({2, 7, 6, 5, 4, 3, 2}, 11, R, kDigitTable), 11));
    add("ee-kmkr", W, weighted({3, 7, 1}, 10, R));
    add("gr-afm", W, weighted({256, 128, 64, 32, 16, 8, 4, 2}, 11, Residue::DIRECT, "01234567890"));
    add("fi-ytunnus", W, weighted({7, 9, 10, 5, 8, 4, 2}, 11, C, "0123456789?0"));
    {
        auto p = numeric(97, Residue::DIRECT, "", 2);
        p.shift = 2;
        p.sumOffset = 12;
        add("fr-tva-key", N, p);
    }
    add("lu-tva", N, numeric(89, Residue::DIRECT, "", 2));
    add("lv-pvn", W, withBase(weighted({9, 1, 4, 8, 3, 10, 2, 5, 7, 6}, 11, R, kDigitTable), 3));
    {
        auto p = weighted({3, 4, 6, 7, 8, 9}, 37, C);
        p.width = 2;
        add("mt-vat", W, p);
    }
    add("pl-nip", W, weighted({6, 5, 7, 2, 3, 4, 5, 6, 7}, 11, Residue::DIRECT, kDigitTable));
    add("ro-cui", W, fromRight(weighted({2, 3, 5, 7, 1, 2, 3, 5, 7}, 11, R, "01234567890")));
    add("si-ddv", W, weighted({8, 7, 6, 5, 4, 3, 2}, 11, C, "01234567890?"));
    {
        auto p = numeric(11, R, kDigitTable);
        p.shift = 1;
        add("sk-dph", N, p);
    }
    {
        auto p = weighted({8, 7, 6, 5, 4, 3, 2}, 97, C);
        p.width = 2;
        add("gb-vat", W, p);
    }
    add("ch-uid", W, weighted({5, 4, 3, 2, 7, 6, 5, 4}, 11, C, "0123456789?0"));
    add("pl-regon", W, weighted({8, 9, 2, 3, 4, 5, 6, 7}, 11, Residue::DIRECT, "01234567890"));
    add("br-cnpj-1", W, weighted({5, 4, 3, 2, 9, 8, 7, 6, 5, 4, 3, 2}, 11, C, "012345678900"));
    add("br-cnpj-2", W, weighted({6, 5, 4, 3, 2, 9, 8, 7, 6, 5, 4, 3, 2}, 11, C, "012345678900"));
    add("jp-corporate", W, fromRight(weighted({1, 2}, 9, C, "?123456789")));
    add("ru-ogrn", N, numeric(11, Residue::DIRECT, "01234567890"));
    add("cn-uscc", W, withMap(weighted({1, 3, 9, 27, 19, 26, 16, 17, 20, 29, 25, 13, 8, 24, 10, 30, 28},
                                       31, C, "0123456789ABCDEFGHJKLMNPQRTUWXY0"),
                              CharValueMap::USCC));
    add("gb-utr", W, weighted({6, 7, 8, 9, 10, 5, 4, 3, 2}, 11, Residue::DIRECT, "21987654321"));
    {
        auto p = numeric(511, Residue::DIRECT, "", 3);
        add("fr-spi", N, p);
    }
    add("au-tfn", W, weighted({1, 4, 3, 7, 5, 8, 6, 9}, 11, Residue::DIRECT, kDigitTable));
    add("nz-ird", W, withFallback(weighted({3, 2, 7, 6, 5, 4, 3, 2}, 11, R, kDigitTable),
                                  {7, 4, 3, 2, 5, 2, 7, 6}));
    add("ar-cuit", W, weighted({5, 4, 3, 2, 7, 6, 5, 4, 3, 2}, 11, C, "0123456789?0"));
    add("co-nit", W, fromRight(weighted({3, 7, 13, 17, 19, 23, 29, 37, 41, 43, 47, 53, 59, 67, 71},
                                        11, C, "012345678910")));
    add("pe-ruc", W, weighted({5, 4, 3, 2, 7, 6, 5, 4, 3, 2}, 11, C, "012345678901"));
    add("ru-inn-10", W, weighted({2, 4, 10, 3, 5, 9, 4, 6, 8}, 11, Residue::DIRECT, "01234567890"));
    add("ru-inn-11", W, weighted({7, 2, 4, 10, 3, 5, 9, 4, 6, 8}, 11, Residue::DIRECT, "01234567890"));
    add("ru-inn-12", W, weighted({3, 7, 2, 4, 10, 3, 5, 9, 4, 6, 8}, 11, Residue::DIRECT, "01234567890"));
    add("hu-adoazonosito", W, weighted({1, 2, 3, 4, 5, 6, 7, 8, 9}, 11, Residue::DIRECT, kDigitTable));
    add("by-unp", W, weighted({29, 23, 19, 17, 13, 7, 5, 3}, 11, Residue::DIRECT, kDigitTable));
    add("uy-rut", W, weighted({4, 3, 2, 9, 8, 7, 6, 5, 4, 3, 2}, 11, C, "0123456789?0"));
    add("py-ruc", W, fromRight(weighted({2, 3, 4, 5, 6, 7, 8, 9, 10, 11}, 11, C, "012345678900")));
    add("do-rnc", W, weighted({7, 9, 8, 6, 5, 4, 3, 2}, 11, C, "012345678912"));
    add("gt-nit", W, fromRight(weighted({2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13}, 11, R,
                                        "0123456789K")));
    add("vn-mst", W, withBase(weighted({31, 29, 23, 19, 17, 13, 7, 5, 3}, 11, C, "0123456789?"), 10));
    {
        auto p = weighted({1, 2, 1, 2, 1, 2, 4}, 10, R);
        p.crossSumProducts = true;
        add("tw-ubn", W, p);
    }

    return lib;
}

} // namespace idforge::core
