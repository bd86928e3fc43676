/**
 * @file registry_credit_card.cpp
 * @brief Payment card numbers by brand (IIN prefix, length, Luhn)
 */

#include "registry_data.h"

namespace idforge::core::detail {

using namespace layout;

namespace {

std::vector<std::string> prefixRange(int from, int to) {
    std::vector<std::string> prefixes;
    for (int i = from; i <= to; ++i) {
        prefixes.push_back(std::to_string(i));
    }
    return prefixes;
}

/// IIN prefix, account digits up to the full length, Luhn digit
std::vector<Token> card(std::vector<std::string> iins, int length) {
    const int body = length - static_cast<int>(iins.front().size()) - 1;
    return {named(oneOf(std::move(iins)), "iin"), named(digits(body), "account"), check("luhn")};
}

} // anonymous namespace

void addCreditCardFormats(std::vector<FormatSpec>& out) {
    auto add = [&out](const std::string& code, const std::string& name,
                      std::vector<Token> tokens, DisplayRule display = groupsOf(4)) {
        out.push_back(makeSpec(Category::CREDIT_CARD, code, name, std::move(tokens),
                               std::move(display)));
    };

    std::vector<std::string> discover = {"6011", "6440", "6441", "6442", "6443", "6444",
                                         "6445", "6446", "6447", "6448", "6449"};
    for (auto& p : prefixRange(6500, 6599)) discover.push_back(p);

    add("amex", "American Express", card({"34", "37"}, 15), grouped({4, 6, 5}, {" "}));
    add("diners", "Diners Club International", card({"36"}, 14), grouped({4, 6, 4}, {" "}));
    add("discover", "Discover", card(discover, 16));
    add("elo", "Elo", card({"401178", "401179", "431274", "438935", "451416", "457393",
                            "504175", "506699", "627780", "636297", "636368"}, 16));
    add("hipercard", "Hipercard", card({"606282"}, 16));
    add("jcb", "JCB", card(prefixRange(3528, 3589), 16));
    add("maestro", "Maestro", card({"5018", "5020", "5038", "5893", "6304", "6759", "6761",
                                    "6762", "6763"}, 16));
    add("mastercard", "Mastercard", card(prefixRange(51, 55), 16));
    add("mir", "Mir", card(prefixRange(2200, 2204), 16));
    add("rupay", "RuPay", card({"60", "81", "82"}, 16));
    add("troy", "Troy", card({"9792"}, 16));
    add("uatp", "UATP", card({"1"}, 15), grouped({4, 5, 6}, {" "}));
    add("unionpay", "UnionPay", card({"62"}, 16));
    add("verve", "Verve", card(prefixRange(506099, 506198), 16));
    add("visa", "Visa", card({"4"}, 16));
}

} // namespace idforge::core::detail
