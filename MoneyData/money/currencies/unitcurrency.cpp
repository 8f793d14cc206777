/*
 Copyright (C) 2024 Quaternion Risk Management Ltd
 All rights reserved.

 This file is part of Money, a free-software/open-source library
 for currencies as units of measure

 Money is free software: you can redistribute it and/or modify it
 under the terms of the Modified BSD License.  You should have received a
 copy of the license along with this program.

 This program is distributed on the basis that it will form a useful
 contribution to risk analytics and model standardisation, but WITHOUT
 ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 FITNESS FOR A PARTICULAR PURPOSE. See the license for more details.
*/

#include <money/currencies/unitcurrency.hpp>
#include <money/utilities/log.hpp>
#include <money/utilities/parsers.hpp>

#include <ql/errors.hpp>

namespace money {
namespace data {

const string UnitCurrency::codeKey = "code";

UnitCurrency::UnitCurrency(const string& symbol, Code code, Real coefficient)
    : symbol_(symbol), code_(code), converter_(coefficient) {}

UnitCurrency::UnitCurrency(const string& symbol, Code code, const LinearConverter& converter)
    : symbol_(symbol), code_(code), converter_(converter) {}

// Coefficients are the USD value of one unit of each currency

const UnitCurrency& UnitCurrency::USD() {
    static const UnitCurrency ccy("$", Code::USD, 1.0);
    return ccy;
}

const UnitCurrency& UnitCurrency::EUR() {
    static const UnitCurrency ccy("€", Code::EUR, 1.123349);
    return ccy;
}

const UnitCurrency& UnitCurrency::GBP() {
    static const UnitCurrency ccy("£", Code::GBP, 1.25025);
    return ccy;
}

const UnitCurrency& UnitCurrency::RUR() {
    static const UnitCurrency ccy("₽", Code::RUR, 0.01587);
    return ccy;
}

const UnitCurrency& UnitCurrency::JPY() {
    static const UnitCurrency ccy("¥", Code::JPY, 0.009283);
    return ccy;
}

const UnitCurrency& UnitCurrency::AUD() {
    static const UnitCurrency ccy("A$", Code::AUD, 0.7042);
    return ccy;
}

const UnitCurrency& UnitCurrency::CAD() {
    static const UnitCurrency ccy("C$", Code::CAD, 0.764905);
    return ccy;
}

const UnitCurrency& UnitCurrency::AMD() {
    static const UnitCurrency ccy("֏", Code::AMD, 0.00209872);
    return ccy;
}

const UnitCurrency& UnitCurrency::baseUnit() { return USD(); }

const UnitCurrency& UnitCurrency::fromCode(Code code) {
    switch (code) {
    case Code::USD:
        return USD();
    case Code::EUR:
        return EUR();
    case Code::GBP:
        return GBP();
    case Code::RUR:
        return RUR();
    case Code::JPY:
        return JPY();
    case Code::AUD:
        return AUD();
    case Code::CAD:
        return CAD();
    case Code::AMD:
        return AMD();
    default:
        QL_FAIL("unknown currency code " << static_cast<int>(code));
    }
}

const std::vector<UnitCurrency::Code>& UnitCurrency::codes() {
    static const std::vector<Code> c = {Code::USD, Code::EUR, Code::GBP, Code::RUR,
                                        Code::JPY, Code::AUD, Code::CAD, Code::AMD};
    return c;
}

const string& UnitCurrency::codeName(Code code) {
    static const std::vector<string> names = {"USD", "EUR", "GBP", "RUR", "JPY", "AUD", "CAD", "AMD"};
    auto i = static_cast<std::size_t>(code);
    QL_REQUIRE(i < names.size(), "unknown currency code " << i);
    return names[i];
}

void UnitCurrency::encode(KeyedEncoder& encoder) const { encoder.encode(codeKey, codeName(code_)); }

boost::optional<UnitCurrency> UnitCurrency::decode(const KeyedDecoder& decoder) {
    boost::optional<string> codeString = decoder.decodeString(codeKey);
    if (!codeString) {
        DLOG("UnitCurrency::decode(): no field '" << codeKey << "'");
        return boost::none;
    }
    Code code = Code::USD;
    if (!tryParseCurrencyCode(*codeString, code)) {
        DLOG("UnitCurrency::decode(): currency code '" << *codeString << "' not recognized");
        return boost::none;
    }
    return fromCode(code);
}

bool operator==(const UnitCurrency& c1, const UnitCurrency& c2) {
    return c1.code() == c2.code() && c1.symbol() == c2.symbol();
}

bool operator!=(const UnitCurrency& c1, const UnitCurrency& c2) { return !(c1 == c2); }

std::ostream& operator<<(std::ostream& out, UnitCurrency::Code code) { return out << UnitCurrency::codeName(code); }

std::ostream& operator<<(std::ostream& out, const UnitCurrency& c) { return out << c.code() << " (" << c.symbol() << ")"; }

} // namespace data
} // namespace money
