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

#include <money/utilities/parsers.hpp>

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <ql/errors.hpp>
#include <ql/utilities/null.hpp>

#include <map>

using namespace QuantLib;
using boost::algorithm::trim_copy;
using std::string;

namespace money {
namespace data {

Real parseReal(const string& s) {
    try {
        return boost::lexical_cast<Real>(trim_copy(s));
    } catch (const boost::bad_lexical_cast&) {
        QL_FAIL("Failed to parseReal(\"" << s << "\")");
    }
}

bool tryParseReal(const string& s, QuantLib::Real& result) {
    try {
        result = boost::lexical_cast<Real>(trim_copy(s));
    } catch (const boost::bad_lexical_cast&) {
        result = Null<Real>();
        return false;
    }
    return true;
}

Integer parseInteger(const string& s) {
    try {
        return boost::lexical_cast<Integer>(trim_copy(s));
    } catch (const boost::bad_lexical_cast&) {
        QL_FAIL("Failed to parseInteger(\"" << s << "\")");
    }
}

bool parseBool(const string& s) {
    static std::map<string, bool> b = {{"Y", true},     {"YES", true},   {"TRUE", true},   {"true", true},
                                       {"1", true},     {"N", false},    {"NO", false},    {"FALSE", false},
                                       {"false", false}, {"0", false}};

    auto it = b.find(trim_copy(s));
    if (it != b.end()) {
        return it->second;
    } else {
        QL_FAIL("Cannot convert \"" << s << "\" to bool");
    }
}

bool tryParseCurrencyCode(const string& s, UnitCurrency::Code& code) {
    for (auto c : UnitCurrency::codes()) {
        if (s == UnitCurrency::codeName(c)) {
            code = c;
            return true;
        }
    }
    return false;
}

UnitCurrency::Code parseCurrencyCode(const string& s) {
    UnitCurrency::Code code = UnitCurrency::Code::USD;
    QL_REQUIRE(tryParseCurrencyCode(trim_copy(s), code), "Currency code \"" << s << "\" not recognized");
    return code;
}

const UnitCurrency& parseUnitCurrency(const string& s) { return UnitCurrency::fromCode(parseCurrencyCode(s)); }

} // namespace data
} // namespace money
