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

#include <money/configuration/currencyunitconfig.hpp>
#include <money/utilities/log.hpp>
#include <money/utilities/parsers.hpp>

#include <boost/algorithm/string/trim.hpp>
#include <ql/errors.hpp>

#include <algorithm>

namespace money {
namespace data {

CurrencyUnitConfig::CurrencyUnitConfig(const std::vector<UnitCurrency>& units) {
    for (auto const& u : units)
        add(u);
}

bool CurrencyUnitConfig::has(UnitCurrency::Code code) const {
    return std::find_if(units_.begin(), units_.end(), [code](const UnitCurrency& u) { return u.code() == code; }) !=
           units_.end();
}

const UnitCurrency& CurrencyUnitConfig::unit(UnitCurrency::Code code) const {
    auto it = std::find_if(units_.begin(), units_.end(), [code](const UnitCurrency& u) { return u.code() == code; });
    QL_REQUIRE(it != units_.end(), "CurrencyUnitConfig: no unit configured for " << code);
    return *it;
}

void CurrencyUnitConfig::add(const UnitCurrency& unit) {
    auto it = std::find_if(units_.begin(), units_.end(),
                           [&unit](const UnitCurrency& u) { return u.code() == unit.code(); });
    if (it != units_.end()) {
        DLOG("CurrencyUnitConfig: replacing unit for " << unit.code());
        *it = unit;
    } else {
        units_.push_back(unit);
    }
}

void CurrencyUnitConfig::fromXML(XMLNode* node) {
    clear();
    XMLUtils::checkNode(node, "CurrencyUnitConfig");

    for (auto n : XMLUtils::getChildrenNodes(node, "CurrencyUnit")) {
        string code = XMLUtils::getChildValue(n, "Code", false);
        try {
            DLOG("Loading currency unit configuration for " << code);
            const UnitCurrency& ref = parseUnitCurrency(code);
            string symbol = boost::algorithm::trim_copy(XMLUtils::getChildValue(n, "Symbol", false));
            if (symbol.empty())
                symbol = ref.symbol();
            Real coefficient = XMLUtils::getChildValueAsDouble(n, "Coefficient", false, ref.coefficient());
            if (coefficient <= 0.0) {
                WLOG("CurrencyUnitConfig: non-positive coefficient " << coefficient << " for " << code);
            }
            add(UnitCurrency(symbol, ref.code(), coefficient));
        } catch (const std::exception& e) {
            ALOG("error loading currency unit config for code '" << code << "': " << e.what());
        }
    }
    LOG("CurrencyUnitConfig: loaded " << units_.size() << " currency units");
}

XMLNode* CurrencyUnitConfig::toXML(XMLDocument& doc) const {
    XMLNode* node = doc.allocNode("CurrencyUnitConfig");
    for (auto const& u : units_) {
        XMLNode* unitNode = XMLUtils::addChild(doc, node, "CurrencyUnit");
        XMLUtils::addChild(doc, unitNode, "Code", UnitCurrency::codeName(u.code()));
        XMLUtils::addChild(doc, unitNode, "Symbol", u.symbol());
        XMLUtils::addChild(doc, unitNode, "Coefficient", u.coefficient());
    }
    return node;
}

} // namespace data
} // namespace money
