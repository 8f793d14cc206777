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

/*! \file money/configuration/currencyunitconfig.hpp
    \brief currency unit configuration
    \ingroup configuration
*/

#pragma once

#include <money/currencies/unitcurrency.hpp>
#include <money/utilities/xmlutils.hpp>

#include <vector>

namespace money {
namespace data {

//! Configuration of currency units with user defined coefficients
/*! Reads and writes

    <pre>
    <CurrencyUnitConfig>
      <CurrencyUnit>
        <Code>EUR</Code>
        <Symbol>€</Symbol>
        <Coefficient>1.10</Coefficient>
      </CurrencyUnit>
      ...
    </CurrencyUnitConfig>
    </pre>

    Symbol and Coefficient are optional, missing values are taken from the catalog currency for the code.
    Entries that cannot be read are logged and skipped. At most one unit is held per code, a later entry
    replaces an earlier one.

    \warning The configured units compare equal to the catalog units with the same code and symbol,
             see UnitCurrency.

    \ingroup configuration
*/
class CurrencyUnitConfig : public XMLSerializable {
public:
    CurrencyUnitConfig() {}
    explicit CurrencyUnitConfig(const std::vector<UnitCurrency>& units);

    //! \name Inspectors
    //@{
    const std::vector<UnitCurrency>& units() const { return units_; }
    bool has(UnitCurrency::Code code) const;
    const UnitCurrency& unit(UnitCurrency::Code code) const;
    //@}

    //! adds a unit, replacing the unit configured for the same code
    void add(const UnitCurrency& unit);
    void clear() { units_.clear(); }

    //! \name Serialisation
    //@{
    void fromXML(XMLNode* node) override;
    XMLNode* toXML(XMLDocument& doc) const override;
    //@}

private:
    std::vector<UnitCurrency> units_;
};

} // namespace data
} // namespace money
