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

/*! \file money/currencies/unitcurrency.hpp
    \brief Currency as a linear unit of measure
    \ingroup currencies
*/

#pragma once

#include <money/coding/coder.hpp>
#include <money/units/linearconverter.hpp>

#include <boost/optional.hpp>

#include <ostream>
#include <string>
#include <vector>

namespace money {
namespace data {
using std::string;

//! A unit of measure for money
/*! Each currency is tied to the base currency (USD) by a linear converter, whose coefficient is the
    amount of USD that one unit of the currency is worth. Amounts of money are represented as
    Measurement<UnitCurrency>, converting between two currencies goes through the base currency.

    The catalog holds one instance per code, see USD(), EUR() etc. Further instances can be constructed
    freely, nothing is validated.

    \warning Two currencies are equal if their codes and symbols match, the converter is not compared.
             If you create two currencies with equal codes and symbols but different coefficients the
             behaviour of conversions between them is undefined.

    \ingroup currencies
*/
class UnitCurrency {
public:
    //! ISO 4217 codes of the supported currencies
    enum class Code { USD, EUR, GBP, RUR, JPY, AUD, CAD, AMD };

    UnitCurrency(const string& symbol, Code code, Real coefficient);
    UnitCurrency(const string& symbol, Code code, const LinearConverter& converter);

    //! \name Catalog
    //@{
    //! United States dollar, the base currency
    static const UnitCurrency& USD();
    //! Euro
    static const UnitCurrency& EUR();
    //! Pound sterling
    static const UnitCurrency& GBP();
    //! Russian ruble
    static const UnitCurrency& RUR();
    //! Japanese yen
    static const UnitCurrency& JPY();
    //! Australian dollar
    static const UnitCurrency& AUD();
    //! Canadian dollar
    static const UnitCurrency& CAD();
    //! Armenian dram
    static const UnitCurrency& AMD();

    //! the base currency, USD
    static const UnitCurrency& baseUnit();
    //! the catalog currency for a code
    static const UnitCurrency& fromCode(Code code);
    //! all supported codes, in catalog order
    static const std::vector<Code>& codes();
    //! the ISO 4217 string for a code
    static const string& codeName(Code code);
    //@}

    //! \name Inspectors
    //@{
    const string& symbol() const { return symbol_; }
    Code code() const { return code_; }
    const LinearConverter& converter() const { return converter_; }
    //! amount of base currency worth one unit of this currency
    Real coefficient() const { return converter_.coefficient(); }
    //@}

    //! \name Coding
    //@{
    //! key under which the code is stored
    static const string codeKey;
    //! writes the code, symbol and coefficient are not stored
    void encode(KeyedEncoder& encoder) const;
    //! the catalog currency for the stored code, none if the code is missing or unknown
    static boost::optional<UnitCurrency> decode(const KeyedDecoder& decoder);
    //@}

private:
    string symbol_;
    Code code_;
    LinearConverter converter_;
};

//! compares code and symbol only
bool operator==(const UnitCurrency&, const UnitCurrency&);
bool operator!=(const UnitCurrency&, const UnitCurrency&);

std::ostream& operator<<(std::ostream&, UnitCurrency::Code);
std::ostream& operator<<(std::ostream&, const UnitCurrency&);

} // namespace data
} // namespace money
