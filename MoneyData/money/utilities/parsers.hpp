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

/*! \file money/utilities/parsers.hpp
    \brief string utilities
    \ingroup utilities
*/

#pragma once

#include <money/currencies/unitcurrency.hpp>

#include <ql/types.hpp>

#include <string>

namespace money {
namespace data {
using QuantLib::Integer;
using QuantLib::Real;
using std::string;

//! Convert text to Real
/*!
  \ingroup utilities
*/
Real parseReal(const string& s);

//! Attempt to convert text to Real
/*! Attempts to convert text to Real
    \param[in]  s      The string we wish to convert to a Real
    \param[out] result The result of the conversion if it is valid.
                       Null<Real>() if conversion fails

    \return True if the conversion was successful, False if not

    \ingroup utilities
*/
bool tryParseReal(const string& s, Real& result);

//! Convert text to QuantLib::Integer
/*!
  \ingroup utilities
*/
Integer parseInteger(const string& s);

//! Convert text to bool
/*!
  \ingroup utilities
*/
bool parseBool(const string& s);

//! Convert text to a currency code
/*! Codes are matched exactly against the supported ISO 4217 codes, surrounding whitespace is ignored.
    Throws for an unknown code.
    \ingroup utilities
*/
UnitCurrency::Code parseCurrencyCode(const string& s);

//! Attempt to convert text to a currency code
/*! Unlike parseCurrencyCode() the text must match a code exactly.
    \return True if the conversion was successful, False if not
    \ingroup utilities
*/
bool tryParseCurrencyCode(const string& s, UnitCurrency::Code& code);

//! Convert text to the catalog currency unit for the code
/*!
  \ingroup utilities
*/
const UnitCurrency& parseUnitCurrency(const string& s);

} // namespace data
} // namespace money
