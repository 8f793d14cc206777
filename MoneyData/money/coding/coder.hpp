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

/*! \file money/coding/coder.hpp
    \brief Keyed encoder and decoder interfaces
    \ingroup coding
*/

#pragma once

#include <boost/optional.hpp>

#include <string>

namespace money {
namespace data {
using std::string;

/*! Abstract keyed encoder

    An encoder is a flat set of string fields, each stored under a key. Encoding a key that has been
    encoded before replaces the stored value.

    Usage
    <pre>
     InMemoryCoder coder;
     UnitCurrency::EUR().encode(coder);
     boost::optional<UnitCurrency> ccy = UnitCurrency::decode(coder);
    </pre>
  \ingroup coding
 */
class KeyedEncoder {
public:
    virtual ~KeyedEncoder() {}
    virtual void encode(const string& key, const string& value) = 0;
};

/*! Abstract keyed decoder
  \ingroup coding
 */
class KeyedDecoder {
public:
    virtual ~KeyedDecoder() {}
    //! the value stored under \p key, none if there is no such field
    virtual boost::optional<string> decodeString(const string& key) const = 0;
    virtual bool contains(const string& key) const { return decodeString(key) != boost::none; }
};

} // namespace data
} // namespace money
