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

/*! \file money/coding/inmemorycoder.hpp
    \brief In memory keyed archive
    \ingroup coding
*/

#pragma once

#include <money/coding/coder.hpp>

#include <ql/types.hpp>

#include <map>
#include <vector>

namespace money {
namespace data {
using QuantLib::Size;
using std::vector;

/*! InMemoryCoder keeps the encoded fields in a local map and serves them back for decoding.
  \ingroup coding
 */
class InMemoryCoder : public KeyedEncoder, public KeyedDecoder {
public:
    InMemoryCoder() {}
    explicit InMemoryCoder(const std::map<string, string>& fields) : fields_(fields) {}

    void encode(const string& key, const string& value) override;
    boost::optional<string> decodeString(const string& key) const override;
    bool contains(const string& key) const override;

    //! \name Inspectors
    //@{
    Size size() const { return fields_.size(); }
    vector<string> keys() const;
    const std::map<string, string>& fields() const { return fields_; }
    //@}

    void clear() { fields_.clear(); }

private:
    std::map<string, string> fields_;
};

} // namespace data
} // namespace money
