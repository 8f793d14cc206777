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

#include <money/coding/inmemorycoder.hpp>

namespace money {
namespace data {

void InMemoryCoder::encode(const string& key, const string& value) { fields_[key] = value; }

boost::optional<string> InMemoryCoder::decodeString(const string& key) const {
    auto it = fields_.find(key);
    if (it == fields_.end())
        return boost::none;
    return it->second;
}

bool InMemoryCoder::contains(const string& key) const { return fields_.find(key) != fields_.end(); }

vector<string> InMemoryCoder::keys() const {
    vector<string> result;
    result.reserve(fields_.size());
    for (auto const& f : fields_)
        result.push_back(f.first);
    return result;
}

} // namespace data
} // namespace money
