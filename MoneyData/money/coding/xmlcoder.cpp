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

#include <money/coding/xmlcoder.hpp>

#include <ql/errors.hpp>

#include <cctype>

namespace money {
namespace data {

namespace {
void checkKey(const string& key) {
    QL_REQUIRE(!key.empty(), "XML coder: empty key");
    QL_REQUIRE(std::isalpha(static_cast<unsigned char>(key[0])) || key[0] == '_',
               "XML coder: key '" << key << "' is not a valid element name");
    for (char c : key) {
        QL_REQUIRE(std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.',
                   "XML coder: key '" << key << "' is not a valid element name");
    }
}
} // namespace

XMLEncoder::XMLEncoder(XMLDocument& doc, XMLNode* node) : doc_(doc), node_(node) {
    QL_REQUIRE(node_, "XMLEncoder: XML Node is NULL");
}

void XMLEncoder::encode(const string& key, const string& value) {
    checkKey(key);
    XMLUtils::removeChildren(node_, key);
    XMLUtils::addChild(doc_, node_, key, value);
}

XMLEncoder XMLEncoder::child(const string& key) {
    checkKey(key);
    XMLUtils::removeChildren(node_, key);
    return XMLEncoder(doc_, XMLUtils::addChild(doc_, node_, key));
}

XMLDecoder::XMLDecoder(XMLNode* node) : node_(node) { QL_REQUIRE(node_, "XMLDecoder: XML Node is NULL"); }

boost::optional<string> XMLDecoder::decodeString(const string& key) const {
    if (key.empty())
        return boost::none;
    if (XMLNode* n = XMLUtils::getChildNode(node_, key))
        return XMLUtils::getNodeValue(n);
    return boost::none;
}

boost::optional<XMLDecoder> XMLDecoder::child(const string& key) const {
    if (key.empty())
        return boost::none;
    if (XMLNode* n = XMLUtils::getChildNode(node_, key))
        return XMLDecoder(n);
    return boost::none;
}

} // namespace data
} // namespace money
