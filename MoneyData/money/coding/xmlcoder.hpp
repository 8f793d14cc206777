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

/*! \file money/coding/xmlcoder.hpp
    \brief Keyed archive stored as XML elements
    \ingroup coding
*/

#pragma once

#include <money/coding/coder.hpp>
#include <money/utilities/xmlutils.hpp>

namespace money {
namespace data {

//! Encodes fields as child elements of an XML node
/*! Each field becomes an element <tt>\<key\>value\</key\></tt> below the node, so keys must be valid
    XML element names. Nested archives are written with child(), which opens a new element below the
    node and returns an encoder for it.

    \ingroup coding
*/
class XMLEncoder : public KeyedEncoder {
public:
    XMLEncoder(XMLDocument& doc, XMLNode* node);

    void encode(const string& key, const string& value) override;

    //! encoder for a nested archive stored under \p key, replacing any previous one
    XMLEncoder child(const string& key);

    XMLNode* node() const { return node_; }

private:
    XMLDocument& doc_;
    XMLNode* node_;
};

//! Decodes fields from the child elements of an XML node
/*! \ingroup coding
 */
class XMLDecoder : public KeyedDecoder {
public:
    explicit XMLDecoder(XMLNode* node);

    boost::optional<string> decodeString(const string& key) const override;

    //! decoder for a nested archive stored under \p key, none if there is no such archive
    boost::optional<XMLDecoder> child(const string& key) const;

    XMLNode* node() const { return node_; }

private:
    XMLNode* node_;
};

} // namespace data
} // namespace money
