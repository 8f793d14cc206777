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

#include <boost/test/unit_test.hpp>
#include <money/coding/inmemorycoder.hpp>
#include <money/coding/xmlcoder.hpp>
#include <money/currencies/unitcurrency.hpp>
#include <moneyt/toplevelfixture.hpp>
#include <ql/errors.hpp>

#include <map>

using namespace money::data;
using namespace boost::unit_test_framework;
using namespace std;

using money::test::TopLevelFixture;

BOOST_FIXTURE_TEST_SUITE(MoneyDataTestSuite, TopLevelFixture)

BOOST_AUTO_TEST_SUITE(CodingTests)

BOOST_AUTO_TEST_CASE(testInMemoryCoder) {

    BOOST_TEST_MESSAGE("Testing the in memory coder");

    InMemoryCoder coder;
    BOOST_CHECK_EQUAL(coder.size(), 0u);
    BOOST_CHECK(!coder.decodeString("a"));
    BOOST_CHECK(!coder.contains("a"));

    coder.encode("a", "1");
    coder.encode("b", "2");
    coder.encode("a", "3");
    BOOST_CHECK_EQUAL(coder.size(), 2u);
    BOOST_CHECK(coder.contains("a"));
    BOOST_REQUIRE(coder.decodeString("a"));
    BOOST_CHECK_EQUAL(*coder.decodeString("a"), "3");

    vector<string> expectedKeys = {"a", "b"};
    vector<string> keys = coder.keys();
    BOOST_CHECK_EQUAL_COLLECTIONS(keys.begin(), keys.end(), expectedKeys.begin(), expectedKeys.end());

    coder.clear();
    BOOST_CHECK_EQUAL(coder.size(), 0u);
}

BOOST_AUTO_TEST_CASE(testEncodeWritesCodeOnly) {

    BOOST_TEST_MESSAGE("Testing that a currency is encoded by its code alone");

    InMemoryCoder coder;
    UnitCurrency::JPY().encode(coder);

    BOOST_CHECK_EQUAL(coder.size(), 1u);
    BOOST_REQUIRE(coder.decodeString("code"));
    BOOST_CHECK_EQUAL(*coder.decodeString("code"), "JPY");
}

BOOST_AUTO_TEST_CASE(testRoundTrip) {

    BOOST_TEST_MESSAGE("Testing encoding and decoding of the catalog currencies");

    for (auto code : UnitCurrency::codes()) {
        const UnitCurrency& ccy = UnitCurrency::fromCode(code);
        InMemoryCoder coder;
        ccy.encode(coder);
        boost::optional<UnitCurrency> decoded = UnitCurrency::decode(coder);
        BOOST_REQUIRE(decoded);
        BOOST_CHECK(*decoded == ccy);
        BOOST_CHECK_EQUAL(decoded->coefficient(), ccy.coefficient());
    }
}

BOOST_AUTO_TEST_CASE(testDecodeResolvesToCatalog) {

    BOOST_TEST_MESSAGE("Testing that decoding returns the catalog currency");

    // the coefficient is not stored, decoding yields the catalog coefficient
    UnitCurrency custom("€", UnitCurrency::Code::EUR, 2.0);
    InMemoryCoder coder;
    custom.encode(coder);

    boost::optional<UnitCurrency> decoded = UnitCurrency::decode(coder);
    BOOST_REQUIRE(decoded);
    BOOST_CHECK(*decoded == custom);
    BOOST_CHECK_EQUAL(decoded->coefficient(), UnitCurrency::EUR().coefficient());

    // and so is the symbol
    InMemoryCoder symbolCoder;
    UnitCurrency("A$ ", UnitCurrency::Code::AUD, 0.7042).encode(symbolCoder);
    decoded = UnitCurrency::decode(symbolCoder);
    BOOST_REQUIRE(decoded);
    BOOST_CHECK_EQUAL(decoded->symbol(), "A$");
}

BOOST_AUTO_TEST_CASE(testDecodeFailures) {

    BOOST_TEST_MESSAGE("Testing decoding of missing and unknown codes");

    InMemoryCoder empty;
    BOOST_CHECK(!UnitCurrency::decode(empty));

    map<string, string> fields;
    fields["code"] = "XXX";
    BOOST_CHECK(!UnitCurrency::decode(InMemoryCoder(fields)));

    fields["code"] = "eur";
    BOOST_CHECK(!UnitCurrency::decode(InMemoryCoder(fields)));

    fields["code"] = " EUR";
    BOOST_CHECK(!UnitCurrency::decode(InMemoryCoder(fields)));

    fields["code"] = "";
    BOOST_CHECK(!UnitCurrency::decode(InMemoryCoder(fields)));

    fields.clear();
    fields["Code"] = "EUR";
    BOOST_CHECK(!UnitCurrency::decode(InMemoryCoder(fields)));

    // sanity check, the field is read when present
    fields["code"] = "EUR";
    BOOST_CHECK(UnitCurrency::decode(InMemoryCoder(fields)));
}

BOOST_AUTO_TEST_CASE(testXMLCoder) {

    BOOST_TEST_MESSAGE("Testing the XML coder");

    XMLDocument doc;
    XMLNode* root = doc.allocNode("Root");
    doc.appendNode(root);

    XMLEncoder encoder(doc, root);
    encoder.encode("Name", "a < b");
    encoder.encode("Name", "c");
    XMLEncoder nested = encoder.child("Nested");
    nested.encode("Value", "42");

    BOOST_CHECK_EQUAL(XMLUtils::getChildrenNodes(root, "Name").size(), 1u);

    XMLDecoder decoder(root);
    BOOST_REQUIRE(decoder.decodeString("Name"));
    BOOST_CHECK_EQUAL(*decoder.decodeString("Name"), "c");
    BOOST_CHECK(decoder.contains("Nested"));
    BOOST_CHECK(!decoder.decodeString("Missing"));
    BOOST_CHECK(!decoder.decodeString(""));
    BOOST_CHECK(!decoder.child("Missing"));

    boost::optional<XMLDecoder> nestedDecoder = decoder.child("Nested");
    BOOST_REQUIRE(nestedDecoder);
    BOOST_REQUIRE(nestedDecoder->decodeString("Value"));
    BOOST_CHECK_EQUAL(*nestedDecoder->decodeString("Value"), "42");

    BOOST_CHECK_THROW(encoder.encode("", "x"), QuantLib::Error);
    BOOST_CHECK_THROW(encoder.encode("1abc", "x"), QuantLib::Error);
    BOOST_CHECK_THROW(encoder.encode("a b", "x"), QuantLib::Error);
    BOOST_CHECK_THROW(encoder.child("a<b"), QuantLib::Error);
}

BOOST_AUTO_TEST_CASE(testXMLRoundTrip) {

    BOOST_TEST_MESSAGE("Testing a currency written to and read back from an XML string");

    XMLDocument doc;
    XMLNode* root = doc.allocNode("Archive");
    doc.appendNode(root);
    XMLEncoder encoder(doc, root);
    XMLEncoder ccyEncoder = encoder.child("CurrencyKey");
    UnitCurrency::AMD().encode(ccyEncoder);

    string xml = doc.toString();
    BOOST_TEST_MESSAGE("encoded currency:\n" << xml);

    XMLDocument readBack;
    readBack.fromXMLString(xml);
    XMLNode* node = readBack.getFirstNode("Archive");
    BOOST_REQUIRE(node);

    XMLNode* ccyNode = XMLUtils::getChildNode(node, "CurrencyKey");
    BOOST_REQUIRE(ccyNode);
    // a single field
    BOOST_CHECK_EQUAL(XMLUtils::getChildrenNodes(ccyNode, "").size(), 1u);
    BOOST_CHECK_EQUAL(XMLUtils::getChildValue(ccyNode, "code", true), "AMD");

    boost::optional<XMLDecoder> ccyDecoder = XMLDecoder(node).child("CurrencyKey");
    BOOST_REQUIRE(ccyDecoder);
    boost::optional<UnitCurrency> decoded = UnitCurrency::decode(*ccyDecoder);
    BOOST_REQUIRE(decoded);
    BOOST_CHECK(*decoded == UnitCurrency::AMD());
    BOOST_CHECK_EQUAL(decoded->coefficient(), 0.00209872);

    // every catalog currency, each under its own key in one document
    XMLDocument all;
    XMLNode* allRoot = all.allocNode("Archive");
    all.appendNode(allRoot);
    XMLEncoder allEncoder(all, allRoot);
    for (auto code : UnitCurrency::codes()) {
        XMLEncoder e = allEncoder.child("Currency" + UnitCurrency::codeName(code));
        UnitCurrency::fromCode(code).encode(e);
    }

    XMLDocument allReadBack;
    allReadBack.fromXMLString(all.toString());
    XMLDecoder allDecoder(allReadBack.getFirstNode("Archive"));
    for (auto code : UnitCurrency::codes()) {
        const UnitCurrency& ccy = UnitCurrency::fromCode(code);
        boost::optional<XMLDecoder> d = allDecoder.child("Currency" + UnitCurrency::codeName(code));
        BOOST_REQUIRE(d);
        boost::optional<UnitCurrency> c = UnitCurrency::decode(*d);
        BOOST_REQUIRE(c);
        BOOST_CHECK(*c == ccy);
        BOOST_CHECK_EQUAL(c->symbol(), ccy.symbol());
        BOOST_CHECK_EQUAL(c->coefficient(), ccy.coefficient());
    }

    // unknown code in a document
    XMLDocument bad;
    bad.fromXMLString("<Archive><CurrencyKey><code>XXX</code></CurrencyKey></Archive>");
    boost::optional<XMLDecoder> badDecoder = XMLDecoder(bad.getFirstNode("Archive")).child("CurrencyKey");
    BOOST_REQUIRE(badDecoder);
    BOOST_CHECK(!UnitCurrency::decode(*badDecoder));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()
