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
#include <money/currencies/unitcurrency.hpp>
#include <money/units/measurement.hpp>
#include <moneyt/toplevelfixture.hpp>
#include <ql/types.hpp>

#include <cmath>
#include <sstream>

using namespace money::data;
using namespace boost::unit_test_framework;
using namespace std;

using money::test::TopLevelFixture;
using QuantLib::Size;

namespace {

struct UnitCurrencyTestData {
    UnitCurrency ccy;
    string code;
    string symbol;
    Real coefficient;
};

vector<UnitCurrencyTestData> catalogData() {
    // clang-format off
    vector<UnitCurrencyTestData> data{
        { UnitCurrency::USD(), "USD", "$", 1.0 },
        { UnitCurrency::EUR(), "EUR", "€", 1.123349 },
        { UnitCurrency::GBP(), "GBP", "£", 1.25025 },
        { UnitCurrency::RUR(), "RUR", "₽", 0.01587 },
        { UnitCurrency::JPY(), "JPY", "¥", 0.009283 },
        { UnitCurrency::AUD(), "AUD", "A$", 0.7042 },
        { UnitCurrency::CAD(), "CAD", "C$", 0.764905 },
        { UnitCurrency::AMD(), "AMD", "֏", 0.00209872 }
    };
    // clang-format on
    return data;
}

vector<Real> amounts() { return {0.0, 1.0, -500.0, 1.0e9}; }

} // namespace

BOOST_FIXTURE_TEST_SUITE(MoneyDataTestSuite, TopLevelFixture)

BOOST_AUTO_TEST_SUITE(UnitCurrencyTests)

BOOST_AUTO_TEST_CASE(testCatalog) {

    BOOST_TEST_MESSAGE("Testing the currency catalog");

    auto data = catalogData();
    BOOST_REQUIRE_EQUAL(UnitCurrency::codes().size(), data.size());

    for (Size i = 0; i < data.size(); ++i) {
        BOOST_CHECK_EQUAL(UnitCurrency::codeName(data[i].ccy.code()), data[i].code);
        BOOST_CHECK_EQUAL(data[i].ccy.symbol(), data[i].symbol);
        BOOST_CHECK_EQUAL(data[i].ccy.coefficient(), data[i].coefficient);
        BOOST_CHECK_EQUAL(data[i].ccy.converter().constant(), 0.0);
        BOOST_CHECK(UnitCurrency::codes()[i] == data[i].ccy.code());
        BOOST_CHECK(UnitCurrency::fromCode(data[i].ccy.code()) == data[i].ccy);
        // the catalog hands out the same instance every time
        BOOST_CHECK_EQUAL(&UnitCurrency::fromCode(data[i].ccy.code()), &UnitCurrency::fromCode(UnitCurrency::codes()[i]));
    }
}

BOOST_AUTO_TEST_CASE(testBaseUnit) {

    BOOST_TEST_MESSAGE("Testing the base currency");

    BOOST_CHECK(UnitCurrency::baseUnit() == UnitCurrency::USD());
    BOOST_CHECK_EQUAL(UnitCurrency::baseUnit().coefficient(), 1.0);

    // whatever was converted before, the base unit stays USD
    Measurement<UnitCurrency> m(10.0, UnitCurrency::GBP());
    m.convert(UnitCurrency::JPY());
    BOOST_CHECK(m.inBaseUnit().unit() == UnitCurrency::USD());
    BOOST_CHECK(UnitCurrency::baseUnit() == UnitCurrency::USD());
}

BOOST_AUTO_TEST_CASE(testConversion) {

    BOOST_TEST_MESSAGE("Testing conversion of AMD to USD");

    Measurement<UnitCurrency> amd500(500.0, UnitCurrency::AMD());
    amd500.convert(UnitCurrency::USD());

    BOOST_CHECK(amd500.unit() == UnitCurrency::USD());
    BOOST_CHECK_EQUAL(amd500.value(), 500.0 * 0.00209872);
}

BOOST_AUTO_TEST_CASE(testConversionFormula) {

    BOOST_TEST_MESSAGE("Testing conversion between two non-base currencies");

    Real tol = 1e-12;
    Measurement<UnitCurrency> gbp(100.0, UnitCurrency::GBP());
    BOOST_CHECK_CLOSE(gbp.converted(UnitCurrency::EUR()).value(), 100.0 * 1.25025 / 1.123349, tol);
    BOOST_CHECK_CLOSE(gbp.converted(UnitCurrency::JPY()).value(), 100.0 * 1.25025 / 0.009283, tol);

    Measurement<UnitCurrency> cad(-42.5, UnitCurrency::CAD());
    BOOST_CHECK_CLOSE(cad.converted(UnitCurrency::AUD()).value(), -42.5 * 0.764905 / 0.7042, tol);
}

BOOST_AUTO_TEST_CASE(testRoundTripThroughBaseUnit) {

    BOOST_TEST_MESSAGE("Testing round trips through the base currency");

    Real tol = 1e-12;
    for (auto code : UnitCurrency::codes()) {
        const UnitCurrency& ccy = UnitCurrency::fromCode(code);
        for (auto x : amounts()) {
            Measurement<UnitCurrency> m(x, ccy);
            m.convert(UnitCurrency::baseUnit());
            m.convert(ccy);
            BOOST_CHECK(m.unit() == ccy);
            BOOST_CHECK_CLOSE(m.value(), x, tol);
        }
    }
}

BOOST_AUTO_TEST_CASE(testPairwiseRoundTrip) {

    BOOST_TEST_MESSAGE("Testing round trips between all pairs of currencies");

    Real tol = 1e-12;
    for (auto a : UnitCurrency::codes()) {
        for (auto b : UnitCurrency::codes()) {
            for (auto x : amounts()) {
                Measurement<UnitCurrency> m(x, UnitCurrency::fromCode(a));
                Real back = m.converted(UnitCurrency::fromCode(b)).converted(UnitCurrency::fromCode(a)).value();
                BOOST_CHECK_CLOSE(back, x, tol);
            }
        }
    }
}

BOOST_AUTO_TEST_CASE(testConversionToSameCurrency) {

    BOOST_TEST_MESSAGE("Testing conversion of a currency to itself");

    // no round trip through the base currency, the value is returned unchanged
    for (auto code : UnitCurrency::codes()) {
        Measurement<UnitCurrency> m(0.1 + 1.0e9, UnitCurrency::fromCode(code));
        m.convert(UnitCurrency::fromCode(code));
        BOOST_CHECK_EQUAL(m.value(), 0.1 + 1.0e9);
    }
}

BOOST_AUTO_TEST_CASE(testEqualityIgnoresCoefficient) {

    BOOST_TEST_MESSAGE("Testing that currency equality ignores the coefficient");

    UnitCurrency eur1("€", UnitCurrency::Code::EUR, 1.123349);
    UnitCurrency eur2("€", UnitCurrency::Code::EUR, 2.0);

    BOOST_CHECK(eur1 == eur2);
    BOOST_CHECK(!(eur1 != eur2));
    BOOST_CHECK(eur2 == UnitCurrency::EUR());
    BOOST_CHECK_NE(eur1.coefficient(), eur2.coefficient());

    // code and symbol both matter
    BOOST_CHECK(UnitCurrency("EUR", UnitCurrency::Code::EUR, 1.123349) != UnitCurrency::EUR());
    BOOST_CHECK(UnitCurrency("€", UnitCurrency::Code::GBP, 1.123349) != UnitCurrency::EUR());

    // equal units are never converted, whatever their coefficients
    Measurement<UnitCurrency> m(100.0, eur2);
    m.convert(UnitCurrency::EUR());
    BOOST_CHECK_EQUAL(m.value(), 100.0);
}

BOOST_AUTO_TEST_CASE(testCustomConverter) {

    BOOST_TEST_MESSAGE("Testing a currency with an explicit converter");

    UnitCurrency cad("C$", UnitCurrency::Code::CAD, LinearConverter(0.75));
    BOOST_CHECK(cad == UnitCurrency::CAD());
    BOOST_CHECK_EQUAL(cad.coefficient(), 0.75);

    Measurement<UnitCurrency> m(4.0, cad);
    BOOST_CHECK_CLOSE(m.converted(UnitCurrency::USD()).value(), 3.0, 1e-12);
}

BOOST_AUTO_TEST_CASE(testNonPositiveCoefficient) {

    BOOST_TEST_MESSAGE("Testing conversion with a zero coefficient");

    UnitCurrency broken("֏", UnitCurrency::Code::AMD, 0.0);
    Measurement<UnitCurrency> usd(1.0, UnitCurrency::USD());
    BOOST_CHECK_NO_THROW(usd.convert(broken));
    BOOST_CHECK(std::isinf(usd.value()));

    UnitCurrency negative("A$", UnitCurrency::Code::AUD, -0.7042);
    Measurement<UnitCurrency> aud(10.0, negative);
    BOOST_CHECK_CLOSE(aud.converted(UnitCurrency::USD()).value(), -7.042, 1e-12);
}

BOOST_AUTO_TEST_CASE(testOutput) {

    BOOST_TEST_MESSAGE("Testing currency output");

    ostringstream oss;
    oss << UnitCurrency::GBP();
    BOOST_CHECK_EQUAL(oss.str(), "GBP (£)");

    ostringstream code;
    code << UnitCurrency::Code::RUR;
    BOOST_CHECK_EQUAL(code.str(), "RUR");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()
