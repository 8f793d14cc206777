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

/*! \file money/units/measurement.hpp
    \brief amount of a linear unit
    \ingroup units
*/

#pragma once

#include <ql/errors.hpp>
#include <ql/types.hpp>

#include <ostream>

namespace money {
namespace data {
using QuantLib::Real;

//! Amount expressed in a unit
/*! The unit type must provide

    - <tt>converter()</tt>, returning a converter with <tt>baseUnitValue(Real)</tt> and <tt>value(Real)</tt>,
      see LinearConverter,
    - a static <tt>baseUnit()</tt>,
    - <tt>symbol()</tt> and <tt>operator==</tt>.

    Conversions go through the base unit. Two measurements in equal units are never converted, whatever
    their converters say.

    Addition and subtraction are only defined for measurements in equal units.

    \ingroup units
*/
template <class Unit> class Measurement {
public:
    Measurement(Real value, const Unit& unit) : value_(value), unit_(unit) {}

    //! \name Inspectors
    //@{
    Real value() const { return value_; }
    const Unit& unit() const { return unit_; }
    //@}

    //! \name Conversion
    //@{
    //! converts in place
    void convert(const Unit& unit) {
        if (!(unit_ == unit))
            value_ = unit.converter().value(unit_.converter().baseUnitValue(value_));
        unit_ = unit;
    }
    //! returns the converted measurement, this one is left unchanged
    Measurement converted(const Unit& unit) const {
        Measurement m(*this);
        m.convert(unit);
        return m;
    }
    //! the measurement expressed in the base unit
    Measurement inBaseUnit() const { return converted(Unit::baseUnit()); }
    //@}

    //! \name Arithmetic
    //@{
    Measurement& operator+=(const Measurement& m) {
        QL_REQUIRE(unit_ == m.unit_,
                   "cannot add measurements in different units (" << unit_.symbol() << ", " << m.unit_.symbol() << ")");
        value_ += m.value_;
        return *this;
    }
    Measurement& operator-=(const Measurement& m) {
        QL_REQUIRE(unit_ == m.unit_, "cannot subtract measurements in different units (" << unit_.symbol() << ", "
                                                                                         << m.unit_.symbol() << ")");
        value_ -= m.value_;
        return *this;
    }
    Measurement& operator*=(Real x) {
        value_ *= x;
        return *this;
    }
    Measurement& operator/=(Real x) {
        value_ /= x;
        return *this;
    }
    //@}

private:
    Real value_;
    Unit unit_;
};

// inline definitions

template <class Unit> inline Measurement<Unit> operator+(Measurement<Unit> m1, const Measurement<Unit>& m2) {
    return m1 += m2;
}

template <class Unit> inline Measurement<Unit> operator-(Measurement<Unit> m1, const Measurement<Unit>& m2) {
    return m1 -= m2;
}

template <class Unit> inline Measurement<Unit> operator-(const Measurement<Unit>& m) {
    return Measurement<Unit>(-m.value(), m.unit());
}

template <class Unit> inline Measurement<Unit> operator*(Measurement<Unit> m, Real x) { return m *= x; }

template <class Unit> inline Measurement<Unit> operator*(Real x, Measurement<Unit> m) { return m *= x; }

template <class Unit> inline Measurement<Unit> operator/(Measurement<Unit> m, Real x) { return m /= x; }

//! measurements in different units are compared in the base unit
template <class Unit> inline bool operator==(const Measurement<Unit>& m1, const Measurement<Unit>& m2) {
    if (m1.unit() == m2.unit())
        return m1.value() == m2.value();
    return m1.inBaseUnit().value() == m2.inBaseUnit().value();
}

template <class Unit> inline bool operator!=(const Measurement<Unit>& m1, const Measurement<Unit>& m2) {
    return !(m1 == m2);
}

//! measurements in different units are compared in the base unit
template <class Unit> inline bool operator<(const Measurement<Unit>& m1, const Measurement<Unit>& m2) {
    if (m1.unit() == m2.unit())
        return m1.value() < m2.value();
    return m1.inBaseUnit().value() < m2.inBaseUnit().value();
}

template <class Unit> inline bool operator>(const Measurement<Unit>& m1, const Measurement<Unit>& m2) {
    return m2 < m1;
}

template <class Unit> inline std::ostream& operator<<(std::ostream& out, const Measurement<Unit>& m) {
    return out << m.value() << " " << m.unit().symbol();
}

} // namespace data
} // namespace money
