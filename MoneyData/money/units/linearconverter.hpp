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

/*! \file money/units/linearconverter.hpp
    \brief linear conversion between a unit and its base unit
    \ingroup units
*/

#pragma once

#include <ql/types.hpp>

namespace money {
namespace data {
using QuantLib::Real;

//! Linear unit converter
/*! Maps a value \f$ v \f$ in some unit to the value \f$ b = v c + k \f$ in the base unit of its dimension,
    where \f$ c \f$ is the coefficient and \f$ k \f$ the constant.

    No checks are done on the coefficient, a zero coefficient gives infinite or NaN values on the way back
    from the base unit.

    \ingroup units
*/
class LinearConverter {
public:
    explicit LinearConverter(Real coefficient, Real constant = 0.0) : coefficient_(coefficient), constant_(constant) {}

    //! value in the base unit
    Real baseUnitValue(Real value) const { return value * coefficient_ + constant_; }
    //! value in this unit for a value given in the base unit
    Real value(Real baseUnitValue) const { return (baseUnitValue - constant_) / coefficient_; }

    Real coefficient() const { return coefficient_; }
    Real constant() const { return constant_; }

private:
    Real coefficient_;
    Real constant_;
};

} // namespace data
} // namespace money
