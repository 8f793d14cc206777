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

/*! \file moneyt/toplevelfixture.hpp
    \brief Fixture that can be used at top level
*/

#pragma once

#include <boost/test/unit_test.hpp>
#include <money/utilities/log.hpp>

namespace money {
namespace test {

//! Top level fixture
class TopLevelFixture {
public:
    /*! Constructor
        Add things here that you want to happen at the start of every test case
    */
    TopLevelFixture()
        : logEnabled_(money::data::Log::instance().enabled()), logMask_(money::data::Log::instance().mask()) {}

    /*! Destructor
        Add things here that you want to happen after _every_ test case
    */
    virtual ~TopLevelFixture() {
        // Restore the log settings a test case may have changed
        if (logEnabled_)
            money::data::Log::instance().switchOn();
        else
            money::data::Log::instance().switchOff();
        money::data::Log::instance().setMask(logMask_);
    }

private:
    bool logEnabled_;
    unsigned logMask_;
};
} // namespace test
} // namespace money
