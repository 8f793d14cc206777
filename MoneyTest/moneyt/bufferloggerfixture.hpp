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


/*! \file moneyt/bufferloggerfixture.hpp
    \brief Fixture capturing log messages in a BufferLogger
*/

#pragma once

#include <money/utilities/log.hpp>
#include <moneyt/toplevelfixture.hpp>

#include <string>
#include <vector>

namespace money {
namespace test {

//! Registers a BufferLogger for the duration of a test case
/*! Logging is switched on with a mask of 255. The logger is removed, and the log header
    length restored, when the test case ends, whether or not it succeeded.
*/
class BufferLoggerFixture : public TopLevelFixture {
public:
    QuantLib::ext::shared_ptr<money::data::BufferLogger> logger;

    BufferLoggerFixture(unsigned minLevel = MONEY_DATA)
        : logger(QuantLib::ext::make_shared<money::data::BufferLogger>(minLevel)),
          maxLen_(money::data::Log::instance().maxLen()) {
        money::data::Log::instance().registerLogger(logger);
        money::data::Log::instance().switchOn();
        money::data::Log::instance().setMask(255);
    }

    ~BufferLoggerFixture() {
        if (money::data::Log::instance().hasLogger(money::data::BufferLogger::name))
            money::data::Log::instance().removeLogger(money::data::BufferLogger::name);
        money::data::Log::instance().setMaxLen(maxLen_);
    }

    //! drains the buffered messages
    std::vector<std::string> messages() {
        std::vector<std::string> res;
        while (logger->hasNext())
            res.push_back(logger->next());
        return res;
    }

private:
    int maxLen_;
};

} // namespace test
} // namespace money
