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

/*! \file moneyt/basedatapath.hpp
    \brief Parse base data path from the Boost test command line arguments
*/

#pragma once

#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include <ql/errors.hpp>
#include <string>
#include <vector>

namespace money {
namespace test {

/*! Gets passed the command line arguments from a unit test suite
    and checks if a base data path has been provided

    Specify the base data path as --base_data_path. The base data path
    should have a child 'input' directory containing any input files for
    the tests. Any output from the tests will be added to child 'output'
    directory under this base data path.

    A default base data path of "." is returned.
*/
inline std::string getBaseDataPath(int argc, char** argv) {

    std::string strPath = ".";

    // Check if a base data path has been provided in the command line arguments
    for (int i = 1; i < argc; ++i) {
        if (boost::starts_with(argv[i], "--base_data_path")) {
            std::vector<std::string> strs;
            boost::split(strs, argv[i], boost::is_any_of("="));
            if (strs.size() > 1) {
                strPath = strs[1];
            }
        }
    }

    // Test that we have a valid path
    boost::filesystem::path p(strPath);
    QL_REQUIRE(boost::filesystem::is_directory(p),
               "Test set up failed: the path '" << strPath << "' is not a directory");

    return strPath;
}

} // namespace test
} // namespace money
