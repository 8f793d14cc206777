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

#include <money/utilities/log.hpp>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/filesystem.hpp>
#include <ql/errors.hpp>

#include <algorithm>
#include <iomanip>
#include <iostream>

using namespace boost::filesystem;
using std::string;

namespace money {
namespace data {

const string StderrLogger::name = "StderrLogger";
const string BufferLogger::name = "BufferLogger";
const string FileLogger::name = "FileLogger";

void StderrLogger::log(unsigned l, const string& s) {
    if (!alertOnly_ || l < MONEY_ERROR)
        std::cerr << s << std::endl;
}

FileLogger::FileLogger(const string& filename) : Logger(name), filename_(filename) {
    fout_.open(filename.c_str(), std::ios_base::out);
    QL_REQUIRE(fout_.is_open(), "Error opening file " << filename);
    fout_.setf(std::ios::fixed, std::ios::floatfield);
    fout_.setf(std::ios::showpoint);
}

FileLogger::~FileLogger() {
    if (fout_.is_open())
        fout_.close();
}

void FileLogger::log(unsigned, const string& msg) {
    if (fout_.is_open())
        fout_ << msg << std::endl;
}

void BufferLogger::log(unsigned level, const string& s) {
    if (level <= minLevel_)
        buffer_.push(s);
}

bool BufferLogger::hasNext() { return !buffer_.empty(); }

string BufferLogger::next() {
    QL_REQUIRE(!buffer_.empty(), "Log Buffer is empty");
    string msg = buffer_.front();
    buffer_.pop();
    return msg;
}

Log::Log() : loggers_(), enabled_(false), mask_(255), ls_() {
    ls_.setf(std::ios::fixed, std::ios::floatfield);
    ls_.setf(std::ios::showpoint);
}

void Log::registerLogger(const QuantLib::ext::shared_ptr<Logger>& logger) {
    boost::unique_lock<boost::shared_mutex> lock(mutex_);
    QL_REQUIRE(loggers_.find(logger->name()) == loggers_.end(),
               "Logger with name " << logger->name() << " already registered");
    loggers_[logger->name()] = logger;
}

bool Log::hasLogger(const string& name) const {
    boost::shared_lock<boost::shared_mutex> lock(mutex_);
    return loggers_.find(name) != loggers_.end();
}

QuantLib::ext::shared_ptr<Logger>& Log::logger(const string& name) {
    boost::shared_lock<boost::shared_mutex> lock(mutex_);
    auto it = loggers_.find(name);
    QL_REQUIRE(it != loggers_.end(), "No logger found with name " << name);
    return it->second;
}

void Log::removeLogger(const string& name) {
    boost::unique_lock<boost::shared_mutex> lock(mutex_);
    auto it = loggers_.find(name);
    if (it != loggers_.end()) {
        loggers_.erase(it);
    } else {
        QL_FAIL("No logger found with name " << name);
    }
}

void Log::removeAllLoggers() {
    boost::unique_lock<boost::shared_mutex> lock(mutex_);
    loggers_.clear();
}

// the caller holds a unique lock on mutex_
void Log::header(unsigned m, const char* filename, int lineNo) {
    // 1. Reset stringstream
    ls_.str(string());
    ls_.clear();

    // Write the header to the stream
    // TYPE [Time] file:no
    switch (m) {
    case MONEY_ALERT:
        ls_ << "ALERT    ";
        break;
    case MONEY_CRITICAL:
        ls_ << "CRITICAL ";
        break;
    case MONEY_ERROR:
        ls_ << "ERROR    ";
        break;
    case MONEY_WARNING:
        ls_ << "WARNING  ";
        break;
    case MONEY_NOTICE:
        ls_ << "NOTICE   ";
        break;
    case MONEY_DEBUG:
        ls_ << "DEBUG    ";
        break;
    case MONEY_DATA:
        ls_ << "DATA     ";
        break;
    }

    // Timestamp
    ls_ << '[' << boost::posix_time::to_simple_string(boost::posix_time::microsec_clock::local_time()) << ']';

    // Filename & line no
    // Strip the root path from the file name if it is set
    string filepath = rootPath_.empty() ? filename : relative(path(filename), rootPath_).string();
    int lineNoLen = static_cast<int>(std::to_string(lineNo).length());
    int len = 2 + static_cast<int>(filepath.length()) + 1 + lineNoLen;

    // keep the tail of the path, at most the whole of it
    if (len > maxLen_) {
        string::size_type cut = std::min<string::size_type>(len - maxLen_ + 3, filepath.length());
        filepath = "..." + filepath.substr(cut);
    }

    ls_ << std::setw(2) << " (" << filepath << ':' << lineNo << ") : ";
}

// the caller holds a unique lock on mutex_
void Log::log(unsigned m) {
    string msg = ls_.str();
    for (auto& l : loggers_) {
        l.second->log(m, msg);
    }
}

} // namespace data
} // namespace money
