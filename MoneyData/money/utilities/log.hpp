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

/*! \file money/utilities/log.hpp
    \brief Classes and functions for log message handling.
    \ingroup utilities
*/

#pragma once

// accumulated 'filter' for 'external' DEBUG_MASK
#define MONEY_ALERT 1    // 00000001   1 = 2^1-1
#define MONEY_CRITICAL 2 // 00000010   2
#define MONEY_ERROR 4    // 00000100   4
#define MONEY_WARNING 8  // 00001000   8
#define MONEY_NOTICE 16  // 00010000  16
#define MONEY_DEBUG 32   // 00100000  32
#define MONEY_DATA 64    // 01000000  64

#include <fstream>
#include <map>
#include <queue>
#include <sstream>
#include <string>

#include <boost/filesystem/path.hpp>
#include <boost/thread/lock_types.hpp>
#include <boost/thread/shared_mutex.hpp>
#include <ql/patterns/singleton.hpp>
#include <ql/shared_ptr.hpp>

namespace money {
namespace data {

//! The Base Custom Log Handler class
/*!
  This base log handler class can be used to define your own custom handler and then registered with the Log class.
  Once registered it will receive all log messages as soon as they occur via it's log() method
  \ingroup utilities
  \see Log
 */
class Logger {
public:
    //! Destructor
    virtual ~Logger() {}

    //! The Log call back function
    /*!
      This function will be called every time a log message is produced.
      \param level the log level
      \param log the actual log message
     */
    virtual void log(unsigned level, const std::string& log) = 0;

    //! Returns the Logger name
    const std::string& name() const { return name_; }

protected:
    //! Constructor
    /*!
      Implementations must provide a logger name
      \param name the logger name
     */
    Logger(const std::string& name) : name_(name) {}

private:
    std::string name_;
};

//! Stderr Logger
/*!
  This logger writes each log message out to stderr (std::cerr)
  \ingroup utilities
  \see Log
 */
class StderrLogger : public Logger {
public:
    //! the name "StderrLogger"
    static const std::string name;
    //! Constructor
    /*!
      This logger writes all logs to stderr.
      If alertOnly is set to true, it will only write alerts.
     */
    StderrLogger(bool alertOnly = false) : Logger(name), alertOnly_(alertOnly) {}
    //! Destructor
    virtual ~StderrLogger() {}
    //! The log callback that writes to stderr
    virtual void log(unsigned l, const std::string& s) override;

private:
    bool alertOnly_;
};

//! FileLogger
/*!
  This logger writes each log message out to the given file.
  The file is flushed, but not closed, after each log message.
  \ingroup utilities
  \see Log
 */
class FileLogger : public Logger {
public:
    //! the name "FileLogger"
    static const std::string name;
    //! Constructor
    /*!
      Construct a file logger using the given filename, this filename is passed to std::fostream::open()
      and this constructor will throw an exception if the file is not opened (e.g. if the filename is invalid)
      \param filename the log filename
     */
    FileLogger(const std::string& filename);
    //! Destructor
    virtual ~FileLogger();
    //! The log callback
    virtual void log(unsigned, const std::string&) override;

private:
    std::string filename_;
    std::fstream fout_;
};

//! BufferLogger
/*!
  This logger stores each log message in an internal buffer, it can then be probed for log messages at a later point.
  Log messages are always returned in FIFO order.

  Typical usage to display log messages would be
  <pre>
      while (bLogger.hasNext()) {
          MsgBox("Log Message", bLogger.next());
      }
  </pre>
  \ingroup utilities
  \see Log
 */
class BufferLogger : public Logger {
public:
    //! the name "BufferLogger"
    static const std::string name;
    //! Constructor
    BufferLogger(unsigned minLevel = MONEY_DATA) : Logger(name), minLevel_(minLevel) {}
    //! Destructor
    virtual ~BufferLogger() {}
    //! The log callback
    virtual void log(unsigned, const std::string&) override;

    //! Checks if Logger has new messages
    /*!
      \return True if this Logger has any new log messages
     */
    bool hasNext();
    //! Retrieve new messages
    /*!
      Retrieve the next new message from the buffer, this will throw if the buffer is empty.
      Messages are returned in FIFO order. Messages are deleted from the buffer once returned.
      \return The next message
     */
    std::string next();

private:
    std::queue<std::string> buffer_;
    unsigned minLevel_;
};

//! Global static Log class
/*!
  The Global Log class gets registered with individual loggers and receives application log messages.
  Once a message is received, it is immediately dispatched to each of the registered loggers, the order in which
  the loggers are called is not guaranteed.

  Logging is done by the calling thread and the LOG call blocks until all the loggers have returned.

  At start up, the Log class has no loggers and so will ignore any LOG() messages until it is configured.

  To configure the Log class to log to a file "/tmp/money.log":
  <pre>
      Log::instance().registerLogger(QuantLib::ext::make_shared<FileLogger>("/tmp/money.log"));
  </pre>

  To change the Log class to only use a BufferLogger:
  <pre>
      Log::instance().removeAllLoggers();
      Log::instance().registerLogger(QuantLib::ext::make_shared<BufferLogger>());
  </pre>

  \ingroup utilities
  \see Logger
 */
class Log : public QuantLib::Singleton<Log, std::integral_constant<bool, true>> {

    friend class QuantLib::Singleton<Log, std::integral_constant<bool, true>>;

private:
    // may throw if two loggers have the same name
    Log();

public:
    //! Add a new Logger.
    /*! Adding a new logger will throw if the logger name is already registered
     */
    void registerLogger(const QuantLib::ext::shared_ptr<Logger>& logger);
    //! Check if logger exists
    bool hasLogger(const std::string& name) const;
    //! Retrieve a Logger.
    /*! Retrieve a Logger by its name, for example to retrieve the StderrLogger (assuming it is registered)
      <pre>
      QuantLib::ext::shared_ptr<Logger> slogger = Log::instance().logger(StderrLogger::name);
      </pre>
     */
    QuantLib::ext::shared_ptr<Logger>& logger(const std::string& name);
    //! Remove a Logger
    /*! Remove a logger by name
      \param name the logger name
     */
    void removeLogger(const std::string& name);
    //! Remove all loggers
    /*! Removes all loggers. If called, all subsequent log messages will be ignored.
     */
    void removeAllLoggers();

    //! macro utility function - do not use directly
    void header(unsigned m, const char* filename, int lineNo);
    //! macro utility function - do not use directly
    std::ostream& logStream() { return ls_; }
    //! macro utility function - do not use directly
    void log(unsigned m);

    //! mutex to acquire locks
    boost::shared_mutex& mutex() { return mutex_; }

    // Avoid a large number of warnings in VS by adding 0 !=
    bool filter(unsigned mask) {
        boost::shared_lock<boost::shared_mutex> lock(mutex_);
        return 0 != (mask & mask_);
    }
    unsigned mask() {
        boost::shared_lock<boost::shared_mutex> lock(mutex_);
        return mask_;
    }
    void setMask(unsigned mask) {
        boost::unique_lock<boost::shared_mutex> lock(mutex_);
        mask_ = mask;
    }

    const boost::filesystem::path& rootPath() {
        boost::shared_lock<boost::shared_mutex> lock(mutex_);
        return rootPath_;
    }
    void setRootPath(const std::string& pathString) {
        boost::unique_lock<boost::shared_mutex> lock(mutex_);
        rootPath_ = boost::filesystem::path(pathString);
    }
    int maxLen() {
        boost::shared_lock<boost::shared_mutex> lock(mutex_);
        return maxLen_;
    }
    void setMaxLen(const int n) {
        boost::unique_lock<boost::shared_mutex> lock(mutex_);
        maxLen_ = n;
    }

    bool enabled() {
        boost::shared_lock<boost::shared_mutex> lock(mutex_);
        return enabled_;
    }
    void switchOn() {
        boost::unique_lock<boost::shared_mutex> lock(mutex_);
        enabled_ = true;
    }
    void switchOff() {
        boost::unique_lock<boost::shared_mutex> lock(mutex_);
        enabled_ = false;
    }

private:
    std::map<std::string, QuantLib::ext::shared_ptr<Logger>> loggers_;
    bool enabled_;
    unsigned mask_;
    boost::filesystem::path rootPath_;
    std::ostringstream ls_;

    int maxLen_ = 45;

    mutable boost::shared_mutex mutex_;
};

/*!
  Main Logging macro, do not use this directly, use on of the below 7 macros instead
 */
#define MLOG(mask, text)                                                                                               \
    {                                                                                                                  \
        if (money::data::Log::instance().enabled() && money::data::Log::instance().filter(mask)) {                     \
            std::ostringstream __money_mlog_tmp_stringstream;                                                          \
            __money_mlog_tmp_stringstream << text;                                                                     \
            boost::unique_lock<boost::shared_mutex> lock(money::data::Log::instance().mutex());                        \
            money::data::Log::instance().header(mask, __FILE__, __LINE__);                                             \
            money::data::Log::instance().logStream() << __money_mlog_tmp_stringstream.str();                           \
            money::data::Log::instance().log(mask);                                                                    \
        }                                                                                                              \
    }

//! Logging Macro (Level = Alert)
#define ALOG(text) MLOG(MONEY_ALERT, text);
//! Logging Macro (Level = Critical)
#define CLOG(text) MLOG(MONEY_CRITICAL, text);
//! Logging Macro (Level = Error)
#define ELOG(text) MLOG(MONEY_ERROR, text);
//! Logging Macro (Level = Warning)
#define WLOG(text) MLOG(MONEY_WARNING, text);
//! Logging Macro (Level = Notice)
#define LOG(text) MLOG(MONEY_NOTICE, text);
//! Logging Macro (Level = Debug)
#define DLOG(text) MLOG(MONEY_DEBUG, text);
//! Logging Macro (Level = Data)
#define TLOG(text) MLOG(MONEY_DATA, text);

} // namespace data
} // namespace money
