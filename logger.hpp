//  SPDX-License-Identifier: GPL-3.0-or-later
//
//  Copyright (c) 2026 plan44.ch / Lukas Zeller, Zurich, Switzerland
//
//  Author: Lukas Zeller <luz@plan44.ch>
//
//  This file is part of tracemux.
//
//  tracemux is free software: you can redistribute it and/or modify
//  it under the terms of the GNU General Public License as published by
//  the Free Software Foundation, either version 3 of the License, or
//  (at your option) any later version.
//
//  tracemux is distributed in the hope that it will be useful,
//  but WITHOUT ANY WARRANTY; without even the implied warranty of
//  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//  GNU General Public License for more details.
//
//  You should have received a copy of the GNU General Public License
//  along with tracemux. If not, see <http://www.gnu.org/licenses/>.
//

#ifndef __tracemux__logger__
#define __tracemux__logger__

#include "tracemux_minimal.hpp"

#include <pthread.h>
#include <stdarg.h>
#include <string>
#include <syslog.h>

#include <boost/function.hpp>

#ifndef __printflike
#define __printflike(...)
#endif

#include "tmxobj.hpp"

// process wide logging
#define LOGENABLED(lvl) globalLogger.logEnabled(lvl)
#define LOG(lvl,...) { if (globalLogger.logEnabled(lvl)) globalLogger.log(lvl,##__VA_ARGS__); }
#define SETLOGLEVEL(lvl) globalLogger.setLogLevel(lvl)
#define LOGLEVEL (globalLogger.getLogLevel())
#define SETLOGSINK(s) globalLogger.setLogSink(s)

// logging from within a TmxLoggingObj (prefixed with logContextPrefix(), object's level offset applied)
#define OLOGENABLED(lvl) logEnabled(lvl)
#define OLOG(lvl,...) { if (logEnabled(lvl)) log(lvl,##__VA_ARGS__); }

// extra logging only compiled into DEBUG builds, or files defining ALWAYS_DEBUG to 1 before including this
#if defined(DEBUG) || ALWAYS_DEBUG
#define DEBUGLOGGING 1
#define DBGLOG(lvl,...) LOG(lvl,##__VA_ARGS__)
#define DBGOLOG(lvl,...) OLOG(lvl,##__VA_ARGS__)
#define LOGGER_DEFAULT_LOGLEVEL LOG_DEBUG
#else
#define DEBUGLOGGING 0
#define DBGLOG(lvl,...)
#define DBGOLOG(lvl,...)
#define LOGGER_DEFAULT_LOGLEVEL LOG_NOTICE
#endif

/// environment variable that, when set to a number 0..7, overrides the initial log level
#define TMX_LOGLEVEL_ENV "TRACEMUX_LOGLEVEL"


using namespace std;

namespace tmx {

  /// receives each finished log line instead of stderr
  /// @param aLevel syslog level of the line
  /// @param aLine the complete line, including prefix, without line end
  typedef boost::function<void (int aLevel, const string &aLine)> LogSinkCB;

  class Logger : public TmxObj
  {
    pthread_mutex_t mOutputMutex;
    int mLogLevel;
    bool mTimestamps; ///< prefix lines with wall clock time
    LogSinkCB mLogSink; ///< if set, receives all lines, otherwise they go to stderr

  public:
    Logger();
    virtual ~Logger();

    /// @param aLogLevel level to check
    /// @param aLevelOffset subtracted from levels in the LOG_NOTICE..LOG_DEBUG range, result stays in that range
    /// @return true if a message at this level would be output
    bool logEnabled(int aLogLevel, int aLevelOffset = 0) const;

    /// log a printf style message if aLogLevel is enabled
    void log(int aLogLevel, const char *aFmt, ... ) __printflike(3,4);

    /// output a message regardless of the current level
    /// @param aLogLevel level shown in the line prefix
    /// @param aContext if not empty, precedes the message, separated by ": "
    /// @param aMessage message text, may span multiple lines
    void output(int aLogLevel, const string &aContext, const string &aMessage);

    void setLogLevel(int aLogLevel);
    int getLogLevel() const { return mLogLevel; }

    /// @param aTimestamps false to omit the time from line prefixes
    void setTimestamps(bool aTimestamps) { mTimestamps = aTimestamps; }

    /// @param aLogSink sink for log lines, empty function to return to stderr
    void setLogSink(LogSinkCB aLogSink);

  private:

    string linePrefix(int aLogLevel) const;
    void emitLine(int aLogLevel, const string &aLine);

  };


  class TmxLoggingObj : public TmxObj
  {
    typedef TmxObj inherited;

  protected:

    int mLogLevelOffset;

  public:

    TmxLoggingObj();

    /// @return text identifying this object in its log lines
    virtual string logContextPrefix();

    bool logEnabled(int aLogLevel);

    /// log a printf style message, prefixed by logContextPrefix(). A leading \r suppresses the prefix.
    void log(int aLogLevel, const char *aFmt, ... ) __printflike(3,4);

    /// @param aLogLevelOffset positive values make this object's NOTICE..DEBUG messages appear at lower global levels
    void setLogLevelOffset(int aLogLevelOffset);
    int getLogLevelOffset() const { return mLogLevelOffset; }

  };

} // namespace tmx


extern tmx::Logger globalLogger;


#endif /* defined(__tracemux__logger__) */
