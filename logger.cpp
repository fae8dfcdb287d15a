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

#include "logger.hpp"

#include "utils.hpp"

#include <ctype.h>
#include <stdio.h>
#include <stdlib.h>
#include <sys/time.h>
#include <time.h>

using namespace tmx;

// MARK: - Logger

tmx::Logger globalLogger;

Logger::Logger() :
  mLogLevel(LOGGER_DEFAULT_LOGLEVEL),
  mTimestamps(true)
{
  pthread_mutex_init(&mOutputMutex, NULL);
  const char *envLevel = getenv(TMX_LOGLEVEL_ENV);
  if (envLevel && isdigit(*envLevel)) {
    setLogLevel(atoi(envLevel));
  }
}


Logger::~Logger()
{
  pthread_mutex_destroy(&mOutputMutex);
}


bool Logger::logEnabled(int aLogLevel, int aLevelOffset) const
{
  if (aLevelOffset!=0 && aLogLevel>=LOG_NOTICE) {
    aLogLevel -= aLevelOffset;
    if (aLogLevel<LOG_NOTICE) aLogLevel = LOG_NOTICE;
    if (aLogLevel>LOG_DEBUG) aLogLevel = LOG_DEBUG;
  }
  return aLogLevel<=mLogLevel;
}


void Logger::log(int aLogLevel, const char *aFmt, ... )
{
  if (!logEnabled(aLogLevel)) return;
  string message;
  va_list args;
  va_start(args, aFmt);
  string_format_v(message, false, aFmt, args);
  va_end(args);
  output(aLogLevel, "", message);
}


static const char levelLetters[] = "*!CEWNID"; // EMERG..DEBUG

string Logger::linePrefix(int aLogLevel) const
{
  string prefix = "[";
  if (mTimestamps) {
    struct timeval now;
    gettimeofday(&now, NULL);
    struct tm tmNow;
    localtime_r(&now.tv_sec, &tmNow);
    string_ftime_append(prefix, "%H:%M:%S", &tmNow);
    string_format_append(prefix, ".%03d ", (int)(now.tv_usec/1000));
  }
  prefix += levelLetters[aLogLevel];
  prefix += "] ";
  return prefix;
}


void Logger::output(int aLogLevel, const string &aContext, const string &aMessage)
{
  if (aLogLevel<LOG_EMERG) aLogLevel = LOG_EMERG;
  if (aLogLevel>LOG_DEBUG) aLogLevel = LOG_DEBUG;
  string prefix = linePrefix(aLogLevel);
  string line = prefix;
  if (!aContext.empty()) {
    line += aContext;
    line += ": ";
  }
  pthread_mutex_lock(&mOutputMutex);
  for (string::const_iterator pos = aMessage.begin(); pos!=aMessage.end(); ++pos) {
    char c = *pos;
    if (c=='\n') {
      // continuation lines are indented to the message start
      emitLine(aLogLevel, line);
      line.assign(prefix.size(), ' ');
    }
    else if ((uint8_t)c<0x20 || c==0x7F) {
      string_format_append(line, "\\x%02x", (unsigned)(uint8_t)c);
    }
    else {
      line += c;
    }
  }
  emitLine(aLogLevel, line);
  pthread_mutex_unlock(&mOutputMutex);
}


void Logger::emitLine(int aLogLevel, const string &aLine)
{
  if (mLogSink) {
    mLogSink(aLogLevel, aLine);
    return;
  }
  fputs(aLine.c_str(), stderr);
  fputc('\n', stderr);
  fflush(stderr);
}


void Logger::setLogLevel(int aLogLevel)
{
  if (aLogLevel>=LOG_EMERG && aLogLevel<=LOG_DEBUG) {
    mLogLevel = aLogLevel;
  }
}


void Logger::setLogSink(LogSinkCB aLogSink)
{
  pthread_mutex_lock(&mOutputMutex);
  mLogSink = aLogSink;
  pthread_mutex_unlock(&mOutputMutex);
}


// MARK: - TmxLoggingObj

TmxLoggingObj::TmxLoggingObj() :
  mLogLevelOffset(0)
{
}


string TmxLoggingObj::logContextPrefix()
{
  return string_format("object @%p", this);
}


bool TmxLoggingObj::logEnabled(int aLogLevel)
{
  return globalLogger.logEnabled(aLogLevel, mLogLevelOffset);
}


void TmxLoggingObj::log(int aLogLevel, const char *aFmt, ... )
{
  if (!logEnabled(aLogLevel)) return;
  string context;
  if (*aFmt=='\r') aFmt++;
  else context = logContextPrefix();
  string message;
  va_list args;
  va_start(args, aFmt);
  string_format_v(message, false, aFmt, args);
  va_end(args);
  globalLogger.output(aLogLevel, context, message);
}


void TmxLoggingObj::setLogLevelOffset(int aLogLevelOffset)
{
  mLogLevelOffset = aLogLevelOffset;
}
