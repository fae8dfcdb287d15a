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

#include <catch2/catch.hpp>

#include "logger.hpp"
#include "utils.hpp"

#include <vector>

#include <boost/bind.hpp>

using namespace tmx;

class LogCapture
{
  int mSavedLevel;

  void collect(int aLevel, const string &aLine)
  {
    levels.push_back(aLevel);
    lines.push_back(aLine);
  }

public:

  std::vector<int> levels;
  std::vector<string> lines;

  LogCapture() : mSavedLevel(LOGLEVEL)
  {
    globalLogger.setTimestamps(false);
    SETLOGSINK(boost::bind(&LogCapture::collect, this, _1, _2));
    SETLOGLEVEL(LOG_INFO);
  }

  ~LogCapture()
  {
    SETLOGSINK(LogSinkCB());
    globalLogger.setTimestamps(true);
    SETLOGLEVEL(mSavedLevel);
  }
};


class NamedLogger : public TmxLoggingObj
{
public:
  virtual string logContextPrefix() TMX_OVERRIDE { return "widget"; }
  void say(int aLevel, const char *aText) { OLOG(aLevel, "%s", aText); }
  void sayPlain(const char *aText) { OLOG(LOG_NOTICE, "\r%s", aText); }
};


TEST_CASE_METHOD(LogCapture, "level filtering", "[logger]") {
  LOG(LOG_DEBUG, "hidden");
  LOG(LOG_INFO, "shown %d", 42);
  LOG(LOG_ERR, "error");
  REQUIRE(lines.size() == 2);
  REQUIRE(lines[0] == "[I] shown 42");
  REQUIRE(lines[1] == "[E] error");
  REQUIRE(levels[1] == LOG_ERR);
  REQUIRE(LOGENABLED(LOG_INFO));
  REQUIRE(!LOGENABLED(LOG_DEBUG));
}

TEST_CASE_METHOD(LogCapture, "invalid levels are ignored", "[logger]") {
  SETLOGLEVEL(12);
  REQUIRE(LOGLEVEL == LOG_INFO);
  SETLOGLEVEL(-1);
  REQUIRE(LOGLEVEL == LOG_INFO);
}

TEST_CASE_METHOD(LogCapture, "multi line messages and control characters", "[logger]") {
  LOG(LOG_NOTICE, "first\nsecond\tend");
  REQUIRE(lines.size() == 2);
  REQUIRE(lines[0] == "[N] first");
  REQUIRE(lines[1] == "    second\\x09end");
}

TEST_CASE_METHOD(LogCapture, "object logging with context and offset", "[logger]") {
  NamedLogger obj;
  obj.say(LOG_INFO, "hello");
  REQUIRE(lines.size() == 1);
  REQUIRE(lines[0] == "[I] widget: hello");
  obj.sayPlain("no prefix");
  REQUIRE(lines.back() == "[N] no prefix");
  // offset makes debug messages visible at info level
  obj.say(LOG_DEBUG, "detail");
  REQUIRE(lines.size() == 2);
  obj.setLogLevelOffset(1);
  obj.say(LOG_DEBUG, "detail");
  REQUIRE(lines.size() == 3);
  REQUIRE(lines.back() == "[D] widget: detail");
  // negative offsets demote down to DEBUG, WARNING and above are never affected
  obj.setLogLevelOffset(-3);
  obj.say(LOG_NOTICE, "now hidden");
  REQUIRE(lines.size() == 3);
  obj.say(LOG_WARNING, "still shown");
  REQUIRE(lines.size() == 4);
  REQUIRE(lines.back() == "[W] widget: still shown");
}
