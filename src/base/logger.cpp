/******************************************************************************
 *
 *    This file is part of the Marionette project
 *    Copyright (C) 2024-2026 Marionette contributors
 *
 *    This program is free software; you can redistribute it and/or modify
 *    it under the terms of the GNU General Public License as published by
 *    the Free Software Foundation; either version 2 of the License, or
 *    (at your option) any later version.
 *
 *    This program is distributed in the hope that it will be useful,
 *    but WITHOUT ANY WARRANTY; without even the implied warranty of
 *    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *    GNU General Public License for more details.
 *
 *    You should have received a copy of the GNU General Public License
 *    along with this program; if not, write to the Free Software
 *    Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
 *
 *****************************************************************************/

#include "logger.h"

#include <algorithm>
#include <cstdarg>
#include <cstdio>

namespace Marionette {

Logger *Logger::msSingleton = nullptr;

//------------------------------------------------------
Logger::Logger() {
    // Second instance would silently steal the singleton slot
    if (!msSingleton)
        msSingleton = this;
}

//------------------------------------------------------
Logger::~Logger() {
    mListeners.clear();
    if (msSingleton == this)
        msSingleton = nullptr;
}

//------------------------------------------------------
void Logger::log(LogLevel level, const char *fmt, ...) {
    if (level > mLogLevel || mListeners.empty())
        return;

    char buf[1024];
    va_list args;
    va_start(args, fmt);
    int n = std::vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);

    if (n < 0)
        return;

    dispatch(level, std::string(buf));
}

//------------------------------------------------------
void Logger::registerLogListener(LogListener *listener) {
    if (!listener)
        return;
    if (std::find(mListeners.begin(), mListeners.end(), listener) ==
        mListeners.end())
        mListeners.push_back(listener);
}

//------------------------------------------------------
void Logger::unregisterLogListener(LogListener *listener) {
    mListeners.erase(
        std::remove(mListeners.begin(), mListeners.end(), listener),
        mListeners.end());
}

//------------------------------------------------------
const char *Logger::getLogLevelName(LogLevel level) {
    switch (level) {
    case LOG_LEVEL_FATAL:   return "FATAL";
    case LOG_LEVEL_ERROR:   return "ERROR";
    case LOG_LEVEL_INFO:    return "INFO";
    case LOG_LEVEL_DEBUG:   return "DEBUG";
    case LOG_LEVEL_VERBOSE: return "VERBOSE";
    }
    return "?";
}

//------------------------------------------------------
Logger &Logger::getSingleton() { return *msSingleton; }

//------------------------------------------------------
Logger *Logger::getSingletonPtr() { return msSingleton; }

//------------------------------------------------------
void Logger::dispatch(LogLevel level, const std::string &msg) {
    for (LogListener *l : mListeners)
        l->logMessage(level, msg);
}

} // namespace Marionette
