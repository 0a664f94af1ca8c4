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

#ifndef __STDLOG_H
#define __STDLOG_H

#include "logger.h"

namespace Marionette {

/// Log listener that writes "[LEVEL] message" lines to stderr.
/// Unregisters itself from the Logger singleton on destruction.
class StdLog : public LogListener {
public:
    StdLog();
    ~StdLog() override;

    void logMessage(Logger::LogLevel level, const std::string &msg) override;
};

} // namespace Marionette

#endif
