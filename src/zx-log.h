/**
 * zxforge - ZX Spectrum game export toolkit
 * Copyright (C) 2026 zxforge contributors
 * Portions copyright (C) 2021-2022 tildearrow and contributors
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; either version 2 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License along
 * with this program; if not, write to the Free Software Foundation, Inc.,
 * 51 Franklin Street, Fifth Floor, Boston, MA 02110-1301 USA.
 */

#ifndef _ZX_LOG_H
#define _ZX_LOG_H

#include <stdio.h>
#include <string.h>
#include <time.h>
#include <fmt/printf.h>
#include "zx-utils.h"

#define LOGLEVEL_ERROR 0
#define LOGLEVEL_WARN 1
#define LOGLEVEL_INFO 2
#define LOGLEVEL_DEBUG 3
#define LOGLEVEL_TRACE 4

// this has to be a power of 2
#define ZX_LOG_SIZE 2048

extern int logLevel;

struct LogEntry {
  int loglevel;
  struct tm time;
  String text;
  bool ready;
  LogEntry():
    loglevel(0),
    ready(false) {
    memset(&time,0,sizeof(struct tm));
  }
};

extern LogEntry logEntries[ZX_LOG_SIZE];
extern unsigned short logPosition;

int writeLog(int level, const char* msg, fmt::printf_args args);

template<typename... T> int logV(const char* msg, const T&... args) {
  return writeLog(LOGLEVEL_TRACE,msg,fmt::make_printf_args(args...));
}

template<typename... T> int logD(const char* msg, const T&... args) {
  return writeLog(LOGLEVEL_DEBUG,msg,fmt::make_printf_args(args...));
}

template<typename... T> int logI(const char* msg, const T&... args) {
  return writeLog(LOGLEVEL_INFO,msg,fmt::make_printf_args(args...));
}

template<typename... T> int logW(const char* msg, const T&... args) {
  return writeLog(LOGLEVEL_WARN,msg,fmt::make_printf_args(args...));
}

template<typename... T> int logE(const char* msg, const T&... args) {
  return writeLog(LOGLEVEL_ERROR,msg,fmt::make_printf_args(args...));
}

// number of entries at the given level written since the last reset
int logCount(int level);
void resetLogCounts();

#endif
