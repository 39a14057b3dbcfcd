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

#include "zx-log.h"

int logLevel=LOGLEVEL_INFO;

LogEntry logEntries[ZX_LOG_SIZE];
unsigned short logPosition=0;

static int logCounts[LOGLEVEL_TRACE+1];

static const char* logTypes[]={
  "error",
  "warning",
  "info",
  "debug",
  "trace"
};

int writeLog(int level, const char* msg, fmt::printf_args args) {
  if (level<LOGLEVEL_ERROR || level>LOGLEVEL_TRACE) level=LOGLEVEL_TRACE;
  time_t thisMakesNoSense=time(NULL);
  int pos=logPosition;
  logPosition=(logPosition+1)&(ZX_LOG_SIZE-1);

  logEntries[pos].text=fmt::vsprintf(msg,args);
  logEntries[pos].loglevel=level;
#ifdef _WIN32
  localtime_s(&logEntries[pos].time,&thisMakesNoSense);
#else
  localtime_r(&thisMakesNoSense,&logEntries[pos].time);
#endif
  logEntries[pos].ready=true;
  logCounts[level]++;

  if (logLevel<level) return 0;
  return fprintf(stderr,"[%s] %s\n",logTypes[level],logEntries[pos].text.c_str());
}

int logCount(int level) {
  if (level<LOGLEVEL_ERROR || level>LOGLEVEL_TRACE) return 0;
  return logCounts[level];
}

void resetLogCounts() {
  for (int i=0; i<=LOGLEVEL_TRACE; i++) {
    logCounts[i]=0;
  }
}
