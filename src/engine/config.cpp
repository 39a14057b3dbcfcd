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

#include "config.h"
#include "../zx-log.h"
#include <stdlib.h>
#include <fmt/printf.h>

static String trim(const String& s) {
  size_t start=s.find_first_not_of(" \t\r");
  if (start==String::npos) return "";
  size_t end=s.find_last_not_of(" \t\r");
  return s.substr(start,end-start+1);
}

bool ZxConfig::loadFromMemory(const char* buf) {
  String line;
  int lineNum=0;
  bool ok=true;
  const char* i=buf;
  while (true) {
    if (*i=='\n' || *i==0) {
      lineNum++;
      String l=trim(line);
      line="";
      if (!l.empty() && l[0]!='#') {
        size_t eq=l.find('=');
        if (eq==String::npos) {
          logW("config line %d has no '=': %s",lineNum,l);
          ok=false;
        } else {
          conf[trim(l.substr(0,eq))]=trim(l.substr(eq+1));
        }
      }
      if (*i==0) break;
    } else {
      line+=*i;
    }
    i++;
  }
  return ok;
}

String ZxConfig::toString() const {
  String ret;
  for (auto& i: conf) {
    ret+=fmt::sprintf("%s=%s\n",i.first,i.second);
  }
  return ret;
}

bool ZxConfig::getBool(const String& key, bool fallback) const {
  auto val=conf.find(key);
  if (val!=conf.cend()) {
    if (val->second=="true" || val->second=="1") {
      return true;
    } else if (val->second=="false" || val->second=="0") {
      return false;
    }
    logW("config value %s=%s is not a boolean",key,val->second);
  }
  return fallback;
}

int ZxConfig::getInt(const String& key, int fallback) const {
  auto val=conf.find(key);
  if (val!=conf.cend()) {
    char* end=NULL;
    long ret=strtol(val->second.c_str(),&end,0);
    if (end!=val->second.c_str() && *end==0) return (int)ret;
    logW("config value %s=%s is not an integer",key,val->second);
  }
  return fallback;
}

double ZxConfig::getDouble(const String& key, double fallback) const {
  auto val=conf.find(key);
  if (val!=conf.cend()) {
    char* end=NULL;
    double ret=strtod(val->second.c_str(),&end);
    if (end!=val->second.c_str() && *end==0) return ret;
    logW("config value %s=%s is not a number",key,val->second);
  }
  return fallback;
}

String ZxConfig::getString(const String& key, const String& fallback) const {
  auto val=conf.find(key);
  if (val!=conf.cend()) {
    return val->second;
  }
  return fallback;
}

void ZxConfig::set(const String& key, bool value) {
  conf[key]=value?"true":"false";
}

void ZxConfig::set(const String& key, int value) {
  conf[key]=fmt::sprintf("%d",value);
}

void ZxConfig::set(const String& key, double value) {
  conf[key]=fmt::sprintf("%g",value);
}

void ZxConfig::set(const String& key, const char* value) {
  conf[key]=String(value);
}

void ZxConfig::set(const String& key, const String& value) {
  conf[key]=value;
}

bool ZxConfig::has(const String& key) const {
  return conf.find(key)!=conf.cend();
}

bool ZxConfig::remove(const String& key) {
  return conf.erase(key)>0;
}

void ZxConfig::clear() {
  conf.clear();
}
