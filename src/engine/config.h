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

#ifndef _CONFIG_H
#define _CONFIG_H

#include <map>
#include "../zx-utils.h"

// string key/value settings with typed getters
class ZxConfig {
  std::map<String,String> conf;

  public:
    // parses "key=value" lines. blank lines and lines starting with '#' are skipped
    bool loadFromMemory(const char* buf);
    String toString() const;

    bool getBool(const String& key, bool fallback) const;
    int getInt(const String& key, int fallback) const;
    double getDouble(const String& key, double fallback) const;
    String getString(const String& key, const String& fallback) const;

    void set(const String& key, bool value);
    void set(const String& key, int value);
    void set(const String& key, double value);
    void set(const String& key, const char* value);
    void set(const String& key, const String& value);

    bool has(const String& key) const;
    bool remove(const String& key);
    void clear();
};

#endif
