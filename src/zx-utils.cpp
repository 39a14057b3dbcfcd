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

#include "zx-utils.h"

String normalizeTag(const String& tag) {
  String ret;
  ret.reserve(tag.size());
  for (char c: tag) {
    if (c>='A' && c<='Z') {
      ret+=(char)(c-'A'+'a');
    } else if (c=='-' || c==' ') {
      ret+='_';
    } else {
      ret+=c;
    }
  }
  return ret;
}

String padRight(const String& s, size_t len, char fill) {
  if (s.size()>=len) return s.substr(0,len);
  return s+String(len-s.size(),fill);
}
