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

#include "keyboardMap.h"
#include "../errors.h"
#include "../../zx-log.h"
#include <fmt/printf.h>

static const ZxKeyBinding keyTable[]={
  // caps shift, z, x, c, v
  {0xfefe, 0, "shift"},
  {0xfefe, 1, "z"},
  {0xfefe, 2, "x"},
  {0xfefe, 3, "c"},
  {0xfefe, 4, "v"},
  // a, s, d, f, g
  {0xfdfe, 0, "a"},
  {0xfdfe, 1, "s"},
  {0xfdfe, 2, "d"},
  {0xfdfe, 3, "f"},
  {0xfdfe, 4, "g"},
  // q, w, e, r, t
  {0xfbfe, 0, "q"},
  {0xfbfe, 1, "w"},
  {0xfbfe, 2, "e"},
  {0xfbfe, 3, "r"},
  {0xfbfe, 4, "t"},
  // 1-5
  {0xf7fe, 0, "1"},
  {0xf7fe, 1, "2"},
  {0xf7fe, 2, "3"},
  {0xf7fe, 3, "4"},
  {0xf7fe, 4, "5"},
  // 0, 9, 8, 7, 6
  {0xeffe, 0, "0"},
  {0xeffe, 1, "9"},
  {0xeffe, 2, "8"},
  {0xeffe, 3, "7"},
  {0xeffe, 4, "6"},
  // p, o, i, u, y
  {0xdffe, 0, "p"},
  {0xdffe, 1, "o"},
  {0xdffe, 2, "i"},
  {0xdffe, 3, "u"},
  {0xdffe, 4, "y"},
  // enter, l, k, j, h
  {0xbffe, 0, "enter"},
  {0xbffe, 1, "l"},
  {0xbffe, 2, "k"},
  {0xbffe, 3, "j"},
  {0xbffe, 4, "h"},
  // space, symbol shift, m, n, b
  {0x7ffe, 0, "space"},
  {0x7ffe, 1, "symbol"},
  {0x7ffe, 2, "m"},
  {0x7ffe, 3, "n"},
  {0x7ffe, 4, "b"},

  {0, 0, NULL}
};

const ZxKeyBinding* findKey(const String& key) {
  String k;
  for (char c: key) {
    if (c==' ' || c=='\t') continue;
    if (c>='A' && c<='Z') c=c-'A'+'a';
    k+=c;
  }
  for (const ZxKeyBinding* i=keyTable; i->name!=NULL; i++) {
    if (k==i->name) return i;
  }
  return NULL;
}

const ZxKeyBinding& keyOrDefault(const String& key, const char* fallback) {
  const ZxKeyBinding* ret=findKey(key);
  if (ret!=NULL) return *ret;
  logW("unknown key %s, using %s",key,fallback);
  ret=findKey(fallback);
  if (ret==NULL) {
    throw ZxExportError(fmt::sprintf("unknown fallback key %s",fallback));
  }
  return *ret;
}
