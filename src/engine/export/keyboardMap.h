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

#ifndef _KEYBOARD_MAP_H
#define _KEYBOARD_MAP_H

#include "../../zx-utils.h"

// a key is read with ld bc,port / in a,(c) / bit n,a. pressed keys read as 0
struct ZxKeyBinding {
  unsigned short port;
  unsigned char bit;
  const char* name;
};

// "a".."z", "0".."9", "space", "enter", "shift", "symbol". case-insensitive.
// returns NULL for anything else
const ZxKeyBinding* findKey(const String& key);

// falls back to the given key, with a warning, if the name is unknown
const ZxKeyBinding& keyOrDefault(const String& key, const char* fallback);

#endif
