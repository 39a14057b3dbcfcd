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

#ifndef _PALETTE_H
#define _PALETTE_H

#define ZX_PALETTE_SIZE 16

struct ZxColor {
  const char* name;
  unsigned char r, g, b;
  // 0-7
  unsigned char ink;
  bool bright;
};

// normal colors 0-7, then their bright versions 8-15
extern const ZxColor zxPalette[ZX_PALETTE_SIZE];

inline int paletteInk(int index) {
  return index&7;
}

inline bool paletteBright(int index) {
  return index>=8;
}

// black has no bright version. always index 0
int paletteIndex(int ink, bool bright);

// Rec. 601 luma
double paletteLuminance(int index);

#endif
