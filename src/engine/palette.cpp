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

#include "palette.h"

const ZxColor zxPalette[ZX_PALETTE_SIZE]={
  {"Black", 0x00, 0x00, 0x00, 0, false},
  {"Blue", 0x00, 0x00, 0xd7, 1, false},
  {"Red", 0xd7, 0x00, 0x00, 2, false},
  {"Magenta", 0xd7, 0x00, 0xd7, 3, false},
  {"Green", 0x00, 0xd7, 0x00, 4, false},
  {"Cyan", 0x00, 0xd7, 0xd7, 5, false},
  {"Yellow", 0xd7, 0xd7, 0x00, 6, false},
  {"White", 0xd7, 0xd7, 0xd7, 7, false},
  {"Bright Black", 0x00, 0x00, 0x00, 0, true},
  {"Bright Blue", 0x00, 0x00, 0xff, 1, true},
  {"Bright Red", 0xff, 0x00, 0x00, 2, true},
  {"Bright Magenta", 0xff, 0x00, 0xff, 3, true},
  {"Bright Green", 0x00, 0xff, 0x00, 4, true},
  {"Bright Cyan", 0x00, 0xff, 0xff, 5, true},
  {"Bright Yellow", 0xff, 0xff, 0x00, 6, true},
  {"Bright White", 0xff, 0xff, 0xff, 7, true}
};

int paletteIndex(int ink, bool bright) {
  ink&=7;
  if (ink==0) return 0;
  return bright?(ink+8):ink;
}

double paletteLuminance(int index) {
  const ZxColor& c=zxPalette[index&15];
  return 0.299*c.r+0.587*c.g+0.114*c.b;
}
