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

#ifndef _SCREEN_CODEC_H
#define _SCREEN_CODEC_H

#include <vector>
#include "../project.h"

#define ZX_SCR_BITMAP_SIZE 6144
#define ZX_SCR_ATTR_SIZE 768
#define ZX_SCR_SIZE 6912

// offset of a pixel row byte within the bitmap
inline int scrBitmapOffset(int x, int y) {
  return ((y&0xc0)<<5)|((y&0x07)<<8)|((y&0x38)<<2)|(x>>3);
}

// FLASH bit 7, BRIGHT bit 6, PAPER bits 5-3, INK bits 2-0
inline unsigned char scrAttribute(int ink, int paper, bool bright, bool flash=false) {
  return (flash?0x80:0)|(bright?0x40:0)|((paper&7)<<3)|(ink&7);
}

struct ZxCellColors {
  int ink;
  int paper;
};

// a cell carrying more than two colors
struct ZxCellViolation {
  int cellX, cellY;
  int colors;
};

class ZxScreenCodec {
  public:
    // distinct colors of a cell in row-major order of first appearance
    static std::vector<int> cellColors(const ZxPixelGrid& grid, int cellX, int cellY);

    static std::vector<ZxCellViolation> findViolations(const ZxPixelGrid& grid);

    // ink is the first color seen in the cell, paper the second (or the same).
    // throws ZxColorConstraintError on a cell with more than two colors, or a grid that is not 256x192
    static std::vector<unsigned char> encode(const ZxPixelGrid& grid);

    // caller-chosen colors, 768 entries. pixels matching neither color are paper
    static std::vector<unsigned char> encodeWithColors(const ZxPixelGrid& grid, const std::vector<ZxCellColors>& colors);

    // like encode, but a cell with more than two colors keeps the first two seen
    // and every other pixel becomes paper. only fails on a grid that is not 256x192
    static std::vector<unsigned char> encodeApproximate(const ZxPixelGrid& grid);

    static ZxPixelGrid decode(const std::vector<unsigned char>& scr);
};

#endif
