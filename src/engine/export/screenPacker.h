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

#ifndef _SCREEN_PACKER_H
#define _SCREEN_PACKER_H

#include <vector>
#include "fieldCodec.h"

// tile index of a cell with no block
#define ZX_TILE_EMPTY 0xff

// screen record header: type code, width, height
#define ZX_SCREEN_HEADER_SIZE 3

extern const ZxFieldDesc zxPlacedObjectFields[];

int screenTypeCode(ZxScreenType type);

// [object index][round(x/8)][round(y/8)][flags][overrides that differ from the object]
std::vector<unsigned char> packPlacedObject(const ZxPlacedObject& placed, const ZxExportContext& ctx);

// [type][width][height][tiles][object count][placed objects]
// pixel screens have width and height 0 and no tiles
std::vector<unsigned char> packScreen(const ZxScreen& screen, const ZxExportContext& ctx);
std::vector<unsigned char> packScreenBank(const ZxExportContext& ctx);

// [count][per level: screen count, screen indices]
std::vector<unsigned char> packLevelTable(const ZxExportContext& ctx);

struct ZxPlacedObjectRecord {
  int objectIndex;
  int tileX, tileY;
  unsigned char flags;
  ZxPropertyBag overrides;
};

struct ZxScreenRecord {
  int type;
  int width, height;
  std::vector<unsigned char> tiles;
  std::vector<ZxPlacedObjectRecord> objects;
};

ZxScreenRecord readScreen(ZxBinaryReader& r);
std::vector<ZxScreenRecord> readScreenBank(const std::vector<unsigned char>& bank);

#endif
