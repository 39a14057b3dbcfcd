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

#ifndef _SPRITE_PACKER_H
#define _SPRITE_PACKER_H

#include <vector>
#include "exportContext.h"

#define ZX_SPRITE_META_SIZE 6
#define ZX_SPRITE_COLLISION_SIZE 4

// one frame as 1bpp rows. ceil(width/8) bytes per row, bit 7 leftmost,
// a bit is set if the palette index is not 0
std::vector<unsigned char> packSpritePixels(const ZxPixelGrid& frame, int width, int height);

// attribute byte for drawing the sprite as a tile: ink from its most used color, black paper
unsigned char spriteAttribute(const ZxSprite& sprite);

// [count][meta pointers][pixel pointers][collision pointers][meta...][pixels...][collision...]
// meta record: index, width, height, frame count, animation speed, attribute
std::vector<unsigned char> packSpriteBank(const ZxExportContext& ctx);

struct ZxSpriteBankEntry {
  int index, width, height, frameCount, animSpeed, attr;
  size_t pixelOffset;
  ZxCollisionBox collision;
};

std::vector<ZxSpriteBankEntry> readSpriteBank(const std::vector<unsigned char>& bank);

#endif
