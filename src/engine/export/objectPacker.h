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

#ifndef _OBJECT_PACKER_H
#define _OBJECT_PACKER_H

#include <vector>
#include "fieldCodec.h"

extern const ZxEnumName zxMovementPatternNames[];
extern const ZxEnumName zxItemTypeNames[];
extern const ZxEnumName zxPlatformTypeNames[];
extern const ZxEnumName zxRepeatTypeNames[];

// optional fields of an object type. never NULL
const ZxFieldDesc* objectFields(int type);

// [sprite index][type][flags][payload][animation mask][animation sprite indices]
std::vector<unsigned char> packObject(const ZxGameObject& obj, const ZxExportContext& ctx);
std::vector<unsigned char> packObjectBank(const ZxExportContext& ctx);

struct ZxObjectRecord {
  int spriteIndex;
  int type;
  unsigned char flags;
  ZxPropertyBag props;
  unsigned char animMask;
  // one per set mask bit, in slot order
  std::vector<int> animSprites;
};

ZxObjectRecord readObject(ZxBinaryReader& r);
std::vector<ZxObjectRecord> readObjectBank(const std::vector<unsigned char>& bank);

#endif
