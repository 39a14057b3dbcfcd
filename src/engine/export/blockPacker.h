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

#ifndef _BLOCK_PACKER_H
#define _BLOCK_PACKER_H

#include <vector>
#include "fieldCodec.h"

// optional fields of a block type. never NULL
const ZxFieldDesc* blockFields(int type);

// [sprite index][type][flags][payload]
std::vector<unsigned char> packBlock(const ZxBlock& block, const ZxExportContext& ctx);
std::vector<unsigned char> packBlockBank(const ZxExportContext& ctx);

struct ZxBlockRecord {
  int spriteIndex;
  int type;
  unsigned char flags;
  ZxPropertyBag props;
};

ZxBlockRecord readBlock(ZxBinaryReader& r);
std::vector<ZxBlockRecord> readBlockBank(const std::vector<unsigned char>& bank);

#endif
