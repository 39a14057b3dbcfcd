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

#ifndef _FIELD_CODEC_H
#define _FIELD_CODEC_H

#include "../binaryPacker.h"
#include "../project.h"
#include "exportContext.h"

enum ZxFieldKind {
  ZX_FIELD_FIXED8=0,   // round(v*4), signed byte
  ZX_FIELD_BYTE,       // rounded byte
  ZX_FIELD_WORD,       // rounded word
  ZX_FIELD_TICKS,      // seconds at 12 ticks per second, byte
  ZX_FIELD_TICKS_WORD, // same, word
  ZX_FIELD_FRACTION,   // coefficient*256, byte
  ZX_FIELD_MS_FRAMES,  // milliseconds to 50Hz frames, byte
  ZX_FIELD_DIRECTION,  // direction byte
  ZX_FIELD_ENUM,       // tag through the names table
  ZX_FIELD_FLAG,       // set when true, no payload
  ZX_FIELD_SCREEN_REF, // screen id to screen index
  ZX_FIELD_LEVEL_REF,  // level id to level index
  ZX_FIELD_BYTE_LIST   // count then one byte per entry
};

// one optional field of a bitflag record.
// a table is ordered by bit and ends with a NULL key
struct ZxFieldDesc {
  int bit;
  const char* key;
  ZxFieldKind kind;
  const ZxEnumName* names;
};

size_t fieldCount(const ZxFieldDesc* fields);

// true if the bag carries a value this field would encode
bool fieldPresent(const ZxFieldDesc& field, const ZxPropertyBag& props);

// appends the payload of every present field in bit order and returns the flag byte
unsigned char encodeFields(const ZxFieldDesc* fields, const ZxPropertyBag& props, const ZxExportContext& ctx, ZxBinaryPacker& payload);

// writes one field's payload
void encodeField(const ZxFieldDesc& field, const ZxPropertyBag& props, const ZxExportContext& ctx, ZxBinaryPacker& payload);

// consumes the payload of every flag bit low to high.
// numbers come back in source units (fixed8 as v/4, ticks as seconds), enums and directions as tags,
// references as indices. throws ZxExportError on a bit with no field
ZxPropertyBag decodeFields(const ZxFieldDesc* fields, unsigned char flags, ZxBinaryReader& r);

#endif
