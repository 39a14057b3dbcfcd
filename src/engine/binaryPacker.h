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

#ifndef _BINARY_PACKER_H
#define _BINARY_PACKER_H

#include <vector>
#include "../zx-utils.h"

// append-only little-endian byte buffer
class ZxBinaryPacker {
  std::vector<unsigned char> buf;

  public:
    void writeByte(int val);
    // two's complement
    void writeSignedByte(int val);
    // little-endian 16-bit
    void writeWord(int val);
    void writeBytes(const std::vector<unsigned char>& data);
    void writeBytes(const unsigned char* data, size_t len);
    // raw characters, used for text outputs
    void writeText(const String& text);

    // overwrite already written bytes
    void patchByte(size_t offset, int val);
    void patchWord(size_t offset, int val);

    size_t size() const {
      return buf.size();
    }
    const std::vector<unsigned char>& getData() const {
      return buf;
    }
    unsigned char operator[](size_t i) const {
      return buf[i];
    }
    void clear() {
      buf.clear();
    }
};

// reads what a ZxBinaryPacker wrote. throws ZxEndOfDataError on overrun
class ZxBinaryReader {
  const std::vector<unsigned char>& buf;
  size_t pos;

  void need(size_t len) const;

  public:
    unsigned char readByte();
    signed char readSignedByte();
    unsigned short readWord();
    std::vector<unsigned char> readBytes(size_t len);
    void seek(size_t p) {
      pos=p;
    }
    size_t position() const {
      return pos;
    }
    size_t remaining() const {
      return pos<buf.size()?buf.size()-pos:0;
    }
    ZxBinaryReader(const std::vector<unsigned char>& data, size_t start=0):
      buf(data),
      pos(start) {}
};

// round(value*scale) clamped to [-128,127]. rounds half up
signed char floatToFixed8(double value, double scale=4.0);

// left/up = 0xff, right/down = 1, anything else 0
unsigned char directionToByte(const String& dir);

// tag to small integer. unmapped tags never fail, they get the fallback
struct ZxEnumName {
  const char* name;
  int value;
};

int encodeEnum(const String& tag, const ZxEnumName* table, int fallback);
// name of the first entry with that value, or "" if none
String enumName(int value, const ZxEnumName* table);

enum ZxBlockType {
  ZX_BLOCK_SOLID=0,
  ZX_BLOCK_DEADLY,
  ZX_BLOCK_CONVEYOR,
  ZX_BLOCK_CRUMBLING,
  ZX_BLOCK_SINKING,
  ZX_BLOCK_ICE,
  ZX_BLOCK_LADDER,
  ZX_BLOCK_EMPTY,
  ZX_BLOCK_PLATFORM,
  ZX_BLOCK_COLLECTIBLE
};

enum ZxObjectType {
  ZX_OBJECT_PLAYER=0,
  ZX_OBJECT_ENEMY,
  ZX_OBJECT_COLLECTIBLE,
  ZX_OBJECT_DOOR,
  ZX_OBJECT_EXIT,
  ZX_OBJECT_MOVING_PLATFORM,
  ZX_OBJECT_AMMUNITION
};

extern const ZxEnumName zxBlockTypeNames[];
extern const ZxEnumName zxObjectTypeNames[];

// unmapped tags are solid
int encodeBlockType(const String& tag);
// unmapped tags are collectibles
int encodeObjectType(const String& tag);

#endif
