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

#include "blockPacker.h"
#include "bank.h"
#include "../../zx-log.h"

static const ZxFieldDesc noFields[]={
  {0, NULL, ZX_FIELD_FLAG, NULL}
};

static const ZxFieldDesc conveyorFields[]={
  {0, "speed", ZX_FIELD_FIXED8, NULL},
  {1, "direction", ZX_FIELD_DIRECTION, NULL},
  {0, NULL, ZX_FIELD_FLAG, NULL}
};

static const ZxFieldDesc crumblingFields[]={
  {2, "crumbleTime", ZX_FIELD_TICKS, NULL},
  {3, "respawnTime", ZX_FIELD_TICKS_WORD, NULL},
  {0, NULL, ZX_FIELD_FLAG, NULL}
};

static const ZxFieldDesc sinkingFields[]={
  {0, "sinkingSpeed", ZX_FIELD_FIXED8, NULL},
  {5, "sinkingDepth", ZX_FIELD_BYTE, NULL},
  {0, NULL, ZX_FIELD_FLAG, NULL}
};

static const ZxFieldDesc iceFields[]={
  {4, "frictionCoefficient", ZX_FIELD_FRACTION, NULL},
  {0, NULL, ZX_FIELD_FLAG, NULL}
};

static const ZxFieldDesc ladderFields[]={
  {6, "climbSpeed", ZX_FIELD_FIXED8, NULL},
  {7, "passThrough", ZX_FIELD_FLAG, NULL},
  {0, NULL, ZX_FIELD_FLAG, NULL}
};

const ZxFieldDesc* blockFields(int type) {
  switch (type) {
    case ZX_BLOCK_CONVEYOR:
      return conveyorFields;
    case ZX_BLOCK_CRUMBLING:
      return crumblingFields;
    case ZX_BLOCK_SINKING:
      return sinkingFields;
    case ZX_BLOCK_ICE:
      return iceFields;
    case ZX_BLOCK_LADDER:
      return ladderFields;
    default:
      return noFields;
  }
}

std::vector<unsigned char> packBlock(const ZxBlock& block, const ZxExportContext& ctx) {
  int type=encodeBlockType(block.type);
  ZxPropertyBag props=block.props;
  // conveyor-left and conveyor-right carry their direction in the tag
  if (type==ZX_BLOCK_CONVEYOR && !props.hasString("direction")) {
    String tag=normalizeTag(block.type);
    if (tag=="conveyor_left") {
      props.setString("direction","left");
    } else if (tag=="conveyor_right") {
      props.setString("direction","right");
    }
  }

  ZxBinaryPacker payload;
  unsigned char flags=encodeFields(blockFields(type),props,ctx,payload);

  ZxBinaryPacker rec;
  rec.writeByte(ctx.spriteIndex(block.spriteId));
  rec.writeByte(type);
  rec.writeByte(flags);
  rec.writeBytes(payload.getData());
  return rec.getData();
}

std::vector<unsigned char> packBlockBank(const ZxExportContext& ctx) {
  std::vector<ZxRecord> records;
  for (const ZxBlock& i: ctx.getProject().blocks) {
    records.push_back(packBlock(i,ctx));
  }
  return packRecordBank(records,"blocks");
}

ZxBlockRecord readBlock(ZxBinaryReader& r) {
  ZxBlockRecord ret;
  ret.spriteIndex=r.readByte();
  ret.type=r.readByte();
  ret.flags=r.readByte();
  ret.props=decodeFields(blockFields(ret.type),ret.flags,r);
  return ret;
}

std::vector<ZxBlockRecord> readBlockBank(const std::vector<unsigned char>& bank) {
  std::vector<ZxBlockRecord> ret;
  int count=bankRecordCount(bank);
  for (int i=0; i<count; i++) {
    ZxBinaryReader r(bank,bankRecordOffset(bank,i));
    ret.push_back(readBlock(r));
  }
  return ret;
}
