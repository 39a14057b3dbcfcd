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

#include "objectPacker.h"
#include "bank.h"
#include "../../zx-log.h"

const ZxEnumName zxMovementPatternNames[]={
  {"stationary", 0},
  {"patrol", 1},
  {"chase", 2},
  {"fly", 3},
  {NULL, 0}
};

const ZxEnumName zxItemTypeNames[]={
  {"coin", 0},
  {"key", 1},
  {"powerup", 2},
  {"life", 3},
  {NULL, 0}
};

const ZxEnumName zxPlatformTypeNames[]={
  {"horizontal", 0},
  {"vertical", 1},
  {"elevator", 2},
  {"rope", 3},
  {NULL, 0}
};

const ZxEnumName zxRepeatTypeNames[]={
  {"ping_pong", 0},
  {"loop", 1},
  {NULL, 0}
};

static const ZxFieldDesc noFields[]={
  {0, NULL, ZX_FIELD_FLAG, NULL}
};

static const ZxFieldDesc playerFields[]={
  {0, "speed", ZX_FIELD_FIXED8, NULL},
  {1, "jumpHeight", ZX_FIELD_BYTE, NULL},
  {2, "gravity", ZX_FIELD_FIXED8, NULL},
  {0, NULL, ZX_FIELD_FLAG, NULL}
};

static const ZxFieldDesc enemyFields[]={
  {0, "speed", ZX_FIELD_FIXED8, NULL},
  {1, "direction", ZX_FIELD_DIRECTION, NULL},
  {3, "movementPattern", ZX_FIELD_ENUM, zxMovementPatternNames},
  {4, "damage", ZX_FIELD_BYTE, NULL},
  {5, "respawnDelay", ZX_FIELD_TICKS, NULL},
  {0, NULL, ZX_FIELD_FLAG, NULL}
};

static const ZxFieldDesc ammunitionFields[]={
  {0, "projectileSpeed", ZX_FIELD_FIXED8, NULL},
  {4, "projectileDamage", ZX_FIELD_BYTE, NULL},
  {5, "projectileRange", ZX_FIELD_BYTE, NULL},
  {0, NULL, ZX_FIELD_FLAG, NULL}
};

static const ZxFieldDesc collectibleFields[]={
  {3, "itemType", ZX_FIELD_ENUM, zxItemTypeNames},
  {4, "energyBonus", ZX_FIELD_BYTE, NULL},
  {5, "points", ZX_FIELD_WORD, NULL},
  {6, "oneTime", ZX_FIELD_FLAG, NULL},
  {7, "requiredToExit", ZX_FIELD_FLAG, NULL},
  {0, NULL, ZX_FIELD_FLAG, NULL}
};

static const ZxFieldDesc doorFields[]={
  {0, "targetRoom", ZX_FIELD_SCREEN_REF, NULL},
  {1, "targetFloor", ZX_FIELD_BYTE, NULL},
  {0, NULL, ZX_FIELD_FLAG, NULL}
};

static const ZxFieldDesc exitFields[]={
  {0, "targetLevel", ZX_FIELD_LEVEL_REF, NULL},
  {0, NULL, ZX_FIELD_FLAG, NULL}
};

static const ZxFieldDesc platformFields[]={
  {0, "platformType", ZX_FIELD_ENUM, zxPlatformTypeNames},
  {1, "platformSpeed", ZX_FIELD_BYTE, NULL},
  {2, "platformRange", ZX_FIELD_BYTE, NULL},
  {3, "pauseAtEnds", ZX_FIELD_MS_FRAMES, NULL},
  {4, "startDirection", ZX_FIELD_DIRECTION, NULL},
  {5, "repeatType", ZX_FIELD_ENUM, zxRepeatTypeNames},
  {6, "playerCarry", ZX_FIELD_FLAG, NULL},
  {7, "elevatorStops", ZX_FIELD_BYTE_LIST, NULL},
  {0, NULL, ZX_FIELD_FLAG, NULL}
};

const ZxFieldDesc* objectFields(int type) {
  switch (type) {
    case ZX_OBJECT_PLAYER:
      return playerFields;
    case ZX_OBJECT_ENEMY:
      return enemyFields;
    case ZX_OBJECT_COLLECTIBLE:
      return collectibleFields;
    case ZX_OBJECT_DOOR:
      return doorFields;
    case ZX_OBJECT_EXIT:
      return exitFields;
    case ZX_OBJECT_MOVING_PLATFORM:
      return platformFields;
    case ZX_OBJECT_AMMUNITION:
      return ammunitionFields;
    default:
      return noFields;
  }
}

std::vector<unsigned char> packObject(const ZxGameObject& obj, const ZxExportContext& ctx) {
  int type=encodeObjectType(obj.type);

  ZxBinaryPacker payload;
  unsigned char flags=encodeFields(objectFields(type),obj.props,ctx,payload);

  ZxBinaryPacker rec;
  rec.writeByte(ctx.spriteIndex(obj.spriteId));
  rec.writeByte(type);
  rec.writeByte(flags);
  rec.writeBytes(payload.getData());

  unsigned char animMask=0;
  ZxBinaryPacker anims;
  if (obj.hasAnimations) {
    for (int i=0; i<ZX_ANIM_MAX; i++) {
      if (obj.animations.sprite[i].empty()) continue;
      animMask|=1<<i;
      anims.writeByte(ctx.spriteIndex(obj.animations.sprite[i]));
    }
  }
  rec.writeByte(animMask);
  rec.writeBytes(anims.getData());
  return rec.getData();
}

std::vector<unsigned char> packObjectBank(const ZxExportContext& ctx) {
  std::vector<ZxRecord> records;
  for (const ZxGameObject& i: ctx.getProject().objects) {
    records.push_back(packObject(i,ctx));
  }
  return packRecordBank(records,"objects");
}

ZxObjectRecord readObject(ZxBinaryReader& r) {
  ZxObjectRecord ret;
  ret.spriteIndex=r.readByte();
  ret.type=r.readByte();
  ret.flags=r.readByte();
  ret.props=decodeFields(objectFields(ret.type),ret.flags,r);
  ret.animMask=r.readByte();
  for (int i=0; i<ZX_ANIM_MAX; i++) {
    if (ret.animMask&(1<<i)) {
      ret.animSprites.push_back(r.readByte());
    }
  }
  return ret;
}

std::vector<ZxObjectRecord> readObjectBank(const std::vector<unsigned char>& bank) {
  std::vector<ZxObjectRecord> ret;
  int count=bankRecordCount(bank);
  for (int i=0; i<count; i++) {
    ZxBinaryReader r(bank,bankRecordOffset(bank,i));
    ret.push_back(readObject(r));
  }
  return ret;
}
