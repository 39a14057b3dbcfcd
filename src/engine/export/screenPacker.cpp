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

#include "screenPacker.h"
#include "bank.h"
#include "objectPacker.h"
#include "../errors.h"
#include "../../zx-log.h"
#include <math.h>
#include <fmt/printf.h>

const ZxFieldDesc zxPlacedObjectFields[]={
  {0, "speed", ZX_FIELD_FIXED8, NULL},
  {1, "direction", ZX_FIELD_DIRECTION, NULL},
  {2, "movementPattern", ZX_FIELD_ENUM, zxMovementPatternNames},
  {3, "damage", ZX_FIELD_BYTE, NULL},
  {4, "points", ZX_FIELD_WORD, NULL},
  {0, NULL, ZX_FIELD_FLAG, NULL}
};

int screenTypeCode(ZxScreenType type) {
  switch (type) {
    case ZX_SCREEN_TITLE:
      return 1;
    case ZX_SCREEN_LOADING:
      return 2;
    default:
      return 0;
  }
}

static int tileCoord(int pixels) {
  int ret=(int)floor(pixels/8.0+0.5);
  return CLAMP(ret,0,255);
}

std::vector<unsigned char> packPlacedObject(const ZxPlacedObject& placed, const ZxExportContext& ctx) {
  const ZxGameObject* def=ctx.getProject().findObject(placed.objectId);
  ZxPropertyBag defaults;
  if (def!=NULL) defaults=def->props;

  // only overrides that change the object's default
  ZxPropertyBag delta;
  for (const ZxFieldDesc* i=zxPlacedObjectFields; i->key!=NULL; i++) {
    const ZxPropertyValue* v=placed.overrides.find(i->key);
    if (v==NULL || !fieldPresent(*i,placed.overrides)) continue;
    const ZxPropertyValue* d=defaults.find(i->key);
    if (d!=NULL && *d==*v) continue;
    switch (v->type) {
      case ZX_PROP_NUMBER:
        delta.setNumber(i->key,v->num);
        break;
      case ZX_PROP_STRING:
        delta.setString(i->key,v->str);
        break;
      case ZX_PROP_BOOL:
        delta.setBool(i->key,v->flag);
        break;
      case ZX_PROP_LIST:
        delta.setList(i->key,v->list);
        break;
    }
  }

  ZxBinaryPacker payload;
  unsigned char flags=encodeFields(zxPlacedObjectFields,delta,ctx,payload);

  ZxBinaryPacker rec;
  rec.writeByte(ctx.objectIndex(placed.objectId));
  rec.writeByte(tileCoord(placed.x));
  rec.writeByte(tileCoord(placed.y));
  rec.writeByte(flags);
  rec.writeBytes(payload.getData());
  return rec.getData();
}

std::vector<unsigned char> packScreen(const ZxScreen& screen, const ZxExportContext& ctx) {
  ZxBinaryPacker rec;
  rec.writeByte(screenTypeCode(screen.type));
  if (screen.hasTiles) {
    if (screen.tileWidth<1 || screen.tileWidth>255 || screen.tileHeight<1 || screen.tileHeight>255 ||
        (int)screen.tiles.size()!=screen.tileWidth*screen.tileHeight) {
      String msg=fmt::sprintf("screen %s has a malformed %dx%d tile grid",screen.name,screen.tileWidth,screen.tileHeight);
      logE("%s",msg);
      throw ZxExportError(msg);
    }
    rec.writeByte(screen.tileWidth);
    rec.writeByte(screen.tileHeight);
    for (int y=0; y<screen.tileHeight; y++) {
      for (int x=0; x<screen.tileWidth; x++) {
        const String& id=screen.tileAt(x,y);
        rec.writeByte(id.empty()?ZX_TILE_EMPTY:ctx.blockIndex(id));
      }
    }
  } else {
    rec.writeByte(0);
    rec.writeByte(0);
  }

  if (screen.objects.size()>255) {
    String msg=fmt::sprintf("screen %s has too many objects: %d > 255",screen.name,screen.objects.size());
    logE("%s",msg);
    throw ZxExportError(msg);
  }
  rec.writeByte((int)screen.objects.size());
  for (const ZxPlacedObject& i: screen.objects) {
    rec.writeBytes(packPlacedObject(i,ctx));
  }
  return rec.getData();
}

std::vector<unsigned char> packScreenBank(const ZxExportContext& ctx) {
  std::vector<ZxRecord> records;
  for (const ZxScreen& i: ctx.getProject().screens) {
    records.push_back(packScreen(i,ctx));
  }
  return packRecordBank(records,"screens");
}

std::vector<unsigned char> packLevelTable(const ZxExportContext& ctx) {
  const std::vector<ZxLevel>& levels=ctx.getProject().levels;
  if (levels.size()>255) {
    String msg=fmt::sprintf("too many levels: %d > 255",levels.size());
    logE("%s",msg);
    throw ZxExportError(msg);
  }
  ZxBinaryPacker table;
  table.writeByte((int)levels.size());
  for (const ZxLevel& i: levels) {
    size_t count=MIN(i.screenIds.size(),(size_t)255);
    if (count<i.screenIds.size()) {
      logW("level %s has more than 255 screens, truncating",i.name);
    }
    table.writeByte((int)count);
    for (size_t j=0; j<count; j++) {
      table.writeByte(ctx.screenIndex(i.screenIds[j]));
    }
  }
  return table.getData();
}

ZxScreenRecord readScreen(ZxBinaryReader& r) {
  ZxScreenRecord ret;
  ret.type=r.readByte();
  ret.width=r.readByte();
  ret.height=r.readByte();
  ret.tiles=r.readBytes(ret.width*ret.height);
  int count=r.readByte();
  for (int i=0; i<count; i++) {
    ZxPlacedObjectRecord o;
    o.objectIndex=r.readByte();
    o.tileX=r.readByte();
    o.tileY=r.readByte();
    o.flags=r.readByte();
    o.overrides=decodeFields(zxPlacedObjectFields,o.flags,r);
    ret.objects.push_back(o);
  }
  return ret;
}

std::vector<ZxScreenRecord> readScreenBank(const std::vector<unsigned char>& bank) {
  std::vector<ZxScreenRecord> ret;
  int count=bankRecordCount(bank);
  for (int i=0; i<count; i++) {
    ZxBinaryReader r(bank,bankRecordOffset(bank,i));
    ret.push_back(readScreen(r));
  }
  return ret;
}
