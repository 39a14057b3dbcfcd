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

#include "fieldCodec.h"
#include "../errors.h"
#include <math.h>
#include <fmt/printf.h>

static int roundHalfUp(double v) {
  return (int)floor(v+0.5);
}

static const ZxFieldDesc* findBit(const ZxFieldDesc* fields, int bit) {
  for (const ZxFieldDesc* i=fields; i->key!=NULL; i++) {
    if (i->bit==bit) return i;
  }
  return NULL;
}

size_t fieldCount(const ZxFieldDesc* fields) {
  size_t ret=0;
  for (const ZxFieldDesc* i=fields; i->key!=NULL; i++) {
    ret++;
  }
  return ret;
}

bool fieldPresent(const ZxFieldDesc& field, const ZxPropertyBag& props) {
  switch (field.kind) {
    case ZX_FIELD_DIRECTION:
    case ZX_FIELD_ENUM:
    case ZX_FIELD_SCREEN_REF:
    case ZX_FIELD_LEVEL_REF:
      return props.hasString(field.key);
    case ZX_FIELD_FLAG:
      return props.getBool(field.key,false);
    case ZX_FIELD_BYTE_LIST:
      return props.hasList(field.key) && !props.getList(field.key).empty();
    default:
      return props.hasNumber(field.key);
  }
}

void encodeField(const ZxFieldDesc& field, const ZxPropertyBag& props, const ZxExportContext& ctx, ZxBinaryPacker& payload) {
  double num=props.getNumber(field.key,0);
  switch (field.kind) {
    case ZX_FIELD_FIXED8:
      payload.writeSignedByte(floatToFixed8(num));
      break;
    case ZX_FIELD_BYTE:
      payload.writeByte(CLAMP(roundHalfUp(num),0,255));
      break;
    case ZX_FIELD_WORD:
      payload.writeWord(CLAMP(roundHalfUp(num),0,65535));
      break;
    case ZX_FIELD_TICKS:
      payload.writeByte(CLAMP(roundHalfUp(num*12),0,255));
      break;
    case ZX_FIELD_TICKS_WORD:
      payload.writeWord(CLAMP(roundHalfUp(num*12),0,65535));
      break;
    case ZX_FIELD_FRACTION:
      payload.writeByte(CLAMP(roundHalfUp(num*256),0,255));
      break;
    case ZX_FIELD_MS_FRAMES:
      payload.writeByte(CLAMP(roundHalfUp(num*50/1000),0,255));
      break;
    case ZX_FIELD_DIRECTION:
      payload.writeByte(directionToByte(props.getString(field.key)));
      break;
    case ZX_FIELD_ENUM:
      payload.writeByte(encodeEnum(props.getString(field.key),field.names,0));
      break;
    case ZX_FIELD_FLAG:
      break;
    case ZX_FIELD_SCREEN_REF:
      payload.writeByte(ctx.screenIndex(props.getString(field.key)));
      break;
    case ZX_FIELD_LEVEL_REF:
      payload.writeByte(ctx.levelIndex(props.getString(field.key)));
      break;
    case ZX_FIELD_BYTE_LIST: {
      std::vector<double> list=props.getList(field.key);
      if (list.size()>255) list.resize(255);
      payload.writeByte((int)list.size());
      for (double i: list) {
        payload.writeByte(CLAMP(roundHalfUp(i),0,255));
      }
      break;
    }
  }
}

unsigned char encodeFields(const ZxFieldDesc* fields, const ZxPropertyBag& props, const ZxExportContext& ctx, ZxBinaryPacker& payload) {
  unsigned char flags=0;
  for (int bit=0; bit<8; bit++) {
    const ZxFieldDesc* field=findBit(fields,bit);
    if (field==NULL) continue;
    if (!fieldPresent(*field,props)) continue;
    flags|=1<<bit;
    encodeField(*field,props,ctx,payload);
  }
  return flags;
}

ZxPropertyBag decodeFields(const ZxFieldDesc* fields, unsigned char flags, ZxBinaryReader& r) {
  ZxPropertyBag ret;
  for (int bit=0; bit<8; bit++) {
    if (!(flags&(1<<bit))) continue;
    const ZxFieldDesc* field=findBit(fields,bit);
    if (field==NULL) {
      throw ZxExportError(fmt::sprintf("flag bit %d has no field in this record type",bit));
    }
    switch (field->kind) {
      case ZX_FIELD_FIXED8:
        ret.setNumber(field->key,r.readSignedByte()/4.0);
        break;
      case ZX_FIELD_BYTE:
      case ZX_FIELD_MS_FRAMES:
      case ZX_FIELD_SCREEN_REF:
      case ZX_FIELD_LEVEL_REF:
        ret.setNumber(field->key,r.readByte());
        break;
      case ZX_FIELD_WORD:
        ret.setNumber(field->key,r.readWord());
        break;
      case ZX_FIELD_TICKS:
        ret.setNumber(field->key,r.readByte()/12.0);
        break;
      case ZX_FIELD_TICKS_WORD:
        ret.setNumber(field->key,r.readWord()/12.0);
        break;
      case ZX_FIELD_FRACTION:
        ret.setNumber(field->key,r.readByte()/256.0);
        break;
      case ZX_FIELD_DIRECTION: {
        unsigned char d=r.readByte();
        ret.setString(field->key,d==0xff?"left":(d==1?"right":""));
        break;
      }
      case ZX_FIELD_ENUM:
        ret.setString(field->key,enumName(r.readByte(),field->names));
        break;
      case ZX_FIELD_FLAG:
        ret.setBool(field->key,true);
        break;
      case ZX_FIELD_BYTE_LIST: {
        std::vector<double> list;
        int count=r.readByte();
        for (int i=0; i<count; i++) {
          list.push_back(r.readByte());
        }
        ret.setList(field->key,list);
        break;
      }
    }
  }
  return ret;
}
