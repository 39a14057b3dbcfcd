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

#include "binaryPacker.h"
#include "errors.h"
#include <math.h>
#include <stddef.h>
#include <fmt/printf.h>

void ZxBinaryPacker::writeByte(int val) {
  buf.push_back(val&0xff);
}

void ZxBinaryPacker::writeSignedByte(int val) {
  if (val<0) val+=256;
  buf.push_back(val&0xff);
}

void ZxBinaryPacker::writeWord(int val) {
  buf.push_back(val&0xff);
  buf.push_back((val>>8)&0xff);
}

void ZxBinaryPacker::writeBytes(const std::vector<unsigned char>& data) {
  buf.insert(buf.end(),data.begin(),data.end());
}

void ZxBinaryPacker::writeBytes(const unsigned char* data, size_t len) {
  buf.insert(buf.end(),data,data+len);
}

void ZxBinaryPacker::writeText(const String& text) {
  buf.insert(buf.end(),text.begin(),text.end());
}

void ZxBinaryPacker::patchByte(size_t offset, int val) {
  if (offset>=buf.size()) {
    throw ZxEndOfDataError(fmt::sprintf("patch at %d past end of buffer (%d)",offset,buf.size()));
  }
  buf[offset]=val&0xff;
}

void ZxBinaryPacker::patchWord(size_t offset, int val) {
  if (offset+2>buf.size()) {
    throw ZxEndOfDataError(fmt::sprintf("patch at %d past end of buffer (%d)",offset,buf.size()));
  }
  buf[offset]=val&0xff;
  buf[offset+1]=(val>>8)&0xff;
}

void ZxBinaryReader::need(size_t len) const {
  if (pos+len>buf.size()) {
    throw ZxEndOfDataError(fmt::sprintf("read of %d bytes at %d past end of data (%d)",len,pos,buf.size()));
  }
}

unsigned char ZxBinaryReader::readByte() {
  need(1);
  return buf[pos++];
}

signed char ZxBinaryReader::readSignedByte() {
  need(1);
  return (signed char)buf[pos++];
}

unsigned short ZxBinaryReader::readWord() {
  need(2);
  unsigned short ret=buf[pos]|(buf[pos+1]<<8);
  pos+=2;
  return ret;
}

std::vector<unsigned char> ZxBinaryReader::readBytes(size_t len) {
  need(len);
  std::vector<unsigned char> ret(buf.begin()+pos,buf.begin()+pos+len);
  pos+=len;
  return ret;
}

signed char floatToFixed8(double value, double scale) {
  double fixed=floor(value*scale+0.5);
  if (fixed<-128) fixed=-128;
  if (fixed>127) fixed=127;
  return (signed char)fixed;
}

unsigned char directionToByte(const String& dir) {
  String d=normalizeTag(dir);
  if (d=="left" || d=="up") return 0xff;
  if (d=="right" || d=="down") return 0x01;
  return 0;
}

int encodeEnum(const String& tag, const ZxEnumName* table, int fallback) {
  String t=normalizeTag(tag);
  for (const ZxEnumName* i=table; i->name!=NULL; i++) {
    if (t==i->name) return i->value;
  }
  return fallback;
}

String enumName(int value, const ZxEnumName* table) {
  for (const ZxEnumName* i=table; i->name!=NULL; i++) {
    if (i->value==value) return i->name;
  }
  return "";
}

const ZxEnumName zxBlockTypeNames[]={
  {"solid", ZX_BLOCK_SOLID},
  {"deadly", ZX_BLOCK_DEADLY},
  {"conveyor", ZX_BLOCK_CONVEYOR},
  {"conveyor_left", ZX_BLOCK_CONVEYOR},
  {"conveyor_right", ZX_BLOCK_CONVEYOR},
  {"crumbling", ZX_BLOCK_CRUMBLING},
  {"sinking", ZX_BLOCK_SINKING},
  {"ice", ZX_BLOCK_ICE},
  {"slippery", ZX_BLOCK_ICE},
  {"ladder", ZX_BLOCK_LADDER},
  {"empty", ZX_BLOCK_EMPTY},
  {"platform", ZX_BLOCK_PLATFORM},
  {"collectible", ZX_BLOCK_COLLECTIBLE},
  {"collectable", ZX_BLOCK_COLLECTIBLE},
  {NULL, 0}
};

const ZxEnumName zxObjectTypeNames[]={
  {"player", ZX_OBJECT_PLAYER},
  {"enemy", ZX_OBJECT_ENEMY},
  {"collectible", ZX_OBJECT_COLLECTIBLE},
  {"collectable", ZX_OBJECT_COLLECTIBLE},
  {"door", ZX_OBJECT_DOOR},
  {"exit", ZX_OBJECT_EXIT},
  {"moving_platform", ZX_OBJECT_MOVING_PLATFORM},
  {"ammunition", ZX_OBJECT_AMMUNITION},
  {NULL, 0}
};

int encodeBlockType(const String& tag) {
  return encodeEnum(tag,zxBlockTypeNames,ZX_BLOCK_SOLID);
}

int encodeObjectType(const String& tag) {
  return encodeEnum(tag,zxObjectTypeNames,ZX_OBJECT_COLLECTIBLE);
}
