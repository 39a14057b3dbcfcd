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

#include "tapWriter.h"
#include "../errors.h"
#include "../../zx-log.h"


void ZxBasicProgram::beginLine(int num) {
  if (inLine) endLine();
  // line numbers are big-endian
  code.writeByte((num>>8)&0xff);
  code.writeByte(num&0xff);
  lineStart=code.size();
  code.writeWord(0);
  inLine=true;
}

void ZxBasicProgram::endLine() {
  if (!inLine) return;
  code.writeByte(ZX_BASIC_EOL);
  code.patchWord(lineStart,(int)(code.size()-lineStart-2));
  inLine=false;
}

void ZxBasicProgram::token(int t) {
  code.writeByte(t);
}

void ZxBasicProgram::text(const String& t) {
  code.writeText(t);
}

void ZxBasicProgram::number(int val) {
  code.writeText(fmt::sprintf("%d",val));
  code.writeByte(ZX_BASIC_NUMBER);
  code.writeByte(0);
  code.writeByte(val<0?0xff:0);
  code.writeWord(val&0xffff);
  code.writeByte(0);
}

ZxBasicProgram buildLoader(int org, bool withScreen) {
  ZxBasicProgram b;
  b.beginLine(10);
  b.token(ZX_TOKEN_CLEAR);
  b.number(org-1);
  if (withScreen) {
    b.text(":");
    b.token(ZX_TOKEN_LOAD);
    b.text("\"\"");
    b.token(ZX_TOKEN_SCREEN);
  }
  b.text(":");
  b.token(ZX_TOKEN_LOAD);
  b.text("\"\"");
  b.token(ZX_TOKEN_CODE);
  b.text(":");
  b.token(ZX_TOKEN_RANDOMIZE);
  b.token(ZX_TOKEN_USR);
  b.number(org);
  b.endLine();
  return b;
}

unsigned char tapChecksum(unsigned char flag, const std::vector<unsigned char>& data) {
  unsigned char ret=flag;
  for (unsigned char i: data) {
    ret^=i;
  }
  return ret;
}

void ZxTapWriter::addBlock(unsigned char flag, const std::vector<unsigned char>& data) {
  if (data.size()+1>0xffff) {
    String msg=fmt::sprintf("tape block too large (%d bytes)",data.size());
    logE("%s",msg);
    throw ZxImageTooLargeError(msg);
  }
  tap.writeWord((int)data.size()+1);
  tap.writeByte(flag);
  tap.writeBytes(data);
  tap.writeByte(tapChecksum(flag,data));
  blocks++;
}

void ZxTapWriter::addHeader(int type, const String& name, int length, int param1, int param2) {
  ZxBinaryPacker h;
  h.writeByte(type);
  h.writeText(padRight(name,ZX_TAP_NAME_LEN));
  h.writeWord(length);
  h.writeWord(param1);
  h.writeWord(param2);
  addBlock(ZX_TAP_FLAG_HEADER,h.getData());
}

void ZxTapWriter::addProgram(const String& name, const ZxBasicProgram& prog, int autostart) {
  addHeader(ZX_TAP_TYPE_PROGRAM,name,(int)prog.size(),autostart,(int)prog.size());
  addBlock(ZX_TAP_FLAG_DATA,prog.getData());
}

void ZxTapWriter::addCode(const String& name, const std::vector<unsigned char>& data, int address) {
  addHeader(ZX_TAP_TYPE_CODE,name,(int)data.size(),address,32768);
  addBlock(ZX_TAP_FLAG_DATA,data);
  logD("tape: %s, %d bytes at %d",name,data.size(),address);
}

std::vector<ZxTapBlock> readTap(const std::vector<unsigned char>& image) {
  std::vector<ZxTapBlock> ret;
  ZxBinaryReader r(image);
  while (r.remaining()>0) {
    int len=r.readWord();
    if (len<1) {
      throw ZxEndOfDataError(fmt::sprintf("tape block at %d is too short",r.position()-2));
    }
    ZxTapBlock b;
    b.flag=r.readByte();
    b.data=r.readBytes(len-1);
    b.checksum=r.readByte();
    ret.push_back(b);
  }
  return ret;
}
