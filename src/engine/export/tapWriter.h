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

#ifndef _TAP_WRITER_H
#define _TAP_WRITER_H

#include <vector>
#include "../binaryPacker.h"

#define ZX_TAP_FLAG_HEADER 0x00
#define ZX_TAP_FLAG_DATA 0xff

#define ZX_TAP_TYPE_PROGRAM 0
#define ZX_TAP_TYPE_CODE 3

#define ZX_TAP_NAME_LEN 10

// BASIC tokens
#define ZX_TOKEN_SCREEN 0xaa
#define ZX_TOKEN_CODE 0xaf
#define ZX_TOKEN_USR 0xc0
#define ZX_TOKEN_LOAD 0xef
#define ZX_TOKEN_RANDOMIZE 0xf9
#define ZX_TOKEN_CLEAR 0xfd
#define ZX_BASIC_NUMBER 0x0e
#define ZX_BASIC_EOL 0x0d

// tokenized BASIC program, one line at a time:
//
//   ZxBasicProgram b;
//   b.beginLine(10);
//   b.token(ZX_TOKEN_CLEAR);
//   b.number(32767);
//   b.endLine();
class ZxBasicProgram {
  ZxBinaryPacker code;
  size_t lineStart;
  bool inLine;

  public:
    void beginLine(int num);
    // patches the line length
    void endLine();
    void token(int t);
    void text(const String& t);
    // ASCII digits then the hidden 5-byte integer form
    void number(int val);

    const std::vector<unsigned char>& getData() const {
      return code.getData();
    }
    size_t size() const {
      return code.size();
    }

    ZxBasicProgram():
      lineStart(0),
      inLine(false) {}
};

// CLEAR org-1 : LOAD "" SCREEN$ : LOAD "" CODE : RANDOMIZE USR org, as line 10
ZxBasicProgram buildLoader(int org, bool withScreen);

unsigned char tapChecksum(unsigned char flag, const std::vector<unsigned char>& data);

class ZxTapWriter {
  ZxBinaryPacker tap;
  int blocks;

  public:
    // [len][flag][data][checksum]. len counts flag and data
    void addBlock(unsigned char flag, const std::vector<unsigned char>& data);
    void addHeader(int type, const String& name, int length, int param1, int param2);
    // header and data for a program that autostarts at the given line
    void addProgram(const String& name, const ZxBasicProgram& prog, int autostart);
    void addCode(const String& name, const std::vector<unsigned char>& data, int address);

    int getBlockCount() const {
      return blocks;
    }
    const std::vector<unsigned char>& getData() const {
      return tap.getData();
    }

    ZxTapWriter():
      blocks(0) {}
};

struct ZxTapBlock {
  unsigned char flag;
  std::vector<unsigned char> data;
  unsigned char checksum;
  bool valid() const {
    return tapChecksum(flag,data)==checksum;
  }
};

// splits a tape image back into blocks. throws ZxEndOfDataError on a truncated image
std::vector<ZxTapBlock> readTap(const std::vector<unsigned char>& image);

#endif
