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

#include "test.h"
#include "../src/zx-log.h"
#include "../src/engine/binaryPacker.h"
#include "../src/engine/config.h"
#include "../src/engine/errors.h"

void testBinaryPacker() {
  ZxBinaryPacker p;
  p.writeByte(0x12);
  p.writeWord(0xbeef);
  p.writeSignedByte(-2);
  p.writeText("AB");
  expect(p.size()==6,"packer size after mixed writes");
  expect(p[0]==0x12,"byte write");
  expect(p[1]==0xef && p[2]==0xbe,"words are little-endian");
  expect(p[3]==0xfe,"signed byte is two's complement");
  expect(p[4]=='A' && p[5]=='B',"text is written raw");

  p.patchWord(1,0x1234);
  expect(p[1]==0x34 && p[2]==0x12,"patchWord overwrites in place");
  bool threw=false;
  try {
    p.patchWord(5,0);
  } catch (ZxEndOfDataError& e) {
    threw=true;
  }
  expect(threw,"patchWord past the end throws");

  ZxBinaryReader r(p.getData());
  expect(r.readByte()==0x12,"reader byte");
  expect(r.readWord()==0x1234,"reader word");
  expect(r.readSignedByte()==-2,"reader signed byte");
  expect(r.remaining()==2,"reader remaining");
  threw=false;
  try {
    r.readBytes(3);
  } catch (ZxEndOfDataError& e) {
    threw=true;
  }
  expect(threw,"reading past the end throws");

  expect(floatToFixed8(2.5)==10,"2.5 as fixed8 is 10");
  expect(floatToFixed8(-1.0)==-4,"-1 as fixed8 is -4");
  expect(floatToFixed8(0.125)==1,"fixed8 rounds half up");
  expect(floatToFixed8(100.0)==127,"fixed8 saturates high");
  expect(floatToFixed8(-100.0)==-128,"fixed8 saturates low");

  expect(directionToByte("left")==0xff,"left is 0xff");
  expect(directionToByte("Up")==0xff,"up is 0xff");
  expect(directionToByte("right")==1,"right is 1");
  expect(directionToByte("sideways")==0,"unknown direction is 0");

  expect(encodeBlockType("conveyor-left")==ZX_BLOCK_CONVEYOR,"conveyor-left maps to conveyor");
  expect(encodeBlockType("Slippery")==ZX_BLOCK_ICE,"slippery maps to ice");
  expect(encodeBlockType("lava pit")==ZX_BLOCK_SOLID,"unknown block type falls back to solid");
  expect(encodeObjectType("moving-platform")==ZX_OBJECT_MOVING_PLATFORM,"moving-platform tag");
  expect(encodeObjectType("collectable")==ZX_OBJECT_COLLECTIBLE,"collectable spelling");
  expect(encodeObjectType("???")==ZX_OBJECT_COLLECTIBLE,"unknown object type falls back to collectible");
  expect(enumName(ZX_BLOCK_LADDER,zxBlockTypeNames)=="ladder","enum name lookup");
}

void testConfig() {
  ZxConfig conf;
  bool ok=conf.loadFromMemory(
    "# export settings\n"
    "export.org = 40000\n"
    "export.debugBorder=false\n"
    "\n"
    "export.keyJump=q\n"
    "quantize.paperColor=0x7\n"
    "not a setting\n"
    "export.scale=1.5"
  );
  expect(!ok,"a line without '=' is reported");
  expect(conf.getInt("export.org",32768)==40000,"int value with spaces around '='");
  expect(conf.getBool("export.debugBorder",true)==false,"bool value");
  expect(conf.getString("export.keyJump","space")=="q","string value");
  expect(conf.getInt("quantize.paperColor",0)==7,"hex int value");
  expect(conf.getDouble("export.scale",0.0)==1.5,"last line without newline");
  expect(conf.getInt("export.missing",5)==5,"missing key gives the fallback");
  expect(!conf.has("not a setting"),"bad line is not stored");

  conf.set("export.generateAsm",true);
  conf.set("export.org",24576);
  expect(conf.getBool("export.generateAsm",false),"set bool");
  expect(conf.getInt("export.org",0)==24576,"set overwrites");
  conf.set("export.keyLeft","Z");
  expect(conf.getInt("export.keyLeft",3)==3,"non-numeric int gives the fallback");

  ZxConfig copy;
  copy.loadFromMemory(conf.toString().c_str());
  expect(copy.getInt("export.org",0)==24576,"toString output loads back");
  expect(copy.remove("export.org"),"remove existing key");
  expect(!copy.remove("export.org"),"remove missing key");
}

void testLog() {
  resetLogCounts();
  logW("warning %d",1);
  logE("error %s","two");
  logD("debug");
  expect(logCount(LOGLEVEL_WARN)==1,"warnings are counted");
  expect(logCount(LOGLEVEL_ERROR)==1,"errors are counted");
  expect(logCount(LOGLEVEL_DEBUG)==1,"entries below the log level are counted");
  int last=(logPosition+ZX_LOG_SIZE-1)&(ZX_LOG_SIZE-1);
  expect(logEntries[last].text=="debug","ring buffer holds the last entry");
  int prev=(logPosition+ZX_LOG_SIZE-2)&(ZX_LOG_SIZE-1);
  expect(logEntries[prev].text=="error two","printf-style formatting");
  resetLogCounts();
}
