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
#include "../src/engine/errors.h"
#include "../src/engine/export/tapWriter.h"

static void pushText(std::vector<unsigned char>& v, const char* text) {
  for (const char* i=text; *i; i++) {
    v.push_back(*i);
  }
}

static void pushNumber(std::vector<unsigned char>& v, const char* digits, int val) {
  pushText(v,digits);
  v.push_back(0x0e);
  v.push_back(0);
  v.push_back(0);
  v.push_back(val&0xff);
  v.push_back(val>>8);
  v.push_back(0);
}

void testTap() {
  ZxTapWriter tap;
  std::vector<unsigned char> payload;
  payload.push_back(1);
  payload.push_back(2);
  payload.push_back(4);
  tap.addBlock(ZX_TAP_FLAG_DATA,payload);
  const std::vector<unsigned char>& image=tap.getData();
  expect(image.size()==7,"block size");
  expect(image[0]==4 && image[1]==0,"length counts flag and payload");
  expect(image[2]==0xff,"data flag");
  expect((image[2]^image[3]^image[4]^image[5]^image[6])==0,"checksum cancels the block");

  tap.addHeader(ZX_TAP_TYPE_CODE,"game",6912,16384,32768);
  std::vector<ZxTapBlock> blocks=readTap(tap.getData());
  expect(blocks.size()==2 && tap.getBlockCount()==2,"two blocks");
  const ZxTapBlock& h=blocks[1];
  expect(h.flag==ZX_TAP_FLAG_HEADER && h.data.size()==17,"header block");
  expect(h.data[0]==3,"code header type");
  expect(String(h.data.begin()+1,h.data.begin()+11)=="game      ","name is space padded");
  expect(h.data[11]==0x00 && h.data[12]==0x1b,"declared length");
  expect(h.data[13]==0x00 && h.data[14]==0x40,"load address");
  expect(h.data[15]==0x00 && h.data[16]==0x80,"second parameter");
  expect(h.valid() && blocks[0].valid(),"checksums");

  ZxTapWriter named;
  named.addHeader(ZX_TAP_TYPE_PROGRAM,"a very long name",1,10,1);
  blocks=readTap(named.getData());
  expect(String(blocks[0].data.begin()+1,blocks[0].data.begin()+11)=="a very lon","long names are cut");

  std::vector<unsigned char> line;
  line.push_back(0xfd);
  pushNumber(line,"32767",32767);
  line.push_back(':');
  line.push_back(0xef);
  pushText(line,"\"\"");
  line.push_back(0xaa);
  line.push_back(':');
  line.push_back(0xef);
  pushText(line,"\"\"");
  line.push_back(0xaf);
  line.push_back(':');
  line.push_back(0xf9);
  line.push_back(0xc0);
  pushNumber(line,"32768",32768);
  line.push_back(0x0d);
  std::vector<unsigned char> want;
  want.push_back(0);
  want.push_back(10);
  want.push_back(line.size()&0xff);
  want.push_back(line.size()>>8);
  want.insert(want.end(),line.begin(),line.end());
  ZxBasicProgram loader=buildLoader(32768,true);
  expect(loader.getData()==want,"loader tokens");

  ZxBasicProgram noScreen=buildLoader(40000,false);
  const std::vector<unsigned char>& ns=noScreen.getData();
  bool hasScreen=false;
  for (unsigned char i: ns) {
    if (i==ZX_TOKEN_SCREEN) hasScreen=true;
  }
  expect(!hasScreen,"no SCREEN$ without a loading screen");
  expect((size_t)(ns[2]|(ns[3]<<8))==ns.size()-4,"line length is patched");
  expect(ns[4]==ZX_TOKEN_CLEAR && ns[5]=='3' && ns[9]=='9',"CLEAR 39999");

  ZxBasicProgram two;
  two.beginLine(1000);
  two.token(ZX_TOKEN_CLEAR);
  two.beginLine(1010);
  two.text("x");
  two.endLine();
  const std::vector<unsigned char>& t=two.getData();
  expect(t.size()==12,"two lines");
  expect(t[0]==0x03 && t[1]==0xe8,"line numbers are big-endian");
  expect(t[2]==2 && t[3]==0,"first line closed by the second");

  ZxTapWriter full;
  full.addProgram("game",loader,10);
  full.addCode("game",std::vector<unsigned char>(6912,0),16384);
  full.addCode("game",std::vector<unsigned char>(100,0x55),32768);
  blocks=readTap(full.getData());
  expect(blocks.size()==6,"loader, screen and code");
  bool valid=true;
  for (const ZxTapBlock& i: blocks) {
    if (!i.valid()) valid=false;
  }
  expect(valid,"every block checksum");
  expect(blocks[0].data[0]==ZX_TAP_TYPE_PROGRAM,"program header");
  expect(blocks[0].data[13]==10 && blocks[0].data[14]==0,"autostart line");
  expect(blocks[0].data[11]==(loader.size()&0xff),"program length");
  expect(blocks[1].data==loader.getData(),"program data");
  expect(blocks[4].data[13]==0x00 && blocks[4].data[14]==0x80,"code load address");

  std::vector<unsigned char> truncated=full.getData();
  truncated.resize(truncated.size()-3);
  bool threw=false;
  try {
    readTap(truncated);
  } catch (ZxEndOfDataError& e) {
    threw=true;
  }
  expect(threw,"truncated tape fails");

  // the length word never covers the checksum
  const std::vector<unsigned char>& framed=full.getData();
  size_t pos=0;
  bool lengths=true;
  for (const ZxTapBlock& i: blocks) {
    int len=framed[pos]|(framed[pos+1]<<8);
    if (len!=(int)i.data.size()+1) lengths=false;
    pos+=2+len+1;
  }
  expect(lengths && pos==framed.size(),"every length is flag plus payload");

  std::vector<unsigned char> empty;
  empty.push_back(0);
  empty.push_back(0);
  threw=false;
  try {
    readTap(empty);
  } catch (ZxEndOfDataError& e) {
    threw=true;
  }
  expect(threw,"zero length block fails");
}
