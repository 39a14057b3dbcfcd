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
#include "../src/engine/export/runtimeEmitter.h"

static bool containsBytes(const std::vector<unsigned char>& data, const unsigned char* seq, size_t len) {
  if (data.size()<len) return false;
  for (size_t i=0; i+len<=data.size(); i++) {
    bool match=true;
    for (size_t j=0; j<len; j++) {
      if (data[i+j]!=seq[j]) {
        match=false;
        break;
      }
    }
    if (match) return true;
  }
  return false;
}

static int countLines(const ZxAsm& a, const String& text) {
  int ret=0;
  for (const ZxAsmLine& i: a.getLines()) {
    if (i.text==text) ret++;
  }
  return ret;
}

// counts a line before and after a label
static void countAround(const ZxAsm& a, const String& label, const String& text, int& before, int& after) {
  before=0;
  after=0;
  bool past=false;
  for (const ZxAsmLine& i: a.getLines()) {
    if (i.isLabel && i.text==label+":") past=true;
    if (i.text==text) {
      if (past) {
        after++;
      } else {
        before++;
      }
    }
  }
}

static std::map<String,int> runtimeSymbols() {
  std::map<String,int> ret;
  ret[ZX_SYM_SPRITE_BANK]=0x9000;
  ret[ZX_SYM_BLOCK_BANK]=0x9100;
  ret[ZX_SYM_OBJECT_BANK]=0x9200;
  ret[ZX_SYM_SCREEN_BANK]=0x9300;
  ret[ZX_SYM_LEVEL_TABLE]=0x9800;
  ret[ZX_SYM_FLOW_TABLE]=0x9900;
  ret[ZX_SYM_BACKGROUND]=0xa000;
  return ret;
}

static ZxRuntimeParams fullParams() {
  ZxRuntimeParams p;
  p.hasBackground=true;
  p.flowPrelude=true;
  p.startScreen=0;
  p.tileCols=32;
  p.tileRows=24;
  p.tileStride=32;
  p.spriteCount=3;
  p.hasPlayer=true;
  p.playerX=40;
  p.playerY=100;
  p.playerPixels=25;
  p.playerWidth=16;
  p.playerWidthBytes=2;
  p.playerHeight=16;
  p.playerSpeed=2;
  return p;
}

void testAssembler() {
  ZxAsm a;
  a.ins("xor a");
  a.ins("LD A , n",7);
  a.ins("ld (hl),n",0x55);
  a.insWord("ld bc,nn",0x7ffe);
  a.label("loop");
  a.ins("in a,(c)");
  a.ins("bit n,a",3);
  a.insRel("jr nz,e","loop");
  a.insAddr("ld hl,nn","data",2);
  a.insAddr("call nn","ext");
  a.ins("ret");
  a.defb("data",9);

  unsigned char want[]={
    0xaf,
    0x3e,0x07,
    0x36,0x55,
    0x01,0xfe,0x7f,
    0xed,0x78,
    0xcb,0x5f,
    0x20,0x00,
    0x21,0x00,0x00,
    0xcd,0x00,0x00,
    0xc9,
    0x09
  };
  expect(a.size()==sizeof(want),"assembled size");
  expect(a.hasLabel("loop") && a.labelOffset("loop")==8,"label offset");
  expect(a.getFixups().size()==2,"two address fixups");

  std::map<String,int> syms;
  syms["ext"]=0x1234;
  a.link(0x8000,syms);
  // jr back over itself and the bit test
  want[13]=0xfa;
  // data label is local: org + 21 + addend
  want[15]=0x17;
  want[16]=0x80;
  want[18]=0x34;
  want[19]=0x12;
  expect(a.getData()==std::vector<unsigned char>(want,want+sizeof(want)),"linked bytes");
  expect(a.isLinked(),"linked flag");
  for (const ZxFixup& i: a.getFixups()) {
    expect(i.patched,"every fixup patched");
  }

  bool threw=false;
  try {
    a.link(0x8000,syms);
  } catch (ZxLinkError& e) {
    threw=true;
  }
  expect(threw,"second link is refused");

  ZxAsm b;
  b.insAddr("jp nn","nowhere");
  threw=false;
  try {
    b.link(0x8000,std::map<String,int>());
  } catch (ZxLinkError& e) {
    threw=true;
  }
  expect(threw,"unresolved symbol fails the link");

  ZxAsm c;
  c.label("far");
  for (int i=0; i<130; i++) {
    c.ins("nop");
  }
  c.insRel("djnz e","far");
  threw=false;
  try {
    c.link(0x8000,std::map<String,int>());
  } catch (ZxLinkError& e) {
    threw=true;
  }
  expect(threw,"relative jump out of range fails the link");

  ZxAsm d;
  threw=false;
  try {
    d.ins("ld ix,nn");
  } catch (ZxExportError& e) {
    threw=true;
  }
  expect(threw,"unknown instruction is rejected");
  threw=false;
  try {
    d.label("x");
    d.label("x");
  } catch (ZxLinkError& e) {
    threw=true;
  }
  expect(threw,"label defined twice");

  String listing=a.listing(0x8000);
  expect(listing.find("8000  AF")==0,"listing starts with the first instruction");
  expect(listing.find("call ext")!=String::npos,"listing names symbols");
  expect(listing.find("loop:")!=String::npos,"listing shows labels");
}

void testRuntime() {
  std::vector<signed char> jump=ZxRuntimeEmitter::buildJumpTable(20);
  int sum=0, rise=0;
  for (signed char i: jump) {
    sum+=i;
    if (i<0) rise-=i;
  }
  expect(jump.size()==17,"jump table length for height 20");
  expect(jump[0]==-4 && jump[8]==0 && jump[16]==4,"ascent, apex, descent");
  expect(rise>=20,"ascent reaches the jump height");
  expect(sum==0,"descent mirrors the ascent");
  expect(ZxRuntimeEmitter::buildJumpTable(1000).size()==33,"jump speed is capped");

  ZxRuntimeParams params=fullParams();
  ZxAsm first, second;
  ZxRuntimeEmitter(params,first).emit();
  ZxRuntimeEmitter(params,second).emit();
  std::map<String,int> syms=runtimeSymbols();
  first.link(0x8000,syms);
  second.link(0x8000,syms);
  expect(first.getData()==second.getData(),"identical inputs emit identical code");

  const std::vector<unsigned char>& code=first.getData();
  bool allPatched=true;
  for (const ZxFixup& i: first.getFixups()) {
    int v=code[i.offset]|(code[i.offset+1]<<8);
    if (!i.patched || v==0) allPatched=false;
  }
  expect(allPatched,"every fixup holds an address");
  expect(first.getFixups().size()>50,"engine refers to its variables by address");

  expect(first.labelOffset("start")==0,"entry point at the load address");
  expect(code[0]==0xaf && code[1]==0xd3 && code[2]==0xfe,"entry clears the border");
  const char* routines[]={
    "main_loop","clear_screen","blit_background","wait_key","flow_show","render_tiles",
    "draw_tile","pixel_addr","draw_player","init_player","poll_input","update_h","update_v",
    "tile_under_feet","jump_table",NULL
  };
  for (int i=0; routines[i]!=NULL; i++) {
    expect(first.hasLabel(routines[i]),String("engine has ")+routines[i]);
  }

  // ld bc,0xdffe / in a,(c) / bit 1,a: the o key
  unsigned char keyO[]={0x01,0xfe,0xdf,0xed,0x78,0xcb,0x4f};
  expect(containsBytes(code,keyO,sizeof(keyO)),"left key polled on its half-row");
  // background copy into the display file
  unsigned char blit[]={0x21,0x00,0xa0,0x11,0x00,0x40,0x01,0x00,0x1b,0xed,0xb0};
  expect(containsBytes(code,blit,sizeof(blit)),"background blit");
  // player frame address
  unsigned char player[]={0x21,0x19,0x90};
  expect(containsBytes(code,player,sizeof(player)),"player pixels inside the sprite bank");

  // tile row stride: add a,7 / rra / rrca / rrca / and 0x3f keeps the carry for wide sprites
  unsigned char stride[]={0xc6,0x07,0x1f,0x0f,0x0f,0xe6,0x3f};
  expect(containsBytes(code,stride,sizeof(stride)),"tile stride survives widths past 248");
  int strideOk=1;
  for (int w=1; w<256; w++) {
    // the same steps on an 8-bit register with carry
    int sum=w+7;
    int carry=(sum>>8)&1;
    int r=((sum&0xff)>>1)|(carry<<7);
    r=((r>>1)|(r<<7))&0xff;
    r=((r>>1)|(r<<7))&0xff;
    if ((r&0x3f)!=(w+7)/8) strideOk=0;
  }
  expect(strideOk,"stride sequence equals ceil(width/8)");

  size_t table=first.labelOffset("jump_table");
  expect(table+params.jumpTable.size()==code.size(),"jump table ends the engine");
  expect(code[table]==(unsigned char)-4,"jump table bytes are signed");

  int drawBefore, drawAfter;
  countAround(first,"main_loop","call draw_player",drawBefore,drawAfter);
  expect(drawBefore==1,"player drawn once before the first frame");
  expect(countLines(first,"call draw_player")==3,"loop erases and redraws the player");
  expect(first.labelOffset("start")<first.labelOffset("main_loop"),"entry runs into the loop");

  expect(countLines(first,"out (254),a")==6,"border color per branch");
  params.debugBorder=false;
  ZxAsm quiet;
  ZxRuntimeEmitter(params,quiet).emit();
  expect(countLines(quiet,"out (254),a")==1,"no debug border writes");

  ZxRuntimeParams bare;
  ZxAsm minimal;
  ZxRuntimeEmitter(bare,minimal).emit();
  expect(!minimal.hasLabel("render_tiles") && !minimal.hasLabel("draw_player"),"nothing to draw");
  expect(countLines(minimal,"call draw_player")==0,"no player calls without a player");
  expect(!minimal.hasLabel("flow_show") && !minimal.hasLabel("wait_key"),"no prelude");
  minimal.link(0x8000,std::map<String,int>());
  expect(minimal.isLinked(),"bare engine needs no banks");
}

void testKeyboard() {
  const ZxKeyBinding* k=findKey("O");
  expect(k!=NULL && k->port==0xdffe && k->bit==1,"o key");
  k=findKey("space");
  expect(k!=NULL && k->port==0x7ffe && k->bit==0,"space key");
  k=findKey("shift");
  expect(k!=NULL && k->port==0xfefe && k->bit==0,"caps shift shares the z half-row");
  k=findKey("enter");
  expect(k!=NULL && k->port==0xbffe && k->bit==0,"enter key");
  k=findKey("1");
  expect(k!=NULL && k->port==0xf7fe,"number row");
  expect(findKey("f13")==NULL,"unknown key");
  const ZxKeyBinding& fallback=keyOrDefault("f13","p");
  expect(fallback.port==0xdffe && fallback.bit==0,"unknown key falls back");
}
