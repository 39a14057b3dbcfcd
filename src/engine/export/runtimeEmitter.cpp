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

#include "runtimeEmitter.h"
#include "screenPacker.h"
#include "screenCodec.h"
#include "spritePacker.h"
#include "../../zx-log.h"

// the ROM's last key pressed and the flag telling a new one arrived
#define SYSVAR_LAST_K 23560
#define SYSVAR_FLAGS 23611

// frames an auto-show flow screen stays up
#define FLOW_AUTO_FRAMES 150

ZxRuntimeParams::ZxRuntimeParams():
  debugBorder(true),
  hasBackground(false),
  flowPrelude(false),
  startScreen(-1),
  tileCols(0),
  tileRows(0),
  tileStride(0),
  spriteCount(0),
  hasPlayer(false),
  playerX(16),
  playerY(16),
  playerPixels(0),
  playerWidthBytes(1),
  playerWidth(8),
  playerHeight(8),
  playerSpeed(1),
  gravity(2) {
  keyLeft=*findKey("o");
  keyRight=*findKey("p");
  keyJump=*findKey("space");
  jumpTable=ZxRuntimeEmitter::buildJumpTable(20);
}

std::vector<signed char> ZxRuntimeEmitter::buildJumpTable(int height) {
  int v=1;
  while (v*(v+1)<height && v<8) v++;
  std::vector<signed char> ret;
  for (int i=v; i>0; i--) {
    ret.push_back(-i);
    ret.push_back(-i);
  }
  ret.push_back(0);
  for (int i=1; i<=v; i++) {
    ret.push_back(i);
    ret.push_back(i);
  }
  return ret;
}

void ZxRuntimeEmitter::border(int color) {
  if (!p.debugBorder) return;
  a.ins("ld a,n",color);
  a.ins("out (n),a",254);
}

void ZxRuntimeEmitter::bankRecord(const char* bank, int tableOffset) {
  a.ins("ld l,a");
  a.ins("ld h,n",0);
  a.ins("add hl,hl");
  a.insAddr("ld de,nn",bank,tableOffset);
  a.ins("add hl,de");
  a.ins("ld e,(hl)");
  a.ins("inc hl");
  a.ins("ld d,(hl)");
  a.insAddr("ld hl,nn",bank);
  a.ins("add hl,de");
}

void ZxRuntimeEmitter::emitEntry() {
  a.label("start");
  a.ins("xor a");
  a.ins("out (n),a",254);
  a.insAddr("call nn","clear_screen");
  if (p.flowPrelude) {
    a.insAddr("call nn","flow_show");
  }
  if (p.hasBackground) {
    a.insAddr("call nn","blit_background");
    a.insAddr("call nn","wait_key");
  }
  if (p.startScreen>=0) {
    a.insAddr("call nn","render_tiles");
  }
  a.insAddr("call nn","init_player");
  // first frame: the loop erases before it moves
  if (p.hasPlayer) a.insAddr("call nn","draw_player");
}

void ZxRuntimeEmitter::emitMainLoop() {
  a.label("main_loop");
  a.ins("halt");
  // erase at the old position
  if (p.hasPlayer) a.insAddr("call nn","draw_player");
  a.insAddr("call nn","poll_input");
  a.insAddr("call nn","update_h");
  a.insAddr("call nn","update_v");
  if (p.hasPlayer) a.insAddr("call nn","draw_player");
  a.insAddr("jp nn","main_loop");
}

void ZxRuntimeEmitter::emitClearScreen() {
  a.label("clear_screen");
  a.insWord("ld hl,nn",0x4000);
  a.insWord("ld de,nn",0x4001);
  a.insWord("ld bc,nn",ZX_SCR_BITMAP_SIZE-1);
  a.ins("ld (hl),n",0);
  a.ins("ldir");
  a.insWord("ld hl,nn",0x5800);
  a.insWord("ld de,nn",0x5801);
  a.insWord("ld bc,nn",ZX_SCR_ATTR_SIZE-1);
  // white ink, black paper
  a.ins("ld (hl),n",0x07);
  a.ins("ldir");
  a.ins("ret");
}

void ZxRuntimeEmitter::emitBlitBackground() {
  a.label("blit_background");
  a.insAddr("ld hl,nn",ZX_SYM_BACKGROUND);
  a.insWord("ld de,nn",0x4000);
  a.insWord("ld bc,nn",ZX_SCR_SIZE);
  a.ins("ldir");
  a.ins("ret");
}

void ZxRuntimeEmitter::emitWaitKey() {
  // all half-rows at once: release, then press
  a.label("wait_key");
  a.label("wk_release");
  a.ins("xor a");
  a.ins("in a,(n)",254);
  a.ins("cpl");
  a.ins("and n",0x1f);
  a.insRel("jr nz,e","wk_release");
  a.label("wk_press");
  a.ins("xor a");
  a.ins("in a,(n)",254);
  a.ins("cpl");
  a.ins("and n",0x1f);
  a.insRel("jr z,e","wk_press");
  a.ins("ret");
}

void ZxRuntimeEmitter::emitFlowPrelude() {
  // flow table: [count][kind, autoShow, key, 6912 screen bytes, menu length, menu text]...
  a.label("flow_show");
  a.insAddr("ld hl,nn",ZX_SYM_FLOW_TABLE);
  a.ins("ld b,(hl)");
  a.ins("inc hl");
  a.ins("ld a,b");
  a.ins("or a");
  a.ins("ret z");
  a.label("fs_loop");
  a.ins("push bc");
  a.ins("inc hl");
  a.ins("ld a,(hl)");
  a.insAddr("ld (nn),a","fs_auto");
  a.ins("inc hl");
  a.ins("ld a,(hl)");
  a.insAddr("ld (nn),a","fs_key");
  a.ins("inc hl");
  a.insWord("ld de,nn",0x4000);
  a.insWord("ld bc,nn",ZX_SCR_SIZE);
  a.ins("ldir");
  // skip the menu text
  a.ins("ld a,(hl)");
  a.ins("inc hl");
  a.ins("ld e,a");
  a.ins("ld d,n",0);
  a.ins("add hl,de");
  a.ins("push hl");
  a.insAddr("ld a,(nn)","fs_auto");
  a.ins("or a");
  a.insRel("jr z,e","fs_wait");
  a.ins("ld b,n",FLOW_AUTO_FRAMES);
  a.label("fs_pause");
  a.ins("halt");
  a.insRel("djnz e","fs_pause");
  a.insRel("jr e","fs_next");
  a.label("fs_wait");
  a.insAddr("ld a,(nn)","fs_key");
  a.ins("or a");
  a.insRel("jr nz,e","fs_want");
  a.insAddr("call nn","wait_key");
  a.insRel("jr e","fs_next");
  // wait for the access key through the ROM keyboard scan
  a.label("fs_want");
  a.insWord("ld hl,nn",SYSVAR_FLAGS);
  a.ins("res 5,(hl)");
  a.label("fs_scan");
  a.ins("halt");
  a.ins("bit 5,(hl)");
  a.insRel("jr z,e","fs_scan");
  a.ins("res 5,(hl)");
  a.insAddr("ld a,(nn)","fs_key");
  a.ins("ld b,a");
  a.insWord("ld a,(nn)",SYSVAR_LAST_K);
  a.ins("cp b");
  a.insRel("jr nz,e","fs_scan");
  a.label("fs_next");
  a.ins("pop hl");
  a.ins("pop bc");
  a.insRel("djnz e","fs_loop");
  a.ins("ret");
}

void ZxRuntimeEmitter::emitRenderTiles() {
  a.label("render_tiles");
  a.ins("ld a,n",p.startScreen);
  bankRecord(ZX_SYM_SCREEN_BANK,1);
  a.insWord("ld de,nn",ZX_SCREEN_HEADER_SIZE);
  a.ins("add hl,de");
  a.insAddr("ld (nn),hl","tile_map");
  a.ins("xor a");
  a.insAddr("ld (nn),a","cur_row");
  a.label("rt_row");
  a.ins("xor a");
  a.insAddr("ld (nn),a","cur_col");
  a.label("rt_col");
  a.ins("ld a,(hl)");
  a.ins("push hl");
  a.ins("cp n",ZX_TILE_EMPTY);
  a.insRel("jr z,e","rt_skip");
  a.insAddr("call nn","draw_tile");
  a.label("rt_skip");
  a.ins("pop hl");
  a.ins("inc hl");
  a.insAddr("ld a,(nn)","cur_col");
  a.ins("inc a");
  a.insAddr("ld (nn),a","cur_col");
  a.ins("cp n",p.tileCols);
  a.insRel("jr nz,e","rt_col");
  if (p.tileStride>p.tileCols) {
    a.insWord("ld de,nn",p.tileStride-p.tileCols);
    a.ins("add hl,de");
  }
  a.insAddr("ld a,(nn)","cur_row");
  a.ins("inc a");
  a.insAddr("ld (nn),a","cur_row");
  a.ins("cp n",p.tileRows);
  a.insRel("jr nz,e","rt_row");
  a.ins("ret");
}

void ZxRuntimeEmitter::emitDrawTile() {
  // a = block index. draws the top left 8x8 of the block's sprite at (cur_col, cur_row)
  a.label("draw_tile");
  bankRecord(ZX_SYM_BLOCK_BANK,1);
  a.ins("ld a,(hl)");
  a.insAddr("ld (nn),a","tile_sprite");

  // metadata: width decides the row stride, attribute colors the cell
  bankRecord(ZX_SYM_SPRITE_BANK,1);
  a.ins("inc hl");
  a.ins("ld a,(hl)");
  // (w+7)>>3 in 9 bits: the carry of the add comes back in through rra
  a.ins("add a,n",7);
  a.ins("rra");
  a.ins("rrca");
  a.ins("rrca");
  a.ins("and n",0x3f);
  a.insAddr("ld (nn),a","tile_stride");
  a.ins("inc hl");
  a.ins("inc hl");
  a.ins("inc hl");
  a.ins("inc hl");
  a.ins("ld a,(hl)");
  a.insAddr("ld (nn),a","tile_attr");

  a.insAddr("ld a,(nn)","tile_sprite");
  bankRecord(ZX_SYM_SPRITE_BANK,1+2*p.spriteCount);
  a.ins("ex de,hl");

  // 0x4000 | (row&0x18)<<8 | (row&7)<<5 | col
  a.insAddr("ld a,(nn)","cur_row");
  a.ins("ld b,a");
  a.ins("and n",0x18);
  a.ins("or n",0x40);
  a.ins("ld h,a");
  a.ins("ld a,b");
  a.ins("and n",0x07);
  a.ins("rrca");
  a.ins("rrca");
  a.ins("rrca");
  a.ins("ld l,a");
  a.insAddr("ld a,(nn)","cur_col");
  a.ins("or l");
  a.ins("ld l,a");

  a.ins("ld b,n",8);
  a.label("dt_row");
  a.ins("ld a,(de)");
  a.ins("ld (hl),a");
  a.ins("inc h");
  a.insAddr("ld a,(nn)","tile_stride");
  a.ins("add a,e");
  a.ins("ld e,a");
  a.insRel("jr nc,e","dt_nc");
  a.ins("inc d");
  a.label("dt_nc");
  a.insRel("djnz e","dt_row");

  // attribute at 0x5800 + row*32 + col
  a.insAddr("ld a,(nn)","cur_row");
  a.ins("ld l,a");
  a.ins("ld h,n",0);
  for (int i=0; i<5; i++) {
    a.ins("add hl,hl");
  }
  a.insAddr("ld a,(nn)","cur_col");
  a.ins("ld e,a");
  a.ins("ld d,n",0);
  a.ins("add hl,de");
  a.insWord("ld de,nn",0x5800);
  a.ins("add hl,de");
  a.insAddr("ld a,(nn)","tile_attr");
  a.ins("ld (hl),a");
  a.ins("ret");
}

void ZxRuntimeEmitter::emitPixelAddr() {
  // b = y, c = x. hl = screen address
  a.label("pixel_addr");
  a.ins("ld a,b");
  a.ins("and n",0x07);
  a.ins("or n",0x40);
  a.ins("ld h,a");
  a.ins("ld a,b");
  a.ins("rra");
  a.ins("rra");
  a.ins("rra");
  a.ins("and n",0x18);
  a.ins("or h");
  a.ins("ld h,a");
  a.ins("ld a,b");
  a.ins("rla");
  a.ins("rla");
  a.ins("and n",0xe0);
  a.ins("ld l,a");
  a.ins("ld a,c");
  a.ins("rra");
  a.ins("rra");
  a.ins("rra");
  a.ins("and n",0x1f);
  a.ins("or l");
  a.ins("ld l,a");
  a.ins("ret");
}

void ZxRuntimeEmitter::emitDrawPlayer() {
  // XOR, so a second call at the same position erases
  a.label("draw_player");
  a.insAddr("ld hl,nn",ZX_SYM_SPRITE_BANK,p.playerPixels);
  a.insAddr("ld (nn),hl","dp_src");
  a.insAddr("ld a,(nn)","player_y");
  a.insAddr("ld (nn),a","dp_y");
  a.ins("ld a,n",p.playerHeight);
  a.insAddr("ld (nn),a","dp_rows");

  a.label("dp_row");
  a.insAddr("ld a,(nn)","dp_y");
  a.ins("ld b,a");
  a.ins("cp n",ZX_SCREEN_HEIGHT);
  a.insRel("jr nc,e","dp_skip");
  a.insAddr("ld a,(nn)","player_x");
  a.ins("ld c,a");
  a.insAddr("call nn","pixel_addr");
  a.ins("ld a,n",p.playerWidthBytes);
  a.insAddr("ld (nn),a","dp_cols");
  a.insAddr("ld de,(nn)","dp_src");

  a.label("dp_col");
  a.ins("ld a,(de)");
  a.ins("push de");
  a.ins("ld d,a");
  a.ins("ld e,n",0);
  a.insAddr("ld a,(nn)","player_x");
  a.ins("and n",0x07);
  a.insRel("jr z,e","dp_aligned");
  a.ins("ld b,a");
  a.label("dp_shift");
  a.ins("srl d");
  a.ins("rr e");
  a.insRel("djnz e","dp_shift");
  a.label("dp_aligned");
  a.ins("ld a,(hl)");
  a.ins("xor d");
  a.ins("ld (hl),a");
  // next column, wrapping within the pixel row
  a.ins("ld a,l");
  a.ins("and n",0xe0);
  a.ins("ld b,a");
  a.ins("ld a,l");
  a.ins("inc a");
  a.ins("and n",0x1f);
  a.ins("or b");
  a.ins("ld l,a");
  a.ins("ld a,(hl)");
  a.ins("xor e");
  a.ins("ld (hl),a");
  a.ins("pop de");
  a.ins("inc de");
  a.insAddr("ld a,(nn)","dp_cols");
  a.ins("dec a");
  a.insAddr("ld (nn),a","dp_cols");
  a.insRel("jr nz,e","dp_col");
  a.insAddr("ld (nn),de","dp_src");
  a.insRel("jr e","dp_next");

  // row below the screen
  a.label("dp_skip");
  a.insAddr("ld hl,(nn)","dp_src");
  a.insWord("ld de,nn",p.playerWidthBytes);
  a.ins("add hl,de");
  a.insAddr("ld (nn),hl","dp_src");

  a.label("dp_next");
  a.insAddr("ld a,(nn)","dp_y");
  a.ins("inc a");
  a.insAddr("ld (nn),a","dp_y");
  a.insAddr("ld a,(nn)","dp_rows");
  a.ins("dec a");
  a.insAddr("ld (nn),a","dp_rows");
  a.insRel("jr nz,e","dp_row");
  a.ins("ret");
}

void ZxRuntimeEmitter::emitInitPlayer() {
  a.label("init_player");
  a.ins("ld a,n",p.playerX);
  a.insAddr("ld (nn),a","player_x");
  a.ins("ld a,n",p.playerY);
  a.insAddr("ld (nn),a","player_y");
  a.ins("xor a");
  a.insAddr("ld (nn),a","vel_state");
  a.insAddr("ld (nn),a","jumping");
  a.insAddr("ld (nn),a","jump_index");
  a.insAddr("ld (nn),a","grounded");
  a.insAddr("ld (nn),a","conveyor_push");
  a.insAddr("ld (nn),a","input");
  a.ins("ret");
}

void ZxRuntimeEmitter::emitPollInput() {
  // input bits: 0 left, 1 right, 2 jump
  const ZxKeyBinding* keys[3]={&p.keyLeft,&p.keyRight,&p.keyJump};
  a.label("poll_input");
  a.ins("ld e,n",0);
  for (int i=0; i<3; i++) {
    String skip=fmt::sprintf("pi_%d",i);
    a.insWord("ld bc,nn",keys[i]->port);
    a.ins("in a,(c)");
    a.ins("bit n,a",keys[i]->bit);
    a.insRel("jr nz,e",skip);
    a.ins("set n,e",i);
    a.label(skip);
  }
  a.ins("ld a,e");
  a.insAddr("ld (nn),a","input");
  a.ins("ret");
}

void ZxRuntimeEmitter::emitUpdateH() {
  a.label("update_h");
  a.insAddr("ld a,(nn)","input");
  a.ins("bit 0,a");
  a.insRel("jr z,e","uh_not_left");
  a.ins("ld a,n",ZX_VEL_LEFT);
  a.insAddr("ld (nn),a","vel_state");
  border(ZX_BORDER_LEFT);
  a.insAddr("ld a,(nn)","player_x");
  a.ins("sub n",p.playerSpeed);
  a.insAddr("ld (nn),a","player_x");
  a.insRel("jr e","uh_conveyor");

  a.label("uh_not_left");
  a.ins("bit 1,a");
  a.insRel("jr z,e","uh_idle");
  a.ins("ld a,n",ZX_VEL_RIGHT);
  a.insAddr("ld (nn),a","vel_state");
  border(ZX_BORDER_RIGHT);
  a.insAddr("ld a,(nn)","player_x");
  a.ins("add a,n",p.playerSpeed);
  a.insAddr("ld (nn),a","player_x");
  a.insRel("jr e","uh_conveyor");

  a.label("uh_idle");
  a.ins("xor a");
  a.insAddr("ld (nn),a","vel_state");
  border(ZX_BORDER_IDLE);

  // conveyors push while standing on them
  a.label("uh_conveyor");
  a.insAddr("ld a,(nn)","grounded");
  a.ins("or a");
  a.ins("ret z");
  a.insAddr("ld a,(nn)","conveyor_push");
  a.ins("ld b,a");
  a.insAddr("ld a,(nn)","player_x");
  a.ins("add a,b");
  a.insAddr("ld (nn),a","player_x");
  a.ins("ret");
}

void ZxRuntimeEmitter::emitUpdateV() {
  a.label("update_v");
  a.insAddr("ld a,(nn)","jumping");
  a.ins("or a");
  a.insRel("jr nz,e","uv_jump");
  a.insAddr("ld a,(nn)","grounded");
  a.ins("or a");
  a.insRel("jr z,e","uv_fall");
  a.insAddr("ld a,(nn)","input");
  a.ins("bit 2,a");
  a.insRel("jr z,e","uv_fall");
  a.ins("ld a,n",1);
  a.insAddr("ld (nn),a","jumping");
  a.ins("xor a");
  a.insAddr("ld (nn),a","jump_index");
  a.insAddr("ld (nn),a","grounded");
  border(ZX_BORDER_JUMP);

  a.label("uv_jump");
  a.insAddr("ld a,(nn)","jump_index");
  a.ins("cp n",(int)p.jumpTable.size());
  a.insRel("jr nc,e","uv_jump_end");
  a.ins("ld e,a");
  a.ins("ld d,n",0);
  a.insAddr("ld hl,nn","jump_table");
  a.ins("add hl,de");
  a.ins("inc a");
  a.insAddr("ld (nn),a","jump_index");
  a.ins("ld b,(hl)");
  a.insRel("jr e","uv_move");

  // table exhausted: constant gravity from here
  a.label("uv_jump_end");
  a.ins("xor a");
  a.insAddr("ld (nn),a","jumping");
  a.label("uv_fall");
  a.ins("ld b,n",p.gravity);

  // y wraps within the 192 visible lines
  a.label("uv_move");
  a.insAddr("ld a,(nn)","player_y");
  a.ins("add a,b");
  a.ins("cp n",ZX_SCREEN_HEIGHT);
  a.insRel("jr c,e","uv_store");
  a.ins("bit 7,b");
  a.insRel("jr z,e","uv_wrap_down");
  a.ins("add a,n",ZX_SCREEN_HEIGHT);
  a.insRel("jr e","uv_store");
  a.label("uv_wrap_down");
  a.ins("sub n",ZX_SCREEN_HEIGHT);
  a.label("uv_store");
  a.insAddr("ld (nn),a","player_y");

  // only land while falling or level
  a.ins("bit 7,b");
  a.ins("ret nz");
  a.insAddr("call nn","tile_under_feet");
  a.insRel("jr nc,e","uv_air");
  // stand on top of the tile
  a.insAddr("ld a,(nn)","player_y");
  a.ins("add a,n",p.playerHeight);
  a.ins("and n",0xf8);
  a.ins("sub n",p.playerHeight);
  a.insAddr("ld (nn),a","player_y");
  a.ins("ld a,n",1);
  a.insAddr("ld (nn),a","grounded");
  a.ins("xor a");
  a.insAddr("ld (nn),a","jumping");
  border(ZX_BORDER_LANDED);
  a.ins("ret");
  a.label("uv_air");
  a.ins("xor a");
  a.insAddr("ld (nn),a","grounded");
  a.insAddr("ld (nn),a","conveyor_push");
  a.ins("ret");
}

void ZxRuntimeEmitter::emitTileUnderFeet() {
  // carry set if the tile below the player is solid or a conveyor.
  // a conveyor also sets conveyor_push
  a.label("tile_under_feet");
  if (p.startScreen<0) {
    a.ins("or a");
    a.ins("ret");
    return;
  }
  a.insAddr("ld a,(nn)","player_y");
  a.ins("add a,n",p.playerHeight);
  a.insRel("jr c,e","tf_none");
  a.ins("cp n",ZX_SCREEN_HEIGHT);
  a.insRel("jr nc,e","tf_none");
  a.ins("rrca");
  a.ins("rrca");
  a.ins("rrca");
  a.ins("and n",0x1f);
  a.ins("cp n",p.tileRows);
  a.insRel("jr nc,e","tf_none");
  a.ins("ld b,a");
  a.insAddr("ld a,(nn)","player_x");
  a.ins("add a,n",p.playerWidth/2);
  a.ins("rrca");
  a.ins("rrca");
  a.ins("rrca");
  a.ins("and n",0x1f);
  a.ins("cp n",p.tileCols);
  a.insRel("jr nc,e","tf_none");
  a.ins("ld e,a");
  a.ins("ld d,n",0);
  a.insAddr("ld hl,(nn)","tile_map");
  a.ins("add hl,de");
  a.ins("ld a,b");
  a.ins("or a");
  a.insRel("jr z,e","tf_have");
  a.insWord("ld de,nn",p.tileStride);
  a.label("tf_rows");
  a.ins("add hl,de");
  a.insRel("djnz e","tf_rows");
  a.label("tf_have");
  a.ins("ld a,(hl)");
  a.ins("cp n",ZX_TILE_EMPTY);
  a.insRel("jr z,e","tf_none");
  bankRecord(ZX_SYM_BLOCK_BANK,1);
  a.ins("inc hl");
  a.ins("ld a,(hl)");
  a.ins("cp n",ZX_BLOCK_SOLID);
  a.insRel("jr z,e","tf_solid");
  a.ins("cp n",ZX_BLOCK_CONVEYOR);
  a.insRel("jr z,e","tf_conveyor");
  a.label("tf_none");
  a.ins("or a");
  a.ins("ret");
  a.label("tf_solid");
  a.ins("xor a");
  a.insAddr("ld (nn),a","conveyor_push");
  a.ins("scf");
  a.ins("ret");

  // flags, then speed (fixed8, quarter pixels) and direction
  a.label("tf_conveyor");
  a.ins("inc hl");
  a.ins("ld c,(hl)");
  a.ins("inc hl");
  a.ins("ld b,n",1);
  a.ins("bit 0,c");
  a.insRel("jr z,e","tf_direction");
  a.ins("ld a,(hl)");
  a.ins("inc hl");
  a.ins("sra a");
  a.ins("sra a");
  a.ins("ld b,a");
  a.label("tf_direction");
  a.ins("bit 1,c");
  a.insRel("jr z,e","tf_push");
  a.ins("ld a,(hl)");
  a.ins("cp n",0xff);
  a.insRel("jr nz,e","tf_push");
  a.ins("ld a,b");
  a.ins("neg");
  a.ins("ld b,a");
  a.label("tf_push");
  a.ins("ld a,b");
  a.insAddr("ld (nn),a","conveyor_push");
  a.ins("scf");
  a.ins("ret");
}

void ZxRuntimeEmitter::emitVariables() {
  a.defw("tile_map");
  a.defb("cur_row");
  a.defb("cur_col");
  a.defb("tile_sprite");
  a.defb("tile_stride");
  a.defb("tile_attr");
  a.defb("player_x");
  a.defb("player_y");
  a.defb("vel_state");
  a.defb("jumping");
  a.defb("jump_index");
  a.defb("grounded");
  a.defb("conveyor_push");
  a.defb("input");
  a.defw("dp_src");
  a.defb("dp_y");
  a.defb("dp_rows");
  a.defb("dp_cols");
  if (p.flowPrelude) {
    a.defb("fs_auto");
    a.defb("fs_key");
  }
  std::vector<unsigned char> table;
  for (signed char i: p.jumpTable) {
    table.push_back((unsigned char)i);
  }
  a.defbytes("jump_table",table);
}

void ZxRuntimeEmitter::emit() {
  emitEntry();
  emitMainLoop();
  emitClearScreen();
  if (p.hasBackground || p.flowPrelude) emitWaitKey();
  if (p.hasBackground) emitBlitBackground();
  if (p.flowPrelude) emitFlowPrelude();
  if (p.startScreen>=0) {
    emitRenderTiles();
    emitDrawTile();
  }
  if (p.hasPlayer) {
    emitPixelAddr();
    emitDrawPlayer();
  }
  emitInitPlayer();
  emitPollInput();
  emitUpdateH();
  emitUpdateV();
  emitTileUnderFeet();
  emitVariables();
  logD("engine: %d bytes, %d fixups",a.size(),a.getFixups().size());
}
