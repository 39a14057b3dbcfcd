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

#ifndef _RUNTIME_EMITTER_H
#define _RUNTIME_EMITTER_H

#include <vector>
#include "z80Asm.h"
#include "keyboardMap.h"

// symbols the engine refers to. the orchestrator resolves them from its memory layout
#define ZX_SYM_SPRITE_BANK "sprite_bank"
#define ZX_SYM_BLOCK_BANK "block_bank"
#define ZX_SYM_OBJECT_BANK "object_bank"
#define ZX_SYM_SCREEN_BANK "screen_bank"
#define ZX_SYM_LEVEL_TABLE "level_table"
#define ZX_SYM_FLOW_TABLE "flow_table"
#define ZX_SYM_BACKGROUND "background"

// horizontal state
#define ZX_VEL_IDLE 0
#define ZX_VEL_LEFT 1
#define ZX_VEL_RIGHT 2

// border colors per branch when debugBorder is on
#define ZX_BORDER_IDLE 0
#define ZX_BORDER_LEFT 1
#define ZX_BORDER_RIGHT 2
#define ZX_BORDER_JUMP 4
#define ZX_BORDER_LANDED 6

struct ZxRuntimeParams {
  bool debugBorder;
  bool hasBackground;
  bool flowPrelude;
  ZxKeyBinding keyLeft, keyRight, keyJump;

  // screen bank index of the screen drawn at start, -1 for none
  int startScreen;
  // visible tile area and the row stride of the tile array
  int tileCols, tileRows, tileStride;
  int spriteCount;

  bool hasPlayer;
  int playerX, playerY;
  // bank-relative offset of the player's first frame
  int playerPixels;
  int playerWidthBytes, playerWidth, playerHeight;
  int playerSpeed;
  int gravity;
  // signed per-frame y offsets, ascent then descent
  std::vector<signed char> jumpTable;

  ZxRuntimeParams();
};

// emits the in-game engine into an assembler. addresses of banks and of the engine's
// own variables are left as fixups for ZxAsm::link
class ZxRuntimeEmitter {
  const ZxRuntimeParams& p;
  ZxAsm& a;

  void border(int color);
  // hl = bank + word at (bank + tableOffset + 2*a)
  void bankRecord(const char* bank, int tableOffset);

  void emitEntry();
  void emitMainLoop();
  void emitClearScreen();
  void emitBlitBackground();
  void emitWaitKey();
  void emitFlowPrelude();
  void emitRenderTiles();
  void emitDrawTile();
  void emitPixelAddr();
  void emitDrawPlayer();
  void emitInitPlayer();
  void emitPollInput();
  void emitUpdateH();
  void emitUpdateV();
  void emitTileUnderFeet();
  void emitVariables();

  public:
    void emit();

    // v(v+1) >= height, v capped at 8
    static std::vector<signed char> buildJumpTable(int height);

    ZxRuntimeEmitter(const ZxRuntimeParams& params, ZxAsm& assembler):
      p(params),
      a(assembler) {}
};

#endif
