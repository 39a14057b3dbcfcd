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

#ifndef _ZXFORGE_TEST_H
#define _ZXFORGE_TEST_H

#include "../src/engine/project.h"

extern int failures;
void expect(bool cond, const String& msg);

// a solid 8x8 sprite filled with one palette index
ZxSprite makeSprite(const char* id, unsigned char color);
// 32x24 tiles, black 256x192 pixels
ZxScreen makeScreen(const char* id, ZxScreenType type);
// paints one 8x8 cell
void fillCell(ZxPixelGrid& grid, int cellX, int cellY, unsigned char color);

void testBinaryPacker();
void testConfig();
void testLog();
void testSpriteBank();
void testBlockBank();
void testObjectBank();
void testScreenBank();
void testScreenCodec();
void testColorQuantizer();
void testAssembler();
void testRuntime();
void testKeyboard();
void testTap();
void testGameExport();
void testFlowExport();

#endif
