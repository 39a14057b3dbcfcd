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

#include "screenCodec.h"
#include "../errors.h"
#include "../palette.h"
#include "../../zx-log.h"
#include <fmt/printf.h>

#define CELLS_X (ZX_SCREEN_WIDTH/8)
#define CELLS_Y (ZX_SCREEN_HEIGHT/8)

static void checkSize(const ZxPixelGrid& grid) {
  if (grid.width()!=ZX_SCREEN_WIDTH || grid.height()!=ZX_SCREEN_HEIGHT) {
    String msg=fmt::sprintf("screen pixel data is %dx%d, expected 256x192",grid.width(),grid.height());
    logE("%s",msg);
    throw ZxColorConstraintError(msg,-1,-1);
  }
}

std::vector<int> ZxScreenCodec::cellColors(const ZxPixelGrid& grid, int cellX, int cellY) {
  std::vector<int> ret;
  for (int y=cellY*8; y<cellY*8+8; y++) {
    for (int x=cellX*8; x<cellX*8+8; x++) {
      int c=grid.get(x,y)&15;
      bool found=false;
      for (int i: ret) {
        if (i==c) {
          found=true;
          break;
        }
      }
      if (!found) ret.push_back(c);
    }
  }
  return ret;
}

std::vector<ZxCellViolation> ZxScreenCodec::findViolations(const ZxPixelGrid& grid) {
  checkSize(grid);
  std::vector<ZxCellViolation> ret;
  for (int cy=0; cy<CELLS_Y; cy++) {
    for (int cx=0; cx<CELLS_X; cx++) {
      std::vector<int> colors=cellColors(grid,cx,cy);
      if (colors.size()>2) {
        ZxCellViolation v;
        v.cellX=cx;
        v.cellY=cy;
        v.colors=(int)colors.size();
        ret.push_back(v);
      }
    }
  }
  return ret;
}

std::vector<unsigned char> ZxScreenCodec::encode(const ZxPixelGrid& grid) {
  checkSize(grid);
  std::vector<ZxCellColors> colors;
  colors.reserve(ZX_SCR_ATTR_SIZE);
  for (int cy=0; cy<CELLS_Y; cy++) {
    for (int cx=0; cx<CELLS_X; cx++) {
      std::vector<int> c=cellColors(grid,cx,cy);
      if (c.size()>2) {
        String msg=fmt::sprintf("cell (%d, %d) has %d colors, at most 2 are allowed",cx,cy,c.size());
        logE("%s",msg);
        throw ZxColorConstraintError(msg,cx,cy);
      }
      ZxCellColors cell;
      cell.ink=c[0];
      cell.paper=c.size()>1?c[1]:c[0];
      colors.push_back(cell);
    }
  }
  return encodeWithColors(grid,colors);
}

std::vector<unsigned char> ZxScreenCodec::encodeWithColors(const ZxPixelGrid& grid, const std::vector<ZxCellColors>& colors) {
  checkSize(grid);
  if (colors.size()!=ZX_SCR_ATTR_SIZE) {
    throw ZxExportError(fmt::sprintf("expected 768 cell colors, got %d",colors.size()));
  }
  std::vector<unsigned char> scr(ZX_SCR_SIZE,0);
  for (int cy=0; cy<CELLS_Y; cy++) {
    for (int cx=0; cx<CELLS_X; cx++) {
      const ZxCellColors& cell=colors[cy*CELLS_X+cx];
      bool bright=paletteBright(cell.ink) || paletteBright(cell.paper);
      scr[ZX_SCR_BITMAP_SIZE+cy*CELLS_X+cx]=scrAttribute(paletteInk(cell.ink),paletteInk(cell.paper),bright);
      for (int y=cy*8; y<cy*8+8; y++) {
        unsigned char b=0;
        for (int x=0; x<8; x++) {
          if ((grid.get(cx*8+x,y)&15)==cell.ink) b|=0x80>>x;
        }
        scr[scrBitmapOffset(cx*8,y)]=b;
      }
    }
  }
  return scr;
}

std::vector<unsigned char> ZxScreenCodec::encodeApproximate(const ZxPixelGrid& grid) {
  checkSize(grid);
  std::vector<ZxCellColors> colors;
  colors.reserve(ZX_SCR_ATTR_SIZE);
  int cells=0;
  for (int cy=0; cy<CELLS_Y; cy++) {
    for (int cx=0; cx<CELLS_X; cx++) {
      std::vector<int> c=cellColors(grid,cx,cy);
      if (c.size()>2) cells++;
      ZxCellColors cell;
      cell.ink=c[0];
      cell.paper=c.size()>1?c[1]:c[0];
      colors.push_back(cell);
    }
  }
  if (cells>0) logD("approximated %d cells with more than 2 colors",cells);
  return encodeWithColors(grid,colors);
}

ZxPixelGrid ZxScreenCodec::decode(const std::vector<unsigned char>& scr) {
  if (scr.size()<ZX_SCR_SIZE) {
    throw ZxEndOfDataError(fmt::sprintf("screen data is %d bytes, expected 6912",scr.size()));
  }
  ZxPixelGrid ret(ZX_SCREEN_WIDTH,ZX_SCREEN_HEIGHT,0);
  for (int cy=0; cy<CELLS_Y; cy++) {
    for (int cx=0; cx<CELLS_X; cx++) {
      unsigned char attr=scr[ZX_SCR_BITMAP_SIZE+cy*CELLS_X+cx];
      bool bright=(attr&0x40)!=0;
      int ink=paletteIndex(attr&7,bright);
      int paper=paletteIndex((attr>>3)&7,bright);
      for (int y=cy*8; y<cy*8+8; y++) {
        unsigned char b=scr[scrBitmapOffset(cx*8,y)];
        for (int x=0; x<8; x++) {
          ret.set(cx*8+x,y,(b&(0x80>>x))?ink:paper);
        }
      }
    }
  }
  return ret;
}
