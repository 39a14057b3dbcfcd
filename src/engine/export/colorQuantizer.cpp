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

#include "colorQuantizer.h"
#include "../errors.h"
#include "../palette.h"
#include "../../zx-log.h"
#include <fmt/printf.h>

#define CELLS_X (ZX_SCREEN_WIDTH/8)
#define CELLS_Y (ZX_SCREEN_HEIGHT/8)

int ZxColorQuantizer::nearestColor(int r, int g, int b) {
  int best=0;
  int bestDist=-1;
  for (int i=0; i<ZX_PALETTE_SIZE; i++) {
    int dr=r-zxPalette[i].r;
    int dg=g-zxPalette[i].g;
    int db=b-zxPalette[i].b;
    int dist=dr*dr+dg*dg+db*db;
    if (bestDist<0 || dist<bestDist) {
      best=i;
      bestDist=dist;
    }
  }
  return best;
}

ZxPixelGrid ZxColorQuantizer::mapImage(const unsigned char* rgb, int width, int height) {
  ZxPixelGrid ret(width,height,0);
  for (int y=0; y<height; y++) {
    for (int x=0; x<width; x++) {
      const unsigned char* p=&rgb[(y*width+x)*3];
      ret.set(x,y,nearestColor(p[0],p[1],p[2]));
    }
  }
  return ret;
}

void ZxColorQuantizer::reduceCell(ZxPixelGrid& grid, int cellX, int cellY) {
  std::vector<int> order=ZxScreenCodec::cellColors(grid,cellX,cellY);
  if (order.size()<=2) return;
  int counts[ZX_PALETTE_SIZE];
  memset(counts,0,sizeof(counts));
  for (int y=cellY*8; y<cellY*8+8; y++) {
    for (int x=cellX*8; x<cellX*8+8; x++) {
      counts[grid.get(x,y)&15]++;
    }
  }
  // stable: equal counts keep order of appearance
  int first=-1, second=-1;
  for (int c: order) {
    if (first<0 || counts[c]>counts[first]) {
      second=first;
      first=c;
    } else if (second<0 || counts[c]>counts[second]) {
      second=c;
    }
  }
  for (int y=cellY*8; y<cellY*8+8; y++) {
    for (int x=cellX*8; x<cellX*8+8; x++) {
      int c=grid.get(x,y)&15;
      if (c!=first && c!=second) grid.set(x,y,first);
    }
  }
}

ZxPixelGrid ZxColorQuantizer::reduce(const ZxPixelGrid& grid) {
  if (grid.width()%8!=0 || grid.height()%8!=0) {
    throw ZxColorConstraintError(fmt::sprintf("grid size %dx%d is not a multiple of 8",grid.width(),grid.height()),-1,-1);
  }
  ZxPixelGrid ret=grid;
  for (int cy=0; cy<grid.height()/8; cy++) {
    for (int cx=0; cx<grid.width()/8; cx++) {
      reduceCell(ret,cx,cy);
    }
  }
  return ret;
}

int ZxColorQuantizer::choosePaper(int first, int second, int firstCount, int secondCount) const {
  double lumFirst=paletteLuminance(first);
  double lumSecond=paletteLuminance(second);
  switch (opts.policy) {
    case ZX_PAPER_LIGHTER:
      return (lumSecond>lumFirst)?second:first;
    case ZX_PAPER_DARKER:
      return (lumSecond<lumFirst)?second:first;
    case ZX_PAPER_BIGGER:
      return (secondCount>firstCount)?second:first;
    case ZX_PAPER_SMALLER:
      return (secondCount<firstCount)?second:first;
    case ZX_PAPER_FIXED:
      if (first==opts.fixedPaper) return first;
      if (second==opts.fixedPaper) return second;
      return (lumSecond>lumFirst)?second:first;
  }
  return first;
}

std::vector<ZxCellColors> ZxColorQuantizer::assignInkPaper(const ZxPixelGrid& grid) const {
  if (grid.width()!=ZX_SCREEN_WIDTH || grid.height()!=ZX_SCREEN_HEIGHT) {
    throw ZxColorConstraintError(fmt::sprintf("screen pixel data is %dx%d, expected 256x192",grid.width(),grid.height()),-1,-1);
  }
  std::vector<ZxCellColors> ret(CELLS_X*CELLS_Y);
  for (int cy=0; cy<CELLS_Y; cy++) {
    for (int cx=0; cx<CELLS_X; cx++) {
      ZxCellColors& cell=ret[cy*CELLS_X+cx];
      std::vector<int> colors=ZxScreenCodec::cellColors(grid,cx,cy);
      if (colors.size()==1) {
        cell.ink=colors[0];
        cell.paper=colors[0];
        continue;
      }
      int first=colors[0];
      int second=colors[1];

      int paper=-1;
      if (opts.neighbors==ZX_NEIGHBOR_LEFT || opts.neighbors==ZX_NEIGHBOR_MATCH) {
        if (cx>0) {
          int n=ret[cy*CELLS_X+cx-1].paper;
          if (n==first || n==second) paper=n;
        }
      }
      if (paper<0 && (opts.neighbors==ZX_NEIGHBOR_UP || opts.neighbors==ZX_NEIGHBOR_MATCH)) {
        if (cy>0) {
          int n=ret[(cy-1)*CELLS_X+cx].paper;
          if (n==first || n==second) paper=n;
        }
      }
      if (paper<0) {
        int firstCount=0, secondCount=0;
        for (int y=cy*8; y<cy*8+8; y++) {
          for (int x=cx*8; x<cx*8+8; x++) {
            int c=grid.get(x,y)&15;
            if (c==first) firstCount++;
            if (c==second) secondCount++;
          }
        }
        paper=choosePaper(first,second,firstCount,secondCount);
      }
      cell.paper=paper;
      cell.ink=(paper==first)?second:first;
    }
  }
  return ret;
}

ZxPixelGrid ZxColorQuantizer::stripped(const ZxPixelGrid& grid) const {
  std::vector<ZxCellColors> colors=assignInkPaper(grid);
  ZxPixelGrid ret(grid.width(),grid.height(),0);
  for (int cy=0; cy<CELLS_Y; cy++) {
    for (int cx=0; cx<CELLS_X; cx++) {
      const ZxCellColors& cell=colors[cy*CELLS_X+cx];
      bool single=(cell.ink==cell.paper);
      for (int y=cy*8; y<cy*8+8; y++) {
        for (int x=cx*8; x<cx*8+8; x++) {
          bool ink;
          if (single) {
            ink=opts.singleColorAsInk;
          } else {
            ink=(grid.get(x,y)&15)!=cell.paper;
          }
          ret.set(x,y,ink?7:0);
        }
      }
    }
  }
  return ret;
}

ZxQuantizeOptions ZxColorQuantizer::optionsFromConfig(const ZxConfig& conf) {
  ZxQuantizeOptions ret;
  String policy=conf.getString("quantize.paperPolicy","bigger");
  if (policy=="lighter") {
    ret.policy=ZX_PAPER_LIGHTER;
  } else if (policy=="darker") {
    ret.policy=ZX_PAPER_DARKER;
  } else if (policy=="bigger") {
    ret.policy=ZX_PAPER_BIGGER;
  } else if (policy=="smaller") {
    ret.policy=ZX_PAPER_SMALLER;
  } else if (policy=="fixed") {
    ret.policy=ZX_PAPER_FIXED;
  } else {
    logW("unknown paper policy %s, using bigger",policy);
  }
  String neighbors=conf.getString("quantize.neighbors","no");
  if (neighbors=="left") {
    ret.neighbors=ZX_NEIGHBOR_LEFT;
  } else if (neighbors=="up") {
    ret.neighbors=ZX_NEIGHBOR_UP;
  } else if (neighbors=="match") {
    ret.neighbors=ZX_NEIGHBOR_MATCH;
  } else if (neighbors!="no") {
    logW("unknown neighbor mode %s, ignoring",neighbors);
  }
  ret.singleColorAsInk=(conf.getString("quantize.singleColorAs","paper")=="ink");
  ret.fixedPaper=CLAMP(conf.getInt("quantize.paperColor",0),0,ZX_PALETTE_SIZE-1);
  return ret;
}
