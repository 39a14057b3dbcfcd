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

#ifndef _COLOR_QUANTIZER_H
#define _COLOR_QUANTIZER_H

#include <vector>
#include "screenCodec.h"
#include "../config.h"

enum ZxPaperPolicy {
  ZX_PAPER_LIGHTER=0, // the lighter color is paper
  ZX_PAPER_DARKER,
  ZX_PAPER_BIGGER,    // the color covering more pixels is paper
  ZX_PAPER_SMALLER,
  ZX_PAPER_FIXED      // a chosen color is paper wherever it appears, lighter otherwise
};

enum ZxNeighborMode {
  ZX_NEIGHBOR_NONE=0,
  ZX_NEIGHBOR_LEFT,
  ZX_NEIGHBOR_UP,
  // left, then up
  ZX_NEIGHBOR_MATCH
};

struct ZxQuantizeOptions {
  ZxPaperPolicy policy;
  ZxNeighborMode neighbors;
  bool singleColorAsInk;
  int fixedPaper;
  ZxQuantizeOptions():
    policy(ZX_PAPER_BIGGER),
    neighbors(ZX_NEIGHBOR_NONE),
    singleColorAsInk(false),
    fixedPaper(0) {}
};

class ZxColorQuantizer {
  ZxQuantizeOptions opts;

  int choosePaper(int first, int second, int firstCount, int secondCount) const;

  public:
    // nearest palette entry by squared distance. ties go to the lower index
    static int nearestColor(int r, int g, int b);

    // packed RGB, 3 bytes per pixel
    static ZxPixelGrid mapImage(const unsigned char* rgb, int width, int height);

    // keeps the two most used colors of the cell (ties in order of appearance)
    // and moves every other pixel to the most used one
    static void reduceCell(ZxPixelGrid& grid, int cellX, int cellY);
    static ZxPixelGrid reduce(const ZxPixelGrid& grid);

    // ink/paper per cell. only the first two colors of a cell are considered,
    // so run reduce first
    std::vector<ZxCellColors> assignInkPaper(const ZxPixelGrid& grid) const;

    // ink white, paper black
    ZxPixelGrid stripped(const ZxPixelGrid& grid) const;

    const ZxQuantizeOptions& getOptions() const {
      return opts;
    }

    // quantize.paperPolicy, quantize.neighbors, quantize.singleColorAs, quantize.paperColor
    static ZxQuantizeOptions optionsFromConfig(const ZxConfig& conf);

    explicit ZxColorQuantizer(const ZxQuantizeOptions& o=ZxQuantizeOptions()):
      opts(o) {}
};

#endif
