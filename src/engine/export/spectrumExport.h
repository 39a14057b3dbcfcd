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

#ifndef _SPECTRUM_EXPORT_H
#define _SPECTRUM_EXPORT_H

#include <map>
#include "export.h"
#include "exportContext.h"
#include "runtimeEmitter.h"

// consecutive data placed after the engine. each piece becomes a link symbol
struct ZxMemoryLayout {
  ZxBinaryPacker data;
  // symbol, offset and size per piece, in placement order
  struct Piece {
    String symbol;
    size_t offset, size;
  };
  std::vector<Piece> pieces;

  void place(const char* symbol, const std::vector<unsigned char>& bytes);
  // symbol addresses once the data starts at base
  std::map<String,int> resolve(int base) const;
};

// game export. packs the project, emits the engine in front of the banks and
// frames everything as a bootable tape.
// outputs: <name>.tap, <name>.asm (export.generateAsm), <name>.bin (export.includeBinary)
class ZxExportSpectrum: public ZxExport {
  protected:
    const ZxProject* project;
    ZxConfig conf;
    int org;

    // screen chosen by a config key, or the first screen of the given type with pixels.
    // an empty id in the config means none
    const ZxScreen* pickScreen(const char* key, ZxScreenType type, bool useDefault);
    const ZxScreen* pickStartScreen();

    // player position, sprite and physics from the start screen's player or the first player object
    void setupPlayer(const ZxExportContext& ctx, const ZxScreen* start, const std::vector<unsigned char>& spriteBank, ZxRuntimeParams& params);

    // 6912-byte display file. fails on a cell with more than two colors
    // unless quantize.paperPolicy is set
    virtual std::vector<unsigned char> encodeScreen(const ZxScreen& screen);
    // tables placed after the banks
    virtual void addTables(const ZxExportContext& ctx, ZxMemoryLayout& layout, ZxRuntimeParams& params);
    virtual bool defaultBackground() const {
      return true;
    }
    virtual const char* exportName() const {
      return "game";
    }

    String fileBase() const;
    String listing(const ZxAsm& engine, const ZxMemoryLayout& layout) const;
    void checkAbort();
    void run();

  public:
    bool go(const ZxProject* proj, const ZxConfig& c) override;

    ZxExportSpectrum():
      project(NULL),
      org(32768) {}
    virtual ~ZxExportSpectrum() {}
};

#endif
