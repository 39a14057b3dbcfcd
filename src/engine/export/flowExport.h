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

#ifndef _FLOW_EXPORT_H
#define _FLOW_EXPORT_H

#include "spectrumExport.h"

#define ZX_FLOW_KIND_LOADING 1
#define ZX_FLOW_KIND_MENU 2

// key code compared against the ROM's LAST_K. 0 for "any key"
int flowAccessKey(const String& key);

// [count][per entry: kind, autoShow, access key, 6912-byte screen, menu length, menu text]
// entries in flow order. entries naming a missing screen are skipped
std::vector<unsigned char> packFlowTable(const ZxProject& project);

// game export with the flow screens shown in front of the game.
// screens never fail on color overflow, extra colors in a cell turn to paper
class ZxExportFlow: public ZxExportSpectrum {
  protected:
    std::vector<unsigned char> encodeScreen(const ZxScreen& screen) override;
    void addTables(const ZxExportContext& ctx, ZxMemoryLayout& layout, ZxRuntimeParams& params) override;
    bool defaultBackground() const override {
      return false;
    }
    const char* exportName() const override {
      return "flow";
    }

  public:
    ~ZxExportFlow() {}
};

#endif
