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

#ifndef _ZX_EXPORT_H
#define _ZX_EXPORT_H

#include <vector>
#include "../binaryPacker.h"
#include "../config.h"
#include "../project.h"

struct ZxExportOutput {
  String name;
  ZxBinaryPacker* data;

  ZxExportOutput(const String& n, ZxBinaryPacker* d):
    name(n),
    data(d) {}
  ZxExportOutput():
    data(NULL) {}
};

struct ZxExportProgress {
  String name;
  float amount;
  ZxExportProgress():
    amount(0.0f) {}
};

// base of the exporters. an export runs to completion inside go();
// outputs belong to the exporter and die with it
class ZxExport {
  protected:
    std::vector<ZxExportOutput> output;
    ZxExportProgress progress;
    String errorMessage;
    bool running, failed, mustAbort;

    void setProgress(const char* stage, float amount);
    // records the message of a failed run
    void fail(const String& msg);

  public:
    virtual bool go(const ZxProject* project, const ZxConfig& conf)=0;
    virtual bool isRunning();
    virtual bool hasFailed();
    virtual void abort();
    virtual void wait();
    virtual ZxExportProgress getProgress(int index=0);

    const String& getError() const {
      return errorMessage;
    }
    std::vector<ZxExportOutput>& getOutputs() {
      return output;
    }
    // NULL if there is no such output
    const ZxBinaryPacker* getOutput(const String& name) const;

    ZxExport(const ZxExport&)=delete;
    ZxExport& operator=(const ZxExport&)=delete;
    ZxExport():
      running(false),
      failed(false),
      mustAbort(false) {}
    virtual ~ZxExport();
};

#endif
