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

#include "export.h"
#include "../../zx-log.h"

void ZxExport::setProgress(const char* stage, float amount) {
  progress.name=stage;
  progress.amount=amount;
  logV("export: %s (%.0f%%)",stage,amount*100.0f);
}

void ZxExport::fail(const String& msg) {
  errorMessage=msg;
  failed=true;
}

bool ZxExport::isRunning() {
  return running;
}

bool ZxExport::hasFailed() {
  return failed;
}

void ZxExport::abort() {
  mustAbort=true;
}

void ZxExport::wait() {
}

ZxExportProgress ZxExport::getProgress(int index) {
  if (index!=0) return ZxExportProgress();
  return progress;
}

const ZxBinaryPacker* ZxExport::getOutput(const String& name) const {
  for (const ZxExportOutput& i: output) {
    if (i.name==name) return i.data;
  }
  return NULL;
}

ZxExport::~ZxExport() {
  for (ZxExportOutput& i: output) {
    delete i.data;
  }
  output.clear();
}
