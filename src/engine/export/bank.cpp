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

#include "bank.h"
#include "../errors.h"
#include "../../zx-log.h"
#include <fmt/printf.h>

std::vector<unsigned char> packRecordBank(const std::vector<ZxRecord>& records, const char* what) {
  if (records.size()>255) {
    String msg=fmt::sprintf("too many %s for one bank: %d > 255",what,records.size());
    logE("%s",msg);
    throw ZxExportError(msg);
  }
  ZxBinaryPacker bank;
  bank.writeByte((int)records.size());
  size_t offset=1+records.size()*2;
  for (const ZxRecord& i: records) {
    bank.writeWord((int)offset);
    offset+=i.size();
  }
  if (offset>65535) {
    String msg=fmt::sprintf("%s bank is too large: %d bytes",what,offset);
    logE("%s",msg);
    throw ZxExportError(msg);
  }
  for (const ZxRecord& i: records) {
    bank.writeBytes(i);
  }
  logD("packed %d %s into %d bytes",records.size(),what,bank.size());
  return bank.getData();
}

int bankRecordCount(const std::vector<unsigned char>& bank) {
  ZxBinaryReader r(bank);
  return r.readByte();
}

size_t bankRecordOffset(const std::vector<unsigned char>& bank, int index) {
  ZxBinaryReader r(bank,1+index*2);
  return r.readWord();
}
