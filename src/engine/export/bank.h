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

#ifndef _BANK_H
#define _BANK_H

#include <vector>
#include "../binaryPacker.h"

typedef std::vector<unsigned char> ZxRecord;

// [count][pointer table][records]. pointers are words relative to the start of the bank.
// throws ZxExportError on more than 255 records or a bank over 64K
std::vector<unsigned char> packRecordBank(const std::vector<ZxRecord>& records, const char* what);

// bank-relative offset of record i
size_t bankRecordOffset(const std::vector<unsigned char>& bank, int index);
int bankRecordCount(const std::vector<unsigned char>& bank);

#endif
