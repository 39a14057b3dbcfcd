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

#ifndef _ERRORS_H
#define _ERRORS_H

#include <stdexcept>
#include "../zx-utils.h"

// base of everything an export can fail with
class ZxExportError: public std::runtime_error {
  public:
    explicit ZxExportError(const String& what):
      std::runtime_error(what) {}
};

// a screen cell with more than two colors, or a screen without pixel data
class ZxColorConstraintError: public ZxExportError {
  public:
    int cellX, cellY;
    ZxColorConstraintError(const String& what, int x, int y):
      ZxExportError(what),
      cellX(x),
      cellY(y) {}
};

// unknown symbol, double patch or out of range relative jump
class ZxLinkError: public ZxExportError {
  public:
    explicit ZxLinkError(const String& what):
      ZxExportError(what) {}
};

class ZxEndOfDataError: public ZxExportError {
  public:
    explicit ZxEndOfDataError(const String& what):
      ZxExportError(what) {}
};

class ZxImageTooLargeError: public ZxExportError {
  public:
    explicit ZxImageTooLargeError(const String& what):
      ZxExportError(what) {}
};

#endif
