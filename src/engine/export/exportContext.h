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

#ifndef _EXPORT_CONTEXT_H
#define _EXPORT_CONTEXT_H

#include <map>
#include "../project.h"

// id to bank index maps for one export run
class ZxExportContext {
  const ZxProject& project;
  std::map<String,int> spriteMap;
  std::map<String,int> blockMap;
  std::map<String,int> objectMap;
  std::map<String,int> screenMap;
  std::map<String,int> levelMap;
  mutable int danglingCount;

  int lookup(const std::map<String,int>& m, const String& id, const char* what) const;

  public:
    // dangling ids resolve to 0 with a warning. empty ids resolve to 0 silently
    int spriteIndex(const String& id) const;
    int blockIndex(const String& id) const;
    int objectIndex(const String& id) const;
    int screenIndex(const String& id) const;
    int levelIndex(const String& id) const;

    bool hasSprite(const String& id) const {
      return spriteMap.find(id)!=spriteMap.cend();
    }
    bool hasBlock(const String& id) const {
      return blockMap.find(id)!=blockMap.cend();
    }

    const ZxProject& getProject() const {
      return project;
    }
    // references that fell back to index 0 so far
    int getDanglingCount() const {
      return danglingCount;
    }

    explicit ZxExportContext(const ZxProject& p);
};

#endif
