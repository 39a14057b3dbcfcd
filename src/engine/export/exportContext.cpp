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

#include "exportContext.h"
#include "../../zx-log.h"

ZxExportContext::ZxExportContext(const ZxProject& p):
  project(p),
  danglingCount(0) {
  for (size_t i=0; i<p.sprites.size(); i++) {
    spriteMap.emplace(p.sprites[i].id,(int)i);
  }
  for (size_t i=0; i<p.blocks.size(); i++) {
    blockMap.emplace(p.blocks[i].id,(int)i);
  }
  for (size_t i=0; i<p.objects.size(); i++) {
    objectMap.emplace(p.objects[i].id,(int)i);
  }
  for (size_t i=0; i<p.screens.size(); i++) {
    screenMap.emplace(p.screens[i].id,(int)i);
  }
  for (size_t i=0; i<p.levels.size(); i++) {
    levelMap.emplace(p.levels[i].id,(int)i);
  }
}

int ZxExportContext::lookup(const std::map<String,int>& m, const String& id, const char* what) const {
  if (id.empty()) return 0;
  auto i=m.find(id);
  if (i==m.cend()) {
    logW("dangling %s reference %s, using index 0",what,id);
    danglingCount++;
    return 0;
  }
  return i->second;
}

int ZxExportContext::spriteIndex(const String& id) const {
  return lookup(spriteMap,id,"sprite");
}

int ZxExportContext::blockIndex(const String& id) const {
  return lookup(blockMap,id,"block");
}

int ZxExportContext::objectIndex(const String& id) const {
  return lookup(objectMap,id,"object");
}

int ZxExportContext::screenIndex(const String& id) const {
  return lookup(screenMap,id,"screen");
}

int ZxExportContext::levelIndex(const String& id) const {
  return lookup(levelMap,id,"level");
}
