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

#include "flowExport.h"
#include "screenCodec.h"
#include "screenPacker.h"
#include "../errors.h"
#include "../../zx-log.h"
#include <algorithm>

int flowAccessKey(const String& key) {
  if (key.empty()) return 0;
  String k=normalizeTag(key);
  if (k=="space") return ' ';
  if (k=="enter") return 13;
  if (key.size()>1) {
    logW("access key %s is not a single character, using any key",key);
    return 0;
  }
  unsigned char c=key[0];
  if (c>='A' && c<='Z') c=c-'A'+'a';
  if (c<32 || c>127) {
    logW("access key %d is not printable, using any key",(int)c);
    return 0;
  }
  return c;
}

static bool flowOrderLess(const ZxGameFlowEntry* a, const ZxGameFlowEntry* b) {
  return a->order<b->order;
}

std::vector<unsigned char> packFlowTable(const ZxProject& project) {
  std::vector<const ZxGameFlowEntry*> sorted;
  for (const ZxGameFlowEntry& i: project.flow) {
    sorted.push_back(&i);
  }
  std::stable_sort(sorted.begin(),sorted.end(),flowOrderLess);

  ZxBinaryPacker table;
  table.writeByte(0);
  int count=0;
  for (const ZxGameFlowEntry* i: sorted) {
    const ZxScreen* screen=project.findScreen(i->screenId);
    if (screen==NULL) {
      logW("flow entry %s: no screen %s, skipping",i->id,i->screenId);
      continue;
    }
    if (count==255) {
      String msg="too many flow entries: more than 255";
      logE("%s",msg);
      throw ZxExportError(msg);
    }
    table.writeByte(screen->type==ZX_SCREEN_LOADING?ZX_FLOW_KIND_LOADING:ZX_FLOW_KIND_MENU);
    table.writeByte(i->autoShow?1:0);
    table.writeByte(flowAccessKey(i->accessKey));
    if (screen->hasPixels) {
      table.writeBytes(ZxScreenCodec::encodeApproximate(screen->pixels));
    } else {
      logW("flow screen %s has no pixels, showing a blank screen",screen->name);
      table.writeBytes(std::vector<unsigned char>(ZX_SCR_SIZE,0));
    }
    String menu;
    if (screen->type==ZX_SCREEN_TITLE) {
      menu=i->menuText.substr(0,ZX_MENU_TEXT_MAX);
    }
    table.writeByte((int)menu.size());
    table.writeText(menu);
    count++;
  }
  table.patchByte(0,count);
  logD("flow table: %d of %d entries",count,project.flow.size());
  return table.getData();
}

std::vector<unsigned char> ZxExportFlow::encodeScreen(const ZxScreen& screen) {
  if (!screen.hasPixels) {
    logW("screen %s has no pixels, using a blank screen",screen.name);
    return std::vector<unsigned char>(ZX_SCR_SIZE,0);
  }
  return ZxScreenCodec::encodeApproximate(screen.pixels);
}

void ZxExportFlow::addTables(const ZxExportContext& ctx, ZxMemoryLayout& layout, ZxRuntimeParams& params) {
  std::vector<unsigned char> flow=packFlowTable(*project);
  layout.place(ZX_SYM_LEVEL_TABLE,packLevelTable(ctx));
  layout.place(ZX_SYM_FLOW_TABLE,flow);
  params.flowPrelude=(flow[0]>0);
}
