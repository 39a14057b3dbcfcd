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

#include "spectrumExport.h"
#include "bank.h"
#include "blockPacker.h"
#include "colorQuantizer.h"
#include "objectPacker.h"
#include "screenCodec.h"
#include "screenPacker.h"
#include "spritePacker.h"
#include "tapWriter.h"
#include "../errors.h"
#include "../../zx-log.h"
#include <math.h>

#define ZX_DISPLAY_FILE 16384
#define ZX_MIN_ORG 24576
#define ZX_LOADER_LINE 10

void ZxMemoryLayout::place(const char* symbol, const std::vector<unsigned char>& bytes) {
  Piece p;
  p.symbol=symbol;
  p.offset=data.size();
  p.size=bytes.size();
  pieces.push_back(p);
  data.writeBytes(bytes);
}

std::map<String,int> ZxMemoryLayout::resolve(int base) const {
  std::map<String,int> ret;
  for (const Piece& i: pieces) {
    ret[i.symbol]=base+(int)i.offset;
  }
  return ret;
}

const ZxScreen* ZxExportSpectrum::pickScreen(const char* key, ZxScreenType type, bool useDefault) {
  if (conf.has(key)) {
    String id=conf.getString(key,"");
    if (id.empty()) return NULL;
    const ZxScreen* s=project->findScreen(id);
    if (s==NULL) {
      logW("%s: no screen %s",key,id);
    }
    return s;
  }
  if (!useDefault) return NULL;
  for (const ZxScreen& i: project->screens) {
    if (i.type==type && i.hasPixels) return &i;
  }
  return NULL;
}

const ZxScreen* ZxExportSpectrum::pickStartScreen() {
  if (conf.has("export.startScreen")) {
    String id=conf.getString("export.startScreen","");
    if (id.empty()) return NULL;
    const ZxScreen* s=project->findScreen(id);
    if (s==NULL) {
      logW("export.startScreen: no screen %s",id);
    } else if (!s->hasTiles) {
      logW("start screen %s has no tiles",s->name);
      return NULL;
    }
    return s;
  }
  for (const ZxScreen& i: project->screens) {
    if (i.type==ZX_SCREEN_GAME && i.hasTiles) return &i;
  }
  return NULL;
}

static int physicsValue(const ZxPropertyBag& props, const ZxPropertyBag* overrides, const char* key, int fallback, int lo, int hi) {
  double v=fallback;
  if (props.hasNumber(key)) v=props.getNumber(key);
  if (overrides!=NULL && overrides->hasNumber(key)) v=overrides->getNumber(key);
  return CLAMP((int)floor(v+0.5),lo,hi);
}

void ZxExportSpectrum::setupPlayer(const ZxExportContext& ctx, const ZxScreen* start, const std::vector<unsigned char>& spriteBank, ZxRuntimeParams& params) {
  const ZxGameObject* player=NULL;
  const ZxPlacedObject* placed=NULL;
  if (start!=NULL) {
    for (const ZxPlacedObject& i: start->objects) {
      const ZxGameObject* obj=project->findObject(i.objectId);
      if (obj!=NULL && encodeObjectType(obj->type)==ZX_OBJECT_PLAYER) {
        player=obj;
        placed=&i;
        break;
      }
    }
  }
  if (player==NULL) {
    for (const ZxGameObject& i: project->objects) {
      if (encodeObjectType(i.type)==ZX_OBJECT_PLAYER) {
        player=&i;
        break;
      }
    }
  }
  if (player==NULL) {
    logI("no player object, the engine will only draw the screen");
    params.hasPlayer=false;
    return;
  }
  if (!ctx.hasSprite(player->spriteId)) {
    logW("player %s has no sprite",player->name);
    params.hasPlayer=false;
    return;
  }

  std::vector<ZxSpriteBankEntry> sprites=readSpriteBank(spriteBank);
  const ZxSpriteBankEntry& s=sprites[ctx.spriteIndex(player->spriteId)];
  params.hasPlayer=true;
  params.playerPixels=(int)s.pixelOffset;
  params.playerWidth=s.width;
  params.playerWidthBytes=(s.width+7)>>3;
  params.playerHeight=s.height;
  if (placed!=NULL) {
    params.playerX=CLAMP(placed->x,0,ZX_SCREEN_WIDTH-1);
    params.playerY=CLAMP(placed->y,0,ZX_SCREEN_HEIGHT-1);
  }

  const ZxPropertyBag* overrides=(placed!=NULL)?&placed->overrides:NULL;
  params.playerSpeed=physicsValue(player->props,overrides,"speed",1,1,8);
  params.gravity=physicsValue(player->props,overrides,"gravity",2,1,8);
  int jumpHeight=physicsValue(player->props,overrides,"jumpHeight",20,1,ZX_SCREEN_HEIGHT);
  params.jumpTable=ZxRuntimeEmitter::buildJumpTable(jumpHeight);
  logD("player %s at %d,%d: speed %d, gravity %d, jump %d",player->name,params.playerX,params.playerY,params.playerSpeed,params.gravity,jumpHeight);
}

std::vector<unsigned char> ZxExportSpectrum::encodeScreen(const ZxScreen& screen) {
  if (!screen.hasPixels) {
    String msg=fmt::sprintf("screen %s has no pixel data",screen.name);
    logE("%s",msg);
    throw ZxColorConstraintError(msg,-1,-1);
  }
  if (conf.has("quantize.paperPolicy")) {
    ZxColorQuantizer q(ZxColorQuantizer::optionsFromConfig(conf));
    ZxPixelGrid reduced=ZxColorQuantizer::reduce(screen.pixels);
    return ZxScreenCodec::encodeWithColors(reduced,q.assignInkPaper(reduced));
  }
  try {
    return ZxScreenCodec::encode(screen.pixels);
  } catch (ZxColorConstraintError& e) {
    String msg=fmt::sprintf("screen %s: %s",screen.name,e.what());
    throw ZxColorConstraintError(msg,e.cellX,e.cellY);
  }
}

void ZxExportSpectrum::addTables(const ZxExportContext& ctx, ZxMemoryLayout& layout, ZxRuntimeParams& params) {
}

String ZxExportSpectrum::fileBase() const {
  String ret=normalizeTag(project->name);
  if (ret.empty()) return "game";
  return ret;
}

String ZxExportSpectrum::listing(const ZxAsm& engine, const ZxMemoryLayout& layout) const {
  String ret=fmt::sprintf("; %s\n",project->name);
  ret+=fmt::sprintf("    org %d\n\n",org);
  ret+=engine.listing(org);

  const std::vector<unsigned char>& data=layout.data.getData();
  int base=org+(int)engine.size();
  for (const ZxMemoryLayout::Piece& i: layout.pieces) {
    ret+="\n"+i.symbol+":\n";
    for (size_t j=0; j<i.size; j+=16) {
      size_t end=MIN(j+16,i.size);
      String bytes;
      String text="defb ";
      for (size_t k=j; k<end; k++) {
        if (k-j<4) bytes+=fmt::sprintf("%.2X ",data[i.offset+k]);
        if (k>j) text+=",";
        text+=fmt::sprintf("%d",data[i.offset+k]);
      }
      if (end-j>4) bytes+="...";
      ret+=fmt::sprintf("%.4X  %-12s    %s\n",(base+(int)(i.offset+j))&0xffff,bytes,text);
    }
  }
  return ret;
}

void ZxExportSpectrum::checkAbort() {
  if (mustAbort) {
    throw ZxExportError("export aborted");
  }
}

void ZxExportSpectrum::run() {
  org=conf.getInt("export.org",32768);
  if (org<ZX_MIN_ORG || org>0xffff) {
    String msg=fmt::sprintf("load address %d is outside %d..65535",org,ZX_MIN_ORG);
    logE("%s",msg);
    throw ZxExportError(msg);
  }

  setProgress("packing banks",0.1f);
  ZxExportContext ctx(*project);
  std::vector<unsigned char> spriteBank=packSpriteBank(ctx);
  std::vector<unsigned char> blockBank=packBlockBank(ctx);
  std::vector<unsigned char> objectBank=packObjectBank(ctx);
  std::vector<unsigned char> screenBank=packScreenBank(ctx);
  checkAbort();

  ZxRuntimeParams params;
  params.debugBorder=conf.getBool("export.debugBorder",true);
  params.keyLeft=keyOrDefault(conf.getString("export.keyLeft","o"),"o");
  params.keyRight=keyOrDefault(conf.getString("export.keyRight","p"),"p");
  params.keyJump=keyOrDefault(conf.getString("export.keyJump","space"),"space");
  params.spriteCount=bankRecordCount(spriteBank);

  const ZxScreen* start=pickStartScreen();
  if (start!=NULL) {
    params.startScreen=ctx.screenIndex(start->id);
    params.tileCols=MIN(start->tileWidth,ZX_TILES_X);
    params.tileRows=MIN(start->tileHeight,ZX_TILES_Y);
    params.tileStride=start->tileWidth;
    logD("start screen: %s (%d)",start->name,params.startScreen);
  }
  setupPlayer(ctx,start,spriteBank,params);

  setProgress("encoding screens",0.3f);
  const ZxScreen* loading=pickScreen("export.loadingScreen",ZX_SCREEN_LOADING,true);
  const ZxScreen* background=pickScreen("export.backgroundScreen",ZX_SCREEN_TITLE,defaultBackground());
  std::vector<unsigned char> loadingScr, backgroundScr;
  if (loading!=NULL) {
    loadingScr=encodeScreen(*loading);
  }
  if (background!=NULL) {
    backgroundScr=encodeScreen(*background);
    params.hasBackground=true;
  }
  checkAbort();

  ZxMemoryLayout layout;
  layout.place(ZX_SYM_SPRITE_BANK,spriteBank);
  layout.place(ZX_SYM_BLOCK_BANK,blockBank);
  layout.place(ZX_SYM_OBJECT_BANK,objectBank);
  layout.place(ZX_SYM_SCREEN_BANK,screenBank);
  addTables(ctx,layout,params);
  if (params.hasBackground) {
    layout.place(ZX_SYM_BACKGROUND,backgroundScr);
  }

  setProgress("emitting engine",0.5f);
  ZxAsm engine;
  ZxRuntimeEmitter emitter(params,engine);
  emitter.emit();

  setProgress("linking",0.7f);
  int dataBase=org+(int)engine.size();
  engine.link(org,layout.resolve(dataBase));

  ZxBinaryPacker image;
  image.writeBytes(engine.getData());
  image.writeBytes(layout.data.getData());
  if (org+(int)image.size()>0x10000) {
    String msg=fmt::sprintf("image is %d bytes, only %d fit at %d",image.size(),0x10000-org,org);
    logE("%s",msg);
    throw ZxImageTooLargeError(msg);
  }
  checkAbort();

  setProgress("writing tape",0.9f);
  String tapeName=conf.getString("export.tapeName",project->name);
  if (tapeName.empty()) tapeName=fileBase();
  ZxTapWriter tap;
  tap.addProgram(tapeName,buildLoader(org,!loadingScr.empty()),ZX_LOADER_LINE);
  if (!loadingScr.empty()) {
    tap.addCode(tapeName,loadingScr,ZX_DISPLAY_FILE);
  }
  tap.addCode(tapeName,image.getData(),org);

  String base=fileBase();
  ZxBinaryPacker* tapOut=new ZxBinaryPacker;
  tapOut->writeBytes(tap.getData());
  output.push_back(ZxExportOutput(base+".tap",tapOut));

  if (conf.getBool("export.generateAsm",false)) {
    ZxBinaryPacker* asmOut=new ZxBinaryPacker;
    asmOut->writeText(listing(engine,layout));
    output.push_back(ZxExportOutput(base+".asm",asmOut));
  }
  if (conf.getBool("export.includeBinary",true)) {
    ZxBinaryPacker* binOut=new ZxBinaryPacker;
    binOut->writeBytes(spriteBank);
    binOut->writeBytes(blockBank);
    binOut->writeBytes(objectBank);
    binOut->writeBytes(screenBank);
    output.push_back(ZxExportOutput(base+".bin",binOut));
  }

  logI("%s export: %s",exportName(),project->name);
  logI("  engine: %d bytes",engine.size());
  for (const ZxMemoryLayout::Piece& i: layout.pieces) {
    logI("  %s: %d bytes",i.symbol,i.size);
  }
  logI("  image: %d bytes at %d, %d free",image.size(),org,0x10000-org-(int)image.size());
  if (ctx.getDanglingCount()>0) {
    logW("%d references fell back to index 0",ctx.getDanglingCount());
  }
  setProgress("done",1.0f);
}

bool ZxExportSpectrum::go(const ZxProject* proj, const ZxConfig& c) {
  for (ZxExportOutput& i: output) {
    delete i.data;
  }
  output.clear();
  project=proj;
  conf=c;
  failed=false;
  mustAbort=false;
  errorMessage="";
  if (project==NULL) {
    fail("no project");
    logE("%s export: no project",exportName());
    return false;
  }

  running=true;
  try {
    run();
  } catch (ZxExportError& e) {
    logE("%s export failed: %s",exportName(),e.what());
    for (ZxExportOutput& i: output) {
      delete i.data;
    }
    output.clear();
    fail(e.what());
  }
  running=false;
  return !failed;
}
