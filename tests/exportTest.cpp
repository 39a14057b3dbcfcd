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

#include "test.h"
#include "../src/engine/export/blockPacker.h"
#include "../src/engine/export/flowExport.h"
#include "../src/engine/export/objectPacker.h"
#include "../src/engine/export/screenCodec.h"
#include "../src/engine/export/screenPacker.h"
#include "../src/engine/export/spritePacker.h"
#include "../src/engine/export/tapWriter.h"

static ZxProject makeProject() {
  ZxProject p;
  p.name="Test Game";
  p.sprites.push_back(makeSprite("hero",7));
  p.sprites.push_back(makeSprite("brick",2));

  ZxBlock wall;
  wall.id="wall";
  wall.spriteId="brick";
  p.blocks.push_back(wall);
  ZxBlock belt;
  belt.id="belt";
  belt.type="conveyor";
  belt.spriteId="brick";
  belt.props.setNumber("speed",2.5).setString("direction","right");
  p.blocks.push_back(belt);

  ZxGameObject player;
  player.id="player";
  player.type="player";
  player.spriteId="hero";
  player.props.setNumber("speed",2).setNumber("jumpHeight",30);
  p.objects.push_back(player);

  ZxScreen loading=makeScreen("loading",ZX_SCREEN_LOADING);
  loading.hasTiles=false;
  fillCell(loading.pixels,0,0,6);
  loading.pixels.set(3,3,1);
  p.screens.push_back(loading);

  ZxScreen title=makeScreen("title",ZX_SCREEN_TITLE);
  title.hasTiles=false;
  fillCell(title.pixels,10,10,14);
  p.screens.push_back(title);

  ZxScreen room=makeScreen("room",ZX_SCREEN_GAME);
  for (int x=0; x<ZX_TILES_X; x++) {
    room.setTile(x,23,x<16?"wall":"belt");
  }
  ZxPlacedObject start;
  start.objectId="player";
  start.x=16;
  start.y=120;
  room.objects.push_back(start);
  p.screens.push_back(room);

  ZxLevel level;
  level.id="level1";
  level.screenIds.push_back("room");
  p.levels.push_back(level);
  return p;
}

static size_t bankTotal(const ZxProject& p) {
  ZxExportContext ctx(p);
  return packSpriteBank(ctx).size()+packBlockBank(ctx).size()+packObjectBank(ctx).size()+packScreenBank(ctx).size();
}

void testGameExport() {
  ZxProject p=makeProject();
  ZxConfig conf;

  ZxExportSpectrum e;
  expect(e.go(&p,conf),"game export succeeds");
  expect(!e.hasFailed() && !e.isRunning(),"export finished");
  expect(e.getProgress().amount==1.0f,"progress complete");
  expect(e.getOutput("test_game.tap")!=NULL,"tape output");
  expect(e.getOutput("test_game.bin")!=NULL,"binary output");
  expect(e.getOutput("test_game.asm")==NULL,"no listing by default");

  const ZxBinaryPacker* bin=e.getOutput("test_game.bin");
  expect(bin!=NULL && bin->size()==bankTotal(p),"binary is the packed banks");

  std::vector<ZxTapBlock> blocks=readTap(e.getOutput("test_game.tap")->getData());
  expect(blocks.size()==6,"loader, loading screen and image");
  bool hasScreen=false;
  for (unsigned char i: blocks[1].data) {
    if (i==ZX_TOKEN_SCREEN) hasScreen=true;
  }
  expect(hasScreen,"loader loads the screen");
  expect(String(blocks[0].data.begin()+1,blocks[0].data.begin()+11)=="Test Game ","tape name");
  expect(blocks[3].data.size()==ZX_SCR_SIZE,"loading screen block");
  ZxPixelGrid shown=ZxScreenCodec::decode(blocks[3].data);
  expect(shown.get(3,3)==1 && shown.get(0,0)==6,"loading screen content");
  expect(blocks[4].data[13]==0x00 && blocks[4].data[14]==0x80,"image loads at 32768");
  const std::vector<unsigned char>& image=blocks[5].data;
  expect(image[0]==0xaf,"image starts with the engine");
  // background is the last piece of the image
  std::vector<unsigned char> bg(image.end()-ZX_SCR_SIZE,image.end());
  expect(ZxScreenCodec::decode(bg).get(80,80)==14,"title screen is the background");
  expect(image.size()>bankTotal(p)+ZX_SCR_SIZE,"engine in front of the banks");

  conf.set("export.generateAsm",true);
  conf.set("export.includeBinary",false);
  conf.set("export.tapeName","ZXF");
  conf.set("export.backgroundScreen","");
  ZxExportSpectrum listed;
  expect(listed.go(&p,conf),"export with listing");
  const ZxBinaryPacker* asmOut=listed.getOutput("test_game.asm");
  expect(asmOut!=NULL,"listing output");
  expect(listed.getOutput("test_game.bin")==NULL,"binary disabled");
  if (asmOut!=NULL) {
    String text(asmOut->getData().begin(),asmOut->getData().end());
    expect(text.find("org 32768")!=String::npos,"listing origin");
    expect(text.find("sprite_bank:")!=String::npos,"listing has the banks");
    expect(text.find("render_tiles:")!=String::npos,"listing has the engine");
    expect(text.find("background:")==String::npos,"no background when disabled");
  }
  blocks=readTap(listed.getOutput("test_game.tap")->getData());
  expect(String(blocks[0].data.begin()+1,blocks[0].data.begin()+11)=="ZXF       ","configured tape name");

  // a third color in one cell of the loading screen stops the export
  ZxProject bad=makeProject();
  bad.screens[0].pixels.set(4,4,2);
  ZxExportSpectrum strict;
  expect(!strict.go(&bad,ZxConfig()),"three colors in a cell fail");
  expect(strict.hasFailed(),"failure reported");
  expect(strict.getError().find("loading")!=String::npos,"error names the screen");
  expect(strict.getOutputs().empty(),"no outputs from a failed export");

  ZxConfig quantized;
  quantized.set("quantize.paperPolicy","bigger");
  ZxExportSpectrum lenient;
  expect(lenient.go(&bad,quantized),"quantizer resolves the cell");

  ZxProject noPixels=makeProject();
  noPixels.screens[0].hasPixels=false;
  ZxConfig pick;
  pick.set("export.loadingScreen","loading");
  ZxExportSpectrum missing;
  expect(!missing.go(&noPixels,pick),"loading screen without pixels fails");

  ZxConfig low;
  low.set("export.org",1000);
  ZxExportSpectrum lowOrg;
  expect(!lowOrg.go(&p,low),"load address inside the system area");

  ZxConfig high;
  high.set("export.org",65000);
  ZxExportSpectrum tooLarge;
  expect(!tooLarge.go(&p,high),"image past the top of memory");
  expect(tooLarge.getError().find("only")!=String::npos,"size error");

  // a second run on the same exporter starts over
  expect(strict.go(&p,ZxConfig()),"exporter is reusable");
  expect(strict.getOutputs().size()==2,"outputs of the second run");

  ZxProject empty;
  ZxExportSpectrum nothing;
  expect(nothing.go(&empty,ZxConfig()),"empty project exports the bare engine");
  expect(nothing.getOutput("game.tap")!=NULL,"fallback file name");
}

void testFlowExport() {
  expect(flowAccessKey("S")=='s',"letters are lowercase");
  expect(flowAccessKey("space")==' ',"space key");
  expect(flowAccessKey("Enter")==13,"enter key");
  expect(flowAccessKey("")==0,"no key");
  expect(flowAccessKey("ab")==0,"not a single key");

  ZxProject p=makeProject();
  // three colors in a cell of the title screen
  p.screens[1].pixels.set(80,81,11);
  p.screens[1].pixels.set(81,81,0);

  ZxGameFlowEntry menu;
  menu.id="menu";
  menu.screenId="title";
  menu.order=2;
  menu.accessKey="S";
  menu.menuText="S - START";
  ZxGameFlowEntry boot;
  boot.id="boot";
  boot.screenId="loading";
  boot.order=1;
  boot.autoShow=true;
  boot.menuText="ignored";
  ZxGameFlowEntry lost;
  lost.id="lost";
  lost.screenId="nowhere";
  lost.order=0;
  p.flow.push_back(menu);
  p.flow.push_back(boot);
  p.flow.push_back(lost);

  std::vector<unsigned char> table=packFlowTable(p);
  size_t entry=3+ZX_SCR_SIZE;
  expect(table[0]==2,"only entries with a screen are counted");
  expect(table[1]==ZX_FLOW_KIND_LOADING && table[2]==1 && table[3]==0,"loading entry first");
  expect(table[4+ZX_SCR_SIZE]==0,"menu text only on title screens");
  size_t second=1+entry+1;
  expect(table[second]==ZX_FLOW_KIND_MENU && table[second+1]==0 && table[second+2]=='s',"menu entry");
  expect(table[second+3+ZX_SCR_SIZE]==9,"menu text length");
  expect(String(table.begin()+second+4+ZX_SCR_SIZE,table.end())=="S - START","menu text");
  expect(table.size()==second+4+ZX_SCR_SIZE+9,"flow table size");

  std::vector<unsigned char> shot(table.begin()+second+3,table.begin()+second+3+ZX_SCR_SIZE);
  ZxPixelGrid shown=ZxScreenCodec::decode(shot);
  expect(shown.get(80,80)==14 && shown.get(80,81)==11,"first colors kept");
  expect(shown.get(81,81)==11,"extra color approximated to paper");

  ZxExportFlow e;
  expect(e.go(&p,ZxConfig()),"flow export approximates instead of failing");
  const ZxBinaryPacker* tap=e.getOutput("test_game.tap");
  expect(tap!=NULL,"flow tape");
  if (tap!=NULL) {
    std::vector<ZxTapBlock> blocks=readTap(tap->getData());
    expect(blocks.size()==6,"flow tape blocks");
    const std::vector<unsigned char>& image=blocks[5].data;
    expect(image.size()>table.size()+bankTotal(p),"flow table inside the image");
    // the flow table is the last piece, no background in a flow export
    expect(std::vector<unsigned char>(image.end()-table.size(),image.end())==table,"flow table ends the image");
  }

  ZxConfig asmConf;
  asmConf.set("export.generateAsm",true);
  ZxExportFlow listed;
  expect(listed.go(&p,asmConf),"flow export with listing");
  const ZxBinaryPacker* asmOut=listed.getOutput("test_game.asm");
  if (asmOut!=NULL) {
    String text(asmOut->getData().begin(),asmOut->getData().end());
    expect(text.find("flow_show:")!=String::npos,"prelude in the engine");
    expect(text.find("level_table:")!=String::npos,"level table placed");
  } else {
    expect(false,"flow listing output");
  }

  ZxProject noFlow=makeProject();
  ZxExportFlow plain;
  expect(plain.go(&noFlow,asmConf),"flow export without flow entries");
  asmOut=plain.getOutput("test_game.asm");
  if (asmOut!=NULL) {
    String text(asmOut->getData().begin(),asmOut->getData().end());
    expect(text.find("flow_show:")==String::npos,"no prelude without entries");
  }
}
