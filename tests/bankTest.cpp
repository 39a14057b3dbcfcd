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
#include "../src/engine/errors.h"
#include "../src/engine/export/bank.h"
#include "../src/engine/export/blockPacker.h"
#include "../src/engine/export/objectPacker.h"
#include "../src/engine/export/screenPacker.h"
#include "../src/engine/export/spritePacker.h"

void testSpriteBank() {
  // 12 pixels wide: two bytes per row, only the top 4 bits of the second byte used
  ZxPixelGrid frame(12,3,0);
  frame.set(0,0,5);
  frame.set(9,0,1);
  frame.set(11,2,14);
  std::vector<unsigned char> px=packSpritePixels(frame,12,3);
  expect(px.size()==6,"pixel bytes are height*ceil(width/8)");
  expect(px[0]==0x80,"leftmost pixel is bit 7");
  expect(px[1]==0x40,"pixel 9 is bit 6 of the second byte");
  expect(px[2]==0 && px[3]==0,"blank row");
  expect(px[5]==0x10,"pixel 11 is bit 4 of the second byte");

  ZxProject p;
  ZxSprite a=makeSprite("a",2);
  ZxSprite b;
  b.id="b";
  b.name="b";
  b.width=16;
  b.height=8;
  b.frames.push_back(ZxPixelGrid(16,8,10));
  b.frames.push_back(ZxPixelGrid(16,8,0));
  b.hasCollision=true;
  b.collision.top=1;
  b.collision.right=3;
  p.sprites.push_back(a);
  p.sprites.push_back(b);

  ZxExportContext ctx(p);
  std::vector<unsigned char> bank=packSpriteBank(ctx);
  expect(bank[0]==2,"sprite bank count");
  // three pointer tables follow the count
  expect(bank[1]+(bank[2]<<8)==1+3*2*2,"first metadata record follows the pointer tables");

  std::vector<ZxSpriteBankEntry> entries=readSpriteBank(bank);
  expect(entries.size()==2,"sprite bank entries");
  expect(entries[0].width==8 && entries[0].height==8,"sprite a size");
  expect(entries[0].attr==2,"red ink attribute");
  expect(entries[1].frameCount==2,"sprite b frame count");
  expect(entries[1].attr==(0x40|2),"bright red ink attribute");
  expect(entries[1].collision.top==1 && entries[1].collision.right==3,"collision insets");
  expect(entries[0].collision.top==0 && entries[0].collision.bottom==8,"missing collision box spans the height");
  expect(entries[0].collision.left==0 && entries[0].collision.right==8,"missing collision box spans the width");
  expect(bank[entries[0].pixelOffset]==0xff,"solid sprite pixels");
  // frame 1 of b is blank and follows frame 0
  expect(bank[entries[1].pixelOffset]==0xff,"sprite b frame 0");
  expect(bank[entries[1].pixelOffset+16]==0,"sprite b frame 1");
  expect(entries[1].pixelOffset==entries[0].pixelOffset+8,"pixel data is contiguous");

  ZxProject bad;
  ZxSprite huge=makeSprite("h",1);
  huge.width=0;
  bad.sprites.push_back(huge);
  ZxExportContext badCtx(bad);
  bool threw=false;
  try {
    packSpriteBank(badCtx);
  } catch (ZxExportError& e) {
    threw=true;
  }
  expect(threw,"zero-width sprite is rejected");
}

void testBlockBank() {
  ZxProject p;
  p.sprites.push_back(makeSprite("s0",1));
  p.sprites.push_back(makeSprite("s1",2));

  ZxBlock conveyor;
  conveyor.id="conv";
  conveyor.type="conveyor";
  conveyor.spriteId="s1";
  conveyor.props.setNumber("speed",2.5).setString("direction","right");

  ZxBlock crumbling;
  crumbling.id="crumb";
  crumbling.type="crumbling";
  crumbling.spriteId="s0";
  crumbling.props.setNumber("crumbleTime",0.5).setNumber("respawnTime",30);

  ZxBlock ladder;
  ladder.id="ladder";
  ladder.type="ladder";
  ladder.spriteId="missing";
  ladder.props.setBool("passThrough",true);

  ZxBlock left;
  left.id="left";
  left.type="conveyor-left";

  p.blocks.push_back(conveyor);
  p.blocks.push_back(crumbling);
  p.blocks.push_back(ladder);
  p.blocks.push_back(left);

  ZxExportContext ctx(p);
  std::vector<unsigned char> rec=packBlock(conveyor,ctx);
  expect(rec.size()==5,"conveyor record size");
  expect(rec[0]==1 && rec[1]==2 && rec[2]==3 && rec[3]==10 && rec[4]==1,"conveyor record bytes");

  rec=packBlock(crumbling,ctx);
  // 0.5s = 6 ticks, 30s = 360 ticks as a word
  expect(rec.size()==6,"crumbling record size");
  expect(rec[2]==0x0c && rec[3]==6 && rec[4]==(360&0xff) && rec[5]==(360>>8),"crumbling record bytes");

  int before=ctx.getDanglingCount();
  rec=packBlock(ladder,ctx);
  expect(rec[0]==0,"dangling sprite id becomes index 0");
  expect(ctx.getDanglingCount()==before+1,"dangling reference is counted");
  expect(rec[2]==0x80 && rec.size()==3,"pass-through is a flag with no payload");

  rec=packBlock(left,ctx);
  expect(rec[2]==0x02 && rec[3]==0xff,"conveyor-left implies the direction");

  std::vector<unsigned char> bank=packBlockBank(ctx);
  expect(bank[0]==4,"block bank starts with the count");
  std::vector<ZxBlockRecord> blocks=readBlockBank(bank);
  expect(blocks.size()==4,"block bank parses back");
  expect(blocks[0].type==ZX_BLOCK_CONVEYOR && blocks[0].flags==3,"conveyor type and flags");
  expect(blocks[0].props.getNumber("speed")==2.5,"conveyor speed decodes");
  expect(blocks[0].props.getString("direction")=="right","conveyor direction decodes");
  expect(blocks[1].type==ZX_BLOCK_CRUMBLING && blocks[1].flags==0x0c,"crumbling type and flags");
  expect(blocks[1].props.getNumber("respawnTime")==30,"respawn time decodes");
  expect(blocks[2].type==ZX_BLOCK_LADDER && blocks[2].props.getBool("passThrough"),"ladder flag decodes");
  expect(blocks[3].props.getString("direction")=="left","implied direction decodes");
}

void testObjectBank() {
  ZxProject p;
  p.sprites.push_back(makeSprite("idle",1));
  p.sprites.push_back(makeSprite("walk",2));
  ZxScreen room=makeScreen("room1",ZX_SCREEN_GAME);
  p.screens.push_back(makeScreen("room0",ZX_SCREEN_GAME));
  p.screens.push_back(room);
  ZxLevel level;
  level.id="l0";
  level.screenIds.push_back("room0");
  p.levels.push_back(level);

  ZxGameObject player;
  player.id="player";
  player.type="player";
  player.spriteId="idle";
  player.props.setNumber("speed",1.5).setNumber("jumpHeight",24).setNumber("gravity",0.75);
  player.hasAnimations=true;
  player.animations.sprite[ZX_ANIM_MOVE_RIGHT]="walk";
  player.animations.sprite[ZX_ANIM_IDLE]="idle";

  ZxGameObject coin;
  coin.id="coin";
  coin.type="collectable";
  coin.spriteId="walk";
  coin.props.setString("itemType","key").setNumber("points",500).setBool("requiredToExit",true);

  ZxGameObject door;
  door.id="door";
  door.type="door";
  door.props.setString("targetRoom","room1");

  ZxGameObject lift;
  lift.id="lift";
  lift.type="moving-platform";
  std::vector<double> stops;
  stops.push_back(2);
  stops.push_back(9);
  lift.props.setString("platformType","elevator").setNumber("pauseAtEnds",500).setList("elevatorStops",stops);

  ZxGameObject exit;
  exit.id="exit";
  exit.type="exit";
  exit.props.setString("targetLevel","l0");

  p.objects.push_back(player);
  p.objects.push_back(coin);
  p.objects.push_back(door);
  p.objects.push_back(lift);
  p.objects.push_back(exit);

  ZxExportContext ctx(p);
  std::vector<unsigned char> rec=packObject(player,ctx);
  // speed 6, jump 24, gravity 3, mask: move right + idle, sprites walk, idle
  unsigned char want[]={0,ZX_OBJECT_PLAYER,0x07,6,24,3,0x12,1,0};
  expect(rec.size()==sizeof(want),"player record size");
  expect(rec==std::vector<unsigned char>(want,want+sizeof(want)),"player record bytes");

  rec=packObject(coin,ctx);
  expect(rec[2]==(0x08|0x20|0x80),"collectible flags");
  expect(rec[3]==1 && rec[4]==(500&0xff) && rec[5]==(500>>8),"item type and points");
  expect(rec[6]==0,"no animations");

  rec=packObject(door,ctx);
  expect(rec[2]==0x01 && rec[3]==1,"door target is a screen index");

  std::vector<unsigned char> bank=packObjectBank(ctx);
  std::vector<ZxObjectRecord> objects=readObjectBank(bank);
  expect(objects.size()==5,"object bank parses back");
  expect(objects[0].animMask==0x12 && objects[0].animSprites.size()==2,"animation mask decodes");
  expect(objects[0].props.getNumber("gravity")==0.75,"gravity decodes");
  expect(objects[1].props.getString("itemType")=="key","item type decodes");
  expect(objects[1].props.getBool("requiredToExit"),"required-to-exit decodes");
  expect(objects[3].type==ZX_OBJECT_MOVING_PLATFORM,"moving platform type");
  // 500ms at 50Hz
  expect(objects[3].props.getNumber("pauseAtEnds")==25,"pause is in frames");
  std::vector<double> decoded=objects[3].props.getList("elevatorStops");
  expect(decoded.size()==2 && decoded[0]==2 && decoded[1]==9,"elevator stops decode");
  expect(objects[4].props.getNumber("targetLevel")==0,"exit target is a level index");
}

void testScreenBank() {
  ZxProject p;
  p.sprites.push_back(makeSprite("s",1));
  ZxBlock wall;
  wall.id="wall";
  wall.spriteId="s";
  p.blocks.push_back(wall);
  ZxGameObject enemy;
  enemy.id="enemy";
  enemy.type="enemy";
  enemy.props.setNumber("speed",1).setString("movementPattern","patrol");
  p.objects.push_back(enemy);

  ZxScreen room=makeScreen("room",ZX_SCREEN_GAME);
  room.setTile(0,0,"wall");
  room.setTile(31,23,"wall");
  room.setTile(1,0,"gone");
  ZxPlacedObject a;
  a.objectId="enemy";
  a.x=20;
  a.y=11;
  // same as the default, not written
  a.overrides.setNumber("speed",1).setString("movementPattern","chase");
  room.objects.push_back(a);
  ZxPlacedObject b;
  b.objectId="enemy";
  b.x=4;
  b.y=0;
  b.overrides.setNumber("speed",2).setNumber("points",300);
  room.objects.push_back(b);

  ZxScreen title=makeScreen("title",ZX_SCREEN_TITLE);
  title.hasTiles=false;

  p.screens.push_back(room);
  p.screens.push_back(title);
  ZxLevel level;
  level.id="l";
  level.screenIds.push_back("title");
  level.screenIds.push_back("room");
  p.levels.push_back(level);

  ZxExportContext ctx(p);
  std::vector<unsigned char> rec=packPlacedObject(a,ctx);
  // 20/8 = 2.5 rounds up, 11/8 rounds down
  expect(rec[1]==3 && rec[2]==1,"placed position in tiles");
  expect(rec[3]==0x04 && rec[4]==2 && rec.size()==5,"only changed overrides are written");

  std::vector<unsigned char> bank=packScreenBank(ctx);
  std::vector<ZxScreenRecord> screens=readScreenBank(bank);
  expect(screens.size()==2,"screen bank parses back");
  const ZxScreenRecord& r=screens[0];
  expect(r.type==0 && r.width==32 && r.height==24,"game screen header");
  expect(r.tiles[0]==0 && r.tiles[32*24-1]==0,"block tiles");
  expect(r.tiles[2]==ZX_TILE_EMPTY,"empty tile");
  expect(r.tiles[1]==0,"dangling block id becomes 0");
  expect(r.objects.size()==2,"placed objects");
  expect(r.objects[1].flags==0x11,"speed and points overrides");
  expect(r.objects[1].overrides.getNumber("points")==300,"points override decodes");
  expect(screens[1].type==1 && screens[1].width==0 && screens[1].height==0,"pixel screen has no tiles");

  std::vector<unsigned char> levels=packLevelTable(ctx);
  unsigned char want[]={1,2,1,0};
  expect(levels==std::vector<unsigned char>(want,want+4),"level table bytes");

  ZxScreen broken=makeScreen("broken",ZX_SCREEN_GAME);
  broken.tiles.pop_back();
  bool threw=false;
  try {
    packScreen(broken,ctx);
  } catch (ZxExportError& e) {
    threw=true;
  }
  expect(threw,"malformed tile grid is rejected");
}
