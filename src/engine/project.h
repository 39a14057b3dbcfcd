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

#ifndef _PROJECT_H
#define _PROJECT_H

#include <map>
#include <vector>
#include "../zx-utils.h"

#define ZX_SCREEN_WIDTH 256
#define ZX_SCREEN_HEIGHT 192
#define ZX_TILES_X 32
#define ZX_TILES_Y 24

// palette indices (0-15), row-major
class ZxPixelGrid {
  int w, h;
  std::vector<unsigned char> data;

  public:
    int width() const {
      return w;
    }
    int height() const {
      return h;
    }
    bool empty() const {
      return data.empty();
    }
    unsigned char get(int x, int y) const {
      return data[y*w+x];
    }
    void set(int x, int y, unsigned char val) {
      data[y*w+x]=val;
    }
    void fill(unsigned char val);
    bool operator==(const ZxPixelGrid& other) const {
      return w==other.w && h==other.h && data==other.data;
    }
    bool operator!=(const ZxPixelGrid& other) const {
      return !(*this==other);
    }
    ZxPixelGrid():
      w(0),
      h(0) {}
    ZxPixelGrid(int width, int height, unsigned char val=0):
      w(width),
      h(height),
      data(width*height,val) {}
};

enum ZxPropertyType {
  ZX_PROP_NUMBER=0,
  ZX_PROP_STRING,
  ZX_PROP_BOOL,
  ZX_PROP_LIST
};

struct ZxPropertyValue {
  ZxPropertyType type;
  double num;
  String str;
  bool flag;
  std::vector<double> list;
  bool operator==(const ZxPropertyValue& other) const;
  bool operator!=(const ZxPropertyValue& other) const {
    return !(*this==other);
  }
  ZxPropertyValue():
    type(ZX_PROP_NUMBER),
    num(0),
    flag(false) {}
};

// optional, type-specific properties of blocks, objects and placed objects
class ZxPropertyBag {
  std::map<String,ZxPropertyValue> props;

  public:
    bool has(const String& key) const;
    // true only if present with that type
    bool hasNumber(const String& key) const;
    bool hasString(const String& key) const;
    bool hasBool(const String& key) const;
    bool hasList(const String& key) const;
    const ZxPropertyValue* find(const String& key) const;

    double getNumber(const String& key, double fallback=0) const;
    String getString(const String& key, const String& fallback="") const;
    bool getBool(const String& key, bool fallback=false) const;
    std::vector<double> getList(const String& key) const;

    ZxPropertyBag& setNumber(const String& key, double val);
    ZxPropertyBag& setString(const String& key, const String& val);
    ZxPropertyBag& setBool(const String& key, bool val);
    ZxPropertyBag& setList(const String& key, const std::vector<double>& val);
    void remove(const String& key);
    bool empty() const {
      return props.empty();
    }
};

// edge insets in pixels
struct ZxCollisionBox {
  int top, bottom, left, right;
  ZxCollisionBox():
    top(0),
    bottom(0),
    left(0),
    right(0) {}
};

struct ZxSprite {
  String id, name;
  int width, height;
  std::vector<ZxPixelGrid> frames;
  int animSpeed;
  bool hasCollision;
  ZxCollisionBox collision;
  ZxSprite():
    width(8),
    height(8),
    animSpeed(4),
    hasCollision(false) {}
};

struct ZxBlock {
  String id, name;
  String type;
  String spriteId;
  ZxPropertyBag props;
  ZxBlock():
    type("solid") {}
};

enum ZxAnimSlot {
  ZX_ANIM_MOVE_LEFT=0,
  ZX_ANIM_MOVE_RIGHT,
  ZX_ANIM_MOVE_UP,
  ZX_ANIM_MOVE_DOWN,
  ZX_ANIM_IDLE,
  ZX_ANIM_JUMP_LEFT,
  ZX_ANIM_JUMP_RIGHT,
  ZX_ANIM_FIRE,

  ZX_ANIM_MAX
};

// sprite ids per slot, "" for unset
struct ZxAnimationSet {
  String sprite[ZX_ANIM_MAX];
  bool empty() const;
};

struct ZxGameObject {
  String id, name;
  String type;
  String spriteId;
  bool hasAnimations;
  ZxAnimationSet animations;
  ZxPropertyBag props;
  ZxGameObject():
    type("collectable"),
    hasAnimations(false) {}
};

struct ZxPlacedObject {
  String id;
  String objectId;
  int x, y;
  ZxPropertyBag overrides;
  ZxPlacedObject():
    x(0),
    y(0) {}
};

enum ZxScreenType {
  ZX_SCREEN_GAME=0,
  ZX_SCREEN_TITLE,
  ZX_SCREEN_LOADING
};

struct ZxScreen {
  String id, name;
  ZxScreenType type;
  // block ids, row-major, "" for an empty cell
  bool hasTiles;
  int tileWidth, tileHeight;
  std::vector<String> tiles;
  bool hasPixels;
  ZxPixelGrid pixels;
  std::vector<ZxPlacedObject> objects;

  const String& tileAt(int x, int y) const {
    return tiles[y*tileWidth+x];
  }
  void setTile(int x, int y, const String& blockId) {
    tiles[y*tileWidth+x]=blockId;
  }
  // resets to an empty 32x24 tile grid
  void initTiles();
  // resets to a black 256x192 pixel grid
  void initPixels();

  ZxScreen():
    type(ZX_SCREEN_GAME),
    hasTiles(false),
    tileWidth(0),
    tileHeight(0),
    hasPixels(false) {}
};

struct ZxLevel {
  String id, name;
  std::vector<String> screenIds;
};

#define ZX_MENU_TEXT_MAX 64

struct ZxGameFlowEntry {
  String id;
  String screenId;
  int order;
  bool autoShow;
  String accessKey;
  String menuText;
  ZxGameFlowEntry():
    order(0),
    autoShow(false) {}
};

struct ZxProjectSettings {
  int lives;
  int startEnergy;
  bool showScore;
  bool showEnergy;
  ZxProjectSettings():
    lives(3),
    startEnergy(100),
    showScore(true),
    showEnergy(true) {}
};

struct ZxProject {
  String name;
  std::vector<ZxSprite> sprites;
  std::vector<ZxBlock> blocks;
  std::vector<ZxGameObject> objects;
  std::vector<ZxScreen> screens;
  std::vector<ZxLevel> levels;
  std::vector<ZxGameFlowEntry> flow;
  ZxProjectSettings settings;

  const ZxSprite* findSprite(const String& id) const;
  const ZxBlock* findBlock(const String& id) const;
  const ZxGameObject* findObject(const String& id) const;
  const ZxScreen* findScreen(const String& id) const;
};

#endif
