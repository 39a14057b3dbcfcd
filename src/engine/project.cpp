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

#include "project.h"

void ZxPixelGrid::fill(unsigned char val) {
  for (unsigned char& i: data) {
    i=val;
  }
}

bool ZxPropertyValue::operator==(const ZxPropertyValue& other) const {
  if (type!=other.type) return false;
  switch (type) {
    case ZX_PROP_NUMBER:
      return num==other.num;
    case ZX_PROP_STRING:
      return str==other.str;
    case ZX_PROP_BOOL:
      return flag==other.flag;
    case ZX_PROP_LIST:
      return list==other.list;
  }
  return false;
}

bool ZxPropertyBag::has(const String& key) const {
  return props.find(key)!=props.cend();
}

bool ZxPropertyBag::hasNumber(const String& key) const {
  const ZxPropertyValue* v=find(key);
  return v!=NULL && v->type==ZX_PROP_NUMBER;
}

bool ZxPropertyBag::hasString(const String& key) const {
  const ZxPropertyValue* v=find(key);
  return v!=NULL && v->type==ZX_PROP_STRING && !v->str.empty();
}

bool ZxPropertyBag::hasBool(const String& key) const {
  const ZxPropertyValue* v=find(key);
  return v!=NULL && v->type==ZX_PROP_BOOL;
}

bool ZxPropertyBag::hasList(const String& key) const {
  const ZxPropertyValue* v=find(key);
  return v!=NULL && v->type==ZX_PROP_LIST;
}

const ZxPropertyValue* ZxPropertyBag::find(const String& key) const {
  auto i=props.find(key);
  if (i==props.cend()) return NULL;
  return &i->second;
}

double ZxPropertyBag::getNumber(const String& key, double fallback) const {
  if (!hasNumber(key)) return fallback;
  return find(key)->num;
}

String ZxPropertyBag::getString(const String& key, const String& fallback) const {
  if (!hasString(key)) return fallback;
  return find(key)->str;
}

bool ZxPropertyBag::getBool(const String& key, bool fallback) const {
  if (!hasBool(key)) return fallback;
  return find(key)->flag;
}

std::vector<double> ZxPropertyBag::getList(const String& key) const {
  if (!hasList(key)) return std::vector<double>();
  return find(key)->list;
}

ZxPropertyBag& ZxPropertyBag::setNumber(const String& key, double val) {
  ZxPropertyValue& v=props[key];
  v=ZxPropertyValue();
  v.type=ZX_PROP_NUMBER;
  v.num=val;
  return *this;
}

ZxPropertyBag& ZxPropertyBag::setString(const String& key, const String& val) {
  ZxPropertyValue& v=props[key];
  v=ZxPropertyValue();
  v.type=ZX_PROP_STRING;
  v.str=val;
  return *this;
}

ZxPropertyBag& ZxPropertyBag::setBool(const String& key, bool val) {
  ZxPropertyValue& v=props[key];
  v=ZxPropertyValue();
  v.type=ZX_PROP_BOOL;
  v.flag=val;
  return *this;
}

ZxPropertyBag& ZxPropertyBag::setList(const String& key, const std::vector<double>& val) {
  ZxPropertyValue& v=props[key];
  v=ZxPropertyValue();
  v.type=ZX_PROP_LIST;
  v.list=val;
  return *this;
}

void ZxPropertyBag::remove(const String& key) {
  props.erase(key);
}

bool ZxAnimationSet::empty() const {
  for (int i=0; i<ZX_ANIM_MAX; i++) {
    if (!sprite[i].empty()) return false;
  }
  return true;
}

void ZxScreen::initTiles() {
  hasTiles=true;
  tileWidth=ZX_TILES_X;
  tileHeight=ZX_TILES_Y;
  tiles.assign(ZX_TILES_X*ZX_TILES_Y,"");
}

void ZxScreen::initPixels() {
  hasPixels=true;
  pixels=ZxPixelGrid(ZX_SCREEN_WIDTH,ZX_SCREEN_HEIGHT,0);
}

const ZxSprite* ZxProject::findSprite(const String& id) const {
  for (const ZxSprite& i: sprites) {
    if (i.id==id) return &i;
  }
  return NULL;
}

const ZxBlock* ZxProject::findBlock(const String& id) const {
  for (const ZxBlock& i: blocks) {
    if (i.id==id) return &i;
  }
  return NULL;
}

const ZxGameObject* ZxProject::findObject(const String& id) const {
  for (const ZxGameObject& i: objects) {
    if (i.id==id) return &i;
  }
  return NULL;
}

const ZxScreen* ZxProject::findScreen(const String& id) const {
  for (const ZxScreen& i: screens) {
    if (i.id==id) return &i;
  }
  return NULL;
}
