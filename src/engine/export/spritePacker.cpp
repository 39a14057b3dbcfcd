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

#include "spritePacker.h"
#include "../binaryPacker.h"
#include "../errors.h"
#include "../palette.h"
#include "../../zx-log.h"
#include <fmt/printf.h>

std::vector<unsigned char> packSpritePixels(const ZxPixelGrid& frame, int width, int height) {
  int rowBytes=(width+7)/8;
  std::vector<unsigned char> ret(rowBytes*height,0);
  for (int y=0; y<height; y++) {
    for (int x=0; x<width; x++) {
      if (x>=frame.width() || y>=frame.height()) continue;
      if (frame.get(x,y)!=0) {
        ret[y*rowBytes+(x>>3)]|=0x80>>(x&7);
      }
    }
  }
  return ret;
}

unsigned char spriteAttribute(const ZxSprite& sprite) {
  int counts[ZX_PALETTE_SIZE];
  memset(counts,0,sizeof(counts));
  for (const ZxPixelGrid& frame: sprite.frames) {
    for (int y=0; y<frame.height(); y++) {
      for (int x=0; x<frame.width(); x++) {
        counts[frame.get(x,y)&15]++;
      }
    }
  }
  int best=-1;
  for (int i=1; i<ZX_PALETTE_SIZE; i++) {
    if (counts[i]==0) continue;
    if (best<0 || counts[i]>counts[best]) best=i;
  }
  // white ink on black
  if (best<0) return 7;
  return (paletteBright(best)?0x40:0)|paletteInk(best);
}

static unsigned char insetByte(int v) {
  return CLAMP(v,0,255);
}

std::vector<unsigned char> packSpriteBank(const ZxExportContext& ctx) {
  const std::vector<ZxSprite>& sprites=ctx.getProject().sprites;
  size_t count=sprites.size();
  if (count>255) {
    String msg=fmt::sprintf("too many sprites for one bank: %d > 255",count);
    logE("%s",msg);
    throw ZxExportError(msg);
  }

  ZxBinaryPacker meta, pixels, collision;
  std::vector<size_t> metaOffsets, pixelOffsets, collisionOffsets;

  for (size_t i=0; i<count; i++) {
    const ZxSprite& s=sprites[i];
    if (s.width<1 || s.width>255 || s.height<1 || s.height>255) {
      String msg=fmt::sprintf("sprite %s has invalid size %dx%d",s.name,s.width,s.height);
      logE("%s",msg);
      throw ZxExportError(msg);
    }
    int frameCount=(int)s.frames.size();

    metaOffsets.push_back(meta.size());
    meta.writeByte((int)i);
    meta.writeByte(s.width);
    meta.writeByte(s.height);
    meta.writeByte(frameCount>0?frameCount:1);
    meta.writeByte(s.animSpeed);
    meta.writeByte(spriteAttribute(s));

    pixelOffsets.push_back(pixels.size());
    if (frameCount==0) {
      logW("sprite %s has no frames, packing a blank one",s.name);
      pixels.writeBytes(packSpritePixels(ZxPixelGrid(),s.width,s.height));
    }
    for (const ZxPixelGrid& frame: s.frames) {
      pixels.writeBytes(packSpritePixels(frame,s.width,s.height));
    }

    collisionOffsets.push_back(collision.size());
    if (s.hasCollision) {
      collision.writeByte(insetByte(s.collision.top));
      collision.writeByte(insetByte(s.collision.bottom));
      collision.writeByte(insetByte(s.collision.left));
      collision.writeByte(insetByte(s.collision.right));
    } else {
      // whole sprite
      collision.writeByte(0);
      collision.writeByte(s.height);
      collision.writeByte(0);
      collision.writeByte(s.width);
    }
  }

  size_t metaStart=1+count*6;
  size_t pixelStart=metaStart+meta.size();
  size_t collisionStart=pixelStart+pixels.size();
  if (collisionStart+collision.size()>65535) {
    String msg=fmt::sprintf("sprite bank is too large: %d bytes",collisionStart+collision.size());
    logE("%s",msg);
    throw ZxExportError(msg);
  }

  ZxBinaryPacker bank;
  bank.writeByte((int)count);
  for (size_t i: metaOffsets) bank.writeWord((int)(metaStart+i));
  for (size_t i: pixelOffsets) bank.writeWord((int)(pixelStart+i));
  for (size_t i: collisionOffsets) bank.writeWord((int)(collisionStart+i));
  bank.writeBytes(meta.getData());
  bank.writeBytes(pixels.getData());
  bank.writeBytes(collision.getData());
  logD("packed %d sprites into %d bytes",count,bank.size());
  return bank.getData();
}

std::vector<ZxSpriteBankEntry> readSpriteBank(const std::vector<unsigned char>& bank) {
  std::vector<ZxSpriteBankEntry> ret;
  ZxBinaryReader r(bank);
  int count=r.readByte();
  for (int i=0; i<count; i++) {
    ZxSpriteBankEntry e;
    ZxBinaryReader ptr(bank,1+i*2);
    r.seek(ptr.readWord());
    e.index=r.readByte();
    e.width=r.readByte();
    e.height=r.readByte();
    e.frameCount=r.readByte();
    e.animSpeed=r.readByte();
    e.attr=r.readByte();
    ptr.seek(1+count*2+i*2);
    e.pixelOffset=ptr.readWord();
    ptr.seek(1+count*4+i*2);
    r.seek(ptr.readWord());
    e.collision.top=r.readByte();
    e.collision.bottom=r.readByte();
    e.collision.left=r.readByte();
    e.collision.right=r.readByte();
    ret.push_back(e);
  }
  return ret;
}
