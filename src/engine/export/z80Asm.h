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

#ifndef _Z80_ASM_H
#define _Z80_ASM_H

#include <map>
#include <vector>
#include "../binaryPacker.h"

// a 16-bit address written as 0 and patched at link time
struct ZxFixup {
  size_t offset;
  String symbol;
  int addend;
  bool patched;
  ZxFixup(size_t o, const String& s, int a):
    offset(o),
    symbol(s),
    addend(a),
    patched(false) {}
};

struct ZxAsmLine {
  size_t offset;
  size_t length;
  String text;
  // labels are listed without bytes
  bool isLabel;
};

// small Z80 assembler.
// instructions are written as mnemonics. "n" in a pattern stands for an 8-bit operand,
// "nn" for a 16-bit one and "e" for a relative jump target:
//
//   a.ins("ld a,(hl)");
//   a.ins("cp n",0xff);
//   a.insAddr("ld hl,nn","block_bank",1);
//   a.insRel("djnz e","loop");
//
// an nn operand naming a label of this assembler resolves to org+offset at link time,
// anything else has to be passed to link().
class ZxAsm {
  struct RelFixup {
    size_t offset;
    String label;
  };

  ZxBinaryPacker code;
  std::map<String,size_t> labels;
  std::vector<ZxFixup> fixups;
  std::vector<RelFixup> relFixups;
  std::vector<ZxAsmLine> lines;
  bool linked;

  void emit(const String& text, const std::vector<unsigned char>& bytes);
  // encodes a pattern. nnPos receives the offset of a 16-bit operand in the bytes, or -1
  std::vector<unsigned char> encode(const String& pattern, int n, int& nnPos, bool& usesN, bool& usesE) const;
  void resolveRelative();

  public:
    void label(const String& name);
    bool hasLabel(const String& name) const;
    size_t labelOffset(const String& name) const;

    // no operand, or register operands only
    void ins(const String& text);
    // 8-bit immediate or bit number
    void ins(const String& pattern, int n);
    // 16-bit literal
    void insWord(const String& pattern, int nn);
    // 16-bit symbol reference
    void insAddr(const String& pattern, const String& symbol, int addend=0);
    // relative jump to a label of this assembler
    void insRel(const String& pattern, const String& target);

    // labelled data
    void defb(const String& name, int value=0);
    void defw(const String& name, int value=0);
    void defbytes(const String& name, const std::vector<unsigned char>& data);

    // resolves relative jumps, then patches every fixup.
    // throws ZxLinkError on an unknown symbol, a jump out of range or a second link
    void link(int org, const std::map<String,int>& symbols);

    size_t size() const {
      return code.size();
    }
    bool isLinked() const {
      return linked;
    }
    const std::vector<unsigned char>& getData() const {
      return code.getData();
    }
    const std::vector<ZxFixup>& getFixups() const {
      return fixups;
    }
    const std::vector<ZxAsmLine>& getLines() const {
      return lines;
    }
    // address, bytes and mnemonic per line
    String listing(int org) const;

    ZxAsm():
      linked(false) {}
};

#endif
