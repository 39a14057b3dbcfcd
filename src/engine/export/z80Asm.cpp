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

#include "z80Asm.h"
#include "../errors.h"
#include "../../zx-log.h"
#include <fmt/printf.h>

enum ZxOperandKind {
  OPERAND_NONE=0,
  OPERAND_N,
  OPERAND_NN,
  OPERAND_E
};

struct ZxOpcode {
  const char* text;
  int kind;
  int len;
  unsigned char bytes[2];
};

// everything that does not follow a register encoding pattern
static const ZxOpcode opcodeTable[]={
  {"nop", OPERAND_NONE, 1, {0x00, 0}},
  {"halt", OPERAND_NONE, 1, {0x76, 0}},
  {"di", OPERAND_NONE, 1, {0xf3, 0}},
  {"ei", OPERAND_NONE, 1, {0xfb, 0}},
  {"ret", OPERAND_NONE, 1, {0xc9, 0}},
  {"scf", OPERAND_NONE, 1, {0x37, 0}},
  {"ccf", OPERAND_NONE, 1, {0x3f, 0}},
  {"cpl", OPERAND_NONE, 1, {0x2f, 0}},
  {"neg", OPERAND_NONE, 2, {0xed, 0x44}},
  {"ldir", OPERAND_NONE, 2, {0xed, 0xb0}},
  {"lddr", OPERAND_NONE, 2, {0xed, 0xb8}},
  {"rla", OPERAND_NONE, 1, {0x17, 0}},
  {"rra", OPERAND_NONE, 1, {0x1f, 0}},
  {"rlca", OPERAND_NONE, 1, {0x07, 0}},
  {"rrca", OPERAND_NONE, 1, {0x0f, 0}},
  {"exx", OPERAND_NONE, 1, {0xd9, 0}},
  {"ex de,hl", OPERAND_NONE, 1, {0xeb, 0}},
  {"ex (sp),hl", OPERAND_NONE, 1, {0xe3, 0}},
  {"in a,(c)", OPERAND_NONE, 2, {0xed, 0x78}},
  {"out (c),a", OPERAND_NONE, 2, {0xed, 0x79}},
  {"ld a,(de)", OPERAND_NONE, 1, {0x1a, 0}},
  {"ld a,(bc)", OPERAND_NONE, 1, {0x0a, 0}},
  {"ld (de),a", OPERAND_NONE, 1, {0x12, 0}},
  {"ld (bc),a", OPERAND_NONE, 1, {0x02, 0}},
  {"ld sp,hl", OPERAND_NONE, 1, {0xf9, 0}},
  {"jp (hl)", OPERAND_NONE, 1, {0xe9, 0}},

  {"add a,n", OPERAND_N, 1, {0xc6, 0}},
  {"adc a,n", OPERAND_N, 1, {0xce, 0}},
  {"sub n", OPERAND_N, 1, {0xd6, 0}},
  {"sbc a,n", OPERAND_N, 1, {0xde, 0}},
  {"and n", OPERAND_N, 1, {0xe6, 0}},
  {"xor n", OPERAND_N, 1, {0xee, 0}},
  {"or n", OPERAND_N, 1, {0xf6, 0}},
  {"cp n", OPERAND_N, 1, {0xfe, 0}},
  {"out (n),a", OPERAND_N, 1, {0xd3, 0}},
  {"in a,(n)", OPERAND_N, 1, {0xdb, 0}},

  {"ld hl,(nn)", OPERAND_NN, 1, {0x2a, 0}},
  {"ld (nn),hl", OPERAND_NN, 1, {0x22, 0}},
  {"ld a,(nn)", OPERAND_NN, 1, {0x3a, 0}},
  {"ld (nn),a", OPERAND_NN, 1, {0x32, 0}},
  {"ld bc,(nn)", OPERAND_NN, 2, {0xed, 0x4b}},
  {"ld (nn),bc", OPERAND_NN, 2, {0xed, 0x43}},
  {"ld de,(nn)", OPERAND_NN, 2, {0xed, 0x5b}},
  {"ld (nn),de", OPERAND_NN, 2, {0xed, 0x53}},
  {"ld sp,(nn)", OPERAND_NN, 2, {0xed, 0x7b}},
  {"ld (nn),sp", OPERAND_NN, 2, {0xed, 0x73}},
  {"jp nn", OPERAND_NN, 1, {0xc3, 0}},
  {"call nn", OPERAND_NN, 1, {0xcd, 0}},

  {"jr e", OPERAND_E, 1, {0x18, 0}},
  {"djnz e", OPERAND_E, 1, {0x10, 0}},

  {NULL, OPERAND_NONE, 0, {0, 0}}
};

static int reg8(const String& s) {
  if (s=="b") return 0;
  if (s=="c") return 1;
  if (s=="d") return 2;
  if (s=="e") return 3;
  if (s=="h") return 4;
  if (s=="l") return 5;
  if (s=="(hl)") return 6;
  if (s=="a") return 7;
  return -1;
}

static int reg16(const String& s, bool withAF) {
  if (s=="bc") return 0;
  if (s=="de") return 1;
  if (s=="hl") return 2;
  if (s=="sp" && !withAF) return 3;
  if (s=="af" && withAF) return 3;
  return -1;
}

static int condition(const String& s) {
  static const char* names[]={"nz","z","nc","c","po","pe","p","m"};
  for (int i=0; i<8; i++) {
    if (s==names[i]) return i;
  }
  return -1;
}

static String normalize(const String& text) {
  String ret;
  bool space=false;
  for (char c: text) {
    if (c==' ' || c=='\t') {
      space=!ret.empty();
      continue;
    }
    if (c==',') {
      space=false;
      ret+=c;
      continue;
    }
    if (space && ret.back()!=',') ret+=' ';
    space=false;
    if (c>='A' && c<='Z') c=c-'A'+'a';
    ret+=c;
  }
  return ret;
}

static void splitInstruction(const String& text, String& mnemonic, std::vector<String>& ops) {
  size_t sp=text.find(' ');
  ops.clear();
  if (sp==String::npos) {
    mnemonic=text;
    return;
  }
  mnemonic=text.substr(0,sp);
  String rest=text.substr(sp+1);
  size_t start=0;
  while (true) {
    size_t comma=rest.find(',',start);
    if (comma==String::npos) {
      ops.push_back(rest.substr(start));
      break;
    }
    ops.push_back(rest.substr(start,comma-start));
    start=comma+1;
  }
}

static String renderOperands(const String& text, const String& n, const String& nn, const String& e) {
  String mnemonic;
  std::vector<String> ops;
  splitInstruction(text,mnemonic,ops);
  String ret=mnemonic;
  for (size_t i=0; i<ops.size(); i++) {
    String op=ops[i];
    if (op=="n") {
      op=n;
    } else if (op=="(n)") {
      op="("+n+")";
    } else if (op=="nn") {
      op=nn;
    } else if (op=="(nn)") {
      op="("+nn+")";
    } else if (op=="e") {
      op=e;
    }
    ret+=(i==0)?" ":",";
    ret+=op;
  }
  return ret;
}

std::vector<unsigned char> ZxAsm::encode(const String& pattern, int n, int& nnPos, bool& usesN, bool& usesE) const {
  std::vector<unsigned char> ret;
  nnPos=-1;
  usesN=false;
  usesE=false;

  for (const ZxOpcode* i=opcodeTable; i->text!=NULL; i++) {
    if (pattern!=i->text) continue;
    ret.assign(i->bytes,i->bytes+i->len);
    switch (i->kind) {
      case OPERAND_N:
        usesN=true;
        ret.push_back(n&0xff);
        break;
      case OPERAND_NN:
        nnPos=(int)ret.size();
        ret.push_back(0);
        ret.push_back(0);
        break;
      case OPERAND_E:
        usesE=true;
        ret.push_back(0);
        break;
    }
    return ret;
  }

  String m;
  std::vector<String> ops;
  splitInstruction(pattern,m,ops);

  if (m=="ld" && ops.size()==2) {
    int dst=reg8(ops[0]);
    int src=reg8(ops[1]);
    if (dst>=0 && src>=0 && !(dst==6 && src==6)) {
      ret.push_back(0x40|(dst<<3)|src);
      return ret;
    }
    if (dst>=0 && ops[1]=="n") {
      usesN=true;
      ret.push_back(0x06|(dst<<3));
      ret.push_back(n&0xff);
      return ret;
    }
    int rr=reg16(ops[0],false);
    if (rr>=0 && ops[1]=="nn") {
      ret.push_back(0x01|(rr<<4));
      nnPos=1;
      ret.push_back(0);
      ret.push_back(0);
      return ret;
    }
  }

  if ((m=="inc" || m=="dec") && ops.size()==1) {
    int r=reg8(ops[0]);
    if (r>=0) {
      ret.push_back((m=="inc"?0x04:0x05)|(r<<3));
      return ret;
    }
    int rr=reg16(ops[0],false);
    if (rr>=0) {
      ret.push_back((m=="inc"?0x03:0x0b)|(rr<<4));
      return ret;
    }
  }

  if ((m=="push" || m=="pop") && ops.size()==1) {
    int rr=reg16(ops[0],true);
    if (rr>=0) {
      ret.push_back((m=="push"?0xc5:0xc1)|(rr<<4));
      return ret;
    }
  }

  if (m=="add" && ops.size()==2 && ops[0]=="hl") {
    int rr=reg16(ops[1],false);
    if (rr>=0) {
      ret.push_back(0x09|(rr<<4));
      return ret;
    }
  }

  // 8-bit arithmetic with a register
  static const char* alu[]={"add","adc","sub","sbc","and","xor","or","cp"};
  for (int i=0; i<8; i++) {
    if (m!=alu[i]) continue;
    String src;
    if (ops.size()==2 && ops[0]=="a") {
      src=ops[1];
    } else if (ops.size()==1) {
      src=ops[0];
    }
    int r=reg8(src);
    if (r>=0) {
      ret.push_back(0x80|(i<<3)|r);
      return ret;
    }
  }

  static const char* rot[]={"rlc","rrc","rl","rr","sla","sra","sll","srl"};
  for (int i=0; i<8; i++) {
    if (m!=rot[i] || ops.size()!=1) continue;
    int r=reg8(ops[0]);
    if (r>=0) {
      ret.push_back(0xcb);
      ret.push_back((i<<3)|r);
      return ret;
    }
  }

  if ((m=="bit" || m=="res" || m=="set") && ops.size()==2) {
    int b=-1;
    if (ops[0]=="n") {
      usesN=true;
      b=n;
    } else if (ops[0].size()==1 && ops[0][0]>='0' && ops[0][0]<='7') {
      b=ops[0][0]-'0';
    }
    int r=reg8(ops[1]);
    if (b>=0 && b<8 && r>=0) {
      int base=(m=="bit")?0x40:((m=="res")?0x80:0xc0);
      ret.push_back(0xcb);
      ret.push_back(base|(b<<3)|r);
      return ret;
    }
  }

  if (ops.size()==2 && (m=="jp" || m=="call" || m=="jr")) {
    int cc=condition(ops[0]);
    if (cc>=0 && m=="jp" && ops[1]=="nn") {
      ret.push_back(0xc2|(cc<<3));
      nnPos=1;
      ret.push_back(0);
      ret.push_back(0);
      return ret;
    }
    if (cc>=0 && m=="call" && ops[1]=="nn") {
      ret.push_back(0xc4|(cc<<3));
      nnPos=1;
      ret.push_back(0);
      ret.push_back(0);
      return ret;
    }
    if (cc>=0 && cc<4 && m=="jr" && ops[1]=="e") {
      usesE=true;
      ret.push_back(0x20|(cc<<3));
      ret.push_back(0);
      return ret;
    }
  }

  if (m=="ret" && ops.size()==1) {
    int cc=condition(ops[0]);
    if (cc>=0) {
      ret.push_back(0xc0|(cc<<3));
      return ret;
    }
  }

  throw ZxExportError(fmt::sprintf("unknown instruction: %s",pattern));
}

void ZxAsm::emit(const String& text, const std::vector<unsigned char>& bytes) {
  ZxAsmLine line;
  line.offset=code.size();
  line.length=bytes.size();
  line.text=text;
  line.isLabel=false;
  lines.push_back(line);
  code.writeBytes(bytes);
}

void ZxAsm::label(const String& name) {
  if (labels.find(name)!=labels.end()) {
    throw ZxLinkError(fmt::sprintf("label %s defined twice",name));
  }
  labels[name]=code.size();
  ZxAsmLine line;
  line.offset=code.size();
  line.length=0;
  line.text=name+":";
  line.isLabel=true;
  lines.push_back(line);
}

bool ZxAsm::hasLabel(const String& name) const {
  return labels.find(name)!=labels.end();
}

size_t ZxAsm::labelOffset(const String& name) const {
  auto i=labels.find(name);
  if (i==labels.end()) {
    throw ZxLinkError(fmt::sprintf("undefined label %s",name));
  }
  return i->second;
}

void ZxAsm::ins(const String& text) {
  String t=normalize(text);
  int nnPos;
  bool usesN, usesE;
  std::vector<unsigned char> bytes=encode(t,0,nnPos,usesN,usesE);
  if (nnPos>=0 || usesN || usesE) {
    throw ZxExportError(fmt::sprintf("instruction %s needs an operand",t));
  }
  emit(t,bytes);
}

void ZxAsm::ins(const String& pattern, int n) {
  String t=normalize(pattern);
  int nnPos;
  bool usesN, usesE;
  std::vector<unsigned char> bytes=encode(t,n,nnPos,usesN,usesE);
  if (!usesN) {
    throw ZxExportError(fmt::sprintf("instruction %s takes no 8-bit operand",t));
  }
  emit(renderOperands(t,fmt::sprintf("%d",n),"",""),bytes);
}

void ZxAsm::insWord(const String& pattern, int nn) {
  String t=normalize(pattern);
  int nnPos;
  bool usesN, usesE;
  std::vector<unsigned char> bytes=encode(t,0,nnPos,usesN,usesE);
  if (nnPos<0) {
    throw ZxExportError(fmt::sprintf("instruction %s takes no 16-bit operand",t));
  }
  bytes[nnPos]=nn&0xff;
  bytes[nnPos+1]=(nn>>8)&0xff;
  emit(renderOperands(t,"",fmt::sprintf("%d",nn&0xffff),""),bytes);
}

void ZxAsm::insAddr(const String& pattern, const String& symbol, int addend) {
  String t=normalize(pattern);
  int nnPos;
  bool usesN, usesE;
  std::vector<unsigned char> bytes=encode(t,0,nnPos,usesN,usesE);
  if (nnPos<0) {
    throw ZxExportError(fmt::sprintf("instruction %s takes no 16-bit operand",t));
  }
  fixups.push_back(ZxFixup(code.size()+nnPos,symbol,addend));
  String ref=symbol;
  if (addend>0) {
    ref+=fmt::sprintf("+%d",addend);
  } else if (addend<0) {
    ref+=fmt::sprintf("%d",addend);
  }
  emit(renderOperands(t,"",ref,""),bytes);
}

void ZxAsm::insRel(const String& pattern, const String& target) {
  String t=normalize(pattern);
  int nnPos;
  bool usesN, usesE;
  std::vector<unsigned char> bytes=encode(t,0,nnPos,usesN,usesE);
  if (!usesE) {
    throw ZxExportError(fmt::sprintf("instruction %s is not a relative jump",t));
  }
  RelFixup f;
  f.offset=code.size()+bytes.size()-1;
  f.label=target;
  relFixups.push_back(f);
  emit(renderOperands(t,"","",target),bytes);
}

void ZxAsm::defb(const String& name, int value) {
  label(name);
  emit(fmt::sprintf("defb %d",value&0xff),std::vector<unsigned char>(1,value&0xff));
}

void ZxAsm::defw(const String& name, int value) {
  label(name);
  std::vector<unsigned char> bytes;
  bytes.push_back(value&0xff);
  bytes.push_back((value>>8)&0xff);
  emit(fmt::sprintf("defw %d",value&0xffff),bytes);
}

void ZxAsm::defbytes(const String& name, const std::vector<unsigned char>& data) {
  label(name);
  String text="defb ";
  for (size_t i=0; i<data.size(); i++) {
    if (i>0) text+=",";
    text+=fmt::sprintf("%d",data[i]);
  }
  emit(text,data);
}

void ZxAsm::resolveRelative() {
  for (const RelFixup& i: relFixups) {
    auto target=labels.find(i.label);
    if (target==labels.end()) {
      String msg=fmt::sprintf("relative jump to undefined label %s",i.label);
      logE("%s",msg);
      throw ZxLinkError(msg);
    }
    long disp=(long)target->second-(long)(i.offset+1);
    if (disp<-128 || disp>127) {
      String msg=fmt::sprintf("relative jump to %s out of range (%d)",i.label,disp);
      logE("%s",msg);
      throw ZxLinkError(msg);
    }
    code.patchByte(i.offset,(int)disp);
  }
}

void ZxAsm::link(int org, const std::map<String,int>& symbols) {
  if (linked) {
    String msg="code was already linked, fixups would be patched twice";
    logE("%s",msg);
    throw ZxLinkError(msg);
  }
  resolveRelative();
  for (ZxFixup& i: fixups) {
    if (i.patched) {
      String msg=fmt::sprintf("fixup at %d patched twice",i.offset);
      logE("%s",msg);
      throw ZxLinkError(msg);
    }
    int addr;
    auto local=labels.find(i.symbol);
    if (local!=labels.end()) {
      addr=org+(int)local->second;
    } else {
      auto ext=symbols.find(i.symbol);
      if (ext==symbols.end()) {
        String msg=fmt::sprintf("unresolved symbol %s",i.symbol);
        logE("%s",msg);
        throw ZxLinkError(msg);
      }
      addr=ext->second;
    }
    code.patchWord(i.offset,addr+i.addend);
    i.patched=true;
  }
  linked=true;
  logD("linked %d bytes at %.4x: %d fixups, %d relative jumps",code.size(),org,fixups.size(),relFixups.size());
}

String ZxAsm::listing(int org) const {
  String ret;
  const std::vector<unsigned char>& data=code.getData();
  for (const ZxAsmLine& i: lines) {
    if (i.isLabel) {
      ret+=i.text+"\n";
      continue;
    }
    String bytes;
    for (size_t j=0; j<i.length && j<4; j++) {
      bytes+=fmt::sprintf("%.2X ",data[i.offset+j]);
    }
    if (i.length>4) bytes+="...";
    ret+=fmt::sprintf("%.4X  %-12s    %s\n",(int)((org+i.offset)&0xffff),bytes,i.text);
  }
  return ret;
}
