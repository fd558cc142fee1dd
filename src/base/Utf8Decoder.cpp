#include "Utf8Decoder.hpp"

namespace uex {
namespace {
// Length of the sequence introduced by `lead`, or 0 if it cannot start one.
int sequenceLength(unsigned char lead) {
  if (lead >= 0xC2 && lead <= 0xDF) return 2;
  if (lead >= 0xE0 && lead <= 0xEF) return 3;
  if (lead >= 0xF0 && lead <= 0xF4) return 4;
  return 0;
}

// Valid range of the first continuation byte, which excludes overlong forms,
// surrogates and code points above U+10FFFF.
void firstContinuationRange(unsigned char lead, unsigned char* lo,
                            unsigned char* hi) {
  *lo = 0x80;
  *hi = 0xBF;
  switch (lead) {
    case 0xE0:
      *lo = 0xA0;
      break;
    case 0xED:
      *hi = 0x9F;
      break;
    case 0xF0:
      *lo = 0x90;
      break;
    case 0xF4:
      *hi = 0x8F;
      break;
    default:
      break;
  }
}
}  // namespace

string Utf8Decoder::escapeByte(unsigned char c) {
  static const char hexDigits[] = "0123456789abcdef";
  string s = "\\x";
  s.push_back(hexDigits[c >> 4]);
  s.push_back(hexDigits[c & 0xF]);
  return s;
}

string Utf8Decoder::decode(const char* data, size_t count) {
  string input;
  input.swap(tail);
  input.append(data, count);

  string out;
  out.reserve(input.size());
  size_t i = 0;
  while (i < input.size()) {
    unsigned char lead = (unsigned char)input[i];
    if (lead < 0x80) {
      out.push_back((char)lead);
      i++;
      continue;
    }
    int need = sequenceLength(lead);
    if (need == 0) {
      out.append(escapeByte(lead));
      i++;
      continue;
    }

    int valid = 1;
    bool incomplete = false;
    for (int k = 1; k < need; k++) {
      if (i + k >= input.size()) {
        incomplete = true;
        break;
      }
      unsigned char c = (unsigned char)input[i + k];
      unsigned char lo = 0x80, hi = 0xBF;
      if (k == 1) {
        firstContinuationRange(lead, &lo, &hi);
      }
      if (c < lo || c > hi) {
        break;
      }
      valid++;
    }

    if (incomplete) {
      // Wait for the rest of the sequence
      tail = input.substr(i);
      break;
    }
    if (valid < need) {
      // Escape the broken prefix and resume at the offending byte
      for (int k = 0; k < valid; k++) {
        out.append(escapeByte((unsigned char)input[i + k]));
      }
      i += valid;
      continue;
    }
    out.append(input, i, need);
    i += need;
  }
  return out;
}

string Utf8Decoder::flush() {
  string out;
  for (char c : tail) {
    out.append(escapeByte((unsigned char)c));
  }
  tail.clear();
  return out;
}
}  // namespace uex
