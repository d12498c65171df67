#include "AnsiStripper.hpp"

namespace ras {
namespace {
const char ESC = '\x1b';
const char BEL = '\x07';

bool isOneOf(char c, const char* set) {
  return c != '\0' && strchr(set, c) != NULL;
}

void emitLineBreak(string* out) {
  if (!out->empty() && out->back() != '\n') {
    out->push_back('\n');
  }
}

void emitSpace(string* out) {
  if (!out->empty() && out->back() != ' ' && out->back() != '\n' &&
      out->back() != '\t') {
    out->push_back(' ');
  }
}

// Returns the index just past the string terminator (BEL or ESC \), or npos
// if the string is not terminated yet.
size_t skipControlString(const string& raw, size_t start) {
  for (size_t j = start; j < raw.size(); j++) {
    if (raw[j] == BEL) {
      return j + 1;
    }
    if (raw[j] == ESC) {
      if (j + 1 >= raw.size()) {
        return string::npos;
      }
      if (raw[j + 1] == '\\') {
        return j + 2;
      }
    }
  }
  return string::npos;
}
}  // namespace

string AnsiStripper::strip(const string& raw) {
  size_t unused;
  return strip(raw, raw.size(), &unused);
}

string AnsiStripper::strip(const string& raw, size_t rawOffset,
                           size_t* cleanOffset) {
  string out;
  out.reserve(raw.size());
  bool offsetSet = false;
  size_t n = raw.size();
  size_t i = 0;

  while (i < n) {
    if (!offsetSet && i >= rawOffset) {
      *cleanOffset = out.size();
      offsetSet = true;
    }
    char c = raw[i];

    if (c == ESC) {
      if (i + 1 >= n) {
        break;
      }
      char kind = raw[i + 1];
      if (kind == '[') {
        // CSI: parameters, intermediates, then one final byte
        size_t j = i + 2;
        while (j < n && raw[j] >= 0x30 && raw[j] <= 0x3F) j++;
        while (j < n && raw[j] >= 0x20 && raw[j] <= 0x2F) j++;
        if (j >= n) {
          break;
        }
        char finalByte = raw[j];
        if (isOneOf(finalByte, "HfdABEF")) {
          emitLineBreak(&out);
        } else if (isOneOf(finalByte, "CDG")) {
          emitSpace(&out);
        }
        i = j + 1;
        continue;
      }
      if (kind == ']' || kind == 'P' || kind == '^' || kind == '_') {
        // OSC, DCS, PM, APC
        size_t end = skipControlString(raw, i + 2);
        if (end == string::npos) {
          break;
        }
        i = end;
        continue;
      }
      if (isOneOf(kind, "()*+-./#% ON")) {
        // Charset selection and other three byte forms
        if (i + 2 >= n) {
          break;
        }
        i += 3;
        continue;
      }
      i += 2;
      continue;
    }

    if (c == '\r') {
      out.push_back('\n');
      i += (i + 1 < n && raw[i + 1] == '\n') ? 2 : 1;
      continue;
    }
    if (c == '\n' || c == '\t') {
      out.push_back(c);
      i++;
      continue;
    }
    if ((c >= 0 && c < 0x20) || c == 0x7f) {
      i++;
      continue;
    }
    out.push_back(c);
    i++;
  }

  if (!offsetSet) {
    *cleanOffset = out.size();
  }
  return out;
}
}  // namespace ras
