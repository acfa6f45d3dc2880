/*
    This file is part of TON Blockchain Library.

    TON Blockchain Library is free software: you can redistribute it and/or modify
    it under the terms of the GNU Lesser General Public License as published by
    the Free Software Foundation, either version 2 of the License, or
    (at your option) any later version.

    TON Blockchain Library is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU Lesser General Public License for more details.

    You should have received a copy of the GNU Lesser General Public License
    along with TON Blockchain Library.  If not, see <http://www.gnu.org/licenses/>.
*/
#include "tolk/common/bitstring.h"
#include <algorithm>
#include <ostream>
#include <stdexcept>

namespace tolk {

namespace bitstring {

int get_bit(const unsigned char* data, unsigned offs) {
  return (data[offs >> 3] >> (7 - (offs & 7))) & 1;
}

void set_bit(unsigned char* data, unsigned offs, int bit) {
  unsigned char mask = (unsigned char)(0x80 >> (offs & 7));
  if (bit) {
    data[offs >> 3] |= mask;
  } else {
    data[offs >> 3] &= (unsigned char)~mask;
  }
}

void bits_memcpy(unsigned char* to, unsigned to_offs, const unsigned char* from, unsigned from_offs,
                 unsigned bit_count) {
  if (!((to_offs | from_offs | bit_count) & 7)) {
    for (unsigned i = 0; i < (bit_count >> 3); i++) {
      to[(to_offs >> 3) + i] = from[(from_offs >> 3) + i];
    }
    return;
  }
  for (unsigned i = 0; i < bit_count; i++) {
    set_bit(to, to_offs + i, get_bit(from, from_offs + i));
  }
}

void bits_memset(unsigned char* to, unsigned to_offs, bool val, unsigned bit_count) {
  for (unsigned i = 0; i < bit_count; i++) {
    set_bit(to, to_offs + i, val);
  }
}

unsigned long long bits_load_ulong(const unsigned char* data, unsigned offs, unsigned bits) {
  unsigned long long res = 0;
  for (unsigned i = 0; i < bits; i++) {
    res = (res << 1) | (unsigned)get_bit(data, offs + i);
  }
  return res;
}

void bits_store_ulong(unsigned char* data, unsigned offs, unsigned long long value, unsigned bits) {
  for (unsigned i = 0; i < bits; i++) {
    unsigned shift = bits - 1 - i;
    set_bit(data, offs + i, shift < 64 ? (int)((value >> shift) & 1) : 0);
  }
}

int bits_memcmp(const unsigned char* a, unsigned a_offs, const unsigned char* b, unsigned b_offs, unsigned bit_count,
                unsigned* same_upto) {
  for (unsigned i = 0; i < bit_count; i++) {
    int x = get_bit(a, a_offs + i), y = get_bit(b, b_offs + i);
    if (x != y) {
      if (same_upto) {
        *same_upto = i;
      }
      return x < y ? -1 : 1;
    }
  }
  if (same_upto) {
    *same_upto = bit_count;
  }
  return 0;
}

std::string bits_to_binary(const unsigned char* data, unsigned offs, unsigned bits) {
  std::string res;
  res.reserve(bits);
  for (unsigned i = 0; i < bits; i++) {
    res.push_back((char)('0' + get_bit(data, offs + i)));
  }
  return res;
}

std::string bits_to_hex(const unsigned char* data, unsigned offs, unsigned bits) {
  static const char hex_digits[] = "0123456789ABCDEF";
  std::string res;
  unsigned i = 0;
  for (; i + 4 <= bits; i += 4) {
    res.push_back(hex_digits[bits_load_ulong(data, offs + i, 4)]);
  }
  if (i < bits) {
    // completion tag: append a one bit and pad with zeroes up to the nibble
    unsigned rest = bits - i;
    unsigned v = (unsigned)bits_load_ulong(data, offs + i, rest);
    v = (v << 1 | 1) << (3 - rest);
    res.push_back(hex_digits[v]);
    res.push_back('_');
  }
  return res;
}

long parse_bitstring_binary_literal(unsigned char* buff, std::size_t buff_size, const char* str,
                                    const char* str_end) {
  long bits = 0;
  for (const char* ptr = str; ptr < str_end; ++ptr) {
    if (*ptr != '0' && *ptr != '1') {
      return -1;
    }
    if ((std::size_t)bits >= buff_size * 8) {
      return -1;
    }
    set_bit(buff, (unsigned)bits++, *ptr - '0');
  }
  return bits;
}

long parse_bitstring_hex_literal(unsigned char* buff, std::size_t buff_size, const char* str, const char* str_end) {
  long bits = 0;
  bool cmpl = false;
  for (const char* ptr = str; ptr < str_end; ++ptr) {
    int c = *ptr;
    if (c == '_' && ptr + 1 == str_end) {
      cmpl = true;
      break;
    }
    if (c >= '0' && c <= '9') {
      c -= '0';
    } else if (c >= 'A' && c <= 'F') {
      c -= 'A' - 10;
    } else if (c >= 'a' && c <= 'f') {
      c -= 'a' - 10;
    } else {
      return -1;
    }
    if ((std::size_t)bits + 4 > buff_size * 8) {
      return -1;
    }
    bits_store_ulong(buff, (unsigned)bits, (unsigned)c, 4);
    bits += 4;
  }
  if (cmpl) {
    while (bits > 0 && !get_bit(buff, (unsigned)bits - 1)) {
      --bits;
    }
    if (bits > 0) {
      --bits;
    }
  }
  return bits;
}

}  // namespace bitstring

BitString::BitString(const unsigned char* data, unsigned offs, unsigned bits) : bits_(bits), data_((bits + 7) / 8, 0) {
  bitstring::bits_memcpy(data_.data(), 0, data, offs, bits);
}

BitString BitString::from_ulong(unsigned long long value, unsigned bits) {
  BitString res(bits);
  bitstring::bits_store_ulong(res.data(), 0, value, bits);
  return res;
}

BitString BitString::from_long(long long value, unsigned bits) {
  BitString res(bits);
  for (unsigned i = 0; i < bits; i++) {
    unsigned shift = bits - 1 - i;
    res.set(i, shift < 64 ? (int)((value >> shift) & 1) : (value < 0));
  }
  return res;
}

BitString BitString::parse_binary(const std::string& str) {
  std::vector<unsigned char> buff(str.size() / 8 + 1, 0);
  long bits = bitstring::parse_bitstring_binary_literal(buff.data(), buff.size(), str.data(), str.data() + str.size());
  if (bits < 0) {
    throw std::invalid_argument("invalid binary bitstring literal `" + str + "`");
  }
  return BitString(buff.data(), 0, (unsigned)bits);
}

BitString BitString::parse_hex(const std::string& str) {
  std::string body = str;
  if (body.size() >= 3 && body[0] == 'x' && body[1] == '{' && body.back() == '}') {
    body = body.substr(2, body.size() - 3);
  }
  std::vector<unsigned char> buff(body.size() / 2 + 1, 0);
  long bits = bitstring::parse_bitstring_hex_literal(buff.data(), buff.size(), body.data(), body.data() + body.size());
  if (bits < 0) {
    throw std::invalid_argument("invalid hex bitstring literal `" + str + "`");
  }
  return BitString(buff.data(), 0, (unsigned)bits);
}

BitString BitString::parse(const std::string& str) {
  if (!str.empty() && str[0] == 'x') {
    return parse_hex(str);
  }
  if (str.size() > 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X')) {
    return parse_hex(str.substr(2));
  }
  if (str.size() > 2 && str[0] == '0' && (str[1] == 'b' || str[1] == 'B')) {
    return parse_binary(str.substr(2));
  }
  return parse_binary(str);
}

BitString& BitString::append(const BitString& other) {
  return append(other.data(), 0, other.size());
}

BitString& BitString::append(const unsigned char* data, unsigned offs, unsigned bits) {
  data_.resize((bits_ + bits + 7) / 8, 0);
  bitstring::bits_memcpy(data_.data(), bits_, data, offs, bits);
  bits_ += bits;
  return *this;
}

BitString& BitString::push_back(int bit) {
  data_.resize((bits_ + 8) / 8, 0);
  bitstring::set_bit(data_.data(), bits_++, bit);
  return *this;
}

BitString BitString::substr(unsigned offs, unsigned bits) const {
  if (offs + bits > bits_) {
    throw std::out_of_range("bitstring substr out of range");
  }
  return BitString(data_.data(), offs, bits);
}

bool BitString::is_prefix_of(const BitString& other) const {
  return bits_ <= other.bits_ && !bitstring::bits_memcmp(data(), 0, other.data(), 0, bits_);
}

unsigned long long BitString::to_ulong() const {
  if (bits_ > 64) {
    throw std::range_error("bitstring does not fit into 64 bits");
  }
  return bitstring::bits_load_ulong(data_.data(), 0, bits_);
}

long long BitString::to_long() const {
  if (bits_ > 64) {
    throw std::range_error("bitstring does not fit into 64 bits");
  }
  if (!bits_) {
    return 0;
  }
  unsigned long long x = bitstring::bits_load_ulong(data_.data(), 0, bits_);
  if (bits_ < 64 && (*this)[0]) {
    x |= ~0ULL << bits_;
  }
  return (long long)x;
}

std::string BitString::to_binary() const {
  return bitstring::bits_to_binary(data_.data(), 0, bits_);
}

std::string BitString::to_hex() const {
  return bitstring::bits_to_hex(data_.data(), 0, bits_);
}

int BitString::compare(const BitString& other) const {
  unsigned common = std::min(bits_, other.bits_);
  int c = bitstring::bits_memcmp(data(), 0, other.data(), 0, common);
  if (c) {
    return c;
  }
  return bits_ == other.bits_ ? 0 : (bits_ < other.bits_ ? -1 : 1);
}

std::ostream& operator<<(std::ostream& os, const BitString& bs) {
  return os << "x{" << bs.to_hex() << "}";
}

}  // namespace tolk
