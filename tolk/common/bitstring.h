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
#pragma once
#include <string>
#include <vector>
#include <iosfwd>

namespace tolk {

namespace bitstring {

// raw bit helpers over big-endian byte buffers (bit 0 is the MSB of byte 0)
int get_bit(const unsigned char* data, unsigned offs);
void set_bit(unsigned char* data, unsigned offs, int bit);
void bits_memcpy(unsigned char* to, unsigned to_offs, const unsigned char* from, unsigned from_offs,
                 unsigned bit_count);
void bits_memset(unsigned char* to, unsigned to_offs, bool val, unsigned bit_count);
unsigned long long bits_load_ulong(const unsigned char* data, unsigned offs, unsigned bits);
void bits_store_ulong(unsigned char* data, unsigned offs, unsigned long long value, unsigned bits);
int bits_memcmp(const unsigned char* a, unsigned a_offs, const unsigned char* b, unsigned b_offs, unsigned bit_count,
                unsigned* same_upto = nullptr);
std::string bits_to_binary(const unsigned char* data, unsigned offs, unsigned bits);
std::string bits_to_hex(const unsigned char* data, unsigned offs, unsigned bits);

// parses "0101..." into buff; returns bit count or -1 on error
long parse_bitstring_binary_literal(unsigned char* buff, std::size_t buff_size, const char* str, const char* str_end);
// parses hex digits with optional trailing '_' completion tag; returns bit count or -1 on error
long parse_bitstring_hex_literal(unsigned char* buff, std::size_t buff_size, const char* str, const char* str_end);

}  // namespace bitstring

// Owning sequence of bits, used for bitsN values, dictionary keys and discriminants.
class BitString {
 public:
  BitString() = default;
  explicit BitString(unsigned bits) : bits_(bits), data_((bits + 7) / 8, 0) {
  }
  BitString(const unsigned char* data, unsigned offs, unsigned bits);

  static BitString from_ulong(unsigned long long value, unsigned bits);
  static BitString from_long(long long value, unsigned bits);
  static BitString zeroes(unsigned bits) {
    return BitString(bits);
  }
  // "0110", "x{6_}" or "6_" style literals; throws std::invalid_argument
  static BitString parse_binary(const std::string& str);
  static BitString parse_hex(const std::string& str);
  static BitString parse(const std::string& str);

  unsigned size() const {
    return bits_;
  }
  bool empty() const {
    return !bits_;
  }
  const unsigned char* data() const {
    return data_.data();
  }
  unsigned char* data() {
    return data_.data();
  }
  int operator[](unsigned i) const {
    return bitstring::get_bit(data_.data(), i);
  }
  void set(unsigned i, int bit) {
    bitstring::set_bit(data_.data(), i, bit);
  }

  BitString& append(const BitString& other);
  BitString& append(const unsigned char* data, unsigned offs, unsigned bits);
  BitString& push_back(int bit);
  BitString substr(unsigned offs, unsigned bits) const;
  bool is_prefix_of(const BitString& other) const;

  unsigned long long to_ulong() const;
  long long to_long() const;
  std::string to_binary() const;
  std::string to_hex() const;

  int compare(const BitString& other) const;
  bool operator==(const BitString& other) const {
    return compare(other) == 0;
  }
  bool operator!=(const BitString& other) const {
    return compare(other) != 0;
  }
  bool operator<(const BitString& other) const {
    return compare(other) < 0;
  }

 private:
  unsigned bits_ = 0;
  std::vector<unsigned char> data_;
};

std::ostream& operator<<(std::ostream& os, const BitString& bs);

}  // namespace tolk
