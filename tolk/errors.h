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
#include <exception>
#include <iosfwd>
#include <string>

namespace tolk {

enum class ErrorCode {
  ambiguous_discriminant,
  ambiguous_width,
  unknown_type,
  size_exceeded,
  truncated_data,
  opcode_mismatch,
  unmatched_variant,
  trailing_data,
  range_check,
  type_check
};

const char* get_error_code_name(ErrorCode code);
std::ostream& operator<<(std::ostream& os, ErrorCode code);

class Error : public std::exception {
 public:
  Error(ErrorCode code, std::string msg);

  ErrorCode get_code() const {
    return code_;
  }
  const std::string& get_msg() const {
    return msg_;
  }
  const char* what() const noexcept override {
    return what_.c_str();
  }

 protected:
  void update_what();
  virtual std::string describe() const;

 private:
  ErrorCode code_;
  std::string msg_;
  std::string what_;
};

// raised while registering layouts; always fatal to the registration step
class LayoutError : public Error {
 public:
  LayoutError(ErrorCode code, std::string type_name, std::string msg);

  const std::string& get_type_name() const {
    return type_name_;
  }

 protected:
  std::string describe() const override;

 private:
  std::string type_name_;
};

// raised while encoding, decoding or dispatching a value
class CodecError : public Error {
 public:
  CodecError(ErrorCode code, std::string msg, int exit_code = 0);
  CodecError(ErrorCode code, std::string msg, unsigned missing_bits, unsigned missing_refs);

  // dotted path of the field that failed, outermost first
  const std::string& get_path() const {
    return path_;
  }
  unsigned get_missing_bits() const {
    return missing_bits_;
  }
  unsigned get_missing_refs() const {
    return missing_refs_;
  }
  // error signal of opcode and variant mismatches (the analogue of `throw <code>`)
  int get_exit_code() const {
    return exit_code_;
  }

  CodecError& prepend_path(const std::string& name);

 protected:
  std::string describe() const override;

 private:
  std::string path_;
  unsigned missing_bits_{0};
  unsigned missing_refs_{0};
  int exit_code_{0};
};

}  // namespace tolk
