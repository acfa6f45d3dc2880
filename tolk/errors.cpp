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
#include "tolk/errors.h"
#include <ostream>
#include <sstream>

namespace tolk {

const char* get_error_code_name(ErrorCode code) {
  switch (code) {
    case ErrorCode::ambiguous_discriminant:
      return "AmbiguousDiscriminant";
    case ErrorCode::ambiguous_width:
      return "AmbiguousWidth";
    case ErrorCode::unknown_type:
      return "UnknownType";
    case ErrorCode::size_exceeded:
      return "SizeExceeded";
    case ErrorCode::truncated_data:
      return "TruncatedData";
    case ErrorCode::opcode_mismatch:
      return "OpcodePrefixMismatch";
    case ErrorCode::unmatched_variant:
      return "UnmatchedVariant";
    case ErrorCode::trailing_data:
      return "TrailingData";
    case ErrorCode::range_check:
      return "RangeCheck";
    case ErrorCode::type_check:
      return "TypeCheck";
  }
  return "UnknownError";
}

std::ostream& operator<<(std::ostream& os, ErrorCode code) {
  return os << get_error_code_name(code);
}

Error::Error(ErrorCode code, std::string msg) : code_(code), msg_(std::move(msg)) {
  what_ = Error::describe();
}

std::string Error::describe() const {
  return std::string{get_error_code_name(code_)} + ": " + msg_;
}

void Error::update_what() {
  what_ = describe();
}

LayoutError::LayoutError(ErrorCode code, std::string type_name, std::string msg)
    : Error(code, std::move(msg)), type_name_(std::move(type_name)) {
  update_what();
}

std::string LayoutError::describe() const {
  return std::string{get_error_code_name(get_code())} + " in type `" + type_name_ + "`: " + get_msg();
}

CodecError::CodecError(ErrorCode code, std::string msg, int exit_code) : Error(code, std::move(msg)), exit_code_(exit_code) {
  update_what();
}

CodecError::CodecError(ErrorCode code, std::string msg, unsigned missing_bits, unsigned missing_refs)
    : Error(code, std::move(msg)), missing_bits_(missing_bits), missing_refs_(missing_refs) {
  update_what();
}

CodecError& CodecError::prepend_path(const std::string& name) {
  path_ = path_.empty() ? name : name + "." + path_;
  update_what();
  return *this;
}

std::string CodecError::describe() const {
  std::ostringstream os;
  os << get_code();
  if (!path_.empty()) {
    os << " at `" << path_ << "`";
  }
  os << ": " << get_msg();
  if (missing_bits_ || missing_refs_) {
    os << " (" << missing_bits_ << " bits and " << missing_refs_ << " refs short)";
  }
  if (exit_code_) {
    os << " [exit code " << exit_code_ << "]";
  }
  return os.str();
}

}  // namespace tolk
