// Copyright 2023 Disintar LLP / andrey@head-labs.com

#include <pybind11/pybind11.h>
#include <sstream>
#include <string>
#include "td/utils/logging.h"
#include "tolk/cells/CellSlice.h"
#include "tolk/cells/boc.h"
#include "PyCell.h"

namespace {

const tolk::Ref<tolk::Cell>& checked(const tolk::Ref<tolk::Cell>& cell) {
  if (!cell) {
    throw std::invalid_argument("Cell is null");
  }
  return cell;
}

}  // namespace

std::string PyCell::get_hash() const {
  return checked(my_cell)->get_hash_hex();
}

int PyCell::get_depth() const {
  return (int)checked(my_cell)->get_depth();
}

unsigned PyCell::bits() const {
  return checked(my_cell)->size();
}

unsigned PyCell::refs() const {
  return checked(my_cell)->size_refs();
}

std::string PyCell::toString() const {
  if (!my_cell) {
    return "<Cell null>";
  }
  std::stringstream os;
  os << "<Cell [" << my_cell->size() << "] bits, [" << my_cell->size_refs() << "] refs, ["
     << my_cell->get_hash_hex() << "] hash>";
  return os.str();
}

std::string PyCell::dump() const {
  std::stringstream os;
  tolk::print_cell_rec(os, checked(my_cell));
  return os.str();
}

std::string PyCell::to_boc() const {
  return tolk::boc_to_base64(checked(my_cell));
}

PyCell PyCell::copy() const {
  return PyCell(my_cell);
}

bool PyCell::is_null() const {
  return !my_cell;
}

bool PyCell::equals(const PyCell& other) const {
  if (!my_cell || !other.my_cell) {
    return !my_cell && !other.my_cell;
  }
  return my_cell->equals(*other.my_cell);
}

PyCell parse_string_to_cell(const std::string& base64string) {
  auto r_cell = tolk::boc_from_base64(base64string);
  if (r_cell.is_error()) {
    LOG(ERROR) << "Can't parse cell: " << r_cell.error().message().str();
    throw std::invalid_argument("Parse cell error: " + r_cell.error().message().str());
  }
  return PyCell(r_cell.move_as_ok());
}
