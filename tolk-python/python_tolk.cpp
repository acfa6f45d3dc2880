// Copyright 2023 Disintar LLP / andrey@head-labs.com

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <string>
#include "td/utils/logging.h"
#include "tolk/errors.h"
#include "PyCell.h"
#include "PyCellBuilder.h"
#include "PyCellSlice.h"
#include "PyCodec.h"
#include "PyDict.h"

namespace py = pybind11;

void globalSetVerbosity(int vb) {
  if (vb > 9) {
    vb = 9;
  } else if (vb < -1) {
    vb = -1;
  }

  int ll = VERBOSITY_NAME(FATAL) + vb;
  SET_VERBOSITY_LEVEL(ll);
}

PyCellSlice load_as_cell_slice(const PyCell& cell) {
  if (cell.is_null()) {
    throw std::invalid_argument("Cell is null");
  }
  return PyCellSlice(cell.my_cell);
}

PYBIND11_MODULE(python_tolk, m) {
  SET_VERBOSITY_LEVEL(verbosity_ERROR);
  static py::exception<tolk::Error> exc(m, "TolkError");
  py::register_exception_translator([](std::exception_ptr p) {
    try {
      if (p)
        std::rethrow_exception(p);
    } catch (const tolk::CellBuilder::CellWriteError&) {
      throw std::runtime_error("CellWriteError");
    } catch (const tolk::CellSlice::CellReadError&) {
      throw std::runtime_error("CellReadError");
    } catch (const tolk::Error& e) {
      LOG(ERROR) << "raising " << tolk::get_error_code_name(e.get_code()) << ": " << e.what();
      PyErr_SetString(exc.ptr(), e.what());
    }
  });

  py::class_<PyCell>(m, "PyCell", py::module_local())
      .def(py::init<>())
      .def("get_hash", &PyCell::get_hash)
      .def("get_depth", &PyCell::get_depth)
      .def("dump", &PyCell::dump)
      .def("to_boc", &PyCell::to_boc)
      .def("__repr__", &PyCell::toString)
      .def("__eq__", &PyCell::equals)
      .def("copy", &PyCell::copy)
      .def("is_null", &PyCell::is_null)
      .def_property("bits", &PyCell::bits, &PyCell::dummy_set)
      .def_property("refs", &PyCell::refs, &PyCell::dummy_set);

  py::class_<PyCellSlice>(m, "PyCellSlice", py::module_local())
      .def(py::init<>())
      .def("load_uint", &PyCellSlice::load_uint, py::arg("bit_len"))
      .def("preload_uint", &PyCellSlice::preload_uint, py::arg("bit_len"))
      .def("load_int", &PyCellSlice::load_int, py::arg("bit_len"))
      .def("preload_int", &PyCellSlice::preload_int, py::arg("bit_len"))
      .def("load_bool", &PyCellSlice::load_bool)
      .def("load_var_uint", &PyCellSlice::load_var_uint, py::arg("len_bits"))
      .def("load_var_int", &PyCellSlice::load_var_int, py::arg("len_bits"))
      .def("load_coins", [](PyCellSlice& cs) { return cs.load_var_uint(4); })
      .def("load_bitstring", &PyCellSlice::load_bitstring, py::arg("bit_len"))
      .def("preload_bitstring", &PyCellSlice::preload_bitstring, py::arg("bit_len"))
      .def("load_address", &PyCellSlice::load_address)
      .def("load_ref", &PyCellSlice::load_ref)
      .def("preload_ref", &PyCellSlice::preload_ref, py::arg("offset") = 0)
      .def("load_subslice", &PyCellSlice::load_subslice, py::arg("bits"), py::arg("refs") = 0)
      .def("skip_bits", &PyCellSlice::skip_bits, py::arg("bits"), py::return_value_policy::reference_internal)
      .def("skip_refs", &PyCellSlice::skip_refs, py::arg("refs"), py::return_value_policy::reference_internal)
      .def("begins_with", &PyCellSlice::begins_with, py::arg("bits"), py::arg("value"))
      .def("begins_with_bitstring", &PyCellSlice::begins_with_bitstring, py::arg("bits"))
      .def("bit_at", &PyCellSlice::bit_at, py::arg("i"))
      .def("empty_ext", &PyCellSlice::empty_ext)
      .def("to_bitstring", &PyCellSlice::to_bitstring)
      .def("to_boc", &PyCellSlice::to_boc)
      .def("dump", &PyCellSlice::dump)
      .def("copy", &PyCellSlice::copy)
      .def("__repr__", &PyCellSlice::toString)
      .def_property("bits", &PyCellSlice::bits, &PyCellSlice::dummy_set)
      .def_property("refs", &PyCellSlice::refs, &PyCellSlice::dummy_set);

  py::class_<PyCellBuilder>(m, "PyCellBuilder", py::module_local())
      .def(py::init<unsigned, unsigned>(), py::arg("max_bits") = 1023, py::arg("max_refs") = 4)
      .def("store_uint", &PyCellBuilder::store_uint, py::arg("value"), py::arg("bits"),
           py::return_value_policy::reference_internal)
      .def("store_int", &PyCellBuilder::store_int, py::arg("value"), py::arg("bits"),
           py::return_value_policy::reference_internal)
      .def("store_bool", &PyCellBuilder::store_bool, py::arg("value"), py::return_value_policy::reference_internal)
      .def("store_var_uint", &PyCellBuilder::store_var_uint, py::arg("value"), py::arg("len_bits"),
           py::return_value_policy::reference_internal)
      .def("store_var_int", &PyCellBuilder::store_var_int, py::arg("value"), py::arg("len_bits"),
           py::return_value_policy::reference_internal)
      .def("store_coins", &PyCellBuilder::store_coins, py::arg("value"), py::return_value_policy::reference_internal)
      .def("store_zeroes", &PyCellBuilder::store_zeroes, py::arg("bits"), py::return_value_policy::reference_internal)
      .def("store_ones", &PyCellBuilder::store_ones, py::arg("bits"), py::return_value_policy::reference_internal)
      .def("store_bitstring", &PyCellBuilder::store_bitstring, py::arg("bs"),
           py::return_value_policy::reference_internal)
      .def("store_address", &PyCellBuilder::store_address, py::arg("addr"), py::return_value_policy::reference_internal)
      .def("store_ref", &PyCellBuilder::store_ref, py::arg("cell"), py::return_value_policy::reference_internal)
      .def("store_slice", &PyCellBuilder::store_slice, py::arg("cs"), py::return_value_policy::reference_internal)
      .def("store_builder", &PyCellBuilder::store_builder, py::arg("cb"), py::return_value_policy::reference_internal)
      .def("end_cell", &PyCellBuilder::get_cell)
      .def("dump", &PyCellBuilder::dump)
      .def("to_boc", &PyCellBuilder::to_boc)
      .def("__repr__", &PyCellBuilder::toString)
      .def_property("bits", &PyCellBuilder::bits, &PyCellBuilder::dummy_set)
      .def_property("refs", &PyCellBuilder::refs, &PyCellBuilder::dummy_set)
      .def_property("remaining_bits", &PyCellBuilder::remaining_bits, &PyCellBuilder::dummy_set)
      .def_property("remaining_refs", &PyCellBuilder::remaining_refs, &PyCellBuilder::dummy_set);

  py::class_<PyDict>(m, "PyDict", py::module_local())
      .def(py::init<unsigned, bool, std::optional<PyCell>>(), py::arg("key_len"), py::arg("signed") = false,
           py::arg("root") = py::none())
      .def("get_pycell", &PyDict::get_pycell)
      .def("is_empty", &PyDict::is_empty)
      .def("set", &PyDict::set, py::arg("key"), py::arg("value"), py::arg("mode") = "set",
           py::return_value_policy::reference_internal)
      .def("set_ref", &PyDict::set_ref, py::arg("key"), py::arg("value"), py::arg("mode") = "set",
           py::return_value_policy::reference_internal)
      .def("set_builder", &PyDict::set_builder, py::arg("key"), py::arg("value"), py::arg("mode") = "set",
           py::return_value_policy::reference_internal)
      .def("lookup", &PyDict::lookup, py::arg("key"))
      .def("lookup_delete", &PyDict::lookup_delete, py::arg("key"))
      .def("lookup_nearest_key", &PyDict::lookup_nearest_key, py::arg("key"), py::arg("fetch_next") = true,
           py::arg("allow_eq") = false)
      .def("get_minmax_key", &PyDict::get_minmax_key, py::arg("fetch_max") = false)
      .def("map", &PyDict::map, py::arg("f"))
      .def("to_boc", &PyDict::to_boc)
      .def("dump", &PyDict::dump)
      .def("__len__", &PyDict::size)
      .def("__repr__", &PyDict::toString);

  py::class_<PyRegistry>(m, "PyRegistry", py::module_local())
      .def(py::init<unsigned, unsigned>(), py::arg("max_bits") = 1023, py::arg("max_refs") = 4)
      .def_static("from_schema", &PyRegistry::from_schema, py::arg("schema"))
      .def("load_schema", &PyRegistry::load_schema, py::arg("schema"))
      .def("to_schema", &PyRegistry::to_schema)
      .def("register_record", &PyRegistry::register_record, py::arg("name"), py::arg("fields"),
           py::arg("opcode") = py::none())
      .def("register_union", &PyRegistry::register_union, py::arg("name"), py::arg("variants"),
           py::arg("on_unmatched") = "error", py::arg("exit_code") = 63)
      .def("register_enum", &PyRegistry::register_enum, py::arg("name"), py::arg("bits"), py::arg("signed"),
           py::arg("members"))
      .def("layout_of", &PyRegistry::layout_of, py::arg("name"))
      .def("__contains__", &PyRegistry::contains, py::arg("name"))
      .def("type_names", &PyRegistry::type_names);

  py::class_<PyLazyValue>(m, "PyLazyValue", py::module_local())
      .def("type_name", &PyLazyValue::type_name)
      .def("get", &PyLazyValue::get, py::arg("field"))
      .def("is_cached", &PyLazyValue::is_cached, py::arg("field"))
      .def("to_json", &PyLazyValue::to_json)
      .def("rest", &PyLazyValue::rest);

  py::class_<PyUnionView>(m, "PyUnionView", py::module_local())
      .def("state", &PyUnionView::state)
      .def("open", &PyUnionView::open)
      .def("close", &PyUnionView::close)
      .def("variant", &PyUnionView::variant)
      .def("discriminant_depth", &PyUnionView::discriminant_depth)
      .def("get", &PyUnionView::get, py::arg("field"))
      .def("to_json", &PyUnionView::to_json)
      .def("raw", &PyUnionView::raw);

  py::class_<PyMap>(m, "PyMap", py::module_local())
      .def("get", &PyMap::get, py::arg("key"))
      .def("set", &PyMap::set, py::arg("key"), py::arg("value"))
      .def("set_if_absent", &PyMap::set_if_absent, py::arg("key"), py::arg("value"))
      .def("set_if_present", &PyMap::set_if_present, py::arg("key"), py::arg("value"))
      .def("delete", &PyMap::remove, py::arg("key"))
      .def("first", &PyMap::first)
      .def("last", &PyMap::last)
      .def("next", &PyMap::next, py::arg("key"))
      .def("prev", &PyMap::prev, py::arg("key"))
      .def("next_or_equal", &PyMap::next_or_equal, py::arg("key"))
      .def("prev_or_equal", &PyMap::prev_or_equal, py::arg("key"))
      .def("is_empty", &PyMap::is_empty)
      .def("get_pycell", &PyMap::get_pycell)
      .def("to_json", &PyMap::to_json)
      .def("__len__", &PyMap::size);

  py::class_<PyCodec>(m, "PyCodec", py::module_local())
      .def(py::init<const PyRegistry&>(), py::arg("registry"))
      .def("encode", &PyCodec::encode, py::arg("type_name"), py::arg("value"),
           py::arg("skip_bits_n_validation") = false)
      .def("decode", &PyCodec::decode, py::arg("cell"), py::arg("type_name"),
           py::arg("assert_end_after_reading") = false, py::arg("throw_if_opcode_does_not_match") = 63)
      .def("decode_lazy", &PyCodec::decode_lazy, py::arg("cell"), py::arg("type_name"),
           py::arg("assert_end_after_reading") = false, py::arg("throw_if_opcode_does_not_match") = 63)
      .def("open_lazy_union", &PyCodec::open_lazy_union, py::arg("cell"), py::arg("type_name"),
           py::arg("assert_end_after_reading") = false, py::arg("throw_if_opcode_does_not_match") = 63)
      .def("match", &PyCodec::match, py::arg("cell"), py::arg("type_name"), py::arg("arms"),
           py::arg("otherwise") = py::none())
      .def("new_map", &PyCodec::new_map, py::arg("key_type"), py::arg("value_type"), py::arg("root") = py::none());

  m.def("parse_string_to_cell", parse_string_to_cell, py::arg("cell_boc"));
  m.def("load_as_cell_slice", load_as_cell_slice, py::arg("cell"));
  m.def("globalSetVerbosity", globalSetVerbosity, py::arg("verbosity"));
}
