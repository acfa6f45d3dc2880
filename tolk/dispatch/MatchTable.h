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
#include <functional>
#include <string>
#include <vector>
#include "tolk/dispatch/UnionView.h"
#include "tolk/errors.h"

namespace tolk {

// `match` over a union: arms are bound to variant indices once, when the table is built,
// and dispatch is a single index lookup after the discriminant has been read.
template <class R>
class MatchTable {
 public:
  using Handler = std::function<R(UnionView&)>;

  explicit MatchTable(const TypeLayout& layout) : layout_(&layout), arms_(match_arm_count(layout)) {
  }

  const TypeLayout& get_layout() const {
    return *layout_;
  }

  // throws LayoutError: unknown_type for a name that is not a variant, ambiguous_discriminant for a second arm
  MatchTable& on(const std::string& variant_name, Handler handler) {
    int idx = match_arm_index(*layout_, variant_name);
    if (arms_[idx]) {
      throw LayoutError(ErrorCode::ambiguous_discriminant, layout_->name,
                        "more than one arm for `" + variant_name + "`");
    }
    arms_[idx] = std::move(handler);
    return *this;
  }
  MatchTable& otherwise(Handler handler) {
    if (else_) {
      throw LayoutError(ErrorCode::ambiguous_discriminant, layout_->name, "more than one `else` arm");
    }
    else_ = std::move(handler);
    return *this;
  }

  bool has_else() const {
    return (bool)else_;
  }

  // the view is closed when the arm returns or throws
  R operator()(UnionView& view) const {
    Closer closer{view};
    if (&view.get_union_layout() != layout_) {
      throw CodecError(ErrorCode::type_check, "match over `" + layout_->name + "` applied to a view of `" +
                                                  view.get_union_layout().name + "`");
    }
    view.open();
    if (view.is_matched() && arms_[view.variant_index()]) {
      return arms_[view.variant_index()](view);
    }
    if (else_) {
      return else_(view);
    }
    view.fail_unmatched();
  }

 private:
  struct Closer {
    UnionView& view;
    ~Closer() {
      view.close();
    }
  };

  const TypeLayout* layout_;
  std::vector<Handler> arms_;
  Handler else_;
};

// opens cell as the table's union and dispatches it
template <class R>
R match(const Codec& codec, const Ref<Cell>& cell, const MatchTable<R>& table, const UnpackOptions& options = {}) {
  UnionView view = open_lazy_union(codec, cell, table.get_layout(), options);
  return table(view);
}

}  // namespace tolk
