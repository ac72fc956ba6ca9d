#include "stitch.h"

namespace navsql {

namespace {

/// Picks the primary key, else the first complete unique key over non-null columns.
std::vector<const Column*> identifying_columns(const Table& table) {
  if (const UniqueKey* key = table.primary_key()) {
    return key->columns;
  }
  for (const auto& key : table.unique_keys()) {
    if (key.is_partial) continue;
    bool all_required = true;
    for (const Column* column : key.columns) {
      if (column->is_nullable) {
        all_required = false;
        break;
      }
    }
    if (all_required) return key.columns;
  }
  return {};
}

void arrange_into(const SpacePtr& space, bool with_strong, bool with_weak,
                  std::vector<OrderItem>& out) {
  switch (space->kind) {
    case SpaceKind::Root:
      return;
    case SpaceKind::DirectTable:
    case SpaceKind::FiberTable: {
      arrange_into(space->base, with_strong, with_weak, out);
      if (!with_weak || space->is_contracting) return;
      const Table& table = *space->family.table;
      std::vector<const Column*> columns = identifying_columns(table);
      if (columns.empty()) {
        for (const auto& column : table.columns()) columns.push_back(column.get());
      }
      SpacePtr inflated = inflate(space);
      for (const Column* column : columns) {
        out.emplace_back(make_column_unit(*column, inflated, space->mark), +1);
      }
      return;
    }
    case SpaceKind::Quotient: {
      arrange_into(space->base, with_strong, with_weak, out);
      if (!with_weak) return;
      SpacePtr inflated = inflate(space);
      for (const auto& kernel : space->family.kernels) {
        out.emplace_back(make_kernel_unit(kernel, inflated, kernel->mark), +1);
      }
      return;
    }
    case SpaceKind::Complement:
    case SpaceKind::Moniker:
    case SpaceKind::Forked:
    case SpaceKind::Linked: {
      arrange_into(space->base, with_strong, with_weak, out);
      if (!with_weak) return;
      SpacePtr inflated = inflate(space);
      SpacePtr ground_base = space->ground->base;
      for (const auto& item : arrange(space->seed)) {
        bool covered = ground_base != nullptr;
        if (covered) {
          for (const auto& unit : units_of(item.first)) {
            if (!spans(ground_base, unit->space)) {
              covered = false;
              break;
            }
          }
        }
        if (!covered) {
          out.emplace_back(make_covering_unit(item.first, inflated, item.first->mark),
                           item.second);
        }
      }
      return;
    }
    case SpaceKind::Ordered:
      if (with_strong) {
        arrange_into(space->base, true, false, out);
        for (const auto& item : space->order) out.push_back(item);
      }
      if (with_weak) {
        arrange_into(space->base, false, true, out);
      }
      return;
    case SpaceKind::Scalar:
    case SpaceKind::Filtered:
      arrange_into(space->base, with_strong, with_weak, out);
      return;
  }
}

}  // namespace

std::vector<OrderItem> arrange(const SpacePtr& space, bool with_strong, bool with_weak) {
  std::vector<OrderItem> items;
  arrange_into(space, with_strong, with_weak, items);
  std::vector<OrderItem> order;
  for (const auto& item : items) {
    bool duplicate = false;
    for (const auto& kept : order) {
      if (same_code(kept.first, item.first)) {
        duplicate = true;
        break;
      }
    }
    if (!duplicate) order.push_back(item);
  }
  return order;
}

std::vector<CodePtr> spread(const SpacePtr& space) {
  std::vector<CodePtr> units;
  if (!space->is_axis) {
    for (const auto& unit : spread(space->base)) {
      units.push_back(unit_with_space(unit, space));
    }
    return units;
  }
  switch (space->kind) {
    case SpaceKind::DirectTable:
    case SpaceKind::FiberTable:
      for (const auto& column : space->family.table->columns()) {
        units.push_back(make_column_unit(*column, space, space->mark));
      }
      break;
    case SpaceKind::Quotient:
      for (const auto& joint : navsql::tie(space->family.ground)) {
        units.push_back(make_kernel_unit(joint.rop, space, joint.rop->mark));
      }
      for (const auto& kernel : space->family.kernels) {
        units.push_back(make_kernel_unit(kernel, space, kernel->mark));
      }
      break;
    case SpaceKind::Complement:
    case SpaceKind::Moniker:
    case SpaceKind::Forked:
    case SpaceKind::Linked:
      for (const auto& unit : spread(inflate(space->seed))) {
        units.push_back(unit_with_space(unit, space));
      }
      break;
    default:
      break;
  }
  return units;
}

std::vector<Joint> sew(const SpacePtr& space) {
  if (!space->is_axis) return sew(space->base);
  std::vector<Joint> joints;
  switch (space->kind) {
    case SpaceKind::DirectTable:
    case SpaceKind::FiberTable: {
      const Table& table = *space->family.table;
      std::vector<const Column*> columns = identifying_columns(table);
      if (columns.empty()) {
        throw Error("unable to connect a table lacking a primary key", space->mark,
                    table.name());
      }
      SpacePtr inflated = inflate(space);
      for (const Column* column : columns) {
        CodePtr unit = make_column_unit(*column, inflated, space->mark);
        joints.push_back(Joint{unit, unit});
      }
      break;
    }
    case SpaceKind::Quotient: {
      SpacePtr inflated = inflate(space);
      for (const auto& joint : navsql::tie(inflated->family.ground)) {
        CodePtr unit = make_kernel_unit(joint.rop, inflated, joint.rop->mark);
        joints.push_back(Joint{unit, unit});
      }
      for (const auto& kernel : inflated->family.kernels) {
        CodePtr unit = make_kernel_unit(kernel, inflated, kernel->mark);
        joints.push_back(Joint{unit, unit});
      }
      break;
    }
    case SpaceKind::Complement:
    case SpaceKind::Moniker:
    case SpaceKind::Forked:
    case SpaceKind::Linked: {
      SpacePtr inflated = inflate(space);
      SpacePtr baseline = inflate(space->ground);
      std::vector<SpacePtr> axes;
      for (SpacePtr axis = inflate(space->seed); axis && concludes(axis, baseline);
           axis = axis->base) {
        axes.push_back(axis);
      }
      for (auto it = axes.rbegin(); it != axes.rend(); ++it) {
        const SpacePtr& axis = *it;
        if (axis->is_contracting && !same_space(axis, baseline)) continue;
        for (const auto& joint : sew(axis)) {
          CodePtr unit = make_covering_unit(joint.lop, inflated, joint.lop->mark);
          joints.push_back(Joint{unit, unit});
        }
      }
      break;
    }
    default:
      break;
  }
  return joints;
}

std::vector<Joint> tie(const SpacePtr& space) {
  if (!space->is_axis) return navsql::tie(space->base);
  std::vector<Joint> joints;
  SpacePtr inflated = inflate(space);
  switch (space->kind) {
    case SpaceKind::FiberTable: {
      const Join& join = *inflated->join;
      for (size_t i = 0; i < join.origin_columns.size(); ++i) {
        joints.push_back(Joint{make_column_unit(*join.origin_columns[i], inflated->base, space->mark),
                               make_column_unit(*join.target_columns[i], inflated, space->mark)});
      }
      break;
    }
    case SpaceKind::Quotient:
      for (const auto& joint : navsql::tie(inflated->family.ground)) {
        joints.push_back(Joint{joint.lop, make_kernel_unit(joint.rop, inflated, joint.rop->mark)});
      }
      break;
    case SpaceKind::Complement:
      for (const auto& joint : navsql::tie(inflated->ground)) {
        const CodePtr& op = joint.rop;
        joints.push_back(Joint{make_kernel_unit(op, inflated->base, op->mark),
                               make_covering_unit(op, inflated, op->mark)});
      }
      for (const auto& kernel : inflated->kernels) {
        joints.push_back(Joint{make_kernel_unit(kernel, inflated->base, kernel->mark),
                               make_covering_unit(kernel, inflated, kernel->mark)});
      }
      break;
    case SpaceKind::Moniker: {
      std::vector<Joint> ground_joints =
          inflated->is_contracting ? sew(inflated->ground) : navsql::tie(inflated->ground);
      for (const auto& joint : ground_joints) {
        joints.push_back(Joint{joint.lop, make_covering_unit(joint.rop, inflated, joint.rop->mark)});
      }
      break;
    }
    case SpaceKind::Forked:
      for (const auto& joint : navsql::tie(inflated->seed)) {
        joints.push_back(Joint{joint.rop, make_covering_unit(joint.rop, inflated, joint.rop->mark)});
      }
      for (const auto& kernel : space->kernels) {
        joints.push_back(Joint{kernel, make_covering_unit(kernel, inflated, kernel->mark)});
      }
      break;
    case SpaceKind::Linked:
      for (const auto& image : inflated->images) {
        joints.push_back(Joint{image.first,
                               make_covering_unit(image.second, inflated, image.second->mark)});
      }
      break;
    default:
      break;
  }
  return joints;
}

}  // namespace navsql
