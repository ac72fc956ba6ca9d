#pragma once

#include <vector>

#include "space.h"

namespace navsql {

/// One equality condition attaching a term to another: lop from the left, rop from the right.
struct Joint {
  CodePtr lop;
  CodePtr rop;
};

/// Returns the ordering of the space as (code, direction) pairs without duplicates.
/// MUST list explicit sort keys when with_strong is set and the implicit key columns
/// (primary key, first non-null unique key, else all columns) when with_weak is set.
/// Inputs are any space; outputs belong to the space or its inflation.
std::vector<OrderItem> arrange(const SpacePtr& space, bool with_strong = true,
                               bool with_weak = true);

/// Returns the units every term compiled for the space exports natively.
std::vector<CodePtr> spread(const SpacePtr& space);

/// Returns joints attaching two parallel terms of the same axis.
/// MUST throw Error "unable to connect a table lacking a primary key" when a table
/// has neither a primary key nor a non-null complete unique key.
/// Inputs are any space; units in the joints belong to its inflation.
std::vector<Joint> sew(const SpacePtr& space);

/// Returns joints attaching the term of an axis to the term of its base.
std::vector<Joint> tie(const SpacePtr& space);

}  // namespace navsql
