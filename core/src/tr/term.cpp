#include "term.h"

#include <sstream>

namespace navsql {

int Routes::find(const CodePtr& unit) const {
  auto it = index_.find(unit);
  if (it == index_.end()) return -1;
  return entries_[it->second].second;
}

int Routes::at(const CodePtr& unit) const {
  int tag = find(unit);
  internal_check(tag >= 0, "a unit is routed before it is used");
  return tag;
}

void Routes::set(const CodePtr& unit, int tag) {
  auto it = index_.find(unit);
  if (it != index_.end()) {
    entries_[it->second].second = tag;
    return;
  }
  index_.emplace(unit, entries_.size());
  entries_.emplace_back(unit, tag);
}

void Routes::update(const Routes& other) {
  for (const auto& entry : other) set(entry.first, entry.second);
}

namespace {

std::shared_ptr<Term> start_term(TermKind kind, int tag, std::vector<TermPtr> kids,
                                 SpacePtr space, SpacePtr baseline, Routes routes) {
  internal_check(baseline && baseline->is_inflated, "a term baseline is an inflated space");
  auto term = std::make_shared<Term>();
  term->kind = kind;
  term->tag = tag;
  term->kids = std::move(kids);
  term->backbone = inflate(space);
  term->space = std::move(space);
  term->baseline = std::move(baseline);
  term->routes = std::move(routes);
  for (const auto& kid : term->kids) {
    term->offsprings[kid->tag] = kid->tag;
    for (const auto& entry : kid->offsprings) {
      term->offsprings[entry.first] = kid->tag;
    }
  }
  return term;
}

const char* kind_name(TermKind kind) {
  switch (kind) {
    case TermKind::Scalar: return "Scalar";
    case TermKind::Table: return "Table";
    case TermKind::Filter: return "Filter";
    case TermKind::Join: return "Join";
    case TermKind::Embedding: return "Embedding";
    case TermKind::Correlation: return "Correlation";
    case TermKind::Projection: return "Projection";
    case TermKind::Order: return "Order";
    case TermKind::Wrapper: return "Wrapper";
    case TermKind::Permanent: return "Permanent";
    case TermKind::Segment: return "Segment";
  }
  return "?";
}

void write_term(std::ostream& os, const TermPtr& term, int depth) {
  os << std::string(static_cast<size_t>(depth) * 2, ' ') << kind_name(term->kind) << " #"
     << term->tag << " " << space_to_string(term->space);
  switch (term->kind) {
    case TermKind::Filter:
      os << " ? " << code_to_string(term->filter);
      break;
    case TermKind::Join: {
      os << (term->is_left ? " left" : " inner") << " on";
      for (const auto& joint : term->joints) {
        os << " " << code_to_string(joint.lop) << "=" << code_to_string(joint.rop);
      }
      break;
    }
    case TermKind::Projection:
      os << " ^";
      for (const auto& kernel : term->kernels) os << " " << code_to_string(kernel);
      break;
    case TermKind::Order:
      for (const auto& item : term->order) {
        os << " " << code_to_string(item.first) << (item.second < 0 ? "-" : "+");
      }
      if (term->limit) os << " limit " << *term->limit;
      if (term->offset) os << " offset " << *term->offset;
      break;
    default:
      break;
  }
  os << "\n";
  for (const auto& kid : term->kids) write_term(os, kid, depth + 1);
}

}  // namespace

TermPtr make_scalar_term(int tag, SpacePtr space, SpacePtr baseline, Routes routes) {
  return start_term(TermKind::Scalar, tag, {}, std::move(space), std::move(baseline),
                    std::move(routes));
}

TermPtr make_table_term(int tag, SpacePtr space, SpacePtr baseline, Routes routes) {
  internal_check(space->family.kind == FamilyKind::Table, "a table term runs over a table space");
  return start_term(TermKind::Table, tag, {}, std::move(space), std::move(baseline),
                    std::move(routes));
}

TermPtr make_filter_term(int tag, TermPtr kid, CodePtr filter, SpacePtr space,
                         SpacePtr baseline, Routes routes) {
  internal_check(filter->domain->kind() == DomainKind::Boolean, "a term filter is boolean");
  auto term = start_term(TermKind::Filter, tag, {std::move(kid)}, std::move(space),
                         std::move(baseline), std::move(routes));
  term->filter = std::move(filter);
  return term;
}

TermPtr make_join_term(int tag, TermPtr lkid, TermPtr rkid, std::vector<Joint> joints,
                       bool is_left, bool is_right, SpacePtr space, SpacePtr baseline,
                       Routes routes) {
  auto term = start_term(TermKind::Join, tag, {std::move(lkid), std::move(rkid)},
                         std::move(space), std::move(baseline), std::move(routes));
  term->joints = std::move(joints);
  term->is_left = is_left;
  term->is_right = is_right;
  return term;
}

TermPtr make_embedding_term(int tag, TermPtr lkid, TermPtr rkid,
                            std::vector<CodePtr> correlations, SpacePtr space,
                            SpacePtr baseline, Routes routes) {
  internal_check(rkid->kind == TermKind::Correlation, "an embedded term is a correlation");
  auto term = start_term(TermKind::Embedding, tag, {std::move(lkid), std::move(rkid)},
                         std::move(space), std::move(baseline), std::move(routes));
  term->correlations = std::move(correlations);
  return term;
}

TermPtr make_correlation_term(int tag, TermPtr kid, SpacePtr space, SpacePtr baseline,
                              Routes routes) {
  return start_term(TermKind::Correlation, tag, {std::move(kid)}, std::move(space),
                    std::move(baseline), std::move(routes));
}

TermPtr make_projection_term(int tag, TermPtr kid, std::vector<CodePtr> kernels,
                             SpacePtr space, SpacePtr baseline, Routes routes) {
  auto term = start_term(TermKind::Projection, tag, {std::move(kid)}, std::move(space),
                         std::move(baseline), std::move(routes));
  term->kernels = std::move(kernels);
  return term;
}

TermPtr make_order_term(int tag, TermPtr kid, std::vector<OrderItem> order,
                        std::optional<int64_t> limit, std::optional<int64_t> offset,
                        SpacePtr space, SpacePtr baseline, Routes routes) {
  auto term = start_term(TermKind::Order, tag, {std::move(kid)}, std::move(space),
                         std::move(baseline), std::move(routes));
  term->order = std::move(order);
  term->limit = limit;
  term->offset = offset;
  return term;
}

TermPtr make_wrapper_term(int tag, TermPtr kid, SpacePtr space, SpacePtr baseline,
                          Routes routes) {
  return start_term(TermKind::Wrapper, tag, {std::move(kid)}, std::move(space),
                    std::move(baseline), std::move(routes));
}

TermPtr make_permanent_term(int tag, TermPtr kid, SpacePtr space, SpacePtr baseline,
                            Routes routes) {
  return start_term(TermKind::Permanent, tag, {std::move(kid)}, std::move(space),
                    std::move(baseline), std::move(routes));
}

TermPtr make_segment_term(int tag, TermPtr kid, std::vector<CodePtr> codes, SpacePtr space,
                          SpacePtr baseline, Routes routes) {
  auto term = start_term(TermKind::Segment, tag, {std::move(kid)}, std::move(space),
                         std::move(baseline), std::move(routes));
  term->codes = std::move(codes);
  return term;
}

std::string dump_term(const TermPtr& term) {
  if (!term) return "(empty)\n";
  std::ostringstream oss;
  write_term(oss, term, 0);
  return oss.str();
}

}  // namespace navsql
