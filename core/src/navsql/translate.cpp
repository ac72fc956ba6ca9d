#include <algorithm>
#include <functional>
#include <memory>
#include <string>

#include "bind/binder.h"
#include "navsql/navsql.h"
#include "syntax/syntax.h"
#include "tr/assemble.h"
#include "tr/compile.h"
#include "tr/dump.h"
#include "tr/encode.h"
#include "tr/reduce.h"
#include "tr/rewrite.h"

namespace navsql {

namespace {

Profile make_profile(const Binding& collect) {
  Profile profile;
  profile.tag = collect.title;
  const Binding& seed = *collect.seed;
  if (seed.kind == BindingKind::Selection) {
    for (const auto& element : seed.elements) {
      profile.fields.push_back(Field{element->title, element->domain});
    }
  } else {
    profile.fields.push_back(Field{seed.title, seed.domain});
  }
  return profile;
}

Error parse_failure(const ParseError& error, const std::shared_ptr<const std::string>& text) {
  size_t start = std::min(error.position, text->size());
  size_t end = std::min(start + 1, text->size());
  return Error(error.message, Mark(text, start, end));
}

}  // namespace

Pipe translate(const std::string& query, const Catalog& catalog,
               const Environment& environment, const TranslateOptions& options) {
  auto text = std::make_shared<const std::string>(query);
  ParseResult parsed = parse_query(query);
  if (parsed.error) throw parse_failure(*parsed.error, text);

  Explanation explanation;
  auto stage = [&](const char* name, const std::function<std::string()>& render) {
    if (options.explain) explanation.stages.emplace_back(name, render());
  };

  Binder binder(catalog, environment, text);
  BindingPtr binding = binder.bind_query(*parsed.query, options.limit);
  Plan plan;
  // WHY: a bare `/` selects nothing; the pipe then returns an empty product.
  if (!binding) return Pipe(std::move(plan), environment, std::move(explanation));
  plan.profile = make_profile(*binding);
  stage("binding", [&] { return dump_binding(binding); });

  Encoder encoder;
  Segment segment = encoder.collect(binding);
  stage("encoded", [&] { return dump_segment(segment); });

  Rewriter rewriter(segment.root);
  segment = rewriter.run(segment);
  stage("rewritten", [&] { return dump_segment(segment); });

  Compiler compiler(segment.root);
  TermPtr term = compiler.compile_segment(segment);
  stage("compiled", [&] { return dump_term(term); });

  Assembler assembler;
  FramePtr frame = assembler.assemble_segment(term);
  stage("assembled", [&] { return dump_frame(frame); });

  Reducer reducer;
  frame = reducer.run(frame);
  stage("reduced", [&] { return dump_frame(frame); });

  Serializer serializer(options.dialect);
  SqlStatement statement = serializer.serialize(frame);
  plan.sql = std::move(statement.sql);
  plan.placeholders = std::move(statement.placeholders);
  for (const auto& phrase : frame->select) plan.domains.push_back(phrase->domain);
  plan.outputs = frame->outputs;
  stage("serialized", [&] { return plan.sql + "\n"; });

  return Pipe(std::move(plan), environment, std::move(explanation));
}

}  // namespace navsql
