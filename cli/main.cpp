#include <cstdio>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

#include <unistd.h>

#include "cli_args.h"
#include "cli_utils.h"
#include "config.h"
#include "navsql/navsql.h"
#include "ui/color.h"

namespace {

using navsql::cli::kColor;

int fail(const std::string& message) {
  std::cerr << kColor.red << "Error: " << kColor.reset << message << std::endl;
  return 1;
}

void print_explanation(const navsql::Explanation& explanation) {
  for (const auto& stage : explanation.stages) {
    std::cout << kColor.dim << "== " << stage.first << " ==" << kColor.reset << "\n";
    std::cout << stage.second;
    if (!stage.second.empty() && stage.second.back() != '\n') std::cout << "\n";
  }
}

}  // namespace

int main(int argc, char** argv) {
  using namespace navsql::cli;

  if (argc == 1) {
    print_startup_help(std::cout);
    return 0;
  }

  CliOptions options;
  std::string error;
  if (!parse_cli_args(argc, argv, options, error)) {
    return fail(error);
  }
  if (options.show_help) {
    print_help(std::cout);
    return 0;
  }

  CliSettings settings;
  std::string config_path = resolve_config_path();
  if (!load_config(config_path, settings, error) && !error.empty()) {
    return fail(error);
  }

  bool is_tty = isatty(fileno(stdout)) != 0;
  bool color = options.color.value_or(settings.color.value_or(true)) && is_tty;
  if (!color) disable_color();
  std::string mode = options.output_mode.value_or(settings.output_mode.value_or("sql"));

  navsql::TranslateOptions translate_options;
  translate_options.limit = options.limit ? options.limit : settings.limit;
  translate_options.explain = options.explain;

  try {
    translate_options.dialect =
        parse_dialect(options.dialect.value_or(settings.dialect.value_or("ansi")));
    if (options.catalog.empty()) {
      return fail("Missing --catalog <file.json>");
    }
    std::unique_ptr<navsql::Catalog> catalog = load_catalog(read_file(options.catalog));

    std::string query = options.query;
    if (query.empty() && !options.query_file.empty()) {
      query = read_file(options.query_file);
    } else if (query.empty()) {
      query = read_stdin();
    }

    navsql::Environment environment = build_environment(options.params);
    navsql::Pipe pipe = navsql::translate(query, *catalog, environment, translate_options);
    const navsql::Plan& plan = pipe.plan();

    if (options.explain) print_explanation(pipe.explanation());
    if (mode == "json") {
      std::cout << colorize_json(build_plan_json(plan), color) << std::endl;
    } else if (mode == "plan") {
      std::cout << render_plan_duckbox(plan, color, is_tty) << std::endl;
    } else if (plan.sql.empty()) {
      std::cout << kColor.dim << "(the query selects nothing)" << kColor.reset << std::endl;
    } else {
      std::cout << plan.sql << std::endl;
    }
  } catch (const navsql::Error& ex) {
    return fail(ex.describe());
  } catch (const std::exception& ex) {
    return fail(ex.what());
  }
  return 0;
}
