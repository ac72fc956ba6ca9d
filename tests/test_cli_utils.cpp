#include "test_harness.h"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>

#include "cli_args.h"
#include "cli_utils.h"
#include "config.h"
#include "render/duckbox_renderer.h"
#include "test_utils.h"

namespace {

const char* kCatalogJson = R"({
  "schemas": [
    {
      "name": "ad",
      "tables": [
        {
          "name": "school",
          "columns": [
            {"name": "code", "type": "text", "nullable": false},
            {"name": "name", "type": "text", "nullable": false},
            {"name": "campus", "type": "enum", "labels": ["old", "north"]}
          ],
          "primary_key": ["code"]
        },
        {
          "name": "department",
          "columns": [
            {"name": "code", "type": "text", "nullable": false},
            {"name": "school_code", "type": "text", "nullable": false}
          ],
          "primary_key": ["code"]
        }
      ]
    }
  ],
  "foreign_keys": [
    {"origin": "ad.department", "columns": ["school_code"],
     "target": "school", "target_columns": ["code"]}
  ]
})";

std::string write_temp(const std::string& name, const std::string& content) {
  std::filesystem::path path = std::filesystem::temp_directory_path() / name;
  std::ofstream out(path);
  out << content;
  return path.string();
}

bool parse_args(std::vector<std::string> args, navsql::cli::CliOptions& options,
                std::string& error) {
  args.insert(args.begin(), "navsql");
  std::vector<char*> argv;
  for (auto& arg : args) argv.push_back(arg.data());
  return navsql::cli::parse_cli_args(static_cast<int>(argv.size()), argv.data(), options, error);
}

void test_load_config_values() {
  std::string path = write_temp("navsql_test_config.toml",
                                "# defaults\n"
                                "[translate]\n"
                                "limit = 25\n"
                                "dialect = \"pgsql\"\n"
                                "[output]\n"
                                "mode = 'json'\n"
                                "color = false\n");
  navsql::cli::CliSettings settings;
  std::string error;
  expect_true(navsql::cli::load_config(path, settings, error), "config loads");
  expect_true(settings.limit && *settings.limit == 25, "limit is read");
  expect_true(settings.dialect && *settings.dialect == "pgsql", "quoted dialect is read");
  expect_true(settings.output_mode && *settings.output_mode == "json", "single quotes work");
  expect_true(settings.color && !*settings.color, "color flag is read");
  std::filesystem::remove(path);
}

void test_load_config_errors() {
  std::string path = write_temp("navsql_test_bad_config.toml", "[translate]\n\nlimit = -3\n");
  navsql::cli::CliSettings settings;
  std::string error;
  expect_true(!navsql::cli::load_config(path, settings, error), "negative limit rejected");
  expect_str(error, "Invalid translate.limit at line 3", "error names the line");
  std::filesystem::remove(path);

  error.clear();
  expect_true(!navsql::cli::load_config("/nonexistent/navsql.toml", settings, error),
              "missing file is not loaded");
  expect_true(error.empty(), "missing file is not an error");
}

void test_parse_cli_args() {
  navsql::cli::CliOptions options;
  std::string error;
  bool ok = parse_args({"--catalog", "c.json", "--query", "/school", "--param", "c=eng",
                        "--limit", "5", "--dialect", "sqlite", "--mode", "plan", "--explain"},
                       options, error);
  expect_true(ok, "valid arguments parse");
  expect_str(options.catalog, "c.json", "catalog path");
  expect_str(options.query, "/school", "query text");
  expect_eq(options.params.size(), 1, "one parameter");
  expect_true(options.limit && *options.limit == 5, "limit");
  expect_true(options.dialect && *options.dialect == "sqlite", "dialect");
  expect_true(options.output_mode && *options.output_mode == "plan", "mode");
  expect_true(options.explain, "explain flag");
}

void test_parse_cli_args_errors() {
  navsql::cli::CliOptions options;
  std::string error;
  expect_true(!parse_args({"--frobnicate"}, options, error), "unknown flag rejected");
  expect_str(error, "Unknown or incomplete argument: --frobnicate", "unknown flag message");

  error.clear();
  expect_true(!parse_args({"--query"}, options, error), "missing value rejected");
  expect_str(error, "Unknown or incomplete argument: --query", "missing value message");

  error.clear();
  expect_true(!parse_args({"--limit", "9x"}, options, error), "bad limit rejected");
  expect_contains(error, "Invalid --limit value", "limit message");

  error.clear();
  expect_true(!parse_args({"--param", "=x"}, options, error), "nameless parameter rejected");
}

void test_load_catalog() {
  auto catalog = navsql::cli::load_catalog(kCatalogJson);
  const navsql::Schema* schema = catalog->find_schema("ad");
  expect_true(schema != nullptr, "schema is loaded");
  if (!schema) return;
  const navsql::Table* school = schema->find_table("school");
  expect_true(school != nullptr, "table is loaded");
  if (!school) return;
  const navsql::Column* campus = school->find_column("campus");
  expect_true(campus && campus->domain->kind() == navsql::DomainKind::Enum,
              "enum columns keep their labels");
  std::string sql = navsql::translate("/school{code, count(department)}", *catalog).plan().sql;
  expect_contains(sql, "\"ad\".\"department\"", "foreign keys become links");
}

void test_load_catalog_errors() {
  std::string message;
  try {
    navsql::cli::load_catalog(R"({"schemas": [], "foreign_keys": [
        {"origin": "a", "columns": ["x"], "target": "b", "target_columns": ["y"]}]})");
  } catch (const std::runtime_error& ex) {
    message = ex.what();
  }
  expect_str(message, "unknown table in foreign key: a", "unknown tables are reported");

  message.clear();
  try {
    navsql::cli::load_catalog("{\"tables\": []}");
  } catch (const std::runtime_error& ex) {
    message = ex.what();
  }
  expect_contains(message, "\"schemas\"", "a schemas list is required");

  message.clear();
  try {
    navsql::cli::load_catalog("{not json");
  } catch (const std::runtime_error& ex) {
    message = ex.what();
  }
  expect_contains(message, "invalid catalog JSON", "syntax errors are reported");
}

void test_dialect_and_environment() {
  expect_true(navsql::cli::parse_dialect("pgsql") == navsql::Dialect::PgSql, "pgsql");
  bool threw = false;
  try {
    navsql::cli::parse_dialect("oracle");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  expect_true(threw, "unknown dialect rejected");

  navsql::Environment environment = navsql::cli::build_environment({{"c", "eng"}});
  expect_eq(environment.size(), 1, "one entry per parameter");
  expect_true(environment["c"].value == navsql::Value::text("eng"), "value is text");
  expect_true(environment["c"].domain->kind() == navsql::DomainKind::Untyped,
              "CLI parameters are untyped");
}

void test_plan_outputs() {
  auto catalog = make_university_catalog();
  navsql::Environment environment = navsql::cli::build_environment({{"c", "eng"}});
  navsql::TranslateOptions options;
  options.dialect = navsql::Dialect::PgSql;
  navsql::Plan plan =
      navsql::translate("/school{code, name}?code=$c", *catalog, environment, options).plan();

  std::string json = navsql::cli::build_plan_json(plan);
  expect_contains(json, "\"sql\"", "SQL is included");
  expect_contains(json, "\"name\": \"c\"", "placeholders are named");
  expect_contains(json, "\"title\": \"code\"", "profile fields are listed");
  expect_contains(json, "\"tag\": \"school\"", "profile tag is listed");

  std::string box = navsql::cli::render_plan_duckbox(plan, false, false);
  expect_contains(box, "parameter", "placeholders appear in the table");
  expect_contains(box, "$c", "parameters are shown by name");
}

void test_duckbox_null_cells() {
  navsql::render::DuckboxOptions options;
  options.highlight = false;
  options.max_width = 80;
  std::string box = navsql::render::render_duckbox(
      {{"name", navsql::Domain::text()}, {"credits", navsql::Domain::integer()}},
      {{std::string("Lab"), std::nullopt}, {std::string("Art"), std::string("3")}}, options);
  expect_contains(box, "NULL", "missing cells print as NULL");
  expect_contains(box, "credits", "titles are printed");
  expect_contains(box, "integer", "the type line names the domain");
  expect_contains(box, "│ Art  │       3 │", "numeric domains are right-aligned");
}

}  // namespace

void register_cli_utils_tests(std::vector<TestCase>& tests) {
  tests.push_back({"cli_load_config_values", test_load_config_values});
  tests.push_back({"cli_load_config_errors", test_load_config_errors});
  tests.push_back({"cli_parse_args", test_parse_cli_args});
  tests.push_back({"cli_parse_args_errors", test_parse_cli_args_errors});
  tests.push_back({"cli_load_catalog", test_load_catalog});
  tests.push_back({"cli_load_catalog_errors", test_load_catalog_errors});
  tests.push_back({"cli_dialect_and_environment", test_dialect_and_environment});
  tests.push_back({"cli_plan_outputs", test_plan_outputs});
  tests.push_back({"cli_duckbox_null_cells", test_duckbox_null_cells});
}
