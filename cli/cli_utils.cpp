#include "cli_utils.h"

#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "render/duckbox_renderer.h"
#include "ui/color.h"

namespace navsql::cli {

namespace {

using nlohmann::json;

std::vector<std::string> string_list(const json& value, const std::string& context) {
  if (!value.is_array()) throw std::runtime_error(context + ": expected a list of names");
  std::vector<std::string> out;
  for (const auto& item : value) {
    if (!item.is_string()) throw std::runtime_error(context + ": expected a list of names");
    out.push_back(item.get<std::string>());
  }
  return out;
}

/// Looks up `schema.table`, or a bare table name that is unique across schemas.
Table* find_table(std::unordered_map<std::string, Table*>& tables, const std::string& name) {
  auto it = tables.find(name);
  if (it == tables.end()) throw std::runtime_error("unknown table in foreign key: " + name);
  return it->second;
}

}  // namespace

std::string read_file(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw std::runtime_error("Failed to open file: " + path);
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

std::string read_stdin() {
  std::ostringstream buffer;
  buffer << std::cin.rdbuf();
  return buffer.str();
}

std::string colorize_json(const std::string& input, bool enable) {
  if (!enable) return input;
  std::string out;
  out.reserve(input.size() * 2);
  bool in_string = false;
  bool escape = false;
  for (size_t i = 0; i < input.size(); ++i) {
    char c = input[i];
    if (in_string) {
      if (escape) {
        escape = false;
      } else if (c == '\\') {
        escape = true;
      } else if (c == '"') {
        in_string = false;
        out += '"';
        out += kColor.reset;
        continue;
      }
      out += c;
      continue;
    }

    if (c == '"') {
      in_string = true;
      out += kColor.green;
      out += '"';
      continue;
    }

    if (std::isdigit(static_cast<unsigned char>(c)) || c == '-') {
      out += kColor.cyan;
      while (i < input.size() &&
             (std::isdigit(static_cast<unsigned char>(input[i])) || input[i] == '.' ||
              input[i] == '-' || input[i] == 'e' || input[i] == 'E' || input[i] == '+')) {
        out += input[i++];
      }
      --i;
      out += kColor.reset;
      continue;
    }

    if (input.compare(i, 4, "true") == 0 || input.compare(i, 4, "null") == 0) {
      out += kColor.yellow;
      out += input.substr(i, 4);
      out += kColor.reset;
      i += 3;
      continue;
    }
    if (input.compare(i, 5, "false") == 0) {
      out += kColor.yellow;
      out += "false";
      out += kColor.reset;
      i += 4;
      continue;
    }
    out += c;
  }
  return out;
}

DomainPtr domain_from_name(const std::string& name) {
  if (name == "boolean") return Domain::boolean();
  if (name == "integer") return Domain::integer();
  if (name == "float") return Domain::floating();
  if (name == "decimal") return Domain::decimal();
  if (name == "text") return Domain::text();
  if (name == "date") return Domain::date();
  if (name == "time") return Domain::time();
  if (name == "datetime") return Domain::datetime();
  return Domain::opaque(name);
}

std::unique_ptr<Catalog> load_catalog(const std::string& json_text) {
  json document;
  try {
    document = json::parse(json_text);
  } catch (const json::parse_error& ex) {
    throw std::runtime_error(std::string("invalid catalog JSON: ") + ex.what());
  }
  if (!document.is_object() || !document.contains("schemas") || !document["schemas"].is_array()) {
    throw std::runtime_error("catalog JSON must hold a \"schemas\" list");
  }

  auto catalog = std::make_unique<Catalog>();
  std::unordered_map<std::string, Table*> tables;
  std::unordered_map<std::string, int> bare_names;
  for (const auto& schema_json : document["schemas"]) {
    std::string schema_name = schema_json.value("name", std::string("public"));
    Schema& schema = catalog->add_schema(schema_name);
    for (const auto& table_json : schema_json.value("tables", json::array())) {
      std::string table_name = table_json.at("name").get<std::string>();
      std::string context = schema_name + "." + table_name;
      Table& table = schema.add_table(table_name);
      for (const auto& column_json : table_json.value("columns", json::array())) {
        std::string type = column_json.value("type", std::string("text"));
        DomainPtr domain;
        if (type == "enum") {
          domain = Domain::enumeration(
              string_list(column_json.value("labels", json::array()), context));
        } else {
          domain = domain_from_name(type);
        }
        table.add_column(column_json.at("name").get<std::string>(), domain,
                         column_json.value("nullable", true), column_json.value("default", false));
      }
      try {
        if (table_json.contains("primary_key")) {
          table.add_unique_key(string_list(table_json["primary_key"], context), true);
        }
        for (const auto& key : table_json.value("unique_keys", json::array())) {
          table.add_unique_key(string_list(key, context), false);
        }
      } catch (const std::invalid_argument& ex) {
        throw std::runtime_error(context + ": " + ex.what());
      }
      tables[context] = &table;
      ++bare_names[table_name];
      tables.emplace(table_name, &table);
    }
  }
  // WHY: a bare table name is only usable in foreign keys when it is unique.
  for (const auto& entry : bare_names) {
    if (entry.second > 1) tables.erase(entry.first);
  }

  for (const auto& key_json : document.value("foreign_keys", json::array())) {
    Table* origin = find_table(tables, key_json.at("origin").get<std::string>());
    Table* target = find_table(tables, key_json.at("target").get<std::string>());
    std::string context = "foreign key " + origin->name() + " -> " + target->name();
    try {
      catalog->add_foreign_key(*origin, string_list(key_json.at("columns"), context), *target,
                               string_list(key_json.at("target_columns"), context),
                               key_json.value("partial", false));
    } catch (const std::invalid_argument& ex) {
      throw std::runtime_error(context + ": " + ex.what());
    }
  }
  return catalog;
}

Environment build_environment(const std::vector<std::pair<std::string, std::string>>& params) {
  Environment environment;
  for (const auto& param : params) {
    environment[param.first] = ParameterValue{Value::text(param.second), Domain::untyped()};
  }
  return environment;
}

Dialect parse_dialect(const std::string& name) {
  if (name == "ansi") return Dialect::Ansi;
  if (name == "pgsql") return Dialect::PgSql;
  if (name == "sqlite") return Dialect::Sqlite;
  throw std::invalid_argument("unknown dialect: " + name);
}

std::string build_plan_json(const Plan& plan) {
  json out = json::object();
  out["sql"] = plan.sql;
  json domains = json::array();
  for (const auto& domain : plan.domains) domains.push_back(domain->to_string());
  out["domains"] = domains;
  json placeholders = json::array();
  for (const auto& placeholder : plan.placeholders) {
    placeholders.push_back({{"index", placeholder.index},
                            {"name", placeholder.name},
                            {"domain", placeholder.domain->to_string()}});
  }
  out["placeholders"] = placeholders;
  json fields = json::array();
  for (size_t i = 0; i < plan.profile.fields.size(); ++i) {
    const Field& field = plan.profile.fields[i];
    json item = {{"title", field.title}, {"domain", field.domain->to_string()}};
    if (i < plan.outputs.size()) item["select"] = plan.outputs[i];
    fields.push_back(item);
  }
  out["profile"] = {{"tag", plan.profile.tag}, {"fields", fields}};
  return out.dump(2);
}

std::string render_plan_duckbox(const Plan& plan, bool highlight, bool is_tty) {
  std::vector<render::DuckboxRow> rows;
  for (size_t i = 0; i < plan.profile.fields.size(); ++i) {
    const Field& field = plan.profile.fields[i];
    render::DuckboxRow row{std::string("field"), field.title, field.domain->to_string(),
                           std::nullopt};
    if (i < plan.outputs.size()) row[3] = std::to_string(plan.outputs[i] + 1);
    rows.push_back(std::move(row));
  }
  for (const auto& placeholder : plan.placeholders) {
    rows.push_back(render::DuckboxRow{std::string("parameter"), "$" + placeholder.name,
                                      placeholder.domain->to_string(),
                                      std::to_string(placeholder.index + 1)});
  }
  render::DuckboxOptions options;
  options.highlight = highlight;
  options.is_tty = is_tty;
  std::vector<render::DuckboxColumn> columns{{"kind", Domain::text()},
                                              {"name", Domain::text()},
                                              {"type", Domain::text()},
                                              {"position", Domain::integer()}};
  return render::render_duckbox(columns, rows, options);
}

}  // namespace navsql::cli
