#include "utils.h"

#include <cstdio>
#include <fstream>

const char kSalesDataset[] = R"(
CREATE TABLE sales (id INTEGER PRIMARY KEY, region TEXT NOT NULL, rev INTEGER NOT NULL);
INSERT INTO sales VALUES
  (1, 'north', 100), (2, 'south', 90), (3, 'east', 80),
  (4, 'west', 70), (5, 'north', 60), (6, 'south', 50);
)";

const char kTop3Query[] = "SELECT id, rev FROM sales ORDER BY rev DESC LIMIT 3";
const char kTop3Hardcoded[] = "SELECT 1 AS id, 100 AS rev UNION SELECT 2,90 UNION SELECT 3,80";

void WriteProblem(const std::filesystem::path& root, int id, const nlohmann::json& meta,
                  const std::string& dataset_sql) {
  char name[16];
  snprintf(name, sizeof(name), "%04d", id);
  std::filesystem::path dir = root / name;
  std::filesystem::create_directories(dir);
  std::ofstream(dir / "problem.json") << meta.dump(2);
  std::ofstream(dir / meta.value("dataset", std::string("dataset.sql"))) << dataset_sql;
}

Problem MakeProblem(const nlohmann::json& expected, ValidationConfig cfg) {
  nlohmann::json meta = {
    {"tables", {{"sales", {"id", "region", "rev"}}}},
    {"expected", expected},
  };
  Problem problem = ParseProblem(1, meta, "/nonexistent");
  problem.validation = cfg;
  return problem;
}

nlohmann::json Cell(const nlohmann::json& value) {
  nlohmann::json row = nlohmann::json::array();
  row.push_back(value);
  nlohmann::json rows = nlohmann::json::array();
  rows.push_back(std::move(row));
  return rows;
}
