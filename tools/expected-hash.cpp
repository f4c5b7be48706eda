#include <fstream>
#include <sstream>
#include <iostream>

#include <argparse/argparse.hpp>
#include <nlohmann/json.hpp>
#include <sqljudge/paths.h>
#include <sqljudge/problem.h>
#include <sqljudge/sandbox.h>
#include <sqljudge/validator.h>

// Print the "expected" block of problem.json for a reference query.
int main(int argc, char** argv) {
  argparse::ArgumentParser parser("sqljudge-hash");
  parser.add_argument("query_file")
    .help("File holding the reference query");
  parser.add_argument("-d", "--dataset")
    .help("Dataset (.sql seed script or SQLite database)");
  parser.add_argument("-p", "--problem")
    .scan<'d', int>()
    .help("Take dataset and limits from this problem");
  parser.add_argument("--problem-root")
    .help("Problem directory root");
  parser.add_argument("--unordered")
    .default_value(false)
    .implicit_value(true)
    .help("Hash rows in canonical order");
  parser.add_argument("--values")
    .default_value(false)
    .implicit_value(true)
    .help("Print columns and rows instead of a hash");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    return 1;
  }

  SandboxOptions opt;
  opt.time_limit = kDefaultTimeLimit;
  opt.max_rows = 0;
  if (auto root = parser.present("--problem-root")) kProblemRoot = *root;
  if (auto id = parser.present<int>("--problem")) {
    ProblemCatalog catalog;
    auto problem = catalog.Get(*id);
    if (!problem) {
      std::cerr << "Problem " << *id << " not found under " << kProblemRoot << std::endl;
      return 1;
    }
    opt.dataset = problem->dataset.string();
    opt.time_limit = problem->time_limit;
  }
  if (auto dataset = parser.present("--dataset")) opt.dataset = *dataset;
  if (opt.dataset.empty()) {
    std::cerr << "Either --dataset or --problem is required" << std::endl;
    return 1;
  }

  std::ifstream fin(parser.get<std::string>("query_file"));
  if (!fin) {
    std::cerr << "Cannot read query file" << std::endl;
    return 1;
  }
  std::stringstream ss;
  ss << fin.rdbuf();
  opt.sql = ss.str();

  SandboxResult res = RunQuery(opt);
  if (res.status != SandboxStatus::OK) {
    std::cerr << SandboxStatusName(res.status) << ": " << res.error << std::endl;
    return 1;
  }
  nlohmann::json out;
  if (parser["--values"] == true) {
    out = {{"columns", res.result.columns}, {"rows", res.result.rows}};
  } else {
    bool order_sensitive = parser["--unordered"] == false;
    out = {{"hash", ResultHash(res.result.rows, order_sensitive)},
           {"row_count", res.result.rows.size()}};
  }
  std::cout << out.dump(2) << std::endl;
  return 0;
}
