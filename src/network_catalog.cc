#include "network_catalog.hh"
#include "spdlog/fmt/fmt.h"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <fstream>
#include <set>
#include <sstream>

namespace link_rank {

namespace {
std::string Trim(const std::string &value) {
  const char *whitespace = " \t\r\n";
  auto begin = value.find_first_not_of(whitespace);
  if (begin == std::string::npos) {
    return "";
  }
  auto end = value.find_last_not_of(whitespace);
  return value.substr(begin, end - begin + 1);
}

std::vector<std::string> SplitRow(const std::string &line) {
  std::vector<std::string> fields;
  std::istringstream iss(line);
  std::string field;
  while (std::getline(iss, field, ',')) {
    field = Trim(field);
    // Plain quoting only, no embedded commas
    if (field.size() >= 2 && field.front() == '"' && field.back() == '"') {
      field = Trim(field.substr(1, field.size() - 2));
    }
    fields.push_back(field);
  }
  // A trailing comma leaves an empty last field
  if (!line.empty() && line.back() == ',') {
    fields.emplace_back();
  }
  return fields;
}
} // namespace

std::optional<Network> ParseEdgeList(std::istream &in) {
  std::string line;
  if (!std::getline(in, line)) {
    spdlog::error("Edge list is empty, expected a source,target header");
    return std::nullopt;
  }

  auto header = SplitRow(line);
  std::optional<size_t> source_col;
  std::optional<size_t> target_col;
  for (size_t i = 0; i < header.size(); ++i) {
    if (header[i] == "source") {
      source_col = i;
    } else if (header[i] == "target") {
      target_col = i;
    }
  }
  if (!source_col || !target_col) {
    spdlog::error("Edge list header must contain source and target columns");
    return std::nullopt;
  }
  const size_t min_fields = std::max(*source_col, *target_col) + 1;

  Network network;
  std::set<std::string> labels;
  size_t line_no = 1;
  while (std::getline(in, line)) {
    ++line_no;
    if (Trim(line).empty()) {
      continue;
    }
    auto fields = SplitRow(line);
    if (fields.size() < min_fields) {
      spdlog::warn("Skipping malformed edge list row {}: '{}'", line_no, line);
      continue;
    }
    const auto &source = fields[*source_col];
    const auto &target = fields[*target_col];
    network.edges.emplace_back(source, target);
    labels.insert(source);
    labels.insert(target);
  }

  network.nodes.assign(labels.begin(), labels.end());
  return network;
}

std::optional<Network> LoadNetworkFromCsv(const std::string &csv_path) {
  std::ifstream file(csv_path);
  if (!file) {
    spdlog::error("Unable to open edge list {}", csv_path);
    return std::nullopt;
  }
  auto network = ParseEdgeList(file);
  if (!network) {
    spdlog::error("Unable to parse edge list {}", csv_path);
    return std::nullopt;
  }
  network->csv_file = csv_path;
  spdlog::info("Loaded {} nodes and {} edges from {}", network->nodes.size(),
               network->edges.size(), csv_path);
  return network;
}

bool NetworkCatalog::Add(Network network) {
  auto type = network.type;
  auto [it, inserted] = networks_.emplace(
      type, std::make_shared<const Network>(std::move(network)));
  if (!inserted) {
    spdlog::error("Network type {} is already registered", type);
  }
  return inserted;
}

bool NetworkCatalog::AddFromCsv(const std::string &type,
                                const std::string &name,
                                const std::string &description,
                                const std::string &csv_path) {
  auto network = LoadNetworkFromCsv(csv_path);
  if (!network) {
    return false;
  }
  network->type = type;
  network->name = name;
  network->description =
      fmt::format("{} ({} nodes, {} edges)", description,
                  network->nodes.size(), network->edges.size());
  return Add(std::move(*network));
}

std::shared_ptr<const Network>
NetworkCatalog::Get(const std::string &type) const {
  if (auto it = networks_.find(type); it != networks_.end()) {
    return it->second;
  }
  return nullptr;
}

std::vector<std::shared_ptr<const Network>> NetworkCatalog::List() const {
  std::vector<std::shared_ptr<const Network>> networks;
  networks.reserve(networks_.size());
  for (const auto &[type, network] : networks_) {
    networks.push_back(network);
  }
  return networks;
}

} // namespace link_rank
