#pragma once

#include <string>
#include <vector>

namespace cmdvec::catalog {

struct CommandRecord {
  std::string command;
  std::string description;
  std::vector<std::string> keywords;
  std::vector<std::string> tags;
  std::string niche;
  std::vector<std::string> platform;
  bool pipeline = false;
};

} // namespace cmdvec::catalog
