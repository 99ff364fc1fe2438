#include <cstdlib>

#include "bezier.hh"
#include "switches.hh"

namespace BezierFit {

template <>
bool extractValue(std::string str) {
  if (str == "true" || str == "yes" || str == "1")
    return true;
  if (str == "false" || str == "no" || str == "0")
    return false;
  throw InvalidInput("not a boolean: " + str);
}

template <>
size_t extractValue(std::string str) {
  char *end;
  long value = std::strtol(str.c_str(), &end, 10);
  if (str.empty() || *end != '\0' || value < 0)
    throw InvalidInput("not a non-negative integer: " + str);
  return value;
}

template <>
double extractValue(std::string str) {
  char *end;
  double value = std::strtod(str.c_str(), &end);
  if (str.empty() || *end != '\0')
    throw InvalidInput("not a number: " + str);
  return value;
}

template <>
std::string extractValue(std::string str) {
  return str;
}

std::optional<std::string> findSwitch(const std::vector<std::string> &switches,
                                      const std::string &name) {
  auto prefix = "--" + name;
  for (const auto &sw : switches) {
    if (sw.compare(0, prefix.size(), prefix) != 0)
      continue;
    if (sw.size() == prefix.size())
      return std::string();
    if (sw[prefix.size()] == '=')
      return sw.substr(prefix.size() + 1);
  }
  return std::nullopt;
}

bool parseFlag(const std::vector<std::string> &switches, const std::string &name) {
  bool value;
  return parseSwitch<bool>(switches, name, &value, true) && value;
}

std::vector<std::string> collectSwitches(int argc, char **argv, int first) {
  std::vector<std::string> switches;
  for (int i = first; i < argc; ++i) {
    std::string sw = argv[i];
    if (sw.size() < 3 || sw[0] != '-' || sw[1] != '-')
      throw InvalidInput("invalid switch: " + sw);
    switches.push_back(sw);
  }
  return switches;
}

}
