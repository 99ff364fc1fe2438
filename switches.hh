#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace BezierFit {

// Conversion of a switch value; the numeric ones throw InvalidInput on junk
template <typename T>
T extractValue(std::string str) {
  throw std::runtime_error("no conversion for switch value \"" + str + "\"");
}

template <> bool extractValue(std::string str);
template <> size_t extractValue(std::string str);
template <> double extractValue(std::string str);
template <> std::string extractValue(std::string str);

// Looks for "--name" or "--name=value" (exact name match).
// nullopt: absent; empty string: present without a value.
std::optional<std::string> findSwitch(const std::vector<std::string> &switches,
                                      const std::string &name);

// Returns true when the switch is given. `value` receives the converted value part,
// or `default_value` when there is none.
template <typename T>
bool parseSwitch(const std::vector<std::string> &switches, const std::string &name,
                 T *value = nullptr, T default_value = T()) {
  auto found = findSwitch(switches, name);
  if (value)
    *value = found && !found->empty() ? extractValue<T>(*found) : default_value;
  return found.has_value();
}

// On/off switch: "--name" and "--name=true|false|yes|no|1|0"; false when absent
bool parseFlag(const std::vector<std::string> &switches, const std::string &name);

// argv[first..argc) as switches; throws InvalidInput on anything not starting with "--"
std::vector<std::string> collectSwitches(int argc, char **argv, int first);

}
