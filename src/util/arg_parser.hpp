#ifndef UTIL_ARG_PARSER_H_
#define UTIL_ARG_PARSER_H_

#include <map>
#include <string>
#include <tuple>
#include <vector>

namespace lensgen {

using ArgParseResult = std::map<std::string, std::vector<std::string>>;

/**
 * @brief A parser to parse command line arguments.
 *
 * A typical call looks like:
 * ~~~bash
 * lensgen -f config.json -o out --prefix slice_ -vs
 * ~~~
 * `-f` and `-o` are single letter options with one value. `-vs` is the compact form of `-v` and `-s`.
 * `--prefix` is a full option name.
 *
 * An option registered with `value_num > 0` is required and must be followed by exactly that many values.
 * `value_num == 0` declares a flag, and `value_num < 0` an option taking any number of values up to the next
 * option.
 *
 * There are no positional arguments. A term that is neither an option nor a value of one makes Parse() throw
 * std::invalid_argument.
 */
class ArgParser {
 public:
  void AddArgument(const std::string& name, int value_num, const std::string& metavar, const std::string& help_msg);
  ArgParseResult Parse(int argc, char** argv) const;

  void ShowHelp(const char* cmd) const;

 private:
  std::map<std::string, int> option_value_num_;
  std::map<std::string, std::tuple<std::string, std::string>> option_meta_;  // (metavar, help)
};


/**
 * @brief Get the value of an option, or the given default if the option is absent or has no value.
 *
 * @throw std::invalid_argument if the option got more than one value.
 */
std::string GetArgValue(const ArgParseResult& result, const std::string& name, const std::string& default_value);

}  // namespace lensgen

#endif  // UTIL_ARG_PARSER_H_
