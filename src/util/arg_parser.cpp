#include "util/arg_parser.hpp"

#include <cstdio>
#include <functional>
#include <stdexcept>
#include <string>

#include "util/log.hpp"

namespace lensgen {

void ArgParser::AddArgument(const std::string& name, int value_num, const std::string& metavar,
                            const std::string& help_msg) {
  std::string key = name;
  if (key.empty() || key[0] != '-') {
    LOG_WARNING("Argument %s does not start with minus! Prepend a minus to it.", name.c_str());
    key = "-" + key;
  }
  option_value_num_[key] = value_num;
  option_meta_[key] = std::make_tuple(metavar, help_msg);
}


void ArgParser::ShowHelp(const char* cmd) const {
  std::string usage = cmd ? cmd : "";
  for (const auto& [opt, opt_num] : option_value_num_) {
    const auto& metavar = std::get<0>(option_meta_.at(opt));
    std::string value_name = metavar.empty() ? "val" : metavar;
    if (opt_num > 0) {
      usage += " " + opt;
      for (int i = 0; i < opt_num; i++) {
        usage += " " + value_name;
      }
    } else if (opt_num == 0) {
      usage += " [" + opt + "]";
    } else {
      usage += " [" + opt + " " + value_name + "...]";
    }
  }

  LOG_INFO("USAGE:");
  LOG_INFO("  %s", usage.c_str());
  LOG_INFO("OPTIONS:");
  for (const auto& [opt, meta] : option_meta_) {
    LOG_INFO("  %-12s %s", opt.c_str(), std::get<1>(meta).c_str());
  }
}


namespace {

enum ParseState {
  kStart,
  kReceivedKey,
  kWaitingValue,
  kFail,
};


struct ParseContext {
  const std::map<std::string, int>& option_map;
  ArgParseResult& result;
};


ParseState PushValue(const std::string& curr_arg, const std::string& key, ParseContext& ctx) {
  int value_num = ctx.option_map.at(key);
  auto& values = ctx.result.at(key);
  values.emplace_back(curr_arg);
  if (value_num > 0 && values.size() >= static_cast<size_t>(value_num)) {
    return kStart;
  }
  return kWaitingValue;
}


ParseState StartAction(const std::string& curr_arg, const std::string& /* key */, ParseContext& ctx) {
  if (ctx.option_map.count(curr_arg)) {
    ctx.result[curr_arg].clear();
    return kReceivedKey;
  }

  bool is_single_minus = curr_arg.size() > 2 && curr_arg[0] == '-' && curr_arg[1] != '-';
  if (!is_single_minus) {
    return kFail;
  }

  // Compact flags, e.g. -vs. Every letter must be a known flag.
  for (size_t i = 1; i < curr_arg.size(); i++) {
    std::string flag{ '-', curr_arg[i] };
    auto iter = ctx.option_map.find(flag);
    if (iter == ctx.option_map.end() || iter->second != 0) {
      return kFail;
    }
    ctx.result[flag].clear();
  }
  return kStart;
}


ParseState ReceivedKeyAction(const std::string& curr_arg, const std::string& key, ParseContext& ctx) {
  int value_num = ctx.option_map.at(key);
  if (value_num == 0) {
    return StartAction(curr_arg, key, ctx);
  }
  if (ctx.option_map.count(curr_arg)) {
    if (value_num > 0) {  // a required value is missing
      return kFail;
    }
    ctx.result[curr_arg].clear();
    return kReceivedKey;
  }
  return PushValue(curr_arg, key, ctx);
}


ParseState WaitingValueAction(const std::string& curr_arg, const std::string& key, ParseContext& ctx) {
  if (ctx.option_map.count(curr_arg)) {
    if (ctx.option_map.at(key) > 0) {
      return kFail;
    }
    ctx.result[curr_arg].clear();
    return kReceivedKey;
  }
  return PushValue(curr_arg, key, ctx);
}


using ParseStateAction = std::function<ParseState(const std::string&, const std::string&, ParseContext&)>;

const std::map<ParseState, ParseStateAction>& GetParseStateActions() {
  static const std::map<ParseState, ParseStateAction> actions{
    { kStart, &StartAction },
    { kReceivedKey, &ReceivedKeyAction },
    { kWaitingValue, &WaitingValueAction },
  };
  return actions;
}

}  // namespace


ArgParseResult ArgParser::Parse(int argc, char** argv) const {
  ArgParseResult result;
  ParseContext ctx{ option_value_num_, result };
  const auto& state_actions = GetParseStateActions();

  ParseState state = kStart;
  std::string key;
  for (int i = 1; i < argc; i++) {
    std::string curr_arg = argv[i];
    state = state_actions.at(state)(curr_arg, key, ctx);
    if (state == kReceivedKey) {
      key = curr_arg;
    } else if (state == kStart) {
      key.clear();
    } else if (state == kFail) {
      ShowHelp(argv[0]);
      throw std::invalid_argument("unexpected argument: " + curr_arg);
    }
  }

  if (state == kReceivedKey || state == kWaitingValue) {
    int value_num = option_value_num_.at(key);
    if (value_num > 0 && result.at(key).size() < static_cast<size_t>(value_num)) {
      ShowHelp(argc > 0 ? argv[0] : nullptr);
      throw std::invalid_argument("missing values for option " + key);
    }
  }

  for (const auto& [opt, opt_num] : option_value_num_) {
    if (opt_num > 0 && !result.count(opt)) {
      ShowHelp(argc > 0 ? argv[0] : nullptr);
      throw std::invalid_argument("missing required option " + opt);
    }
  }
  return result;
}


std::string GetArgValue(const ArgParseResult& result, const std::string& name, const std::string& default_value) {
  auto iter = result.find(name);
  if (iter == result.end() || iter->second.empty()) {
    return default_value;
  }
  if (iter->second.size() > 1) {
    throw std::invalid_argument("option " + name + " takes one value, got " + std::to_string(iter->second.size()));
  }
  return iter->second.front();
}

}  // namespace lensgen
