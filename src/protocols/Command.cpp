/* @file Command.cpp
 * @brief console command tokenizer
 *
 * © 2025 RollStart contributors — MIT-licensed.
 */

// STL headers
#include <cctype>
#include <iterator>

// RollStart headers
#include "protocols/Command.hpp"

using namespace rollstart::protocols;

std::optional<Command> Command::fromWire(const std::string& line) {
  std::vector<std::string> tokens;
  std::string current;
  bool inToken = false;
  bool quoted = false;

  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (quoted) {
      if (c == '\\' && i + 1 < line.size() && line[i + 1] == '"') {
        current += '"';
        ++i;
      } else if (c == '"') {
        quoted = false;
      } else {
        current += c;
      }
      continue;
    }
    if (c == '"') {
      quoted = true;
      inToken = true;
    } else if (std::isspace(static_cast<unsigned char>(c))) {
      if (inToken) {
        tokens.push_back(std::move(current));
        current.clear();
        inToken = false;
      }
    } else {
      current += c;
      inToken = true;
    }
  }
  if (quoted)
    return std::nullopt;
  if (inToken)
    tokens.push_back(std::move(current));

  if (tokens.empty() || tokens.front().empty() || tokens.front().front() == '#')
    return std::nullopt;

  Command cmd;
  cmd.verb = std::move(tokens.front());
  cmd.args.assign(std::make_move_iterator(tokens.begin() + 1),
                  std::make_move_iterator(tokens.end()));
  return cmd;
}

std::string Command::toWire() const {
  auto quote = [](const std::string& arg) {
    const bool plain = !arg.empty() && arg.find_first_of(" \t\"") == std::string::npos;
    if (plain)
      return arg;
    std::string out = "\"";
    for (char c : arg) {
      if (c == '"')
        out += '\\';
      out += c;
    }
    return out + "\"";
  };

  std::string wire = verb;
  for (const auto& a : args)
    wire += " " + quote(a);
  return wire + "\n";
}

std::vector<std::string> Command::tail(std::size_t first) const {
  if (first >= args.size())
    return {};
  return { args.begin() + static_cast<std::ptrdiff_t>(first), args.end() };
}
