#include "netqasm/lang/text_parser.hpp"

#include <array>
#include <cctype>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>

#include "netqasm/common/diagnostic/diagnostic.hpp"
#include "netqasm/common/host_line.hpp"
#include "netqasm/common/overloaded.hpp"
#include "netqasm/lang/instruction.hpp"
#include "netqasm/lang/opcode.hpp"
#include "netqasm/lang/operand.hpp"
#include "netqasm/lang/subroutine.hpp"

namespace netqasm::lang {

namespace {

// Operands as written, before integer constants are moved into registers.
struct IntLiteral {
  int32_t value;
};

using IndexToken = std::variant<Register, int32_t>;

struct TextEntry {
  Address address;
  IndexToken index;
};

struct TextSlice {
  Address address;
  IndexToken start;
  IndexToken stop;
};

using TextOperand =
    std::variant<Register, IntLiteral, Address, TextEntry, TextSlice, LabelRef>;

struct TextLabel {
  std::string name;
};

struct TextInstruction {
  Opcode opcode;
  std::vector<TextOperand> operands;
};

struct BodyLine {
  uint32_t line;
  std::variant<TextLabel, TextInstruction> content;
};

struct Preamble {
  ProtocolVersion version = kCurrentVersion;
  uint16_t app_id = 0;
  std::map<std::string, std::string, std::less<>> defines;
};

auto Error(uint32_t line, std::string msg) -> Diagnostic {
  return Diagnostic::Encoding(TextSpan{.line = line}, std::move(msg));
}

auto Trim(std::string_view s) -> std::string_view {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
    s.remove_prefix(1);
  }
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
    s.remove_suffix(1);
  }
  return s;
}

auto IsIdentStart(char c) -> bool {
  return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
}

auto IsIdentChar(char c) -> bool {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

auto IsIdentifier(std::string_view s) -> bool {
  if (s.empty() || !IsIdentStart(s.front())) {
    return false;
  }
  for (char c : s) {
    if (!IsIdentChar(c)) {
      return false;
    }
  }
  return true;
}

auto SplitWhitespace(std::string_view s) -> std::vector<std::string_view> {
  std::vector<std::string_view> words;
  size_t pos = 0;
  while (pos < s.size()) {
    while (pos < s.size() &&
           std::isspace(static_cast<unsigned char>(s[pos])) != 0) {
      ++pos;
    }
    size_t start = pos;
    while (pos < s.size() &&
           std::isspace(static_cast<unsigned char>(s[pos])) == 0) {
      ++pos;
    }
    if (pos > start) {
      words.push_back(s.substr(start, pos - start));
    }
  }
  return words;
}

auto ParseInt(std::string_view s) -> std::optional<int32_t> {
  int32_t value = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (ec != std::errc{} || ptr != s.data() + s.size() || s.empty()) {
    return std::nullopt;
  }
  return value;
}

// Blanks out `//` and `/* */` comments, keeping newlines so that line numbers
// survive.
auto StripComments(std::string_view text) -> Result<std::string> {
  std::string out;
  out.reserve(text.size());
  uint32_t line = 1;
  uint32_t block_start = 0;
  bool in_block = false;
  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    char next = i + 1 < text.size() ? text[i + 1] : '\0';
    if (in_block) {
      if (c == '*' && next == '/') {
        in_block = false;
        out += "  ";
        ++i;
        continue;
      }
      if (c == '\n') {
        ++line;
      }
      out += (c == '\n') ? '\n' : ' ';
      continue;
    }
    if (c == '/' && next == '*') {
      in_block = true;
      block_start = line;
      out += "  ";
      ++i;
      continue;
    }
    if (c == '/' && next == '/') {
      while (i < text.size() && text[i] != '\n') {
        ++i;
      }
      if (i < text.size()) {
        out += '\n';
        ++line;
      }
      continue;
    }
    if (c == '\n') {
      ++line;
    }
    out += c;
  }
  if (in_block) {
    return std::unexpected(Error(block_start, "unterminated block comment"));
  }
  return out;
}

auto ParsePreambleLine(std::string_view directive, uint32_t line, Preamble& pre)
    -> Result<void> {
  auto words = SplitWhitespace(directive);
  if (words.empty()) {
    return std::unexpected(Error(line, "empty preamble line"));
  }

  if (words[0] == "NETQASM") {
    if (words.size() != 2) {
      return std::unexpected(Error(line, "expected '# NETQASM <major>.<minor>'"));
    }
    auto dot = words[1].find('.');
    auto major = ParseInt(words[1].substr(0, dot));
    auto minor = dot == std::string_view::npos
                     ? std::optional<int32_t>{}
                     : ParseInt(words[1].substr(dot + 1));
    if (!major || !minor || *major < 0 || *major > UINT8_MAX || *minor < 0 ||
        *minor > UINT8_MAX) {
      return std::unexpected(
          Error(line, fmt::format("invalid version '{}'", words[1])));
    }
    pre.version = ProtocolVersion{
        .major = static_cast<uint8_t>(*major),
        .minor = static_cast<uint8_t>(*minor)};
    if (pre.version != kCurrentVersion) {
      return std::unexpected(
          Error(line, fmt::format("unsupported version '{}'", words[1])));
    }
    return {};
  }

  if (words[0] == "APPID") {
    auto id = words.size() == 2 ? ParseInt(words[1]) : std::nullopt;
    if (!id || *id < 0 || *id > UINT16_MAX) {
      return std::unexpected(Error(line, "expected '# APPID <0..65535>'"));
    }
    pre.app_id = static_cast<uint16_t>(*id);
    return {};
  }

  if (words[0] == "DEFINE") {
    if (words.size() < 3) {
      return std::unexpected(Error(line, "expected '# DEFINE <key> <value>'"));
    }
    std::string_view key = words[1];
    if (!IsIdentifier(key)) {
      return std::unexpected(
          Error(line, fmt::format("invalid macro name '{}'", key)));
    }
    // Value is the rest of the line after the key.
    auto value_start = static_cast<size_t>(
        key.data() + key.size() - directive.data());
    std::string_view value = Trim(directive.substr(value_start));
    if (value.size() >= 2 && value.front() == '{' && value.back() == '}') {
      value = Trim(value.substr(1, value.size() - 2));
    }
    auto [it, inserted] = pre.defines.emplace(key, value);
    if (!inserted) {
      return std::unexpected(
          Error(line, fmt::format("macro '{}' defined twice", key)));
    }
    return {};
  }

  return std::unexpected(
      Error(line, fmt::format("unknown preamble directive '{}'", words[0])));
}

auto ExpandMacros(
    std::string_view text, const Preamble& pre, uint32_t line)
    -> Result<std::string> {
  std::string out;
  size_t pos = 0;
  while (pos < text.size()) {
    if (text[pos] != '$') {
      out += text[pos++];
      continue;
    }
    size_t start = ++pos;
    while (pos < text.size() && IsIdentChar(text[pos])) {
      ++pos;
    }
    std::string_view key = text.substr(start, pos - start);
    auto it = pre.defines.find(key);
    if (it == pre.defines.end()) {
      return std::unexpected(
          Error(line, fmt::format("undefined macro '${}'", key)));
    }
    out += it->second;
  }
  return out;
}

auto ParseIndexToken(std::string_view s, uint32_t line) -> Result<IndexToken> {
  s = Trim(s);
  if (auto reg = ParseRegister(s)) {
    return *reg;
  }
  if (auto value = ParseInt(s)) {
    return *value;
  }
  return std::unexpected(
      Error(line, fmt::format("invalid array index '{}'", s)));
}

auto ParseArrayOperand(std::string_view s, uint32_t line)
    -> Result<TextOperand> {
  // s starts with '@'
  size_t bracket = s.find('[');
  std::string_view addr_text = s.substr(1, bracket == std::string_view::npos
                                               ? std::string_view::npos
                                               : bracket - 1);
  auto addr = ParseInt(addr_text);
  if (!addr) {
    return std::unexpected(
        Error(line, fmt::format("invalid array address '{}'", s)));
  }
  Address address{*addr};
  if (bracket == std::string_view::npos) {
    return address;
  }
  if (s.back() != ']') {
    return std::unexpected(
        Error(line, fmt::format("missing ']' in '{}'", s)));
  }
  std::string_view inner = s.substr(bracket + 1, s.size() - bracket - 2);
  size_t colon = inner.find(':');
  if (colon == std::string_view::npos) {
    auto index = ParseIndexToken(inner, line);
    if (!index) {
      return std::unexpected(std::move(index).error());
    }
    return TextEntry{.address = address, .index = *index};
  }
  auto start = ParseIndexToken(inner.substr(0, colon), line);
  if (!start) {
    return std::unexpected(std::move(start).error());
  }
  auto stop = ParseIndexToken(inner.substr(colon + 1), line);
  if (!stop) {
    return std::unexpected(std::move(stop).error());
  }
  return TextSlice{.address = address, .start = *start, .stop = *stop};
}

auto ParseOperand(std::string_view s, uint32_t line) -> Result<TextOperand> {
  if (s.empty()) {
    return std::unexpected(Error(line, "empty operand"));
  }
  if (s.front() == '@') {
    return ParseArrayOperand(s, line);
  }
  if (auto reg = ParseRegister(s)) {
    return *reg;
  }
  if (auto value = ParseInt(s)) {
    return IntLiteral{*value};
  }
  if (IsIdentifier(s)) {
    return LabelRef{std::string(s)};
  }
  return std::unexpected(Error(line, fmt::format("invalid operand '{}'", s)));
}

auto ParseBodyLine(std::string_view text, uint32_t line) -> Result<BodyLine> {
  if (text.back() == ':') {
    std::string_view name = Trim(text.substr(0, text.size() - 1));
    if (!IsIdentifier(name)) {
      return std::unexpected(
          Error(line, fmt::format("invalid label '{}'", name)));
    }
    return BodyLine{.line = line, .content = TextLabel{std::string(name)}};
  }

  size_t pos = 0;
  while (pos < text.size() && IsIdentChar(text[pos])) {
    ++pos;
  }
  std::string_view mnemonic = text.substr(0, pos);
  auto opcode = OpcodeFromMnemonic(mnemonic);
  if (!opcode) {
    std::string_view word = SplitWhitespace(text).front();
    return std::unexpected(
        Error(line, fmt::format("unknown instruction '{}'", word)));
  }

  std::vector<std::string_view> tokens;
  if (pos < text.size() && text[pos] == '(') {
    size_t close = text.find(')', pos);
    if (close == std::string_view::npos) {
      return std::unexpected(Error(line, "missing ')' after arguments"));
    }
    std::string_view args = text.substr(pos + 1, close - pos - 1);
    while (!Trim(args).empty()) {
      size_t comma = args.find(',');
      tokens.push_back(Trim(args.substr(0, comma)));
      if (comma == std::string_view::npos) {
        break;
      }
      args.remove_prefix(comma + 1);
    }
    pos = close + 1;
  } else if (
      pos < text.size() &&
      std::isspace(static_cast<unsigned char>(text[pos])) == 0) {
    return std::unexpected(
        Error(
            line,
            fmt::format("unexpected '{}' after '{}'", text[pos], mnemonic)));
  }
  for (auto word : SplitWhitespace(text.substr(pos))) {
    tokens.push_back(word);
  }

  TextInstruction instr{.opcode = *opcode, .operands = {}};
  for (auto token : tokens) {
    auto operand = ParseOperand(token, line);
    if (!operand) {
      return std::unexpected(std::move(operand).error());
    }
    instr.operands.push_back(std::move(*operand));
  }
  return BodyLine{.line = line, .content = std::move(instr)};
}

// Hands out scratch R registers for integer constants. A register qualifies
// when the text never names it and the current instruction has not taken it.
class ConstantRegisters {
 public:
  explicit ConstantRegisters(const std::vector<BodyLine>& body) {
    auto mark = [this](const Register& r) {
      if (r.bank == RegisterBank::kR && r.index < kRegistersPerBank) {
        used_[r.index] = true;
      }
    };
    auto mark_index = [&](const IndexToken& t) {
      if (const auto* r = std::get_if<Register>(&t)) {
        mark(*r);
      }
    };
    for (const auto& line : body) {
      const auto* instr = std::get_if<TextInstruction>(&line.content);
      if (instr == nullptr) {
        continue;
      }
      for (const auto& operand : instr->operands) {
        std::visit(
            Overloaded{
                [&](const Register& r) { mark(r); },
                [&](const TextEntry& e) { mark_index(e.index); },
                [&](const TextSlice& s) {
                  mark_index(s.start);
                  mark_index(s.stop);
                },
                [](const auto&) {},
            },
            operand);
      }
    }
  }

  void BeginInstruction() {
    taken_ = {};
  }

  auto Take(uint32_t line) -> Result<Register> {
    for (uint8_t i = 0; i < kRegistersPerBank; ++i) {
      if (!used_[i] && !taken_[i]) {
        taken_[i] = true;
        return Register::R(i);
      }
    }
    return std::unexpected(
        Diagnostic::Layout(
            TextSpan{.line = line},
            "no free R register left to hold an integer constant"));
  }

 private:
  std::array<bool, kRegistersPerBank> used_{};
  std::array<bool, kRegistersPerBank> taken_{};
};

// Converts one text instruction into its `set` prologue plus the instruction.
auto LowerInstruction(
    const TextInstruction& text, uint32_t line, ConstantRegisters& constants)
    -> Result<std::vector<Instruction>> {
  auto slots = GetShapeSlots(GetOpcodeInfo(text.opcode).shape);
  if (text.operands.size() != slots.size()) {
    return std::unexpected(
        Error(
            line, fmt::format(
                      "'{}' expects {} operands, got {}", ToString(text.opcode),
                      slots.size(), text.operands.size())));
  }

  std::vector<Instruction> sets;
  constants.BeginInstruction();
  auto materialize = [&](int32_t value) -> Result<Register> {
    auto reg = constants.Take(line);
    if (reg) {
      sets.push_back(Instruction::Set(*reg, value));
    }
    return reg;
  };
  auto lower_index = [&](const IndexToken& token) -> Result<Register> {
    if (const auto* r = std::get_if<Register>(&token)) {
      return *r;
    }
    return materialize(std::get<int32_t>(token));
  };
  auto mismatch = [&](size_t i) {
    return Error(
        line, fmt::format(
                  "operand {} of '{}' has the wrong kind", i,
                  ToString(text.opcode)));
  };

  Instruction instr{.opcode = text.opcode, .operands = {}};
  for (size_t i = 0; i < slots.size(); ++i) {
    const auto& operand = text.operands[i];
    switch (slots[i]) {
      case SlotKind::kRegister: {
        if (const auto* r = std::get_if<Register>(&operand)) {
          instr.operands.emplace_back(*r);
        } else if (const auto* lit = std::get_if<IntLiteral>(&operand)) {
          auto reg = materialize(lit->value);
          if (!reg) {
            return std::unexpected(std::move(reg).error());
          }
          instr.operands.emplace_back(*reg);
        } else {
          return std::unexpected(mismatch(i));
        }
        break;
      }
      case SlotKind::kInt32:
      case SlotKind::kUint8: {
        if (const auto* lit = std::get_if<IntLiteral>(&operand)) {
          instr.operands.emplace_back(Immediate{lit->value});
        } else if (const auto* label = std::get_if<LabelRef>(&operand)) {
          instr.operands.emplace_back(*label);
        } else {
          return std::unexpected(mismatch(i));
        }
        break;
      }
      case SlotKind::kAddress: {
        const auto* addr = std::get_if<Address>(&operand);
        if (addr == nullptr) {
          return std::unexpected(mismatch(i));
        }
        instr.operands.emplace_back(*addr);
        break;
      }
      case SlotKind::kEntry: {
        const auto* entry = std::get_if<TextEntry>(&operand);
        if (entry == nullptr) {
          return std::unexpected(mismatch(i));
        }
        auto index = lower_index(entry->index);
        if (!index) {
          return std::unexpected(std::move(index).error());
        }
        instr.operands.emplace_back(
            ArrayEntry{.address = entry->address, .index = *index});
        break;
      }
      case SlotKind::kSlice: {
        const auto* slice = std::get_if<TextSlice>(&operand);
        if (slice == nullptr) {
          return std::unexpected(mismatch(i));
        }
        auto start = lower_index(slice->start);
        if (!start) {
          return std::unexpected(std::move(start).error());
        }
        auto stop = lower_index(slice->stop);
        if (!stop) {
          return std::unexpected(std::move(stop).error());
        }
        instr.operands.emplace_back(
            ArraySlice{
                .address = slice->address, .start = *start, .stop = *stop});
        break;
      }
    }
  }
  sets.push_back(std::move(instr));
  return sets;
}

}  // namespace

auto ParseText(
    std::string_view text, const flavour::Flavour& flavour,
    std::string_view file_name) -> Result<Subroutine> {
  auto stripped = StripComments(text);
  if (!stripped) {
    return std::unexpected(std::move(stripped).error());
  }

  Preamble preamble;
  std::vector<std::pair<uint32_t, std::string_view>> raw_body;
  std::string_view rest = *stripped;
  uint32_t line = 0;
  while (!rest.empty() || line == 0) {
    ++line;
    size_t newline = rest.find('\n');
    std::string_view current = Trim(rest.substr(0, newline));
    rest = newline == std::string_view::npos ? std::string_view{}
                                              : rest.substr(newline + 1);
    if (current.empty()) {
      continue;
    }
    if (current.front() == '#') {
      if (!raw_body.empty()) {
        return std::unexpected(
            Error(line, "preamble line after the first instruction"));
      }
      auto r = ParsePreambleLine(current.substr(1), line, preamble);
      if (!r) {
        return std::unexpected(std::move(r).error());
      }
      continue;
    }
    raw_body.emplace_back(line, current);
  }

  std::vector<BodyLine> body;
  body.reserve(raw_body.size());
  for (const auto& [number, raw] : raw_body) {
    auto expanded = ExpandMacros(raw, preamble, number);
    if (!expanded) {
      return std::unexpected(std::move(expanded).error());
    }
    std::string_view trimmed = Trim(*expanded);
    if (trimmed.empty()) {
      continue;
    }
    auto parsed = ParseBodyLine(trimmed, number);
    if (!parsed) {
      return std::unexpected(std::move(parsed).error());
    }
    body.push_back(std::move(*parsed));
  }

  ConstantRegisters constants(body);
  SubroutineBuilder builder(preamble.app_id);
  builder.SetVersion(preamble.version);
  for (const auto& entry : body) {
    HostLine host_line{.file = std::string(file_name), .line = entry.line};
    if (const auto* label = std::get_if<TextLabel>(&entry.content)) {
      builder.PlaceLabel(label->name, host_line);
      continue;
    }
    auto lowered = LowerInstruction(
        std::get<TextInstruction>(entry.content), entry.line, constants);
    if (!lowered) {
      return std::unexpected(std::move(lowered).error());
    }
    for (auto& instr : *lowered) {
      builder.Append(std::move(instr), host_line);
    }
  }
  return std::move(builder).Finalize(flavour);
}

}  // namespace netqasm::lang
