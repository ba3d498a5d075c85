//
// Copyright 2019 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
//


#include "gqlengine/language/lexer.h"

#include <algorithm>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "gqlengine/base/status_builder.h"
#include "gqlengine/base/status_macros.h"
#include "gqlengine/language/source.h"
#include "gqlengine/proto/graphql_error.pb.h"

namespace gqlengine {

namespace {

bool IsDigit(int c) { return c >= '0' && c <= '9'; }

bool IsLetter(int c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); }

bool IsNameStart(int c) { return IsLetter(c) || c == '_'; }

bool IsNameContinue(int c) { return IsNameStart(c) || IsDigit(c); }

int HexValue(int c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

void AppendUtf8(uint32_t code_point, std::string* out) {
  if (code_point < 0x80) {
    out->push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800) {
    out->push_back(static_cast<char>(0xC0 | (code_point >> 6)));
    out->push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else if (code_point < 0x10000) {
    out->push_back(static_cast<char>(0xE0 | (code_point >> 12)));
    out->push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else {
    out->push_back(static_cast<char>(0xF0 | (code_point >> 18)));
    out->push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  }
}

// Decodes the UTF-8 sequence at the start of `text`. Returns -1 when it is
// malformed.
int32_t DecodeUtf8(absl::string_view text) {
  if (text.empty()) return -1;
  const unsigned char lead = static_cast<unsigned char>(text[0]);
  if (lead < 0x80) return lead;
  int length;
  int32_t code_point;
  if ((lead & 0xE0) == 0xC0) {
    length = 2;
    code_point = lead & 0x1F;
  } else if ((lead & 0xF0) == 0xE0) {
    length = 3;
    code_point = lead & 0x0F;
  } else if ((lead & 0xF8) == 0xF0) {
    length = 4;
    code_point = lead & 0x07;
  } else {
    return -1;
  }
  if (static_cast<int>(text.size()) < length) return -1;
  for (int i = 1; i < length; ++i) {
    const unsigned char next = static_cast<unsigned char>(text[i]);
    if ((next & 0xC0) != 0x80) return -1;
    code_point = (code_point << 6) | (next & 0x3F);
  }
  return code_point;
}

bool IsBlank(absl::string_view line) {
  return std::all_of(line.begin(), line.end(),
                     [](char c) { return c == ' ' || c == '\t'; });
}

int LeadingWhitespace(absl::string_view line) {
  int i = 0;
  while (i < static_cast<int>(line.size()) &&
         (line[i] == ' ' || line[i] == '\t')) {
    ++i;
  }
  return i;
}

}  // namespace

std::string TokenKindDescription(TokenKind kind) {
  switch (kind) {
    case TokenKind::kStartOfFile:
      return "<SOF>";
    case TokenKind::kEndOfFile:
      return "<EOF>";
    case TokenKind::kBang:
      return "\"!\"";
    case TokenKind::kDollar:
      return "\"$\"";
    case TokenKind::kAmp:
      return "\"&\"";
    case TokenKind::kParenL:
      return "\"(\"";
    case TokenKind::kParenR:
      return "\")\"";
    case TokenKind::kSpread:
      return "\"...\"";
    case TokenKind::kColon:
      return "\":\"";
    case TokenKind::kEquals:
      return "\"=\"";
    case TokenKind::kAt:
      return "\"@\"";
    case TokenKind::kBracketL:
      return "\"[\"";
    case TokenKind::kBracketR:
      return "\"]\"";
    case TokenKind::kBraceL:
      return "\"{\"";
    case TokenKind::kPipe:
      return "\"|\"";
    case TokenKind::kBraceR:
      return "\"}\"";
    case TokenKind::kName:
      return "Name";
    case TokenKind::kInt:
      return "Int";
    case TokenKind::kFloat:
      return "Float";
    case TokenKind::kString:
      return "String";
    case TokenKind::kBlockString:
      return "BlockString";
  }
  return "<unknown token>";
}

std::string TokenDescription(const Token& token) {
  switch (token.kind) {
    case TokenKind::kName:
    case TokenKind::kInt:
    case TokenKind::kFloat:
    case TokenKind::kString:
    case TokenKind::kBlockString:
      return absl::StrCat(TokenKindDescription(token.kind), " \"", token.value,
                          "\"");
    default:
      return TokenKindDescription(token.kind);
  }
}

absl::Status MakeSyntaxError(const Source& source, int position,
                             absl::string_view description) {
  const SourcePosition source_position = source.GetPosition(position);
  GraphQLErrorPayload payload;
  ErrorLocation* location = payload.add_locations();
  location->set_line(source_position.line);
  location->set_column(source_position.column);
  payload.set_located(true);
  return gqlengine_base::InvalidArgumentErrorBuilder()
             .Attach(payload)
         << "Syntax Error: " << description;
}

std::string DedentBlockStringValue(absl::string_view raw) {
  // Split on \r\n, \n and \r.
  std::vector<absl::string_view> lines;
  size_t line_start = 0;
  for (size_t i = 0; i < raw.size(); ++i) {
    if (raw[i] == '\n' || raw[i] == '\r') {
      lines.push_back(raw.substr(line_start, i - line_start));
      if (raw[i] == '\r' && i + 1 < raw.size() && raw[i + 1] == '\n') ++i;
      line_start = i + 1;
    }
  }
  lines.push_back(raw.substr(line_start));

  int common_indent = -1;
  for (size_t i = 1; i < lines.size(); ++i) {
    const int indent = LeadingWhitespace(lines[i]);
    if (indent == static_cast<int>(lines[i].size())) continue;
    if (common_indent < 0 || indent < common_indent) common_indent = indent;
  }
  if (common_indent > 0) {
    for (size_t i = 1; i < lines.size(); ++i) {
      lines[i].remove_prefix(
          std::min(static_cast<size_t>(common_indent), lines[i].size()));
    }
  }

  size_t first = 0;
  size_t last = lines.size();
  while (first < last && IsBlank(lines[first])) ++first;
  while (last > first && IsBlank(lines[last - 1])) --last;
  return absl::StrJoin(lines.begin() + first, lines.begin() + last, "\n");
}

Lexer::Lexer(const Source* source)
    : source_(source), body_(source->body()) {}

absl::Status Lexer::Advance() {
  GQLENGINE_ASSIGN_OR_RETURN(Token next, ReadNextToken(token_.end));
  last_token_ = std::move(token_);
  token_ = std::move(next);
  return absl::OkStatus();
}

absl::StatusOr<Token> Lexer::Lookahead() const {
  if (token_.kind == TokenKind::kEndOfFile) return token_;
  return ReadNextToken(token_.end);
}

std::string Lexer::PrintCharAt(int position) const {
  if (position >= static_cast<int>(body_.size())) return "<EOF>";
  const int32_t code = DecodeUtf8(body_.substr(position));
  if (code == '"') return "'\"'";
  if (code >= 0x20 && code <= 0x7E) {
    return absl::StrCat("\"", std::string(1, static_cast<char>(code)), "\"");
  }
  if (code < 0) {
    return absl::StrFormat("U+%04X",
                           static_cast<unsigned char>(body_[position]));
  }
  return absl::StrFormat("U+%04X", code);
}

absl::StatusOr<Token> Lexer::ReadNextToken(int position) const {
  const int size = static_cast<int>(body_.size());
  while (position < size) {
    const char c = body_[position];
    if (c == ' ' || c == '\t' || c == ',' || c == '\n' || c == '\r') {
      ++position;
      continue;
    }
    // U+FEFF byte order mark.
    if (body_.substr(position, 3) == "\xEF\xBB\xBF") {
      position += 3;
      continue;
    }
    if (c == '#') {
      while (position < size && body_[position] != '\n' &&
             body_[position] != '\r') {
        ++position;
      }
      continue;
    }

    auto punctuator = [position](TokenKind kind, int length = 1) {
      Token token;
      token.kind = kind;
      token.start = position;
      token.end = position + length;
      return token;
    };
    switch (c) {
      case '!':
        return punctuator(TokenKind::kBang);
      case '$':
        return punctuator(TokenKind::kDollar);
      case '&':
        return punctuator(TokenKind::kAmp);
      case '(':
        return punctuator(TokenKind::kParenL);
      case ')':
        return punctuator(TokenKind::kParenR);
      case ':':
        return punctuator(TokenKind::kColon);
      case '=':
        return punctuator(TokenKind::kEquals);
      case '@':
        return punctuator(TokenKind::kAt);
      case '[':
        return punctuator(TokenKind::kBracketL);
      case ']':
        return punctuator(TokenKind::kBracketR);
      case '{':
        return punctuator(TokenKind::kBraceL);
      case '|':
        return punctuator(TokenKind::kPipe);
      case '}':
        return punctuator(TokenKind::kBraceR);
      case '.':
        if (body_.substr(position, 3) == "...") {
          return punctuator(TokenKind::kSpread, 3);
        }
        break;
      case '"':
        if (body_.substr(position, 3) == "\"\"\"") {
          return ReadBlockString(position);
        }
        return ReadString(position);
      default:
        break;
    }
    if (IsNameStart(c)) return ReadName(position);
    if (IsDigit(c) || c == '-') return ReadNumber(position);

    const unsigned char code = static_cast<unsigned char>(c);
    if (code < 0x20 && c != '\t' && c != '\n' && c != '\r') {
      return SyntaxError(position,
                         absl::StrCat("Cannot contain the invalid character ",
                                      PrintCharAt(position), "."));
    }
    if (c == '\'') {
      return SyntaxError(position,
                         "Unexpected single quote character ('), did you "
                         "mean to use a double quote (\")?");
    }
    return SyntaxError(position,
                       absl::StrCat("Cannot parse the unexpected character ",
                                    PrintCharAt(position), "."));
  }
  Token eof;
  eof.kind = TokenKind::kEndOfFile;
  eof.start = size;
  eof.end = size;
  return eof;
}

Token Lexer::ReadName(int start) const {
  int position = start + 1;
  while (position < static_cast<int>(body_.size()) &&
         IsNameContinue(body_[position])) {
    ++position;
  }
  Token token;
  token.kind = TokenKind::kName;
  token.start = start;
  token.end = position;
  token.value = std::string(body_.substr(start, position - start));
  return token;
}

absl::StatusOr<Token> Lexer::ReadNumber(int start) const {
  const int size = static_cast<int>(body_.size());
  auto char_at = [this, size](int position) -> int {
    return position < size ? body_[position] : -1;
  };
  auto read_digits = [&](int position) -> absl::StatusOr<int> {
    if (!IsDigit(char_at(position))) {
      return SyntaxError(position,
                         absl::StrCat("Invalid number, expected digit but got: ",
                                      PrintCharAt(position), "."));
    }
    while (IsDigit(char_at(position))) ++position;
    return position;
  };

  int position = start;
  bool is_float = false;
  if (char_at(position) == '-') ++position;
  if (char_at(position) == '0') {
    ++position;
    if (IsDigit(char_at(position))) {
      return SyntaxError(
          position, absl::StrCat("Invalid number, unexpected digit after 0: ",
                                 PrintCharAt(position), "."));
    }
  } else {
    GQLENGINE_ASSIGN_OR_RETURN(position, read_digits(position));
  }
  if (char_at(position) == '.') {
    is_float = true;
    GQLENGINE_ASSIGN_OR_RETURN(position, read_digits(position + 1));
  }
  if (char_at(position) == 'e' || char_at(position) == 'E') {
    is_float = true;
    ++position;
    if (char_at(position) == '+' || char_at(position) == '-') ++position;
    GQLENGINE_ASSIGN_OR_RETURN(position, read_digits(position));
  }
  if (char_at(position) == '.' || IsNameStart(char_at(position))) {
    return SyntaxError(position,
                       absl::StrCat("Invalid number, expected digit but got: ",
                                    PrintCharAt(position), "."));
  }

  Token token;
  token.kind = is_float ? TokenKind::kFloat : TokenKind::kInt;
  token.start = start;
  token.end = position;
  token.value = std::string(body_.substr(start, position - start));
  return token;
}

absl::StatusOr<int> Lexer::ReadEscapeSequence(int position,
                                              std::string* out) const {
  const int size = static_cast<int>(body_.size());
  // `position` is at the backslash.
  if (position + 1 >= size) {
    return SyntaxError(position, "Unterminated string.");
  }
  const char escaped = body_[position + 1];
  switch (escaped) {
    case '"':
      out->push_back('"');
      return position + 2;
    case '\\':
      out->push_back('\\');
      return position + 2;
    case '/':
      out->push_back('/');
      return position + 2;
    case 'b':
      out->push_back('\b');
      return position + 2;
    case 'f':
      out->push_back('\f');
      return position + 2;
    case 'n':
      out->push_back('\n');
      return position + 2;
    case 'r':
      out->push_back('\r');
      return position + 2;
    case 't':
      out->push_back('\t');
      return position + 2;
    case 'u':
      break;
    default:
      return SyntaxError(
          position,
          absl::StrCat("Invalid character escape sequence: \"\\",
                       std::string(1, escaped), "\"."));
  }

  auto read_hex4 = [this, size](int at) -> int32_t {
    if (at + 4 > size) return -1;
    int32_t value = 0;
    for (int i = 0; i < 4; ++i) {
      const int digit = HexValue(body_[at + i]);
      if (digit < 0) return -1;
      value = (value << 4) | digit;
    }
    return value;
  };
  auto invalid_unicode = [this, position, size]() {
    const int length = std::min(6, size - position);
    return SyntaxError(
        position, absl::StrCat("Invalid character escape sequence: \"",
                               body_.substr(position, length), "\"."));
  };

  int32_t code_point = read_hex4(position + 2);
  if (code_point < 0) return invalid_unicode();
  int next = position + 6;
  if (code_point >= 0xD800 && code_point <= 0xDBFF) {
    // A leading surrogate must be followed by an escaped trailing surrogate.
    if (body_.substr(next, 2) != "\\u") return invalid_unicode();
    const int32_t trailing = read_hex4(next + 2);
    if (trailing < 0xDC00 || trailing > 0xDFFF) return invalid_unicode();
    code_point = 0x10000 + ((code_point - 0xD800) << 10) + (trailing - 0xDC00);
    next += 6;
  } else if (code_point >= 0xDC00 && code_point <= 0xDFFF) {
    return invalid_unicode();
  }
  AppendUtf8(static_cast<uint32_t>(code_point), out);
  return next;
}

absl::StatusOr<Token> Lexer::ReadString(int start) const {
  const int size = static_cast<int>(body_.size());
  int position = start + 1;
  int chunk_start = position;
  std::string value;
  while (position < size) {
    const char c = body_[position];
    if (c == '\n' || c == '\r') break;
    if (c == '"') {
      value.append(body_.data() + chunk_start, position - chunk_start);
      Token token;
      token.kind = TokenKind::kString;
      token.start = start;
      token.end = position + 1;
      token.value = std::move(value);
      return token;
    }
    if (static_cast<unsigned char>(c) < 0x20 && c != '\t') {
      return SyntaxError(position,
                         absl::StrCat("Invalid character within String: ",
                                      PrintCharAt(position), "."));
    }
    if (c == '\\') {
      value.append(body_.data() + chunk_start, position - chunk_start);
      GQLENGINE_ASSIGN_OR_RETURN(position,
                                 ReadEscapeSequence(position, &value));
      chunk_start = position;
      continue;
    }
    ++position;
  }
  return SyntaxError(position, "Unterminated string.");
}

absl::StatusOr<Token> Lexer::ReadBlockString(int start) const {
  const int size = static_cast<int>(body_.size());
  int position = start + 3;
  int chunk_start = position;
  std::string raw;
  while (position < size) {
    const char c = body_[position];
    if (body_.substr(position, 3) == "\"\"\"") {
      raw.append(body_.data() + chunk_start, position - chunk_start);
      Token token;
      token.kind = TokenKind::kBlockString;
      token.start = start;
      token.end = position + 3;
      token.value = DedentBlockStringValue(raw);
      return token;
    }
    if (static_cast<unsigned char>(c) < 0x20 && c != '\t' && c != '\n' &&
        c != '\r') {
      return SyntaxError(position,
                         absl::StrCat("Invalid character within String: ",
                                      PrintCharAt(position), "."));
    }
    if (body_.substr(position, 4) == "\\\"\"\"") {
      raw.append(body_.data() + chunk_start, position - chunk_start);
      raw.append("\"\"\"");
      position += 4;
      chunk_start = position;
      continue;
    }
    ++position;
  }
  return SyntaxError(position, "Unterminated string.");
}

}  // namespace gqlengine
