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


#ifndef GQLENGINE_LANGUAGE_LEXER_H_
#define GQLENGINE_LANGUAGE_LEXER_H_

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "gqlengine/language/source.h"

namespace gqlengine {

enum class TokenKind {
  kStartOfFile,
  kEndOfFile,
  kBang,
  kDollar,
  kAmp,
  kParenL,
  kParenR,
  kSpread,
  kColon,
  kEquals,
  kAt,
  kBracketL,
  kBracketR,
  kBraceL,
  kPipe,
  kBraceR,
  kName,
  kInt,
  kFloat,
  kString,
  kBlockString,
};

struct Token {
  TokenKind kind = TokenKind::kStartOfFile;
  // Byte range [start, end) in the source body.
  int start = 0;
  int end = 0;
  // Set for names, numbers and strings. Strings hold the decoded value.
  std::string value;
};

// "Name", "Int", "<EOF>", or the quoted punctuator such as "\"{\"".
std::string TokenKindDescription(TokenKind kind);

// The kind description followed by the quoted value, if any:
// Name "type", Int "12", "{".
std::string TokenDescription(const Token& token);

// Returns a kInvalidArgument status "Syntax Error: <description>" located at
// byte `position` of `source`.
absl::Status MakeSyntaxError(const Source& source, int position,
                             absl::string_view description);

// Produces the tokens of a Source one at a time. Whitespace, commas, comments
// and a leading byte order mark are skipped.
//
//   Lexer lexer(&source);
//   while (lexer.token().kind != TokenKind::kEndOfFile) {
//     GQLENGINE_RETURN_IF_ERROR(lexer.Advance());
//     ...
//   }
class Lexer {
 public:
  // `source` must outlive the Lexer.
  explicit Lexer(const Source* source);
  Lexer(const Lexer&) = delete;
  Lexer& operator=(const Lexer&) = delete;

  const Source& source() const { return *source_; }

  // The current token. Starts as kStartOfFile.
  const Token& token() const { return token_; }

  // The token that was current before the last Advance().
  const Token& last_token() const { return last_token_; }

  // Moves to the next token.
  absl::Status Advance();

  // Reads the token after the current one without consuming it.
  absl::StatusOr<Token> Lookahead() const;

 private:
  absl::StatusOr<Token> ReadNextToken(int position) const;
  absl::StatusOr<Token> ReadNumber(int start) const;
  absl::StatusOr<Token> ReadString(int start) const;
  absl::StatusOr<Token> ReadBlockString(int start) const;
  Token ReadName(int start) const;

  // Decodes the escape sequence starting at the backslash at `position`,
  // appending its UTF-8 encoding to `out`. Returns the position after it.
  absl::StatusOr<int> ReadEscapeSequence(int position, std::string* out) const;

  // Formats the character at `position` for error messages.
  std::string PrintCharAt(int position) const;

  absl::Status SyntaxError(int position, absl::string_view description) const {
    return MakeSyntaxError(*source_, position, description);
  }

  const Source* source_;
  absl::string_view body_;
  Token token_;
  Token last_token_;
};

// Removes the common indentation and the leading and trailing blank lines of
// a block string's raw content.
std::string DedentBlockStringValue(absl::string_view raw);

}  // namespace gqlengine

#endif  // GQLENGINE_LANGUAGE_LEXER_H_
