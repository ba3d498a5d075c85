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

#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "gqlengine/base/status_macros.h"
#include "gqlengine/base/status_payload.h"
#include "gqlengine/base/testing/status_matchers.h"
#include "gqlengine/language/source.h"
#include "gqlengine/proto/graphql_error.pb.h"

namespace gqlengine {
namespace {

using ::gqlengine_base::testing::StatusIs;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

// Returns the first token of `body`.
absl::StatusOr<Token> LexOne(const std::string& body) {
  Source source(body);
  Lexer lexer(&source);
  GQLENGINE_RETURN_IF_ERROR(lexer.Advance());
  return lexer.token();
}

std::vector<TokenKind> LexKinds(const std::string& body) {
  Source source(body);
  Lexer lexer(&source);
  std::vector<TokenKind> kinds;
  while (true) {
    absl::Status status = lexer.Advance();
    EXPECT_TRUE(status.ok()) << status;
    if (!status.ok() || lexer.token().kind == TokenKind::kEndOfFile) break;
    kinds.push_back(lexer.token().kind);
  }
  return kinds;
}

TEST(LexerTest, SkipsIgnoredCharacters) {
  GQLENGINE_ASSERT_OK_AND_ASSIGN(
      Token token, LexOne("\xEF\xBB\xBF \t,,\n# comment\r\n  foo  "));
  EXPECT_EQ(token.kind, TokenKind::kName);
  EXPECT_EQ(token.value, "foo");
  EXPECT_EQ(token.start, 21);
  EXPECT_EQ(token.end, 24);
}

TEST(LexerTest, Punctuators) {
  EXPECT_THAT(LexKinds("! $ & ( ) ... : = @ [ ] { | }"),
              ElementsAre(TokenKind::kBang, TokenKind::kDollar,
                          TokenKind::kAmp, TokenKind::kParenL,
                          TokenKind::kParenR, TokenKind::kSpread,
                          TokenKind::kColon, TokenKind::kEquals,
                          TokenKind::kAt, TokenKind::kBracketL,
                          TokenKind::kBracketR, TokenKind::kBraceL,
                          TokenKind::kPipe, TokenKind::kBraceR));
}

TEST(LexerTest, Numbers) {
  GQLENGINE_ASSERT_OK_AND_ASSIGN(Token token, LexOne("-123"));
  EXPECT_EQ(token.kind, TokenKind::kInt);
  EXPECT_EQ(token.value, "-123");

  GQLENGINE_ASSERT_OK_AND_ASSIGN(token, LexOne("0.5e-10"));
  EXPECT_EQ(token.kind, TokenKind::kFloat);
  EXPECT_EQ(token.value, "0.5e-10");

  GQLENGINE_ASSERT_OK_AND_ASSIGN(token, LexOne("1E3"));
  EXPECT_EQ(token.kind, TokenKind::kFloat);
}

TEST(LexerTest, InvalidNumbers) {
  EXPECT_THAT(LexOne("01"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       "Syntax Error: Invalid number, unexpected digit after "
                       "0: \"1\"."));
  EXPECT_THAT(LexOne("1."),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       "Syntax Error: Invalid number, expected digit but "
                       "got: <EOF>."));
  EXPECT_THAT(LexOne("1.0x"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       "Syntax Error: Invalid number, expected digit but "
                       "got: \"x\"."));
  EXPECT_THAT(LexOne("-"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("expected digit but got: <EOF>")));
}

TEST(LexerTest, Strings) {
  GQLENGINE_ASSERT_OK_AND_ASSIGN(Token token,
                                 LexOne(R"("a\"b\\c\/d\n\u0041")"));
  EXPECT_EQ(token.kind, TokenKind::kString);
  EXPECT_EQ(token.value, "a\"b\\c/d\nA");

  GQLENGINE_ASSERT_OK_AND_ASSIGN(token, LexOne(R"("\u00e9")"));
  EXPECT_EQ(token.value, "\xC3\xA9");

  // Surrogate pair for U+1F600.
  GQLENGINE_ASSERT_OK_AND_ASSIGN(token, LexOne(R"("\uD83D\uDE00")"));
  EXPECT_EQ(token.value, "\xF0\x9F\x98\x80");

  // Raw UTF-8 passes through.
  GQLENGINE_ASSERT_OK_AND_ASSIGN(token, LexOne("\"caf\xC3\xA9\""));
  EXPECT_EQ(token.value, "caf\xC3\xA9");
}

TEST(LexerTest, InvalidStrings) {
  EXPECT_THAT(LexOne("\"abc"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       "Syntax Error: Unterminated string."));
  EXPECT_THAT(LexOne("\"ab\ncd\""),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       "Syntax Error: Unterminated string."));
  EXPECT_THAT(LexOne(R"("\x")"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       "Syntax Error: Invalid character escape sequence: "
                       "\"\\x\"."));
  EXPECT_THAT(LexOne(R"("\u12G4")"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       "Syntax Error: Invalid character escape sequence: "
                       "\"\\u12G4\"."));
  EXPECT_THAT(LexOne(std::string("\"a\x07\"")),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       "Syntax Error: Invalid character within String: "
                       "U+0007."));
}

TEST(LexerTest, BlockStrings) {
  GQLENGINE_ASSERT_OK_AND_ASSIGN(
      Token token, LexOne("\"\"\"\n    Hello,\n      World!\n\n    Yours\n  "
                          "\"\"\""));
  EXPECT_EQ(token.kind, TokenKind::kBlockString);
  EXPECT_EQ(token.value, "Hello,\n  World!\n\nYours");

  GQLENGINE_ASSERT_OK_AND_ASSIGN(token, LexOne(R"("""a \""" b""")"));
  EXPECT_EQ(token.value, "a \"\"\" b");
}

TEST(LexerTest, DedentKeepsFirstLineIndentation) {
  EXPECT_EQ(DedentBlockStringValue("  first\n    second\n    third"),
            "  first\nsecond\nthird");
  EXPECT_EQ(DedentBlockStringValue("\n\n   \n"), "");
}

TEST(LexerTest, UnexpectedCharacters) {
  EXPECT_THAT(LexOne("?"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       "Syntax Error: Cannot parse the unexpected character "
                       "\"?\"."));
  EXPECT_THAT(LexOne(".."),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       "Syntax Error: Cannot parse the unexpected character "
                       "\".\"."));
  EXPECT_THAT(LexOne("'a'"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Unexpected single quote character")));
  EXPECT_THAT(LexOne(std::string("\x07")),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       "Syntax Error: Cannot contain the invalid character "
                       "U+0007."));
}

TEST(LexerTest, SyntaxErrorsAreLocated) {
  absl::StatusOr<Token> token = LexOne("\n\n    ?");
  ASSERT_FALSE(token.ok());
  ASSERT_TRUE(gqlengine_base::HasPayloadWithType<GraphQLErrorPayload>(
      token.status()));
  const GraphQLErrorPayload payload =
      gqlengine_base::GetPayload<GraphQLErrorPayload>(token.status());
  ASSERT_EQ(payload.locations_size(), 1u);
  EXPECT_EQ(payload.locations(0).line(), 3);
  EXPECT_EQ(payload.locations(0).column(), 5);
}

TEST(LexerTest, LookaheadDoesNotConsume) {
  Source source("a b");
  Lexer lexer(&source);
  GQLENGINE_ASSERT_OK(lexer.Advance());
  GQLENGINE_ASSERT_OK_AND_ASSIGN(Token next, lexer.Lookahead());
  EXPECT_EQ(next.value, "b");
  EXPECT_EQ(lexer.token().value, "a");
  GQLENGINE_ASSERT_OK(lexer.Advance());
  EXPECT_EQ(lexer.token().value, "b");
  EXPECT_EQ(lexer.last_token().value, "a");
}

TEST(LexerTest, TokenDescriptions) {
  Token name;
  name.kind = TokenKind::kName;
  name.value = "type";
  EXPECT_EQ(TokenDescription(name), "Name \"type\"");
  EXPECT_EQ(TokenKindDescription(TokenKind::kBraceL), "\"{\"");
  EXPECT_EQ(TokenKindDescription(TokenKind::kEndOfFile), "<EOF>");
}

}  // namespace
}  // namespace gqlengine
