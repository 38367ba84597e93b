/******************************************************************************\
* Copyright (c) 2019, Robert van Engelen, Genivia Inc. All rights reserved.    *
*                                                                              *
* Redistribution and use in source and binary forms, with or without           *
* modification, are permitted provided that the following conditions are met:  *
*                                                                              *
*   (1) Redistributions of source code must retain the above copyright notice, *
*       this list of conditions and the following disclaimer.                  *
*                                                                              *
*   (2) Redistributions in binary form must reproduce the above copyright      *
*       notice, this list of conditions and the following disclaimer in the    *
*       documentation and/or other materials provided with the distribution.   *
*                                                                              *
*   (3) The name of the author may not be used to endorse or promote products  *
*       derived from this software without specific prior written permission.  *
*                                                                              *
* THIS SOFTWARE IS PROVIDED BY THE AUTHOR ``AS IS'' AND ANY EXPRESS OR IMPLIED *
* WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED WARRANTIES OF         *
* MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO   *
* EVENT SHALL THE AUTHOR BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,       *
* SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, *
* PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS;  *
* OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY,     *
* WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR      *
* OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF       *
* ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.                                   *
\******************************************************************************/

/**
@file      test_match.cpp
@brief     tests of evaluating patterns against lines
@author    Robert van Engelen - engelen@genivia.com
@copyright (c) 2019-2022, Robert van Engelen, Genivia Inc. All rights reserved.
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#include "match.hpp"
#include <gtest/gtest.h>

// a line numbered 1 with the given text
static Line make_line(const std::string& text, bool binary = false)
{
  Line line;
  line.text = text;
  line.lineno = 1;
  line.binary = binary;
  return line;
}

TEST(MatchEngine, LiteralSelectsLinesContainingIt)
{
  Patterns patterns = compile({ "foo" }, Dialect::FIXED, false, false, false);
  MatchEngine engine(patterns, false, false);

  EXPECT_TRUE(engine.evaluate(make_line("a foo b")).matched);
  EXPECT_FALSE(engine.evaluate(make_line("a fo o b")).matched);
  EXPECT_FALSE(engine.evaluate(make_line("")).matched);
}

TEST(MatchEngine, AnyPatternSelectsTheLine)
{
  Patterns patterns = compile({ "cat", "dog" }, Dialect::FIXED, false, false, false);
  MatchEngine engine(patterns, false, false);

  EXPECT_TRUE(engine.evaluate(make_line("hotdog")).matched);
  EXPECT_TRUE(engine.evaluate(make_line("concatenate")).matched);
  EXPECT_FALSE(engine.evaluate(make_line("bird")).matched);
}

TEST(MatchEngine, FirstMatchWithoutHighlighting)
{
  Patterns patterns = compile({ "foo", "bar" }, Dialect::FIXED, false, false, false);
  MatchEngine engine(patterns, false, false);

  MatchResult result = engine.evaluate(make_line("foo bar foo"));

  EXPECT_TRUE(result.matched);
  ASSERT_EQ(result.spans.size(), 1u);
  EXPECT_EQ(result.spans[0].start, 0u);
  EXPECT_EQ(result.spans[0].end, 3u);
  EXPECT_EQ(result.spans[0].pattern, 0u);
}

TEST(MatchEngine, AllMatchesWhenHighlighting)
{
  Patterns patterns = compile({ "foo", "bar" }, Dialect::FIXED, false, false, false);
  MatchEngine engine(patterns, false, true);

  MatchResult result = engine.evaluate(make_line("foo bar foo"));

  EXPECT_TRUE(result.matched);
  ASSERT_EQ(result.spans.size(), 3u);
  EXPECT_EQ(result.spans[0].start, 0u);
  EXPECT_EQ(result.spans[0].end, 3u);
  EXPECT_EQ(result.spans[1].start, 8u);
  EXPECT_EQ(result.spans[1].end, 11u);
  EXPECT_EQ(result.spans[2].start, 4u);
  EXPECT_EQ(result.spans[2].end, 7u);
  EXPECT_EQ(result.spans[2].pattern, 1u);
}

TEST(MatchEngine, LiteralMatchesDoNotOverlap)
{
  Patterns patterns = compile({ "aa" }, Dialect::FIXED, false, false, false);
  MatchEngine engine(patterns, false, true);

  MatchResult result = engine.evaluate(make_line("aaaaa"));

  ASSERT_EQ(result.spans.size(), 2u);
  EXPECT_EQ(result.spans[0].start, 0u);
  EXPECT_EQ(result.spans[1].start, 2u);
}

TEST(MatchEngine, LiteralIgnoringCase)
{
  Patterns patterns = compile({ "Foo" }, Dialect::FIXED, true, false, false);
  MatchEngine engine(patterns, false, true);

  MatchResult result = engine.evaluate(make_line("FOO and foo"));

  EXPECT_TRUE(result.matched);
  ASSERT_EQ(result.spans.size(), 2u);
  EXPECT_EQ(result.spans[1].start, 8u);
}

TEST(MatchEngine, RegexSpans)
{
  Patterns patterns = compile({ "[0-9]+" }, Dialect::EXTENDED, false, false, false);
  MatchEngine engine(patterns, false, true);

  MatchResult result = engine.evaluate(make_line("a1b22"));

  EXPECT_TRUE(result.matched);
  ASSERT_EQ(result.spans.size(), 2u);
  EXPECT_EQ(result.spans[0].start, 1u);
  EXPECT_EQ(result.spans[0].end, 2u);
  EXPECT_EQ(result.spans[1].start, 3u);
  EXPECT_EQ(result.spans[1].end, 5u);
}

TEST(MatchEngine, RegexIgnoringCase)
{
  Patterns patterns = compile({ "hello" }, Dialect::EXTENDED, true, false, false);
  MatchEngine engine(patterns, false, false);

  EXPECT_TRUE(engine.evaluate(make_line("say HeLLo")).matched);
  EXPECT_FALSE(engine.evaluate(make_line("say help")).matched);
}

TEST(MatchEngine, BasicRegexAlternation)
{
  Patterns patterns = compile({ "cat\\|dog" }, Dialect::BASIC, false, false, false);
  MatchEngine engine(patterns, false, false);

  EXPECT_TRUE(engine.evaluate(make_line("a dog")).matched);
  EXPECT_FALSE(engine.evaluate(make_line("a bird")).matched);
}

TEST(MatchEngine, WordAnchor)
{
  Patterns patterns = compile({ "cat" }, Dialect::FIXED, false, true, false);
  MatchEngine engine(patterns, false, true);

  EXPECT_FALSE(engine.evaluate(make_line("concatenate")).matched);

  MatchResult result = engine.evaluate(make_line("the cat sat"));

  EXPECT_TRUE(result.matched);
  ASSERT_EQ(result.spans.size(), 1u);
  EXPECT_EQ(result.spans[0].start, 4u);
  EXPECT_EQ(result.spans[0].end, 7u);
}

TEST(MatchEngine, LineAnchor)
{
  Patterns patterns = compile({ "a.c" }, Dialect::EXTENDED, false, false, true);
  MatchEngine engine(patterns, false, true);

  EXPECT_FALSE(engine.evaluate(make_line("abcd")).matched);
  EXPECT_FALSE(engine.evaluate(make_line("xabc")).matched);

  MatchResult result = engine.evaluate(make_line("abc"));

  EXPECT_TRUE(result.matched);
  ASSERT_EQ(result.spans.size(), 1u);
  EXPECT_EQ(result.spans[0].start, 0u);
  EXPECT_EQ(result.spans[0].end, 3u);
}

TEST(MatchEngine, LineAnchorRejectsMatchesInsideTheLine)
{
  Patterns patterns = compile({ "ab+" }, Dialect::EXTENDED, false, false, true);
  MatchEngine engine(patterns, false, false);

  EXPECT_FALSE(engine.evaluate(make_line("xaby")).matched);
  EXPECT_FALSE(engine.evaluate(make_line("abbx")).matched);
  EXPECT_TRUE(engine.evaluate(make_line("abbb")).matched);
}

TEST(MatchEngine, WordAnchorIgnoringCase)
{
  const char *lines[] = { "foo bar", "foobar", "FOO" };

  Patterns anywhere = compile({ "foo" }, Dialect::FIXED, true, false, false);
  MatchEngine substring(anywhere, false, false);

  for (const char *line : lines)
    EXPECT_TRUE(substring.evaluate(make_line(line)).matched) << line;

  Patterns words = compile({ "foo" }, Dialect::FIXED, true, true, false);
  MatchEngine word(words, false, false);

  EXPECT_TRUE(word.evaluate(make_line("foo bar")).matched);
  EXPECT_FALSE(word.evaluate(make_line("foobar")).matched);
  EXPECT_TRUE(word.evaluate(make_line("FOO")).matched);
}

TEST(MatchEngine, InvertSelectsNonMatchingLinesWithoutSpans)
{
  Patterns patterns = compile({ "foo" }, Dialect::FIXED, false, false, false);
  MatchEngine engine(patterns, true, true);

  MatchResult hit = engine.evaluate(make_line("foo"));
  MatchResult miss = engine.evaluate(make_line("bar"));

  EXPECT_FALSE(hit.matched);
  EXPECT_TRUE(hit.spans.empty());
  EXPECT_TRUE(miss.matched);
  EXPECT_TRUE(miss.spans.empty());
}

TEST(MatchEngine, InvertIsTheComplement)
{
  Patterns patterns = compile({ "o+", "^x" }, Dialect::EXTENDED, false, false, false);
  MatchEngine plain(patterns, false, false);
  MatchEngine inverted(patterns, true, false);

  const char *texts[] = { "", "foo", "xyz", "abc", "x", "bob" };

  for (const char *text : texts)
    EXPECT_NE(plain.evaluate(make_line(text)).matched, inverted.evaluate(make_line(text)).matched) << text;
}

TEST(MatchEngine, EmptyPatternMatchesEveryLine)
{
  Patterns literal = compile({ "" }, Dialect::FIXED, false, false, false);
  MatchEngine literal_engine(literal, false, true);

  MatchResult result = literal_engine.evaluate(make_line("anything"));

  EXPECT_TRUE(result.matched);
  EXPECT_TRUE(result.spans.empty());
  EXPECT_TRUE(literal_engine.evaluate(make_line("")).matched);

  Patterns regex = compile({ "" }, Dialect::EXTENDED, false, false, false);
  MatchEngine regex_engine(regex, false, true);

  EXPECT_TRUE(regex_engine.evaluate(make_line("anything")).matched);
  EXPECT_TRUE(regex_engine.evaluate(make_line("")).matched);
}

TEST(MatchEngine, EmptyPatternWithLineAnchorMatchesEmptyLines)
{
  Patterns patterns = compile({ "" }, Dialect::EXTENDED, false, false, true);
  MatchEngine engine(patterns, false, false);

  EXPECT_TRUE(engine.evaluate(make_line("")).matched);
  EXPECT_FALSE(engine.evaluate(make_line("x")).matched);
}

TEST(MatchEngine, EmptyMatchesSelectWithoutSpans)
{
  Patterns patterns = compile({ "^$" }, Dialect::EXTENDED, false, false, false);
  MatchEngine engine(patterns, false, true);

  MatchResult result = engine.evaluate(make_line(""));

  EXPECT_TRUE(result.matched);
  EXPECT_TRUE(result.spans.empty());
  EXPECT_FALSE(engine.evaluate(make_line("text")).matched);
}

TEST(MatchEngine, BinaryLinesAreMatched)
{
  std::string text("ab", 2);
  text.push_back('\0');
  text.append("needle");

  Patterns patterns = compile({ "needle" }, Dialect::FIXED, false, false, false);
  MatchEngine engine(patterns, false, false);

  EXPECT_TRUE(engine.evaluate(make_line(text, true)).matched);
}

TEST(MatchEngine, ResultIsReusedAcrossLines)
{
  Patterns patterns = compile({ "x" }, Dialect::FIXED, false, false, false);
  MatchEngine engine(patterns, false, true);
  MatchResult result;

  engine.evaluate(make_line("xx"), result);
  EXPECT_EQ(result.spans.size(), 2u);

  engine.evaluate(make_line("y"), result);
  EXPECT_FALSE(result.matched);
  EXPECT_TRUE(result.spans.empty());
}
