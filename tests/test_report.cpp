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
@file      test_report.cpp
@brief     tests of formatting selected lines and source summaries
@author    Robert van Engelen - engelen@genivia.com
@copyright (c) 2019-2022, Robert van Engelen, Genivia Inc. All rights reserved.
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#include "report.hpp"
#include "stats.hpp"
#include "helpers.hpp"
#include <gtest/gtest.h>

// a line with the given number and text
static Line make_line(size_t lineno, const std::string& text)
{
  Line line;
  line.text = text;
  line.lineno = lineno;
  return line;
}

// a selected line
static MatchResult selected()
{
  MatchResult result;
  result.matched = true;
  return result;
}

// report lines of source "f.txt" and return the output
class ReporterTest : public ::testing::Test {

 protected:

  void SetUp() override
  {
    file = tmpfile();
    ASSERT_TRUE(file != NULL);
    Stats::reset();
  }

  void TearDown() override
  {
    if (file != NULL)
      fclose(file);
  }

  std::string run(const std::vector<Line>& lines, bool color = false)
  {
    Output out(file);
    Reporter reporter(config, out, color);
    reporter.begin("f.txt");
    for (const auto& line : lines)
      reporter.report(line, selected(), line.text);
    reporter.end();
    out.finish();
    return slurp(file);
  }

  Config config;
  FILE  *file;

};

TEST_F(ReporterTest, TextOnly)
{
  EXPECT_EQ(run({ make_line(3, "hi") }), "hi\n");
}

TEST_F(ReporterTest, FilenameAndLineNumber)
{
  config.with_filename = true;
  config.line_number = true;

  EXPECT_EQ(run({ make_line(3, "hi"), make_line(12, "there") }), "f.txt:3:hi\nf.txt:12:there\n");
}

TEST_F(ReporterTest, FilenameOnly)
{
  config.with_filename = true;

  EXPECT_EQ(run({ make_line(3, "hi") }), "f.txt:hi\n");
}

TEST_F(ReporterTest, LineNumberOnly)
{
  config.line_number = true;

  EXPECT_EQ(run({ make_line(3, "hi") }), "3:hi\n");
}

TEST_F(ReporterTest, CustomSeparators)
{
  config.with_filename = true;
  config.line_number = true;
  config.result_separator = ": ";
  config.name_number_separator = "@";

  EXPECT_EQ(run({ make_line(3, "hi") }), "f.txt@3: hi\n");
}

TEST_F(ReporterTest, ColoredHeaderFields)
{
  config.with_filename = true;
  config.line_number = true;

  EXPECT_EQ(run({ make_line(3, "hi") }, true), "\033[35mf.txt\033[m\033[36m:\033[m\033[32m3\033[m\033[36m:\033[mhi\n");
}

TEST_F(ReporterTest, EmptyColorsAreNotApplied)
{
  config.with_filename = true;
  config.palette.fn.clear();
  config.palette.se.clear();

  EXPECT_EQ(run({ make_line(3, "hi") }, true), "f.txt:hi\n");
}

TEST_F(ReporterTest, UnselectedLinesAreNotOutput)
{
  Output out(file);
  Reporter reporter(config, out, false);

  reporter.begin("f.txt");
  reporter.report(make_line(1, "skip"), MatchResult(), "skip");
  reporter.report(make_line(2, "keep"), selected(), "keep");
  reporter.end();
  out.finish();

  EXPECT_EQ(slurp(file), "keep\n");
  EXPECT_EQ(reporter.selected(), 1u);
}

TEST_F(ReporterTest, BinaryMatchesAreSummarized)
{
  Line binary = make_line(1, "bin");
  binary.binary = true;

  Output out(file);
  Reporter reporter(config, out, false);

  reporter.begin("f.txt");
  reporter.report(binary, selected(), "");
  reporter.report(binary, selected(), "");
  reporter.end();
  out.finish();

  EXPECT_EQ(slurp(file), "Binary file f.txt matches\n");
  EXPECT_EQ(reporter.selected(), 0u);
  EXPECT_EQ(reporter.binary_matches(), 2u);
}

TEST_F(ReporterTest, TruncatedLinesAreSummarized)
{
  Line truncated = make_line(1, "long");
  truncated.overflow = true;

  Output out(file);
  Reporter reporter(config, out, false);

  reporter.begin("f.txt");
  reporter.report(truncated, MatchResult(), "");
  reporter.report(truncated, selected(), "long");
  reporter.end();
  out.finish();

  EXPECT_EQ(slurp(file), "long\nFile f.txt has 2 lines truncated to 131072 bytes\n");
  EXPECT_EQ(reporter.overflows(), 2u);
  EXPECT_EQ(Stats::truncated_lines(), 2u);
}

TEST_F(ReporterTest, OneTruncatedLine)
{
  Line truncated = make_line(1, "long");
  truncated.overflow = true;
  config.max_line = 4;

  EXPECT_EQ(run({ truncated }), "long\nFile f.txt has 1 line truncated to 4 bytes\n");
}

TEST_F(ReporterTest, BeginResetsTheCounts)
{
  Output out(file);
  Reporter reporter(config, out, false);

  reporter.begin("a");
  reporter.report(make_line(1, "x"), selected(), "x");
  reporter.end();

  reporter.begin("b");
  EXPECT_EQ(reporter.selected(), 0u);
  reporter.end();
  out.finish();

  EXPECT_EQ(slurp(file), "x\n");
}
