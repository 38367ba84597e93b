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
@file      test_config.cpp
@brief     tests of colors, --color and --delimiter arguments
@author    Robert van Engelen - engelen@genivia.com
@copyright (c) 2019-2022, Robert van Engelen, Genivia Inc. All rights reserved.
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#include "config.hpp"
#include <gtest/gtest.h>

TEST(Palette, Defaults)
{
  Palette palette = Palette::defaults();

  EXPECT_EQ(palette.ms, "01;31");
  EXPECT_EQ(palette.mc, "01;31");
  EXPECT_EQ(palette.fn, "35");
  EXPECT_EQ(palette.ln, "32");
  EXPECT_EQ(palette.se, "36");
}

TEST(Palette, ParseOverridesGivenParameters)
{
  Palette palette = Palette::defaults();
  palette.parse("ln=1;33:se=34");

  EXPECT_EQ(palette.ms, "01;31");
  EXPECT_EQ(palette.ln, "1;33");
  EXPECT_EQ(palette.se, "34");
}

TEST(Palette, MatchedTextSetsBothMatchColors)
{
  Palette palette = Palette::defaults();
  palette.parse("mt=1;32:mc=33");

  EXPECT_EQ(palette.ms, "1;32");
  EXPECT_EQ(palette.mc, "33");
}

TEST(Palette, EasyColors)
{
  Palette palette;
  palette.parse("ms=+r:mc=Y:fn=m:ln=hu:se=cK");

  EXPECT_EQ(palette.ms, "91");
  EXPECT_EQ(palette.mc, "43");
  EXPECT_EQ(palette.fn, "35");
  EXPECT_EQ(palette.ln, "1;4");
  EXPECT_EQ(palette.se, "36;40");
}

TEST(Palette, EmptyParameterDisablesColor)
{
  Palette palette = Palette::defaults();
  palette.parse("fn=:ln=32");

  EXPECT_EQ(palette.fn, "");
  EXPECT_EQ(palette.ln, "32");
}

TEST(Palette, ParametersAreMatchedAtBoundaries)
{
  Palette palette;
  palette.parse("xfn=1:fn=2");

  EXPECT_EQ(palette.fn, "2");
}

TEST(Config, Defaults)
{
  Config config;

  EXPECT_EQ(config.dialect, Dialect::BASIC);
  EXPECT_EQ(config.delimiter, "\n");
  EXPECT_EQ(config.max_line, static_cast<size_t>(DEFAULT_MAX_LINE));
  EXPECT_EQ(config.result_separator, ":");
  EXPECT_EQ(config.name_number_separator, ":");
  EXPECT_EQ(config.color_mode, ColorMode::AUTO);
  EXPECT_TRUE(config.pipeline);
}

TEST(Config, ColorWhen)
{
  Config config;
  FILE *file = tmpfile();
  ASSERT_TRUE(file != NULL);

  config.color_mode = ColorMode::ALWAYS;
  EXPECT_TRUE(config.color(file));

  config.color_mode = ColorMode::NEVER;
  EXPECT_FALSE(config.color(file));

  // a regular file is not a terminal
  config.color_mode = ColorMode::AUTO;
  EXPECT_FALSE(config.color(file));

  fclose(file);
}

TEST(ColorMode, Synonyms)
{
  ColorMode mode = ColorMode::NEVER;

  EXPECT_TRUE(color_mode("auto", mode));
  EXPECT_EQ(mode, ColorMode::AUTO);
  EXPECT_TRUE(color_mode("always", mode));
  EXPECT_EQ(mode, ColorMode::ALWAYS);
  EXPECT_TRUE(color_mode("none", mode));
  EXPECT_EQ(mode, ColorMode::NEVER);
  EXPECT_TRUE(color_mode("force", mode));
  EXPECT_EQ(mode, ColorMode::ALWAYS);
  EXPECT_TRUE(color_mode("if-tty", mode));
  EXPECT_EQ(mode, ColorMode::AUTO);
  EXPECT_TRUE(color_mode(NULL, mode));
  EXPECT_EQ(mode, ColorMode::AUTO);

  EXPECT_FALSE(color_mode("sometimes", mode));
  EXPECT_EQ(mode, ColorMode::AUTO);
}

TEST(Unescape, Escapes)
{
  EXPECT_EQ(unescape("\\n"), "\n");
  EXPECT_EQ(unescape("\\r\\n"), "\r\n");
  EXPECT_EQ(unescape("a\\tb"), "a\tb");
  EXPECT_EQ(unescape("\\0"), std::string(1, '\0'));
  EXPECT_EQ(unescape("\\\\"), "\\");
  EXPECT_EQ(unescape("\\x41\\x7e"), "A~");
  EXPECT_EQ(unescape("\\x4"), std::string(1, '\x04'));
  EXPECT_EQ(unescape("\\xg"), "\\xg");
  EXPECT_EQ(unescape("end\\"), "end\\");
  EXPECT_EQ(unescape("||"), "||");
}
