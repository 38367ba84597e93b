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
@file      config.hpp
@brief     search configuration and color palette, resolved once before searching
@author    Robert van Engelen - engelen@genivia.com
@copyright (c) 2019-2022, Robert van Engelen, Genivia Inc. All rights reserved.
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#ifndef CONFIG_HPP
#define CONFIG_HPP

#include "lgrep.hpp"
#include <string>

// pattern syntax of the patterns specified
enum class Dialect { FIXED, BASIC, EXTENDED };

// --color=WHEN
enum class ColorMode { AUTO, ALWAYS, NEVER };

// ANSI SGR parameters of GREP_COLORS and --colors, without the \033[ and m
struct Palette {

  Palette()
    :
      ms(),
      mc(),
      fn(),
      ln(),
      se()
  { }

  // the default palette DEFAULT_GREP_COLORS
  static Palette defaults()
  {
    Palette palette;
    palette.parse(DEFAULT_GREP_COLORS);
    return palette;
  }

  // update the palette with the GREP_COLORS-formatted string colors, e.g. "ms=1;31:fn=35"
  void parse(const char *colors);

  std::string ms; // matched text in a selected line
  std::string mc; // matched text in a context line
  std::string fn; // file name
  std::string ln; // line number
  std::string se; // separator

};

// search configuration, a plain value shared by const reference
struct Config {

  Config()
    :
      dialect(Dialect::BASIC),
      ignore_case(false),
      word_anchor(false),
      line_anchor(false),
      invert(false),
      delimiter("\n"),
      max_line(DEFAULT_MAX_LINE),
      line_number(false),
      with_filename(false),
      no_messages(false),
      result_separator(":"),
      name_number_separator(":"),
      color_mode(ColorMode::AUTO),
      palette(Palette::defaults()),
      pipeline(true),
      max_queue(DEFAULT_MAX_QUEUE),
      line_buffered(false)
  { }

  // true if output to the given file should be colorized
  bool color(FILE *file) const;

  Dialect     dialect;               // -E, -F, -G
  bool        ignore_case;           // -i
  bool        word_anchor;           // -w
  bool        line_anchor;           // -x
  bool        invert;                // -v
  std::string delimiter;             // --delimiter and -z
  size_t      max_line;              // --max-line
  bool        line_number;           // -n
  bool        with_filename;         // -H
  bool        no_messages;           // -s
  std::string result_separator;      // --result-sep
  std::string name_number_separator; // --name-num-sep
  ColorMode   color_mode;            // --color
  Palette     palette;               // GREP_COLORS and --colors
  bool        pipeline;              // --no-pipeline disables the writer thread
  size_t      max_queue;             // --max-queue
  bool        line_buffered;         // --line-buffered

};

// convert a --color=WHEN argument, returns false if WHEN is invalid
extern bool color_mode(const char *when, ColorMode& mode);

// convert C escapes \n \r \t \0 \\ and \xHH in a --delimiter argument to bytes
extern std::string unescape(const char *arg);

#endif
