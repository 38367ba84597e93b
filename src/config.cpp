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
@file      config.cpp
@brief     search configuration and color palette, resolved once before searching
@author    Robert van Engelen - engelen@genivia.com
@copyright (c) 2019-2022, Robert van Engelen, Genivia Inc. All rights reserved.
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#include "config.hpp"
#include <cctype>
#include <cstdint>

// convert GREP_COLORS parameter value s up to a ':' or '\0' to ANSI SGR parameters
static std::string sgr_parameters(const char *s)
{
  std::string color;

#ifdef WITH_EASY_GREP_COLORS

  // foreground colors: k=black, r=red, g=green, y=yellow b=blue, m=magenta, c=cyan, w=white
  // background colors: K=black, R=red, G=green, Y=yellow B=blue, M=magenta, C=cyan, W=white
  // bright colors: +k, +r, +g, +y, +b, +m, +c, +w, +K, +R, +G, +Y, +B, +M, +C, +W
  // modifiers: h=highlight, u=underline, i=invert, f=faint, n=normal, H=highlight off, U=underline off, I=invert off
  // semicolons are not required and abbreviations can be mixed with numeric ANSI SGR codes

  uint8_t offset = 30;
  bool sep = false;

  while (*s != '\0' && *s != ':')
  {
    if (isdigit(static_cast<unsigned char>(*s)))
    {
      if (sep)
        color.push_back(';');
      if (offset == 90)
      {
        color.append("1;");
        offset = 30;
      }
      while (isdigit(static_cast<unsigned char>(*s)))
        color.push_back(*s++);
      sep = true;
      continue;
    }

    const char *modifier = NULL;

    switch (*s)
    {
      case '+':
        offset = 90;
        break;

      case 'n':
        modifier = "0";
        break;

      case 'h':
        modifier = "1";
        break;

      case 'H':
        modifier = "21";
        offset = 30;
        break;

      case 'f':
        modifier = "2";
        break;

      case 'u':
        modifier = "4";
        break;

      case 'U':
        modifier = "24";
        break;

      case 'i':
        modifier = "7";
        break;

      case 'I':
        modifier = "27";
        break;

      case ',':
      case ';':
      case ' ':
      case '\t':
        if (sep)
          color.push_back(';');
        sep = false;
        break;

      default:
      {
        const char *c = "krgybmcw  KRGYBMCW";
        const char *k = strchr(c, *s);

        if (k != NULL)
        {
          if (sep)
            color.push_back(';');
          uint8_t n = offset + static_cast<uint8_t>(k - c);
          if (n >= 100)
          {
            color.push_back('1');
            n -= 100;
          }
          color.push_back('0' + n / 10);
          color.push_back('0' + n % 10);
          offset = 30;
          sep = true;
        }
      }
    }

    if (modifier != NULL)
    {
      if (sep)
        color.push_back(';');
      color.append(modifier);
      sep = true;
    }

    ++s;
  }

  // trailing separators are not SGR parameters
  while (!color.empty() && color.back() == ';')
    color.pop_back();

#else

  // traditional grep SGR parameters
  while (*s == ';' || isdigit(static_cast<unsigned char>(*s)))
    color.push_back(*s++);

#endif

  return color;
}

// find the value of parameter "xx=" in colors, at the start or after a ':'
static const char *color_parameter(const char *colors, const char *parameter)
{
  size_t len = strlen(parameter);
  const char *s = colors;

  while (s != NULL && *s != '\0')
  {
    if (strncmp(s, parameter, len) == 0)
      return s + len;
    s = strchr(s, ':');
    if (s != NULL)
      ++s;
  }

  return NULL;
}

// update the palette with the GREP_COLORS-formatted string colors, e.g. "ms=1;31:fn=35"
void Palette::parse(const char *colors)
{
  if (colors == NULL)
    return;

  const char *s;

  // mt= sets both ms= and mc=, which may be overridden when specified later
  if ((s = color_parameter(colors, "mt=")) != NULL)
    ms = mc = sgr_parameters(s);
  if ((s = color_parameter(colors, "ms=")) != NULL)
    ms = sgr_parameters(s);
  if ((s = color_parameter(colors, "mc=")) != NULL)
    mc = sgr_parameters(s);
  if ((s = color_parameter(colors, "fn=")) != NULL)
    fn = sgr_parameters(s);
  if ((s = color_parameter(colors, "ln=")) != NULL)
    ln = sgr_parameters(s);
  if ((s = color_parameter(colors, "se=")) != NULL)
    se = sgr_parameters(s);
}

// true if output to the given file should be colorized
bool Config::color(FILE *file) const
{
  switch (color_mode)
  {
    case ColorMode::ALWAYS:
      return true;

    case ColorMode::NEVER:
      return false;

    case ColorMode::AUTO:
      break;
  }

  if (file == NULL || isatty(fileno(file)) == 0)
    return false;

  // check TERM for a color terminal
  char *term = NULL;
  bool color_term = dupenv_s(&term, "TERM") == 0 && term != NULL && strcmp(term, "dumb") != 0;
  if (term != NULL)
    free(term);

  return color_term;
}

// convert a --color=WHEN argument, returns false if WHEN is invalid
bool color_mode(const char *when, ColorMode& mode)
{
  if (when == NULL || strcmp(when, "auto") == 0 || strcmp(when, "tty") == 0 || strcmp(when, "if-tty") == 0)
    mode = ColorMode::AUTO;
  else if (strcmp(when, "never") == 0 || strcmp(when, "no") == 0 || strcmp(when, "none") == 0)
    mode = ColorMode::NEVER;
  else if (strcmp(when, "always") == 0 || strcmp(when, "yes") == 0 || strcmp(when, "force") == 0)
    mode = ColorMode::ALWAYS;
  else
    return false;
  return true;
}

// convert C escapes \n \r \t \0 \\ and \xHH in a --delimiter argument to bytes
std::string unescape(const char *arg)
{
  std::string bytes;

  while (*arg != '\0')
  {
    if (*arg != '\\' || arg[1] == '\0')
    {
      bytes.push_back(*arg++);
      continue;
    }

    ++arg;

    switch (*arg)
    {
      case 'n':
        bytes.push_back('\n');
        break;

      case 'r':
        bytes.push_back('\r');
        break;

      case 't':
        bytes.push_back('\t');
        break;

      case '0':
        bytes.push_back('\0');
        break;

      case 'x':
        if (isxdigit(static_cast<unsigned char>(arg[1])))
        {
          int c = 0;
          size_t n = 0;
          while (n < 2 && isxdigit(static_cast<unsigned char>(arg[1])))
          {
            int d = static_cast<unsigned char>(*++arg);
            c = 16 * c + (isdigit(d) ? d - '0' : (tolower(d) - 'a' + 10));
            ++n;
          }
          bytes.push_back(static_cast<char>(c));
          break;
        }
        bytes.append("\\x");
        break;

      default:
        // \\ and any other escaped character stand for the character itself
        bytes.push_back(*arg);
    }

    ++arg;
  }

  return bytes;
}
