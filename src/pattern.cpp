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
@file      pattern.cpp
@brief     compile fixed string, basic and extended regex patterns to one search form
@author    Robert van Engelen - engelen@genivia.com
@copyright (c) 2019-2022, Robert van Engelen, Genivia Inc. All rights reserved.
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#include "pattern.hpp"
#include <reflex/matcher.h>
#include <cctype>

// a literal string to find, lowercased when ignore_case
Pattern Pattern::literal(const std::string& bytes, bool ignore_case)
{
  return Pattern(Type::LITERAL, ignore_case ? lowercase(bytes) : bytes, ignore_case, false, false);
}

// a regex in RE/flex syntax, matched against the whole line when line_anchor, throws PatternError
Pattern Pattern::compiled(const std::string& regex, bool ignore_case, bool line_anchor, bool word_anchor)
{
  Pattern pattern(Type::COMPILED, regex, ignore_case, line_anchor, word_anchor);

  // an empty regex is not compiled, RE/flex rejects empty patterns
  if (regex.empty())
    return pattern;

  std::string options(ignore_case ? "(?i)" : "");

  try
  {
    // convert to RE/flex syntax, inverted character classes and \s do not match newlines
    std::string converted = reflex::Matcher::convert(options + regex, reflex::convert_flag::notnewline | reflex::convert_flag::unicode);

    pattern.regex_.reset(new reflex::Pattern(converted, "r"));
  }

  catch (reflex::regex_error& error)
  {
    throw PatternError(error.what(), regex);
  }

  return pattern;
}

// compile the patterns of a dialect with the -i, -w and -x modifiers, throws PatternError
Patterns compile(const std::vector<std::string>& patterns, Dialect dialect, bool ignore_case, bool word_anchor, bool line_anchor)
{
  if (patterns.empty())
    throw PatternError("no pattern specified", "");

  Patterns compiled;
  compiled.reserve(patterns.size());

  for (const auto& raw : patterns)
  {
    std::string pattern(raw);

    switch (dialect)
    {
      case Dialect::FIXED:
        // -F without -w and -x is a literal string search, lowercased by literal() when ignoring case
        if (!word_anchor && !line_anchor)
        {
          compiled.push_back(Pattern::literal(pattern, ignore_case));
          continue;
        }

        // -w and -x need a regex to anchor the string
        quote(pattern);
        break;

      case Dialect::BASIC:
        pattern = invert_escapes(pattern);
        break;

      case Dialect::EXTENDED:
        break;
    }

    // -w: \b(?:regex)\b, -x is applied by matching the whole line
    if (word_anchor && !pattern.empty())
      pattern.insert(0, "\\b(?:").append(")\\b");

    compiled.push_back(Pattern::compiled(pattern, ignore_case, line_anchor && !word_anchor, word_anchor));
  }

  return compiled;
}

// convert between basic and extended regex syntax by inverting the escapes of the meta characters
std::string invert_escapes(const std::string& pattern, const char *metas)
{
  std::string inverted;
  inverted.reserve(pattern.size() + 8);

  for (size_t i = 0; i < pattern.size(); ++i)
  {
    char c = pattern[i];

    if (c == '\\' && i + 1 < pattern.size())
    {
      // \x becomes x for meta x, other escapes such as \\ and \. are kept
      char next = pattern[++i];
      if (next == '\0' || strchr(metas, next) == NULL)
        inverted.push_back('\\');
      inverted.push_back(next);
    }
    else
    {
      // x becomes \x for meta x
      if (c != '\0' && strchr(metas, c) != NULL)
        inverted.push_back('\\');
      inverted.push_back(c);
    }
  }

  return inverted;
}

// quote a pattern with \Q and \E
void quote(std::string& pattern)
{
  // when empty then nothing to quote
  if (pattern.empty())
    return;

  size_t from = 0;
  size_t to;

  // replace each \E in the pattern with \E\\E\Q
  while ((to = pattern.find("\\E", from)) != std::string::npos)
  {
    pattern.insert(to + 2, "\\\\E\\Q");
    from = to + 7;
  }

  // enclose in \Q and \E
  pattern.insert(0, "\\Q").append("\\E");
}

// ASCII lowercase of a string, preserving its length
std::string lowercase(const std::string& string)
{
  std::string lower(string);

  for (auto& c : lower)
    c = static_cast<char>(tolower(static_cast<unsigned char>(c)));

  return lower;
}
