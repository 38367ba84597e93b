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
@file      pattern.hpp
@brief     compile fixed string, basic and extended regex patterns to one search form
@author    Robert van Engelen - engelen@genivia.com
@copyright (c) 2019-2022, Robert van Engelen, Genivia Inc. All rights reserved.
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#ifndef PATTERN_HPP
#define PATTERN_HPP

#include "config.hpp"
#include <reflex/pattern.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

// an invalid pattern, raised before searching starts
class PatternError : public std::runtime_error {

 public:

  PatternError(const std::string& message, const std::string& pattern)
    :
      std::runtime_error(message),
      pattern_(pattern)
  { }

  // the offending pattern as specified
  const std::string& pattern() const
  {
    return pattern_;
  }

 private:

  std::string pattern_;

};

// a compiled search pattern, either a literal string to find or a regex
class Pattern {

 public:

  enum class Type { LITERAL, COMPILED };

  // a literal string to find, lowercased when ignore_case
  static Pattern literal(const std::string& bytes, bool ignore_case);

  // a regex in RE/flex syntax, matched against the whole line when line_anchor, throws PatternError
  static Pattern compiled(const std::string& regex, bool ignore_case, bool line_anchor, bool word_anchor);

  Type type() const
  {
    return type_;
  }

  // the literal string or the regex
  const std::string& source() const
  {
    return source_;
  }

  bool ignore_case() const
  {
    return ignore_case_;
  }

  bool line_anchor() const
  {
    return line_anchor_;
  }

  bool word_anchor() const
  {
    return word_anchor_;
  }

  // an empty regex is not compiled, it matches any line or any empty line when line_anchor
  bool empty() const
  {
    return regex_ == NULL;
  }

  // the compiled regex, when !empty()
  const reflex::Pattern& regex() const
  {
    return *regex_;
  }

 protected:

  Pattern(Type type, const std::string& source, bool ignore_case, bool line_anchor, bool word_anchor)
    :
      type_(type),
      source_(source),
      ignore_case_(ignore_case),
      line_anchor_(line_anchor),
      word_anchor_(word_anchor),
      regex_()
  { }

  Type                             type_;
  std::string                      source_;
  bool                             ignore_case_;
  bool                             line_anchor_;
  bool                             word_anchor_;
  std::unique_ptr<reflex::Pattern> regex_; // heap allocated so matchers keep a valid reference when patterns move

};

typedef std::vector<Pattern> Patterns;

// compile the patterns of a dialect with the -i, -w and -x modifiers, throws PatternError
extern Patterns compile(const std::vector<std::string>& patterns, Dialect dialect, bool ignore_case, bool word_anchor, bool line_anchor);

// compile the patterns with the dialect and modifiers of the configuration, throws PatternError
inline Patterns compile(const std::vector<std::string>& patterns, const Config& config)
{
  return compile(patterns, config.dialect, config.ignore_case, config.word_anchor, config.line_anchor);
}

// convert between basic and extended regex syntax by inverting the escapes of the meta characters
extern std::string invert_escapes(const std::string& pattern, const char *metas = "{+?|()}");

// quote a pattern with \Q and \E
extern void quote(std::string& pattern);

// ASCII lowercase of a string, preserving its length
extern std::string lowercase(const std::string& string);

#endif
