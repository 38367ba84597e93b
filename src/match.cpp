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
@file      match.cpp
@brief     evaluate compiled patterns against a line
@author    Robert van Engelen - engelen@genivia.com
@copyright (c) 2019-2022, Robert van Engelen, Genivia Inc. All rights reserved.
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#include "match.hpp"

// invert selects lines that do not match, highlight collects all matches of all patterns to color them
MatchEngine::MatchEngine(const Patterns& patterns, bool invert, bool highlight)
  :
    patterns_(patterns),
    matchers_(),
    invert_(invert),
    all_(highlight && !invert),
    fold_(false),
    lower_()
{
  matchers_.reserve(patterns_.size());

  for (const auto& pattern : patterns_)
  {
    // option N: find may return empty matches, to match empty lines with e.g. ^$ and x*
    if (pattern.type() == Pattern::Type::COMPILED && !pattern.empty())
      matchers_.emplace_back(new reflex::Matcher(pattern.regex(), reflex::Input(), "N"));
    else
      matchers_.emplace_back();

    if (pattern.type() == Pattern::Type::LITERAL && pattern.ignore_case())
      fold_ = true;
  }
}

// evaluate the patterns against the line
void MatchEngine::evaluate(const Line& line, MatchResult& result)
{
  result.clear();

  const std::string& text = line.text;

  // literal patterns that ignore case are lowercased, search a lowercased copy of the line
  if (fold_)
    lower_ = lowercase(text);

  bool found = false;

  for (size_t i = 0; i < patterns_.size(); ++i)
  {
    const Pattern& pattern = patterns_[i];

    bool hit;

    if (pattern.type() == Pattern::Type::LITERAL)
      hit = find_literal(i, pattern.ignore_case() ? lower_ : text, result);
    else
      hit = find_regex(i, text, result);

    if (hit)
    {
      found = true;

      // the first match suffices when matches are not colored or when inverted
      if (!all_)
        break;
    }
  }

  if (invert_)
  {
    result.matched = !found;
    result.spans.clear();
  }
  else
  {
    result.matched = found;
  }
}

// search literal pattern number index, returns true if found
bool MatchEngine::find_literal(size_t index, const std::string& text, MatchResult& result)
{
  const std::string& literal = patterns_[index].source();

  size_t pos = text.find(literal);

  if (pos == std::string::npos)
    return false;

  // an empty string matches any line, but there is nothing to color
  if (literal.empty())
    return true;

  do
  {
    result.spans.emplace_back(pos, pos + literal.size(), index);
    if (!all_)
      break;
    pos = text.find(literal, pos + literal.size());
  } while (pos != std::string::npos);

  return true;
}

// search compiled pattern number index, returns true if found
bool MatchEngine::find_regex(size_t index, const std::string& text, MatchResult& result)
{
  const Pattern& pattern = patterns_[index];
  reflex::Matcher *matcher = matchers_[index].get();

  // an empty regex matches any line, or any empty line with -x
  if (matcher == NULL)
    return !pattern.line_anchor() || text.empty();

  // safe cast: buffer() is read-only if no matcher.text() and matcher.rest() are used, size + 1 to include final \0
  matcher->buffer(const_cast<char*>(text.c_str()), text.size() + 1);

  // -x: the regex must match the whole line
  if (pattern.line_anchor())
  {
    if (matcher->matches() == 0)
      return false;

    if (!text.empty())
      result.spans.emplace_back(0, text.size(), index);

    return true;
  }

  bool found = false;

  while (matcher->find() != 0)
  {
    found = true;

    // empty matches select the line but are not colored
    if (matcher->size() > 0)
      result.spans.emplace_back(matcher->first(), matcher->last(), index);

    if (!all_)
      break;
  }

  return found;
}
