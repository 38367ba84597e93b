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
@file      match.hpp
@brief     evaluate compiled patterns against a line
@author    Robert van Engelen - engelen@genivia.com
@copyright (c) 2019-2022, Robert van Engelen, Genivia Inc. All rights reserved.
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#ifndef MATCH_HPP
#define MATCH_HPP

#include "input.hpp"
#include "pattern.hpp"
#include <reflex/matcher.h>
#include <memory>
#include <vector>

// a match of a pattern in a line, start <= end <= line size
struct MatchSpan {

  MatchSpan(size_t start, size_t end, size_t pattern)
    :
      start(start),
      end(end),
      pattern(pattern)
  { }

  size_t start;   // byte offset of the match
  size_t end;     // byte offset after the match
  size_t pattern; // index of the pattern that matched

};

// the result of evaluating the patterns against a line
struct MatchResult {

  MatchResult()
    :
      matched(false),
      spans()
  { }

  void clear()
  {
    matched = false;
    spans.clear();
  }

  bool                   matched; // line is selected, no spans when inverted
  std::vector<MatchSpan> spans;   // matches in order of the patterns, then in order of the line

};

// evaluate the patterns against lines, the patterns must outlive the engine
class MatchEngine {

 public:

  // invert selects lines that do not match, highlight collects all matches of all patterns to color them
  MatchEngine(const Patterns& patterns, bool invert, bool highlight);

  // evaluate the patterns against the line
  void evaluate(const Line& line, MatchResult& result);

  // evaluate the patterns against the line
  MatchResult evaluate(const Line& line)
  {
    MatchResult result;
    evaluate(line, result);
    return result;
  }

 protected:

  // search literal pattern number index, returns true if found
  bool find_literal(size_t index, const std::string& text, MatchResult& result);

  // search compiled pattern number index, returns true if found
  bool find_regex(size_t index, const std::string& text, MatchResult& result);

  const Patterns&                              patterns_; // the patterns to evaluate
  std::vector<std::unique_ptr<reflex::Matcher>> matchers_; // a matcher per compiled pattern, NULL for literal and empty patterns
  bool                                         invert_;   // -v
  bool                                         all_;      // collect all matches, no early exit on the first match
  bool                                         fold_;     // some literal patterns ignore case
  std::string                                  lower_;    // the lowercased line for literal patterns that ignore case

};

#endif
