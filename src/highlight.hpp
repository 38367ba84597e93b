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
@file      highlight.hpp
@brief     text with ANSI SGR styles applied to byte ranges, possibly overlapping
@author    Robert van Engelen - engelen@genivia.com
@copyright (c) 2019-2022, Robert van Engelen, Genivia Inc. All rights reserved.
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#ifndef HIGHLIGHT_HPP
#define HIGHLIGHT_HPP

#include "lgrep.hpp"
#include <map>
#include <string>
#include <vector>

// text with ANSI SGR styles that start and stop at byte offsets
class Highlight {

 public:

  // identifies a style applied by apply()
  typedef size_t Instance;

  Highlight()
    :
      text_(),
      events_(),
      next_(0)
  { }

  explicit Highlight(const std::string& text)
    :
      text_(text),
      events_(),
      next_(0)
  { }

  // assign new text without styles
  void assign(const std::string& text)
  {
    text_.assign(text);
    events_.clear();
  }

  // apply the SGR parameters sgr, e.g. "1;31", from offset start to the end of the text
  Instance apply(const std::string& sgr, size_t start);

  // apply the SGR parameters sgr, e.g. "1;31", to length bytes at offset start, nothing is applied when length is zero
  Instance apply(const std::string& sgr, size_t start, size_t length);

  // remove all styles
  void clear()
  {
    events_.clear();
  }

  // true if no styles are applied
  bool empty() const
  {
    return events_.empty();
  }

  const std::string& text() const
  {
    return text_;
  }

  // the text with SGR escape sequences, throws std::logic_error when a style is removed that is not active
  std::string render() const;

 protected:

  // a style instance
  struct Style {

    Style(Instance id, const std::string& sgr)
      :
        id(id),
        sgr(sgr)
    { }

    Instance    id;
    std::string sgr;

  };

  // the styles removed and applied at an offset, in that order
  struct Event {
    std::vector<Style>    apply;
    std::vector<Instance> remove;
  };

  typedef std::map<size_t,Event> Events;

  std::string text_;   // the text
  Events      events_; // style events by offset
  Instance    next_;   // next instance id, increasing over the lifetime of this object

};

#endif
