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
@file      highlight.cpp
@brief     text with ANSI SGR styles applied to byte ranges, possibly overlapping
@author    Robert van Engelen - engelen@genivia.com
@copyright (c) 2019-2022, Robert van Engelen, Genivia Inc. All rights reserved.
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#include "highlight.hpp"
#include <algorithm>
#include <stdexcept>

// apply the SGR parameters sgr, e.g. "1;31", from offset start to the end of the text
Highlight::Instance Highlight::apply(const std::string& sgr, size_t start)
{
  Instance id = next_++;
  events_[start].apply.emplace_back(id, sgr);
  return id;
}

// apply the SGR parameters sgr, e.g. "1;31", to length bytes at offset start, nothing is applied when length is zero
Highlight::Instance Highlight::apply(const std::string& sgr, size_t start, size_t length)
{
  if (length == 0)
    return next_++;

  Instance id = apply(sgr, start);
  events_[start + length].remove.push_back(id);
  return id;
}

// the text with SGR escape sequences, throws std::logic_error when a style is removed that is not active
std::string Highlight::render() const
{
  if (events_.empty())
    return text_;

  std::string out;
  out.reserve(text_.size() + 16 * events_.size());

  // the active styles in the order applied
  std::vector<const Style*> active;

  size_t last = 0;

  for (Events::const_iterator event = events_.begin(); event != events_.end(); ++event)
  {
    size_t offset = event->first;

    // styles at or past the end of the text have no effect
    if (offset >= text_.size())
      break;

    out.append(text_, last, offset - last);
    last = offset;

    bool removed = false;

    for (auto id : event->second.remove)
    {
      std::vector<const Style*>::iterator style = std::find_if(active.begin(), active.end(), [id](const Style *s) { return s->id == id; });

      if (style == active.end())
        throw std::logic_error("highlight style removed that is not active");

      active.erase(style);
      removed = true;
    }

    for (const auto& style : event->second.apply)
      active.push_back(&style);

    // reset when styles were removed and other styles stay active, then set the active styles
    out.append("\033[");

    bool sep = false;

    if (removed && !active.empty())
    {
      out.push_back('0');
      sep = true;
    }

    for (const auto style : active)
    {
      if (sep)
        out.push_back(';');
      out.append(style->sgr);
      sep = true;
    }

    out.push_back('m');
  }

  out.append(text_, last, std::string::npos);

  if (!active.empty())
    out.append("\033[m");

  return out;
}
