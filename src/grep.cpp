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
@file      grep.cpp
@brief     search sources line by line and report the selected lines
@author    Robert van Engelen - engelen@genivia.com
@copyright (c) 2019-2022, Robert van Engelen, Genivia Inc. All rights reserved.
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#include "grep.hpp"
#include "highlight.hpp"
#include "stats.hpp"
#ifndef OS_WIN
#include <sys/select.h>
#endif

Grep::Grep(const Config& config, const Patterns& patterns, Output& out)
  :
    config_(config),
    out_(out),
    color_(config.color(out.file)),
    highlight_(color_ && !config.invert && !config.palette.ms.empty()),
    engine_(patterns, config.invert, highlight_),
    reporter_(config, out, color_),
    stdin_handler_(out)
{ }

// flush the output, then wait until input is available
int Grep::StdInHandler::operator()(FILE *file)
{
  out.flush();

#ifndef OS_WIN
  while (true)
  {
    struct timeval tv;
    fd_set rfds, efds;
    FD_ZERO(&rfds);
    FD_ZERO(&efds);
    FD_SET(fileno(file), &rfds);
    FD_SET(fileno(file), &efds);
    tv.tv_sec = 1;
    tv.tv_usec = 0;
    int r = ::select(fileno(file) + 1, &rfds, NULL, &efds, &tv);
    if (r < 0 && errno != EINTR)
      return 0;
    if (r > 0 && FD_ISSET(fileno(file), &efds))
      return 0;
    if (r > 0)
      break;
  }
#endif

  // clear EAGAIN and EINTR error on the nonblocking input
  clearerr(file);

  // no error
  return 1;
}

// search the files in order, or standard input when no files are given, stop when output fails
void Grep::grep(const std::vector<std::string>& files)
{
  if (files.empty())
  {
    search(NULL);
    return;
  }

  for (const auto& file : files)
  {
    // the other end closed or has an error
    if (out_.eof)
      break;

    search(file.c_str());
  }
}

// search a file, or standard input when pathname is NULL or "-", returns false when the file cannot be read
bool Grep::search(const char *pathname)
{
  LineSource source(config_.delimiter, config_.max_line);

  int err = source.open(pathname, &stdin_handler_);

  if (err != 0)
  {
    Stats::score_unreadable();

    if (!config_.no_messages)
    {
      errno = err;
      warning("cannot read", pathname);
    }

    return false;
  }

  search(source);

  // the source was searched up to the error
  if (source.error() && !config_.no_messages)
    warning("error while reading", source.name().c_str());

  return true;
}

// search the lines of an opened source
void Grep::search(LineSource& source)
{
  static const std::string none;

  Line line;
  MatchResult result;
  Highlight text;

  reporter_.begin(source.name());

  while (!out_.eof && source.next(line))
  {
    engine_.evaluate(line, result);

    if (result.matched && !line.binary)
    {
      text.assign(line.text);

      if (highlight_)
        for (const auto& span : result.spans)
          text.apply(config_.palette.ms, span.start, span.end - span.start);

      reporter_.report(line, result, text.render());
    }
    else
    {
      reporter_.report(line, result, none);
    }
  }

  reporter_.end();

  Stats::score_file();
  Stats::score_lines(source.lines(), reporter_.selected());
}
