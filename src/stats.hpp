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
@file      stats.hpp
@brief     collect global statistics - static, updated by the searching thread only
@author    Robert van Engelen - engelen@genivia.com
@copyright (c) 2019-2022, Robert van Engelen, Genivia Inc. All rights reserved.
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#ifndef STATS_HPP
#define STATS_HPP

#include "lgrep.hpp"
#include <reflex/timer.h>

// static class to collect global statistics
class Stats {

 public:

  // reset stats
  static void reset()
  {
    reflex::timer_start(timer);
    files = 0;
    unreadable = 0;
    lines = 0;
    selected = 0;
    binary = 0;
    overflow = 0;
    warnings = 0;
  }

  // score a source searched
  static void score_file()
  {
    ++files;
  }

  // score a source that could not be opened
  static void score_unreadable()
  {
    ++unreadable;
  }

  // score lines read and lines selected of a source
  static void score_lines(size_t read, size_t selects)
  {
    lines += read;
    selected += selects;
  }

  // score binary sources that matched and the number of truncated lines of a source
  static void score_summary(bool binary_match, size_t truncated)
  {
    if (binary_match)
      ++binary;
    overflow += truncated;
  }

  // count a warning
  static void warning()
  {
    ++warnings;
  }

  // number of sources searched
  static size_t searched_files()
  {
    return files;
  }

  // number of sources that could not be opened
  static size_t unreadable_files()
  {
    return unreadable;
  }

  // number of lines searched
  static size_t searched_lines()
  {
    return lines;
  }

  // number of lines selected for output
  static size_t selected_lines()
  {
    return selected;
  }

  // number of truncated lines
  static size_t truncated_lines()
  {
    return overflow;
  }

  // number of warnings given
  static size_t warnings_given()
  {
    return warnings;
  }

  // report the statistics
  static void report(FILE *output);

 protected:

  static reflex::timer_type timer;      // elapsed wall-clock time in milli seconds (ms)
  static size_t             files;      // number of sources searched
  static size_t             unreadable; // number of sources that could not be opened
  static size_t             lines;      // number of lines read
  static size_t             selected;   // number of lines selected
  static size_t             binary;     // number of binary sources with matches
  static size_t             overflow;   // number of lines truncated to the maximum line length
  static std::atomic_size_t warnings;   // number of warnings given

};

#endif
