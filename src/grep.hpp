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
@file      grep.hpp
@brief     search sources line by line and report the selected lines
@author    Robert van Engelen - engelen@genivia.com
@copyright (c) 2019-2022, Robert van Engelen, Genivia Inc. All rights reserved.
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#ifndef GREP_HPP
#define GREP_HPP

#include "config.hpp"
#include "input.hpp"
#include "match.hpp"
#include "output.hpp"
#include "pattern.hpp"
#include "report.hpp"
#include <string>
#include <vector>

// search sources one after another, the config and patterns must outlive the search
class Grep {

 public:

  Grep(const Config& config, const Patterns& patterns, Output& out);

  // search the files in order, or standard input when no files are given, stop when output fails
  void grep(const std::vector<std::string>& files);

  // search a file, or standard input when pathname is NULL or "-", returns false when the file cannot be read
  bool search(const char *pathname);

  // search the lines of an opened source
  void search(LineSource& source);

  // a handler to read standard input nonblocking from a TTY or a slow pipe, flushes output and waits for input
  struct StdInHandler : public reflex::Input::Handler {

    explicit StdInHandler(Output& out)
      :
        out(out)
    { }

    // returns 1 when input is available, 0 on error
    int operator()(FILE *file);

    Output& out;

  };

 protected:

  const Config& config_;        // the configuration
  Output&       out_;           // the output
  bool          color_;         // output is colorized
  bool          highlight_;     // matches are colored, not when inverted
  MatchEngine   engine_;        // evaluates the patterns
  Reporter      reporter_;      // reports selected lines and summaries
  StdInHandler  stdin_handler_; // waits for standard input from a TTY or pipe

};

#endif
