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
@file      input.hpp
@brief     split a byte stream into delimited lines
@author    Robert van Engelen - engelen@genivia.com
@copyright (c) 2019-2022, Robert van Engelen, Genivia Inc. All rights reserved.
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#ifndef INPUT_HPP
#define INPUT_HPP

#include "lgrep.hpp"
#include <reflex/input.h>
#include <string>

// a line read from a source, valid until the next line is read
struct Line {

  Line()
    :
      text(),
      lineno(0),
      binary(false),
      overflow(false),
      eof(false)
  { }

  std::string text;     // line content without the delimiter, at most max bytes
  size_t      lineno;   // 1-based line number in the source
  bool        binary;   // line is not valid UTF-8 or contains a NUL
  bool        overflow; // line was truncated to max bytes before its delimiter was found
  bool        eof;      // last line of the source, not terminated by a delimiter

};

// read lines separated by a delimiter from a file or standard input
class LineSource {

 public:

  // delimiter is a non-empty byte sequence, max > 0 is the maximum number of bytes retained per line
  explicit LineSource(const std::string& delimiter = "\n", size_t max = DEFAULT_MAX_LINE);

  ~LineSource()
  {
    close();
  }

  // open pathname to read, or standard input when pathname is NULL or "-", returns 0 or an errno value
  int open(const char *pathname, reflex::Input::Handler *handler = NULL);

  // read lines from an open file that is not closed by close(), a TTY or pipe is read nonblocking with the handler to wait for input
  void open(FILE *file, const char *name, reflex::Input::Handler *handler = NULL);

  // read lines from an input, e.g. a string, the name is used to report the source
  void open(const reflex::Input& input, const char *name);

  // close the source, if opened by open(pathname)
  void close();

  // read the next line, returns false at the end of the source
  bool next(Line& line);

  // the name of the source
  const std::string& name() const
  {
    return name_;
  }

  // true if a read error occurred, nonblocking reads set the error indicator when no input is available yet
  bool error() const
  {
    return file_ != NULL && !nonblocking_ && ferror(file_) != 0;
  }

  // true if the end of the source was reached
  bool eof() const
  {
    return eof_;
  }

  // number of lines read so far
  size_t lines() const
  {
    return lineno_;
  }

 protected:

  // set the line number and binary flag of the line read
  void finish(Line& line);

  std::string           delimiter_;   // line delimiter
  size_t                max_;         // maximum number of bytes retained per line
  reflex::BufferedInput input_;       // buffered input to read bytes one at a time
  std::string           window_;      // the last delimiter size + 1 bytes read
  std::string           name_;        // the name of the source
  FILE                 *file_;        // file or standard input read, or NULL when reading a string
  bool                  owned_;       // file_ was opened by open(pathname) and is closed by close()
  bool                  nonblocking_; // file_ is a TTY or pipe read nonblocking
  size_t                lineno_;      // number of lines read
  bool                  eof_;         // end of the source reached

};

#endif
