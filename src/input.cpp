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
@file      input.cpp
@brief     split a byte stream into delimited lines
@author    Robert van Engelen - engelen@genivia.com
@copyright (c) 2019-2022, Robert van Engelen, Genivia Inc. All rights reserved.
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#include "input.hpp"
#include <reflex/simd.h>
#include <sys/types.h>
#include <sys/stat.h>
#ifndef OS_WIN
#include <fcntl.h>
#endif
#include <algorithm>
#include <stdexcept>

LineSource::LineSource(const std::string& delimiter, size_t max)
  :
    delimiter_(delimiter),
    max_(max),
    input_(),
    window_(),
    name_(),
    file_(NULL),
    owned_(false),
    nonblocking_(false),
    lineno_(0),
    eof_(true)
{
  if (delimiter_.empty())
    throw std::invalid_argument("empty line delimiter");
  if (max_ == 0)
    throw std::invalid_argument("maximum line length must be positive");
}

// open pathname to read, or standard input when pathname is NULL or "-", returns 0 or an errno value
int LineSource::open(const char *pathname, reflex::Input::Handler *handler)
{
  if (pathname == NULL || strcmp(pathname, "-") == 0)
  {
    open(stdin, LABEL_STANDARD_INPUT, handler);
    return 0;
  }

  close();

  FILE *file = NULL;
  int err = fopenw_s(&file, pathname, "rb");
  if (err != 0)
    return err;

  // reading a directory fails silently on some systems
  struct stat buf;
  if (fstat(fileno(file), &buf) == 0 && S_ISDIR(buf.st_mode))
  {
    fclose(file);
    return EISDIR;
  }

  file_ = file;
  owned_ = true;
  name_.assign(pathname);

  // read bytes as is, unless a UTF BOM is present
  input_ = reflex::Input(file_, reflex::Input::file_encoding::plain);
  lineno_ = 0;
  eof_ = false;

  return 0;
}

// read lines from an open file that is not closed by close(), a TTY or pipe is read nonblocking with the handler to wait for input
void LineSource::open(FILE *file, const char *name, reflex::Input::Handler *handler)
{
  close();

  file_ = file;
  owned_ = false;
  name_.assign(name != NULL ? name : LABEL_STANDARD_INPUT);

#ifndef OS_WIN
  if (handler != NULL)
  {
    int fd = fileno(file_);
    struct stat buf;
    bool interactive = fstat(fd, &buf) == 0 && (S_ISCHR(buf.st_mode) || S_ISFIFO(buf.st_mode));

    // if input is a TTY or pipe, then make it nonblocking before the first read, the handler flushes output and waits for more input
    if (interactive)
    {
      if (fcntl(fd, F_SETFL, fcntl(fd, F_GETFL) | O_NONBLOCK) == -1)
        clearerr(file_);
      else
        nonblocking_ = true;
    }
  }
#endif

  // read bytes as is, unless a UTF BOM is present
  reflex::Input input(file_, reflex::Input::file_encoding::plain);

  if (nonblocking_)
    input.set_handler(handler);

  // the handler is copied with the input, the first block is read when assigned
  input_ = input;
  lineno_ = 0;
  eof_ = false;
}

// read lines from an input, e.g. a string, the name is used to report the source
void LineSource::open(const reflex::Input& input, const char *name)
{
  close();

  input_ = input;
  name_.assign(name != NULL ? name : LABEL_STANDARD_INPUT);
  lineno_ = 0;
  eof_ = false;
}

// close the source, if opened by open(pathname)
void LineSource::close()
{
  if (owned_ && file_ != NULL)
    fclose(file_);

  file_ = NULL;
  owned_ = false;
  nonblocking_ = false;
  eof_ = true;
}

// read the next line, returns false at the end of the source
bool LineSource::next(Line& line)
{
  line.text.clear();
  line.binary = false;
  line.overflow = false;
  line.eof = false;

  if (eof_)
    return false;

  const size_t k = delimiter_.size();

  // number of bytes of this line read, including the delimiter bytes read
  size_t total = 0;

  window_.clear();

  int ch;

  while ((ch = input_.get()) != EOF)
  {
    ++total;

    // retain up to max bytes and the delimiter, the remainder of a long line is discarded
    if (line.text.size() < max_ + k)
      line.text.push_back(static_cast<char>(ch));

    // the window holds the byte before the delimiter and the delimiter, to strip a \r before a \n
    window_.push_back(static_cast<char>(ch));
    if (window_.size() > k + 1)
      window_.erase(0, 1);

    if (window_.size() >= k && window_.compare(window_.size() - k, k, delimiter_) == 0)
    {
      size_t len = total - k;

      if (delimiter_[0] == '\n' && window_.size() > k && window_[0] == '\r')
        --len;

      line.overflow = len > max_;
      line.text.resize(std::min(len, max_));
      finish(line);

      return true;
    }
  }

  eof_ = true;

  if (total == 0)
    return false;

  // the last line without a delimiter is truncated without reporting an overflow
  line.text.resize(std::min(total, max_));
  line.eof = true;
  finish(line);

  return true;
}

// set the line number and binary flag of the line read
void LineSource::finish(Line& line)
{
  line.lineno = ++lineno_;

  const char *s = line.text.data();
  line.binary = !reflex::isutf8(s, s + line.text.size());
}
