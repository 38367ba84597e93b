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
@file      output.cpp
@brief     Output management
@author    Robert van Engelen - engelen@genivia.com
@copyright (c) 2019-2020, Robert van Engelen, Genivia Inc. All rights reserved.
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#include "output.hpp"

// output to file, with a writer thread when pipeline is true that queues at most max_queue blocks
Output::Output(FILE *file, bool pipeline, size_t max_queue)
  :
    file(file),
    eof(false),
    buf_(),
    flush_(false),
    queue_(max_queue),
    thread_()
{
  buf_.reserve(SIZE);

  if (pipeline)
    thread_ = std::thread(&Output::writer, this);
}

// flush the buffered output to the writer thread or to the file
void Output::flush()
{
  if (buf_.empty())
    return;

  if (!eof)
  {
    if (thread_.joinable())
    {
      if (!queue_.push(std::move(buf_)))
        eof = true;
    }
    else
    {
      write(buf_);
    }
  }

  buf_.clear();
}

// flush and wait for the writer thread to write all output
void Output::finish()
{
  flush();

  if (thread_.joinable())
  {
    queue_.close();
    thread_.join();
  }
}

// write data to the file, cancel output on error
void Output::write(const std::string& data)
{
  size_t nwritten = fwrite(data.data(), 1, data.size(), file);

  if (nwritten < data.size())
    cancel();
  else if (fflush(file) != 0)
    cancel();
}

// the writer thread writes the queued blocks
void Output::writer()
{
  std::string block;

  while (!eof && queue_.pop(block))
    write(block);
}
