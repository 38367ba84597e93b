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
@file      helpers.hpp
@brief     temporary files for the lgrep tests
@author    Robert van Engelen - engelen@genivia.com
@copyright (c) 2019-2022, Robert van Engelen, Genivia Inc. All rights reserved.
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#ifndef HELPERS_HPP
#define HELPERS_HPP

#include "lgrep.hpp"
#include <string>

// a temporary file with the given content, removed by the destructor
class TempFile {

 public:

  explicit TempFile(const std::string& content)
    :
      path_()
  {
    char name[] = "/tmp/lgrep-test-XXXXXX";
    int fd = mkstemp(name);
    if (fd >= 0)
    {
      path_.assign(name);
      size_t n = 0;
      while (n < content.size())
      {
        ssize_t k = write(fd, content.data() + n, content.size() - n);
        if (k <= 0)
          break;
        n += static_cast<size_t>(k);
      }
      close(fd);
    }
  }

  ~TempFile()
  {
    if (!path_.empty())
      unlink(path_.c_str());
  }

  const char *path() const
  {
    return path_.c_str();
  }

 private:

  std::string path_;

};

// the content written to a file opened with tmpfile()
inline std::string slurp(FILE *file)
{
  std::string content;
  char buf[4096];
  size_t n;

  fflush(file);
  rewind(file);

  while ((n = fread(buf, 1, sizeof(buf), file)) > 0)
    content.append(buf, n);

  return content;
}

#endif
