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
@file      stats.cpp
@brief     collect global statistics - static, updated by the searching thread only
@author    Robert van Engelen - engelen@genivia.com
@copyright (c) 2019-2022, Robert van Engelen, Genivia Inc. All rights reserved.
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#include "stats.hpp"
#include <cstdlib>
#include <cstdio>

// report the statistics
void Stats::report(FILE *output)
{
  size_t sf = searched_files();
  size_t sl = searched_lines();
  size_t ss = selected_lines();
  size_t su = unreadable_files();
  size_t ws = warnings;

  fprintf(output, "\nSearched %zu file%s in %.3g seconds", sf, (sf == 1 ? "" : "s"), 0.001 * reflex::timer_elapsed(timer));
  if (su > 0)
    fprintf(output, " (%zu unreadable)", su);
  fprintf(output, "\n");

  if (sl > 0)
    fprintf(output, "Searched %zu line%s: %zu selected (%.4g%%)\n", sl, (sl == 1 ? "" : "s"), ss, 100.0 * ss / sl);

  if (binary > 0)
    fprintf(output, "Binary files with matches: %zu\n", binary);

  if (overflow > 0)
    fprintf(output, "Lines truncated to the maximum line length: %zu\n", overflow);

  if (ws > 0)
    fprintf(output, "Received %zu warning%s\n", ws, ws == 1 ? "" : "s");
}

reflex::timer_type Stats::timer;
size_t             Stats::files      = 0;
size_t             Stats::unreadable = 0;
size_t             Stats::lines      = 0;
size_t             Stats::selected   = 0;
size_t             Stats::binary     = 0;
size_t             Stats::overflow   = 0;
std::atomic_size_t Stats::warnings;
