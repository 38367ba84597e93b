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
@file      report.cpp
@brief     output selected lines with a header and per-source summaries
@author    Robert van Engelen - engelen@genivia.com
@copyright (c) 2019-2022, Robert van Engelen, Genivia Inc. All rights reserved.
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#include "report.hpp"
#include "highlight.hpp"
#include "stats.hpp"

// report to out, with the header fields colored when color is true
Reporter::Reporter(const Config& config, Output& out, bool color)
  :
    config_(config),
    out_(out),
    color_(color),
    name_(),
    selected_(0),
    binary_(0),
    overflow_(0)
{ }

// start reporting the lines of the named source
void Reporter::begin(const std::string& name)
{
  name_.assign(name);
  selected_ = 0;
  binary_ = 0;
  overflow_ = 0;
}

// report an evaluated line, output a record when the line is selected with its formatted text
void Reporter::report(const Line& line, const MatchResult& result, const std::string& text)
{
  if (line.overflow)
    ++overflow_;

  if (!result.matched)
    return;

  // binary lines are not output, only counted to report "Binary file NAME matches"
  if (line.binary)
  {
    ++binary_;
    return;
  }

  ++selected_;

  out_.str(record(line, text));
  out_.nl();
}

// output the summary of the source: "Binary file NAME matches" and the number of truncated lines
void Reporter::end()
{
  if (binary_ > 0)
  {
    std::string summary("Binary file ");
    field(summary, name_, config_.palette.fn);
    summary.append(" matches");
    out_.str(summary);
    out_.nl();
  }

  if (overflow_ > 0)
  {
    std::string summary("File ");
    field(summary, name_, config_.palette.fn);
    summary.append(" has ").append(std::to_string(overflow_)).append(overflow_ == 1 ? " line" : " lines");
    summary.append(" truncated to ").append(std::to_string(config_.max_line)).append(" bytes");
    out_.str(summary);
    out_.nl();
  }

  Stats::score_summary(binary_ > 0, overflow_);
}

// the record of a line with the formatted text: filename, separator, line number, separator, text
std::string Reporter::record(const Line& line, const std::string& text) const
{
  std::string record;

  if (config_.with_filename)
  {
    field(record, name_, config_.palette.fn);
    field(record, config_.line_number ? config_.name_number_separator : config_.result_separator, config_.palette.se);
  }

  if (config_.line_number)
  {
    field(record, std::to_string(line.lineno), config_.palette.ln);
    field(record, config_.result_separator, config_.palette.se);
  }

  record.append(text);

  return record;
}

// append a field to the record, colored with SGR parameters sgr
void Reporter::field(std::string& record, const std::string& text, const std::string& sgr) const
{
  if (color_ && !sgr.empty())
  {
    Highlight highlight(text);
    highlight.apply(sgr, 0);
    record.append(highlight.render());
  }
  else
  {
    record.append(text);
  }
}
